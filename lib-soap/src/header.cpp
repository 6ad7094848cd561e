//        Copyright Maarten L. Hekkelman, 2014-2023
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#include <boost/algorithm/string.hpp>

#include <soapd/soap/header.hpp>

namespace ba = boost::algorithm;

namespace soapd::soap
{

std::vector<std::string> get_headers(const header_list& headers, const std::string& name)
{
	std::vector<std::string> result;

	for (auto& h : headers)
	{
		if (ba::iequals(h.name, name))
			result.push_back(h.value);
	}

	return result;
}

std::string get_header(const header_list& headers, const std::string& name)
{
	std::string result;

	for (auto& h : headers)
	{
		if (ba::iequals(h.name, name))
		{
			result = h.value;
			break;
		}
	}

	return result;
}

} // namespace soapd::soap
