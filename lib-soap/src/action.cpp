//        Copyright Maarten L. Hekkelman, 2014-2023
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#include <regex>

#include <boost/algorithm/string.hpp>

#include <soapd/soap/action.hpp>

namespace ba = boost::algorithm;

namespace soapd::soap
{

// --------------------------------------------------------------------

std::optional<std::string> normalize_soap_action(const std::string& action)
{
	std::string result = ba::trim_copy(action);

	if (result.length() >= 2 and (result.front() == '"' or result.front() == '\'') and result.back() == result.front())
		result = ba::trim_copy(result.substr(1, result.length() - 2));
	else if (not result.empty() and (result.front() == '"' or result.front() == '\''))
	{
		// an opening quote without a matching closing one, keep up to the next quote
		auto e = result.find(result.front(), 1);
		result = ba::trim_copy(result.substr(1, e == std::string::npos ? std::string::npos : e - 1));
	}

	if (result.empty())
		return {};

	return result;
}

std::optional<std::string> soap_action_from_headers(const std::string& method, const header_list& headers)
{
	std::vector<std::string> actions;

	if (method == "POST")
		actions = get_headers(headers, "SOAPAction");
	else if (method == "M-POST")
	{
		// Microsofts HTTP Extension Framework
		static const std::regex kNSRE(R"(;\s*ns\s*=\s*(\d+))");
		const std::string extID = '"' + kHTTPExtensionSOAP + '"';

		std::string ns;

		for (auto& man : get_headers(headers, "Man"))
		{
			std::vector<std::string> entries;
			ba::split(entries, man, ba::is_any_of(","));

			for (auto& entry : entries)
			{
				if (entry.find(extID) == std::string::npos)
					continue;

				std::smatch m;
				if (std::regex_search(entry, m, kNSRE))
					ns = m[1];
				break;
			}

			if (not ns.empty())
				break;
		}

		if (ns.empty())
			return {};

		actions = get_headers(headers, ns + "-SOAPAction");
	}

	if (actions.empty())
		return {};

	return normalize_soap_action(actions.front());
}

} // namespace soapd::soap
