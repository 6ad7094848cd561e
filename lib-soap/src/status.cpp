//        Copyright Maarten L. Hekkelman, 2014-2023
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#include <soapd/soap/status.hpp>

namespace soapd::soap
{

namespace detail
{

	struct status_string
	{
		status_type code;
		const char* text;
	} kStatusStrings[] = {
		{ ok, "OK" },
		{ see_other, "See Other" },
		{ bad_request, "Bad Request" },
		{ forbidden, "Forbidden" },
		{ not_found, "Not Found" },
		{ method_not_allowed, "Method not allowed" },
		{ not_acceptable, "Not Acceptable" },
		{ unprocessable_entity, "Unprocessable Entity" },
		{ internal_server_error, "Internal Server Error" },
		{ not_implemented, "Not Implemented" }
	};

	const int kStatusStringCount = sizeof(kStatusStrings) / sizeof(status_string);

} // namespace detail

std::string get_status_text(status_type status)
{
	std::string result = "Internal Service Error";

	for (int i = 0; i < detail::kStatusStringCount; ++i)
	{
		if (detail::kStatusStrings[i].code == status)
		{
			result = detail::kStatusStrings[i].text;
			break;
		}
	}

	return result;
}

} // namespace soapd::soap
