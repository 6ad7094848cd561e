//        Copyright Maarten L. Hekkelman, 2014-2023
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// status codes returned by the dispatcher
///
/// The numbers are taken from HTTP since every SOAP transport knows how
/// to map them. They are plain integers here, nothing depends on an HTTP
/// stack.

#include <soapd/config.hpp>

#include <string>

namespace soapd::soap
{

/// Various predefined status codes

enum status_type
{
	ok = 200,
	see_other = 303,
	bad_request = 400,
	forbidden = 403,
	not_found = 404,
	method_not_allowed = 405,
	not_acceptable = 406,
	unprocessable_entity = 422,
	internal_server_error = 500,
	not_implemented = 501
};

/// Return the standard reason phrase for the status_type
std::string get_status_text(status_type status);

} // namespace soapd::soap
