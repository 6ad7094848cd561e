//        Copyright Maarten L. Hekkelman, 2014-2023
// Distributed under the Boost Software License, Version 1.0.
//    (See accompanying file LICENSE_1_0.txt or copy at
//          http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// definition of the soapd::soap::header class

#include <soapd/config.hpp>

#include <string>
#include <vector>

namespace soapd::soap
{

/// The header object contains the header lines as found in a transport
/// request. The lines are parsed into name / value pairs by the transport.

struct header
{
	std::string	name;
	std::string	value;
};

using header_list = std::vector<header>;

/// \brief return the values of all headers named \a name, compared case insensitive
std::vector<std::string> get_headers(const header_list& headers, const std::string& name);

/// \brief return the value of the first header named \a name, or an empty string
std::string get_header(const header_list& headers, const std::string& name);

} // namespace soapd::soap
