//        Copyright Maarten L. Hekkelman, 2014-2023
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// extraction of the SOAPAction from transport headers

#include <soapd/soap/header.hpp>

#include <optional>

namespace soapd::soap
{

/// The extension identifier in the Man header of an M-POST request,
/// the HTTP Extension Framework way of sending a SOAPAction
const std::string kHTTPExtensionSOAP = "http://schemas.xmlsoap.org/soap/envelope/";

/// \brief return the SOAPAction for a request with method \a method and headers \a headers
///
/// For POST the SOAPAction header is used. For M-POST the Man headers are
/// searched for the SOAP extension, its ns=NN parameter tells which
/// NN-SOAPAction header holds the action. Other methods have no action.
///
/// Clients send all sorts of variations, the value is normalized and never
/// rejected. std::nullopt is returned when no usable value is found.
std::optional<std::string> soap_action_from_headers(const std::string& method, const header_list& headers);

/// \brief strip whitespace and surrounding quotes from \a action
///
/// An empty result is returned as std::nullopt.
std::optional<std::string> normalize_soap_action(const std::string& action);

} // namespace soapd::soap
