//        Copyright Maarten L. Hekkelman, 2014-2023
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// the SOAP protocol versions known to libsoapd

#include <soapd/config.hpp>

#include <optional>
#include <string>
#include <vector>

namespace soapd::soap
{

/// Namespaces used in SOAP messages and their descriptions

const std::string
	kSOAP11EnvelopeNS = "http://schemas.xmlsoap.org/soap/envelope/",
	kSOAP12EnvelopeNS = "http://www.w3.org/2003/05/soap-envelope",
	kWSA200408NS = "http://schemas.xmlsoap.org/ws/2004/08/addressing",
	kWSA200508NS = "http://www.w3.org/2005/08/addressing";

enum class protocol_version
{
	soap11,
	soap12
};

/// \brief the name of the protocol, SOAP11 or SOAP12
std::string to_string(protocol_version version);

/// \brief the namespace of the Envelope element for \a version
const std::string& envelope_namespace(protocol_version version);

/// \brief look up the protocol version for the namespace \a ns of an Envelope element
std::optional<protocol_version> protocol_from_envelope(const std::string& ns);

/// \brief all protocol versions, in the order they are printed
const std::vector<protocol_version>& known_protocols();

} // namespace soapd::soap
