//        Copyright Maarten L. Hekkelman, 2014-2023
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// code for inspecting and constructing SOAP envelopes

#include <soapd/soap/protocol.hpp>
#include <soapd/xml/node.hpp>

#include <optional>
#include <string>
#include <vector>

namespace soapd::soap
{

/// \brief structural information about a received SOAP message
///
/// Created fresh for each request. The element types are written as
/// {namespace-uri}local-name.

struct message_info
{
	protocol_version version = protocol_version::soap11;
	std::vector<std::string> header;		///< types of the elements in the Header
	std::vector<std::string> body;			///< types of the elements in the Body
	std::optional<std::string> wsa_action;	///< the WS-Addressing Action, if present
	std::string selected_by;				///< the strategy that selected the operation
};

/// \brief collect the message_info for \a envelope, which is of protocol \a version
message_info message_structure(const xml::element& envelope, protocol_version version);

/// \brief the Body element of \a envelope, or nullptr
const xml::element* find_body(const xml::element& envelope);

/// \brief the first element inside the Body of \a envelope, or nullptr
const xml::element* find_request(const xml::element& envelope);

/// Wrap data into a SOAP envelope
///
/// \param    version     The SOAP version to use
/// \param    data        The xml::element object to wrap into the envelope
/// \param    wsa_action  If not empty, a WS-Addressing Action header is added
/// \return   A new xml::element object containing the envelope.
xml::element make_envelope(protocol_version version, xml::element&& data, const std::string& wsa_action = {});

/// \brief the side that caused a fault
enum class fault_code
{
	client,
	server
};

/// Create a SOAP Fault element
///
/// For SOAP 1.1 the faultcode is SOAP-ENV:Client or SOAP-ENV:Server with
/// \a subcode appended after a dot, for SOAP 1.2 the Code is Sender or
/// Receiver with \a subcode as Subcode.
///
/// \return   A new xml::element object containing the Fault, not yet wrapped
xml::element make_fault(protocol_version version, fault_code code,
	const std::string& subcode, const std::string& reason);

/// \brief Create a complete fault envelope
xml::element make_fault_envelope(protocol_version version, fault_code code,
	const std::string& subcode, const std::string& reason);

} // namespace soapd::soap
