//        Copyright Maarten L. Hekkelman, 2014-2023
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// the faults produced when a request cannot be dispatched
///
/// Each function returns a complete fault_descriptor and never throws.
/// Where the SOAP version of the request is known, the descriptor carries
/// a Fault envelope in that version as detail.

#include <soapd/soap/envelope.hpp>
#include <soapd/soap/status.hpp>

#include <optional>
#include <string>
#include <vector>

namespace soapd::soap
{

enum class fault_category
{
	invalid_xml,
	not_soap_message,
	unsupported_version,
	try_other_protocol,
	message_not_recognized,
	not_implemented,
	handler_failure,
	method_not_allowed,
	not_acceptable
};

struct fault_descriptor
{
	fault_category category;
	status_type status;
	std::string reason;						///< short reason phrase
	std::string message;					///< human readable explanation
	std::optional<xml::element> detail;		///< a Fault envelope, if one could be made
};

/// \brief the input could not be parsed
fault_descriptor fault_invalid_xml(const std::string& error);

/// \brief the root element is not an Envelope, \a type is its {ns}local name
fault_descriptor fault_not_soap_message(const std::string& type);

/// \brief the Envelope namespace \a envns is not a known SOAP version
fault_descriptor fault_unsupported_soap_version(const std::string& envns);

/// \brief no operation in \a version accepted the message, but \a other versions have operations
fault_descriptor fault_try_other_protocol(protocol_version version, const std::string& body_element,
	const std::vector<protocol_version>& other);

/// \brief no operation accepted the message
///
/// \param available	the operation names to list, pass std::nullopt to leave them out
fault_descriptor fault_message_not_recognized(protocol_version version, const std::string& body_element,
	const std::optional<std::string>& soap_action, const std::optional<std::vector<std::string>>& available);

/// \brief the operation exists but was never given an implementation
fault_descriptor fault_not_implemented(protocol_version version, const std::string& operation);

/// \brief the handler for \a operation threw an exception with message \a what
fault_descriptor fault_handler_failure(protocol_version version, const std::string& operation, const std::string& what);

/// \brief the transport used a method other than POST or M-POST
fault_descriptor fault_method_not_allowed(const std::string& method);

/// \brief the transport content type is not some XML
fault_descriptor fault_not_acceptable(const std::string& content_type);

} // namespace soapd::soap
