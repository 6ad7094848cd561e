//        Copyright Maarten L. Hekkelman, 2014-2023
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#include <boost/algorithm/string.hpp>

#include <soapd/soap/fault.hpp>

namespace ba = boost::algorithm;

namespace soapd::soap
{

namespace
{

	// should building the detail envelope fail, the fault goes out
	// without detail. A null character in the text does not fail here,
	// write_string refuses it when the reply is written out.
	std::optional<xml::element> fault_detail(protocol_version version, fault_code code,
		const std::string& subcode, const std::string& reason) noexcept
	{
		try
		{
			return make_fault_envelope(version, code, subcode, reason);
		}
		catch (const std::exception&)
		{
			return {};
		}
	}

} // namespace

// --------------------------------------------------------------------

fault_descriptor fault_invalid_xml(const std::string& error)
{
	return {
		fault_category::invalid_xml, unprocessable_entity, "XML syntax error",
		"The XML cannot be parsed: " + error
	};
}

fault_descriptor fault_not_soap_message(const std::string& type)
{
	return {
		fault_category::not_soap_message, forbidden, "message not SOAP",
		"The message was XML, but not SOAP; not an Envelope but `" + type + '\''
	};
}

fault_descriptor fault_unsupported_soap_version(const std::string& envns)
{
	return {
		fault_category::unsupported_version, not_implemented, "SOAP version not supported",
		"The soap version `" + envns + "' is not supported"
	};
}

fault_descriptor fault_try_other_protocol(protocol_version version, const std::string& body_element,
	const std::vector<protocol_version>& other)
{
	std::vector<std::string> names;
	for (auto v : other)
		names.push_back(to_string(v));

	std::string message = "body element " + body_element + " not available in " + to_string(version) +
		", try " + ba::join(names, ", ");

	return {
		fault_category::try_other_protocol, see_other, "SOAP protocol not in use",
		message, fault_detail(version, fault_code::server, "tryUpgrade", message)
	};
}

fault_descriptor fault_message_not_recognized(protocol_version version, const std::string& body_element,
	const std::optional<std::string>& soap_action, const std::optional<std::vector<std::string>>& available)
{
	std::string message = to_string(version) + " body element " + body_element + " not recognized";

	if (soap_action)
		message += ", soapAction `" + *soap_action + '\'';

	if (available)
		message += ", available operations are " + (available->empty() ? "(none)" : ba::join(*available, ", "));

	return {
		fault_category::message_not_recognized, not_found, "message not recognized",
		message, fault_detail(version, fault_code::client, "notRecognized", message)
	};
}

fault_descriptor fault_not_implemented(protocol_version version, const std::string& operation)
{
	std::string message = "procedure " + operation + " for " + to_string(version) + " is not yet implemented";

	return {
		fault_category::not_implemented, not_implemented, "not implemented",
		message, fault_detail(version, fault_code::server, "notImplemented", message)
	};
}

fault_descriptor fault_handler_failure(protocol_version version, const std::string& operation, const std::string& what)
{
	std::string message = "operation " + operation + " failed: " + what;

	return {
		fault_category::handler_failure, internal_server_error, "handler failure",
		message, fault_detail(version, fault_code::server, "", message)
	};
}

fault_descriptor fault_method_not_allowed(const std::string& method)
{
	return {
		fault_category::method_not_allowed, method_not_allowed, "only POST or M-POST",
		"attempt to connect via " + method
	};
}

fault_descriptor fault_not_acceptable(const std::string& content_type)
{
	return {
		fault_category::not_acceptable, not_acceptable, "required is XML",
		"content-type seems to be " + content_type + ", must be some XML"
	};
}

} // namespace soapd::soap
