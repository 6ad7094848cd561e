//        Copyright Maarten L. Hekkelman, 2014-2023
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#include <boost/algorithm/string.hpp>

#include <soapd/soap/envelope.hpp>

namespace ba = boost::algorithm;

namespace soapd::soap
{

// --------------------------------------------------------------------

const xml::element* find_body(const xml::element& envelope)
{
	return envelope.find_child(envelope.get_ns(), "Body");
}

const xml::element* find_request(const xml::element& envelope)
{
	const xml::element* result = nullptr;

	auto body = find_body(envelope);
	if (body != nullptr and not body->empty())
		result = &body->front();

	return result;
}

message_info message_structure(const xml::element& envelope, protocol_version version)
{
	message_info result;
	result.version = version;

	const std::string& envns = envelope.get_ns();

	if (auto header = envelope.find_child(envns, "Header"); header != nullptr)
	{
		for (auto& h : *header)
		{
			result.header.push_back(xml::type_of_node(h));

			if (h.name() != "Action" or result.wsa_action)
				continue;

			auto ns = h.get_ns();
			if (ns == kWSA200508NS or ns == kWSA200408NS)
				result.wsa_action = ba::trim_copy(h.get_content());
		}
	}

	if (auto body = find_body(envelope); body != nullptr)
	{
		for (auto& b : *body)
			result.body.push_back(xml::type_of_node(b));
	}

	return result;
}

// --------------------------------------------------------------------

xml::element make_envelope(protocol_version version, xml::element&& data, const std::string& wsa_action)
{
	xml::element env("soap:Envelope", {
		{ "xmlns:soap", envelope_namespace(version) }
	});

	if (not wsa_action.empty())
	{
		auto& header = env.emplace_back("soap:Header");
		auto& action = header.emplace_back("wsa:Action", {
			{ "xmlns:wsa", kWSA200508NS }
		});
		action.set_content(wsa_action);
	}

	auto& body = env.emplace_back("soap:Body");
	body.emplace_back(std::move(data));

	return env;
}

xml::element make_fault(protocol_version version, fault_code code,
	const std::string& subcode, const std::string& reason)
{
	xml::element fault("soap:Fault", {
		{ "xmlns:soap", envelope_namespace(version) }
	});

	if (version == protocol_version::soap11)
	{
		std::string faultcode = code == fault_code::client ? "soap:Client" : "soap:Server";
		if (not subcode.empty())
			faultcode += '.' + subcode;

		fault.emplace_back("faultcode").set_content(faultcode);
		fault.emplace_back("faultstring").set_content(reason);
	}
	else
	{
		auto& faultCode = fault.emplace_back("soap:Code");
		faultCode.emplace_back("soap:Value").set_content(code == fault_code::client ? "soap:Sender" : "soap:Receiver");

		if (not subcode.empty())
			faultCode.emplace_back("soap:Subcode").emplace_back("soap:Value").set_content(subcode);

		fault.emplace_back("soap:Reason").emplace_back("soap:Text", { { "xml:lang", "en" } }).set_content(reason);
	}

	return fault;
}

xml::element make_fault_envelope(protocol_version version, fault_code code,
	const std::string& subcode, const std::string& reason)
{
	auto fault = make_fault(version, code, subcode, reason);

	// the envelope declares the namespace already
	xml::element stripped(fault.get_qname());
	for (auto& c : fault)
		stripped.emplace_back(std::move(c));

	return make_envelope(version, std::move(stripped));
}

} // namespace soapd::soap
