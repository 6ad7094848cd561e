//        Copyright Maarten L. Hekkelman, 2014-2023
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#include <fstream>
#include <set>

#include <soapd/exception.hpp>
#include <soapd/soap/fault.hpp>
#include <soapd/soap/wsdl.hpp>

namespace soapd::soap
{

namespace
{

	struct port_type_operation
	{
		std::string input_message, output_message;
		std::string wsa_input_action, wsa_output_action;
	};

	using port_type = std::map<std::string, port_type_operation>;

	// the qualified name of a definition in the target namespace
	std::string qualified(const std::string& ns, const std::string& name)
	{
		return ns.empty() ? name : '{' + ns + '}' + name;
	}

	std::string get_wsa_action(const xml::element& e)
	{
		std::string result;

		for (auto& ns : { kWSAWNS, kWSAMNS, kWSAW200602NS })
		{
			result = e.get_attribute(ns, "Action");
			if (not result.empty())
				break;
		}

		return result;
	}

} // namespace

// --------------------------------------------------------------------

wsdl11::wsdl11(const xml::document& doc)
{
	if (doc.empty())
		throw configuration_error("WSDL document is empty");

	read(*doc.child());
}

wsdl11::wsdl11(const xml::element& definitions)
{
	read(definitions);
}

wsdl11 wsdl11::load(const std::string& path)
{
	std::ifstream file(path, std::ios::binary);
	if (not file.is_open())
		throw configuration_error("cannot read wsdl file " + path);

	try
	{
		xml::document doc(file);
		return wsdl11(doc);
	}
	catch (const xml::invalid_exception& ex)
	{
		throw configuration_error("wsdl file " + path + " is not valid XML: " + ex.what());
	}
}

void wsdl11::read(const xml::element& definitions)
{
	if (definitions.name() != "definitions" or definitions.get_ns() != kWSDL11NS)
		throw configuration_error("Not a WSDL 1.1 document, root is " + xml::type_of_node(definitions));

	m_target_ns = definitions.get_attribute("targetNamespace");

	// QName attributes, an undeclared prefix is a broken reference
	auto resolve = [](const xml::element& e, const std::string& attr) -> std::string
	{
		std::string value = e.get_attribute(attr);
		if (value.empty())
			return value;

		try
		{
			return e.resolve_qname(value);
		}
		catch (const soapd::exception& ex)
		{
			throw configuration_error("WSDL attribute " + attr + " of " + xml::type_of_node(e) + ": " + ex.what());
		}
	};

	// messages, the element of the first part is what goes in the Body

	std::map<std::string, std::string> messages;

	for (auto message : definitions.find_children(kWSDL11NS, "message"))
	{
		std::string element;

		for (auto part : message->find_children(kWSDL11NS, "part"))
		{
			element = resolve(*part, "element");
			if (not element.empty())
				break;
		}

		messages[qualified(m_target_ns, message->get_attribute("name"))] = element;
	}

	// port types

	std::map<std::string, port_type> port_types;

	for (auto pt : definitions.find_children(kWSDL11NS, "portType"))
	{
		port_type& ops = port_types[qualified(m_target_ns, pt->get_attribute("name"))];

		for (auto op : pt->find_children(kWSDL11NS, "operation"))
		{
			port_type_operation& pto = ops[op->get_attribute("name")];

			if (auto input = op->find_child(kWSDL11NS, "input"); input != nullptr)
			{
				pto.input_message = resolve(*input, "message");
				pto.wsa_input_action = get_wsa_action(*input);
			}

			if (auto output = op->find_child(kWSDL11NS, "output"); output != nullptr)
			{
				pto.output_message = resolve(*output, "message");
				pto.wsa_output_action = get_wsa_action(*output);
			}
		}
	}

	auto message_element = [&messages](const std::string& message) -> std::string
	{
		if (message.empty())
			return {};

		auto m = messages.find(message);
		if (m == messages.end())
			throw configuration_error("WSDL message " + message + " is not defined");
		return m->second;
	};

	// bindings

	for (auto binding : definitions.find_children(kWSDL11NS, "binding"))
	{
		std::string soapns;
		protocol_version version = protocol_version::soap11;

		const xml::element* soap_binding = binding->find_child(kWSDL11SOAP11NS, "binding");
		if (soap_binding != nullptr)
		{
			soapns = kWSDL11SOAP11NS;
			version = protocol_version::soap11;
		}
		else if ((soap_binding = binding->find_child(kWSDL11SOAP12NS, "binding")) != nullptr)
		{
			soapns = kWSDL11SOAP12NS;
			version = protocol_version::soap12;
		}
		else
			continue;

		std::string binding_style = soap_binding->get_attribute("style");
		if (binding_style.empty())
			binding_style = "document";

		std::string type = resolve(*binding, "type");
		auto pt = port_types.find(type);
		if (pt == port_types.end())
			throw configuration_error("WSDL binding " + binding->get_attribute("name") + " refers to unknown portType " + type);

		for (auto op : binding->find_children(kWSDL11NS, "operation"))
		{
			operation_definition def;
			def.name = op->get_attribute("name");
			def.version = version;

			auto pto = pt->second.find(def.name);
			if (pto == pt->second.end())
				throw configuration_error("WSDL operation " + def.name + " is not defined in portType " + type);

			std::string style = binding_style;

			if (auto soap_op = op->find_child(soapns, "operation"); soap_op != nullptr)
			{
				def.soap_action = soap_op->get_attribute("soapAction");
				if (not soap_op->get_attribute("style").empty())
					style = soap_op->get_attribute("style");
			}

			def.wsa_input_action = pto->second.wsa_input_action;
			def.wsa_output_action = pto->second.wsa_output_action;

			if (style == "rpc")
			{
				// the body element is named after the operation, in the namespace of soap:body
				std::string ns;
				if (auto input = op->find_child(kWSDL11NS, "input"); input != nullptr)
				{
					if (auto body = input->find_child(soapns, "body"); body != nullptr)
						ns = body->get_attribute("namespace");
				}

				def.input_element = qualified(ns, def.name);
				def.output_element = qualified(ns, def.name + "Response");
			}
			else
			{
				def.input_element = message_element(pto->second.input_message);
				def.output_element = message_element(pto->second.output_message);
			}

			m_operations.push_back(std::move(def));
		}
	}
}

// --------------------------------------------------------------------

operation_handler compile_handler(const operation_definition& op, operation_callback callback)
{
	if (not callback)
		throw configuration_error("callback " + op.name + " must be callable");

	return [op, callback = std::move(callback)](const std::string& name, const xml::element& envelope, message_info& info) -> handler_result
	{
		auto request = find_request(envelope);

		if (request == nullptr)
		{
			if (not op.input_element.empty())
				return {};
		}
		else if (xml::type_of_node(*request) != op.input_element)
			return {};

		static const xml::element kNoRequest;

		// pass the request in place, a copy would lose the namespaces declared on Envelope and Body
		handler_reply reply = callback(name, request != nullptr ? *request : kNoRequest, info);

		auto& payload = reply.payload;
		if (not payload.get_qname().empty() and
			not (payload.name() == "Envelope" and payload.get_ns() == envelope_namespace(op.version)))
		{
			payload = make_envelope(op.version, std::move(payload), op.wsa_output_action);
		}

		return reply;
	};
}

handler_reply not_implemented_reply(protocol_version version, const std::string& operation)
{
	auto fault = fault_not_implemented(version, operation);

	handler_reply reply;
	reply.status = fault.status;
	reply.message = fault.reason;
	if (fault.detail)
		reply.payload = std::move(*fault.detail);

	return reply;
}

size_t import_operations(registry& reg, const wsdl_model& model,
	const std::map<std::string, operation_callback>& callbacks, operation_callback default_callback)
{
	for (auto& [name, callback] : callbacks)
	{
		if (not callback)
			throw configuration_error("callback " + name + " must be callable");
	}

	auto operations = model.operations();

	std::set<std::string> used;

	for (auto& op : operations)
	{
		operation_callback callback;

		if (auto cb = callbacks.find(op.name); cb != callbacks.end())
		{
			callback = cb->second;
			used.insert(op.name);
		}
		else if (default_callback)
			callback = default_callback;
		else
		{
			callback = [](const std::string& operation, const xml::element&, const message_info& info)
			{
				return not_implemented_reply(info.version, operation);
			};
		}

		reg.register_handler(op.version, op.name, compile_handler(op, std::move(callback)));

		reg.add_wsa_action(wsa_direction::input, op.name, op.wsa_input_action);
		reg.add_wsa_action(wsa_direction::output, op.name, op.wsa_output_action);
		reg.add_soap_action(op.name, op.soap_action);
	}

	for (auto& [name, callback] : callbacks)
	{
		if (used.count(name) == 0)
			std::cerr << "no operation for callback handler `" << name << '\'' << std::endl;
	}

	return operations.size();
}

} // namespace soapd::soap
