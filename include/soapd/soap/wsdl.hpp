//        Copyright Maarten L. Hekkelman, 2014-2023
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// Importing operations from a WSDL description
///
/// A wsdl_model lists the operations a service offers, for each of them
/// the protocol version, the SOAPAction and WS-Addressing actions and the
/// element expected as first child of the Body. The wsdl11 class reads
/// such a model from a WSDL 1.1 document.
///
/// import_operations registers a handler for each operation in a registry.
/// The handler checks the body element and calls the callback registered
/// for the operation name:
///
/// \code
/// soapd::soap::registry reg;
/// auto wsdl = soapd::soap::wsdl11::load("names.wsdl");
///
/// soapd::soap::import_operations(reg, wsdl, {
/// 	{ "getInfo", [](const std::string& operation, const soapd::xml::element& request, const soapd::soap::message_info& info)
/// 		{
/// 			soapd::soap::handler_reply reply;
/// 			reply.payload = soapd::xml::element("x:getInfoResponse", { { "xmlns:x", "urn:names" } });
/// 			return reply;
/// 		} }
/// });
/// \endcode

#include <soapd/soap/registry.hpp>
#include <soapd/xml/document.hpp>

#include <functional>
#include <map>

namespace soapd::soap
{

/// \brief the description of one operation in one protocol version

struct operation_definition
{
	std::string name;
	protocol_version version = protocol_version::soap11;
	std::string soap_action;
	std::string wsa_input_action;
	std::string wsa_output_action;
	std::string input_element;		///< {ns}local of the request element, empty for an empty Body
	std::string output_element;		///< {ns}local of the response element
};

/// \brief the abstract interface to a service description

class wsdl_model
{
  public:
	virtual ~wsdl_model() = default;

	/// \brief the operations, in the order they appear in the description
	virtual std::vector<operation_definition> operations() const = 0;
};

// --------------------------------------------------------------------

/// The namespaces used in WSDL 1.1 documents
const std::string
	kWSDL11NS = "http://schemas.xmlsoap.org/wsdl/",
	kWSDL11SOAP11NS = "http://schemas.xmlsoap.org/wsdl/soap/",
	kWSDL11SOAP12NS = "http://schemas.xmlsoap.org/wsdl/soap12/",
	kWSAWNS = "http://www.w3.org/2006/05/addressing/wsdl",
	kWSAW200602NS = "http://www.w3.org/2006/02/addressing/wsdl",
	kWSAMNS = "http://www.w3.org/2007/05/addressing/metadata";

/// \brief a wsdl_model read from a WSDL 1.1 document
///
/// Each operation in each SOAP binding results in one operation_definition.
/// Bindings for other protocols, like the HTTP binding, are skipped.
/// References to messages or port types that cannot be found result in
/// a configuration_error.

class wsdl11 : public wsdl_model
{
  public:
	explicit wsdl11(const xml::document& doc);
	explicit wsdl11(const xml::element& definitions);

	/// \brief read the WSDL file \a path
	static wsdl11 load(const std::string& path);

	const std::string& get_target_namespace() const		{ return m_target_ns; }

	std::vector<operation_definition> operations() const override
	{
		return m_operations;
	}

  private:
	void read(const xml::element& definitions);

	std::string m_target_ns;
	std::vector<operation_definition> m_operations;
};

// --------------------------------------------------------------------

/// \brief the callback for an operation imported from a WSDL
///
/// \a request is the first element in the Body. The payload of the returned
/// reply is wrapped in an Envelope unless it is one already.
using operation_callback = std::function<handler_reply(const std::string& operation,
	const xml::element& request, const message_info& info)>;

/// \brief create the handler for \a op calling \a callback
///
/// The handler declines messages whose first Body element is not the
/// input element of \a op.
operation_handler compile_handler(const operation_definition& op, operation_callback callback);

/// \brief the reply of operations without a callback
handler_reply not_implemented_reply(protocol_version version, const std::string& operation);

/// \brief register the operations in \a model in \a reg
///
/// Operations are looked up in \a callbacks by name. Operations without a
/// callback use \a default_callback, or when that is empty a stub returning
/// a not implemented fault. Actions found in the model are added to the
/// registry, existing actions are kept.
///
/// Returns the number of operations added. Throws configuration_error when
/// a callback is empty. Callbacks whose name matches no operation are
/// reported on std::cerr.
size_t import_operations(registry& reg, const wsdl_model& model,
	const std::map<std::string, operation_callback>& callbacks = {},
	operation_callback default_callback = {});

} // namespace soapd::soap
