//        Copyright Maarten L. Hekkelman, 2014-2023
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#include <memory>
#include <sstream>

#include <soapd/soap/dispatcher.hpp>

namespace soapd::soap
{

namespace detail
{

	// a thread specific logger
	thread_local std::unique_ptr<std::ostringstream> s_log;

} // namespace detail

// --------------------------------------------------------------------

response response::from_fault(fault_descriptor&& fault)
{
	response result;
	result.status = fault.status;
	result.message = std::move(fault.reason);
	result.payload = std::move(fault.detail);
	result.error = std::move(fault.message);
	return result;
}

// --------------------------------------------------------------------

dispatcher::dispatcher(const registry& reg, dispatcher_options options)
	: m_registry(reg)
	, m_options(options)
{
}

std::ostream& dispatcher::get_log()
{
	if (detail::s_log.get() == nullptr)
		detail::s_log.reset(new std::ostringstream);
	return *detail::s_log;
}

std::string dispatcher::reset_log()
{
	std::string result;
	if (detail::s_log)
		result = detail::s_log->str();
	detail::s_log.reset(new std::ostringstream);
	return result;
}

// --------------------------------------------------------------------

response dispatcher::dispatch(std::string_view body, const std::optional<std::string>& soap_action) const
{
	xml::document doc;

	try
	{
		doc.read(std::string(body));
	}
	catch (const std::exception& ex)
	{
		get_log() << "invalid XML";
		return response::from_fault(fault_invalid_xml(ex.what()));
	}

	return dispatch(doc, soap_action);
}

response dispatcher::dispatch(const xml::document& doc, const std::optional<std::string>& soap_action) const
{
	if (doc.empty())
		return response::from_fault(fault_invalid_xml("Document is empty"));

	return dispatch(*doc.child(), soap_action);
}

response dispatcher::dispatch(const xml::element& envelope, const std::optional<std::string>& soap_action) const
{
	try
	{
		if (envelope.name() != "Envelope")
		{
			get_log() << "not SOAP";
			return response::from_fault(fault_not_soap_message(xml::type_of_node(envelope)));
		}

		std::string envns = envelope.get_ns();
		auto version = protocol_from_envelope(envns);
		if (not version)
		{
			get_log() << "unsupported SOAP version";
			return response::from_fault(fault_unsupported_soap_version(envns));
		}

		message_info info = message_structure(envelope, *version);

		// Try to resolve the operation via WS-Addressing
		if (info.wsa_action)
		{
			auto name = m_registry.find_by_wsa_action(*info.wsa_action);
			auto handler = name ? m_registry.find_handler(*version, *name) : nullptr;

			if (handler != nullptr)
			{
				info.selected_by = "wsa-action";
				if (bool failed = false; auto r = invoke(*name, *handler, envelope, info, failed))
				{
					get_log() << to_string(*version) << ' ' << *name << " via wsa " << *info.wsa_action;
					return std::move(*r);
				}
			}
		}

		// Try to resolve the operation via the SOAPAction of the transport
		if (soap_action)
		{
			auto name = m_registry.find_by_soap_action(*soap_action);
			auto handler = name ? m_registry.find_handler(*version, *name) : nullptr;

			if (handler != nullptr)
			{
				info.selected_by = "soap-action";
				if (bool failed = false; auto r = invoke(*name, *handler, envelope, info, failed))
				{
					get_log() << to_string(*version) << ' ' << *name << " via sa " << *soap_action;
					return std::move(*r);
				}
			}
		}

		// Last resort, try each of the operations for the first which
		// accepts the message
		if (m_options.accept_slow_select)
		{
			info.selected_by = "attempt-all";

			// a handler that fails does not stop the search, the first
			// failure is only reported when no other handler accepts
			std::optional<response> failure;

			for (auto& name : m_registry.names(*version))
			{
				auto handler = m_registry.find_handler(*version, name);
				if (handler == nullptr)
					continue;

				bool failed = false;
				auto r = invoke(name, *handler, envelope, info, failed);
				if (not r)
					continue;

				if (failed)
				{
					if (not failure)
						failure = std::move(r);
					continue;
				}

				get_log() << to_string(*version) << ' ' << name;
				return std::move(*r);
			}

			if (failure)
				return std::move(*failure);
		}

		info.selected_by.clear();

		std::string body_element = info.body.empty() ? "(none)" : info.body.front();

		std::vector<protocol_version> other;
		for (auto v : m_registry.versions())
		{
			if (v != *version)
				other.push_back(v);
		}

		if (not other.empty())
		{
			get_log() << "try other protocol for " << body_element;
			return response::from_fault(fault_try_other_protocol(*version, body_element, other));
		}

		std::optional<std::vector<std::string>> available;
		if (m_options.disclose_operations)
		{
			auto names = m_registry.names(*version);
			available.emplace(names.begin(), names.end());
		}

		get_log() << "not recognized " << body_element;
		return response::from_fault(fault_message_not_recognized(*version, body_element, soap_action, available));
	}
	catch (const std::exception& ex)
	{
		get_log() << "internal error: " << ex.what();

		response result;
		result.status = internal_server_error;
		result.message = get_status_text(internal_server_error);
		result.error = ex.what();
		return result;
	}
}

std::optional<response> dispatcher::invoke(const std::string& name, const operation_handler& handler,
	const xml::element& envelope, message_info& info, bool& failed) const
{
	failed = false;

	try
	{
		auto r = handler(name, envelope, info);
		if (not r)
			return {};

		response result;
		result.status = r->status;
		result.message = std::move(r->message);

		// a reply without a payload element is reported as plain text
		if (r->payload.get_qname().empty())
			result.error = result.message;
		else
			result.payload = std::move(r->payload);

		return result;
	}
	catch (const std::exception& ex)
	{
		failed = true;
		get_log() << to_string(info.version) << ' ' << name << " failed; ";
		return response::from_fault(fault_handler_failure(info.version, name, ex.what()));
	}
	catch (...)
	{
		failed = true;
		get_log() << to_string(info.version) << ' ' << name << " failed; ";
		return response::from_fault(fault_handler_failure(info.version, name, "unknown exception"));
	}
}

} // namespace soapd::soap
