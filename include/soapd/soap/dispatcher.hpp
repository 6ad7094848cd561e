//        Copyright Maarten L. Hekkelman, 2014-2023
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// definition of the soapd::soap::dispatcher class
///
/// The dispatcher takes a SOAP message, finds out which protocol version
/// it uses and which operation should handle it, calls that operation and
/// returns the result. Any failure along the way results in a fault.
///
/// Selecting the operation is done with three strategies, always tried in
/// this order:
///
/// - the WS-Addressing Action in the message header
/// - the SOAPAction passed in by the transport
/// - trying each operation in turn until one accepts the message
///
/// The last one is only used when accept_slow_select is set. It costs a
/// handler call per registered operation for each message that carries no
/// usable action, which makes it easy to keep a server busy. It is also
/// the only way to serve clients that do not send an action at all.

#include <soapd/soap/fault.hpp>
#include <soapd/soap/registry.hpp>
#include <soapd/xml/document.hpp>

#include <iostream>
#include <string_view>

namespace soapd::soap
{

struct dispatcher_options
{
	/// try all operations when no action selects one
	bool accept_slow_select = SOAPD_ACCEPT_SLOW_SELECT;

	/// list the available operations in a message not recognized fault
	bool disclose_operations = true;
};

/// \brief the result of dispatching a message
///
/// Either \a payload contains the XML to send back, or \a error contains a
/// text describing what went wrong.

struct response
{
	status_type status = internal_server_error;
	std::string message;
	std::optional<xml::element> payload;
	std::string error;

	/// \brief create a response for fault \a fault
	static response from_fault(fault_descriptor&& fault);

	bool is_ok() const	{ return status == ok; }
};

class dispatcher
{
  public:
	/// \brief create a dispatcher for the operations in \a reg, which must outlive the dispatcher
	dispatcher(const registry& reg, dispatcher_options options = {});

	dispatcher(const dispatcher&) = delete;
	dispatcher& operator=(const dispatcher&) = delete;

	const registry& get_registry() const			{ return m_registry; }
	const dispatcher_options& get_options() const	{ return m_options; }

	/// \brief dispatch the message in \a body, \a soap_action is the action found by the transport
	response dispatch(std::string_view body, const std::optional<std::string>& soap_action = {}) const;

	/// \brief dispatch an already parsed document
	response dispatch(const xml::document& doc, const std::optional<std::string>& soap_action = {}) const;

	/// \brief dispatch an already parsed Envelope element
	response dispatch(const xml::element& envelope, const std::optional<std::string>& soap_action = {}) const;

	/// \brief the log stream for the current thread
	///
	/// The dispatcher writes which operation was selected and how. The
	/// request_handler clears this stream before each request and adds
	/// its content to the access log line.
	static std::ostream& get_log();

	/// \brief reset the log stream for the current thread and return its previous content
	static std::string reset_log();

  private:
	/// invoke the handler for \a name, catching everything it throws.
	/// An exception results in a handler failure fault and sets \a failed.
	std::optional<response> invoke(const std::string& name, const operation_handler& handler,
		const xml::element& envelope, message_info& info, bool& failed) const;

	const registry& m_registry;
	dispatcher_options m_options;
};

} // namespace soapd::soap
