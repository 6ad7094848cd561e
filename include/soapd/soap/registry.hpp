//        Copyright Maarten L. Hekkelman, 2014-2023
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// definition of the soapd::soap::registry class, the table of operations
/// known to a dispatcher

#include <soapd/soap/envelope.hpp>
#include <soapd/soap/status.hpp>

#include <functional>
#include <iostream>
#include <map>
#include <set>

namespace soapd::soap
{

/// \brief the answer of a handler that recognized the message

struct handler_reply
{
	status_type status = ok;
	std::string message = "OK";
	xml::element payload;
};

/// \brief std::nullopt means the handler does not recognize the message
using handler_result = std::optional<handler_reply>;

/// \brief an operation handler
///
/// Called with the name under which it was registered, the complete
/// Envelope element and the message_info of the request. Handlers must
/// be synchronous, the dispatcher waits for the result.
using operation_handler = std::function<handler_result(const std::string& name,
	const xml::element& envelope, message_info& info)>;

/// \brief which WS-Addressing action table to use
enum class wsa_direction
{
	input,
	output
};

/// \brief map of operation name to action
using action_map = std::map<std::string, std::string>;

/// \brief the operation registry
///
/// Holds per protocol version the handlers by operation name, plus the
/// WS-Addressing and SOAPAction tables used to find an operation by
/// action.
///
/// A registry is filled at startup and read by any number of threads
/// once requests are being dispatched. There is no locking, adding
/// operations while requests are processed is not supported.
///
/// Note the two different conflict rules: registering a handler for an
/// existing name replaces it, while the action tables keep the first
/// action registered for a name, and the first name registered for an
/// action.

class registry
{
  public:
	registry() = default;
	registry(const registry&) = delete;
	registry& operator=(const registry&) = delete;

	/// \brief register \a handler for \a name in protocol \a version, a previous handler is replaced
	///
	/// Throws configuration_error when \a handler is empty or \a name is empty.
	void register_handler(protocol_version version, const std::string& name, operation_handler handler);

	/// \brief add WS-Addressing actions, existing entries are kept
	void add_wsa_actions(wsa_direction direction, const action_map& actions);

	/// \brief add a single WS-Addressing action, an existing entry is kept
	void add_wsa_action(wsa_direction direction, const std::string& name, const std::string& action);

	/// \brief add SOAPAction values, existing entries are kept in both directions
	void add_soap_actions(const action_map& actions);

	/// \brief add a single SOAPAction value
	void add_soap_action(const std::string& name, const std::string& action);

	/// \brief the handler for \a name in \a version, nullptr if there is none
	const operation_handler* find_handler(protocol_version version, const std::string& name) const;

	/// \brief the operation name registered for WS-Addressing input action \a action
	std::optional<std::string> find_by_wsa_action(const std::string& action) const;

	/// \brief the operation name registered for SOAPAction \a action
	std::optional<std::string> find_by_soap_action(const std::string& action) const;

	/// \brief the WS-Addressing action for \a name
	std::optional<std::string> wsa_action(wsa_direction direction, const std::string& name) const;

	/// \brief the SOAPAction value for \a name
	std::optional<std::string> soap_action(const std::string& name) const;

	/// \brief the names of the operations in \a version, sorted
	std::set<std::string> names(protocol_version version) const;

	/// \brief the protocol versions with at least one handler
	std::vector<protocol_version> versions() const;

	/// \brief print a table of the operations per protocol version
	void print_index(std::ostream& os) const;

  private:
	using handler_map = std::map<std::string, operation_handler>;

	std::map<protocol_version, handler_map> m_handlers;
	action_map m_wsa_input, m_wsa_output, m_wsa_input_rev;
	action_map m_soap_action, m_soap_action_rev;
};

} // namespace soapd::soap
