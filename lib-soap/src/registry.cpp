//        Copyright Maarten L. Hekkelman, 2014-2023
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#include <soapd/exception.hpp>
#include <soapd/soap/registry.hpp>

namespace soapd::soap
{

void registry::register_handler(protocol_version version, const std::string& name, operation_handler handler)
{
	if (name.empty())
		throw configuration_error("Cannot register a handler without a name");

	if (not handler)
		throw configuration_error("Handler for operation " + name + " is not callable");

	m_handlers[version][name] = std::move(handler);
}

void registry::add_wsa_actions(wsa_direction direction, const action_map& actions)
{
	for (auto& [name, action] : actions)
		add_wsa_action(direction, name, action);
}

void registry::add_wsa_action(wsa_direction direction, const std::string& name, const std::string& action)
{
	if (action.empty())
		return;

	if (direction == wsa_direction::input)
	{
		// the reverse table only knows the actions that made it into the forward table
		if (m_wsa_input.emplace(name, action).second)
			m_wsa_input_rev.emplace(action, name);
	}
	else
		m_wsa_output.emplace(name, action);
}

void registry::add_soap_actions(const action_map& actions)
{
	for (auto& [name, action] : actions)
		add_soap_action(name, action);
}

void registry::add_soap_action(const std::string& name, const std::string& action)
{
	if (action.empty())
		return;

	m_soap_action.emplace(name, action);
	m_soap_action_rev.emplace(action, name);
}

const operation_handler* registry::find_handler(protocol_version version, const std::string& name) const
{
	const operation_handler* result = nullptr;

	auto v = m_handlers.find(version);
	if (v != m_handlers.end())
	{
		auto h = v->second.find(name);
		if (h != v->second.end())
			result = &h->second;
	}

	return result;
}

std::optional<std::string> registry::find_by_wsa_action(const std::string& action) const
{
	auto i = m_wsa_input_rev.find(action);
	if (i == m_wsa_input_rev.end())
		return {};
	return i->second;
}

std::optional<std::string> registry::find_by_soap_action(const std::string& action) const
{
	auto i = m_soap_action_rev.find(action);
	if (i == m_soap_action_rev.end())
		return {};
	return i->second;
}

std::optional<std::string> registry::wsa_action(wsa_direction direction, const std::string& name) const
{
	auto& table = direction == wsa_direction::input ? m_wsa_input : m_wsa_output;

	auto i = table.find(name);
	if (i == table.end())
		return {};
	return i->second;
}

std::optional<std::string> registry::soap_action(const std::string& name) const
{
	auto i = m_soap_action.find(name);
	if (i == m_soap_action.end())
		return {};
	return i->second;
}

std::set<std::string> registry::names(protocol_version version) const
{
	std::set<std::string> result;

	auto v = m_handlers.find(version);
	if (v != m_handlers.end())
	{
		for (auto& [name, handler] : v->second)
			result.insert(name);
	}

	return result;
}

std::vector<protocol_version> registry::versions() const
{
	std::vector<protocol_version> result;

	for (auto version : known_protocols())
	{
		auto v = m_handlers.find(version);
		if (v != m_handlers.end() and not v->second.empty())
			result.push_back(version);
	}

	return result;
}

void registry::print_index(std::ostream& os) const
{
	for (auto version : versions())
	{
		os << to_string(version) << ':' << std::endl;
		for (auto& name : names(version))
			os << "   " << name << std::endl;
	}
}

} // namespace soapd::soap
