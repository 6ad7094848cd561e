//        Copyright Maarten L. Hekkelman, 2014-2023
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#include <algorithm>
#include <sstream>

#include <soapd/exception.hpp>
#include <soapd/xml/node.hpp>

namespace soapd::xml
{

const std::string kXMLNamespace("http://www.w3.org/XML/1998/namespace");

// --------------------------------------------------------------------

void write_string(std::ostream& os, const std::string& s, bool escape_quot)
{
	for (char c : s)
	{
		switch (c)
		{
			case '&':	os << "&amp;";	break;
			case '<':	os << "&lt;";	break;
			case '>':	os << "&gt;";	break;
			case '\"':	if (escape_quot) os << "&quot;"; else os << c; break;
			case '\r':	os << "&#13;";	break;
			case 0:		throw exception("Invalid null character in XML content");
			default:	os << c;		break;
		}
	}
}

std::string type_of_node(const element& e)
{
	std::string ns = e.get_ns();
	return ns.empty() ? e.name() : '{' + ns + '}' + e.name();
}

// --------------------------------------------------------------------

std::string attribute::name() const
{
	std::string::size_type d = m_qname.find(':');
	return d == std::string::npos ? m_qname : m_qname.substr(d + 1);
}

std::string attribute::get_prefix() const
{
	std::string::size_type d = m_qname.find(':');
	return d == std::string::npos ? "" : m_qname.substr(0, d);
}

bool attribute::is_namespace() const
{
	return m_qname == "xmlns" or m_qname.compare(0, 6, "xmlns:") == 0;
}

// --------------------------------------------------------------------

element::element()
{
}

element::element(const std::string& qname)
	: m_qname(qname)
{
}

element::element(const std::string& qname, std::initializer_list<attribute> attributes)
	: m_qname(qname)
	, m_attributes(attributes)
{
}

element::element(const element& e)
	: m_qname(e.m_qname)
	, m_attributes(e.m_attributes)
	, m_content(e.m_content)
	, m_children(e.m_children)
{
	reparent();
}

element::element(element&& e)
	: m_qname(std::move(e.m_qname))
	, m_attributes(std::move(e.m_attributes))
	, m_content(std::move(e.m_content))
	, m_children(std::move(e.m_children))
{
	reparent();
}

element& element::operator=(const element& e)
{
	if (this != &e)
	{
		element tmp(e);
		swap(tmp);
	}
	return *this;
}

element& element::operator=(element&& e)
{
	if (this != &e)
	{
		m_qname = std::move(e.m_qname);
		m_attributes = std::move(e.m_attributes);
		m_content = std::move(e.m_content);
		m_children = std::move(e.m_children);
		reparent();
	}
	return *this;
}

element::~element()
{
}

void element::swap(element& e) noexcept
{
	std::swap(m_qname, e.m_qname);
	std::swap(m_attributes, e.m_attributes);
	std::swap(m_content, e.m_content);
	std::swap(m_children, e.m_children);

	// the parent stays, that is where the element lives
	reparent();
	e.reparent();
}

void element::reparent()
{
	for (auto& c : m_children)
		c.m_parent = this;
}

// --------------------------------------------------------------------

std::string element::name() const
{
	std::string::size_type d = m_qname.find(':');
	return d == std::string::npos ? m_qname : m_qname.substr(d + 1);
}

std::string element::get_prefix() const
{
	std::string::size_type d = m_qname.find(':');
	return d == std::string::npos ? "" : m_qname.substr(0, d);
}

std::string element::get_ns() const
{
	return namespace_for_prefix(get_prefix());
}

std::string element::namespace_for_prefix(const std::string& prefix) const
{
	if (prefix == "xml")
		return kXMLNamespace;

	for (auto& a : m_attributes)
	{
		if (not a.is_namespace())
			continue;

		if (a.get_qname() == "xmlns")
		{
			if (prefix.empty())
				return a.value();
			continue;
		}

		if (a.name() == prefix)
			return a.value();
	}

	std::string result;
	if (m_parent != nullptr)
		result = m_parent->namespace_for_prefix(prefix);
	return result;
}

std::pair<std::string, bool> element::prefix_for_namespace(const std::string& uri) const
{
	for (auto& a : m_attributes)
	{
		if (a.is_namespace() and a.value() == uri)
			return { a.get_qname() == "xmlns" ? "" : a.name(), true };
	}

	std::pair<std::string, bool> result{};
	if (m_parent != nullptr)
		result = m_parent->prefix_for_namespace(uri);
	return result;
}

std::string element::resolve_qname(const std::string& qname) const
{
	std::string prefix, local = qname;

	std::string::size_type d = qname.find(':');
	if (d != std::string::npos)
	{
		prefix = qname.substr(0, d);
		local = qname.substr(d + 1);
	}

	std::string ns = namespace_for_prefix(prefix);
	if (ns.empty() and not prefix.empty())
		throw exception("Undeclared namespace prefix '" + prefix + "' in " + qname);

	return ns.empty() ? local : '{' + ns + '}' + local;
}

// --------------------------------------------------------------------

std::string element::get_attribute(const std::string& qname) const
{
	std::string result;

	auto a = std::find_if(m_attributes.begin(), m_attributes.end(),
		[&qname](const attribute& a) { return a.get_qname() == qname; });
	if (a != m_attributes.end())
		result = a->value();

	return result;
}

std::string element::get_attribute(const std::string& ns, const std::string& name) const
{
	std::string result;

	for (auto& a : m_attributes)
	{
		if (a.is_namespace() or a.name() != name)
			continue;

		// unprefixed attributes are in no namespace at all
		std::string prefix = a.get_prefix();
		if ((prefix.empty() and ns.empty()) or
			(not prefix.empty() and namespace_for_prefix(prefix) == ns))
		{
			result = a.value();
			break;
		}
	}

	return result;
}

void element::set_attribute(const std::string& qname, const std::string& value)
{
	auto a = std::find_if(m_attributes.begin(), m_attributes.end(),
		[&qname](const attribute& a) { return a.get_qname() == qname; });
	if (a != m_attributes.end())
		a->m_value = value;
	else
		m_attributes.emplace_back(qname, value);
}

void element::set_name_space(const std::string& prefix, const std::string& uri)
{
	set_attribute(prefix.empty() ? "xmlns" : "xmlns:" + prefix, uri);
}

// --------------------------------------------------------------------

void element::set_content(const std::string& content)
{
	m_content = content;
}

void element::add_text(const std::string& text)
{
	m_content += text;
}

// --------------------------------------------------------------------

element& element::emplace_back(const std::string& qname)
{
	return emplace_back(element(qname));
}

element& element::emplace_back(const std::string& qname, std::initializer_list<attribute> attributes)
{
	return emplace_back(element(qname, attributes));
}

element& element::emplace_back(const element& e)
{
	return emplace_back(element(e));
}

element& element::emplace_back(element&& e)
{
	auto& result = m_children.emplace_back(std::move(e));
	result.m_parent = this;
	return result;
}

element* element::find_child(const std::string& ns, const std::string& name)
{
	for (auto& c : m_children)
	{
		if (c.name() == name and c.get_ns() == ns)
			return &c;
	}
	return nullptr;
}

const element* element::find_child(const std::string& ns, const std::string& name) const
{
	return const_cast<element*>(this)->find_child(ns, name);
}

std::vector<const element*> element::find_children(const std::string& ns, const std::string& name) const
{
	std::vector<const element*> result;
	for (auto& c : m_children)
	{
		if (c.name() == name and c.get_ns() == ns)
			result.push_back(&c);
	}
	return result;
}

// --------------------------------------------------------------------

bool element::operator==(const element& e) const
{
	if (m_qname != e.m_qname or m_content != e.m_content or
		m_attributes.size() != e.m_attributes.size() or m_children.size() != e.m_children.size())
		return false;

	for (auto& a : m_attributes)
	{
		if (std::find(e.m_attributes.begin(), e.m_attributes.end(), a) == e.m_attributes.end())
			return false;
	}

	return std::equal(m_children.begin(), m_children.end(), e.m_children.begin());
}

void element::write(std::ostream& os, int indent, int level) const
{
	if (indent > 0 and level > 0)
		os << '\n' << std::string(indent * level, ' ');

	os << '<' << m_qname;

	for (auto& a : m_attributes)
	{
		os << ' ' << a.get_qname() << "=\"";
		write_string(os, a.value(), true);
		os << '"';
	}

	if (m_content.empty() and m_children.empty())
	{
		os << "/>";
		return;
	}

	os << '>';

	write_string(os, m_content, false);

	for (auto& c : m_children)
		c.write(os, indent, level + 1);

	if (indent > 0 and not m_children.empty())
		os << '\n' << std::string(indent * level, ' ');

	os << "</" << m_qname << '>';
}

std::string element::str() const
{
	std::ostringstream s;
	write(s, 0);
	return s.str();
}

std::ostream& operator<<(std::ostream& os, const element& e)
{
	int indent = static_cast<int>(os.width());
	os.width(0);

	e.write(os, indent);

	return os;
}

} // namespace soapd::xml
