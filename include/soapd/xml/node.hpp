//        Copyright Maarten L. Hekkelman, 2014-2023
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// the element and attribute classes used to hold a SOAP message in memory
///
/// An element has a qualified name, a list of attributes, a text content
/// and a list of child elements. Namespaces are resolved the XML way, the
/// prefix of a qname is looked up in the xmlns attributes of the element
/// and its ancestors. Comments and processing instructions are not kept,
/// a SOAP processor has no use for them.

#include <soapd/config.hpp>

#include <initializer_list>
#include <iostream>
#include <list>
#include <string>
#include <utility>
#include <vector>

namespace soapd::xml
{

class element;

// --------------------------------------------------------------------

/// \brief an attribute is a qname/value pair, namespace declarations are attributes too

struct attribute
{
	std::string m_qname;
	std::string m_value;

	attribute() = default;
	attribute(const std::string& qname, const std::string& value)
		: m_qname(qname), m_value(value) {}

	const std::string& get_qname() const	{ return m_qname; }
	const std::string& value() const		{ return m_value; }

	/// \brief the local part of the qname
	std::string name() const;

	/// \brief the prefix part of the qname, empty if there is none
	std::string get_prefix() const;

	/// \brief true for xmlns and xmlns:xxx attributes
	bool is_namespace() const;

	bool operator==(const attribute& a) const
	{
		return m_qname == a.m_qname and m_value == a.m_value;
	}
};

using attribute_list = std::vector<attribute>;

// --------------------------------------------------------------------

/// \brief the element class
///
/// Child elements are owned by value. Copying an element copies the
/// complete subtree, moving it is cheap.

class element
{
  public:
	using element_list = std::list<element>;
	using iterator = element_list::iterator;
	using const_iterator = element_list::const_iterator;

	element();
	explicit element(const std::string& qname);
	element(const std::string& qname, std::initializer_list<attribute> attributes);

	element(const element& e);
	element(element&& e);
	element& operator=(const element& e);
	element& operator=(element&& e);

	~element();

	void swap(element& e) noexcept;

	// --------------------------------------------------------------------
	// naming

	/// \brief the qualified name as it was written, e.g. soap:Envelope
	const std::string& get_qname() const		{ return m_qname; }
	void set_qname(const std::string& qname)	{ m_qname = qname; }

	/// \brief the local name, the qname without its prefix
	std::string name() const;

	/// \brief the prefix of the qname
	std::string get_prefix() const;

	/// \brief the namespace URI for this element, resolved through its prefix
	std::string get_ns() const;

	/// \brief return the namespace URI bound to \a prefix in the scope of this element
	std::string namespace_for_prefix(const std::string& prefix) const;

	/// \brief return the prefix bound to \a uri, the second field is false if not found
	std::pair<std::string, bool> prefix_for_namespace(const std::string& uri) const;

	/// \brief resolve a QName valued attribute or text, returning the {ns}local form
	std::string resolve_qname(const std::string& qname) const;

	element* parent()							{ return m_parent; }
	const element* parent() const				{ return m_parent; }

	// --------------------------------------------------------------------
	// attributes

	const attribute_list& attributes() const	{ return m_attributes; }

	/// \brief return the value of attribute \a qname, empty string if not found
	std::string get_attribute(const std::string& qname) const;

	/// \brief return the value of the attribute named \a name in namespace \a ns
	std::string get_attribute(const std::string& ns, const std::string& name) const;

	void set_attribute(const std::string& qname, const std::string& value);

	/// \brief declare namespace \a uri with prefix \a prefix on this element
	void set_name_space(const std::string& prefix, const std::string& uri);

	// --------------------------------------------------------------------
	// content

	/// \brief the text content directly contained in this element
	const std::string& get_content() const		{ return m_content; }
	void set_content(const std::string& content);
	void add_text(const std::string& text);

	// --------------------------------------------------------------------
	// children

	iterator begin()							{ return m_children.begin(); }
	iterator end()								{ return m_children.end(); }
	const_iterator begin() const				{ return m_children.begin(); }
	const_iterator end() const					{ return m_children.end(); }

	bool empty() const							{ return m_children.empty(); }
	size_t size() const							{ return m_children.size(); }

	element& front()							{ return m_children.front(); }
	const element& front() const				{ return m_children.front(); }

	element& emplace_back(const std::string& qname);
	element& emplace_back(const std::string& qname, std::initializer_list<attribute> attributes);
	element& emplace_back(const element& e);
	element& emplace_back(element&& e);

	/// \brief return the first child element with local name \a name in namespace \a ns
	element* find_child(const std::string& ns, const std::string& name);
	const element* find_child(const std::string& ns, const std::string& name) const;

	/// \brief return all child elements with local name \a name in namespace \a ns
	std::vector<const element*> find_children(const std::string& ns, const std::string& name) const;

	// --------------------------------------------------------------------
	// comparing and writing

	/// \brief compare two elements, namespace declarations and prefixes must match too
	bool operator==(const element& e) const;
	bool operator!=(const element& e) const		{ return not operator==(e); }

	/// \brief write this element, \a indent is the number of spaces per level, 0 means no indentation
	void write(std::ostream& os, int indent, int level = 0) const;

	/// \brief return the element as a string, without indentation
	std::string str() const;

	/// \brief the stream operator uses the width of the stream as indentation
	///
	/// \code
	/// std::cout << std::setw(2) << e;
	/// \endcode
	friend std::ostream& operator<<(std::ostream& os, const element& e);

  private:
	void reparent();

	std::string m_qname;
	attribute_list m_attributes;
	std::string m_content;
	element_list m_children;
	element* m_parent = nullptr;
};

/// \brief write the string \a s escaped for use as XML content or attribute value
void write_string(std::ostream& os, const std::string& s, bool escape_quot);

/// \brief return the qualified type of \a e as {namespace-uri}local-name, the way
/// type names are printed in diagnostics
std::string type_of_node(const element& e);

} // namespace soapd::xml
