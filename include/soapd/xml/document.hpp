//        Copyright Maarten L. Hekkelman, 2014-2023
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// definition of the soapd::xml::document class

#include <soapd/config.hpp>
#include <soapd/exception.hpp>
#include <soapd/xml/node.hpp>

#include <optional>

namespace soapd::xml
{

/// \brief exception thrown when the input is not well-formed XML
class invalid_exception : public soapd::exception
{
  public:
	invalid_exception(const std::string& msg)
		: exception(msg) {}
};

/// soapd::xml::document is the class that contains a parsed XML file.
/// You can create an empty document and add an element to it, or you can
/// create it by specifying a string containing XML or an std::istream
/// to parse.
///
/// The actual parsing is done by libxml2, with network access and entity
/// expansion turned off. Whitespace-only text between elements is dropped.
///
/// A document has at most one element child.

class document
{
  public:
	/// \brief Constructor for an empty document.
	document();

	/// \brief Constructor that takes ownership of \a root
	explicit document(element&& root);

	/// \brief Constructor that will parse the XML passed in argument \a s
	explicit document(const std::string& s);

	/// \brief Constructor that will parse the XML passed in argument \a is
	explicit document(std::istream& is);

	document(const document&) = default;
	document(document&&) = default;
	document& operator=(const document&) = default;
	document& operator=(document&&) = default;

	/// \brief parse \a s replacing the current content, throws invalid_exception on error
	void read(const std::string& s);

	/// \brief parse the content of \a is replacing the current content
	void read(std::istream& is);

	bool empty() const							{ return not m_child.has_value(); }

	/// \brief the root element, nullptr if the document is empty
	element* child()							{ return m_child ? &*m_child : nullptr; }
	const element* child() const				{ return m_child ? &*m_child : nullptr; }

	void set_child(element&& e)					{ m_child = std::move(e); }

	bool operator==(const document& doc) const;
	bool operator!=(const document& doc) const	{ return not operator==(doc); }

	/// \brief write the XML declaration followed by the root element,
	/// the width of \a os is used as indentation
	friend std::ostream& operator<<(std::ostream& os, const document& doc);

  private:
	std::optional<element> m_child;
};

namespace literals
{
	/// \brief parse an XML literal
	///
	/// \code
	/// using namespace soapd::xml::literals;
	/// auto doc = R"(<test/>)"_xml;
	/// \endcode
	document operator""_xml(const char* text, size_t length);
} // namespace literals

} // namespace soapd::xml
