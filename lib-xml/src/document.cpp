//        Copyright Maarten L. Hekkelman, 2014-2023
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#include <mutex>
#include <sstream>
#include <stack>

#include <boost/algorithm/string.hpp>

#include <libxml/parser.h>
#include <libxml/xmlreader.h>

#include <soapd/xml/document.hpp>

namespace ba = boost::algorithm;

namespace soapd::xml
{

// --------------------------------------------------------------------
// the libxml2 xmlTextReader is used to walk the input, the nodes it
// reports are turned into our own element tree

namespace
{

	std::once_flag s_libxml2_init;

	struct libxml2_reader
	{
		libxml2_reader(document& doc)
			: m_doc(doc)
		{
		}

		void parse(const std::string& data);

		void process_node(xmlTextReaderPtr reader);
		void start_element(xmlTextReaderPtr reader);
		void end_element(xmlTextReaderPtr reader);
		void character_data(xmlTextReaderPtr reader);

		static void error_handler(void* arg, const char* msg,
			xmlParserSeverities severity, xmlTextReaderLocatorPtr locator);

		document& m_doc;
		std::stack<element*> m_stack;
		std::string m_error;
	};

	void libxml2_reader::start_element(xmlTextReaderPtr reader)
	{
		const char* qname = reinterpret_cast<const char*>(xmlTextReaderConstName(reader));
		if (qname == nullptr)
			throw invalid_exception("Element without a name");

		element* cur;
		if (m_stack.empty())
		{
			if (not m_doc.empty())
				throw invalid_exception("Document has more than one root element");

			m_doc.set_child(element(qname));
			cur = m_doc.child();
		}
		else
			cur = &m_stack.top()->emplace_back(qname);

		// namespace declarations are reported as attributes too
		int count = xmlTextReaderAttributeCount(reader);
		for (int i = 0; i < count; ++i)
		{
			if (xmlTextReaderMoveToAttributeNo(reader, i) != 1)
				continue;

			cur->set_attribute(
				reinterpret_cast<const char*>(xmlTextReaderConstName(reader)),
				reinterpret_cast<const char*>(xmlTextReaderConstValue(reader)));
		}

		xmlTextReaderMoveToElement(reader);

		if (not xmlTextReaderIsEmptyElement(reader))
			m_stack.push(cur);
	}

	void libxml2_reader::end_element(xmlTextReaderPtr reader)
	{
		if (m_stack.empty())
			throw invalid_exception("Unbalanced end tag");
		m_stack.pop();
	}

	void libxml2_reader::character_data(xmlTextReaderPtr reader)
	{
		// text outside the root element is not possible in well-formed XML
		if (m_stack.empty())
			return;

		const char* text = reinterpret_cast<const char*>(xmlTextReaderConstValue(reader));
		if (text != nullptr)
			m_stack.top()->add_text(text);
	}

	void libxml2_reader::process_node(xmlTextReaderPtr reader)
	{
		switch (xmlTextReaderNodeType(reader))
		{
			case XML_READER_TYPE_ELEMENT:
				start_element(reader);
				break;

			case XML_READER_TYPE_END_ELEMENT:
				end_element(reader);
				break;

			case XML_READER_TYPE_TEXT:
			case XML_READER_TYPE_CDATA:
				character_data(reader);
				break;

			// whitespace between elements, comments and processing
			// instructions have no meaning in a SOAP message
			default:
				break;
		}
	}

	void libxml2_reader::error_handler(void* arg, const char* msg,
		xmlParserSeverities severity, xmlTextReaderLocatorPtr locator)
	{
		auto self = static_cast<libxml2_reader*>(arg);

		if (severity != XML_PARSER_SEVERITY_ERROR and severity != XML_PARSER_SEVERITY_VALIDITY_ERROR)
			return;

		if (self->m_error.empty() and msg != nullptr)
		{
			self->m_error = ba::trim_copy(std::string(msg));

			int line = xmlTextReaderLocatorLineNumber(locator);
			if (line > 0)
				self->m_error += " (line " + std::to_string(line) + ')';
		}
	}

	void libxml2_reader::parse(const std::string& data)
	{
		std::call_once(s_libxml2_init, []() { xmlInitParser(); });

		xmlTextReaderPtr reader = xmlReaderForMemory(data.data(), static_cast<int>(data.length()),
			nullptr, nullptr, XML_PARSE_NONET | XML_PARSE_NOCDATA);

		if (reader == nullptr)
			throw invalid_exception("Could not create XML reader");

		xmlTextReaderSetErrorHandler(reader, &libxml2_reader::error_handler, this);

		int ret;
		try
		{
			while ((ret = xmlTextReaderRead(reader)) == 1)
				process_node(reader);
		}
		catch (...)
		{
			xmlFreeTextReader(reader);
			throw;
		}

		xmlFreeTextReader(reader);

		if (ret != 0 or not m_error.empty())
			throw invalid_exception(m_error.empty() ? "XML parse error" : m_error);

		if (m_doc.empty())
			throw invalid_exception("Document is empty");
	}

} // namespace

// --------------------------------------------------------------------

document::document()
{
}

document::document(element&& root)
	: m_child(std::move(root))
{
}

document::document(const std::string& s)
{
	read(s);
}

document::document(std::istream& is)
{
	read(is);
}

void document::read(const std::string& s)
{
	m_child.reset();

	libxml2_reader reader(*this);

	try
	{
		reader.parse(s);
	}
	catch (...)
	{
		m_child.reset();
		throw;
	}
}

void document::read(std::istream& is)
{
	std::ostringstream data;
	data << is.rdbuf();
	read(data.str());
}

bool document::operator==(const document& doc) const
{
	if (empty() or doc.empty())
		return empty() == doc.empty();
	return *m_child == *doc.m_child;
}

std::ostream& operator<<(std::ostream& os, const document& doc)
{
	int indent = static_cast<int>(os.width());
	os.width(0);

	os << R"(<?xml version="1.0" encoding="UTF-8"?>)";
	if (indent > 0)
		os << '\n';

	if (not doc.empty())
		doc.child()->write(os, indent);

	if (indent > 0)
		os << '\n';

	return os;
}

namespace literals
{
	document operator""_xml(const char* text, size_t length)
	{
		return document(std::string(text, length));
	}
} // namespace literals

} // namespace soapd::xml
