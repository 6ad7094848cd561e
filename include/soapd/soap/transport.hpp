//        Copyright Maarten L. Hekkelman, 2014-2023
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// definition of the soapd::soap::request_handler class, the part every
/// transport binding (a daemon, a CGI script) has in common.
///
/// A transport reads a request, fills in a transport_request and sends the
/// transport_reply it gets back. The request_handler takes care of the
/// rest: it answers WSDL queries, refuses anything that is not a POST of
/// XML, finds the SOAPAction, calls the dispatcher and turns its response
/// into status, headers and content.

#include <soapd/soap/dispatcher.hpp>
#include <soapd/soap/header.hpp>

namespace soapd::soap
{

struct transport_request
{
	std::string method = "POST";
	std::string uri = "/";			///< path and query
	header_list headers;
	std::string payload;
	std::string client = "-";		///< address of the client, used for logging only

	std::string get_header(const std::string& name) const
	{
		return soap::get_header(headers, name);
	}
};

struct transport_reply
{
	status_type status = internal_server_error;
	std::string message;
	header_list headers;
	std::string content;

	std::string get_header(const std::string& name) const
	{
		return soap::get_header(headers, name);
	}

	void set_header(const std::string& name, const std::string& value);
};

class request_handler
{
  public:
	/// \brief create a request_handler using \a disp, which must outlive it
	request_handler(const dispatcher& disp);

	request_handler(const request_handler&) = delete;
	request_handler& operator=(const request_handler&) = delete;

	/// \brief answer GET requests for ?WSDL with \a wsdl
	void set_wsdl(const std::string& wsdl)		{ m_wsdl = wsdl; }

	/// \brief answer GET requests for ?WSDL with the content of file \a path
	void set_wsdl_file(const std::string& path);

	/// \brief write an access log line to std::cout for each request, on by default
	void set_log_requests(bool log)				{ m_log_requests = log; }

	/// \brief handle \a req, this never throws
	transport_reply handle_request(const transport_request& req) const;

	/// \brief turn the dispatcher response \a rsp into a reply for \a req
	static transport_reply make_reply(const transport_request& req, const response& rsp);

  private:
	transport_reply handle_request_internal(const transport_request& req) const;

	void log_request(const transport_request& req, const transport_reply& rep, const std::string& entry) const noexcept;

	const dispatcher& m_dispatcher;
	std::string m_wsdl;
	bool m_log_requests = true;
};

} // namespace soapd::soap
