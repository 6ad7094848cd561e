//        Copyright Maarten L. Hekkelman, 2014-2023
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>

#include <boost/algorithm/string.hpp>

#include <soapd/exception.hpp>
#include <soapd/soap/action.hpp>
#include <soapd/soap/transport.hpp>

namespace ba = boost::algorithm;

namespace soapd::soap
{

namespace detail
{

	std::mutex s_access_log_lock;

} // namespace detail

// --------------------------------------------------------------------

void transport_reply::set_header(const std::string& name, const std::string& value)
{
	for (auto& h : headers)
	{
		if (ba::iequals(h.name, name))
		{
			h.value = value;
			return;
		}
	}

	headers.push_back({ name, value });
}

// --------------------------------------------------------------------

request_handler::request_handler(const dispatcher& disp)
	: m_dispatcher(disp)
{
}

void request_handler::set_wsdl_file(const std::string& path)
{
	std::ifstream file(path, std::ios::binary);
	if (not file.is_open())
		throw configuration_error("cannot read wsdl file " + path);

	std::ostringstream s;
	s << file.rdbuf();
	m_wsdl = s.str();
}

transport_reply request_handler::handle_request(const transport_request& req) const
{
	// set up a logging stream and collect logging information
	dispatcher::reset_log();

	transport_reply rep;

	try
	{
		rep = handle_request_internal(req);
	}
	catch (const std::exception& ex)
	{
		dispatcher::get_log() << ex.what();

		response rsp;
		rsp.status = internal_server_error;
		rsp.message = get_status_text(internal_server_error);
		rsp.error = ex.what();

		rep = make_reply(req, rsp);
	}

	if (m_log_requests)
		log_request(req, rep, dispatcher::reset_log());

	return rep;
}

transport_reply request_handler::handle_request_internal(const transport_request& req) const
{
	if (not m_wsdl.empty() and req.method == "GET" and ba::iends_with(req.uri, "?wsdl"))
	{
		transport_reply rep;
		rep.status = ok;
		rep.message = "WSDL specification";
		rep.content = m_wsdl;
		rep.set_header("Warning", "199 " + rep.message);
		rep.set_header("Content-Type", R"(application/wsdl+xml; charset="utf-8")");
		rep.set_header("Content-Length", std::to_string(rep.content.length()));
		rep.set_header("X-soapd-Version", SOAPD_VERSION);
		return rep;
	}

	if (req.method != "POST" and req.method != "M-POST")
		return make_reply(req, response::from_fault(fault_method_not_allowed(req.method)));

	std::string media = req.get_header("Content-Type");
	if (media.empty())
		media = "text/plain";

	std::string media_type = ba::to_lower_copy(ba::trim_copy(media.substr(0, media.find(';'))));
	if (not (ba::ends_with(media_type, "/xml") or ba::ends_with(media_type, "+xml")))
		return make_reply(req, response::from_fault(fault_not_acceptable(media)));

	auto action = soap_action_from_headers(req.method, req.headers);

	return make_reply(req, m_dispatcher.dispatch(req.payload, action));
}

transport_reply request_handler::make_reply(const transport_request& req, const response& rsp)
{
	transport_reply rep;
	rep.status = rsp.status;
	rep.message = rsp.message.empty() ? get_status_text(rsp.status) : rsp.message;

	rep.set_header("Warning", "199 " + rep.message);
	rep.set_header("X-soapd-Version", SOAPD_VERSION);

	if (rsp.payload)
	{
		std::ostringstream s;

		// errors are indented to make them more readable
		if (rsp.status != ok)
			s << std::setw(2);

		s << xml::document(xml::element(*rsp.payload));

		rep.content = s.str();
		rep.set_header("Content-Type", R"(text/xml; charset="utf-8")");
	}
	else
	{
		rep.content = '[' + std::to_string(static_cast<int>(rsp.status)) + "] " + (rsp.error.empty() ? rep.message : rsp.error);
		rep.set_header("Content-Type", "text/plain");
	}

	rep.set_header("Content-Length", std::to_string(rep.content.length()));

	// HTTP Extension Framework
	if (ba::starts_with(req.method, "M-"))
		rep.set_header("Ext", "");

	return rep;
}

void request_handler::log_request(const transport_request& req, const transport_reply& rep, const std::string& entry) const noexcept
{
	try
	{
		// protect the output stream from garbled log messages
		std::unique_lock<std::mutex> lock(detail::s_access_log_lock);

		const std::time_t now_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());

		std::cout << req.client << ' '
				  << "- - "
				  << std::put_time(std::localtime(&now_t), "[%d/%b/%Y:%H:%M:%S %z]") << ' '
				  << '"' << req.method << ' ' << req.uri << "\" "
				  << rep.status << ' '
				  << rep.content.length() << ' ';

		if (entry.empty())
			std::cout << '-' << std::endl;
		else
			std::cout << '"' << entry << '"' << std::endl;
	}
	catch (const std::exception& ex)
	{
		std::cerr << "Error writing access log: " << ex.what() << std::endl;
	}
}

} // namespace soapd::soap
