//        Copyright Maarten L. Hekkelman, 2014-2023
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

// A SOAP service run as a CGI script. The operations are described in
// names.wsdl, the location of which is taken from the environment variable
// NAMES_WSDL. The service knows a few first names per country.

#include <cstdlib>
#include <iostream>
#include <iterator>
#include <map>
#include <set>

#include <soapd/soap/transport.hpp>
#include <soapd/soap/wsdl.hpp>

using namespace std;
namespace s = soapd::soap;
namespace sx = soapd::xml;

namespace
{

const string kTypesNS = "http://example.com/names/types";

struct country_names
{
	set<string> male, female;
};

const map<string, country_names> kNames{
	{ "Netherlands", { { "Daan", "Sem", "Lucas", "Jan" }, { "Emma", "Julia", "Tess", "Anna" } } },
	{ "Austria", { { "Lukas", "Jakob", "Maximilian", "Jan" }, { "Anna", "Marie", "Lena" } } },
	{ "Germany", { { "Ben", "Paul", "Leon", "Lukas" }, { "Mia", "Emma", "Hannah", "Marie" } } }
};

string getenv_str(const char* name)
{
	const char* v = getenv(name);
	return v ? v : "";
}

sx::element make_response(const string& name)
{
	return sx::element("x:" + name, { { "xmlns:x", kTypesNS } });
}

string child_content(const sx::element& request, const string& name)
{
	auto e = request.find_child(kTypesNS, name);
	if (e == nullptr)
		throw runtime_error("missing parameter " + name);
	return e->get_content();
}

s::handler_reply get_countries(const string&, const sx::element&, const s::message_info&)
{
	s::handler_reply reply;
	reply.payload = make_response("getCountriesResponse");

	for (auto& [country, names] : kNames)
		reply.payload.emplace_back("x:country").set_content(country);

	return reply;
}

s::handler_reply get_names_in_country(const string&, const sx::element& request, const s::message_info&)
{
	auto country = child_content(request, "country");

	auto i = kNames.find(country);
	if (i == kNames.end())
		throw runtime_error("unknown country " + country);

	set<string> names(i->second.male);
	names.insert(i->second.female.begin(), i->second.female.end());

	s::handler_reply reply;
	reply.payload = make_response("getNamesInCountryResponse");

	for (auto& name : names)
		reply.payload.emplace_back("x:name").set_content(name);

	return reply;
}

s::handler_reply get_name_info(const string&, const sx::element& request, const s::message_info&)
{
	auto name = child_content(request, "name");

	bool male = false, female = false;
	vector<string> countries;

	for (auto& [country, names] : kNames)
	{
		bool m = names.male.count(name) > 0;
		bool f = names.female.count(name) > 0;

		if (m or f)
			countries.push_back(country);

		male = male or m;
		female = female or f;
	}

	s::handler_reply reply;
	reply.payload = make_response("getNameInfoResponse");

	reply.payload.emplace_back("x:male").set_content(male ? "true" : "false");
	reply.payload.emplace_back("x:female").set_content(female ? "true" : "false");
	for (auto& country : countries)
		reply.payload.emplace_back("x:country").set_content(country);

	return reply;
}

} // namespace

int main()
{
	try
	{
		string wsdl_file = getenv_str("NAMES_WSDL");
		if (wsdl_file.empty())
			wsdl_file = "names.wsdl";

		s::registry reg;
		s::import_operations(reg, s::wsdl11::load(wsdl_file), {
			{ "getCountries", &get_countries },
			{ "getNamesInCountry", &get_names_in_country },
			{ "getNameInfo", &get_name_info }
		});

		s::dispatcher disp(reg);

		s::request_handler handler(disp);
		handler.set_wsdl_file(wsdl_file);

		// the web server writes its own access log
		handler.set_log_requests(false);

		s::transport_request req;
		req.method = getenv_str("REQUEST_METHOD");
		req.uri = getenv_str("SCRIPT_NAME");
		if (not getenv_str("QUERY_STRING").empty())
			req.uri += '?' + getenv_str("QUERY_STRING");
		req.client = getenv_str("REMOTE_ADDR");

		if (auto content_type = getenv_str("CONTENT_TYPE"); not content_type.empty())
			req.headers.push_back({ "Content-Type", content_type });
		if (auto soap_action = getenv_str("HTTP_SOAPACTION"); not soap_action.empty())
			req.headers.push_back({ "SOAPAction", soap_action });

		auto length = getenv_str("CONTENT_LENGTH");
		if (not length.empty())
		{
			req.payload.resize(stoul(length));
			cin.read(req.payload.data(), req.payload.size());
			req.payload.resize(cin.gcount());
		}

		auto rep = handler.handle_request(req);

		cout << "Status: " << rep.status << ' ' << rep.message << "\r\n";
		for (auto& h : rep.headers)
			cout << h.name << ": " << h.value << "\r\n";
		cout << "\r\n"
			 << rep.content;
	}
	catch (const exception& ex)
	{
		cout << "Status: 500 Internal Server Error\r\n"
			 << "Content-Type: text/plain\r\n"
			 << "\r\n"
			 << ex.what() << endl;
	}

	return 0;
}
