#define BOOST_TEST_MODULE Dispatcher_Test
#include <boost/test/included/unit_test.hpp>

#include <stdexcept>

#include <soapd/soap/dispatcher.hpp>

using namespace std;
namespace s = soapd::soap;
namespace sx = soapd::xml;

namespace
{

const string kSOAP11NS = "http://schemas.xmlsoap.org/soap/envelope/";
const string kSOAP12NS = "http://www.w3.org/2003/05/soap-envelope";

string make_message(const string& envns, const string& body, const string& header = "")
{
	string result = R"(<?xml version="1.0" encoding="UTF-8"?>
<env:Envelope xmlns:env=")" + envns + R"(">)";

	if (not header.empty())
		result += "<env:Header>" + header + "</env:Header>";

	result += "<env:Body>" + body + "</env:Body></env:Envelope>";

	return result;
}

const string kGetInfo = R"(<n:getInfo xmlns:n="urn:names"><n:name>Mark</n:name></n:getInfo>)";
const string kGetCountries = R"(<n:getCountries xmlns:n="urn:names"/>)";

// a record of the handler calls
struct call_log
{
	vector<string> names;
	vector<string> strategies;
};

// a handler recognizing messages with a first body element of type \a type,
// an empty type matches everything
s::operation_handler recognize(const string& type, call_log& log)
{
	return [type, &log](const string& name, const sx::element& env, s::message_info& info) -> s::handler_result
	{
		log.names.push_back(name);
		log.strategies.push_back(info.selected_by);

		if (not type.empty())
		{
			auto request = s::find_request(env);
			if (request == nullptr or sx::type_of_node(*request) != type)
				return {};
		}

		s::handler_reply reply;
		reply.payload = s::make_envelope(info.version,
			sx::element("n:" + name + "Response", { { "xmlns:n", "urn:names" } }));
		return reply;
	};
}

// a handler accepting anything
s::operation_handler accept_all(call_log& log)
{
	return recognize("", log);
}

s::operation_handler decline_all(call_log& log)
{
	return [&log](const string& name, const sx::element&, s::message_info& info) -> s::handler_result
	{
		log.names.push_back(name);
		log.strategies.push_back(info.selected_by);
		return {};
	};
}

string response_element(const s::response& rsp)
{
	BOOST_REQUIRE(rsp.payload);

	auto request = s::find_request(*rsp.payload);
	BOOST_REQUIRE(request != nullptr);

	return sx::type_of_node(*request);
}

} // namespace

// --------------------------------------------------------------------

BOOST_AUTO_TEST_CASE(invalid_xml)
{
	s::registry reg;
	s::dispatcher d(reg);

	vector<string> bodies{
		"this is not XML",
		"",
		"<a><b></a>",
		string("\x00\x01\x02\xff", 4),
		R"(<?xml version="1.0"?>)"
	};

	for (auto& body : bodies)
	{
		s::response rsp;
		BOOST_CHECK_NO_THROW(rsp = d.dispatch(body));

		BOOST_TEST(rsp.status == 422);
		BOOST_TEST(rsp.message == "XML syntax error");
		BOOST_TEST(rsp.error.find("The XML cannot be parsed") == 0);
		BOOST_TEST(not rsp.payload);
	}
}

BOOST_AUTO_TEST_CASE(not_a_soap_message)
{
	s::registry reg;
	s::dispatcher d(reg);

	auto rsp = d.dispatch(R"(<x:foo xmlns:x="urn:x"><bar/></x:foo>)");
	BOOST_TEST(rsp.status == 403);
	BOOST_TEST(rsp.message == "message not SOAP");
	BOOST_TEST(rsp.error.find("{urn:x}foo") != string::npos);

	rsp = d.dispatch("<foo/>");
	BOOST_TEST(rsp.status == 403);
	BOOST_TEST(rsp.error.find("`foo'") != string::npos);
}

BOOST_AUTO_TEST_CASE(unsupported_version)
{
	s::registry reg;
	s::dispatcher d(reg);

	auto rsp = d.dispatch(make_message("urn:no-soap-at-all", kGetInfo));
	BOOST_TEST(rsp.status == 501);
	BOOST_TEST(rsp.message == "SOAP version not supported");
	BOOST_TEST(rsp.error == "The soap version `urn:no-soap-at-all' is not supported");

	rsp = d.dispatch("<Envelope><Body/></Envelope>");
	BOOST_TEST(rsp.status == 501);
	BOOST_TEST(rsp.error == "The soap version `' is not supported");
}

BOOST_AUTO_TEST_CASE(lookup_by_name)
{
	s::registry reg;
	call_log log;

	reg.register_handler(s::protocol_version::soap11, "getInfo", decline_all(log));
	reg.register_handler(s::protocol_version::soap12, "getInfo", accept_all(log));

	sx::element env("Envelope");
	s::message_info info;

	auto h11 = reg.find_handler(s::protocol_version::soap11, "getInfo");
	auto h12 = reg.find_handler(s::protocol_version::soap12, "getInfo");
	BOOST_REQUIRE(h11 != nullptr);
	BOOST_REQUIRE(h12 != nullptr);

	BOOST_TEST(not (*h11)("getInfo", env, info));
	BOOST_TEST((bool)(*h12)("getInfo", env, info));
}

BOOST_AUTO_TEST_CASE(wsa_has_priority)
{
	s::registry reg;
	call_log log;

	reg.register_handler(s::protocol_version::soap11, "A", accept_all(log));
	reg.register_handler(s::protocol_version::soap11, "B", accept_all(log));
	reg.add_wsa_action(s::wsa_direction::input, "A", "urn:a");
	reg.add_soap_action("B", "act-b");

	s::dispatcher d(reg);

	auto msg = make_message(kSOAP11NS, kGetInfo,
		R"(<wsa:Action xmlns:wsa="http://www.w3.org/2005/08/addressing">urn:a</wsa:Action>)");

	auto rsp = d.dispatch(msg, string("act-b"));

	BOOST_TEST(rsp.status == 200);
	BOOST_TEST(response_element(rsp) == "{urn:names}AResponse");

	BOOST_TEST(log.names == vector<string>{ "A" }, boost::test_tools::per_element());
	BOOST_TEST(log.strategies == vector<string>{ "wsa-action" }, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(soap_action_strategy)
{
	s::registry reg;
	call_log log;

	reg.register_handler(s::protocol_version::soap11, "A", accept_all(log));
	reg.register_handler(s::protocol_version::soap11, "B", accept_all(log));
	reg.add_wsa_action(s::wsa_direction::input, "A", "urn:a");
	reg.add_soap_action("B", "act-b");

	s::dispatcher d(reg);

	auto rsp = d.dispatch(make_message(kSOAP11NS, kGetInfo), string("act-b"));

	BOOST_TEST(rsp.status == 200);
	BOOST_TEST(response_element(rsp) == "{urn:names}BResponse");
	BOOST_TEST(log.strategies == vector<string>{ "soap-action" }, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(wsa_2004_namespace)
{
	s::registry reg;
	call_log log;

	reg.register_handler(s::protocol_version::soap12, "A", accept_all(log));
	reg.register_handler(s::protocol_version::soap12, "B", accept_all(log));
	reg.add_wsa_action(s::wsa_direction::input, "B", "urn:b");

	s::dispatcher d(reg);

	auto msg = make_message(kSOAP12NS, kGetInfo,
		R"(<a:Action xmlns:a="http://schemas.xmlsoap.org/ws/2004/08/addressing">
			urn:b
		</a:Action>)");

	auto rsp = d.dispatch(msg);

	BOOST_TEST(rsp.status == 200);
	BOOST_TEST(response_element(rsp) == "{urn:names}BResponse");
	BOOST_TEST(log.strategies == vector<string>{ "wsa-action" }, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(declined_wsa_falls_through)
{
	s::registry reg;
	call_log log;

	reg.register_handler(s::protocol_version::soap11, "getCountries", recognize("{urn:names}getCountries", log));
	reg.register_handler(s::protocol_version::soap11, "getInfo", recognize("{urn:names}getInfo", log));
	reg.add_wsa_action(s::wsa_direction::input, "getCountries", "urn:countries");

	s::dispatcher d(reg);

	// the action points to the wrong operation, the exhaustive search finds the right one
	auto msg = make_message(kSOAP11NS, kGetInfo,
		R"(<wsa:Action xmlns:wsa="http://www.w3.org/2005/08/addressing">urn:countries</wsa:Action>)");

	auto rsp = d.dispatch(msg);

	BOOST_TEST(rsp.status == 200);
	BOOST_TEST(response_element(rsp) == "{urn:names}getInfoResponse");

	BOOST_TEST(log.names == (vector<string>{ "getCountries", "getCountries", "getInfo" }), boost::test_tools::per_element());
	BOOST_TEST(log.strategies == (vector<string>{ "wsa-action", "attempt-all", "attempt-all" }), boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(unknown_actions_are_ignored)
{
	s::registry reg;
	call_log log;

	reg.register_handler(s::protocol_version::soap11, "getInfo", recognize("{urn:names}getInfo", log));

	s::dispatcher d(reg);

	auto msg = make_message(kSOAP11NS, kGetInfo,
		R"(<wsa:Action xmlns:wsa="http://www.w3.org/2005/08/addressing">urn:unknown</wsa:Action>)");

	auto rsp = d.dispatch(msg, string("urn:unknown-too"));

	BOOST_TEST(rsp.status == 200);
	BOOST_TEST(log.strategies == vector<string>{ "attempt-all" }, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(slow_select_disabled)
{
	s::registry reg;
	call_log log;

	reg.register_handler(s::protocol_version::soap11, "getInfo", accept_all(log));
	reg.register_handler(s::protocol_version::soap11, "getCountries", accept_all(log));

	s::dispatcher_options options;
	options.accept_slow_select = false;

	s::dispatcher d(reg, options);

	auto rsp = d.dispatch(make_message(kSOAP11NS, kGetInfo), string("urn:nothing"));

	BOOST_TEST(rsp.status == 404);
	BOOST_TEST(rsp.message == "message not recognized");
	BOOST_TEST(log.names.empty());
}

BOOST_AUTO_TEST_CASE(attempt_all_scenario)
{
	s::registry reg;
	call_log log;

	reg.register_handler(s::protocol_version::soap11, "getInfo", recognize("{urn:names}getInfo", log));

	s::dispatcher d(reg);
	BOOST_TEST(d.get_options().accept_slow_select);

	auto rsp = d.dispatch(make_message(kSOAP11NS, kGetInfo));

	BOOST_TEST(rsp.status == 200);
	BOOST_TEST(rsp.message == "OK");
	BOOST_TEST(rsp.is_ok());
	BOOST_TEST(rsp.error.empty());
	BOOST_TEST(response_element(rsp) == "{urn:names}getInfoResponse");
	BOOST_TEST(sx::type_of_node(*rsp.payload) == "{" + kSOAP11NS + "}Envelope");

	BOOST_TEST(log.strategies == vector<string>{ "attempt-all" }, boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(attempt_all_sorted)
{
	s::registry reg;
	call_log log;

	for (auto name : { "delta", "alpha", "charlie", "bravo" })
		reg.register_handler(s::protocol_version::soap11, name, decline_all(log));

	s::dispatcher d(reg);
	d.dispatch(make_message(kSOAP11NS, kGetInfo));

	BOOST_TEST(log.names == (vector<string>{ "alpha", "bravo", "charlie", "delta" }), boost::test_tools::per_element());
}

BOOST_AUTO_TEST_CASE(try_other_protocol)
{
	s::registry reg;
	call_log log;

	reg.register_handler(s::protocol_version::soap11, "getInfo", accept_all(log));

	s::dispatcher d(reg);

	auto rsp = d.dispatch(make_message(kSOAP12NS, kGetInfo));

	BOOST_TEST(rsp.status == 303);
	BOOST_TEST(rsp.message == "SOAP protocol not in use");
	BOOST_TEST(rsp.error == "body element {urn:names}getInfo not available in SOAP12, try SOAP11");
	BOOST_TEST(log.names.empty());

	// the fault is in the version of the request
	BOOST_REQUIRE(rsp.payload);
	BOOST_TEST(rsp.payload->get_ns() == kSOAP12NS);
	BOOST_TEST(response_element(rsp) == "{" + kSOAP12NS + "}Fault");
}

BOOST_AUTO_TEST_CASE(not_recognized_lists_operations)
{
	s::registry reg;
	call_log log;

	reg.register_handler(s::protocol_version::soap11, "gamma", decline_all(log));
	reg.register_handler(s::protocol_version::soap11, "alpha", decline_all(log));
	reg.register_handler(s::protocol_version::soap11, "beta", decline_all(log));
	reg.add_soap_action("alpha", "urn:alpha");

	s::dispatcher d(reg);

	auto rsp = d.dispatch(make_message(kSOAP11NS, kGetInfo), string("urn:alpha"));

	BOOST_TEST(rsp.status == 404);
	BOOST_TEST(rsp.error == "SOAP11 body element {urn:names}getInfo not recognized, soapAction `urn:alpha', available operations are alpha, beta, gamma");

	// once via the SOAPAction, then all of them
	BOOST_TEST(log.names == (vector<string>{ "alpha", "alpha", "beta", "gamma" }), boost::test_tools::per_element());

	BOOST_TEST(response_element(rsp) == "{" + kSOAP11NS + "}Fault");
}

BOOST_AUTO_TEST_CASE(not_recognized_hidden_operations)
{
	s::registry reg;
	call_log log;

	reg.register_handler(s::protocol_version::soap12, "alpha", decline_all(log));

	s::dispatcher_options options;
	options.disclose_operations = false;

	s::dispatcher d(reg, options);

	auto rsp = d.dispatch(make_message(kSOAP12NS, ""));

	BOOST_TEST(rsp.status == 404);
	BOOST_TEST(rsp.error == "SOAP12 body element (none) not recognized");
}

BOOST_AUTO_TEST_CASE(empty_registry)
{
	s::registry reg;
	s::dispatcher d(reg);

	auto rsp = d.dispatch(make_message(kSOAP11NS, kGetInfo));

	BOOST_TEST(rsp.status == 404);
	BOOST_TEST(rsp.error == "SOAP11 body element {urn:names}getInfo not recognized, available operations are (none)");
}

BOOST_AUTO_TEST_CASE(handler_failure)
{
	s::registry reg;

	reg.register_handler(s::protocol_version::soap11, "getInfo",
		[](const string&, const sx::element&, s::message_info&) -> s::handler_result
		{
			throw runtime_error("boom");
		});

	reg.register_handler(s::protocol_version::soap11, "getOther",
		[](const string&, const sx::element&, s::message_info&) -> s::handler_result
		{
			throw 42;
		});

	reg.add_soap_action("getOther", "urn:other");

	s::dispatcher d(reg);

	s::response rsp;
	BOOST_CHECK_NO_THROW(rsp = d.dispatch(make_message(kSOAP11NS, kGetInfo)));

	BOOST_TEST(rsp.status == 500);
	BOOST_TEST(rsp.message == "handler failure");
	BOOST_TEST(rsp.error == "operation getInfo failed: boom");
	BOOST_TEST(response_element(rsp) == "{" + kSOAP11NS + "}Fault");

	BOOST_CHECK_NO_THROW(rsp = d.dispatch(make_message(kSOAP11NS, kGetInfo), string("urn:other")));
	BOOST_TEST(rsp.status == 500);
	BOOST_TEST(rsp.error == "operation getOther failed: unknown exception");
}

BOOST_AUTO_TEST_CASE(attempt_all_continues_after_failure)
{
	s::registry reg;
	call_log log;

	// sorted before getInfo and throwing on everything
	reg.register_handler(s::protocol_version::soap11, "broken",
		[](const string&, const sx::element&, s::message_info&) -> s::handler_result
		{
			throw runtime_error("not mine");
		});

	reg.register_handler(s::protocol_version::soap11, "getInfo", recognize("{urn:names}getInfo", log));

	s::dispatcher d(reg);

	auto rsp = d.dispatch(make_message(kSOAP11NS, kGetInfo));
	BOOST_TEST(rsp.status == 200);
	BOOST_TEST(response_element(rsp) == "{urn:names}getInfoResponse");

	// nothing else accepts, the failure is reported
	rsp = d.dispatch(make_message(kSOAP11NS, kGetCountries));
	BOOST_TEST(rsp.status == 500);
	BOOST_TEST(rsp.error == "operation broken failed: not mine");
}

BOOST_AUTO_TEST_CASE(handler_reply_verbatim)
{
	s::registry reg;

	reg.register_handler(s::protocol_version::soap11, "getInfo",
		[](const string&, const sx::element&, s::message_info& info) -> s::handler_result
		{
			s::handler_reply reply;
			reply.status = s::not_found;
			reply.message = "No such name";
			reply.payload = s::make_fault_envelope(info.version, s::fault_code::client, "noSuchName", "Mark is unknown");
			return reply;
		});

	reg.register_handler(s::protocol_version::soap12, "getInfo",
		[](const string&, const sx::element&, s::message_info&) -> s::handler_result
		{
			s::handler_reply reply;
			reply.message = "Fine";
			return reply;
		});

	s::dispatcher d(reg);

	auto rsp = d.dispatch(make_message(kSOAP11NS, kGetInfo));
	BOOST_TEST(rsp.status == 404);
	BOOST_TEST(rsp.message == "No such name");
	BOOST_TEST(response_element(rsp) == "{" + kSOAP11NS + "}Fault");

	// a reply without payload
	rsp = d.dispatch(make_message(kSOAP12NS, kGetInfo));
	BOOST_TEST(rsp.status == 200);
	BOOST_TEST(rsp.message == "Fine");
	BOOST_TEST(not rsp.payload);
}

BOOST_AUTO_TEST_CASE(message_info_1)
{
	s::registry reg;
	s::message_info seen;

	reg.register_handler(s::protocol_version::soap12, "getInfo",
		[&seen](const string&, const sx::element&, s::message_info& info) -> s::handler_result
		{
			seen = info;
			return s::handler_reply{};
		});

	s::dispatcher d(reg);

	auto msg = make_message(kSOAP12NS, kGetInfo + kGetCountries,
		R"(<h:session xmlns:h="urn:h">1</h:session><wsa:Action xmlns:wsa="http://www.w3.org/2005/08/addressing">urn:x</wsa:Action>)");

	d.dispatch(msg);

	BOOST_CHECK(seen.version == s::protocol_version::soap12);
	BOOST_TEST(seen.header == (vector<string>{ "{urn:h}session", "{http://www.w3.org/2005/08/addressing}Action" }), boost::test_tools::per_element());
	BOOST_TEST(seen.body == (vector<string>{ "{urn:names}getInfo", "{urn:names}getCountries" }), boost::test_tools::per_element());
	BOOST_REQUIRE(seen.wsa_action);
	BOOST_TEST(*seen.wsa_action == "urn:x");
	BOOST_TEST(seen.selected_by == "attempt-all");
}

BOOST_AUTO_TEST_CASE(parsed_input)
{
	using namespace sx::literals;

	s::registry reg;
	call_log log;

	reg.register_handler(s::protocol_version::soap11, "getInfo", recognize("{urn:names}getInfo", log));

	s::dispatcher d(reg);

	sx::document doc(make_message(kSOAP11NS, kGetInfo));
	BOOST_TEST(d.dispatch(doc).status == 200);
	BOOST_TEST(d.dispatch(*doc.child()).status == 200);

	BOOST_TEST(d.dispatch(sx::document()).status == 422);
}

BOOST_AUTO_TEST_CASE(request_log)
{
	s::registry reg;
	call_log log;

	reg.register_handler(s::protocol_version::soap11, "getInfo", recognize("{urn:names}getInfo", log));
	reg.add_soap_action("getInfo", "urn:getInfo");

	s::dispatcher d(reg);

	s::dispatcher::reset_log();
	d.dispatch(make_message(kSOAP11NS, kGetInfo), string("urn:getInfo"));

	auto entry = s::dispatcher::reset_log();
	BOOST_TEST(entry.find("getInfo") != string::npos);
	BOOST_TEST(s::dispatcher::reset_log().empty());
}
