//        Copyright Maarten L. Hekkelman, 2014-2023
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

// A command line tool that reads a WSDL, registers a stub for each of its
// operations and then dispatches a single request read from a file (or
// stdin) the way a server would. Useful to check which operation a message
// ends up in.

#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>

#include <boost/program_options.hpp>

#include <soapd/soap/transport.hpp>
#include <soapd/soap/wsdl.hpp>

using namespace std;
namespace po = boost::program_options;
namespace s = soapd::soap;

int main(int argc, const char* argv[])
{
	po::options_description visible_options(argv[0] + " options"s);
	visible_options.add_options()
		("help,h",										"Display help message")
		("version",										"Print version")
		("verbose,v",									"Verbose output")

		("wsdl",				po::value<string>(),	"The WSDL file describing the service")
		("request",				po::value<string>(),	"File containing the request, default is stdin")
		("soap-action",			po::value<string>(),	"The SOAPAction header to send with the request")
		("content-type",		po::value<string>(),	"Content type of the request, default is text/xml")
		("no-slow-select",								"Do not try all operations when there is no usable action")
		("hide-operations",								"Do not list the available operations in faults")
		("print-index",									"Print the operations per SOAP version and exit")
		;

	po::options_description cmdline_options;
	cmdline_options.add(visible_options);

	po::positional_options_description p;
	p.add("request", 1);

	po::variables_map vm;

	try
	{
		po::store(po::command_line_parser(argc, argv).options(cmdline_options).positional(p).run(), vm);
		po::notify(vm);
	}
	catch (const exception& ex)
	{
		cerr << ex.what() << endl
			 << visible_options << endl;
		exit(1);
	}

	// --------------------------------------------------------------------

	if (vm.count("help"))
	{
		cerr << visible_options << endl;
		exit(0);
	}

	if (vm.count("version"))
	{
		cout << argv[0] << " version " << SOAPD_VERSION << endl;
		exit(0);
	}

	if (vm.count("wsdl") == 0)
	{
		cerr << "The --wsdl option is required" << endl
			 << visible_options << endl;
		exit(1);
	}

	try
	{
		bool verbose = vm.count("verbose") > 0;

		auto wsdl = s::wsdl11::load(vm["wsdl"].as<string>());

		s::registry reg;
		auto n = s::import_operations(reg, wsdl);

		if (verbose)
			cerr << "imported " << n << " operations from " << vm["wsdl"].as<string>() << endl;

		if (vm.count("print-index"))
		{
			reg.print_index(cout);
			exit(0);
		}

		s::dispatcher_options options;
		options.accept_slow_select = vm.count("no-slow-select") == 0;
		options.disclose_operations = vm.count("hide-operations") == 0;

		s::dispatcher disp(reg, options);

		s::request_handler handler(disp);
		handler.set_log_requests(verbose);

		s::transport_request req;
		req.headers.push_back({ "Content-Type", vm.count("content-type") ? vm["content-type"].as<string>() : "text/xml" });
		if (vm.count("soap-action"))
			req.headers.push_back({ "SOAPAction", vm["soap-action"].as<string>() });

		if (vm.count("request") and vm["request"].as<string>() != "-")
		{
			ifstream file(vm["request"].as<string>(), ios::binary);
			if (not file.is_open())
				throw runtime_error("Could not open request file " + vm["request"].as<string>());

			req.payload.assign(istreambuf_iterator<char>(file), istreambuf_iterator<char>());
		}
		else
			req.payload.assign(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());

		auto rep = handler.handle_request(req);

		cout << rep.status << ' ' << rep.message << endl;
		if (verbose)
		{
			for (auto& h : rep.headers)
				cout << h.name << ": " << h.value << endl;
		}
		cout << endl
			 << rep.content << endl;

		return rep.status == s::ok ? 0 : 1;
	}
	catch (const exception& ex)
	{
		cerr << ex.what() << endl;
		exit(1);
	}

	return 0;
}
