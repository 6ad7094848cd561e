//        Copyright Maarten L. Hekkelman, 2014-2023
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#include <soapd/soap/protocol.hpp>

namespace soapd::soap
{

namespace
{

	struct protocol_info
	{
		protocol_version version;
		const char* name;
		const std::string& envelope_ns;
	};

	const protocol_info kProtocols[] = {
		{ protocol_version::soap11, "SOAP11", kSOAP11EnvelopeNS },
		{ protocol_version::soap12, "SOAP12", kSOAP12EnvelopeNS }
	};

} // namespace

std::string to_string(protocol_version version)
{
	for (auto& p : kProtocols)
	{
		if (p.version == version)
			return p.name;
	}

	return "unknown";
}

const std::string& envelope_namespace(protocol_version version)
{
	for (auto& p : kProtocols)
	{
		if (p.version == version)
			return p.envelope_ns;
	}

	return kSOAP11EnvelopeNS;
}

std::optional<protocol_version> protocol_from_envelope(const std::string& ns)
{
	for (auto& p : kProtocols)
	{
		if (p.envelope_ns == ns)
			return p.version;
	}

	return {};
}

const std::vector<protocol_version>& known_protocols()
{
	static const std::vector<protocol_version> kVersions{ protocol_version::soap11, protocol_version::soap12 };
	return kVersions;
}

} // namespace soapd::soap
