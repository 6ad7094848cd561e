//        Copyright Maarten L. Hekkelman, 2014-2023
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

/// \file
/// Generic configuration file, version information and defaults

#pragma once

#include <string>
#include <type_traits>

/// The current version of libsoapd

#define SOAPD_VERSION		"1.0.0"
#define SOAPD_VERSION_MAJOR 1
#define SOAPD_VERSION_MINOR 0
#define SOAPD_VERSION_PATCH 0

/// The last resort strategy of the dispatcher tries every registered
/// operation until one accepts the message. Clients that send neither a
/// WS-Addressing action nor a SOAPAction need it, but it costs one handler
/// call per registered operation. This is the compile time default for
/// soapd::soap::dispatcher_options::accept_slow_select.

#ifndef SOAPD_ACCEPT_SLOW_SELECT
#define SOAPD_ACCEPT_SLOW_SELECT 1
#endif

// see if we're using Visual C++, if so we have to include
// some VC specific include files to make the standard C++
// keywords work.

#if defined(_MSC_VER)
#	if defined(_MSC_EXTENSIONS)
#		define and		&&
#		define and_eq	&=
#		define bitand	&
#		define bitor	|
#		define compl	~
#		define not		!
#		define not_eq	!=
#		define or		||
#		define or_eq	|=
#		define xor		^
#		define xor_eq	^=
#	endif // _MSC_EXTENSIONS

#	pragma warning (disable : 4355)	// this is used in Base Initializer list
#	pragma warning (disable : 4996)	// unsafe function or variable
#endif
