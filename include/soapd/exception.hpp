//        Copyright Maarten L. Hekkelman, 2014-2023
//  Distributed under the Boost Software License, Version 1.0.
//     (See accompanying file LICENSE_1_0.txt or copy at
//           http://www.boost.org/LICENSE_1_0.txt)

#pragma once

/// \file
/// definition of soapd::exception, base class for exceptions thrown by libsoapd

#include <soapd/config.hpp>

#include <exception>
#include <string>

namespace soapd
{

/// \brief base class of the exceptions thrown by libsoapd
class exception : public std::exception
{
  public:
	/// \brief Create an exception with the message in \a message
	exception(const std::string& message)
		: m_message(message) {}

	virtual ~exception() throw() {}

	virtual const char* what() const throw() { return m_message.c_str(); }

  protected:
	std::string m_message;
};

/// \brief thrown when a service is set up incorrectly
///
/// Registration of operations happens at startup, errors found while
/// doing so are fatal and never deferred to the moment a request arrives.
class configuration_error : public exception
{
  public:
	configuration_error(const std::string& message)
		: exception(message) {}
};

} // namespace soapd
