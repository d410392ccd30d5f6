// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __ABTEST_EXCEPTION_H
#define __ABTEST_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace mkc_abtest
{
  // Base class for every error raised by the testing engine
  class ABTestException : public std::runtime_error
  {
  public:
    explicit ABTestException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    virtual ~ABTestException() = default;
  };

  // Invalid or contradictory test configuration. Never retried.
  class ConfigurationError : public ABTestException
  {
  public:
    explicit ConfigurationError(const std::string& msg)
      : ABTestException(msg)
    {}
  };

  // Too few observations for the requested method. The caller may keep
  // collecting data and try again.
  class InsufficientDataError : public ABTestException
  {
  public:
    explicit InsufficientDataError(const std::string& msg)
      : ABTestException(msg)
    {}
  };

  // Degenerate variance or a posterior simulation that failed its
  // convergence diagnostics.
  class NumericalInstabilityError : public ABTestException
  {
  public:
    explicit NumericalInstabilityError(const std::string& msg)
      : ABTestException(msg)
    {}
  };

} // namespace mkc_abtest

#endif // __ABTEST_EXCEPTION_H
