#pragma once

#include <stdexcept>
#include <string>

#include "my_error_codes.hpp"

namespace clientid::analytics {

class AnalyticsError : public std::runtime_error {
  int code_;

public:
  AnalyticsError(int code, const std::string &what)
      : std::runtime_error(what), code_(code) {}

  int code() const noexcept { return code_; }
};

// Resolve, connect, TLS, write or read failure. code() is one of
// my_errors::NETWORK.
class NetworkError : public AnalyticsError {
public:
  NetworkError(int code, const std::string &what) : AnalyticsError(code, what) {}
};

// The endpoint answered with something other than 2xx.
class HttpStatusError : public AnalyticsError {
  int status_;

public:
  HttpStatusError(int status, const std::string &what)
      : AnalyticsError(my_errors::NETWORK::HTTP_STATUS, what), status_(status) {}

  int status() const noexcept { return status_; }
};

} // namespace clientid::analytics
