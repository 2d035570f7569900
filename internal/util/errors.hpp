#pragma once

#include <stdexcept>
#include <string>

namespace presence::util {

/*
  Central error types.

  Appliance errors are caught at the poll scheduler boundary and turned
  into a failed tick. InvalidConfig surfaces from startup only.
*/

// Credentials rejected by the appliance.
class AuthenticationError : public std::runtime_error {
 public:
  explicit AuthenticationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Connection, DNS or timeout failure talking to the appliance. Transient.
class UnreachableError : public std::runtime_error {
 public:
  explicit UnreachableError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Payload did not have the expected shape.
class MalformedResponseError : public std::runtime_error {
 public:
  explicit MalformedResponseError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The appliance no longer accepts the session credential. Handled inside SessionManager.
class SessionExpired : public std::runtime_error {
 public:
  explicit SessionExpired(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace presence::util
