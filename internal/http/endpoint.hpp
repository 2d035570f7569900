#pragma once

#include <string>
#include <string_view>

namespace presence::http {

struct Endpoint {
  std::string host;
  std::string port{"80"};
};

/*
  Accepts "pi.hole", "http://192.168.1.2/", "pi.hole:8080", "[fd00::2]:80".
  Scheme, trailing slashes and any path are dropped.
  Throws std::invalid_argument when no host remains or the port is not numeric.
*/
Endpoint ParseEndpoint(std::string_view address);

} // namespace presence::http
