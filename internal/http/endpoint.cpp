#include "endpoint.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace presence::http {

namespace {

bool StartsWith(std::string_view value, std::string_view prefix) {
  return value.substr(0, prefix.size()) == prefix;
}

bool IsPort(std::string_view value) {
  if (value.empty() || value.size() > 5) return false;
  if (!std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) return false;
  const auto port = std::stoi(std::string(value));
  return port > 0 && port <= 65535;
}

} // namespace

Endpoint ParseEndpoint(std::string_view address) {
  while (!address.empty() && std::isspace(static_cast<unsigned char>(address.front()))) address.remove_prefix(1);
  while (!address.empty() && std::isspace(static_cast<unsigned char>(address.back()))) address.remove_suffix(1);

  if (StartsWith(address, "http://")) {
    address.remove_prefix(7);
  } else if (StartsWith(address, "https://")) {
    address.remove_prefix(8);
  }

  if (auto slash = address.find('/'); slash != std::string_view::npos) {
    address = address.substr(0, slash);
  }

  Endpoint endpoint;
  std::string_view host = address;
  std::string_view port;
  bool             has_port = false;

  if (StartsWith(address, "[")) {
    const auto close = address.find(']');
    if (close == std::string_view::npos) {
      throw std::invalid_argument("unterminated IPv6 literal");
    }
    host = address.substr(1, close - 1);
    auto rest = address.substr(close + 1);
    if (!rest.empty()) {
      if (rest.front() != ':') throw std::invalid_argument("unexpected text after IPv6 literal");
      port     = rest.substr(1);
      has_port = true;
    }
  } else if (std::count(address.begin(), address.end(), ':') > 1) {
    // bare IPv6 literal, no port
    host = address;
  } else if (auto colon = address.rfind(':'); colon != std::string_view::npos) {
    host     = address.substr(0, colon);
    port     = address.substr(colon + 1);
    has_port = true;
  }

  if (host.empty()) {
    throw std::invalid_argument("empty host");
  }
  endpoint.host = std::string(host);

  if (has_port) {
    if (!IsPort(port)) {
      throw std::invalid_argument("invalid port '" + std::string(port) + "'");
    }
    endpoint.port = std::string(port);
  }

  return endpoint;
}

} // namespace presence::http
