#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace presence::session {

enum class SessionStatus : std::uint8_t {
  kUnauthenticated = 0,
  kAuthenticated   = 1,
  kExpired         = 2,
};

/*
  Credential issued by the appliance.

  `token` is absent when the appliance has no password configured. A
  non-positive validity means the appliance did not bound the session.
  `generation` identifies the authentication that produced this session so
  stale copies can be told apart from the one currently held.
*/
struct Session {
  std::optional<std::string>     token;
  util::TimePoint                issued_at{};
  std::optional<util::TimePoint> expires_at;
  std::chrono::seconds           validity{0};
  SessionStatus                  status{SessionStatus::kUnauthenticated};
  std::uint64_t                  generation{0};

  bool IsValid(util::TimePoint now) const {
    if (status != SessionStatus::kAuthenticated) return false;
    return !expires_at || now < *expires_at;
  }
};

} // namespace presence::session
