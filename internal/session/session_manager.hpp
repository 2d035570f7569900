#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>

#include "internal/http/http_transport.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "session.hpp"

namespace presence::session {

/*
  Owns the single live appliance session.

  EnsureSession() is single-flight: while one caller authenticates, any
  other caller waits for and shares that result (or its failure). The mutex
  only guards bookkeeping; it is never held across network I/O.
*/
class SessionManager {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  SessionManager(http::HttpTransportPtr transport, std::optional<std::string> password, ClockFn clock = util::Now);

  SessionManager(const SessionManager&)            = delete;
  SessionManager& operator=(const SessionManager&) = delete;

  // Returns a valid session, authenticating if needed.
  // Throws AuthenticationError, UnreachableError or MalformedResponseError.
  Session EnsureSession();

  // Forget `session` if it is still the one held. Older copies are ignored.
  void Invalidate(const Session& session);

  // Extend the sliding expiry of `session` after a successful request.
  void Touch(const Session& session);

  /*
    Runs fn(session). If fn throws SessionExpired, the session is dropped,
    a fresh one obtained and fn retried once. A second SessionExpired is
    reported as AuthenticationError.
  */
  template <typename Fn>
  std::invoke_result_t<Fn&, const Session&> WithSession(Fn&& fn);

  // Releases the held session on the appliance. Never throws.
  void Logout();

  // Authentication attempts made so far, successful or not.
  std::uint64_t AuthenticationCount() const;

 private:
  Session Authenticate();

  http::HttpTransportPtr     transport_;
  std::optional<std::string> password_;
  ClockFn                    clock_;

  mutable std::mutex          mutex_;
  Session                     current_;
  std::shared_future<Session> in_flight_;
  std::uint64_t               authentications_{0};
};

template <typename Fn>
std::invoke_result_t<Fn&, const Session&> SessionManager::WithSession(Fn&& fn) {
  auto session = EnsureSession();
  try {
    auto result = fn(session);
    Touch(session);
    return result;
  } catch (const util::SessionExpired& e) {
    PRESENCE_LOG_INFO("Appliance session expired, re-authenticating", {observability::StringField("reason", e.what())});
    Invalidate(session);
  }

  auto renewed = EnsureSession();
  try {
    auto result = fn(renewed);
    Touch(renewed);
    return result;
  } catch (const util::SessionExpired& e) {
    Invalidate(renewed);
    throw util::AuthenticationError(std::string("appliance rejected a freshly issued session: ") + e.what());
  }
}

} // namespace presence::session
