#include "session_manager.hpp"

#include <exception>
#include <utility>

#include "internal/appliance/api_status.hpp"
#include "internal/util/json.hpp"
#include "presence/appliance/v1/pihole_api.pb.h"

namespace presence::session {

using presence::appliance::v1::AuthRequest;
using presence::appliance::v1::AuthResponse;

namespace {

constexpr char kAuthPath[] = "/api/auth";

// A rejected login carries its reason in session.message, not the error envelope.
std::string RejectionMessage(const std::string& body) {
  AuthResponse auth;
  try {
    util::ParseJson(body, &auth, "authentication response");
  } catch (const util::MalformedResponseError&) {
    return appliance::ErrorMessage(body);
  }
  if (auth.has_session() && !auth.session().message().empty()) {
    return auth.session().message();
  }
  return appliance::ErrorMessage(body);
}

} // namespace

SessionManager::SessionManager(http::HttpTransportPtr transport, std::optional<std::string> password, ClockFn clock)
    : transport_(std::move(transport)), password_(std::move(password)), clock_(std::move(clock)) {
  if (password_ && password_->empty()) {
    password_.reset();
  }
}

// ------------------------------------------------------------
// EnsureSession
// ------------------------------------------------------------

Session SessionManager::EnsureSession() {
  std::promise<Session>       promise;
  std::shared_future<Session> pending;
  bool                        leader = false;

  {
    std::lock_guard lock(mutex_);
    if (current_.IsValid(clock_())) {
      return current_;
    }

    if (in_flight_.valid()) {
      pending = in_flight_;
    } else {
      in_flight_ = promise.get_future().share();
      pending    = in_flight_;
      leader     = true;
    }
  }

  if (!leader) {
    return pending.get();
  }

  try {
    auto session = Authenticate();
    {
      std::lock_guard lock(mutex_);
      session.generation = ++authentications_;
      current_           = session;
      in_flight_         = {};
    }
    promise.set_value(session);
    return session;
  } catch (...) {
    {
      std::lock_guard lock(mutex_);
      ++authentications_;
      in_flight_ = {};
    }
    promise.set_exception(std::current_exception());
    throw;
  }
}

void SessionManager::Invalidate(const Session& session) {
  std::lock_guard lock(mutex_);
  if (current_.generation == session.generation && current_.status == SessionStatus::kAuthenticated) {
    current_.status = SessionStatus::kExpired;
  }
}

void SessionManager::Touch(const Session& session) {
  std::lock_guard lock(mutex_);
  if (current_.generation != session.generation || current_.status != SessionStatus::kAuthenticated) {
    return;
  }
  if (current_.validity.count() > 0) {
    current_.expires_at = clock_() + current_.validity;
  }
}

std::uint64_t SessionManager::AuthenticationCount() const {
  std::lock_guard lock(mutex_);
  return authentications_;
}

// ------------------------------------------------------------
// Authenticate
// ------------------------------------------------------------

Session SessionManager::Authenticate() {
  http::Request request;
  request.target = kAuthPath;

  // Without a password, GET reports whether the appliance requires one.
  if (password_) {
    AuthRequest body;
    body.set_password(*password_);
    request.method = http::Method::kPost;
    request.body   = util::ToJson(body);
  }

  const auto response = transport_->Send(request);

  if (response.status == 401) {
    const auto reason = password_ ? RejectionMessage(response.body) : std::string("appliance requires a password");
    throw util::AuthenticationError("authentication rejected: " + reason);
  }
  appliance::RequireSuccess(response, "authentication");

  AuthResponse auth;
  util::ParseJson(response.body, &auth, "authentication response");
  if (!auth.has_session()) {
    throw util::MalformedResponseError("authentication response: missing 'session'");
  }

  const auto& granted = auth.session();
  if (!granted.valid()) {
    throw util::AuthenticationError("authentication rejected: " +
                                    (granted.message().empty() ? std::string("session not valid") : granted.message()));
  }

  Session session;
  session.issued_at = clock_();
  session.status    = SessionStatus::kAuthenticated;
  session.validity  = std::chrono::seconds(granted.validity());
  if (granted.has_sid() && !granted.sid().empty()) {
    session.token = granted.sid();
  }
  if (granted.validity() > 0) {
    session.expires_at = session.issued_at + session.validity;
  }

  PRESENCE_LOG_INFO("Authenticated with appliance", {observability::BoolField("token", session.token.has_value()),
                                                     observability::IntField("validity_s", granted.validity())});
  return session;
}

// ------------------------------------------------------------
// Logout
// ------------------------------------------------------------

void SessionManager::Logout() {
  Session held;
  {
    std::lock_guard lock(mutex_);
    held     = current_;
    current_ = Session{};
  }

  if (held.status != SessionStatus::kAuthenticated || !held.token) {
    return;
  }

  http::Request request;
  request.method = http::Method::kDelete;
  request.target = kAuthPath;
  request.headers.emplace_back(appliance::kSessionHeader, *held.token);

  try {
    const auto response = transport_->Send(request);
    if (response.status >= 300 && response.status != 401) {
      PRESENCE_LOG_WARN("Appliance refused logout", {observability::IntField("status", response.status)});
      return;
    }
    PRESENCE_LOG_INFO("Released appliance session");
  } catch (const std::exception& e) {
    PRESENCE_LOG_WARN("Failed to release appliance session", {observability::StringField("error", e.what())});
  }
}

} // namespace presence::session
