#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/http/http_transport.hpp"

namespace presence::poll {
class PollScheduler;
}

namespace presence::session {
class SessionManager;
}

namespace presence::sink {
class PresenceSink;
}

namespace presence::tracker {
class DeviceReconciler;
}

namespace presence::factory {

/*
  Application

  Owns every long-lived object of the process. The scheduler holds the
  others too; they are exposed for startup logging and tests.
*/
struct Application {
  std::shared_ptr<session::SessionManager>   sessions;
  std::shared_ptr<tracker::DeviceReconciler> reconciler;
  std::shared_ptr<sink::PresenceSink>        sink;
  std::shared_ptr<poll::PollScheduler>       scheduler;
};

/*
  Build

  Composition root. The only place that knows concrete transport and sink
  types. `transport` replaces the Beast transport when given.
  Throws util::InvalidConfig for an unreadable OUI file.
*/
Application Build(const presence::runtime::config::RuntimeConfig& config, http::HttpTransportPtr transport = nullptr);

} // namespace presence::factory
