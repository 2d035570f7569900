#include "factory.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/appliance/appliance_client.hpp"
#include "internal/http/beast_transport.hpp"
#include "internal/http/endpoint.hpp"
#include "internal/observability/logging.hpp"
#include "internal/poll/poll_scheduler.hpp"
#include "internal/session/session_manager.hpp"
#include "internal/sink/fanout_presence_sink.hpp"
#include "internal/sink/log_presence_sink.hpp"
#include "internal/sink/snapshot_file_sink.hpp"
#include "internal/tracker/device_reconciler.hpp"
#include "internal/tracker/oui_table.hpp"

namespace presence::factory {

namespace {

std::shared_ptr<const tracker::OuiTable> LoadOuiTable(const presence::runtime::config::TrackingConfig& tracking) {
  if (tracking.oui_file().empty()) {
    return nullptr;
  }

  auto table = std::make_shared<const tracker::OuiTable>(tracker::OuiTable::LoadFromFile(tracking.oui_file()));
  PRESENCE_LOG_INFO("Loaded OUI table", {observability::StringField("path", tracking.oui_file()),
                                         observability::IntField("prefixes", static_cast<std::int64_t>(table->size()))});
  return table;
}

std::shared_ptr<sink::PresenceSink> BuildSink(const presence::runtime::config::SinkConfig& config) {
  std::vector<sink::PresenceSinkPtr> sinks;
  sinks.push_back(std::make_shared<sink::LogPresenceSink>(config.has_log_transitions() ? config.log_transitions() : true));

  if (!config.snapshot_path().empty()) {
    sinks.push_back(std::make_shared<sink::SnapshotFilePresenceSink>(config.snapshot_path()));
    PRESENCE_LOG_INFO("Writing presence snapshots", {observability::StringField("path", config.snapshot_path())});
  }

  return std::make_shared<sink::FanoutPresenceSink>(std::move(sinks));
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const presence::runtime::config::RuntimeConfig& config, http::HttpTransportPtr transport) {
  Application app;

  const auto& appliance = config.appliance();
  const auto& polling   = config.polling();

  // ------------------------------------------------------------------
  // Appliance access
  // ------------------------------------------------------------------
  if (!transport) {
    transport = std::make_shared<http::BeastHttpTransport>(http::ParseEndpoint(appliance.host()),
                                                           std::chrono::milliseconds(appliance.request_timeout_ms()));
  }

  std::optional<std::string> password;
  if (appliance.has_password()) {
    password = appliance.password();
  }
  app.sessions = std::make_shared<session::SessionManager>(transport, std::move(password));

  appliance::ApplianceClientOptions client_options;
  client_options.max_devices   = appliance.max_devices();
  client_options.max_addresses = appliance.max_addresses();
  client_options.query_window  = appliance.query_window();
  auto client                  = std::make_shared<appliance::ApplianceClient>(transport, client_options);

  // ------------------------------------------------------------------
  // Tracking
  // ------------------------------------------------------------------
  tracker::ReconcilerOptions reconciler_options;
  reconciler_options.away_threshold = std::chrono::seconds(polling.away_threshold_seconds());
  app.reconciler = std::make_shared<tracker::DeviceReconciler>(reconciler_options, LoadOuiTable(config.tracking()));

  // ------------------------------------------------------------------
  // Publication and scheduling
  // ------------------------------------------------------------------
  app.sink = BuildSink(config.sink());

  poll::PollSchedulerOptions scheduler_options;
  scheduler_options.poll_interval = std::chrono::seconds(polling.poll_interval_seconds());
  scheduler_options.max_backoff   = std::chrono::seconds(polling.max_backoff_seconds());
  app.scheduler = std::make_shared<poll::PollScheduler>(app.sessions, client, app.reconciler, app.sink, scheduler_options);

  return app;
}

} // namespace presence::factory
