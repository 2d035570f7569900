#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/poll/poll_scheduler.hpp"

static volatile std::sig_atomic_t g_running = 1;
static volatile std::sig_atomic_t g_refresh = 0;

void HandleSignal(int) {
  g_running = 0;
}

void HandleRefresh(int) {
  g_refresh = 1;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: pihole-presence <config.yaml> OR pihole-presence --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = presence::config::ConfigLoader::LoadFromYaml(config_path);

    presence::observability::InitializeLogging(config);
    presence::observability::InitializeMetrics(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = presence::factory::Build(config);

    // Register signal handlers before starting the loop to avoid a race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    std::signal(SIGHUP, HandleRefresh);

    app.scheduler->Start();
    PRESENCE_LOG_INFO("pihole-presence started", {presence::observability::StringField("appliance", config.appliance().host()),
                                                  presence::observability::IntField("interval_s", config.polling().poll_interval_seconds())});

    while (g_running) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
      if (g_refresh) {
        g_refresh = 0;
        app.scheduler->RequestRefresh();
      }
    }

    PRESENCE_LOG_INFO("Shutting down pihole-presence");

    app.scheduler->Stop();
    presence::observability::ShutdownMetrics();
    presence::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    PRESENCE_LOG_ERROR("Fatal error", {presence::observability::StringField("error", e.what())});
    presence::observability::ShutdownMetrics();
    presence::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
