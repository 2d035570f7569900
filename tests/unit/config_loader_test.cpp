#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using presence::config::ConfigLoader;
using presence::util::InvalidConfig;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "pihole_presence_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml, const std::string& expected_fragment) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const InvalidConfig& e) {
    return std::string(e.what()).find(expected_fragment) != std::string::npos;
  }
  return false;
}

void TestMinimalConfigGetsDefaults() {
  ::unsetenv("PRESENCE_APPLIANCE_PASSWORD");
  const auto yaml_path = WriteYaml("minimal", R"(appliance:
  host: "pi.hole"
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());

  assert(config.appliance().host() == "pi.hole");
  assert(!config.appliance().has_password());
  assert(config.appliance().request_timeout_ms() == 10000);
  assert(config.appliance().max_devices() == 999);
  assert(config.appliance().max_addresses() == 24);
  assert(config.appliance().query_window() == 1000);
  assert(config.polling().poll_interval_seconds() == 30);
  assert(config.polling().away_threshold_seconds() == 180);
  assert(config.polling().max_backoff_seconds() == 300);
  assert(config.sink().log_transitions());
  assert(config.sink().snapshot_path().empty());
}

void TestFullConfigIsParsed() {
  ::unsetenv("PRESENCE_APPLIANCE_PASSWORD");
  const auto config = ConfigLoader::LoadFromYamlString(R"(appliance:
  host: "http://192.168.1.2:8080/admin/"
  password: "1234"
  request_timeout_ms: 2500
polling:
  poll_interval_seconds: 10
  away_threshold_seconds: 0
  max_backoff_seconds: 120
tracking:
  oui_file: "/usr/share/ieee-data/oui.txt"
sink:
  log_transitions: false
  snapshot_path: "/tmp/presence.json"
logging:
  level: "debug"
observability:
  metrics_enabled: false
  transport: OTLP_TRANSPORT_HTTP
)");

  // quoted digits stay a string
  assert(config.appliance().has_password());
  assert(config.appliance().password() == "1234");
  assert(config.appliance().request_timeout_ms() == 2500);
  assert(config.polling().poll_interval_seconds() == 10);
  // an explicit zero threshold is kept, not defaulted
  assert(config.polling().has_away_threshold_seconds());
  assert(config.polling().away_threshold_seconds() == 0);
  assert(config.polling().max_backoff_seconds() == 120);
  assert(config.tracking().oui_file() == "/usr/share/ieee-data/oui.txt");
  assert(!config.sink().log_transitions());
  assert(config.sink().snapshot_path() == "/tmp/presence.json");
  assert(config.logging().level() == "debug");
  assert(config.observability().transport() == presence::runtime::config::OTLP_TRANSPORT_HTTP);
}

void TestPasswordFromEnvironmentWins() {
  ::setenv("PRESENCE_APPLIANCE_PASSWORD", "from-env", 1);
  const auto config = ConfigLoader::LoadFromYamlString(R"(appliance:
  host: "pi.hole"
  password: "from-file"
)");
  ::unsetenv("PRESENCE_APPLIANCE_PASSWORD");

  assert(config.appliance().password() == "from-env");
}

void TestBackoffDefaultFollowsLongIntervals() {
  const auto config = ConfigLoader::LoadFromYamlString(R"(appliance:
  host: "pi.hole"
polling:
  poll_interval_seconds: 600
)");

  assert(config.polling().max_backoff_seconds() == 600);
}

void TestInvalidConfigsAreRejected() {
  assert(Rejects("polling:\n  poll_interval_seconds: 30\n", "appliance.host"));
  assert(Rejects("appliance:\n  host: \"pi.hole\"\npolling:\n  poll_interval_seconds: 4\n", "poll_interval_seconds"));
  assert(Rejects("appliance:\n  host: \"pi.hole\"\npolling:\n  away_threshold_seconds: -1\n", "away_threshold_seconds"));
  assert(Rejects("appliance:\n  host: \"pi.hole\"\npolling:\n  poll_interval_seconds: 60\n  max_backoff_seconds: 30\n",
                 "max_backoff_seconds"));
  assert(Rejects("appliance:\n  host: \"pi.hole:notaport\"\n", "appliance.host"));
  assert(Rejects("- just\n- a list\n", "mapping"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field", R"(appliance:
  host: "pi.hole"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const InvalidConfig&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsInvalidConfig() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/pihole-presence.yaml");
  } catch (const InvalidConfig&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestMinimalConfigGetsDefaults();
  TestFullConfigIsParsed();
  TestPasswordFromEnvironmentWins();
  TestBackoffDefaultFollowsLongIntervals();
  TestInvalidConfigsAreRejected();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsInvalidConfig();

  std::cout << "pihole_presence_unit_config_loader: pass\n";
  return 0;
}
