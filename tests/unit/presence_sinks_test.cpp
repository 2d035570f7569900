#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/sink/fanout_presence_sink.hpp"
#include "internal/sink/log_presence_sink.hpp"
#include "internal/sink/snapshot_file_sink.hpp"
#include "internal/util/json.hpp"
#include "support/recording_sink.hpp"

namespace {

using namespace std::chrono_literals;

using presence::sink::BuildSnapshot;
using presence::sink::FanoutPresenceSink;
using presence::sink::LogPresenceSink;
using presence::sink::SnapshotFilePresenceSink;
using presence::testing::RecordingSink;
using presence::tracker::Presence;
using presence::tracker::PresenceTransition;
using presence::tracker::PresenceUpdate;
using presence::util::TimePoint;

const TimePoint kT0{std::chrono::seconds(1'700'000'000)};

std::vector<PresenceUpdate> SampleUpdates() {
  PresenceUpdate phone;
  phone.key                          = "phone_ee01";
  phone.transition                   = PresenceTransition::kArrived;
  phone.state.key                    = phone.key;
  phone.state.presence               = Presence::kHome;
  phone.state.name                   = "Phone";
  phone.state.mac                    = "aa:bb:cc:dd:ee:01";
  phone.state.first_seen             = kT0 - 3600s;
  phone.state.last_seen              = kT0 - 20s;
  phone.state.last_query             = kT0 - 20s;
  phone.state.last_query_seconds_ago = 20;
  phone.state.num_queries            = 42;
  phone.state.mac_vendor             = "Apple, Inc.";
  phone.state.ips                    = {"192.168.1.20", "fd00::20"};
  phone.state.dhcp_expires           = kT0 + 86400s;
  phone.state.interface_name         = "wlan0";

  PresenceUpdate printer;
  printer.key              = "printer_192_168_1_30";
  printer.state.key        = printer.key;
  printer.state.presence   = Presence::kAway;
  printer.state.first_seen = kT0 - 7200s;
  printer.state.last_seen  = kT0 - 7200s;
  printer.state.ips        = {"192.168.1.30"};

  return {phone, printer};
}

presence::v1::PresenceSnapshot ReadSnapshot(const std::filesystem::path& path) {
  std::ifstream      in(path);
  std::ostringstream body;
  body << in.rdbuf();

  presence::v1::PresenceSnapshot snapshot;
  presence::util::ParseJson(body.str(), &snapshot, "snapshot file");
  return snapshot;
}

void TestBuildSnapshotCarriesAttributes() {
  const auto snapshot = BuildSnapshot(SampleUpdates(), true, "ignored", kT0);

  assert(snapshot.generated_at().seconds() == 1'700'000'000);
  assert(snapshot.available());
  assert(snapshot.unavailable_reason().empty());
  assert(snapshot.devices_size() == 2);

  const auto& phone = snapshot.devices(0);
  assert(phone.key() == "phone_ee01");
  assert(phone.presence() == "home");
  assert(phone.transitioned());
  assert(phone.attributes().last_query().seconds() == 1'700'000'000 - 20);
  assert(phone.attributes().last_query_seconds_ago() == 20);
  assert(phone.attributes().num_queries() == 42);
  assert(phone.attributes().mac_vendor() == "Apple, Inc.");
  assert(phone.attributes().ips_size() == 2);
  assert(phone.attributes().name() == "Phone");
  assert(phone.attributes().dhcp_expires().seconds() == 1'700'000'000 + 86400);
  assert(phone.attributes().interface() == "wlan0");
  assert(phone.attributes().mac() == "aa:bb:cc:dd:ee:01");

  const auto& printer = snapshot.devices(1);
  assert(printer.presence() == "away");
  assert(!printer.transitioned());
  assert(!printer.attributes().has_last_query());
  assert(!printer.attributes().has_last_query_seconds_ago());
  assert(!printer.attributes().has_num_queries());
  assert(!printer.attributes().has_dhcp_expires());
}

void TestSnapshotFileIsRewrittenAtomically() {
  const auto dir  = std::filesystem::temp_directory_path() / "pihole_presence_sink_test";
  const auto path = dir / "nested" / "state.json";
  std::filesystem::remove_all(dir);

  SnapshotFilePresenceSink sink(path);
  sink.SetAvailable(true, "");
  sink.Publish(SampleUpdates());

  assert(std::filesystem::exists(path));
  assert(!std::filesystem::exists(path.string() + ".tmp"));

  auto snapshot = ReadSnapshot(path);
  assert(snapshot.available());
  assert(snapshot.devices_size() == 2);

  // losing the appliance keeps the last devices in the document
  sink.SetAvailable(false, "unreachable: connect: connection refused");
  snapshot = ReadSnapshot(path);
  assert(!snapshot.available());
  assert(snapshot.unavailable_reason() == "unreachable: connect: connection refused");
  assert(snapshot.devices_size() == 2);

  std::filesystem::remove_all(dir);
}

void TestSnapshotWriteFailureDoesNotThrow() {
  const auto blocker = std::filesystem::temp_directory_path() / "pihole_presence_sink_blocker";
  std::filesystem::remove_all(blocker);
  {
    std::ofstream out(blocker);
    out << "a file, not a directory";
  }

  SnapshotFilePresenceSink sink(blocker / "state.json");
  sink.Publish(SampleUpdates());
  sink.SetAvailable(false, "auth: rejected");

  std::filesystem::remove(blocker);
}

class ThrowingSink : public presence::sink::PresenceSink {
 public:
  void Publish(const std::vector<PresenceUpdate>&) override {
    throw std::runtime_error("disk full");
  }
  void SetAvailable(bool, const std::string&) override {
    throw std::runtime_error("disk full");
  }
};

void TestFanoutIsolatesFailingSinks() {
  auto recorder = std::make_shared<RecordingSink>();
  auto logger   = std::make_shared<LogPresenceSink>();

  FanoutPresenceSink fanout({std::make_shared<ThrowingSink>(), logger, recorder});
  assert(fanout.size() == 3);

  fanout.SetAvailable(true, "");
  fanout.Publish(SampleUpdates());
  fanout.SetAvailable(false, "malformed: network table: 'devices' is not a list");

  assert(recorder->PublishCount() == 1);
  assert(recorder->LastPublished().size() == 2);
  assert(!recorder->LastAvailability()->first);
}

} // namespace

int main() {
  TestBuildSnapshotCarriesAttributes();
  TestSnapshotFileIsRewrittenAtomically();
  TestSnapshotWriteFailureDoesNotThrow();
  TestFanoutIsolatesFailingSinks();

  std::cout << "pihole_presence_unit_presence_sinks: pass\n";
  return 0;
}
