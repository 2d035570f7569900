#include "snapshot_file_sink.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/json.hpp"

namespace presence::sink {

using presence::v1::DeviceSnapshot;
using presence::v1::PresenceSnapshot;

presence::v1::PresenceSnapshot BuildSnapshot(const std::vector<tracker::PresenceUpdate>& updates, bool available,
                                             const std::string& unavailable_reason, util::TimePoint generated_at) {
  PresenceSnapshot snapshot;
  *snapshot.mutable_generated_at() = util::ToProto(generated_at);
  snapshot.set_available(available);
  if (!available) {
    snapshot.set_unavailable_reason(unavailable_reason);
  }

  for (const auto& update : updates) {
    const auto& state  = update.state;
    auto*       device = snapshot.add_devices();
    device->set_key(update.key);
    device->set_presence(std::string(tracker::ToString(state.presence)));
    device->set_transitioned(update.transitioned());

    auto* attributes = device->mutable_attributes();
    *attributes->mutable_first_seen() = util::ToProto(state.first_seen);
    if (state.last_query) *attributes->mutable_last_query() = util::ToProto(*state.last_query);
    if (state.last_query_seconds_ago) attributes->set_last_query_seconds_ago(*state.last_query_seconds_ago);
    if (state.num_queries) attributes->set_num_queries(*state.num_queries);
    if (state.dhcp_expires) *attributes->mutable_dhcp_expires() = util::ToProto(*state.dhcp_expires);
    if (state.mac_vendor) attributes->set_mac_vendor(*state.mac_vendor);
    if (state.name) attributes->set_name(*state.name);
    if (state.interface_name) attributes->set_interface(*state.interface_name);
    if (state.mac) attributes->set_mac(*state.mac);
    for (const auto& ip : state.ips) {
      attributes->add_ips(ip);
    }
  }
  return snapshot;
}

SnapshotFilePresenceSink::SnapshotFilePresenceSink(std::filesystem::path path) : path_(std::move(path)) {
}

void SnapshotFilePresenceSink::Publish(const std::vector<tracker::PresenceUpdate>& updates) {
  std::lock_guard lock(mutex_);
  last_ = updates;
  Flush();
}

void SnapshotFilePresenceSink::SetAvailable(bool available, const std::string& reason) {
  std::lock_guard lock(mutex_);
  if (available_ == available && reason_ == reason) return;
  available_ = available;
  reason_    = available ? std::string() : reason;
  Flush();
}

void SnapshotFilePresenceSink::Flush() {
  try {
    Write(util::ToJson(BuildSnapshot(last_, available_, reason_, util::Now()), true));
  } catch (const std::exception& e) {
    PRESENCE_LOG_WARN("Failed to write presence snapshot", {observability::StringField("path", path_.string()),
                                                            observability::StringField("error", e.what())});
  }
}

/*
  Atomic write:
      write tmp -> close -> rename
*/
void SnapshotFilePresenceSink::Write(const std::string& document) {
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path());
  }

  const auto tmp_path = path_.string() + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("cannot open " + tmp_path);
    }
    out << document << '\n';
    out.close();
    if (!out) {
      throw std::runtime_error("short write to " + tmp_path);
    }
  }

  std::filesystem::rename(tmp_path, path_);
}

} // namespace presence::sink
