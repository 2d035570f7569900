#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "device_state.hpp"
#include "internal/appliance/raw_device_record.hpp"
#include "oui_table.hpp"

namespace presence::tracker {

struct ReconcilerOptions {
  std::chrono::seconds away_threshold{180};
};

/*
  Owns the DeviceKey -> DeviceState table.

  Merge() folds one poll's records into the table and decides presence:
    - a reported device with recent (or unknown) activity is home
    - any device whose last activity is older than the away threshold is away
    - a device missing from a poll keeps its presence until it goes stale
  Keys are bound to the device identity (MAC, else address) the first time it
  is seen, so later name or address changes keep the same key.

  Merge is all-or-nothing: the table is only replaced once the whole batch
  has been applied. Not thread-safe; callers serialize polls.
*/
class DeviceReconciler {
 public:
  explicit DeviceReconciler(ReconcilerOptions options, std::shared_ptr<const OuiTable> oui = nullptr);

  // One update per known device, ordered by key.
  std::vector<PresenceUpdate> Merge(const std::vector<appliance::RawDeviceRecord>& records, util::TimePoint now);

  // Current table with last_query_seconds_ago relative to `now`; no transitions.
  std::vector<PresenceUpdate> Snapshot(util::TimePoint now) const;

  std::optional<DeviceState> Find(const DeviceKey& key) const;

  std::size_t size() const {
    return table_.devices.size();
  }

 private:
  struct Table {
    std::map<DeviceKey, DeviceState>                         devices;
    std::map<std::string, DeviceKey>                         identities;
    std::map<DeviceKey, std::map<std::string, std::uint64_t>> address_polls; // address -> poll it was last reported in
    std::uint64_t                                            poll{0};
  };

  DeviceKey ResolveKey(Table& table, const std::string& identity, const appliance::RawDeviceRecord& record) const;
  void      ApplyRecord(Table& table, DeviceState& state, const appliance::RawDeviceRecord& record) const;
  std::optional<std::string> ResolveVendor(const std::optional<std::string>& mac, const std::optional<std::string>& reported) const;
  bool                       IsStale(const DeviceState& state, util::TimePoint now) const;

  ReconcilerOptions               options_;
  std::shared_ptr<const OuiTable> oui_;
  Table                           table_;
};

} // namespace presence::tracker
