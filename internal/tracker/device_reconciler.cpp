#include "device_reconciler.hpp"

#include <algorithm>
#include <iterator>
#include <set>
#include <utility>

#include "internal/observability/logging.hpp"

namespace presence::tracker {

using appliance::RawDeviceRecord;

namespace {

template <typename T>
void KeepLatest(std::optional<T>& into, const std::optional<T>& candidate) {
  if (candidate && (!into || *into < *candidate)) {
    into = candidate;
  }
}

// Two records of the same identity within one batch.
void Combine(RawDeviceRecord& into, const RawDeviceRecord& from) {
  into.ips.insert(from.ips.begin(), from.ips.end());
  if (!into.name) into.name = from.name;
  if (!into.interface_name) into.interface_name = from.interface_name;
  if (!into.mac_vendor) into.mac_vendor = from.mac_vendor;
  KeepLatest(into.last_query, from.last_query);
  KeepLatest(into.num_queries, from.num_queries);
  KeepLatest(into.dhcp_expires, from.dhcp_expires);
}

std::string CompactMac(const std::string& mac) {
  std::string compact;
  std::copy_if(mac.begin(), mac.end(), std::back_inserter(compact), [](char c) { return c != ':'; });
  return compact;
}

} // namespace

DeviceReconciler::DeviceReconciler(ReconcilerOptions options, std::shared_ptr<const OuiTable> oui)
    : options_(options), oui_(std::move(oui)) {
}

// ------------------------------------------------------------
// Merge
// ------------------------------------------------------------

std::vector<PresenceUpdate> DeviceReconciler::Merge(const std::vector<RawDeviceRecord>& records, util::TimePoint now) {
  Table next = table_;
  ++next.poll;

  std::vector<std::pair<std::string, RawDeviceRecord>> batch;
  std::map<std::string, std::size_t>                   batch_index;
  for (const auto& record : records) {
    auto identity = IdentityOf(record);
    if (identity.empty()) {
      PRESENCE_LOG_DEBUG("Ignoring record without MAC or address");
      continue;
    }
    auto [it, inserted] = batch_index.emplace(identity, batch.size());
    if (inserted) {
      batch.emplace_back(std::move(identity), record);
    } else {
      Combine(batch[it->second].second, record);
    }
  }

  std::map<DeviceKey, PresenceTransition> transitions;
  std::set<DeviceKey>                     reported;

  for (const auto& [identity, record] : batch) {
    const auto key      = ResolveKey(next, identity, record);
    auto [it, created]  = next.devices.try_emplace(key);
    auto&      state    = it->second;
    const auto previous = state.presence;
    const auto seen_at  = record.last_query.value_or(now);

    if (created) {
      state.key        = key;
      state.first_seen = now;
      state.last_seen  = seen_at;
    } else {
      state.last_seen = std::max(state.last_seen, seen_at);
    }
    ApplyRecord(next, state, record);
    reported.insert(key);

    // Observed in this poll: home, whatever its last recorded activity.
    state.presence = Presence::kHome;

    if (created) {
      transitions[key] = PresenceTransition::kDiscovered;
    } else if (previous == Presence::kAway) {
      transitions[key] = PresenceTransition::kArrived;
    }
  }

  for (auto& [key, state] : next.devices) {
    if (reported.count(key)) continue;
    if (state.presence == Presence::kHome && IsStale(state, now)) {
      state.presence   = Presence::kAway;
      transitions[key] = PresenceTransition::kDeparted;
    }
  }

  std::vector<PresenceUpdate> updates;
  updates.reserve(next.devices.size());
  for (auto& [key, state] : next.devices) {
    state.last_query_seconds_ago =
        state.last_query ? std::optional<std::int64_t>(util::SecondsBetween(*state.last_query, now)) : std::nullopt;

    auto transition = transitions.find(key);
    updates.push_back({key, state, transition == transitions.end() ? PresenceTransition::kNone : transition->second});
  }

  table_ = std::move(next);

  PRESENCE_LOG_DEBUG("Merged poll", {observability::IntField("records", static_cast<std::int64_t>(records.size())),
                                     observability::IntField("devices", static_cast<std::int64_t>(table_.devices.size())),
                                     observability::IntField("transitions", static_cast<std::int64_t>(transitions.size()))});
  return updates;
}

std::vector<PresenceUpdate> DeviceReconciler::Snapshot(util::TimePoint now) const {
  std::vector<PresenceUpdate> updates;
  updates.reserve(table_.devices.size());
  for (const auto& [key, state] : table_.devices) {
    PresenceUpdate update{key, state, PresenceTransition::kNone};
    if (state.last_query) {
      update.state.last_query_seconds_ago = util::SecondsBetween(*state.last_query, now);
    }
    updates.push_back(std::move(update));
  }
  return updates;
}

std::optional<DeviceState> DeviceReconciler::Find(const DeviceKey& key) const {
  auto it = table_.devices.find(key);
  if (it == table_.devices.end()) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------

DeviceKey DeviceReconciler::ResolveKey(Table& table, const std::string& identity, const RawDeviceRecord& record) const {
  if (auto it = table.identities.find(identity); it != table.identities.end()) {
    return it->second;
  }

  const auto vendor  = ResolveVendor(record.mac, record.mac_vendor);
  const auto address = record.ips.empty() ? std::string() : *record.ips.begin();
  auto       key     = DeriveDeviceKey(record.name, vendor, record.mac, address);

  if (table.devices.count(key)) {
    // Held by a different identity: fall back to the full MAC, then a counter.
    const auto base = DeviceLabel(record.name, vendor) + "_" + (record.mac ? CompactMac(*record.mac) : Sanitize(address));
    key             = base;
    for (int n = 2; table.devices.count(key); ++n) {
      key = base + "_" + std::to_string(n);
    }
  }

  table.identities.emplace(identity, key);
  PRESENCE_LOG_INFO("Tracking new device", {observability::StringField("key", key), observability::StringField("identity", identity)});
  return key;
}

void DeviceReconciler::ApplyRecord(Table& table, DeviceState& state, const RawDeviceRecord& record) const {
  if (!state.mac && record.mac) state.mac = record.mac;
  if (record.name && !record.name->empty()) state.name = record.name;
  if (record.dhcp_expires) state.dhcp_expires = record.dhcp_expires;
  if (record.interface_name) state.interface_name = record.interface_name;
  KeepLatest(state.num_queries, record.num_queries);
  KeepLatest(state.last_query, record.last_query);

  // Keep addresses reported in this poll or the one before it.
  auto& polls = table.address_polls[state.key];
  for (const auto& ip : record.ips) {
    polls[ip] = table.poll;
  }
  for (auto it = polls.begin(); it != polls.end();) {
    if (it->second + 1 < table.poll) {
      it = polls.erase(it);
    } else {
      ++it;
    }
  }
  state.ips.clear();
  for (const auto& [ip, poll] : polls) {
    state.ips.insert(ip);
  }

  if (!state.mac_vendor) {
    state.mac_vendor = ResolveVendor(state.mac, record.mac_vendor);
    if (state.mac_vendor) {
      PRESENCE_LOG_DEBUG("Resolved vendor", {observability::StringField("key", state.key), observability::StringField("vendor", *state.mac_vendor)});
    }
  }
}

std::optional<std::string> DeviceReconciler::ResolveVendor(const std::optional<std::string>& mac,
                                                           const std::optional<std::string>& reported) const {
  if (mac && oui_) {
    if (auto vendor = oui_->Lookup(*mac)) return vendor;
  }
  if (reported && !reported->empty()) return reported;
  return std::nullopt;
}

bool DeviceReconciler::IsStale(const DeviceState& state, util::TimePoint now) const {
  const auto reference = state.last_query.value_or(state.last_seen);
  return now - reference > options_.away_threshold;
}

} // namespace presence::tracker
