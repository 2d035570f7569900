#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include "device_key.hpp"
#include "internal/util/time.hpp"

namespace presence::tracker {

enum class Presence : std::uint8_t {
  kAway = 0,
  kHome = 1,
};

constexpr std::string_view ToString(Presence presence) {
  return presence == Presence::kHome ? "home" : "away";
}

enum class PresenceTransition : std::uint8_t {
  kNone       = 0,
  kDiscovered = 1, // first observation of the key
  kArrived    = 2, // away -> home
  kDeparted   = 3, // home -> away
};

constexpr std::string_view ToString(PresenceTransition transition) {
  switch (transition) {
    case PresenceTransition::kDiscovered:
      return "discovered";
    case PresenceTransition::kArrived:
      return "arrived";
    case PresenceTransition::kDeparted:
      return "departed";
    case PresenceTransition::kNone:
    default:
      return "none";
  }
}

/*
  Everything known about one device for the life of the process.

  first_seen is set once. num_queries and last_query only move forward.
  mac_vendor, once resolved, never changes.
*/
struct DeviceState {
  DeviceKey                      key;
  Presence                       presence{Presence::kHome};
  std::optional<std::string>     name;
  std::optional<std::string>     mac;
  util::TimePoint                first_seen{};
  util::TimePoint                last_seen{};
  std::optional<util::TimePoint> last_query;
  std::optional<std::int64_t>    last_query_seconds_ago;
  std::optional<std::int64_t>    num_queries;
  std::optional<std::string>     mac_vendor;
  std::set<std::string>          ips;
  std::optional<util::TimePoint> dhcp_expires;
  std::optional<std::string>     interface_name;

  bool operator==(const DeviceState&) const = default;
};

struct PresenceUpdate {
  DeviceKey          key;
  DeviceState        state;
  PresenceTransition transition{PresenceTransition::kNone};

  bool transitioned() const {
    return transition != PresenceTransition::kNone;
  }
};

} // namespace presence::tracker
