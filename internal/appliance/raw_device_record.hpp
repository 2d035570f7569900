#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>

#include "internal/util/time.hpp"

namespace presence::appliance {

/*
  One device as reported by a single poll.

  Every field the appliance did not report is an empty optional, never a
  zero or empty placeholder: "no data" and "no activity" must stay distinct.
*/
struct RawDeviceRecord {
  std::optional<std::string>     mac; // "aa:bb:cc:dd:ee:ff"
  std::set<std::string>          ips;
  std::optional<std::string>     name;
  std::optional<util::TimePoint> dhcp_expires;
  std::optional<std::string>     interface_name;
  std::optional<util::TimePoint> last_query;
  std::optional<std::int64_t>    num_queries;
  std::optional<std::string>     mac_vendor; // as reported by the appliance
};

} // namespace presence::appliance
