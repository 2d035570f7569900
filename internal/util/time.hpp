#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace presence::util {

/*
  Time utilities: single place to control clock source later.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);

// Appliance timestamps are epoch seconds, sometimes fractional.
TimePoint FromUnixSeconds(double seconds);
std::int64_t ToUnixSeconds(TimePoint tp);

// Whole seconds from `earlier` to `later`, clamped at zero.
std::int64_t SecondsBetween(TimePoint earlier, TimePoint later);

} // namespace presence::util
