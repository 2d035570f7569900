#include "time.hpp"

#include <algorithm>

namespace presence::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);
  if (nanos.count() < 0) {
    sec -= std::chrono::seconds(1);
    nanos += std::chrono::seconds(1);
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromUnixSeconds(double seconds) {
  const auto since_epoch = std::chrono::duration<double>(seconds);
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(since_epoch);
}

std::int64_t ToUnixSeconds(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

std::int64_t SecondsBetween(TimePoint earlier, TimePoint later) {
  const auto delta = std::chrono::duration_cast<std::chrono::seconds>(later - earlier).count();
  return std::max<std::int64_t>(delta, 0);
}

} // namespace presence::util
