#include "backoff_policy.hpp"

#include <algorithm>

namespace presence::poll {

BackoffPolicy::BackoffPolicy(std::chrono::seconds interval, std::chrono::seconds ceiling)
    : interval_(interval), ceiling_(std::max(ceiling, interval)) {
}

std::chrono::seconds BackoffPolicy::Delay(std::uint32_t failures) const {
  if (failures == 0) return std::chrono::seconds(0);

  auto delay = interval_;
  for (std::uint32_t i = 1; i < failures && delay < ceiling_; ++i) {
    delay *= 2;
  }
  return std::min(delay, ceiling_);
}

} // namespace presence::poll
