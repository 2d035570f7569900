#pragma once

#include <chrono>
#include <cstdint>

namespace presence::poll {

/*
  Exponential backoff on the poll interval.

  Delay(n) = min(interval * 2^(n-1), ceiling) for the n-th consecutive
  failure, n >= 1. Delay(0) is zero.
*/
class BackoffPolicy {
 public:
  BackoffPolicy(std::chrono::seconds interval, std::chrono::seconds ceiling);

  std::chrono::seconds Delay(std::uint32_t failures) const;

  std::chrono::seconds interval() const {
    return interval_;
  }
  std::chrono::seconds ceiling() const {
    return ceiling_;
  }

 private:
  std::chrono::seconds interval_;
  std::chrono::seconds ceiling_;
};

} // namespace presence::poll
