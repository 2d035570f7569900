#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

#include "backoff_policy.hpp"
#include "internal/util/time.hpp"

namespace presence::appliance {
class ApplianceClient;
}

namespace presence::session {
class SessionManager;
}

namespace presence::sink {
class PresenceSink;
}

namespace presence::tracker {
class DeviceReconciler;
}

namespace presence::poll {

enum class SchedulerState : std::uint8_t {
  kIdle       = 0,
  kPolling    = 1,
  kBackingOff = 2,
  kPaused     = 3, // credentials rejected twice; waits for RequestRefresh()
};

enum class TickOutcome : std::uint8_t {
  kExecuted   = 0, // fetched, merged and published
  kSkipped    = 1, // another tick was still polling
  kBackingOff = 2, // inside a backoff window
  kFailed     = 3,
  kPaused     = 4, // polling paused after repeated authentication failures
};

std::string_view ToString(SchedulerState state);
std::string_view ToString(TickOutcome outcome);

struct PollSchedulerOptions {
  std::chrono::seconds poll_interval{30};
  std::chrono::seconds max_backoff{300};
};

// Smallest interval seconds the scheduler accepts. Lower values are clamped.
inline constexpr std::chrono::seconds kMinPollInterval{5};

// Rejected logins in a row before polling pauses: the failing one plus one fresh attempt.
inline constexpr std::uint32_t kAuthAttemptsBeforePause = 2;

/*
  First grid point start + k * interval strictly after `now`.
  Grid points that passed while a poll was running are not replayed.
*/
std::chrono::steady_clock::time_point NextTickAfter(std::chrono::steady_clock::time_point start,
                                                    std::chrono::seconds                  interval,
                                                    std::chrono::steady_clock::time_point now);

/*
  Drives poll cycles: session -> fetch -> merge -> publish.

  Tick() is the unit of work and may be called from any thread; at most one
  tick polls at a time and concurrent callers get kSkipped. Start() runs
  ticks on a fixed-rate grid from a worker thread.

  Appliance failures never escape a tick. They mark the sink unavailable
  and leave the device table untouched, so presence freezes at the last
  known value until a poll succeeds.

  A rejected login is retried once on the next tick. If that also fails the
  scheduler pauses and stops contacting the appliance until RequestRefresh()
  (or a restart), so a wrong password is never replayed on a timer.
*/
class PollScheduler {
 public:
  PollScheduler(std::shared_ptr<session::SessionManager>    sessions,
                std::shared_ptr<appliance::ApplianceClient> client,
                std::shared_ptr<tracker::DeviceReconciler>  reconciler,
                std::shared_ptr<sink::PresenceSink>         sink,
                PollSchedulerOptions                        options);
  ~PollScheduler();

  PollScheduler(const PollScheduler&)            = delete;
  PollScheduler& operator=(const PollScheduler&) = delete;

  TickOutcome Tick(util::TimePoint now);

  // First tick runs immediately.
  void Start();

  // Waits for the in-flight tick, then releases the appliance session.
  void Stop();

  // Wake the loop for one extra tick outside the grid. Also lifts an
  // authentication pause for one fresh login attempt.
  void RequestRefresh();

  SchedulerState state() const {
    return state_.load();
  }

  std::uint32_t consecutive_failures() const {
    return failures_.load();
  }

  std::chrono::seconds poll_interval() const {
    return backoff_.interval();
  }

 private:
  void Run();
  void Fail(std::string_view kind, const std::string& reason, util::TimePoint now, std::uint32_t backoff_failures);
  void Pause(const std::string& reason);
  void MarkUnavailable(const std::string& reason);

  std::shared_ptr<session::SessionManager>    sessions_;
  std::shared_ptr<appliance::ApplianceClient> client_;
  std::shared_ptr<tracker::DeviceReconciler>  reconciler_;
  std::shared_ptr<sink::PresenceSink>         sink_;
  BackoffPolicy                               backoff_;

  std::atomic<SchedulerState> state_{SchedulerState::kIdle};
  std::atomic<std::uint32_t>  failures_{0};
  std::atomic<bool>           resume_requested_{false};

  // Written only by the tick holding kPolling.
  std::uint32_t   auth_failures_{0};
  util::TimePoint backoff_until_{};
  bool            available_{false};

  std::mutex              wake_mutex_;
  std::condition_variable wake_;
  bool                    refresh_requested_{false};
  std::atomic<bool>       running_{false};
  std::thread             thread_;
};

} // namespace presence::poll
