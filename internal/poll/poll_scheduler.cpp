#include "poll_scheduler.hpp"

#include <algorithm>
#include <exception>
#include <utility>
#include <vector>

#include "internal/appliance/appliance_client.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/session/session_manager.hpp"
#include "internal/sink/presence_sink.hpp"
#include "internal/tracker/device_reconciler.hpp"
#include "internal/util/errors.hpp"

namespace presence::poll {

using observability::IntField;
using observability::StringField;

namespace {

std::chrono::seconds ClampInterval(std::chrono::seconds interval) {
  if (interval < kMinPollInterval) {
    PRESENCE_LOG_WARN("Poll interval below minimum, clamping",
                      {IntField("requested_s", interval.count()), IntField("minimum_s", kMinPollInterval.count())});
    return kMinPollInterval;
  }
  return interval;
}

} // namespace

std::string_view ToString(SchedulerState state) {
  switch (state) {
    case SchedulerState::kPolling:
      return "polling";
    case SchedulerState::kBackingOff:
      return "backing_off";
    case SchedulerState::kPaused:
      return "paused";
    case SchedulerState::kIdle:
    default:
      return "idle";
  }
}

std::string_view ToString(TickOutcome outcome) {
  switch (outcome) {
    case TickOutcome::kExecuted:
      return "executed";
    case TickOutcome::kSkipped:
      return "skipped";
    case TickOutcome::kBackingOff:
      return "backing_off";
    case TickOutcome::kPaused:
      return "paused";
    case TickOutcome::kFailed:
    default:
      return "failed";
  }
}

std::chrono::steady_clock::time_point NextTickAfter(std::chrono::steady_clock::time_point start,
                                                    std::chrono::seconds                  interval,
                                                    std::chrono::steady_clock::time_point now) {
  if (now < start) return start;
  const auto elapsed = now - start;
  const auto k       = elapsed / interval + 1;
  return start + k * interval;
}

PollScheduler::PollScheduler(std::shared_ptr<session::SessionManager>    sessions,
                             std::shared_ptr<appliance::ApplianceClient> client,
                             std::shared_ptr<tracker::DeviceReconciler>  reconciler,
                             std::shared_ptr<sink::PresenceSink>         sink,
                             PollSchedulerOptions                        options)
    : sessions_(std::move(sessions)),
      client_(std::move(client)),
      reconciler_(std::move(reconciler)),
      sink_(std::move(sink)),
      backoff_(ClampInterval(options.poll_interval), options.max_backoff) {
}

PollScheduler::~PollScheduler() {
  if (thread_.joinable()) {
    Stop();
  }
}

// ------------------------------------------------------------
// Tick
// ------------------------------------------------------------

TickOutcome PollScheduler::Tick(util::TimePoint now) {
  auto observed = state_.load();
  if (observed == SchedulerState::kPolling || !state_.compare_exchange_strong(observed, SchedulerState::kPolling)) {
    PRESENCE_LOG_DEBUG("Previous poll still running, skipping tick");
    observability::Metrics::Instance().RecordPoll("skipped");
    return TickOutcome::kSkipped;
  }

  if (observed == SchedulerState::kPaused) {
    if (!resume_requested_.exchange(false)) {
      state_.store(SchedulerState::kPaused);
      PRESENCE_LOG_DEBUG("Polling paused after authentication failures, skipping tick");
      observability::Metrics::Instance().RecordPoll("paused");
      return TickOutcome::kPaused;
    }
    // One fresh attempt; another rejection pauses again.
    auth_failures_ = kAuthAttemptsBeforePause - 1;
    PRESENCE_LOG_INFO("Resuming polls after authentication pause");
  }

  // Half an interval of slack: a grid tick landing on the end of the window runs.
  if (observed == SchedulerState::kBackingOff && now + backoff_.interval() / 2 < backoff_until_) {
    state_.store(SchedulerState::kBackingOff);
    PRESENCE_LOG_DEBUG("Backing off, skipping tick", {IntField("remaining_s", util::SecondsBetween(now, backoff_until_))});
    observability::Metrics::Instance().RecordPoll("backoff");
    return TickOutcome::kBackingOff;
  }

  const auto  started = std::chrono::steady_clock::now();
  TickOutcome outcome = TickOutcome::kFailed;

  try {
    auto records = sessions_->WithSession([this](const session::Session& session) { return client_->FetchDevices(session); });
    auto updates = reconciler_->Merge(records, now);

    if (!available_) {
      sink_->SetAvailable(true, "");
      available_ = true;
      PRESENCE_LOG_INFO("Appliance available", {IntField("devices", static_cast<std::int64_t>(updates.size()))});
    }
    sink_->Publish(updates);

    const auto home = std::count_if(updates.begin(), updates.end(),
                                    [](const tracker::PresenceUpdate& u) { return u.state.presence == tracker::Presence::kHome; });
    observability::Metrics::Instance().SetTrackedDevices(home, static_cast<std::int64_t>(updates.size()) - home);
    observability::Metrics::Instance().RecordPoll("ok");

    failures_      = 0;
    auth_failures_ = 0;
    state_.store(SchedulerState::kIdle);
    outcome = TickOutcome::kExecuted;
  } catch (const util::AuthenticationError& e) {
    ++failures_;
    const auto attempts = ++auth_failures_;
    PRESENCE_LOG_ERROR("Appliance authentication failed", {StringField("error", e.what()), IntField("attempts", attempts)});
    if (attempts >= kAuthAttemptsBeforePause) {
      Pause(e.what());
    } else {
      // The next scheduled tick makes one fresh attempt.
      Fail("auth", e.what(), now, 0);
    }
  } catch (const util::UnreachableError& e) {
    auth_failures_      = 0;
    const auto failures = ++failures_;
    PRESENCE_LOG_WARN("Appliance unreachable", {StringField("error", e.what()), IntField("failures", failures)});
    Fail("unreachable", e.what(), now, failures);
  } catch (const util::MalformedResponseError& e) {
    PRESENCE_LOG_ERROR("Malformed appliance response", {StringField("error", e.what())});
    Fail("malformed", e.what(), now, 0);
  } catch (const std::exception& e) {
    PRESENCE_LOG_ERROR("Poll failed", {StringField("error", e.what())});
    Fail("error", e.what(), now, 0);
  }

  const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started);
  observability::Metrics::Instance().ObservePollDurationMs(elapsed.count());
  PRESENCE_LOG_DEBUG("Poll finished", {StringField("outcome", ToString(outcome)), IntField("duration_ms", static_cast<std::int64_t>(elapsed.count()))});
  return outcome;
}

void PollScheduler::Fail(std::string_view kind, const std::string& reason, util::TimePoint now, std::uint32_t backoff_failures) {
  MarkUnavailable(std::string(kind) + ": " + reason);
  observability::Metrics::Instance().RecordPoll(kind);

  if (backoff_failures == 0) {
    state_.store(SchedulerState::kIdle);
    return;
  }

  const auto delay = backoff_.Delay(backoff_failures);
  backoff_until_   = now + delay;
  PRESENCE_LOG_INFO("Backing off appliance polls", {IntField("delay_s", delay.count())});
  state_.store(SchedulerState::kBackingOff);
}

void PollScheduler::Pause(const std::string& reason) {
  MarkUnavailable("auth: " + reason + " (polling paused)");
  observability::Metrics::Instance().RecordPoll("auth");

  resume_requested_ = false;
  PRESENCE_LOG_ERROR("Polling paused: appliance keeps rejecting the configured password; fix it and send SIGHUP or restart",
                     {IntField("attempts", static_cast<std::int64_t>(auth_failures_))});
  state_.store(SchedulerState::kPaused);
}

void PollScheduler::MarkUnavailable(const std::string& reason) {
  sink_->SetAvailable(false, reason);
  available_ = false;
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

void PollScheduler::Start() {
  if (running_.exchange(true)) return;

  PRESENCE_LOG_INFO("Starting poll loop", {IntField("interval_s", backoff_.interval().count()),
                                           IntField("max_backoff_s", backoff_.ceiling().count())});
  thread_ = std::thread(&PollScheduler::Run, this);
}

void PollScheduler::Stop() {
  {
    std::lock_guard lock(wake_mutex_);
    running_ = false;
  }
  wake_.notify_all();

  if (thread_.joinable()) {
    thread_.join();
  }
  sessions_->Logout();
  PRESENCE_LOG_INFO("Poll loop stopped");
}

void PollScheduler::RequestRefresh() {
  {
    std::lock_guard lock(wake_mutex_);
    refresh_requested_ = true;
  }
  resume_requested_ = true;
  wake_.notify_all();
}

void PollScheduler::Run() {
  const auto start = std::chrono::steady_clock::now();

  while (running_) {
    Tick(util::Now());

    const auto       next = NextTickAfter(start, backoff_.interval(), std::chrono::steady_clock::now());
    std::unique_lock lock(wake_mutex_);
    wake_.wait_until(lock, next, [this] { return !running_ || refresh_requested_; });
    if (refresh_requested_) {
      PRESENCE_LOG_INFO("Refresh requested");
      refresh_requested_ = false;
    }
  }
}

} // namespace presence::poll
