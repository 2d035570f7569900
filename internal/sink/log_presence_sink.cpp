#include "log_presence_sink.hpp"

#include <cstdint>

#include "internal/observability/logging.hpp"

namespace presence::sink {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

LogPresenceSink::LogPresenceSink(bool log_transitions) : log_transitions_(log_transitions) {
}

void LogPresenceSink::Publish(const std::vector<tracker::PresenceUpdate>& updates) {
  std::int64_t home = 0;
  std::int64_t changed = 0;

  for (const auto& update : updates) {
    if (update.state.presence == tracker::Presence::kHome) ++home;
    if (!update.transitioned()) continue;
    ++changed;

    const auto level = log_transitions_ ? spdlog::level::info : spdlog::level::debug;
    observability::Log(level, "Device presence changed",
                       {StringField("key", update.key), StringField("transition", tracker::ToString(update.transition)),
                        StringField("presence", tracker::ToString(update.state.presence)),
                        StringField("name", update.state.name.value_or("")), StringField("mac", update.state.mac.value_or("")),
                        IntField("ips", static_cast<std::int64_t>(update.state.ips.size()))});
  }

  PRESENCE_LOG_DEBUG("Presence snapshot", {IntField("devices", static_cast<std::int64_t>(updates.size())), IntField("home", home),
                                           IntField("away", static_cast<std::int64_t>(updates.size()) - home),
                                           IntField("transitions", changed)});
}

void LogPresenceSink::SetAvailable(bool available, const std::string& reason) {
  if (available_ == available) return;
  available_ = available;

  if (available) {
    PRESENCE_LOG_INFO("Presence source available", {BoolField("available", true)});
  } else {
    PRESENCE_LOG_WARN("Presence source unavailable, holding last known state", {StringField("reason", reason)});
  }
}

} // namespace presence::sink
