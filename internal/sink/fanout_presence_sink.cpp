#include "fanout_presence_sink.hpp"

#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"

namespace presence::sink {

FanoutPresenceSink::FanoutPresenceSink(std::vector<PresenceSinkPtr> sinks) : sinks_(std::move(sinks)) {
}

void FanoutPresenceSink::Publish(const std::vector<tracker::PresenceUpdate>& updates) {
  for (const auto& sink : sinks_) {
    try {
      sink->Publish(updates);
    } catch (const std::exception& e) {
      PRESENCE_LOG_ERROR("Presence sink failed to publish", {observability::StringField("error", e.what())});
    }
  }
}

void FanoutPresenceSink::SetAvailable(bool available, const std::string& reason) {
  for (const auto& sink : sinks_) {
    try {
      sink->SetAvailable(available, reason);
    } catch (const std::exception& e) {
      PRESENCE_LOG_ERROR("Presence sink failed to update availability", {observability::StringField("error", e.what())});
    }
  }
}

} // namespace presence::sink
