#pragma once

#include <optional>
#include <string>
#include <vector>

#include "presence_sink.hpp"

namespace presence::sink {

/*
  Writes presence decisions to the process log.

  Transitions are logged at info (debug when log_transitions is off), the
  per-poll summary at debug. Availability is logged when it changes.
*/
class LogPresenceSink final : public PresenceSink {
 public:
  explicit LogPresenceSink(bool log_transitions = true);

  void Publish(const std::vector<tracker::PresenceUpdate>& updates) override;
  void SetAvailable(bool available, const std::string& reason) override;

 private:
  bool                log_transitions_;
  std::optional<bool> available_;
};

} // namespace presence::sink
