#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/tracker/device_state.hpp"

namespace presence::sink {

/*
  Receiver of presence decisions.

  Publish() gets the full device table after every successful poll, in key
  order, with transitions flagged. SetAvailable(false, reason) is called on
  every failed poll and SetAvailable(true, "") once polling recovers.
  Both are called from the poll thread only.
*/
class PresenceSink {
 public:
  virtual ~PresenceSink() = default;

  virtual void Publish(const std::vector<tracker::PresenceUpdate>& updates) = 0;
  virtual void SetAvailable(bool available, const std::string& reason)    = 0;
};

using PresenceSinkPtr = std::shared_ptr<PresenceSink>;

} // namespace presence::sink
