#pragma once

#include <string>
#include <vector>

#include "presence_sink.hpp"

namespace presence::sink {

/*
  Forwards every call to each child sink in order. A child that throws is
  logged and does not stop delivery to the others.
*/
class FanoutPresenceSink final : public PresenceSink {
 public:
  explicit FanoutPresenceSink(std::vector<PresenceSinkPtr> sinks);

  void Publish(const std::vector<tracker::PresenceUpdate>& updates) override;
  void SetAvailable(bool available, const std::string& reason) override;

  std::size_t size() const {
    return sinks_.size();
  }

 private:
  std::vector<PresenceSinkPtr> sinks_;
};

} // namespace presence::sink
