#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "internal/util/time.hpp"
#include "presence/v1/presence.pb.h"
#include "presence_sink.hpp"

namespace presence::sink {

presence::v1::PresenceSnapshot BuildSnapshot(const std::vector<tracker::PresenceUpdate>& updates, bool available,
                                             const std::string& unavailable_reason, util::TimePoint generated_at);

/*
  Keeps a JSON document of the latest presence table on disk.

  Every Publish() and availability change rewrites the file atomically
  (write tmp -> rename) so readers never observe a partial document. On an
  availability loss the last published devices are kept in the document.
  Write failures are logged and retried on the next call.
*/
class SnapshotFilePresenceSink final : public PresenceSink {
 public:
  explicit SnapshotFilePresenceSink(std::filesystem::path path);

  void Publish(const std::vector<tracker::PresenceUpdate>& updates) override;
  void SetAvailable(bool available, const std::string& reason) override;

  const std::filesystem::path& path() const {
    return path_;
  }

 private:
  void Flush();
  void Write(const std::string& document);

  std::filesystem::path path_;

  std::mutex                           mutex_;
  std::vector<tracker::PresenceUpdate> last_;
  bool                                 available_{false};
  std::string                          reason_{"no successful poll yet"};
};

} // namespace presence::sink
