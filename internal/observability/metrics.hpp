#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace presence::runtime::config {
class RuntimeConfig;
}

namespace presence::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"pihole-presence"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t collection_interval_ms{10000};
};

bool InitializeMetrics(const presence::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

class Metrics {
 public:
  static Metrics& Instance();

  // outcome: "ok", "skipped", "backoff", "paused", "unreachable", "auth", "malformed", "error"
  void RecordPoll(std::string_view outcome);
  void ObservePollDurationMs(double duration_ms);
  void SetTrackedDevices(std::int64_t home, std::int64_t away);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const presence::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordPoll(std::string_view) {
}

inline void Metrics::ObservePollDurationMs(double) {
}

inline void Metrics::SetTrackedDevices(std::int64_t, std::int64_t) {
}
#endif

} // namespace presence::observability
