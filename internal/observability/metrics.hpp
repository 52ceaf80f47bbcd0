#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace medianode::runtime::config {
class RuntimeConfig;
}

namespace medianode::observability {

bool InitializeMetrics(const medianode::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void RecordTransition(std::string_view from, std::string_view to);
  void RecordProvisioningRequest(std::string_view op, bool success);
  void SetFleetNodes(std::string_view state, std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const medianode::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordTransition(std::string_view, std::string_view) {
}

inline void Metrics::RecordProvisioningRequest(std::string_view, bool) {
}

inline void Metrics::SetFleetNodes(std::string_view, std::uint64_t) {
}
#endif

} // namespace medianode::observability
