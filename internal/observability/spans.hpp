#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace sensorlink::runtime::config {
class ObservabilityConfig;
}

namespace sensorlink::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"sensorlink"};
  // service.instance.id; the sensor id for sensor processes
  std::string   instance_id{};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  double        sample_ratio{1.0};
};

bool InitializeTracing(const OtlpConfig& config = {});
bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeTracing(const sensorlink::runtime::config::ObservabilityConfig& config, std::string_view service_name,
                       std::string_view instance_id = {});
bool InitializeMetrics(const sensorlink::runtime::config::ObservabilityConfig& config, std::string_view service_name,
                       std::string_view instance_id = {});
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process-wide instruments. Operator-facing signals:
    sensorlink.queue.depth              sustained growth means the collector is unreachable
    sensorlink.chunk.integrity_errors   repeated errors mean corrupted sensor storage
    sensorlink.sensor.missed_heartbeats sensors that stopped talking
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  void RecordChunkOutcome(std::string_view outcome, std::uint64_t count = 1);
  void RecordIntegrityError(std::string_view sensor_id);
  void SetQueueDepth(std::string_view sensor_id, std::uint64_t depth);
  void RecordMissedHeartbeat(std::string_view sensor_id);
  void RecordAbandonedWindow(std::string_view sensor_id);
  void SetLiveSessions(std::uint64_t sessions);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const OtlpConfig&) {
  return false;
}

inline bool InitializeMetrics(const OtlpConfig&) {
  return false;
}

inline bool InitializeTracing(const sensorlink::runtime::config::ObservabilityConfig&, std::string_view, std::string_view) {
  return false;
}

inline bool InitializeMetrics(const sensorlink::runtime::config::ObservabilityConfig&, std::string_view, std::string_view) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
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

inline void Metrics::RecordChunkOutcome(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordIntegrityError(std::string_view) {
}

inline void Metrics::SetQueueDepth(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordMissedHeartbeat(std::string_view) {
}

inline void Metrics::RecordAbandonedWindow(std::string_view) {
}

inline void Metrics::SetLiveSessions(std::uint64_t) {
}
#endif

} // namespace sensorlink::observability
