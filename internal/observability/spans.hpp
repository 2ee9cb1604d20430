#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace bay::runtime::config {
class RuntimeConfig;
}

namespace bay::observability {

/*
  Tracing and metrics facade.

  Backed by OpenTelemetry when built with ENABLE_OTEL, otherwise every call
  is an inline no-op.
*/

bool InitializeTracing(const bay::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const bay::runtime::config::RuntimeConfig& config);
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
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // One GC task run: items reclaimed, items failed, wall time.
  void RecordGcRun(std::string_view task, std::uint64_t cleaned, std::uint64_t errors, double duration_ms);

  // Time from session creation to confirmed runtime health.
  void ObserveSessionStartMs(std::string_view profile, double duration_ms, bool success);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const bay::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const bay::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordGcRun(std::string_view, std::uint64_t, std::uint64_t, double) {
}

inline void Metrics::ObserveSessionStartMs(std::string_view, double, bool) {
}
#endif

} // namespace bay::observability
