#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace outbox::runtime::config {
class RuntimeConfig;
}

namespace outbox::observability {

/*
  OTLP export configured from config.observability(). Both return
  false when the signal is disabled.
*/
bool InitializeTracing(const outbox::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const outbox::runtime::config::RuntimeConfig& config);
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
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Outbox counters.

  kind is "immediate" or "scheduled".
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordCommandsFlushed(std::string_view kind, std::uint64_t count);
  void RecordAlreadyGoneDelete(std::string_view kind);
  void RecordFlushFailure();
  void RecordSweepPass(std::uint64_t candidates);
  void RecordUnhandleableFailure();
  void ObserveFlushDurationMs(double duration_ms);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const outbox::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const outbox::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordCommandsFlushed(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordAlreadyGoneDelete(std::string_view) {
}

inline void Metrics::RecordFlushFailure() {
}

inline void Metrics::RecordSweepPass(std::uint64_t) {
}

inline void Metrics::RecordUnhandleableFailure() {
}

inline void Metrics::ObserveFlushDurationMs(double) {
}
#endif

} // namespace outbox::observability
