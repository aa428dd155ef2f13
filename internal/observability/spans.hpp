#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace archstore::runtime::config {
class RuntimeConfig;
}

namespace archstore::observability {

struct OtlpConfig {
  std::string service_name{"archstore"};
  std::string endpoint{};
  bool        insecure{true};
};

// Tracing and metrics export only when otlp_endpoint is configured.
bool InitializeTracing(const archstore::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const archstore::runtime::config::RuntimeConfig& config);
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

class Metrics {
 public:
  static Metrics& Instance();

  void RecordCommit(std::string_view origin, bool success);
  void ObserveMigrationDurationMs(bool success, double duration_ms);
  void ObserveBackupDurationMs(std::string_view op, double duration_ms);
  void RecordRepairs(std::string_view repair_type, std::uint64_t repaired, std::uint64_t failed);
  void SetIntegrityScore(double score);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const archstore::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const archstore::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordCommit(std::string_view, bool) {
}

inline void Metrics::ObserveMigrationDurationMs(bool, double) {
}

inline void Metrics::ObserveBackupDurationMs(std::string_view, double) {
}

inline void Metrics::RecordRepairs(std::string_view, std::uint64_t, std::uint64_t) {
}

inline void Metrics::SetIntegrityScore(double) {
}
#endif

} // namespace archstore::observability
