#pragma once

#include <chrono>
#include <cstdint>
#include <exception>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace meshdeploy::runtime::config {
class RuntimeConfig;
}

namespace meshdeploy::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"meshdeploy"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::map<std::string, std::string> resource_attributes{};
};

OtlpConfig OtlpConfigFrom(const meshdeploy::runtime::config::RuntimeConfig& config);

bool InitializeTracing(const OtlpConfig& config = {});
bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeTracing(const meshdeploy::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const meshdeploy::runtime::config::RuntimeConfig& config);
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

  void RecordOperation(std::string_view operation, bool success);
  void ObserveOperationLatencyMs(std::string_view operation, double latency_ms);
  void RecordProvisionAttempt(std::string_view provider, bool success);
  void SetRunningServices(std::uint64_t count);
  // outcome is "completed", "crashed" or "stopped".
  void RecordServiceExit(std::string_view outcome);
  void RecordTeardownFailures(std::uint64_t count);

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

inline bool InitializeTracing(const meshdeploy::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const meshdeploy::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordOperation(std::string_view, bool) {
}

inline void Metrics::ObserveOperationLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordProvisionAttempt(std::string_view, bool) {
}

inline void Metrics::SetRunningServices(std::uint64_t) {
}

inline void Metrics::RecordServiceExit(std::string_view) {
}

inline void Metrics::RecordTeardownFailures(std::uint64_t) {
}
#endif

/*
  Span plus operation count and latency for one lifecycle operation. The
  operation counts as failed when Fail() was called or when the scope is
  left by an exception.
*/
class OperationScope {
 public:
  OperationScope(std::string_view operation, std::string_view deployment_id)
      : operation_(operation),
        span_("deployment." + operation_),
        started_(std::chrono::steady_clock::now()),
        exceptions_(std::uncaught_exceptions()) {
    span_.SetAttribute("deployment", deployment_id);
  }

  ~OperationScope() {
    const bool success = !failed_ && std::uncaught_exceptions() == exceptions_;
    auto&      metrics = Metrics::Instance();
    metrics.RecordOperation(operation_, success);
    if (success) {
      metrics.ObserveOperationLatencyMs(operation_, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_).count());
    }
  }

  OperationScope(const OperationScope&)            = delete;
  OperationScope& operator=(const OperationScope&) = delete;

  void Fail(std::string_view description) {
    failed_ = true;
    span_.RecordException(description);
  }

  SpanScope& Span() { return span_; }

 private:
  std::string                           operation_;
  SpanScope                             span_;
  std::chrono::steady_clock::time_point started_;
  int                                   exceptions_;
  bool                                  failed_{false};
};

} // namespace meshdeploy::observability
