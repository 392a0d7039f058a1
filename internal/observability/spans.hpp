#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace upload::runtime::config {
class RuntimeConfig;
}

namespace upload::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"upload-manager"};
  std::string   service_version{"0.1.0"};
  // deployment.environment; UPLOAD_ENVIRONMENT when empty
  std::string   environment{};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const OtlpConfig& config = {});
bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeTracing(const upload::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const upload::runtime::config::RuntimeConfig& config);
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
  // upload.tenant_id / upload.brand_id / upload.session_id, empty values skipped
  void SetUploadContext(std::string_view tenant_id, std::string_view brand_id, std::string_view session_id);
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
  // outcome: created | replayed | replaced | failed
  void RecordCompletion(std::string_view outcome);
  void ObserveVerifiedBytes(std::uint64_t bytes);
  void RecordSessionTransition(std::string_view to_status);
  // transfer_type: direct | chunked
  void RecordInitiation(std::string_view transfer_type);
  // reason: plan_limit | bucket_not_ready | invalid
  void RecordInitiationRejected(std::string_view reason);
  void RecordReaped(std::uint64_t sessions);

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

inline bool InitializeTracing(const upload::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const upload::runtime::config::RuntimeConfig&) {
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

inline void SpanScope::SetUploadContext(std::string_view, std::string_view, std::string_view) {
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

inline void Metrics::RecordCompletion(std::string_view) {
}

inline void Metrics::ObserveVerifiedBytes(std::uint64_t) {
}

inline void Metrics::RecordSessionTransition(std::string_view) {
}

inline void Metrics::RecordInitiation(std::string_view) {
}

inline void Metrics::RecordInitiationRejected(std::string_view) {
}

inline void Metrics::RecordReaped(std::uint64_t) {
}
#endif

} // namespace upload::observability
