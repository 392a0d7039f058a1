#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace upload::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

bool InstallProvider(const OtlpConfig& config, std::chrono::milliseconds export_interval) {
  auto endpoint = ResolveEndpoint(config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = export_interval;
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", config.service_name}, {"service.version", config.service_version}};
  if (const char* environment = std::getenv("UPLOAD_ENVIRONMENT")) {
    attrs.SetAttribute("deployment.environment", opentelemetry::nostd::string_view(environment));
  }
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attrs));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> completion_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> verified_bytes;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> session_transitions;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> initiations;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> initiation_rejections;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> reaped_sessions;
};

bool InitializeMetrics(const OtlpConfig& config) {
  return InstallProvider(config, std::chrono::milliseconds(1000));
}

bool InitializeMetrics(const upload::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == upload::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  const auto interval_ms = observability.metrics_export_interval_ms() > 0 ? observability.metrics_export_interval_ms() : 1000;
  return InstallProvider(otlp_config, std::chrono::milliseconds(interval_ms));
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("upload-manager", "0.1.0");

  impl_->request_count       = impl_->meter->CreateUInt64Counter("upload.request.count", "Total number of service requests", "1");
  impl_->request_latency_ms  = impl_->meter->CreateDoubleHistogram("upload.request.latency_ms", "End-to-end request latency", "ms");
  impl_->completion_count    = impl_->meter->CreateUInt64Counter("upload.completion.count", "Completion pipeline outcomes", "1");
  impl_->verified_bytes      = impl_->meter->CreateUInt64Counter("upload.completion.verified_bytes", "Bytes verified in the object store", "By");
  impl_->session_transitions = impl_->meter->CreateUInt64Counter("upload.session.transitions", "Upload session state transitions", "1");
  impl_->initiations         = impl_->meter->CreateUInt64Counter("upload.initiation.count", "Upload sessions opened", "1");
  impl_->initiation_rejections =
      impl_->meter->CreateUInt64Counter("upload.initiation.rejected", "Initiations refused before a session was written", "1");
  impl_->reaped_sessions = impl_->meter->CreateUInt64Counter("upload.reaper.expired", "Sessions expired by the reaper", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
  impl_->request_count->Add(1, attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  impl_->request_latency_ms->Record(latency_ms, attributes, opentelemetry::context::Context{});
}

void Metrics::RecordCompletion(std::string_view outcome) {
  if (!impl_ || !impl_->completion_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"outcome", std::string(outcome)}};
  impl_->completion_count->Add(1, attributes);
}

void Metrics::ObserveVerifiedBytes(std::uint64_t bytes) {
  if (!impl_ || !impl_->verified_bytes) {
    return;
  }
  impl_->verified_bytes->Add(bytes);
}

void Metrics::RecordSessionTransition(std::string_view to_status) {
  if (!impl_ || !impl_->session_transitions) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"to", std::string(to_status)}};
  impl_->session_transitions->Add(1, attributes);
}

void Metrics::RecordInitiation(std::string_view transfer_type) {
  if (!impl_ || !impl_->initiations) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"transfer_type", std::string(transfer_type)}};
  impl_->initiations->Add(1, attributes);
}

void Metrics::RecordInitiationRejected(std::string_view reason) {
  if (!impl_ || !impl_->initiation_rejections) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"reason", std::string(reason)}};
  impl_->initiation_rejections->Add(1, attributes);
}

void Metrics::RecordReaped(std::uint64_t sessions) {
  if (!impl_ || !impl_->reaped_sessions || sessions == 0) {
    return;
  }
  impl_->reaped_sessions->Add(sessions);
}

} // namespace upload::observability

#endif
