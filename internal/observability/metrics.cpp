#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define MESHDEPLOY_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define MESHDEPLOY_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace meshdeploy::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;
namespace cfg         = meshdeploy::runtime::config;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

struct MetricsOptions {
  bool operation_metrics_enabled{true};
  bool provision_metrics_enabled{true};
  bool operation_labels_enabled{true};
};

MetricsOptions g_metrics_options;

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

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveEndpoint(config);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

template <typename Provider>
void ConfigureResource(Provider& provider, const resource::Resource& res) {
  if constexpr (requires { provider.SetResource(res); }) {
    provider.SetResource(res);
  }
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

bool Install(const OtlpConfig& config, sdkmetrics::PeriodicExportingMetricReaderOptions reader_options) {
#ifdef MESHDEPLOY_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(config), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(MakeExporter(config), reader_options);
#endif

  resource::ResourceAttributes attrs = {{"service.name", config.service_name}};
  for (const auto& [key, value] : config.resource_attributes) {
    attrs.SetAttribute(key, value);
  }
  auto res   = resource::Resource::Create(attrs);
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), res);
  ConfigureResource(*g_provider, res);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> operation_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      operation_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> provision_attempts;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   running_services_gauge;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> service_exits;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> teardown_failures;

  std::atomic<std::int64_t> running_services{0};
};

bool InitializeMetrics(const OtlpConfig& config) {
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(1000);
  return Install(config, reader_options);
}

bool InitializeMetrics(const cfg::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto  otlp_config   = OtlpConfigFrom(config);
  const auto& metric_config = observability.metrics();
  const auto  configured_ms = metric_config.collection_interval_ms() > 0 ? metric_config.collection_interval_ms() : 1000;

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(std::max(metric_config.min_collection_interval_ms(), configured_ms));
  if (metric_config.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(metric_config.export_timeout_ms());
  }

  g_metrics_options.operation_metrics_enabled = metric_config.operation_metrics_enabled();
  g_metrics_options.provision_metrics_enabled = metric_config.provision_metrics_enabled();
  g_metrics_options.operation_labels_enabled  = metric_config.operation_labels_enabled();

  return Install(otlp_config, reader_options);
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
  impl_->meter  = provider->GetMeter("meshdeploy", "0.1.0");

  impl_->operation_count      = impl_->meter->CreateUInt64Counter("meshdeploy.operation.count", "1", "Lifecycle operations by outcome");
  impl_->operation_latency_ms = impl_->meter->CreateDoubleHistogram("meshdeploy.operation.latency_ms", "ms", "Lifecycle operation latency");
  impl_->provision_attempts   = impl_->meter->CreateUInt64Counter("meshdeploy.provision.attempts", "1", "Provisioning attempts by provider");
  impl_->service_exits        = impl_->meter->CreateUInt64Counter("meshdeploy.service.exits", "1", "Service process exits by outcome");
  impl_->teardown_failures    = impl_->meter->CreateUInt64Counter("meshdeploy.teardown.failures", "1", "Resources that could not be released");
  impl_->running_services_gauge =
      impl_->meter->CreateInt64ObservableGauge("meshdeploy.services.running", "Services currently in the running state", "1");
  impl_->running_services_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->running_services.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordOperation(std::string_view operation, bool success) {
  if (!impl_ || !impl_->operation_count || !g_metrics_options.operation_metrics_enabled) {
    return;
  }

  if (g_metrics_options.operation_labels_enabled) {
    const std::initializer_list<AttributePair> attributes = {{"operation", std::string(operation)}, {"success", success}};
    AddWithAttributes(impl_->operation_count, static_cast<std::uint64_t>(1), attributes);
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"success", success}};
  AddWithAttributes(impl_->operation_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveOperationLatencyMs(std::string_view operation, double latency_ms) {
  if (!impl_ || !impl_->operation_latency_ms || !g_metrics_options.operation_metrics_enabled) {
    return;
  }

  if (g_metrics_options.operation_labels_enabled) {
    const std::initializer_list<AttributePair> attributes = {{"operation", std::string(operation)}};
    RecordWithAttributes(impl_->operation_latency_ms, latency_ms, attributes);
    return;
  }

  RecordWithAttributes(impl_->operation_latency_ms, latency_ms, std::initializer_list<AttributePair>{});
}

void Metrics::RecordProvisionAttempt(std::string_view provider, bool success) {
  if (!impl_ || !impl_->provision_attempts || !g_metrics_options.provision_metrics_enabled) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"provider", std::string(provider)}, {"success", success}};
  AddWithAttributes(impl_->provision_attempts, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::SetRunningServices(std::uint64_t count) {
  if (!impl_) {
    return;
  }
  impl_->running_services.store(static_cast<std::int64_t>(count));
}

void Metrics::RecordServiceExit(std::string_view outcome) {
  if (!impl_ || !impl_->service_exits) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->service_exits, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordTeardownFailures(std::uint64_t count) {
  if (!impl_ || !impl_->teardown_failures || count == 0) {
    return;
  }
  AddWithAttributes(impl_->teardown_failures, count, std::initializer_list<AttributePair>{});
}

} // namespace meshdeploy::observability

#endif
