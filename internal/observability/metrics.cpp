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

#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define ROADCAST_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define ROADCAST_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"

namespace roadcast::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

struct MetricsOptions {
  bool cache_metrics_enabled{true};
  bool route_labels_enabled{true};
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

resource::Resource BuildResource(const OtlpConfig& config) {
  resource::ResourceAttributes attrs = {{"service.name", config.service_name}};
  return resource::Resource::Create(attrs);
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

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> cache_lookups;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> provider_calls;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> gate_roles;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> stale_serves;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      injected_edges;
};

namespace {

void InstallProvider(const OtlpConfig& config, std::chrono::milliseconds interval, std::chrono::milliseconds export_timeout) {
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
  reader_options.export_interval_millis = interval;
  if (export_timeout.count() > 0) {
    reader_options.export_timeout_millis = export_timeout;
  }
#ifdef ROADCAST_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  auto resource = BuildResource(config);
  g_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource);
  ConfigureResource(*g_provider, resource);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
}

} // namespace

bool InitializeMetrics(const OtlpConfig& config) {
  InstallProvider(config, std::chrono::milliseconds(1000), std::chrono::milliseconds(0));
  return true;
}

bool InitializeMetrics(const roadcast::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == roadcast::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  const auto& metric_config = observability.metrics();
  const auto  interval_ms   = metric_config.collection_interval_ms() > 0 ? metric_config.collection_interval_ms() : 1000;
  InstallProvider(otlp_config, std::chrono::milliseconds(interval_ms), std::chrono::milliseconds(metric_config.export_timeout_ms()));

  g_metrics_options.cache_metrics_enabled = metric_config.cache_metrics_enabled();
  g_metrics_options.route_labels_enabled  = metric_config.route_labels_enabled();
  return true;
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
  impl_->meter  = provider->GetMeter("roadcast", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("roadcast.request.count", "1", "Total number of service requests");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("roadcast.request.latency_ms", "ms", "End-to-end request latency in milliseconds");
  impl_->cache_lookups      = impl_->meter->CreateUInt64Counter("roadcast.cache.lookups", "1", "Cache lookups by tier and outcome");
  impl_->provider_calls     = impl_->meter->CreateUInt64Counter("roadcast.provider.calls", "1", "Upstream provider calls by provider and outcome");
  impl_->gate_roles         = impl_->meter->CreateUInt64Counter("roadcast.gate.acquisitions", "1", "Dedup gate outcomes by role");
  impl_->stale_serves       = impl_->meter->CreateUInt64Counter("roadcast.cache.stale_serves", "1", "Entries served past expiry on provider failure");
  impl_->injected_edges     = impl_->meter->CreateDoubleHistogram("roadcast.graph.injected_edges", "1", "Edges added per routing provider answer");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }

  if (g_metrics_options.route_labels_enabled) {
    const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
    AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }

  if (g_metrics_options.route_labels_enabled) {
    const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
    RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
    return;
  }

  RecordWithAttributes(impl_->request_latency_ms, latency_ms, std::initializer_list<AttributePair>{});
}

void Metrics::RecordCacheLookup(std::string_view tier, std::string_view outcome) {
  if (!impl_ || !impl_->cache_lookups || !g_metrics_options.cache_metrics_enabled) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"tier", std::string(tier)}, {"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->cache_lookups, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordProviderCall(std::string_view provider, bool success) {
  if (!impl_ || !impl_->provider_calls) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"provider", std::string(provider)}, {"success", success}};
  AddWithAttributes(impl_->provider_calls, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordGateRole(std::string_view role) {
  if (!impl_ || !impl_->gate_roles || !g_metrics_options.cache_metrics_enabled) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"role", std::string(role)}};
  AddWithAttributes(impl_->gate_roles, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordStaleServe(std::string_view kind) {
  if (!impl_ || !impl_->stale_serves) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"kind", std::string(kind)}};
  AddWithAttributes(impl_->stale_serves, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordGraphInjection(std::uint64_t edges) {
  if (!impl_ || !impl_->injected_edges) {
    return;
  }

  RecordWithAttributes(impl_->injected_edges, static_cast<double>(edges), std::initializer_list<AttributePair>{});
}

} // namespace roadcast::observability

#endif
