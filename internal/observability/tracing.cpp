#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <cstdlib>
#include <mutex>
#include <utility>

#include "config/config.pb.h"

namespace roadcast::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {

constexpr const char* kTracerName = "roadcast";

std::mutex                                          g_tracer_mutex;
std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) return config.endpoint;

  for (const char* name : {"OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* endpoint = std::getenv(name)) return endpoint;
  }
  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/traces" : "localhost:4317";
}

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveEndpoint(config);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

// Falls back to whatever global provider is installed (a no-op one by
// default), so spans opened before InitializeTracing are harmless.
opentelemetry::nostd::shared_ptr<trace_api::Tracer> Tracer() {
  std::lock_guard lock(g_tracer_mutex);
  if (!g_tracer) {
    if (auto provider = trace_api::Provider::GetTracerProvider()) {
      g_tracer = provider->GetTracer(kTracerName, "0.1.0");
    }
  }
  return g_tracer;
}

} // namespace

bool InitializeTracing(const OtlpConfig& config) {
  resource::ResourceAttributes attrs = {{"service.name", config.service_name}, {"service.version", config.service_version}};
  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(config), sdktrace::BatchSpanProcessorOptions{});
  auto provider  = sdktrace::TracerProviderFactory::Create(std::move(processor), resource::Resource::Create(attrs));

  std::lock_guard lock(g_tracer_mutex);
  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kTracerName, config.service_version);
  return static_cast<bool>(g_tracer);
}

bool InitializeTracing(const roadcast::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint  = observability.otlp_endpoint();
  otlp_config.transport = observability.transport() == roadcast::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf
                                                                                                      : OtlpTransport::kGrpc;
  return InitializeTracing(otlp_config);
}

void ShutdownTracing() {
  std::lock_guard lock(g_tracer_mutex);
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;

  template <typename F>
  void With(F&& f) {
    if (span) f(*span);
  }
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  auto tracer = Tracer();
  if (!tracer) return;

  impl_->span  = tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_) impl_->With([](trace_api::Span& span) { span.End(); });
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_) impl_->With([&](trace_api::Span& span) { span.SetAttribute(std::string(key), std::string(value)); });
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_) impl_->With([&](trace_api::Span& span) { span.SetAttribute(std::string(key), value); });
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  if (impl_) impl_->With([&](trace_api::Span& span) { span.SetAttribute(std::string(key), value); });
}

void SpanScope::SetAttribute(std::string_view key, bool value) {
  if (impl_) impl_->With([&](trace_api::Span& span) { span.SetAttribute(std::string(key), value); });
}

void SpanScope::SetCoordinate(std::string_view prefix, double lat, double lon) {
  const std::string base(prefix);
  SetAttribute(base + ".lat", lat);
  SetAttribute(base + ".lon", lon);
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_) impl_->With([&](trace_api::Span& span) { span.AddEvent(std::string(name)); });
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_) return;
  impl_->With([&](trace_api::Span& span) {
    span.AddEvent("exception", {{"exception.message", std::string(description)}});
    span.SetStatus(trace_api::StatusCode::kError, std::string(description));
  });
}

} // namespace roadcast::observability

#endif
