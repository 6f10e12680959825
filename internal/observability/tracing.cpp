#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/samplers/parent_factory.h>
#include <opentelemetry/sdk/trace/samplers/trace_id_ratio_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <mutex>
#include <utility>

#include "internal/observability/otlp_common.hpp"

namespace sensorlink::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

namespace {
constexpr char kTracerName[]    = "sensorlink";
constexpr char kTracerVersion[] = "0.1.0";

std::mutex                                          g_tracer_mutex;
std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::unique_ptr<sdktrace::SpanExporter> BuildExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveOtlpEndpoint(config, OtlpSignal::kTraces);
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

// Sensors open a span per submitted event; a ratio below 1 thins root spans
// while children follow their parent's decision.
std::unique_ptr<sdktrace::Sampler> BuildSampler(const OtlpConfig& config) {
  if (config.sample_ratio >= 1.0) {
    return nullptr;
  }
  std::shared_ptr<sdktrace::Sampler> root = sdktrace::TraceIdRatioBasedSamplerFactory::Create(config.sample_ratio);
  return sdktrace::ParentBasedSamplerFactory::Create(root);
}

opentelemetry::nostd::shared_ptr<trace_api::Tracer> CurrentTracer() {
  std::lock_guard lock(g_tracer_mutex);
  if (!g_tracer) {
    auto provider = trace_api::Provider::GetTracerProvider();
    if (provider) {
      g_tracer = provider->GetTracer(kTracerName, kTracerVersion);
    }
  }
  return g_tracer;
}

} // namespace

bool InitializeTracing(const OtlpConfig& config) {
  auto processor = sdktrace::BatchSpanProcessorFactory::Create(BuildExporter(config), sdktrace::BatchSpanProcessorOptions{});

  std::unique_ptr<sdktrace::TracerProvider> provider;
  if (auto sampler = BuildSampler(config)) {
    provider = sdktrace::TracerProviderFactory::Create(std::move(processor), BuildOtlpResource(config), std::move(sampler));
  } else {
    provider = sdktrace::TracerProviderFactory::Create(std::move(processor), BuildOtlpResource(config));
  }

  std::lock_guard lock(g_tracer_mutex);
  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kTracerName, kTracerVersion);
  return static_cast<bool>(g_tracer);
}

bool InitializeTracing(const sensorlink::runtime::config::ObservabilityConfig& config, std::string_view service_name, std::string_view instance_id) {
  if (!config.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }
  return InitializeTracing(ToOtlpConfig(config, service_name, instance_id));
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
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  auto tracer = CurrentTracer();
  if (!tracer) {
    return;
  }

  impl_->span  = tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->span) {
    impl_->span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_ && impl_->span) {
    impl_->span->AddEvent(std::string(name));
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (impl_ && impl_->span) {
    impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
  }
}

} // namespace sensorlink::observability

#endif
