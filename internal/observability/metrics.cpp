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
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define SENSORLINK_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define SENSORLINK_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif

#include "config/config.pb.h"
#include "internal/observability/otlp_common.hpp"

namespace sensorlink::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

template <typename Provider>
void ConfigureResource(Provider& provider, const opentelemetry::sdk::resource::Resource& res) {
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

bool InstallProvider(const OtlpConfig& config, std::chrono::milliseconds interval, std::chrono::milliseconds export_timeout) {
  auto endpoint = ResolveOtlpEndpoint(config, OtlpSignal::kMetrics);

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
#ifdef SENSORLINK_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  auto resource = BuildOtlpResource(config);
  g_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource);
  ConfigureResource(*g_provider, resource);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> chunk_outcomes;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> integrity_errors;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> missed_heartbeats;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> abandoned_windows;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   queue_depth_gauge;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   live_sessions_gauge;

  std::mutex                                    queue_depth_mutex;
  std::unordered_map<std::string, std::int64_t> queue_depth_values;
  std::atomic<std::int64_t>                     live_sessions{0};
};

bool InitializeMetrics(const OtlpConfig& config) {
  return InstallProvider(config, std::chrono::milliseconds(1000), std::chrono::milliseconds(0));
}

bool InitializeMetrics(const sensorlink::runtime::config::ObservabilityConfig& config, std::string_view service_name, std::string_view instance_id) {
  if (!config.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto interval_ms = config.collection_interval_ms() > 0 ? config.collection_interval_ms() : 1000;
  return InstallProvider(ToOtlpConfig(config, service_name, instance_id), std::chrono::milliseconds(interval_ms),
                         std::chrono::milliseconds(config.export_timeout_ms()));
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
  impl_->meter  = provider->GetMeter("sensorlink", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("sensorlink.request.count", "1", "Total number of RPC requests");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("sensorlink.request.latency_ms", "ms", "End-to-end request latency in milliseconds");
  impl_->chunk_outcomes     = impl_->meter->CreateUInt64Counter("sensorlink.chunk.outcomes", "1", "Chunk write outcomes by kind");
  impl_->integrity_errors   = impl_->meter->CreateUInt64Counter("sensorlink.chunk.integrity_errors", "1", "Chunks or events rejected on hash mismatch");
  impl_->missed_heartbeats  = impl_->meter->CreateUInt64Counter("sensorlink.sensor.missed_heartbeats", "1", "Sessions closed for missing heartbeats");
  impl_->abandoned_windows  = impl_->meter->CreateUInt64Counter("sensorlink.window.abandoned", "1", "Windows abandoned after retries or timeout");

  impl_->queue_depth_gauge = impl_->meter->CreateInt64ObservableGauge("sensorlink.queue.depth", "Un-acked chunks reported per sensor", "1");
  impl_->queue_depth_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto*                       impl = static_cast<Impl*>(state);
        std::lock_guard<std::mutex> lock(impl->queue_depth_mutex);
        auto int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        for (const auto& [sensor, depth] : impl->queue_depth_values) {
          const std::initializer_list<AttributePair> attributes = {{"sensor", sensor}};
          int_result->Observe(depth, attributes);
        }
      },
      impl_.get());

  impl_->live_sessions_gauge = impl_->meter->CreateInt64ObservableGauge("sensorlink.sessions.live", "Live control sessions", "1");
  impl_->live_sessions_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->live_sessions.load());
      },
      impl_.get());
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
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::RecordChunkOutcome(std::string_view outcome, std::uint64_t count) {
  if (!impl_ || !impl_->chunk_outcomes || count == 0) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->chunk_outcomes, count, attributes);
}

void Metrics::RecordIntegrityError(std::string_view sensor_id) {
  if (!impl_ || !impl_->integrity_errors) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"sensor", std::string(sensor_id)}};
  AddWithAttributes(impl_->integrity_errors, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::SetQueueDepth(std::string_view sensor_id, std::uint64_t depth) {
  if (!impl_ || !impl_->queue_depth_gauge) {
    return;
  }

  std::lock_guard<std::mutex> lock(impl_->queue_depth_mutex);
  impl_->queue_depth_values[std::string(sensor_id)] = static_cast<std::int64_t>(depth);
}

void Metrics::RecordMissedHeartbeat(std::string_view sensor_id) {
  if (!impl_ || !impl_->missed_heartbeats) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"sensor", std::string(sensor_id)}};
  AddWithAttributes(impl_->missed_heartbeats, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordAbandonedWindow(std::string_view sensor_id) {
  if (!impl_ || !impl_->abandoned_windows) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"sensor", std::string(sensor_id)}};
  AddWithAttributes(impl_->abandoned_windows, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::SetLiveSessions(std::uint64_t sessions) {
  if (!impl_) {
    return;
  }
  impl_->live_sessions.store(static_cast<std::int64_t>(sessions));
}

} // namespace sensorlink::observability

#endif
