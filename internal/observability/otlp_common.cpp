#include "internal/observability/otlp_common.hpp"

#ifdef ENABLE_OTEL

#include <cstdlib>

#include "config/config.pb.h"

namespace sensorlink::observability {

namespace resource = opentelemetry::sdk::resource;

std::string ResolveOtlpEndpoint(const OtlpConfig& config, OtlpSignal signal) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  const char* specific = signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
  if (const char* endpoint = std::getenv(specific)) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  if (config.transport == OtlpTransport::kHttpProtobuf) {
    return signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
  }
  return "localhost:4317";
}

resource::Resource BuildOtlpResource(const OtlpConfig& config) {
  resource::ResourceAttributes attrs = {{"service.name", config.service_name}, {"service.namespace", std::string("sensorlink")}};
  if (!config.instance_id.empty()) {
    attrs.SetAttribute("service.instance.id", config.instance_id);
  }
  return resource::Resource::Create(attrs);
}

OtlpConfig ToOtlpConfig(const sensorlink::runtime::config::ObservabilityConfig& config, std::string_view service_name, std::string_view instance_id) {
  OtlpConfig otlp;
  otlp.service_name = std::string(service_name);
  otlp.instance_id  = std::string(instance_id);
  otlp.endpoint     = config.otlp_endpoint();
  otlp.transport    = config.transport() == sensorlink::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (config.trace_sample_ratio() > 0.0 && config.trace_sample_ratio() < 1.0) {
    otlp.sample_ratio = config.trace_sample_ratio();
  }
  return otlp;
}

} // namespace sensorlink::observability

#endif
