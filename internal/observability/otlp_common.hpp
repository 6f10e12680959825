#pragma once

#ifdef ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <string>
#include <string_view>

#include "internal/observability/spans.hpp"

namespace sensorlink::observability {

enum class OtlpSignal { kTraces, kMetrics };

// Explicit endpoint, then the per-signal OTEL_* variable, then the generic one.
std::string ResolveOtlpEndpoint(const OtlpConfig& config, OtlpSignal signal);

opentelemetry::sdk::resource::Resource BuildOtlpResource(const OtlpConfig& config);

OtlpConfig ToOtlpConfig(const sensorlink::runtime::config::ObservabilityConfig& config, std::string_view service_name, std::string_view instance_id);

} // namespace sensorlink::observability

#endif
