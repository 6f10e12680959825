#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace sensorlink::service {

/*
  Wraps one service operation with a span, request count/latency metrics and
  an error log. Exceptions are rethrown for the transport adapter to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view sensor_id, Fn&& fn) {
  sensorlink::observability::SpanScope span(route);
  if (!sensor_id.empty()) {
    span.SetAttribute("sensor.id", sensor_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  const auto observe    = [&](bool success) {
    sensorlink::observability::Metrics::Instance().RecordRequest(route, success);
    sensorlink::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      observe(true);
      return;
    } else {
      auto result = fn();
      observe(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    SENSORLINK_LOG_ERROR("RPC failed", {sensorlink::observability::StringField("route", route), sensorlink::observability::StringField("error", ex.what()),
                                        sensorlink::observability::StringField("sensor_id", sensor_id)});
    observe(false);
    throw;
  }
}

} // namespace sensorlink::service
