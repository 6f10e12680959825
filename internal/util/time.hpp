#pragma once

#include <chrono>
#include <cstdint>

namespace sensorlink::util {

// Wall clock. Persisted timestamps (enqueued_at_ms, received_at_ms,
// updated_at_ms) are unix milliseconds taken from here.
using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);
uint64_t NowMillis();

} // namespace sensorlink::util
