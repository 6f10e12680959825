#pragma once

#include <chrono>
#include <string_view>

namespace sensorlink::util {

/*
  Parses "250ms", "30s", "5m", "72h" or a bare number of seconds.
  Empty input yields fallback. Malformed input throws util::InvalidArgument.
*/
std::chrono::milliseconds ParseDuration(std::string_view text, std::chrono::milliseconds fallback);

} // namespace sensorlink::util
