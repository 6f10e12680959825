#include "duration.hpp"

#include <cstdlib>
#include <string>

#include "internal/util/errors.hpp"

namespace sensorlink::util {

std::chrono::milliseconds ParseDuration(std::string_view text, std::chrono::milliseconds fallback) {
  if (text.empty()) {
    return fallback;
  }

  const std::string raw(text);
  char*             end   = nullptr;
  const double      value = std::strtod(raw.c_str(), &end);
  if (end == raw.c_str() || value < 0.0) {
    throw InvalidArgument("invalid duration '" + raw + "'");
  }

  const std::string unit(end);
  double            ms = 0.0;
  if (unit.empty() || unit == "s") {
    ms = value * 1000.0;
  } else if (unit == "ms") {
    ms = value;
  } else if (unit == "m") {
    ms = value * 60'000.0;
  } else if (unit == "h") {
    ms = value * 3'600'000.0;
  } else if (unit == "d") {
    ms = value * 86'400'000.0;
  } else {
    throw InvalidArgument("invalid duration unit in '" + raw + "'; use ms, s, m, h or d");
  }

  return std::chrono::milliseconds(static_cast<int64_t>(ms));
}

} // namespace sensorlink::util
