#include "time.hpp"

namespace sensorlink::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  return ms < 0 ? 0 : static_cast<uint64_t>(ms);
}

uint64_t NowMillis() {
  return ToUnixMillis(Now());
}

} // namespace sensorlink::util
