#include "backoff.hpp"

#include <algorithm>

namespace sensorlink::util {

Backoff::Backoff(BackoffPolicy policy)
    : policy_(policy), current_ms_(static_cast<double>(policy.base.count())), rng_(std::random_device{}()) {
  if (policy_.factor < 1.0) policy_.factor = 1.0;
  if (policy_.jitter < 0.0) policy_.jitter = 0.0;
  if (policy_.max < policy_.base) policy_.max = policy_.base;
}

std::chrono::milliseconds Backoff::Next() {
  const double capped = std::min(current_ms_, static_cast<double>(policy_.max.count()));

  double delay = capped;
  if (policy_.jitter > 0.0) {
    std::uniform_real_distribution<double> dist(-policy_.jitter, policy_.jitter);
    delay = capped * (1.0 + dist(rng_));
  }

  current_ms_ = std::min(current_ms_ * policy_.factor, static_cast<double>(policy_.max.count()));
  ++attempts_;

  return std::chrono::milliseconds(static_cast<int64_t>(std::max(0.0, delay)));
}

void Backoff::Reset() {
  current_ms_ = static_cast<double>(policy_.base.count());
  attempts_   = 0;
}

} // namespace sensorlink::util
