#pragma once

#include <chrono>
#include <cstdint>
#include <random>

namespace sensorlink::util {

struct BackoffPolicy {
  std::chrono::milliseconds base{500};
  std::chrono::milliseconds max{30'000};
  double                    factor{2.0};
  // Fraction of the delay added or removed at random, 0.1 means +/-10%.
  double jitter{0.1};
};

/*
  Exponential backoff with jitter.

  Next() returns base, base*factor, base*factor^2 ... capped at max, each
  perturbed by the jitter fraction. Reset() restarts from base.
*/
class Backoff {
 public:
  explicit Backoff(BackoffPolicy policy = {});

  std::chrono::milliseconds Next();
  void                      Reset();

  uint32_t Attempts() const {
    return attempts_;
  }

  const BackoffPolicy& Policy() const {
    return policy_;
  }

 private:
  BackoffPolicy   policy_;
  double          current_ms_;
  uint32_t        attempts_ = 0;
  std::mt19937_64 rng_;
};

} // namespace sensorlink::util
