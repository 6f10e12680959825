#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "data_channel.hpp"
#include "durable_queue.hpp"
#include "internal/util/backoff.hpp"
#include "internal/util/time.hpp"
#include "sensorlink/pipeline/v1.hpp"

namespace sensorlink::sensor {

struct DispatcherOptions {
  // Defaults for probe windows and for requests that leave a limit at zero.
  uint32_t max_chunks    = 32;
  uint64_t max_bytes     = 2 * 1024 * 1024;
  uint32_t max_in_flight = 32;

  uint32_t            max_attempts = 5;
  util::BackoffPolicy backoff{std::chrono::milliseconds{500}, std::chrono::milliseconds{30'000}, 2.0, 0.2};

  std::chrono::milliseconds window_timeout{30'000};
  std::chrono::milliseconds send_timeout{10'000};

  // Called with the collector's committed point after each successful send.
  std::function<void(const sensorlink::pipeline::v1::ChunkAck&)> on_committed;
};

enum class DispatcherState { Idle, AwaitingRequest, Sending, AwaitingAck };

const char* ToString(DispatcherState state);

enum class WindowOutcome {
  Empty,        // nothing above since_sequence
  Completed,    // every chunk of the window committed
  AwaitingAck,  // sent, committed point still below the window
  Abandoned,    // retries exhausted or batch refused
};

const char* ToString(WindowOutcome outcome);

/*
  Sends chunk windows from the DurableQueue to the collector.

  Windows are driven by ChunkRequests from the control channel or by
  Probe(). Nothing is removed from the queue until the collector reports
  it committed, so an abandoned window is simply sent again later.
*/
class Dispatcher {
 public:
  Dispatcher(std::string sensor_id, std::shared_ptr<DurableQueue> queue, std::shared_ptr<DataChannel> channel, DispatcherOptions options = {});
  ~Dispatcher();

  Dispatcher(const Dispatcher&)            = delete;
  Dispatcher& operator=(const Dispatcher&) = delete;

  void Start();
  void Stop();

  // Queues a window for the worker. A newer request replaces one not yet started.
  void HandleChunkRequest(const sensorlink::pipeline::v1::ChunkRequest& request);

  void HandleChunkAck(const sensorlink::pipeline::v1::ChunkAck& ack);

  // Self-initiated window from the last acked sequence when idle with a non-empty queue.
  bool Probe();

  // Runs one window on the calling thread.
  WindowOutcome ProcessRequest(const sensorlink::pipeline::v1::ChunkRequest& request);

  // Drops queued requests and releases the window awaiting an ack.
  void CancelPending();

  DispatcherState State() const;

  const DispatcherOptions& Options() const {
    return options_;
  }

 private:
  void Run();
  void ExpireWindowLocked(util::TimePoint now);
  bool WaitForRetry(std::chrono::milliseconds delay);
  void Abandon(const std::string& window_id, const std::string& reason);

  std::string                   sensor_id_;
  std::shared_ptr<DurableQueue> queue_;
  std::shared_ptr<DataChannel>  channel_;
  DispatcherOptions             options_;

  mutable std::mutex                                  mutex_;
  std::condition_variable                             cv_;
  std::deque<sensorlink::pipeline::v1::ChunkRequest> pending_;
  DispatcherState                                     state_ = DispatcherState::Idle;

  // window awaiting its ack
  std::string     awaiting_window_;
  uint64_t        awaiting_upto_ = 0;
  util::TimePoint awaiting_deadline_{};

  uint64_t          probe_counter_ = 0;
  std::atomic<bool> stopping_{false};
  std::thread       worker_;
};

} // namespace sensorlink::sensor
