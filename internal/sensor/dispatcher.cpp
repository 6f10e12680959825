#include "dispatcher.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace sensorlink::sensor {

using namespace sensorlink::pipeline::v1;
using sensorlink::observability::IntField;
using sensorlink::observability::StringField;
using sensorlink::observability::UintField;

const char* ToString(DispatcherState state) {
  switch (state) {
    case DispatcherState::Idle:
      return "idle";
    case DispatcherState::AwaitingRequest:
      return "awaiting_request";
    case DispatcherState::Sending:
      return "sending";
    case DispatcherState::AwaitingAck:
      return "awaiting_ack";
  }
  return "unknown";
}

const char* ToString(WindowOutcome outcome) {
  switch (outcome) {
    case WindowOutcome::Empty:
      return "empty";
    case WindowOutcome::Completed:
      return "completed";
    case WindowOutcome::AwaitingAck:
      return "awaiting_ack";
    case WindowOutcome::Abandoned:
      return "abandoned";
  }
  return "unknown";
}

Dispatcher::Dispatcher(std::string sensor_id, std::shared_ptr<DurableQueue> queue, std::shared_ptr<DataChannel> channel, DispatcherOptions options)
    : sensor_id_(std::move(sensor_id)), queue_(std::move(queue)), channel_(std::move(channel)), options_(std::move(options)) {
  if (!queue_ || !channel_) {
    throw std::invalid_argument("Dispatcher requires a queue and a data channel");
  }
  if (options_.max_attempts == 0) {
    options_.max_attempts = 1;
  }
}

Dispatcher::~Dispatcher() {
  Stop();
}

void Dispatcher::Start() {
  std::lock_guard lock(mutex_);
  if (worker_.joinable()) {
    return;
  }
  stopping_ = false;
  worker_   = std::thread([this] { Run(); });
}

void Dispatcher::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (worker_.joinable()) {
    worker_.join();
  }
}

void Dispatcher::Run() {
  while (true) {
    ChunkRequest request;
    {
      std::unique_lock lock(mutex_);
      cv_.wait(lock, [this] { return stopping_.load() || !pending_.empty(); });
      if (stopping_) {
        return;
      }
      request = std::move(pending_.front());
      pending_.pop_front();
    }

    try {
      const auto outcome = ProcessRequest(request);
      SENSORLINK_LOG_DEBUG("Window finished", {StringField("window_id", request.window_id()), StringField("outcome", ToString(outcome))});
    } catch (const std::exception& e) {
      SENSORLINK_LOG_ERROR("Window failed", {StringField("window_id", request.window_id()), StringField("error", e.what())});
    }
  }
}

void Dispatcher::HandleChunkRequest(const ChunkRequest& request) {
  {
    std::lock_guard lock(mutex_);
    pending_.clear();
    pending_.push_back(request);
    if (state_ == DispatcherState::Idle) {
      state_ = DispatcherState::AwaitingRequest;
    }
  }
  cv_.notify_all();
}

void Dispatcher::HandleChunkAck(const ChunkAck& ack) {
  if (ack.committed_upto_sequence() > 0) {
    queue_->AckUpto(ack.committed_upto_sequence());
  }

  std::lock_guard lock(mutex_);
  if (state_ == DispatcherState::AwaitingAck && ack.committed_upto_sequence() >= awaiting_upto_) {
    awaiting_window_.clear();
    awaiting_upto_ = 0;
    state_         = pending_.empty() ? DispatcherState::Idle : DispatcherState::AwaitingRequest;
  }
}

bool Dispatcher::Probe() {
  {
    std::lock_guard lock(mutex_);
    ExpireWindowLocked(util::Now());
    if (state_ != DispatcherState::Idle || !pending_.empty()) {
      return false;
    }
  }

  if (queue_->QueueDepth() == 0) {
    return false;
  }

  ChunkRequest request;
  request.set_since_sequence(queue_->LastAckedSequence());
  request.set_max_chunks(options_.max_chunks);
  request.set_max_bytes(options_.max_bytes);
  request.set_max_in_flight(options_.max_in_flight);
  {
    std::lock_guard lock(mutex_);
    request.set_window_id(sensor_id_ + "-probe-" + std::to_string(++probe_counter_));
  }

  HandleChunkRequest(request);
  return true;
}

void Dispatcher::CancelPending() {
  std::lock_guard lock(mutex_);
  pending_.clear();
  awaiting_window_.clear();
  awaiting_upto_ = 0;
  if (state_ != DispatcherState::Sending) {
    state_ = DispatcherState::Idle;
  }
}

DispatcherState Dispatcher::State() const {
  std::lock_guard lock(mutex_);
  return state_;
}

void Dispatcher::ExpireWindowLocked(util::TimePoint now) {
  if (state_ != DispatcherState::AwaitingAck || now < awaiting_deadline_) {
    return;
  }

  SENSORLINK_LOG_WARN("Window abandoned without acknowledgement", {StringField("sensor_id", sensor_id_), StringField("window_id", awaiting_window_),
                                                                    UintField("last_sequence", awaiting_upto_)});
  observability::Metrics::Instance().RecordAbandonedWindow(sensor_id_);
  awaiting_window_.clear();
  awaiting_upto_ = 0;
  state_         = pending_.empty() ? DispatcherState::Idle : DispatcherState::AwaitingRequest;
}

bool Dispatcher::WaitForRetry(std::chrono::milliseconds delay) {
  std::unique_lock lock(mutex_);
  cv_.wait_for(lock, delay, [this] { return stopping_.load(); });
  return !stopping_;
}

void Dispatcher::Abandon(const std::string& window_id, const std::string& reason) {
  SENSORLINK_LOG_WARN("Window abandoned", {StringField("sensor_id", sensor_id_), StringField("window_id", window_id), StringField("reason", reason)});
  observability::Metrics::Instance().RecordAbandonedWindow(sensor_id_);

  std::lock_guard lock(mutex_);
  state_ = pending_.empty() ? DispatcherState::Idle : DispatcherState::AwaitingRequest;
}

WindowOutcome Dispatcher::ProcessRequest(const ChunkRequest& request) {
  observability::SpanScope span("sensorlink.dispatcher.window");
  span.SetAttribute("window_id", request.window_id());

  {
    std::lock_guard lock(mutex_);
    // a new request supersedes whatever window was still waiting for its ack
    awaiting_window_.clear();
    awaiting_upto_ = 0;
    state_         = DispatcherState::Sending;
  }

  try {
    const uint32_t max_in_flight = request.max_in_flight() ? request.max_in_flight() : options_.max_in_flight;
    const uint32_t max_chunks    = std::min(request.max_chunks() ? request.max_chunks() : options_.max_chunks, max_in_flight);
    const uint64_t max_bytes     = request.max_bytes() ? request.max_bytes() : options_.max_bytes;

    auto chunks = queue_->PeekRange(request.since_sequence(), max_chunks, max_bytes);
    if (chunks.empty()) {
      std::lock_guard lock(mutex_);
      state_ = pending_.empty() ? DispatcherState::Idle : DispatcherState::AwaitingRequest;
      return WindowOutcome::Empty;
    }

    IngestBatchRequest batch;
    batch.set_sensor_id(sensor_id_);
    batch.set_window_id(request.window_id());

    std::vector<uint64_t> sequences;
    sequences.reserve(chunks.size());
    for (auto& chunk : chunks) {
      sequences.push_back(chunk.sequence());
      *batch.add_chunks() = std::move(chunk);
    }
    const uint64_t last_sequence = sequences.back();

    util::Backoff       backoff(options_.backoff);
    IngestBatchResponse response;
    bool                sent = false;

    for (uint32_t attempt = 1; attempt <= options_.max_attempts; ++attempt) {
      queue_->RecordAttempt(sequences);
      try {
        response = channel_->Send(batch, options_.send_timeout);
        sent     = true;
        break;
      } catch (const util::TransportError& e) {
        SENSORLINK_LOG_WARN("Batch send failed", {StringField("window_id", request.window_id()), IntField("attempt", attempt),
                                                  StringField("error", e.what())});
        if (attempt == options_.max_attempts || !WaitForRetry(backoff.Next())) {
          break;
        }
      } catch (const util::UnauthorizedSensor& e) {
        Abandon(request.window_id(), std::string("credential refused: ") + e.what());
        return WindowOutcome::Abandoned;
      } catch (const util::InvalidArgument& e) {
        Abandon(request.window_id(), std::string("batch rejected: ") + e.what());
        return WindowOutcome::Abandoned;
      }
    }

    if (!sent) {
      Abandon(request.window_id(), "retries exhausted");
      return WindowOutcome::Abandoned;
    }

    for (const auto& error : response.errors()) {
      SENSORLINK_LOG_WARN("Chunk refused by collector", {StringField("window_id", request.window_id()), UintField("sequence", error.sequence()),
                                                         StringField("reason", error.reason())});
    }

    const uint64_t committed = response.committed_sequence();
    if (committed > 0) {
      queue_->AckUpto(committed);
      if (options_.on_committed) {
        ChunkAck ack;
        ack.set_window_id(request.window_id());
        ack.set_committed_upto_sequence(committed);
        options_.on_committed(ack);
      }
    }

    // Every chunk of the window is stored but its last event is still open:
    // keep streaming that event from what the collector already holds
    // instead of resending from the committed point.
    const uint64_t received       = response.received_sequence();
    const bool     continue_event = committed < last_sequence && received >= last_sequence && queue_->LastSequence() > received;

    std::lock_guard lock(mutex_);
    if (committed >= last_sequence) {
      state_ = pending_.empty() ? DispatcherState::Idle : DispatcherState::AwaitingRequest;
      return WindowOutcome::Completed;
    }

    awaiting_window_   = request.window_id();
    awaiting_upto_     = last_sequence;
    awaiting_deadline_ = util::Now() + options_.window_timeout;
    state_             = DispatcherState::AwaitingAck;
    if (continue_event && pending_.empty()) {
      ChunkRequest next = request;
      next.set_since_sequence(received);
      next.set_window_id(request.window_id() + "+" + std::to_string(received));
      pending_.push_back(std::move(next));
      cv_.notify_all();
    }
    return WindowOutcome::AwaitingAck;
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    std::lock_guard lock(mutex_);
    state_ = DispatcherState::Idle;
    throw;
  }
}

} // namespace sensorlink::sensor
