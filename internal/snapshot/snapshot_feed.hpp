#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "sensorlink/pipeline/v1.hpp"

namespace sensorlink::snapshot {

inline constexpr std::size_t kDefaultSubscriberQueueDepth = 256;

/*
  Bounded queue of feed messages for one subscriber.

  When full, the oldest pending message is dropped so a slow reader never
  blocks publishers.
*/
class Subscription {
 public:
  explicit Subscription(std::size_t max_depth);

  void Push(const sensorlink::pipeline::v1::SnapshotFeedMessage& message);

  // blocking wait, nullopt on timeout or once closed and drained
  std::optional<sensorlink::pipeline::v1::SnapshotFeedMessage> Next(std::chrono::milliseconds timeout);

  void Close();
  bool Closed() const;

  uint64_t Dropped() const;

 private:
  const std::size_t                                       max_depth_;
  mutable std::mutex                                      mutex_;
  std::condition_variable                                 cv_;
  std::deque<sensorlink::pipeline::v1::SnapshotFeedMessage> queue_;
  uint64_t                                                dropped_ = 0;
  bool                                                    closed_  = false;
};

/*
  Fan-out of snapshot updates to all live subscriptions.
*/
class SnapshotFeed {
 public:
  explicit SnapshotFeed(std::size_t subscriber_queue_depth = kDefaultSubscriberQueueDepth);

  // initial is delivered before any later broadcast
  std::shared_ptr<Subscription> Subscribe(const sensorlink::pipeline::v1::SnapshotFeedMessage& initial);

  void Broadcast(const sensorlink::pipeline::v1::SnapshotFeedMessage& message);

  // closes every subscription
  void CloseAll();

  std::size_t SubscriberCount() const;

 private:
  const std::size_t                       subscriber_queue_depth_;
  mutable std::mutex                      mutex_;
  std::vector<std::weak_ptr<Subscription>> subscribers_;
};

} // namespace sensorlink::snapshot
