#include "snapshot_feed.hpp"

#include <algorithm>

namespace sensorlink::snapshot {

using sensorlink::pipeline::v1::SnapshotFeedMessage;

Subscription::Subscription(std::size_t max_depth) : max_depth_(std::max<std::size_t>(max_depth, 1)) {
}

void Subscription::Push(const SnapshotFeedMessage& message) {
  {
    std::lock_guard lock(mutex_);
    if (closed_) return;
    while (queue_.size() >= max_depth_) {
      queue_.pop_front();
      ++dropped_;
    }
    queue_.push_back(message);
  }
  cv_.notify_one();
}

std::optional<SnapshotFeedMessage> Subscription::Next(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);

  cv_.wait_for(lock, timeout, [&] { return closed_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  SnapshotFeedMessage message = std::move(queue_.front());
  queue_.pop_front();
  return message;
}

void Subscription::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool Subscription::Closed() const {
  std::lock_guard lock(mutex_);
  return closed_;
}

uint64_t Subscription::Dropped() const {
  std::lock_guard lock(mutex_);
  return dropped_;
}

// ------------------------------------------------------------
// Feed
// ------------------------------------------------------------

SnapshotFeed::SnapshotFeed(std::size_t subscriber_queue_depth) : subscriber_queue_depth_(subscriber_queue_depth) {
}

std::shared_ptr<Subscription> SnapshotFeed::Subscribe(const SnapshotFeedMessage& initial) {
  auto subscription = std::make_shared<Subscription>(subscriber_queue_depth_);
  subscription->Push(initial);

  std::lock_guard lock(mutex_);
  subscribers_.push_back(subscription);
  return subscription;
}

void SnapshotFeed::Broadcast(const SnapshotFeedMessage& message) {
  std::lock_guard lock(mutex_);

  auto it = subscribers_.begin();
  while (it != subscribers_.end()) {
    auto subscription = it->lock();
    if (!subscription || subscription->Closed()) {
      it = subscribers_.erase(it);
      continue;
    }
    subscription->Push(message);
    ++it;
  }
}

void SnapshotFeed::CloseAll() {
  std::lock_guard lock(mutex_);
  for (auto& weak : subscribers_) {
    if (auto subscription = weak.lock()) subscription->Close();
  }
  subscribers_.clear();
}

std::size_t SnapshotFeed::SubscriberCount() const {
  std::lock_guard lock(mutex_);
  return static_cast<std::size_t>(std::count_if(subscribers_.begin(), subscribers_.end(), [](const auto& weak) {
    auto subscription = weak.lock();
    return subscription && !subscription->Closed();
  }));
}

} // namespace sensorlink::snapshot
