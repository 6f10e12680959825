#pragma once

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "sensorlink/pipeline/v1.hpp"
#include "snapshot_feed.hpp"

namespace sensorlink::snapshot {

/*
  Latest complete event per sensor, read-optimized.

  Entries are replaced whole. A snapshot only replaces the cached one when it
  comes from a later point in the sensor's sequence, so a late reassembly of an
  older event never hides a newer one.
*/
class SnapshotCache {
 public:
  explicit SnapshotCache(std::size_t subscriber_queue_depth = kDefaultSubscriberQueueDepth);

  std::optional<sensorlink::pipeline::v1::Snapshot> Get(const std::string& sensor_id) const;

  // true when the cache changed; feed subscribers see every change
  bool Publish(const sensorlink::pipeline::v1::Snapshot& snapshot);

  // ordered by sensor id
  std::vector<sensorlink::pipeline::v1::Snapshot> List() const;

  void Remove(const std::string& sensor_id);

  std::size_t Size() const;

  // first message is a snapshot_batch of the whole cache
  std::shared_ptr<Subscription> Subscribe();

  SnapshotFeed& Feed() {
    return feed_;
  }

 private:
  std::vector<sensorlink::pipeline::v1::Snapshot> ListLocked() const;

  mutable std::shared_mutex                                           mutex_;
  std::unordered_map<std::string, sensorlink::pipeline::v1::Snapshot> cache_;
  SnapshotFeed                                                        feed_;
};

} // namespace sensorlink::snapshot
