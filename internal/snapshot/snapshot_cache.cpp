#include "snapshot_cache.hpp"

#include <algorithm>
#include <mutex>

namespace sensorlink::snapshot {

using namespace sensorlink::pipeline::v1;

SnapshotCache::SnapshotCache(std::size_t subscriber_queue_depth) : feed_(subscriber_queue_depth) {
}

// ------------------------------------------------------------
// Get
// ------------------------------------------------------------

std::optional<Snapshot> SnapshotCache::Get(const std::string& sensor_id) const {
    std::shared_lock lock(mutex_);

    auto it = cache_.find(sensor_id);
    if (it == cache_.end())
        return std::nullopt;

    return it->second;
}

// ------------------------------------------------------------
// Publish
// ------------------------------------------------------------

bool SnapshotCache::Publish(const Snapshot& snapshot) {
    std::unique_lock lock(mutex_);

    auto it = cache_.find(snapshot.sensor_id());
    if (it != cache_.end() && it->second.last_sequence() >= snapshot.last_sequence())
        return false;

    cache_[snapshot.sensor_id()] = snapshot;

    SnapshotFeedMessage message;
    message.set_type("snapshot");
    *message.mutable_snapshot() = snapshot;

    // under the lock so subscribers see updates in publish order
    feed_.Broadcast(message);
    return true;
}

// ------------------------------------------------------------
// List / Remove
// ------------------------------------------------------------

std::vector<Snapshot> SnapshotCache::ListLocked() const {
    std::vector<Snapshot> out;
    out.reserve(cache_.size());
    for (const auto& [_, snapshot] : cache_)
        out.push_back(snapshot);

    std::sort(out.begin(), out.end(), [](const Snapshot& a, const Snapshot& b) { return a.sensor_id() < b.sensor_id(); });
    return out;
}

std::vector<Snapshot> SnapshotCache::List() const {
    std::shared_lock lock(mutex_);
    return ListLocked();
}

void SnapshotCache::Remove(const std::string& sensor_id) {
    std::unique_lock lock(mutex_);
    cache_.erase(sensor_id);
}

std::size_t SnapshotCache::Size() const {
    std::shared_lock lock(mutex_);
    return cache_.size();
}

// ------------------------------------------------------------
// Subscribe
// ------------------------------------------------------------

std::shared_ptr<Subscription> SnapshotCache::Subscribe() {
    // exclusive so no publish lands between the batch and registration
    std::unique_lock lock(mutex_);

    SnapshotFeedMessage batch;
    batch.set_type("snapshot_batch");
    for (auto& snapshot : ListLocked())
        *batch.add_snapshots() = std::move(snapshot);

    return feed_.Subscribe(batch);
}

} // namespace sensorlink::snapshot
