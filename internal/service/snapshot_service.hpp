#pragma once

#include <memory>
#include <string>

#include "sensorlink/pipeline/v1.hpp"
#include "service_context.hpp"

namespace sensorlink::snapshot {
class Subscription;
}

namespace sensorlink::service {

/*
  Consumer read API over the snapshot cache. Every call checks the reader token.
*/
class SnapshotService {
 public:
  explicit SnapshotService(ServiceContext ctx);

  sensorlink::pipeline::v1::GetSnapshotResponse GetSnapshot(const std::string& token, const sensorlink::pipeline::v1::GetSnapshotRequest& req);

  sensorlink::pipeline::v1::ListSnapshotsResponse ListSnapshots(const std::string& token, const sensorlink::pipeline::v1::ListSnapshotsRequest& req);

  // First message is a snapshot_batch of the whole cache.
  std::shared_ptr<sensorlink::snapshot::Subscription> WatchSnapshots(const std::string& token,
                                                                     const sensorlink::pipeline::v1::WatchSnapshotsRequest& req);

  sensorlink::pipeline::v1::RequestSensorResponse RequestSensor(const std::string& token, const sensorlink::pipeline::v1::RequestSensorRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace sensorlink::service
