#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/snapshot_service.hpp"
#include "sensorlink/pipeline/v1.hpp"

namespace sensorlink::grpc {

class SnapshotServer final : public sensorlink::pipeline::v1::SnapshotService::Service {
public:
  explicit SnapshotServer(std::shared_ptr<sensorlink::service::SnapshotService> svc);

  ::grpc::Status GetSnapshot(::grpc::ServerContext*,
                             const sensorlink::pipeline::v1::GetSnapshotRequest*,
                             sensorlink::pipeline::v1::GetSnapshotResponse*) override;

  ::grpc::Status ListSnapshots(::grpc::ServerContext*,
                               const sensorlink::pipeline::v1::ListSnapshotsRequest*,
                               sensorlink::pipeline::v1::ListSnapshotsResponse*) override;

  ::grpc::Status WatchSnapshots(::grpc::ServerContext*,
                                const sensorlink::pipeline::v1::WatchSnapshotsRequest*,
                                ::grpc::ServerWriter<sensorlink::pipeline::v1::SnapshotFeedMessage>*) override;

  ::grpc::Status RequestSensor(::grpc::ServerContext*,
                               const sensorlink::pipeline::v1::RequestSensorRequest*,
                               sensorlink::pipeline::v1::RequestSensorResponse*) override;

private:
  std::shared_ptr<sensorlink::service::SnapshotService> service_;
};

} // namespace sensorlink::grpc
