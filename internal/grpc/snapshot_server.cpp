#include "snapshot_server.hpp"

#include <chrono>

#include "call_metadata.hpp"
#include "grpc_error.hpp"
#include "internal/snapshot/snapshot_feed.hpp"

namespace sensorlink::grpc {

namespace {
constexpr std::chrono::milliseconds kWatchPollInterval{250};
}

SnapshotServer::SnapshotServer(std::shared_ptr<sensorlink::service::SnapshotService> svc)
    : service_(std::move(svc)) {}

::grpc::Status SnapshotServer::GetSnapshot(::grpc::ServerContext* context,
                                           const sensorlink::pipeline::v1::GetSnapshotRequest* req,
                                           sensorlink::pipeline::v1::GetSnapshotResponse* resp) {
  try {
    *resp = service_->GetSnapshot(BearerToken(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SnapshotServer::ListSnapshots(::grpc::ServerContext* context,
                                             const sensorlink::pipeline::v1::ListSnapshotsRequest* req,
                                             sensorlink::pipeline::v1::ListSnapshotsResponse* resp) {
  try {
    *resp = service_->ListSnapshots(BearerToken(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SnapshotServer::WatchSnapshots(
    ::grpc::ServerContext* context,
    const sensorlink::pipeline::v1::WatchSnapshotsRequest* req,
    ::grpc::ServerWriter<sensorlink::pipeline::v1::SnapshotFeedMessage>* writer) {
  std::shared_ptr<sensorlink::snapshot::Subscription> subscription;
  try {
    subscription = service_->WatchSnapshots(BearerToken(*context), *req);
  } catch (const std::exception& e) {
    return ToStatus(e);
  }

  while (!context->IsCancelled()) {
    auto message = subscription->Next(kWatchPollInterval);
    if (!message) {
      if (subscription->Closed()) break;
      continue;
    }
    if (!writer->Write(*message)) break;
  }

  subscription->Close();
  return ::grpc::Status::OK;
}

::grpc::Status SnapshotServer::RequestSensor(::grpc::ServerContext* context,
                                             const sensorlink::pipeline::v1::RequestSensorRequest* req,
                                             sensorlink::pipeline::v1::RequestSensorResponse* resp) {
  try {
    *resp = service_->RequestSensor(BearerToken(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace sensorlink::grpc
