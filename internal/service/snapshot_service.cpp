#include "snapshot_service.hpp"

#include "internal/auth/sensor_registry.hpp"
#include "internal/snapshot/snapshot_cache.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"
#include "request_scheduler.hpp"

namespace sensorlink::service {

using namespace sensorlink::pipeline::v1;

SnapshotService::SnapshotService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GetSnapshotResponse SnapshotService::GetSnapshot(const std::string& token, const GetSnapshotRequest& req) {
  return ObserveRpc("SnapshotService.GetSnapshot", req.sensor_id(), [&] {
    ctx_.sensors->AuthenticateReader(token);
    if (req.sensor_id().empty()) {
      throw sensorlink::util::InvalidArgument("get snapshot: sensor_id is required");
    }

    auto snapshot = ctx_.snapshots->Get(req.sensor_id());
    if (!snapshot.has_value()) {
      throw sensorlink::util::NotFound("get snapshot: no snapshot for sensor " + req.sensor_id());
    }

    GetSnapshotResponse resp;
    *resp.mutable_snapshot() = std::move(*snapshot);
    return resp;
  });
}

ListSnapshotsResponse SnapshotService::ListSnapshots(const std::string& token, const ListSnapshotsRequest&) {
  return ObserveRpc("SnapshotService.ListSnapshots", "", [&] {
    ctx_.sensors->AuthenticateReader(token);

    ListSnapshotsResponse resp;
    for (auto& snapshot : ctx_.snapshots->List()) {
      *resp.add_snapshots() = std::move(snapshot);
    }
    return resp;
  });
}

std::shared_ptr<sensorlink::snapshot::Subscription> SnapshotService::WatchSnapshots(const std::string& token, const WatchSnapshotsRequest&) {
  return ObserveRpc("SnapshotService.WatchSnapshots", "", [&] {
    ctx_.sensors->AuthenticateReader(token);
    return ctx_.snapshots->Subscribe();
  });
}

RequestSensorResponse SnapshotService::RequestSensor(const std::string& token, const RequestSensorRequest& req) {
  return ObserveRpc("SnapshotService.RequestSensor", req.sensor_id(), [&] {
    ctx_.sensors->AuthenticateReader(token);
    if (req.sensor_id().empty()) {
      throw sensorlink::util::InvalidArgument("request sensor: sensor_id is required");
    }
    if (!ctx_.sensors->IsKnown(req.sensor_id())) {
      throw sensorlink::util::NotFound("request sensor: unknown sensor " + req.sensor_id());
    }

    RequestSensorResponse resp;
    auto                  request = ctx_.scheduler->RequestSensor(req.sensor_id(), req.max_chunks(), req.max_bytes());
    resp.set_dispatched(request.has_value());
    if (request.has_value()) {
      resp.set_window_id(request->window_id());
      resp.set_since_sequence(request->since_sequence());
    }
    return resp;
  });
}

} // namespace sensorlink::service
