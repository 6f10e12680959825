#include <cassert>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/auth/sensor_registry.hpp"
#include "internal/control/session_registry.hpp"
#include "internal/db/memory/memory_chunk_repository.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/ingest_server.hpp"
#include "internal/grpc/snapshot_server.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/service/request_scheduler.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/snapshot_service.hpp"
#include "internal/snapshot/snapshot_cache.hpp"
#include "internal/store/chunk_store.hpp"
#include "internal/store/offset_tracker.hpp"
#include "sensorlink/pipeline/v1.hpp"

namespace {

sensorlink::service::ServiceContext BuildServiceContext() {
  sensorlink::service::ServiceContext ctx;
  auto repo       = std::make_shared<sensorlink::db::memory::MemoryChunkRepository>();
  ctx.offsets     = std::make_shared<sensorlink::store::OffsetTracker>(repo);
  ctx.snapshots   = std::make_shared<sensorlink::snapshot::SnapshotCache>();
  ctx.chunk_store = std::make_shared<sensorlink::store::ChunkStore>(repo, ctx.offsets, ctx.snapshots);
  ctx.sensors     = std::make_shared<sensorlink::auth::SensorRegistry>();
  ctx.sessions    = std::make_shared<sensorlink::control::SessionRegistry>();
  ctx.scheduler   = std::make_shared<sensorlink::service::RequestScheduler>(ctx.sessions, ctx.offsets);
  ctx.sensors->Upsert("s1", "token-1");
  return ctx;
}

void TestErrorMapping() {
  using namespace sensorlink::util;
  using sensorlink::grpc::ToStatus;

  assert(ToStatus(InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(UnauthorizedSensor("x")).error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
  assert(ToStatus(NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(IntegrityError("x")).error_code() == ::grpc::StatusCode::DATA_LOSS);
  assert(ToStatus(InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(IncompleteEvent("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(ResourceExhausted("x")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(TransportError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(NotFound("no snapshot")).error_message() == "no snapshot");
}

void TestIngestWithoutBearerReturnsUnauthenticated() {
  auto ctx = BuildServiceContext();
  sensorlink::grpc::IngestServer server(std::make_shared<sensorlink::service::IngestService>(ctx));

  sensorlink::pipeline::v1::IngestBatchRequest req;
  req.set_sensor_id("s1");
  sensorlink::pipeline::v1::IngestBatchResponse resp;
  ::grpc::ServerContext                         grpc_ctx;

  const auto status = server.IngestBatch(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
}

void TestIngestWithoutSensorReturnsInvalidArgument() {
  auto ctx = BuildServiceContext();
  sensorlink::grpc::IngestServer server(std::make_shared<sensorlink::service::IngestService>(ctx));

  sensorlink::pipeline::v1::IngestBatchRequest  req;
  sensorlink::pipeline::v1::IngestBatchResponse resp;
  ::grpc::ServerContext                         grpc_ctx;

  const auto status = server.IngestBatch(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestMissingSnapshotReturnsNotFound() {
  auto ctx = BuildServiceContext();
  sensorlink::grpc::SnapshotServer server(std::make_shared<sensorlink::service::SnapshotService>(ctx));

  sensorlink::pipeline::v1::GetSnapshotRequest req;
  req.set_sensor_id("s1");
  sensorlink::pipeline::v1::GetSnapshotResponse resp;
  ::grpc::ServerContext                         grpc_ctx;

  const auto status = server.GetSnapshot(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestSnapshotReadsNeedReaderToken() {
  auto ctx = BuildServiceContext();
  ctx.sensors->SetReaderToken("reader");
  sensorlink::grpc::SnapshotServer server(std::make_shared<sensorlink::service::SnapshotService>(ctx));

  sensorlink::pipeline::v1::ListSnapshotsRequest  req;
  sensorlink::pipeline::v1::ListSnapshotsResponse resp;
  ::grpc::ServerContext                           grpc_ctx;

  const auto status = server.ListSnapshots(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAUTHENTICATED);
}

void TestRequestUnknownSensorReturnsNotFound() {
  auto ctx = BuildServiceContext();
  sensorlink::grpc::SnapshotServer server(std::make_shared<sensorlink::service::SnapshotService>(ctx));

  sensorlink::pipeline::v1::RequestSensorRequest req;
  req.set_sensor_id("s9");
  sensorlink::pipeline::v1::RequestSensorResponse resp;
  ::grpc::ServerContext                           grpc_ctx;

  auto status = server.RequestSensor(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);

  // known but not connected: accepted, nothing dispatched
  req.set_sensor_id("s1");
  status = server.RequestSensor(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(!resp.dispatched());
}

} // namespace

int main() {
  TestErrorMapping();
  TestIngestWithoutBearerReturnsUnauthenticated();
  TestIngestWithoutSensorReturnsInvalidArgument();
  TestMissingSnapshotReturnsNotFound();
  TestSnapshotReadsNeedReaderToken();
  TestRequestUnknownSensorReturnsNotFound();

  std::cout << "sensorlink_unit_grpc_status: pass\n";
  return 0;
}
