#pragma once

#include <memory>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "config/config.pb.h"
#include "internal/db/api/chunk_repository.hpp"
#include "internal/runtime/periodic_task.hpp"
#include "internal/runtime/server.hpp"
#include "internal/service/control_service.hpp"
#include "internal/service/ingest_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/snapshot_service.hpp"

namespace sensorlink::factory {

/*
  Application

  Owns all long-lived objects of the collector.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  service::ServiceContext ctx;

  std::shared_ptr<service::ControlService>  control_service;
  std::shared_ptr<service::IngestService>   ingest_service;
  std::shared_ptr<service::SnapshotService> snapshot_service;

  std::vector<std::unique_ptr<::grpc::Service>>       grpc_services;
  std::vector<std::shared_ptr<runtime::PeriodicTask>> background_workers;

  runtime::ServerOptions server_options;
};

/*
  Build

  Constructs the collector from its config: storage, offsets, snapshot cache
  (hydrated), credentials, services, gRPC adapters and background tasks
  (heartbeat watchdog, retention pruning). Background tasks are started.

  This is the composition root. It is the ONLY place that knows concrete
  DB types.
*/
Application Build(const sensorlink::runtime::config::ServerConfig& config);

std::shared_ptr<db::ChunkRepository> BuildChunkRepository(const sensorlink::runtime::config::ServerConfig::Store& store);

} // namespace sensorlink::factory
