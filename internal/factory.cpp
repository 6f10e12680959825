#include "factory.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/auth/sensor_registry.hpp"
#include "internal/control/session_registry.hpp"
#include "internal/db/memory/memory_chunk_repository.hpp"
#include "internal/grpc/control_server.hpp"
#include "internal/grpc/ingest_server.hpp"
#include "internal/grpc/snapshot_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/request_scheduler.hpp"
#include "internal/snapshot/snapshot_cache.hpp"
#include "internal/store/chunk_store.hpp"
#include "internal/store/offset_tracker.hpp"
#include "internal/util/duration.hpp"

#if SENSORLINK_DB_SQLITE
#include "internal/db/sqlite/sqlite_chunk_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace sensorlink::factory {

using std::chrono::milliseconds;
using sensorlink::observability::IntField;
using sensorlink::observability::StringField;
using sensorlink::util::ParseDuration;

namespace {

constexpr milliseconds kDefaultRetention{72LL * 60 * 60 * 1000};
constexpr milliseconds kDefaultPruneInterval{60LL * 60 * 1000};

template <typename T>
T OrDefault(T value, T fallback) {
  return value ? value : fallback;
}

} // namespace

std::shared_ptr<db::ChunkRepository> BuildChunkRepository(const sensorlink::runtime::config::ServerConfig::Store& store) {
  const std::string backend = store.backend().empty() ? "sqlite" : store.backend();

  if (backend == "memory") {
    return std::make_shared<db::memory::MemoryChunkRepository>();
  }

  if (backend == "sqlite") {
#if SENSORLINK_DB_SQLITE
    const std::string path      = store.path().empty() ? "sensorlink-server.db" : store.path();
    auto              sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path, !store.relaxed_durability());
    db::sqlite::BootstrapChunkStoreSchema(sqlite_db);
    return std::make_shared<db::sqlite::SqliteChunkRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  throw std::runtime_error("unknown store backend: " + backend);
}

/*
    Build full application dependency graph
*/
Application Build(const sensorlink::runtime::config::ServerConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  auto repository = BuildChunkRepository(config.store());

  auto offsets = std::make_shared<store::OffsetTracker>(repository);
  offsets->Load();

  auto snapshots = std::make_shared<snapshot::SnapshotCache>(
      OrDefault<std::size_t>(config.feed().subscriber_queue_depth(), snapshot::kDefaultSubscriberQueueDepth));

  store::ChunkStoreOptions store_options;
  store_options.max_assembly_failures = OrDefault<uint32_t>(config.store().max_assembly_failures(), store_options.max_assembly_failures);

  auto chunk_store = std::make_shared<store::ChunkStore>(repository, offsets, snapshots, store_options);
  const auto hydrated = chunk_store->Hydrate();

  // ------------------------------------------------------------------
  // Sessions, credentials, scheduling
  // ------------------------------------------------------------------
  auto sensors = std::make_shared<auth::SensorRegistry>();
  sensors->Load(config);
  if (config.auth().sensors().empty()) {
    SENSORLINK_LOG_WARN("No sensors configured under auth.sensors; every registration will be rejected");
  }

  auto sessions = std::make_shared<control::SessionRegistry>();

  service::SchedulerLimits limits;
  limits.max_chunks     = OrDefault(config.scheduler().max_chunks(), limits.max_chunks);
  limits.max_bytes      = OrDefault<uint64_t>(config.scheduler().max_bytes(), limits.max_bytes);
  limits.max_in_flight  = OrDefault(config.scheduler().max_in_flight(), limits.max_in_flight);
  limits.window_timeout = ParseDuration(config.scheduler().window_timeout(), limits.window_timeout);
  auto scheduler        = std::make_shared<service::RequestScheduler>(sessions, offsets, limits);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  app.ctx.chunk_store = chunk_store;
  app.ctx.offsets     = offsets;
  app.ctx.snapshots   = snapshots;
  app.ctx.sensors     = sensors;
  app.ctx.sessions    = sessions;
  app.ctx.scheduler   = scheduler;

  service::ControlOptions control_options;
  control_options.heartbeat_interval = ParseDuration(config.control().heartbeat_interval(), control_options.heartbeat_interval);
  control_options.heartbeat_timeout  = ParseDuration(config.control().heartbeat_timeout(), control_options.heartbeat_interval * 3);

  service::IngestLimits ingest_limits;
  ingest_limits.max_batch_chunks = OrDefault(config.ingest().max_batch_chunks(), ingest_limits.max_batch_chunks);
  ingest_limits.max_batch_bytes  = OrDefault<uint64_t>(config.ingest().max_batch_bytes(), ingest_limits.max_batch_bytes);
  ingest_limits.require_session  = config.ingest().require_session();

  app.control_service  = std::make_shared<service::ControlService>(app.ctx, control_options);
  app.ingest_service   = std::make_shared<service::IngestService>(app.ctx, ingest_limits);
  app.snapshot_service = std::make_shared<service::SnapshotService>(app.ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::ControlServer>(app.control_service));
  app.grpc_services.push_back(std::make_unique<grpc::IngestServer>(app.ingest_service));
  app.grpc_services.push_back(std::make_unique<grpc::SnapshotServer>(app.snapshot_service));

  app.server_options.max_message_bytes = static_cast<int>(config.server().max_message_bytes());
  app.server_options.tls_cert_path     = config.server().tls().cert_path();
  app.server_options.tls_key_path      = config.server().tls().key_path();
  app.server_options.tls_ca_path       = config.server().tls().ca_path();

  // ------------------------------------------------------------------
  // Background workers
  // ------------------------------------------------------------------
  auto control_service = app.control_service;
  auto watchdog        = std::make_shared<runtime::PeriodicTask>("heartbeat-watchdog", control_options.heartbeat_interval,
                                                          [control_service] { control_service->CheckHeartbeats(); });

  const auto retention = ParseDuration(config.store().retention(), kDefaultRetention);
  auto       pruner    = std::make_shared<runtime::PeriodicTask>("retention", ParseDuration(config.store().prune_interval(), kDefaultPruneInterval),
                                                        [chunk_store, retention] { chunk_store->PruneRetention(retention); });

  watchdog->Start();
  pruner->Start();

  // Keep ownership of workers so they live for process lifetime
  app.background_workers.push_back(watchdog);
  app.background_workers.push_back(pruner);

  SENSORLINK_LOG_INFO("Collector assembled", {StringField("store", config.store().backend().empty() ? "sqlite" : config.store().backend()),
                                              IntField("sensors", config.auth().sensors_size()),
                                              IntField("hydrated_snapshots", static_cast<int64_t>(hydrated))});
  return app;
}

} // namespace sensorlink::factory
