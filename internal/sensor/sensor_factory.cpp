#include "sensor_factory.hpp"

#include <stdexcept>

#include "grpc_transport.hpp"
#include "internal/db/memory/memory_queue_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/duration.hpp"
#include "internal/util/errors.hpp"

#if SENSORLINK_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_queue_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace sensorlink::sensor {

using sensorlink::observability::StringField;
using sensorlink::observability::UintField;
using sensorlink::runtime::config::SensorConfig;
using sensorlink::util::ParseDuration;

std::shared_ptr<db::QueueRepository> BuildQueueRepository(const SensorConfig::Queue& queue) {
  const std::string backend = queue.backend().empty() ? "sqlite" : queue.backend();

  if (backend == "memory") {
    SENSORLINK_LOG_WARN("Sensor queue is in memory; un-acked chunks are lost on restart");
    return std::make_shared<db::memory::MemoryQueueRepository>();
  }

  if (backend == "sqlite") {
#if SENSORLINK_DB_SQLITE
    const std::string path      = queue.path().empty() ? "sensorlink-queue.db" : queue.path();
    auto              sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path, !queue.relaxed_durability());
    db::sqlite::BootstrapQueueSchema(sqlite_db);
    return std::make_shared<db::sqlite::SqliteQueueRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  throw std::runtime_error("unknown queue backend: " + backend);
}

DispatcherOptions BuildDispatcherOptions(const SensorConfig& config) {
  const auto& dispatch = config.dispatch();

  DispatcherOptions options;
  if (dispatch.max_chunks()) options.max_chunks = dispatch.max_chunks();
  if (dispatch.max_bytes()) options.max_bytes = dispatch.max_bytes();
  if (dispatch.max_in_flight()) options.max_in_flight = dispatch.max_in_flight();
  if (dispatch.max_attempts()) options.max_attempts = dispatch.max_attempts();
  if (dispatch.jitter() > 0) options.backoff.jitter = dispatch.jitter();

  options.backoff.base   = ParseDuration(dispatch.backoff_base(), options.backoff.base);
  options.backoff.max    = ParseDuration(dispatch.backoff_max(), options.backoff.max);
  options.window_timeout = ParseDuration(dispatch.window_timeout(), options.window_timeout);
  options.send_timeout   = ParseDuration(dispatch.send_timeout(), options.send_timeout);
  return options;
}

std::unique_ptr<SensorAgent> BuildAgent(const SensorConfig& config) {
  if (config.sensor_id().empty()) {
    throw std::runtime_error("sensor_id is required");
  }
  if (config.server_address().empty()) {
    throw std::runtime_error("server_address is required");
  }

  // ------------------------------------------------------------------
  // Durable queue
  // ------------------------------------------------------------------
  auto queue = std::make_shared<DurableQueue>(BuildQueueRepository(config.queue()));

  // ------------------------------------------------------------------
  // Transports
  // ------------------------------------------------------------------
  client::ChannelOptions channel_options;
  channel_options.ca_path   = config.tls().ca_path();
  channel_options.cert_path = config.tls().cert_path();
  channel_options.key_path  = config.tls().key_path();

  auto channel = client::CreateChannel(config.server_address(), channel_options);
  if (!channel.ok()) {
    throw std::runtime_error(channel.status().ToString());
  }
  auto client = std::make_shared<client::SensorlinkClient>(channel.MoveValueUnsafe(), config.token(), config.sensor_id());

  // ------------------------------------------------------------------
  // Agent
  // ------------------------------------------------------------------
  SensorAgentOptions options;
  options.sensor_id        = config.sensor_id();
  options.software_version = config.software_version();
  options.clock_skew_ms    = config.clock_skew_ms();
  if (config.chunking().max_chunk_bytes()) options.max_chunk_bytes = config.chunking().max_chunk_bytes();
  if (!config.chunking().compression().empty()) {
    const auto compression = codec::CompressionFromString(config.chunking().compression());
    if (!compression.has_value()) {
      throw util::InvalidArgument("unsupported chunking.compression '" + config.chunking().compression() + "'");
    }
    options.compression = *compression;
  }
  options.retention            = ParseDuration(config.queue().retention(), options.retention);
  options.maintenance_interval = ParseDuration(config.dispatch().probe_interval(), options.maintenance_interval);

  ControlChannelOptions control;
  control.token              = config.token();
  control.software_version   = config.software_version();
  control.heartbeat_interval = ParseDuration(config.control().heartbeat_interval(), control.heartbeat_interval);
  control.reconnect.base     = ParseDuration(config.control().reconnect_base(), control.reconnect.base);
  control.reconnect.max      = ParseDuration(config.control().reconnect_max(), control.reconnect.max);
  for (const auto& capability : config.capabilities()) {
    control.capabilities.push_back(capability);
  }

  std::unique_ptr<SpoolSource> spool;
  if (!config.spool().dir().empty()) {
    spool = std::make_unique<SpoolSource>(SpoolOptions{config.spool().dir(), config.spool().extension()});
  }

  auto agent = std::make_unique<SensorAgent>(std::move(options), queue, std::make_shared<GrpcDataChannel>(client),
                                             std::make_shared<GrpcControlConnector>(client), std::move(control), BuildDispatcherOptions(config),
                                             std::move(spool));

  SENSORLINK_LOG_INFO("Sensor assembled", {StringField("sensor_id", config.sensor_id()), StringField("server", config.server_address()),
                                           StringField("queue", config.queue().backend().empty() ? "sqlite" : config.queue().backend()),
                                           UintField("queue_depth", queue->QueueDepth())});
  return agent;
}

} // namespace sensorlink::sensor
