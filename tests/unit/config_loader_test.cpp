#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/duration.hpp"

namespace {

using sensorlink::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "sensorlink_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestServerConfigIsParsed() {
  const auto yaml_path = WriteYaml("server_full",
                                   R"(server:
  bind_address: "127.0.0.1:9000"
  max_message_bytes: 8388608
auth:
  reader_token: "reader-secret"
  sensors:
    - id: "sensor-a"
      token: "a-secret"
    - id: "sensor-b"
      token: "12345"
      revoked: true
store:
  backend: sqlite
  path: "/var/lib/sensorlink/server.db"
  retention: "72h"
  max_assembly_failures: 5
scheduler:
  max_chunks: 64
  max_bytes: 4194304
  window_timeout: "45s"
control:
  heartbeat_interval: "5s"
  heartbeat_timeout: "15s"
ingest:
  max_batch_chunks: 128
  require_session: true
feed:
  subscriber_queue_depth: 32
logging:
  level: debug
)");

  const auto config = ConfigLoader::LoadServerConfig(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:9000");
  assert(config.server().max_message_bytes() == 8388608);
  assert(config.auth().reader_token() == "reader-secret");
  assert(config.auth().sensors_size() == 2);
  assert(config.auth().sensors(0).id() == "sensor-a");
  assert(config.auth().sensors(1).token() == "12345");
  assert(config.auth().sensors(1).revoked());
  assert(config.store().backend() == "sqlite");
  assert(!config.store().relaxed_durability());
  assert(config.store().max_assembly_failures() == 5);
  assert(config.scheduler().max_chunks() == 64);
  assert(config.scheduler().max_bytes() == 4194304);
  assert(config.ingest().require_session());
  assert(config.feed().subscriber_queue_depth() == 32);
  assert(config.logging().level() == "debug");

  using namespace std::chrono_literals;
  assert(sensorlink::util::ParseDuration(config.store().retention(), 0ms) == 72h);
  assert(sensorlink::util::ParseDuration(config.control().heartbeat_timeout(), 0ms) == 15s);
}

void TestServerBindAddressDefault() {
  const auto yaml_path = WriteYaml("server_minimal", R"(store:
  backend: memory
)");

  const auto config = ConfigLoader::LoadServerConfig(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:7443");
  assert(config.store().backend() == "memory");
}

void TestSensorConfigIsParsed() {
  const auto yaml_path = WriteYaml("sensor_full",
                                   R"(sensor_id: "sensor-a"
token: "a-secret"
server_address: "collector.example:7443"
software_version: "1.4.2"
capabilities: ["throughput", "latency"]
clock_skew_ms: -12
queue:
  path: "/var/lib/sensorlink/queue.db"
  retention: "72h"
chunking:
  max_chunk_bytes: 32768
  compression: "none"
dispatch:
  max_attempts: 7
  backoff_base: "250ms"
  jitter: 0.25
spool:
  dir: "/var/spool/sensorlink"
  extension: ".json"
)");

  const auto config = ConfigLoader::LoadSensorConfig(yaml_path.string());
  assert(config.sensor_id() == "sensor-a");
  assert(config.server_address() == "collector.example:7443");
  assert(config.capabilities_size() == 2);
  assert(config.capabilities(1) == "latency");
  assert(config.clock_skew_ms() == -12);
  assert(config.chunking().max_chunk_bytes() == 32768);
  assert(config.chunking().compression() == "none");
  assert(config.dispatch().max_attempts() == 7);
  assert(config.dispatch().jitter() == 0.25);
  assert(config.spool().extension() == ".json");
}

void TestSensorConfigRequiresIdentity() {
  const auto yaml_path = WriteYaml("sensor_missing_id", R"(server_address: "collector:7443"
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadSensorConfig(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "sensor config without sensor_id must be rejected");
}

template <typename Load>
std::string RejectionMessage(Load&& load) {
  try {
    load();
  } catch (const std::runtime_error& e) {
    return e.what();
  }
  return {};
}

void TestMalformedValuesNameTheKey() {
  const auto bad_duration = WriteYaml("bad_duration", R"(control:
  heartbeat_timeout: "15 parsecs"
)");
  auto message = RejectionMessage([&] { (void)ConfigLoader::LoadServerConfig(bad_duration.string()); });
  assert(message.find("control.heartbeat_timeout") != std::string::npos);

  const auto duplicate = WriteYaml("duplicate_sensor", R"(auth:
  sensors:
    - id: "sensor-a"
      token: "one"
    - id: "sensor-a"
      token: "two"
)");
  message = RejectionMessage([&] { (void)ConfigLoader::LoadServerConfig(duplicate.string()); });
  assert(message.find("listed twice") != std::string::npos);

  const auto backend = WriteYaml("bad_backend", R"(store:
  backend: postgres
)");
  message = RejectionMessage([&] { (void)ConfigLoader::LoadServerConfig(backend.string()); });
  assert(message.find("store.backend") != std::string::npos);

  const auto chunk = WriteYaml("huge_chunks", R"(sensor_id: "s"
token: "t"
server_address: "collector:7443"
chunking:
  max_chunk_bytes: 16777216
)");
  message = RejectionMessage([&] { (void)ConfigLoader::LoadSensorConfig(chunk.string()); });
  assert(message.find("max_chunk_bytes") != std::string::npos);

  const auto codec = WriteYaml("bad_compression", R"(sensor_id: "s"
token: "t"
server_address: "collector:7443"
chunking:
  compression: "brotli"
)");
  message = RejectionMessage([&] { (void)ConfigLoader::LoadSensorConfig(codec.string()); });
  assert(message.find("chunking.compression") != std::string::npos);
}

void TestSensorTokenFromEnvironment() {
  const auto yaml_path = WriteYaml("sensor_env_token", R"(sensor_id: "sensor-a"
server_address: "collector:7443"
)");

  assert(!RejectionMessage([&] { (void)ConfigLoader::LoadSensorConfig(yaml_path.string()); }).empty());

  setenv("SENSORLINK_SENSOR_TOKEN", "from-env", 1);
  const auto config = ConfigLoader::LoadSensorConfig(yaml_path.string());
  unsetenv("SENSORLINK_SENSOR_TOKEN");
  assert(config.token() == "from-env");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:7443"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadServerConfig(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadServerConfig("/nonexistent/sensorlink/server.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestServerConfigIsParsed();
  TestServerBindAddressDefault();
  TestSensorConfigIsParsed();
  TestSensorConfigRequiresIdentity();
  TestUnknownFieldsAreRejected();
  TestMalformedValuesNameTheKey();
  TestSensorTokenFromEnvironment();
  TestMissingFileIsReported();

  std::cout << "sensorlink_unit_config_loader: pass\n";
  return 0;
}
