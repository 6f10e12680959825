#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdlib>
#include <set>
#include <stdexcept>
#include <utility>

#include "internal/codec/chunk_codec.hpp"
#include "internal/util/duration.hpp"
#include "internal/util/errors.hpp"

namespace sensorlink::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings (tokens, ids)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

void ConfigLoader::LoadYamlInto(const std::string& path, google::protobuf::Message* message) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration " + path + ": " + std::string(status.message()));
  }
}

namespace {

using sensorlink::runtime::config::SensorConfig;
using sensorlink::runtime::config::ServerConfig;

[[noreturn]] void Reject(const std::string& path, const std::string& reason) {
  throw std::runtime_error("Invalid configuration " + path + ": " + reason);
}

void OverrideFromEnv(const char* variable, std::string* field) {
  if (const char* value = std::getenv(variable); value && *value) {
    *field = value;
  }
}

void CheckBackend(const std::string& path, const std::string& key, const std::string& backend) {
  if (!backend.empty() && backend != "sqlite" && backend != "memory") {
    Reject(path, key + " must be 'sqlite' or 'memory', got '" + backend + "'");
  }
}

// Durations are parsed again by the factories; failing here names the key.
void CheckDurations(const std::string& path, std::initializer_list<std::pair<const char*, const std::string*>> durations) {
  for (const auto& [key, text] : durations) {
    try {
      (void)util::ParseDuration(*text, std::chrono::milliseconds{0});
    } catch (const util::InvalidArgument& e) {
      Reject(path, std::string(key) + ": " + e.what());
    }
  }
}

void Validate(const std::string& path, const ServerConfig& config) {
  std::set<std::string> ids;
  for (const auto& sensor : config.auth().sensors()) {
    if (sensor.id().empty() || sensor.token().empty()) {
      Reject(path, "auth.sensors entries need both id and token");
    }
    if (!ids.insert(sensor.id()).second) {
      Reject(path, "sensor '" + sensor.id() + "' is listed twice in auth.sensors");
    }
  }

  CheckBackend(path, "store.backend", config.store().backend());
  CheckDurations(path, {{"store.retention", &config.store().retention()},
                        {"store.prune_interval", &config.store().prune_interval()},
                        {"scheduler.window_timeout", &config.scheduler().window_timeout()},
                        {"control.heartbeat_interval", &config.control().heartbeat_interval()},
                        {"control.heartbeat_timeout", &config.control().heartbeat_timeout()}});

  const auto& tls = config.server().tls();
  if (tls.cert_path().empty() != tls.key_path().empty()) {
    Reject(path, "server.tls needs both cert_path and key_path");
  }
}

void Validate(const std::string& path, const SensorConfig& config) {
  if (config.sensor_id().empty()) {
    Reject(path, "sensor_id is required");
  }
  if (config.server_address().empty()) {
    Reject(path, "server_address is required");
  }
  if (config.token().empty()) {
    Reject(path, "token is required (or set SENSORLINK_SENSOR_TOKEN)");
  }
  if (!codec::CompressionFromString(config.chunking().compression()).has_value()) {
    Reject(path, "chunking.compression must be gzip or none, got '" + config.chunking().compression() + "'");
  }
  if (config.chunking().max_chunk_bytes() > codec::kMaxChunkBytes) {
    Reject(path, "chunking.max_chunk_bytes exceeds " + std::to_string(codec::kMaxChunkBytes));
  }
  if (config.dispatch().jitter() < 0.0 || config.dispatch().jitter() > 1.0) {
    Reject(path, "dispatch.jitter must be within [0, 1]");
  }

  CheckBackend(path, "queue.backend", config.queue().backend());
  CheckDurations(path, {{"queue.retention", &config.queue().retention()},
                        {"dispatch.backoff_base", &config.dispatch().backoff_base()},
                        {"dispatch.backoff_max", &config.dispatch().backoff_max()},
                        {"dispatch.window_timeout", &config.dispatch().window_timeout()},
                        {"dispatch.probe_interval", &config.dispatch().probe_interval()},
                        {"dispatch.send_timeout", &config.dispatch().send_timeout()},
                        {"control.heartbeat_interval", &config.control().heartbeat_interval()},
                        {"control.reconnect_base", &config.control().reconnect_base()},
                        {"control.reconnect_max", &config.control().reconnect_max()}});

  const auto& tls = config.tls();
  if (tls.cert_path().empty() != tls.key_path().empty()) {
    Reject(path, "tls needs both cert_path and key_path for a client certificate");
  }
}

} // namespace

ServerConfig ConfigLoader::LoadServerConfig(const std::string& path) {
  ServerConfig config;
  LoadYamlInto(path, &config);

  OverrideFromEnv("SENSORLINK_READER_TOKEN", config.mutable_auth()->mutable_reader_token());
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address("0.0.0.0:7443");
  }

  Validate(path, config);
  return config;
}

SensorConfig ConfigLoader::LoadSensorConfig(const std::string& path) {
  SensorConfig config;
  LoadYamlInto(path, &config);

  OverrideFromEnv("SENSORLINK_SENSOR_TOKEN", config.mutable_token());
  OverrideFromEnv("SENSORLINK_SERVER_ADDRESS", config.mutable_server_address());

  Validate(path, config);
  return config;
}

} // namespace sensorlink::config
