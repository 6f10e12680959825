#pragma once

#include <string>

#include <google/protobuf/message.h>

#include "config/config.pb.h"

namespace sensorlink::config {

/*
  Loads ServerConfig / SensorConfig from YAML files.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are rejected.
*/
class ConfigLoader {
 public:
  static sensorlink::runtime::config::ServerConfig LoadServerConfig(const std::string& path);
  static sensorlink::runtime::config::SensorConfig LoadSensorConfig(const std::string& path);

  // Shared implementation, exposed for tests.
  static void LoadYamlInto(const std::string& path, google::protobuf::Message* message);
};

} // namespace sensorlink::config
