#pragma once

#include <cstdint>
#include <string>

namespace sensorlink::db::model {

struct SensorOffsetRecord {
  std::string sensor_id;
  uint64_t    committed_sequence = 0;
  uint64_t    expired_upto = 0;
  uint64_t    updated_at_ms = 0;
};

}
