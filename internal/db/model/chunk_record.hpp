#pragma once

#include <cstdint>
#include <string>

namespace sensorlink::db::model {

struct ChunkRecord {
  std::string sensor_id;
  uint64_t    sequence = 0;
  std::string event_id;
  uint32_t    chunk_index = 0;
  uint32_t    chunk_count = 0;
  // wire bytes, as hashed by chunk_sha256
  std::string payload;
  std::string chunk_sha256;
  // codec name from the chunk, "" when uncompressed
  std::string compression;
  uint64_t    received_at_ms = 0;
};

}
