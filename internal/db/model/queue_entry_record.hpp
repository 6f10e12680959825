#pragma once

#include <cstdint>
#include <string>

namespace sensorlink::db::model {

struct QueueEntryRecord {
  uint64_t    sequence = 0;
  std::string event_id;
  uint32_t    chunk_index = 0;
  uint32_t    chunk_count = 0;
  uint64_t    payload_bytes = 0;
  // serialized pipeline::v1::Chunk with its sequence set
  std::string chunk;
  uint64_t    enqueued_at_ms = 0;
  uint32_t    attempt_count = 0;
  uint64_t    last_attempt_at_ms = 0;
};

struct QueueStateRecord {
  // highest sequence ever assigned
  uint64_t last_sequence = 0;
  uint64_t acked_upto = 0;
  // highest sequence dropped by retention without an ack
  uint64_t expired_upto = 0;
};

}
