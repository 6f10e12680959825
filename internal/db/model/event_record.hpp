#pragma once

#include <cstdint>
#include <string>

namespace sensorlink::db::model {

enum class EventState : int {
  Pending   = 0,
  Complete  = 1,
  Failed    = 2,
  // gave up after repeated payload hash failures; chunks are kept and the
  // committed point moves past it
  Abandoned = 3,
};

struct EventRecord {
  std::string sensor_id;
  std::string event_id;
  uint32_t    chunk_count = 0;
  uint64_t    total_bytes = 0;
  std::string event_sha256;
  uint64_t    created_at_ms = 0;
  int64_t     logical_timestamp_ms = 0;
  int64_t     clock_skew_ms = 0;
  // JSON object of string attributes
  std::string attributes;

  EventState state = EventState::Pending;
  uint32_t   received_chunks = 0;
  uint64_t   first_sequence = 0;
  uint64_t   last_sequence = 0;
  uint32_t   assembly_failures = 0;

  // reassembled payload, set once Complete
  std::string payload;
  uint64_t    completed_at_ms = 0;
  uint64_t    updated_at_ms = 0;
};

}
