#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "compression.hpp"
#include "sensorlink/pipeline/v1/chunk.pb.h"

namespace sensorlink::codec {

inline constexpr std::size_t kDefaultChunkBytes = 64 * 1024;
// Stays below the default 4 MiB gRPC message limit once framing is added.
inline constexpr std::size_t kMaxChunkBytes = 4 * 1024 * 1024 - 64 * 1024;

struct EventOptions {
  std::string sensor_id;
  // Generated when empty.
  std::string event_id;
  // Defaults to now when zero.
  uint64_t                           created_at_ms{0};
  int64_t                            logical_timestamp_ms{0};
  int64_t                            clock_skew_ms{0};
  std::map<std::string, std::string> attributes;
  Compression                        compression{Compression::Gzip};
};

/*
  Splits a payload into ceil(len / max_chunk_bytes) chunks, each carrying its
  own SHA-256 and the SHA-256 of the whole payload. An empty payload yields a
  single empty chunk. Sequence numbers are left at zero for the queue to assign.

  max_chunk_bytes bounds the uncompressed slice. Each slice is compressed on
  its own and chunk_sha256 covers the compressed wire bytes; event_sha256
  always covers the original payload.

  Throws util::InvalidArgument when max_chunk_bytes is 0 or above kMaxChunkBytes.
*/
std::vector<sensorlink::pipeline::v1::Chunk> Split(std::string_view payload, std::size_t max_chunk_bytes,
                                                   const EventOptions& options);

/*
  Reassembles one event. Chunks may arrive in any order and may repeat.

  Throws util::IncompleteEvent when an index in [0, chunk_count) is missing,
  util::IntegrityError when a chunk hash, the payload hash, a compressed
  stream or the per-event metadata disagree, and util::InvalidArgument for
  an unknown compression name.
*/
std::string Assemble(const std::vector<sensorlink::pipeline::v1::Chunk>& chunks);

// True when chunk_sha256 matches the payload bytes.
bool VerifyChunk(const sensorlink::pipeline::v1::Chunk& chunk);

// The chunk's codec. Throws util::InvalidArgument for an unknown name.
Compression ChunkCompression(const sensorlink::pipeline::v1::Chunk& chunk);

// Uncompressed slice carried by one chunk.
std::string DecodePayload(const sensorlink::pipeline::v1::Chunk& chunk);

} // namespace sensorlink::codec
