#include "chunk_codec.hpp"

#include <algorithm>

#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/ids.hpp"
#include "internal/util/time.hpp"

namespace sensorlink::codec {

using sensorlink::pipeline::v1::Chunk;

std::vector<Chunk> Split(std::string_view payload, std::size_t max_chunk_bytes, const EventOptions& options) {
  if (max_chunk_bytes == 0 || max_chunk_bytes > kMaxChunkBytes) {
    throw util::InvalidArgument("split: max_chunk_bytes must be in [1, " + std::to_string(kMaxChunkBytes) + "], got " +
                                std::to_string(max_chunk_bytes));
  }

  const std::size_t chunk_count = payload.empty() ? 1 : (payload.size() + max_chunk_bytes - 1) / max_chunk_bytes;
  const std::string event_sha   = util::Sha256(payload);
  const std::string event_id    = options.event_id.empty() ? util::GenerateEventId() : options.event_id;
  const uint64_t    created_at  = options.created_at_ms != 0 ? options.created_at_ms : util::NowMillis();

  std::vector<Chunk> chunks;
  chunks.reserve(chunk_count);

  for (std::size_t index = 0; index < chunk_count; ++index) {
    const std::size_t offset = index * max_chunk_bytes;
    const auto        slice  = payload.substr(std::min(offset, payload.size()), max_chunk_bytes);

    std::string wire = Compress(options.compression, slice);

    Chunk chunk;
    chunk.set_sensor_id(options.sensor_id);
    chunk.set_event_id(event_id);
    chunk.set_chunk_index(static_cast<uint32_t>(index));
    chunk.set_chunk_count(static_cast<uint32_t>(chunk_count));
    chunk.set_chunk_sha256(util::Sha256(wire));
    chunk.set_payload(std::move(wire));
    if (options.compression != Compression::None) {
      chunk.set_compression(ToString(options.compression));
    }
    chunk.set_event_sha256(event_sha);
    chunk.set_is_last(index + 1 == chunk_count);
    chunk.set_total_bytes(payload.size());
    chunk.set_created_at_ms(created_at);
    chunk.set_logical_timestamp_ms(options.logical_timestamp_ms);
    chunk.set_clock_skew_ms(options.clock_skew_ms);
    for (const auto& [key, value] : options.attributes) {
      (*chunk.mutable_attributes())[key] = value;
    }
    chunks.push_back(std::move(chunk));
  }

  return chunks;
}

bool VerifyChunk(const Chunk& chunk) {
  return util::ConstantTimeEquals(util::Sha256(chunk.payload()), chunk.chunk_sha256());
}

Compression ChunkCompression(const Chunk& chunk) {
  const auto compression = CompressionFromString(chunk.compression());
  if (!compression.has_value()) {
    throw util::InvalidArgument("chunk " + std::to_string(chunk.sequence()) + " uses unsupported compression '" + chunk.compression() + "'");
  }
  return *compression;
}

std::string DecodePayload(const Chunk& chunk) {
  return Decompress(ChunkCompression(chunk), chunk.payload(), kMaxChunkBytes);
}

std::string Assemble(const std::vector<Chunk>& chunks) {
  if (chunks.empty()) {
    throw util::IncompleteEvent("assemble: no chunks");
  }

  const Chunk&   reference   = chunks.front();
  const uint32_t chunk_count = reference.chunk_count();
  if (chunk_count == 0) {
    throw util::IntegrityError("assemble: event " + reference.event_id() + " declares zero chunks");
  }

  std::vector<const Chunk*> slots(chunk_count, nullptr);
  for (const auto& chunk : chunks) {
    if (chunk.event_id() != reference.event_id() || chunk.chunk_count() != chunk_count || chunk.event_sha256() != reference.event_sha256()) {
      throw util::IntegrityError("assemble: chunk " + std::to_string(chunk.chunk_index()) + " does not belong to event " + reference.event_id());
    }
    if (chunk.chunk_index() >= chunk_count) {
      throw util::IntegrityError("assemble: chunk index " + std::to_string(chunk.chunk_index()) + " out of range for event " + reference.event_id());
    }
    if (!VerifyChunk(chunk)) {
      throw util::IntegrityError("assemble: chunk " + std::to_string(chunk.chunk_index()) + " hash mismatch");
    }
    ChunkCompression(chunk); // rejects unknown codecs

    const Chunk*& slot = slots[chunk.chunk_index()];
    if (slot && (slot->payload() != chunk.payload() || slot->compression() != chunk.compression())) {
      throw util::IntegrityError("assemble: conflicting copies of chunk " + std::to_string(chunk.chunk_index()));
    }
    slot = &chunk;
  }

  for (uint32_t index = 0; index < chunk_count; ++index) {
    if (!slots[index]) {
      throw util::IncompleteEvent("assemble: event " + reference.event_id() + " missing chunk " + std::to_string(index) + " of " +
                                  std::to_string(chunk_count));
    }
  }

  std::string payload;
  payload.reserve(std::min<uint64_t>(reference.total_bytes(), kMaxChunkBytes));
  for (const auto* chunk : slots) {
    payload.append(DecodePayload(*chunk));
  }

  if (!util::ConstantTimeEquals(util::Sha256(payload), reference.event_sha256())) {
    throw util::IntegrityError("assemble: event " + reference.event_id() + " payload hash mismatch");
  }

  return payload;
}

} // namespace sensorlink::codec
