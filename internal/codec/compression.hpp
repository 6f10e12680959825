#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace sensorlink::codec {

// Per-chunk payload codecs. The wire name travels in Chunk.compression.
enum class Compression {
  None,
  Gzip,
};

// "none" or "gzip".
const char* ToString(Compression compression);

// Accepts the wire names; an empty name is an uncompressed chunk.
std::optional<Compression> CompressionFromString(std::string_view name);

std::string Compress(Compression compression, std::string_view bytes);

/*
  Inverse of Compress.

  Throws util::IntegrityError when the bytes are not a valid stream for the
  codec or inflate to more than max_bytes.
*/
std::string Decompress(Compression compression, std::string_view bytes, std::size_t max_bytes);

} // namespace sensorlink::codec
