#include "compression.hpp"

#include <zlib.h>

#include <algorithm>

#include "internal/util/errors.hpp"

namespace sensorlink::codec {

namespace {

// windowBits + 16 selects the gzip wrapper in deflateInit2/inflateInit2.
constexpr int kGzipWindowBits = 15 + 16;
constexpr int kMemLevel       = 8;

constexpr std::size_t kInflateStep = 64 * 1024;

std::string GzipCompress(std::string_view bytes) {
  z_stream stream{};
  if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits, kMemLevel, Z_DEFAULT_STRATEGY) != Z_OK) {
    throw util::InvalidState("gzip: deflateInit2 failed");
  }

  std::string out(deflateBound(&stream, static_cast<uLong>(bytes.size())), '\0');
  stream.next_in   = reinterpret_cast<Bytef*>(const_cast<char*>(bytes.data()));
  stream.avail_in  = static_cast<uInt>(bytes.size());
  stream.next_out  = reinterpret_cast<Bytef*>(out.data());
  stream.avail_out = static_cast<uInt>(out.size());

  const int rc = deflate(&stream, Z_FINISH);
  deflateEnd(&stream);
  if (rc != Z_STREAM_END) {
    throw util::InvalidState("gzip: deflate did not finish (" + std::to_string(rc) + ")");
  }

  out.resize(stream.total_out);
  return out;
}

std::string GzipDecompress(std::string_view bytes, std::size_t max_bytes) {
  z_stream stream{};
  if (inflateInit2(&stream, kGzipWindowBits) != Z_OK) {
    throw util::InvalidState("gzip: inflateInit2 failed");
  }

  stream.next_in  = reinterpret_cast<Bytef*>(const_cast<char*>(bytes.data()));
  stream.avail_in = static_cast<uInt>(bytes.size());

  std::string out;
  int         rc = Z_OK;
  while (rc != Z_STREAM_END) {
    const std::size_t produced = out.size();
    if (produced > max_bytes) {
      break;
    }
    out.resize(produced + std::min(kInflateStep, max_bytes - produced + 1));
    stream.next_out  = reinterpret_cast<Bytef*>(out.data() + produced);
    stream.avail_out = static_cast<uInt>(out.size() - produced);

    rc = inflate(&stream, Z_NO_FLUSH);
    out.resize(stream.total_out);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      break;
    }
    if (rc == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
      // input ended before the gzip trailer
      rc = Z_DATA_ERROR;
      break;
    }
  }
  inflateEnd(&stream);

  if (out.size() > max_bytes) {
    throw util::IntegrityError("gzip: chunk inflates beyond " + std::to_string(max_bytes) + " bytes");
  }
  if (rc != Z_STREAM_END) {
    throw util::IntegrityError("gzip: corrupt stream (" + std::to_string(rc) + ")");
  }
  return out;
}

} // namespace

const char* ToString(Compression compression) {
  switch (compression) {
    case Compression::None:
      return "none";
    case Compression::Gzip:
      return "gzip";
  }
  return "unknown";
}

std::optional<Compression> CompressionFromString(std::string_view name) {
  if (name.empty() || name == "none") {
    return Compression::None;
  }
  if (name == "gzip") {
    return Compression::Gzip;
  }
  return std::nullopt;
}

std::string Compress(Compression compression, std::string_view bytes) {
  switch (compression) {
    case Compression::None:
      return std::string(bytes);
    case Compression::Gzip:
      return GzipCompress(bytes);
  }
  throw util::InvalidArgument("unsupported compression");
}

std::string Decompress(Compression compression, std::string_view bytes, std::size_t max_bytes) {
  switch (compression) {
    case Compression::None:
      if (bytes.size() > max_bytes) {
        throw util::IntegrityError("chunk exceeds " + std::to_string(max_bytes) + " bytes");
      }
      return std::string(bytes);
    case Compression::Gzip:
      return GzipDecompress(bytes, max_bytes);
  }
  throw util::InvalidArgument("unsupported compression");
}

} // namespace sensorlink::codec
