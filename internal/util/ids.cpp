#include "ids.hpp"

#include <random>

namespace sensorlink::util {

namespace {

constexpr char kHex[] = "0123456789abcdef";

} // namespace

RandomId GenerateRandomId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  RandomId id{};
  for (auto& b : id)
    b = static_cast<uint8_t>(rng());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string GenerateEventId() {
  const auto id = GenerateRandomId();
  return HexEncode(std::string_view(reinterpret_cast<const char*>(id.data()), id.size()));
}

std::string GenerateSessionId() {
  return ToDashedString(GenerateRandomId());
}

std::string HexEncode(std::string_view bytes) {
  std::string out;
  out.reserve(bytes.size() * 2);
  for (unsigned char c : bytes) {
    out.push_back(kHex[(c >> 4) & 0x0F]);
    out.push_back(kHex[c & 0x0F]);
  }
  return out;
}

std::string ToDashedString(const RandomId& id) {
  std::string out;
  out.reserve(36);
  for (size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(kHex[(id[i] >> 4) & 0x0F]);
    out.push_back(kHex[id[i] & 0x0F]);
  }
  return out;
}

} // namespace sensorlink::util
