#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace sensorlink::util {

/*
  Identifier helpers.

  Event ids are 16 random bytes rendered as 32 lowercase hex chars.
  Session ids use the RFC4122 dashed form of the same randomness.
*/

using RandomId = std::array<uint8_t, 16>;

RandomId GenerateRandomId();

std::string GenerateEventId();
std::string GenerateSessionId();

std::string HexEncode(std::string_view bytes);
std::string ToDashedString(const RandomId& id);

} // namespace sensorlink::util
