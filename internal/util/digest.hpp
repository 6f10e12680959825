#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace sensorlink::util {

inline constexpr std::size_t kSha256Bytes = 32;

// Raw 32 byte SHA-256 digest of data.
std::string Sha256(std::string_view data);

// Lowercase hex rendering of Sha256(data).
std::string Sha256Hex(std::string_view data);

// Comparison whose running time does not depend on where the inputs differ.
bool ConstantTimeEquals(std::string_view a, std::string_view b);

} // namespace sensorlink::util
