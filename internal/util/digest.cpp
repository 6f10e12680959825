#include "digest.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <stdexcept>

#include "internal/util/ids.hpp"

namespace sensorlink::util {

std::string Sha256(std::string_view data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  digest_len = 0;
  if (EVP_Digest(data.data(), data.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1 || digest_len != kSha256Bytes) {
    throw std::runtime_error("sha256: EVP_Digest failed");
  }
  return std::string(reinterpret_cast<const char*>(digest), digest_len);
}

std::string Sha256Hex(std::string_view data) {
  return HexEncode(Sha256(data));
}

bool ConstantTimeEquals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) {
    return false;
  }
  if (a.empty()) {
    return true;
  }
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace sensorlink::util
