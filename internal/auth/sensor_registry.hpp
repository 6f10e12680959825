#pragma once

#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace sensorlink::runtime::config {
class ServerConfig;
}

namespace sensorlink::auth {

/*
  Known sensors and their credentials.

  Only SHA-256 digests of tokens are held. Comparisons run in constant time.
  Rotation is Upsert with the new token; Revoke keeps the entry so a revoked
  sensor is told apart from an unknown one in logs.
*/
class SensorRegistry {
 public:
  SensorRegistry() = default;

  // Adds auth.sensors and auth.reader_token. Throws util::InvalidArgument.
  void Load(const sensorlink::runtime::config::ServerConfig& config);

  // Throws util::UnauthorizedSensor for unknown, revoked or mismatched credentials.
  void Authenticate(const std::string& sensor_id, const std::string& token) const;

  void Upsert(const std::string& sensor_id, const std::string& token);
  void Revoke(const std::string& sensor_id);

  bool IsKnown(const std::string& sensor_id) const;

  // An empty reader token disables consumer authentication.
  void SetReaderToken(const std::string& token);
  // Throws util::UnauthorizedSensor.
  void AuthenticateReader(const std::string& token) const;

  std::vector<std::string> SensorIds() const;

 private:
  struct Entry {
    std::string token_digest;
    bool        revoked = false;
  };

  mutable std::shared_mutex              mutex_;
  std::unordered_map<std::string, Entry> sensors_;
  std::string                            reader_token_digest_;
};

} // namespace sensorlink::auth
