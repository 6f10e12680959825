#include "sensor_registry.hpp"

#include <algorithm>
#include <mutex>

#include "config/config.pb.h"
#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"

namespace sensorlink::auth {

void SensorRegistry::Load(const sensorlink::runtime::config::ServerConfig& config) {
  for (const auto& sensor : config.auth().sensors()) {
    if (sensor.id().empty()) {
      throw sensorlink::util::InvalidArgument("auth.sensors: entry without id");
    }
    Upsert(sensor.id(), sensor.token());
    if (sensor.revoked()) {
      Revoke(sensor.id());
    }
  }
  SetReaderToken(config.auth().reader_token());
}

void SensorRegistry::Authenticate(const std::string& sensor_id, const std::string& token) const {
  std::shared_lock lock(mutex_);

  auto it = sensors_.find(sensor_id);
  if (it == sensors_.end()) {
    throw sensorlink::util::UnauthorizedSensor("unknown sensor: " + sensor_id);
  }
  if (it->second.revoked) {
    throw sensorlink::util::UnauthorizedSensor("credential revoked for sensor: " + sensor_id);
  }
  if (!sensorlink::util::ConstantTimeEquals(sensorlink::util::Sha256(token), it->second.token_digest)) {
    throw sensorlink::util::UnauthorizedSensor("credential mismatch for sensor: " + sensor_id);
  }
}

void SensorRegistry::Upsert(const std::string& sensor_id, const std::string& token) {
  std::unique_lock lock(mutex_);
  sensors_[sensor_id] = Entry{sensorlink::util::Sha256(token), false};
}

void SensorRegistry::Revoke(const std::string& sensor_id) {
  std::unique_lock lock(mutex_);
  auto             it = sensors_.find(sensor_id);
  if (it != sensors_.end()) {
    it->second.revoked = true;
  }
}

bool SensorRegistry::IsKnown(const std::string& sensor_id) const {
  std::shared_lock lock(mutex_);
  auto             it = sensors_.find(sensor_id);
  return it != sensors_.end() && !it->second.revoked;
}

void SensorRegistry::SetReaderToken(const std::string& token) {
  std::unique_lock lock(mutex_);
  reader_token_digest_ = token.empty() ? std::string{} : sensorlink::util::Sha256(token);
}

void SensorRegistry::AuthenticateReader(const std::string& token) const {
  std::shared_lock lock(mutex_);
  if (reader_token_digest_.empty()) {
    return;
  }
  if (!sensorlink::util::ConstantTimeEquals(sensorlink::util::Sha256(token), reader_token_digest_)) {
    throw sensorlink::util::UnauthorizedSensor("invalid reader token");
  }
}

std::vector<std::string> SensorRegistry::SensorIds() const {
  std::shared_lock         lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(sensors_.size());
  for (const auto& [id, _] : sensors_) {
    ids.push_back(id);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

} // namespace sensorlink::auth
