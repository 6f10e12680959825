#include "session_registry.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace sensorlink::control {

using sensorlink::observability::StringField;

std::shared_ptr<ControlSession> SessionRegistry::Insert(std::shared_ptr<ControlSession> session) {
  std::shared_ptr<ControlSession> previous;
  std::size_t                     live = 0;
  {
    std::lock_guard lock(mutex_);
    auto&           slot = sessions_[session->SensorId()];
    previous             = std::move(slot);
    slot                 = std::move(session);
    live                 = sessions_.size();
  }

  sensorlink::observability::Metrics::Instance().SetLiveSessions(live);

  if (previous) {
    SENSORLINK_LOG_INFO("Superseding control session",
                        {StringField("sensor_id", previous->SensorId()), StringField("session_id", previous->SessionId())});
    previous->Close();
  }
  return previous;
}

bool SessionRegistry::Remove(const std::shared_ptr<ControlSession>& session) {
  std::size_t live = 0;
  {
    std::lock_guard lock(mutex_);
    auto            it = sessions_.find(session->SensorId());
    if (it == sessions_.end() || it->second != session) {
      return false;
    }
    sessions_.erase(it);
    live = sessions_.size();
  }

  sensorlink::observability::Metrics::Instance().SetLiveSessions(live);
  return true;
}

std::shared_ptr<ControlSession> SessionRegistry::Find(const std::string& sensor_id) const {
  std::lock_guard lock(mutex_);
  auto            it = sessions_.find(sensor_id);
  return it == sessions_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<ControlSession>> SessionRegistry::List() const {
  std::lock_guard                              lock(mutex_);
  std::vector<std::shared_ptr<ControlSession>> out;
  out.reserve(sessions_.size());
  for (const auto& [_, session] : sessions_) {
    out.push_back(session);
  }
  return out;
}

std::size_t SessionRegistry::Size() const {
  std::lock_guard lock(mutex_);
  return sessions_.size();
}

void SessionRegistry::CloseAll() {
  std::unordered_map<std::string, std::shared_ptr<ControlSession>> sessions;
  {
    std::lock_guard lock(mutex_);
    sessions.swap(sessions_);
  }
  for (auto& [_, session] : sessions) {
    session->Close();
  }
  sensorlink::observability::Metrics::Instance().SetLiveSessions(0);
}

} // namespace sensorlink::control
