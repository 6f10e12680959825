#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "control_session.hpp"

namespace sensorlink::control {

/*
  At most one live control session per sensor.

  Insert supersedes (and closes) an existing session for the same sensor.
  Remove is a no-op unless the registered session is the one passed in, so a
  late disconnect of a superseded stream never evicts its replacement.
*/
class SessionRegistry {
 public:
  // Returns the superseded session, already closed, or nullptr.
  std::shared_ptr<ControlSession> Insert(std::shared_ptr<ControlSession> session);

  bool Remove(const std::shared_ptr<ControlSession>& session);

  std::shared_ptr<ControlSession> Find(const std::string& sensor_id) const;

  std::vector<std::shared_ptr<ControlSession>> List() const;

  std::size_t Size() const;

  // Closes and drops every session (shutdown).
  void CloseAll();

 private:
  mutable std::mutex                                               mutex_;
  std::unordered_map<std::string, std::shared_ptr<ControlSession>> sessions_;
};

} // namespace sensorlink::control
