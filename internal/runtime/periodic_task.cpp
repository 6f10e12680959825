#include "periodic_task.hpp"

#include "internal/observability/logging.hpp"

namespace sensorlink::runtime {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> fn)
    : name_(std::move(name)), interval_(interval), fn_(std::move(fn)) {}

PeriodicTask::~PeriodicTask() {
  Stop();
}

void PeriodicTask::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;
  running_ = true;
  thread_  = std::thread(&PeriodicTask::Run, this);
}

void PeriodicTask::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable())
    thread_.join();
}

void PeriodicTask::Run() {
  std::unique_lock lock(mutex_);
  while (running_) {
    if (cv_.wait_for(lock, interval_, [&] { return !running_; }))
      break;

    lock.unlock();
    try {
      fn_();
    } catch (const std::exception& e) {
      SENSORLINK_LOG_ERROR("Periodic task failed", {sensorlink::observability::StringField("task", name_),
                                                    sensorlink::observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace sensorlink::runtime
