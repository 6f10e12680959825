#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace sensorlink::runtime {

/*
  Background thread that runs a callback every interval until stopped.

  Exceptions thrown by the callback are logged and the task keeps running.
*/
class PeriodicTask {
 public:
  PeriodicTask(std::string name, std::chrono::milliseconds interval, std::function<void()> fn);
  ~PeriodicTask();

  PeriodicTask(const PeriodicTask&)            = delete;
  PeriodicTask& operator=(const PeriodicTask&) = delete;

  void Start();
  void Stop();

 private:
  void Run();

  std::string               name_;
  std::chrono::milliseconds interval_;
  std::function<void()>     fn_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
  std::thread             thread_;
};

} // namespace sensorlink::runtime
