#include "internal/grpc/control_server.hpp"

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <future>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace {

using namespace std::chrono_literals;
using sensorlink::grpc::ControlStreamInterface;
using sensorlink::grpc::GrpcControlSession;
using sensorlink::pipeline::v1::SensorMessage;
using sensorlink::pipeline::v1::ServerMessage;

// Write blocks until Release, like a stream whose peer stopped reading.
class StalledStream final : public ControlStreamInterface {
 public:
  void SendInitialMetadata() override {}

  bool Write(const ServerMessage&, ::grpc::WriteOptions) override {
    std::unique_lock lock(mutex_);
    ++writes_;
    cv_.notify_all();
    cv_.wait(lock, [&] { return released_; });
    return true;
  }

  bool NextMessageSize(uint32_t* size) override {
    *size = 0;
    return false;
  }
  bool Read(SensorMessage*) override {
    return false;
  }

  void WaitForWrite() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return writes_ > 0; });
  }

  void Release() {
    std::lock_guard lock(mutex_);
    released_ = true;
    cv_.notify_all();
  }

  int Writes() {
    std::lock_guard lock(mutex_);
    return writes_;
  }

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  int                     writes_   = 0;
  bool                    released_ = false;
};

ServerMessage Ack(const std::string& window_id) {
  ServerMessage message;
  message.mutable_ack()->set_window_id(window_id);
  return message;
}

void TestCloseDoesNotWaitForBlockedWrite() {
  StalledStream stream;
  auto          session = std::make_shared<GrpcControlSession>("sensor-a", "session-1", nullptr, &stream);

  std::thread sender([&] { session->Send(Ack("w-1")); });
  stream.WaitForWrite();

  auto       closing         = std::async(std::launch::async, [&] { session->Close(); });
  const bool closed_promptly = closing.wait_for(2s) == std::future_status::ready;

  stream.Release();
  closing.wait();
  sender.join();

  assert(closed_promptly);
  assert(session->Closed());
  assert(!session->Send(Ack("w-2")));
  assert(stream.Writes() == 1);
}

void TestDetachedSessionRefusesWrites() {
  StalledStream stream;
  stream.Release();
  auto session = std::make_shared<GrpcControlSession>("sensor-a", "session-2", nullptr, &stream);

  assert(session->Send(Ack("w-1")));
  session->Detach();
  assert(!session->Send(Ack("w-2")));
  assert(session->Closed());
  assert(stream.Writes() == 1);

  session->Close();  // no context left to cancel
}

} // namespace

int main() {
  TestCloseDoesNotWaitForBlockedWrite();
  TestDetachedSessionRefusesWrites();

  std::cout << "sensorlink_unit_grpc_control_session: pass\n";
  return 0;
}
