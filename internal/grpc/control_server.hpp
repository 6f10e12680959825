#pragma once

#include <memory>
#include <mutex>

#include <grpcpp/grpcpp.h>

#include "internal/control/control_session.hpp"
#include "internal/service/control_service.hpp"
#include "sensorlink/pipeline/v1.hpp"

namespace sensorlink::grpc {

using ControlStream = ::grpc::ServerReaderWriter<sensorlink::pipeline::v1::ServerMessage, sensorlink::pipeline::v1::SensorMessage>;
using ControlStreamInterface =
    ::grpc::ServerReaderWriterInterface<sensorlink::pipeline::v1::ServerMessage, sensorlink::pipeline::v1::SensorMessage>;

/*
  Control session bound to one Connect call. Writes are serialized; once the
  handler returns the session is detached and further writes fail.

  Cancel never waits on write_mutex_: a Write blocked on a slow peer is
  released by TryCancel, so the context has its own lock.
*/
class GrpcControlSession final : public sensorlink::control::ControlSession {
public:
  GrpcControlSession(std::string sensor_id, std::string session_id, ::grpc::ServerContext* context, ControlStreamInterface* stream);

  void Detach();

protected:
  bool Write(const sensorlink::pipeline::v1::ServerMessage& message) override;
  void Cancel() override;

private:
  std::mutex              write_mutex_;
  ControlStreamInterface* stream_;

  std::mutex             context_mutex_;
  ::grpc::ServerContext* context_;
};

class ControlServer final : public sensorlink::pipeline::v1::ControlService::Service {
public:
  explicit ControlServer(std::shared_ptr<sensorlink::service::ControlService> svc);

  ::grpc::Status Connect(::grpc::ServerContext*, ControlStream*) override;

private:
  std::shared_ptr<sensorlink::service::ControlService> service_;
};

} // namespace sensorlink::grpc
