#include "control_server.hpp"

#include "call_metadata.hpp"
#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/ids.hpp"

namespace sensorlink::grpc {

using namespace sensorlink::pipeline::v1;
using sensorlink::observability::StringField;

GrpcControlSession::GrpcControlSession(std::string sensor_id, std::string session_id, ::grpc::ServerContext* context,
                                       ControlStreamInterface* stream)
    : ControlSession(std::move(sensor_id), std::move(session_id)), stream_(stream), context_(context) {}

void GrpcControlSession::Detach() {
  {
    std::lock_guard lock(context_mutex_);
    context_ = nullptr;
  }
  std::lock_guard lock(write_mutex_);
  stream_ = nullptr;
}

bool GrpcControlSession::Write(const ServerMessage& message) {
  std::lock_guard lock(write_mutex_);
  return stream_ && stream_->Write(message);
}

void GrpcControlSession::Cancel() {
  std::lock_guard lock(context_mutex_);
  if (context_) context_->TryCancel();
}

ControlServer::ControlServer(std::shared_ptr<sensorlink::service::ControlService> svc)
    : service_(std::move(svc)) {}

::grpc::Status ControlServer::Connect(::grpc::ServerContext* context, ControlStream* stream) {
  SensorMessage first;
  if (!stream->Read(&first)) {
    return ::grpc::Status(::grpc::StatusCode::CANCELLED, "stream closed before registration");
  }
  if (!first.has_registration()) {
    return ::grpc::Status(::grpc::StatusCode::INVALID_ARGUMENT, "first message must be a registration");
  }

  sensorlink::service::CallCredentials credentials;
  credentials.bearer_token = BearerToken(*context);
  credentials.sensor_id    = MetadataValue(*context, kSensorIdHeader);

  try {
    service_->Authenticate(first.registration(), credentials);
  } catch (const std::exception& e) {
    return ToStatus(e);
  }

  auto session = std::make_shared<GrpcControlSession>(first.registration().sensor_id(), sensorlink::util::GenerateSessionId(), context, stream);

  ::grpc::Status status = ::grpc::Status::OK;
  try {
    service_->Open(session, first.registration());

    SensorMessage message;
    while (!session->Closed() && stream->Read(&message)) {
      service_->HandleMessage(session, message);
    }
  } catch (const std::exception& e) {
    SENSORLINK_LOG_WARN("Control session failed", {StringField("sensor_id", session->SensorId()), StringField("error", e.what())});
    status = ToStatus(e);
  }

  session->Detach();
  service_->Close(session);
  return status;
}

} // namespace sensorlink::grpc
