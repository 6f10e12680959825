#include "grpc_transport.hpp"

#include "internal/util/errors.hpp"

namespace sensorlink::sensor {

using namespace sensorlink::pipeline::v1;

namespace {

class GrpcControlStream final : public ControlStream {
 public:
  GrpcControlStream(std::unique_ptr<grpc::ClientContext> context, std::unique_ptr<grpc::ClientReaderWriter<SensorMessage, ServerMessage>> stream)
      : context_(std::move(context)), stream_(std::move(stream)) {}

  bool Write(const SensorMessage& message) override {
    return stream_->Write(message);
  }

  bool Read(ServerMessage* message) override {
    return stream_->Read(message);
  }

  void Finish() override {
    stream_->WritesDone();
    ThrowIfTransportFailed(client::SensorlinkClient::FromGrpc(stream_->Finish(), "Connect"));
  }

  void Cancel() override {
    context_->TryCancel();
  }

 private:
  std::unique_ptr<grpc::ClientContext>                                     context_;
  std::unique_ptr<grpc::ClientReaderWriter<SensorMessage, ServerMessage>> stream_;
};

} // namespace

void ThrowIfTransportFailed(const arrow::Status& status) {
  if (status.ok()) {
    return;
  }
  if (status.IsKeyError()) {
    throw util::UnauthorizedSensor(status.message());
  }
  if (status.IsInvalid()) {
    throw util::InvalidArgument(status.message());
  }
  throw util::TransportError(status.ToString());
}

GrpcDataChannel::GrpcDataChannel(std::shared_ptr<client::SensorlinkClient> client) : client_(std::move(client)) {}

IngestBatchResponse GrpcDataChannel::Send(const IngestBatchRequest& request, std::chrono::milliseconds timeout) {
  auto result = client_->IngestBatch(request, timeout);
  ThrowIfTransportFailed(result.status());
  return std::move(result).ValueOrDie();
}

GrpcControlConnector::GrpcControlConnector(std::shared_ptr<client::SensorlinkClient> client) : client_(std::move(client)) {}

std::unique_ptr<ControlStream> GrpcControlConnector::Open(const std::string& sensor_id, const std::string& token) {
  auto context = std::make_unique<grpc::ClientContext>();
  client::SensorlinkClient::Authorize(context.get(), token, sensor_id);

  auto stream = client_->OpenControl(context.get());
  if (!stream) {
    throw util::TransportError("control stream could not be opened");
  }
  return std::make_unique<GrpcControlStream>(std::move(context), std::move(stream));
}

} // namespace sensorlink::sensor
