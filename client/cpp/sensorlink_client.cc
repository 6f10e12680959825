#include "client/cpp/sensorlink_client.h"

#include <fstream>
#include <iterator>
#include <string>

#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>
#include <grpcpp/support/channel_arguments.h>

namespace sensorlink::client {

using namespace sensorlink::pipeline::v1;

namespace {

constexpr char kAuthorizationHeader[] = "authorization";
constexpr char kSensorIdHeader[]      = "x-sensor-id";

arrow::Result<std::string> ReadPem(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return arrow::Status::IOError("failed to open ", path);
  }
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace

arrow::Result<std::shared_ptr<grpc::Channel>> CreateChannel(const std::string& address, const ChannelOptions& options) {
  if (address.empty()) {
    return arrow::Status::Invalid("collector address is empty");
  }

  grpc::ChannelArguments args;
  if (options.max_message_bytes > 0) {
    args.SetMaxReceiveMessageSize(options.max_message_bytes);
    args.SetMaxSendMessageSize(options.max_message_bytes);
  }

  std::shared_ptr<grpc::ChannelCredentials> credentials;
  if (options.ca_path.empty()) {
    credentials = grpc::InsecureChannelCredentials();
  } else {
    grpc::SslCredentialsOptions ssl;
    ARROW_ASSIGN_OR_RAISE(ssl.pem_root_certs, ReadPem(options.ca_path));
    if (!options.cert_path.empty()) {
      ARROW_ASSIGN_OR_RAISE(ssl.pem_cert_chain, ReadPem(options.cert_path));
      ARROW_ASSIGN_OR_RAISE(ssl.pem_private_key, ReadPem(options.key_path));
    }
    credentials = grpc::SslCredentials(ssl);
  }

  return grpc::CreateCustomChannel(address, credentials, args);
}

SensorlinkClient::SensorlinkClient(std::shared_ptr<grpc::Channel> channel, std::string token, std::string sensor_id)
    : token_(std::move(token)),
      sensor_id_(std::move(sensor_id)),
      control_stub_(ControlService::NewStub(channel)),
      ingest_stub_(IngestService::NewStub(channel)),
      snapshot_stub_(SnapshotService::NewStub(channel)) {}

arrow::Status SensorlinkClient::FromGrpc(const grpc::Status& status, std::string_view action) {
  if (status.ok()) {
    return arrow::Status::OK();
  }

  const std::string what(action);
  switch (status.error_code()) {
    case grpc::StatusCode::UNAUTHENTICATED:
    case grpc::StatusCode::PERMISSION_DENIED:
      return arrow::Status::KeyError(what, " unauthorized: ", status.error_message());
    case grpc::StatusCode::NOT_FOUND:
      return arrow::Status::IndexError(what, " not found: ", status.error_message());
    case grpc::StatusCode::INVALID_ARGUMENT:
    case grpc::StatusCode::FAILED_PRECONDITION:
      return arrow::Status::Invalid(what, " rejected: ", status.error_message());
    case grpc::StatusCode::RESOURCE_EXHAUSTED:
      return arrow::Status::CapacityError(what, " failed: ", status.error_message());
    case grpc::StatusCode::DATA_LOSS:
      return arrow::Status::SerializationError(what, " failed: ", status.error_message());
    default:
      return arrow::Status::IOError(what, " failed: ", status.error_message());
  }
}

void SensorlinkClient::Authorize(grpc::ClientContext* context, const std::string& token, const std::string& sensor_id) {
  if (!token.empty()) {
    context->AddMetadata(kAuthorizationHeader, "Bearer " + token);
  }
  if (!sensor_id.empty()) {
    context->AddMetadata(kSensorIdHeader, sensor_id);
  }
}

void SensorlinkClient::Authorize(grpc::ClientContext* context) const {
  Authorize(context, token_, sensor_id_);
}

arrow::Result<IngestBatchResponse> SensorlinkClient::IngestBatch(const IngestBatchRequest& request, std::chrono::milliseconds timeout) const {
  IngestBatchResponse response;
  grpc::ClientContext ctx;
  Authorize(&ctx);
  if (timeout.count() > 0) {
    ctx.set_deadline(std::chrono::system_clock::now() + timeout);
  }

  ARROW_RETURN_NOT_OK(FromGrpc(ingest_stub_->IngestBatch(&ctx, request, &response), "IngestBatch"));
  return response;
}

std::unique_ptr<grpc::ClientReaderWriter<SensorMessage, ServerMessage>> SensorlinkClient::OpenControl(grpc::ClientContext* context) const {
  return control_stub_->Connect(context);
}

arrow::Result<Snapshot> SensorlinkClient::GetSnapshot(const std::string& sensor_id) const {
  GetSnapshotRequest request;
  request.set_sensor_id(sensor_id);

  GetSnapshotResponse response;
  grpc::ClientContext ctx;
  Authorize(&ctx);

  ARROW_RETURN_NOT_OK(FromGrpc(snapshot_stub_->GetSnapshot(&ctx, request, &response), "GetSnapshot"));
  return response.snapshot();
}

arrow::Result<ListSnapshotsResponse> SensorlinkClient::ListSnapshots() const {
  ListSnapshotsRequest  request;
  ListSnapshotsResponse response;
  grpc::ClientContext   ctx;
  Authorize(&ctx);

  ARROW_RETURN_NOT_OK(FromGrpc(snapshot_stub_->ListSnapshots(&ctx, request, &response), "ListSnapshots"));
  return response;
}

std::unique_ptr<grpc::ClientReader<SnapshotFeedMessage>> SensorlinkClient::WatchSnapshots(grpc::ClientContext* context) const {
  Authorize(context);
  return snapshot_stub_->WatchSnapshots(context, WatchSnapshotsRequest{});
}

arrow::Result<RequestSensorResponse> SensorlinkClient::RequestSensor(const RequestSensorRequest& request) const {
  RequestSensorResponse response;
  grpc::ClientContext   ctx;
  Authorize(&ctx);

  ARROW_RETURN_NOT_OK(FromGrpc(snapshot_stub_->RequestSensor(&ctx, request, &response), "RequestSensor"));
  return response;
}

} // namespace sensorlink::client
