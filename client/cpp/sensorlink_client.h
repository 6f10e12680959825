#pragma once

#include <arrow/result.h>
#include <arrow/status.h>
#include <grpcpp/channel.h>
#include <grpcpp/client_context.h>
#include <grpcpp/support/sync_stream.h>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include "sensorlink/pipeline/v1.hpp"

namespace sensorlink::client {

struct ChannelOptions {
  // TLS is used when ca_path is set; cert/key add a client certificate.
  std::string ca_path;
  std::string cert_path;
  std::string key_path;
  int         max_message_bytes = 0;
};

arrow::Result<std::shared_ptr<grpc::Channel>> CreateChannel(const std::string& address, const ChannelOptions& options = {});

/*
  Thin client over the three collector services.

  Failures come back as arrow::Status:
    UNAUTHENTICATED, PERMISSION_DENIED        -> KeyError
    NOT_FOUND                                 -> IndexError
    INVALID_ARGUMENT, FAILED_PRECONDITION     -> Invalid
    RESOURCE_EXHAUSTED                        -> CapacityError
    DATA_LOSS                                 -> SerializationError
    anything else                             -> IOError
*/
class SensorlinkClient {
 public:
  // token is a sensor credential (sensor_id set) or the reader token (sensor_id empty).
  SensorlinkClient(std::shared_ptr<grpc::Channel> channel, std::string token, std::string sensor_id = {});

  arrow::Result<sensorlink::pipeline::v1::IngestBatchResponse> IngestBatch(const sensorlink::pipeline::v1::IngestBatchRequest& request,
                                                                           std::chrono::milliseconds timeout = std::chrono::milliseconds{0}) const;

  // The context must outlive the stream and carry credentials (see Authorize).
  std::unique_ptr<grpc::ClientReaderWriter<sensorlink::pipeline::v1::SensorMessage, sensorlink::pipeline::v1::ServerMessage>> OpenControl(
      grpc::ClientContext* context) const;

  arrow::Result<sensorlink::pipeline::v1::Snapshot> GetSnapshot(const std::string& sensor_id) const;

  arrow::Result<sensorlink::pipeline::v1::ListSnapshotsResponse> ListSnapshots() const;

  std::unique_ptr<grpc::ClientReader<sensorlink::pipeline::v1::SnapshotFeedMessage>> WatchSnapshots(grpc::ClientContext* context) const;

  arrow::Result<sensorlink::pipeline::v1::RequestSensorResponse> RequestSensor(const sensorlink::pipeline::v1::RequestSensorRequest& request) const;

  // Adds the authorization and x-sensor-id headers of this client.
  void Authorize(grpc::ClientContext* context) const;

  static void Authorize(grpc::ClientContext* context, const std::string& token, const std::string& sensor_id);

  static arrow::Status FromGrpc(const grpc::Status& status, std::string_view action);

  const std::string& SensorId() const {
    return sensor_id_;
  }

 private:
  std::string token_;
  std::string sensor_id_;

  std::unique_ptr<sensorlink::pipeline::v1::ControlService::Stub>  control_stub_;
  std::unique_ptr<sensorlink::pipeline::v1::IngestService::Stub>   ingest_stub_;
  std::unique_ptr<sensorlink::pipeline::v1::SnapshotService::Stub> snapshot_stub_;
};

} // namespace sensorlink::client
