#pragma once

#include <memory>

#include "client/cpp/sensorlink_client.h"
#include "control_channel.hpp"
#include "data_channel.hpp"

namespace sensorlink::sensor {

/*
  Sensor transports over the gRPC client.

  arrow::Status failures from the client become the exceptions the
  dispatcher and control channel act on: KeyError is a refused credential,
  Invalid a rejected batch, everything else a retryable transport error.
*/
void ThrowIfTransportFailed(const arrow::Status& status);

class GrpcDataChannel final : public DataChannel {
 public:
  explicit GrpcDataChannel(std::shared_ptr<client::SensorlinkClient> client);

  sensorlink::pipeline::v1::IngestBatchResponse Send(const sensorlink::pipeline::v1::IngestBatchRequest& request,
                                                     std::chrono::milliseconds                         timeout) override;

 private:
  std::shared_ptr<client::SensorlinkClient> client_;
};

class GrpcControlConnector final : public ControlConnector {
 public:
  explicit GrpcControlConnector(std::shared_ptr<client::SensorlinkClient> client);

  std::unique_ptr<ControlStream> Open(const std::string& sensor_id, const std::string& token) override;

 private:
  std::shared_ptr<client::SensorlinkClient> client_;
};

} // namespace sensorlink::sensor
