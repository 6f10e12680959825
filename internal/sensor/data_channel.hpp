#pragma once

#include <chrono>

#include "sensorlink/pipeline/v1.hpp"

namespace sensorlink::sensor {

/*
  Bulk path from the sensor to the collector's IngestEndpoint.

  Send throws util::TransportError for anything worth retrying (timeout,
  unreachable collector, server-side failure), util::UnauthorizedSensor when
  the credential is refused and util::InvalidArgument when the batch itself
  was rejected.
*/
class DataChannel {
 public:
  virtual ~DataChannel() = default;

  virtual sensorlink::pipeline::v1::IngestBatchResponse Send(const sensorlink::pipeline::v1::IngestBatchRequest& request,
                                                             std::chrono::milliseconds                         timeout) = 0;
};

} // namespace sensorlink::sensor
