#pragma once

#include <cstdint>
#include <string>

#include "sensorlink/pipeline/v1.hpp"
#include "service_context.hpp"

namespace sensorlink::service {

struct IngestLimits {
  uint32_t max_batch_chunks = 256;
  uint64_t max_batch_bytes  = 16 * 1024 * 1024;
  // reject batches from sensors without a live control session
  bool require_session = false;
};

/*
  Data channel endpoint.

  A malformed batch is rejected whole with util::InvalidArgument. A chunk
  whose hash does not match is reported in the response and not stored;
  the other chunks of the batch still go through.
*/
class IngestService {
 public:
  IngestService(ServiceContext ctx, IngestLimits limits = {});

  sensorlink::pipeline::v1::IngestBatchResponse IngestBatch(const std::string& bearer_token,
                                                            const sensorlink::pipeline::v1::IngestBatchRequest& req);

  const IngestLimits& Limits() const {
    return limits_;
  }

 private:
  void Validate(const sensorlink::pipeline::v1::IngestBatchRequest& req) const;

  ServiceContext ctx_;
  IngestLimits   limits_;
};

} // namespace sensorlink::service
