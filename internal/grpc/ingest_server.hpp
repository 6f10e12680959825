#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/ingest_service.hpp"
#include "sensorlink/pipeline/v1.hpp"

namespace sensorlink::grpc {

class IngestServer final : public sensorlink::pipeline::v1::IngestService::Service {
public:
  explicit IngestServer(std::shared_ptr<sensorlink::service::IngestService> svc);

  ::grpc::Status IngestBatch(::grpc::ServerContext*,
                             const sensorlink::pipeline::v1::IngestBatchRequest*,
                             sensorlink::pipeline::v1::IngestBatchResponse*) override;

private:
  std::shared_ptr<sensorlink::service::IngestService> service_;
};

} // namespace sensorlink::grpc
