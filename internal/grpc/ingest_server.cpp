#include "ingest_server.hpp"

#include "call_metadata.hpp"
#include "grpc_error.hpp"

namespace sensorlink::grpc {

IngestServer::IngestServer(std::shared_ptr<sensorlink::service::IngestService> svc)
    : service_(std::move(svc)) {}

::grpc::Status IngestServer::IngestBatch(::grpc::ServerContext* context,
                                         const sensorlink::pipeline::v1::IngestBatchRequest* req,
                                         sensorlink::pipeline::v1::IngestBatchResponse* resp) {
  try {
    *resp = service_->IngestBatch(BearerToken(*context), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace sensorlink::grpc
