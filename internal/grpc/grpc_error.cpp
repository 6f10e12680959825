#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace sensorlink::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace sensorlink::util;

  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const UnauthorizedSensor*>(&e)) {
    return {::grpc::StatusCode::UNAUTHENTICATED, e.what()};
  }
  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const IntegrityError*>(&e)) {
    return {::grpc::StatusCode::DATA_LOSS, e.what()};
  }
  if (dynamic_cast<const IncompleteEvent*>(&e) || dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const ResourceExhausted*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }
  if (dynamic_cast<const TransportError*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace sensorlink::grpc
