#pragma once

#include <string>
#include <string_view>

#include <grpcpp/grpcpp.h>

namespace sensorlink::grpc {

inline constexpr std::string_view kAuthorizationHeader = "authorization";
inline constexpr std::string_view kSensorIdHeader      = "x-sensor-id";

// First value of a client metadata key, empty when absent.
std::string MetadataValue(const ::grpc::ServerContext& context, std::string_view key);

// Token from "authorization: Bearer <token>", empty when absent or malformed.
std::string BearerToken(const ::grpc::ServerContext& context);

} // namespace sensorlink::grpc
