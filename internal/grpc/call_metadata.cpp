#include "call_metadata.hpp"

namespace sensorlink::grpc {

std::string MetadataValue(const ::grpc::ServerContext& context, std::string_view key) {
  const auto& metadata = context.client_metadata();
  auto        it       = metadata.find(::grpc::string_ref(key.data(), key.size()));
  if (it == metadata.end()) {
    return {};
  }
  return std::string(it->second.data(), it->second.size());
}

std::string BearerToken(const ::grpc::ServerContext& context) {
  static constexpr std::string_view kPrefix = "Bearer ";

  const auto value = MetadataValue(context, kAuthorizationHeader);
  if (value.size() <= kPrefix.size() || value.compare(0, kPrefix.size(), kPrefix) != 0) {
    return {};
  }
  return value.substr(kPrefix.size());
}

} // namespace sensorlink::grpc
