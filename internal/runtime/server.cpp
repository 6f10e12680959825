#include "server.hpp"

#include <chrono>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace sensorlink::runtime {

namespace {

std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot read " + path);
  }
  std::ostringstream contents;
  contents << in.rdbuf();
  return contents.str();
}

std::shared_ptr<::grpc::ServerCredentials> BuildCredentials(const ServerOptions& options) {
  if (options.tls_cert_path.empty() || options.tls_key_path.empty()) {
    return ::grpc::InsecureServerCredentials();
  }

  ::grpc::SslServerCredentialsOptions ssl;
  ssl.pem_key_cert_pairs.push_back({ReadFile(options.tls_key_path), ReadFile(options.tls_cert_path)});
  if (!options.tls_ca_path.empty()) {
    ssl.pem_root_certs      = ReadFile(options.tls_ca_path);
    ssl.client_certificate_request = GRPC_SSL_REQUEST_AND_REQUIRE_CLIENT_CERTIFICATE_AND_VERIFY;
  }
  return ::grpc::SslServerCredentials(ssl);
}

} // namespace

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services, ServerOptions options)
    : bind_address_(std::move(bind_address)), services_(std::move(services)), options_(std::move(options)) {}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;

  builder.AddListeningPort(bind_address_, BuildCredentials(options_), &selected_port_);
  if (options_.max_message_bytes > 0) {
    builder.SetMaxReceiveMessageSize(options_.max_message_bytes);
    builder.SetMaxSendMessageSize(options_.max_message_bytes);
  }

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_) {
    throw std::runtime_error("Failed to start gRPC server on " + bind_address_);
  }

  SENSORLINK_LOG_INFO("gRPC server listening", {sensorlink::observability::StringField("bind_address", bind_address_),
                                                sensorlink::observability::IntField("port", selected_port_)});
}

void Server::Wait() {
  if (grpc_server_)
    grpc_server_->Wait();
}

void Server::Stop() {
  if (grpc_server_) {
    // open control and watch streams are cancelled after the deadline
    grpc_server_->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
    grpc_server_.reset();
  }
}

} // namespace sensorlink::runtime
