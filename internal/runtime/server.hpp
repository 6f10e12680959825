#pragma once

#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace sensorlink::runtime {

struct ServerOptions {
  // 0 keeps the gRPC default
  int max_message_bytes = 0;
  // TLS is enabled when both cert and key are set
  std::string tls_cert_path;
  std::string tls_key_path;
  // requires client certificates when set
  std::string tls_ca_path;
};

class Server {
public:
  Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services, ServerOptions options = {});
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();
  void Stop();

  // Port actually bound, useful with "host:0".
  int Port() const { return selected_port_; }

private:
  std::string bind_address_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  ServerOptions options_;
  std::unique_ptr<::grpc::Server> grpc_server_;
  int selected_port_ = 0;
};

} // namespace sensorlink::runtime
