#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "client/cpp/sensorlink_client.h"
#include "sensorlink/pipeline/v1.hpp"

using namespace sensorlink::pipeline::v1;
using sensorlink::client::SensorlinkClient;

static void Usage() {
  std::cout << "Usage:\n"
            << "  sensorlinkctl <addr> <reader_token> get <sensor_id>\n"
            << "  sensorlinkctl <addr> <reader_token> list\n"
            << "  sensorlinkctl <addr> <reader_token> watch\n"
            << "  sensorlinkctl <addr> <reader_token> request <sensor_id> [max_chunks] [max_bytes]\n";
}

static std::string HexDigest(const std::string& bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(bytes.size() * 2);
  for (unsigned char c : bytes) {
    out.push_back(kHex[c >> 4]);
    out.push_back(kHex[c & 0x0f]);
  }
  return out;
}

static void PrintSnapshot(const Snapshot& snapshot) {
  std::cout << "sensor=" << snapshot.sensor_id() << " event=" << snapshot.event_id() << " bytes=" << snapshot.total_bytes()
            << " chunks=" << snapshot.chunk_count() << " logical_ts=" << snapshot.logical_timestamp_ms() << " updated_at=" << snapshot.updated_at_ms()
            << " last_sequence=" << snapshot.last_sequence() << " sha256=" << HexDigest(snapshot.event_sha256()) << "\n";
}

int main(int argc, char** argv) {
  if (argc < 4) {
    Usage();
    return 1;
  }

  std::string addr  = argv[1];
  std::string token = argv[2];
  std::string cmd   = argv[3];

  auto channel = sensorlink::client::CreateChannel(addr);
  if (!channel.ok()) {
    std::cerr << channel.status().ToString() << "\n";
    return 1;
  }
  SensorlinkClient client(channel.MoveValueUnsafe(), token);

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 5) return 1;

    auto snapshot = client.GetSnapshot(argv[4]);
    if (!snapshot.ok()) {
      std::cerr << snapshot.status().ToString() << "\n";
      return 2;
    }

    PrintSnapshot(*snapshot);
    std::cout.write(snapshot->payload().data(), static_cast<std::streamsize>(snapshot->payload().size()));
    std::cout << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    auto list = client.ListSnapshots();
    if (!list.ok()) {
      std::cerr << list.status().ToString() << "\n";
      return 2;
    }

    for (const auto& snapshot : list->snapshots()) PrintSnapshot(snapshot);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "watch") {
    grpc::ClientContext ctx;
    auto                reader = client.WatchSnapshots(&ctx);

    SnapshotFeedMessage message;
    while (reader->Read(&message)) {
      if (message.type() == "snapshot_batch") {
        std::cout << "# batch of " << message.snapshots_size() << "\n";
        for (const auto& snapshot : message.snapshots()) PrintSnapshot(snapshot);
      } else {
        PrintSnapshot(message.snapshot());
      }
      std::cout.flush();
    }

    auto status = SensorlinkClient::FromGrpc(reader->Finish(), "WatchSnapshots");
    if (!status.ok()) {
      std::cerr << status.ToString() << "\n";
      return 2;
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "request") {
    if (argc < 5) return 1;

    RequestSensorRequest req;
    req.set_sensor_id(argv[4]);
    if (argc >= 6) req.set_max_chunks(static_cast<uint32_t>(std::stoul(argv[5])));
    if (argc >= 7) req.set_max_bytes(std::stoull(argv[6]));

    auto resp = client.RequestSensor(req);
    if (!resp.ok()) {
      std::cerr << resp.status().ToString() << "\n";
      return 2;
    }

    if (!resp->dispatched()) {
      std::cout << "not connected\n";
      return 0;
    }
    std::cout << "window=" << resp->window_id() << " since=" << resp->since_sequence() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
