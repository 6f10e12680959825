#include "ingest_service.hpp"

#include <vector>

#include "internal/auth/sensor_registry.hpp"
#include "internal/codec/compression.hpp"
#include "internal/control/session_registry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/chunk_store.hpp"
#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace sensorlink::service {

using namespace sensorlink::pipeline::v1;
using sensorlink::observability::IntField;
using sensorlink::observability::StringField;
using sensorlink::observability::UintField;

IngestService::IngestService(ServiceContext ctx, IngestLimits limits) : ctx_(std::move(ctx)), limits_(limits) {
}

void IngestService::Validate(const IngestBatchRequest& req) const {
  if (req.chunks_size() > static_cast<int>(limits_.max_batch_chunks)) {
    throw sensorlink::util::InvalidArgument("ingest: batch of " + std::to_string(req.chunks_size()) + " chunks exceeds limit " +
                                            std::to_string(limits_.max_batch_chunks));
  }

  uint64_t total_bytes   = 0;
  uint64_t last_sequence = 0;
  for (const auto& chunk : req.chunks()) {
    const std::string where = "ingest: chunk " + std::to_string(chunk.sequence()) + ": ";

    if (chunk.sensor_id() != req.sensor_id()) {
      throw sensorlink::util::InvalidArgument(where + "belongs to sensor '" + chunk.sensor_id() + "'");
    }
    if (chunk.sequence() == 0) {
      throw sensorlink::util::InvalidArgument(where + "sequence must be positive");
    }
    if (chunk.sequence() <= last_sequence) {
      throw sensorlink::util::InvalidArgument(where + "sequences must be strictly increasing");
    }
    if (chunk.event_id().empty()) {
      throw sensorlink::util::InvalidArgument(where + "missing event_id");
    }
    if (chunk.chunk_index() >= chunk.chunk_count()) {
      throw sensorlink::util::InvalidArgument(where + "chunk_index " + std::to_string(chunk.chunk_index()) + " >= chunk_count " +
                                              std::to_string(chunk.chunk_count()));
    }
    if (chunk.chunk_sha256().size() != sensorlink::util::kSha256Bytes || chunk.event_sha256().size() != sensorlink::util::kSha256Bytes) {
      throw sensorlink::util::InvalidArgument(where + "hashes must be 32 byte SHA-256 digests");
    }
    if (!sensorlink::codec::CompressionFromString(chunk.compression()).has_value()) {
      throw sensorlink::util::InvalidArgument(where + "unsupported compression '" + chunk.compression() + "'");
    }
    last_sequence = chunk.sequence();
    total_bytes += chunk.payload().size();
  }

  if (total_bytes > limits_.max_batch_bytes) {
    throw sensorlink::util::InvalidArgument("ingest: batch of " + std::to_string(total_bytes) + " bytes exceeds limit " +
                                            std::to_string(limits_.max_batch_bytes));
  }
}

IngestBatchResponse IngestService::IngestBatch(const std::string& bearer_token, const IngestBatchRequest& req) {
  return ObserveRpc("IngestService.IngestBatch", req.sensor_id(), [&] {
    if (req.sensor_id().empty()) {
      throw sensorlink::util::InvalidArgument("ingest: sensor_id is required");
    }
    ctx_.sensors->Authenticate(req.sensor_id(), bearer_token);

    auto session = ctx_.sessions->Find(req.sensor_id());
    if (limits_.require_session && !session) {
      throw sensorlink::util::InvalidState("ingest: sensor " + req.sensor_id() + " has no live control session");
    }

    Validate(req);

    IngestBatchResponse resp;
    resp.set_window_id(req.window_id());

    std::vector<Chunk> chunks(req.chunks().begin(), req.chunks().end());
    const auto         batch = ctx_.chunk_store->WriteBatch(req.sensor_id(), chunks);

    for (const auto& result : batch.results) {
      switch (result.outcome) {
        case sensorlink::store::WriteOutcome::Accepted:
          resp.add_accepted(result.sequence);
          break;
        case sensorlink::store::WriteOutcome::DuplicateIgnored:
          resp.add_duplicates(result.sequence);
          break;
        case sensorlink::store::WriteOutcome::IntegrityError: {
          auto* error = resp.add_errors();
          error->set_sequence(result.sequence);
          error->set_reason(result.reason);
          SENSORLINK_LOG_WARN("Chunk rejected", {StringField("sensor_id", req.sensor_id()), UintField("sequence", result.sequence),
                                                 StringField("reason", result.reason)});
          break;
        }
      }
    }
    resp.set_committed_sequence(batch.committed_sequence);
    resp.set_received_sequence(batch.received_sequence);

    SENSORLINK_LOG_DEBUG("Batch ingested", {StringField("sensor_id", req.sensor_id()), StringField("window_id", req.window_id()),
                                            IntField("accepted", resp.accepted_size()), IntField("duplicates", resp.duplicates_size()),
                                            IntField("errors", resp.errors_size()), UintField("committed_sequence", batch.committed_sequence)});

    if (session) {
      ServerMessage ack;
      ack.mutable_ack()->set_window_id(req.window_id());
      ack.mutable_ack()->set_committed_upto_sequence(batch.committed_sequence);
      session->Send(ack);
      session->ClearOutstandingWindow(req.window_id());
    }
    return resp;
  });
}

} // namespace sensorlink::service
