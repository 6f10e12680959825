#pragma once

#include <memory>

namespace sensorlink::store { class ChunkStore; class OffsetTracker; }
namespace sensorlink::snapshot { class SnapshotCache; }
namespace sensorlink::auth { class SensorRegistry; }
namespace sensorlink::control { class SessionRegistry; }

namespace sensorlink::service {

class RequestScheduler;

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<sensorlink::store::ChunkStore> chunk_store;
  std::shared_ptr<sensorlink::store::OffsetTracker> offsets;
  std::shared_ptr<sensorlink::snapshot::SnapshotCache> snapshots;
  std::shared_ptr<sensorlink::auth::SensorRegistry> sensors;
  std::shared_ptr<sensorlink::control::SessionRegistry> sessions;
  std::shared_ptr<RequestScheduler> scheduler;
};

}
