#pragma once

#include <memory>

#include "sqlite_db.hpp"

namespace sensorlink::db::sqlite {

// Sensor side: queue_entries + queue_state.
void BootstrapQueueSchema(const std::shared_ptr<SqliteDB>& sqlite_db);

// Collector side: chunks, events, sensor_offsets.
void BootstrapChunkStoreSchema(const std::shared_ptr<SqliteDB>& sqlite_db);

} // namespace sensorlink::db::sqlite
