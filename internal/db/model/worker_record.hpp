#pragma once

#include <cstdint>
#include <string>

namespace jobq::db::model {

/*
  One row per worker process. Upserted by every heartbeat, never deleted;
  liveness is inferred from last_seen_ms.
*/
struct WorkerRecord {
  std::string id;
  std::string worker_type;
  std::string storage_name;
  uint64_t    last_seen_ms = 0;
};

}
