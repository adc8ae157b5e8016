#pragma once

#include <cstdint>

namespace sandbox::db::model {

// Singleton row read by every claim cycle.
struct QueueSettingsRecord {
  bool     paused      = false;
  uint32_t concurrency = 2;
};

} // namespace sandbox::db::model
