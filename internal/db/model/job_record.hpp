#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/state_machine.hpp"

namespace sandbox::db::model {

/*
  Persistent job row.

  - Lock fields are set iff state == running.
  - dedupe_active marks the row as holding its dedupe_key slot; terminal
    transitions clear it so the key can be reused.
  - project_id and dedupe_key are empty when absent (stored as NULL).
*/
struct JobRecord {
  std::string                id;
  std::string                type;
  sandbox::model::JobState   state = sandbox::model::JobState::kQueued;
  std::string                project_id;
  std::string                payload_json = "{}";
  int32_t                    priority     = 0;
  uint32_t                   attempts     = 0;
  uint32_t                   max_attempts = 3;
  uint64_t                   run_at_ms    = 0;
  std::optional<uint64_t>    locked_at_ms;
  std::optional<uint64_t>    lock_expires_at_ms;
  std::string                locked_by;
  std::string                dedupe_key;
  bool                       dedupe_active = false;
  std::optional<uint64_t>    cancel_requested_at_ms;
  std::optional<uint64_t>    cancelled_at_ms;
  std::string                last_error;
  uint64_t                   created_at_ms = 0;
  uint64_t                   updated_at_ms = 0;

  void ClearLock() {
    locked_at_ms.reset();
    lock_expires_at_ms.reset();
    locked_by.clear();
  }
};

} // namespace sandbox::db::model
