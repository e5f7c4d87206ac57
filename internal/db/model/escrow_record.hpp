#pragma once

#include <cstdint>

namespace market::db::model {

// One milestone's share of a job payment. Keyed by (job_id, milestone_index).
struct EscrowRecord {
  uint64_t job_id          = 0;
  uint32_t milestone_index = 0; // 1-based
  uint64_t amount          = 0;
  bool     released        = false;
};

} // namespace market::db::model
