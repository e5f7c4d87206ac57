#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "market/exchange/core/v1/types.pb.h"

namespace market::db::model {

struct JobRecord {
  uint64_t    id         = 0; // 0 = assign on insert
  uint64_t    auction_id = 0;
  std::string provider;
  std::string requester;

  uint64_t total_payment = 0;

  uint32_t milestone_count      = 0;
  uint32_t completed_milestones = 0; // monotonic, <= milestone_count

  std::optional<std::string> execution_proof;

  market::exchange::core::v1::JobStatus status = market::exchange::core::v1::JOB_STATUS_ACTIVE;

  uint64_t created_at_height = 0;
};

} // namespace market::db::model
