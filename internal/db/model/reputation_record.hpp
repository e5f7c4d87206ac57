#pragma once

#include <cstdint>
#include <string>

namespace market::db::model {

struct ReputationRecord {
  std::string provider;

  uint32_t score          = 50; // neutral prior until the first completed job
  uint64_t completed_jobs = 0;
  uint64_t total_jobs     = 0;
  uint64_t total_earned   = 0;
};

} // namespace market::db::model
