#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"

namespace market::core {

class ReputationTracker {
 public:
  explicit ReputationTracker(std::shared_ptr<market::db::Repository> repository);

  // Unknown providers read as the neutral default, score 50.
  market::db::model::ReputationRecord Get(market::db::Transaction& tx, const std::string& provider) const;

  /*
    Counts one more completed job:
      completed_jobs += 1, total_jobs += 1, total_earned += earned
      score = clamp(completed_jobs * 100 / total_jobs, 0, 100)
  */
  market::db::model::ReputationRecord RecordCompletion(market::db::Transaction& tx, const std::string& provider, uint64_t earned);

  static uint32_t Score(uint64_t completed_jobs, uint64_t total_jobs);

 private:
  std::shared_ptr<market::db::Repository> repository_;
};

} // namespace market::core
