#include "internal/core/reputation_tracker.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

#include "internal/core/db_errors.hpp"
#include "internal/core/market_constants.hpp"

namespace market::core {

ReputationTracker::ReputationTracker(std::shared_ptr<market::db::Repository> repository) : repository_(std::move(repository)) {
}

market::db::model::ReputationRecord ReputationTracker::Get(market::db::Transaction& tx, const std::string& provider) const {
  if (auto record = repository_->GetReputation(tx, provider)) {
    return *record;
  }

  market::db::model::ReputationRecord fresh;
  fresh.provider = provider;
  fresh.score    = kDefaultReputationScore;
  return fresh;
}

uint32_t ReputationTracker::Score(uint64_t completed_jobs, uint64_t total_jobs) {
  if (total_jobs == 0) {
    return kDefaultReputationScore;
  }
  const uint64_t ratio = completed_jobs * 100 / total_jobs;
  return static_cast<uint32_t>(std::clamp<uint64_t>(ratio, 0, 100));
}

market::db::model::ReputationRecord ReputationTracker::RecordCompletion(market::db::Transaction& tx, const std::string& provider,
                                                                          uint64_t earned) {
  auto record = Get(tx, provider);
  if (earned > std::numeric_limits<uint64_t>::max() - record.total_earned) {
    throw std::overflow_error("reputation earnings overflow for " + provider);
  }

  record.completed_jobs += 1;
  record.total_jobs += 1;
  record.total_earned += earned;
  record.score = Score(record.completed_jobs, record.total_jobs);

  ThrowIfDbError(repository_->UpsertReputation(tx, record), "update reputation " + provider);
  return record;
}

} // namespace market::core
