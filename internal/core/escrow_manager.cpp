#include "internal/core/escrow_manager.hpp"

#include <stdexcept>

#include "internal/core/account_ledger.hpp"
#include "internal/core/db_errors.hpp"
#include "internal/core/market_constants.hpp"
#include "internal/core/reputation_tracker.hpp"
#include "internal/core/treasury.hpp"
#include "internal/util/errors.hpp"
#include "market/exchange/v1.hpp"

namespace market::core {

using market::exchange::v1::JOB_STATUS_ACTIVE;
using market::exchange::v1::JOB_STATUS_COMPLETED;

EscrowManager::EscrowManager(std::shared_ptr<market::db::Repository> repository, AccountLedger& ledger, Treasury& treasury,
                             ReputationTracker& reputation)
    : repository_(std::move(repository)), ledger_(ledger), treasury_(treasury), reputation_(reputation) {
}

std::vector<uint64_t> EscrowManager::Partition(uint64_t total, uint32_t milestone_count) {
  if (milestone_count == 0) {
    throw std::invalid_argument("milestone count must be at least 1");
  }

  const uint64_t        share = total / milestone_count;
  std::vector<uint64_t> shares(milestone_count, share);
  shares.back() = total - share * (milestone_count - 1);
  return shares;
}

uint64_t EscrowManager::PlatformFee(uint64_t amount) {
  // amount * 25 / 1000 without overflowing the intermediate product
  return amount / 1000 * kPlatformFeePerMille + amount % 1000 * kPlatformFeePerMille / 1000;
}

market::db::model::JobRecord EscrowManager::OpenJob(market::db::Transaction& tx, const market::db::model::AuctionRecord& settled,
                                                    uint64_t height) {
  if (!settled.current_bidder) {
    throw std::logic_error("open job: auction " + std::to_string(settled.id) + " has no winner");
  }

  market::db::model::JobRecord job;
  job.auction_id           = settled.id;
  job.provider             = *settled.current_bidder;
  job.requester            = settled.requester;
  job.total_payment        = settled.current_bid;
  job.milestone_count      = kMilestoneCount;
  job.completed_milestones = 0;
  job.status               = JOB_STATUS_ACTIVE;
  job.created_at_height    = height;

  ThrowIfDbError(repository_->InsertJob(tx, job), "open job for auction " + std::to_string(settled.id));
  SetupEscrow(tx, job.id, job.total_payment, job.milestone_count);
  return job;
}

void EscrowManager::SetupEscrow(market::db::Transaction& tx, uint64_t job_id, uint64_t total, uint32_t milestone_count) {
  const auto shares = Partition(total, milestone_count);
  for (uint32_t i = 0; i < milestone_count; ++i) {
    market::db::model::EscrowRecord entry;
    entry.job_id          = job_id;
    entry.milestone_index = i + 1;
    entry.amount          = shares[i];
    entry.released        = false;
    ThrowIfDbError(repository_->InsertEscrow(tx, entry), "setup escrow for job " + std::to_string(job_id));
  }
}

market::db::model::JobRecord EscrowManager::SubmitExecutionProof(market::db::Transaction& tx, const std::string& caller, uint64_t job_id,
                                                                 const std::string& proof) {
  auto job = GetJob(tx, job_id);
  if (caller != job.provider) {
    throw market::util::NotAuthorized(caller + " is not the provider of job " + std::to_string(job_id));
  }
  if (job.status != JOB_STATUS_ACTIVE) {
    throw market::util::AlreadyCompleted("job " + std::to_string(job_id) + " is no longer active");
  }

  job.execution_proof = proof;
  job.status          = JOB_STATUS_COMPLETED;
  ThrowIfDbError(repository_->UpdateJob(tx, job), "submit execution proof");
  return job;
}

MilestonePayout EscrowManager::ReleaseMilestone(market::db::Transaction& tx, const std::string& caller, uint64_t job_id,
                                                uint32_t milestone_index) {
  auto job = repository_->GetJob(tx, job_id);
  if (!job) {
    throw market::util::JobNotFound("job " + std::to_string(job_id));
  }
  auto entry = repository_->GetEscrow(tx, job_id, milestone_index);
  if (!entry) {
    throw market::util::MilestoneNotReady("job " + std::to_string(job_id) + " has no milestone " + std::to_string(milestone_index));
  }
  if (caller != job->requester) {
    throw market::util::NotAuthorized(caller + " is not the requester of job " + std::to_string(job_id));
  }
  if (entry->released) {
    throw market::util::AlreadyCompleted("milestone " + std::to_string(milestone_index) + " of job " + std::to_string(job_id) +
                                         " already released");
  }
  if (milestone_index > job->milestone_count) {
    throw market::util::MilestoneNotReady("milestone " + std::to_string(milestone_index) + " is beyond job " + std::to_string(job_id));
  }

  // NOTE: release does not require an execution proof. Payment and the
  // completion trigger below fire on the requester's approval and the
  // milestone count alone, even if the provider never called
  // SubmitExecutionProof. Keep it that way unless the settlement rules change.
  MilestonePayout payout;
  payout.platform_fee     = PlatformFee(entry->amount);
  payout.provider_payment = entry->amount - payout.platform_fee;

  ledger_.Credit(tx, job->provider, payout.provider_payment);
  treasury_.Collect(tx, payout.platform_fee);

  entry->released = true;
  ThrowIfDbError(repository_->UpdateEscrow(tx, *entry), "release milestone");

  job->completed_milestones += 1;
  ThrowIfDbError(repository_->UpdateJob(tx, *job), "release milestone");

  if (job->completed_milestones == job->milestone_count) {
    reputation_.RecordCompletion(tx, job->provider, job->total_payment);
    payout.reputation_updated = true;
  }

  payout.job = *job;
  return payout;
}

market::db::model::JobRecord EscrowManager::GetJob(market::db::Transaction& tx, uint64_t job_id) const {
  auto job = repository_->GetJob(tx, job_id);
  if (!job) {
    throw market::util::JobNotFound("job " + std::to_string(job_id));
  }
  return *job;
}

market::db::model::EscrowRecord EscrowManager::GetEscrow(market::db::Transaction& tx, uint64_t job_id, uint32_t milestone_index) const {
  GetJob(tx, job_id);
  auto entry = repository_->GetEscrow(tx, job_id, milestone_index);
  if (!entry) {
    throw market::util::MilestoneNotReady("job " + std::to_string(job_id) + " has no milestone " + std::to_string(milestone_index));
  }
  return *entry;
}

std::vector<market::db::model::EscrowRecord> EscrowManager::ListEscrow(market::db::Transaction& tx, uint64_t job_id) const {
  GetJob(tx, job_id);
  return repository_->ListEscrow(tx, job_id);
}

} // namespace market::core
