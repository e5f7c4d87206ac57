#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace market::core {

class AccountLedger;
class ReputationTracker;
class Treasury;

struct MilestonePayout {
  uint64_t                     provider_payment = 0;
  uint64_t                     platform_fee     = 0;
  market::db::model::JobRecord job;
  // Set when this release completed the job.
  bool reputation_updated = false;
};

/*
  Jobs and their milestone escrow.

  Escrow entries are indexed 1..milestone_count and partition the job's
  total payment exactly; the last entry absorbs the division remainder.
*/
class EscrowManager {
 public:
  EscrowManager(std::shared_ptr<market::db::Repository> repository, AccountLedger& ledger, Treasury& treasury, ReputationTracker& reputation);

  // Job for a settled auction: provider = winning bidder, requester = auction requester.
  market::db::model::JobRecord OpenJob(market::db::Transaction& tx, const market::db::model::AuctionRecord& settled, uint64_t height);

  void SetupEscrow(market::db::Transaction& tx, uint64_t job_id, uint64_t total, uint32_t milestone_count);

  // Shares for SetupEscrow; element i is milestone i+1.
  static std::vector<uint64_t> Partition(uint64_t total, uint32_t milestone_count);

  static uint64_t PlatformFee(uint64_t amount);

  market::db::model::JobRecord SubmitExecutionProof(market::db::Transaction& tx, const std::string& caller, uint64_t job_id,
                                                    const std::string& proof);

  MilestonePayout ReleaseMilestone(market::db::Transaction& tx, const std::string& caller, uint64_t job_id, uint32_t milestone_index);

  // Throws JobNotFound.
  market::db::model::JobRecord GetJob(market::db::Transaction& tx, uint64_t job_id) const;

  // Throws JobNotFound, then MilestoneNotReady.
  market::db::model::EscrowRecord GetEscrow(market::db::Transaction& tx, uint64_t job_id, uint32_t milestone_index) const;

  std::vector<market::db::model::EscrowRecord> ListEscrow(market::db::Transaction& tx, uint64_t job_id) const;

 private:
  std::shared_ptr<market::db::Repository> repository_;
  AccountLedger&                          ledger_;
  Treasury&                               treasury_;
  ReputationTracker&                      reputation_;
};

} // namespace market::core
