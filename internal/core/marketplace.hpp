#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/core/account_ledger.hpp"
#include "internal/core/auction_engine.hpp"
#include "internal/core/escrow_manager.hpp"
#include "internal/core/reputation_tracker.hpp"
#include "internal/core/resource_registry.hpp"
#include "internal/core/treasury.hpp"
#include "internal/db/api/repository.hpp"
#include "market/exchange/v1.hpp"

namespace market::chain {
class BlockClock;
class TokenRail;
class VerifierRegistry;
} // namespace market::chain

namespace market::core {

/*
  Single-writer facade over the market components.

  Every public call:
    - holds mutex_ for its whole duration
    - reads the block height once
    - runs in exactly one repository transaction
    - commits only if nothing threw

  A thrown error abandons the transaction, whose destructor rolls back,
  so a failing call never leaves partial state behind.
*/
class Marketplace {
 public:
  Marketplace(std::shared_ptr<market::db::Repository> repository, std::shared_ptr<market::chain::BlockClock> clock,
              std::shared_ptr<market::chain::TokenRail> token_rail, std::shared_ptr<market::chain::VerifierRegistry> verifiers,
              std::string contract_principal);

  // Resource registry
  uint64_t                                           ListResource(const std::string& sender, const market::exchange::v1::ResourceSpec& spec,
                                                                  uint64_t hourly_rate);
  market::exchange::v1::ComputeResource              GetResource(uint64_t resource_id);
  std::vector<market::exchange::v1::ComputeResource> ListResources(const market::db::ResourceFilter& filter, const market::db::Pagination& page);

  // Auctions
  market::exchange::v1::Auction              CreateAuction(const std::string& sender, const market::exchange::v1::ResourceSpec& requirements,
                                                           uint64_t max_duration, uint64_t starting_price);
  market::exchange::v1::Auction              PlaceBid(const std::string& sender, uint64_t auction_id, uint64_t amount);
  uint64_t                                   EndAuction(const std::string& sender, uint64_t auction_id);
  market::exchange::v1::Auction              GetAuction(uint64_t auction_id);
  bool                                       IsAuctionActive(uint64_t auction_id);
  std::vector<market::exchange::v1::Auction> ListAuctions(bool active_only, const market::db::Pagination& page);

  // Jobs + escrow
  market::exchange::v1::Job                      SubmitExecutionProof(const std::string& sender, uint64_t job_id, const std::string& proof);
  market::exchange::v1::ReleaseMilestoneResponse ReleaseMilestone(const std::string& sender, uint64_t job_id, uint32_t milestone_index);
  market::exchange::v1::Job                      GetJob(uint64_t job_id);
  std::vector<market::exchange::v1::Job>         ListJobs(const market::db::JobFilter& filter, const market::db::Pagination& page);
  market::exchange::v1::EscrowEntry              GetEscrowBalance(uint64_t job_id, uint32_t milestone_index);
  std::vector<market::exchange::v1::EscrowEntry> ListEscrow(uint64_t job_id);
  market::exchange::v1::Reputation               GetProviderReputation(const std::string& provider);
  bool                                           VerifyExecution(uint64_t job_id);

  // Ledger
  uint64_t DepositFunds(const std::string& sender, uint64_t amount);
  uint64_t WithdrawFunds(const std::string& sender, uint64_t amount);
  uint64_t GetUserBalance(const std::string& principal);
  uint64_t GetPlatformTreasury();

  // Admin
  market::exchange::v1::AuditConservationResponse AuditConservation();
  market::exchange::v1::StatsResponse             Stats();
  uint64_t                                        BlockHeight() const;

  const std::string& ContractPrincipal() const {
    return contract_principal_;
  }

 private:
  std::shared_ptr<market::db::Repository>         repository_;
  std::shared_ptr<market::chain::BlockClock>      clock_;
  std::shared_ptr<market::chain::TokenRail>       token_rail_;
  std::shared_ptr<market::chain::VerifierRegistry> verifiers_;
  std::string                                     contract_principal_;

  // Declaration order is construction order: later components hold
  // references to earlier ones.
  AccountLedger     ledger_;
  Treasury          treasury_;
  ReputationTracker reputation_;
  ResourceRegistry  registry_;
  EscrowManager     escrow_;
  AuctionEngine     auctions_;

  mutable std::mutex mutex_;
};

} // namespace market::core
