#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

#include "internal/db/api/repository.hpp"

namespace market::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertResource(Transaction&, model::ResourceRecord&) override;
  std::optional<model::ResourceRecord> GetResource(Transaction&, uint64_t) override;
  std::vector<model::ResourceRecord> ListResources(Transaction&, const ResourceFilter&, const Pagination&) override;

  Result InsertAuction(Transaction&, model::AuctionRecord&) override;
  std::optional<model::AuctionRecord> GetAuction(Transaction&, uint64_t) override;
  Result UpdateAuction(Transaction&, const model::AuctionRecord&) override;
  std::vector<model::AuctionRecord> ListAuctions(Transaction&, const AuctionFilter&, const Pagination&) override;

  Result InsertJob(Transaction&, model::JobRecord&) override;
  std::optional<model::JobRecord> GetJob(Transaction&, uint64_t) override;
  Result UpdateJob(Transaction&, const model::JobRecord&) override;
  std::vector<model::JobRecord> ListJobs(Transaction&, const JobFilter&, const Pagination&) override;

  Result InsertEscrow(Transaction&, const model::EscrowRecord&) override;
  std::optional<model::EscrowRecord> GetEscrow(Transaction&, uint64_t job_id, uint32_t milestone_index) override;
  Result UpdateEscrow(Transaction&, const model::EscrowRecord&) override;
  std::vector<model::EscrowRecord> ListEscrow(Transaction&, uint64_t job_id) override;

  std::optional<model::ReputationRecord> GetReputation(Transaction&, const std::string&) override;
  Result UpsertReputation(Transaction&, const model::ReputationRecord&) override;

  std::optional<model::BalanceRecord> GetBalance(Transaction&, const std::string&) override;
  Result UpsertBalance(Transaction&, const model::BalanceRecord&) override;
  std::vector<model::BalanceRecord> ListBalances(Transaction&) override;

  model::LedgerTotalsRecord GetLedgerTotals(Transaction&) override;
  Result UpdateLedgerTotals(Transaction&, const model::LedgerTotalsRecord&) override;

private:
  friend class MemoryTransaction;

  // Ordered maps keep list output in id order, matching the SQL backends.
  struct State {
    std::map<uint64_t, model::ResourceRecord> resources;
    std::map<uint64_t, model::AuctionRecord> auctions;
    std::map<uint64_t, model::JobRecord> jobs;
    std::map<std::pair<uint64_t, uint32_t>, model::EscrowRecord> escrow;
    std::unordered_map<std::string, model::ReputationRecord> reputation;
    std::map<std::string, model::BalanceRecord> balances;
    model::LedgerTotalsRecord totals;

    uint64_t next_resource_id = 1;
    uint64_t next_auction_id = 1;
    uint64_t next_job_id = 1;
  };

  std::mutex mutex_;
  State committed_;
  uint64_t committed_version_ = 0;
};

}
