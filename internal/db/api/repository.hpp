#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/auction_record.hpp"
#include "internal/db/model/balance_record.hpp"
#include "internal/db/model/escrow_record.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/db/model/ledger_totals_record.hpp"
#include "internal/db/model/reputation_record.hpp"
#include "internal/db/model/resource_record.hpp"

namespace market::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Inserted ids are sequential per entity, start at 1 and are never reused
  - Nothing is ever deleted; entities only transition

  The DB is the source of truth for:
    custodial balances and treasury
    auction / job / escrow state
    reputation
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Resource registry
  // ---------------------------------------------------------------------

  // Assigns the next id into r.id when r.id == 0.
  virtual Result InsertResource(Transaction&, model::ResourceRecord& r) = 0;

  virtual std::optional<model::ResourceRecord> GetResource(Transaction&, uint64_t id) = 0;

  virtual std::vector<model::ResourceRecord> ListResources(Transaction&, const ResourceFilter&, const Pagination&) = 0;

  // ---------------------------------------------------------------------
  // Auctions
  // ---------------------------------------------------------------------

  virtual Result InsertAuction(Transaction&, model::AuctionRecord& r) = 0;

  virtual std::optional<model::AuctionRecord> GetAuction(Transaction&, uint64_t id) = 0;

  virtual Result UpdateAuction(Transaction&, const model::AuctionRecord&) = 0;

  virtual std::vector<model::AuctionRecord> ListAuctions(Transaction&, const AuctionFilter&, const Pagination&) = 0;

  // ---------------------------------------------------------------------
  // Jobs + escrow
  // ---------------------------------------------------------------------

  virtual Result InsertJob(Transaction&, model::JobRecord& r) = 0;

  virtual std::optional<model::JobRecord> GetJob(Transaction&, uint64_t id) = 0;

  virtual Result UpdateJob(Transaction&, const model::JobRecord&) = 0;

  virtual std::vector<model::JobRecord> ListJobs(Transaction&, const JobFilter&, const Pagination&) = 0;

  virtual Result InsertEscrow(Transaction&, const model::EscrowRecord&) = 0;

  virtual std::optional<model::EscrowRecord> GetEscrow(Transaction&, uint64_t job_id, uint32_t milestone_index) = 0;

  virtual Result UpdateEscrow(Transaction&, const model::EscrowRecord&) = 0;

  // Ordered by milestone_index.
  virtual std::vector<model::EscrowRecord> ListEscrow(Transaction&, uint64_t job_id) = 0;

  // ---------------------------------------------------------------------
  // Reputation
  // ---------------------------------------------------------------------

  virtual std::optional<model::ReputationRecord> GetReputation(Transaction&, const std::string& provider) = 0;

  virtual Result UpsertReputation(Transaction&, const model::ReputationRecord&) = 0;

  // ---------------------------------------------------------------------
  // Balances + ledger totals
  // ---------------------------------------------------------------------

  virtual std::optional<model::BalanceRecord> GetBalance(Transaction&, const std::string& principal) = 0;

  virtual Result UpsertBalance(Transaction&, const model::BalanceRecord&) = 0;

  virtual std::vector<model::BalanceRecord> ListBalances(Transaction&) = 0;

  // Zero-initialized until the first update.
  virtual model::LedgerTotalsRecord GetLedgerTotals(Transaction&) = 0;

  virtual Result UpdateLedgerTotals(Transaction&, const model::LedgerTotalsRecord&) = 0;
};

} // namespace market::db
