#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace market::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
