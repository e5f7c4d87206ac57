#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"

#if MARKET_DB_SQLITE
#include "internal/db/sql/migrations.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if MARKET_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#endif

namespace {

using market::db::AuctionFilter;
using market::db::ErrorCode;
using market::db::JobFilter;
using market::db::Pagination;
using market::db::Repository;
using market::db::ResourceFilter;
using market::db::memory::MemoryRepository;
using market::db::model::AuctionRecord;
using market::db::model::BalanceRecord;
using market::db::model::EscrowRecord;
using market::db::model::JobRecord;
using market::db::model::ReputationRecord;
using market::db::model::ResourceRecord;
using market::exchange::core::v1::JOB_STATUS_ACTIVE;
using market::exchange::core::v1::JOB_STATUS_COMPLETED;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

// Postgres runs against a shared database, so nothing below assumes an
// empty schema: ids are checked relative to each other and principals
// carry a per-run suffix.
std::string Principal(const std::string& backend, const std::string& who) {
  static const auto run = std::to_string(NowMs());
  return backend + "-" + who + "-" + run;
}

AuctionRecord MakeAuction(const std::string& requester) {
  AuctionRecord a;
  a.requester      = requester;
  a.req_gpu        = 1;
  a.req_cpu        = 8;
  a.req_ram        = 32;
  a.max_duration   = 24;
  a.starting_price = 100;
  a.current_bid    = 100;
  a.end_height     = 244;
  a.created_at_height = 100;
  return a;
}

JobRecord MakeJob(uint64_t auction_id, const std::string& provider, const std::string& requester) {
  JobRecord j;
  j.auction_id        = auction_id;
  j.provider          = provider;
  j.requester         = requester;
  j.total_payment     = 200;
  j.milestone_count   = 3;
  j.created_at_height = 245;
  return j;
}

void VerifyResourceIdsAndFilters(Repository& repo, const std::string& backend) {
  const auto provider = Principal(backend, "provider");
  auto       tx       = repo.Begin();

  ResourceRecord first{.provider = provider, .gpu = 2, .cpu = 16, .ram = 64, .hourly_rate = 10, .created_at_height = 1};
  ResourceRecord second{.provider = provider, .gpu = 0, .cpu = 4, .ram = 8, .hourly_rate = 3, .created_at_height = 2};
  assert(repo.InsertResource(*tx, first));
  assert(repo.InsertResource(*tx, second));
  assert(first.id >= 1);
  assert(second.id == first.id + 1);

  auto read = repo.GetResource(*tx, second.id);
  assert(read.has_value());
  assert(read->provider == provider);
  assert(read->cpu == 4);
  assert(read->available);

  ResourceFilter filter;
  filter.provider = provider;
  auto listed     = repo.ListResources(*tx, filter, Pagination{});
  assert(listed.size() == 2);
  assert(listed[0].id == first.id);

  auto paged = repo.ListResources(*tx, filter, Pagination{.limit = 1, .offset = 1});
  assert(paged.size() == 1);
  assert(paged[0].id == second.id);

  assert(!repo.GetResource(*tx, second.id + 1000).has_value());
  tx->Commit();
}

void VerifyAuctionUpdate(Repository& repo, const std::string& backend) {
  auto tx      = repo.Begin();
  auto auction = MakeAuction(Principal(backend, "requester"));
  assert(repo.InsertAuction(*tx, auction));
  assert(auction.id >= 1);

  auto read = repo.GetAuction(*tx, auction.id);
  assert(read.has_value());
  assert(!read->current_bidder.has_value());
  assert(!read->ended);

  read->current_bid    = 150;
  read->current_bidder = Principal(backend, "bidder");
  assert(repo.UpdateAuction(*tx, *read));

  auto updated = repo.GetAuction(*tx, auction.id);
  assert(updated->current_bid == 150);
  assert(updated->current_bidder == Principal(backend, "bidder"));

  bool found_open = false;
  for (const auto& a : repo.ListAuctions(*tx, AuctionFilter{.open_only = true}, Pagination{.limit = 1000})) {
    found_open = found_open || a.id == auction.id;
  }
  assert(found_open);

  updated->ended = true;
  assert(repo.UpdateAuction(*tx, *updated));
  for (const auto& a : repo.ListAuctions(*tx, AuctionFilter{.open_only = true}, Pagination{.limit = 1000})) {
    assert(a.id != auction.id);
  }

  AuctionRecord missing = *updated;
  missing.id            = auction.id + 1000;
  auto result           = repo.UpdateAuction(*tx, missing);
  assert(!result);
  assert(result.code == ErrorCode::NotFound);

  tx->Commit();
}

void VerifyJobAndEscrow(Repository& repo, const std::string& backend) {
  const auto provider  = Principal(backend, "job-provider");
  const auto requester = Principal(backend, "job-requester");

  uint64_t job_id = 0;
  {
    auto tx      = repo.Begin();
    auto auction = MakeAuction(requester);
    assert(repo.InsertAuction(*tx, auction));

    auto job = MakeJob(auction.id, provider, requester);
    assert(repo.InsertJob(*tx, job));
    job_id = job.id;

    // inserted out of order, listed by milestone index
    assert((repo.InsertEscrow(*tx, EscrowRecord{.job_id = job_id, .milestone_index = 3, .amount = 68})));
    assert((repo.InsertEscrow(*tx, EscrowRecord{.job_id = job_id, .milestone_index = 1, .amount = 66})));
    assert((repo.InsertEscrow(*tx, EscrowRecord{.job_id = job_id, .milestone_index = 2, .amount = 66})));
    tx->Commit();
  }

  {
    auto tx      = repo.Begin();
    auto entries = repo.ListEscrow(*tx, job_id);
    assert(entries.size() == 3);
    assert(entries[0].milestone_index == 1);
    assert(entries[1].milestone_index == 2);
    assert(entries[2].milestone_index == 3);
    assert(entries[2].amount == 68);

    auto entry     = repo.GetEscrow(*tx, job_id, 1);
    entry->released = true;
    assert(repo.UpdateEscrow(*tx, *entry));
    assert(repo.GetEscrow(*tx, job_id, 1)->released);
    assert(!repo.GetEscrow(*tx, job_id, 4).has_value());

    auto missing = repo.UpdateEscrow(*tx, EscrowRecord{.job_id = job_id, .milestone_index = 9, .amount = 1});
    assert(missing.code == ErrorCode::NotFound);

    auto job                  = repo.GetJob(*tx, job_id);
    job->completed_milestones = 3;
    job->execution_proof      = "proof";
    job->status               = JOB_STATUS_COMPLETED;
    assert(repo.UpdateJob(*tx, *job));
    tx->Commit();
  }

  {
    // a failed statement poisons a postgres transaction; keep it isolated
    auto tx  = repo.Begin();
    auto dup = repo.InsertEscrow(*tx, EscrowRecord{.job_id = job_id, .milestone_index = 2, .amount = 1});
    assert(dup.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  {
    auto tx       = repo.Begin();
    auto existing = repo.GetJob(*tx, job_id);
    auto second   = MakeJob(existing->auction_id, provider, requester);
    auto dup      = repo.InsertJob(*tx, second);
    assert(dup.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  auto tx  = repo.Begin();
  auto job = repo.GetJob(*tx, job_id);
  assert(job.has_value());
  assert(job->status == JOB_STATUS_COMPLETED);
  assert(job->execution_proof == "proof");
  assert(job->completed_milestones == 3);

  JobFilter by_provider;
  by_provider.provider = provider;
  auto jobs            = repo.ListJobs(*tx, by_provider, Pagination{});
  assert(jobs.size() == 1);
  assert(jobs[0].id == job_id);

  JobFilter by_requester;
  by_requester.requester = provider;
  assert(repo.ListJobs(*tx, by_requester, Pagination{}).empty());

  JobRecord ghost = *job;
  ghost.id        = job_id + 1000;
  ghost.status    = JOB_STATUS_ACTIVE;
  assert(repo.UpdateJob(*tx, ghost).code == ErrorCode::NotFound);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& backend) {
  const auto who = Principal(backend, "rollback");
  {
    auto tx = repo.Begin();
    assert((repo.UpsertBalance(*tx, BalanceRecord{.principal = who, .balance = 500})));
    ReputationRecord rep{.provider = who, .score = 90, .completed_jobs = 1, .total_jobs = 1, .total_earned = 500};
    assert(repo.UpsertReputation(*tx, rep));
    assert(repo.GetBalance(*tx, who)->balance == 500);
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert((repo.UpsertBalance(*tx, BalanceRecord{.principal = who, .balance = 7})));
    // destroyed without commit
  }

  auto tx = repo.Begin();
  assert(!repo.GetBalance(*tx, who).has_value());
  assert(!repo.GetReputation(*tx, who).has_value());
  tx->Commit();
}

void VerifyBalancesAndTotals(Repository& repo, const std::string& backend) {
  const auto alice = Principal(backend, "alice");
  const auto bob   = Principal(backend, "bob");

  market::db::model::LedgerTotalsRecord before;
  {
    auto tx = repo.Begin();
    before  = repo.GetLedgerTotals(*tx);

    assert((repo.UpsertBalance(*tx, BalanceRecord{.principal = alice, .balance = 1000})));
    assert((repo.UpsertBalance(*tx, BalanceRecord{.principal = bob, .balance = 40})));
    assert((repo.UpsertBalance(*tx, BalanceRecord{.principal = alice, .balance = 850})));

    auto totals = before;
    totals.treasury += 3;
    totals.total_deposited += 1040;
    totals.total_withdrawn += 150;
    assert(repo.UpdateLedgerTotals(*tx, totals));

    ReputationRecord rep{.provider = bob, .score = 100, .completed_jobs = 1, .total_jobs = 1, .total_earned = 200};
    assert(repo.UpsertReputation(*tx, rep));
    rep.total_jobs = 2;
    rep.score      = 50;
    assert(repo.UpsertReputation(*tx, rep));
    tx->Commit();
  }

  auto tx = repo.Begin();
  assert(repo.GetBalance(*tx, alice)->balance == 850);
  assert(repo.GetBalance(*tx, bob)->balance == 40);

  std::size_t mine = 0;
  for (const auto& b : repo.ListBalances(*tx)) {
    if (b.principal == alice || b.principal == bob) ++mine;
  }
  assert(mine == 2);

  auto totals = repo.GetLedgerTotals(*tx);
  assert(totals.treasury == before.treasury + 3);
  assert(totals.total_deposited == before.total_deposited + 1040);
  assert(totals.total_withdrawn == before.total_withdrawn + 150);

  auto rep = repo.GetReputation(*tx, bob);
  assert(rep.has_value());
  assert(rep->score == 50);
  assert(rep->total_jobs == 2);
  assert(rep->total_earned == 200);
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  const auto provider = Principal(backend.name, "durable");
  auto       repo     = backend.make_repository();
  uint64_t   resource_id = 0;
  {
    auto           tx = repo->Begin();
    ResourceRecord r{.provider = provider, .gpu = 8, .cpu = 64, .ram = 512, .hourly_rate = 99, .created_at_height = 5};
    assert(repo->InsertResource(*tx, r));
    resource_id = r.id;
    assert((repo->UpsertBalance(*tx, BalanceRecord{.principal = provider, .balance = 123})));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto r  = repo->GetResource(*tx, resource_id);
  assert(r.has_value());
  assert(r->gpu == 8);
  assert(r->hourly_rate == 99);
  assert(repo->GetBalance(*tx, provider)->balance == 123);

  // ids are never reused after a restart
  ResourceRecord next{.provider = provider, .created_at_height = 6};
  assert(repo->InsertResource(*tx, next));
  assert(next.id > resource_id);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if MARKET_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("market_manager_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<market::db::sqlite::SqliteDB>(db_path);
    market::db::sql::RunMigrations(*db, market::db::sql::SchemaStatements(market::db::sql::Dialect::kSqlite));
    return std::make_shared<market::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if MARKET_DB_SQLITE
void VerifySqliteSchemaVersionRecorded() {
  auto db_path = (std::filesystem::temp_directory_path() / ("market_manager_schema_version_" + std::to_string(NowMs()) + ".db")).string();
  {
    market::db::sqlite::SqliteDB db(db_path, false);
    const auto&                  schema = market::db::sql::SchemaStatements(market::db::sql::Dialect::kSqlite);
    market::db::sql::RunMigrations(db, schema);
    market::db::sql::RunMigrations(db, schema);

    sqlite3_stmt* st = db.Prepare("SELECT COUNT(*), MIN(applied_at_ms) FROM market_schema_migrations WHERE version=1;");
    assert(sqlite3_step(st) == SQLITE_ROW);
    assert(sqlite3_column_int64(st, 0) == 1);
    assert(sqlite3_column_type(st, 1) != SQLITE_NULL);
    assert(sqlite3_column_int64(st, 1) > 0);
    sqlite3_finalize(st);
  }
  std::filesystem::remove(db_path);
}
#endif

#if MARKET_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("MARKET_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("MARKET_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<market::db::postgres::PgPool>(conninfo);
    market::db::sql::RunMigrations(*pool, market::db::sql::SchemaStatements(market::db::sql::Dialect::kPostgres));
    return std::make_shared<market::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyResourceIdsAndFilters(*repo, backend.name);
    VerifyAuctionUpdate(*repo, backend.name);
    VerifyJobAndEscrow(*repo, backend.name);
    VerifyRollbackBehavior(*repo, backend.name);
    VerifyBalancesAndTotals(*repo, backend.name);
  }

  VerifyRestartDurability(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if MARKET_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if MARKET_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

#if MARKET_DB_SQLITE
  VerifySqliteSchemaVersionRecorded();
#endif

  std::cout << "market_manager_integration_repository_parity: pass\n";
  return 0;
}
