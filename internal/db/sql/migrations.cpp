#include "migrations.hpp"

#include <stdexcept>

namespace market::db::sql {

namespace {

const std::vector<std::string> kSqliteSchema = {
    "CREATE TABLE IF NOT EXISTS market_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS resources (id INTEGER PRIMARY KEY AUTOINCREMENT, provider TEXT NOT NULL, gpu INTEGER NOT NULL, cpu INTEGER NOT NULL, "
    "ram INTEGER NOT NULL, hourly_rate INTEGER NOT NULL, available INTEGER NOT NULL, created_at_height INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS auctions (id INTEGER PRIMARY KEY AUTOINCREMENT, requester TEXT NOT NULL, req_gpu INTEGER NOT NULL, req_cpu INTEGER NOT NULL, "
    "req_ram INTEGER NOT NULL, max_duration INTEGER NOT NULL, starting_price INTEGER NOT NULL, current_bid INTEGER NOT NULL, current_bidder TEXT, "
    "end_height INTEGER NOT NULL, ended INTEGER NOT NULL, created_at_height INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS jobs (id INTEGER PRIMARY KEY AUTOINCREMENT, auction_id INTEGER NOT NULL UNIQUE REFERENCES auctions(id), "
    "provider TEXT NOT NULL, requester TEXT NOT NULL, total_payment INTEGER NOT NULL, milestone_count INTEGER NOT NULL, "
    "completed_milestones INTEGER NOT NULL, execution_proof TEXT, status INTEGER NOT NULL, created_at_height INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS escrow (job_id INTEGER NOT NULL REFERENCES jobs(id), milestone_index INTEGER NOT NULL, amount INTEGER NOT NULL, "
    "released INTEGER NOT NULL, PRIMARY KEY (job_id, milestone_index));",
    "CREATE TABLE IF NOT EXISTS reputation (provider TEXT PRIMARY KEY, score INTEGER NOT NULL, completed_jobs INTEGER NOT NULL, "
    "total_jobs INTEGER NOT NULL, total_earned INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS balances (principal TEXT PRIMARY KEY, balance INTEGER NOT NULL);",
    "CREATE TABLE IF NOT EXISTS ledger_totals (id INTEGER PRIMARY KEY CHECK (id = 1), treasury INTEGER NOT NULL, total_deposited INTEGER NOT NULL, "
    "total_withdrawn INTEGER NOT NULL);",
    "INSERT OR IGNORE INTO ledger_totals(id,treasury,total_deposited,total_withdrawn) VALUES(1,0,0,0);",
    "INSERT OR IGNORE INTO market_schema_migrations(version,applied_at_ms) VALUES(1, CAST(strftime('%s','now') AS INTEGER) * 1000);",
};

const std::vector<std::string> kPostgresSchema = {
    "CREATE TABLE IF NOT EXISTS market_schema_migrations (version INTEGER PRIMARY KEY, applied_at TIMESTAMPTZ DEFAULT NOW());",
    "CREATE TABLE IF NOT EXISTS resources (id BIGSERIAL PRIMARY KEY, provider TEXT NOT NULL, gpu BIGINT NOT NULL, cpu BIGINT NOT NULL, "
    "ram BIGINT NOT NULL, hourly_rate BIGINT NOT NULL, available BOOLEAN NOT NULL, created_at_height BIGINT NOT NULL);",
    "CREATE TABLE IF NOT EXISTS auctions (id BIGSERIAL PRIMARY KEY, requester TEXT NOT NULL, req_gpu BIGINT NOT NULL, req_cpu BIGINT NOT NULL, "
    "req_ram BIGINT NOT NULL, max_duration BIGINT NOT NULL, starting_price BIGINT NOT NULL, current_bid BIGINT NOT NULL, current_bidder TEXT, "
    "end_height BIGINT NOT NULL, ended BOOLEAN NOT NULL, created_at_height BIGINT NOT NULL);",
    "CREATE TABLE IF NOT EXISTS jobs (id BIGSERIAL PRIMARY KEY, auction_id BIGINT NOT NULL UNIQUE REFERENCES auctions(id), provider TEXT NOT NULL, "
    "requester TEXT NOT NULL, total_payment BIGINT NOT NULL, milestone_count INTEGER NOT NULL, completed_milestones INTEGER NOT NULL, "
    "execution_proof TEXT, status SMALLINT NOT NULL, created_at_height BIGINT NOT NULL);",
    "CREATE TABLE IF NOT EXISTS escrow (job_id BIGINT NOT NULL REFERENCES jobs(id), milestone_index INTEGER NOT NULL, amount BIGINT NOT NULL, "
    "released BOOLEAN NOT NULL, PRIMARY KEY (job_id, milestone_index));",
    "CREATE TABLE IF NOT EXISTS reputation (provider TEXT PRIMARY KEY, score INTEGER NOT NULL, completed_jobs BIGINT NOT NULL, "
    "total_jobs BIGINT NOT NULL, total_earned BIGINT NOT NULL);",
    "CREATE TABLE IF NOT EXISTS balances (principal TEXT PRIMARY KEY, balance BIGINT NOT NULL);",
    "CREATE TABLE IF NOT EXISTS ledger_totals (id INTEGER PRIMARY KEY CHECK (id = 1), treasury BIGINT NOT NULL, total_deposited BIGINT NOT NULL, "
    "total_withdrawn BIGINT NOT NULL);",
    "INSERT INTO ledger_totals(id,treasury,total_deposited,total_withdrawn) VALUES(1,0,0,0) ON CONFLICT (id) DO NOTHING;",
    "INSERT INTO market_schema_migrations(version) VALUES(1) ON CONFLICT (version) DO NOTHING;",
};

} // namespace

const std::vector<std::string>& SchemaStatements(Dialect dialect) {
  switch (dialect) {
    case Dialect::kSqlite:
      return kSqliteSchema;
    case Dialect::kPostgres:
      return kPostgresSchema;
  }
  throw std::invalid_argument("unknown SQL dialect");
}

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

} // namespace market::db::sql
