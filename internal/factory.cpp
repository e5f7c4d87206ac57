#include "factory.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/chain/block_clock.hpp"
#include "internal/chain/execution_verifier.hpp"
#include "internal/chain/token_rail.hpp"
#include "internal/core/marketplace.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/auction_server.hpp"
#include "internal/grpc/job_server.hpp"
#include "internal/grpc/ledger_server.hpp"
#include "internal/grpc/resource_registry_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/auction_service.hpp"
#include "internal/service/job_service.hpp"
#include "internal/service/ledger_service.hpp"
#include "internal/service/resource_registry_service.hpp"
#include "internal/service/service_context.hpp"
#if MARKET_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if MARKET_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace market::factory {

using namespace market;

namespace {

using market::runtime::config::RuntimeConfig;

std::shared_ptr<chain::BlockClock> BuildClock(const RuntimeConfig& config, std::shared_ptr<chain::ManualBlockClock>* manual_out) {
  const auto& chain_config = config.chain();
  if (chain_config.clock() == market::runtime::config::CLOCK_MODE_WALL) {
    return std::make_shared<chain::WallBlockClock>(chain_config.genesis_height(),
                                                   std::chrono::milliseconds(chain_config.block_interval_ms()));
  }

  auto manual = std::make_shared<chain::ManualBlockClock>(chain_config.genesis_height());
  *manual_out = manual;
  return manual;
}

std::shared_ptr<chain::TokenRail> BuildTokenRail(const RuntimeConfig& config) {
  std::map<std::string, uint64_t> genesis;
  for (const auto& [principal, amount] : config.token().genesis_balances()) {
    genesis.emplace(principal, amount);
  }
  return std::make_shared<chain::InMemoryTokenRail>(std::move(genesis));
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if MARKET_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sql::RunMigrations(*sqlite_db, db::sql::SchemaStatements(db::sql::Dialect::kSqlite));
    MARKET_LOG_INFO("Repository ready", {observability::StringField("backend", "sqlite"),
                                         observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if MARKET_DB_POSTGRES
    const auto& pg   = database.postgres();
    auto        pool = std::make_shared<db::postgres::PgPool>(pg.connection_uri(), pg.max_connections() == 0 ? 16 : pg.max_connections());
    db::sql::RunMigrations(*pool, db::sql::SchemaStatements(db::sql::Dialect::kPostgres));
    MARKET_LOG_INFO("Repository ready", {observability::StringField("backend", "postgres")});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  MARKET_LOG_WARN("No database configured; state is in-memory and lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

service::ServiceContext BuildContext(const RuntimeConfig& config) {
  service::ServiceContext ctx;
  ctx.repository  = BuildRepository(config);
  ctx.clock       = BuildClock(config, &ctx.manual_clock);
  ctx.token_rail  = BuildTokenRail(config);
  ctx.verifiers   = std::make_shared<chain::VerifierRegistry>();
  ctx.marketplace = std::make_shared<core::Marketplace>(ctx.repository, ctx.clock, ctx.token_rail, ctx.verifiers,
                                                        config.chain().contract_principal());
  return ctx;
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.context = BuildContext(config);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  auto registry_service = std::make_shared<service::ResourceRegistryService>(app.context);
  auto auction_service  = std::make_shared<service::AuctionService>(app.context);
  auto job_service      = std::make_shared<service::JobService>(app.context);
  auto ledger_service   = std::make_shared<service::LedgerService>(app.context);
  auto admin_service    = std::make_shared<service::AdminService>(app.context);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::ResourceRegistryServer>(registry_service));
  app.grpc_services.push_back(std::make_unique<grpc::AuctionServer>(auction_service));
  app.grpc_services.push_back(std::make_unique<grpc::JobServer>(job_service));
  app.grpc_services.push_back(std::make_unique<grpc::LedgerServer>(ledger_service));
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(admin_service));

  return app;
}

} // namespace market::factory
