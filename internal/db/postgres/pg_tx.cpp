#include "pg_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace market::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool)
{
  conn_ = pool->Acquire();
  tx_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      MARKET_LOG_ERROR("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
  // the work must go before its connection returns to the pool
  tx_.reset();
}

void PgTransaction::Commit() {
  if (finished_) throw std::logic_error("postgres transaction already finished");
  tx_->commit();
  committed_ = true;
  finished_ = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  tx_->abort();
}

}
