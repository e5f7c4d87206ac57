#include "internal/core/treasury.hpp"

#include <limits>
#include <stdexcept>

#include "internal/core/db_errors.hpp"

namespace market::core {

Treasury::Treasury(std::shared_ptr<market::db::Repository> repository) : repository_(std::move(repository)) {
}

uint64_t Treasury::Balance(market::db::Transaction& tx) const {
  return repository_->GetLedgerTotals(tx).treasury;
}

uint64_t Treasury::Collect(market::db::Transaction& tx, uint64_t fee) {
  auto totals = repository_->GetLedgerTotals(tx);
  if (fee > std::numeric_limits<uint64_t>::max() - totals.treasury) {
    throw std::overflow_error("treasury overflow");
  }
  totals.treasury += fee;
  ThrowIfDbError(repository_->UpdateLedgerTotals(tx, totals), "collect platform fee");
  return totals.treasury;
}

} // namespace market::core
