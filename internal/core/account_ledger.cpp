#include "internal/core/account_ledger.hpp"

#include <limits>
#include <stdexcept>

#include "internal/core/db_errors.hpp"
#include "internal/util/errors.hpp"

namespace market::core {

AccountLedger::AccountLedger(std::shared_ptr<market::db::Repository> repository) : repository_(std::move(repository)) {
}

uint64_t AccountLedger::Balance(market::db::Transaction& tx, const std::string& principal) const {
  auto record = repository_->GetBalance(tx, principal);
  return record ? record->balance : 0;
}

uint64_t AccountLedger::Credit(market::db::Transaction& tx, const std::string& principal, uint64_t amount) {
  const auto current = Balance(tx, principal);
  if (amount > std::numeric_limits<uint64_t>::max() - current) {
    throw std::overflow_error("credit " + principal + ": balance overflow");
  }

  const auto next = current + amount;
  ThrowIfDbError(repository_->UpsertBalance(tx, {principal, next}), "credit " + principal);
  return next;
}

uint64_t AccountLedger::Debit(market::db::Transaction& tx, const std::string& principal, uint64_t amount) {
  const auto current = Balance(tx, principal);
  if (current < amount) {
    throw market::util::InsufficientBalance(principal + " holds " + std::to_string(current) + ", needs " + std::to_string(amount));
  }

  const auto next = current - amount;
  ThrowIfDbError(repository_->UpsertBalance(tx, {principal, next}), "debit " + principal);
  return next;
}

void AccountLedger::RecordDeposit(market::db::Transaction& tx, uint64_t amount) {
  auto totals = repository_->GetLedgerTotals(tx);
  if (amount > std::numeric_limits<uint64_t>::max() - totals.total_deposited) {
    throw std::overflow_error("total deposited overflow");
  }
  totals.total_deposited += amount;
  ThrowIfDbError(repository_->UpdateLedgerTotals(tx, totals), "record deposit");
}

void AccountLedger::RecordWithdrawal(market::db::Transaction& tx, uint64_t amount) {
  auto totals = repository_->GetLedgerTotals(tx);
  if (amount > std::numeric_limits<uint64_t>::max() - totals.total_withdrawn) {
    throw std::overflow_error("total withdrawn overflow");
  }
  totals.total_withdrawn += amount;
  ThrowIfDbError(repository_->UpdateLedgerTotals(tx, totals), "record withdrawal");
}

uint64_t AccountLedger::TotalCustodial(market::db::Transaction& tx) const {
  uint64_t total = 0;
  for (const auto& record : repository_->ListBalances(tx)) {
    if (record.balance > std::numeric_limits<uint64_t>::max() - total) {
      throw std::overflow_error("custodial total overflow");
    }
    total += record.balance;
  }
  return total;
}

} // namespace market::core
