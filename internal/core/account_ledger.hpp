#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"

namespace market::core {

/*
  Custodial balances the contract holds per principal.

  Every call runs inside the caller's transaction; nothing here commits.
  Deposit/withdraw totals live beside the balances so value
  conservation can be audited.
*/
class AccountLedger {
 public:
  explicit AccountLedger(std::shared_ptr<market::db::Repository> repository);

  // 0 for a principal that never held funds.
  uint64_t Balance(market::db::Transaction& tx, const std::string& principal) const;

  // Returns the new balance. Throws std::overflow_error before writing.
  uint64_t Credit(market::db::Transaction& tx, const std::string& principal, uint64_t amount);

  // Returns the new balance. Throws InsufficientBalance when balance < amount.
  uint64_t Debit(market::db::Transaction& tx, const std::string& principal, uint64_t amount);

  void RecordDeposit(market::db::Transaction& tx, uint64_t amount);
  void RecordWithdrawal(market::db::Transaction& tx, uint64_t amount);

  // Sum over every principal. Throws std::overflow_error if it exceeds uint64.
  uint64_t TotalCustodial(market::db::Transaction& tx) const;

 private:
  std::shared_ptr<market::db::Repository> repository_;
};

} // namespace market::core
