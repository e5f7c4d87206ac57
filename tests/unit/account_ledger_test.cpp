#include <cassert>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>

#include "internal/core/account_ledger.hpp"
#include "internal/core/treasury.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using market::core::AccountLedger;
using market::core::Treasury;
using market::db::memory::MemoryRepository;

void TestUnknownPrincipalHasZeroBalance() {
  auto          repo = std::make_shared<MemoryRepository>();
  AccountLedger ledger(repo);

  auto tx = repo->Begin();
  assert(ledger.Balance(*tx, "nobody") == 0);
  assert(ledger.TotalCustodial(*tx) == 0);
}

void TestCreditAndDebitAdjustBalance() {
  auto          repo = std::make_shared<MemoryRepository>();
  AccountLedger ledger(repo);

  auto tx = repo->Begin();
  assert(ledger.Credit(*tx, "alice", 300) == 300);
  assert(ledger.Credit(*tx, "alice", 200) == 500);
  assert(ledger.Debit(*tx, "alice", 125) == 375);
  assert(ledger.Credit(*tx, "bob", 25) == 25);
  assert(ledger.TotalCustodial(*tx) == 400);
  tx->Commit();

  auto read = repo->Begin();
  assert(ledger.Balance(*read, "alice") == 375);
}

void TestCustodialTotalOverflowThrows() {
  auto          repo = std::make_shared<MemoryRepository>();
  AccountLedger ledger(repo);

  auto tx = repo->Begin();
  ledger.Credit(*tx, "alice", std::numeric_limits<uint64_t>::max());
  ledger.Credit(*tx, "bob", 1);

  bool threw = false;
  try {
    (void)ledger.TotalCustodial(*tx);
  } catch (const std::overflow_error&) {
    threw = true;
  }
  assert(threw);
}

void TestOverdraftFailsWithoutChangingBalance() {
  auto          repo = std::make_shared<MemoryRepository>();
  AccountLedger ledger(repo);

  auto tx = repo->Begin();
  ledger.Credit(*tx, "alice", 100);

  bool threw = false;
  try {
    ledger.Debit(*tx, "alice", 101);
  } catch (const market::util::InsufficientBalance&) {
    threw = true;
  }
  assert(threw);
  assert(ledger.Balance(*tx, "alice") == 100);

  assert(ledger.Debit(*tx, "alice", 100) == 0);
}

void TestCreditOverflowThrowsBeforeWriting() {
  auto          repo = std::make_shared<MemoryRepository>();
  AccountLedger ledger(repo);

  auto tx = repo->Begin();
  ledger.Credit(*tx, "whale", std::numeric_limits<uint64_t>::max());

  bool threw = false;
  try {
    ledger.Credit(*tx, "whale", 1);
  } catch (const std::overflow_error&) {
    threw = true;
  }
  assert(threw);
  assert(ledger.Balance(*tx, "whale") == std::numeric_limits<uint64_t>::max());
}

void TestUncommittedWritesAreDiscarded() {
  auto          repo = std::make_shared<MemoryRepository>();
  AccountLedger ledger(repo);

  {
    auto tx = repo->Begin();
    ledger.Credit(*tx, "alice", 1000);
    ledger.RecordDeposit(*tx, 1000);
  }

  auto tx = repo->Begin();
  assert(ledger.Balance(*tx, "alice") == 0);
  assert(repo->GetLedgerTotals(*tx).total_deposited == 0);
}

void TestTreasuryAccumulatesFees() {
  auto     repo = std::make_shared<MemoryRepository>();
  Treasury treasury(repo);

  auto tx = repo->Begin();
  assert(treasury.Balance(*tx) == 0);
  assert(treasury.Collect(*tx, 1) == 1);
  assert(treasury.Collect(*tx, 2) == 3);
  tx->Commit();

  auto read = repo->Begin();
  assert(treasury.Balance(*read) == 3);
}

} // namespace

int main() {
  TestUnknownPrincipalHasZeroBalance();
  TestCreditAndDebitAdjustBalance();
  TestOverdraftFailsWithoutChangingBalance();
  TestCustodialTotalOverflowThrows();
  TestCreditOverflowThrowsBeforeWriting();
  TestUncommittedWritesAreDiscarded();
  TestTreasuryAccumulatesFees();

  std::cout << "market_unit_account_ledger: pass\n";
  return 0;
}
