#include "internal/chain/token_rail.hpp"

#include <limits>

namespace market::chain {

InMemoryTokenRail::InMemoryTokenRail(std::map<std::string, uint64_t> genesis_balances) : wallets_(std::move(genesis_balances)) {
}

TransferResult InMemoryTokenRail::Transfer(uint64_t amount, const std::string& from, const std::string& to) {
  if (amount == 0) {
    return TransferResult::Fail("zero amount");
  }

  std::lock_guard lock(mutex_);
  auto            it = wallets_.find(from);
  if (it == wallets_.end() || it->second < amount) {
    return TransferResult::Fail("insufficient funds");
  }
  auto& dest = wallets_[to];
  if (&dest != &it->second && dest > std::numeric_limits<uint64_t>::max() - amount) {
    return TransferResult::Fail("recipient overflow");
  }

  it->second -= amount;
  dest += amount;
  return TransferResult::Ok();
}

uint64_t InMemoryTokenRail::WalletBalance(const std::string& principal) const {
  std::lock_guard lock(mutex_);
  auto            it = wallets_.find(principal);
  return it == wallets_.end() ? 0 : it->second;
}

} // namespace market::chain
