#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace market::chain {

struct TransferResult {
  bool        ok = false;
  std::string reason;

  static TransferResult Ok() {
    return {true, {}};
  }

  static TransferResult Fail(std::string why) {
    return {false, std::move(why)};
  }
};

/*
  External fungible-token transfer primitive.

  Business failures come back as TransferResult; only broken
  infrastructure throws.
*/
class TokenRail {
 public:
  virtual ~TokenRail() = default;

  virtual TransferResult Transfer(uint64_t amount, const std::string& from, const std::string& to) = 0;
};

// Wallet balances outside the contract, held in process.
class InMemoryTokenRail final : public TokenRail {
 public:
  InMemoryTokenRail() = default;
  explicit InMemoryTokenRail(std::map<std::string, uint64_t> genesis_balances);

  TransferResult Transfer(uint64_t amount, const std::string& from, const std::string& to) override;

  uint64_t WalletBalance(const std::string& principal) const;

 private:
  mutable std::mutex              mutex_;
  std::map<std::string, uint64_t> wallets_;
};

} // namespace market::chain
