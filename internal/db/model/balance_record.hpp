#pragma once

#include <cstdint>
#include <string>

namespace market::db::model {

// Custodial balance the contract holds on behalf of a principal.
struct BalanceRecord {
  std::string principal;
  uint64_t    balance = 0;
};

} // namespace market::db::model
