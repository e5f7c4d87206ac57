#pragma once

#include <cstdint>

namespace market::db::model {

/*
  Single-row accumulator.

  treasury collects platform fees. The deposit/withdraw totals exist so
  value conservation can be audited against the custodial state.
*/

struct LedgerTotalsRecord {
  uint64_t treasury        = 0;
  uint64_t total_deposited = 0;
  uint64_t total_withdrawn = 0;
};

} // namespace market::db::model
