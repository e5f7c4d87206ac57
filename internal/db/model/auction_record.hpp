#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace market::db::model {

/*
  Persistent auction row.

  IMPORTANT:
  - current_bid never decreases.
  - current_bidder is empty iff no bid above starting_price was accepted.
  - ended flips false -> true exactly once.
*/

struct AuctionRecord {
  uint64_t    id = 0; // 0 = assign on insert
  std::string requester;

  uint64_t req_gpu = 0;
  uint64_t req_cpu = 0;
  uint64_t req_ram = 0;

  uint64_t max_duration   = 0;
  uint64_t starting_price = 0;
  uint64_t current_bid    = 0;

  std::optional<std::string> current_bidder;

  uint64_t end_height        = 0;
  bool     ended             = false;
  uint64_t created_at_height = 0;
};

} // namespace market::db::model
