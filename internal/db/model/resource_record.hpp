#pragma once

#include <cstdint>
#include <string>

namespace market::db::model {

struct ResourceRecord {
  uint64_t    id = 0; // 0 = assign on insert
  std::string provider;

  uint64_t gpu = 0;
  uint64_t cpu = 0;
  uint64_t ram = 0;

  uint64_t hourly_rate = 0;

  // Never toggled by any flow yet; kept for a future reservation feature.
  bool available = true;

  uint64_t created_at_height = 0;
};

} // namespace market::db::model
