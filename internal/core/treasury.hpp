#pragma once

#include <cstdint>
#include <memory>

#include "internal/db/api/repository.hpp"

namespace market::core {

// Platform fee accumulator. Only ever grows.
class Treasury {
 public:
  explicit Treasury(std::shared_ptr<market::db::Repository> repository);

  uint64_t Balance(market::db::Transaction& tx) const;

  // Returns the new treasury total.
  uint64_t Collect(market::db::Transaction& tx, uint64_t fee);

 private:
  std::shared_ptr<market::db::Repository> repository_;
};

} // namespace market::core
