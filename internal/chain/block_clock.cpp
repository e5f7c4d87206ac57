#include "internal/chain/block_clock.hpp"

#include <limits>
#include <stdexcept>

namespace market::chain {

ManualBlockClock::ManualBlockClock(uint64_t genesis_height) : height_(genesis_height) {
}

uint64_t ManualBlockClock::CurrentHeight() const {
  return height_.load();
}

uint64_t ManualBlockClock::Advance(uint64_t blocks) {
  uint64_t current = height_.load();
  for (;;) {
    if (blocks > std::numeric_limits<uint64_t>::max() - current) {
      throw std::overflow_error("block height overflow");
    }
    if (height_.compare_exchange_weak(current, current + blocks)) {
      return current + blocks;
    }
  }
}

WallBlockClock::WallBlockClock(uint64_t genesis_height, std::chrono::milliseconds block_interval)
    : genesis_height_(genesis_height), block_interval_(block_interval), genesis_time_(Clock::now()) {
  if (block_interval_.count() <= 0) {
    throw std::invalid_argument("block interval must be positive");
  }
}

uint64_t WallBlockClock::CurrentHeight() const {
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - genesis_time_);
  return genesis_height_ + static_cast<uint64_t>(elapsed.count() / block_interval_.count());
}

} // namespace market::chain
