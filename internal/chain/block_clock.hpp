#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace market::chain {

/*
  Source of the current block height.
  Heights never decrease.
*/
class BlockClock {
 public:
  virtual ~BlockClock() = default;

  virtual uint64_t CurrentHeight() const = 0;
};

// Advanced explicitly by tests and the admin AdvanceBlocks RPC.
class ManualBlockClock final : public BlockClock {
 public:
  explicit ManualBlockClock(uint64_t genesis_height = 0);

  uint64_t CurrentHeight() const override;

  // Returns the new height.
  uint64_t Advance(uint64_t blocks);

 private:
  std::atomic<uint64_t> height_;
};

// height = genesis_height + elapsed / block_interval
class WallBlockClock final : public BlockClock {
 public:
  using Clock = std::chrono::steady_clock;

  WallBlockClock(uint64_t genesis_height, std::chrono::milliseconds block_interval);

  uint64_t CurrentHeight() const override;

 private:
  uint64_t                  genesis_height_;
  std::chrono::milliseconds block_interval_;
  Clock::time_point         genesis_time_;
};

} // namespace market::chain
