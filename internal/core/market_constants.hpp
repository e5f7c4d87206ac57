#pragma once

#include <cstdint>

namespace market::core {

// Blocks between auction creation and the earliest end_auction.
inline constexpr uint64_t kAuctionDurationBlocks = 144;

// Every job is split into this many escrowed milestones, regardless of
// what the auction asked for.
inline constexpr uint32_t kMilestoneCount = 3;

// Platform fee on each milestone payout, in tokens per thousand (2.5%).
inline constexpr uint64_t kPlatformFeePerMille = 25;

// Score reported for a provider with no completed jobs.
inline constexpr uint32_t kDefaultReputationScore = 50;

} // namespace market::core
