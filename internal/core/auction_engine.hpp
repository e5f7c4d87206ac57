#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "internal/core/resource_registry.hpp"
#include "internal/db/api/repository.hpp"

namespace market::core {

class AccountLedger;
class EscrowManager;

struct AuctionTerms {
  ResourceCapacity requirements;
  uint64_t         max_duration   = 0;
  uint64_t         starting_price = 0;
};

struct BidOutcome {
  market::db::model::AuctionRecord auction;
  // The displaced bidder and the exact amount returned to them.
  std::optional<std::string> refunded_bidder;
  uint64_t                   refunded_amount = 0;
};

struct AuctionSettlement {
  market::db::model::AuctionRecord            auction;
  std::optional<market::db::model::JobRecord> job;

  // 0 when the auction closed without a bidder.
  uint64_t JobId() const {
    return job ? job->id : 0;
  }
};

/*
  English auctions with a fixed block duration.

    Open   : !ended && height < end_height, accepting strictly higher bids
    Ended  : terminal; settled into a job when a bidder exists

  A bid is escrowed in full the moment it is accepted and returned in
  full when it is outbid.
*/
class AuctionEngine {
 public:
  AuctionEngine(std::shared_ptr<market::db::Repository> repository, AccountLedger& ledger, EscrowManager& escrow);

  market::db::model::AuctionRecord Create(market::db::Transaction& tx, const std::string& requester, const AuctionTerms& terms,
                                          uint64_t height);

  BidOutcome PlaceBid(market::db::Transaction& tx, const std::string& bidder, uint64_t auction_id, uint64_t amount, uint64_t height);

  AuctionSettlement End(market::db::Transaction& tx, uint64_t auction_id, uint64_t height);

  // Throws AuctionNotFound.
  market::db::model::AuctionRecord Get(market::db::Transaction& tx, uint64_t auction_id) const;

  static bool IsActive(const market::db::model::AuctionRecord& auction, uint64_t height);

 private:
  std::shared_ptr<market::db::Repository> repository_;
  AccountLedger&                          ledger_;
  EscrowManager&                          escrow_;
};

} // namespace market::core
