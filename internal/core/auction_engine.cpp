#include "internal/core/auction_engine.hpp"

#include <limits>
#include <stdexcept>

#include "internal/core/account_ledger.hpp"
#include "internal/core/db_errors.hpp"
#include "internal/core/escrow_manager.hpp"
#include "internal/core/market_constants.hpp"
#include "internal/util/errors.hpp"

namespace market::core {

AuctionEngine::AuctionEngine(std::shared_ptr<market::db::Repository> repository, AccountLedger& ledger, EscrowManager& escrow)
    : repository_(std::move(repository)), ledger_(ledger), escrow_(escrow) {
}

bool AuctionEngine::IsActive(const market::db::model::AuctionRecord& auction, uint64_t height) {
  return !auction.ended && height < auction.end_height;
}

market::db::model::AuctionRecord AuctionEngine::Get(market::db::Transaction& tx, uint64_t auction_id) const {
  auto auction = repository_->GetAuction(tx, auction_id);
  if (!auction) {
    throw market::util::AuctionNotFound("auction " + std::to_string(auction_id));
  }
  return *auction;
}

market::db::model::AuctionRecord AuctionEngine::Create(market::db::Transaction& tx, const std::string& requester, const AuctionTerms& terms,
                                                       uint64_t height) {
  if (height > std::numeric_limits<uint64_t>::max() - kAuctionDurationBlocks) {
    throw std::overflow_error("auction end height overflow");
  }

  market::db::model::AuctionRecord auction;
  auction.requester         = requester;
  auction.req_gpu           = terms.requirements.gpu;
  auction.req_cpu           = terms.requirements.cpu;
  auction.req_ram           = terms.requirements.ram;
  auction.max_duration      = terms.max_duration;
  auction.starting_price    = terms.starting_price;
  auction.current_bid       = terms.starting_price;
  auction.current_bidder    = std::nullopt;
  auction.end_height        = height + kAuctionDurationBlocks;
  auction.ended             = false;
  auction.created_at_height = height;

  ThrowIfDbError(repository_->InsertAuction(tx, auction), "create auction");
  return auction;
}

BidOutcome AuctionEngine::PlaceBid(market::db::Transaction& tx, const std::string& bidder, uint64_t auction_id, uint64_t amount,
                                   uint64_t height) {
  auto auction = Get(tx, auction_id);
  if (!IsActive(auction, height)) {
    throw market::util::AuctionEnded("auction " + std::to_string(auction_id) + " closed at height " + std::to_string(auction.end_height));
  }
  if (amount <= auction.current_bid) {
    throw market::util::BidTooLow("bid " + std::to_string(amount) + " must exceed " + std::to_string(auction.current_bid));
  }
  // Checked against the balance before any refund, so a leading bidder
  // raising their own bid still needs the full new amount on hand.
  if (ledger_.Balance(tx, bidder) < amount) {
    throw market::util::InsufficientBalance(bidder + " cannot cover bid " + std::to_string(amount));
  }

  BidOutcome outcome;
  if (auction.current_bidder) {
    ledger_.Credit(tx, *auction.current_bidder, auction.current_bid);
    outcome.refunded_bidder = auction.current_bidder;
    outcome.refunded_amount = auction.current_bid;
  }
  ledger_.Debit(tx, bidder, amount);

  auction.current_bid    = amount;
  auction.current_bidder = bidder;
  ThrowIfDbError(repository_->UpdateAuction(tx, auction), "place bid");

  outcome.auction = std::move(auction);
  return outcome;
}

AuctionSettlement AuctionEngine::End(market::db::Transaction& tx, uint64_t auction_id, uint64_t height) {
  auto auction = Get(tx, auction_id);
  if (height < auction.end_height) {
    throw market::util::AuctionActive("auction " + std::to_string(auction_id) + " runs until height " + std::to_string(auction.end_height));
  }
  if (auction.ended) {
    throw market::util::AlreadyCompleted("auction " + std::to_string(auction_id) + " already ended");
  }

  auction.ended = true;
  ThrowIfDbError(repository_->UpdateAuction(tx, auction), "end auction");

  AuctionSettlement settlement;
  if (auction.current_bidder) {
    // The winning bid is already held by the contract; it moves into escrow.
    settlement.job = escrow_.OpenJob(tx, auction, height);
  }
  settlement.auction = std::move(auction);
  return settlement;
}

} // namespace market::core
