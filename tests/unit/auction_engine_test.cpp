#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/account_ledger.hpp"
#include "internal/core/auction_engine.hpp"
#include "internal/core/escrow_manager.hpp"
#include "internal/core/market_constants.hpp"
#include "internal/core/reputation_tracker.hpp"
#include "internal/core/treasury.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using market::core::AccountLedger;
using market::core::AuctionEngine;
using market::core::AuctionTerms;
using market::core::EscrowManager;
using market::core::ReputationTracker;
using market::core::Treasury;
using market::db::memory::MemoryRepository;

struct Engine {
  std::shared_ptr<MemoryRepository> repo = std::make_shared<MemoryRepository>();
  AccountLedger                     ledger{repo};
  Treasury                          treasury{repo};
  ReputationTracker                 reputation{repo};
  EscrowManager                     escrow{repo, ledger, treasury, reputation};
  AuctionEngine                     auctions{repo, ledger, escrow};
};

template <typename E, typename Fn>
void ExpectThrows(Fn&& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const E&) {
    threw = true;
  }
  assert(threw);
}

AuctionTerms Terms(uint64_t starting_price) {
  AuctionTerms terms;
  terms.requirements   = {1, 8, 32};
  terms.max_duration   = 24;
  terms.starting_price = starting_price;
  return terms;
}

void TestCreateSetsEndHeightAndStartingBid() {
  Engine engine;
  auto   tx = engine.repo->Begin();

  const auto auction = engine.auctions.Create(*tx, "requester", Terms(100), 10);
  assert(auction.id == 1);
  assert(auction.current_bid == 100);
  assert(!auction.current_bidder.has_value());
  assert(auction.end_height == 10 + market::core::kAuctionDurationBlocks);
  assert(AuctionEngine::IsActive(auction, 10));
  assert(AuctionEngine::IsActive(auction, auction.end_height - 1));
  assert(!AuctionEngine::IsActive(auction, auction.end_height));

  const auto second = engine.auctions.Create(*tx, "requester", Terms(5), 10);
  assert(second.id == 2);
}

void TestBidsMustStrictlyExceedCurrentBid() {
  Engine engine;
  auto   tx = engine.repo->Begin();
  engine.ledger.Credit(*tx, "b1", 1000);
  engine.ledger.Credit(*tx, "b2", 1000);

  const auto auction = engine.auctions.Create(*tx, "requester", Terms(100), 0);

  ExpectThrows<market::util::BidTooLow>([&] { engine.auctions.PlaceBid(*tx, "b1", auction.id, 100, 1); });

  auto first = engine.auctions.PlaceBid(*tx, "b1", auction.id, 150, 1);
  assert(first.auction.current_bid == 150);
  assert(first.auction.current_bidder == std::string("b1"));
  assert(!first.refunded_bidder.has_value());
  assert(engine.ledger.Balance(*tx, "b1") == 850);

  ExpectThrows<market::util::BidTooLow>([&] { engine.auctions.PlaceBid(*tx, "b2", auction.id, 140, 2); });
  assert(engine.ledger.Balance(*tx, "b2") == 1000);

  auto second = engine.auctions.PlaceBid(*tx, "b2", auction.id, 200, 2);
  assert(second.auction.current_bid == 200);
  assert(second.auction.current_bidder == std::string("b2"));
  assert(second.refunded_bidder == std::string("b1"));
  assert(second.refunded_amount == 150);
  assert(engine.ledger.Balance(*tx, "b1") == 1000);
  assert(engine.ledger.Balance(*tx, "b2") == 800);
}

void TestBidRequiresFullAmountOnDeposit() {
  Engine engine;
  auto   tx = engine.repo->Begin();
  engine.ledger.Credit(*tx, "poor", 120);

  const auto auction = engine.auctions.Create(*tx, "requester", Terms(100), 0);
  ExpectThrows<market::util::InsufficientBalance>([&] { engine.auctions.PlaceBid(*tx, "poor", auction.id, 121, 1); });

  engine.auctions.PlaceBid(*tx, "poor", auction.id, 110, 1);
  // Raising an own bid needs the whole new amount, not the increment.
  ExpectThrows<market::util::InsufficientBalance>([&] { engine.auctions.PlaceBid(*tx, "poor", auction.id, 115, 1); });
  assert(engine.ledger.Balance(*tx, "poor") == 10);
}

void TestBidsOnClosedOrUnknownAuctionsFail() {
  Engine engine;
  auto   tx = engine.repo->Begin();
  engine.ledger.Credit(*tx, "b1", 1000);

  const auto auction = engine.auctions.Create(*tx, "requester", Terms(100), 0);

  ExpectThrows<market::util::AuctionNotFound>([&] { engine.auctions.PlaceBid(*tx, "b1", 99, 500, 1); });
  ExpectThrows<market::util::AuctionEnded>([&] { engine.auctions.PlaceBid(*tx, "b1", auction.id, 500, auction.end_height); });
  assert(engine.ledger.Balance(*tx, "b1") == 1000);
}

void TestEndBeforeDeadlineFails() {
  Engine engine;
  auto   tx = engine.repo->Begin();

  const auto auction = engine.auctions.Create(*tx, "requester", Terms(100), 0);
  ExpectThrows<market::util::AuctionActive>([&] { engine.auctions.End(*tx, auction.id, auction.end_height - 1); });
  ExpectThrows<market::util::AuctionNotFound>([&] { engine.auctions.End(*tx, 42, auction.end_height); });
}

void TestEndWithoutBidderCreatesNoJob() {
  Engine engine;
  auto   tx = engine.repo->Begin();

  const auto auction    = engine.auctions.Create(*tx, "requester", Terms(100), 0);
  const auto settlement = engine.auctions.End(*tx, auction.id, auction.end_height);
  assert(settlement.auction.ended);
  assert(!settlement.job.has_value());
  assert(settlement.JobId() == 0);

  ExpectThrows<market::util::AlreadyCompleted>([&] { engine.auctions.End(*tx, auction.id, auction.end_height + 1); });
}

void TestEndWithBidderOpensJobAndEscrow() {
  Engine engine;
  auto   tx = engine.repo->Begin();
  engine.ledger.Credit(*tx, "provider", 500);

  const auto auction = engine.auctions.Create(*tx, "requester", Terms(100), 0);
  engine.auctions.PlaceBid(*tx, "provider", auction.id, 200, 1);

  const auto settlement = engine.auctions.End(*tx, auction.id, auction.end_height + 5);
  assert(settlement.job.has_value());
  assert(settlement.JobId() == 1);
  assert(settlement.job->provider == "provider");
  assert(settlement.job->requester == "requester");
  assert(settlement.job->total_payment == 200);
  assert(settlement.job->milestone_count == market::core::kMilestoneCount);

  const auto entries = engine.escrow.ListEscrow(*tx, settlement.JobId());
  assert(entries.size() == 3);
  uint64_t sum = 0;
  for (const auto& entry : entries) sum += entry.amount;
  assert(sum == 200);

  ExpectThrows<market::util::AuctionEnded>([&] { engine.auctions.PlaceBid(*tx, "provider", auction.id, 300, 1); });
}

} // namespace

int main() {
  TestCreateSetsEndHeightAndStartingBid();
  TestBidsMustStrictlyExceedCurrentBid();
  TestBidRequiresFullAmountOnDeposit();
  TestBidsOnClosedOrUnknownAuctionsFail();
  TestEndBeforeDeadlineFails();
  TestEndWithoutBidderCreatesNoJob();
  TestEndWithBidderOpensJobAndEscrow();

  std::cout << "market_unit_auction_engine: pass\n";
  return 0;
}
