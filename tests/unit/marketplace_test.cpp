#include <cassert>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/chain/block_clock.hpp"
#include "internal/chain/execution_verifier.hpp"
#include "internal/chain/token_rail.hpp"
#include "internal/core/market_constants.hpp"
#include "internal/core/marketplace.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using market::chain::InMemoryTokenRail;
using market::chain::ManualBlockClock;
using market::chain::VerifierRegistry;
using market::core::Marketplace;
using market::exchange::v1::JOB_STATUS_COMPLETED;
using market::exchange::v1::ResourceSpec;

constexpr const char* kContract = "market.escrow";

class HashPrefixVerifier final : public market::chain::ExecutionVerifier {
 public:
  bool Verify(const std::string& proof) override {
    return proof.rfind("sha256:", 0) == 0;
  }
};

struct Fixture {
  std::shared_ptr<market::db::memory::MemoryRepository> repo  = std::make_shared<market::db::memory::MemoryRepository>();
  std::shared_ptr<ManualBlockClock>                     clock = std::make_shared<ManualBlockClock>(0);
  std::shared_ptr<InMemoryTokenRail>                    rail =
      std::make_shared<InMemoryTokenRail>(std::map<std::string, uint64_t>{{"requester", 1000}, {"alice", 1000}, {"bob", 1000}});
  std::shared_ptr<VerifierRegistry> verifiers = std::make_shared<VerifierRegistry>();
  Marketplace                       market{repo, clock, rail, verifiers, kContract};
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

ResourceSpec Spec(uint64_t gpu, uint64_t cpu, uint64_t ram) {
  ResourceSpec spec;
  spec.set_gpu(gpu);
  spec.set_cpu(cpu);
  spec.set_ram(ram);
  return spec;
}

void AssertBalanced(Marketplace& market) {
  const auto audit = market.AuditConservation();
  assert(audit.balanced());
}

// Runs the bid sequence 150 (alice), 140 (bob, rejected), 200 (bob) and
// ends the auction. Returns the job id.
uint64_t SettleReferenceAuction(Fixture& f) {
  f.market.DepositFunds("alice", 1000);
  f.market.DepositFunds("bob", 1000);

  const auto auction = f.market.CreateAuction("requester", Spec(1, 8, 32), 24, 100);
  assert(auction.id() == 1);
  assert(auction.end_height() == market::core::kAuctionDurationBlocks);

  f.market.PlaceBid("alice", auction.id(), 150);
  assert(f.market.GetUserBalance("alice") == 850);
  AssertBalanced(f.market);

  ExpectThrows<market::util::BidTooLow>([&] { f.market.PlaceBid("bob", auction.id(), 140); });

  const auto leading = f.market.PlaceBid("bob", auction.id(), 200);
  assert(leading.current_bid() == 200);
  assert(leading.current_bidder() == "bob");
  assert(f.market.GetUserBalance("alice") == 1000);
  assert(f.market.GetUserBalance("bob") == 800);
  AssertBalanced(f.market);

  ExpectThrows<market::util::AuctionActive>([&] { f.market.EndAuction("anyone", auction.id()); });

  f.clock->Advance(market::core::kAuctionDurationBlocks);
  assert(!f.market.IsAuctionActive(auction.id()));
  ExpectThrows<market::util::AuctionEnded>([&] { f.market.PlaceBid("alice", auction.id(), 500); });

  const auto job_id = f.market.EndAuction("anyone", auction.id());
  assert(job_id == 1);
  ExpectThrows<market::util::AlreadyCompleted>([&] { f.market.EndAuction("anyone", auction.id()); });
  AssertBalanced(f.market);
  return job_id;
}

void TestReferenceAuctionSettlesIntoEscrow() {
  Fixture    f;
  const auto job_id = SettleReferenceAuction(f);

  const auto job = f.market.GetJob(job_id);
  assert(job.provider() == "bob");
  assert(job.requester() == "requester");
  assert(job.total_payment() == 200);
  assert(job.milestone_count() == 3);

  const auto entries = f.market.ListEscrow(job_id);
  assert(entries.size() == 3);
  assert(entries[0].amount() == 66);
  assert(entries[1].amount() == 66);
  assert(entries[2].amount() == 68);
  assert(f.market.GetEscrowBalance(job_id, 3).amount() == 68);

  const auto audit = f.market.AuditConservation();
  assert(audit.total_deposited() == 2000);
  assert(audit.unreleased_escrow() == 200);
  assert(audit.open_bids() == 0);
  assert(audit.custodial_balances() == 1800);
}

void TestMilestoneReleasesPayProviderAndTreasury() {
  Fixture    f;
  const auto job_id = SettleReferenceAuction(f);

  ExpectThrows<market::util::NotAuthorized>([&] { f.market.ReleaseMilestone("bob", job_id, 1); });
  ExpectThrows<market::util::MilestoneNotReady>([&] { f.market.ReleaseMilestone("requester", job_id, 4); });

  const auto first = f.market.ReleaseMilestone("requester", job_id, 1);
  assert(first.provider_payment() == 65);
  assert(first.platform_fee() == 1);
  ExpectThrows<market::util::AlreadyCompleted>([&] { f.market.ReleaseMilestone("requester", job_id, 1); });

  f.market.ReleaseMilestone("requester", job_id, 2);
  assert(f.market.GetProviderReputation("bob").completed_jobs() == 0);

  const auto last = f.market.ReleaseMilestone("requester", job_id, 3);
  assert(last.job().completed_milestones() == 3);

  const auto reputation = f.market.GetProviderReputation("bob");
  assert(reputation.completed_jobs() == 1);
  assert(reputation.total_jobs() == 1);
  assert(reputation.total_earned() == 200);
  assert(reputation.score() == 100);

  assert(f.market.GetUserBalance("bob") == 800 + 197);
  assert(f.market.GetPlatformTreasury() == 3);

  const auto audit = f.market.AuditConservation();
  assert(audit.balanced());
  assert(audit.unreleased_escrow() == 0);
  assert(audit.treasury() == 3);
}

void TestWithdrawOverdraftLeavesBalanceUnchanged() {
  Fixture f;
  f.market.DepositFunds("alice", 300);

  ExpectThrows<market::util::InsufficientBalance>([&] { f.market.WithdrawFunds("alice", 301); });
  assert(f.market.GetUserBalance("alice") == 300);
  assert(f.rail->WalletBalance("alice") == 700);

  assert(f.market.WithdrawFunds("alice", 100) == 200);
  assert(f.rail->WalletBalance("alice") == 800);
  assert(f.rail->WalletBalance(kContract) == 200);

  const auto audit = f.market.AuditConservation();
  assert(audit.total_deposited() == 300);
  assert(audit.total_withdrawn() == 100);
  assert(audit.balanced());
}

void TestDepositRollsBackWhenTransferFails() {
  Fixture f;

  ExpectThrows<market::util::TransferFailed>([&] { f.market.DepositFunds("alice", 5000); });
  ExpectThrows<market::util::TransferFailed>([&] { f.market.DepositFunds("stranger", 1); });
  assert(f.market.GetUserBalance("alice") == 0);
  assert(f.market.GetUserBalance("stranger") == 0);
  assert(f.rail->WalletBalance("alice") == 1000);

  const auto audit = f.market.AuditConservation();
  assert(audit.total_deposited() == 0);
  assert(audit.balanced());
}

void TestDepositTotalsOverflowLeavesWalletUntouched() {
  constexpr uint64_t kMax  = std::numeric_limits<uint64_t>::max();
  auto               repo  = std::make_shared<market::db::memory::MemoryRepository>();
  auto               clock = std::make_shared<ManualBlockClock>(0);
  auto               rail  = std::make_shared<InMemoryTokenRail>(std::map<std::string, uint64_t>{{"alice", kMax}});
  Marketplace        market{repo, clock, rail, std::make_shared<VerifierRegistry>(), kContract};

  market.DepositFunds("alice", kMax);
  market.WithdrawFunds("alice", kMax);
  assert(rail->WalletBalance("alice") == kMax);

  // total_deposited is saturated; the rail must not move before that is known
  ExpectThrows<std::overflow_error>([&] { market.DepositFunds("alice", 1); });
  assert(rail->WalletBalance("alice") == kMax);
  assert(rail->WalletBalance(kContract) == 0);
  assert(market.GetUserBalance("alice") == 0);
  assert(market.AuditConservation().balanced());
}

void TestAuditReportsOverflowedHoldingsAsUnbalanced() {
  Fixture f;
  {
    auto tx = f.repo->Begin();
    assert((f.repo->UpsertBalance(*tx, {"alice", std::numeric_limits<uint64_t>::max() / 2 + 1})));
    assert((f.repo->UpsertBalance(*tx, {"bob", std::numeric_limits<uint64_t>::max() / 2 + 1})));
    tx->Commit();
  }

  const auto audit = f.market.AuditConservation();
  assert(!audit.balanced());
  assert(audit.custodial_balances() == std::numeric_limits<uint64_t>::max());
}

void TestVerifyExecutionUsesRegisteredVerifier() {
  Fixture    f;
  const auto job_id = SettleReferenceAuction(f);

  ExpectThrows<market::util::JobNotFound>([&] { f.market.VerifyExecution(99); });
  ExpectThrows<market::util::InvalidProof>([&] { f.market.VerifyExecution(job_id); });

  ExpectThrows<market::util::NotAuthorized>([&] { f.market.SubmitExecutionProof("requester", job_id, "sha256:beef"); });
  const auto job = f.market.SubmitExecutionProof("bob", job_id, "sha256:beef");
  assert(job.status() == JOB_STATUS_COMPLETED);
  assert(job.execution_proof() == "sha256:beef");

  ExpectThrows<market::util::Unsupported>([&] { f.market.VerifyExecution(job_id); });

  f.verifiers->Register(std::make_shared<HashPrefixVerifier>());
  assert(f.market.VerifyExecution(job_id));
}

void TestQueriesOnUnknownIds() {
  Fixture f;

  ExpectThrows<market::util::ResourceNotFound>([&] { f.market.GetResource(1); });
  ExpectThrows<market::util::AuctionNotFound>([&] { f.market.GetAuction(1); });
  ExpectThrows<market::util::JobNotFound>([&] { f.market.GetJob(1); });
  ExpectThrows<market::util::JobNotFound>([&] { f.market.GetEscrowBalance(1, 1); });
  assert(!f.market.IsAuctionActive(1));
  assert(f.market.GetUserBalance("nobody") == 0);

  const auto reputation = f.market.GetProviderReputation("nobody");
  assert(reputation.score() == 50);
  assert(reputation.total_jobs() == 0);
}

void TestListingsAndStats() {
  Fixture f;

  const auto first  = f.market.ListResource("gpu-farm", Spec(8, 64, 512), 40);
  const auto second = f.market.ListResource("gpu-farm", Spec(0, 0, 0), 0);
  const auto third  = f.market.ListResource("cpu-shop", Spec(0, 32, 128), 5);
  assert(first == 1 && second == 2 && third == 3);

  const auto resource = f.market.GetResource(first);
  assert(resource.provider() == "gpu-farm");
  assert(resource.spec().gpu() == 8);
  assert(resource.hourly_rate() == 40);
  assert(resource.available());

  market::db::ResourceFilter by_provider;
  by_provider.provider = "gpu-farm";
  assert(f.market.ListResources(by_provider, {}).size() == 2);
  assert(f.market.ListResources({}, {}).size() == 3);

  market::db::Pagination page;
  page.limit  = 1;
  page.offset = 1;
  const auto paged = f.market.ListResources({}, page);
  assert(paged.size() == 1);
  assert(paged[0].id() == second);

  f.market.CreateAuction("requester", Spec(1, 1, 1), 1, 10);
  f.clock->Advance(10);
  f.market.CreateAuction("requester", Spec(1, 1, 1), 1, 10);
  f.clock->Advance(market::core::kAuctionDurationBlocks - 5);

  assert(f.market.ListAuctions(false, {}).size() == 2);
  const auto active = f.market.ListAuctions(true, {});
  assert(active.size() == 1);
  assert(active[0].id() == 2);

  const auto stats = f.market.Stats();
  assert(stats.resources() == 3);
  assert(stats.auctions() == 2);
  assert(stats.open_auctions() == 1);
  assert(stats.jobs() == 0);
  assert(stats.block_height() == f.clock->CurrentHeight());
}

void TestConstructorRejectsMissingCollaborators() {
  auto repo = std::make_shared<market::db::memory::MemoryRepository>();
  ExpectThrows<std::invalid_argument>([&] {
    Marketplace broken(repo, nullptr, std::make_shared<InMemoryTokenRail>(), std::make_shared<VerifierRegistry>(), kContract);
  });
  ExpectThrows<std::invalid_argument>([&] {
    Marketplace broken(repo, std::make_shared<ManualBlockClock>(), std::make_shared<InMemoryTokenRail>(),
                       std::make_shared<VerifierRegistry>(), "");
  });
}

} // namespace

int main() {
  TestReferenceAuctionSettlesIntoEscrow();
  TestMilestoneReleasesPayProviderAndTreasury();
  TestWithdrawOverdraftLeavesBalanceUnchanged();
  TestDepositRollsBackWhenTransferFails();
  TestDepositTotalsOverflowLeavesWalletUntouched();
  TestAuditReportsOverflowedHoldingsAsUnbalanced();
  TestVerifyExecutionUsesRegisteredVerifier();
  TestQueriesOnUnknownIds();
  TestListingsAndStats();
  TestConstructorRejectsMissingCollaborators();

  std::cout << "market_unit_marketplace: pass\n";
  return 0;
}
