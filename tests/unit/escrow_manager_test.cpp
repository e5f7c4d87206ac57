#include <cassert>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/account_ledger.hpp"
#include "internal/core/escrow_manager.hpp"
#include "internal/core/reputation_tracker.hpp"
#include "internal/core/treasury.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using market::core::AccountLedger;
using market::core::EscrowManager;
using market::core::ReputationTracker;
using market::core::Treasury;
using market::db::memory::MemoryRepository;
using market::exchange::core::v1::JOB_STATUS_ACTIVE;
using market::exchange::core::v1::JOB_STATUS_COMPLETED;

struct Escrow {
  std::shared_ptr<MemoryRepository> repo = std::make_shared<MemoryRepository>();
  AccountLedger                     ledger{repo};
  Treasury                          treasury{repo};
  ReputationTracker                 reputation{repo};
  EscrowManager                     escrow{repo, ledger, treasury, reputation};
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

market::db::model::JobRecord OpenJob(Escrow& e, market::db::Transaction& tx, uint64_t total) {
  market::db::model::AuctionRecord settled;
  settled.id             = 7;
  settled.requester      = "requester";
  settled.current_bid    = total;
  settled.current_bidder = "provider";
  settled.ended          = true;
  return e.escrow.OpenJob(tx, settled, 200);
}

void TestPartitionGivesRemainderToLastMilestone() {
  assert((EscrowManager::Partition(200, 3) == std::vector<uint64_t>{66, 66, 68}));
  assert((EscrowManager::Partition(300, 3) == std::vector<uint64_t>{100, 100, 100}));
  assert((EscrowManager::Partition(2, 3) == std::vector<uint64_t>{0, 0, 2}));
  assert((EscrowManager::Partition(0, 3) == std::vector<uint64_t>{0, 0, 0}));

  const auto max    = std::numeric_limits<uint64_t>::max();
  const auto shares = EscrowManager::Partition(max, 3);
  assert(shares[0] + shares[1] + shares[2] == max);
}

void TestPlatformFeeIsTwoAndAHalfPercentRoundedDown() {
  assert(EscrowManager::PlatformFee(66) == 1);
  assert(EscrowManager::PlatformFee(68) == 1);
  assert(EscrowManager::PlatformFee(39) == 0);
  assert(EscrowManager::PlatformFee(40) == 1);
  assert(EscrowManager::PlatformFee(1000) == 25);
  assert(EscrowManager::PlatformFee(1039) == 25);

  const auto max = std::numeric_limits<uint64_t>::max();
  assert(EscrowManager::PlatformFee(max) == max / 1000 * 25 + max % 1000 * 25 / 1000);
}

void TestOpenJobWritesOneBasedEscrowEntries() {
  Escrow e;
  auto   tx  = e.repo->Begin();
  auto   job = OpenJob(e, *tx, 200);

  assert(job.id == 1);
  assert(job.auction_id == 7);
  assert(job.status == JOB_STATUS_ACTIVE);
  assert(job.completed_milestones == 0);

  const auto entries = e.escrow.ListEscrow(*tx, job.id);
  assert(entries.size() == 3);
  assert(entries[0].milestone_index == 1 && entries[0].amount == 66);
  assert(entries[1].milestone_index == 2 && entries[1].amount == 66);
  assert(entries[2].milestone_index == 3 && entries[2].amount == 68);

  ExpectThrows<market::util::MilestoneNotReady>([&] { e.escrow.GetEscrow(*tx, job.id, 0); });
  ExpectThrows<market::util::MilestoneNotReady>([&] { e.escrow.GetEscrow(*tx, job.id, 4); });
  ExpectThrows<market::util::JobNotFound>([&] { e.escrow.GetEscrow(*tx, 99, 1); });
  ExpectThrows<market::util::JobNotFound>([&] { e.escrow.ListEscrow(*tx, 99); });
}

void TestReleaseChecksCallerAndOrder() {
  Escrow e;
  auto   tx  = e.repo->Begin();
  auto   job = OpenJob(e, *tx, 200);

  ExpectThrows<market::util::JobNotFound>([&] { e.escrow.ReleaseMilestone(*tx, "requester", 99, 1); });
  ExpectThrows<market::util::MilestoneNotReady>([&] { e.escrow.ReleaseMilestone(*tx, "requester", job.id, 9); });
  ExpectThrows<market::util::NotAuthorized>([&] { e.escrow.ReleaseMilestone(*tx, "provider", job.id, 1); });

  const auto payout = e.escrow.ReleaseMilestone(*tx, "requester", job.id, 1);
  assert(payout.provider_payment == 65);
  assert(payout.platform_fee == 1);
  assert(payout.job.completed_milestones == 1);
  assert(!payout.reputation_updated);

  ExpectThrows<market::util::AlreadyCompleted>([&] { e.escrow.ReleaseMilestone(*tx, "requester", job.id, 1); });

  assert(e.ledger.Balance(*tx, "provider") == 65);
  assert(e.treasury.Balance(*tx) == 1);
  assert(e.escrow.GetEscrow(*tx, job.id, 1).released);
  assert(!e.escrow.GetEscrow(*tx, job.id, 2).released);
}

void TestFinalReleaseUpdatesReputation() {
  Escrow e;
  auto   tx  = e.repo->Begin();
  auto   job = OpenJob(e, *tx, 200);

  e.escrow.ReleaseMilestone(*tx, "requester", job.id, 3);
  e.escrow.ReleaseMilestone(*tx, "requester", job.id, 1);
  assert(e.reputation.Get(*tx, "provider").completed_jobs == 0);

  const auto last = e.escrow.ReleaseMilestone(*tx, "requester", job.id, 2);
  assert(last.reputation_updated);
  assert(last.job.completed_milestones == 3);

  // 66 -> 65 + 1, 66 -> 65 + 1, 68 -> 67 + 1
  assert(e.ledger.Balance(*tx, "provider") == 197);
  assert(e.treasury.Balance(*tx) == 3);

  const auto reputation = e.reputation.Get(*tx, "provider");
  assert(reputation.completed_jobs == 1);
  assert(reputation.total_jobs == 1);
  assert(reputation.total_earned == 200);
  assert(reputation.score == 100);
}

void TestProofSubmissionIsProviderOnlyAndOnce() {
  Escrow e;
  auto   tx  = e.repo->Begin();
  auto   job = OpenJob(e, *tx, 90);

  ExpectThrows<market::util::JobNotFound>([&] { e.escrow.SubmitExecutionProof(*tx, "provider", 99, "hash"); });
  ExpectThrows<market::util::NotAuthorized>([&] { e.escrow.SubmitExecutionProof(*tx, "requester", job.id, "hash"); });

  const auto submitted = e.escrow.SubmitExecutionProof(*tx, "provider", job.id, "sha256:abc");
  assert(submitted.status == JOB_STATUS_COMPLETED);
  assert(submitted.execution_proof == std::string("sha256:abc"));

  ExpectThrows<market::util::AlreadyCompleted>([&] { e.escrow.SubmitExecutionProof(*tx, "provider", job.id, "again"); });

  // Release still works after proof submission; it never looks at the proof.
  const auto payout = e.escrow.ReleaseMilestone(*tx, "requester", job.id, 1);
  assert(payout.provider_payment + payout.platform_fee == 30);
}

} // namespace

int main() {
  TestPartitionGivesRemainderToLastMilestone();
  TestPlatformFeeIsTwoAndAHalfPercentRoundedDown();
  TestOpenJobWritesOneBasedEscrowEntries();
  TestReleaseChecksCallerAndOrder();
  TestFinalReleaseUpdatesReputation();
  TestProofSubmissionIsProviderOnlyAndOnce();

  std::cout << "market_unit_escrow_manager: pass\n";
  return 0;
}
