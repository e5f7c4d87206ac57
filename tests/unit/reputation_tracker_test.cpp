#include <cassert>
#include <iostream>
#include <memory>

#include "internal/core/reputation_tracker.hpp"
#include "internal/db/memory/memory_repository.hpp"

namespace {

using market::core::ReputationTracker;
using market::db::memory::MemoryRepository;

void TestUnknownProviderReadsAsNeutralDefault() {
  auto              repo = std::make_shared<MemoryRepository>();
  ReputationTracker tracker(repo);

  auto       tx         = repo->Begin();
  const auto reputation = tracker.Get(*tx, "provider-x");
  assert(reputation.provider == "provider-x");
  assert(reputation.score == 50);
  assert(reputation.completed_jobs == 0);
  assert(reputation.total_jobs == 0);
  assert(reputation.total_earned == 0);
}

void TestCompletionRaisesScoreToHundred() {
  auto              repo = std::make_shared<MemoryRepository>();
  ReputationTracker tracker(repo);

  auto tx    = repo->Begin();
  auto first = tracker.RecordCompletion(*tx, "p1", 200);
  assert(first.completed_jobs == 1);
  assert(first.total_jobs == 1);
  assert(first.total_earned == 200);
  assert(first.score == 100);

  auto second = tracker.RecordCompletion(*tx, "p1", 50);
  assert(second.completed_jobs == 2);
  assert(second.total_jobs == 2);
  assert(second.total_earned == 250);
  assert(second.score == 100);
  tx->Commit();

  auto read = repo->Begin();
  assert(tracker.Get(*read, "p1").total_earned == 250);
}

void TestScoreFormula() {
  assert(ReputationTracker::Score(0, 0) == 50);
  assert(ReputationTracker::Score(1, 2) == 50);
  assert(ReputationTracker::Score(2, 3) == 66);
  assert(ReputationTracker::Score(3, 3) == 100);
  assert(ReputationTracker::Score(0, 4) == 0);
}

} // namespace

int main() {
  TestUnknownProviderReadsAsNeutralDefault();
  TestCompletionRaisesScoreToHundred();
  TestScoreFormula();

  std::cout << "market_unit_reputation_tracker: pass\n";
  return 0;
}
