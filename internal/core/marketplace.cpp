#include "internal/core/marketplace.hpp"

#include <limits>
#include <stdexcept>

#include "internal/chain/block_clock.hpp"
#include "internal/chain/execution_verifier.hpp"
#include "internal/chain/token_rail.hpp"
#include "internal/core/conversions.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace market::core {

using namespace market::exchange::v1;
using market::observability::BoolField;
using market::observability::IntField;
using market::observability::TokenField;
using market::observability::StringField;

namespace {

constexpr std::size_t kScanPageSize = 256;

// Drains a paged repository listing.
template <typename Record, typename Fetch>
std::vector<Record> ScanAll(Fetch&& fetch) {
  std::vector<Record>    all;
  market::db::Pagination page{kScanPageSize, 0};
  for (;;) {
    auto batch = fetch(page);
    all.insert(all.end(), batch.begin(), batch.end());
    if (batch.size() < page.limit) {
      return all;
    }
    page.offset += batch.size();
  }
}

ResourceCapacity ToCapacity(const ResourceSpec& spec) {
  return {spec.gpu(), spec.cpu(), spec.ram()};
}

} // namespace

Marketplace::Marketplace(std::shared_ptr<market::db::Repository> repository, std::shared_ptr<market::chain::BlockClock> clock,
                         std::shared_ptr<market::chain::TokenRail> token_rail, std::shared_ptr<market::chain::VerifierRegistry> verifiers,
                         std::string contract_principal)
    : repository_(std::move(repository)),
      clock_(std::move(clock)),
      token_rail_(std::move(token_rail)),
      verifiers_(std::move(verifiers)),
      contract_principal_(std::move(contract_principal)),
      ledger_(repository_),
      treasury_(repository_),
      reputation_(repository_),
      registry_(repository_),
      escrow_(repository_, ledger_, treasury_, reputation_),
      auctions_(repository_, ledger_, escrow_) {
  if (!repository_ || !clock_ || !token_rail_ || !verifiers_) {
    throw std::invalid_argument("marketplace requires repository, clock, token rail and verifier registry");
  }
  if (contract_principal_.empty()) {
    throw std::invalid_argument("marketplace requires a contract principal");
  }
}

uint64_t Marketplace::BlockHeight() const {
  return clock_->CurrentHeight();
}

// ------------------------------------------------------------------
// Resource registry
// ------------------------------------------------------------------

uint64_t Marketplace::ListResource(const std::string& sender, const ResourceSpec& spec, uint64_t hourly_rate) {
  std::lock_guard lock(mutex_);
  const auto      height = clock_->CurrentHeight();
  auto            tx     = repository_->Begin();
  auto            record = registry_.List(*tx, sender, ToCapacity(spec), hourly_rate, height);
  tx->Commit();

  MARKET_LOG_INFO("resource listed", {TokenField("resource_id", record.id), StringField("provider", sender),
                                      TokenField("hourly_rate", hourly_rate)});
  return record.id;
}

ComputeResource Marketplace::GetResource(uint64_t resource_id) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  return ToProto(registry_.Get(*tx, resource_id));
}

std::vector<ComputeResource> Marketplace::ListResources(const market::db::ResourceFilter& filter, const market::db::Pagination& page) {
  std::lock_guard              lock(mutex_);
  auto                         tx = repository_->Begin();
  std::vector<ComputeResource> out;
  for (const auto& record : registry_.Find(*tx, filter, page)) {
    out.push_back(ToProto(record));
  }
  return out;
}

// ------------------------------------------------------------------
// Auctions
// ------------------------------------------------------------------

Auction Marketplace::CreateAuction(const std::string& sender, const ResourceSpec& requirements, uint64_t max_duration,
                                   uint64_t starting_price) {
  std::lock_guard lock(mutex_);
  const auto      height = clock_->CurrentHeight();
  auto            tx     = repository_->Begin();

  AuctionTerms terms;
  terms.requirements   = ToCapacity(requirements);
  terms.max_duration   = max_duration;
  terms.starting_price = starting_price;
  auto auction         = auctions_.Create(*tx, sender, terms, height);
  tx->Commit();

  MARKET_LOG_INFO("auction created", {TokenField("auction_id", auction.id), StringField("requester", sender),
                                      TokenField("starting_price", starting_price), TokenField("end_height", auction.end_height)});
  return ToProto(auction);
}

Auction Marketplace::PlaceBid(const std::string& sender, uint64_t auction_id, uint64_t amount) {
  std::lock_guard lock(mutex_);
  const auto      height  = clock_->CurrentHeight();
  auto            tx      = repository_->Begin();
  auto            outcome = auctions_.PlaceBid(*tx, sender, auction_id, amount, height);
  tx->Commit();

  if (outcome.refunded_bidder) {
    MARKET_LOG_INFO("bid refunded", {TokenField("auction_id", auction_id), StringField("bidder", *outcome.refunded_bidder),
                                     TokenField("amount", outcome.refunded_amount)});
  }
  MARKET_LOG_INFO("bid accepted", {TokenField("auction_id", auction_id), StringField("bidder", sender), TokenField("amount", amount)});
  return ToProto(outcome.auction);
}

uint64_t Marketplace::EndAuction(const std::string& sender, uint64_t auction_id) {
  std::lock_guard lock(mutex_);
  const auto      height     = clock_->CurrentHeight();
  auto            tx         = repository_->Begin();
  auto            settlement = auctions_.End(*tx, auction_id, height);
  tx->Commit();

  if (settlement.job) {
    market::observability::Metrics::Instance().RecordSettlement("auction_settled", settlement.job->total_payment);
    MARKET_LOG_INFO("auction ended", {TokenField("auction_id", auction_id), TokenField("job_id", settlement.job->id),
                                      StringField("winner", settlement.job->provider), TokenField("amount", settlement.job->total_payment),
                                      StringField("ended_by", sender)});
  } else {
    MARKET_LOG_INFO("auction ended without bids", {TokenField("auction_id", auction_id), StringField("ended_by", sender)});
  }
  return settlement.JobId();
}

Auction Marketplace::GetAuction(uint64_t auction_id) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  return ToProto(auctions_.Get(*tx, auction_id));
}

bool Marketplace::IsAuctionActive(uint64_t auction_id) {
  std::lock_guard lock(mutex_);
  const auto      height  = clock_->CurrentHeight();
  auto            tx      = repository_->Begin();
  auto            auction = repository_->GetAuction(*tx, auction_id);
  return auction && AuctionEngine::IsActive(*auction, height);
}

std::vector<Auction> Marketplace::ListAuctions(bool active_only, const market::db::Pagination& page) {
  std::lock_guard      lock(mutex_);
  auto                 tx = repository_->Begin();
  std::vector<Auction> out;

  if (!active_only) {
    for (const auto& record : repository_->ListAuctions(*tx, {}, page)) {
      out.push_back(ToProto(record));
    }
    return out;
  }

  // Un-ended auctions past their end height are not active, so the page
  // window is applied after the height filter.
  const auto  height = clock_->CurrentHeight();
  const auto  open   = ScanAll<market::db::model::AuctionRecord>(
      [&](const market::db::Pagination& p) { return repository_->ListAuctions(*tx, market::db::AuctionFilter{true}, p); });
  std::size_t skipped = 0;
  for (const auto& record : open) {
    if (!AuctionEngine::IsActive(record, height)) continue;
    if (skipped < page.offset) {
      ++skipped;
      continue;
    }
    if (out.size() >= page.limit) break;
    out.push_back(ToProto(record));
  }
  return out;
}

// ------------------------------------------------------------------
// Jobs + escrow
// ------------------------------------------------------------------

Job Marketplace::SubmitExecutionProof(const std::string& sender, uint64_t job_id, const std::string& proof) {
  std::lock_guard lock(mutex_);
  auto            tx  = repository_->Begin();
  auto            job = escrow_.SubmitExecutionProof(*tx, sender, job_id, proof);
  tx->Commit();

  MARKET_LOG_INFO("execution proof submitted", {TokenField("job_id", job_id), StringField("provider", sender)});
  return ToProto(job);
}

ReleaseMilestoneResponse Marketplace::ReleaseMilestone(const std::string& sender, uint64_t job_id, uint32_t milestone_index) {
  std::lock_guard lock(mutex_);
  auto            tx      = repository_->Begin();
  auto            payout  = escrow_.ReleaseMilestone(*tx, sender, job_id, milestone_index);
  const auto      treasury = treasury_.Balance(*tx);
  tx->Commit();

  auto& metrics = market::observability::Metrics::Instance();
  metrics.RecordSettlement("milestone_released", payout.provider_payment);
  metrics.RecordSettlement("platform_fee", payout.platform_fee);
  metrics.SetTreasury(treasury);

  MARKET_LOG_INFO("milestone released", {TokenField("job_id", job_id), IntField("milestone", milestone_index),
                                         StringField("provider", payout.job.provider), TokenField("provider_payment", payout.provider_payment),
                                         TokenField("platform_fee", payout.platform_fee)});
  if (payout.reputation_updated) {
    MARKET_LOG_INFO("reputation updated", {StringField("provider", payout.job.provider), TokenField("job_id", job_id),
                                           TokenField("earned", payout.job.total_payment)});
  }

  ReleaseMilestoneResponse response;
  response.set_provider_payment(payout.provider_payment);
  response.set_platform_fee(payout.platform_fee);
  *response.mutable_job() = ToProto(payout.job);
  return response;
}

Job Marketplace::GetJob(uint64_t job_id) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  return ToProto(escrow_.GetJob(*tx, job_id));
}

std::vector<Job> Marketplace::ListJobs(const market::db::JobFilter& filter, const market::db::Pagination& page) {
  std::lock_guard  lock(mutex_);
  auto             tx = repository_->Begin();
  std::vector<Job> out;
  for (const auto& record : repository_->ListJobs(*tx, filter, page)) {
    out.push_back(ToProto(record));
  }
  return out;
}

EscrowEntry Marketplace::GetEscrowBalance(uint64_t job_id, uint32_t milestone_index) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  return ToProto(escrow_.GetEscrow(*tx, job_id, milestone_index));
}

std::vector<EscrowEntry> Marketplace::ListEscrow(uint64_t job_id) {
  std::lock_guard          lock(mutex_);
  auto                     tx = repository_->Begin();
  std::vector<EscrowEntry> out;
  for (const auto& record : escrow_.ListEscrow(*tx, job_id)) {
    out.push_back(ToProto(record));
  }
  return out;
}

Reputation Marketplace::GetProviderReputation(const std::string& provider) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  return ToProto(reputation_.Get(*tx, provider));
}

bool Marketplace::VerifyExecution(uint64_t job_id) {
  std::string proof;
  {
    std::lock_guard lock(mutex_);
    auto            tx  = repository_->Begin();
    auto            job = escrow_.GetJob(*tx, job_id);
    if (!job.execution_proof) {
      throw market::util::InvalidProof("job " + std::to_string(job_id) + " has no execution proof");
    }
    proof = *job.execution_proof;
  }

  // Oracle calls run outside the writer lock; they never touch state.
  auto verifier = verifiers_->Get();
  if (!verifier) {
    throw market::util::Unsupported("no execution verifier registered");
  }
  const bool verified = verifier->Verify(proof);
  MARKET_LOG_INFO("execution verified", {TokenField("job_id", job_id), BoolField("verified", verified)});
  return verified;
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

uint64_t Marketplace::DepositFunds(const std::string& sender, uint64_t amount) {
  std::lock_guard lock(mutex_);
  auto            tx      = repository_->Begin();
  const auto      balance = ledger_.Credit(*tx, sender, amount);
  ledger_.RecordDeposit(*tx, amount);

  // The rail cannot be rolled back: it stays the last fallible step before commit.
  auto transfer = token_rail_->Transfer(amount, sender, contract_principal_);
  if (!transfer.ok) {
    throw market::util::TransferFailed("deposit " + std::to_string(amount) + " from " + sender + ": " + transfer.reason);
  }
  tx->Commit();

  market::observability::Metrics::Instance().RecordSettlement("deposit", amount);
  MARKET_LOG_INFO("deposit", {StringField("principal", sender), TokenField("amount", amount), TokenField("balance", balance)});
  return balance;
}

uint64_t Marketplace::WithdrawFunds(const std::string& sender, uint64_t amount) {
  std::lock_guard lock(mutex_);
  auto            tx      = repository_->Begin();
  const auto      balance = ledger_.Debit(*tx, sender, amount);
  ledger_.RecordWithdrawal(*tx, amount);

  auto transfer = token_rail_->Transfer(amount, contract_principal_, sender);
  if (!transfer.ok) {
    throw market::util::TransferFailed("withdraw " + std::to_string(amount) + " to " + sender + ": " + transfer.reason);
  }
  tx->Commit();

  market::observability::Metrics::Instance().RecordSettlement("withdraw", amount);
  MARKET_LOG_INFO("withdrawal", {StringField("principal", sender), TokenField("amount", amount), TokenField("balance", balance)});
  return balance;
}

uint64_t Marketplace::GetUserBalance(const std::string& principal) {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  return ledger_.Balance(*tx, principal);
}

uint64_t Marketplace::GetPlatformTreasury() {
  std::lock_guard lock(mutex_);
  auto            tx = repository_->Begin();
  return treasury_.Balance(*tx);
}

// ------------------------------------------------------------------
// Admin
// ------------------------------------------------------------------

AuditConservationResponse Marketplace::AuditConservation() {
  std::lock_guard lock(mutex_);
  auto            tx     = repository_->Begin();
  const auto      totals = repository_->GetLedgerTotals(*tx);

  // Sums saturate at uint64 max; an overflowed sum can never balance.
  bool overflowed = false;
  auto add        = [&overflowed](uint64_t& sum, uint64_t value) {
    if (value > std::numeric_limits<uint64_t>::max() - sum) {
      overflowed = true;
      sum        = std::numeric_limits<uint64_t>::max();
      return;
    }
    sum += value;
  };

  uint64_t open_bids = 0;
  for (const auto& auction : ScanAll<market::db::model::AuctionRecord>(
           [&](const market::db::Pagination& p) { return repository_->ListAuctions(*tx, market::db::AuctionFilter{true}, p); })) {
    if (auction.current_bidder) add(open_bids, auction.current_bid);
  }

  uint64_t unreleased = 0;
  for (const auto& job :
       ScanAll<market::db::model::JobRecord>([&](const market::db::Pagination& p) { return repository_->ListJobs(*tx, {}, p); })) {
    for (const auto& entry : repository_->ListEscrow(*tx, job.id)) {
      if (!entry.released) add(unreleased, entry.amount);
    }
  }

  uint64_t custodial = 0;
  try {
    custodial = ledger_.TotalCustodial(*tx);
  } catch (const std::overflow_error& e) {
    MARKET_LOG_ERROR("conservation audit overflow", {StringField("error", e.what())});
    overflowed = true;
    custodial  = std::numeric_limits<uint64_t>::max();
  }

  AuditConservationResponse audit;
  audit.set_total_deposited(totals.total_deposited);
  audit.set_total_withdrawn(totals.total_withdrawn);
  audit.set_custodial_balances(custodial);
  audit.set_open_bids(open_bids);
  audit.set_unreleased_escrow(unreleased);
  audit.set_treasury(totals.treasury);

  uint64_t held = 0;
  add(held, custodial);
  add(held, open_bids);
  add(held, unreleased);
  add(held, totals.treasury);

  const bool balanced = !overflowed && totals.total_deposited >= totals.total_withdrawn &&
                        totals.total_deposited - totals.total_withdrawn == held;
  audit.set_balanced(balanced);
  if (!balanced) {
    MARKET_LOG_ERROR("conservation audit failed",
                     {TokenField("deposited", totals.total_deposited), TokenField("withdrawn", totals.total_withdrawn),
                      TokenField("custodial", audit.custodial_balances()), TokenField("open_bids", open_bids),
                      TokenField("unreleased_escrow", unreleased), TokenField("treasury", totals.treasury)});
  }
  return audit;
}

StatsResponse Marketplace::Stats() {
  std::lock_guard lock(mutex_);
  const auto      height = clock_->CurrentHeight();
  auto            tx     = repository_->Begin();

  const auto resources = ScanAll<market::db::model::ResourceRecord>(
      [&](const market::db::Pagination& p) { return repository_->ListResources(*tx, {}, p); });
  const auto auctions = ScanAll<market::db::model::AuctionRecord>(
      [&](const market::db::Pagination& p) { return repository_->ListAuctions(*tx, {}, p); });
  const auto jobs =
      ScanAll<market::db::model::JobRecord>([&](const market::db::Pagination& p) { return repository_->ListJobs(*tx, {}, p); });

  uint64_t open_auctions = 0;
  for (const auto& auction : auctions) {
    if (AuctionEngine::IsActive(auction, height)) ++open_auctions;
  }
  uint64_t active_jobs = 0;
  for (const auto& job : jobs) {
    if (job.status == JOB_STATUS_ACTIVE) ++active_jobs;
  }

  StatsResponse stats;
  stats.set_resources(resources.size());
  stats.set_auctions(auctions.size());
  stats.set_open_auctions(open_auctions);
  stats.set_jobs(jobs.size());
  stats.set_active_jobs(active_jobs);
  stats.set_treasury(treasury_.Balance(*tx));
  stats.set_block_height(height);
  *stats.mutable_generated_at() = market::util::ToProto(market::util::Now());
  return stats;
}

} // namespace market::core
