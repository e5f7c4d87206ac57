#include "memory_repository.hpp"

#include <algorithm>
#include <string>

#include "memory_tx.hpp"

namespace market::db::memory {

namespace {

template <typename Record, typename Map, typename Pred>
std::vector<Record> Page(const Map& rows, const Pagination& page, Pred&& keep) {
  std::vector<Record> out;
  std::size_t         skipped = 0;
  for (const auto& [_, record] : rows) {
    if (!keep(record)) continue;
    if (skipped < page.offset) {
      ++skipped;
      continue;
    }
    if (out.size() >= page.limit) break;
    out.push_back(record);
  }
  return out;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Resources
// ------------------------------------------------------------------

Result MemoryRepository::InsertResource(Transaction& t, model::ResourceRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.id == 0) {
    r.id = s.next_resource_id++;
  } else {
    if (s.resources.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
    s.next_resource_id = std::max(s.next_resource_id, r.id + 1);
  }
  s.resources[r.id] = r;
  return Result::Ok();
}

std::optional<model::ResourceRecord> MemoryRepository::GetResource(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.resources.find(id);
  if (it == s.resources.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ResourceRecord> MemoryRepository::ListResources(Transaction& t, const ResourceFilter& filter, const Pagination& page) {
  return Page<model::ResourceRecord>(TX(t).View().resources, page, [&](const model::ResourceRecord& r) {
    if (filter.provider && r.provider != *filter.provider) return false;
    if (filter.available_only && !r.available) return false;
    return true;
  });
}

// ------------------------------------------------------------------
// Auctions
// ------------------------------------------------------------------

Result MemoryRepository::InsertAuction(Transaction& t, model::AuctionRecord& r) {
  auto& s = TX(t).Mutable();
  if (r.id == 0) {
    r.id = s.next_auction_id++;
  } else {
    if (s.auctions.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
    s.next_auction_id = std::max(s.next_auction_id, r.id + 1);
  }
  s.auctions[r.id] = r;
  return Result::Ok();
}

std::optional<model::AuctionRecord> MemoryRepository::GetAuction(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.auctions.find(id);
  if (it == s.auctions.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateAuction(Transaction& t, const model::AuctionRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.auctions.contains(r.id)) return Result::Err(ErrorCode::NotFound);
  s.auctions[r.id] = r;
  return Result::Ok();
}

std::vector<model::AuctionRecord> MemoryRepository::ListAuctions(Transaction& t, const AuctionFilter& filter, const Pagination& page) {
  return Page<model::AuctionRecord>(TX(t).View().auctions, page,
                                    [&](const model::AuctionRecord& r) { return !filter.open_only || !r.ended; });
}

// ------------------------------------------------------------------
// Jobs + escrow
// ------------------------------------------------------------------

Result MemoryRepository::InsertJob(Transaction& t, model::JobRecord& r) {
  auto& s = TX(t).Mutable();
  // one job per auction, as the sql schemas enforce with UNIQUE(auction_id)
  for (const auto& [_, job] : s.jobs) {
    if (job.auction_id == r.auction_id) return Result::Err(ErrorCode::AlreadyExists, "job for auction " + std::to_string(r.auction_id));
  }
  if (r.id == 0) {
    r.id = s.next_job_id++;
  } else {
    if (s.jobs.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
    s.next_job_id = std::max(s.next_job_id, r.id + 1);
  }
  s.jobs[r.id] = r;
  return Result::Ok();
}

std::optional<model::JobRecord> MemoryRepository::GetJob(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.jobs.find(id);
  if (it == s.jobs.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.jobs.contains(r.id)) return Result::Err(ErrorCode::NotFound);
  s.jobs[r.id] = r;
  return Result::Ok();
}

std::vector<model::JobRecord> MemoryRepository::ListJobs(Transaction& t, const JobFilter& filter, const Pagination& page) {
  return Page<model::JobRecord>(TX(t).View().jobs, page, [&](const model::JobRecord& r) {
    if (filter.provider && r.provider != *filter.provider) return false;
    if (filter.requester && r.requester != *filter.requester) return false;
    return true;
  });
}

Result MemoryRepository::InsertEscrow(Transaction& t, const model::EscrowRecord& r) {
  auto&      s   = TX(t).Mutable();
  const auto key = std::make_pair(r.job_id, r.milestone_index);
  if (s.escrow.contains(key)) return Result::Err(ErrorCode::AlreadyExists);
  s.escrow[key] = r;
  return Result::Ok();
}

std::optional<model::EscrowRecord> MemoryRepository::GetEscrow(Transaction& t, uint64_t job_id, uint32_t milestone_index) {
  const auto& s  = TX(t).View();
  auto        it = s.escrow.find({job_id, milestone_index});
  if (it == s.escrow.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateEscrow(Transaction& t, const model::EscrowRecord& r) {
  auto&      s   = TX(t).Mutable();
  const auto key = std::make_pair(r.job_id, r.milestone_index);
  if (!s.escrow.contains(key)) return Result::Err(ErrorCode::NotFound);
  s.escrow[key] = r;
  return Result::Ok();
}

std::vector<model::EscrowRecord> MemoryRepository::ListEscrow(Transaction& t, uint64_t job_id) {
  const auto&                      s = TX(t).View();
  std::vector<model::EscrowRecord> out;
  for (auto it = s.escrow.lower_bound({job_id, 0}); it != s.escrow.end() && it->first.first == job_id; ++it) {
    out.push_back(it->second);
  }
  return out;
}

// ------------------------------------------------------------------
// Reputation
// ------------------------------------------------------------------

std::optional<model::ReputationRecord> MemoryRepository::GetReputation(Transaction& t, const std::string& provider) {
  const auto& s  = TX(t).View();
  auto        it = s.reputation.find(provider);
  if (it == s.reputation.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertReputation(Transaction& t, const model::ReputationRecord& r) {
  TX(t).Mutable().reputation[r.provider] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Balances + totals
// ------------------------------------------------------------------

std::optional<model::BalanceRecord> MemoryRepository::GetBalance(Transaction& t, const std::string& principal) {
  const auto& s  = TX(t).View();
  auto        it = s.balances.find(principal);
  if (it == s.balances.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertBalance(Transaction& t, const model::BalanceRecord& r) {
  TX(t).Mutable().balances[r.principal] = r;
  return Result::Ok();
}

std::vector<model::BalanceRecord> MemoryRepository::ListBalances(Transaction& t) {
  const auto&                       s = TX(t).View();
  std::vector<model::BalanceRecord> out;
  out.reserve(s.balances.size());
  for (const auto& [_, record] : s.balances) {
    out.push_back(record);
  }
  return out;
}

model::LedgerTotalsRecord MemoryRepository::GetLedgerTotals(Transaction& t) {
  return TX(t).View().totals;
}

Result MemoryRepository::UpdateLedgerTotals(Transaction& t, const model::LedgerTotalsRecord& r) {
  TX(t).Mutable().totals = r;
  return Result::Ok();
}

} // namespace market::db::memory
