#include "pg_repository.hpp"

#include "market/exchange/v1.hpp"

namespace market::db::postgres {

namespace {

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

model::ResourceRecord ReadResource(const pqxx::row& row) {
  model::ResourceRecord r;
  r.id                = row[0].as<uint64_t>();
  r.provider          = row[1].c_str();
  r.gpu               = row[2].as<uint64_t>();
  r.cpu               = row[3].as<uint64_t>();
  r.ram               = row[4].as<uint64_t>();
  r.hourly_rate       = row[5].as<uint64_t>();
  r.available         = row[6].as<bool>();
  r.created_at_height = row[7].as<uint64_t>();
  return r;
}

model::AuctionRecord ReadAuction(const pqxx::row& row) {
  model::AuctionRecord r;
  r.id                = row[0].as<uint64_t>();
  r.requester         = row[1].c_str();
  r.req_gpu           = row[2].as<uint64_t>();
  r.req_cpu           = row[3].as<uint64_t>();
  r.req_ram           = row[4].as<uint64_t>();
  r.max_duration      = row[5].as<uint64_t>();
  r.starting_price    = row[6].as<uint64_t>();
  r.current_bid       = row[7].as<uint64_t>();
  r.current_bidder    = OptText(row[8]);
  r.end_height        = row[9].as<uint64_t>();
  r.ended             = row[10].as<bool>();
  r.created_at_height = row[11].as<uint64_t>();
  return r;
}

model::JobRecord ReadJob(const pqxx::row& row) {
  model::JobRecord r;
  r.id                   = row[0].as<uint64_t>();
  r.auction_id           = row[1].as<uint64_t>();
  r.provider             = row[2].c_str();
  r.requester            = row[3].c_str();
  r.total_payment        = row[4].as<uint64_t>();
  r.milestone_count      = row[5].as<uint32_t>();
  r.completed_milestones = row[6].as<uint32_t>();
  r.execution_proof      = OptText(row[7]);
  r.status               = (market::exchange::v1::JobStatus)row[8].as<int>();
  r.created_at_height    = row[9].as<uint64_t>();
  return r;
}

model::EscrowRecord ReadEscrow(const pqxx::row& row) {
  model::EscrowRecord r;
  r.job_id          = row[0].as<uint64_t>();
  r.milestone_index = row[1].as<uint32_t>();
  r.amount          = row[2].as<uint64_t>();
  r.released        = row[3].as<bool>();
  return r;
}

Result AffectedOne(const pqxx::result& res, std::string what) {
  if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, std::move(what));
  return Result::Ok();
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Resources
// ------------------------------------------------------------------

Result PgRepository::InsertResource(Transaction& t, model::ResourceRecord& r) {
  try {
    auto& w = TX(t).Work();
    if (r.id == 0) {
      auto res = w.exec_params(
          "INSERT INTO resources(provider,gpu,cpu,ram,hourly_rate,available,created_at_height) "
          "VALUES($1,$2,$3,$4,$5,$6,$7) RETURNING id;",
          r.provider, r.gpu, r.cpu, r.ram, r.hourly_rate, r.available, r.created_at_height);
      r.id = res[0][0].as<uint64_t>();
    } else {
      w.exec_params(
          "INSERT INTO resources(id,provider,gpu,cpu,ram,hourly_rate,available,created_at_height) "
          "VALUES($1,$2,$3,$4,$5,$6,$7,$8);",
          r.id, r.provider, r.gpu, r.cpu, r.ram, r.hourly_rate, r.available, r.created_at_height);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ResourceRecord> PgRepository::GetResource(Transaction& t, uint64_t id) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,provider,gpu,cpu,ram,hourly_rate,available,created_at_height FROM resources WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;
  return ReadResource(res[0]);
}

std::vector<model::ResourceRecord> PgRepository::ListResources(Transaction& t, const ResourceFilter& filter, const Pagination& page) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,provider,gpu,cpu,ram,hourly_rate,available,created_at_height FROM resources "
      "WHERE ($1::text IS NULL OR provider=$1) AND (NOT $2 OR available) ORDER BY id LIMIT $3 OFFSET $4;",
      filter.provider, filter.available_only, static_cast<int64_t>(page.limit), static_cast<int64_t>(page.offset));

  std::vector<model::ResourceRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadResource(row));
  return out;
}

// ------------------------------------------------------------------
// Auctions
// ------------------------------------------------------------------

Result PgRepository::InsertAuction(Transaction& t, model::AuctionRecord& r) {
  try {
    auto& w = TX(t).Work();
    if (r.id == 0) {
      auto res = w.exec_params(
          "INSERT INTO auctions(requester,req_gpu,req_cpu,req_ram,max_duration,starting_price,current_bid,current_bidder,"
          "end_height,ended,created_at_height) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11) RETURNING id;",
          r.requester, r.req_gpu, r.req_cpu, r.req_ram, r.max_duration, r.starting_price, r.current_bid, r.current_bidder,
          r.end_height, r.ended, r.created_at_height);
      r.id = res[0][0].as<uint64_t>();
    } else {
      w.exec_params(
          "INSERT INTO auctions(id,requester,req_gpu,req_cpu,req_ram,max_duration,starting_price,current_bid,current_bidder,"
          "end_height,ended,created_at_height) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12);",
          r.id, r.requester, r.req_gpu, r.req_cpu, r.req_ram, r.max_duration, r.starting_price, r.current_bid, r.current_bidder,
          r.end_height, r.ended, r.created_at_height);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::AuctionRecord> PgRepository::GetAuction(Transaction& t, uint64_t id) {
  auto res = TX(t).Work().exec_prepared("get_auction", id);
  if (res.empty()) return std::nullopt;
  return ReadAuction(res[0]);
}

Result PgRepository::UpdateAuction(Transaction& t, const model::AuctionRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_auction", r.id, r.current_bid, r.current_bidder, r.ended);
    return AffectedOne(res, "auction " + std::to_string(r.id));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::AuctionRecord> PgRepository::ListAuctions(Transaction& t, const AuctionFilter& filter, const Pagination& page) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,requester,req_gpu,req_cpu,req_ram,max_duration,starting_price,current_bid,current_bidder,end_height,ended,"
      "created_at_height FROM auctions WHERE (NOT $1 OR NOT ended) ORDER BY id LIMIT $2 OFFSET $3;",
      filter.open_only, static_cast<int64_t>(page.limit), static_cast<int64_t>(page.offset));

  std::vector<model::AuctionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadAuction(row));
  return out;
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result PgRepository::InsertJob(Transaction& t, model::JobRecord& r) {
  try {
    auto& w = TX(t).Work();
    if (r.id == 0) {
      auto res = w.exec_params(
          "INSERT INTO jobs(auction_id,provider,requester,total_payment,milestone_count,completed_milestones,execution_proof,"
          "status,created_at_height) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9) RETURNING id;",
          r.auction_id, r.provider, r.requester, r.total_payment, r.milestone_count, r.completed_milestones, r.execution_proof,
          (int)r.status, r.created_at_height);
      r.id = res[0][0].as<uint64_t>();
    } else {
      w.exec_params(
          "INSERT INTO jobs(id,auction_id,provider,requester,total_payment,milestone_count,completed_milestones,execution_proof,"
          "status,created_at_height) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10);",
          r.id, r.auction_id, r.provider, r.requester, r.total_payment, r.milestone_count, r.completed_milestones,
          r.execution_proof, (int)r.status, r.created_at_height);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::JobRecord> PgRepository::GetJob(Transaction& t, uint64_t id) {
  auto res = TX(t).Work().exec_prepared("get_job", id);
  if (res.empty()) return std::nullopt;
  return ReadJob(res[0]);
}

Result PgRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_job", r.id, r.completed_milestones, r.execution_proof, (int)r.status);
    return AffectedOne(res, "job " + std::to_string(r.id));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::JobRecord> PgRepository::ListJobs(Transaction& t, const JobFilter& filter, const Pagination& page) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,auction_id,provider,requester,total_payment,milestone_count,completed_milestones,execution_proof,status,"
      "created_at_height FROM jobs WHERE ($1::text IS NULL OR provider=$1) AND ($2::text IS NULL OR requester=$2) "
      "ORDER BY id LIMIT $3 OFFSET $4;",
      filter.provider, filter.requester, static_cast<int64_t>(page.limit), static_cast<int64_t>(page.offset));

  std::vector<model::JobRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadJob(row));
  return out;
}

// ------------------------------------------------------------------
// Escrow
// ------------------------------------------------------------------

Result PgRepository::InsertEscrow(Transaction& t, const model::EscrowRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO escrow(job_id,milestone_index,amount,released) VALUES($1,$2,$3,$4);", r.job_id,
                             r.milestone_index, r.amount, r.released);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::EscrowRecord> PgRepository::GetEscrow(Transaction& t, uint64_t job_id, uint32_t milestone_index) {
  auto res = TX(t).Work().exec_prepared("get_escrow", job_id, milestone_index);
  if (res.empty()) return std::nullopt;
  return ReadEscrow(res[0]);
}

Result PgRepository::UpdateEscrow(Transaction& t, const model::EscrowRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_escrow", r.job_id, r.milestone_index, r.amount, r.released);
    return AffectedOne(res, "escrow " + std::to_string(r.job_id) + "/" + std::to_string(r.milestone_index));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::EscrowRecord> PgRepository::ListEscrow(Transaction& t, uint64_t job_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT job_id,milestone_index,amount,released FROM escrow WHERE job_id=$1 ORDER BY milestone_index;", job_id);

  std::vector<model::EscrowRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadEscrow(row));
  return out;
}

// ------------------------------------------------------------------
// Reputation
// ------------------------------------------------------------------

std::optional<model::ReputationRecord> PgRepository::GetReputation(Transaction& t, const std::string& provider) {
  auto res = TX(t).Work().exec_params(
      "SELECT provider,score,completed_jobs,total_jobs,total_earned FROM reputation WHERE provider=$1;", provider);
  if (res.empty()) return std::nullopt;

  model::ReputationRecord r;
  r.provider       = res[0][0].c_str();
  r.score          = res[0][1].as<uint32_t>();
  r.completed_jobs = res[0][2].as<uint64_t>();
  r.total_jobs     = res[0][3].as<uint64_t>();
  r.total_earned   = res[0][4].as<uint64_t>();
  return r;
}

Result PgRepository::UpsertReputation(Transaction& t, const model::ReputationRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO reputation(provider,score,completed_jobs,total_jobs,total_earned) VALUES($1,$2,$3,$4,$5) "
        "ON CONFLICT(provider) DO UPDATE SET score=EXCLUDED.score,completed_jobs=EXCLUDED.completed_jobs,"
        "total_jobs=EXCLUDED.total_jobs,total_earned=EXCLUDED.total_earned;",
        r.provider, r.score, r.completed_jobs, r.total_jobs, r.total_earned);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Balances + totals
// ------------------------------------------------------------------

std::optional<model::BalanceRecord> PgRepository::GetBalance(Transaction& t, const std::string& principal) {
  auto res = TX(t).Work().exec_prepared("get_balance", principal);
  if (res.empty()) return std::nullopt;
  return model::BalanceRecord{res[0][0].c_str(), res[0][1].as<uint64_t>()};
}

Result PgRepository::UpsertBalance(Transaction& t, const model::BalanceRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_balance", r.principal, r.balance);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::BalanceRecord> PgRepository::ListBalances(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT principal,balance FROM balances ORDER BY principal;");

  std::vector<model::BalanceRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back({row[0].c_str(), row[1].as<uint64_t>()});
  return out;
}

model::LedgerTotalsRecord PgRepository::GetLedgerTotals(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT treasury,total_deposited,total_withdrawn FROM ledger_totals WHERE id=1;");

  model::LedgerTotalsRecord r;
  if (!res.empty()) {
    r.treasury        = res[0][0].as<uint64_t>();
    r.total_deposited = res[0][1].as<uint64_t>();
    r.total_withdrawn = res[0][2].as<uint64_t>();
  }
  return r;
}

Result PgRepository::UpdateLedgerTotals(Transaction& t, const model::LedgerTotalsRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO ledger_totals(id,treasury,total_deposited,total_withdrawn) VALUES(1,$1,$2,$3) "
        "ON CONFLICT(id) DO UPDATE SET treasury=EXCLUDED.treasury,total_deposited=EXCLUDED.total_deposited,"
        "total_withdrawn=EXCLUDED.total_withdrawn;",
        r.treasury, r.total_deposited, r.total_withdrawn);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace market::db::postgres
