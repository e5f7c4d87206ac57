#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "market/exchange/v1.hpp"

namespace market::db::sqlite {

using market::db::ErrorCode;
using market::db::Result;

namespace {

// Owns one prepared statement for the duration of a call.
class Statement {
public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
  }
  ~Statement() { sqlite3_finalize(st_); }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const { return st_; }

  // SQLITE_ROW, SQLITE_DONE, or throws on anything else.
  int StepRow() {
    int rc = sqlite3_step(st_);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
      throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db_));
    }
    return rc;
  }

private:
  sqlite3* db_;
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s) {
        BindText(st, idx, *s);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

// u64 values are stored bit-for-bit in sqlite's signed 64-bit INTEGER.
void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindBool(sqlite3_stmt* st, int idx, bool v) {
    sqlite3_bind_int(st, idx, v ? 1 : 0);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColText(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

uint32_t ColU32(sqlite3_stmt* st, int col) {
    return static_cast<uint32_t>(sqlite3_column_int64(st, col));
}

bool ColBool(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col) != 0;
}

void BindPage(sqlite3_stmt* st, int idx, const Pagination& page) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(page.limit));
    sqlite3_bind_int64(st, idx + 1, static_cast<sqlite3_int64>(page.offset));
}

constexpr const char* kResourceColumns = "id,provider,gpu,cpu,ram,hourly_rate,available,created_at_height";

model::ResourceRecord ReadResource(sqlite3_stmt* st) {
    model::ResourceRecord r;
    r.id = ColU64(st, 0);
    r.provider = ColText(st, 1);
    r.gpu = ColU64(st, 2);
    r.cpu = ColU64(st, 3);
    r.ram = ColU64(st, 4);
    r.hourly_rate = ColU64(st, 5);
    r.available = ColBool(st, 6);
    r.created_at_height = ColU64(st, 7);
    return r;
}

constexpr const char* kAuctionColumns =
    "id,requester,req_gpu,req_cpu,req_ram,max_duration,starting_price,current_bid,current_bidder,end_height,ended,created_at_height";

model::AuctionRecord ReadAuction(sqlite3_stmt* st) {
    model::AuctionRecord r;
    r.id = ColU64(st, 0);
    r.requester = ColText(st, 1);
    r.req_gpu = ColU64(st, 2);
    r.req_cpu = ColU64(st, 3);
    r.req_ram = ColU64(st, 4);
    r.max_duration = ColU64(st, 5);
    r.starting_price = ColU64(st, 6);
    r.current_bid = ColU64(st, 7);
    r.current_bidder = ColOptText(st, 8);
    r.end_height = ColU64(st, 9);
    r.ended = ColBool(st, 10);
    r.created_at_height = ColU64(st, 11);
    return r;
}

constexpr const char* kJobColumns =
    "id,auction_id,provider,requester,total_payment,milestone_count,completed_milestones,execution_proof,status,created_at_height";

model::JobRecord ReadJob(sqlite3_stmt* st) {
    model::JobRecord r;
    r.id = ColU64(st, 0);
    r.auction_id = ColU64(st, 1);
    r.provider = ColText(st, 2);
    r.requester = ColText(st, 3);
    r.total_payment = ColU64(st, 4);
    r.milestone_count = ColU32(st, 5);
    r.completed_milestones = ColU32(st, 6);
    r.execution_proof = ColOptText(st, 7);
    r.status = static_cast<market::exchange::v1::JobStatus>(sqlite3_column_int(st, 8));
    r.created_at_height = ColU64(st, 9);
    return r;
}

model::EscrowRecord ReadEscrow(sqlite3_stmt* st) {
    model::EscrowRecord r;
    r.job_id = ColU64(st, 0);
    r.milestone_index = ColU32(st, 1);
    r.amount = ColU64(st, 2);
    r.released = ColBool(st, 3);
    return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT: {
            const int extended = sqlite3_extended_errcode(db);
            if (extended == SQLITE_CONSTRAINT_PRIMARYKEY || extended == SQLITE_CONSTRAINT_UNIQUE)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        }
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Resources
// ------------------------------------------------------------------

Result SqliteRepository::InsertResource(Transaction& t, model::ResourceRecord& r) {
    auto* db = TX(t).Handle();

    // id=NULL lets AUTOINCREMENT pick the next id.
    Statement st(db,
        "INSERT INTO resources(id,provider,gpu,cpu,ram,hourly_rate,available,created_at_height) "
        "VALUES(?,?,?,?,?,?,?,?);");

    if (r.id == 0) sqlite3_bind_null(st.get(), 1); else BindU64(st.get(), 1, r.id);
    BindText(st.get(), 2, r.provider);
    BindU64(st.get(), 3, r.gpu);
    BindU64(st.get(), 4, r.cpu);
    BindU64(st.get(), 5, r.ram);
    BindU64(st.get(), 6, r.hourly_rate);
    BindBool(st.get(), 7, r.available);
    BindU64(st.get(), 8, r.created_at_height);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE && r.id == 0) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return Translate(db, rc);
}

std::optional<model::ResourceRecord>
SqliteRepository::GetResource(Transaction& t, uint64_t id) {
    auto* db = TX(t).Handle();
    std::string sql = std::string("SELECT ") + kResourceColumns + " FROM resources WHERE id=?;";
    Statement st(db, sql.c_str());
    BindU64(st.get(), 1, id);

    if (st.StepRow() != SQLITE_ROW) return std::nullopt;
    return ReadResource(st.get());
}

std::vector<model::ResourceRecord>
SqliteRepository::ListResources(Transaction& t, const ResourceFilter& filter, const Pagination& page) {
    auto* db = TX(t).Handle();
    std::string sql = std::string("SELECT ") + kResourceColumns +
        " FROM resources WHERE (?1 IS NULL OR provider=?1) AND (?2=0 OR available=1) ORDER BY id LIMIT ?3 OFFSET ?4;";
    Statement st(db, sql.c_str());
    if (filter.provider) BindText(st.get(), 1, *filter.provider); else sqlite3_bind_null(st.get(), 1);
    BindBool(st.get(), 2, filter.available_only);
    BindPage(st.get(), 3, page);

    std::vector<model::ResourceRecord> out;
    while (st.StepRow() == SQLITE_ROW) out.push_back(ReadResource(st.get()));
    return out;
}

// ------------------------------------------------------------------
// Auctions
// ------------------------------------------------------------------

Result SqliteRepository::InsertAuction(Transaction& t, model::AuctionRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "INSERT INTO auctions(id,requester,req_gpu,req_cpu,req_ram,max_duration,starting_price,current_bid,"
        "current_bidder,end_height,ended,created_at_height) VALUES(?,?,?,?,?,?,?,?,?,?,?,?);");

    if (r.id == 0) sqlite3_bind_null(st.get(), 1); else BindU64(st.get(), 1, r.id);
    BindText(st.get(), 2, r.requester);
    BindU64(st.get(), 3, r.req_gpu);
    BindU64(st.get(), 4, r.req_cpu);
    BindU64(st.get(), 5, r.req_ram);
    BindU64(st.get(), 6, r.max_duration);
    BindU64(st.get(), 7, r.starting_price);
    BindU64(st.get(), 8, r.current_bid);
    BindOptText(st.get(), 9, r.current_bidder);
    BindU64(st.get(), 10, r.end_height);
    BindBool(st.get(), 11, r.ended);
    BindU64(st.get(), 12, r.created_at_height);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE && r.id == 0) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return Translate(db, rc);
}

std::optional<model::AuctionRecord>
SqliteRepository::GetAuction(Transaction& t, uint64_t id) {
    auto* db = TX(t).Handle();
    std::string sql = std::string("SELECT ") + kAuctionColumns + " FROM auctions WHERE id=?;";
    Statement st(db, sql.c_str());
    BindU64(st.get(), 1, id);

    if (st.StepRow() != SQLITE_ROW) return std::nullopt;
    return ReadAuction(st.get());
}

Result SqliteRepository::UpdateAuction(Transaction& t, const model::AuctionRecord& r) {
    auto* db = TX(t).Handle();

    // Requirements, requester and end height are fixed at creation.
    Statement st(db, "UPDATE auctions SET current_bid=?,current_bidder=?,ended=? WHERE id=?;");
    BindU64(st.get(), 1, r.current_bid);
    BindOptText(st.get(), 2, r.current_bidder);
    BindBool(st.get(), 3, r.ended);
    BindU64(st.get(), 4, r.id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "auction " + std::to_string(r.id));
    return Translate(db, rc);
}

std::vector<model::AuctionRecord>
SqliteRepository::ListAuctions(Transaction& t, const AuctionFilter& filter, const Pagination& page) {
    auto* db = TX(t).Handle();
    std::string sql = std::string("SELECT ") + kAuctionColumns +
        " FROM auctions WHERE (?1=0 OR ended=0) ORDER BY id LIMIT ?2 OFFSET ?3;";
    Statement st(db, sql.c_str());
    BindBool(st.get(), 1, filter.open_only);
    BindPage(st.get(), 2, page);

    std::vector<model::AuctionRecord> out;
    while (st.StepRow() == SQLITE_ROW) out.push_back(ReadAuction(st.get()));
    return out;
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result SqliteRepository::InsertJob(Transaction& t, model::JobRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "INSERT INTO jobs(id,auction_id,provider,requester,total_payment,milestone_count,completed_milestones,"
        "execution_proof,status,created_at_height) VALUES(?,?,?,?,?,?,?,?,?,?);");

    if (r.id == 0) sqlite3_bind_null(st.get(), 1); else BindU64(st.get(), 1, r.id);
    BindU64(st.get(), 2, r.auction_id);
    BindText(st.get(), 3, r.provider);
    BindText(st.get(), 4, r.requester);
    BindU64(st.get(), 5, r.total_payment);
    sqlite3_bind_int64(st.get(), 6, r.milestone_count);
    sqlite3_bind_int64(st.get(), 7, r.completed_milestones);
    BindOptText(st.get(), 8, r.execution_proof);
    sqlite3_bind_int(st.get(), 9, static_cast<int>(r.status));
    BindU64(st.get(), 10, r.created_at_height);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE && r.id == 0) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return Translate(db, rc);
}

std::optional<model::JobRecord>
SqliteRepository::GetJob(Transaction& t, uint64_t id) {
    auto* db = TX(t).Handle();
    std::string sql = std::string("SELECT ") + kJobColumns + " FROM jobs WHERE id=?;";
    Statement st(db, sql.c_str());
    BindU64(st.get(), 1, id);

    if (st.StepRow() != SQLITE_ROW) return std::nullopt;
    return ReadJob(st.get());
}

Result SqliteRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, "UPDATE jobs SET completed_milestones=?,execution_proof=?,status=? WHERE id=?;");
    sqlite3_bind_int64(st.get(), 1, r.completed_milestones);
    BindOptText(st.get(), 2, r.execution_proof);
    sqlite3_bind_int(st.get(), 3, static_cast<int>(r.status));
    BindU64(st.get(), 4, r.id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "job " + std::to_string(r.id));
    return Translate(db, rc);
}

std::vector<model::JobRecord>
SqliteRepository::ListJobs(Transaction& t, const JobFilter& filter, const Pagination& page) {
    auto* db = TX(t).Handle();
    std::string sql = std::string("SELECT ") + kJobColumns +
        " FROM jobs WHERE (?1 IS NULL OR provider=?1) AND (?2 IS NULL OR requester=?2) ORDER BY id LIMIT ?3 OFFSET ?4;";
    Statement st(db, sql.c_str());
    BindOptText(st.get(), 1, filter.provider);
    BindOptText(st.get(), 2, filter.requester);
    BindPage(st.get(), 3, page);

    std::vector<model::JobRecord> out;
    while (st.StepRow() == SQLITE_ROW) out.push_back(ReadJob(st.get()));
    return out;
}

// ------------------------------------------------------------------
// Escrow
// ------------------------------------------------------------------

Result SqliteRepository::InsertEscrow(Transaction& t, const model::EscrowRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, "INSERT INTO escrow(job_id,milestone_index,amount,released) VALUES(?,?,?,?);");
    BindU64(st.get(), 1, r.job_id);
    sqlite3_bind_int64(st.get(), 2, r.milestone_index);
    BindU64(st.get(), 3, r.amount);
    BindBool(st.get(), 4, r.released);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::EscrowRecord>
SqliteRepository::GetEscrow(Transaction& t, uint64_t job_id, uint32_t milestone_index) {
    auto* db = TX(t).Handle();
    Statement st(db, "SELECT job_id,milestone_index,amount,released FROM escrow WHERE job_id=? AND milestone_index=?;");
    BindU64(st.get(), 1, job_id);
    sqlite3_bind_int64(st.get(), 2, milestone_index);

    if (st.StepRow() != SQLITE_ROW) return std::nullopt;
    return ReadEscrow(st.get());
}

Result SqliteRepository::UpdateEscrow(Transaction& t, const model::EscrowRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, "UPDATE escrow SET amount=?,released=? WHERE job_id=? AND milestone_index=?;");
    BindU64(st.get(), 1, r.amount);
    BindBool(st.get(), 2, r.released);
    BindU64(st.get(), 3, r.job_id);
    sqlite3_bind_int64(st.get(), 4, r.milestone_index);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "escrow " + std::to_string(r.job_id) + "/" + std::to_string(r.milestone_index));
    return Translate(db, rc);
}

std::vector<model::EscrowRecord>
SqliteRepository::ListEscrow(Transaction& t, uint64_t job_id) {
    auto* db = TX(t).Handle();
    Statement st(db, "SELECT job_id,milestone_index,amount,released FROM escrow WHERE job_id=? ORDER BY milestone_index;");
    BindU64(st.get(), 1, job_id);

    std::vector<model::EscrowRecord> out;
    while (st.StepRow() == SQLITE_ROW) out.push_back(ReadEscrow(st.get()));
    return out;
}

// ------------------------------------------------------------------
// Reputation
// ------------------------------------------------------------------

std::optional<model::ReputationRecord>
SqliteRepository::GetReputation(Transaction& t, const std::string& provider) {
    auto* db = TX(t).Handle();
    Statement st(db, "SELECT provider,score,completed_jobs,total_jobs,total_earned FROM reputation WHERE provider=?;");
    BindText(st.get(), 1, provider);

    if (st.StepRow() != SQLITE_ROW) return std::nullopt;

    model::ReputationRecord r;
    r.provider = ColText(st.get(), 0);
    r.score = ColU32(st.get(), 1);
    r.completed_jobs = ColU64(st.get(), 2);
    r.total_jobs = ColU64(st.get(), 3);
    r.total_earned = ColU64(st.get(), 4);
    return r;
}

Result SqliteRepository::UpsertReputation(Transaction& t, const model::ReputationRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "INSERT INTO reputation(provider,score,completed_jobs,total_jobs,total_earned) VALUES(?,?,?,?,?) "
        "ON CONFLICT(provider) DO UPDATE SET score=excluded.score, completed_jobs=excluded.completed_jobs, "
        "total_jobs=excluded.total_jobs, total_earned=excluded.total_earned;");
    BindText(st.get(), 1, r.provider);
    sqlite3_bind_int64(st.get(), 2, r.score);
    BindU64(st.get(), 3, r.completed_jobs);
    BindU64(st.get(), 4, r.total_jobs);
    BindU64(st.get(), 5, r.total_earned);

    return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Balances + totals
// ------------------------------------------------------------------

std::optional<model::BalanceRecord>
SqliteRepository::GetBalance(Transaction& t, const std::string& principal) {
    auto* db = TX(t).Handle();
    Statement st(db, "SELECT principal,balance FROM balances WHERE principal=?;");
    BindText(st.get(), 1, principal);

    if (st.StepRow() != SQLITE_ROW) return std::nullopt;
    return model::BalanceRecord{ColText(st.get(), 0), ColU64(st.get(), 1)};
}

Result SqliteRepository::UpsertBalance(Transaction& t, const model::BalanceRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "INSERT INTO balances(principal,balance) VALUES(?,?) "
        "ON CONFLICT(principal) DO UPDATE SET balance=excluded.balance;");
    BindText(st.get(), 1, r.principal);
    BindU64(st.get(), 2, r.balance);

    return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::BalanceRecord> SqliteRepository::ListBalances(Transaction& t) {
    auto* db = TX(t).Handle();
    Statement st(db, "SELECT principal,balance FROM balances ORDER BY principal;");

    std::vector<model::BalanceRecord> out;
    while (st.StepRow() == SQLITE_ROW) out.push_back({ColText(st.get(), 0), ColU64(st.get(), 1)});
    return out;
}

model::LedgerTotalsRecord SqliteRepository::GetLedgerTotals(Transaction& t) {
    auto* db = TX(t).Handle();
    Statement st(db, "SELECT treasury,total_deposited,total_withdrawn FROM ledger_totals WHERE id=1;");

    model::LedgerTotalsRecord r;
    if (st.StepRow() == SQLITE_ROW) {
        r.treasury = ColU64(st.get(), 0);
        r.total_deposited = ColU64(st.get(), 1);
        r.total_withdrawn = ColU64(st.get(), 2);
    }
    return r;
}

Result SqliteRepository::UpdateLedgerTotals(Transaction& t, const model::LedgerTotalsRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "INSERT INTO ledger_totals(id,treasury,total_deposited,total_withdrawn) VALUES(1,?,?,?) "
        "ON CONFLICT(id) DO UPDATE SET treasury=excluded.treasury, total_deposited=excluded.total_deposited, "
        "total_withdrawn=excluded.total_withdrawn;");
    BindU64(st.get(), 1, r.treasury);
    BindU64(st.get(), 2, r.total_deposited);
    BindU64(st.get(), 3, r.total_withdrawn);

    return Translate(db, sqlite3_step(st.get()));
}

} // namespace market::db::sqlite
