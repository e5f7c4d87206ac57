#include "pg_pool.hpp"

#include <exception>

namespace market::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::ExecuteSQL(const std::string& sql) {
  pqxx::connection    conn(conninfo_);
  pqxx::nontransaction tx(conn);
  tx.exec(sql);
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_auction",
               "SELECT id,requester,req_gpu,req_cpu,req_ram,max_duration,starting_price,current_bid,current_bidder,"
               "end_height,ended,created_at_height FROM auctions WHERE id=$1");

  conn.prepare("update_auction", "UPDATE auctions SET current_bid=$2,current_bidder=$3,ended=$4 WHERE id=$1");

  conn.prepare("get_job",
               "SELECT id,auction_id,provider,requester,total_payment,milestone_count,completed_milestones,execution_proof,"
               "status,created_at_height FROM jobs WHERE id=$1");

  conn.prepare("update_job", "UPDATE jobs SET completed_milestones=$2,execution_proof=$3,status=$4 WHERE id=$1");

  conn.prepare("get_escrow", "SELECT job_id,milestone_index,amount,released FROM escrow WHERE job_id=$1 AND milestone_index=$2");

  conn.prepare("update_escrow", "UPDATE escrow SET amount=$3,released=$4 WHERE job_id=$1 AND milestone_index=$2");

  conn.prepare("get_balance", "SELECT principal,balance FROM balances WHERE principal=$1");

  conn.prepare("upsert_balance",
               "INSERT INTO balances(principal,balance) VALUES($1,$2) "
               "ON CONFLICT(principal) DO UPDATE SET balance=EXCLUDED.balance");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace market::db::postgres
