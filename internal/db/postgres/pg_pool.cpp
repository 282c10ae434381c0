#include "pg_pool.hpp"

namespace gaitrank::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (...) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_belief",
               "SELECT discipline, entity_class, name, mu, sigma, last_active, last_venue "
               "FROM beliefs WHERE discipline=$1 AND entity_class=$2 AND name=$3");

  conn.prepare("upsert_belief",
               "INSERT INTO beliefs(discipline,entity_class,name,mu,sigma,last_active,last_venue) VALUES($1,$2,$3,$4,$5,$6,$7) "
               "ON CONFLICT(discipline,entity_class,name) DO UPDATE SET mu=EXCLUDED.mu, sigma=EXCLUDED.sigma, "
               "last_active=EXCLUDED.last_active, last_venue=EXCLUDED.last_venue");

  conn.prepare("list_beliefs",
               "SELECT discipline, entity_class, name, mu, sigma, last_active, last_venue "
               "FROM beliefs WHERE discipline=$1 AND entity_class=$2 ORDER BY name");

  conn.prepare("append_history",
               "INSERT INTO belief_history(discipline,entity_class,name,mu,sigma,race_date,venue,finish,race_class,horse_name) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10) RETURNING seq");

  conn.prepare("upsert_race_entry",
               "INSERT INTO race_entries(race_date,venue,race_number,horse_name,driver_name,trainer_name,finish,race_class,discipline,qualifier) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10) ON CONFLICT(race_date,venue,race_number,horse_name) DO UPDATE SET "
               "driver_name=EXCLUDED.driver_name, trainer_name=EXCLUDED.trainer_name, finish=EXCLUDED.finish, race_class=EXCLUDED.race_class, "
               "discipline=EXCLUDED.discipline, qualifier=EXCLUDED.qualifier");
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

} // namespace gaitrank::db::postgres
