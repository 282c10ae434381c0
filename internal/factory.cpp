#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/history/history_reader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/rating/fusion.hpp"
#include "internal/rating/odds_engine.hpp"
#include "internal/rating/qualifier_handler.hpp"
#include "internal/rating/rating_store.hpp"
#include "internal/rating/trueskill.hpp"
#include "internal/rating/update_engine.hpp"
#include "internal/service/service_context.hpp"
#if GAITRANK_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if GAITRANK_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace gaitrank::factory {

using namespace gaitrank;

namespace {

#if GAITRANK_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(db::sqlite::SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  db::sqlite::SqliteDB& db_;
};
#endif

#if GAITRANK_DB_POSTGRES
class PostgresMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PostgresMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};

// Runs before the pool exists: pooled connections prepare statements against these tables.
void BootstrapPostgresSchema(const std::string& conninfo) {
  pqxx::connection          conn(conninfo);
  pqxx::work                tx(conn);
  PostgresMigrationExecutor executor(tx);
  db::sql::RunMigrations(executor, db::sql::PostgresSchema());
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const gaitrank::runtime::config::DatabaseConfig& database) {
  if (database.has_sqlite()) {
#if GAITRANK_DB_SQLITE
    const bool wal_mode  = database.sqlite().has_wal_mode() ? database.sqlite().wal_mode() : true;
    auto       sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), wal_mode);
    SqliteMigrationExecutor executor(*sqlite_db);
    db::sql::RunMigrations(executor, db::sql::SqliteSchema());
    GAITRANK_LOG_INFO("Using sqlite repository", {observability::StringField("path", sqlite_db->Path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if GAITRANK_DB_POSTGRES
    const auto& postgres = database.postgres();
    BootstrapPostgresSchema(postgres.connection_uri());
    auto pool = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(),
                                                       postgres.max_connections() > 0 ? postgres.max_connections() : 8);
    GAITRANK_LOG_INFO("Using postgres repository");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  GAITRANK_LOG_INFO("Using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const config::EngineConfig& engine, std::shared_ptr<db::Repository> repository) {
  config::Validate(engine);

  Application app;
  app.engine     = engine;
  app.repository = repository;

  // ------------------------------------------------------------------
  // Rating components
  // ------------------------------------------------------------------
  auto store = std::make_shared<rating::RatingStore>(repository, engine);

  service::ServiceContext ctx;
  ctx.repository        = repository;
  ctx.store             = store;
  ctx.update_engine     = std::make_shared<rating::RatingUpdateEngine>(repository, store, rating::TrueSkill(engine.trueskill));
  ctx.qualifier_handler = std::make_shared<rating::QualifierHandler>(store);
  ctx.fusion            = std::make_shared<rating::RatingFusion>(engine.fusion, store->Default());
  ctx.odds              = std::make_shared<rating::OddsEngine>(engine.odds);
  ctx.history           = std::make_shared<history::HistoryReader>(repository);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  app.ingest_service  = std::make_shared<service::IngestService>(ctx);
  app.odds_service    = std::make_shared<service::OddsService>(ctx);
  app.catalog_service = std::make_shared<service::CatalogService>(ctx);

  return app;
}

Application Build(const gaitrank::runtime::config::RuntimeConfig& config) {
  auto engine = config::BuildEngineConfig(config);
  return Build(engine, BuildRepository(config.database()));
}

} // namespace gaitrank::factory
