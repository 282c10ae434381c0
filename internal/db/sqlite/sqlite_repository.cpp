#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>

namespace gaitrank::db::sqlite {

using gaitrank::db::ErrorCode;
using gaitrank::db::Result;
using gaitrank::model::Discipline;
using gaitrank::model::EntityClass;
using gaitrank::model::EntityKey;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

static void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

static void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

static std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

static int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

static double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

// Reads have no Result to carry an error, so a failed prepare or step throws.
static sqlite3_stmt* PrepareOrThrow(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return st;
}

[[noreturn]] static void ThrowStepError(sqlite3* db, sqlite3_stmt* st) {
  std::string msg = sqlite3_errmsg(db);
  sqlite3_finalize(st);
  throw std::runtime_error("sqlite step: " + msg);
}

static const char* kBeliefColumns = "discipline,entity_class,name,mu,sigma,last_active,last_venue";

static model::BeliefRecord ReadBelief(sqlite3_stmt* st) {
  model::BeliefRecord r;
  r.discipline    = static_cast<Discipline>(ColI32(st, 0));
  r.entity_class  = static_cast<EntityClass>(ColI32(st, 1));
  r.name          = ColText(st, 2);
  r.mu            = ColDouble(st, 3);
  r.sigma         = ColDouble(st, 4);
  r.last_active_s = ColI64(st, 5);
  r.last_venue    = ColOptText(st, 6);
  return r;
}

static model::RaceEntryRecord ReadRaceEntry(sqlite3_stmt* st) {
  model::RaceEntryRecord r;
  r.race_date_s  = ColI64(st, 0);
  r.venue        = ColText(st, 1);
  r.race_number  = static_cast<uint32_t>(ColI64(st, 2));
  r.horse_name   = ColText(st, 3);
  r.driver_name  = ColOptText(st, 4);
  r.trainer_name = ColOptText(st, 5);
  r.finish       = ColText(st, 6);
  r.race_class   = ColOptText(st, 7);
  r.discipline   = static_cast<Discipline>(ColI32(st, 8));
  r.qualifier    = ColI32(st, 9) != 0;
  return r;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Beliefs
// ------------------------------------------------------------------

std::optional<model::BeliefRecord> SqliteRepository::GetBelief(Transaction& t, const EntityKey& key) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kBeliefColumns + " FROM beliefs WHERE discipline=? AND entity_class=? AND name=?;";
  sqlite3_stmt*     st  = PrepareOrThrow(db, sql.c_str());

  BindI32(st, 1, static_cast<int>(key.discipline));
  BindI32(st, 2, static_cast<int>(key.entity_class));
  BindText(st, 3, key.name);

  int rc = sqlite3_step(st);
  if (rc == SQLITE_DONE) {
    sqlite3_finalize(st);
    return std::nullopt;
  }
  if (rc != SQLITE_ROW) ThrowStepError(db, st);

  auto r = ReadBelief(st);
  sqlite3_finalize(st);
  return r;
}

Result SqliteRepository::UpsertBelief(Transaction& t, const model::BeliefRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO beliefs(discipline,entity_class,name,mu,sigma,last_active,last_venue) VALUES(?,?,?,?,?,?,?) "
      "ON CONFLICT(discipline,entity_class,name) DO UPDATE SET mu=excluded.mu, sigma=excluded.sigma, "
      "last_active=excluded.last_active, last_venue=excluded.last_venue;";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI32(st, 1, static_cast<int>(r.discipline));
  BindI32(st, 2, static_cast<int>(r.entity_class));
  BindText(st, 3, r.name);
  BindDouble(st, 4, r.mu);
  BindDouble(st, 5, r.sigma);
  BindI64(st, 6, r.last_active_s);
  BindOptText(st, 7, r.last_venue);

  int  rc     = sqlite3_step(st);
  auto result = Translate(db, rc);
  sqlite3_finalize(st);
  return result;
}

std::vector<model::BeliefRecord> SqliteRepository::ListBeliefs(Transaction& t, Discipline discipline, EntityClass entity_class) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kBeliefColumns + " FROM beliefs WHERE discipline=? AND entity_class=? ORDER BY name;";
  sqlite3_stmt*     st  = PrepareOrThrow(db, sql.c_str());

  BindI32(st, 1, static_cast<int>(discipline));
  BindI32(st, 2, static_cast<int>(entity_class));

  std::vector<model::BeliefRecord> out;
  int                              rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(ReadBelief(st));
  }
  if (rc != SQLITE_DONE) ThrowStepError(db, st);

  sqlite3_finalize(st);
  return out;
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

Result SqliteRepository::AppendHistory(Transaction& t, model::HistoryRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO belief_history(discipline,entity_class,name,mu,sigma,race_date,venue,finish,race_class,horse_name) "
      "VALUES(?,?,?,?,?,?,?,?,?,?);";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI32(st, 1, static_cast<int>(r.discipline));
  BindI32(st, 2, static_cast<int>(r.entity_class));
  BindText(st, 3, r.name);
  BindDouble(st, 4, r.mu);
  BindDouble(st, 5, r.sigma);
  BindI64(st, 6, r.race_date_s);
  BindText(st, 7, r.venue);
  BindText(st, 8, r.finish);
  BindOptText(st, 9, r.race_class);
  BindOptText(st, 10, r.horse_name);

  int  rc     = sqlite3_step(st);
  auto result = Translate(db, rc);
  sqlite3_finalize(st);

  if (result) r.seq = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return result;
}

std::vector<model::HistoryRecord> SqliteRepository::ReadHistory(Transaction& t, const EntityKey& key, std::optional<uint64_t> max_entries) {
  auto* db = TX(t).Handle();

  // LIMIT -1 means no limit in sqlite
  const char* sql =
      "SELECT seq,discipline,entity_class,name,mu,sigma,race_date,venue,finish,race_class,horse_name FROM belief_history "
      "WHERE discipline=? AND entity_class=? AND name=? ORDER BY race_date DESC, seq DESC LIMIT ?;";
  sqlite3_stmt* st = PrepareOrThrow(db, sql);

  BindI32(st, 1, static_cast<int>(key.discipline));
  BindI32(st, 2, static_cast<int>(key.entity_class));
  BindText(st, 3, key.name);
  BindI64(st, 4, max_entries ? static_cast<int64_t>(*max_entries) : -1);

  std::vector<model::HistoryRecord> out;
  int                               rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    model::HistoryRecord r;
    r.seq          = static_cast<uint64_t>(ColI64(st, 0));
    r.discipline   = static_cast<Discipline>(ColI32(st, 1));
    r.entity_class = static_cast<EntityClass>(ColI32(st, 2));
    r.name         = ColText(st, 3);
    r.mu           = ColDouble(st, 4);
    r.sigma        = ColDouble(st, 5);
    r.race_date_s  = ColI64(st, 6);
    r.venue        = ColText(st, 7);
    r.finish       = ColText(st, 8);
    r.race_class   = ColOptText(st, 9);
    r.horse_name   = ColOptText(st, 10);
    out.push_back(std::move(r));
  }
  if (rc != SQLITE_DONE) ThrowStepError(db, st);

  sqlite3_finalize(st);
  return out;
}

// ------------------------------------------------------------------
// Race entries
// ------------------------------------------------------------------

Result SqliteRepository::UpsertRaceEntry(Transaction& t, const model::RaceEntryRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT OR REPLACE INTO race_entries(race_date,venue,race_number,horse_name,driver_name,trainer_name,finish,race_class,discipline,"
      "qualifier) VALUES(?,?,?,?,?,?,?,?,?,?);";

  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI64(st, 1, r.race_date_s);
  BindText(st, 2, r.venue);
  BindI64(st, 3, r.race_number);
  BindText(st, 4, r.horse_name);
  BindOptText(st, 5, r.driver_name);
  BindOptText(st, 6, r.trainer_name);
  BindText(st, 7, r.finish);
  BindOptText(st, 8, r.race_class);
  BindI32(st, 9, static_cast<int>(r.discipline));
  BindI32(st, 10, r.qualifier ? 1 : 0);

  int  rc     = sqlite3_step(st);
  auto result = Translate(db, rc);
  sqlite3_finalize(st);
  return result;
}

std::vector<model::RaceEntryRecord> SqliteRepository::GetRaceEntries(Transaction& t, int64_t race_date_s, const std::string& venue,
                                                                     uint32_t race_number) {
  auto* db = TX(t).Handle();

  const char* sql =
      "SELECT race_date,venue,race_number,horse_name,driver_name,trainer_name,finish,race_class,discipline,qualifier FROM race_entries "
      "WHERE race_date=? AND venue=? AND race_number=? ORDER BY horse_name;";
  sqlite3_stmt* st = PrepareOrThrow(db, sql);

  BindI64(st, 1, race_date_s);
  BindText(st, 2, venue);
  BindI64(st, 3, race_number);

  std::vector<model::RaceEntryRecord> out;
  int                                 rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(ReadRaceEntry(st));
  }
  if (rc != SQLITE_DONE) ThrowStepError(db, st);

  sqlite3_finalize(st);
  return out;
}

std::optional<int64_t> SqliteRepository::LatestRaceDate(Transaction& t, Discipline discipline) {
  auto* db = TX(t).Handle();

  sqlite3_stmt* st = PrepareOrThrow(db, "SELECT MAX(race_date) FROM race_entries WHERE discipline=?;");
  BindI32(st, 1, static_cast<int>(discipline));

  int rc = sqlite3_step(st);
  if (rc != SQLITE_ROW) ThrowStepError(db, st);

  std::optional<int64_t> latest;
  if (sqlite3_column_type(st, 0) != SQLITE_NULL) latest = ColI64(st, 0);
  sqlite3_finalize(st);
  return latest;
}

} // namespace gaitrank::db::sqlite
