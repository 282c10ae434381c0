#include "pg_repository.hpp"

namespace gaitrank::db::postgres {

using gaitrank::model::Discipline;
using gaitrank::model::EntityClass;
using gaitrank::model::EntityKey;

namespace {

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

model::BeliefRecord ReadBelief(const pqxx::row& row) {
  model::BeliefRecord r;
  r.discipline    = static_cast<Discipline>(row[0].as<int>());
  r.entity_class  = static_cast<EntityClass>(row[1].as<int>());
  r.name          = row[2].c_str();
  r.mu            = row[3].as<double>();
  r.sigma         = row[4].as<double>();
  r.last_active_s = row[5].as<int64_t>();
  r.last_venue    = OptText(row[6]);
  return r;
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
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Conflict, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

std::optional<model::BeliefRecord> PgRepository::GetBelief(Transaction& t, const EntityKey& key) {
  auto res = TX(t).Work().exec_prepared("get_belief", static_cast<int>(key.discipline), static_cast<int>(key.entity_class), key.name);
  if (res.empty()) return std::nullopt;
  return ReadBelief(res[0]);
}

Result PgRepository::UpsertBelief(Transaction& t, const model::BeliefRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_belief", static_cast<int>(r.discipline), static_cast<int>(r.entity_class), r.name, r.mu, r.sigma,
                               r.last_active_s, r.last_venue);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::BeliefRecord> PgRepository::ListBeliefs(Transaction& t, Discipline discipline, EntityClass entity_class) {
  auto res = TX(t).Work().exec_prepared("list_beliefs", static_cast<int>(discipline), static_cast<int>(entity_class));

  std::vector<model::BeliefRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadBelief(row));
  return out;
}

Result PgRepository::AppendHistory(Transaction& t, model::HistoryRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("append_history", static_cast<int>(r.discipline), static_cast<int>(r.entity_class), r.name, r.mu,
                                          r.sigma, r.race_date_s, r.venue, r.finish, r.race_class, r.horse_name);
    r.seq = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::HistoryRecord> PgRepository::ReadHistory(Transaction& t, const EntityKey& key, std::optional<uint64_t> max_entries) {
  // LIMIT NULL means no limit in postgres
  std::optional<int64_t> limit;
  if (max_entries) limit = static_cast<int64_t>(*max_entries);

  auto res = TX(t).Work().exec_params(
      "SELECT seq,discipline,entity_class,name,mu,sigma,race_date,venue,finish,race_class,horse_name FROM belief_history "
      "WHERE discipline=$1 AND entity_class=$2 AND name=$3 ORDER BY race_date DESC, seq DESC LIMIT $4;",
      static_cast<int>(key.discipline), static_cast<int>(key.entity_class), key.name, limit);

  std::vector<model::HistoryRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::HistoryRecord r;
    r.seq          = row[0].as<uint64_t>();
    r.discipline   = static_cast<Discipline>(row[1].as<int>());
    r.entity_class = static_cast<EntityClass>(row[2].as<int>());
    r.name         = row[3].c_str();
    r.mu           = row[4].as<double>();
    r.sigma        = row[5].as<double>();
    r.race_date_s  = row[6].as<int64_t>();
    r.venue        = row[7].c_str();
    r.finish       = row[8].c_str();
    r.race_class   = OptText(row[9]);
    r.horse_name   = OptText(row[10]);
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::UpsertRaceEntry(Transaction& t, const model::RaceEntryRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_race_entry", r.race_date_s, r.venue, static_cast<int64_t>(r.race_number), r.horse_name, r.driver_name,
                               r.trainer_name, r.finish, r.race_class, static_cast<int>(r.discipline), r.qualifier);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::RaceEntryRecord> PgRepository::GetRaceEntries(Transaction& t, int64_t race_date_s, const std::string& venue,
                                                                 uint32_t race_number) {
  auto res = TX(t).Work().exec_params(
      "SELECT race_date,venue,race_number,horse_name,driver_name,trainer_name,finish,race_class,discipline,qualifier FROM race_entries "
      "WHERE race_date=$1 AND venue=$2 AND race_number=$3 ORDER BY horse_name;",
      race_date_s, venue, static_cast<int64_t>(race_number));

  std::vector<model::RaceEntryRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::RaceEntryRecord r;
    r.race_date_s  = row[0].as<int64_t>();
    r.venue        = row[1].c_str();
    r.race_number  = row[2].as<uint32_t>();
    r.horse_name   = row[3].c_str();
    r.driver_name  = OptText(row[4]);
    r.trainer_name = OptText(row[5]);
    r.finish       = row[6].c_str();
    r.race_class   = OptText(row[7]);
    r.discipline   = static_cast<Discipline>(row[8].as<int>());
    r.qualifier    = row[9].as<bool>();
    out.push_back(std::move(r));
  }
  return out;
}

std::optional<int64_t> PgRepository::LatestRaceDate(Transaction& t, Discipline discipline) {
  auto res = TX(t).Work().exec_params("SELECT MAX(race_date) FROM race_entries WHERE discipline=$1;", static_cast<int>(discipline));
  if (res.empty() || res[0][0].is_null()) return std::nullopt;
  return res[0][0].as<int64_t>();
}

} // namespace gaitrank::db::postgres
