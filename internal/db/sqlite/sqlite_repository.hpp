#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace gaitrank::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  std::optional<model::BeliefRecord> GetBelief(Transaction&, const gaitrank::model::EntityKey&) override;
  Result                             UpsertBelief(Transaction&, const model::BeliefRecord&) override;
  std::vector<model::BeliefRecord>   ListBeliefs(Transaction&, gaitrank::model::Discipline, gaitrank::model::EntityClass) override;

  Result                            AppendHistory(Transaction&, model::HistoryRecord&) override;
  std::vector<model::HistoryRecord> ReadHistory(Transaction&, const gaitrank::model::EntityKey&, std::optional<uint64_t> max_entries) override;

  Result                              UpsertRaceEntry(Transaction&, const model::RaceEntryRecord&) override;
  std::vector<model::RaceEntryRecord> GetRaceEntries(Transaction&, int64_t race_date_s, const std::string& venue, uint32_t race_number) override;
  std::optional<int64_t>              LatestRaceDate(Transaction&, gaitrank::model::Discipline) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace gaitrank::db::sqlite
