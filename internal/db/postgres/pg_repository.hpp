#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace gaitrank::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception&);
};

} // namespace gaitrank::db::postgres
