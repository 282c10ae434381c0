#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace gaitrank::db::memory {

class MemoryTransaction;

/*
  Process-local backend. Used by tests and by `database: { memory: {} }`.
  Nothing survives the process.

  Conflicts are tracked per discipline partition; history sequence
  numbers are allocated repository-wide and never reused.
*/
class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  static constexpr std::size_t kDisciplines = 2;

  static std::size_t Partition(gaitrank::model::Discipline discipline) {
    return discipline == gaitrank::model::Discipline::kTrot ? 0 : 1;
  }

  struct State {
    std::map<std::string, model::BeliefRecord>    beliefs;
    std::vector<model::HistoryRecord>             history;
    std::map<std::string, model::RaceEntryRecord> race_entries;
  };

  std::mutex                         mutex_;
  State                              committed_;
  std::array<uint64_t, kDisciplines> committed_versions_{};
  uint64_t                           next_history_seq_ = 1;
};

} // namespace gaitrank::db::memory
