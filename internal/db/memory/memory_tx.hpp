#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace gaitrank::db::memory {

/*
  Transaction = snapshot + write set.

  Reads see the snapshot with this transaction's writes applied. Commit
  merges only the write set into the committed state, so transactions
  on different disciplines never conflict. Commit fails with
  "transaction conflict" when another transaction committed to one of
  the disciplines this one wrote after the snapshot was taken.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_ || rolled_back_;
  }

  const MemoryRepository::State& View() const {
    return working_;
  }

  void PutBelief(const std::string& key, const model::BeliefRecord& record);
  void PutHistory(const model::HistoryRecord& record);
  void PutRaceEntry(const std::string& key, const model::RaceEntryRecord& record);

 private:
  void Touch(gaitrank::model::Discipline discipline);

  MemoryRepository&       repo_;
  MemoryRepository::State working_;

  std::map<std::string, model::BeliefRecord>           belief_writes_;
  std::vector<model::HistoryRecord>                    history_writes_;
  std::map<std::string, model::RaceEntryRecord>        race_entry_writes_;
  std::array<bool, MemoryRepository::kDisciplines>     touched_{};
  std::array<uint64_t, MemoryRepository::kDisciplines> snapshot_versions_{};

  bool committed_   = false;
  bool rolled_back_ = false;
};

} // namespace gaitrank::db::memory
