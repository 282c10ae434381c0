#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace gaitrank::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_           = repo_.committed_; // snapshot copy
  snapshot_versions_ = repo_.committed_versions_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Touch(gaitrank::model::Discipline discipline) {
  touched_[MemoryRepository::Partition(discipline)] = true;
}

void MemoryTransaction::PutBelief(const std::string& key, const model::BeliefRecord& record) {
  working_.beliefs[key] = record;
  belief_writes_[key]   = record;
  Touch(record.discipline);
}

void MemoryTransaction::PutHistory(const model::HistoryRecord& record) {
  working_.history.push_back(record);
  history_writes_.push_back(record);
  Touch(record.discipline);
}

void MemoryTransaction::PutRaceEntry(const std::string& key, const model::RaceEntryRecord& record) {
  working_.race_entries[key] = record;
  race_entry_writes_[key]    = record;
  Touch(record.discipline);
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw util::InvalidState("transaction already finished");
  }
  std::scoped_lock lock(repo_.mutex_);
  for (std::size_t p = 0; p < touched_.size(); ++p) {
    if (touched_[p] && repo_.committed_versions_[p] != snapshot_versions_[p]) {
      throw util::InvalidState("transaction conflict: state was modified by a concurrent transaction");
    }
  }

  auto& state = repo_.committed_;
  for (auto& [key, record] : belief_writes_) state.beliefs[key] = std::move(record);
  for (auto& record : history_writes_) state.history.push_back(std::move(record));
  for (auto& [key, record] : race_entry_writes_) state.race_entries[key] = std::move(record);

  for (std::size_t p = 0; p < touched_.size(); ++p) {
    if (touched_[p]) repo_.committed_versions_[p]++;
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  working_ = {};
  belief_writes_.clear();
  history_writes_.clear();
  race_entry_writes_.clear();
  rolled_back_ = true;
}

} // namespace gaitrank::db::memory
