#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/belief_record.hpp"
#include "internal/db/model/history_record.hpp"
#include "internal/db/model/race_entry_record.hpp"
#include "internal/model/entity.hpp"

namespace gaitrank::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - History rows are append-only
  - Beliefs are never deleted

  The DB is the source of truth for:
    beliefs (one row per discipline/class/name)
    belief history
    race entry audit rows
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Beliefs
  // ---------------------------------------------------------------------

  virtual std::optional<model::BeliefRecord> GetBelief(Transaction&, const gaitrank::model::EntityKey& key) = 0;

  // Inserts or replaces the row for (discipline, entity_class, name).
  virtual Result UpsertBelief(Transaction&, const model::BeliefRecord&) = 0;

  virtual std::vector<model::BeliefRecord> ListBeliefs(Transaction&, gaitrank::model::Discipline, gaitrank::model::EntityClass) = 0;

  // ---------------------------------------------------------------------
  // History (append-only)
  // ---------------------------------------------------------------------

  // Assigns record.seq.
  virtual Result AppendHistory(Transaction&, model::HistoryRecord& record) = 0;

  // Newest first: race date descending, then append order descending.
  virtual std::vector<model::HistoryRecord> ReadHistory(Transaction&, const gaitrank::model::EntityKey& key,
                                                        std::optional<uint64_t> max_entries) = 0;

  // ---------------------------------------------------------------------
  // Race entries (audit)
  // ---------------------------------------------------------------------

  virtual Result UpsertRaceEntry(Transaction&, const model::RaceEntryRecord&) = 0;

  virtual std::vector<model::RaceEntryRecord> GetRaceEntries(Transaction&, int64_t race_date_s, const std::string& venue,
                                                             uint32_t race_number) = 0;

  // Latest race date recorded for the discipline, if any race was applied.
  virtual std::optional<int64_t> LatestRaceDate(Transaction&, gaitrank::model::Discipline) = 0;
};

} // namespace gaitrank::db
