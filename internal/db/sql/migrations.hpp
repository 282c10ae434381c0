#pragma once

#include <string>
#include <vector>

namespace gaitrank::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Schema bootstrap statements. Every statement is idempotent
  (CREATE ... IF NOT EXISTS) so they run on every start-up.

  Tables:
    beliefs         one row per (discipline, entity_class, name)
    belief_history  append-only post-race snapshots
    race_entries    audit rows keyed by (race_date, venue, race_number, horse_name)
*/
const std::vector<std::string>& SqliteSchema();
const std::vector<std::string>& PostgresSchema();

// Runs statements in order.
void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

} // namespace gaitrank::db::sql
