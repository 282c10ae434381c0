#include "migrations.hpp"

#include <stdexcept>

namespace gaitrank::db::sql {

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS beliefs (discipline INTEGER NOT NULL, entity_class INTEGER NOT NULL, name TEXT NOT NULL, mu REAL NOT NULL, "
      "sigma REAL NOT NULL CHECK (sigma > 0), last_active INTEGER NOT NULL, last_venue TEXT, PRIMARY KEY (discipline, entity_class, name));",
      "CREATE TABLE IF NOT EXISTS belief_history (seq INTEGER PRIMARY KEY AUTOINCREMENT, discipline INTEGER NOT NULL, entity_class INTEGER NOT "
      "NULL, name TEXT NOT NULL, mu REAL NOT NULL, sigma REAL NOT NULL, race_date INTEGER NOT NULL, venue TEXT NOT NULL, finish TEXT NOT NULL, "
      "race_class TEXT, horse_name TEXT);",
      "CREATE INDEX IF NOT EXISTS idx_belief_history_entity ON belief_history (discipline, entity_class, name, race_date);",
      "CREATE TABLE IF NOT EXISTS race_entries (race_date INTEGER NOT NULL, venue TEXT NOT NULL, race_number INTEGER NOT NULL, horse_name TEXT NOT "
      "NULL, driver_name TEXT, trainer_name TEXT, finish TEXT NOT NULL, race_class TEXT, discipline INTEGER NOT NULL, qualifier INTEGER NOT NULL, "
      "PRIMARY KEY (race_date, venue, race_number, horse_name));",
      "CREATE INDEX IF NOT EXISTS idx_race_entries_discipline_date ON race_entries (discipline, race_date);",
  };
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS beliefs (discipline SMALLINT NOT NULL, entity_class SMALLINT NOT NULL, name TEXT NOT NULL, mu DOUBLE PRECISION "
      "NOT NULL, sigma DOUBLE PRECISION NOT NULL CHECK (sigma > 0), last_active BIGINT NOT NULL, last_venue TEXT, PRIMARY KEY (discipline, "
      "entity_class, name));",
      "CREATE TABLE IF NOT EXISTS belief_history (seq BIGSERIAL PRIMARY KEY, discipline SMALLINT NOT NULL, entity_class SMALLINT NOT NULL, name "
      "TEXT NOT NULL, mu DOUBLE PRECISION NOT NULL, sigma DOUBLE PRECISION NOT NULL, race_date BIGINT NOT NULL, venue TEXT NOT NULL, finish TEXT "
      "NOT NULL, race_class TEXT, horse_name TEXT);",
      "CREATE INDEX IF NOT EXISTS idx_belief_history_entity ON belief_history (discipline, entity_class, name, race_date);",
      "CREATE TABLE IF NOT EXISTS race_entries (race_date BIGINT NOT NULL, venue TEXT NOT NULL, race_number INTEGER NOT NULL, horse_name TEXT NOT "
      "NULL, driver_name TEXT, trainer_name TEXT, finish TEXT NOT NULL, race_class TEXT, discipline SMALLINT NOT NULL, qualifier BOOLEAN NOT "
      "NULL, PRIMARY KEY (race_date, venue, race_number, horse_name));",
      "CREATE INDEX IF NOT EXISTS idx_race_entries_discipline_date ON race_entries (discipline, race_date);",
  };
  return kSchema;
}

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    try {
      executor.ExecuteSQL(sql);
    } catch (const std::exception& e) {
      throw std::runtime_error("schema bootstrap failed: " + std::string(e.what()) + " [" + sql + "]");
    }
  }
}

} // namespace gaitrank::db::sql
