#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/entity.hpp"
#include "internal/util/time.hpp"

namespace gaitrank::history {

// One rated race of an entity, newest first in RecentForm() output.
struct FormEntry {
  util::TimePoint            race_date;
  std::string                venue;
  std::string                finish;
  std::optional<std::string> race_class;
  std::optional<std::string> horse_name;
  double                     mu       = 0.0; // after the race
  double                     sigma    = 0.0;
  double                     mu_delta = 0.0; // change from the previous snapshot, 0 for the first one
};

/*
  Read side of the belief history. Bounded windows only; the full stream
  stays in the repository.
*/
class HistoryReader {
 public:
  explicit HistoryReader(std::shared_ptr<db::Repository> repository);

  std::vector<FormEntry> RecentForm(db::Transaction& tx, const model::EntityKey& key, std::size_t limit) const;

  // 5 races for horses, 3 for drivers and trainers.
  static std::size_t DefaultLimit(model::EntityClass entity_class);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace gaitrank::history
