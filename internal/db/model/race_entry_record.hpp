#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/entity.hpp"

namespace gaitrank::db::model {

// Audit row. Natural key: (race_date_s, venue, race_number, horse_name).
struct RaceEntryRecord {
  int64_t     race_date_s = 0;
  std::string venue;
  uint32_t    race_number = 0;
  std::string horse_name;

  std::optional<std::string> driver_name;
  std::optional<std::string> trainer_name;
  std::string                finish;
  std::optional<std::string> race_class;

  gaitrank::model::Discipline discipline = gaitrank::model::Discipline::kTrot;
  bool                        qualifier  = false;
};

} // namespace gaitrank::db::model
