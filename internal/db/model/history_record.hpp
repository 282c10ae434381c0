#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/entity.hpp"

namespace gaitrank::db::model {

/*
  Append-only snapshot of a belief immediately after a rated race.
  Never updated or deleted.
*/

struct HistoryRecord {
  uint64_t                     seq          = 0; // assigned by the backend on append
  gaitrank::model::Discipline  discipline   = gaitrank::model::Discipline::kTrot;
  gaitrank::model::EntityClass entity_class = gaitrank::model::EntityClass::kHorse;
  std::string                  name;

  double mu    = 0.0;
  double sigma = 0.0;

  int64_t                    race_date_s = 0;
  std::string                venue;
  std::string                finish;
  std::optional<std::string> race_class;

  // Horse the driver or trainer was partnered with; unset on horse rows.
  std::optional<std::string> horse_name;
};

} // namespace gaitrank::db::model
