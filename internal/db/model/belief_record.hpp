#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/entity.hpp"

namespace gaitrank::db::model {

/*
  Persistent belief row. One per (discipline, entity_class, name).

  IMPORTANT:
  - mu is stored undecayed; decay is applied by readers.
  - sigma > 0 always.
*/

struct BeliefRecord {
  gaitrank::model::Discipline  discipline   = gaitrank::model::Discipline::kTrot;
  gaitrank::model::EntityClass entity_class = gaitrank::model::EntityClass::kHorse;
  std::string                  name;

  double mu    = 0.0;
  double sigma = 0.0;

  // Unix seconds of the last race (or qualifier) the entity took part in.
  int64_t                    last_active_s = 0;
  std::optional<std::string> last_venue;
};

} // namespace gaitrank::db::model
