#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/entity.hpp"
#include "internal/util/time.hpp"

namespace gaitrank::model {

/*
  Finishing result of one starter. Exactly one of:
    - a position (1 = winner)
    - a non-numeric code such as "DNF" or a garbled OCR token
    - nothing (result not known)
*/
struct Finish {
  std::optional<int> position;
  std::string        code;

  bool IsPlaced() const {
    return position.has_value() && *position >= 1;
  }

  // Text stored on history and audit rows.
  std::string Display() const {
    if (position) return std::to_string(*position);
    return code;
  }
};

struct Starter {
  std::string                horse_name;
  std::optional<std::string> driver_name;
  std::optional<std::string> trainer_name;
  Finish                     finish;
  bool                       scratched = false;
  std::string                odds_text;
};

struct RaceKey {
  util::TimePoint race_date;
  std::string     venue;
  uint32_t        race_number = 0;

  bool operator==(const RaceKey&) const = default;
};

struct Race {
  Discipline                 discipline = Discipline::kTrot;
  util::TimePoint            race_date;
  std::string                venue;
  uint32_t                   race_number = 0;
  std::optional<std::string> race_class;
  bool                       qualifier = false;
  std::vector<Starter>       starters;

  RaceKey Key() const {
    return RaceKey{race_date, venue, race_number};
  }
};

std::string Describe(const Race& race);

// Copy with venue and every starter name passed through util::NormalizeName.
// Driver or trainer names that normalize to nothing become unset.
Race Normalized(Race race);

} // namespace gaitrank::model
