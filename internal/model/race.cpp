#include "race.hpp"

#include "internal/util/names.hpp"

namespace gaitrank::model {

std::string Describe(const Race& race) {
  return std::string(ToString(race.discipline)) + " " + util::FormatDateTime(race.race_date) + " " + race.venue + " R" +
         std::to_string(race.race_number);
}

static void NormalizeOptional(std::optional<std::string>& name) {
  if (!name) return;
  *name = util::NormalizeName(*name);
  if (name->empty()) name.reset();
}

Race Normalized(Race race) {
  race.venue = util::NormalizeName(race.venue);
  for (auto& starter : race.starters) {
    starter.horse_name = util::NormalizeName(starter.horse_name);
    NormalizeOptional(starter.driver_name);
    NormalizeOptional(starter.trainer_name);
  }
  return race;
}

} // namespace gaitrank::model
