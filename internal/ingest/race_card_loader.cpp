#include "race_card_loader.hpp"

#include "internal/config/yaml_proto.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/names.hpp"

namespace gaitrank::ingest {

namespace {

std::optional<std::string> OptionalName(bool present, const std::string& raw) {
  if (!present) return std::nullopt;
  auto name = util::NormalizeName(raw);
  if (name.empty()) return std::nullopt;
  return name;
}

model::Finish ToFinish(const gaitrank::v1::Starter& starter) {
  model::Finish finish;
  switch (starter.finish_case()) {
    case gaitrank::v1::Starter::kPosition:
      finish.position = starter.position();
      break;
    case gaitrank::v1::Starter::kFinishCode:
      finish.code = util::NormalizeName(starter.finish_code());
      break;
    case gaitrank::v1::Starter::FINISH_NOT_SET:
      break;
  }
  return finish;
}

} // namespace

gaitrank::v1::RaceCard LoadRaceCard(const std::string& path) {
  gaitrank::v1::RaceCard card;
  config::LoadYamlMessage(path, "race card", &card);
  return card;
}

model::Race ToModel(const gaitrank::v1::Race& in) {
  const std::string label = in.race_date() + " " + in.venue() + " R" + std::to_string(in.race_number());

  auto discipline = model::ParseDiscipline(in.gait());
  if (!discipline) {
    throw util::InvalidArgument("race " + label + ": unknown gait '" + in.gait() + "'");
  }

  model::Race race;
  race.discipline = *discipline;
  try {
    race.race_date = util::ParseDate(in.race_date());
  } catch (const util::InvalidArgument& e) {
    throw util::InvalidArgument("race " + label + ": " + e.what());
  }

  race.venue = util::NormalizeName(in.venue());
  if (race.venue.empty()) throw util::InvalidArgument("race " + label + ": venue is required");

  race.race_number = in.race_number();
  if (in.has_race_class() && !in.race_class().empty()) race.race_class = in.race_class();
  race.qualifier = in.qualifier();

  race.starters.reserve(static_cast<std::size_t>(in.starters_size()));
  for (const auto& s : in.starters()) {
    model::Starter starter;
    starter.horse_name   = util::NormalizeName(s.horse_name());
    starter.driver_name  = OptionalName(s.has_driver_name(), s.driver_name());
    starter.trainer_name = OptionalName(s.has_trainer_name(), s.trainer_name());
    starter.finish       = ToFinish(s);
    starter.scratched    = s.scratched();
    starter.odds_text    = s.odds_text();
    race.starters.push_back(std::move(starter));
  }
  return race;
}

std::vector<model::Race> ToModel(const gaitrank::v1::RaceCard& card) {
  std::vector<model::Race> races;
  races.reserve(static_cast<std::size_t>(card.races_size()));
  for (const auto& race : card.races()) races.push_back(ToModel(race));
  return races;
}

} // namespace gaitrank::ingest
