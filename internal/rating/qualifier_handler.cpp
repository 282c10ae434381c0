#include "qualifier_handler.hpp"

#include <set>

#include "internal/observability/logging.hpp"

namespace gaitrank::rating {

QualifierHandler::QualifierHandler(std::shared_ptr<RatingStore> store) : store_(std::move(store)) {
}

QualifierOutcome QualifierHandler::Apply(db::Transaction& tx, const model::Race& input) {
  const auto race = model::Normalized(input);

  std::set<std::pair<model::EntityClass, std::string>> participants;
  for (const auto& starter : race.starters) {
    if (starter.scratched) continue;
    if (!starter.horse_name.empty()) participants.emplace(model::EntityClass::kHorse, starter.horse_name);
    if (starter.driver_name && !starter.driver_name->empty()) participants.emplace(model::EntityClass::kDriver, *starter.driver_name);
    if (starter.trainer_name && !starter.trainer_name->empty()) participants.emplace(model::EntityClass::kTrainer, *starter.trainer_name);
  }

  QualifierOutcome outcome;
  for (const auto& [entity_class, name] : participants) {
    if (store_->Touch(tx, model::EntityKey{race.discipline, entity_class, name}, race.race_date, race.venue)) {
      ++outcome.created;
    }
    ++outcome.touched;
  }

  GAITRANK_LOG_INFO("Qualifier recorded", {observability::StringField("race", model::Describe(race)),
                                           observability::IntField("touched", static_cast<int64_t>(outcome.touched)),
                                           observability::IntField("created", static_cast<int64_t>(outcome.created))});
  return outcome;
}

} // namespace gaitrank::rating
