#include "update_engine.hpp"

#include <algorithm>
#include <unordered_set>

#include "internal/db/api/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/names.hpp"

namespace gaitrank::rating {

namespace {

using observability::DoubleField;
using observability::IntField;
using observability::StringField;

// Codes that mean "did not finish" rather than an unreadable result.
bool IsNonFinishCode(const std::string& code) {
  const auto lowered = util::ToLower(code);
  return lowered.empty() || lowered == "dnf" || lowered == "dq" || lowered == "dis" || lowered == "pu";
}

} // namespace

bool UpdateOutcome::HasFailures() const {
  return std::any_of(classes.begin(), classes.end(), [](const ClassOutcome& c) { return c.status == ClassStatus::kFailed; });
}

RatingUpdateEngine::RatingUpdateEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<RatingStore> store, TrueSkill solver)
    : repository_(std::move(repository)), store_(std::move(store)), solver_(std::move(solver)) {
}

UpdateOutcome RatingUpdateEngine::Apply(db::Transaction& tx, const model::Race& input) {
  const auto    race = model::Normalized(input);
  UpdateOutcome outcome;
  const auto    race_label = model::Describe(race);

  std::vector<const model::Starter*> valid;
  std::unordered_set<std::string>    seen_horses;
  for (const auto& starter : race.starters) {
    if (starter.scratched) continue;

    if (starter.horse_name.empty()) {
      GAITRANK_LOG_WARN("Starter without a horse name excluded", {StringField("race", race_label)});
      continue;
    }

    if (!starter.finish.IsPlaced()) {
      if (starter.finish.position || !IsNonFinishCode(starter.finish.code)) {
        GAITRANK_LOG_WARN("Malformed finishing position, starter excluded",
                          {StringField("race", race_label), StringField("horse", starter.horse_name),
                           StringField("finish", starter.finish.Display())});
        outcome.excluded.push_back(starter.horse_name);
      }
      continue;
    }

    if (!seen_horses.insert(starter.horse_name).second) {
      GAITRANK_LOG_WARN("Horse listed twice in one race, later entry ignored",
                        {StringField("race", race_label), StringField("horse", starter.horse_name)});
      continue;
    }
    valid.push_back(&starter);
  }

  outcome.valid_starters = valid.size();
  if (valid.size() < 2) {
    outcome.status = RaceStatus::kSkippedInsufficientField;
    GAITRANK_LOG_WARN("Not enough valid finishers, race skipped",
                      {StringField("race", race_label), IntField("valid_starters", static_cast<int64_t>(valid.size()))});
    return outcome;
  }

  std::stable_sort(valid.begin(), valid.end(),
                   [](const model::Starter* a, const model::Starter* b) { return *a->finish.position < *b->finish.position; });

  for (auto entity_class : model::kAllEntityClasses) {
    // best-placed appearance wins when a driver or trainer has several starters
    std::vector<Participant>        participants;
    std::unordered_set<std::string> seen;
    for (const auto* starter : valid) {
      std::optional<std::string> name;
      switch (entity_class) {
        case model::EntityClass::kHorse:
          name = starter->horse_name;
          break;
        case model::EntityClass::kDriver:
          name = starter->driver_name;
          break;
        case model::EntityClass::kTrainer:
          name = starter->trainer_name;
          break;
      }
      if (!name || name->empty() || !seen.insert(*name).second) continue;

      Participant p;
      p.name     = *name;
      p.position = *starter->finish.position;
      p.finish   = starter->finish.Display();
      if (entity_class != model::EntityClass::kHorse) p.horse_name = starter->horse_name;
      participants.push_back(std::move(p));
    }

    outcome.classes.push_back(RateClass(tx, race, entity_class, participants));
  }

  GAITRANK_LOG_INFO("Race rated", {StringField("race", race_label), IntField("starters", static_cast<int64_t>(valid.size())),
                                   IntField("horses", static_cast<int64_t>(outcome.classes[0].rated)),
                                   IntField("drivers", static_cast<int64_t>(outcome.classes[1].rated)),
                                   IntField("trainers", static_cast<int64_t>(outcome.classes[2].rated))});
  return outcome;
}

ClassOutcome RatingUpdateEngine::RateClass(db::Transaction& tx, const model::Race& race, model::EntityClass entity_class,
                                           const std::vector<Participant>& participants) {
  ClassOutcome outcome;
  outcome.entity_class = entity_class;

  if (participants.size() < 2) {
    outcome.status = ClassStatus::kTooFewParticipants;
    return outcome;
  }

  std::vector<model::EntityKey> keys;
  std::vector<Belief>           priors;
  std::vector<int>              ranks;
  for (const auto& p : participants) {
    keys.push_back(model::EntityKey{race.discipline, entity_class, p.name});
    priors.push_back(store_->ReadOrDefault(tx, keys.back(), race.race_date));
    ranks.push_back(p.position);
  }

  std::vector<Belief> posteriors;
  try {
    posteriors = solver_.Rate(priors, ranks);
  } catch (const util::RatingUpdateError& e) {
    outcome.status = ClassStatus::kFailed;
    outcome.error  = e.what();
    GAITRANK_LOG_ERROR("Rating update failed, class left unchanged",
                       {StringField("race", model::Describe(race)), StringField("class", model::ToString(entity_class)),
                        StringField("error", e.what())});
    return outcome;
  }

  for (std::size_t i = 0; i < participants.size(); ++i) {
    store_->Write(tx, keys[i], posteriors[i], race.race_date, race.venue);

    db::model::HistoryRecord history;
    history.discipline   = race.discipline;
    history.entity_class = entity_class;
    history.name         = participants[i].name;
    history.mu           = posteriors[i].mu;
    history.sigma        = posteriors[i].sigma;
    history.race_date_s  = util::ToUnixSeconds(race.race_date);
    history.venue        = race.venue;
    history.finish       = participants[i].finish;
    history.race_class   = race.race_class;
    history.horse_name   = participants[i].horse_name;
    db::ThrowIfDbError(repository_->AppendHistory(tx, history), "append history " + model::ToString(keys[i]));

    GAITRANK_LOG_DEBUG("Belief updated", {StringField("entity", model::ToString(keys[i])), DoubleField("mu_before", priors[i].mu),
                                          DoubleField("mu_after", posteriors[i].mu), DoubleField("sigma_after", posteriors[i].sigma)});
  }

  outcome.rated = participants.size();
  return outcome;
}

} // namespace gaitrank::rating
