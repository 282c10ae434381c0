#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/race.hpp"
#include "internal/rating/rating_store.hpp"
#include "internal/rating/trueskill.hpp"

namespace gaitrank::rating {

enum class ClassStatus {
  kApplied,
  kTooFewParticipants, // fewer than two named entities of the class among valid finishers
  kFailed,             // numerical failure; beliefs of the class untouched
};

struct ClassOutcome {
  model::EntityClass entity_class = model::EntityClass::kHorse;
  ClassStatus        status       = ClassStatus::kApplied;
  std::size_t        rated        = 0;
  std::string        error;
};

enum class RaceStatus {
  kApplied,
  kSkippedInsufficientField,
};

struct UpdateOutcome {
  RaceStatus                status         = RaceStatus::kApplied;
  std::size_t               valid_starters = 0;
  std::vector<std::string>  excluded;      // horses dropped for a malformed finishing position
  std::vector<ClassOutcome> classes;

  bool HasFailures() const;
};

constexpr std::string_view ToString(ClassStatus status) {
  switch (status) {
    case ClassStatus::kApplied:
      return "applied";
    case ClassStatus::kTooFewParticipants:
      return "too_few_participants";
    case ClassStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

/*
  RatingUpdateEngine

  Applies one finished non-qualifier race inside the caller's transaction:

  1. drops scratched starters and starters without a placed finish
  2. skips the race (no writes) when fewer than two valid starters remain
  3. per class (horse, driver, trainer) independently: read decayed priors,
     run one TrueSkill update with finishing positions as ranks, write the
     posteriors and append one history row per entity

  A numerical failure in one class leaves that class untouched and the
  other classes proceed. Storage errors propagate as exceptions so the
  caller's transaction rolls back the whole race.
*/
class RatingUpdateEngine {
 public:
  RatingUpdateEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<RatingStore> store, TrueSkill solver);

  UpdateOutcome Apply(db::Transaction& tx, const model::Race& race);

 private:
  struct Participant {
    std::string                name;
    int                        position = 0;
    std::string                finish;
    std::optional<std::string> horse_name;
  };

  ClassOutcome RateClass(db::Transaction& tx, const model::Race& race, model::EntityClass entity_class,
                         const std::vector<Participant>& participants);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<RatingStore>    store_;
  TrueSkill                       solver_;
};

} // namespace gaitrank::rating
