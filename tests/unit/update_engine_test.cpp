#include "internal/rating/update_engine.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/memory/memory_repository.hpp"

namespace {

using gaitrank::model::Discipline;
using gaitrank::model::EntityClass;
using gaitrank::model::EntityKey;
using gaitrank::model::Race;
using gaitrank::model::Starter;
using gaitrank::rating::ClassStatus;
using gaitrank::rating::RaceStatus;

struct Fixture {
  std::shared_ptr<gaitrank::db::memory::MemoryRepository> repository = std::make_shared<gaitrank::db::memory::MemoryRepository>();
  gaitrank::config::EngineConfig                          config;
  std::shared_ptr<gaitrank::rating::RatingStore>          store  = std::make_shared<gaitrank::rating::RatingStore>(repository, config);
  gaitrank::rating::RatingUpdateEngine                    engine{repository, store, gaitrank::rating::TrueSkill(config.trueskill)};
};

Starter Finisher(std::string horse, std::optional<int> position, std::optional<std::string> driver = std::nullopt,
                 std::optional<std::string> trainer = std::nullopt) {
  Starter s;
  s.horse_name      = std::move(horse);
  s.finish.position = position;
  s.driver_name     = std::move(driver);
  s.trainer_name    = std::move(trainer);
  return s;
}

Race MakeRace(std::vector<Starter> starters) {
  Race race;
  race.discipline  = Discipline::kTrot;
  race.race_date   = gaitrank::util::ParseDate("2024-05-01 19:30");
  race.venue       = "saratoga";
  race.race_number = 3;
  race.race_class  = "nw2";
  race.starters    = std::move(starters);
  return race;
}

EntityKey Horse(const std::string& name) {
  return EntityKey{Discipline::kTrot, EntityClass::kHorse, name};
}

void TestRatesAllThreeClasses() {
  Fixture f;
  auto    tx = f.repository->Begin();

  const auto outcome = f.engine.Apply(*tx, MakeRace({Finisher("alpha", 1, "d1", "t1"), Finisher("bravo", 2, "d2", "t2"),
                                                     Finisher("charlie", 3, "d3", "t1")}));
  assert(outcome.status == RaceStatus::kApplied);
  assert(outcome.valid_starters == 3);
  assert(!outcome.HasFailures());
  assert(outcome.classes.size() == 3);
  assert(outcome.classes[0].status == ClassStatus::kApplied && outcome.classes[0].rated == 3);
  assert(outcome.classes[1].status == ClassStatus::kApplied && outcome.classes[1].rated == 3);
  // t1 appears twice; only its best placing counts
  assert(outcome.classes[2].status == ClassStatus::kApplied && outcome.classes[2].rated == 2);

  const auto alpha   = f.repository->GetBelief(*tx, Horse("alpha"));
  const auto bravo   = f.repository->GetBelief(*tx, Horse("bravo"));
  const auto charlie = f.repository->GetBelief(*tx, Horse("charlie"));
  assert(alpha && bravo && charlie);
  assert(alpha->mu > bravo->mu && bravo->mu > charlie->mu);
  assert(alpha->mu > 1000.0 && charlie->mu < 1000.0);
  assert(alpha->last_venue && *alpha->last_venue == "saratoga");

  const auto t1 = f.repository->GetBelief(*tx, {Discipline::kTrot, EntityClass::kTrainer, "t1"});
  const auto t2 = f.repository->GetBelief(*tx, {Discipline::kTrot, EntityClass::kTrainer, "t2"});
  assert(t1 && t2 && t1->mu > t2->mu);

  const auto driver_history = f.repository->ReadHistory(*tx, {Discipline::kTrot, EntityClass::kDriver, "d2"}, std::nullopt);
  assert(driver_history.size() == 1);
  assert(driver_history[0].finish == "2");
  assert(driver_history[0].horse_name && *driver_history[0].horse_name == "bravo");
  assert(driver_history[0].race_class && *driver_history[0].race_class == "nw2");

  const auto horse_history = f.repository->ReadHistory(*tx, Horse("alpha"), std::nullopt);
  assert(horse_history.size() == 1 && !horse_history[0].horse_name);
  assert(horse_history[0].mu == alpha->mu && horse_history[0].sigma == alpha->sigma);
}

void TestSingleValidFinisherSkipsRace() {
  Fixture f;
  auto    tx = f.repository->Begin();

  auto scratched      = Finisher("scratched", 2, "d2");
  scratched.scratched = true;
  auto dnf            = Finisher("dnf", std::nullopt, "d3");
  dnf.finish.code     = "dnf";

  const auto outcome = f.engine.Apply(*tx, MakeRace({Finisher("winner", 1, "d1"), scratched, dnf}));
  assert(outcome.status == RaceStatus::kSkippedInsufficientField);
  assert(outcome.valid_starters == 1);
  assert(outcome.excluded.empty());

  for (auto entity_class : gaitrank::model::kAllEntityClasses) {
    assert(f.repository->ListBeliefs(*tx, Discipline::kTrot, entity_class).empty());
  }
  assert(f.repository->ReadHistory(*tx, Horse("winner"), std::nullopt).empty());
}

void TestMalformedPositionsAreExcluded() {
  Fixture f;
  auto    tx = f.repository->Begin();

  auto garbled        = Finisher("garbled", std::nullopt);
  garbled.finish.code = "7x";

  const auto outcome =
      f.engine.Apply(*tx, MakeRace({Finisher("first", 1), Finisher("zero", 0), garbled, Finisher("second", 2), Finisher("neg", -4)}));
  assert(outcome.status == RaceStatus::kApplied);
  assert(outcome.valid_starters == 2);
  assert(outcome.excluded.size() == 3);
  assert(!f.repository->GetBelief(*tx, Horse("zero")));
  assert(!f.repository->GetBelief(*tx, Horse("garbled")));
  assert(f.repository->GetBelief(*tx, Horse("first"))->mu > f.repository->GetBelief(*tx, Horse("second"))->mu);
}

void TestClassWithOneParticipantIsNotRated() {
  Fixture f;
  auto    tx = f.repository->Begin();

  const auto outcome = f.engine.Apply(*tx, MakeRace({Finisher("a", 1, "d1", "stable"), Finisher("b", 2, "d2", "stable")}));
  assert(outcome.classes[2].status == ClassStatus::kTooFewParticipants);
  assert(!f.repository->GetBelief(*tx, {Discipline::kTrot, EntityClass::kTrainer, "stable"}));
  assert(f.repository->GetBelief(*tx, {Discipline::kTrot, EntityClass::kDriver, "d1"}));
}

void TestClassFailureIsContained() {
  Fixture f;
  auto    tx = f.repository->Begin();

  // dead heat between horses; their drivers are the same person so the driver class has no tie
  const auto outcome = f.engine.Apply(*tx, MakeRace({Finisher("a", 1, "d1"), Finisher("b", 1, "d1"), Finisher("c", 3, "d2")}));
  assert(outcome.status == RaceStatus::kApplied);
  assert(outcome.HasFailures());
  assert(outcome.classes[0].status == ClassStatus::kFailed);
  assert(!outcome.classes[0].error.empty());
  assert(outcome.classes[1].status == ClassStatus::kApplied);

  assert(f.repository->ListBeliefs(*tx, Discipline::kTrot, EntityClass::kHorse).empty());
  assert(f.repository->ListBeliefs(*tx, Discipline::kTrot, EntityClass::kDriver).size() == 2);
}

void TestDuplicateHorseUsesFirstEntry() {
  Fixture f;
  auto    tx = f.repository->Begin();

  const auto outcome = f.engine.Apply(*tx, MakeRace({Finisher("a", 1), Finisher("b", 2), Finisher("a", 3)}));
  assert(outcome.valid_starters == 2);
  assert(f.repository->ReadHistory(*tx, Horse("a"), std::nullopt).size() == 1);
}

void TestNamesAreNormalizedBeforeRating() {
  Fixture f;
  auto    tx = f.repository->Begin();

  const auto outcome =
      f.engine.Apply(*tx, MakeRace({Finisher("Alpha  Star", 1, "  "), Finisher("bravo", 2, "D One"), Finisher(" ALPHA STAR ", 3)}));
  assert(outcome.valid_starters == 2);
  assert(f.repository->ReadHistory(*tx, Horse("alpha star"), std::nullopt).size() == 1);
  assert(!f.repository->GetBelief(*tx, Horse("Alpha  Star")));

  // the blank driver is dropped, leaving one driver and no driver update
  assert(!f.repository->GetBelief(*tx, {Discipline::kTrot, EntityClass::kDriver, "d one"}));
  assert(!f.repository->GetBelief(*tx, {Discipline::kTrot, EntityClass::kDriver, ""}));
}

void TestDisciplinesAreIsolated() {
  Fixture f;
  auto    tx = f.repository->Begin();

  auto race       = MakeRace({Finisher("a", 1), Finisher("b", 2)});
  race.discipline = Discipline::kPace;
  (void)f.engine.Apply(*tx, race);

  assert(f.repository->ListBeliefs(*tx, Discipline::kTrot, EntityClass::kHorse).empty());
  assert(f.repository->ListBeliefs(*tx, Discipline::kPace, EntityClass::kHorse).size() == 2);
}

} // namespace

int main() {
  TestRatesAllThreeClasses();
  TestSingleValidFinisherSkipsRace();
  TestMalformedPositionsAreExcluded();
  TestClassWithOneParticipantIsNotRated();
  TestClassFailureIsContained();
  TestDuplicateHorseUsesFirstEntry();
  TestNamesAreNormalizedBeforeRating();
  TestDisciplinesAreIsolated();

  std::cout << "gaitrank_unit_update_engine: pass\n";
  return 0;
}
