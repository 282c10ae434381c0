#include "internal/rating/qualifier_handler.hpp"

#include <cassert>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"

namespace {

using gaitrank::model::Discipline;
using gaitrank::model::EntityClass;
using gaitrank::model::EntityKey;
using gaitrank::model::Race;
using gaitrank::model::Starter;
using gaitrank::rating::Belief;
using gaitrank::util::ParseDate;

struct Fixture {
  std::shared_ptr<gaitrank::db::memory::MemoryRepository> repository = std::make_shared<gaitrank::db::memory::MemoryRepository>();
  std::shared_ptr<gaitrank::rating::RatingStore>          store =
      std::make_shared<gaitrank::rating::RatingStore>(repository, gaitrank::config::EngineConfig{});
  gaitrank::rating::QualifierHandler handler{store};
};

Race Qualifier() {
  Race race;
  race.discipline  = Discipline::kPace;
  race.race_date   = ParseDate("2024-06-01");
  race.venue       = "yonkers";
  race.race_number = 1;
  race.qualifier   = true;

  Starter veteran;
  veteran.horse_name   = "veteran";
  veteran.driver_name  = "d1";
  veteran.trainer_name = "stable";
  Starter rookie;
  rookie.horse_name   = "rookie";
  rookie.trainer_name = "stable";
  Starter scratched;
  scratched.horse_name = "scratched";
  scratched.scratched  = true;

  race.starters = {veteran, rookie, scratched};
  return race;
}

void TestQualifierRefreshesRecencyWithoutRating() {
  Fixture         f;
  const EntityKey veteran{Discipline::kPace, EntityClass::kHorse, "veteran"};
  {
    auto tx = f.repository->Begin();
    f.store->Write(*tx, veteran, Belief{1250.0, 180.0}, ParseDate("2023-01-01"), "saratoga");
    tx->Commit();
  }

  auto       tx      = f.repository->Begin();
  const auto outcome = f.handler.Apply(*tx, Qualifier());

  // veteran, rookie, d1, stable
  assert(outcome.touched == 4);
  assert(outcome.created == 3);

  const auto record = f.repository->GetBelief(*tx, veteran);
  assert(record->mu == 1250.0 && record->sigma == 180.0);
  assert(record->last_active_s == gaitrank::util::ToUnixSeconds(ParseDate("2024-06-01")));
  assert(record->last_venue && *record->last_venue == "yonkers");

  // decay clock restarted
  const auto effective = f.store->Read(*tx, veteran, ParseDate("2024-06-10"));
  assert(effective->belief.mu == 1250.0);

  const auto rookie = f.repository->GetBelief(*tx, {Discipline::kPace, EntityClass::kHorse, "rookie"});
  assert(rookie && rookie->mu == 1000.0);
  assert(!f.repository->GetBelief(*tx, {Discipline::kPace, EntityClass::kHorse, "scratched"}));
  assert(f.repository->ReadHistory(*tx, veteran, std::nullopt).empty());
}

void TestQualifierNormalizesNames() {
  Fixture f;
  auto    race = Qualifier();
  race.starters[0].horse_name  = "  VETERAN ";
  race.starters[0].driver_name = "D1";
  race.starters[1].horse_name  = "Rookie";

  auto       tx      = f.repository->Begin();
  const auto outcome = f.handler.Apply(*tx, race);
  assert(outcome.touched == 4);
  assert(f.repository->GetBelief(*tx, {Discipline::kPace, EntityClass::kHorse, "veteran"}));
  assert(f.repository->GetBelief(*tx, {Discipline::kPace, EntityClass::kDriver, "d1"}));
  assert(!f.repository->GetBelief(*tx, {Discipline::kPace, EntityClass::kHorse, "Rookie"}));
}

} // namespace

int main() {
  TestQualifierRefreshesRecencyWithoutRating();
  TestQualifierNormalizesNames();

  std::cout << "gaitrank_unit_qualifier_handler: pass\n";
  return 0;
}
