#include "internal/rating/rating_store.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using gaitrank::model::Discipline;
using gaitrank::model::EntityClass;
using gaitrank::model::EntityKey;
using gaitrank::rating::Belief;
using gaitrank::rating::RatingStore;
using gaitrank::util::ParseDate;

bool Near(double a, double b) {
  return std::fabs(a - b) <= 1e-9;
}

struct Fixture {
  std::shared_ptr<gaitrank::db::memory::MemoryRepository> repository = std::make_shared<gaitrank::db::memory::MemoryRepository>();
  RatingStore                                             store{repository, gaitrank::config::EngineConfig{}};
};

const EntityKey kHorse{Discipline::kTrot, EntityClass::kHorse, "lucky strike"};

void TestUnseenEntityReadsAsDefaultWithoutWriting() {
  Fixture f;
  auto    tx = f.repository->Begin();

  assert(!f.store.Read(*tx, kHorse, ParseDate("2024-01-01")));
  const auto belief = f.store.ReadOrDefault(*tx, kHorse, ParseDate("2024-01-01"));
  assert(belief.mu == 1000.0 && Near(belief.sigma, 333.333));
  assert(!f.repository->GetBelief(*tx, kHorse));
}

void TestReadAppliesDecayButNeverStoresIt() {
  Fixture f;
  {
    auto tx = f.repository->Begin();
    f.store.Write(*tx, kHorse, Belief{1200.0, 250.0}, ParseDate("2023-01-01"), "saratoga");
    tx->Commit();
  }

  auto tx = f.repository->Begin();

  const auto fresh = f.store.Read(*tx, kHorse, ParseDate("2023-01-20"));
  assert(fresh && fresh->belief.mu == 1200.0 && fresh->days_inactive == 19);

  const auto stale = f.store.Read(*tx, kHorse, ParseDate("2024-06-01"));
  assert(stale && Near(stale->belief.mu, 600.0));
  assert(stale->stored_mu == 1200.0);
  assert(stale->belief.sigma == 250.0);
  assert(stale->last_venue && *stale->last_venue == "saratoga");

  assert(f.repository->GetBelief(*tx, kHorse)->mu == 1200.0);
}

void TestWriteRejectsInvalidBelief() {
  Fixture f;
  auto    tx = f.repository->Begin();

  bool threw = false;
  try {
    f.store.Write(*tx, kHorse, Belief{1000.0, 0.0}, ParseDate("2024-01-01"), "saratoga");
  } catch (const gaitrank::util::InvalidState&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.store.Write(*tx, kHorse, Belief{std::nan(""), 10.0}, ParseDate("2024-01-01"), "saratoga");
  } catch (const gaitrank::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestTouchRefreshesRecencyOnly() {
  Fixture f;
  auto    tx = f.repository->Begin();

  assert(f.store.Touch(*tx, kHorse, ParseDate("2024-01-01"), "yonkers"));
  auto record = f.repository->GetBelief(*tx, kHorse);
  assert(record && record->mu == 1000.0 && Near(record->sigma, 333.333));

  f.store.Write(*tx, kHorse, Belief{1100.0, 200.0}, ParseDate("2024-02-01"), "saratoga");
  assert(!f.store.Touch(*tx, kHorse, ParseDate("2024-03-01"), "meadowlands"));

  record = f.repository->GetBelief(*tx, kHorse);
  assert(record->mu == 1100.0 && record->sigma == 200.0);
  assert(record->last_active_s == gaitrank::util::ToUnixSeconds(ParseDate("2024-03-01")));
  assert(record->last_venue && *record->last_venue == "meadowlands");
}

void TestListSortsByDecayedMean() {
  Fixture f;
  auto    tx = f.repository->Begin();

  f.store.Write(*tx, {Discipline::kTrot, EntityClass::kHorse, "old star"}, Belief{1400.0, 100.0}, ParseDate("2022-01-01"), "a");
  f.store.Write(*tx, {Discipline::kTrot, EntityClass::kHorse, "current"}, Belief{1100.0, 100.0}, ParseDate("2024-05-01"), "a");
  f.store.Write(*tx, {Discipline::kTrot, EntityClass::kHorse, "novice"}, Belief{900.0, 100.0}, ParseDate("2024-05-01"), "a");
  f.store.Write(*tx, {Discipline::kPace, EntityClass::kHorse, "pacer"}, Belief{2000.0, 100.0}, ParseDate("2024-05-01"), "a");
  f.store.Write(*tx, {Discipline::kTrot, EntityClass::kDriver, "driver"}, Belief{2000.0, 100.0}, ParseDate("2024-05-01"), "a");

  const auto list = f.store.List(*tx, Discipline::kTrot, EntityClass::kHorse, ParseDate("2024-05-10"));
  assert(list.size() == 3);
  assert(list[0].key.name == "current");
  assert(list[1].key.name == "novice");
  assert(list[2].key.name == "old star" && Near(list[2].belief.mu, 700.0));
}

} // namespace

int main() {
  TestUnseenEntityReadsAsDefaultWithoutWriting();
  TestReadAppliesDecayButNeverStoresIt();
  TestWriteRejectsInvalidBelief();
  TestTouchRefreshesRecencyOnly();
  TestListSortsByDecayedMean();

  std::cout << "gaitrank_unit_rating_store: pass\n";
  return 0;
}
