#include "internal/service/odds_service.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/rating/rating_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using gaitrank::model::Discipline;
using gaitrank::model::EntityClass;
using gaitrank::model::EntityKey;
using gaitrank::model::Race;
using gaitrank::model::Starter;
using gaitrank::rating::Belief;
using gaitrank::util::ParseDate;

bool Near(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps;
}

Starter Entry(std::string horse, std::optional<std::string> driver = std::nullopt, std::optional<std::string> trainer = std::nullopt) {
  Starter s;
  s.horse_name   = std::move(horse);
  s.driver_name  = std::move(driver);
  s.trainer_name = std::move(trainer);
  return s;
}

Race Card(const char* date, std::vector<Starter> starters) {
  Race race;
  race.discipline  = Discipline::kTrot;
  race.race_date   = ParseDate(date);
  race.venue       = "saratoga";
  race.race_number = 7;
  race.starters    = std::move(starters);
  return race;
}

void Seed(const std::shared_ptr<gaitrank::db::Repository>& repository, const gaitrank::config::EngineConfig& engine, const EntityKey& key,
          double mu, const char* active) {
  gaitrank::rating::RatingStore store(repository, engine);
  auto                          tx = repository->Begin();
  store.Write(*tx, key, Belief{mu, 200.0}, ParseDate(active), "saratoga");
  tx->Commit();
}

void TestPricesFieldWithFusion() {
  auto repository = std::make_shared<gaitrank::db::memory::MemoryRepository>();
  auto app        = gaitrank::factory::Build(gaitrank::config::EngineConfig{}, repository);

  Seed(repository, app.engine, {Discipline::kTrot, EntityClass::kHorse, "fast"}, 1100.0, "2024-05-01");
  Seed(repository, app.engine, {Discipline::kTrot, EntityClass::kDriver, "ace"}, 1200.0, "2024-05-01");
  Seed(repository, app.engine, {Discipline::kTrot, EntityClass::kHorse, "slow"}, 900.0, "2024-05-01");

  auto scratched      = Entry("scratched");
  scratched.scratched = true;

  const auto report = app.odds_service->Price(Card("2024-05-10", {Entry("slow"), Entry("fast", "ace"), Entry("unknown"), scratched}));
  assert(report.discipline() == "trot");
  assert(report.race_number() == 7);
  assert(report.lines_size() == 3);

  const auto& top = report.lines(0);
  assert(top.rank() == 1 && top.horse_name() == "fast");
  assert(top.has_driver_name() && top.driver_name() == "ace");
  assert(!top.has_trainer_name());
  assert(Near(top.fused_mu(), 0.7 * 1100.0 + 0.3 * 1200.0));
  assert(Near(top.horse_mu(), 1100.0));
  assert(Near(top.driver_mu(), 1200.0));

  assert(report.lines(1).horse_name() == "unknown" && Near(report.lines(1).fused_mu(), 1000.0));
  assert(report.lines(2).horse_name() == "slow" && report.lines(2).rank() == 3);

  double total = 0.0;
  for (const auto& line : report.lines()) total += line.win_probability();
  assert(Near(total, 1.0, 1e-12));
}

void TestDecayAppliedAsOfRaceDate() {
  auto repository = std::make_shared<gaitrank::db::memory::MemoryRepository>();
  auto app        = gaitrank::factory::Build(gaitrank::config::EngineConfig{}, repository);

  Seed(repository, app.engine, {Discipline::kTrot, EntityClass::kHorse, "retired"}, 1400.0, "2022-01-01");

  const auto report = app.odds_service->Price(Card("2024-05-10", {Entry("retired"), Entry("fresh")}));
  assert(report.lines(0).horse_name() == "fresh");
  assert(Near(report.lines(1).horse_mu(), 700.0));
}

void TestCardNamesAreNormalized() {
  auto repository = std::make_shared<gaitrank::db::memory::MemoryRepository>();
  auto app        = gaitrank::factory::Build(gaitrank::config::EngineConfig{}, repository);

  Seed(repository, app.engine, {Discipline::kTrot, EntityClass::kHorse, "fast lane"}, 1100.0, "2024-05-01");
  Seed(repository, app.engine, {Discipline::kTrot, EntityClass::kDriver, "ace"}, 1200.0, "2024-05-01");

  const auto report = app.odds_service->Price(Card("2024-05-10", {Entry("Fast   Lane", " ACE"), Entry("other"), Entry("FAST LANE")}));
  assert(report.lines_size() == 2);
  assert(report.lines(0).horse_name() == "fast lane");
  assert(report.lines(0).driver_name() == "ace");
  assert(Near(report.lines(0).horse_mu(), 1100.0));
  assert(Near(report.lines(0).driver_mu(), 1200.0));
}

void TestReportCarriesRecentForm() {
  auto repository = std::make_shared<gaitrank::db::memory::MemoryRepository>();
  auto app        = gaitrank::factory::Build(gaitrank::config::EngineConfig{}, repository);

  auto race = Card("2024-05-01", {Entry("a", "d1", "t1"), Entry("b", "d2", "t2")});
  race.starters[0].finish.position = 1;
  race.starters[1].finish.position = 2;
  (void)app.ingest_service->IngestRace(race);

  const auto report = app.odds_service->Price(Card("2024-05-20", {Entry("a", "d1", "t1"), Entry("b", "d2")}));
  const auto& a     = report.lines(0);
  assert(a.horse_name() == "a");
  assert(a.horse_form_size() == 1 && a.driver_form_size() == 1 && a.trainer_form_size() == 1);
  assert(a.horse_form(0).race_date() == "2024-05-01");
  assert(a.horse_form(0).finish() == "1");
  assert(a.driver_form(0).horse_name() == "a");
  assert(report.lines(1).trainer_form_size() == 0);
}

void TestEmptyCardRejected() {
  auto app = gaitrank::factory::Build(gaitrank::config::EngineConfig{}, std::make_shared<gaitrank::db::memory::MemoryRepository>());

  auto scratched      = Entry("scratched");
  scratched.scratched = true;

  bool threw = false;
  try {
    (void)app.odds_service->Price(Card("2024-05-10", {scratched}));
  } catch (const gaitrank::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestPriceCard() {
  auto app = gaitrank::factory::Build(gaitrank::config::EngineConfig{}, std::make_shared<gaitrank::db::memory::MemoryRepository>());

  const auto set = app.odds_service->PriceCard({Card("2024-05-10", {Entry("a"), Entry("b")}), Card("2024-05-10", {Entry("c")})});
  assert(set.reports_size() == 2);
  assert(Near(set.reports(0).lines(0).win_probability(), 0.5));
  assert(Near(set.reports(1).lines(0).decimal_odds(), 1.0));
}

} // namespace

int main() {
  TestPricesFieldWithFusion();
  TestDecayAppliedAsOfRaceDate();
  TestCardNamesAreNormalized();
  TestReportCarriesRecentForm();
  TestEmptyCardRejected();
  TestPriceCard();

  std::cout << "gaitrank_unit_odds_service: pass\n";
  return 0;
}
