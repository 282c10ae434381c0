#include "internal/history/history_reader.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>

#include "internal/db/memory/memory_repository.hpp"

namespace {

using gaitrank::history::HistoryReader;
using gaitrank::model::Discipline;
using gaitrank::model::EntityClass;
using gaitrank::model::EntityKey;

bool Near(double a, double b) {
  return std::fabs(a - b) <= 1e-9;
}

void Append(gaitrank::db::Repository& repository, gaitrank::db::Transaction& tx, const EntityKey& key, const char* date, double mu) {
  gaitrank::db::model::HistoryRecord record;
  record.discipline   = key.discipline;
  record.entity_class = key.entity_class;
  record.name         = key.name;
  record.mu           = mu;
  record.sigma        = 200.0;
  record.race_date_s  = gaitrank::util::ToUnixSeconds(gaitrank::util::ParseDate(date));
  record.venue        = "saratoga";
  record.finish       = "1";
  const auto result = repository.AppendHistory(tx, record);
  assert(result);
}

void TestRecentFormNewestFirstWithDeltas() {
  auto            repository = std::make_shared<gaitrank::db::memory::MemoryRepository>();
  HistoryReader   reader(repository);
  const EntityKey key{Discipline::kTrot, EntityClass::kHorse, "alpha"};

  auto tx = repository->Begin();
  Append(*repository, *tx, key, "2024-01-01", 1100.0);
  Append(*repository, *tx, key, "2024-02-01", 1150.0);
  Append(*repository, *tx, key, "2024-03-01", 1120.0);
  Append(*repository, *tx, key, "2024-04-01", 1180.0);
  Append(*repository, *tx, {Discipline::kTrot, EntityClass::kHorse, "other"}, "2024-04-01", 900.0);

  const auto form = reader.RecentForm(*tx, key, 3);
  assert(form.size() == 3);
  assert(gaitrank::util::FormatDate(form[0].race_date) == "2024-04-01");
  assert(Near(form[0].mu_delta, 60.0));
  assert(Near(form[1].mu_delta, -30.0));
  // oldest shown row still has a baseline
  assert(Near(form[2].mu_delta, 50.0));

  const auto all = reader.RecentForm(*tx, key, 10);
  assert(all.size() == 4);
  assert(all[3].mu_delta == 0.0);

  assert(reader.RecentForm(*tx, key, 0).empty());
}

void TestSameDayKeepsAppendOrder() {
  auto            repository = std::make_shared<gaitrank::db::memory::MemoryRepository>();
  HistoryReader   reader(repository);
  const EntityKey key{Discipline::kPace, EntityClass::kDriver, "d1"};

  auto tx = repository->Begin();
  Append(*repository, *tx, key, "2024-05-01", 1010.0);
  Append(*repository, *tx, key, "2024-05-01", 1030.0);

  const auto form = reader.RecentForm(*tx, key, HistoryReader::DefaultLimit(EntityClass::kDriver));
  assert(form.size() == 2);
  assert(form[0].mu == 1030.0);
  assert(Near(form[0].mu_delta, 20.0));
}

void TestDefaultLimits() {
  assert(HistoryReader::DefaultLimit(EntityClass::kHorse) == 5);
  assert(HistoryReader::DefaultLimit(EntityClass::kDriver) == 3);
  assert(HistoryReader::DefaultLimit(EntityClass::kTrainer) == 3);
}

} // namespace

int main() {
  TestRecentFormNewestFirstWithDeltas();
  TestSameDayKeepsAppendOrder();
  TestDefaultLimits();

  std::cout << "gaitrank_unit_history_reader: pass\n";
  return 0;
}
