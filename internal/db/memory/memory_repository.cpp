#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace gaitrank::db::memory {

namespace {

using gaitrank::model::Discipline;
using gaitrank::model::EntityClass;
using gaitrank::model::EntityKey;

std::string BeliefKey(Discipline discipline, EntityClass entity_class, const std::string& name) {
  return std::to_string(static_cast<int>(discipline)) + "#" + std::to_string(static_cast<int>(entity_class)) + "#" + name;
}

std::string RacePrefix(int64_t race_date_s, const std::string& venue, uint32_t race_number) {
  return std::to_string(race_date_s) + "#" + venue + "#" + std::to_string(race_number) + "#";
}

std::string RaceEntryKey(const model::RaceEntryRecord& r) {
  return RacePrefix(r.race_date_s, r.venue, r.race_number) + r.horse_name;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

std::optional<model::BeliefRecord> MemoryRepository::GetBelief(Transaction& t, const EntityKey& key) {
  const auto& s  = TX(t).View();
  auto        it = s.beliefs.find(BeliefKey(key.discipline, key.entity_class, key.name));
  if (it == s.beliefs.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertBelief(Transaction& t, const model::BeliefRecord& r) {
  if (!(r.sigma > 0.0)) return Result::Err(ErrorCode::ConstraintViolation, "sigma must be positive");
  TX(t).PutBelief(BeliefKey(r.discipline, r.entity_class, r.name), r);
  return Result::Ok();
}

std::vector<model::BeliefRecord> MemoryRepository::ListBeliefs(Transaction& t, Discipline discipline, EntityClass entity_class) {
  std::vector<model::BeliefRecord> out;
  for (const auto& [_, record] : TX(t).View().beliefs) {
    if (record.discipline == discipline && record.entity_class == entity_class) out.push_back(record);
  }
  return out;
}

Result MemoryRepository::AppendHistory(Transaction& t, model::HistoryRecord& r) {
  {
    std::scoped_lock lock(mutex_);
    r.seq = next_history_seq_++;
  }
  TX(t).PutHistory(r);
  return Result::Ok();
}

std::vector<model::HistoryRecord> MemoryRepository::ReadHistory(Transaction& t, const EntityKey& key, std::optional<uint64_t> max_entries) {
  std::vector<model::HistoryRecord> out;
  for (const auto& r : TX(t).View().history) {
    if (r.discipline == key.discipline && r.entity_class == key.entity_class && r.name == key.name) out.push_back(r);
  }

  std::sort(out.begin(), out.end(), [](const model::HistoryRecord& a, const model::HistoryRecord& b) {
    if (a.race_date_s != b.race_date_s) return a.race_date_s > b.race_date_s;
    return a.seq > b.seq;
  });

  if (max_entries && out.size() > *max_entries) out.resize(*max_entries);
  return out;
}

Result MemoryRepository::UpsertRaceEntry(Transaction& t, const model::RaceEntryRecord& r) {
  TX(t).PutRaceEntry(RaceEntryKey(r), r);
  return Result::Ok();
}

std::vector<model::RaceEntryRecord> MemoryRepository::GetRaceEntries(Transaction& t, int64_t race_date_s, const std::string& venue,
                                                                     uint32_t race_number) {
  const auto& s      = TX(t).View();
  const auto  prefix = RacePrefix(race_date_s, venue, race_number);

  std::vector<model::RaceEntryRecord> out;
  for (auto it = s.race_entries.lower_bound(prefix); it != s.race_entries.end() && it->first.starts_with(prefix); ++it) {
    out.push_back(it->second);
  }
  return out;
}

std::optional<int64_t> MemoryRepository::LatestRaceDate(Transaction& t, Discipline discipline) {
  std::optional<int64_t> latest;
  for (const auto& [_, r] : TX(t).View().race_entries) {
    if (r.discipline != discipline) continue;
    if (!latest || r.race_date_s > *latest) latest = r.race_date_s;
  }
  return latest;
}

} // namespace gaitrank::db::memory
