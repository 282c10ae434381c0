#include "rating_store.hpp"

#include <algorithm>
#include <cmath>

#include "internal/db/api/db_error.hpp"
#include "internal/util/errors.hpp"

namespace gaitrank::rating {

RatingStore::RatingStore(std::shared_ptr<db::Repository> repository, const config::EngineConfig& config)
    : repository_(std::move(repository)), decay_(config.decay), default_mu_(config.trueskill.mu), default_sigma_(config.trueskill.sigma) {
}

EffectiveBelief RatingStore::Effective(const db::model::BeliefRecord& record, util::TimePoint as_of) const {
  EffectiveBelief out;
  out.key           = model::EntityKey{record.discipline, record.entity_class, record.name};
  out.stored_mu     = record.mu;
  out.last_active   = util::FromUnixSeconds(record.last_active_s);
  out.last_venue    = record.last_venue;
  out.days_inactive = util::DaysBetween(out.last_active, as_of);
  out.belief        = Belief{decay_.Apply(record.mu, out.days_inactive), record.sigma};
  return out;
}

std::optional<EffectiveBelief> RatingStore::Read(db::Transaction& tx, const model::EntityKey& key, util::TimePoint as_of) const {
  auto record = repository_->GetBelief(tx, key);
  if (!record) return std::nullopt;
  return Effective(*record, as_of);
}

Belief RatingStore::ReadOrDefault(db::Transaction& tx, const model::EntityKey& key, util::TimePoint as_of) const {
  auto effective = Read(tx, key, as_of);
  return effective ? effective->belief : Default();
}

void RatingStore::Write(db::Transaction& tx, const model::EntityKey& key, const Belief& belief, util::TimePoint active,
                        const std::string& venue) {
  if (!std::isfinite(belief.mu) || !std::isfinite(belief.sigma) || belief.sigma <= 0.0) {
    throw util::InvalidState("refusing to store invalid belief for " + model::ToString(key));
  }

  db::model::BeliefRecord record;
  record.discipline    = key.discipline;
  record.entity_class  = key.entity_class;
  record.name          = key.name;
  record.mu            = belief.mu;
  record.sigma         = belief.sigma;
  record.last_active_s = util::ToUnixSeconds(active);
  record.last_venue    = venue;
  db::ThrowIfDbError(repository_->UpsertBelief(tx, record), "write belief " + model::ToString(key));
}

bool RatingStore::Touch(db::Transaction& tx, const model::EntityKey& key, util::TimePoint active, const std::string& venue) {
  auto       record  = repository_->GetBelief(tx, key);
  const bool created = !record.has_value();
  if (created) {
    record               = db::model::BeliefRecord{};
    record->discipline   = key.discipline;
    record->entity_class = key.entity_class;
    record->name         = key.name;
    record->mu           = default_mu_;
    record->sigma        = default_sigma_;
  }
  record->last_active_s = util::ToUnixSeconds(active);
  record->last_venue    = venue;
  db::ThrowIfDbError(repository_->UpsertBelief(tx, *record), "touch belief " + model::ToString(key));
  return created;
}

std::vector<EffectiveBelief> RatingStore::List(db::Transaction& tx, model::Discipline discipline, model::EntityClass entity_class,
                                               util::TimePoint as_of) const {
  std::vector<EffectiveBelief> out;
  for (const auto& record : repository_->ListBeliefs(tx, discipline, entity_class)) {
    out.push_back(Effective(record, as_of));
  }
  std::stable_sort(out.begin(), out.end(), [](const EffectiveBelief& a, const EffectiveBelief& b) { return a.belief.mu > b.belief.mu; });
  return out;
}

} // namespace gaitrank::rating
