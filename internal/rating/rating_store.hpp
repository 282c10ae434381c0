#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/engine_config.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/entity.hpp"
#include "internal/rating/belief.hpp"
#include "internal/rating/decay.hpp"
#include "internal/util/time.hpp"

namespace gaitrank::rating {

// A stored belief with decay applied as of some date.
struct EffectiveBelief {
  model::EntityKey           key;
  Belief                     belief;        // mu decayed, sigma as stored
  double                     stored_mu = 0.0;
  util::TimePoint            last_active;
  std::optional<std::string> last_venue;
  int64_t                    days_inactive = 0;
};

/*
  RatingStore

  Typed access to persisted beliefs. Reads apply inactivity decay as of
  the caller's date and never write; the stored mean only changes through
  Write(). New entities start at (default mu, default sigma).
*/
class RatingStore {
 public:
  RatingStore(std::shared_ptr<db::Repository> repository, const config::EngineConfig& config);

  Belief Default() const {
    return Belief{default_mu_, default_sigma_};
  }

  // Decayed belief, or nullopt when the entity was never seen.
  std::optional<EffectiveBelief> Read(db::Transaction& tx, const model::EntityKey& key, util::TimePoint as_of) const;

  // Decayed belief, or the default for an unseen entity. Nothing is written.
  Belief ReadOrDefault(db::Transaction& tx, const model::EntityKey& key, util::TimePoint as_of) const;

  // Replaces mu/sigma and the recency fields. Throws util::InvalidState when sigma is not positive.
  void Write(db::Transaction& tx, const model::EntityKey& key, const Belief& belief, util::TimePoint active, const std::string& venue);

  // Refreshes last_active/last_venue only, creating a default belief for an unseen entity.
  // Returns true when the entity was created.
  bool Touch(db::Transaction& tx, const model::EntityKey& key, util::TimePoint active, const std::string& venue);

  // All beliefs of one class, decayed as of `as_of`, highest mean first.
  std::vector<EffectiveBelief> List(db::Transaction& tx, model::Discipline discipline, model::EntityClass entity_class,
                                    util::TimePoint as_of) const;

 private:
  EffectiveBelief Effective(const db::model::BeliefRecord& record, util::TimePoint as_of) const;

  std::shared_ptr<db::Repository> repository_;
  DecayPolicy                     decay_;
  double                          default_mu_;
  double                          default_sigma_;
};

} // namespace gaitrank::rating
