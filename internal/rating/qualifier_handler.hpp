#pragma once

#include <cstddef>
#include <memory>

#include "internal/model/race.hpp"
#include "internal/rating/rating_store.hpp"

namespace gaitrank::rating {

struct QualifierOutcome {
  std::size_t touched = 0;
  std::size_t created = 0;
};

/*
  Qualifier races prove fitness but are not rated: every non-scratched
  horse, driver and trainer gets last_active/last_venue refreshed (which
  resets its decay clock) and unseen entities are created at the default
  belief. mu and sigma never change and no history is written.
*/
class QualifierHandler {
 public:
  explicit QualifierHandler(std::shared_ptr<RatingStore> store);

  QualifierOutcome Apply(db::Transaction& tx, const model::Race& race);

 private:
  std::shared_ptr<RatingStore> store_;
};

} // namespace gaitrank::rating
