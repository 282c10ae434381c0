#pragma once

#include <optional>

#include "internal/config/engine_config.hpp"
#include "internal/rating/belief.hpp"

namespace gaitrank::rating {

struct FusedBelief {
  Belief          fused;
  config::Weights weights;
};

/*
  Combines horse, driver and trainer beliefs into one rating per starter.

  The weight row is picked by which of driver/trainer are named. A
  missing driver or trainer contributes the default belief at weight 0,
  so it never moves the result.
*/
class RatingFusion {
 public:
  RatingFusion(config::FusionTable table, Belief default_belief);

  FusedBelief Fuse(const Belief& horse, const std::optional<Belief>& driver, const std::optional<Belief>& trainer) const;

  const config::Weights& WeightsFor(bool driver_known, bool trainer_known) const;

 private:
  config::FusionTable table_;
  Belief              default_belief_;
};

} // namespace gaitrank::rating
