#pragma once

#include <vector>

#include "internal/config/engine_config.hpp"
#include "internal/rating/belief.hpp"

namespace gaitrank::rating {

/*
  TrueSkill for one-member teams.

  Builds the factor graph for one race (prior -> performance -> pairwise
  performance differences -> truncation) and runs expectation propagation
  along the difference chain until the largest message change drops to
  convergence_delta or max_iterations is reached.

  Ranks follow finishing order: lower is better, equal ranks are a draw.
  With draw_probability == 0 the draw margin is 0 and a draw cannot be
  represented; Rate() then throws util::RatingUpdateError.
*/
class TrueSkill {
 public:
  explicit TrueSkill(config::TrueSkillSettings settings);

  // priors[i] finished with ranks[i]. Returns posteriors in input order.
  // Throws util::InvalidArgument for fewer than two competitors or mismatched sizes.
  std::vector<Belief> Rate(const std::vector<Belief>& priors, const std::vector<int>& ranks) const;

  const config::TrueSkillSettings& Settings() const {
    return settings_;
  }

 private:
  double DrawMargin() const;

  config::TrueSkillSettings settings_;
};

} // namespace gaitrank::rating
