#include "decay.hpp"

#include <algorithm>
#include <cmath>

namespace gaitrank::rating {

DecayPolicy::DecayPolicy(config::DecaySettings settings) : settings_(settings) {
}

double DecayPolicy::Apply(double mu, int64_t days_inactive) const {
  if (days_inactive <= settings_.min_days_no_decay) return mu;

  const int64_t days  = std::min(days_inactive, settings_.max_days_decay);
  const double  x     = static_cast<double>(days - settings_.min_days_no_decay + 1);
  const double  max_x = static_cast<double>(settings_.max_days_decay - settings_.min_days_no_decay + 1);
  if (max_x <= 1.0) return mu;

  const double ratio = std::log(x) / std::log(max_x);
  return mu * (1.0 - ratio * settings_.max_decay);
}

} // namespace gaitrank::rating
