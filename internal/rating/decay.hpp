#pragma once

#include <cstdint>

#include "internal/config/engine_config.hpp"

namespace gaitrank::rating {

/*
  Inactivity decay of a stored mean.

  Up to min_days_no_decay nothing changes. Beyond that the mean shrinks
  logarithmically in the idle days, reaching mu * (1 - max_decay) at
  max_days_decay and staying there. sigma is never decayed.

  Applied when a belief is read; the stored value is left untouched.
*/
class DecayPolicy {
 public:
  explicit DecayPolicy(config::DecaySettings settings);

  double Apply(double mu, int64_t days_inactive) const;

  const config::DecaySettings& Settings() const {
    return settings_;
  }

 private:
  config::DecaySettings settings_;
};

} // namespace gaitrank::rating
