#pragma once

namespace gaitrank::rating {

// Gaussian skill estimate. sigma > 0.
struct Belief {
  double mu    = 0.0;
  double sigma = 0.0;
};

} // namespace gaitrank::rating
