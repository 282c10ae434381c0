#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "internal/config/engine_config.hpp"

namespace gaitrank::rating {

struct OddsInput {
  std::string id;
  double      fused_mu = 0.0;
};

struct OddsResult {
  std::string id;
  std::size_t input_index     = 0;
  double      fused_mu        = 0.0;
  double      win_probability = 0.0;
  double      decimal_odds    = 0.0; // +inf when win_probability underflows to 0
};

/*
  Softmax of fused means with temperature beta, computed relative to the
  largest mean so no exponent overflows. Probabilities sum to 1.
  Results are sorted by descending probability, ties kept in input order.
*/
class OddsEngine {
 public:
  explicit OddsEngine(config::OddsSettings settings);

  // Throws util::InvalidArgument for an empty field.
  std::vector<OddsResult> Compute(const std::vector<OddsInput>& field) const;

 private:
  config::OddsSettings settings_;
};

} // namespace gaitrank::rating
