#include "odds_engine.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "internal/util/errors.hpp"

namespace gaitrank::rating {

OddsEngine::OddsEngine(config::OddsSettings settings) : settings_(settings) {
}

std::vector<OddsResult> OddsEngine::Compute(const std::vector<OddsInput>& field) const {
  if (field.empty()) throw util::InvalidArgument("cannot price a race with no starters");

  double max_mu = -std::numeric_limits<double>::infinity();
  for (const auto& in : field) {
    if (!std::isfinite(in.fused_mu)) throw util::InvalidArgument("non-finite rating for " + in.id);
    max_mu = std::max(max_mu, in.fused_mu);
  }

  std::vector<double> scores;
  scores.reserve(field.size());
  double total = 0.0;
  for (const auto& in : field) {
    scores.push_back(std::exp((in.fused_mu - max_mu) / settings_.beta));
    total += scores.back();
  }

  std::vector<OddsResult> out;
  out.reserve(field.size());
  for (std::size_t i = 0; i < field.size(); ++i) {
    OddsResult r;
    r.id              = field[i].id;
    r.input_index     = i;
    r.fused_mu        = field[i].fused_mu;
    r.win_probability = scores[i] / total;
    r.decimal_odds    = r.win_probability > 0.0 ? 1.0 / r.win_probability : std::numeric_limits<double>::infinity();
    out.push_back(std::move(r));
  }

  std::stable_sort(out.begin(), out.end(), [](const OddsResult& a, const OddsResult& b) { return a.win_probability > b.win_probability; });
  return out;
}

} // namespace gaitrank::rating
