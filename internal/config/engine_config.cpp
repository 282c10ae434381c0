#include "engine_config.hpp"

#include <cmath>
#include <string>

#include "internal/util/errors.hpp"

namespace gaitrank::config {

namespace {

void RequirePositive(double value, const char* name) {
  if (!std::isfinite(value) || value <= 0.0) {
    throw util::InvalidArgument(std::string(name) + " must be a positive number");
  }
}

void ValidateWeights(const Weights& w, const char* row) {
  const bool non_negative = w.horse >= 0.0 && w.driver >= 0.0 && w.trainer >= 0.0;
  if (!non_negative || std::fabs(w.horse + w.driver + w.trainer - 1.0) > 1e-9) {
    throw util::InvalidArgument(std::string("fusion.") + row + " weights must be non-negative and sum to 1");
  }
}

Weights FromProto(const gaitrank::runtime::config::FusionWeights& w) {
  return Weights{w.horse(), w.driver(), w.trainer()};
}

} // namespace

EngineConfig BuildEngineConfig(const gaitrank::runtime::config::RuntimeConfig& config) {
  EngineConfig out;

  const auto& rating = config.rating();
  if (rating.has_default_mu()) out.trueskill.mu = rating.default_mu();
  if (rating.has_default_sigma()) {
    // beta and tau follow sigma unless set explicitly
    out.trueskill.sigma = rating.default_sigma();
    out.trueskill.beta  = out.trueskill.sigma / 2.0;
    out.trueskill.tau   = out.trueskill.sigma / 100.0;
  }
  if (rating.has_beta()) out.trueskill.beta = rating.beta();
  if (rating.has_tau()) out.trueskill.tau = rating.tau();
  if (rating.has_draw_probability()) out.trueskill.draw_probability = rating.draw_probability();
  if (rating.has_convergence_delta()) out.trueskill.convergence_delta = rating.convergence_delta();
  if (rating.has_max_iterations()) out.trueskill.max_iterations = rating.max_iterations();

  const auto& decay = config.decay();
  if (decay.has_min_days_no_decay()) out.decay.min_days_no_decay = decay.min_days_no_decay();
  if (decay.has_max_days_decay()) out.decay.max_days_decay = decay.max_days_decay();
  if (decay.has_max_decay()) out.decay.max_decay = decay.max_decay();

  const auto& fusion = config.fusion();
  if (fusion.has_both_known()) out.fusion.both_known = FromProto(fusion.both_known());
  if (fusion.has_driver_only()) out.fusion.driver_only = FromProto(fusion.driver_only());
  if (fusion.has_trainer_only()) out.fusion.trainer_only = FromProto(fusion.trainer_only());
  if (fusion.has_neither()) out.fusion.neither = FromProto(fusion.neither());

  if (config.odds().has_beta()) out.odds.beta = config.odds().beta();

  Validate(out);
  return out;
}

void Validate(const EngineConfig& config) {
  RequirePositive(config.trueskill.sigma, "rating.default_sigma");
  RequirePositive(config.trueskill.beta, "rating.beta");
  RequirePositive(config.trueskill.convergence_delta, "rating.convergence_delta");
  if (!std::isfinite(config.trueskill.mu)) throw util::InvalidArgument("rating.default_mu must be finite");
  if (!std::isfinite(config.trueskill.tau) || config.trueskill.tau < 0.0) throw util::InvalidArgument("rating.tau must be >= 0");
  if (!(config.trueskill.draw_probability >= 0.0 && config.trueskill.draw_probability < 1.0)) {
    throw util::InvalidArgument("rating.draw_probability must be in [0, 1)");
  }
  if (config.trueskill.max_iterations == 0) throw util::InvalidArgument("rating.max_iterations must be >= 1");

  if (config.decay.min_days_no_decay < 0 || config.decay.max_days_decay < config.decay.min_days_no_decay) {
    throw util::InvalidArgument("decay.max_days_decay must be >= decay.min_days_no_decay >= 0");
  }
  if (!(config.decay.max_decay >= 0.0 && config.decay.max_decay <= 1.0)) {
    throw util::InvalidArgument("decay.max_decay must be in [0, 1]");
  }

  ValidateWeights(config.fusion.both_known, "both_known");
  ValidateWeights(config.fusion.driver_only, "driver_only");
  ValidateWeights(config.fusion.trainer_only, "trainer_only");
  ValidateWeights(config.fusion.neither, "neither");

  RequirePositive(config.odds.beta, "odds.beta");
}

} // namespace gaitrank::config
