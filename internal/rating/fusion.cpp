#include "fusion.hpp"

namespace gaitrank::rating {

RatingFusion::RatingFusion(config::FusionTable table, Belief default_belief) : table_(table), default_belief_(default_belief) {
}

const config::Weights& RatingFusion::WeightsFor(bool driver_known, bool trainer_known) const {
  if (driver_known && trainer_known) return table_.both_known;
  if (driver_known) return table_.driver_only;
  if (trainer_known) return table_.trainer_only;
  return table_.neither;
}

FusedBelief RatingFusion::Fuse(const Belief& horse, const std::optional<Belief>& driver, const std::optional<Belief>& trainer) const {
  const auto&   w = WeightsFor(driver.has_value(), trainer.has_value());
  const Belief& d = driver ? *driver : default_belief_;
  const Belief& t = trainer ? *trainer : default_belief_;

  FusedBelief out;
  out.weights = w;
  out.fused.mu    = w.horse * horse.mu + w.driver * d.mu + w.trainer * t.mu;
  out.fused.sigma = w.horse * horse.sigma + w.driver * d.sigma + w.trainer * t.sigma;
  return out;
}

} // namespace gaitrank::rating
