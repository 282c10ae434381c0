#include "internal/rating/fusion.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

namespace {

using gaitrank::config::FusionTable;
using gaitrank::rating::Belief;
using gaitrank::rating::RatingFusion;

bool Near(double a, double b) {
  return std::fabs(a - b) <= 1e-9;
}

const Belief kDefault{1000.0, 333.333};

void TestBothKnownUsesFullRow() {
  RatingFusion fusion(FusionTable{}, kDefault);
  const auto   fused = fusion.Fuse(Belief{1200.0, 100.0}, Belief{1100.0, 150.0}, Belief{900.0, 200.0});

  assert(Near(fused.weights.horse, 0.8) && Near(fused.weights.driver, 0.1) && Near(fused.weights.trainer, 0.1));
  assert(Near(fused.fused.mu, 0.8 * 1200.0 + 0.1 * 1100.0 + 0.1 * 900.0));
  assert(Near(fused.fused.sigma, 0.8 * 100.0 + 0.1 * 150.0 + 0.1 * 200.0));
}

void TestDriverOnly() {
  RatingFusion fusion(FusionTable{}, kDefault);
  const auto   fused = fusion.Fuse(Belief{1200.0, 100.0}, Belief{1100.0, 150.0}, std::nullopt);

  assert(Near(fused.weights.trainer, 0.0));
  assert(Near(fused.fused.mu, 0.7 * 1200.0 + 0.3 * 1100.0));
}

void TestTrainerOnly() {
  RatingFusion fusion(FusionTable{}, kDefault);
  const auto   fused = fusion.Fuse(Belief{1200.0, 100.0}, std::nullopt, Belief{900.0, 200.0});

  assert(Near(fused.weights.driver, 0.0));
  assert(Near(fused.fused.mu, 0.8 * 1200.0 + 0.2 * 900.0));
}

void TestNeitherKnownIsHorseAlone() {
  RatingFusion fusion(FusionTable{}, kDefault);
  const auto   fused = fusion.Fuse(Belief{1234.5, 111.0}, std::nullopt, std::nullopt);

  assert(Near(fused.fused.mu, 1234.5));
  assert(Near(fused.fused.sigma, 111.0));
}

void TestCustomTable() {
  FusionTable table;
  table.both_known = {0.6, 0.25, 0.15};
  RatingFusion fusion(table, kDefault);

  const auto fused = fusion.Fuse(Belief{1000.0, 100.0}, Belief{1400.0, 100.0}, Belief{600.0, 100.0});
  assert(Near(fused.fused.mu, 600.0 + 350.0 + 90.0));
  assert(Near(fusion.WeightsFor(false, false).horse, 1.0));
}

} // namespace

int main() {
  TestBothKnownUsesFullRow();
  TestDriverOnly();
  TestTrainerOnly();
  TestNeitherKnownIsHorseAlone();
  TestCustomTable();

  std::cout << "gaitrank_unit_fusion: pass\n";
  return 0;
}
