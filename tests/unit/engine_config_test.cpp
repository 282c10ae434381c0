#include "internal/config/engine_config.hpp"

#include <cassert>
#include <cmath>
#include <functional>
#include <iostream>

#include "internal/util/errors.hpp"

namespace {

using gaitrank::config::BuildEngineConfig;
using gaitrank::runtime::config::RuntimeConfig;

bool Near(double a, double b) {
  return std::fabs(a - b) <= 1e-9;
}

bool Rejects(const std::function<void(RuntimeConfig&)>& mutate) {
  RuntimeConfig config;
  mutate(config);
  try {
    (void)BuildEngineConfig(config);
  } catch (const gaitrank::util::InvalidArgument&) {
    return true;
  }
  return false;
}

void TestDefaults() {
  const auto engine = BuildEngineConfig(RuntimeConfig{});

  assert(engine.trueskill.mu == 1000.0);
  assert(Near(engine.trueskill.sigma, 333.333));
  assert(Near(engine.trueskill.beta, 333.333 / 2.0));
  assert(Near(engine.trueskill.tau, 333.333 / 100.0));
  assert(engine.trueskill.draw_probability == 0.0);
  assert(engine.decay.min_days_no_decay == 28);
  assert(engine.decay.max_days_decay == 365);
  assert(engine.decay.max_decay == 0.5);
  assert(Near(engine.fusion.both_known.horse, 0.8));
  assert(Near(engine.fusion.driver_only.driver, 0.3));
  assert(Near(engine.fusion.trainer_only.trainer, 0.2));
  assert(engine.fusion.neither.horse == 1.0);
  assert(engine.odds.beta == 166.5);
}

void TestSigmaDrivesBetaAndTau() {
  RuntimeConfig config;
  config.mutable_rating()->set_default_sigma(100.0);
  auto engine = BuildEngineConfig(config);
  assert(Near(engine.trueskill.beta, 50.0));
  assert(Near(engine.trueskill.tau, 1.0));

  config.mutable_rating()->set_beta(70.0);
  engine = BuildEngineConfig(config);
  assert(Near(engine.trueskill.beta, 70.0));
  assert(Near(engine.trueskill.tau, 1.0));
}

void TestOverrides() {
  RuntimeConfig config;
  config.mutable_decay()->set_max_decay(0.25);
  config.mutable_odds()->set_beta(200.0);
  auto* row = config.mutable_fusion()->mutable_both_known();
  row->set_horse(0.6);
  row->set_driver(0.25);
  row->set_trainer(0.15);

  const auto engine = BuildEngineConfig(config);
  assert(engine.decay.max_decay == 0.25);
  assert(engine.odds.beta == 200.0);
  assert(Near(engine.fusion.both_known.driver, 0.25));
  assert(Near(engine.fusion.neither.horse, 1.0));
}

void TestValidation() {
  assert(Rejects([](RuntimeConfig& c) { c.mutable_rating()->set_default_sigma(0.0); }));
  assert(Rejects([](RuntimeConfig& c) { c.mutable_rating()->set_beta(-1.0); }));
  assert(Rejects([](RuntimeConfig& c) { c.mutable_rating()->set_draw_probability(1.0); }));
  assert(Rejects([](RuntimeConfig& c) { c.mutable_rating()->set_max_iterations(0); }));
  assert(Rejects([](RuntimeConfig& c) {
    c.mutable_decay()->set_min_days_no_decay(100);
    c.mutable_decay()->set_max_days_decay(50);
  }));
  assert(Rejects([](RuntimeConfig& c) { c.mutable_decay()->set_max_decay(1.5); }));
  assert(Rejects([](RuntimeConfig& c) { c.mutable_odds()->set_beta(0.0); }));
  assert(Rejects([](RuntimeConfig& c) {
    auto* row = c.mutable_fusion()->mutable_driver_only();
    row->set_horse(0.5);
    row->set_driver(0.4);
  }));
  assert(Rejects([](RuntimeConfig& c) {
    auto* row = c.mutable_fusion()->mutable_neither();
    row->set_horse(1.2);
    row->set_trainer(-0.2);
  }));
  assert(!Rejects([](RuntimeConfig& c) { c.mutable_rating()->set_draw_probability(0.1); }));
}

} // namespace

int main() {
  TestDefaults();
  TestSigmaDrivesBetaAndTau();
  TestOverrides();
  TestValidation();

  std::cout << "gaitrank_unit_engine_config: pass\n";
  return 0;
}
