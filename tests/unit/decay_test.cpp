#include "internal/rating/decay.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

namespace {

using gaitrank::config::DecaySettings;
using gaitrank::rating::DecayPolicy;

bool Near(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) <= eps;
}

void TestNoDecayInsideGracePeriod() {
  DecayPolicy decay(DecaySettings{});
  assert(decay.Apply(1000.0, 0) == 1000.0);
  assert(decay.Apply(1000.0, 28) == 1000.0);
  assert(decay.Apply(1000.0, -3) == 1000.0);
}

void TestFirstDayAfterGracePeriod() {
  DecayPolicy decay(DecaySettings{});
  const double expected = 1000.0 * (1.0 - std::log(2.0) / std::log(338.0) * 0.5);
  assert(Near(decay.Apply(1000.0, 29), expected));
  assert(decay.Apply(1000.0, 29) < 1000.0);
}

void TestFullDecayAtAndBeyondCap() {
  DecayPolicy decay(DecaySettings{});
  assert(Near(decay.Apply(1000.0, 365), 500.0));
  assert(Near(decay.Apply(1000.0, 5000), 500.0));
}

void TestDecayIsMonotonic() {
  DecayPolicy decay(DecaySettings{});
  double previous = decay.Apply(1200.0, 28);
  for (int64_t days = 29; days <= 400; ++days) {
    const double current = decay.Apply(1200.0, days);
    assert(current <= previous);
    previous = current;
  }
}

void TestCustomSettings() {
  DecayPolicy decay(DecaySettings{10, 20, 1.0});
  assert(decay.Apply(800.0, 10) == 800.0);
  assert(Near(decay.Apply(800.0, 20), 0.0));

  DecayPolicy disabled(DecaySettings{28, 365, 0.0});
  assert(disabled.Apply(800.0, 300) == 800.0);
}

} // namespace

int main() {
  TestNoDecayInsideGracePeriod();
  TestFirstDayAfterGracePeriod();
  TestFullDecayAtAndBeyondCap();
  TestDecayIsMonotonic();
  TestCustomSettings();

  std::cout << "gaitrank_unit_decay: pass\n";
  return 0;
}
