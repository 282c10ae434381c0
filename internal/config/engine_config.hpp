#pragma once

#include <cstdint>

#include "config/config.pb.h"

namespace gaitrank::config {

struct DecaySettings {
  int64_t min_days_no_decay = 28;
  int64_t max_days_decay    = 365;
  double  max_decay         = 0.50;
};

struct TrueSkillSettings {
  double   mu                = 1000.0;
  double   sigma             = 333.333;
  double   beta              = 333.333 / 2.0;
  double   tau               = 333.333 / 100.0;
  double   draw_probability  = 0.0;
  double   convergence_delta = 0.0001;
  uint32_t max_iterations    = 10;
};

struct Weights {
  double horse   = 1.0;
  double driver  = 0.0;
  double trainer = 0.0;
};

/*
  Fusion weights keyed by which of driver/trainer are named for a starter.
  Rows must be non-negative and sum to 1.
*/
struct FusionTable {
  Weights both_known{0.8, 0.1, 0.1};
  Weights driver_only{0.7, 0.3, 0.0};
  Weights trainer_only{0.8, 0.0, 0.2};
  Weights neither{1.0, 0.0, 0.0};
};

struct OddsSettings {
  double beta = 166.5;
};

/*
  Validated engine parameters. Built once from RuntimeConfig and handed
  by value to every rating component.
*/
struct EngineConfig {
  DecaySettings     decay;
  TrueSkillSettings trueskill;
  FusionTable       fusion;
  OddsSettings      odds;
};

// Unset fields keep their defaults. Throws util::InvalidArgument when a value is out of range.
EngineConfig BuildEngineConfig(const gaitrank::runtime::config::RuntimeConfig& config);

void Validate(const EngineConfig& config);

} // namespace gaitrank::config
