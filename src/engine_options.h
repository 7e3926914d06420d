// engine_options.h
#pragma once
#include <cstdint>

namespace rostra {

// Per-engine tuning. JSON keys in upper case (see options_from_json):
// {"HIGH_CONFIDENCE", 0.8}, {"MEDIUM_CONFIDENCE", 0.6}, {"PREDICTOR_TIMEOUT_MS", 2000},
// {"MAX_FIXED_POINT_ITERATIONS", 8}, {"MAX_PIPELINE_PASSES", 3}, {"MAX_REPAIR_PASSES", 5},
// {"USE_SOLVER_REPAIR", true}, {"SOLVER_TIME_LIMIT_SECONDS", 10}, {"DEFAULT_RNG_SEED", 42},
// {"VERBOSE", false}
struct EngineOptions {
  double high_confidence = 0.8;
  double medium_confidence = 0.6;
  int predictor_timeout_ms = 2000;
  int max_fixed_point_iterations = 8;
  int max_pipeline_passes = 3;
  int max_repair_passes = 5;
  bool use_solver_repair = true;
  double solver_time_limit_seconds = 10.0;
  std::uint64_t default_rng_seed = 42;
  bool verbose = false;
};

} // namespace rostra
