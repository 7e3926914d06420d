// hybrid.h
#pragma once
#include "engine_options.h"
#include "predictor.h"
#include "types.h"

namespace rostra {

enum class ConfidenceBand { High, Medium, Low, Unavailable };
enum class GenerationMethod { PredictorDirect, Hybrid, RuleOnly };

const char* band_name(ConfidenceBand b);
const char* method_name(GenerationMethod m);

ConfidenceBand band_for(double confidence, const EngineOptions& opt);

struct HybridDecision {
  ConfidenceBand band = ConfidenceBand::Unavailable;
  GenerationMethod method = GenerationMethod::RuleOnly;
  double confidence = 0.0;
  Schedule seed;                     // locks not yet applied
  int predicted_cells = 0;           // cells seeded from the predictor

  bool run_generator() const { return band != ConfidenceBand::High; }
  int repair_tier_limit() const { return band == ConfidenceBand::High ? 1 : 3; }
};

// One band for the whole run. High and Medium seed from the argmax of each
// predicted cell (Normal where the predictor is silent); Low and Unavailable
// discard the prediction and seed Normal everywhere.
HybridDecision decide(const PredictionOutcome& outcome, const std::vector<Staff>& roster,
                      const Horizon& horizon, const EngineOptions& opt);

} // namespace rostra
