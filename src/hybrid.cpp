// hybrid.cpp
#include "hybrid.h"

namespace rostra {

const char* band_name(ConfidenceBand b) {
  switch (b) {
    case ConfidenceBand::High:        return "high";
    case ConfidenceBand::Medium:      return "medium";
    case ConfidenceBand::Low:         return "low";
    case ConfidenceBand::Unavailable: return "unavailable";
  }
  return "unavailable";
}

const char* method_name(GenerationMethod m) {
  switch (m) {
    case GenerationMethod::PredictorDirect: return "predictor_direct";
    case GenerationMethod::Hybrid:          return "hybrid";
    case GenerationMethod::RuleOnly:        return "rule_only";
  }
  return "rule_only";
}

ConfidenceBand band_for(double confidence, const EngineOptions& opt) {
  if (confidence >= opt.high_confidence) return ConfidenceBand::High;
  if (confidence >= opt.medium_confidence) return ConfidenceBand::Medium;
  return ConfidenceBand::Low;
}

HybridDecision decide(const PredictionOutcome& outcome, const std::vector<Staff>& roster,
                      const Horizon& horizon, const EngineOptions& opt) {
  HybridDecision h;
  const int S = static_cast<int>(roster.size());
  const int D = horizon.size();
  h.seed = Schedule(S, D, ShiftValue::Normal);

  if (!outcome.available()) {
    h.band = ConfidenceBand::Unavailable;
    h.method = GenerationMethod::RuleOnly;
    return h;
  }

  const Prediction& pr = *outcome.prediction;
  h.confidence = pr.confidence;
  h.band = band_for(pr.confidence, opt);
  if (h.band == ConfidenceBand::Low) {
    h.method = GenerationMethod::RuleOnly;
    return h;
  }
  h.method = h.band == ConfidenceBand::High ? GenerationMethod::PredictorDirect : GenerationMethod::Hybrid;

  for (int s = 0; s < S; ++s)
    for (int d = 0; d < D; ++d) {
      auto it = pr.per_cell.find(DateCell{roster[s].id, horizon.dates[d]});
      if (it == pr.per_cell.end()) continue;
      h.seed.set(s, d, it->second.argmax());
      ++h.predicted_cells;
    }
  return h;
}

} // namespace rostra
