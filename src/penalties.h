// penalties.h
#pragma once
#include <vector>

#include "priority_registry.h"
#include "rule_index.h"
#include "types.h"

namespace rostra {

// Per-violation weight comes from the constraint; these scale it by severity.
struct PenaltyWeights {
  int critical = 10;
  int high = 5;
  int medium = 2;
  int low = 1;
};

inline int severity_factor(Severity s, const PenaltyWeights& W) {
  switch (s) {
    case Severity::Critical: return W.critical;
    case Severity::High:     return W.high;
    case Severity::Medium:   return W.medium;
    case Severity::Low:      return W.low;
  }
  return W.low;
}

long long penalty_score(const std::vector<Violation>& violations, const PenaltyWeights& W = {});

struct FairnessMetrics {
  double off_day_mean = 0.0;
  double off_day_variance = 0.0;       // population variance across staff
  int off_day_target = 0;
  std::vector<int> off_days_per_staff; // roster order
  int preferred_applicable = 0;        // unlocked cells with an effective preference
  int preferred_honored = 0;
  double preferred_honor_rate = 1.0;   // 1.0 when nothing applies
  long long penalty_score = 0;
};

FairnessMetrics compute_metrics(const Schedule& schedule, const RuleIndex& index,
                                const std::vector<Violation>& violations, const PenaltyWeights& W = {});

} // namespace rostra
