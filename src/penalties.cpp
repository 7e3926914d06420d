// penalties.cpp
#include "penalties.h"
#include "priority_rules.h"

namespace rostra {

long long penalty_score(const std::vector<Violation>& violations, const PenaltyWeights& W) {
  long long c = 0;
  for (const auto& v : violations)
    c += static_cast<long long>(v.weight) * v.magnitude * severity_factor(v.severity, W);
  return c;
}

FairnessMetrics compute_metrics(const Schedule& schedule, const RuleIndex& index,
                                const std::vector<Violation>& violations, const PenaltyWeights& W) {
  FairnessMetrics m;
  const int S = schedule.staff_count();
  const int D = schedule.day_count();

  m.off_days_per_staff.assign(S, 0);
  for (int s = 0; s < S; ++s)
    for (int d = 0; d < D; ++d)
      if (schedule.at(s, d) == ShiftValue::Off) m.off_days_per_staff[s] += 1;

  if (S > 0) {
    double sum = 0.0;
    for (int x : m.off_days_per_staff) sum += x;
    m.off_day_mean = sum / S;
    double var = 0.0;
    for (int x : m.off_days_per_staff) var += (x - m.off_day_mean) * (x - m.off_day_mean);
    m.off_day_variance = var / S;
  }
  m.off_day_target = index.off_target(schedule);

  for (int s = 0; s < S; ++s)
    for (int d = 0; d < D; ++d) {
      if (index.locks().is_locked(s, d)) continue;
      const int pref = effective_preference(index, s, d);
      if (pref < 0) continue;
      ++m.preferred_applicable;
      if (schedule.at(s, d) == index.priorities()[pref].shift) ++m.preferred_honored;
    }
  if (m.preferred_applicable > 0)
    m.preferred_honor_rate = static_cast<double>(m.preferred_honored) / m.preferred_applicable;

  m.penalty_score = penalty_score(violations, W);
  return m;
}

} // namespace rostra
