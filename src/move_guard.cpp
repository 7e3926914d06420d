// move_guard.cpp
#include "move_guard.h"
#include "validation.h"

namespace rostra {

bool admissible(const ScheduleState& state, const RuleIndex& index, int s, int d, ShiftValue v,
                int mover_priority) {
  if (state.locks().is_locked(s, d)) return false;
  if (!index.roster()[s].eligible(v)) return false;
  if (state.at(s, d) == v) return true;

  const Focus focus{s, d};
  const KindTotals before = totals_by_kind(validate_focus(state.schedule(), index, focus));
  Schedule trial = state.schedule();
  trial.set(s, d, v);
  const KindTotals after = totals_by_kind(validate_focus(trial, index, focus));

  for (const auto& k : PriorityRegistry::all()) {
    if (k.priority >= mover_priority) break;   // catalog is in priority order
    const size_t i = static_cast<size_t>(k.kind);
    if (after[i] > before[i]) return false;
  }
  return true;
}

bool guarded_set(ScheduleState& state, const RuleIndex& index, int s, int d, ShiftValue v,
                 int mover_priority) {
  if (!admissible(state, index, s, d, v, mover_priority)) return false;
  return state.set(s, d, v);
}

} // namespace rostra
