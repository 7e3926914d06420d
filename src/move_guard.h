// move_guard.h
#pragma once
#include "rule_index.h"
#include "schedule_state.h"

namespace rostra {

// True when writing v into (s, d) leaves every constraint kind that outranks
// mover_priority (smaller priority number) no worse around that cell.
// Locked cells and ineligible values are never admissible.
bool admissible(const ScheduleState& state, const RuleIndex& index, int s, int d, ShiftValue v,
                int mover_priority);

// admissible() then write. Returns whether the cell now holds v.
bool guarded_set(ScheduleState& state, const RuleIndex& index, int s, int d, ShiftValue v,
                 int mover_priority);

} // namespace rostra
