// priority_rules.h
#pragma once
#include <optional>
#include <random>
#include <vector>

#include "rule_index.h"

namespace rostra {

// Precedence on one cell: AllowOnlyShifts > Avoid(WithExceptions) > PreferredShift > RequiredOff.
// A preference the stronger rules forbid is superseded, not violated.

// Eligible, inside every AllowOnly list and avoided by no Avoid rule.
bool permitted(const RuleIndex& index, int s, int d, ShiftValue v);

// Permitted values in fallback order (first AllowOnly list order, else Normal, Late, Early, Off).
std::vector<ShiftValue> permitted_values(const RuleIndex& index, int s, int d);

// Winning PreferredShift rule for the cell (index into priorities()), or -1.
// Highest priority level first, then declaration order; only permitted shifts compete.
int effective_preference(const RuleIndex& index, int s, int d);

// A RequiredOff rule applies, no preference is effective, and Off is permitted.
bool required_off_effective(const RuleIndex& index, int s, int d);

bool is_compliant(const RuleIndex& index, int s, int d, ShiftValue v);

struct CellResolution {
  ShiftValue value = ShiftValue::Normal;
  ConstraintKind kind = ConstraintKind::PriorityPreferred;   // strongest rule the change satisfies
  int rule = -1;                                             // deciding priority rule, -1 for eligibility
};

// Compliant target value for a non-compliant cell, nullopt when already compliant.
// AvoidShiftWithExceptions picks uniformly among its permitted exceptions with rng.
std::optional<CellResolution> resolve_cell(const RuleIndex& index, int s, int d, ShiftValue current,
                                           std::mt19937_64& rng);

} // namespace rostra
