// repair.h
#pragma once
#include <string>
#include <vector>

#include "priority_registry.h"
#include "rule_index.h"
#include "schedule_state.h"

namespace rostra {

struct RepairOptions {
  int max_passes = 5;
  int tier_limit = 3;                 // violations above this tier are left alone
  bool use_solver = true;             // CP-SAT fallback for Tier-1 leftovers
  double solver_time_limit_seconds = 10.0;
  bool verbose = false;
};

struct RepairAction {
  std::string constraint_id;          // violation that motivated the change
  ConstraintKind kind = ConstraintKind::FairDistribution;
  CellRef cell;
  ShiftValue from = ShiftValue::Normal;
  ShiftValue to = ShiftValue::Normal;
  int pass = 0;                       // 0 for the solver
};

struct RepairSummary {
  int attempted = 0;                  // distinct violations a fix was searched for
  int repaired = 0;                   // of those, gone at the end
  int passes = 0;
  bool solver_used = false;
  bool solver_improved = false;
  std::string solver_status;
  std::vector<RepairAction> actions;
  std::vector<Violation> unresolved;  // what validation still reports, sorted
};

// Consumes violations in precedence order and applies the smallest safe single-cell
// change for each. A change is kept only if it removes or shrinks the target and
// creates or worsens nothing of equal or higher precedence and nothing in Tier 1.
// Locked cells are never written. Unfixable soft violations end up in `unresolved`.
class RepairEngine {
 public:
  RepairEngine(const RuleIndex& index, RepairOptions opt) : index_(index), opt_(opt) {}

  // Throws InvariantViolation when the schedule arrives with a broken lock.
  RepairSummary repair(ScheduleState& state) const;

 private:
  // Greedy passes; returns the violation set after the last accepted change.
  std::vector<Violation> greedy(ScheduleState& state, std::vector<Violation> current,
                                RepairSummary& summary, std::vector<std::string>& attempted) const;

  const RuleIndex& index_;
  RepairOptions opt_;
};

} // namespace rostra
