// repair_solver.h
#pragma once
#include <string>

#include "rule_index.h"
#include "types.h"

namespace rostra {

struct SolverRepairParams {
  double time_limit_seconds = 10.0;
  bool log_search = false;
};

struct SolverRepairResult {
  bool feasible = false;
  bool optimal = false;
  std::string status;
  int cells_changed = 0;
  Schedule schedule;      // equals the input when infeasible
};

// Closest schedule (fewest changed cells) that satisfies every Tier-1 constraint,
// with locks and eligibility fixed. Single deterministic worker.
SolverRepairResult solve_minimal_change(const Schedule& current, const RuleIndex& index,
                                        const SolverRepairParams& params);

} // namespace rostra
