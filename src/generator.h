// generator.h
#pragma once
#include <functional>
#include <random>
#include <string>
#include <vector>

#include "rule_index.h"
#include "schedule_state.h"

namespace rostra {

struct GeneratorOptions {
  int max_fixed_point_iterations = 8;   // priority re-application sweeps per stage
  int max_pipeline_passes = 3;          // repeats of stages 2-7 until nothing moves
  bool verbose = false;
};

struct StageStat {
  std::string stage;
  int pass = 0;
  int cells_changed = 0;
};

// Called after every stage; may throw (cancellation, lock breach) to abort the run.
using StageHook = std::function<void(const StageStat&, const ScheduleState&)>;

// Deterministic staged pipeline. Every write goes through the move guard, so a
// stage never undoes what a higher-precedence constraint needs and never touches
// a locked cell. Every stage is idempotent at its fixed point.
class RuleBasedGenerator {
 public:
  RuleBasedGenerator(const RuleIndex& index, GeneratorOptions opt, std::mt19937_64& rng);

  // Stages 2-7, repeated until a full pass changes nothing or the pass bound is hit.
  std::vector<StageStat> run(ScheduleState& state, const StageHook& hook = {});

  // Stage 2: conflict, coverage, proximity.
  int apply_group_rules(ScheduleState& state);
  // One sweep of cell-level priority resolution.
  int apply_priority_rules(ScheduleState& state);
  // Stages 3, 5, 7: sweeps until nothing changes (bounded).
  int enforce_priority_fixed_point(ScheduleState& state);
  // Stage 4: rest rule, monthly, daily, weekly.
  int apply_limits(ScheduleState& state);
  // Stage 6: Off days toward the per-staff target, largest deficit first.
  int distribute_off_days(ScheduleState& state);

 private:
  int apply_conflict(ScheduleState& state, const CompiledGroup& g);
  int apply_coverage(ScheduleState& state, const CompiledGroup& g);
  int apply_proximity(ScheduleState& state, const CompiledGroup& g);
  int apply_rest(ScheduleState& state);
  int apply_monthly(ScheduleState& state, const CompiledLimit& l);
  int apply_daily(ScheduleState& state, const CompiledLimit& l);
  int apply_weekly(ScheduleState& state, const CompiledLimit& l);

  // Best value for (s, d) that is not `avoid`: first permitted, else Normal.
  ShiftValue replacement(int s, int d, ShiftValue avoid) const;
  int daily_count(const ScheduleState& state, const CompiledLimit& l, int d) const;

  const RuleIndex& index_;
  GeneratorOptions opt_;
  std::mt19937_64& rng_;
};

} // namespace rostra
