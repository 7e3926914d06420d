// rule_index.h
#pragma once
#include <string>
#include <unordered_map>
#include <vector>

#include "constraints.h"
#include "locker.h"
#include "types.h"

namespace rostra {

// Effective registry metadata of one constraint clause.
struct ClauseMeta {
  std::string id;
  ConstraintKind kind = ConstraintKind::FairDistribution;
  int order = -1;       // position in the snapshot, -1 for built-in rules
  int tier = 3;
  bool hard = false;
  int weight = 0;
  int priority = 17;
};

struct CompiledLimit {
  ClauseMeta meta;
  ShiftValue shift = ShiftValue::Off;
  int min = -1;
  int max = -1;
  int window_days = 7;              // weekly limits only
  std::vector<char> in_scope;       // per staff
  std::vector<char> day_on;         // per day; weekday filter and mandate exemptions applied
  std::vector<int> scope_staff;     // staff indices in scope, ascending
};

struct CompiledGroup {
  std::string id;
  int order = 0;
  std::vector<int> members;         // staff indices, declaration order
  std::vector<char> is_member;

  bool has_conflict = false;
  ClauseMeta conflict_meta;
  int max_concurrent_off = 1;
  bool count_early = true;

  bool has_coverage = false;
  ClauseMeta coverage_meta;
  int backup = -1;
  ShiftValue required_shift = ShiftValue::Normal;

  bool has_proximity = false;
  ClauseMeta proximity_meta;
  int trigger = -1;
  int target = -1;
  int within_days = 1;

  // Off, or Early when count_early: the values the conflict clause counts.
  bool conflict_counts(ShiftValue v) const {
    return v == ShiftValue::Off || (count_early && v == ShiftValue::Early);
  }
};

struct CompiledPriority {
  ClauseMeta meta;
  PriorityRuleType type = PriorityRuleType::PreferredShift;
  ShiftValue shift = ShiftValue::Normal;
  std::vector<ShiftValue> shifts;
  int level = 2;
};

// Constraint snapshot resolved against one roster, horizon and lock set.
// Built once per run, read-only afterwards.
class RuleIndex {
 public:
  // Throws ConfigurationError for roster-dependent contradictions.
  RuleIndex(ConfigSnapshotPtr snapshot, std::vector<Staff> roster, Horizon horizon, LockedCells locks);

  const ConfigSnapshot& snapshot() const { return *snap_; }
  const std::vector<Staff>& roster() const { return roster_; }
  const Horizon& horizon() const { return horizon_; }
  const LockedCells& locks() const { return locks_; }

  int staff_count() const { return static_cast<int>(roster_.size()); }
  int day_count() const { return horizon_.size(); }
  int staff_index(const std::string& id) const;   // -1 when unknown

  DateCell date_cell(const CellRef& c) const { return {roster_[c.staff].id, horizon_.dates[c.day]}; }
  std::vector<DateCell> date_cells(const std::vector<CellRef>& cells) const {
    std::vector<DateCell> out;
    for (const auto& c : cells) out.push_back(date_cell(c));
    return out;
  }

  bool must_off_day(int d) const { return must_off_[d] != 0; }
  bool mandate_day(int d) const { return must_off_[d] || must_work_[d]; }

  const std::vector<CompiledLimit>& daily() const { return daily_; }
  const std::vector<CompiledLimit>& weekly() const { return weekly_; }
  const std::vector<CompiledLimit>& monthly() const { return monthly_; }
  const std::vector<CompiledGroup>& groups() const { return groups_; }
  const std::vector<CompiledPriority>& priorities() const { return priorities_; }

  // Priority rules applying to an unlocked cell, declaration order.
  const std::vector<int>& cell_rules(int s, int d) const { return cell_rules_[static_cast<size_t>(s) * day_count() + d]; }

  // Groups in which s is a member, backup, trigger or target.
  const std::vector<int>& groups_of(int s) const { return groups_of_[s]; }

  const ClauseMeta& rest_meta() const { return rest_meta_; }
  int max_consecutive_work_days() const { return snap_->rest.max_consecutive_work_days; }
  const ClauseMeta& adjacent_meta() const { return adjacent_meta_; }
  bool adjacent_enabled() const { return snap_->adjacent.enabled; }
  const ClauseMeta& fairness_meta() const { return fairness_meta_; }

  const ClauseMeta& builtin_meta(ConstraintKind k) const;

  // Configured per-staff target, or floor of the roster's mean Off count.
  int off_target(const Schedule& schedule) const;

 private:
  void compile_limit(const LimitSpec& spec, ConstraintKind kind, int order, int window_days,
                     std::vector<CompiledLimit>& out);
  void compile_group(const StaffGroupRule& g, int order);
  void compile_priority(const PriorityRule& p, int order);
  std::vector<char> resolve_scope(const Scope& scope, const std::string& owner) const;
  int require_staff(const std::string& id, const std::string& owner) const;
  void check_consistency() const;

  ConfigSnapshotPtr snap_;
  std::vector<Staff> roster_;
  Horizon horizon_;
  LockedCells locks_;

  std::unordered_map<std::string, int> staff_pos_;
  std::unordered_map<std::string, int> group_pos_;
  std::vector<char> must_off_;
  std::vector<char> must_work_;

  std::vector<CompiledLimit> daily_, weekly_, monthly_;
  std::vector<CompiledGroup> groups_;
  std::vector<CompiledPriority> priorities_;
  std::vector<std::vector<int>> cell_rules_;
  std::vector<std::vector<int>> groups_of_;

  ClauseMeta rest_meta_, adjacent_meta_, fairness_meta_;
  std::vector<ClauseMeta> builtin_;
};

} // namespace rostra
