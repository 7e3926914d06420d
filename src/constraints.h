// constraints.h
#pragma once
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "priority_registry.h"
#include "types.h"

namespace rostra {

enum class ScopeKind { All, Group, Staff, Category };

struct Scope {
  ScopeKind kind = ScopeKind::All;
  std::string group_id;                 // ScopeKind::Group -> StaffGroupRule id
  std::vector<std::string> staff_ids;   // ScopeKind::Staff
  std::string category;                 // ScopeKind::Category
};

// Fields every constraint instance carries. tier 0 / empty hard / weight 0
// mean "use the registry default for the kind".
struct ConstraintMeta {
  std::string id;
  int tier = 0;
  std::optional<bool> hard;
  int penalty_weight = 0;
};

struct LimitSpec {
  ConstraintMeta meta;
  ShiftValue shift = ShiftValue::Off;
  int min = -1;                     // -1 = unbounded
  int max = -1;
  Scope scope;
  std::vector<int> days_of_week;    // 0=Sun..6=Sat, empty = every day
};

// Per date: number of in-scope staff holding `shift`.
struct DailyLimit : LimitSpec {};

// Per staff, per rolling window of window_days: days holding `shift`.
struct WeeklyLimit : LimitSpec {
  int window_days = 7;
};

// Per staff, per calendar month within the horizon: days holding `shift`.
struct MonthlyLimit : LimitSpec {};

// At most max_concurrent_off members Off (or Early) on one date.
struct ConflictRule {
  int max_concurrent_off = 1;
  bool count_early = true;
};

// When any member is Off, the backup must hold required_shift.
struct CoverageRule {
  std::string backup_staff_id;
  ShiftValue required_shift = ShiftValue::Normal;
};

// Trigger Off on d implies target Off somewhere in [d - within_days, d + within_days].
struct ProximityPattern {
  std::string trigger_staff_id;
  std::string target_staff_id;
  int within_days = 1;
};

struct StaffGroupRule {
  ConstraintMeta meta;
  std::string name;
  std::vector<std::string> members;
  std::optional<ConflictRule> conflict;
  std::optional<CoverageRule> coverage;
  std::optional<ProximityPattern> proximity;
};

enum class PriorityRuleType {
  PreferredShift,
  AvoidShift,
  AvoidShiftWithExceptions,
  AllowOnlyShifts,
  RequiredOff,
};

const char* priority_rule_type_name(PriorityRuleType t);
PriorityRuleType parse_priority_rule_type(const std::string& s); // throws std::invalid_argument
ConstraintKind kind_of(PriorityRuleType t);

struct PriorityRule {
  ConstraintMeta meta;
  PriorityRuleType type = PriorityRuleType::PreferredShift;
  std::vector<std::string> staff_ids;
  std::vector<int> days_of_week;      // empty = every day
  ShiftValue shift = ShiftValue::Normal;
  std::vector<ShiftValue> shifts;     // allowed list, or exceptions for AvoidShiftWithExceptions
  int priority_level = 2;             // higher wins among preferences
};

using Constraint = std::variant<DailyLimit, WeeklyLimit, MonthlyLimit, StaffGroupRule, PriorityRule>;

const ConstraintMeta& meta_of(const Constraint& c);

// Registry kind the instance is filed under (a group rule files under its
// strongest clause).
ConstraintKind primary_kind(const Constraint& c);

struct CalendarMandates {
  std::vector<std::string> must_work;   // dates, every staff works Normal
  std::vector<std::string> must_off;    // dates, every staff is released
};

// Consecutive working days limit. 0 disables it.
struct RestRule {
  int max_consecutive_work_days = 0;
  int tier = 1;
  bool hard = true;
  int penalty_weight = 200;
};

struct AdjacentConflictRule {
  bool enabled = false;
  int tier = 3;
  int penalty_weight = 30;
};

// Versioned, read-only input to a run. Shared across concurrent runs.
struct ConfigSnapshot {
  std::string version = "0";
  std::vector<Staff> roster;                 // default roster; a request may bring its own
  std::vector<Constraint> constraints;
  CalendarMandates mandates;
  RestRule rest;
  AdjacentConflictRule adjacent;
  int off_day_target = 0;                    // per staff over the horizon, 0 = roster mean
  bool must_off_early_for_eligible = true;
};

using ConfigSnapshotPtr = std::shared_ptr<const ConfigSnapshot>;

// Roster-independent consistency checks. Throws ConfigurationError.
void check_snapshot(const ConfigSnapshot& snap);

// Effective tier / hard flag / weight of an instance for a given kind.
int effective_tier(const ConstraintMeta& m, ConstraintKind k);
bool effective_hard(const ConstraintMeta& m, ConstraintKind k);
int effective_weight(const ConstraintMeta& m, ConstraintKind k);

} // namespace rostra
