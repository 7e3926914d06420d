// constraints.cpp
#include "constraints.h"
#include "errors.h"
#include "utils.h"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <unordered_set>

namespace rostra {

const char* priority_rule_type_name(PriorityRuleType t) {
  switch (t) {
    case PriorityRuleType::PreferredShift:           return "preferred_shift";
    case PriorityRuleType::AvoidShift:               return "avoid_shift";
    case PriorityRuleType::AvoidShiftWithExceptions: return "avoid_shift_with_exceptions";
    case PriorityRuleType::AllowOnlyShifts:          return "allow_only_shifts";
    case PriorityRuleType::RequiredOff:              return "required_off";
  }
  return "preferred_shift";
}

PriorityRuleType parse_priority_rule_type(const std::string& s) {
  if (s == "preferred_shift") return PriorityRuleType::PreferredShift;
  if (s == "avoid_shift") return PriorityRuleType::AvoidShift;
  if (s == "avoid_shift_with_exceptions") return PriorityRuleType::AvoidShiftWithExceptions;
  if (s == "allow_only_shifts") return PriorityRuleType::AllowOnlyShifts;
  if (s == "required_off") return PriorityRuleType::RequiredOff;
  throw std::invalid_argument("Unknown priority rule type: " + s);
}

ConstraintKind kind_of(PriorityRuleType t) {
  switch (t) {
    case PriorityRuleType::PreferredShift:           return ConstraintKind::PriorityPreferred;
    case PriorityRuleType::AvoidShift:               return ConstraintKind::PriorityAvoid;
    case PriorityRuleType::AvoidShiftWithExceptions: return ConstraintKind::PriorityAvoidWithExceptions;
    case PriorityRuleType::AllowOnlyShifts:          return ConstraintKind::PriorityAllowOnly;
    case PriorityRuleType::RequiredOff:              return ConstraintKind::PriorityRequiredOff;
  }
  return ConstraintKind::PriorityPreferred;
}

namespace {

struct MetaVisitor {
  const ConstraintMeta& operator()(const DailyLimit& c) const { return c.meta; }
  const ConstraintMeta& operator()(const WeeklyLimit& c) const { return c.meta; }
  const ConstraintMeta& operator()(const MonthlyLimit& c) const { return c.meta; }
  const ConstraintMeta& operator()(const StaffGroupRule& c) const { return c.meta; }
  const ConstraintMeta& operator()(const PriorityRule& c) const { return c.meta; }
};

struct KindVisitor {
  ConstraintKind operator()(const DailyLimit&) const { return ConstraintKind::DailyLimit; }
  ConstraintKind operator()(const WeeklyLimit&) const { return ConstraintKind::WeeklyLimit; }
  ConstraintKind operator()(const MonthlyLimit&) const { return ConstraintKind::MonthlyLimit; }
  ConstraintKind operator()(const StaffGroupRule& g) const {
    if (g.conflict) return ConstraintKind::StaffGroupConflict;
    if (g.coverage) return ConstraintKind::BackupCoverage;
    return ConstraintKind::ProximityPattern;
  }
  ConstraintKind operator()(const PriorityRule& p) const { return kind_of(p.type); }
};

[[noreturn]] void fail(const std::string& id, const std::string& msg) {
  throw ConfigurationError(id, msg);
}

void check_tier(const std::string& id, int tier, bool allow_default) {
  if ((allow_default && tier == 0) || (tier >= 1 && tier <= 3)) return;
  fail(id, "tier " + std::to_string(tier) + " outside 1..3");
}

void check_days(const std::string& id, const std::vector<int>& days) {
  for (int d : days)
    if (d < 0 || d > 6) fail(id, "day of week " + std::to_string(d) + " outside 0..6");
}

void check_limit(const LimitSpec& l, const std::unordered_set<std::string>& groups) {
  const std::string& id = l.meta.id;
  if (l.min >= 0 && l.max >= 0 && l.min > l.max)
    fail(id, "min " + std::to_string(l.min) + " exceeds max " + std::to_string(l.max));
  if (l.min < -1 || l.max < -1) fail(id, "negative bound");
  check_days(id, l.days_of_week);
  if (l.scope.kind == ScopeKind::Group && !groups.count(l.scope.group_id))
    fail(id, "unknown staff group '" + l.scope.group_id + "'");
  if (l.scope.kind == ScopeKind::Staff && l.scope.staff_ids.empty())
    fail(id, "staff scope lists no staff");
}

} // namespace

const ConstraintMeta& meta_of(const Constraint& c) {
  return std::visit(MetaVisitor{}, c);
}

ConstraintKind primary_kind(const Constraint& c) {
  return std::visit(KindVisitor{}, c);
}

int effective_tier(const ConstraintMeta& m, ConstraintKind k) {
  return m.tier > 0 ? m.tier : PriorityRegistry::tier_of(k);
}

bool effective_hard(const ConstraintMeta& m, ConstraintKind k) {
  if (m.hard) return *m.hard;
  return effective_tier(m, k) == 1 && PriorityRegistry::is_hard_constraint(k);
}

int effective_weight(const ConstraintMeta& m, ConstraintKind k) {
  return m.penalty_weight > 0 ? m.penalty_weight : PriorityRegistry::info(k).default_penalty;
}

void check_snapshot(const ConfigSnapshot& snap) {
  std::unordered_set<std::string> ids;
  std::unordered_set<std::string> groups;
  for (const auto& c : snap.constraints) {
    const auto& m = meta_of(c);
    if (m.id.empty()) fail("<unnamed>", "constraint without id");
    if (!ids.insert(m.id).second) fail(m.id, "duplicate constraint id");
    check_tier(m.id, m.tier, true);
    if (m.penalty_weight < 0) fail(m.id, "negative penalty weight");
    if (const auto* g = std::get_if<StaffGroupRule>(&c)) groups.insert(g->meta.id);
  }

  for (const auto& c : snap.constraints) {
    if (const auto* d = std::get_if<DailyLimit>(&c)) {
      check_limit(*d, groups);
    } else if (const auto* w = std::get_if<WeeklyLimit>(&c)) {
      check_limit(*w, groups);
      if (w->window_days < 1) fail(w->meta.id, "window length must be positive");
    } else if (const auto* mo = std::get_if<MonthlyLimit>(&c)) {
      check_limit(*mo, groups);
    } else if (const auto* g = std::get_if<StaffGroupRule>(&c)) {
      const std::string& id = g->meta.id;
      if (g->members.empty()) fail(id, "staff group has no members");
      std::set<std::string> uniq(g->members.begin(), g->members.end());
      if (uniq.size() != g->members.size()) fail(id, "duplicate group member");
      if (!g->conflict && !g->coverage && !g->proximity)
        fail(id, "staff group carries no conflict, coverage or proximity clause");
      if (g->conflict && g->conflict->max_concurrent_off < 0)
        fail(id, "negative maxConcurrentOff");
      if (g->coverage) {
        if (g->coverage->backup_staff_id.empty()) fail(id, "coverage without backup staff");
        if (uniq.count(g->coverage->backup_staff_id))
          fail(id, "backup staff '" + g->coverage->backup_staff_id + "' is also a member");
        if (g->coverage->required_shift == ShiftValue::Off)
          fail(id, "coverage cannot require an off day");
      }
      if (g->proximity) {
        if (g->proximity->within_days < 0) fail(id, "negative proximity window");
        if (g->proximity->trigger_staff_id == g->proximity->target_staff_id)
          fail(id, "proximity trigger and target are the same staff");
      }
    } else if (const auto* p = std::get_if<PriorityRule>(&c)) {
      const std::string& id = p->meta.id;
      check_days(id, p->days_of_week);
      if (p->staff_ids.empty()) fail(id, "priority rule targets no staff");
      if (p->type == PriorityRuleType::AllowOnlyShifts && p->shifts.empty())
        fail(id, "allow-only rule permits no shift");
      if (p->type == PriorityRuleType::AvoidShiftWithExceptions) {
        if (p->shifts.empty()) fail(id, "avoid-with-exceptions rule lists no exception");
        if (std::find(p->shifts.begin(), p->shifts.end(), p->shift) != p->shifts.end())
          fail(id, "exception list contains the avoided shift");
      }
    }
  }

  check_tier("restRule", snap.rest.tier, false);
  if (snap.rest.max_consecutive_work_days < 0) fail("restRule", "negative maxConsecutiveWorkDays");
  check_tier("adjacentConflict", snap.adjacent.tier, false);
  if (snap.off_day_target < 0) fail("offDayTarget", "negative off-day target");

  std::set<std::string> work;
  for (const auto& d : snap.mandates.must_work) {
    try { parse_ymd(d); } catch (const std::invalid_argument& e) { fail("calendarMandates", e.what()); }
    work.insert(d);
  }
  for (const auto& d : snap.mandates.must_off) {
    try { parse_ymd(d); } catch (const std::invalid_argument& e) { fail("calendarMandates", e.what()); }
    if (work.count(d)) fail("calendarMandates", "date " + d + " is both must-work and must-off");
  }

  std::unordered_set<std::string> staff;
  for (const auto& s : snap.roster)
    if (!staff.insert(s.id).second) fail("roster", "duplicate staff id '" + s.id + "'");
}

} // namespace rostra
