// rule_index.cpp
#include "rule_index.h"
#include "errors.h"
#include "priority_rules.h"

#include <algorithm>
#include <utility>

namespace rostra {

namespace {

ClauseMeta make_meta(const ConstraintMeta& m, ConstraintKind kind, int order) {
  ClauseMeta c;
  c.id = m.id;
  c.kind = kind;
  c.order = order;
  c.tier = effective_tier(m, kind);
  c.hard = effective_hard(m, kind);
  c.weight = effective_weight(m, kind);
  c.priority = PriorityRegistry::priority_of(kind);
  return c;
}

ClauseMeta builtin(const std::string& id, ConstraintKind kind, int tier, bool hard, int weight) {
  ClauseMeta c;
  c.id = id;
  c.kind = kind;
  c.order = -1;
  c.tier = tier;
  c.hard = hard;
  c.weight = weight;
  c.priority = PriorityRegistry::priority_of(kind);
  return c;
}

bool day_matches(const std::vector<int>& days, int weekday) {
  return days.empty() || std::find(days.begin(), days.end(), weekday) != days.end();
}

} // namespace

RuleIndex::RuleIndex(ConfigSnapshotPtr snapshot, std::vector<Staff> roster, Horizon horizon, LockedCells locks)
    : snap_(std::move(snapshot)), roster_(std::move(roster)), horizon_(std::move(horizon)), locks_(std::move(locks)) {
  const int S = staff_count();
  const int D = day_count();

  for (int s = 0; s < S; ++s) {
    if (!staff_pos_.emplace(roster_[s].id, s).second)
      throw ConfigurationError("roster", "duplicate staff id '" + roster_[s].id + "'");
  }

  must_off_.assign(D, 0);
  must_work_.assign(D, 0);
  for (const auto& date : snap_->mandates.must_off) {
    const int d = horizon_.index_of(date);
    if (d >= 0) must_off_[d] = 1;
  }
  for (const auto& date : snap_->mandates.must_work) {
    const int d = horizon_.index_of(date);
    if (d >= 0) must_work_[d] = 1;
  }

  const auto& rest = snap_->rest;
  rest_meta_ = builtin("restRule", ConstraintKind::ConsecutiveWorkLimit, rest.tier, rest.hard, rest.penalty_weight);
  const auto& adj = snap_->adjacent;
  adjacent_meta_ = builtin("adjacentConflict", ConstraintKind::AdjacentConflict, adj.tier, false, adj.penalty_weight);
  fairness_meta_ = builtin("fairDistribution", ConstraintKind::FairDistribution, 3, false,
                           PriorityRegistry::info(ConstraintKind::FairDistribution).default_penalty);
  for (const auto& k : PriorityRegistry::all())
    builtin_.push_back(builtin(k.id, k.kind, k.tier, k.hard, k.default_penalty));

  // Groups first: limit scopes may refer to them.
  const auto& cons = snap_->constraints;
  for (int i = 0; i < static_cast<int>(cons.size()); ++i)
    if (const auto* g = std::get_if<StaffGroupRule>(&cons[i])) compile_group(*g, i);

  for (int i = 0; i < static_cast<int>(cons.size()); ++i) {
    const auto& c = cons[i];
    if (const auto* dl = std::get_if<DailyLimit>(&c))
      compile_limit(*dl, ConstraintKind::DailyLimit, i, 0, daily_);
    else if (const auto* wl = std::get_if<WeeklyLimit>(&c))
      compile_limit(*wl, ConstraintKind::WeeklyLimit, i, wl->window_days, weekly_);
    else if (const auto* ml = std::get_if<MonthlyLimit>(&c))
      compile_limit(*ml, ConstraintKind::MonthlyLimit, i, 0, monthly_);
    else if (const auto* pr = std::get_if<PriorityRule>(&c))
      compile_priority(*pr, i);
  }

  cell_rules_.assign(static_cast<size_t>(S) * D, {});
  for (int r = 0; r < static_cast<int>(priorities_.size()); ++r) {
    const auto& rule = std::get<PriorityRule>(cons[priorities_[r].meta.order]);
    for (const auto& sid : rule.staff_ids) {
      const int s = staff_pos_.at(sid);
      for (int d = 0; d < D; ++d) {
        if (locks_.is_locked(s, d) || !day_matches(rule.days_of_week, horizon_.weekday[d])) continue;
        auto& lst = cell_rules_[static_cast<size_t>(s) * D + d];
        if (lst.empty() || lst.back() != r) lst.push_back(r);
      }
    }
  }

  groups_of_.assign(S, {});
  for (int g = 0; g < static_cast<int>(groups_.size()); ++g) {
    std::vector<int> who = groups_[g].members;
    if (groups_[g].backup >= 0) who.push_back(groups_[g].backup);
    if (groups_[g].trigger >= 0) who.push_back(groups_[g].trigger);
    if (groups_[g].target >= 0) who.push_back(groups_[g].target);
    std::sort(who.begin(), who.end());
    who.erase(std::unique(who.begin(), who.end()), who.end());
    for (int s : who) groups_of_[s].push_back(g);
  }

  check_consistency();
}

int RuleIndex::staff_index(const std::string& id) const {
  auto it = staff_pos_.find(id);
  return it == staff_pos_.end() ? -1 : it->second;
}

int RuleIndex::require_staff(const std::string& id, const std::string& owner) const {
  const int s = staff_index(id);
  if (s < 0) throw ConfigurationError(owner, "unknown staff '" + id + "'");
  return s;
}

const ClauseMeta& RuleIndex::builtin_meta(ConstraintKind k) const {
  return builtin_[static_cast<size_t>(k)];
}

std::vector<char> RuleIndex::resolve_scope(const Scope& scope, const std::string& owner) const {
  std::vector<char> in(staff_count(), 0);
  switch (scope.kind) {
    case ScopeKind::All:
      std::fill(in.begin(), in.end(), 1);
      break;
    case ScopeKind::Group: {
      auto it = group_pos_.find(scope.group_id);
      if (it == group_pos_.end())
        throw ConfigurationError(owner, "unknown staff group '" + scope.group_id + "'");
      for (int s : groups_[it->second].members) in[s] = 1;
      break;
    }
    case ScopeKind::Staff:
      for (const auto& id : scope.staff_ids) in[require_staff(id, owner)] = 1;
      break;
    case ScopeKind::Category: {
      bool any = false;
      for (int s = 0; s < staff_count(); ++s)
        if (roster_[s].category == scope.category) { in[s] = 1; any = true; }
      if (!any) throw ConfigurationError(owner, "no staff in category '" + scope.category + "'");
      break;
    }
  }
  return in;
}

void RuleIndex::compile_limit(const LimitSpec& spec, ConstraintKind kind, int order, int window_days,
                              std::vector<CompiledLimit>& out) {
  CompiledLimit l;
  l.meta = make_meta(spec.meta, kind, order);
  l.shift = spec.shift;
  l.min = spec.min;
  l.max = spec.max;
  l.window_days = window_days;
  l.in_scope = resolve_scope(spec.scope, spec.meta.id);
  for (int s = 0; s < staff_count(); ++s)
    if (l.in_scope[s]) l.scope_staff.push_back(s);

  // Mandate dates override daily limits; must-off dates do not count toward
  // per-staff weekly and monthly totals.
  l.day_on.assign(day_count(), 0);
  for (int d = 0; d < day_count(); ++d) {
    if (!day_matches(spec.days_of_week, horizon_.weekday[d])) continue;
    if (kind == ConstraintKind::DailyLimit ? mandate_day(d) : must_off_day(d)) continue;
    l.day_on[d] = 1;
  }
  out.push_back(std::move(l));
}

void RuleIndex::compile_group(const StaffGroupRule& g, int order) {
  CompiledGroup c;
  c.id = g.meta.id;
  c.order = order;
  c.is_member.assign(staff_count(), 0);
  for (const auto& m : g.members) {
    const int s = require_staff(m, g.meta.id);
    c.members.push_back(s);
    c.is_member[s] = 1;
  }
  if (g.conflict) {
    c.has_conflict = true;
    c.conflict_meta = make_meta(g.meta, ConstraintKind::StaffGroupConflict, order);
    c.max_concurrent_off = g.conflict->max_concurrent_off;
    c.count_early = g.conflict->count_early;
  }
  if (g.coverage) {
    c.has_coverage = true;
    c.coverage_meta = make_meta(g.meta, ConstraintKind::BackupCoverage, order);
    c.backup = require_staff(g.coverage->backup_staff_id, g.meta.id);
    c.required_shift = g.coverage->required_shift;
  }
  if (g.proximity) {
    c.has_proximity = true;
    c.proximity_meta = make_meta(g.meta, ConstraintKind::ProximityPattern, order);
    c.trigger = require_staff(g.proximity->trigger_staff_id, g.meta.id);
    c.target = require_staff(g.proximity->target_staff_id, g.meta.id);
    c.within_days = g.proximity->within_days;
  }
  group_pos_[c.id] = static_cast<int>(groups_.size());
  groups_.push_back(std::move(c));
}

void RuleIndex::compile_priority(const PriorityRule& p, int order) {
  for (const auto& sid : p.staff_ids) require_staff(sid, p.meta.id);
  CompiledPriority c;
  c.meta = make_meta(p.meta, kind_of(p.type), order);
  c.type = p.type;
  c.shift = p.shift;
  c.shifts = p.shifts;
  c.level = p.priority_level;
  priorities_.push_back(std::move(c));
}

void RuleIndex::check_consistency() const {
  const int S = staff_count();
  const int D = day_count();

  for (const auto& l : daily_) {
    if (l.min > static_cast<int>(l.scope_staff.size()))
      throw ConfigurationError(l.meta.id, "minimum " + std::to_string(l.min) + " exceeds the " +
                               std::to_string(l.scope_staff.size()) + " staff in scope");
    if (l.min <= 0) continue;
    for (int d = 0; d < D; ++d) {
      if (!l.day_on[d]) continue;
      int able = 0;
      for (int s : l.scope_staff)
        if (locks_.is_locked(s, d) ? *locks_.locked_value(s, d) == l.shift : roster_[s].eligible(l.shift)) ++able;
      if (able < l.min)
        throw ConfigurationError(l.meta.id, "only " + std::to_string(able) + " staff can hold " +
                                 shift_name(l.shift) + " on " + horizon_.dates[d]);
    }
  }

  // Locks alone must not break a Tier-1 maximum or group conflict.
  for (const auto& l : daily_) {
    if (l.max < 0 || l.meta.tier != 1) continue;
    for (int d = 0; d < D; ++d) {
      if (!l.day_on[d]) continue;
      int locked = 0;
      for (int s : l.scope_staff)
        if (locks_.locked_value(s, d) == l.shift) ++locked;
      if (locked > l.max)
        throw ConfigurationError(l.meta.id, std::to_string(locked) + " locked cells hold " + shift_name(l.shift) +
                                 " on " + horizon_.dates[d] + ", above the maximum " + std::to_string(l.max));
    }
  }

  for (const auto& g : groups_) {
    if (!g.has_conflict || g.conflict_meta.tier != 1) continue;
    for (int d = 0; d < D; ++d) {
      if (must_off_day(d)) continue;
      int locked = 0;
      for (int m : g.members)
        if (auto v = locks_.locked_value(m, d); v && g.conflict_counts(*v)) ++locked;
      if (locked > g.max_concurrent_off)
        throw ConfigurationError(g.conflict_meta.id, std::to_string(locked) + " locked group members off on " +
                                 horizon_.dates[d]);
    }
  }

  // Per-staff monthly maximum.
  for (const auto& l : monthly_) {
    if (l.max < 0) continue;
    for (int s : l.scope_staff)
      for (const auto& m : horizon_.months) {
        int locked = 0;
        for (int d = m.first_day; d <= m.last_day; ++d)
          if (l.day_on[d] && locks_.locked_value(s, d) == l.shift) ++locked;
        if (locked > l.max)
          throw ConfigurationError(l.meta.id, "locked cells exceed the maximum for " + roster_[s].id +
                                   " in " + m.key);
      }
  }

  const int max_run = max_consecutive_work_days();
  if (max_run > 0) {
    for (int s = 0; s < S; ++s) {
      int run = 0;
      for (int d = 0; d < D; ++d) {
        auto v = locks_.locked_value(s, d);
        run = (v && is_working(*v)) ? run + 1 : 0;
        if (run > max_run)
          throw ConfigurationError("restRule", "locked cells force " + std::to_string(run) +
                                   " consecutive working days on " + roster_[s].id);
      }
    }
  }

  for (int s = 0; s < S; ++s)
    for (int d = 0; d < D; ++d) {
      if (locks_.is_locked(s, d)) continue;
      if (!permitted_values(*this, s, d).empty()) continue;
      std::string owner = "shift_eligibility";
      for (int r : cell_rules(s, d))
        if (priorities_[r].type != PriorityRuleType::PreferredShift &&
            priorities_[r].type != PriorityRuleType::RequiredOff)
          owner = priorities_[r].meta.id;
      throw ConfigurationError(owner, "no permitted shift for " + roster_[s].id + " on " + horizon_.dates[d]);
    }
}

int RuleIndex::off_target(const Schedule& schedule) const {
  if (snap_->off_day_target > 0) return snap_->off_day_target;
  if (schedule.staff_count() == 0) return 0;
  int off = 0;
  for (int s = 0; s < schedule.staff_count(); ++s)
    for (int d = 0; d < schedule.day_count(); ++d)
      if (schedule.at(s, d) == ShiftValue::Off) ++off;
  return off / schedule.staff_count();
}

} // namespace rostra
