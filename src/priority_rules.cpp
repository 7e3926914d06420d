// priority_rules.cpp
#include "priority_rules.h"

#include <algorithm>

namespace rostra {

namespace {

const ShiftValue kFallbackOrder[] = {ShiftValue::Normal, ShiftValue::Late, ShiftValue::Early, ShiftValue::Off};

bool contains(const std::vector<ShiftValue>& vs, ShiftValue v) {
  return std::find(vs.begin(), vs.end(), v) != vs.end();
}

// Strongest cell-level rule the current value breaks, if any.
std::optional<CellResolution> breach(const RuleIndex& index, int s, int d, ShiftValue v) {
  if (!index.roster()[s].eligible(v)) {
    CellResolution r;
    r.kind = ConstraintKind::ShiftEligibility;
    return r;
  }
  std::optional<CellResolution> worst;
  for (int ri : index.cell_rules(s, d)) {
    const auto& p = index.priorities()[ri];
    bool broken = false;
    switch (p.type) {
      case PriorityRuleType::AllowOnlyShifts:          broken = !contains(p.shifts, v); break;
      case PriorityRuleType::AvoidShift:
      case PriorityRuleType::AvoidShiftWithExceptions: broken = p.shift == v; break;
      default: break;
    }
    if (!broken) continue;
    if (!worst || p.meta.priority < PriorityRegistry::priority_of(worst->kind)) {
      CellResolution r;
      r.kind = p.meta.kind;
      r.rule = ri;
      worst = r;
    }
  }
  return worst;
}

} // namespace

bool permitted(const RuleIndex& index, int s, int d, ShiftValue v) {
  return !breach(index, s, d, v).has_value();
}

std::vector<ShiftValue> permitted_values(const RuleIndex& index, int s, int d) {
  std::vector<ShiftValue> out;
  for (int ri : index.cell_rules(s, d)) {
    const auto& p = index.priorities()[ri];
    if (p.type != PriorityRuleType::AllowOnlyShifts) continue;
    for (ShiftValue v : p.shifts)
      if (!contains(out, v) && permitted(index, s, d, v)) out.push_back(v);
    return out;
  }
  for (ShiftValue v : kFallbackOrder)
    if (permitted(index, s, d, v)) out.push_back(v);
  return out;
}

int effective_preference(const RuleIndex& index, int s, int d) {
  int best = -1;
  for (int ri : index.cell_rules(s, d)) {
    const auto& p = index.priorities()[ri];
    if (p.type != PriorityRuleType::PreferredShift) continue;
    if (!permitted(index, s, d, p.shift)) continue;
    // cell_rules is in declaration order, so strict > keeps the earlier rule on ties.
    if (best < 0 || p.level > index.priorities()[best].level) best = ri;
  }
  return best;
}

bool required_off_effective(const RuleIndex& index, int s, int d) {
  if (effective_preference(index, s, d) >= 0) return false;
  for (int ri : index.cell_rules(s, d))
    if (index.priorities()[ri].type == PriorityRuleType::RequiredOff)
      return permitted(index, s, d, ShiftValue::Off);
  return false;
}

bool is_compliant(const RuleIndex& index, int s, int d, ShiftValue v) {
  if (!permitted(index, s, d, v)) return false;
  const int pref = effective_preference(index, s, d);
  if (pref >= 0) return v == index.priorities()[pref].shift;
  if (required_off_effective(index, s, d)) return v == ShiftValue::Off;
  return true;
}

std::optional<CellResolution> resolve_cell(const RuleIndex& index, int s, int d, ShiftValue current,
                                           std::mt19937_64& rng) {
  if (index.locks().is_locked(s, d)) return std::nullopt;
  if (is_compliant(index, s, d, current)) return std::nullopt;

  const auto broken = breach(index, s, d, current);
  const int pref = effective_preference(index, s, d);

  CellResolution r;
  if (pref >= 0) {
    r.value = index.priorities()[pref].shift;
    r.kind = broken ? broken->kind : ConstraintKind::PriorityPreferred;
    r.rule = broken ? broken->rule : pref;
    return r;
  }

  if (required_off_effective(index, s, d)) {
    r.value = ShiftValue::Off;
    r.kind = broken ? broken->kind : ConstraintKind::PriorityRequiredOff;
    r.rule = broken ? broken->rule : -1;
    return r;
  }

  // Only a breach is left to fix here.
  for (int ri : index.cell_rules(s, d)) {
    const auto& p = index.priorities()[ri];
    if (p.type != PriorityRuleType::AvoidShiftWithExceptions || p.shift != current) continue;
    std::vector<ShiftValue> options;
    for (ShiftValue v : p.shifts)
      if (permitted(index, s, d, v)) options.push_back(v);
    if (options.empty()) continue;
    std::uniform_int_distribution<size_t> pick(0, options.size() - 1);
    r.value = options[pick(rng)];
    r.kind = broken->kind;
    r.rule = broken->rule;
    return r;
  }

  const auto allowed = permitted_values(index, s, d);
  if (allowed.empty()) return std::nullopt;
  r.value = allowed.front();
  r.kind = broken->kind;
  r.rule = broken->rule;
  return r;
}

} // namespace rostra
