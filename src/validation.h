// validation.h
#pragma once
#include <array>
#include <vector>

#include "priority_registry.h"
#include "rule_index.h"
#include "types.h"

namespace rostra {

// Limits a check to the constraints one cell can influence. staff/day -1 = everything.
struct Focus {
    int staff = -1;
    int day = -1;

    bool all() const { return staff < 0; }
};

// Full violation set of a schedule, sorted by tier, priority, declaration order, key.
// Only kinds whose effective tier is <= max_tier are reported. Never mutates.
std::vector<Violation> validate(const Schedule& schedule, const RuleIndex& index, int max_tier = 3);

// Violations of the constraints a single cell takes part in (unsorted).
std::vector<Violation> validate_focus(const Schedule& schedule, const RuleIndex& index, const Focus& focus);

// Sum of magnitudes per kind, indexed by ConstraintKind.
using KindTotals = std::array<int, kConstraintKindCount>;
KindTotals totals_by_kind(const std::vector<Violation>& violations);

// Tier 1 only; what must be empty after repair.
std::vector<Violation> tier1_violations(const std::vector<Violation>& violations);

// ---- per-kind checks, exposed for tests ----
void check_locks(const Schedule& s, const RuleIndex& ix, const Focus& f, std::vector<Violation>& out);
void check_eligibility(const Schedule& s, const RuleIndex& ix, const Focus& f, std::vector<Violation>& out);
void check_rest(const Schedule& s, const RuleIndex& ix, const Focus& f, std::vector<Violation>& out);
void check_daily(const Schedule& s, const RuleIndex& ix, const Focus& f, std::vector<Violation>& out);
void check_weekly(const Schedule& s, const RuleIndex& ix, const Focus& f, std::vector<Violation>& out);
void check_monthly(const Schedule& s, const RuleIndex& ix, const Focus& f, std::vector<Violation>& out);
void check_groups(const Schedule& s, const RuleIndex& ix, const Focus& f, std::vector<Violation>& out);
void check_priority(const Schedule& s, const RuleIndex& ix, const Focus& f, std::vector<Violation>& out);
void check_adjacent(const Schedule& s, const RuleIndex& ix, const Focus& f, std::vector<Violation>& out);
void check_fairness(const Schedule& s, const RuleIndex& ix, const Focus& f, std::vector<Violation>& out);

} // namespace rostra
