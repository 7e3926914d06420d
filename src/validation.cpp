// validation.cpp
#include "validation.h"
#include "priority_rules.h"

#include <algorithm>
#include <cstdlib>
#include <string>
#include <utility>

namespace rostra
{

    namespace
    {

        struct Range
        {
            int lo;
            int hi; // inclusive
        };

        Range staff_range(const RuleIndex &ix, const Focus &f)
        {
            if (f.all())
                return {0, ix.staff_count() - 1};
            return {f.staff, f.staff};
        }

        Range day_range(const RuleIndex &ix, const Focus &f)
        {
            if (f.day < 0)
                return {0, ix.day_count() - 1};
            return {f.day, f.day};
        }

        Violation make_violation(const ClauseMeta &m, std::vector<CellRef> cells, int magnitude,
                                 std::string message, std::string key)
        {
            Violation v;
            v.constraint_id = m.id;
            v.kind = m.kind;
            v.tier = m.tier;
            v.hard = m.hard;
            v.severity = PriorityRegistry::severity(m.tier, m.hard);
            v.priority = m.priority;
            v.order = m.order;
            std::sort(cells.begin(), cells.end());
            v.cells = std::move(cells);
            v.magnitude = magnitude;
            v.weight = m.weight;
            v.message = std::move(message);
            v.key = std::move(key);
            return v;
        }

        std::string at_cell(const RuleIndex &ix, int s, int d)
        {
            return ix.roster()[s].id + "@" + ix.horizon().dates[d];
        }

        bool free_cell(const RuleIndex &ix, int s, int d)
        {
            return !ix.locks().is_locked(s, d);
        }

        // Bound breaches of one counted quantity. Emits at most one violation.
        void bound_check(const CompiledLimit &l, int count, int min_cap, const std::string &where,
                         const std::vector<CellRef> &at_shift, const std::vector<CellRef> &not_shift,
                         std::vector<Violation> &out)
        {
            const int min = std::min(l.min, min_cap);
            if (l.max >= 0 && count > l.max)
            {
                out.push_back(make_violation(l.meta, at_shift, count - l.max,
                                             std::string(shift_name(l.shift)) + " count " + std::to_string(count) +
                                                 " above max " + std::to_string(l.max) + " (" + where + ")",
                                             l.meta.id + "@" + where));
            }
            else if (min > 0 && count < min)
            {
                out.push_back(make_violation(l.meta, not_shift, min - count,
                                             std::string(shift_name(l.shift)) + " count " + std::to_string(count) +
                                                 " below min " + std::to_string(l.min) + " (" + where + ")",
                                             l.meta.id + "@" + where));
            }
        }

        // Shared by weekly and monthly: one staff, days [lo, hi].
        void per_staff_span(const Schedule &sch, const RuleIndex &ix, const CompiledLimit &l, int s,
                            int lo, int hi, bool min_applies, const std::string &where,
                            std::vector<Violation> &out)
        {
            int count = 0, on = 0;
            std::vector<CellRef> at_shift, not_shift;
            for (int d = lo; d <= hi; ++d)
            {
                if (!l.day_on[d])
                    continue;
                ++on;
                const bool hit = sch.at(s, d) == l.shift;
                if (hit)
                    ++count;
                if (!free_cell(ix, s, d))
                    continue;
                (hit ? at_shift : not_shift).push_back({s, d});
            }
            bound_check(l, count, min_applies ? on : 0, where, at_shift, not_shift, out);
        }

        bool adjacent_bad(ShiftValue a, ShiftValue b)
        {
            using V = ShiftValue;
            return (a == V::Off && b == V::Off) || (a == V::Early && b == V::Off) || (a == V::Off && b == V::Early);
        }

    } // namespace

    void check_locks(const Schedule &sch, const RuleIndex &ix, const Focus &f, std::vector<Violation> &out)
    {
        const Range sr = staff_range(ix, f), dr = day_range(ix, f);
        for (int s = sr.lo; s <= sr.hi; ++s)
            for (int d = dr.lo; d <= dr.hi; ++d)
            {
                auto v = ix.locks().locked_value(s, d);
                if (!v || sch.at(s, d) == *v)
                    continue;
                const auto &m = ix.builtin_meta(ix.locks().source(s, d));
                out.push_back(make_violation(m, {{s, d}}, 1,
                                             "locked cell holds " + std::string(shift_name(sch.at(s, d))) +
                                                 " instead of " + shift_name(*v),
                                             m.id + "@" + at_cell(ix, s, d)));
            }
    }

    void check_eligibility(const Schedule &sch, const RuleIndex &ix, const Focus &f, std::vector<Violation> &out)
    {
        const Range sr = staff_range(ix, f), dr = day_range(ix, f);
        const auto &m = ix.builtin_meta(ConstraintKind::ShiftEligibility);
        for (int s = sr.lo; s <= sr.hi; ++s)
            for (int d = dr.lo; d <= dr.hi; ++d)
            {
                if (!free_cell(ix, s, d) || ix.roster()[s].eligible(sch.at(s, d)))
                    continue;
                out.push_back(make_violation(m, {{s, d}}, 1,
                                             ix.roster()[s].id + " may not work " + shift_name(sch.at(s, d)),
                                             m.id + "@" + at_cell(ix, s, d)));
            }
    }

    void check_rest(const Schedule &sch, const RuleIndex &ix, const Focus &f, std::vector<Violation> &out)
    {
        const int max_run = ix.max_consecutive_work_days();
        if (max_run <= 0)
            return;
        const Range sr = staff_range(ix, f);
        const int D = ix.day_count();
        for (int s = sr.lo; s <= sr.hi; ++s)
        {
            int start = 0;
            for (int d = 0; d <= D; ++d)
            {
                if (d < D && is_working(sch.at(s, d)))
                    continue;
                const int len = d - start;
                if (len > max_run)
                {
                    std::vector<CellRef> cells;
                    for (int k = start; k < d; ++k)
                        if (free_cell(ix, s, k))
                            cells.push_back({s, k});
                    out.push_back(make_violation(ix.rest_meta(), std::move(cells), len - max_run,
                                                 std::to_string(len) + " consecutive working days from " +
                                                     ix.horizon().dates[start] + " (max " + std::to_string(max_run) + ")",
                                                 ix.rest_meta().id + "@" + at_cell(ix, s, start)));
                }
                start = d + 1;
            }
        }
    }

    void check_daily(const Schedule &sch, const RuleIndex &ix, const Focus &f, std::vector<Violation> &out)
    {
        const Range dr = day_range(ix, f);
        for (const auto &l : ix.daily())
        {
            if (!f.all() && !l.in_scope[f.staff])
                continue;
            for (int d = dr.lo; d <= dr.hi; ++d)
            {
                if (!l.day_on[d])
                    continue;
                int count = 0;
                std::vector<CellRef> at_shift, not_shift;
                for (int s : l.scope_staff)
                {
                    const bool hit = sch.at(s, d) == l.shift;
                    if (hit)
                        ++count;
                    if (free_cell(ix, s, d))
                        (hit ? at_shift : not_shift).push_back({s, d});
                }
                bound_check(l, count, static_cast<int>(l.scope_staff.size()), ix.horizon().dates[d],
                            at_shift, not_shift, out);
            }
        }
    }

    void check_weekly(const Schedule &sch, const RuleIndex &ix, const Focus &f, std::vector<Violation> &out)
    {
        const int D = ix.day_count();
        for (const auto &l : ix.weekly())
        {
            if (!f.all() && !l.in_scope[f.staff])
                continue;
            const int w = l.window_days;
            if (D < w)
                continue;
            int first = 0, last = D - w;
            if (f.day >= 0)
            {
                first = std::max(0, f.day - w + 1);
                last = std::min(D - w, f.day);
            }
            for (int s : l.scope_staff)
            {
                if (!f.all() && s != f.staff)
                    continue;
                for (int start = first; start <= last; ++start)
                    per_staff_span(sch, ix, l, s, start, start + w - 1, true,
                                   at_cell(ix, s, start), out);
            }
        }
    }

    void check_monthly(const Schedule &sch, const RuleIndex &ix, const Focus &f, std::vector<Violation> &out)
    {
        const auto &months = ix.horizon().months;
        for (const auto &l : ix.monthly())
        {
            if (!f.all() && !l.in_scope[f.staff])
                continue;
            for (int s : l.scope_staff)
            {
                if (!f.all() && s != f.staff)
                    continue;
                for (int mi = 0; mi < static_cast<int>(months.size()); ++mi)
                {
                    if (f.day >= 0 && ix.horizon().month_of_day[f.day] != mi)
                        continue;
                    const auto &m = months[mi];
                    per_staff_span(sch, ix, l, s, m.first_day, m.last_day, m.full,
                                   ix.roster()[s].id + "@" + m.key, out);
                }
            }
        }
    }

    void check_groups(const Schedule &sch, const RuleIndex &ix, const Focus &f, std::vector<Violation> &out)
    {
        const int D = ix.day_count();
        const Range dr = day_range(ix, f);
        std::vector<int> which;
        if (f.all())
            for (int g = 0; g < static_cast<int>(ix.groups().size()); ++g)
                which.push_back(g);
        else
            which = ix.groups_of(f.staff);

        for (int gi : which)
        {
            const auto &g = ix.groups()[gi];
            for (int d = dr.lo; d <= dr.hi; ++d)
            {
                if (ix.must_off_day(d))
                    continue;
                if (g.has_conflict)
                {
                    int count = 0;
                    std::vector<CellRef> cells;
                    for (int m : g.members)
                    {
                        if (!g.conflict_counts(sch.at(m, d)))
                            continue;
                        ++count;
                        if (free_cell(ix, m, d))
                            cells.push_back({m, d});
                    }
                    if (count > g.max_concurrent_off)
                        out.push_back(make_violation(g.conflict_meta, std::move(cells), count - g.max_concurrent_off,
                                                     std::to_string(count) + " members of " + g.id + " released on " +
                                                         ix.horizon().dates[d] + " (max " +
                                                         std::to_string(g.max_concurrent_off) + ")",
                                                     g.id + ":conflict@" + ix.horizon().dates[d]));
                }
                if (g.has_coverage && free_cell(ix, g.backup, d) && sch.at(g.backup, d) != g.required_shift)
                {
                    std::vector<CellRef> cells;
                    for (int m : g.members)
                        if (sch.at(m, d) == ShiftValue::Off && free_cell(ix, m, d))
                            cells.push_back({m, d});
                    const bool any_off = std::any_of(g.members.begin(), g.members.end(), [&](int m)
                                                     { return sch.at(m, d) == ShiftValue::Off; });
                    if (any_off)
                    {
                        cells.push_back({g.backup, d});
                        out.push_back(make_violation(g.coverage_meta, std::move(cells), 1,
                                                     "backup " + ix.roster()[g.backup].id + " not on " +
                                                         shift_name(g.required_shift) + " while a member of " + g.id +
                                                         " is off",
                                                     g.id + ":coverage@" + ix.horizon().dates[d]));
                    }
                }
            }

            if (!g.has_proximity)
                continue;
            const int n = g.within_days;
            int lo = 0, hi = D - 1;
            if (f.day >= 0)
            {
                lo = std::max(0, f.day - n);
                hi = std::min(D - 1, f.day + n);
            }
            for (int t = lo; t <= hi; ++t)
            {
                if (ix.must_off_day(t) || sch.at(g.trigger, t) != ShiftValue::Off)
                    continue;
                const int a = std::max(0, t - n), b = std::min(D - 1, t + n);
                bool found = false;
                std::vector<CellRef> cells;
                for (int k = a; k <= b; ++k)
                {
                    if (sch.at(g.target, k) == ShiftValue::Off)
                        found = true;
                    else if (free_cell(ix, g.target, k))
                        cells.push_back({g.target, k});
                }
                if (found)
                    continue;
                if (free_cell(ix, g.trigger, t))
                    cells.push_back({g.trigger, t});
                out.push_back(make_violation(g.proximity_meta, std::move(cells), 1,
                                             ix.roster()[g.target].id + " has no day off within " +
                                                 std::to_string(n) + " days of " + ix.roster()[g.trigger].id +
                                                 "'s day off",
                                             g.id + ":proximity@" + ix.horizon().dates[t]));
            }
        }
    }

    void check_priority(const Schedule &sch, const RuleIndex &ix, const Focus &f, std::vector<Violation> &out)
    {
        const Range sr = staff_range(ix, f), dr = day_range(ix, f);
        for (int s = sr.lo; s <= sr.hi; ++s)
            for (int d = dr.lo; d <= dr.hi; ++d)
            {
                const auto &rules = ix.cell_rules(s, d);
                if (rules.empty())
                    continue;
                const ShiftValue v = sch.at(s, d);
                const int pref = effective_preference(ix, s, d);
                bool off_reported = false;
                for (int ri : rules)
                {
                    const auto &p = ix.priorities()[ri];
                    std::string why;
                    switch (p.type)
                    {
                    case PriorityRuleType::AllowOnlyShifts:
                        if (std::find(p.shifts.begin(), p.shifts.end(), v) == p.shifts.end())
                            why = std::string(shift_name(v)) + " not in allowed shifts";
                        break;
                    case PriorityRuleType::AvoidShift:
                    case PriorityRuleType::AvoidShiftWithExceptions:
                        if (v == p.shift)
                            why = std::string("holds avoided shift ") + shift_name(v);
                        break;
                    case PriorityRuleType::PreferredShift:
                        if (ri == pref && v != p.shift)
                            why = std::string("preferred ") + shift_name(p.shift) + ", holds " + shift_name(v);
                        break;
                    case PriorityRuleType::RequiredOff:
                        if (!off_reported && v != ShiftValue::Off && required_off_effective(ix, s, d))
                        {
                            why = std::string("required off, holds ") + shift_name(v);
                            off_reported = true;
                        }
                        break;
                    }
                    if (why.empty())
                        continue;
                    out.push_back(make_violation(p.meta, {{s, d}}, 1, ix.roster()[s].id + ": " + why,
                                                 p.meta.id + "@" + at_cell(ix, s, d)));
                }
            }
    }

    void check_adjacent(const Schedule &sch, const RuleIndex &ix, const Focus &f, std::vector<Violation> &out)
    {
        if (!ix.adjacent_enabled())
            return;
        const int D = ix.day_count();
        const Range sr = staff_range(ix, f);
        int lo = 0, hi = D - 2;
        if (f.day >= 0)
        {
            lo = std::max(0, f.day - 1);
            hi = std::min(D - 2, f.day);
        }
        for (int s = sr.lo; s <= sr.hi; ++s)
            for (int d = lo; d <= hi; ++d)
            {
                if (!adjacent_bad(sch.at(s, d), sch.at(s, d + 1)))
                    continue;
                std::vector<CellRef> cells;
                if (free_cell(ix, s, d))
                    cells.push_back({s, d});
                if (free_cell(ix, s, d + 1))
                    cells.push_back({s, d + 1});
                if (cells.empty())
                    continue;
                out.push_back(make_violation(ix.adjacent_meta(), std::move(cells), 1,
                                             ix.roster()[s].id + ": " + shift_name(sch.at(s, d)) + " then " +
                                                 shift_name(sch.at(s, d + 1)),
                                             ix.adjacent_meta().id + "@" + at_cell(ix, s, d)));
            }
    }

    void check_fairness(const Schedule &sch, const RuleIndex &ix, const Focus &f, std::vector<Violation> &out)
    {
        if (ix.staff_count() == 0)
            return;
        const int target = ix.off_target(sch);
        const Range sr = staff_range(ix, f);
        for (int s = sr.lo; s <= sr.hi; ++s)
        {
            int off = 0;
            for (int d = 0; d < ix.day_count(); ++d)
                if (sch.at(s, d) == ShiftValue::Off)
                    ++off;
            const int dev = off - target;
            if (std::abs(dev) <= 1)
                continue;
            std::vector<CellRef> cells;
            for (int d = 0; d < ix.day_count(); ++d)
                if (free_cell(ix, s, d) && ((sch.at(s, d) == ShiftValue::Off) == (dev > 0)))
                    cells.push_back({s, d});
            out.push_back(make_violation(ix.fairness_meta(), std::move(cells), std::abs(dev) - 1,
                                         ix.roster()[s].id + " has " + std::to_string(off) + " days off, target " +
                                             std::to_string(target),
                                         ix.fairness_meta().id + "@" + ix.roster()[s].id));
        }
    }

    std::vector<Violation> validate_focus(const Schedule &sch, const RuleIndex &ix, const Focus &f)
    {
        std::vector<Violation> out;
        check_locks(sch, ix, f, out);
        check_eligibility(sch, ix, f, out);
        check_rest(sch, ix, f, out);
        check_monthly(sch, ix, f, out);
        check_daily(sch, ix, f, out);
        check_groups(sch, ix, f, out);
        check_weekly(sch, ix, f, out);
        check_priority(sch, ix, f, out);
        check_adjacent(sch, ix, f, out);
        check_fairness(sch, ix, f, out);
        return out;
    }

    std::vector<Violation> validate(const Schedule &sch, const RuleIndex &ix, int max_tier)
    {
        auto all = validate_focus(sch, ix, Focus{});
        std::vector<Violation> out;
        out.reserve(all.size());
        for (auto &v : all)
            if (v.tier <= max_tier)
                out.push_back(std::move(v));
        std::sort(out.begin(), out.end(), PriorityRegistry::before);
        return out;
    }

    KindTotals totals_by_kind(const std::vector<Violation> &violations)
    {
        KindTotals t{};
        for (const auto &v : violations)
            t[static_cast<size_t>(v.kind)] += v.magnitude;
        return t;
    }

    std::vector<Violation> tier1_violations(const std::vector<Violation> &violations)
    {
        std::vector<Violation> out;
        for (const auto &v : violations)
            if (v.tier == 1)
                out.push_back(v);
        return out;
    }

} // namespace rostra
