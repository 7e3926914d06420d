// repair_solver.cpp
#include "repair_solver.h"
#include "priority_rules.h"

#include <algorithm>
#include <iostream>
#include <vector>

#include <ortools/sat/cp_model.h>
#include <ortools/sat/cp_model_solver.h>
#include <ortools/sat/model.h>
#include <ortools/sat/sat_parameters.pb.h>

namespace sat = operations_research::sat;

namespace rostra
{

    namespace
    {

        // x[(s * D + d) * 4 + v]
        struct CellVars
        {
            int days = 0;
            std::vector<sat::BoolVar> x;

            const sat::BoolVar &at(int s, int d, ShiftValue v) const
            {
                return x[(static_cast<size_t>(s) * days + d) * kShiftValueCount + shift_index(v)];
            }
        };

        void bound(sat::CpModelBuilder &cp, const sat::LinearExpr &sum, int min, int max)
        {
            if (max >= 0)
                cp.AddLessOrEqual(sum, max);
            if (min > 0)
                cp.AddGreaterOrEqual(sum, min);
        }

        void add_limits(sat::CpModelBuilder &cp, const CellVars &X, const RuleIndex &ix)
        {
            const int D = ix.day_count();
            for (const auto &l : ix.daily())
            {
                if (l.meta.tier != 1)
                    continue;
                for (int d = 0; d < D; ++d)
                {
                    if (!l.day_on[d])
                        continue;
                    sat::LinearExpr sum;
                    for (int s : l.scope_staff)
                        sum += X.at(s, d, l.shift);
                    bound(cp, sum, std::min<int>(l.min, static_cast<int>(l.scope_staff.size())), l.max);
                }
            }
            for (const auto &l : ix.weekly())
            {
                if (l.meta.tier != 1)
                    continue;
                for (int s : l.scope_staff)
                    for (int start = 0; start + l.window_days <= D; ++start)
                    {
                        sat::LinearExpr sum;
                        int on = 0;
                        for (int d = start; d < start + l.window_days; ++d)
                            if (l.day_on[d])
                            {
                                sum += X.at(s, d, l.shift);
                                ++on;
                            }
                        bound(cp, sum, std::min(l.min, on), l.max);
                    }
            }
            for (const auto &l : ix.monthly())
            {
                if (l.meta.tier != 1)
                    continue;
                for (int s : l.scope_staff)
                    for (const auto &m : ix.horizon().months)
                    {
                        sat::LinearExpr sum;
                        int on = 0;
                        for (int d = m.first_day; d <= m.last_day; ++d)
                            if (l.day_on[d])
                            {
                                sum += X.at(s, d, l.shift);
                                ++on;
                            }
                        bound(cp, sum, m.full ? std::min(l.min, on) : 0, l.max);
                    }
            }
        }

        void add_groups(sat::CpModelBuilder &cp, const CellVars &X, const RuleIndex &ix)
        {
            const int D = ix.day_count();
            for (const auto &g : ix.groups())
            {
                for (int d = 0; d < D; ++d)
                {
                    if (ix.must_off_day(d))
                        continue;
                    if (g.has_conflict && g.conflict_meta.tier == 1)
                    {
                        sat::LinearExpr sum;
                        for (int m : g.members)
                        {
                            sum += X.at(m, d, ShiftValue::Off);
                            if (g.count_early)
                                sum += X.at(m, d, ShiftValue::Early);
                        }
                        cp.AddLessOrEqual(sum, g.max_concurrent_off);
                    }
                    if (g.has_coverage && g.coverage_meta.tier == 1 && !ix.locks().is_locked(g.backup, d))
                    {
                        for (int m : g.members)
                            cp.AddImplication(X.at(m, d, ShiftValue::Off), X.at(g.backup, d, g.required_shift));
                    }
                }
                if (g.has_proximity && g.proximity_meta.tier == 1)
                {
                    const int n = g.within_days;
                    for (int t = 0; t < D; ++t)
                    {
                        if (ix.must_off_day(t))
                            continue;
                        std::vector<sat::BoolVar> any;
                        for (int k = std::max(0, t - n); k <= std::min(D - 1, t + n); ++k)
                            any.push_back(X.at(g.target, k, ShiftValue::Off));
                        cp.AddBoolOr(any).OnlyEnforceIf(X.at(g.trigger, t, ShiftValue::Off));
                    }
                }
            }
        }

        void add_cells(sat::CpModelBuilder &cp, const CellVars &X, const RuleIndex &ix)
        {
            for (int s = 0; s < ix.staff_count(); ++s)
                for (int d = 0; d < ix.day_count(); ++d)
                {
                    if (auto lv = ix.locks().locked_value(s, d))
                    {
                        cp.AddEquality(X.at(s, d, *lv), 1);
                        continue;
                    }
                    for (ShiftValue v : kAllShiftValues)
                        if (!ix.roster()[s].eligible(v))
                            cp.AddEquality(X.at(s, d, v), 0);

                    const int pref = effective_preference(ix, s, d);
                    for (int ri : ix.cell_rules(s, d))
                    {
                        const auto &p = ix.priorities()[ri];
                        if (p.meta.tier != 1)
                            continue;
                        switch (p.type)
                        {
                        case PriorityRuleType::AllowOnlyShifts:
                            for (ShiftValue v : kAllShiftValues)
                                if (std::find(p.shifts.begin(), p.shifts.end(), v) == p.shifts.end())
                                    cp.AddEquality(X.at(s, d, v), 0);
                            break;
                        case PriorityRuleType::AvoidShift:
                        case PriorityRuleType::AvoidShiftWithExceptions:
                            cp.AddEquality(X.at(s, d, p.shift), 0);
                            break;
                        case PriorityRuleType::PreferredShift:
                            if (ri == pref)
                                cp.AddEquality(X.at(s, d, p.shift), 1);
                            break;
                        case PriorityRuleType::RequiredOff:
                            if (required_off_effective(ix, s, d))
                                cp.AddEquality(X.at(s, d, ShiftValue::Off), 1);
                            break;
                        }
                    }
                }
        }

        void add_rest_and_adjacent(sat::CpModelBuilder &cp, const CellVars &X, const RuleIndex &ix)
        {
            const int D = ix.day_count();
            const int max_run = ix.max_consecutive_work_days();
            if (max_run > 0 && ix.rest_meta().tier == 1)
            {
                // Every max_run + 1 consecutive days hold at least one Off.
                for (int s = 0; s < ix.staff_count(); ++s)
                    for (int start = 0; start + max_run < D; ++start)
                    {
                        std::vector<sat::BoolVar> offs;
                        for (int d = start; d <= start + max_run; ++d)
                            offs.push_back(X.at(s, d, ShiftValue::Off));
                        cp.AddBoolOr(offs);
                    }
            }
            if (ix.adjacent_enabled() && ix.adjacent_meta().tier == 1)
            {
                for (int s = 0; s < ix.staff_count(); ++s)
                    for (int d = 0; d + 1 < D; ++d)
                    {
                        if (ix.locks().is_locked(s, d) && ix.locks().is_locked(s, d + 1))
                            continue;
                        const auto &off0 = X.at(s, d, ShiftValue::Off);
                        const auto &off1 = X.at(s, d + 1, ShiftValue::Off);
                        cp.AddLessOrEqual(sat::LinearExpr(off0) + off1, 1);
                        cp.AddLessOrEqual(sat::LinearExpr(X.at(s, d, ShiftValue::Early)) + off1, 1);
                        cp.AddLessOrEqual(sat::LinearExpr(off0) + X.at(s, d + 1, ShiftValue::Early), 1);
                    }
            }
        }

    } // namespace

    SolverRepairResult solve_minimal_change(const Schedule &current, const RuleIndex &ix,
                                            const SolverRepairParams &params)
    {
        SolverRepairResult out;
        out.schedule = current;
        const int S = ix.staff_count();
        const int D = ix.day_count();

        sat::CpModelBuilder cp;
        CellVars X;
        X.days = D;
        X.x.reserve(static_cast<size_t>(S) * D * kShiftValueCount);
        for (int s = 0; s < S; ++s)
            for (int d = 0; d < D; ++d)
            {
                sat::LinearExpr one;
                for (int v = 0; v < kShiftValueCount; ++v)
                {
                    X.x.push_back(cp.NewBoolVar());
                    one += X.x.back();
                }
                cp.AddEquality(one, 1);
            }

        add_cells(cp, X, ix);
        add_rest_and_adjacent(cp, X, ix);
        add_limits(cp, X, ix);
        add_groups(cp, X, ix);

        // Keep as many cells as possible.
        sat::LinearExpr kept;
        for (int s = 0; s < S; ++s)
            for (int d = 0; d < D; ++d)
                kept += X.at(s, d, current.at(s, d));
        cp.Maximize(kept);

        sat::SatParameters p;
        p.set_max_time_in_seconds(params.time_limit_seconds);
        p.set_num_search_workers(1);
        p.set_log_search_progress(params.log_search);

        sat::Model model;
        model.Add(sat::NewSatParameters(p));
        const sat::CpSolverResponse response = sat::SolveCpModel(cp.Build(), &model);

        out.status = sat::CpSolverStatus_Name(response.status());
        out.optimal = response.status() == sat::CpSolverStatus::OPTIMAL;
        out.feasible = out.optimal || response.status() == sat::CpSolverStatus::FEASIBLE;

        if (!out.feasible)
        {
            if (params.log_search)
            {
                std::cerr << "[cpsat] no repair: status=" << out.status
                          << " staff=" << S << " days=" << D << "\n";
            }
            return out;
        }

        for (int s = 0; s < S; ++s)
            for (int d = 0; d < D; ++d)
                for (ShiftValue v : kAllShiftValues)
                    if (sat::SolutionBooleanValue(response, X.at(s, d, v)))
                    {
                        if (out.schedule.at(s, d) != v)
                            ++out.cells_changed;
                        out.schedule.set(s, d, v);
                        break;
                    }

        if (params.log_search)
        {
            std::cerr << "[cpsat] status=" << out.status << " changed=" << out.cells_changed
                      << " wall=" << response.wall_time() << "s\n";
        }
        return out;
    }

} // namespace rostra
