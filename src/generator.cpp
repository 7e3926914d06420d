// generator.cpp
#include "generator.h"
#include "log.h"
#include "move_guard.h"
#include "priority_rules.h"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <tuple>
#include <utility>

namespace rostra
{

    namespace
    {

        int prio(ConstraintKind k)
        {
            return PriorityRegistry::priority_of(k);
        }

    } // namespace

    RuleBasedGenerator::RuleBasedGenerator(const RuleIndex &index, GeneratorOptions opt, std::mt19937_64 &rng)
        : index_(index), opt_(opt), rng_(rng)
    {
    }

    ShiftValue RuleBasedGenerator::replacement(int s, int d, ShiftValue avoid) const
    {
        for (ShiftValue v : permitted_values(index_, s, d))
            if (v != avoid)
                return v;
        for (ShiftValue v : {ShiftValue::Normal, ShiftValue::Late, ShiftValue::Early, ShiftValue::Off})
            if (v != avoid && index_.roster()[s].eligible(v))
                return v;
        return ShiftValue::Normal;
    }

    int RuleBasedGenerator::daily_count(const ScheduleState &state, const CompiledLimit &l, int d) const
    {
        int c = 0;
        for (int s : l.scope_staff)
            if (state.at(s, d) == l.shift)
                ++c;
        return c;
    }

    // ---------- stage 2: group rules ----------

    int RuleBasedGenerator::apply_conflict(ScheduleState &state, const CompiledGroup &g)
    {
        int changed = 0;
        const int mover = prio(ConstraintKind::StaffGroupConflict);
        for (int d = 0; d < state.day_count(); ++d)
        {
            if (index_.must_off_day(d))
                continue;
            int count = 0;
            std::vector<int> holders;
            for (int m : g.members)
            {
                if (!g.conflict_counts(state.at(m, d)))
                    continue;
                ++count;
                if (!state.locks().is_locked(m, d))
                    holders.push_back(m);
            }
            if (count <= g.max_concurrent_off)
                continue;
            // Members with the most days off give theirs up first.
            std::stable_sort(holders.begin(), holders.end(), [&](int a, int b)
                             { return state.staff_count_of(a, ShiftValue::Off) > state.staff_count_of(b, ShiftValue::Off); });
            for (int m : holders)
            {
                if (count <= g.max_concurrent_off)
                    break;
                ShiftValue v = ShiftValue::Normal;
                for (ShiftValue cand : permitted_values(index_, m, d))
                    if (!g.conflict_counts(cand))
                    {
                        v = cand;
                        break;
                    }
                if (guarded_set(state, index_, m, d, v, mover))
                {
                    --count;
                    ++changed;
                }
            }
        }
        return changed;
    }

    int RuleBasedGenerator::apply_coverage(ScheduleState &state, const CompiledGroup &g)
    {
        int changed = 0;
        const int mover = prio(ConstraintKind::BackupCoverage);
        for (int d = 0; d < state.day_count(); ++d)
        {
            if (index_.must_off_day(d) || state.locks().is_locked(g.backup, d))
                continue;
            const bool any_off = std::any_of(g.members.begin(), g.members.end(), [&](int m)
                                             { return state.at(m, d) == ShiftValue::Off; });
            if (!any_off || state.at(g.backup, d) == g.required_shift)
                continue;
            if (guarded_set(state, index_, g.backup, d, g.required_shift, mover))
            {
                ++changed;
                continue;
            }
            // Backup cannot take the shift: bring the released members back instead.
            for (int m : g.members)
                if (state.at(m, d) == ShiftValue::Off &&
                    guarded_set(state, index_, m, d, replacement(m, d, ShiftValue::Off), mover))
                    ++changed;
        }
        return changed;
    }

    int RuleBasedGenerator::apply_proximity(ScheduleState &state, const CompiledGroup &g)
    {
        int changed = 0;
        const int mover = prio(ConstraintKind::ProximityPattern);
        const int D = state.day_count();
        const int n = g.within_days;
        for (int t = 0; t < D; ++t)
        {
            if (index_.must_off_day(t) || state.at(g.trigger, t) != ShiftValue::Off)
                continue;
            const int lo = std::max(0, t - n), hi = std::min(D - 1, t + n);
            bool found = false;
            for (int k = lo; k <= hi && !found; ++k)
                found = state.at(g.target, k) == ShiftValue::Off;
            if (found)
                continue;
            // Closest date first: t, t-1, t+1, t-2, ...
            for (int dist = 0; dist <= n; ++dist)
            {
                bool done = false;
                for (int k : {t - dist, t + dist})
                {
                    if (k < lo || k > hi)
                        continue;
                    if (guarded_set(state, index_, g.target, k, ShiftValue::Off, mover))
                    {
                        ++changed;
                        done = true;
                        break;
                    }
                }
                if (done)
                    break;
            }
        }
        return changed;
    }

    int RuleBasedGenerator::apply_group_rules(ScheduleState &state)
    {
        int changed = 0;
        for (const auto &g : index_.groups())
        {
            if (g.has_conflict)
                changed += apply_conflict(state, g);
            if (g.has_coverage)
                changed += apply_coverage(state, g);
            if (g.has_proximity)
                changed += apply_proximity(state, g);
        }
        return changed;
    }

    // ---------- stages 3, 5, 7: priority rules ----------

    int RuleBasedGenerator::apply_priority_rules(ScheduleState &state)
    {
        int changed = 0;
        for (int s = 0; s < state.staff_count(); ++s)
            for (int d = 0; d < state.day_count(); ++d)
            {
                if (state.locks().is_locked(s, d))
                    continue;
                auto r = resolve_cell(index_, s, d, state.at(s, d), rng_);
                if (r && guarded_set(state, index_, s, d, r->value, prio(r->kind)))
                    ++changed;
            }
        return changed;
    }

    int RuleBasedGenerator::enforce_priority_fixed_point(ScheduleState &state)
    {
        int total = 0;
        for (int it = 0; it < opt_.max_fixed_point_iterations; ++it)
        {
            const int c = apply_priority_rules(state);
            total += c;
            if (c == 0)
                break;
        }
        return total;
    }

    // ---------- stage 4: limits ----------

    int RuleBasedGenerator::apply_rest(ScheduleState &state)
    {
        const int max_run = index_.max_consecutive_work_days();
        if (max_run <= 0)
            return 0;
        const int mover = prio(ConstraintKind::ConsecutiveWorkLimit);
        int changed = 0;
        for (int s = 0; s < state.staff_count(); ++s)
        {
            int run = 0;
            for (int d = 0; d < state.day_count(); ++d)
            {
                if (!is_working(state.at(s, d)))
                {
                    run = 0;
                    continue;
                }
                if (++run <= max_run)
                    continue;
                // Break the streak inside its last max_run + 1 days, on the day with fewest Off.
                std::vector<int> cand;
                for (int k = d; k >= d - max_run && k >= 0; --k)
                    if (!state.locks().is_locked(s, k))
                        cand.push_back(k);
                std::stable_sort(cand.begin(), cand.end(), [&](int a, int b)
                                 { return state.day_count_of(a, ShiftValue::Off) < state.day_count_of(b, ShiftValue::Off); });
                for (int k : cand)
                    if (guarded_set(state, index_, s, k, ShiftValue::Off, mover))
                    {
                        ++changed;
                        run = d - k;
                        break;
                    }
            }
        }
        return changed;
    }

    int RuleBasedGenerator::apply_monthly(ScheduleState &state, const CompiledLimit &l)
    {
        const int mover = prio(ConstraintKind::MonthlyLimit);
        int changed = 0;
        for (int s : l.scope_staff)
            for (const auto &m : index_.horizon().months)
            {
                int count = 0, on = 0;
                std::vector<int> hits, misses;
                for (int d = m.first_day; d <= m.last_day; ++d)
                {
                    if (!l.day_on[d])
                        continue;
                    ++on;
                    const bool hit = state.at(s, d) == l.shift;
                    if (hit)
                        ++count;
                    if (!state.locks().is_locked(s, d))
                        (hit ? hits : misses).push_back(d);
                }
                if (l.max >= 0 && count > l.max)
                {
                    // Release the busiest days first.
                    std::stable_sort(hits.begin(), hits.end(), [&](int a, int b)
                                     { return state.day_count_of(a, l.shift) > state.day_count_of(b, l.shift); });
                    for (int d : hits)
                    {
                        if (count <= l.max)
                            break;
                        if (guarded_set(state, index_, s, d, replacement(s, d, l.shift), mover))
                        {
                            --count;
                            ++changed;
                        }
                    }
                }
                else if (m.full && l.min > 0 && count < std::min(l.min, on))
                {
                    std::stable_sort(misses.begin(), misses.end(), [&](int a, int b)
                                     { return state.day_count_of(a, l.shift) < state.day_count_of(b, l.shift); });
                    for (int d : misses)
                    {
                        if (count >= std::min(l.min, on))
                            break;
                        if (guarded_set(state, index_, s, d, l.shift, mover))
                        {
                            ++count;
                            ++changed;
                        }
                    }
                }
            }
        return changed;
    }

    int RuleBasedGenerator::apply_daily(ScheduleState &state, const CompiledLimit &l)
    {
        const int mover = prio(ConstraintKind::DailyLimit);
        int changed = 0;
        for (int d = 0; d < state.day_count(); ++d)
        {
            if (!l.day_on[d])
                continue;
            int count = daily_count(state, l, d);
            if (l.max >= 0 && count > l.max)
            {
                std::vector<int> holders;
                for (int s : l.scope_staff)
                    if (state.at(s, d) == l.shift && !state.locks().is_locked(s, d))
                        holders.push_back(s);
                std::stable_sort(holders.begin(), holders.end(), [&](int a, int b)
                                 { return state.staff_count_of(a, l.shift) > state.staff_count_of(b, l.shift); });
                for (int s : holders)
                {
                    if (count <= l.max)
                        break;
                    if (!guarded_set(state, index_, s, d, replacement(s, d, l.shift), mover))
                        continue;
                    --count;
                    ++changed;

                    // Hand the same staff the shift on the least-loaded day that still has room.
                    int best = -1, best_count = 0;
                    for (int k = 0; k < state.day_count(); ++k)
                    {
                        if (k == d || !l.day_on[k] || state.at(s, k) == l.shift || state.locks().is_locked(s, k))
                            continue;
                        const int c = daily_count(state, l, k);
                        if (c >= l.max)
                            continue;
                        if (best < 0 || c < best_count)
                        {
                            best = k;
                            best_count = c;
                        }
                    }
                    if (best >= 0 && guarded_set(state, index_, s, best, l.shift, mover))
                        ++changed;
                }
            }
            else if (l.min > 0 && count < l.min)
            {
                std::vector<int> cand;
                for (int s : l.scope_staff)
                    if (state.at(s, d) != l.shift && !state.locks().is_locked(s, d))
                        cand.push_back(s);
                std::stable_sort(cand.begin(), cand.end(), [&](int a, int b)
                                 { return state.staff_count_of(a, l.shift) < state.staff_count_of(b, l.shift); });
                for (int s : cand)
                {
                    if (count >= l.min)
                        break;
                    if (guarded_set(state, index_, s, d, l.shift, mover))
                    {
                        ++count;
                        ++changed;
                    }
                }
            }
        }
        return changed;
    }

    int RuleBasedGenerator::apply_weekly(ScheduleState &state, const CompiledLimit &l)
    {
        const int mover = prio(ConstraintKind::WeeklyLimit);
        const int w = l.window_days;
        int changed = 0;
        for (int s : l.scope_staff)
            for (int start = 0; start + w <= state.day_count(); ++start)
            {
                int count = 0, on = 0;
                std::vector<int> hits, misses;
                for (int d = start; d < start + w; ++d)
                {
                    if (!l.day_on[d])
                        continue;
                    ++on;
                    const bool hit = state.at(s, d) == l.shift;
                    if (hit)
                        ++count;
                    if (!state.locks().is_locked(s, d))
                        (hit ? hits : misses).push_back(d);
                }
                if (l.max >= 0 && count > l.max)
                {
                    std::stable_sort(hits.begin(), hits.end(), [&](int a, int b)
                                     { return state.day_count_of(a, l.shift) > state.day_count_of(b, l.shift); });
                    for (int d : hits)
                    {
                        if (count <= l.max)
                            break;
                        if (guarded_set(state, index_, s, d, replacement(s, d, l.shift), mover))
                        {
                            --count;
                            ++changed;
                        }
                    }
                }
                else if (l.min > 0 && count < std::min(l.min, on))
                {
                    std::stable_sort(misses.begin(), misses.end(), [&](int a, int b)
                                     { return state.day_count_of(a, l.shift) < state.day_count_of(b, l.shift); });
                    for (int d : misses)
                    {
                        if (count >= std::min(l.min, on))
                            break;
                        if (guarded_set(state, index_, s, d, l.shift, mover))
                        {
                            ++count;
                            ++changed;
                        }
                    }
                }
            }
        return changed;
    }

    int RuleBasedGenerator::apply_limits(ScheduleState &state)
    {
        int changed = apply_rest(state);
        for (const auto &l : index_.monthly())
            changed += apply_monthly(state, l);
        for (const auto &l : index_.daily())
            changed += apply_daily(state, l);
        for (const auto &l : index_.weekly())
            changed += apply_weekly(state, l);
        return changed;
    }

    // ---------- stage 6: fairness ----------

    int RuleBasedGenerator::distribute_off_days(ScheduleState &state)
    {
        const int S = state.staff_count();
        const int D = state.day_count();
        if (S == 0 || D == 0)
            return 0;
        const int mover = prio(ConstraintKind::FairDistribution);
        const int target = index_.off_target(state.schedule());
        int changed = 0;

        std::vector<char> exhausted(S, 0);
        for (int round = 0; round < S * D; ++round)
        {
            // Largest running deficit first, lowest index on ties.
            int who = -1, worst = 0;
            for (int s = 0; s < S; ++s)
            {
                if (exhausted[s])
                    continue;
                const int deficit = target - state.staff_count_of(s, ShiftValue::Off);
                if (std::abs(deficit) <= 1)
                    continue;
                if (who < 0 || std::abs(deficit) > worst)
                {
                    who = s;
                    worst = std::abs(deficit);
                }
            }
            if (who < 0)
                break;

            const bool add = state.staff_count_of(who, ShiftValue::Off) < target;
            std::vector<int> days;
            for (int d = 0; d < D; ++d)
                if (!state.locks().is_locked(who, d) && (state.at(who, d) == ShiftValue::Off) != add)
                    days.push_back(d);
            // Adding: quietest days first. Removing: busiest days first.
            std::stable_sort(days.begin(), days.end(), [&](int a, int b)
                             {
                                 const int ca = state.day_count_of(a, ShiftValue::Off);
                                 const int cb = state.day_count_of(b, ShiftValue::Off);
                                 return add ? ca < cb : ca > cb; });

            bool moved = false;
            for (int d : days)
            {
                const ShiftValue v = add ? ShiftValue::Off : replacement(who, d, ShiftValue::Off);
                if (guarded_set(state, index_, who, d, v, mover))
                {
                    ++changed;
                    moved = true;
                    break;
                }
            }
            if (!moved)
                exhausted[who] = 1;
        }
        return changed;
    }

    // ---------- pipeline ----------

    std::vector<StageStat> RuleBasedGenerator::run(ScheduleState &state, const StageHook &hook)
    {
        using StageFn = int (RuleBasedGenerator::*)(ScheduleState &);
        const std::vector<std::pair<const char *, StageFn>> stages = {
            {"group_rules", &RuleBasedGenerator::apply_group_rules},
            {"priority_rules", &RuleBasedGenerator::enforce_priority_fixed_point},
            {"limits", &RuleBasedGenerator::apply_limits},
            {"priority_reapply", &RuleBasedGenerator::enforce_priority_fixed_point},
            {"fairness", &RuleBasedGenerator::distribute_off_days},
            {"priority_final", &RuleBasedGenerator::enforce_priority_fixed_point},
        };

        std::vector<StageStat> stats;
        for (int pass = 1; pass <= opt_.max_pipeline_passes; ++pass)
        {
            int pass_changes = 0;
            for (const auto &st : stages)
            {
                StageStat stat;
                stat.stage = st.first;
                stat.pass = pass;
                stat.cells_changed = (this->*st.second)(state);
                pass_changes += stat.cells_changed;
                ROSTRA_LOG(opt_.verbose, "[generator] pass %d %-16s changed=%d\n", pass, st.first, stat.cells_changed);
                stats.push_back(stat);
                if (hook)
                    hook(stats.back(), state);
            }
            if (pass_changes == 0)
                break;
        }

        if (opt_.verbose)
        {
            std::cerr << "[generator] done after " << (stats.empty() ? 0 : stats.back().pass)
                      << " pass(es), total writes=" << state.changes() << "\n";
        }
        return stats;
    }

} // namespace rostra
