// repair.cpp
#include "repair.h"
#include "errors.h"
#include "log.h"
#include "penalties.h"
#include "repair_solver.h"
#include "validation.h"

#include <algorithm>
#include <iostream>
#include <unordered_map>
#include <utility>

namespace rostra
{

    namespace
    {

        using KeyMap = std::unordered_map<std::string, const Violation *>;

        KeyMap by_key(const std::vector<Violation> &vs)
        {
            KeyMap m;
            for (const auto &v : vs)
                m.emplace(v.key, &v);
            return m;
        }

        // Target gone or smaller, and nothing of equal-or-higher precedence (or Tier 1) new or worse.
        bool acceptable(const Violation &target, const KeyMap &before, const std::vector<Violation> &after,
                        bool &resolved)
        {
            resolved = true;
            for (const auto &a : after)
            {
                if (a.key == target.key)
                {
                    if (a.magnitude >= target.magnitude)
                        return false;
                    resolved = false;
                    continue;
                }
                auto it = before.find(a.key);
                const bool worse = it == before.end() || a.magnitude > it->second->magnitude;
                if (worse && (a.priority <= target.priority || a.tier == 1))
                    return false;
            }
            return true;
        }

        void add_attempt(std::vector<std::string> &attempted, const std::string &key)
        {
            auto it = std::lower_bound(attempted.begin(), attempted.end(), key);
            if (it == attempted.end() || *it != key)
                attempted.insert(it, key);
        }

    } // namespace

    std::vector<Violation> RepairEngine::greedy(ScheduleState &state, std::vector<Violation> current,
                                                RepairSummary &summary, std::vector<std::string> &attempted) const
    {
        static const ShiftValue kTryOrder[] = {ShiftValue::Normal, ShiftValue::Late, ShiftValue::Early, ShiftValue::Off};

        for (int pass = 1; pass <= opt_.max_passes && !current.empty(); ++pass)
        {
            ++summary.passes;
            bool progress = false;
            const std::vector<Violation> worklist = current;
            KeyMap live = by_key(current);

            for (const auto &w : worklist)
            {
                auto it = live.find(w.key);
                if (it == live.end())
                    continue;
                const Violation target = *it->second;
                add_attempt(attempted, target.key);

                bool have = false, best_resolved = false;
                long long best_score = 0;
                CellRef best_cell;
                ShiftValue best_value = ShiftValue::Normal;
                std::vector<Violation> best_after;

                for (const auto &c : target.cells)
                {
                    if (state.locks().is_locked(c.staff, c.day))
                        continue;
                    const ShiftValue cur = state.at(c.staff, c.day);
                    for (ShiftValue v : kTryOrder)
                    {
                        if (v == cur || !index_.roster()[c.staff].eligible(v))
                            continue;
                        Schedule trial = state.schedule();
                        trial.set(c.staff, c.day, v);
                        auto after = validate(trial, index_, opt_.tier_limit);
                        bool resolved = false;
                        if (!acceptable(target, live, after, resolved))
                            continue;
                        const long long score = penalty_score(after);
                        if (!have || (resolved && !best_resolved) ||
                            (resolved == best_resolved && score < best_score))
                        {
                            have = true;
                            best_resolved = resolved;
                            best_score = score;
                            best_cell = c;
                            best_value = v;
                            best_after = std::move(after);
                        }
                    }
                }

                if (!have)
                    continue;

                RepairAction act;
                act.constraint_id = target.constraint_id;
                act.kind = target.kind;
                act.cell = best_cell;
                act.from = state.at(best_cell.staff, best_cell.day);
                act.to = best_value;
                act.pass = pass;
                state.set(best_cell.staff, best_cell.day, best_value);
                summary.actions.push_back(act);
                ROSTRA_LOG(opt_.verbose, "[repair] pass %d %s: %s %s -> %s\n", pass, target.key.c_str(),
                           index_.roster()[best_cell.staff].id.c_str(), shift_name(act.from), shift_name(act.to));

                current = std::move(best_after);
                live = by_key(current);
                progress = true;
            }

            if (!progress)
                break;
        }
        return current;
    }

    RepairSummary RepairEngine::repair(ScheduleState &state) const
    {
        RepairSummary summary;

        const auto broken = verify_locked(index_.locks(), state.schedule());
        if (!broken.empty())
            throw InvariantViolation("calendar", index_.date_cells(broken), "locked cell changed before repair");

        std::vector<std::string> attempted;
        auto current = validate(state.schedule(), index_, opt_.tier_limit);
        current = greedy(state, std::move(current), summary, attempted);

        const size_t tier1_left = tier1_violations(current).size();
        if (opt_.use_solver && tier1_left > 0)
        {
            summary.solver_used = true;
            SolverRepairParams params;
            params.time_limit_seconds = opt_.solver_time_limit_seconds;
            params.log_search = opt_.verbose;
            const auto result = solve_minimal_change(state.schedule(), index_, params);
            summary.solver_status = result.status;

            if (result.feasible)
            {
                const std::string cause = tier1_violations(current).front().constraint_id;
                const ConstraintKind cause_kind = tier1_violations(current).front().kind;
                for (int s = 0; s < state.staff_count(); ++s)
                    for (int d = 0; d < state.day_count(); ++d)
                    {
                        if (result.schedule.at(s, d) == state.at(s, d) || state.locks().is_locked(s, d))
                            continue;
                        RepairAction act;
                        act.constraint_id = cause;
                        act.kind = cause_kind;
                        act.cell = {s, d};
                        act.from = state.at(s, d);
                        act.to = result.schedule.at(s, d);
                        act.pass = 0;
                        summary.actions.push_back(act);
                    }
                state.assign_unlocked(result.schedule);
                current = validate(state.schedule(), index_, opt_.tier_limit);
                summary.solver_improved = tier1_violations(current).size() < tier1_left;
                // Soft leftovers the solver shuffled around; greedy never adds Tier-1 breaches.
                current = greedy(state, std::move(current), summary, attempted);
            }
            if (opt_.verbose)
            {
                std::cerr << "[repair] solver status=" << summary.solver_status
                          << " tier1 before=" << tier1_left
                          << " after=" << tier1_violations(current).size() << "\n";
            }
        }

        const KeyMap left = by_key(current);
        summary.attempted = static_cast<int>(attempted.size());
        summary.repaired = static_cast<int>(std::count_if(attempted.begin(), attempted.end(),
                                                          [&](const std::string &k)
                                                          { return left.find(k) == left.end(); }));
        summary.unresolved = std::move(current);
        return summary;
    }

} // namespace rostra
