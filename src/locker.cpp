// locker.cpp
#include "locker.h"
#include "errors.h"

#include <algorithm>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>

namespace rostra {

int LockedCells::count() const {
  return static_cast<int>(std::count_if(source_.begin(), source_.end(),
                                        [](LockOrigin o) { return o != LockOrigin::None; }));
}

LockedCells lock_mandates(const CalendarMandates& mandates,
                          const std::vector<Staff>& roster,
                          const Horizon& horizon,
                          bool early_for_eligible,
                          LockSummary* summary,
                          const PrefilledCells& prefilled) {
  const int S = static_cast<int>(roster.size());
  const int D = horizon.size();
  LockedCells out(S, D);
  LockSummary sum;

  // Sets make repeated dates harmless; iteration is date-ordered either way.
  const std::set<std::string> work(mandates.must_work.begin(), mandates.must_work.end());
  const std::set<std::string> off(mandates.must_off.begin(), mandates.must_off.end());

  for (const auto& date : work) {
    const int d = horizon.index_of(date);
    if (d < 0) continue;
    sum.must_work_dates.push_back(date);
    for (int s = 0; s < S; ++s) {
      out.lock(s, d, ShiftValue::Normal, ConstraintKind::CalendarMustWork);
      ++sum.must_work_cells;
    }
  }

  for (const auto& date : off) {
    const int d = horizon.index_of(date);
    if (d < 0) continue;
    sum.must_off_dates.push_back(date);
    for (int s = 0; s < S; ++s) {
      const bool early = early_for_eligible && roster[s].may_work_early;
      out.lock(s, d, early ? ShiftValue::Early : ShiftValue::Off, ConstraintKind::CalendarMustDayOff);
      if (early) ++sum.early_cells; else ++sum.off_cells;
    }
  }

  std::unordered_map<std::string, int> staff_pos;
  for (int s = 0; s < S; ++s) staff_pos.emplace(roster[s].id, s);

  for (const auto& [cell, value] : prefilled) {
    auto it = staff_pos.find(cell.staff_id);
    const int d = horizon.index_of(cell.date);
    if (it == staff_pos.end() || d < 0) {
      ++sum.prefilled_skipped;
      continue;
    }
    const int s = it->second;
    if (auto mandated = out.locked_value(s, d)) {
      if (*mandated != value)
        throw ConfigurationError("prefilledSchedule", "prefilled " + std::string(shift_name(value)) + " for " +
                                 cell.staff_id + " on " + cell.date + " contradicts the calendar mandate (" +
                                 shift_name(*mandated) + ")");
      continue;
    }
    out.lock(s, d, value, LockOrigin::Prefilled);
    ++sum.prefilled_cells;
  }

  sum.total = sum.must_work_cells + sum.early_cells + sum.off_cells + sum.prefilled_cells;
  if (summary) *summary = std::move(sum);
  return out;
}

void apply_locks(const LockedCells& locks, Schedule& schedule) {
  for (int s = 0; s < schedule.staff_count(); ++s)
    for (int d = 0; d < schedule.day_count(); ++d)
      if (auto v = locks.locked_value(s, d)) schedule.set(s, d, *v);
}

std::vector<CellRef> verify_locked(const LockedCells& locks, const Schedule& schedule) {
  std::vector<CellRef> bad;
  for (int s = 0; s < schedule.staff_count(); ++s)
    for (int d = 0; d < schedule.day_count(); ++d) {
      auto v = locks.locked_value(s, d);
      if (v && schedule.at(s, d) != *v) bad.push_back({s, d});
    }
  return bad;
}

} // namespace rostra
