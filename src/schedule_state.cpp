// schedule_state.cpp
#include "schedule_state.h"

#include <stdexcept>
#include <utility>

namespace rostra {

ScheduleState::ScheduleState(Schedule schedule, const LockedCells& locks)
    : schedule_(std::move(schedule)), locks_(&locks) {
  rebuild_counters();
}

void ScheduleState::rebuild_counters() {
  day_counts_.assign(day_count(), Counts{});
  staff_counts_.assign(staff_count(), Counts{});
  for (int s = 0; s < staff_count(); ++s)
    for (int d = 0; d < day_count(); ++d) {
      const int v = shift_index(schedule_.at(s, d));
      day_counts_[d][v] += 1;
      staff_counts_[s][v] += 1;
    }
}

bool ScheduleState::set(int s, int d, ShiftValue v) {
  if (locks_->is_locked(s, d)) return false;
  const ShiftValue old = schedule_.at(s, d);
  if (old == v) return true;
  day_counts_[d][shift_index(old)] -= 1;
  staff_counts_[s][shift_index(old)] -= 1;
  day_counts_[d][shift_index(v)] += 1;
  staff_counts_[s][shift_index(v)] += 1;
  schedule_.set(s, d, v);
  ++changes_;
  return true;
}

int ScheduleState::assign_unlocked(const Schedule& from) {
  if (from.staff_count() != staff_count() || from.day_count() != day_count())
    throw std::invalid_argument("assign_unlocked: schedule shapes differ");
  int changed = 0;
  for (int s = 0; s < staff_count(); ++s)
    for (int d = 0; d < day_count(); ++d) {
      if (locks_->is_locked(s, d) || from.at(s, d) == at(s, d)) continue;
      set(s, d, from.at(s, d));
      ++changed;
    }
  return changed;
}

} // namespace rostra
