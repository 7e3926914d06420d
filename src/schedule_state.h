// schedule_state.h
#pragma once
#include <array>
#include <vector>

#include "locker.h"
#include "types.h"

namespace rostra {

// Working schedule of one run plus the running per-day / per-staff counters
// the generator balances against. Locked cells are read-only through it.
class ScheduleState {
 public:
  ScheduleState(Schedule schedule, const LockedCells& locks);

  const Schedule& schedule() const { return schedule_; }
  const LockedCells& locks() const { return *locks_; }

  int staff_count() const { return schedule_.staff_count(); }
  int day_count() const { return schedule_.day_count(); }
  ShiftValue at(int s, int d) const { return schedule_.at(s, d); }

  // Returns false, leaving the cell untouched, when the cell is locked.
  bool set(int s, int d, ShiftValue v);

  // Overwrites every unlocked cell from another schedule of the same shape.
  int assign_unlocked(const Schedule& from);

  int day_count_of(int d, ShiftValue v) const { return day_counts_[d][shift_index(v)]; }
  int staff_count_of(int s, ShiftValue v) const { return staff_counts_[s][shift_index(v)]; }

  // Successful writes that changed a value since construction.
  long changes() const { return changes_; }

 private:
  using Counts = std::array<int, kShiftValueCount>;

  void rebuild_counters();

  Schedule schedule_;
  const LockedCells* locks_;
  std::vector<Counts> day_counts_;     // day -> value -> staff holding it
  std::vector<Counts> staff_counts_;   // staff -> value -> days holding it
  long changes_ = 0;
};

} // namespace rostra
