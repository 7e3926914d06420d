// locker.h
#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "constraints.h"
#include "types.h"

namespace rostra {

// Cells the user already filled in, by staff and date. They are locked like mandates.
using PrefilledCells = std::map<DateCell, ShiftValue>;

enum class LockOrigin : unsigned char { None = 0, MustWork, MustOff, Prefilled };

// Cells fixed before generation, by calendar mandates or prefilled entries.
// Only the locker writes them.
class LockedCells {
 public:
  LockedCells() = default;
  LockedCells(int staff_count, int day_count)
      : days_(day_count),
        value_(static_cast<size_t>(staff_count) * day_count, ShiftValue::Normal),
        source_(static_cast<size_t>(staff_count) * day_count, LockOrigin::None) {}

  bool is_locked(int s, int d) const { return origin(s, d) != LockOrigin::None; }
  LockOrigin origin(int s, int d) const { return source_[idx(s, d)]; }

  std::optional<ShiftValue> locked_value(int s, int d) const {
    if (!is_locked(s, d)) return std::nullopt;
    return value_[idx(s, d)];
  }

  // Registry kind a broken lock is reported under; meaningless for unlocked cells.
  // A prefilled Off reports as must-day-off, any other prefilled value as must-work.
  ConstraintKind source(int s, int d) const {
    switch (origin(s, d)) {
      case LockOrigin::MustOff:   return ConstraintKind::CalendarMustDayOff;
      case LockOrigin::Prefilled: return value_[idx(s, d)] == ShiftValue::Off ? ConstraintKind::CalendarMustDayOff
                                                                              : ConstraintKind::CalendarMustWork;
      default:                    return ConstraintKind::CalendarMustWork;
    }
  }

  // Called by lock_mandates only.
  void lock(int s, int d, ShiftValue v, ConstraintKind source) {
    lock(s, d, v, source == ConstraintKind::CalendarMustWork ? LockOrigin::MustWork : LockOrigin::MustOff);
  }
  void lock(int s, int d, ShiftValue v, LockOrigin origin) {
    value_[idx(s, d)] = v;
    source_[idx(s, d)] = origin;
  }

  int count() const;
  bool empty() const { return count() == 0; }

  bool operator==(const LockedCells& o) const {
    return days_ == o.days_ && value_ == o.value_ && source_ == o.source_;
  }

 private:
  size_t idx(int s, int d) const { return static_cast<size_t>(s) * days_ + d; }

  int days_ = 0;
  std::vector<ShiftValue> value_;
  std::vector<LockOrigin> source_;
};

struct LockSummary {
  int total = 0;
  int must_work_cells = 0;
  int early_cells = 0;
  int off_cells = 0;
  int prefilled_cells = 0;                    // locked from prefilled entries
  int prefilled_skipped = 0;                  // unknown staff or date outside the horizon
  std::vector<std::string> must_work_dates;   // in horizon, ascending
  std::vector<std::string> must_off_dates;
};

// must-work -> Normal for everyone; must-off -> Early for early-eligible staff
// when early_for_eligible, Off otherwise. Dates outside the horizon are ignored.
// Prefilled cells are then locked at their own value. A prefilled cell on a
// mandate date must agree with the mandate or ConfigurationError is thrown.
LockedCells lock_mandates(const CalendarMandates& mandates,
                          const std::vector<Staff>& roster,
                          const Horizon& horizon,
                          bool early_for_eligible,
                          LockSummary* summary = nullptr,
                          const PrefilledCells& prefilled = {});

// Stamps every locked value into the schedule.
void apply_locks(const LockedCells& locks, Schedule& schedule);

// Cells whose value differs from the locked one. Empty when the schedule honours every lock.
std::vector<CellRef> verify_locked(const LockedCells& locks, const Schedule& schedule);

} // namespace rostra
