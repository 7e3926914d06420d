// types.h
#pragma once
#include <array>
#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace rostra {

// Every cell of a roster holds exactly one of these.
enum class ShiftValue : std::uint8_t { Early = 0, Late = 1, Off = 2, Normal = 3 };

constexpr int kShiftValueCount = 4;

constexpr std::array<ShiftValue, kShiftValueCount> kAllShiftValues = {
    ShiftValue::Early, ShiftValue::Late, ShiftValue::Off, ShiftValue::Normal};

inline int shift_index(ShiftValue v) { return static_cast<int>(v); }

const char* shift_name(ShiftValue v);   // "early", "late", "off", "normal"
ShiftValue parse_shift(const std::string& s); // throws std::invalid_argument

inline bool is_working(ShiftValue v) { return v != ShiftValue::Off; }

struct Staff {
  std::string id;
  std::string name;
  std::string category;      // employment category, e.g. "regular", "part_time"
  bool may_work_early = false;
  bool may_work_late = true;

  bool eligible(ShiftValue v) const {
    if (v == ShiftValue::Early) return may_work_early;
    if (v == ShiftValue::Late) return may_work_late;
    return true;
  }
};

// Outward-facing cell identity (what callers and the predictor see).
struct DateCell {
  std::string staff_id;
  std::string date;          // "YYYY-MM-DD"

  bool operator<(const DateCell& o) const {
    return std::tie(staff_id, date) < std::tie(o.staff_id, o.date);
  }
  bool operator==(const DateCell& o) const {
    return staff_id == o.staff_id && date == o.date;
  }
};

// Inward cell identity: roster index x horizon index.
struct CellRef {
  int staff = 0;
  int day = 0;

  bool operator<(const CellRef& o) const {
    return std::tie(staff, day) < std::tie(o.staff, o.day);
  }
  bool operator==(const CellRef& o) const { return staff == o.staff && day == o.day; }
};

struct MonthBucket {
  std::string key;     // "YYYY-MM"
  int first_day = 0;   // horizon index, inclusive
  int last_day = 0;    // horizon index, inclusive
  bool full = false;   // horizon covers the whole calendar month
};

// Contiguous date range expanded to per-day lookups.
struct Horizon {
  std::vector<std::string> dates;   // ascending, one per day
  std::vector<int> weekday;         // 0=Sunday..6=Saturday
  std::vector<int> month_of_day;    // index into months
  std::vector<MonthBucket> months;

  int size() const { return static_cast<int>(dates.size()); }
  int index_of(const std::string& ymd) const; // -1 when outside
};

// Throws ConfigurationError on malformed dates or end < start.
Horizon make_horizon(const std::string& start, const std::string& end);

// Dense staff x day grid. Row-major by staff: cells[s * days + d].
class Schedule {
 public:
  Schedule() = default;
  Schedule(int staff_count, int day_count, ShiftValue fill = ShiftValue::Normal)
      : staff_(staff_count), days_(day_count),
        cells_(static_cast<size_t>(staff_count) * day_count, fill) {}

  int staff_count() const { return staff_; }
  int day_count() const { return days_; }

  ShiftValue at(int s, int d) const { return cells_[static_cast<size_t>(s) * days_ + d]; }
  ShiftValue at(const CellRef& c) const { return at(c.staff, c.day); }
  void set(int s, int d, ShiftValue v) { cells_[static_cast<size_t>(s) * days_ + d] = v; }

  bool operator==(const Schedule& o) const {
    return staff_ == o.staff_ && days_ == o.days_ && cells_ == o.cells_;
  }
  bool operator!=(const Schedule& o) const { return !(*this == o); }

  // Number of cells whose value differs from o (shapes must match).
  int diff_count(const Schedule& o) const;

 private:
  int staff_ = 0;
  int days_ = 0;
  std::vector<ShiftValue> cells_;
};

} // namespace rostra
