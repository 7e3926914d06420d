// types.cpp
#include "types.h"
#include "errors.h"
#include "utils.h"

#include <stdexcept>

namespace rostra {

const char* shift_name(ShiftValue v) {
  switch (v) {
    case ShiftValue::Early:  return "early";
    case ShiftValue::Late:   return "late";
    case ShiftValue::Off:    return "off";
    case ShiftValue::Normal: return "normal";
  }
  return "normal";
}

ShiftValue parse_shift(const std::string& s) {
  if (s == "early") return ShiftValue::Early;
  if (s == "late") return ShiftValue::Late;
  if (s == "off") return ShiftValue::Off;
  if (s == "normal") return ShiftValue::Normal;
  throw std::invalid_argument("Unknown shift value: " + s);
}

int Horizon::index_of(const std::string& ymd) const {
  if (dates.empty()) return -1;
  Ymd c;
  try {
    c = parse_ymd(ymd);
  } catch (const std::invalid_argument&) {
    return -1;
  }
  const int64_t off = days_from_civil(c) - days_from_civil(parse_ymd(dates.front()));
  if (off < 0 || off >= static_cast<int64_t>(dates.size())) return -1;
  return static_cast<int>(off);
}

Horizon make_horizon(const std::string& start, const std::string& end) {
  Ymd a, b;
  try {
    a = parse_ymd(start);
    b = parse_ymd(end);
  } catch (const std::invalid_argument& e) {
    throw ConfigurationError("dateRange", e.what());
  }
  const int64_t first = days_from_civil(a);
  const int64_t last = days_from_civil(b);
  if (last < first)
    throw ConfigurationError("dateRange", "end " + end + " precedes start " + start);

  Horizon h;
  const int n = static_cast<int>(last - first + 1);
  h.dates.reserve(n);
  h.weekday.reserve(n);
  h.month_of_day.reserve(n);
  for (int i = 0; i < n; ++i) {
    const Ymd c = civil_from_days(first + i);
    h.dates.push_back(format_ymd(c));
    h.weekday.push_back(weekday_from_ymd(c));

    const std::string key = month_key(c);
    if (h.months.empty() || h.months.back().key != key) {
      MonthBucket m;
      m.key = key;
      m.first_day = i;
      m.last_day = i;
      h.months.push_back(m);
    } else {
      h.months.back().last_day = i;
    }
    h.month_of_day.push_back(static_cast<int>(h.months.size()) - 1);
  }

  // A bucket is full when it spans day 1 through the last day of its month.
  for (auto& m : h.months) {
    const Ymd f = parse_ymd(h.dates[m.first_day]);
    const Ymd l = parse_ymd(h.dates[m.last_day]);
    m.full = f.d == 1 && l.d == days_in_month(l.y, l.m);
  }
  return h;
}

int Schedule::diff_count(const Schedule& o) const {
  if (staff_ != o.staff_ || days_ != o.days_)
    throw std::invalid_argument("diff_count: schedule shapes differ");
  int n = 0;
  for (size_t i = 0; i < cells_.size(); ++i)
    if (cells_[i] != o.cells_[i]) ++n;
  return n;
}

} // namespace rostra
