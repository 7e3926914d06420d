// utils.h
#pragma once
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace rostra {

using json = nlohmann::json;

// Returns current time in milliseconds since epoch
static inline long long NowMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
               steady_clock::now().time_since_epoch()
           ).count();
}

// ---------- small date helpers ----------
struct Ymd {
  int y = 0, m = 0, d = 0;
};

static inline bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

static inline int days_in_month(int y, int m) {
  static const int t[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return (m == 2 && is_leap(y)) ? 29 : t[m - 1];
}

// Strict "YYYY-MM-DD" parser; throws std::invalid_argument.
static inline Ymd parse_ymd(const std::string& ymd) {
  if (ymd.size() != 10 || ymd[4] != '-' || ymd[7] != '-')
    throw std::invalid_argument("Bad date: " + ymd);
  for (int i : {0, 1, 2, 3, 5, 6, 8, 9})
    if (ymd[i] < '0' || ymd[i] > '9') throw std::invalid_argument("Bad date: " + ymd);
  Ymd r;
  r.y = (ymd[0] - '0') * 1000 + (ymd[1] - '0') * 100 + (ymd[2] - '0') * 10 + (ymd[3] - '0');
  r.m = (ymd[5] - '0') * 10 + (ymd[6] - '0');
  r.d = (ymd[8] - '0') * 10 + (ymd[9] - '0');
  if (r.m < 1 || r.m > 12 || r.d < 1 || r.d > days_in_month(r.y, r.m))
    throw std::invalid_argument("Bad date: " + ymd);
  return r;
}

// Days since 1970-01-01 (proleptic Gregorian), no timezone involved.
static inline int64_t days_from_civil(const Ymd& c) {
  int y = c.y - (c.m <= 2 ? 1 : 0);
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned mp = static_cast<unsigned>(c.m + (c.m > 2 ? -3 : 9));
  const unsigned doy = (153 * mp + 2) / 5 + static_cast<unsigned>(c.d) - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

static inline Ymd civil_from_days(int64_t z) {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  Ymd r;
  r.d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
  r.m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
  r.y = static_cast<int>(yoe + era * 400) + (r.m <= 2 ? 1 : 0);
  return r;
}

static inline std::string format_ymd(const Ymd& c) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", c.y, c.m, c.d);
  return std::string(buf);
}

static inline std::string ymd_add_days(const std::string& ymd, int d) {
  return format_ymd(civil_from_days(days_from_civil(parse_ymd(ymd)) + d));
}

// Sakamoto's algorithm: 0=Sunday..6=Saturday
static inline int weekday_from_ymd(const Ymd& c) {
  static const int t[12] = {0, 3, 2, 5, 0, 3, 5, 1, 4, 6, 2, 4};
  int y = c.y;
  if (c.m < 3)
    y -= 1;
  return (y + y / 4 - y / 100 + y / 400 + t[c.m - 1] + c.d) % 7;
}

static inline std::string month_key(const Ymd& c) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%04d-%02d", c.y, c.m);
  return std::string(buf);
}

} // namespace rostra
