// priority_registry.cpp
#include "priority_registry.h"

#include <stdexcept>
#include <tuple>

namespace rostra {

namespace {

const std::array<KindInfo, kConstraintKindCount> kCatalog = {{
  {ConstraintKind::CalendarMustWork,            "calendar_must_work",             "Calendar must-work",           1,  1, true,  1000},
  {ConstraintKind::CalendarMustDayOff,          "calendar_must_day_off",          "Calendar must-day-off",        2,  1, true,  1000},
  {ConstraintKind::ShiftEligibility,            "shift_eligibility",              "Shift eligibility",            3,  1, true,  1000},
  {ConstraintKind::ConsecutiveWorkLimit,        "consecutive_work_limit",         "Consecutive work limit",       4,  1, true,  200},
  {ConstraintKind::MonthlyLimit,                "monthly_limit",                  "Monthly limit",                5,  1, true,  80},
  {ConstraintKind::DailyLimit,                  "daily_limit",                    "Daily limit",                  6,  1, true,  50},
  {ConstraintKind::StaffGroupConflict,          "staff_group_conflict",           "Staff group conflict",         7,  1, true,  100},
  {ConstraintKind::BackupCoverage,              "backup_coverage",                "Backup coverage",              8,  2, false, 500},
  {ConstraintKind::WeeklyLimit,                 "weekly_limit",                   "Weekly limit",                 9,  2, false, 60},
  {ConstraintKind::ProximityPattern,            "proximity_pattern",              "Proximity pattern",            10, 2, false, 40},
  {ConstraintKind::PriorityAllowOnly,           "priority_allow_only",            "Allow only shifts",            11, 2, false, 40},
  {ConstraintKind::PriorityAvoidWithExceptions, "priority_avoid_with_exceptions", "Avoid shift with exceptions",  12, 2, false, 30},
  {ConstraintKind::PriorityAvoid,               "priority_avoid",                 "Avoid shift",                  13, 2, false, 30},
  {ConstraintKind::PriorityPreferred,           "priority_preferred",             "Preferred shift",              14, 3, false, 10},
  {ConstraintKind::PriorityRequiredOff,         "priority_required_off",          "Required off",                 15, 3, false, 10},
  {ConstraintKind::AdjacentConflict,            "adjacent_conflict",              "Adjacent conflict",            16, 3, false, 30},
  {ConstraintKind::FairDistribution,            "fair_distribution",              "Fair off-day distribution",    17, 3, false, 5},
}};

} // namespace

const char* severity_name(Severity s) {
  switch (s) {
    case Severity::Critical: return "critical";
    case Severity::High:     return "high";
    case Severity::Medium:   return "medium";
    case Severity::Low:      return "low";
  }
  return "low";
}

const KindInfo& PriorityRegistry::info(ConstraintKind k) {
  return kCatalog[static_cast<size_t>(k)];
}

const std::array<KindInfo, kConstraintKindCount>& PriorityRegistry::all() {
  return kCatalog;
}

Severity PriorityRegistry::severity(int tier, bool hard) {
  if (tier <= 1) return hard ? Severity::Critical : Severity::High;
  if (tier == 2) return Severity::Medium;
  return Severity::Low;
}

ConstraintKind PriorityRegistry::kind_from_id(const std::string& id) {
  for (const auto& k : kCatalog)
    if (id == k.id) return k.kind;
  throw std::invalid_argument("Unknown constraint kind: " + id);
}

const Violation* PriorityRegistry::resolve(const std::vector<Violation>& same_cell) {
  const Violation* best = nullptr;
  for (const auto& v : same_cell) {
    if (!best || v.priority < best->priority ||
        (v.priority == best->priority && v.order < best->order))
      best = &v;
  }
  return best;
}

bool PriorityRegistry::before(const Violation& a, const Violation& b) {
  return std::tie(a.tier, a.priority, a.order, a.key) <
         std::tie(b.tier, b.priority, b.order, b.key);
}

} // namespace rostra
