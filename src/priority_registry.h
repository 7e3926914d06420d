// priority_registry.h
#pragma once
#include <array>
#include <string>
#include <vector>

#include "types.h"

namespace rostra {

// Closed catalog of constraint kinds, declared in precedence order.
enum class ConstraintKind : int {
  CalendarMustWork = 0,
  CalendarMustDayOff,
  ShiftEligibility,
  ConsecutiveWorkLimit,
  MonthlyLimit,
  DailyLimit,
  StaffGroupConflict,
  BackupCoverage,
  WeeklyLimit,
  ProximityPattern,
  PriorityAllowOnly,
  PriorityAvoidWithExceptions,
  PriorityAvoid,
  PriorityPreferred,
  PriorityRequiredOff,
  AdjacentConflict,
  FairDistribution,
};

constexpr int kConstraintKindCount = 17;

enum class Severity : int { Critical = 0, High = 1, Medium = 2, Low = 3 };

const char* severity_name(Severity s);

struct KindInfo {
  ConstraintKind kind;
  const char* id;         // stable snake_case identifier
  const char* name;
  int priority;           // unique, lower wins
  int tier;               // 1 mandatory, 2 important-soft, 3 preference
  bool hard;
  int default_penalty;
};

// One detected breach. cells are sorted; key makes ordering total.
struct Violation {
  std::string constraint_id;
  ConstraintKind kind = ConstraintKind::FairDistribution;
  int tier = 3;
  bool hard = false;
  Severity severity = Severity::Low;
  int priority = 0;
  int order = 0;                  // declaration order of the owning constraint
  std::vector<CellRef> cells;
  int magnitude = 1;              // how far over/under, 1 for yes/no checks
  int weight = 0;                 // penalty per unit of magnitude
  std::string message;
  std::string key;                // constraint_id + scope locator
};

// Immutable after static init; safe to share across concurrent runs.
class PriorityRegistry {
 public:
  static const KindInfo& info(ConstraintKind k);
  static const std::array<KindInfo, kConstraintKindCount>& all();

  static int priority_of(ConstraintKind k) { return info(k).priority; }
  static int tier_of(ConstraintKind k) { return info(k).tier; }
  static bool is_hard_constraint(ConstraintKind k) { return info(k).hard; }

  static Severity severity(int tier, bool hard);

  // Throws std::invalid_argument for unknown ids.
  static ConstraintKind kind_from_id(const std::string& id);

  // Winner among violations touching the same cell: lowest priority number,
  // ties by declaration order. Returns nullptr for an empty input.
  static const Violation* resolve(const std::vector<Violation>& same_cell);

  // Strict weak order used for reporting and repair: tier, priority, order, key.
  static bool before(const Violation& a, const Violation& b);
};

} // namespace rostra
