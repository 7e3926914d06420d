#include "utils/test_utils.h"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <utility>

namespace TestUtils
{

const char * const kWeekStart = "2024-06-02";
const char * const kWeekEnd = "2024-06-08";

Staff MakeStaff(std::string const & id, bool canEarly, bool canLate, std::string const & category)
{
  Staff s;
  s.id = id;
  s.name = "Staff " + id;
  s.category = category;
  s.may_work_early = canEarly;
  s.may_work_late = canLate;
  return s;
}

std::vector<Staff> MakeRoster(int n, bool canEarly)
{
  std::vector<Staff> roster;
  for (int i = 1; i <= n; ++i)
    roster.push_back(MakeStaff("s" + std::to_string(i), canEarly));
  return roster;
}

DailyLimit MakeDailyLimit(std::string const & id, ShiftValue shift, int min, int max)
{
  DailyLimit l;
  l.meta.id = id;
  l.shift = shift;
  l.min = min;
  l.max = max;
  return l;
}

PriorityRule MakePriorityRule(std::string const & id, PriorityRuleType type,
                              std::vector<std::string> staffIds, ShiftValue shift,
                              std::vector<ShiftValue> shifts, std::vector<int> daysOfWeek, int level)
{
  PriorityRule p;
  p.meta.id = id;
  p.type = type;
  p.staff_ids = std::move(staffIds);
  p.shift = shift;
  p.shifts = std::move(shifts);
  p.days_of_week = std::move(daysOfWeek);
  p.priority_level = level;
  return p;
}

ConfigSnapshotPtr Share(ConfigSnapshot snapshot)
{
  return std::make_shared<const ConfigSnapshot>(std::move(snapshot));
}

RuleIndex BuildIndex(ConfigSnapshotPtr const & snapshot, std::string const & start, std::string const & end)
{
  check_snapshot(*snapshot);
  Horizon horizon = make_horizon(start, end);
  LockedCells locks = lock_mandates(snapshot->mandates, snapshot->roster, horizon,
                                    snapshot->must_off_early_for_eligible);
  return RuleIndex(snapshot, snapshot->roster, std::move(horizon), std::move(locks));
}

GenerationRequest MakeRequest(ConfigSnapshotPtr const & snapshot, std::string const & start,
                              std::string const & end, std::uint64_t seed)
{
  GenerationRequest r;
  r.start_date = start;
  r.end_date = end;
  r.config = snapshot;
  r.rng_seed = seed;
  return r;
}

Prediction FlatPrediction(std::vector<Staff> const & roster, Horizon const & horizon, ShiftValue v,
                          double confidence)
{
  Prediction p;
  p.confidence = confidence;
  Distribution dist;
  dist.p.fill(0.1);
  dist.p[shift_index(v)] = 0.7;
  for (auto const & s : roster)
    for (auto const & date : horizon.dates)
      p.per_cell.emplace(DateCell{s.id, date}, dist);
  return p;
}

std::optional<Prediction> ScriptedPredictor::predict(std::vector<Staff> const &, Horizon const &,
                                                     PredictorFeatures const &) const
{
  if (delayMs_ > 0)
    std::this_thread::sleep_for(std::chrono::milliseconds(delayMs_));
  if (fail_)
    throw std::runtime_error("model file missing");
  return answer_;
}

int CountOnDay(Schedule const & schedule, int d, ShiftValue v)
{
  int n = 0;
  for (int s = 0; s < schedule.staff_count(); ++s)
    if (schedule.at(s, d) == v)
      ++n;
  return n;
}

int CountKind(std::vector<Violation> const & violations, ConstraintKind kind)
{
  return static_cast<int>(std::count_if(violations.begin(), violations.end(),
                                        [&](Violation const & v) { return v.kind == kind; }));
}

}  // namespace TestUtils
