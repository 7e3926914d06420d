#include <gtest/gtest.h>

#include <algorithm>

#include "penalties.h"
#include "validation.h"
#include "utils/test_utils.h"

using namespace rostra;
using namespace TestUtils;

namespace
{

Violation const * FindKey(std::vector<Violation> const & vs, std::string const & key)
{
  auto it = std::find_if(vs.begin(), vs.end(), [&](Violation const & v) { return v.key == key; });
  return it == vs.end() ? nullptr : &*it;
}

}  // namespace

// ====== LIMITS ======

TEST(ValidationTest, DailyMax_ReportsOverageWithOffendingCells)
{
  ConfigSnapshot snap;
  snap.roster = MakeRoster(4);
  snap.constraints.push_back(MakeDailyLimit("off-cap", ShiftValue::Off, -1, 2));
  RuleIndex index = BuildIndex(Share(snap));

  Schedule sched(4, index.day_count());
  const int d = index.horizon().index_of("2024-06-04");
  for (int s = 0; s < 3; ++s)
    sched.set(s, d, ShiftValue::Off);

  auto vs = validate(sched, index);
  Violation const * v = FindKey(vs, "off-cap@2024-06-04");
  ASSERT_NE(v, nullptr);
  EXPECT_EQ(v->kind, ConstraintKind::DailyLimit);
  EXPECT_EQ(v->tier, 1);
  EXPECT_EQ(v->severity, Severity::Critical);
  EXPECT_EQ(v->magnitude, 1);
  EXPECT_EQ(v->cells.size(), 3u);
  EXPECT_EQ(CountKind(tier1_violations(vs), ConstraintKind::DailyLimit), 1);
}

TEST(ValidationTest, DailyMin_CappedByScopeAndSkipsMandateDates)
{
  ConfigSnapshot snap;
  snap.roster = MakeRoster(3);
  snap.constraints.push_back(MakeDailyLimit("late-cover", ShiftValue::Late, 1, -1));
  snap.mandates.must_work = {"2024-06-04"};
  RuleIndex index = BuildIndex(Share(snap));

  Schedule sched(3, index.day_count());
  apply_locks(index.locks(), sched);
  for (int d = 0; d < index.day_count(); ++d)
    sched.set(0, d, index.locks().is_locked(0, d) ? ShiftValue::Normal : ShiftValue::Late);
  sched.set(0, 1, ShiftValue::Normal);

  auto vs = validate(sched, index);
  ASSERT_EQ(CountKind(vs, ConstraintKind::DailyLimit), 1);
  EXPECT_NE(FindKey(vs, "late-cover@2024-06-03"), nullptr);
}

TEST(ValidationTest, WeeklyWindowsAreRollingAndFull)
{
  ConfigSnapshot snap;
  snap.roster = MakeRoster(1);
  WeeklyLimit w;
  w.meta.id = "late-week";
  w.shift = ShiftValue::Late;
  w.max = 2;
  snap.constraints.push_back(w);
  RuleIndex index = BuildIndex(Share(snap), "2024-06-02", "2024-06-10");   // 9 days: 3 windows

  Schedule sched(1, index.day_count());
  sched.set(0, 6, ShiftValue::Late);
  sched.set(0, 7, ShiftValue::Late);
  sched.set(0, 8, ShiftValue::Late);

  auto vs = validate(sched, index);
  // Windows starting on days 0, 1, 2; only the one containing days 6..8 (start 2) has 3.
  ASSERT_EQ(CountKind(vs, ConstraintKind::WeeklyLimit), 1);
  EXPECT_NE(FindKey(vs, "late-week@s1@2024-06-04"), nullptr);
  EXPECT_EQ(vs.front().tier, 2);
  EXPECT_EQ(vs.front().severity, Severity::Medium);
}

TEST(ValidationTest, MonthlyMinOnlyForFullMonths)
{
  ConfigSnapshot snap;
  snap.roster = MakeRoster(1);
  MonthlyLimit m;
  m.meta.id = "off-month";
  m.shift = ShiftValue::Off;
  m.min = 4;
  m.max = 8;
  snap.constraints.push_back(m);
  RuleIndex index = BuildIndex(Share(snap), "2024-05-25", "2024-06-30");

  Schedule sched(1, index.day_count());
  auto vs = validate(sched, index);
  // May is partial: min not applied. June is full: 0 < 4.
  ASSERT_EQ(CountKind(vs, ConstraintKind::MonthlyLimit), 1);
  Violation const * v = FindKey(vs, "off-month@s1@2024-06");
  ASSERT_NE(v, nullptr);
  EXPECT_EQ(v->magnitude, 4);
}

// ====== GROUP RULES ======

TEST(ValidationTest, GroupConflictCountsEarlyAndSkipsMustOffDates)
{
  ConfigSnapshot snap;
  snap.roster = MakeRoster(3, true);
  StaffGroupRule g;
  g.meta.id = "desk";
  g.members = {"s1", "s2", "s3"};
  g.conflict = ConflictRule{1, true};
  snap.constraints.push_back(g);
  snap.mandates.must_off = {"2024-06-06"};
  RuleIndex index = BuildIndex(Share(snap));

  Schedule sched(3, index.day_count());
  apply_locks(index.locks(), sched);
  sched.set(0, 1, ShiftValue::Off);
  sched.set(1, 1, ShiftValue::Early);

  auto vs = validate(sched, index);
  ASSERT_EQ(CountKind(vs, ConstraintKind::StaffGroupConflict), 1);
  EXPECT_NE(FindKey(vs, "desk:conflict@2024-06-03"), nullptr);
}

TEST(ValidationTest, CoverageAndProximity)
{
  ConfigSnapshot snap;
  snap.roster = MakeRoster(4);
  StaffGroupRule g;
  g.meta.id = "ward";
  g.members = {"s1", "s2"};
  g.coverage = CoverageRule{"s3", ShiftValue::Normal};
  g.proximity = ProximityPattern{"s1", "s4", 1};
  snap.constraints.push_back(g);
  RuleIndex index = BuildIndex(Share(snap));

  Schedule sched(4, index.day_count());
  sched.set(0, 3, ShiftValue::Off);    // s1 off: trigger and coverage
  sched.set(2, 3, ShiftValue::Late);   // backup on the wrong shift

  auto vs = validate(sched, index);
  Violation const * cov = FindKey(vs, "ward:coverage@2024-06-05");
  ASSERT_NE(cov, nullptr);
  EXPECT_EQ(cov->kind, ConstraintKind::BackupCoverage);
  EXPECT_NE(FindKey(vs, "ward:proximity@2024-06-05"), nullptr);

  sched.set(3, 4, ShiftValue::Off);    // target off the next day
  sched.set(2, 3, ShiftValue::Normal);
  vs = validate(sched, index);
  EXPECT_EQ(CountKind(vs, ConstraintKind::BackupCoverage), 0);
  EXPECT_EQ(CountKind(vs, ConstraintKind::ProximityPattern), 0);
}

// ====== BUILT-IN RULES ======

TEST(ValidationTest, RestRuleAdjacentAndEligibility)
{
  ConfigSnapshot snap;
  snap.roster = {MakeStaff("s1"), MakeStaff("s2", false, false)};
  snap.rest.max_consecutive_work_days = 5;
  snap.adjacent.enabled = true;
  RuleIndex index = BuildIndex(Share(snap));

  Schedule sched(2, index.day_count());   // both work all 7 days
  sched.set(1, 0, ShiftValue::Off);
  sched.set(1, 1, ShiftValue::Off);
  sched.set(1, 4, ShiftValue::Late);

  auto vs = validate(sched, index);
  Violation const * rest = FindKey(vs, "restRule@s1@2024-06-02");
  ASSERT_NE(rest, nullptr);
  EXPECT_EQ(rest->magnitude, 2);
  EXPECT_EQ(rest->cells.size(), 7u);
  EXPECT_NE(FindKey(vs, "adjacentConflict@s2@2024-06-02"), nullptr);
  EXPECT_NE(FindKey(vs, "shift_eligibility@s2@2024-06-06"), nullptr);
}

TEST(ValidationTest, FairnessToleratesOneDayOfDeviation)
{
  ConfigSnapshot snap;
  snap.roster = MakeRoster(2);
  snap.off_day_target = 2;
  RuleIndex index = BuildIndex(Share(snap));

  Schedule sched(2, index.day_count());
  sched.set(0, 0, ShiftValue::Off);   // s1: 1 off, deviation 1
  for (int d = 0; d < 5; ++d)
    sched.set(1, d, ShiftValue::Off); // s2: 5 off, deviation 3

  auto vs = validate(sched, index);
  ASSERT_EQ(CountKind(vs, ConstraintKind::FairDistribution), 1);
  Violation const * v = FindKey(vs, "fairDistribution@s2");
  ASSERT_NE(v, nullptr);
  EXPECT_EQ(v->magnitude, 2);
  EXPECT_EQ(v->cells.size(), 5u);
}

TEST(ValidationTest, LockedCellsNeverListedAsFixable)
{
  ConfigSnapshot snap;
  snap.roster = MakeRoster(3);
  snap.constraints.push_back(MakeDailyLimit("late-cap", ShiftValue::Late, -1, 0));
  snap.mandates.must_off = {"2024-06-04"};
  snap.adjacent.enabled = true;
  RuleIndex index = BuildIndex(Share(snap));

  Schedule sched(3, index.day_count());
  apply_locks(index.locks(), sched);
  const int d = index.horizon().index_of("2024-06-04");
  sched.set(0, d + 1, ShiftValue::Off);

  auto vs = validate(sched, index);
  Violation const * adj = FindKey(vs, "adjacentConflict@s1@2024-06-04");
  ASSERT_NE(adj, nullptr);
  ASSERT_EQ(adj->cells.size(), 1u);
  EXPECT_EQ(adj->cells[0].day, d + 1);
  for (auto const & v : vs)
    for (auto const & c : v.cells)
      EXPECT_FALSE(index.locks().is_locked(c.staff, c.day)) << v.key;
}

// ====== ORDERING AND SCORING ======

TEST(ValidationTest, SortedByTierPriorityAndFilteredByTier)
{
  ConfigSnapshot snap;
  snap.roster = MakeRoster(3);
  snap.constraints.push_back(
      MakePriorityRule("pref", PriorityRuleType::PreferredShift, {"s1"}, ShiftValue::Late));
  snap.constraints.push_back(MakeDailyLimit("off-cap", ShiftValue::Off, -1, 1));
  RuleIndex index = BuildIndex(Share(snap));

  Schedule sched(3, index.day_count());
  sched.set(1, 2, ShiftValue::Off);
  sched.set(2, 2, ShiftValue::Off);

  auto all = validate(sched, index);
  ASSERT_FALSE(all.empty());
  EXPECT_TRUE(std::is_sorted(all.begin(), all.end(), PriorityRegistry::before));
  EXPECT_EQ(all.front().kind, ConstraintKind::DailyLimit);

  auto tier1 = validate(sched, index, 1);
  for (auto const & v : tier1)
    EXPECT_EQ(v.tier, 1);
  EXPECT_LT(tier1.size(), all.size());

  // 1 x 50 x critical + 7 x 10 x low
  EXPECT_EQ(penalty_score(all), 50 * 10 + 7 * 10 * 1);
}

TEST(ValidationTest, Metrics_OffDayStatisticsAndPreferenceRate)
{
  ConfigSnapshot snap;
  snap.roster = MakeRoster(2);
  snap.constraints.push_back(
      MakePriorityRule("pref", PriorityRuleType::PreferredShift, {"s1"}, ShiftValue::Late, {}, {1, 2}));
  RuleIndex index = BuildIndex(Share(snap));

  Schedule sched(2, index.day_count());
  sched.set(0, 1, ShiftValue::Late);   // Monday honoured, Tuesday not
  sched.set(1, 0, ShiftValue::Off);
  sched.set(1, 6, ShiftValue::Off);

  FairnessMetrics m = compute_metrics(sched, index, validate(sched, index));
  EXPECT_DOUBLE_EQ(m.off_day_mean, 1.0);
  EXPECT_DOUBLE_EQ(m.off_day_variance, 1.0);
  EXPECT_EQ(m.off_days_per_staff, std::vector<int>({0, 2}));
  EXPECT_EQ(m.preferred_applicable, 2);
  EXPECT_EQ(m.preferred_honored, 1);
  EXPECT_DOUBLE_EQ(m.preferred_honor_rate, 0.5);
  EXPECT_EQ(m.penalty_score, 10);
}
