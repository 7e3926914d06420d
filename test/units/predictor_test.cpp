#include <gtest/gtest.h>

#include <memory>

#include "predictor.h"
#include "utils.h"
#include "utils/test_utils.h"

using namespace rostra;
using namespace TestUtils;

namespace
{

struct Fixture
{
  std::vector<Staff> roster = MakeRoster(2);
  Horizon horizon = make_horizon(kWeekStart, kWeekEnd);
  PredictorFeatures features;
};

PredictionOutcome Call(std::shared_ptr<const Predictor> p, int timeoutMs = 500)
{
  Fixture f;
  return call_predictor(std::move(p), f.roster, f.horizon, f.features, timeoutMs);
}

// Same pattern every week: s1 off on Sundays and late otherwise, s2 always normal.
PredictorFeatures ConsistentHistory(int weeks)
{
  PredictorFeatures features;
  for (int w = 0; w < weeks; ++w)
  {
    HistoricalSchedule h;
    h.label = "week" + std::to_string(w);
    Horizon week = make_horizon(ymd_add_days(kWeekStart, -7 * (w + 1)), ymd_add_days(kWeekEnd, -7 * (w + 1)));
    for (int d = 0; d < week.size(); ++d)
    {
      h.cells[DateCell{"s1", week.dates[d]}] = week.weekday[d] == 0 ? ShiftValue::Off : ShiftValue::Late;
      h.cells[DateCell{"s2", week.dates[d]}] = ShiftValue::Normal;
    }
    features.history.push_back(h);
  }
  return features;
}

}  // namespace

// ====== CALL OUTCOMES ======

TEST(PredictorTest, NoPredictor_NotConfigured)
{
  PredictionOutcome out = Call(nullptr);
  EXPECT_EQ(out.status, PredictorStatus::NotConfigured);
  EXPECT_FALSE(out.available());
  EXPECT_FALSE(out.prediction.has_value());
}

TEST(PredictorTest, AnswerWithinTimeout_Available)
{
  Fixture f;
  auto p = std::make_shared<ScriptedPredictor>(FlatPrediction(f.roster, f.horizon, ShiftValue::Late, 0.9));
  PredictionOutcome out = Call(p);
  ASSERT_TRUE(out.available());
  EXPECT_DOUBLE_EQ(out.prediction->confidence, 0.9);
  EXPECT_EQ(out.prediction->per_cell.size(), 14u);
}

TEST(PredictorTest, SlowPredictor_TimedOut)
{
  Fixture f;
  auto p = std::make_shared<ScriptedPredictor>(FlatPrediction(f.roster, f.horizon, ShiftValue::Late, 0.9), 300);
  PredictionOutcome out = Call(p, 20);
  EXPECT_EQ(out.status, PredictorStatus::TimedOut);
  EXPECT_FALSE(out.prediction.has_value());
}

TEST(PredictorTest, ThrowingPredictor_FailedWithReason)
{
  auto p = std::make_shared<ScriptedPredictor>(std::nullopt, 0, true);
  PredictionOutcome out = Call(p);
  EXPECT_EQ(out.status, PredictorStatus::Failed);
  EXPECT_EQ(out.reason, "model file missing");
}

TEST(PredictorTest, NoAnswer_Unavailable)
{
  PredictionOutcome out = Call(std::make_shared<ScriptedPredictor>(std::nullopt));
  EXPECT_EQ(out.status, PredictorStatus::Unavailable);
}

TEST(PredictorTest, ConfidenceAboveOne_Malformed)
{
  Fixture f;
  auto p = std::make_shared<ScriptedPredictor>(FlatPrediction(f.roster, f.horizon, ShiftValue::Late, 1.5));
  EXPECT_EQ(Call(p).status, PredictorStatus::Malformed);
}

TEST(PredictorTest, NegativeProbability_Malformed)
{
  Fixture f;
  Prediction pr = FlatPrediction(f.roster, f.horizon, ShiftValue::Late, 0.7);
  pr.per_cell.begin()->second.p[0] = -0.2;
  PredictionOutcome out = Call(std::make_shared<ScriptedPredictor>(pr));
  EXPECT_EQ(out.status, PredictorStatus::Malformed);
  EXPECT_NE(out.reason.find("invalid probability"), std::string::npos);
}

TEST(PredictorTest, CellsOutsideRosterOrHorizon_Dropped)
{
  Fixture f;
  Prediction pr = FlatPrediction(f.roster, f.horizon, ShiftValue::Late, 0.7);
  Distribution d;
  d.p.fill(0.25);
  pr.per_cell[DateCell{"ghost", "2024-06-03"}] = d;
  pr.per_cell[DateCell{"s1", "2024-07-01"}] = d;

  EXPECT_EQ(sanitize_prediction(pr, f.roster, f.horizon), "");
  EXPECT_EQ(pr.per_cell.size(), 14u);
}

// ====== DISTRIBUTION ======

TEST(PredictorTest, Argmax_TiesBreakInEnumOrder)
{
  Distribution d;
  d.p.fill(0.25);
  EXPECT_EQ(d.argmax(), ShiftValue::Early);

  d.p = {0.1, 0.4, 0.4, 0.1};
  EXPECT_EQ(d.argmax(), ShiftValue::Late);
}

// ====== PATTERN PREDICTOR ======

TEST(PatternPredictorTest, NoHistory_Unavailable)
{
  Fixture f;
  PatternPredictor p;
  EXPECT_FALSE(p.predict(f.roster, f.horizon, f.features).has_value());
}

TEST(PatternPredictorTest, DeepConsistentHistory_FullConfidence)
{
  Fixture f;
  PatternPredictor p(8);
  auto pr = p.predict(f.roster, f.horizon, ConsistentHistory(8));
  ASSERT_TRUE(pr.has_value());
  EXPECT_DOUBLE_EQ(pr->confidence, 1.0);

  EXPECT_EQ(pr->per_cell.at(DateCell{"s1", "2024-06-02"}).argmax(), ShiftValue::Off);
  EXPECT_EQ(pr->per_cell.at(DateCell{"s1", "2024-06-04"}).argmax(), ShiftValue::Late);
  EXPECT_EQ(pr->per_cell.at(DateCell{"s2", "2024-06-08"}).argmax(), ShiftValue::Normal);
  EXPECT_DOUBLE_EQ(pr->per_cell.at(DateCell{"s2", "2024-06-08"}).p[shift_index(ShiftValue::Normal)], 0.75);
}

TEST(PatternPredictorTest, ShallowHistory_LowerConfidence)
{
  Fixture f;
  PatternPredictor p(8);
  auto pr = p.predict(f.roster, f.horizon, ConsistentHistory(2));
  ASSERT_TRUE(pr.has_value());
  EXPECT_DOUBLE_EQ(pr->confidence, 0.25);
}

TEST(PatternPredictorTest, StaffWithoutHistory_LeftOut)
{
  Fixture f;
  f.roster.push_back(MakeStaff("s3"));
  PatternPredictor p(8);
  auto pr = p.predict(f.roster, f.horizon, ConsistentHistory(8));
  ASSERT_TRUE(pr.has_value());
  EXPECT_EQ(pr->per_cell.count(DateCell{"s3", "2024-06-03"}), 0u);
  EXPECT_EQ(pr->per_cell.size(), 14u);
}
