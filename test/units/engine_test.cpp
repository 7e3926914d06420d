#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <thread>

#include "engine.h"
#include "errors.h"
#include "report_io.h"
#include "validation.h"
#include "utils/test_utils.h"

using namespace rostra;
using namespace TestUtils;

namespace
{

EngineOptions Quiet()
{
  EngineOptions opt;
  opt.predictor_timeout_ms = 500;
  opt.solver_time_limit_seconds = 5.0;
  return opt;
}

// Five staff, at most two off per day, three days off each if the cap allows it.
ConfigSnapshot OffCapSnapshot()
{
  ConfigSnapshot snap;
  snap.version = "cap-v1";
  snap.roster = MakeRoster(5);
  snap.constraints.push_back(MakeDailyLimit("off-cap", ShiftValue::Off, -1, 2));
  snap.off_day_target = 3;
  return snap;
}

ConfigSnapshot MandateSnapshot()
{
  ConfigSnapshot snap;
  snap.roster = {MakeStaff("s1", true), MakeStaff("s2")};
  snap.mandates.must_work = {"2024-06-03"};
  snap.mandates.must_off = {"2024-06-05"};
  return snap;
}

// Two staff who may never work two days running and never be off together.
ConfigSnapshot AlternatingSnapshot()
{
  ConfigSnapshot snap;
  snap.roster = MakeRoster(2);
  snap.rest.max_consecutive_work_days = 1;
  snap.constraints.push_back(MakeDailyLimit("one-off", ShiftValue::Off, -1, 1));
  return snap;
}

class CancelOnStage : public AuditSink
{
public:
  CancelOnStage(CancellationToken & token, std::string stage) : token_(token), stage_(std::move(stage)) {}

  void emit(AuditEvent const & e) override
  {
    if (e.stage == stage_)
      token_.cancel();
  }

private:
  CancellationToken & token_;
  std::string stage_;
};

class BrokenSink : public AuditSink
{
public:
  void emit(AuditEvent const &) override { throw std::runtime_error("disk full"); }
};

}  // namespace

// ====== SCENARIOS ======

TEST(EngineTest, DailyOffCap_RespectedAndOffDaysSpread)
{
  Engine engine(Quiet());
  GenerationReport rep = engine.generate(MakeRequest(Share(OffCapSnapshot())));

  EXPECT_EQ(rep.config_version, "cap-v1");
  EXPECT_EQ(rep.method, GenerationMethod::RuleOnly);
  EXPECT_EQ(rep.predictor_status, PredictorStatus::NotConfigured);
  for (int d = 0; d < rep.horizon.size(); ++d)
    EXPECT_LE(CountOnDay(rep.schedule, d, ShiftValue::Off), 2) << rep.horizon.dates[d];
  for (int off : rep.metrics.off_days_per_staff)
    EXPECT_GE(off, 2);
  EXPECT_TRUE(tier1_violations(rep.final_violations).empty());
}

TEST(EngineTest, CalendarMandates_LockedThroughWholeRun)
{
  Engine engine(Quiet());
  GenerationReport rep = engine.generate(MakeRequest(Share(MandateSnapshot())));

  const int work = rep.horizon.index_of("2024-06-03");
  const int off = rep.horizon.index_of("2024-06-05");
  EXPECT_EQ(rep.schedule.at(0, work), ShiftValue::Normal);
  EXPECT_EQ(rep.schedule.at(1, work), ShiftValue::Normal);
  EXPECT_EQ(rep.schedule.at(0, off), ShiftValue::Early);
  EXPECT_EQ(rep.schedule.at(1, off), ShiftValue::Off);
  EXPECT_EQ(rep.lock_summary.total, 4);
  EXPECT_EQ(rep.lock_summary.early_cells, 1);
}

TEST(EngineTest, SameRequestAndSeed_IdenticalReport)
{
  ConfigSnapshot snap = OffCapSnapshot();
  snap.constraints.push_back(MakePriorityRule("s2-late", PriorityRuleType::PreferredShift, {"s2"},
                                              ShiftValue::Late, {}, {1, 3, 5}));
  ConfigSnapshotPtr shared = Share(snap);
  Engine engine(Quiet());

  GenerationReport a = engine.generate(MakeRequest(shared, kWeekStart, kWeekEnd, 99));
  GenerationReport b = engine.generate(MakeRequest(shared, kWeekStart, kWeekEnd, 99));
  EXPECT_EQ(report_to_json(a).dump(), report_to_json(b).dump());
  EXPECT_EQ(a.rng_seed, 99u);
}

TEST(EngineTest, ConcurrentRunsShareEngineAndSnapshot)
{
  ConfigSnapshotPtr shared = Share(OffCapSnapshot());
  Engine engine(Quiet());
  GenerationReport a, b;
  std::thread t1([&] { a = engine.generate(MakeRequest(shared)); });
  std::thread t2([&] { b = engine.generate(MakeRequest(shared)); });
  t1.join();
  t2.join();
  EXPECT_EQ(a.schedule, b.schedule);
}

TEST(EngineTest, RequestRoster_OverridesSnapshotRoster)
{
  GenerationRequest req = MakeRequest(Share(MandateSnapshot()));
  req.roster = {MakeStaff("x1", true), MakeStaff("x2"), MakeStaff("x3")};
  GenerationReport rep = Engine(Quiet()).generate(req);

  EXPECT_EQ(rep.staff_ids, std::vector<std::string>({"x1", "x2", "x3"}));
  EXPECT_EQ(rep.schedule.staff_count(), 3);
}

TEST(EngineTest, PrefilledCells_KeptThroughWholeRun)
{
  GenerationRequest req = MakeRequest(Share(OffCapSnapshot()));
  req.prefilled[DateCell{"s1", "2024-06-04"}] = ShiftValue::Off;
  req.prefilled[DateCell{"s2", "2024-06-04"}] = ShiftValue::Late;
  req.prefilled[DateCell{"s3", "2024-06-06"}] = ShiftValue::Off;
  GenerationReport rep = Engine(Quiet()).generate(req);

  const int tue = rep.horizon.index_of("2024-06-04");
  const int thu = rep.horizon.index_of("2024-06-06");
  EXPECT_EQ(rep.schedule.at(0, tue), ShiftValue::Off);
  EXPECT_EQ(rep.schedule.at(1, tue), ShiftValue::Late);
  EXPECT_EQ(rep.schedule.at(2, thu), ShiftValue::Off);
  EXPECT_EQ(rep.lock_summary.prefilled_cells, 3);
  EXPECT_EQ(rep.lock_summary.total, 3);
  EXPECT_EQ(report_to_json(rep)["locks"]["prefilledCells"], 3);
  EXPECT_TRUE(tier1_violations(rep.final_violations).empty());
}

TEST(EngineTest, PrefilledAboveTier1Cap_ConfigurationError)
{
  GenerationRequest req = MakeRequest(Share(OffCapSnapshot()));
  for (char const * id : {"s1", "s2", "s3"})
    req.prefilled[DateCell{id, "2024-06-04"}] = ShiftValue::Off;
  try
  {
    Engine(Quiet()).generate(req);
    FAIL() << "expected ConfigurationError";
  }
  catch (ConfigurationError const & e)
  {
    EXPECT_EQ(e.constraint_id(), "off-cap");
  }
}

TEST(EngineTest, PrefilledAgainstMandate_ConfigurationError)
{
  GenerationRequest req = MakeRequest(Share(MandateSnapshot()));
  req.prefilled[DateCell{"s2", "2024-06-05"}] = ShiftValue::Normal;
  EXPECT_THROW(Engine(Quiet()).generate(req), ConfigurationError);
}

// ====== PREDICTOR PATHS ======

TEST(EngineTest, ThrowingPredictor_FallsBackToRules)
{
  Engine engine(Quiet(), std::make_shared<ScriptedPredictor>(std::nullopt, 0, true));
  GenerationReport rep = engine.generate(MakeRequest(Share(OffCapSnapshot())));

  EXPECT_EQ(rep.predictor_status, PredictorStatus::Failed);
  EXPECT_EQ(rep.predictor_reason, "model file missing");
  EXPECT_EQ(rep.method, GenerationMethod::RuleOnly);
  EXPECT_EQ(rep.band, ConfidenceBand::Unavailable);
  EXPECT_TRUE(tier1_violations(rep.final_violations).empty());
}

TEST(EngineTest, SlowPredictor_TimesOutAndRunStillCompletes)
{
  ConfigSnapshot snap = OffCapSnapshot();
  Horizon h = make_horizon(kWeekStart, kWeekEnd);
  EngineOptions opt = Quiet();
  opt.predictor_timeout_ms = 10;
  Engine engine(opt, std::make_shared<ScriptedPredictor>(FlatPrediction(snap.roster, h, ShiftValue::Off, 0.9), 300));

  GenerationReport rep = engine.generate(MakeRequest(Share(snap)));
  EXPECT_EQ(rep.predictor_status, PredictorStatus::TimedOut);
  EXPECT_EQ(rep.method, GenerationMethod::RuleOnly);
}

TEST(EngineTest, HighConfidence_PredictorDirectThenTier1Repair)
{
  ConfigSnapshot snap;
  snap.roster = MakeRoster(2);
  snap.constraints.push_back(MakeDailyLimit("one-late", ShiftValue::Late, -1, 1));
  Horizon h = make_horizon(kWeekStart, kWeekEnd);
  Engine engine(Quiet(), std::make_shared<ScriptedPredictor>(FlatPrediction(snap.roster, h, ShiftValue::Late, 0.9)));

  GenerationReport rep = engine.generate(MakeRequest(Share(snap)));
  EXPECT_EQ(rep.method, GenerationMethod::PredictorDirect);
  EXPECT_EQ(rep.band, ConfidenceBand::High);
  EXPECT_TRUE(rep.stages.empty());
  EXPECT_EQ(rep.pre_repair_violations.size(), 7u);
  for (int d = 0; d < rep.horizon.size(); ++d)
    EXPECT_EQ(CountOnDay(rep.schedule, d, ShiftValue::Late), 1);
  EXPECT_TRUE(tier1_violations(rep.final_violations).empty());
}

TEST(EngineTest, MediumConfidence_HybridRunsGenerator)
{
  ConfigSnapshot snap = OffCapSnapshot();
  Horizon h = make_horizon(kWeekStart, kWeekEnd);
  Engine engine(Quiet(), std::make_shared<ScriptedPredictor>(FlatPrediction(snap.roster, h, ShiftValue::Off, 0.7)));

  GenerationReport rep = engine.generate(MakeRequest(Share(snap)));
  EXPECT_EQ(rep.method, GenerationMethod::Hybrid);
  EXPECT_FALSE(rep.stages.empty());
  for (int d = 0; d < rep.horizon.size(); ++d)
    EXPECT_LE(CountOnDay(rep.schedule, d, ShiftValue::Off), 2);
}

TEST(EngineTest, StuckPredictedSeed_FallsBackToRuleOnly)
{
  ConfigSnapshot snap = AlternatingSnapshot();
  Horizon h = make_horizon(kWeekStart, kWeekEnd);
  // Both staff off on the same even days: no single-cell repair helps.
  Prediction pr = FlatPrediction(snap.roster, h, ShiftValue::Normal, 0.9);
  Distribution off;
  off.p.fill(0.1);
  off.p[shift_index(ShiftValue::Off)] = 0.7;
  for (int d = 0; d < h.size(); d += 2)
  {
    pr.per_cell[DateCell{"s1", h.dates[d]}] = off;
    pr.per_cell[DateCell{"s2", h.dates[d]}] = off;
  }
  EngineOptions opt = Quiet();
  opt.use_solver_repair = false;
  Engine engine(opt, std::make_shared<ScriptedPredictor>(pr));
  CollectingAuditSink sink;

  GenerationReport rep;
  ASSERT_NO_THROW(rep = engine.generate(MakeRequest(Share(snap)), &sink));
  EXPECT_EQ(rep.band, ConfidenceBand::High);
  EXPECT_EQ(rep.method, GenerationMethod::RuleOnly);
  EXPECT_NE(rep.fallback_reason.find("predictor_direct"), std::string::npos);
  EXPECT_FALSE(rep.stages.empty());
  EXPECT_TRUE(tier1_violations(rep.final_violations).empty());
  for (int d = 0; d < rep.horizon.size(); ++d)
    EXPECT_EQ(CountOnDay(rep.schedule, d, ShiftValue::Off), 1) << rep.horizon.dates[d];
  EXPECT_EQ(report_to_json(rep)["method"], "rule_only");

  auto events = sink.events();
  EXPECT_TRUE(std::any_of(events.begin(), events.end(), [](AuditEvent const & e) { return e.stage == "fallback"; }));
}

TEST(EngineTest, CleanPredictedSeed_NoFallbackReason)
{
  ConfigSnapshot snap;
  snap.roster = MakeRoster(2);
  Horizon h = make_horizon(kWeekStart, kWeekEnd);
  Engine engine(Quiet(), std::make_shared<ScriptedPredictor>(FlatPrediction(snap.roster, h, ShiftValue::Late, 0.95)));

  GenerationReport rep = engine.generate(MakeRequest(Share(snap)));
  EXPECT_EQ(rep.method, GenerationMethod::PredictorDirect);
  EXPECT_TRUE(rep.fallback_reason.empty());
}

// ====== FAILURES ======

TEST(EngineTest, MissingOrBadConfig_ConfigurationError)
{
  Engine engine(Quiet());
  GenerationRequest req = MakeRequest(nullptr);
  EXPECT_THROW(engine.generate(req), ConfigurationError);

  ConfigSnapshot bad = OffCapSnapshot();
  bad.constraints.push_back(MakeDailyLimit("inverted", ShiftValue::Late, 3, 1));
  try
  {
    engine.generate(MakeRequest(Share(bad)));
    FAIL() << "expected ConfigurationError";
  }
  catch (ConfigurationError const & e)
  {
    EXPECT_EQ(e.constraint_id(), "inverted");
  }

  EXPECT_THROW(engine.generate(MakeRequest(Share(OffCapSnapshot()), kWeekEnd, kWeekStart)), ConfigurationError);
}

TEST(EngineTest, DuplicateStaffInRequest_ConfigurationError)
{
  GenerationRequest req = MakeRequest(Share(OffCapSnapshot()));
  req.roster = {MakeStaff("a"), MakeStaff("a")};
  EXPECT_THROW(Engine(Quiet()).generate(req), ConfigurationError);
}

TEST(EngineTest, UnsatisfiableTier1_InvariantViolation)
{
  ConfigSnapshot snap;
  snap.roster = MakeRoster(1);
  snap.adjacent.enabled = true;
  snap.adjacent.tier = 1;
  PriorityRule only_off = MakePriorityRule("only-off", PriorityRuleType::AllowOnlyShifts, {"s1"},
                                           ShiftValue::Normal, {ShiftValue::Off});
  only_off.meta.tier = 1;
  snap.constraints.push_back(only_off);

  try
  {
    Engine(Quiet()).generate(MakeRequest(Share(snap)));
    FAIL() << "expected InvariantViolation";
  }
  catch (InvariantViolation const & e)
  {
    EXPECT_FALSE(e.cells().empty());
  }
}

TEST(EngineTest, CancelledBeforeStart_RunCancelled)
{
  CancellationToken token;
  token.cancel();
  try
  {
    Engine(Quiet()).generate(MakeRequest(Share(OffCapSnapshot())), nullptr, &token);
    FAIL() << "expected RunCancelled";
  }
  catch (RunCancelled const & e)
  {
    EXPECT_EQ(e.stage(), "lock");
  }
}

TEST(EngineTest, CancelledMidRun_StopsAtNextStage)
{
  CancellationToken token;
  CancelOnStage sink(token, "validate");
  try
  {
    Engine(Quiet()).generate(MakeRequest(Share(OffCapSnapshot())), &sink, &token);
    FAIL() << "expected RunCancelled";
  }
  catch (RunCancelled const & e)
  {
    EXPECT_EQ(e.stage(), "repair");
  }
}

// ====== AUDIT ======

TEST(EngineTest, Audit_EveryStageReported)
{
  CollectingAuditSink sink;
  Engine(Quiet()).generate(MakeRequest(Share(OffCapSnapshot())), &sink);

  auto events = sink.events();
  ASSERT_GE(events.size(), 11u);
  EXPECT_EQ(events[0].stage, "lock");
  EXPECT_EQ(events[1].stage, "predict");
  EXPECT_EQ(events[1].detail, "rule_only");
  EXPECT_EQ(events[2].stage, "group_rules");
  EXPECT_EQ(events[events.size() - 3].stage, "validate");
  EXPECT_EQ(events[events.size() - 2].stage, "repair");
  EXPECT_EQ(events.back().stage, "final_validate");
}

TEST(EngineTest, FailingAuditSink_DoesNotFailRun)
{
  BrokenSink sink;
  GenerationReport rep;
  EXPECT_NO_THROW(rep = Engine(Quiet()).generate(MakeRequest(Share(OffCapSnapshot())), &sink));
  EXPECT_TRUE(tier1_violations(rep.final_violations).empty());
}
