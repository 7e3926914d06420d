// engine.cpp
#include "engine.h"
#include "errors.h"
#include "log.h"
#include "rule_index.h"
#include "schedule_state.h"
#include "utils.h"
#include "validation.h"

#include <iostream>
#include <random>
#include <set>
#include <utility>

namespace rostra {

namespace {

void ensure_locked(const RuleIndex& index, const Schedule& schedule, const std::string& stage) {
  const auto broken = verify_locked(index.locks(), schedule);
  if (broken.empty()) return;
  const ConstraintKind k = index.locks().source(broken.front().staff, broken.front().day);
  throw InvariantViolation(PriorityRegistry::info(k).id, index.date_cells(broken),
                           "locked cell changed during " + stage);
}

void ensure_tier1_clean(const RuleIndex& index, const std::vector<Violation>& final_violations) {
  const auto t1 = tier1_violations(final_violations);
  if (t1.empty()) return;
  std::set<CellRef> cells;
  for (const auto& v : t1) cells.insert(v.cells.begin(), v.cells.end());
  throw InvariantViolation(t1.front().constraint_id,
                           index.date_cells(std::vector<CellRef>(cells.begin(), cells.end())),
                           std::to_string(t1.size()) + " Tier-1 violation(s) survived repair, first: " + t1.front().key);
}

AuditEvent event(const std::string& stage, int changed, int found, int repaired, std::string detail = {}) {
  AuditEvent ev;
  ev.stage = stage;
  ev.cells_changed = changed;
  ev.violations_found = found;
  ev.violations_repaired = repaired;
  ev.detail = std::move(detail);
  return ev;
}

} // namespace

Schedule Engine::run_pipeline(const RuleIndex& index, HybridDecision& decision, std::mt19937_64& rng,
                              GenerationReport& rep, AuditSink* audit, const CancellationToken* cancel) const {
  Schedule seed = std::move(decision.seed);
  apply_locks(index.locks(), seed);
  ScheduleState state(std::move(seed), index.locks());

  // ---- generate ----
  rep.stages.clear();
  if (decision.run_generator()) {
    check_cancelled(cancel, "generate");
    GeneratorOptions gopt;
    gopt.max_fixed_point_iterations = opt_.max_fixed_point_iterations;
    gopt.max_pipeline_passes = opt_.max_pipeline_passes;
    gopt.verbose = opt_.verbose;
    RuleBasedGenerator gen(index, gopt, rng);
    rep.stages = gen.run(state, [&](const StageStat& st, const ScheduleState& s) {
      ensure_locked(index, s.schedule(), st.stage);
      emit_safely(audit, event(st.stage, st.cells_changed, 0, 0, "pass " + std::to_string(st.pass)), opt_.verbose);
      check_cancelled(cancel, st.stage);
    });
  }
  ensure_locked(index, state.schedule(), "generation");

  // ---- validate ----
  check_cancelled(cancel, "validate");
  rep.pre_repair_violations = validate(state.schedule(), index, decision.repair_tier_limit());
  emit_safely(audit, event("validate", 0, static_cast<int>(rep.pre_repair_violations.size()), 0), opt_.verbose);

  // ---- repair ----
  check_cancelled(cancel, "repair");
  RepairOptions ropt;
  ropt.max_passes = opt_.max_repair_passes;
  ropt.tier_limit = decision.repair_tier_limit();
  ropt.use_solver = opt_.use_solver_repair;
  ropt.solver_time_limit_seconds = opt_.solver_time_limit_seconds;
  ropt.verbose = opt_.verbose;
  rep.repair = RepairEngine(index, ropt).repair(state);
  emit_safely(audit,
              event("repair", static_cast<int>(rep.repair.actions.size()), rep.repair.attempted, rep.repair.repaired,
                    rep.repair.solver_used ? "solver " + rep.repair.solver_status : std::string()),
              opt_.verbose);

  // ---- final validate ----
  check_cancelled(cancel, "final_validate");
  rep.final_violations = validate(state.schedule(), index);
  ensure_locked(index, state.schedule(), "repair");
  return state.schedule();
}

GenerationReport Engine::generate(const GenerationRequest& req, AuditSink* audit,
                                  const CancellationToken* cancel) const {
  const long long t0 = NowMillis();
  if (!req.config) throw ConfigurationError("config", "request carries no configuration snapshot");
  const ConfigSnapshot& snap = *req.config;
  check_snapshot(snap);

  std::vector<Staff> roster = req.roster.empty() ? snap.roster : req.roster;
  if (roster.empty()) throw ConfigurationError("roster", "no staff to schedule");
  {
    std::set<std::string> seen;
    for (const auto& s : roster)
      if (s.id.empty() || !seen.insert(s.id).second)
        throw ConfigurationError("roster", "missing or duplicate staff id '" + s.id + "'");
  }
  Horizon horizon = make_horizon(req.start_date, req.end_date);

  GenerationReport rep;
  rep.config_version = snap.version;
  rep.horizon = horizon;
  for (const auto& s : roster) rep.staff_ids.push_back(s.id);
  rep.rng_seed = req.rng_seed.value_or(opt_.default_rng_seed);
  std::mt19937_64 rng(rep.rng_seed);

  // ---- lock ----
  check_cancelled(cancel, "lock");
  LockedCells locks = lock_mandates(snap.mandates, roster, horizon, snap.must_off_early_for_eligible,
                                    &rep.lock_summary, req.prefilled);
  if (opt_.verbose) {
    std::cerr << "[locker] locked=" << rep.lock_summary.total
              << " must_work=" << rep.lock_summary.must_work_cells
              << " early=" << rep.lock_summary.early_cells
              << " off=" << rep.lock_summary.off_cells
              << " prefilled=" << rep.lock_summary.prefilled_cells
              << " skipped=" << rep.lock_summary.prefilled_skipped << "\n";
  }
  const RuleIndex index(req.config, roster, horizon, std::move(locks));
  emit_safely(audit, event("lock", rep.lock_summary.total, 0, 0), opt_.verbose);

  // ---- predict + decide ----
  check_cancelled(cancel, "predict");
  const PredictionOutcome outcome = call_predictor(predictor_, roster, horizon,
                                                   req.features.value_or(PredictorFeatures{}),
                                                   opt_.predictor_timeout_ms);
  rep.predictor_status = outcome.status;
  rep.predictor_reason = outcome.reason;

  HybridDecision decision = decide(outcome, roster, horizon, opt_);
  rep.method = decision.method;
  rep.band = decision.band;
  rep.confidence = decision.confidence;
  if (opt_.verbose) {
    std::cerr << "[hybrid] predictor=" << predictor_status_name(outcome.status)
              << (outcome.reason.empty() ? "" : " (" + outcome.reason + ")")
              << " band=" << band_name(decision.band)
              << " method=" << method_name(decision.method)
              << " seeded=" << decision.predicted_cells << "\n";
  }
  emit_safely(audit, event("predict", decision.predicted_cells, 0, 0, method_name(decision.method)), opt_.verbose);

  Schedule result = run_pipeline(index, decision, rng, rep, audit, cancel);

  // A predicted seed can leave the greedy repair stuck where the rule-only
  // pipeline would not. Rerun from the Normal-plus-locks seed before giving up.
  const auto leftover = tier1_violations(rep.final_violations);
  if (!leftover.empty() && decision.method != GenerationMethod::RuleOnly) {
    rep.fallback_reason = std::to_string(leftover.size()) + " Tier-1 violation(s) survived " +
                          method_name(decision.method) + " repair, first: " + leftover.front().key;
    if (opt_.verbose) std::cerr << "[hybrid] falling back to rule_only: " << rep.fallback_reason << "\n";
    emit_safely(audit, event("fallback", 0, static_cast<int>(leftover.size()), 0, rep.fallback_reason),
                opt_.verbose);

    HybridDecision rules;
    rules.seed = Schedule(index.staff_count(), index.day_count(), ShiftValue::Normal);
    rep.method = GenerationMethod::RuleOnly;
    std::mt19937_64 rule_rng(rep.rng_seed);
    result = run_pipeline(index, rules, rule_rng, rep, audit, cancel);
  }
  ensure_tier1_clean(index, rep.final_violations);

  rep.schedule = std::move(result);
  rep.metrics = compute_metrics(rep.schedule, index, rep.final_violations);
  emit_safely(audit, event("final_validate", 0, static_cast<int>(rep.final_violations.size()), 0), opt_.verbose);

  if (opt_.verbose) {
    std::cerr << "[engine] " << method_name(rep.method)
              << " staff=" << index.staff_count() << " days=" << index.day_count()
              << " violations=" << rep.final_violations.size()
              << " penalty=" << rep.metrics.penalty_score
              << " in " << (NowMillis() - t0) << " ms\n";
  }
  return rep;
}

} // namespace rostra
