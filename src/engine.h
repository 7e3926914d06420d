// engine.h
#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "audit.h"
#include "constraints.h"
#include "engine_options.h"
#include "generator.h"
#include "hybrid.h"
#include "locker.h"
#include "penalties.h"
#include "predictor.h"
#include "repair.h"
#include "types.h"

namespace rostra {

class RuleIndex;

struct GenerationRequest {
  std::vector<Staff> roster;                 // empty = the snapshot's roster
  std::string start_date;                    // "YYYY-MM-DD", inclusive
  std::string end_date;
  ConfigSnapshotPtr config;
  PrefilledCells prefilled;                  // user-entered cells, locked as given
  std::optional<PredictorFeatures> features;
  std::optional<std::uint64_t> rng_seed;     // EngineOptions::default_rng_seed when absent
};

struct GenerationReport {
  std::string config_version;
  Horizon horizon;
  std::vector<std::string> staff_ids;        // schedule row order
  Schedule schedule;

  std::vector<Violation> pre_repair_violations;
  std::vector<Violation> final_violations;   // every tier, after repair
  RepairSummary repair;

  GenerationMethod method = GenerationMethod::RuleOnly;   // what produced the final schedule
  ConfidenceBand band = ConfidenceBand::Unavailable;
  double confidence = 0.0;
  PredictorStatus predictor_status = PredictorStatus::NotConfigured;
  std::string predictor_reason;
  std::string fallback_reason;               // set when a predicted seed was abandoned for rule_only

  FairnessMetrics metrics;
  LockSummary lock_summary;
  std::uint64_t rng_seed = 0;
  std::vector<StageStat> stages;
};

// Runs lock -> predict -> decide -> generate -> validate -> repair -> validate.
// Stateless between runs; one Engine may serve concurrent generate() calls.
class Engine {
 public:
  explicit Engine(EngineOptions opt = {}, std::shared_ptr<const Predictor> predictor = nullptr)
      : opt_(opt), predictor_(std::move(predictor)) {}

  const EngineOptions& options() const { return opt_; }

  // Throws ConfigurationError before any generation work, InvariantViolation
  // when a lock breaks or a Tier-1 violation survives repair (after the
  // rule-only rerun for predicted seeds), RunCancelled when
  // the token is set at a stage boundary. Audit failures never propagate.
  GenerationReport generate(const GenerationRequest& request,
                            AuditSink* audit = nullptr,
                            const CancellationToken* cancel = nullptr) const;

 private:
  // generate -> validate -> repair -> final validate from decision's seed.
  Schedule run_pipeline(const RuleIndex& index, HybridDecision& decision, std::mt19937_64& rng,
                        GenerationReport& rep, AuditSink* audit, const CancellationToken* cancel) const;

  EngineOptions opt_;
  std::shared_ptr<const Predictor> predictor_;
};

} // namespace rostra
