// predictor.h
#pragma once
#include <array>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "types.h"

namespace rostra {

// Class probabilities indexed by ShiftValue.
struct Distribution {
  std::array<double, kShiftValueCount> p{};

  // Ties break in enum order: Early, Late, Off, Normal.
  ShiftValue argmax() const;
};

struct Prediction {
  std::map<DateCell, Distribution> per_cell;
  double confidence = 0.0;   // [0, 1]
};

struct HistoricalSchedule {
  std::string label;                       // e.g. period name
  std::map<DateCell, ShiftValue> cells;
};

struct PredictorFeatures {
  std::vector<HistoricalSchedule> history;
};

// External learned model. Implementations must be safe to call from a worker
// thread and must not keep references to the arguments after returning.
class Predictor {
 public:
  virtual ~Predictor() = default;

  // nullopt = Unavailable (untrained, unusable input).
  virtual std::optional<Prediction> predict(const std::vector<Staff>& roster,
                                            const Horizon& horizon,
                                            const PredictorFeatures& features) const = 0;
};

enum class PredictorStatus { Available, NotConfigured, Unavailable, Failed, TimedOut, Malformed };

const char* predictor_status_name(PredictorStatus s);

struct PredictionOutcome {
  PredictorStatus status = PredictorStatus::NotConfigured;
  std::optional<Prediction> prediction;
  std::string reason;

  bool available() const { return status == PredictorStatus::Available; }
};

// Runs the predictor under a timeout. Never throws: every failure mode comes
// back as a non-available outcome. A timed-out call keeps running detached and
// its result is discarded.
PredictionOutcome call_predictor(std::shared_ptr<const Predictor> predictor,
                                 const std::vector<Staff>& roster,
                                 const Horizon& horizon,
                                 const PredictorFeatures& features,
                                 int timeout_ms);

// Rejects out-of-range confidence or probabilities and drops cells outside
// the roster or horizon. Returns an empty string when the prediction is usable.
std::string sanitize_prediction(Prediction& prediction, const std::vector<Staff>& roster, const Horizon& horizon);

// Per staff x weekday shift frequencies from history, Laplace smoothed.
// Confidence grows with history depth and with how consistent each staff's
// weekday pattern is. Unavailable without usable history.
class PatternPredictor : public Predictor {
 public:
  explicit PatternPredictor(int full_depth = 8) : full_depth_(full_depth) {}

  std::optional<Prediction> predict(const std::vector<Staff>& roster,
                                    const Horizon& horizon,
                                    const PredictorFeatures& features) const override;

 private:
  int full_depth_;   // observations per staff x weekday at which depth stops mattering
};

} // namespace rostra
