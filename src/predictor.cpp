// predictor.cpp
#include "predictor.h"
#include "utils.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <future>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <utility>

namespace rostra {

ShiftValue Distribution::argmax() const {
  int best = 0;
  for (int i = 1; i < kShiftValueCount; ++i)
    if (p[i] > p[best]) best = i;
  return static_cast<ShiftValue>(best);
}

const char* predictor_status_name(PredictorStatus s) {
  switch (s) {
    case PredictorStatus::Available:     return "available";
    case PredictorStatus::NotConfigured: return "not_configured";
    case PredictorStatus::Unavailable:   return "unavailable";
    case PredictorStatus::Failed:        return "failed";
    case PredictorStatus::TimedOut:      return "timed_out";
    case PredictorStatus::Malformed:     return "malformed";
  }
  return "unavailable";
}

std::string sanitize_prediction(Prediction& pr, const std::vector<Staff>& roster, const Horizon& horizon) {
  if (!std::isfinite(pr.confidence) || pr.confidence < 0.0 || pr.confidence > 1.0)
    return "confidence outside [0,1]";

  std::unordered_map<std::string, int> known;
  for (const auto& s : roster) known.emplace(s.id, 1);

  for (auto it = pr.per_cell.begin(); it != pr.per_cell.end();) {
    if (!known.count(it->first.staff_id) || horizon.index_of(it->first.date) < 0) {
      it = pr.per_cell.erase(it);
      continue;
    }
    double sum = 0.0;
    for (double x : it->second.p) {
      if (!std::isfinite(x) || x < 0.0)
        return "invalid probability for " + it->first.staff_id + "@" + it->first.date;
      sum += x;
    }
    if (sum <= 0.0) return "empty distribution for " + it->first.staff_id + "@" + it->first.date;
    ++it;
  }
  return {};
}

PredictionOutcome call_predictor(std::shared_ptr<const Predictor> predictor,
                                 const std::vector<Staff>& roster,
                                 const Horizon& horizon,
                                 const PredictorFeatures& features,
                                 int timeout_ms) {
  PredictionOutcome out;
  if (!predictor) {
    out.status = PredictorStatus::NotConfigured;
    out.reason = "no predictor configured";
    return out;
  }

  // The worker owns copies of everything it reads, so a run that gave up
  // waiting can return while the call is still in flight.
  std::packaged_task<std::optional<Prediction>()> task(
      [predictor, roster, horizon, features]() { return predictor->predict(roster, horizon, features); });
  std::future<std::optional<Prediction>> fut = task.get_future();
  std::thread(std::move(task)).detach();

  if (fut.wait_for(std::chrono::milliseconds(std::max(0, timeout_ms))) != std::future_status::ready) {
    out.status = PredictorStatus::TimedOut;
    out.reason = "no answer within " + std::to_string(timeout_ms) + " ms";
    return out;
  }

  std::optional<Prediction> result;
  try {
    result = fut.get();
  } catch (const std::exception& e) {
    out.status = PredictorStatus::Failed;
    out.reason = e.what();
    return out;
  } catch (...) {
    out.status = PredictorStatus::Failed;
    out.reason = "predictor threw a non-standard exception";
    return out;
  }

  if (!result) {
    out.status = PredictorStatus::Unavailable;
    out.reason = "predictor reported unavailable";
    return out;
  }

  const std::string bad = sanitize_prediction(*result, roster, horizon);
  if (!bad.empty()) {
    out.status = PredictorStatus::Malformed;
    out.reason = bad;
    return out;
  }

  out.status = PredictorStatus::Available;
  out.prediction = std::move(result);
  return out;
}

std::optional<Prediction> PatternPredictor::predict(const std::vector<Staff>& roster,
                                                    const Horizon& horizon,
                                                    const PredictorFeatures& features) const {
  if (features.history.empty() || roster.empty() || horizon.size() == 0) return std::nullopt;

  std::unordered_map<std::string, int> pos;
  for (int s = 0; s < static_cast<int>(roster.size()); ++s) pos.emplace(roster[s].id, s);

  // counts[s][weekday][value]
  using Slot = std::array<int, kShiftValueCount>;
  std::vector<std::array<Slot, 7>> counts(roster.size());
  for (auto& per_staff : counts)
    for (auto& slot : per_staff) slot.fill(0);

  int observed = 0;
  for (const auto& h : features.history) {
    for (const auto& [cell, value] : h.cells) {
      auto it = pos.find(cell.staff_id);
      if (it == pos.end()) continue;
      Ymd c;
      try {
        c = parse_ymd(cell.date);
      } catch (const std::invalid_argument&) {
        continue;
      }
      counts[it->second][weekday_from_ymd(c)][shift_index(value)] += 1;
      ++observed;
    }
  }
  if (observed == 0) return std::nullopt;

  double depth_sum = 0.0, consistency_sum = 0.0;
  int slots = 0;
  for (const auto& per_staff : counts)
    for (const auto& slot : per_staff) {
      int n = 0, top = 0;
      for (int c : slot) {
        n += c;
        top = std::max(top, c);
      }
      if (n == 0) continue;
      depth_sum += std::min(1.0, static_cast<double>(n) / full_depth_);
      consistency_sum += static_cast<double>(top) / n;
      ++slots;
    }

  Prediction pr;
  pr.confidence = (depth_sum / slots) * (consistency_sum / slots);

  for (int s = 0; s < static_cast<int>(roster.size()); ++s)
    for (int d = 0; d < horizon.size(); ++d) {
      const Slot& slot = counts[s][horizon.weekday[d]];
      int n = 0;
      for (int c : slot) n += c;
      if (n == 0) continue;   // no evidence: leave the cell to the rule-based seed
      Distribution dist;
      for (int v = 0; v < kShiftValueCount; ++v)
        dist.p[v] = (slot[v] + 1.0) / (n + static_cast<double>(kShiftValueCount));
      pr.per_cell.emplace(DateCell{roster[s].id, horizon.dates[d]}, dist);
    }
  return pr;
}

} // namespace rostra
