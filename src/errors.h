// errors.h
#pragma once
#include <stdexcept>
#include <utility>
#include <string>
#include <vector>

#include "types.h"

namespace rostra {

// Contradictory or malformed constraint snapshot; raised before generation.
class ConfigurationError : public std::runtime_error {
 public:
  ConfigurationError(std::string constraint_id, const std::string& msg)
      : std::runtime_error("configuration error [" + constraint_id + "]: " + msg),
        constraint_id_(std::move(constraint_id)) {}

  const std::string& constraint_id() const { return constraint_id_; }

 private:
  std::string constraint_id_;
};

// Engine bug: a locked cell changed or a Tier-1 violation survived repair.
class InvariantViolation : public std::runtime_error {
 public:
  InvariantViolation(std::string constraint_id, std::vector<DateCell> cells, const std::string& msg)
      : std::runtime_error("invariant violation [" + constraint_id + "]: " + msg),
        constraint_id_(std::move(constraint_id)), cells_(std::move(cells)) {}

  const std::string& constraint_id() const { return constraint_id_; }
  const std::vector<DateCell>& cells() const { return cells_; }

 private:
  std::string constraint_id_;
  std::vector<DateCell> cells_;
};

class RunCancelled : public std::runtime_error {
 public:
  explicit RunCancelled(const std::string& stage)
      : std::runtime_error("run cancelled before stage: " + stage), stage_(stage) {}

  const std::string& stage() const { return stage_; }

 private:
  std::string stage_;
};

} // namespace rostra
