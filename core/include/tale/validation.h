#pragma once

#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "tale/config.h"
#include "tale/errors.h"
#include "tale/payload.h"
#include "tale/universe_time.h"

namespace tale {

struct ValidationIssue {
  std::string field;
  std::string code;
  std::string message;
};

class ValidationResult {
 public:
  void add_error(std::string field, std::string code, std::string message);
  void add_warning(std::string field, std::string code, std::string message);
  // Appends both lists; validity is the AND of the two.
  ValidationResult& merge(const ValidationResult& other);

  bool valid() const { return errors_.empty(); }
  const std::vector<ValidationIssue>& errors() const { return errors_; }
  const std::vector<ValidationIssue>& warnings() const { return warnings_; }

  std::vector<TurnError> error_list() const;
  std::vector<std::string> warning_messages() const;

 private:
  std::vector<ValidationIssue> errors_;
  std::vector<ValidationIssue> warnings_;
};

// Allow-list of mutable state locations, compiled once from the config.
class PatchPathPolicy {
 public:
  explicit PatchPathPolicy(const std::vector<PatchPathRule>& rules);

  // Domain of the first matching rule, or nothing when the path is not mutable.
  std::optional<ValueDomain> match(const std::string& path) const;
  size_t size() const { return rules_.size(); }

 private:
  struct Compiled {
    std::regex pattern;
    ValueDomain domain;
  };
  std::vector<Compiled> rules_;
};

class RollRequestValidator {
 public:
  explicit RollRequestValidator(const EngineConfig& config) : config_(config) {}
  ValidationResult validate(const std::vector<RollRequest>& requests) const;

 private:
  void validate_one(const RollRequest& request, const std::string& prefix, ValidationResult& out) const;

  const EngineConfig& config_;
};

class PatchValidator {
 public:
  explicit PatchValidator(const EngineConfig& config);
  ValidationResult validate(const std::vector<PatchOp>& patches) const;

  const PatchPathPolicy& policy() const { return policy_; }

 private:
  const EngineConfig& config_;
  PatchPathPolicy policy_;
  Calendar calendar_ = Calendar::standard();
};

class LoreDeltaValidator {
 public:
  explicit LoreDeltaValidator(const EngineConfig& config) : config_(config) {}
  ValidationResult validate(const std::vector<LoreDelta>& deltas) const;

 private:
  const EngineConfig& config_;
};

// Runs decoding diagnostics plus all three validators; failures accumulate.
class OutputValidator {
 public:
  explicit OutputValidator(const EngineConfig& config);

  ValidationResult validate(const DecodedPayload& payload) const;

  const RollRequestValidator& rolls() const { return rolls_; }
  const PatchValidator& patches() const { return patches_; }
  const LoreDeltaValidator& lore() const { return lore_; }

 private:
  RollRequestValidator rolls_;
  PatchValidator patches_;
  LoreDeltaValidator lore_;
};

} // namespace tale
