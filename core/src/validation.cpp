#include "tale/validation.h"

#include "tale/checks.h"
#include "tale/dice.h"
#include "tale/log.h"

#include <map>
#include <set>
#include <utility>
#include <variant>

namespace tale {

namespace {
std::string indexed(const char* list, size_t i) {
  return std::string(list) + "[" + std::to_string(i) + "]";
}

bool is_non_negative_int(const nlohmann::json& v) {
  return v.is_number_unsigned() || (v.is_number_integer() && v.get<int64_t>() >= 0);
}

bool is_string_list(const nlohmann::json& v) {
  if (!v.is_array()) return false;
  for (const auto& item : v) {
    if (!item.is_string()) return false;
  }
  return true;
}

const std::set<std::string>& npc_statuses() {
  static const std::set<std::string> kStatuses = {"alive", "dead", "unconscious", "missing", "unknown"};
  return kStatuses;
}

const std::set<std::string>& npc_attitudes() {
  static const std::set<std::string> kAttitudes = {"hostile", "unfriendly", "neutral", "friendly", "helpful"};
  return kAttitudes;
}

void check_domain(ValueDomain domain, const nlohmann::json& value, const std::string& field,
                  ValidationResult& out) {
  const auto reject = [&](const char* expected) {
    out.add_error(field, "invalid_value", std::string("value must be ") + expected + ", got " + value.dump());
  };
  switch (domain) {
    case ValueDomain::Any:
      return;
    case ValueDomain::NonNegativeInt:
      if (!is_non_negative_int(value)) reject("a non-negative integer");
      return;
    case ValueDomain::Int:
      if (!value.is_number_integer()) reject("an integer");
      return;
    case ValueDomain::String:
      if (!value.is_string()) reject("a string");
      return;
    case ValueDomain::StringList:
      if (!is_string_list(value)) reject("a list of strings");
      return;
    case ValueDomain::List:
      if (!value.is_array()) reject("a list");
      return;
    case ValueDomain::Bool:
      if (!value.is_boolean()) reject("a boolean");
      return;
    case ValueDomain::Object:
      if (!value.is_object()) reject("an object");
      return;
    case ValueDomain::NpcStatus:
      if (!value.is_string() || npc_statuses().count(value.get<std::string>()) == 0) {
        out.add_warning(field, "unusual_value", "unusual NPC status: " + value.dump());
      }
      return;
    case ValueDomain::NpcAttitude:
      if (!value.is_string() || npc_attitudes().count(value.get<std::string>()) == 0) {
        out.add_warning(field, "unusual_value", "unusual NPC attitude: " + value.dump());
      }
      return;
  }
}

class PatchChecker {
 public:
  PatchChecker(const EngineConfig& config, const PatchPathPolicy& policy, const Calendar& calendar,
               const std::string& prefix, ValidationResult& out)
      : config_(config), policy_(policy), calendar_(calendar), prefix_(prefix), out_(out) {}

  void operator()(const ReplaceOp& op) const { check_write(op.path, op.value); }
  void operator()(const AddOp& op) const { check_write(op.path, op.value); }
  void operator()(const RemoveOp& op) const { check_path(op.path); }

  void operator()(const AdvanceTimeOp& op) const {
    const std::string field = prefix_ + ".value";
    if (!op.delta.is_object() || op.delta.empty()) {
      out_.add_error(field, "invalid_time", "advance_time needs a non-empty object value");
      return;
    }
    TimeDelta delta;
    std::string error;
    if (!time_delta_from_json(op.delta, delta, error)) {
      out_.add_error(field, "invalid_time", error);
      return;
    }
    const TimeCheck check = validate_time_delta(delta, calendar_, config_.max_turn_years);
    for (const auto& e : check.errors) out_.add_error(field, "invalid_time", e);
    for (const auto& w : check.warnings) out_.add_warning(field, "large_time_delta", w);
  }

  void operator()(const UnknownOp& op) const {
    out_.add_error(prefix_ + ".op", "unknown_op",
                   op.op.empty() ? std::string("patch has no operation") : "unknown patch operation '" + op.op + "'");
  }

 private:
  std::optional<ValueDomain> check_path(const std::string& path) const {
    if (path.empty()) return std::nullopt;  // reported while decoding
    if (path.front() != '/') {
      out_.add_error(prefix_ + ".path", "path_not_allowed", "patch path must start with '/': " + path);
      return std::nullopt;
    }
    auto domain = policy_.match(path);
    if (!domain.has_value()) {
      out_.add_error(prefix_ + ".path", "path_not_allowed", "path is not mutable: " + path);
    }
    return domain;
  }

  void check_write(const std::string& path, const nlohmann::json& value) const {
    const auto domain = check_path(path);
    if (domain.has_value()) {
      check_domain(*domain, value, prefix_ + ".value", out_);
    }
  }

  const EngineConfig& config_;
  const PatchPathPolicy& policy_;
  const Calendar& calendar_;
  const std::string& prefix_;
  ValidationResult& out_;
};
} // namespace

void ValidationResult::add_error(std::string field, std::string code, std::string message) {
  errors_.push_back(ValidationIssue{std::move(field), std::move(code), std::move(message)});
}

void ValidationResult::add_warning(std::string field, std::string code, std::string message) {
  warnings_.push_back(ValidationIssue{std::move(field), std::move(code), std::move(message)});
}

ValidationResult& ValidationResult::merge(const ValidationResult& other) {
  errors_.insert(errors_.end(), other.errors_.begin(), other.errors_.end());
  warnings_.insert(warnings_.end(), other.warnings_.begin(), other.warnings_.end());
  return *this;
}

std::vector<TurnError> ValidationResult::error_list() const {
  std::vector<TurnError> out;
  out.reserve(errors_.size());
  for (const auto& e : errors_) {
    out.push_back(TurnError{ErrorKind::Validation, e.code, e.field, e.message});
  }
  return out;
}

std::vector<std::string> ValidationResult::warning_messages() const {
  std::vector<std::string> out;
  out.reserve(warnings_.size());
  for (const auto& w : warnings_) {
    out.push_back(w.field.empty() ? w.message : w.field + ": " + w.message);
  }
  return out;
}

PatchPathPolicy::PatchPathPolicy(const std::vector<PatchPathRule>& rules) {
  for (const auto& rule : rules) {
    try {
      rules_.push_back(Compiled{std::regex(rule.pattern, std::regex::ECMAScript), rule.domain});
    } catch (const std::regex_error& e) {
      log::warn("patch path rule skipped (" + rule.pattern + "): " + e.what());
    }
  }
}

std::optional<ValueDomain> PatchPathPolicy::match(const std::string& path) const {
  for (const auto& rule : rules_) {
    if (std::regex_search(path, rule.pattern)) {
      return rule.domain;
    }
  }
  return std::nullopt;
}

ValidationResult RollRequestValidator::validate(const std::vector<RollRequest>& requests) const {
  ValidationResult out;
  std::set<std::string> seen;
  for (size_t i = 0; i < requests.size(); ++i) {
    const auto& request = requests[i];
    const std::string prefix = indexed("roll_requests", i);
    validate_one(request, prefix, out);
    if (request.id.empty()) continue;
    if (!seen.insert(request.id).second) {
      out.add_error(prefix + ".id", "duplicate_id", "duplicate roll id: " + request.id);
    }
  }
  return out;
}

void RollRequestValidator::validate_one(const RollRequest& request, const std::string& prefix,
                                        ValidationResult& out) const {
  if (request.kind == RollKind::Unknown) {
    if (!request.kind_name.empty()) {
      out.add_error(prefix + ".type", "invalid_kind", "unknown roll type: " + request.kind_name);
    }
    return;
  }

  AdvantageState advantage;
  if (!parse_advantage_state(request.advantage, advantage)) {
    out.add_error(prefix + ".advantage", "invalid_advantage", "invalid advantage state: " + request.advantage);
  }

  const bool needs_ability = request.kind == RollKind::AbilityCheck || request.kind == RollKind::SavingThrow;
  Ability ability;
  if (request.ability.empty()) {
    if (needs_ability) {
      out.add_error(prefix + ".ability", "missing_field",
                    std::string(to_string(request.kind)) + " needs an ability");
    }
  } else if (!parse_ability(request.ability, ability)) {
    out.add_error(prefix + ".ability", "invalid_ability", "invalid ability: " + request.ability);
  }

  if (!request.skill.empty() && !is_known_skill(normalize_skill_name(request.skill))) {
    out.add_error(prefix + ".skill", "invalid_skill", "invalid skill: " + request.skill);
  }

  if (request.dc.has_value()) {
    if (*request.dc < config_.dc_min || *request.dc > config_.dc_max) {
      out.add_error(prefix + ".dc", "invalid_dc",
                    "DC " + std::to_string(*request.dc) + " outside " + std::to_string(config_.dc_min) + "-" +
                        std::to_string(config_.dc_max));
    }
  } else if (request.kind == RollKind::SavingThrow) {
    out.add_error(prefix + ".dc", "missing_field", "saving_throw needs a dc");
  }

  if (request.kind == RollKind::AttackRoll && request.target_ac.has_value() &&
      (*request.target_ac < 1 || *request.target_ac > config_.armor_class_max)) {
    out.add_error(prefix + ".target_ac", "invalid_armor_class",
                  "target AC must be 1-" + std::to_string(config_.armor_class_max));
  }

  if (request.kind == RollKind::DamageRoll) {
    DiceExpression expr;
    std::string error;
    if (request.dice.empty()) {
      out.add_error(prefix + ".dice", "missing_field", "damage_roll needs a dice expression");
    } else if (!DiceExpression::parse(request.dice, expr, error)) {
      out.add_error(prefix + ".dice", "invalid_dice", error);
    }
  }
}

PatchValidator::PatchValidator(const EngineConfig& config) : config_(config), policy_(config.patch_paths) {}

ValidationResult PatchValidator::validate(const std::vector<PatchOp>& patches) const {
  ValidationResult out;
  std::map<std::string, size_t> first_write;
  for (size_t i = 0; i < patches.size(); ++i) {
    const std::string prefix = indexed("patches", i);
    std::visit(PatchChecker(config_, policy_, calendar_, prefix, out), patches[i]);

    const std::string path = op_path(patches[i]);
    if (path.empty() || path.back() == '-') continue;
    const auto inserted = first_write.emplace(path, i);
    if (!inserted.second) {
      out.add_warning(prefix + ".path", "duplicate_path",
                      "path " + path + " also written by patches[" + std::to_string(inserted.first->second) +
                          "]; the last write wins");
    }
  }
  return out;
}

ValidationResult LoreDeltaValidator::validate(const std::vector<LoreDelta>& deltas) const {
  ValidationResult out;
  for (size_t i = 0; i < deltas.size(); ++i) {
    const auto& delta = deltas[i];
    const std::string prefix = indexed("lore_deltas", i);
    if (delta.type.empty()) {
      out.add_error(prefix + ".type", "missing_field", "lore delta needs a type");
    } else if (delta.type == "hard_canon") {
      out.add_warning(prefix + ".type", "hard_canon", "hard_canon lore should be reserved for verified facts");
    } else if (delta.type != "soft_lore") {
      out.add_error(prefix + ".type", "invalid_lore_type", "invalid lore type: " + delta.type);
    }

    if (delta.text.empty()) {
      out.add_error(prefix + ".text", "missing_field", "lore delta needs text");
    } else if (delta.text.size() > config_.lore_max_text) {
      out.add_error(prefix + ".text", "text_too_long",
                    "lore text exceeds " + std::to_string(config_.lore_max_text) + " characters");
    }

    if (delta.time_ref.has_value()) {
      UniverseTime when;
      std::string error;
      if (!delta.time_ref->is_object()) {
        out.add_error(prefix + ".time_ref", "invalid_time_ref", "time_ref must be an object");
      } else if (!universe_time_from_json(*delta.time_ref, when, error)) {
        out.add_error(prefix + ".time_ref", "invalid_time_ref", error);
      }
    }
  }
  return out;
}

OutputValidator::OutputValidator(const EngineConfig& config) : rolls_(config), patches_(config), lore_(config) {}

ValidationResult OutputValidator::validate(const DecodedPayload& payload) const {
  ValidationResult out;
  for (const auto& e : payload.errors) {
    out.add_error(e.field, e.code, e.message);
  }
  out.merge(rolls_.validate(payload.roll_requests));
  out.merge(patches_.validate(payload.patches));
  out.merge(lore_.validate(payload.lore_deltas));
  return out;
}

} // namespace tale
