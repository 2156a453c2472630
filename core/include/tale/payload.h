#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "tale/errors.h"

namespace tale {

enum class RollKind { AbilityCheck, SavingThrow, AttackRoll, DamageRoll, Unknown };

const char* to_string(RollKind kind);
RollKind parse_roll_kind(const std::string& text);

// Decoding is lenient: every list entry yields a value so the mechanics
// executor can report per-roll errors in request order. Shape problems are
// collected separately with their field paths.
struct RollRequest {
  std::string id;
  RollKind kind = RollKind::Unknown;
  std::string kind_name;  // as written by the narrator
  std::string ability;
  std::string skill;
  std::optional<int> dc;
  std::string advantage = "none";
  std::string dice;
  std::optional<int> target_ac;
  int bonus = 0;
  bool critical = false;
  bool proficient = true;
  std::string attacker;
  std::string target;
};

struct ReplaceOp {
  std::string path;
  nlohmann::json value;
};

// Appends ("-") or inserts at an index in lists, sets a key in objects.
struct AddOp {
  std::string path;
  nlohmann::json value;
};

struct RemoveOp {
  std::string path;
};

struct AdvanceTimeOp {
  nlohmann::json delta;
};

struct UnknownOp {
  std::string op;
  nlohmann::json raw;
};

using PatchOp = std::variant<ReplaceOp, AddOp, RemoveOp, AdvanceTimeOp, UnknownOp>;

const char* op_name(const PatchOp& op);
// Target path of replace/add/remove; empty for the rest.
std::string op_path(const PatchOp& op);

struct LoreDelta {
  std::string type;
  std::string text;
  std::vector<std::string> tags;
  std::optional<nlohmann::json> time_ref;
};

struct DecodedPayload {
  std::vector<RollRequest> roll_requests;
  std::vector<PatchOp> patches;
  std::vector<LoreDelta> lore_deltas;
  std::vector<TurnError> errors;  // kind Validation, field-scoped
};

DecodedPayload decode_payload(const nlohmann::json& payload);

std::vector<RollRequest> decode_roll_requests(const nlohmann::json& list, std::vector<TurnError>& errors);
std::vector<PatchOp> decode_patches(const nlohmann::json& list, std::vector<TurnError>& errors);
std::vector<LoreDelta> decode_lore_deltas(const nlohmann::json& list, std::vector<TurnError>& errors);

nlohmann::json to_json(const RollRequest& request);
nlohmann::json to_json(const PatchOp& op);
nlohmann::json to_json(const LoreDelta& delta);
nlohmann::json patches_to_json(const std::vector<PatchOp>& patches);

} // namespace tale
