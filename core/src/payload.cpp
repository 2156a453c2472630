#include "tale/payload.h"

#include <cstdint>

namespace tale {

namespace {
std::string indexed(const char* list, size_t i) {
  return std::string(list) + "[" + std::to_string(i) + "]";
}

void shape_error(std::vector<TurnError>& errors, const std::string& field, const std::string& code,
                 const std::string& message) {
  errors.push_back(TurnError{ErrorKind::Validation, code, field, message});
}

bool has(const nlohmann::json& j, const char* key) {
  return j.contains(key) && !j[key].is_null();
}

void read_string(const nlohmann::json& j, const char* key, const std::string& prefix, std::string& out,
                 std::vector<TurnError>& errors) {
  if (!has(j, key)) return;
  if (!j[key].is_string()) {
    shape_error(errors, prefix + "." + key, "wrong_type", std::string("'") + key + "' must be a string");
    return;
  }
  out = j[key].get<std::string>();
}

void read_int(const nlohmann::json& j, const char* key, const std::string& prefix, std::optional<int>& out,
              std::vector<TurnError>& errors) {
  if (!has(j, key)) return;
  const auto& v = j[key];
  if (!v.is_number_integer() || v.get<int64_t>() < INT32_MIN || v.get<int64_t>() > INT32_MAX) {
    shape_error(errors, prefix + "." + key, "wrong_type", std::string("'") + key + "' must be an integer");
    return;
  }
  out = v.get<int>();
}

void read_bool(const nlohmann::json& j, const char* key, const std::string& prefix, bool& out,
               std::vector<TurnError>& errors) {
  if (!has(j, key)) return;
  if (!j[key].is_boolean()) {
    shape_error(errors, prefix + "." + key, "wrong_type", std::string("'") + key + "' must be a boolean");
    return;
  }
  out = j[key].get<bool>();
}

bool expect_list(const nlohmann::json& list, const char* name, std::vector<TurnError>& errors) {
  if (list.is_null()) return false;
  if (!list.is_array()) {
    shape_error(errors, name, "not_a_list", std::string(name) + " must be a list");
    return false;
  }
  return true;
}

RollRequest decode_roll_request(const nlohmann::json& j, const std::string& prefix,
                                std::vector<TurnError>& errors) {
  RollRequest r;
  if (!j.is_object()) {
    shape_error(errors, prefix, "not_an_object", "roll request must be an object");
    return r;
  }
  if (has(j, "id")) {
    if (j["id"].is_string()) {
      r.id = j["id"].get<std::string>();
    } else if (j["id"].is_number_integer()) {
      r.id = std::to_string(j["id"].get<int64_t>());
    } else {
      shape_error(errors, prefix + ".id", "wrong_type", "'id' must be a string");
    }
  } else {
    shape_error(errors, prefix + ".id", "missing_field", "roll request missing 'id'");
  }
  const char* kind_key = has(j, "type") ? "type" : "kind";
  if (has(j, kind_key)) {
    read_string(j, kind_key, prefix, r.kind_name, errors);
    r.kind = parse_roll_kind(r.kind_name);
  } else {
    shape_error(errors, prefix + ".type", "missing_field", "roll request missing 'type'");
  }
  read_string(j, "ability", prefix, r.ability, errors);
  read_string(j, "skill", prefix, r.skill, errors);
  read_int(j, "dc", prefix, r.dc, errors);
  read_string(j, "advantage", prefix, r.advantage, errors);
  read_string(j, "dice", prefix, r.dice, errors);
  const char* ac_key = has(j, "target_ac") ? "target_ac" : "ac";
  read_int(j, ac_key, prefix, r.target_ac, errors);
  std::optional<int> bonus;
  read_int(j, "bonus", prefix, bonus, errors);
  r.bonus = bonus.value_or(0);
  read_bool(j, "critical", prefix, r.critical, errors);
  read_bool(j, "proficient", prefix, r.proficient, errors);
  read_string(j, "attacker", prefix, r.attacker, errors);
  read_string(j, "target", prefix, r.target, errors);
  return r;
}

PatchOp decode_patch(const nlohmann::json& j, const std::string& prefix, std::vector<TurnError>& errors) {
  if (!j.is_object()) {
    shape_error(errors, prefix, "not_an_object", "patch must be an object");
    return UnknownOp{"", j};
  }
  if (!has(j, "op") || !j["op"].is_string()) {
    shape_error(errors, prefix + ".op", "missing_field", "patch missing 'op'");
    return UnknownOp{"", j};
  }
  const std::string op = j["op"].get<std::string>();
  if (op == "advance_time") {
    return AdvanceTimeOp{j.contains("value") ? j["value"] : nlohmann::json()};
  }
  if (op != "replace" && op != "add" && op != "remove") {
    return UnknownOp{op, j};
  }

  std::string path;
  if (!has(j, "path")) {
    shape_error(errors, prefix + ".path", "missing_field", "patch missing 'path'");
  } else {
    read_string(j, "path", prefix, path, errors);
  }
  if (op == "remove") {
    return RemoveOp{path};
  }
  if (!j.contains("value")) {
    shape_error(errors, prefix + ".value", "missing_field", "patch operation '" + op + "' requires 'value'");
  }
  const nlohmann::json value = j.contains("value") ? j["value"] : nlohmann::json();
  if (op == "replace") {
    return ReplaceOp{path, value};
  }
  return AddOp{path, value};
}

LoreDelta decode_lore_delta(const nlohmann::json& j, const std::string& prefix, std::vector<TurnError>& errors) {
  LoreDelta d;
  if (!j.is_object()) {
    shape_error(errors, prefix, "not_an_object", "lore delta must be an object");
    return d;
  }
  read_string(j, "type", prefix, d.type, errors);
  read_string(j, "text", prefix, d.text, errors);
  if (has(j, "tags")) {
    if (!j["tags"].is_array()) {
      shape_error(errors, prefix + ".tags", "wrong_type", "'tags' must be a list");
    } else {
      for (size_t i = 0; i < j["tags"].size(); ++i) {
        const auto& tag = j["tags"][i];
        if (!tag.is_string()) {
          shape_error(errors, prefix + ".tags[" + std::to_string(i) + "]", "wrong_type",
                      "each tag must be a string");
          continue;
        }
        d.tags.push_back(tag.get<std::string>());
      }
    }
  }
  if (has(j, "time_ref")) {
    d.time_ref = j["time_ref"];
  }
  return d;
}

struct PatchJson {
  nlohmann::json operator()(const ReplaceOp& op) const {
    return {{"op", "replace"}, {"path", op.path}, {"value", op.value}};
  }
  nlohmann::json operator()(const AddOp& op) const {
    return {{"op", "add"}, {"path", op.path}, {"value", op.value}};
  }
  nlohmann::json operator()(const RemoveOp& op) const {
    return {{"op", "remove"}, {"path", op.path}};
  }
  nlohmann::json operator()(const AdvanceTimeOp& op) const {
    return {{"op", "advance_time"}, {"value", op.delta}};
  }
  nlohmann::json operator()(const UnknownOp& op) const {
    return op.raw;
  }
};
} // namespace

const char* to_string(RollKind kind) {
  switch (kind) {
    case RollKind::AbilityCheck:
      return "ability_check";
    case RollKind::SavingThrow:
      return "saving_throw";
    case RollKind::AttackRoll:
      return "attack_roll";
    case RollKind::DamageRoll:
      return "damage_roll";
    case RollKind::Unknown:
      return "unknown";
  }
  return "unknown";
}

RollKind parse_roll_kind(const std::string& text) {
  for (const auto kind : {RollKind::AbilityCheck, RollKind::SavingThrow, RollKind::AttackRoll,
                          RollKind::DamageRoll}) {
    if (text == to_string(kind)) return kind;
  }
  return RollKind::Unknown;
}

const char* op_name(const PatchOp& op) {
  switch (op.index()) {
    case 0:
      return "replace";
    case 1:
      return "add";
    case 2:
      return "remove";
    case 3:
      return "advance_time";
    default:
      return "unknown";
  }
}

std::string op_path(const PatchOp& op) {
  if (const auto* r = std::get_if<ReplaceOp>(&op)) return r->path;
  if (const auto* a = std::get_if<AddOp>(&op)) return a->path;
  if (const auto* d = std::get_if<RemoveOp>(&op)) return d->path;
  return {};
}

std::vector<RollRequest> decode_roll_requests(const nlohmann::json& list, std::vector<TurnError>& errors) {
  std::vector<RollRequest> out;
  if (!expect_list(list, "roll_requests", errors)) return out;
  for (size_t i = 0; i < list.size(); ++i) {
    out.push_back(decode_roll_request(list[i], indexed("roll_requests", i), errors));
  }
  return out;
}

std::vector<PatchOp> decode_patches(const nlohmann::json& list, std::vector<TurnError>& errors) {
  std::vector<PatchOp> out;
  if (!expect_list(list, "patches", errors)) return out;
  for (size_t i = 0; i < list.size(); ++i) {
    out.push_back(decode_patch(list[i], indexed("patches", i), errors));
  }
  return out;
}

std::vector<LoreDelta> decode_lore_deltas(const nlohmann::json& list, std::vector<TurnError>& errors) {
  std::vector<LoreDelta> out;
  if (!expect_list(list, "lore_deltas", errors)) return out;
  for (size_t i = 0; i < list.size(); ++i) {
    out.push_back(decode_lore_delta(list[i], indexed("lore_deltas", i), errors));
  }
  return out;
}

DecodedPayload decode_payload(const nlohmann::json& payload) {
  DecodedPayload decoded;
  if (!payload.is_object()) {
    return decoded;
  }
  static const nlohmann::json kNull;
  auto field = [&payload](const char* key) -> const nlohmann::json& {
    return payload.contains(key) ? payload[key] : kNull;
  };
  decoded.roll_requests = decode_roll_requests(field("roll_requests"), decoded.errors);
  decoded.patches = decode_patches(field("patches"), decoded.errors);
  decoded.lore_deltas = decode_lore_deltas(field("lore_deltas"), decoded.errors);
  return decoded;
}

nlohmann::json to_json(const RollRequest& request) {
  nlohmann::json j = {{"id", request.id},
                      {"type", request.kind == RollKind::Unknown ? request.kind_name
                                                                 : std::string(to_string(request.kind))},
                      {"advantage", request.advantage}};
  if (!request.ability.empty()) j["ability"] = request.ability;
  if (!request.skill.empty()) j["skill"] = request.skill;
  if (request.dc.has_value()) j["dc"] = *request.dc;
  if (!request.dice.empty()) j["dice"] = request.dice;
  if (request.target_ac.has_value()) j["target_ac"] = *request.target_ac;
  if (request.bonus != 0) j["bonus"] = request.bonus;
  if (request.critical) j["critical"] = true;
  if (!request.proficient) j["proficient"] = false;
  if (!request.attacker.empty()) j["attacker"] = request.attacker;
  if (!request.target.empty()) j["target"] = request.target;
  return j;
}

nlohmann::json to_json(const PatchOp& op) {
  return std::visit(PatchJson{}, op);
}

nlohmann::json to_json(const LoreDelta& delta) {
  nlohmann::json j = {{"type", delta.type}, {"text", delta.text}, {"tags", delta.tags}};
  if (delta.time_ref.has_value()) j["time_ref"] = *delta.time_ref;
  return j;
}

nlohmann::json patches_to_json(const std::vector<PatchOp>& patches) {
  nlohmann::json list = nlohmann::json::array();
  for (const auto& op : patches) list.push_back(to_json(op));
  return list;
}

} // namespace tale
