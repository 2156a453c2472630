#include "tale/mechanics.h"

#include "tale/log.h"

namespace tale {

namespace {
std::vector<int> values(const std::vector<DieRoll>& rolls) {
  std::vector<int> out;
  out.reserve(rolls.size());
  for (const auto& r : rolls) out.push_back(r.value);
  return out;
}

void copy_d20(const RollOutcome& roll, RollResult& result) {
  result.dice = values(roll.rolls);
  result.discarded = values(roll.discarded);
  result.natural = roll.natural;
  result.critical = roll.critical;
  result.fumble = roll.fumble;
}

void add_term(RollResult& result, const char* name, int value) {
  if (value != 0) result.breakdown.push_back(ModifierTerm{name, value});
}

RollResult failed(RollResult result, const std::string& error) {
  result.error = error;
  log::debug("roll " + result.id + " unresolved: " + error);
  return result;
}
} // namespace

nlohmann::json to_json(const RollResult& result) {
  nlohmann::json breakdown = nlohmann::json::array();
  for (const auto& term : result.breakdown) {
    breakdown.push_back({{"name", term.name}, {"value", term.value}});
  }
  nlohmann::json j = {{"id", result.id},
                      {"kind", result.kind},
                      {"dice", result.dice},
                      {"discarded", result.discarded},
                      {"modifier_breakdown", breakdown},
                      {"modifier", result.modifier},
                      {"total", result.total},
                      {"advantage", to_string(result.advantage)},
                      {"critical", result.critical},
                      {"fumble", result.fumble},
                      {"floored", result.floored}};
  j["natural"] = result.natural.has_value() ? nlohmann::json(*result.natural) : nlohmann::json();
  j["dc"] = result.dc.has_value() ? nlohmann::json(*result.dc) : nlohmann::json();
  j["success"] = result.success.has_value() ? nlohmann::json(*result.success) : nlohmann::json();
  if (!result.error.empty()) j["error"] = result.error;
  return j;
}

nlohmann::json to_json(const std::vector<RollResult>& results) {
  nlohmann::json list = nlohmann::json::array();
  for (const auto& r : results) list.push_back(to_json(r));
  return list;
}

std::vector<RollResult> MechanicsExecutor::execute(const std::vector<RollRequest>& requests,
                                                   const CharacterStats& actor) {
  std::vector<RollResult> results;
  results.reserve(requests.size());
  for (const auto& request : requests) {
    results.push_back(execute_one(request, actor));
  }
  return results;
}

RollResult MechanicsExecutor::execute_one(const RollRequest& request, const CharacterStats& actor) {
  RollResult result;
  result.id = request.id;
  result.kind = request.kind == RollKind::Unknown ? request.kind_name : to_string(request.kind);
  if (!parse_advantage_state(request.advantage, result.advantage)) {
    return failed(result, "invalid advantage state: " + request.advantage);
  }
  switch (request.kind) {
    case RollKind::AbilityCheck:
    case RollKind::SavingThrow:
      return resolve_check(request, actor, result);
    case RollKind::AttackRoll:
      return resolve_attack(request, actor, result);
    case RollKind::DamageRoll:
      return resolve_damage(request, result);
    case RollKind::Unknown:
      break;
  }
  return failed(result, "unknown roll type: " + request.kind_name);
}

RollResult MechanicsExecutor::resolve_check(const RollRequest& request, const CharacterStats& actor,
                                            RollResult result) {
  Ability ability;
  if (!parse_ability(request.ability, ability)) {
    return failed(result, "invalid ability: " + request.ability);
  }
  const int dc = request.dc.value_or(0);
  const CheckResult check = request.kind == RollKind::SavingThrow
                                ? checks_.resolve_saving_throw(actor, ability, dc, request.bonus, result.advantage)
                                : checks_.resolve_ability_check(actor, ability, dc, request.skill, request.bonus,
                                                                result.advantage);
  copy_d20(check.roll, result);
  add_term(result, to_string(ability), actor.modifier(ability));
  if (check.proficient) add_term(result, "proficiency", actor.proficiency_bonus());
  if (check.expertise) add_term(result, "expertise", actor.proficiency_bonus());
  add_term(result, "bonus", request.bonus);
  result.modifier = check.modifier;
  result.total = check.total;
  result.dc = request.dc;
  if (request.dc.has_value()) result.success = check.success;
  return result;
}

RollResult MechanicsExecutor::resolve_attack(const RollRequest& request, const CharacterStats& actor,
                                             RollResult result) {
  Ability ability = Ability::Str;
  if (!request.ability.empty() && !parse_ability(request.ability, ability)) {
    return failed(result, "invalid ability: " + request.ability);
  }
  const AttackResult attack =
      checks_.resolve_attack(actor, ability, request.target_ac, request.bonus, request.proficient, result.advantage);
  copy_d20(attack.roll, result);
  add_term(result, to_string(ability), actor.modifier(ability));
  if (request.proficient) add_term(result, "proficiency", actor.proficiency_bonus());
  add_term(result, "bonus", request.bonus);
  result.modifier = attack.modifier;
  result.total = attack.total;
  result.dc = request.target_ac;
  result.critical = attack.critical;
  if (request.target_ac.has_value() || attack.natural == 1 || attack.natural == 20) {
    result.success = attack.hit;
  }
  return result;
}

RollResult MechanicsExecutor::resolve_damage(const RollRequest& request, RollResult result) {
  DiceExpression expr;
  std::string error;
  if (!DiceExpression::parse(request.dice, expr, error)) {
    return failed(result, error);
  }
  const RollOutcome roll = dice_.roll_damage(expr, request.bonus, request.critical);
  result.dice = values(roll.rolls);
  add_term(result, "dice", expr.modifier);
  add_term(result, "bonus", request.bonus);
  result.modifier = roll.modifier;
  result.total = roll.total;
  result.critical = roll.critical;
  result.floored = roll.floored;
  return result;
}

} // namespace tale
