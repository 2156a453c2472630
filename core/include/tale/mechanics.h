#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "tale/checks.h"
#include "tale/dice.h"
#include "tale/payload.h"

namespace tale {

struct ModifierTerm {
  std::string name;
  int value = 0;
};

// Outcome of one roll request. total == sum(dice) + modifier unless
// `floored` is set, in which case the total was raised to 1.
struct RollResult {
  std::string id;
  std::string kind;
  std::vector<int> dice;
  std::vector<int> discarded;
  std::vector<ModifierTerm> breakdown;
  int modifier = 0;
  int total = 0;
  std::optional<int> natural;
  std::optional<int> dc;  // target AC for attack rolls
  std::optional<bool> success;
  AdvantageState advantage = AdvantageState::None;
  bool critical = false;
  bool fumble = false;
  bool floored = false;
  std::string error;  // non-empty when the request could not be resolved
};

nlohmann::json to_json(const RollResult& result);
nlohmann::json to_json(const std::vector<RollResult>& results);

// Resolves roll requests in order with the turn's own roller. A request that
// cannot be resolved yields a result carrying `error`; the batch continues.
class MechanicsExecutor {
 public:
  explicit MechanicsExecutor(DiceRoller& dice) : dice_(dice), checks_(dice) {}

  std::vector<RollResult> execute(const std::vector<RollRequest>& requests, const CharacterStats& actor);
  RollResult execute_one(const RollRequest& request, const CharacterStats& actor);

 private:
  RollResult resolve_check(const RollRequest& request, const CharacterStats& actor, RollResult result);
  RollResult resolve_attack(const RollRequest& request, const CharacterStats& actor, RollResult result);
  RollResult resolve_damage(const RollRequest& request, RollResult result);

  DiceRoller& dice_;
  CheckResolver checks_;
};

} // namespace tale
