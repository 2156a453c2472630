#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "tale/dice.h"

namespace tale {

enum class Ability { Str, Dex, Con, Int, Wis, Cha };

const char* to_string(Ability ability);
// Accepts short ("dex") or long ("dexterity") names, any case.
bool parse_ability(std::string_view text, Ability& out);

// "Sleight of Hand" -> "sleight_of_hand".
std::string normalize_skill_name(std::string_view skill);
bool is_known_skill(std::string_view normalized_skill);
// Governing ability of a known skill.
std::optional<Ability> skill_ability(std::string_view normalized_skill);
const std::vector<std::string>& known_skills();

struct CharacterStats {
  int strength = 10;
  int dexterity = 10;
  int constitution = 10;
  int intelligence = 10;
  int wisdom = 10;
  int charisma = 10;
  int level = 1;
  std::set<std::string> skill_proficiencies;
  std::set<std::string> skill_expertises;
  std::set<std::string> save_proficiencies;  // short ability names

  // Reads `ability_scores` or `abilities` (short or long keys), `level`,
  // `skills` (bool or {proficient, expertise}) and `save_proficiencies`.
  // Missing or mistyped fields keep their defaults.
  static CharacterStats from_json(const nlohmann::json& j);

  int score(Ability ability) const;
  int modifier(Ability ability) const;
  int proficiency_bonus() const;
};

struct CheckResult {
  bool success = false;
  int total = 0;
  int natural = 0;
  int modifier = 0;
  int dc = 0;
  Ability ability = Ability::Str;
  std::string skill;
  bool proficient = false;
  bool expertise = false;
  AdvantageState advantage = AdvantageState::None;
  bool critical = false;
  bool fumble = false;
  RollOutcome roll;
};

struct ContestResult {
  CheckResult actor;
  CheckResult target;
  bool actor_wins = false;
};

struct AttackResult {
  bool hit = false;
  bool critical = false;
  int total = 0;
  int natural = 0;
  int modifier = 0;
  std::optional<int> target_ac;
  AdvantageState advantage = AdvantageState::None;
  RollOutcome roll;
};

// d20 resolution against a borrowed roller; the roller outlives the resolver.
class CheckResolver {
 public:
  explicit CheckResolver(DiceRoller& dice) : dice_(dice) {}

  CheckResult resolve_ability_check(const CharacterStats& actor, Ability ability, int dc,
                                    const std::string& skill = {}, int bonus = 0,
                                    AdvantageState advantage = AdvantageState::None);
  // Expertise never applies to saves.
  CheckResult resolve_saving_throw(const CharacterStats& actor, Ability ability, int dc, int bonus = 0,
                                   AdvantageState advantage = AdvantageState::None);
  // The initiating actor wins ties.
  ContestResult resolve_contested_check(const CharacterStats& actor, Ability actor_ability,
                                        const std::string& actor_skill, const CharacterStats& target,
                                        Ability target_ability, const std::string& target_skill,
                                        AdvantageState actor_advantage = AdvantageState::None,
                                        AdvantageState target_advantage = AdvantageState::None);
  // Natural 1 always misses, natural 20 always hits and is critical. Without
  // a target AC only the natural results decide `hit`.
  AttackResult resolve_attack(const CharacterStats& attacker, Ability ability, std::optional<int> target_ac,
                              int bonus = 0, bool proficient = true,
                              AdvantageState advantage = AdvantageState::None);

 private:
  DiceRoller& dice_;
};

} // namespace tale
