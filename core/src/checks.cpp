#include "tale/checks.h"

#include <algorithm>
#include <cctype>
#include <map>
#include <utility>

namespace tale {

namespace {
const std::map<std::string, Ability>& skill_map() {
  static const std::map<std::string, Ability> kSkills = {
      {"acrobatics", Ability::Dex},    {"animal_handling", Ability::Wis},
      {"arcana", Ability::Int},        {"athletics", Ability::Str},
      {"deception", Ability::Cha},     {"history", Ability::Int},
      {"insight", Ability::Wis},       {"intimidation", Ability::Cha},
      {"investigation", Ability::Int}, {"medicine", Ability::Wis},
      {"nature", Ability::Int},        {"perception", Ability::Wis},
      {"performance", Ability::Cha},   {"persuasion", Ability::Cha},
      {"religion", Ability::Int},      {"sleight_of_hand", Ability::Dex},
      {"stealth", Ability::Dex},       {"survival", Ability::Wis},
  };
  return kSkills;
}

std::string lower_trim(std::string_view text) {
  size_t b = 0;
  size_t e = text.size();
  while (b < e && std::isspace(static_cast<unsigned char>(text[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1]))) --e;
  std::string out(text.substr(b, e - b));
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

int read_score(const nlohmann::json& abilities, const char* short_key, const char* long_key) {
  for (const char* key : {short_key, long_key}) {
    if (abilities.contains(key) && abilities[key].is_number_integer()) {
      return abilities[key].get<int>();
    }
  }
  return 10;
}

int floor_half(int value) {
  return value >= 0 ? value / 2 : -((-value + 1) / 2);
}
} // namespace

const char* to_string(Ability ability) {
  switch (ability) {
    case Ability::Str:
      return "str";
    case Ability::Dex:
      return "dex";
    case Ability::Con:
      return "con";
    case Ability::Int:
      return "int";
    case Ability::Wis:
      return "wis";
    case Ability::Cha:
      return "cha";
  }
  return "str";
}

bool parse_ability(std::string_view text, Ability& out) {
  static const std::pair<const char*, Ability> kLong[] = {
      {"strength", Ability::Str},     {"dexterity", Ability::Dex}, {"constitution", Ability::Con},
      {"intelligence", Ability::Int}, {"wisdom", Ability::Wis},    {"charisma", Ability::Cha},
  };
  const std::string name = lower_trim(text);
  for (const auto& entry : kLong) {
    if (name == entry.first || name == to_string(entry.second)) {
      out = entry.second;
      return true;
    }
  }
  return false;
}

std::string normalize_skill_name(std::string_view skill) {
  std::string name = lower_trim(skill);
  std::replace(name.begin(), name.end(), ' ', '_');
  return name;
}

bool is_known_skill(std::string_view normalized_skill) {
  return skill_map().count(std::string(normalized_skill)) > 0;
}

std::optional<Ability> skill_ability(std::string_view normalized_skill) {
  const auto it = skill_map().find(std::string(normalized_skill));
  if (it == skill_map().end()) return std::nullopt;
  return it->second;
}

const std::vector<std::string>& known_skills() {
  static const std::vector<std::string> kNames = [] {
    std::vector<std::string> names;
    for (const auto& entry : skill_map()) names.push_back(entry.first);
    return names;
  }();
  return kNames;
}

CharacterStats CharacterStats::from_json(const nlohmann::json& j) {
  CharacterStats stats;
  if (!j.is_object()) return stats;

  static const nlohmann::json kEmpty = nlohmann::json::object();
  const nlohmann::json* abilities = &kEmpty;
  if (j.contains("abilities") && j["abilities"].is_object()) {
    abilities = &j["abilities"];
  } else if (j.contains("ability_scores") && j["ability_scores"].is_object()) {
    abilities = &j["ability_scores"];
  }
  stats.strength = read_score(*abilities, "str", "strength");
  stats.dexterity = read_score(*abilities, "dex", "dexterity");
  stats.constitution = read_score(*abilities, "con", "constitution");
  stats.intelligence = read_score(*abilities, "int", "intelligence");
  stats.wisdom = read_score(*abilities, "wis", "wisdom");
  stats.charisma = read_score(*abilities, "cha", "charisma");

  if (j.contains("level") && j["level"].is_number_integer()) {
    stats.level = j["level"].get<int>();
  }

  if (j.contains("skills") && j["skills"].is_object()) {
    for (auto it = j["skills"].begin(); it != j["skills"].end(); ++it) {
      const std::string skill = normalize_skill_name(it.key());
      const auto& entry = it.value();
      if (entry.is_object()) {
        if (entry.value("proficient", false)) stats.skill_proficiencies.insert(skill);
        if (entry.value("expertise", false)) stats.skill_expertises.insert(skill);
      } else if (entry.is_boolean() && entry.get<bool>()) {
        stats.skill_proficiencies.insert(skill);
      }
    }
  }

  if (j.contains("save_proficiencies") && j["save_proficiencies"].is_array()) {
    for (const auto& save : j["save_proficiencies"]) {
      Ability ability;
      if (save.is_string() && parse_ability(save.get<std::string>(), ability)) {
        stats.save_proficiencies.insert(to_string(ability));
      }
    }
  }
  return stats;
}

int CharacterStats::score(Ability ability) const {
  switch (ability) {
    case Ability::Str:
      return strength;
    case Ability::Dex:
      return dexterity;
    case Ability::Con:
      return constitution;
    case Ability::Int:
      return intelligence;
    case Ability::Wis:
      return wisdom;
    case Ability::Cha:
      return charisma;
  }
  return 10;
}

int CharacterStats::modifier(Ability ability) const {
  return floor_half(score(ability) - 10);
}

int CharacterStats::proficiency_bonus() const {
  return 2 + (std::max(level, 1) - 1) / 4;
}

CheckResult CheckResolver::resolve_ability_check(const CharacterStats& actor, Ability ability, int dc,
                                                 const std::string& skill, int bonus,
                                                 AdvantageState advantage) {
  CheckResult result;
  result.ability = ability;
  result.dc = dc;
  result.advantage = advantage;
  if (!skill.empty()) {
    result.skill = normalize_skill_name(skill);
    result.proficient = actor.skill_proficiencies.count(result.skill) > 0;
    result.expertise = actor.skill_expertises.count(result.skill) > 0;
  }
  result.modifier = actor.modifier(ability) + bonus;
  if (result.proficient) result.modifier += actor.proficiency_bonus();
  if (result.expertise) result.modifier += actor.proficiency_bonus();

  result.roll = dice_.roll_d20(advantage, result.modifier);
  result.total = result.roll.total;
  result.natural = result.roll.natural.value_or(0);
  result.critical = result.roll.critical;
  result.fumble = result.roll.fumble;
  // Natural 1 and 20 do not decide checks.
  result.success = result.total >= dc;
  return result;
}

CheckResult CheckResolver::resolve_saving_throw(const CharacterStats& actor, Ability ability, int dc,
                                                int bonus, AdvantageState advantage) {
  CheckResult result;
  result.ability = ability;
  result.dc = dc;
  result.advantage = advantage;
  result.proficient = actor.save_proficiencies.count(to_string(ability)) > 0;
  result.modifier = actor.modifier(ability) + bonus;
  if (result.proficient) result.modifier += actor.proficiency_bonus();

  result.roll = dice_.roll_d20(advantage, result.modifier);
  result.total = result.roll.total;
  result.natural = result.roll.natural.value_or(0);
  result.critical = result.roll.critical;
  result.fumble = result.roll.fumble;
  result.success = result.total >= dc;
  return result;
}

ContestResult CheckResolver::resolve_contested_check(const CharacterStats& actor, Ability actor_ability,
                                                     const std::string& actor_skill,
                                                     const CharacterStats& target, Ability target_ability,
                                                     const std::string& target_skill,
                                                     AdvantageState actor_advantage,
                                                     AdvantageState target_advantage) {
  ContestResult contest;
  contest.actor = resolve_ability_check(actor, actor_ability, 0, actor_skill, 0, actor_advantage);
  contest.target = resolve_ability_check(target, target_ability, 0, target_skill, 0, target_advantage);
  contest.actor_wins = contest.actor.total >= contest.target.total;
  contest.actor.success = contest.actor_wins;
  contest.target.success = !contest.actor_wins;
  return contest;
}

AttackResult CheckResolver::resolve_attack(const CharacterStats& attacker, Ability ability,
                                           std::optional<int> target_ac, int bonus, bool proficient,
                                           AdvantageState advantage) {
  AttackResult result;
  result.target_ac = target_ac;
  result.advantage = advantage;
  result.modifier = attacker.modifier(ability) + bonus;
  if (proficient) result.modifier += attacker.proficiency_bonus();

  result.roll = dice_.roll_d20(advantage, result.modifier);
  result.total = result.roll.total;
  result.natural = result.roll.natural.value_or(0);
  if (result.natural == 1) {
    result.hit = false;
  } else if (result.natural == 20) {
    result.hit = true;
    result.critical = true;
  } else {
    result.hit = target_ac.has_value() && result.total >= *target_ac;
  }
  return result;
}

} // namespace tale
