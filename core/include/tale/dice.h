#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace tale {

enum class AdvantageState { None, Advantage, Disadvantage };

const char* to_string(AdvantageState state);
bool parse_advantage_state(std::string_view text, AdvantageState& out);

struct DieRoll {
  int size = 0;
  int value = 0;
};

// "NdM", "NdM+K", "NdM-K"; case-insensitive, surrounding whitespace ignored.
struct DiceExpression {
  int count = 1;
  int sides = 6;
  int modifier = 0;

  static constexpr int kMaxCount = 100;
  static constexpr int kMaxSides = 1000;

  static bool parse(std::string_view text, DiceExpression& out, std::string& error);
  std::string str() const;
};

struct RollOutcome {
  std::vector<DieRoll> rolls;
  std::vector<DieRoll> discarded;
  int modifier = 0;
  int total = 0;
  std::optional<int> natural;  // d20 rolls only
  AdvantageState advantage = AdvantageState::None;
  bool critical = false;  // natural 20
  bool fumble = false;    // natural 1
  bool floored = false;   // damage/healing raised to the minimum of 1

  int dice_sum() const;
};

struct AdvantageRoll {
  int kept = 0;
  std::optional<int> discarded;
};

// MT19937 keyed the same way as the reference implementation so that a seed
// reproduces identical rolls across builds and save files. Every die draw is
// 1 + (31-bit sample below 2^31-1), reduced with `% size + 1`.
class SeededRandom {
 public:
  explicit SeededRandom(int64_t seed);

  // Uniform in [1, 2^31 - 1].
  uint32_t next_draw();

 private:
  std::mt19937 engine_;
};

class DiceRoller {
 public:
  explicit DiceRoller(int64_t seed);

  int64_t seed() const { return seed_; }
  uint64_t roll_count() const { return roll_count_; }

  // Throws std::invalid_argument for size < 1.
  int roll_die(int size);
  AdvantageRoll roll_with_advantage_state(int size, AdvantageState state);

  RollOutcome roll_d20(AdvantageState state = AdvantageState::None, int modifier = 0);
  RollOutcome roll_expression(const DiceExpression& expr, int extra_modifier = 0);
  bool roll_expression(std::string_view text, RollOutcome& out, std::string& error);

  // Critical doubles the dice, never the modifier. Totals floor at 1.
  RollOutcome roll_damage(const DiceExpression& expr, int modifier = 0, bool critical = false);
  RollOutcome roll_healing(const DiceExpression& expr, int modifier = 0);

  // Dice at or below `threshold` are rerolled and the second result kept.
  // With reroll_once=false a die is rerolled until it clears the threshold
  // (only when the threshold is below the die size).
  RollOutcome roll_with_reroll(const DiceExpression& expr, int threshold = 1, bool reroll_once = true);

 private:
  DieRoll roll_single(int size);
  RollOutcome roll_floored(const DiceExpression& expr, int count, int modifier);

  int64_t seed_ = 0;
  uint64_t roll_count_ = 0;
  SeededRandom rng_;
};

} // namespace tale
