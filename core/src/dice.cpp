#include "tale/dice.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <stdexcept>

namespace tale {

namespace {
constexpr uint32_t kDrawBound = 2147483647u;  // 2^31 - 1

// Seed sequence that fills the engine state with the MT19937 reference
// `init_by_array` output, keyed by the 32-bit words of |seed|.
class ArraySeedSequence {
 public:
  using result_type = uint32_t;

  explicit ArraySeedSequence(int64_t seed) {
    uint64_t magnitude = seed < 0 ? (~static_cast<uint64_t>(seed) + 1u) : static_cast<uint64_t>(seed);
    while (magnitude != 0) {
      key_.push_back(static_cast<uint32_t>(magnitude & 0xffffffffu));
      magnitude >>= 32;
    }
    if (key_.empty()) key_.push_back(0);
  }

  template <typename It>
  void generate(It begin, It end) const {
    constexpr size_t n = 624;
    std::array<uint32_t, n> mt{};
    mt[0] = 19650218u;
    for (size_t i = 1; i < n; ++i) {
      mt[i] = 1812433253u * (mt[i - 1] ^ (mt[i - 1] >> 30)) + static_cast<uint32_t>(i);
    }
    size_t i = 1;
    size_t j = 0;
    for (size_t k = std::max(n, key_.size()); k > 0; --k) {
      mt[i] = (mt[i] ^ ((mt[i - 1] ^ (mt[i - 1] >> 30)) * 1664525u)) + key_[j] + static_cast<uint32_t>(j);
      ++i;
      ++j;
      if (i >= n) {
        mt[0] = mt[n - 1];
        i = 1;
      }
      if (j >= key_.size()) j = 0;
    }
    for (size_t k = n - 1; k > 0; --k) {
      mt[i] = (mt[i] ^ ((mt[i - 1] ^ (mt[i - 1] >> 30)) * 1566083941u)) - static_cast<uint32_t>(i);
      ++i;
      if (i >= n) {
        mt[0] = mt[n - 1];
        i = 1;
      }
    }
    mt[0] = 0x80000000u;

    size_t idx = 0;
    for (It it = begin; it != end; ++it, ++idx) {
      *it = idx < n ? mt[idx] : 0u;
    }
  }

 private:
  std::vector<uint32_t> key_;
};

std::string trim_lower(std::string_view text) {
  size_t b = 0;
  size_t e = text.size();
  while (b < e && std::isspace(static_cast<unsigned char>(text[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(text[e - 1]))) --e;
  std::string out(text.substr(b, e - b));
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

bool parse_bounded(const std::string& digits, int max_value, int& out) {
  if (digits.size() > 9) return false;
  const long value = std::stol(digits);
  if (value > max_value) return false;
  out = static_cast<int>(value);
  return true;
}
} // namespace

const char* to_string(AdvantageState state) {
  switch (state) {
    case AdvantageState::None:
      return "none";
    case AdvantageState::Advantage:
      return "advantage";
    case AdvantageState::Disadvantage:
      return "disadvantage";
  }
  return "none";
}

bool parse_advantage_state(std::string_view text, AdvantageState& out) {
  if (text == "none") {
    out = AdvantageState::None;
  } else if (text == "advantage") {
    out = AdvantageState::Advantage;
  } else if (text == "disadvantage") {
    out = AdvantageState::Disadvantage;
  } else {
    return false;
  }
  return true;
}

bool DiceExpression::parse(std::string_view text, DiceExpression& out, std::string& error) {
  static const std::regex kPattern(R"(^(\d+)d(\d+)(?:([+-])(\d+))?$)");
  const std::string normalized = trim_lower(text);
  std::smatch m;
  if (!std::regex_match(normalized, m, kPattern)) {
    error = "invalid dice expression: '" + std::string(text) + "'";
    return false;
  }
  DiceExpression expr;
  if (!parse_bounded(m[1].str(), kMaxCount, expr.count) || expr.count < 1) {
    error = "dice count must be 1-" + std::to_string(kMaxCount) + ": '" + std::string(text) + "'";
    return false;
  }
  if (!parse_bounded(m[2].str(), kMaxSides, expr.sides) || expr.sides < 1) {
    error = "die size must be 1-" + std::to_string(kMaxSides) + ": '" + std::string(text) + "'";
    return false;
  }
  expr.modifier = 0;
  if (m[3].matched) {
    int magnitude = 0;
    if (!parse_bounded(m[4].str(), 1000000, magnitude)) {
      error = "dice modifier out of range: '" + std::string(text) + "'";
      return false;
    }
    expr.modifier = m[3].str() == "-" ? -magnitude : magnitude;
  }
  out = expr;
  return true;
}

std::string DiceExpression::str() const {
  std::string s = std::to_string(count) + "d" + std::to_string(sides);
  if (modifier > 0) {
    s += "+" + std::to_string(modifier);
  } else if (modifier < 0) {
    s += std::to_string(modifier);
  }
  return s;
}

int RollOutcome::dice_sum() const {
  int sum = 0;
  for (const auto& r : rolls) sum += r.value;
  return sum;
}

SeededRandom::SeededRandom(int64_t seed) {
  ArraySeedSequence seq(seed);
  engine_.seed(seq);
}

uint32_t SeededRandom::next_draw() {
  uint32_t r = static_cast<uint32_t>(engine_()) >> 1;
  while (r >= kDrawBound) {
    r = static_cast<uint32_t>(engine_()) >> 1;
  }
  return r + 1;
}

DiceRoller::DiceRoller(int64_t seed) : seed_(seed), rng_(seed) {}

int DiceRoller::roll_die(int size) {
  if (size < 1) {
    throw std::invalid_argument("die size must be at least 1, got " + std::to_string(size));
  }
  ++roll_count_;
  return static_cast<int>(rng_.next_draw() % static_cast<uint32_t>(size)) + 1;
}

DieRoll DiceRoller::roll_single(int size) {
  return DieRoll{size, roll_die(size)};
}

AdvantageRoll DiceRoller::roll_with_advantage_state(int size, AdvantageState state) {
  AdvantageRoll out;
  if (state == AdvantageState::None) {
    out.kept = roll_die(size);
    return out;
  }
  const int first = roll_die(size);
  const int second = roll_die(size);
  const bool keep_first =
      state == AdvantageState::Advantage ? first >= second : first <= second;
  out.kept = keep_first ? first : second;
  out.discarded = keep_first ? second : first;
  return out;
}

RollOutcome DiceRoller::roll_d20(AdvantageState state, int modifier) {
  const AdvantageRoll pick = roll_with_advantage_state(20, state);
  RollOutcome out;
  out.rolls.push_back({20, pick.kept});
  if (pick.discarded.has_value()) out.discarded.push_back({20, *pick.discarded});
  out.modifier = modifier;
  out.total = pick.kept + modifier;
  out.natural = pick.kept;
  out.advantage = state;
  out.critical = pick.kept == 20;
  out.fumble = pick.kept == 1;
  return out;
}

RollOutcome DiceRoller::roll_expression(const DiceExpression& expr, int extra_modifier) {
  RollOutcome out;
  out.rolls.reserve(static_cast<size_t>(expr.count));
  for (int i = 0; i < expr.count; ++i) {
    out.rolls.push_back(roll_single(expr.sides));
  }
  out.modifier = expr.modifier + extra_modifier;
  out.total = out.dice_sum() + out.modifier;
  return out;
}

bool DiceRoller::roll_expression(std::string_view text, RollOutcome& out, std::string& error) {
  DiceExpression expr;
  if (!DiceExpression::parse(text, expr, error)) {
    return false;
  }
  out = roll_expression(expr);
  return true;
}

RollOutcome DiceRoller::roll_floored(const DiceExpression& expr, int count, int modifier) {
  RollOutcome out;
  for (int i = 0; i < count; ++i) {
    out.rolls.push_back(roll_single(expr.sides));
  }
  out.modifier = expr.modifier + modifier;
  out.total = out.dice_sum() + out.modifier;
  if (out.total < 1) {
    out.total = 1;
    out.floored = true;
  }
  return out;
}

RollOutcome DiceRoller::roll_damage(const DiceExpression& expr, int modifier, bool critical) {
  RollOutcome out = roll_floored(expr, critical ? expr.count * 2 : expr.count, modifier);
  out.critical = critical;
  return out;
}

RollOutcome DiceRoller::roll_healing(const DiceExpression& expr, int modifier) {
  return roll_floored(expr, expr.count, modifier);
}

RollOutcome DiceRoller::roll_with_reroll(const DiceExpression& expr, int threshold, bool reroll_once) {
  const bool until_above = !reroll_once && threshold < expr.sides;
  RollOutcome out;
  for (int i = 0; i < expr.count; ++i) {
    DieRoll die = roll_single(expr.sides);
    if (die.value <= threshold) {
      out.discarded.push_back(die);
      die = roll_single(expr.sides);
      while (until_above && die.value <= threshold) {
        out.discarded.push_back(die);
        die = roll_single(expr.sides);
      }
    }
    out.rolls.push_back(die);
  }
  out.modifier = expr.modifier;
  out.total = out.dice_sum() + out.modifier;
  return out;
}

} // namespace tale
