#pragma once

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "tale/errors.h"
#include "tale/mechanics.h"
#include "tale/turn_store.h"

namespace tale {

struct NarrationContext {
  std::string campaign_id;
  int64_t turn_index = 0;  // index the turn will receive
  std::string player_input;
  nlohmann::json state;  // current canonical state document
  std::vector<TurnEvent> recent_turns;
};

// Source of raw narrator text. An empty optional means no response; the
// engine treats that as a missing proposal, keeps the proposal instead of a
// final narration, or stops repairing.
class Narrator {
 public:
  virtual ~Narrator() = default;

  virtual std::optional<std::string> propose(const NarrationContext& context) = 0;
  virtual std::optional<std::string> finalize(const NarrationContext& context, const std::string& proposal,
                                              const std::vector<RollResult>& rolls) = 0;
  virtual std::optional<std::string> repair(const NarrationContext& context, const std::vector<TurnError>& errors,
                                            const std::string& previous) = 0;
};

// One line per roll, e.g. "- r1: 8 + 4 = 12 vs DC 12: SUCCESS".
std::string summarize_rolls(const std::vector<RollResult>& rolls);

// Replays canned responses in order.
class ScriptedNarrator final : public Narrator {
 public:
  void push_proposal(std::string text) { proposals_.push_back(std::move(text)); }
  void push_final(std::string text) { finals_.push_back(std::move(text)); }
  void push_repair(std::string text) { repairs_.push_back(std::move(text)); }

  std::optional<std::string> propose(const NarrationContext& context) override;
  std::optional<std::string> finalize(const NarrationContext& context, const std::string& proposal,
                                      const std::vector<RollResult>& rolls) override;
  std::optional<std::string> repair(const NarrationContext& context, const std::vector<TurnError>& errors,
                                    const std::string& previous) override;

  size_t finalize_calls() const { return finalize_calls_; }
  size_t repair_calls() const { return repair_calls_; }
  const std::string& last_roll_summary() const { return last_roll_summary_; }
  size_t last_context_turns() const { return last_context_turns_; }

 private:
  static std::optional<std::string> pop(std::deque<std::string>& queue);

  std::deque<std::string> proposals_;
  std::deque<std::string> finals_;
  std::deque<std::string> repairs_;
  size_t finalize_calls_ = 0;
  size_t repair_calls_ = 0;
  size_t last_context_turns_ = 0;
  std::string last_roll_summary_;
};

} // namespace tale
