#include "tale/narrator.h"

#include <sstream>

namespace tale {

std::string summarize_rolls(const std::vector<RollResult>& rolls) {
  std::ostringstream out;
  for (const auto& roll : rolls) {
    out << "- " << roll.id << ": ";
    if (!roll.error.empty()) {
      out << "not resolved (" << roll.error << ")\n";
      continue;
    }
    out << (roll.natural.has_value() ? *roll.natural : roll.total - roll.modifier) << " + " << roll.modifier
        << " = " << roll.total;
    if (roll.dc.has_value()) {
      out << " vs " << (roll.kind == "attack_roll" ? "AC " : "DC ") << *roll.dc;
    }
    if (roll.success.has_value()) {
      out << ": " << (*roll.success ? "SUCCESS" : "FAILURE");
    }
    if (roll.critical) out << " (critical)";
    out << "\n";
  }
  return out.str();
}

std::optional<std::string> ScriptedNarrator::pop(std::deque<std::string>& queue) {
  if (queue.empty()) return std::nullopt;
  std::string text = std::move(queue.front());
  queue.pop_front();
  return text;
}

std::optional<std::string> ScriptedNarrator::propose(const NarrationContext& context) {
  last_context_turns_ = context.recent_turns.size();
  return pop(proposals_);
}

std::optional<std::string> ScriptedNarrator::finalize(const NarrationContext& context, const std::string& proposal,
                                                      const std::vector<RollResult>& rolls) {
  (void)context;
  (void)proposal;
  ++finalize_calls_;
  last_roll_summary_ = summarize_rolls(rolls);
  return pop(finals_);
}

std::optional<std::string> ScriptedNarrator::repair(const NarrationContext& context,
                                                    const std::vector<TurnError>& errors,
                                                    const std::string& previous) {
  (void)context;
  (void)errors;
  (void)previous;
  ++repair_calls_;
  return pop(repairs_);
}

} // namespace tale
