#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "tale/campaign_lock.h"
#include "tale/campaign_state.h"
#include "tale/errors.h"
#include "tale/lore.h"
#include "tale/state_service.h"

namespace tale {

struct RewindResult {
  bool success = false;
  int64_t target_index = 0;
  size_t turns_deleted = 0;
  size_t snapshots_deleted = 0;
  size_t lore_invalidated = 0;
  CampaignState state;
  std::vector<TurnError> errors;
};

struct RewindableTurn {
  int64_t turn_index = 0;
  std::string input_preview;
  std::string narrative_preview;
  UniverseTime universe_time;
  std::string created_at;
};

nlohmann::json to_json(const RewindableTurn& turn);

// Truncates the turn log to a target index and invalidates everything
// derived from the removed turns. Holds the campaign lock throughout.
class RewindCoordinator {
 public:
  static constexpr size_t kPreviewLength = 100;

  RewindCoordinator(StateService& states, LoreSink& lore, CampaignLockRegistry& locks)
      : states_(states), lore_(lore), locks_(locks) {}

  RewindResult rewind(const std::string& campaign_id, int64_t target);
  // Most recent first.
  bool rewindable_turns(const std::string& campaign_id, size_t limit, std::vector<RewindableTurn>& out,
                        std::string& error) const;

 private:
  StateService& states_;
  LoreSink& lore_;
  CampaignLockRegistry& locks_;
};

} // namespace tale
