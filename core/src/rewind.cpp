#include "tale/rewind.h"

#include "tale/log.h"

#include <algorithm>

namespace tale {

namespace {
RewindResult reject(RewindResult result, ErrorKind kind, const char* code, const std::string& message) {
  result.errors.push_back(TurnError{kind, code, "", message});
  log::warn("rewind rejected: " + message);
  return result;
}

// First `length` code points; never splits a UTF-8 sequence.
std::string preview(const std::string& text, size_t length) {
  size_t chars = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    if ((static_cast<unsigned char>(text[i]) & 0xC0) == 0x80) continue;
    if (chars == length) return text.substr(0, i);
    ++chars;
  }
  return text;
}
} // namespace

nlohmann::json to_json(const RewindableTurn& turn) {
  return nlohmann::json{{"turn_index", turn.turn_index},
                        {"input_preview", turn.input_preview},
                        {"narrative_preview", turn.narrative_preview},
                        {"universe_time", to_json(turn.universe_time)},
                        {"created_at", turn.created_at}};
}

RewindResult RewindCoordinator::rewind(const std::string& campaign_id, int64_t target) {
  RewindResult result;
  result.target_index = target;

  auto guard = locks_.try_acquire(campaign_id);
  if (!guard) {
    return reject(result, ErrorKind::StateConflict, "campaign_busy", "a turn is in flight for " + campaign_id);
  }

  std::string error;
  Campaign campaign;
  if (!states_.store().get_campaign(campaign_id, campaign, error)) {
    return reject(result, ErrorKind::StateConflict, "unknown_campaign", error);
  }
  if (campaign.status == CampaignStatus::Ended) {
    return reject(result, ErrorKind::StateConflict, "campaign_ended", "cannot rewind an ended campaign");
  }
  int64_t latest = 0;
  if (!states_.latest_index(campaign_id, latest, error)) {
    return reject(result, ErrorKind::Persistence, "store_read_failed", error);
  }
  if (target < 0) {
    return reject(result, ErrorKind::StateConflict, "invalid_target", "rewind target must be non-negative");
  }
  if (target > latest) {
    return reject(result, ErrorKind::StateConflict, "invalid_target",
                  "rewind target " + std::to_string(target) + " is beyond turn " + std::to_string(latest));
  }

  // Rebuild before deleting so a broken log is never truncated.
  ReplayResult replay = states_.replay_to(campaign, target);
  if (!replay.success) {
    return reject(result, ErrorKind::StateConflict, "replay_failed",
                  replay.errors.empty() ? std::string("replay failed") : replay.errors.front());
  }
  result.state = std::move(replay.state);
  if (target == latest) {
    result.success = true;
    return result;
  }

  if (!states_.store().truncate_after(campaign_id, target, result.turns_deleted, result.snapshots_deleted, error)) {
    return reject(result, ErrorKind::Persistence, "store_write_failed", error);
  }
  result.lore_invalidated = lore_.invalidate_after(campaign_id, target);
  result.success = true;
  log::info("rewind: " + campaign_id + " to turn " + std::to_string(target) + "; removed " +
            std::to_string(result.turns_deleted) + " turns, " + std::to_string(result.snapshots_deleted) +
            " snapshots, invalidated " + std::to_string(result.lore_invalidated) + " lore entries");
  return result;
}

bool RewindCoordinator::rewindable_turns(const std::string& campaign_id, size_t limit,
                                         std::vector<RewindableTurn>& out, std::string& error) const {
  out.clear();
  int64_t latest = 0;
  if (!states_.latest_index(campaign_id, latest, error)) {
    return false;
  }
  const int64_t first = limit == 0 ? 1 : std::max<int64_t>(1, latest - static_cast<int64_t>(limit) + 1);
  std::vector<TurnEvent> turns;
  if (!states_.store().read_turns(campaign_id, first, latest, turns, error)) {
    return false;
  }
  for (auto it = turns.rbegin(); it != turns.rend(); ++it) {
    out.push_back(RewindableTurn{it->turn_index, preview(it->player_input, kPreviewLength),
                                 preview(it->narrative, kPreviewLength), it->universe_time, it->created_at});
  }
  return true;
}

} // namespace tale
