#include "tale/state_service.h"

#include "tale/log.h"

namespace tale {

CampaignState StateService::initial_state(const Campaign& campaign) const {
  return CampaignState::initial(campaign);
}

bool StateService::latest_index(const std::string& campaign_id, int64_t& out, std::string& error) const {
  return store_.latest_index(campaign_id, out, error);
}

ReplayResult StateService::replay_to(const Campaign& campaign, int64_t index, bool use_snapshots) const {
  ReplayResult result;
  std::string error;
  int64_t latest = 0;
  if (!store_.latest_index(campaign.id, latest, error)) {
    result.errors.push_back(error);
    return result;
  }
  if (index < 0 || index > latest) {
    result.errors.push_back("turn " + std::to_string(index) + " outside 0-" + std::to_string(latest));
    return result;
  }

  result.state = initial_state(campaign);
  if (use_snapshots) {
    std::optional<Snapshot> snapshot;
    if (!store_.find_snapshot_at_or_before(campaign.id, index, snapshot, error)) {
      log::warn("snapshot lookup failed, replaying from start: " + error);
    } else if (snapshot.has_value()) {
      CampaignState restored;
      if (!CampaignState::from_json(snapshot->state, restored, error)) {
        log::warn("snapshot at turn " + std::to_string(snapshot->turn_index) + " unreadable: " + error);
      } else if (restored.compute_hash() != snapshot->state_hash) {
        log::warn("snapshot at turn " + std::to_string(snapshot->turn_index) + " fails its hash; ignored");
      } else {
        result.state = std::move(restored);
        result.from_snapshot = true;
        result.snapshot_index = snapshot->turn_index;
      }
    }
  }

  std::vector<TurnEvent> turns;
  const int64_t first = result.state.turn_index() + 1;
  if (!store_.read_turns(campaign.id, first, index, turns, error)) {
    result.errors.push_back(error);
    return result;
  }
  int64_t expected = first;
  for (const auto& turn : turns) {
    if (turn.turn_index != expected) {
      result.errors.push_back("turn log gap before turn " + std::to_string(turn.turn_index));
      return result;
    }
    std::vector<TurnError> decode_errors;
    const auto ops = decode_patches(turn.patch, decode_errors);
    if (!decode_errors.empty()) {
      result.errors.push_back("turn " + std::to_string(turn.turn_index) + ": " + describe(decode_errors));
      return result;
    }
    if (!result.state.apply_patch(ops, error)) {
      result.errors.push_back("turn " + std::to_string(turn.turn_index) + ": " + error);
      return result;
    }
    result.state.set_turn_index(turn.turn_index);
    const std::string hash = result.state.compute_hash();
    if (hash != turn.state_hash) {
      result.errors.push_back("hash mismatch at turn " + std::to_string(turn.turn_index));
      return result;
    }
    ++result.turns_replayed;
    ++expected;
  }
  if (expected != index + 1) {
    result.errors.push_back("turn log ends at " + std::to_string(expected - 1) + ", wanted " +
                            std::to_string(index));
    return result;
  }
  result.success = true;
  return result;
}

bool StateService::get_state_at(const std::string& campaign_id, int64_t index, CampaignState& out,
                                std::string& error) const {
  Campaign campaign;
  if (!store_.get_campaign(campaign_id, campaign, error)) {
    return false;
  }
  ReplayResult replay = replay_to(campaign, index);
  if (!replay.success) {
    error = replay.errors.empty() ? std::string("replay failed") : replay.errors.front();
    return false;
  }
  out = std::move(replay.state);
  return true;
}

bool StateService::current_state(const std::string& campaign_id, CampaignState& out, std::string& error) const {
  int64_t latest = 0;
  if (!store_.latest_index(campaign_id, latest, error)) {
    return false;
  }
  return get_state_at(campaign_id, latest, out, error);
}

bool StateService::save_snapshot(const CampaignState& state, bool force, bool& written, std::string& error) {
  written = false;
  if (!force && (state.turn_index() == 0 || state.turn_index() % config_.snapshot_interval != 0)) {
    return true;
  }
  Snapshot snapshot{state.campaign_id(), state.turn_index(), state.to_json(), state.compute_hash()};
  if (!store_.put_snapshot(snapshot, error)) {
    return false;
  }
  written = true;
  log::info("snapshot saved: " + state.campaign_id() + " turn " + std::to_string(state.turn_index()));
  return true;
}

bool StateService::verify_state_hash(const std::string& campaign_id, int64_t index, const std::string& expected,
                                     bool& matches, std::string& error) const {
  CampaignState state;
  if (!get_state_at(campaign_id, index, state, error)) {
    matches = false;
    return false;
  }
  matches = state.compute_hash() == expected;
  return true;
}

bool StateService::verify_chain(const std::string& campaign_id, VerifyReport& report, std::string& error) const {
  report = VerifyReport{};
  Campaign campaign;
  int64_t latest = 0;
  if (!store_.get_campaign(campaign_id, campaign, error) || !store_.latest_index(campaign_id, latest, error)) {
    return false;
  }

  CampaignState state = initial_state(campaign);
  std::vector<TurnEvent> turns;
  if (!store_.read_turns(campaign_id, 1, latest, turns, error)) {
    return false;
  }
  int64_t expected = 1;
  for (const auto& turn : turns) {
    if (turn.turn_index != expected) {
      report.mismatches.push_back("turn log gap before turn " + std::to_string(turn.turn_index));
      break;
    }
    std::vector<TurnError> decode_errors;
    const auto ops = decode_patches(turn.patch, decode_errors);
    std::string apply_error;
    if (!decode_errors.empty() || !state.apply_patch(ops, apply_error)) {
      report.mismatches.push_back("turn " + std::to_string(turn.turn_index) + ": patch does not apply " +
                                  apply_error);
      break;
    }
    state.set_turn_index(turn.turn_index);
    ++report.turns_checked;
    if (state.compute_hash() != turn.state_hash) {
      report.mismatches.push_back("turn " + std::to_string(turn.turn_index) + ": stored hash differs");
      break;
    }

    std::optional<Snapshot> snapshot;
    if (!store_.find_snapshot_at_or_before(campaign_id, turn.turn_index, snapshot, error)) {
      return false;
    }
    if (snapshot.has_value() && snapshot->turn_index == turn.turn_index) {
      ++report.snapshots_checked;
      if (snapshot->state_hash != turn.state_hash) {
        report.mismatches.push_back("snapshot at turn " + std::to_string(turn.turn_index) + " differs");
      }
    }
    ++expected;
  }
  if (report.ok()) {
    log::info("verify: " + campaign_id + " ok through turn " + std::to_string(report.turns_checked));
  } else {
    log::warn("verify: " + campaign_id + " " + report.mismatches.front());
  }
  return true;
}

} // namespace tale
