#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "tale/campaign_state.h"
#include "tale/config.h"
#include "tale/turn_store.h"

namespace tale {

struct ReplayResult {
  bool success = false;
  CampaignState state;
  bool from_snapshot = false;
  int64_t snapshot_index = 0;
  size_t turns_replayed = 0;
  std::vector<std::string> errors;
};

struct VerifyReport {
  int64_t turns_checked = 0;
  size_t snapshots_checked = 0;
  std::vector<std::string> mismatches;

  bool ok() const { return mismatches.empty(); }
};

// Derives canonical state from the initial state plus the ordered patch log.
// Reads never mutate the store; snapshots only bound replay cost.
class StateService {
 public:
  StateService(TurnStore& store, const EngineConfig& config) : store_(store), config_(config) {}

  CampaignState initial_state(const Campaign& campaign) const;
  bool latest_index(const std::string& campaign_id, int64_t& out, std::string& error) const;

  // Starts from the nearest snapshot at or before `index` (or the initial
  // state) and re-applies stored patches, checking each stored hash.
  ReplayResult replay_to(const Campaign& campaign, int64_t index, bool use_snapshots = true) const;
  bool get_state_at(const std::string& campaign_id, int64_t index, CampaignState& out, std::string& error) const;
  bool current_state(const std::string& campaign_id, CampaignState& out, std::string& error) const;

  // Writes when forced or when the index falls on the snapshot interval.
  bool save_snapshot(const CampaignState& state, bool force, bool& written, std::string& error);

  static std::string compute_hash(const CampaignState& state) { return state.compute_hash(); }
  bool verify_state_hash(const std::string& campaign_id, int64_t index, const std::string& expected, bool& matches,
                         std::string& error) const;
  // Full replay from turn 0 without snapshots, plus a check of every stored
  // snapshot against the replayed state.
  bool verify_chain(const std::string& campaign_id, VerifyReport& report, std::string& error) const;

  const EngineConfig& config() const { return config_; }
  TurnStore& store() { return store_; }

 private:
  TurnStore& store_;
  const EngineConfig& config_;
};

} // namespace tale
