#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "tale/campaign_state.h"
#include "tale/universe_time.h"

namespace tale {

// Immutable record of one committed turn; removed only by rewind.
struct TurnEvent {
  std::string campaign_id;
  int64_t turn_index = 0;
  std::string player_input;
  std::string narrative;
  nlohmann::json roll_requests = nlohmann::json::array();
  nlohmann::json roll_results = nlohmann::json::array();
  nlohmann::json patch = nlohmann::json::array();
  std::string state_hash;
  nlohmann::json lore_deltas = nlohmann::json::array();
  UniverseTime universe_time;
  std::string created_at;  // ISO-8601 UTC
  int64_t seed = 0;
};

nlohmann::json to_json(const TurnEvent& event);
bool turn_event_from_json(const nlohmann::json& j, TurnEvent& out, std::string& error);

struct Snapshot {
  std::string campaign_id;
  int64_t turn_index = 0;
  nlohmann::json state;
  std::string state_hash;
};

// "2026-10-19T08:15:00Z"
std::string utc_timestamp();

// Append-only turn log plus snapshot cache, keyed by (campaign, turn index).
// Every write is atomic; a failed write leaves no partial record.
class TurnStore {
 public:
  virtual ~TurnStore() = default;

  virtual bool put_campaign(const Campaign& campaign, std::string& error) = 0;
  // False with "campaign not found: <id>" when absent.
  virtual bool get_campaign(const std::string& id, Campaign& out, std::string& error) const = 0;

  // Rejects an index other than latest + 1.
  virtual bool append_turn(const TurnEvent& event, std::string& error) = 0;
  // Turns with first <= index <= last, ascending.
  virtual bool read_turns(const std::string& campaign_id, int64_t first, int64_t last, std::vector<TurnEvent>& out,
                          std::string& error) const = 0;
  // 0 when no turn has been committed.
  virtual bool latest_index(const std::string& campaign_id, int64_t& out, std::string& error) const = 0;

  virtual bool put_snapshot(const Snapshot& snapshot, std::string& error) = 0;
  virtual bool find_snapshot_at_or_before(const std::string& campaign_id, int64_t index,
                                          std::optional<Snapshot>& out, std::string& error) const = 0;

  // Removes turns and snapshots with index > `index` as one unit: either both
  // are gone or neither is touched.
  virtual bool truncate_after(const std::string& campaign_id, int64_t index, size_t& turns_deleted,
                              size_t& snapshots_deleted, std::string& error) = 0;
};

class MemoryTurnStore final : public TurnStore {
 public:
  bool put_campaign(const Campaign& campaign, std::string& error) override;
  bool get_campaign(const std::string& id, Campaign& out, std::string& error) const override;
  bool append_turn(const TurnEvent& event, std::string& error) override;
  bool read_turns(const std::string& campaign_id, int64_t first, int64_t last, std::vector<TurnEvent>& out,
                  std::string& error) const override;
  bool latest_index(const std::string& campaign_id, int64_t& out, std::string& error) const override;
  bool put_snapshot(const Snapshot& snapshot, std::string& error) override;
  bool find_snapshot_at_or_before(const std::string& campaign_id, int64_t index, std::optional<Snapshot>& out,
                                  std::string& error) const override;
  bool truncate_after(const std::string& campaign_id, int64_t index, size_t& turns_deleted,
                      size_t& snapshots_deleted, std::string& error) override;

  size_t snapshot_count(const std::string& campaign_id) const;
  // Test hooks: the next append or truncate fails with a persistence error.
  void fail_next_append() { fail_next_append_ = true; }
  void fail_next_truncate() { fail_next_truncate_ = true; }

 private:
  mutable std::shared_mutex mutex_;
  std::map<std::string, Campaign> campaigns_;
  std::map<std::string, std::map<int64_t, TurnEvent>> turns_;
  std::map<std::string, std::map<int64_t, Snapshot>> snapshots_;
  std::atomic<bool> fail_next_append_{false};
  std::atomic<bool> fail_next_truncate_{false};
};

} // namespace tale
