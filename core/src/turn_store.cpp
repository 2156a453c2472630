#include "tale/turn_store.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <mutex>
#include <sstream>

namespace tale {

std::string utc_timestamp() {
  using namespace std::chrono;
  const auto tt = system_clock::to_time_t(system_clock::now());
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

nlohmann::json to_json(const TurnEvent& event) {
  return nlohmann::json{{"campaign_id", event.campaign_id},
                        {"turn_index", event.turn_index},
                        {"player_input", event.player_input},
                        {"narrative", event.narrative},
                        {"roll_requests", event.roll_requests},
                        {"roll_results", event.roll_results},
                        {"patch", event.patch},
                        {"state_hash", event.state_hash},
                        {"lore_deltas", event.lore_deltas},
                        {"universe_time", to_json(event.universe_time)},
                        {"created_at", event.created_at},
                        {"seed", event.seed}};
}

bool turn_event_from_json(const nlohmann::json& j, TurnEvent& out, std::string& error) {
  try {
    TurnEvent e;
    e.campaign_id = j.at("campaign_id").get<std::string>();
    e.turn_index = j.at("turn_index").get<int64_t>();
    e.player_input = j.value("player_input", std::string());
    e.narrative = j.value("narrative", std::string());
    e.roll_requests = j.value("roll_requests", nlohmann::json::array());
    e.roll_results = j.value("roll_results", nlohmann::json::array());
    e.patch = j.value("patch", nlohmann::json::array());
    e.state_hash = j.at("state_hash").get<std::string>();
    e.lore_deltas = j.value("lore_deltas", nlohmann::json::array());
    if (j.contains("universe_time") && !universe_time_from_json(j["universe_time"], e.universe_time, error)) {
      return false;
    }
    e.created_at = j.value("created_at", std::string());
    e.seed = j.value("seed", static_cast<int64_t>(0));
    out = std::move(e);
    return true;
  } catch (const nlohmann::json::exception& ex) {
    error = std::string("turn event: ") + ex.what();
    return false;
  }
}

bool MemoryTurnStore::put_campaign(const Campaign& campaign, std::string& error) {
  if (campaign.id.empty()) {
    error = "campaign id is empty";
    return false;
  }
  std::unique_lock<std::shared_mutex> lock(mutex_);
  campaigns_[campaign.id] = campaign;
  return true;
}

bool MemoryTurnStore::get_campaign(const std::string& id, Campaign& out, std::string& error) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = campaigns_.find(id);
  if (it == campaigns_.end()) {
    error = "campaign not found: " + id;
    return false;
  }
  out = it->second;
  return true;
}

bool MemoryTurnStore::append_turn(const TurnEvent& event, std::string& error) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (fail_next_append_.exchange(false)) {
    error = "simulated write failure";
    return false;
  }
  if (campaigns_.count(event.campaign_id) == 0) {
    error = "campaign not found: " + event.campaign_id;
    return false;
  }
  auto& log = turns_[event.campaign_id];
  const int64_t latest = log.empty() ? 0 : log.rbegin()->first;
  if (event.turn_index != latest + 1) {
    error = "turn index " + std::to_string(event.turn_index) + " does not follow " + std::to_string(latest);
    return false;
  }
  log.emplace(event.turn_index, event);
  return true;
}

bool MemoryTurnStore::read_turns(const std::string& campaign_id, int64_t first, int64_t last,
                                 std::vector<TurnEvent>& out, std::string& error) const {
  (void)error;
  std::shared_lock<std::shared_mutex> lock(mutex_);
  out.clear();
  const auto it = turns_.find(campaign_id);
  if (it == turns_.end() || first > last) return true;
  for (auto t = it->second.lower_bound(first); t != it->second.end() && t->first <= last; ++t) {
    out.push_back(t->second);
  }
  return true;
}

bool MemoryTurnStore::latest_index(const std::string& campaign_id, int64_t& out, std::string& error) const {
  (void)error;
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = turns_.find(campaign_id);
  out = (it == turns_.end() || it->second.empty()) ? 0 : it->second.rbegin()->first;
  return true;
}

bool MemoryTurnStore::put_snapshot(const Snapshot& snapshot, std::string& error) {
  (void)error;
  std::unique_lock<std::shared_mutex> lock(mutex_);
  snapshots_[snapshot.campaign_id][snapshot.turn_index] = snapshot;
  return true;
}

bool MemoryTurnStore::find_snapshot_at_or_before(const std::string& campaign_id, int64_t index,
                                                 std::optional<Snapshot>& out, std::string& error) const {
  (void)error;
  std::shared_lock<std::shared_mutex> lock(mutex_);
  out.reset();
  const auto it = snapshots_.find(campaign_id);
  if (it == snapshots_.end()) return true;
  auto s = it->second.upper_bound(index);
  if (s == it->second.begin()) return true;
  --s;
  out = s->second;
  return true;
}

bool MemoryTurnStore::truncate_after(const std::string& campaign_id, int64_t index, size_t& turns_deleted,
                                     size_t& snapshots_deleted, std::string& error) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  turns_deleted = 0;
  snapshots_deleted = 0;
  if (fail_next_truncate_.exchange(false)) {
    error = "simulated write failure";
    return false;
  }
  const auto erase_after = [index](auto& by_index) {
    auto from = by_index.upper_bound(index);
    const auto count = static_cast<size_t>(std::distance(from, by_index.end()));
    by_index.erase(from, by_index.end());
    return count;
  };
  const auto turns = turns_.find(campaign_id);
  if (turns != turns_.end()) turns_deleted = erase_after(turns->second);
  const auto snapshots = snapshots_.find(campaign_id);
  if (snapshots != snapshots_.end()) snapshots_deleted = erase_after(snapshots->second);
  return true;
}

size_t MemoryTurnStore::snapshot_count(const std::string& campaign_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = snapshots_.find(campaign_id);
  return it == snapshots_.end() ? 0 : it->second.size();
}

} // namespace tale
