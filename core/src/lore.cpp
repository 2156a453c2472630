#include "tale/lore.h"

#include "tale/log.h"

namespace tale {

bool MemoryLoreLedger::record(const std::string& campaign_id, int64_t turn_index,
                              const std::vector<LoreDelta>& deltas, std::string& error) {
  (void)error;
  if (deltas.empty()) return true;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& delta : deltas) {
    entries_.push_back(LoreEntry{campaign_id, turn_index, delta, false});
  }
  log::info("lore: recorded " + std::to_string(deltas.size()) + " deltas for " + campaign_id + " turn " +
            std::to_string(turn_index));
  return true;
}

size_t MemoryLoreLedger::invalidate_after(const std::string& campaign_id, int64_t turn_index) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t count = 0;
  for (auto& entry : entries_) {
    if (entry.campaign_id == campaign_id && entry.turn_index > turn_index && !entry.invalidated) {
      entry.invalidated = true;
      ++count;
    }
  }
  return count;
}

std::vector<LoreEntry> MemoryLoreLedger::entries(const std::string& campaign_id, bool include_invalidated) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<LoreEntry> out;
  for (const auto& entry : entries_) {
    if (entry.campaign_id != campaign_id) continue;
    if (entry.invalidated && !include_invalidated) continue;
    out.push_back(entry);
  }
  return out;
}

} // namespace tale
