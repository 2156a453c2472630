#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "tale/payload.h"

namespace tale {

// Receives validated lore deltas per committed turn so they can be
// invalidated when the turn is rewound away.
class LoreSink {
 public:
  virtual ~LoreSink() = default;
  virtual bool record(const std::string& campaign_id, int64_t turn_index, const std::vector<LoreDelta>& deltas,
                      std::string& error) = 0;
  // Returns the number of entries invalidated.
  virtual size_t invalidate_after(const std::string& campaign_id, int64_t turn_index) = 0;
};

struct LoreEntry {
  std::string campaign_id;
  int64_t turn_index = 0;
  LoreDelta delta;
  bool invalidated = false;
};

// Process-lifetime ledger. Invalidated entries are flagged, never erased, so
// the ledger only grows; durable stores own compaction.
class MemoryLoreLedger final : public LoreSink {
 public:
  bool record(const std::string& campaign_id, int64_t turn_index, const std::vector<LoreDelta>& deltas,
              std::string& error) override;
  size_t invalidate_after(const std::string& campaign_id, int64_t turn_index) override;

  std::vector<LoreEntry> entries(const std::string& campaign_id, bool include_invalidated = false) const;

 private:
  mutable std::mutex mutex_;
  std::vector<LoreEntry> entries_;
};

} // namespace tale
