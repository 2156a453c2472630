#pragma once

#include <mutex>
#include <string>

#include "tale/turn_store.h"

struct sqlite3;

namespace tale::data {

// Durable TurnStore on a single SQLite database file. Each write runs in its
// own transaction; a failed write is rolled back.
class SqliteTurnStore final : public TurnStore {
 public:
  SqliteTurnStore() = default;
  SqliteTurnStore(const SqliteTurnStore&) = delete;
  SqliteTurnStore& operator=(const SqliteTurnStore&) = delete;
  ~SqliteTurnStore() override;

  // Opens (creating if needed) and ensures the schema exists.
  bool open(const std::string& path, std::string& error);
  void close();
  bool is_open() const { return db_ != nullptr; }

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

 private:
  bool exec(const std::string& sql, std::string& error) const;
  bool latest_index_locked(const std::string& campaign_id, int64_t& out, std::string& error) const;
  // Caller holds mutex_ and an open transaction.
  bool delete_rows_after(const char* table, const std::string& campaign_id, int64_t index, size_t& deleted,
                         std::string& error);

  struct sqlite3* db_ = nullptr;
  mutable std::mutex mutex_;
};

} // namespace tale::data
