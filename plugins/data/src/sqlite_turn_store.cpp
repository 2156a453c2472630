#include "tale_data/sqlite_turn_store.h"

#include "tale/log.h"

#include <sqlite3.h>

#include <memory>

namespace tale::data {

namespace {
constexpr const char* kSchema = R"sql(
CREATE TABLE IF NOT EXISTS campaigns (
  id TEXT PRIMARY KEY,
  body TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS turn_events (
  campaign_id TEXT NOT NULL,
  turn_index INTEGER NOT NULL,
  player_input TEXT NOT NULL,
  narrative TEXT NOT NULL,
  roll_requests TEXT NOT NULL,
  roll_results TEXT NOT NULL,
  patch TEXT NOT NULL,
  state_hash TEXT NOT NULL,
  lore_deltas TEXT NOT NULL,
  universe_time TEXT NOT NULL,
  created_at TEXT NOT NULL,
  seed INTEGER NOT NULL,
  PRIMARY KEY (campaign_id, turn_index)
);
CREATE TABLE IF NOT EXISTS snapshots (
  campaign_id TEXT NOT NULL,
  turn_index INTEGER NOT NULL,
  state TEXT NOT NULL,
  state_hash TEXT NOT NULL,
  PRIMARY KEY (campaign_id, turn_index)
);
)sql";

struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

Statement prepare(sqlite3* db, const char* sql, std::string& error) {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    error = std::string("sqlite prepare failed: ") + sqlite3_errmsg(db);
    sqlite3_finalize(stmt);
    return nullptr;
  }
  return Statement(stmt);
}

void bind_text(sqlite3_stmt* stmt, int index, const std::string& text) {
  sqlite3_bind_text(stmt, index, text.c_str(), static_cast<int>(text.size()), SQLITE_TRANSIENT);
}

std::string column_text(sqlite3_stmt* stmt, int column) {
  const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
  return text ? std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt, column))) : std::string();
}

bool parse_column(sqlite3_stmt* stmt, int column, nlohmann::json& out, std::string& error) {
  out = nlohmann::json::parse(column_text(stmt, column), nullptr, false);
  if (out.is_discarded()) {
    error = "stored JSON is corrupt in column " + std::to_string(column);
    return false;
  }
  return true;
}

bool read_turn_row(sqlite3_stmt* stmt, TurnEvent& e, std::string& error) {
  e.campaign_id = column_text(stmt, 0);
  e.turn_index = sqlite3_column_int64(stmt, 1);
  e.player_input = column_text(stmt, 2);
  e.narrative = column_text(stmt, 3);
  nlohmann::json time;
  if (!parse_column(stmt, 4, e.roll_requests, error) || !parse_column(stmt, 5, e.roll_results, error) ||
      !parse_column(stmt, 6, e.patch, error) || !parse_column(stmt, 8, e.lore_deltas, error) ||
      !parse_column(stmt, 9, time, error)) {
    return false;
  }
  e.state_hash = column_text(stmt, 7);
  if (!universe_time_from_json(time, e.universe_time, error)) {
    return false;
  }
  e.created_at = column_text(stmt, 10);
  e.seed = sqlite3_column_int64(stmt, 11);
  return true;
}
} // namespace

SqliteTurnStore::~SqliteTurnStore() {
  close();
}

bool SqliteTurnStore::open(const std::string& path, std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
  if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
    error = std::string("sqlite open failed: ") + (db_ ? sqlite3_errmsg(db_) : "out of memory");
    sqlite3_close(db_);
    db_ = nullptr;
    return false;
  }
  sqlite3_busy_timeout(db_, 2000);
  if (!exec("PRAGMA foreign_keys = ON;", error) || !exec(kSchema, error)) {
    sqlite3_close(db_);
    db_ = nullptr;
    return false;
  }
  log::info("store opened: " + path);
  return true;
}

void SqliteTurnStore::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

bool SqliteTurnStore::exec(const std::string& sql, std::string& error) const {
  if (!db_) {
    error = "sqlite store is not open";
    return false;
  }
  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    error = std::string("sqlite exec error: ") + (err_msg ? err_msg : sqlite3_errstr(rc));
    sqlite3_free(err_msg);
    return false;
  }
  return true;
}

bool SqliteTurnStore::put_campaign(const Campaign& campaign, std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!db_) {
    error = "sqlite store is not open";
    return false;
  }
  Statement stmt = prepare(db_, "INSERT INTO campaigns (id, body) VALUES (?1, ?2) "
                                "ON CONFLICT(id) DO UPDATE SET body = excluded.body;",
                           error);
  if (!stmt) return false;
  bind_text(stmt.get(), 1, campaign.id);
  bind_text(stmt.get(), 2, to_json(campaign).dump());
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    error = std::string("sqlite campaign write failed: ") + sqlite3_errmsg(db_);
    return false;
  }
  return true;
}

bool SqliteTurnStore::get_campaign(const std::string& id, Campaign& out, std::string& error) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!db_) {
    error = "sqlite store is not open";
    return false;
  }
  Statement stmt = prepare(db_, "SELECT body FROM campaigns WHERE id = ?1;", error);
  if (!stmt) return false;
  bind_text(stmt.get(), 1, id);
  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) {
    error = "campaign not found: " + id;
    return false;
  }
  if (rc != SQLITE_ROW) {
    error = std::string("sqlite campaign read failed: ") + sqlite3_errmsg(db_);
    return false;
  }
  nlohmann::json body;
  return parse_column(stmt.get(), 0, body, error) && campaign_from_json(body, out, error);
}

bool SqliteTurnStore::latest_index_locked(const std::string& campaign_id, int64_t& out, std::string& error) const {
  if (!db_) {
    error = "sqlite store is not open";
    return false;
  }
  Statement stmt = prepare(db_, "SELECT COALESCE(MAX(turn_index), 0) FROM turn_events WHERE campaign_id = ?1;", error);
  if (!stmt) return false;
  bind_text(stmt.get(), 1, campaign_id);
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    error = std::string("sqlite read failed: ") + sqlite3_errmsg(db_);
    return false;
  }
  out = sqlite3_column_int64(stmt.get(), 0);
  return true;
}

bool SqliteTurnStore::latest_index(const std::string& campaign_id, int64_t& out, std::string& error) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return latest_index_locked(campaign_id, out, error);
}

bool SqliteTurnStore::append_turn(const TurnEvent& event, std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!exec("BEGIN IMMEDIATE;", error)) {
    return false;
  }
  const auto rollback = [this, &error](const std::string& reason) {
    error = reason;
    std::string ignored;
    if (!exec("ROLLBACK;", ignored)) {
      log::error("sqlite rollback failed: " + ignored);
    }
    return false;
  };

  int64_t latest = 0;
  if (!latest_index_locked(event.campaign_id, latest, error)) {
    return rollback(error);
  }
  if (event.turn_index != latest + 1) {
    return rollback("turn index " + std::to_string(event.turn_index) + " does not follow " +
                    std::to_string(latest));
  }

  Statement stmt = prepare(db_,
                           "INSERT INTO turn_events (campaign_id, turn_index, player_input, narrative, "
                           "roll_requests, roll_results, patch, state_hash, lore_deltas, universe_time, "
                           "created_at, seed) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12);",
                           error);
  if (!stmt) {
    return rollback(error);
  }
  bind_text(stmt.get(), 1, event.campaign_id);
  sqlite3_bind_int64(stmt.get(), 2, event.turn_index);
  bind_text(stmt.get(), 3, event.player_input);
  bind_text(stmt.get(), 4, event.narrative);
  bind_text(stmt.get(), 5, event.roll_requests.dump());
  bind_text(stmt.get(), 6, event.roll_results.dump());
  bind_text(stmt.get(), 7, event.patch.dump());
  bind_text(stmt.get(), 8, event.state_hash);
  bind_text(stmt.get(), 9, event.lore_deltas.dump());
  bind_text(stmt.get(), 10, to_json(event.universe_time).dump());
  bind_text(stmt.get(), 11, event.created_at);
  sqlite3_bind_int64(stmt.get(), 12, event.seed);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return rollback(std::string("sqlite turn write failed: ") + sqlite3_errmsg(db_));
  }
  stmt.reset();
  return exec("COMMIT;", error) || rollback(error);
}

bool SqliteTurnStore::read_turns(const std::string& campaign_id, int64_t first, int64_t last,
                                 std::vector<TurnEvent>& out, std::string& error) const {
  std::lock_guard<std::mutex> lock(mutex_);
  out.clear();
  if (!db_) {
    error = "sqlite store is not open";
    return false;
  }
  Statement stmt = prepare(db_,
                           "SELECT campaign_id, turn_index, player_input, narrative, roll_requests, roll_results, "
                           "patch, state_hash, lore_deltas, universe_time, created_at, seed FROM turn_events "
                           "WHERE campaign_id = ?1 AND turn_index BETWEEN ?2 AND ?3 ORDER BY turn_index;",
                           error);
  if (!stmt) return false;
  bind_text(stmt.get(), 1, campaign_id);
  sqlite3_bind_int64(stmt.get(), 2, first);
  sqlite3_bind_int64(stmt.get(), 3, last);
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    TurnEvent event;
    if (!read_turn_row(stmt.get(), event, error)) {
      return false;
    }
    out.push_back(std::move(event));
  }
  if (rc != SQLITE_DONE) {
    error = std::string("sqlite turn read failed: ") + sqlite3_errmsg(db_);
    return false;
  }
  return true;
}

bool SqliteTurnStore::delete_rows_after(const char* table, const std::string& campaign_id, int64_t index,
                                        size_t& deleted, std::string& error) {
  deleted = 0;
  const std::string sql = std::string("DELETE FROM ") + table + " WHERE campaign_id = ?1 AND turn_index > ?2;";
  Statement stmt = prepare(db_, sql.c_str(), error);
  if (!stmt) return false;
  bind_text(stmt.get(), 1, campaign_id);
  sqlite3_bind_int64(stmt.get(), 2, index);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    error = std::string("sqlite delete failed: ") + sqlite3_errmsg(db_);
    return false;
  }
  deleted = static_cast<size_t>(sqlite3_changes(db_));
  return true;
}

bool SqliteTurnStore::truncate_after(const std::string& campaign_id, int64_t index, size_t& turns_deleted,
                                     size_t& snapshots_deleted, std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  turns_deleted = 0;
  snapshots_deleted = 0;
  if (!exec("BEGIN IMMEDIATE;", error)) {
    return false;
  }
  const auto rollback = [this, &error, &turns_deleted, &snapshots_deleted](const std::string& reason) {
    error = reason;
    turns_deleted = 0;
    snapshots_deleted = 0;
    std::string ignored;
    if (!exec("ROLLBACK;", ignored)) {
      log::error("sqlite rollback failed: " + ignored);
    }
    return false;
  };
  if (!delete_rows_after("turn_events", campaign_id, index, turns_deleted, error) ||
      !delete_rows_after("snapshots", campaign_id, index, snapshots_deleted, error)) {
    return rollback(error);
  }
  return exec("COMMIT;", error) || rollback(error);
}

bool SqliteTurnStore::put_snapshot(const Snapshot& snapshot, std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!db_) {
    error = "sqlite store is not open";
    return false;
  }
  Statement stmt = prepare(db_, "INSERT OR REPLACE INTO snapshots (campaign_id, turn_index, state, state_hash) "
                                "VALUES (?1, ?2, ?3, ?4);",
                           error);
  if (!stmt) return false;
  bind_text(stmt.get(), 1, snapshot.campaign_id);
  sqlite3_bind_int64(stmt.get(), 2, snapshot.turn_index);
  bind_text(stmt.get(), 3, snapshot.state.dump());
  bind_text(stmt.get(), 4, snapshot.state_hash);
  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    error = std::string("sqlite snapshot write failed: ") + sqlite3_errmsg(db_);
    return false;
  }
  return true;
}

bool SqliteTurnStore::find_snapshot_at_or_before(const std::string& campaign_id, int64_t index,
                                                 std::optional<Snapshot>& out, std::string& error) const {
  std::lock_guard<std::mutex> lock(mutex_);
  out.reset();
  if (!db_) {
    error = "sqlite store is not open";
    return false;
  }
  Statement stmt = prepare(db_,
                           "SELECT turn_index, state, state_hash FROM snapshots WHERE campaign_id = ?1 AND "
                           "turn_index <= ?2 ORDER BY turn_index DESC LIMIT 1;",
                           error);
  if (!stmt) return false;
  bind_text(stmt.get(), 1, campaign_id);
  sqlite3_bind_int64(stmt.get(), 2, index);
  const int rc = sqlite3_step(stmt.get());
  if (rc == SQLITE_DONE) return true;
  if (rc != SQLITE_ROW) {
    error = std::string("sqlite snapshot read failed: ") + sqlite3_errmsg(db_);
    return false;
  }
  Snapshot snapshot;
  snapshot.campaign_id = campaign_id;
  snapshot.turn_index = sqlite3_column_int64(stmt.get(), 0);
  if (!parse_column(stmt.get(), 1, snapshot.state, error)) {
    return false;
  }
  snapshot.state_hash = column_text(stmt.get(), 2);
  out = std::move(snapshot);
  return true;
}

} // namespace tale::data
