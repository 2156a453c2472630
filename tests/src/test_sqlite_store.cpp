#include "tale/campaign_lock.h"
#include "tale/config.h"
#include "tale/log.h"
#include "tale/lore.h"
#include "tale/narrator.h"
#include "tale/state_service.h"
#include "tale/turn_engine.h"
#include "tale_data/sqlite_turn_store.h"
#include "talectl/cli_api.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

bool write_text(const fs::path& path, const std::string& contents) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path);
  if (!out) return false;
  out << contents;
  return true;
}

json parse_output(const std::ostringstream& out) {
  return json::parse(out.str(), nullptr, false);
}

tale::Campaign make_campaign(const std::string& id) {
  tale::Campaign campaign;
  std::string error;
  if (!tale::campaign_from_json({{"id", id}, {"character", {{"level", 2}, {"abilities", {{"dex", 16}}}}}}, campaign,
                                error)) {
    std::cerr << "campaign fixture invalid: " << error << "\n";
  }
  return campaign;
}

tale::TurnEvent make_event(const std::string& id, int64_t index) {
  tale::TurnEvent event;
  event.campaign_id = id;
  event.turn_index = index;
  event.player_input = "input " + std::to_string(index);
  event.narrative = "narrative " + std::to_string(index);
  event.patch = json::array({{{"op", "replace"}, {"path", "/world/location_id"}, {"value", "room"}}});
  event.state_hash = "hash" + std::to_string(index);
  event.universe_time.hour = static_cast<int>(index);
  event.created_at = tale::utc_timestamp();
  event.seed = 1000 + index;
  return event;
}

} // namespace

int main() {
  tale::log::init();
  tale::log::set_level(tale::log::Level::Error);
  int failures = 0;
  const fs::path dir = fs::temp_directory_path() / "tale_test_sqlite";
  std::error_code ec;
  fs::remove_all(dir, ec);
  fs::create_directories(dir, ec);
  const fs::path db_path = dir / "store.sqlite";

  // Test: the SQLite store keeps the log contiguous and survives a reopen.
  {
    tale::data::SqliteTurnStore store;
    std::string error;
    if (!store.open(db_path.string(), error)) {
      std::cerr << "open failed: " << error << "\n";
      return 1;
    }
    const auto campaign = make_campaign("c-sql");
    tale::Campaign loaded;
    if (!store.put_campaign(campaign, error) || !store.get_campaign("c-sql", loaded, error) ||
        loaded.character["level"] != 2) {
      std::cerr << "campaign round trip failed: " << error << "\n";
      ++failures;
    }
    if (store.get_campaign("c-none", loaded, error) || error.find("campaign not found") == std::string::npos) {
      std::cerr << "missing campaign not reported\n";
      ++failures;
    }
    for (int64_t i = 1; i <= 4; ++i) {
      if (!store.append_turn(make_event("c-sql", i), error)) {
        std::cerr << "append " << i << " failed: " << error << "\n";
        ++failures;
      }
    }
    if (store.append_turn(make_event("c-sql", 6), error) || store.append_turn(make_event("c-sql", 4), error)) {
      std::cerr << "non-contiguous append accepted\n";
      ++failures;
    }
    for (int64_t i : {2, 4}) {
      if (!store.put_snapshot({"c-sql", i, json{{"turn_index", i}}, "snap" + std::to_string(i)}, error)) {
        std::cerr << "snapshot write failed: " << error << "\n";
        ++failures;
      }
    }
    store.close();

    if (!store.open(db_path.string(), error)) {
      std::cerr << "reopen failed: " << error << "\n";
      return 1;
    }
    int64_t latest = 0;
    std::vector<tale::TurnEvent> turns;
    if (!store.latest_index("c-sql", latest, error) || latest != 4 ||
        !store.read_turns("c-sql", 2, 3, turns, error) || turns.size() != 2 || turns[0].turn_index != 2 ||
        turns[1].seed != 1003 || turns[1].universe_time.hour != 3 || turns[0].patch.size() != 1) {
      std::cerr << "reopened store lost turns\n";
      ++failures;
    }
    std::optional<tale::Snapshot> snapshot;
    if (!store.find_snapshot_at_or_before("c-sql", 3, snapshot, error) || !snapshot ||
        snapshot->turn_index != 2 || snapshot->state_hash != "snap2") {
      std::cerr << "snapshot lookup wrong\n";
      ++failures;
    }
    size_t deleted_turns = 0;
    size_t deleted_snapshots = 0;
    if (!store.truncate_after("c-sql", 2, deleted_turns, deleted_snapshots, error) || deleted_turns != 2 ||
        deleted_snapshots != 1 || !store.latest_index("c-sql", latest, error) || latest != 2 ||
        !store.append_turn(make_event("c-sql", 3), error)) {
      std::cerr << "truncation wrong: " << error << "\n";
      ++failures;
    }
    if (!store.latest_index("c-empty", latest, error) || latest != 0) {
      std::cerr << "empty campaign should report index 0\n";
      ++failures;
    }
  }

  // Test: the turn engine runs end to end on SQLite.
  {
    tale::EngineConfig config;
    config.snapshot_interval = 2;
    tale::data::SqliteTurnStore store;
    tale::MemoryLoreLedger lore;
    tale::CampaignLockRegistry locks;
    tale::ScriptedNarrator narrator;
    std::string error;
    if (!store.open((dir / "engine.sqlite").string(), error) || !store.put_campaign(make_campaign("c-eng"), error)) {
      std::cerr << "engine store setup failed: " << error << "\n";
      return 1;
    }
    tale::TurnEngine engine(config, store, narrator, lore, locks);
    for (int i = 1; i <= 3; ++i) {
      narrator.push_proposal(
          "DM_TEXT: Step " + std::to_string(i) +
          ".\nDM_JSON: {\"patches\": [{\"op\": \"advance_time\", \"value\": {\"hours\": 1}}]}");
      tale::TurnRequest req;
      req.campaign_id = "c-eng";
      req.player_input = "walk";
      const auto result = engine.process_turn(req);
      if (!result.success || result.turn_index != i) {
        std::cerr << "sqlite turn " << i << " failed: " << tale::describe(result.errors) << "\n";
        ++failures;
      }
    }
    tale::VerifyReport report;
    if (!engine.states().verify_chain("c-eng", report, error) || !report.ok() || report.turns_checked != 3 ||
        report.snapshots_checked != 1) {
      std::cerr << "sqlite chain verification failed\n";
      ++failures;
    }
  }

  // Test: talectl commands against a configured store.
  {
    const fs::path store_path = dir / "cli.sqlite";
    tale::EngineConfig config;
    config.store_path = store_path;
    const fs::path campaign_file = dir / "campaign.json";
    const fs::path response_file = dir / "response.txt";
    if (!write_text(campaign_file, R"({"id": "c-cli", "character": {"abilities": {"dex": 14}, "skills": {"stealth": true}}})") ||
        !write_text(response_file,
                    "DM_TEXT: You hide.\nDM_JSON: {\"roll_requests\": [{\"id\": \"r1\", \"type\": \"ability_check\", "
                    "\"ability\": \"dex\", \"skill\": \"stealth\", \"dc\": 12}], \"patches\": [{\"op\": \"replace\", "
                    "\"path\": \"/world/location_id\", \"value\": \"alcove\"}]}")) {
      std::cerr << "could not write cli fixtures\n";
      ++failures;
    }

    std::ostringstream roll_out;
    const json roll = (roll_command("2d6", 42, roll_out) == 0) ? parse_output(roll_out) : json::object();
    if (roll.is_discarded() || roll.value("total", 0) != 7) {
      std::cerr << "talectl roll wrong\n";
      ++failures;
    }

    std::ostringstream created;
    if (campaign_new_command(config, campaign_file, created) != 0) {
      std::cerr << "talectl campaign new failed\n";
      ++failures;
    }

    TurnCommandOptions opts;
    opts.campaign_id = "c-cli";
    opts.player_input = "hide";
    opts.response_path = response_file;
    opts.seed = 42;
    std::ostringstream turn_out;
    const int turn_code = turn_command(config, opts, turn_out);
    const json turn = parse_output(turn_out);
    if (turn_code != 0 || turn.is_discarded() || turn.value("turn_index", 0) != 1 ||
        turn["roll_results"][0].value("total", 0) != 12) {
      std::cerr << "talectl turn failed: " << turn_out.str() << "\n";
      ++failures;
    }

    std::ostringstream state_out;
    const json state = (state_command(config, "c-cli", std::nullopt, state_out) == 0) ? parse_output(state_out)
                                                                                       : json::object();
    if (state.is_discarded() || state.value("turn_index", -1) != 1 ||
        state.value("state_hash", std::string()) != turn.value("state_hash", std::string("?"))) {
      std::cerr << "talectl state disagrees with the turn\n";
      ++failures;
    }

    std::ostringstream history_out;
    std::ostringstream verify_out;
    std::ostringstream rewind_out;
    const int history_code = history_command(config, "c-cli", 10, history_out);
    const int verify_code = verify_command(config, "c-cli", verify_out);
    const int rewind_code = rewind_command(config, "c-cli", 0, rewind_out);
    const json history = parse_output(history_out);
    const json rewound = parse_output(rewind_out);
    if (history_code != 0 || verify_code != 0 || rewind_code != 0 || history.is_discarded() ||
        history["turns"].size() != 1 || rewound.is_discarded() || rewound.value("turns_deleted", 0) != 1) {
      std::cerr << "talectl history/verify/rewind failed\n";
      ++failures;
    }

    // Latin-1 bytes in narrator text and player input are replaced, not fatal.
    const fs::path latin1_file = dir / "latin1.txt";
    if (!write_text(latin1_file, "DM_TEXT: The caf\xe9"
                                 " is quiet.\nDM_JSON: {}")) {
      std::cerr << "could not write latin-1 fixture\n";
      ++failures;
    }
    TurnCommandOptions latin1;
    latin1.campaign_id = "c-cli";
    latin1.player_input = "order a caf\xe9";
    latin1.response_path = latin1_file;
    latin1.seed = 7;
    std::ostringstream latin1_out;
    const int latin1_code = turn_command(config, latin1, latin1_out);
    const json latin1_turn = parse_output(latin1_out);
    if (latin1_code != 0 || latin1_turn.is_discarded() || latin1_turn.value("turn_index", 0) != 1 ||
        latin1_turn.value("narrative", std::string()) != "The caf\xEF\xBF\xBD is quiet." ||
        latin1_turn["warnings"].size() != 2) {
      std::cerr << "invalid UTF-8 turn not handled: " << latin1_out.str() << "\n";
      ++failures;
    }
    std::ostringstream latin1_history;
    const json latin1_list =
        history_command(config, "c-cli", 10, latin1_history) == 0 ? parse_output(latin1_history) : json::object();
    if (latin1_list.is_discarded() || latin1_list["turns"].size() != 1 ||
        latin1_list["turns"][0].value("input_preview", std::string()) != "order a caf\xEF\xBF\xBD") {
      std::cerr << "history after an invalid UTF-8 turn failed\n";
      ++failures;
    }

    std::ostringstream missing_out;
    if (state_command(config, "c-nowhere", std::nullopt, missing_out) == 0) {
      std::cerr << "talectl state should fail for an unknown campaign\n";
      ++failures;
    }
  }

  fs::remove_all(dir, ec);
  tale::log::shutdown();
  return failures == 0 ? 0 : 1;
}
