#include "tale/campaign_lock.h"
#include "tale/campaign_state.h"
#include "tale/config.h"
#include "tale/dice.h"
#include "tale/log.h"
#include "tale/lore.h"
#include "tale/narrator.h"
#include "tale/rewind.h"
#include "tale/state_service.h"
#include "tale/turn_engine.h"
#include "tale_data/sqlite_turn_store.h"
#include "talectl/cli_api.h"

#include <nlohmann/json.hpp>

#include <charconv>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

bool read_text(const fs::path& path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream buffer;
  buffer << in.rdbuf();
  out = buffer.str();
  return true;
}

bool parse_int64(const std::string& text, int64_t& out) {
  const char* begin = text.data();
  const char* end = begin + text.size();
  const auto res = std::from_chars(begin, end, out);
  return res.ec == std::errc() && res.ptr == end;
}

bool open_store(const tale::EngineConfig& config, tale::data::SqliteTurnStore& store) {
  std::error_code ec;
  if (config.store_path.has_parent_path()) {
    fs::create_directories(config.store_path.parent_path(), ec);
  }
  std::string error;
  if (!store.open(config.store_path.string(), error)) {
    tale::log::error(error);
    return false;
  }
  return true;
}

// Stored text from older stores may hold invalid UTF-8; print it replaced
// rather than throwing.
std::string render(const json& j) {
  return j.dump(2, ' ', false, json::error_handler_t::replace);
}

json errors_to_json(const std::vector<tale::TurnError>& errors) {
  json out = json::array();
  for (const auto& e : errors) {
    out.push_back({{"kind", tale::to_string(e.kind)}, {"code", e.code}, {"field", e.field}, {"message", e.message}});
  }
  return out;
}

} // namespace

int roll_command(const std::string& expression, std::optional<int64_t> seed, std::ostream& out) {
  tale::DiceRoller roller(seed.value_or(std::random_device{}()));
  tale::RollOutcome outcome;
  std::string error;
  if (!roller.roll_expression(expression, outcome, error)) {
    tale::log::error("roll: " + error);
    return 1;
  }
  json rolls = json::array();
  for (const auto& r : outcome.rolls) {
    rolls.push_back({{"size", r.size}, {"value", r.value}});
  }
  out << render(json{{"expression", expression},
                     {"seed", roller.seed()},
                     {"rolls", rolls},
                     {"modifier", outcome.modifier},
                     {"total", outcome.total}})
      << "\n";
  return 0;
}

int campaign_new_command(const tale::EngineConfig& config, const fs::path& campaign_file, std::ostream& out) {
  std::string text;
  if (!read_text(campaign_file, text)) {
    tale::log::error("campaign file not found: " + campaign_file.string());
    return 1;
  }
  const auto doc = json::parse(text, nullptr, false);
  if (doc.is_discarded()) {
    tale::log::error("campaign file is not valid JSON: " + campaign_file.string());
    return 1;
  }
  tale::Campaign campaign;
  std::string error;
  if (!tale::campaign_from_json(doc, campaign, error)) {
    tale::log::error("campaign: " + error);
    return 1;
  }
  tale::data::SqliteTurnStore store;
  if (!open_store(config, store)) return 1;
  if (!store.put_campaign(campaign, error)) {
    tale::log::error("campaign: " + error);
    return 1;
  }
  const auto state = tale::CampaignState::initial(campaign);
  out << render(json{{"campaign_id", campaign.id}, {"state_hash", state.compute_hash()}, {"state", state.to_json()}})
      << "\n";
  return 0;
}

int turn_command(const tale::EngineConfig& config, const TurnCommandOptions& opts, std::ostream& out) {
  tale::ScriptedNarrator narrator;
  std::string text;
  if (!read_text(opts.response_path, text)) {
    tale::log::error("response file not found: " + opts.response_path.string());
    return 1;
  }
  narrator.push_proposal(text);
  if (!opts.final_path.empty()) {
    if (!read_text(opts.final_path, text)) {
      tale::log::error("final response file not found: " + opts.final_path.string());
      return 1;
    }
    narrator.push_final(text);
  }
  for (const auto& path : opts.repair_paths) {
    if (!read_text(path, text)) {
      tale::log::error("repair response file not found: " + path.string());
      return 1;
    }
    narrator.push_repair(text);
  }

  tale::data::SqliteTurnStore store;
  if (!open_store(config, store)) return 1;
  tale::MemoryLoreLedger lore;
  tale::CampaignLockRegistry locks;
  tale::TurnEngine engine(config, store, narrator, lore, locks);

  tale::TurnRequest request;
  request.campaign_id = opts.campaign_id;
  request.player_input = opts.player_input;
  request.seed = opts.seed;
  const auto result = engine.process_turn(request);
  out << render(tale::to_json(result)) << "\n";
  return result.success ? 0 : 2;
}

int state_command(const tale::EngineConfig& config, const std::string& campaign_id, std::optional<int64_t> turn,
                  std::ostream& out) {
  tale::data::SqliteTurnStore store;
  if (!open_store(config, store)) return 1;
  tale::StateService states(store, config);
  tale::CampaignState state;
  std::string error;
  const bool ok = turn ? states.get_state_at(campaign_id, *turn, state, error)
                       : states.current_state(campaign_id, state, error);
  if (!ok) {
    tale::log::error("state: " + error);
    return 1;
  }
  out << render(json{{"campaign_id", campaign_id},
                     {"turn_index", state.turn_index()},
                     {"state_hash", state.compute_hash()},
                     {"state", state.to_json()}})
      << "\n";
  return 0;
}

int verify_command(const tale::EngineConfig& config, const std::string& campaign_id, std::ostream& out) {
  tale::data::SqliteTurnStore store;
  if (!open_store(config, store)) return 1;
  tale::StateService states(store, config);
  tale::VerifyReport report;
  std::string error;
  if (!states.verify_chain(campaign_id, report, error)) {
    tale::log::error("verify: " + error);
    return 1;
  }
  out << render(json{{"campaign_id", campaign_id},
                     {"ok", report.ok()},
                     {"turns_checked", report.turns_checked},
                     {"snapshots_checked", report.snapshots_checked},
                     {"mismatches", report.mismatches}})
      << "\n";
  return report.ok() ? 0 : 2;
}

int rewind_command(const tale::EngineConfig& config, const std::string& campaign_id, int64_t target,
                   std::ostream& out) {
  tale::data::SqliteTurnStore store;
  if (!open_store(config, store)) return 1;
  tale::StateService states(store, config);
  tale::MemoryLoreLedger lore;
  tale::CampaignLockRegistry locks;
  tale::RewindCoordinator rewinder(states, lore, locks);
  const auto result = rewinder.rewind(campaign_id, target);
  json body{{"campaign_id", campaign_id},
            {"success", result.success},
            {"target_index", result.target_index},
            {"turns_deleted", result.turns_deleted},
            {"snapshots_deleted", result.snapshots_deleted},
            {"lore_invalidated", result.lore_invalidated},
            {"errors", errors_to_json(result.errors)}};
  if (result.success) {
    body["state_hash"] = result.state.compute_hash();
  }
  out << render(body) << "\n";
  return result.success ? 0 : 2;
}

int history_command(const tale::EngineConfig& config, const std::string& campaign_id, size_t limit,
                    std::ostream& out) {
  tale::data::SqliteTurnStore store;
  if (!open_store(config, store)) return 1;
  tale::StateService states(store, config);
  tale::MemoryLoreLedger lore;
  tale::CampaignLockRegistry locks;
  tale::RewindCoordinator rewinder(states, lore, locks);
  std::vector<tale::RewindableTurn> turns;
  std::string error;
  if (!rewinder.rewindable_turns(campaign_id, limit, turns, error)) {
    tale::log::error("history: " + error);
    return 1;
  }
  json list = json::array();
  for (const auto& t : turns) {
    list.push_back(tale::to_json(t));
  }
  out << render(json{{"campaign_id", campaign_id}, {"turns", list}}) << "\n";
  return 0;
}

void print_usage() {
  std::cout << "Usage:\n"
            << "  talectl roll <expr> [--seed <n>]\n"
            << "  talectl campaign new <campaign.json> [--config <path>]\n"
            << "  talectl turn <campaign_id> --input \"<text>\" --response <file> [--final <file>] [--repair <file>]... "
               "[--seed <n>] [--config <path>]\n"
            << "  talectl state <campaign_id> [--turn <n>] [--config <path>]\n"
            << "  talectl verify <campaign_id> [--config <path>]\n"
            << "  talectl rewind <campaign_id> <turn> [--config <path>]\n"
            << "  talectl history <campaign_id> [--limit <n>] [--config <path>]\n";
}

int run_cli(int argc, char** argv) {
  if (argc < 2) {
    print_usage();
    return 1;
  }
  const std::string command = argv[1];

  fs::path config_path = "config/tale.yaml";
  std::optional<int64_t> seed;
  std::optional<int64_t> turn;
  size_t limit = 50;
  TurnCommandOptions turn_opts;
  std::vector<std::string> positional;
  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    int64_t number = 0;
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--seed" && i + 1 < argc) {
      if (!parse_int64(argv[++i], number)) {
        print_usage();
        return 1;
      }
      seed = number;
    } else if (arg == "--turn" && i + 1 < argc) {
      if (!parse_int64(argv[++i], number)) {
        print_usage();
        return 1;
      }
      turn = number;
    } else if (arg == "--limit" && i + 1 < argc) {
      if (!parse_int64(argv[++i], number) || number < 0) {
        print_usage();
        return 1;
      }
      limit = static_cast<size_t>(number);
    } else if (arg == "--input" && i + 1 < argc) {
      turn_opts.player_input = argv[++i];
    } else if (arg == "--response" && i + 1 < argc) {
      turn_opts.response_path = argv[++i];
    } else if (arg == "--final" && i + 1 < argc) {
      turn_opts.final_path = argv[++i];
    } else if (arg == "--repair" && i + 1 < argc) {
      turn_opts.repair_paths.emplace_back(argv[++i]);
    } else {
      positional.push_back(arg);
    }
  }

  if (command == "roll") {
    if (positional.size() != 1) {
      print_usage();
      return 1;
    }
    return roll_command(positional[0], seed, std::cout);
  }

  const tale::EngineConfig config = tale::load_engine_config(config_path);
  if (!tale::log::set_level(config.log_level)) {
    tale::log::warn("unknown log level: " + config.log_level);
  }
  if (!config.log_dir.empty()) {
    tale::log::shutdown();
    tale::log::init("talectl", config.log_dir);
  }

  if (command == "campaign" && positional.size() == 2 && positional[0] == "new") {
    return campaign_new_command(config, positional[1], std::cout);
  }
  if (command == "turn" && positional.size() == 1) {
    if (turn_opts.response_path.empty()) {
      print_usage();
      return 1;
    }
    turn_opts.campaign_id = positional[0];
    turn_opts.seed = seed;
    return turn_command(config, turn_opts, std::cout);
  }
  if (command == "state" && positional.size() == 1) {
    return state_command(config, positional[0], turn, std::cout);
  }
  if (command == "verify" && positional.size() == 1) {
    return verify_command(config, positional[0], std::cout);
  }
  if (command == "rewind" && positional.size() == 2) {
    int64_t target = 0;
    if (!parse_int64(positional[1], target)) {
      print_usage();
      return 1;
    }
    return rewind_command(config, positional[0], target, std::cout);
  }
  if (command == "history" && positional.size() == 1) {
    return history_command(config, positional[0], limit, std::cout);
  }

  print_usage();
  return 1;
}

#ifndef TALECTL_LIB
int main(int argc, char** argv) {
  tale::log::init();
  tale::log::install_crash_handlers();
  const int code = run_cli(argc, argv);
  tale::log::shutdown();
  return code;
}
#endif
