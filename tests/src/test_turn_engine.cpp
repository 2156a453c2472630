#include "tale/campaign_lock.h"
#include "tale/campaign_state.h"
#include "tale/config.h"
#include "tale/log.h"
#include "tale/lore.h"
#include "tale/narrator.h"
#include "tale/turn_engine.h"
#include "tale/turn_store.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

const char* kCampaignId = "c-turns";

tale::Campaign make_campaign(const std::string& id, const std::string& status = "active") {
  tale::Campaign campaign;
  std::string error;
  if (!tale::campaign_from_json({{"id", id},
                                 {"status", status},
                                 {"character",
                                  {{"name", "Ilse"},
                                   {"level", 1},
                                   {"abilities", {{"str", 12}, {"dex", 14}, {"con", 14}}},
                                   {"skills", {{"stealth", true}}}}}},
                                campaign, error)) {
    std::cerr << "campaign fixture invalid: " << error << "\n";
  }
  return campaign;
}

std::string response(const std::string& narrative, const json& payload) {
  return "DM_TEXT: " + narrative + "\nDM_JSON: " + payload.dump();
}

json stealth_roll(const char* id = "r1") {
  return {{"id", id}, {"type", "ability_check"}, {"ability", "dex"}, {"skill", "stealth"}, {"dc", 12}};
}

json replace(const std::string& path, const json& value) {
  return {{"op", "replace"}, {"path", path}, {"value", value}};
}

bool has_code(const std::vector<tale::TurnError>& errors, const std::string& code) {
  for (const auto& e : errors) {
    if (e.code == code) return true;
  }
  return false;
}

// Store, lore and locks shared by the engine under test.
struct Fixture {
  tale::EngineConfig config;
  tale::MemoryTurnStore store;
  tale::MemoryLoreLedger lore;
  tale::CampaignLockRegistry locks;
  tale::ScriptedNarrator narrator;

  Fixture() {
    std::string error;
    if (!store.put_campaign(make_campaign(kCampaignId), error)) {
      std::cerr << "fixture put_campaign failed: " << error << "\n";
    }
  }

  int64_t latest() const {
    int64_t index = -1;
    std::string error;
    if (!store.latest_index(kCampaignId, index, error)) {
      std::cerr << "latest_index failed: " << error << "\n";
    }
    return index;
  }
};

tale::TurnRequest request(const std::string& input, std::optional<int64_t> seed = 42) {
  tale::TurnRequest req;
  req.campaign_id = kCampaignId;
  req.player_input = input;
  req.seed = seed;
  return req;
}

} // namespace

int main() {
  tale::log::init();
  tale::log::set_level(tale::log::Level::Error);
  int failures = 0;

  // Test: a full turn resolves rolls, merges the final narration and persists.
  {
    Fixture f;
    f.narrator.push_proposal(response(
        "You edge toward the gate.",
        {{"roll_requests", json::array({stealth_roll()})},
         {"patches", json::array({replace("/party/player/hp/current", 15)})},
         {"lore_deltas", json::array({{{"type", "soft_lore"}, {"text", "The gate guard naps at noon."}}})}}));
    f.narrator.push_final(
        response("You slip past unseen.", {{"patches", json::array({replace("/world/location_id", "hall")})}}));
    tale::TurnEngine engine(f.config, f.store, f.narrator, f.lore, f.locks);
    const auto result = engine.process_turn(request("I sneak past the guard."));

    if (!result.success || result.phase != tale::TurnPhase::Persisted || result.turn_index != 1 ||
        result.roll_results.size() != 1) {
      std::cerr << "full turn failed: " << tale::describe(result.errors) << "\n";
      ++failures;
    } else {
      const auto& roll = result.roll_results[0];
      if (roll.total != 12 || !roll.success.value_or(false) || result.narrative != "You slip past unseen.") {
        std::cerr << "full turn roll or narrative wrong\n";
        ++failures;
      }
      const auto& doc = result.state.document();
      if (doc["party"]["player"]["hp"]["current"] != 15 || doc["world"]["location_id"] != "hall") {
        std::cerr << "full turn patches not applied\n";
        ++failures;
      }
      tale::CampaignState stored;
      std::string error;
      if (!engine.states().current_state(kCampaignId, stored, error) ||
          stored.compute_hash() != result.state_hash) {
        std::cerr << "replayed state differs from the committed hash\n";
        ++failures;
      }
      std::vector<tale::TurnEvent> events;
      if (!f.store.read_turns(kCampaignId, 1, 1, events, error) || events.size() != 1 || events[0].seed != 42 ||
          events[0].patch.size() != 2 || events[0].roll_results.size() != 1) {
        std::cerr << "turn event incomplete\n";
        ++failures;
      }
    }
    if (f.narrator.finalize_calls() != 1 || f.narrator.last_roll_summary().find("SUCCESS") == std::string::npos ||
        f.lore.entries(kCampaignId).size() != 1 || f.locks.is_locked(kCampaignId)) {
      std::cerr << "full turn side effects wrong\n";
      ++failures;
    }
    const json j = tale::to_json(result);
    if (j["phase"] != "PERSISTED" || j["turn_index"] != 1) {
      std::cerr << "turn result JSON wrong\n";
      ++failures;
    }
  }

  // Test: identical inputs and seeds give identical hashes; the default seed is derived.
  {
    std::string hashes[2];
    for (auto& hash : hashes) {
      Fixture f;
      f.narrator.push_proposal(response("Steps.", {{"roll_requests", json::array({stealth_roll()})}}));
      tale::TurnEngine engine(f.config, f.store, f.narrator, f.lore, f.locks);
      const auto result = engine.process_turn(request("walk", std::nullopt));
      if (!result.success || result.seed != tale::derive_turn_seed(kCampaignId, 1)) {
        std::cerr << "derived seed not used\n";
        ++failures;
      }
      hash = result.state_hash;
    }
    if (hashes[0].empty() || hashes[0] != hashes[1]) {
      std::cerr << "same turn produced different hashes\n";
      ++failures;
    }
    if (tale::derive_turn_seed(kCampaignId, 1) == tale::derive_turn_seed(kCampaignId, 2) ||
        tale::derive_turn_seed(kCampaignId, 1) < 0) {
      std::cerr << "derived seeds should differ per turn and be non-negative\n";
      ++failures;
    }
  }

  // Test: an unreadable payload with narrative text commits a narrative-only turn.
  {
    Fixture f;
    f.narrator.push_proposal("The wind howls.\nDM_JSON: {\"patches\": [");
    tale::TurnEngine engine(f.config, f.store, f.narrator, f.lore, f.locks);
    const auto result = engine.process_turn(request("listen"));
    if (!result.success || result.narrative != "The wind howls." || result.warnings.empty() ||
        !result.roll_results.empty() || f.narrator.finalize_calls() != 0 || f.latest() != 1) {
      std::cerr << "narrative-only fallback failed\n";
      ++failures;
    }
  }

  // Test: an unmarked payload after prose braces still applies its patches.
  {
    Fixture f;
    f.narrator.push_proposal("The innkeeper grins {wryly} and slides a key across.\n" +
                             json{{"patches", json::array({replace("/world/location_id", "inn")})}}.dump());
    tale::TurnEngine engine(f.config, f.store, f.narrator, f.lore, f.locks);
    const auto result = engine.process_turn(request("I take the key."));
    if (!result.success || !result.warnings.empty() ||
        result.state.document()["world"]["location_id"] != "inn" ||
        result.narrative != "The innkeeper grins {wryly} and slides a key across.") {
      std::cerr << "unmarked payload after prose braces was dropped\n";
      ++failures;
    }
  }

  // Test: no response, or nothing usable, fails without persisting.
  {
    Fixture f;
    tale::TurnEngine engine(f.config, f.store, f.narrator, f.lore, f.locks);
    const auto silent = engine.process_turn(request("hello?"));
    f.narrator.push_proposal("   ");
    const auto empty = engine.process_turn(request("hello?"));
    if (silent.success || !has_code(silent.errors, "narrator_no_response") ||
        silent.failed_phase != tale::TurnPhase::ContextBuilt || empty.success ||
        !has_code(empty.errors, "payload_missing") || f.latest() != 0) {
      std::cerr << "empty narrator output should fail\n";
      ++failures;
    }
  }

  // Test: invalid output is repaired; changed roll requests re-run mechanics.
  {
    Fixture f;
    f.narrator.push_proposal(response("Strength flows in.",
                                      {{"roll_requests", json::array({stealth_roll()})},
                                       {"patches", json::array({replace("/party/player/abilities/str", 20)})}}));
    f.narrator.push_repair(
        response("You steady yourself.",
                 {{"roll_requests",
                   json::array({stealth_roll(), {{"id", "r2"}, {"type", "damage_roll"}, {"dice", "1d4-10"}}})},
                  {"patches", json::array({replace("/party/player/hp/current", 16)})}}));
    tale::TurnEngine engine(f.config, f.store, f.narrator, f.lore, f.locks);
    const auto result = engine.process_turn(request("drink the potion"));
    if (!result.success || f.narrator.repair_calls() != 1 || result.roll_results.size() != 2 ||
        result.roll_results[0].total != 12 || result.roll_results[1].total != 1 ||
        result.narrative != "You steady yourself.") {
      std::cerr << "repair path failed: " << tale::describe(result.errors) << "\n";
      ++failures;
    }
  }

  // Test: output that stays invalid fails after the configured attempts.
  {
    Fixture f;
    const std::string bad = response("Wings sprout.", {{"patches", json::array({replace("/party/player/level", 9)})}});
    f.narrator.push_proposal(bad);
    f.narrator.push_repair(bad);
    f.narrator.push_repair(bad);
    f.narrator.push_repair(bad);
    tale::TurnEngine engine(f.config, f.store, f.narrator, f.lore, f.locks);
    const auto result = engine.process_turn(request("fly"));
    if (result.success || result.phase != tale::TurnPhase::Failed ||
        result.failed_phase != tale::TurnPhase::FinalResponse || !has_code(result.errors, "path_not_allowed") ||
        f.narrator.repair_calls() != 2 || f.latest() != 0 || f.locks.is_locked(kCampaignId)) {
      std::cerr << "unrepairable output should fail\n";
      ++failures;
    }
  }

  // Test: a valid patch that does not fit the state fails the turn.
  {
    Fixture f;
    f.narrator.push_proposal(response(
        "You shake it off.",
        {{"patches", json::array({{{"op", "remove"}, {"path", "/party/player/conditions/3"}}})}}));
    tale::TurnEngine engine(f.config, f.store, f.narrator, f.lore, f.locks);
    const auto result = engine.process_turn(request("shake"));
    if (result.success || !has_code(result.errors, "patch_not_applicable") || f.latest() != 0) {
      std::cerr << "inapplicable patch should fail\n";
      ++failures;
    }
  }

  // Test: a second turn for a locked campaign is rejected while the first is in flight.
  {
    Fixture f;
    f.narrator.push_proposal(response("First.", json::object()));
    tale::TurnEngine engine(f.config, f.store, f.narrator, f.lore, f.locks);
    auto run = engine.start(request("first"));
    if (!run.step() || run.phase() != tale::TurnPhase::ContextBuilt || !f.locks.is_locked(kCampaignId)) {
      std::cerr << "first run did not take the lock\n";
      ++failures;
    }
    const auto second = engine.process_turn(request("second"));
    if (second.success || !has_code(second.errors, "campaign_busy")) {
      std::cerr << "concurrent turn was not rejected\n";
      ++failures;
    }
    const auto& first = run.run();
    if (!first.success || first.turn_index != 1 || f.locks.is_locked(kCampaignId) || run.step()) {
      std::cerr << "first run did not complete\n";
      ++failures;
    }
  }

  // Test: a failed write leaves no turn and the next turn reuses the index.
  {
    Fixture f;
    f.narrator.push_proposal(
        response("Lost.", {{"lore_deltas", json::array({{{"type", "soft_lore"}, {"text", "Ink fades."}}})}}));
    f.narrator.push_proposal(response("Found.", json::object()));
    tale::TurnEngine engine(f.config, f.store, f.narrator, f.lore, f.locks);
    f.store.fail_next_append();
    const auto failed = engine.process_turn(request("write"));
    const auto retry = engine.process_turn(request("write again"));
    if (failed.success || !has_code(failed.errors, "store_write_failed") ||
        failed.failed_phase != tale::TurnPhase::Validated || !f.lore.entries(kCampaignId).empty() ||
        !retry.success || retry.turn_index != 1) {
      std::cerr << "persistence failure handling wrong\n";
      ++failures;
    }
  }

  // Test: paused and ended campaigns accept no turns.
  {
    Fixture f;
    std::string error;
    if (!f.store.put_campaign(make_campaign("c-paused", "paused"), error)) {
      std::cerr << "put_campaign failed: " << error << "\n";
      ++failures;
    }
    f.narrator.push_proposal(response("Nothing.", json::object()));
    tale::TurnEngine engine(f.config, f.store, f.narrator, f.lore, f.locks);
    tale::TurnRequest req = request("wake up");
    req.campaign_id = "c-paused";
    const auto result = engine.process_turn(req);
    req.campaign_id = "c-nowhere";
    const auto missing = engine.process_turn(req);
    if (result.success || !has_code(result.errors, "campaign_not_active") || missing.success ||
        !has_code(missing.errors, "unknown_campaign")) {
      std::cerr << "inactive campaign accepted a turn\n";
      ++failures;
    }
  }

  // Test: the narrator sees at most the configured number of recent turns.
  {
    Fixture f;
    f.config.recent_turn_window = 2;
    tale::TurnEngine engine(f.config, f.store, f.narrator, f.lore, f.locks);
    for (int i = 0; i < 4; ++i) {
      f.narrator.push_proposal(response("Turn " + std::to_string(i + 1) + ".", json::object()));
      const auto result = engine.process_turn(request("go"));
      if (!result.success) {
        std::cerr << "window turn " << i + 1 << " failed\n";
        ++failures;
      }
    }
    if (f.narrator.last_context_turns() != 2 || f.latest() != 4) {
      std::cerr << "recent turn window not applied\n";
      ++failures;
    }
  }

  // Test: phase transitions.
  {
    using tale::TurnPhase;
    if (!tale::is_legal_transition(TurnPhase::Initialized, TurnPhase::ContextBuilt) ||
        tale::is_legal_transition(TurnPhase::Initialized, TurnPhase::MechanicsExecuted) ||
        !tale::is_legal_transition(TurnPhase::Validated, TurnPhase::Failed) ||
        tale::is_legal_transition(TurnPhase::Persisted, TurnPhase::Failed) ||
        tale::is_legal_transition(TurnPhase::Failed, TurnPhase::Initialized) ||
        std::string(tale::to_string(TurnPhase::MechanicsExecuted)) != "MECHANICS_EXECUTED") {
      std::cerr << "phase transition table wrong\n";
      ++failures;
    }
  }

  tale::log::shutdown();
  return failures == 0 ? 0 : 1;
}
