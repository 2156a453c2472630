#include "tale/campaign_lock.h"
#include "tale/campaign_state.h"
#include "tale/config.h"
#include "tale/log.h"
#include "tale/lore.h"
#include "tale/payload.h"
#include "tale/rewind.h"
#include "tale/state_service.h"
#include "tale/turn_store.h"
#include "tale/universe_time.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

tale::Campaign make_campaign(const std::string& id) {
  tale::Campaign campaign;
  std::string error;
  const bool ok = tale::campaign_from_json(
      {{"id", id},
       {"title", "The Sunken Road"},
       {"start_time", {{"year", 1203}, {"month", 3}, {"day", 14}, {"hour", 8}}},
       {"character",
        {{"name", "Ilse"}, {"level", 1}, {"abilities", {{"str", 12}, {"dex", 14}, {"con", 14}}}}},
       {"world", {{"location_id", "crossroads"}}}},
      campaign, error);
  if (!ok) std::cerr << "campaign fixture invalid: " << error << "\n";
  return campaign;
}

// Applies `patch` on top of the current state and commits it as the next turn.
bool commit(tale::TurnStore& store, tale::StateService& states, const std::string& id, const json& patch,
            const std::string& input, std::string& error) {
  tale::CampaignState state;
  if (!states.current_state(id, state, error)) return false;
  std::vector<tale::TurnError> decode_errors;
  const auto ops = tale::decode_patches(patch, decode_errors);
  if (!decode_errors.empty()) {
    error = tale::describe(decode_errors);
    return false;
  }
  if (!state.apply_patch(ops, error)) return false;
  state.set_turn_index(state.turn_index() + 1);

  tale::TurnEvent event;
  event.campaign_id = id;
  event.turn_index = state.turn_index();
  event.player_input = input;
  event.narrative = "narrative for " + input;
  event.patch = patch;
  event.state_hash = state.compute_hash();
  event.universe_time = state.universe_time();
  event.created_at = tale::utc_timestamp();
  event.seed = event.turn_index;
  if (!store.append_turn(event, error)) return false;
  bool written = false;
  return states.save_snapshot(state, false, written, error);
}

json hp_patch(int hp) {
  return json::array({{{"op", "replace"}, {"path", "/party/player/hp/current"}, {"value", hp}},
                      {{"op", "advance_time"}, {"value", {{"minutes", 10}}}}});
}

bool has_code(const std::vector<tale::TurnError>& errors, const std::string& code) {
  for (const auto& e : errors) {
    if (e.code == code) return true;
  }
  return false;
}

} // namespace

int main() {
  tale::log::init();
  tale::log::set_level(tale::log::Level::Error);
  int failures = 0;

  // Test: initial state is derived from the campaign.
  {
    const auto state = tale::CampaignState::initial(make_campaign("c-init"));
    const auto& doc = state.document();
    if (doc["party"]["player"]["hp"]["current"] != 17 || doc["party"]["player"]["hp"]["max"] != 17 ||
        doc["world"]["location_id"] != "crossroads" || !doc["world"]["npcs"].is_object() ||
        doc["rules_context"]["srd_version"] != "5.2" || doc["universe_time"]["year"] != 1203) {
      std::cerr << "initial state wrong: " << doc.dump() << "\n";
      ++failures;
    }
    if (state.turn_index() != 0 || state.character().modifier(tale::Ability::Dex) != 2) {
      std::cerr << "initial state accessors wrong\n";
      ++failures;
    }
  }

  // Test: hashes are stable and cover the turn index.
  {
    auto a = tale::CampaignState::initial(make_campaign("c-hash"));
    const auto b = tale::CampaignState::initial(make_campaign("c-hash"));
    if (a.compute_hash() != b.compute_hash() || a.compute_hash().size() != 64) {
      std::cerr << "identical states hash differently\n";
      ++failures;
    }
    a.set_turn_index(1);
    if (a.compute_hash() == b.compute_hash()) {
      std::cerr << "turn index not covered by the hash\n";
      ++failures;
    }
    tale::CampaignState round;
    std::string error;
    if (!tale::CampaignState::from_json(a.to_json(), round, error) || round.compute_hash() != a.compute_hash()) {
      std::cerr << "state JSON round trip changed the hash: " << error << "\n";
      ++failures;
    }
  }

  // Test: patches apply all-or-nothing.
  {
    auto state = tale::CampaignState::initial(make_campaign("c-patch"));
    const std::string before = state.compute_hash();
    std::vector<tale::TurnError> decode_errors;
    const auto bad = tale::decode_patches(
        json::array({{{"op", "replace"}, {"path", "/party/player/hp/current"}, {"value", 3}},
                     {{"op", "remove"}, {"path", "/party/player/conditions/4"}}}),
        decode_errors);
    std::string error;
    if (state.apply_patch(bad, error) || state.compute_hash() != before ||
        state.document()["party"]["player"]["hp"]["current"] != 17) {
      std::cerr << "failed patch left partial changes\n";
      ++failures;
    }

    const auto good = tale::decode_patches(
        json::array({{{"op", "add"}, {"path", "/party/player/conditions/-"}, {"value", "prone"}},
                     {{"op", "add"}, {"path", "/party/player/conditions/0"}, {"value", "blinded"}},
                     {{"op", "remove"}, {"path", "/party/player/conditions/1"}},
                     {{"op", "replace"}, {"path", "/world/npcs/mira/status"}, {"value", "alive"}},
                     {{"op", "advance_time"}, {"value", {{"hours", 20}}}}}),
        decode_errors);
    if (!decode_errors.empty() || !state.apply_patch(good, error)) {
      std::cerr << "valid patch rejected: " << error << "\n";
      ++failures;
    } else {
      const auto& doc = state.document();
      const auto now = state.universe_time();
      if (doc["party"]["player"]["conditions"] != json::array({"blinded"}) ||
          doc["world"]["npcs"]["mira"]["status"] != "alive" || now.day != 15 || now.hour != 4) {
        std::cerr << "patch results wrong: " << doc.dump() << "\n";
        ++failures;
      }
    }
  }

  // Test: universe times respect month lengths and the year bound.
  {
    tale::UniverseTime when;
    std::string error;
    const bool short_month = tale::universe_time_from_json({{"year", 1203}, {"month", 1}, {"day", 31}}, when, error);
    const bool long_month = tale::universe_time_from_json({{"year", 1203}, {"month", 3}, {"day", 31}}, when, error);
    const bool far_future = tale::universe_time_from_json({{"year", 2000000}}, when, error);
    if (short_month || !long_month || far_future) {
      std::cerr << "universe time bounds wrong\n";
      ++failures;
    }

    auto state = tale::CampaignState::initial(make_campaign("c-time"));
    const std::string before = state.compute_hash();
    std::vector<tale::TurnError> decode_errors;
    const auto huge = tale::decode_patches(
        json::array({{{"op", "advance_time"}, {"value", {{"years", 2000000}, {"minutes", 9000000000000000000LL}}}}}),
        decode_errors);
    if (!decode_errors.empty() || state.apply_patch(huge, error) || state.compute_hash() != before) {
      std::cerr << "oversized advance_time should be rejected\n";
      ++failures;
    }
  }

  // Test: replay from snapshots matches a full replay, and tampered snapshots are ignored.
  {
    tale::EngineConfig config;
    config.snapshot_interval = 3;
    tale::MemoryTurnStore store;
    tale::StateService states(store, config);
    const auto campaign = make_campaign("c-replay");
    std::string error;
    if (!store.put_campaign(campaign, error)) {
      std::cerr << "put_campaign failed: " << error << "\n";
      ++failures;
    }
    for (int i = 1; i <= 7; ++i) {
      if (!commit(store, states, campaign.id, hp_patch(17 - i), "turn " + std::to_string(i), error)) {
        std::cerr << "commit " << i << " failed: " << error << "\n";
        ++failures;
        break;
      }
    }
    if (store.snapshot_count(campaign.id) != 2) {
      std::cerr << "expected snapshots at turns 3 and 6\n";
      ++failures;
    }

    const auto fast = states.replay_to(campaign, 5);
    const auto slow = states.replay_to(campaign, 5, false);
    if (!fast.success || !slow.success || !fast.from_snapshot || fast.snapshot_index != 3 ||
        fast.turns_replayed != 2 || slow.turns_replayed != 5 ||
        fast.state.compute_hash() != slow.state.compute_hash() ||
        fast.state.document()["party"]["player"]["hp"]["current"] != 12) {
      std::cerr << "snapshot replay differs from full replay\n";
      ++failures;
    }

    tale::Snapshot tampered{campaign.id, 6, fast.state.to_json(), "bogus"};
    if (!store.put_snapshot(tampered, error)) {
      std::cerr << "put_snapshot failed: " << error << "\n";
      ++failures;
    }
    const auto after = states.replay_to(campaign, 7);
    if (!after.success || after.from_snapshot || after.state.turn_index() != 7) {
      std::cerr << "tampered snapshot was trusted\n";
      ++failures;
    }

    tale::VerifyReport report;
    if (!states.verify_chain(campaign.id, report, error) || report.ok() || report.turns_checked != 7 ||
        report.snapshots_checked != 2) {
      std::cerr << "verify_chain should flag the tampered snapshot\n";
      ++failures;
    }

    const auto beyond = states.replay_to(campaign, 8);
    if (beyond.success || beyond.errors.empty()) {
      std::cerr << "replay beyond the log should fail\n";
      ++failures;
    }

    bool matches = false;
    if (!states.verify_state_hash(campaign.id, 5, slow.state.compute_hash(), matches, error) || !matches) {
      std::cerr << "verify_state_hash mismatch\n";
      ++failures;
    }

    tale::TurnEvent gap;
    gap.campaign_id = campaign.id;
    gap.turn_index = 9;
    if (store.append_turn(gap, error)) {
      std::cerr << "non-contiguous append accepted\n";
      ++failures;
    }
  }

  // Test: rewind truncates, invalidates lore, and the next turn follows the target.
  {
    tale::EngineConfig config;
    config.snapshot_interval = 3;
    tale::MemoryTurnStore store;
    tale::StateService states(store, config);
    tale::MemoryLoreLedger lore;
    tale::CampaignLockRegistry locks;
    tale::RewindCoordinator rewinder(states, lore, locks);
    const auto campaign = make_campaign("c-rewind");
    std::string error;
    if (!store.put_campaign(campaign, error)) {
      std::cerr << "put_campaign failed: " << error << "\n";
      ++failures;
    }
    const std::string long_input(150, 'x');
    for (int i = 1; i <= 7; ++i) {
      const std::string input = i == 7 ? long_input : "turn " + std::to_string(i);
      if (!commit(store, states, campaign.id, hp_patch(17 - i), input, error) ||
          !lore.record(campaign.id, i, {tale::LoreDelta{"soft_lore", "fact " + std::to_string(i), {}, {}}},
                       error)) {
        std::cerr << "setup turn " << i << " failed: " << error << "\n";
        ++failures;
        break;
      }
    }

    std::vector<tale::RewindableTurn> turns;
    if (!rewinder.rewindable_turns(campaign.id, 2, turns, error) || turns.size() != 2 || turns[0].turn_index != 7 ||
        turns[1].turn_index != 6 || turns[0].input_preview.size() != tale::RewindCoordinator::kPreviewLength) {
      std::cerr << "rewindable_turns wrong\n";
      ++failures;
    }

    tale::CampaignState at_four;
    if (!states.get_state_at(campaign.id, 4, at_four, error)) {
      std::cerr << "state at 4 unavailable: " << error << "\n";
      ++failures;
    }

    {
      auto held = locks.try_acquire(campaign.id);
      const auto busy = rewinder.rewind(campaign.id, 4);
      if (!held || busy.success || !has_code(busy.errors, "campaign_busy")) {
        std::cerr << "rewind ignored the campaign lock\n";
        ++failures;
      }
    }
    if (locks.is_locked(campaign.id)) {
      std::cerr << "lock not released by the guard\n";
      ++failures;
    }

    const auto future = rewinder.rewind(campaign.id, 9);
    const auto negative = rewinder.rewind(campaign.id, -1);
    const auto missing = rewinder.rewind("c-missing", 0);
    if (future.success || !has_code(future.errors, "invalid_target") || negative.success ||
        !has_code(negative.errors, "invalid_target") || missing.success ||
        !has_code(missing.errors, "unknown_campaign")) {
      std::cerr << "bad rewind targets accepted\n";
      ++failures;
    }

    const auto result = rewinder.rewind(campaign.id, 4);
    int64_t latest = 0;
    if (!result.success || result.turns_deleted != 3 || result.snapshots_deleted != 1 ||
        result.lore_invalidated != 3 || result.state.compute_hash() != at_four.compute_hash() ||
        !store.latest_index(campaign.id, latest, error) || latest != 4) {
      std::cerr << "rewind to 4 wrong\n";
      ++failures;
    }
    if (lore.entries(campaign.id).size() != 4 || lore.entries(campaign.id, true).size() != 7) {
      std::cerr << "lore invalidation wrong\n";
      ++failures;
    }

    if (!commit(store, states, campaign.id, hp_patch(1), "after rewind", error) ||
        !store.latest_index(campaign.id, latest, error) || latest != 5) {
      std::cerr << "turn after rewind should get index 5: " << error << "\n";
      ++failures;
    }
    tale::VerifyReport report;
    if (!states.verify_chain(campaign.id, report, error) || !report.ok() || report.turns_checked != 5) {
      std::cerr << "chain broken after rewind\n";
      ++failures;
    }

    auto ended = campaign;
    ended.id = "c-ended";
    ended.status = tale::CampaignStatus::Ended;
    if (!store.put_campaign(ended, error)) {
      std::cerr << "put_campaign failed: " << error << "\n";
      ++failures;
    }
    const auto closed = rewinder.rewind(ended.id, 0);
    if (closed.success || !has_code(closed.errors, "campaign_ended")) {
      std::cerr << "ended campaign was rewound\n";
      ++failures;
    }
  }

  // Test: a failed truncation leaves turns, snapshots and lore intact; the retry
  // succeeds and a new timeline reuses the freed indices.
  {
    tale::EngineConfig config;
    config.snapshot_interval = 2;
    tale::MemoryTurnStore store;
    tale::StateService states(store, config);
    tale::MemoryLoreLedger lore;
    tale::CampaignLockRegistry locks;
    tale::RewindCoordinator rewinder(states, lore, locks);
    const auto campaign = make_campaign("c-partial");
    std::string error;
    bool ready = store.put_campaign(campaign, error);
    for (int i = 1; ready && i <= 4; ++i) {
      ready = commit(store, states, campaign.id, hp_patch(17 - i), "turn " + std::to_string(i), error) &&
              lore.record(campaign.id, i, {tale::LoreDelta{"soft_lore", "fact", {}, {}}}, error);
    }
    if (!ready || store.snapshot_count(campaign.id) != 2) {
      std::cerr << "partial rewind setup failed: " << error << "\n";
      ++failures;
    }

    store.fail_next_truncate();
    const auto failed = rewinder.rewind(campaign.id, 1);
    int64_t latest = 0;
    tale::VerifyReport report;
    if (failed.success || !has_code(failed.errors, "store_write_failed") ||
        !store.latest_index(campaign.id, latest, error) || latest != 4 || store.snapshot_count(campaign.id) != 2 ||
        lore.entries(campaign.id).size() != 4 || !states.verify_chain(campaign.id, report, error) || !report.ok()) {
      std::cerr << "failed rewind changed the store\n";
      ++failures;
    }

    const auto retried = rewinder.rewind(campaign.id, 1);
    if (!retried.success || retried.turns_deleted != 3 || retried.snapshots_deleted != 2 ||
        store.snapshot_count(campaign.id) != 0) {
      std::cerr << "rewind retry wrong\n";
      ++failures;
    }

    tale::CampaignState replayed;
    std::vector<tale::TurnEvent> events;
    if (!commit(store, states, campaign.id, hp_patch(3), "new timeline", error) ||
        !states.get_state_at(campaign.id, 2, replayed, error) ||
        !store.read_turns(campaign.id, 2, 2, events, error) || events.size() != 1 ||
        replayed.compute_hash() != events[0].state_hash ||
        replayed.document()["party"]["player"]["hp"]["current"] != 3 || store.snapshot_count(campaign.id) != 1 ||
        !states.verify_chain(campaign.id, report, error) || !report.ok() || report.snapshots_checked != 1) {
      std::cerr << "new timeline after rewind inconsistent: " << error << "\n";
      ++failures;
    }
  }

  // Test: campaign locks are exclusive and released on destruction.
  {
    tale::CampaignLockRegistry locks;
    auto first = locks.try_acquire("c-lock");
    auto second = locks.try_acquire("c-lock");
    auto other = locks.try_acquire("c-other");
    if (!first || second || !other) {
      std::cerr << "lock exclusivity wrong\n";
      ++failures;
    }
    first.reset();
    if (!locks.try_acquire("c-lock")) {
      std::cerr << "lock not reacquirable after release\n";
      ++failures;
    }
  }

  tale::log::shutdown();
  return failures == 0 ? 0 : 1;
}
