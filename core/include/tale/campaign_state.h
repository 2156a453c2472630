#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "tale/checks.h"
#include "tale/payload.h"
#include "tale/universe_time.h"

namespace tale {

enum class CampaignStatus { Active, Paused, Ended };

const char* to_string(CampaignStatus status);
bool parse_campaign_status(std::string_view text, CampaignStatus& out);

// Read-only to the engine.
struct Campaign {
  std::string id;
  std::string title;
  std::string failure_style = "fail_forward";  // fail_forward | strict_raw
  std::string content_rating = "PG13";         // G | PG | PG13 | R | NC17
  UniverseTime start_time;
  CampaignStatus status = CampaignStatus::Active;
  nlohmann::json character = nlohmann::json::object();     // initial character sheet
  nlohmann::json world = nlohmann::json::object();         // optional world seed
  nlohmann::json rules_profile = nlohmann::json::object();  // merged into rules_context
};

bool campaign_from_json(const nlohmann::json& j, Campaign& out, std::string& error);
nlohmann::json to_json(const Campaign& campaign);

// Lowercase hex SHA-256 of `data`.
std::string sha256_hex(std::string_view data);

// Full state document of a campaign at one turn index:
//   party.player, world, universe_time, rules_context
// plus campaign_id and turn_index, all of which feed the hash.
class CampaignState {
 public:
  CampaignState() = default;
  CampaignState(std::string campaign_id, int64_t turn_index, nlohmann::json document);

  static CampaignState initial(const Campaign& campaign);
  static bool from_json(const nlohmann::json& j, CampaignState& out, std::string& error);

  const std::string& campaign_id() const { return campaign_id_; }
  int64_t turn_index() const { return turn_index_; }
  void set_turn_index(int64_t index) { turn_index_ = index; }

  const nlohmann::json& document() const { return document_; }
  const nlohmann::json& player() const;
  CharacterStats character() const;
  UniverseTime universe_time() const;

  nlohmann::json to_json() const;
  // Compact, key-sorted serialization used for hashing.
  std::string canonical_json() const;
  std::string compute_hash() const;

  // All-or-nothing: ops are applied to a copy which replaces the document
  // only when every op succeeds.
  bool apply_patch(const std::vector<PatchOp>& patch, std::string& error);

 private:
  std::string campaign_id_;
  int64_t turn_index_ = 0;
  nlohmann::json document_ = nlohmann::json::object();
};

} // namespace tale
