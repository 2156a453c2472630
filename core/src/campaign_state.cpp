#include "tale/campaign_state.h"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <memory>
#include <variant>

namespace tale {

namespace {
// RFC 6901 reference tokens.
bool split_pointer(const std::string& path, std::vector<std::string>& tokens, std::string& error) {
  tokens.clear();
  if (path.empty() || path.front() != '/') {
    error = "path must start with '/': " + path;
    return false;
  }
  std::string token;
  for (size_t i = 1; i <= path.size(); ++i) {
    if (i == path.size() || path[i] == '/') {
      tokens.push_back(token);
      token.clear();
      continue;
    }
    if (path[i] == '~') {
      if (i + 1 < path.size() && (path[i + 1] == '0' || path[i + 1] == '1')) {
        token += path[i + 1] == '0' ? '~' : '/';
        ++i;
        continue;
      }
      error = "invalid escape in path: " + path;
      return false;
    }
    token += path[i];
  }
  return true;
}

bool parse_index(const std::string& token, size_t& out) {
  if (token.empty() || token.size() > 9) return false;
  if (token.size() > 1 && token.front() == '0') return false;
  for (const char c : token) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  out = static_cast<size_t>(std::stoul(token));
  return true;
}

// Walks to the container holding the final token; missing object members are
// created when `create` is set.
nlohmann::json* walk_parent(nlohmann::json& doc, const std::vector<std::string>& tokens, bool create,
                            std::string& error) {
  nlohmann::json* cur = &doc;
  for (size_t i = 0; i + 1 < tokens.size(); ++i) {
    const std::string& token = tokens[i];
    if (cur->is_null() && create) {
      *cur = nlohmann::json::object();
    }
    if (cur->is_object()) {
      if (!cur->contains(token)) {
        if (!create) {
          error = "missing member '" + token + "'";
          return nullptr;
        }
        (*cur)[token] = nlohmann::json::object();
      }
      cur = &(*cur)[token];
    } else if (cur->is_array()) {
      size_t idx = 0;
      if (!parse_index(token, idx) || idx >= cur->size()) {
        error = "index '" + token + "' out of range";
        return nullptr;
      }
      cur = &(*cur)[idx];
    } else {
      error = "cannot descend into '" + token + "'";
      return nullptr;
    }
  }
  if (cur->is_null() && create) {
    *cur = nlohmann::json::object();
  }
  return cur;
}

class PatchApplier {
 public:
  PatchApplier(nlohmann::json& doc, std::string& error) : doc_(doc), error_(error) {}

  bool operator()(const ReplaceOp& op) const {
    std::vector<std::string> tokens;
    if (!split_pointer(op.path, tokens, error_)) return false;
    nlohmann::json* parent = walk_parent(doc_, tokens, true, error_);
    if (parent == nullptr) return fail(op.path);
    const std::string& last = tokens.back();
    if (parent->is_array()) {
      size_t idx = 0;
      if (!parse_index(last, idx) || idx >= parent->size()) {
        error_ = "index '" + last + "' out of range";
        return fail(op.path);
      }
      (*parent)[idx] = op.value;
      return true;
    }
    if (!parent->is_object()) {
      error_ = "target parent is not a container";
      return fail(op.path);
    }
    (*parent)[last] = op.value;
    return true;
  }

  bool operator()(const AddOp& op) const {
    std::vector<std::string> tokens;
    if (!split_pointer(op.path, tokens, error_)) return false;
    nlohmann::json* parent = walk_parent(doc_, tokens, true, error_);
    if (parent == nullptr) return fail(op.path);
    const std::string& last = tokens.back();
    if (parent->is_array()) {
      if (last == "-") {
        parent->push_back(op.value);
        return true;
      }
      size_t idx = 0;
      if (!parse_index(last, idx) || idx > parent->size()) {
        error_ = "index '" + last + "' out of range";
        return fail(op.path);
      }
      parent->insert(parent->begin() + static_cast<std::ptrdiff_t>(idx), op.value);
      return true;
    }
    if (!parent->is_object()) {
      error_ = "target parent is not a container";
      return fail(op.path);
    }
    (*parent)[last] = op.value;
    return true;
  }

  bool operator()(const RemoveOp& op) const {
    std::vector<std::string> tokens;
    if (!split_pointer(op.path, tokens, error_)) return false;
    nlohmann::json* parent = walk_parent(doc_, tokens, false, error_);
    if (parent == nullptr) return fail(op.path);
    const std::string& last = tokens.back();
    if (parent->is_array()) {
      size_t idx = 0;
      if (!parse_index(last, idx) || idx >= parent->size()) {
        error_ = "index '" + last + "' out of range";
        return fail(op.path);
      }
      parent->erase(idx);
      return true;
    }
    if (!parent->is_object() || parent->erase(last) == 0) {
      error_ = "nothing to remove";
      return fail(op.path);
    }
    return true;
  }

  bool operator()(const AdvanceTimeOp& op) const {
    TimeDelta delta;
    if (!time_delta_from_json(op.delta, delta, error_)) return fail("advance_time");
    UniverseTime now;
    const nlohmann::json current = doc_.contains("universe_time") ? doc_["universe_time"] : nlohmann::json();
    if (!universe_time_from_json(current, now, error_)) return fail("/universe_time");
    const TimeCheck bounds = validate_time_delta(delta, Calendar::standard(), static_cast<int>(kMaxUniverseYear));
    if (!bounds.ok()) {
      error_ = bounds.errors.front();
      return fail("advance_time");
    }
    const UniverseTime later = advance(now, delta, Calendar::standard());
    if (later.year > kMaxUniverseYear) {
      error_ = "universe time passes year " + std::to_string(kMaxUniverseYear);
      return fail("advance_time");
    }
    doc_["universe_time"] = to_json(later);
    return true;
  }

  bool operator()(const UnknownOp& op) const {
    error_ = "unknown patch operation '" + op.op + "'";
    return false;
  }

 private:
  bool fail(const std::string& where) const {
    error_ = where + ": " + error_;
    return false;
  }

  nlohmann::json& doc_;
  std::string& error_;
};

nlohmann::json object_or_empty(const nlohmann::json& j, const char* key) {
  if (j.contains(key) && j[key].is_object()) return j[key];
  return nlohmann::json::object();
}

nlohmann::json array_or_empty(const nlohmann::json& j, const char* key) {
  if (j.contains(key) && j[key].is_array()) return j[key];
  return nlohmann::json::array();
}

nlohmann::json build_player(const nlohmann::json& sheet) {
  const CharacterStats stats = CharacterStats::from_json(sheet);
  // Average-HP rule; never below 1.
  const int hp = std::max(1, 10 + stats.level * (5 + stats.modifier(Ability::Con)));

  nlohmann::json abilities = object_or_empty(sheet, "ability_scores");
  if (abilities.empty()) abilities = object_or_empty(sheet, "abilities");

  nlohmann::json player = {
      {"name", sheet.value("name", std::string("Adventurer"))},
      {"level", stats.level},
      {"class", sheet.value("class", std::string())},
      {"ability_scores", abilities},
      {"skills", object_or_empty(sheet, "skills")},
      {"save_proficiencies", array_or_empty(sheet, "save_proficiencies")},
      {"hp", {{"current", hp}, {"max", hp}, {"temp", 0}}},
      {"conditions", nlohmann::json::array()},
      {"inventory", array_or_empty(sheet, "inventory")},
      {"money", object_or_empty(sheet, "money")},
      {"resources", object_or_empty(sheet, "resources")},
      {"features", array_or_empty(sheet, "features")},
  };
  for (const char* key : {"species", "background", "subclass"}) {
    if (sheet.contains(key) && sheet[key].is_string()) player[key] = sheet[key];
  }
  return player;
}
} // namespace

const char* to_string(CampaignStatus status) {
  switch (status) {
    case CampaignStatus::Active:
      return "active";
    case CampaignStatus::Paused:
      return "paused";
    case CampaignStatus::Ended:
      return "ended";
  }
  return "active";
}

bool parse_campaign_status(std::string_view text, CampaignStatus& out) {
  for (const auto status : {CampaignStatus::Active, CampaignStatus::Paused, CampaignStatus::Ended}) {
    if (text == to_string(status)) {
      out = status;
      return true;
    }
  }
  return false;
}

bool campaign_from_json(const nlohmann::json& j, Campaign& out, std::string& error) {
  if (!j.is_object()) {
    error = "campaign must be a JSON object";
    return false;
  }
  Campaign c;
  if (!j.contains("id") || !j["id"].is_string() || j["id"].get<std::string>().empty()) {
    error = "campaign.id must be a non-empty string";
    return false;
  }
  c.id = j["id"].get<std::string>();
  c.title = j.value("title", c.id);
  c.failure_style = j.value("failure_style", c.failure_style);
  if (c.failure_style != "fail_forward" && c.failure_style != "strict_raw") {
    error = "campaign.failure_style must be fail_forward or strict_raw";
    return false;
  }
  c.content_rating = j.value("content_rating", c.content_rating);
  static const char* kRatings[] = {"G", "PG", "PG13", "R", "NC17"};
  if (std::find_if(std::begin(kRatings), std::end(kRatings),
                   [&c](const char* r) { return c.content_rating == r; }) == std::end(kRatings)) {
    error = "campaign.content_rating must be one of G, PG, PG13, R, NC17";
    return false;
  }
  const std::string status = j.value("status", std::string("active"));
  if (!parse_campaign_status(status, c.status)) {
    error = "campaign.status must be active, paused or ended";
    return false;
  }
  std::string time_error;
  const nlohmann::json start = j.contains("start_time") ? j["start_time"] : nlohmann::json();
  if (!universe_time_from_json(start, c.start_time, time_error)) {
    error = "campaign.start_time: " + time_error;
    return false;
  }
  c.character = object_or_empty(j, "character");
  c.world = object_or_empty(j, "world");
  c.rules_profile = object_or_empty(j, "rules_profile");
  out = std::move(c);
  return true;
}

nlohmann::json to_json(const Campaign& campaign) {
  return nlohmann::json{{"id", campaign.id},
                        {"title", campaign.title},
                        {"failure_style", campaign.failure_style},
                        {"content_rating", campaign.content_rating},
                        {"start_time", to_json(campaign.start_time)},
                        {"status", to_string(campaign.status)},
                        {"character", campaign.character},
                        {"world", campaign.world},
                        {"rules_profile", campaign.rules_profile}};
}

std::string sha256_hex(std::string_view data) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &length) != 1) {
    return {};
  }
  static const char* kHex = "0123456789abcdef";
  std::string out;
  out.reserve(length * 2);
  for (unsigned int i = 0; i < length; ++i) {
    out += kHex[digest[i] >> 4];
    out += kHex[digest[i] & 0x0f];
  }
  return out;
}

CampaignState::CampaignState(std::string campaign_id, int64_t turn_index, nlohmann::json document)
    : campaign_id_(std::move(campaign_id)), turn_index_(turn_index), document_(std::move(document)) {}

CampaignState CampaignState::initial(const Campaign& campaign) {
  nlohmann::json world = {{"location_id", ""},
                          {"zones", nlohmann::json::object()},
                          {"npcs", nlohmann::json::object()},
                          {"quests", nlohmann::json::array()},
                          {"factions", nlohmann::json::object()},
                          {"global_flags", nlohmann::json::object()}};
  world.update(campaign.world);

  nlohmann::json rules = {{"srd_version", "5.2"},
                          {"homebrew_allowed", true},
                          {"failure_style", campaign.failure_style},
                          {"content_rating", campaign.content_rating}};
  rules.update(campaign.rules_profile);

  nlohmann::json doc = {{"party", {{"player", build_player(campaign.character)}}},
                        {"world", world},
                        {"universe_time", tale::to_json(campaign.start_time)},
                        {"rules_context", rules}};
  return CampaignState(campaign.id, 0, std::move(doc));
}

bool CampaignState::from_json(const nlohmann::json& j, CampaignState& out, std::string& error) {
  if (!j.is_object() || !j.contains("campaign_id") || !j["campaign_id"].is_string() ||
      !j.contains("turn_index") || !j["turn_index"].is_number_integer()) {
    error = "state document needs campaign_id and turn_index";
    return false;
  }
  nlohmann::json doc = j;
  doc.erase("campaign_id");
  doc.erase("turn_index");
  out = CampaignState(j["campaign_id"].get<std::string>(), j["turn_index"].get<int64_t>(), std::move(doc));
  return true;
}

const nlohmann::json& CampaignState::player() const {
  static const nlohmann::json kEmpty = nlohmann::json::object();
  if (document_.contains("party") && document_["party"].contains("player")) {
    return document_["party"]["player"];
  }
  return kEmpty;
}

CharacterStats CampaignState::character() const {
  return CharacterStats::from_json(player());
}

UniverseTime CampaignState::universe_time() const {
  UniverseTime t;
  std::string error;
  if (!document_.contains("universe_time") || !universe_time_from_json(document_["universe_time"], t, error)) {
    return UniverseTime{};
  }
  return t;
}

nlohmann::json CampaignState::to_json() const {
  nlohmann::json j = document_;
  j["campaign_id"] = campaign_id_;
  j["turn_index"] = turn_index_;
  return j;
}

std::string CampaignState::canonical_json() const {
  return to_json().dump();
}

std::string CampaignState::compute_hash() const {
  return sha256_hex(canonical_json());
}

bool CampaignState::apply_patch(const std::vector<PatchOp>& patch, std::string& error) {
  nlohmann::json working = document_;
  for (size_t i = 0; i < patch.size(); ++i) {
    if (!std::visit(PatchApplier(working, error), patch[i])) {
      error = "patches[" + std::to_string(i) + "] " + error;
      return false;
    }
  }
  document_ = std::move(working);
  return true;
}

} // namespace tale
