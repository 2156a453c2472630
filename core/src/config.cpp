#include "tale/config.h"

#include "tale/log.h"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <fstream>
#include <optional>

namespace tale {

const char* to_string(ValueDomain domain) {
  switch (domain) {
    case ValueDomain::Any:
      return "any";
    case ValueDomain::NonNegativeInt:
      return "non_negative_int";
    case ValueDomain::Int:
      return "int";
    case ValueDomain::String:
      return "string";
    case ValueDomain::StringList:
      return "string_list";
    case ValueDomain::List:
      return "list";
    case ValueDomain::Bool:
      return "bool";
    case ValueDomain::Object:
      return "object";
    case ValueDomain::NpcStatus:
      return "npc_status";
    case ValueDomain::NpcAttitude:
      return "npc_attitude";
  }
  return "any";
}

bool parse_value_domain(const std::string& text, ValueDomain& out) {
  static const ValueDomain kAll[] = {
      ValueDomain::Any,    ValueDomain::NonNegativeInt, ValueDomain::Int,
      ValueDomain::String, ValueDomain::StringList,     ValueDomain::List,
      ValueDomain::Bool,   ValueDomain::Object,         ValueDomain::NpcStatus,
      ValueDomain::NpcAttitude};
  for (const auto domain : kAll) {
    if (text == to_string(domain)) {
      out = domain;
      return true;
    }
  }
  return false;
}

std::vector<PatchPathRule> default_patch_path_rules() {
  return {
      {R"(^/party/player/hp/current$)", ValueDomain::NonNegativeInt},
      {R"(^/party/player/hp/temp$)", ValueDomain::NonNegativeInt},
      {R"(^/party/player/conditions$)", ValueDomain::StringList},
      {R"(^/party/player/conditions/(\d+|-)$)", ValueDomain::String},
      {R"(^/party/player/resources/hit_dice/[^/]+/spent$)", ValueDomain::NonNegativeInt},
      {R"(^/party/player/resources/spell_slots/\d+/used$)", ValueDomain::NonNegativeInt},
      {R"(^/party/player/inventory$)", ValueDomain::List},
      {R"(^/party/player/inventory/(\d+|-)$)", ValueDomain::Any},
      {R"(^/party/player/money/[a-z]+$)", ValueDomain::NonNegativeInt},
      {R"(^/world/location_id$)", ValueDomain::String},
      {R"(^/world/zones/[^/]+/flags/[^/]+$)", ValueDomain::Any},
      {R"(^/world/zones/[^/]+/npcs_present$)", ValueDomain::StringList},
      {R"(^/world/quests$)", ValueDomain::List},
      {R"(^/world/quests/(\d+|-)$)", ValueDomain::Object},
      {R"(^/world/quests/\d+/stage$)", ValueDomain::Any},
      {R"(^/world/quests/\d+/flags/[^/]+$)", ValueDomain::Any},
      {R"(^/world/npcs/[^/]+/status$)", ValueDomain::NpcStatus},
      {R"(^/world/npcs/[^/]+/attitude$)", ValueDomain::NpcAttitude},
      {R"(^/world/npcs/[^/]+/location_id$)", ValueDomain::String},
      {R"(^/world/npcs/[^/]+/knowledge_flags$)", ValueDomain::StringList},
      {R"(^/world/npcs/[^/]+/knowledge_flags/(\d+|-)$)", ValueDomain::String},
      {R"(^/world/factions/[^/]+/[^/]+$)", ValueDomain::Any},
      {R"(^/world/global_flags/[^/]+$)", ValueDomain::Any},
  };
}

namespace {
bool file_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

struct ConfigFields {
  std::optional<int> snapshot_interval;
  std::optional<int> recent_turn_window;
  std::optional<int> max_repair_attempts;
  std::optional<int> dc_min;
  std::optional<int> dc_max;
  std::optional<int> armor_class_max;
  std::optional<int> lore_max_text;
  std::optional<int> max_turn_years;
  std::string log_level;
  std::string store_path;
  std::string log_dir;
  std::vector<PatchPathRule> patch_paths;
};

void apply_common_fields(EngineConfig& cfg, const ConfigFields& f) {
  if (f.snapshot_interval.has_value() && *f.snapshot_interval > 0) {
    cfg.snapshot_interval = *f.snapshot_interval;
  }
  if (f.recent_turn_window.has_value() && *f.recent_turn_window >= 0) {
    cfg.recent_turn_window = *f.recent_turn_window;
  }
  if (f.max_repair_attempts.has_value() && *f.max_repair_attempts >= 0) {
    cfg.max_repair_attempts = *f.max_repair_attempts;
  }
  if (f.dc_min.has_value()) cfg.dc_min = *f.dc_min;
  if (f.dc_max.has_value()) cfg.dc_max = *f.dc_max;
  if (f.armor_class_max.has_value()) cfg.armor_class_max = *f.armor_class_max;
  if (f.lore_max_text.has_value() && *f.lore_max_text > 0) {
    cfg.lore_max_text = static_cast<size_t>(*f.lore_max_text);
  }
  if (f.max_turn_years.has_value() && *f.max_turn_years > 0) {
    cfg.max_turn_years = *f.max_turn_years;
  }
  if (!f.log_level.empty()) cfg.log_level = f.log_level;
  if (!f.store_path.empty()) cfg.store_path = f.store_path;
  if (!f.log_dir.empty()) cfg.log_dir = f.log_dir;
  if (!f.patch_paths.empty()) cfg.patch_paths = f.patch_paths;
  if (cfg.dc_min > cfg.dc_max) {
    log::warn("config: dc_min greater than dc_max; restoring defaults");
    cfg.dc_min = 1;
    cfg.dc_max = 40;
  }
}

void push_rule(ConfigFields& f, const std::string& pattern, const std::string& domain_text) {
  ValueDomain domain = ValueDomain::Any;
  if (!domain_text.empty() && !parse_value_domain(domain_text, domain)) {
    log::warn("config: unknown value domain '" + domain_text + "' for " + pattern);
    return;
  }
  f.patch_paths.push_back({pattern, domain});
}

ConfigFields read_json_fields(const nlohmann::json& root) {
  ConfigFields f;
  auto read_int = [&root](const char* key, std::optional<int>& out) {
    if (!root.contains(key)) return;
    if (root[key].is_number_integer()) {
      out = root[key].get<int>();
    } else {
      log::warn(std::string("config: ") + key + " must be an integer; ignored");
    }
  };
  auto read_string = [&root](const char* key, std::string& out) {
    if (!root.contains(key)) return;
    if (root[key].is_string()) {
      out = root[key].get<std::string>();
    } else {
      log::warn(std::string("config: ") + key + " must be a string; ignored");
    }
  };
  read_int("snapshot_interval", f.snapshot_interval);
  read_int("recent_turn_window", f.recent_turn_window);
  read_int("max_repair_attempts", f.max_repair_attempts);
  read_int("dc_min", f.dc_min);
  read_int("dc_max", f.dc_max);
  read_int("armor_class_max", f.armor_class_max);
  read_int("lore_max_text", f.lore_max_text);
  read_int("max_turn_years", f.max_turn_years);
  read_string("log_level", f.log_level);
  read_string("store_path", f.store_path);
  read_string("log_dir", f.log_dir);
  if (root.contains("patch_paths") && root["patch_paths"].is_array()) {
    for (const auto& rule : root["patch_paths"]) {
      if (!rule.is_object() || !rule.contains("pattern") || !rule["pattern"].is_string() ||
          (rule.contains("domain") && !rule["domain"].is_string())) {
        log::warn("config: patch_paths entries need a string pattern and domain; skipped");
        continue;
      }
      push_rule(f, rule["pattern"].get<std::string>(), rule.value("domain", ""));
    }
  }
  return f;
}

ConfigFields read_yaml_fields(const YAML::Node& root) {
  ConfigFields f;
  auto read_int = [&root](const char* key, std::optional<int>& out) {
    if (root[key]) {
      out = root[key].as<int>();
    }
  };
  read_int("snapshot_interval", f.snapshot_interval);
  read_int("recent_turn_window", f.recent_turn_window);
  read_int("max_repair_attempts", f.max_repair_attempts);
  read_int("dc_min", f.dc_min);
  read_int("dc_max", f.dc_max);
  read_int("armor_class_max", f.armor_class_max);
  read_int("lore_max_text", f.lore_max_text);
  read_int("max_turn_years", f.max_turn_years);
  if (root["log_level"]) f.log_level = root["log_level"].as<std::string>();
  if (root["store_path"]) f.store_path = root["store_path"].as<std::string>();
  if (root["log_dir"]) f.log_dir = root["log_dir"].as<std::string>();
  if (root["patch_paths"]) {
    for (const auto& rule : root["patch_paths"]) {
      if (!rule["pattern"]) continue;
      const std::string domain = rule["domain"] ? rule["domain"].as<std::string>() : std::string();
      push_rule(f, rule["pattern"].as<std::string>(), domain);
    }
  }
  return f;
}
} // namespace

EngineConfig load_engine_config(const std::filesystem::path& path) {
  EngineConfig cfg;

  if (!file_exists(path)) {
    log::warn(std::string("config not found: ") + path.string());
    return cfg;
  }

  const auto ext = path.extension().string();
  if (ext == ".json") {
    std::ifstream in(path);
    const auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      log::warn("config: invalid JSON; using defaults");
      return cfg;
    }
    const auto& root = (j.contains("engine") && j["engine"].is_object()) ? j["engine"] : j;
    apply_common_fields(cfg, read_json_fields(root));
    return cfg;
  }

  if (ext == ".yaml" || ext == ".yml") {
    try {
      YAML::Node doc = YAML::LoadFile(path.string());
      YAML::Node root = doc["engine"] ? doc["engine"] : doc;
      apply_common_fields(cfg, read_yaml_fields(root));
    } catch (const YAML::Exception& e) {
      log::warn(std::string("config: YAML load failed: ") + e.what());
    }
    return cfg;
  }

  log::warn("Unknown config extension; using defaults.");
  return cfg;
}

} // namespace tale
