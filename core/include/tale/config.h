#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace tale {

// Value shape a mutable state location accepts.
enum class ValueDomain {
  Any,
  NonNegativeInt,
  Int,
  String,
  StringList,
  List,
  Bool,
  Object,
  NpcStatus,
  NpcAttitude,
};

const char* to_string(ValueDomain domain);
bool parse_value_domain(const std::string& text, ValueDomain& out);

struct PatchPathRule {
  std::string pattern;  // ECMAScript regex over a JSON pointer
  ValueDomain domain = ValueDomain::Any;
};

std::vector<PatchPathRule> default_patch_path_rules();

// Loaded once at startup and handed to components by const reference.
struct EngineConfig {
  int snapshot_interval = 10;
  int recent_turn_window = 10;
  int max_repair_attempts = 2;
  int dc_min = 1;
  int dc_max = 40;
  int armor_class_max = 40;
  size_t lore_max_text = 2000;
  int max_turn_years = 100;
  std::string log_level = "info";
  std::filesystem::path store_path = "build/tale.sqlite";
  std::filesystem::path log_dir;
  std::vector<PatchPathRule> patch_paths = default_patch_path_rules();
};

EngineConfig load_engine_config(const std::filesystem::path& path);

} // namespace tale
