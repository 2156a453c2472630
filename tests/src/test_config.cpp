#include "tale/config.h"
#include "tale/log.h"
#include "tale/validation.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace {

bool write_text(const fs::path& path, const std::string& contents) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path);
  if (!out) return false;
  out << contents;
  return true;
}

} // namespace

int main() {
  tale::log::init();
  tale::log::set_level(tale::log::Level::Error);
  int failures = 0;
  const fs::path dir = fs::temp_directory_path() / "tale_test_config";
  std::error_code ec;
  fs::remove_all(dir, ec);

  // Test: a missing file yields the defaults.
  {
    const auto cfg = tale::load_engine_config(dir / "missing.yaml");
    if (cfg.snapshot_interval != 10 || cfg.recent_turn_window != 10 || cfg.max_repair_attempts != 2 ||
        cfg.dc_min != 1 || cfg.dc_max != 40 || cfg.patch_paths.empty()) {
      std::cerr << "defaults wrong\n";
      ++failures;
    }
  }

  // Test: YAML under an `engine` key.
  {
    const fs::path path = dir / "tale.yaml";
    if (!write_text(path,
                    "engine:\n"
                    "  snapshot_interval: 5\n"
                    "  recent_turn_window: 3\n"
                    "  max_repair_attempts: 1\n"
                    "  dc_max: 30\n"
                    "  log_level: warn\n"
                    "  store_path: data/game.sqlite\n"
                    "  patch_paths:\n"
                    "    - pattern: '^/party/player/hp/current$'\n"
                    "      domain: non_negative_int\n"
                    "    - pattern: '^/world/weather$'\n"
                    "      domain: string\n"
                    "    - pattern: '^/world/mood$'\n"
                    "      domain: feelings\n")) {
      std::cerr << "could not write yaml config\n";
      ++failures;
    }
    const auto cfg = tale::load_engine_config(path);
    if (cfg.snapshot_interval != 5 || cfg.recent_turn_window != 3 || cfg.max_repair_attempts != 1 ||
        cfg.dc_max != 30 || cfg.log_level != "warn" || cfg.store_path != fs::path("data/game.sqlite") ||
        cfg.patch_paths.size() != 2) {
      std::cerr << "yaml config not applied\n";
      ++failures;
    }
    tale::PatchPathPolicy policy(cfg.patch_paths);
    const auto weather = policy.match("/world/weather");
    if (!weather || *weather != tale::ValueDomain::String || policy.match("/world/location_id")) {
      std::cerr << "configured patch paths not used\n";
      ++failures;
    }
  }

  // Test: JSON at the top level; bad values fall back.
  {
    const fs::path path = dir / "tale.json";
    if (!write_text(path, R"({"snapshot_interval": 0, "dc_min": 50, "dc_max": 20, "lore_max_text": 500,
                             "patch_paths": [{"pattern": "([", "domain": "any"}]})")) {
      std::cerr << "could not write json config\n";
      ++failures;
    }
    const auto cfg = tale::load_engine_config(path);
    if (cfg.snapshot_interval != 10 || cfg.dc_min != 1 || cfg.dc_max != 40 || cfg.lore_max_text != 500) {
      std::cerr << "json config fallback wrong\n";
      ++failures;
    }
    tale::PatchPathPolicy policy(cfg.patch_paths);
    if (policy.size() != 0) {
      std::cerr << "invalid regex should be skipped\n";
      ++failures;
    }
  }

  // Test: mistyped JSON values are skipped instead of aborting the load.
  {
    const fs::path path = dir / "typed.json";
    if (!write_text(path, R"({"engine": {"log_level": 5, "store_path": ["a"], "snapshot_interval": "often",
                             "dc_max": 30, "log_dir": "logs",
                             "patch_paths": [{"pattern": 3}, {"pattern": "^/world/weather$", "domain": 1},
                                             {"pattern": "^/world/mood$", "domain": "string"}]}})")) {
      std::cerr << "could not write typed json config\n";
      ++failures;
    }
    const auto cfg = tale::load_engine_config(path);
    if (cfg.log_level != "info" || cfg.store_path != "build/tale.sqlite" || cfg.snapshot_interval != 10 ||
        cfg.dc_max != 30 || cfg.log_dir != "logs" || cfg.patch_paths.size() != 1 ||
        cfg.patch_paths[0].pattern != "^/world/mood$") {
      std::cerr << "mistyped json values not skipped\n";
      ++failures;
    }
  }

  // Test: unreadable files keep the defaults.
  {
    const fs::path broken_json = dir / "broken.json";
    const fs::path broken_yaml = dir / "broken.yaml";
    if (!write_text(broken_json, "{ not json") || !write_text(broken_yaml, "engine: [unclosed")) {
      std::cerr << "could not write broken configs\n";
      ++failures;
    }
    if (tale::load_engine_config(broken_json).snapshot_interval != 10 ||
        tale::load_engine_config(broken_yaml).snapshot_interval != 10 ||
        tale::load_engine_config(dir / "tale.toml").dc_max != 40) {
      std::cerr << "broken config should fall back to defaults\n";
      ++failures;
    }
  }

  fs::remove_all(dir, ec);
  tale::log::shutdown();
  return failures == 0 ? 0 : 1;
}
