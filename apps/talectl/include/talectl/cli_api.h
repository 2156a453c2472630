#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "tale/config.h"

// Each command prints JSON to `out` and returns the process exit code.
int roll_command(const std::string& expression, std::optional<int64_t> seed, std::ostream& out);
int campaign_new_command(const tale::EngineConfig& config, const std::filesystem::path& campaign_file,
                         std::ostream& out);

struct TurnCommandOptions {
  std::string campaign_id;
  std::string player_input;
  std::filesystem::path response_path;
  std::filesystem::path final_path;
  std::vector<std::filesystem::path> repair_paths;
  std::optional<int64_t> seed;
};

int turn_command(const tale::EngineConfig& config, const TurnCommandOptions& opts, std::ostream& out);
int state_command(const tale::EngineConfig& config, const std::string& campaign_id, std::optional<int64_t> turn,
                  std::ostream& out);
int verify_command(const tale::EngineConfig& config, const std::string& campaign_id, std::ostream& out);
int rewind_command(const tale::EngineConfig& config, const std::string& campaign_id, int64_t target,
                   std::ostream& out);
int history_command(const tale::EngineConfig& config, const std::string& campaign_id, size_t limit,
                    std::ostream& out);

int run_cli(int argc, char** argv);
