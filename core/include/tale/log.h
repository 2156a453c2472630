#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace tale::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Console only.
void init();
// Console plus <log_dir>/<app_name>_<timestamp>.log
void init(const std::string& app_name, const std::filesystem::path& log_dir);
void shutdown();
void install_crash_handlers();

void set_level(Level level);
Level level();
// Accepts "debug", "info", "warn", "error"; anything else leaves the level unchanged.
bool set_level(std::string_view name);

void debug(std::string_view msg);
void info(std::string_view msg);
void warn(std::string_view msg);
void error(std::string_view msg);

std::vector<std::string> recent(size_t max_entries = 200);

} // namespace tale::log
