#include "tale/log.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace tale::log {

namespace {
std::mutex g_log_mutex;
std::ofstream g_log_file;
std::deque<std::string> g_ring;
constexpr size_t kRingMax = 200;
std::string g_app_name = "tale";
std::atomic<int> g_min_level{static_cast<int>(Level::Info)};

std::string format_now(const char* pattern) {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const auto tt = system_clock::to_time_t(now);
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &tt);
#else
  localtime_r(&tt, &tm);
#endif
  std::ostringstream oss;
  oss << std::put_time(&tm, pattern);
  return oss.str();
}

const char* level_name(Level level) {
  switch (level) {
    case Level::Debug:
      return "DEBUG";
    case Level::Info:
      return "INFO";
    case Level::Warn:
      return "WARN";
    case Level::Error:
      return "ERROR";
  }
  return "INFO";
}

void log_line(Level level, std::string_view msg) {
  if (static_cast<int>(level) < g_min_level.load()) {
    return;
  }
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const std::string line =
      "[" + format_now("%Y-%m-%d %H:%M:%S") + "][" + level_name(level) + "] " + std::string(msg);
  if (level == Level::Error) {
    std::cerr << line << "\n";
  } else {
    std::cout << line << "\n";
  }
  if (g_log_file.is_open()) {
    g_log_file << line << "\n";
    g_log_file.flush();
  }
  g_ring.push_back(line);
  if (g_ring.size() > kRingMax) {
    g_ring.pop_front();
  }
}
} // namespace

void init() {
  log_line(Level::Info, "log init (console)");
}

void init(const std::string& app_name, const std::filesystem::path& log_dir) {
  {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_app_name = app_name;
    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    const std::string file_name = g_app_name + "_" + format_now("%Y%m%d_%H%M%S") + ".log";
    if (g_log_file.is_open()) {
      g_log_file.close();
    }
    g_log_file.open(log_dir / file_name, std::ios::out | std::ios::app);
  }
  log_line(Level::Info, "log init: " + app_name);
#ifdef TALE_DEBUG
  log_line(Level::Info, "build: debug");
#else
  log_line(Level::Info, "build: release");
#endif
}

void shutdown() {
  log_line(Level::Info, "log shutdown");
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (g_log_file.is_open()) {
    g_log_file.close();
  }
}

void set_level(Level level) {
  g_min_level.store(static_cast<int>(level));
}

Level level() {
  return static_cast<Level>(g_min_level.load());
}

bool set_level(std::string_view name) {
  if (name == "debug") {
    set_level(Level::Debug);
  } else if (name == "info") {
    set_level(Level::Info);
  } else if (name == "warn" || name == "warning") {
    set_level(Level::Warn);
  } else if (name == "error") {
    set_level(Level::Error);
  } else {
    return false;
  }
  return true;
}

void debug(std::string_view msg) {
  log_line(Level::Debug, msg);
}

void info(std::string_view msg) {
  log_line(Level::Info, msg);
}

void warn(std::string_view msg) {
  log_line(Level::Warn, msg);
}

void error(std::string_view msg) {
  log_line(Level::Error, msg);
}

std::vector<std::string> recent(size_t max_entries) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const size_t count = std::min(max_entries, g_ring.size());
  return std::vector<std::string>(g_ring.end() - static_cast<std::ptrdiff_t>(count), g_ring.end());
}

namespace {
void signal_handler(int sig) {
  log_line(Level::Error, std::string("crash signal: ") + std::to_string(sig));
  std::_Exit(1);
}
} // namespace

void install_crash_handlers() {
  std::signal(SIGSEGV, signal_handler);
  std::signal(SIGABRT, signal_handler);
  std::signal(SIGFPE, signal_handler);
  std::signal(SIGILL, signal_handler);
}

} // namespace tale::log
