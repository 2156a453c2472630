#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tale {

struct MonthSpec {
  std::string name;
  int days = 30;
};

// 12 months, 365 days.
struct Calendar {
  std::vector<MonthSpec> months;

  static Calendar standard();
  int days_per_year() const;
  // 0 for a month outside the calendar.
  int days_in_month(int month) const;
};

// Years are bounded so minute arithmetic stays far from int64 overflow.
constexpr int64_t kMaxUniverseYear = 1000000;

struct UniverseTime {
  int64_t year = 1;
  int month = 1;
  int day = 1;
  int hour = 0;
  int minute = 0;

  bool operator==(const UniverseTime& other) const;
  bool operator!=(const UniverseTime& other) const { return !(*this == other); }
};

struct TimeDelta {
  int64_t years = 0;
  int64_t months = 0;
  int64_t days = 0;
  int64_t hours = 0;
  int64_t minutes = 0;
};

int64_t to_total_minutes(const UniverseTime& time, const Calendar& calendar);
UniverseTime from_total_minutes(int64_t total_minutes, const Calendar& calendar);
// Months are converted with the calendar's average month length.
int64_t to_total_minutes(const TimeDelta& delta, const Calendar& calendar);
UniverseTime advance(const UniverseTime& time, const TimeDelta& delta, const Calendar& calendar);

// Missing fields take their defaults; out of range or non-integer fields fail.
// Days are checked against the standard calendar's month lengths and years
// must lie within +/- kMaxUniverseYear.
bool universe_time_from_json(const nlohmann::json& j, UniverseTime& out, std::string& error);
nlohmann::json to_json(const UniverseTime& time);

bool time_delta_from_json(const nlohmann::json& j, TimeDelta& out, std::string& error);
nlohmann::json to_json(const TimeDelta& delta);

struct TimeCheck {
  std::vector<std::string> errors;
  std::vector<std::string> warnings;
  bool ok() const { return errors.empty(); }
};

TimeCheck validate_time_delta(const TimeDelta& delta, const Calendar& calendar, int max_years);

} // namespace tale
