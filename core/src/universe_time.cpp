#include "tale/universe_time.h"

namespace tale {

namespace {
constexpr int64_t kMinutesPerDay = 24 * 60;

int64_t floor_div(int64_t a, int64_t b) {
  int64_t q = a / b;
  if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
  return q;
}

int64_t floor_mod(int64_t a, int64_t b) {
  return a - floor_div(a, b) * b;
}

bool read_int_field(const nlohmann::json& j, const char* key, int64_t& out, std::string& error) {
  if (!j.contains(key)) return true;
  const auto& v = j[key];
  if (!v.is_number_integer()) {
    error = std::string("'") + key + "' must be an integer";
    return false;
  }
  out = v.get<int64_t>();
  return true;
}
} // namespace

Calendar Calendar::standard() {
  Calendar c;
  c.months = {
      {"Deepwinter", 30}, {"Clawfrost", 30},   {"Thawmelt", 31},    {"Greengrass", 30},
      {"Mirthal", 31},    {"Summertide", 30},  {"Highsun", 31},     {"Latesummer", 31},
      {"Harvestglow", 30}, {"Leaffall", 30},   {"Frostdawn", 30},   {"Winternight", 31},
  };
  return c;
}

int Calendar::days_per_year() const {
  int total = 0;
  for (const auto& m : months) total += m.days;
  return total;
}

int Calendar::days_in_month(int month) const {
  if (month < 1 || month > static_cast<int>(months.size())) return 0;
  return months[static_cast<size_t>(month - 1)].days;
}

bool UniverseTime::operator==(const UniverseTime& other) const {
  return year == other.year && month == other.month && day == other.day && hour == other.hour &&
         minute == other.minute;
}

int64_t to_total_minutes(const UniverseTime& time, const Calendar& calendar) {
  int64_t days = time.year * calendar.days_per_year();
  for (int i = 0; i < time.month - 1 && i < static_cast<int>(calendar.months.size()); ++i) {
    days += calendar.months[static_cast<size_t>(i)].days;
  }
  days += time.day - 1;
  return days * kMinutesPerDay + time.hour * 60 + time.minute;
}

UniverseTime from_total_minutes(int64_t total_minutes, const Calendar& calendar) {
  UniverseTime t;
  t.minute = static_cast<int>(floor_mod(total_minutes, 60));
  const int64_t total_hours = floor_div(total_minutes, 60);
  t.hour = static_cast<int>(floor_mod(total_hours, 24));
  const int64_t total_days = floor_div(total_hours, 24);

  const int64_t per_year = calendar.days_per_year();
  t.year = floor_div(total_days, per_year);
  int64_t remaining = floor_mod(total_days, per_year);

  int month = 1;
  for (const auto& m : calendar.months) {
    if (remaining < m.days) break;
    remaining -= m.days;
    ++month;
  }
  t.month = month;
  t.day = static_cast<int>(remaining) + 1;
  return t;
}

int64_t to_total_minutes(const TimeDelta& delta, const Calendar& calendar) {
  const int64_t per_year = calendar.days_per_year();
  const int64_t month_count = calendar.months.empty() ? 12 : static_cast<int64_t>(calendar.months.size());
  int64_t total = delta.minutes;
  total += delta.hours * 60;
  total += delta.days * kMinutesPerDay;
  total += delta.months * per_year * kMinutesPerDay / month_count;
  total += delta.years * per_year * kMinutesPerDay;
  return total;
}

UniverseTime advance(const UniverseTime& time, const TimeDelta& delta, const Calendar& calendar) {
  return from_total_minutes(to_total_minutes(time, calendar) + to_total_minutes(delta, calendar),
                            calendar);
}

bool universe_time_from_json(const nlohmann::json& j, UniverseTime& out, std::string& error) {
  UniverseTime t;
  if (j.is_null()) {
    out = t;
    return true;
  }
  if (!j.is_object()) {
    error = "universe time must be an object";
    return false;
  }
  int64_t month = t.month;
  int64_t day = t.day;
  int64_t hour = t.hour;
  int64_t minute = t.minute;
  if (!read_int_field(j, "year", t.year, error) || !read_int_field(j, "month", month, error) ||
      !read_int_field(j, "day", day, error) || !read_int_field(j, "hour", hour, error) ||
      !read_int_field(j, "minute", minute, error)) {
    return false;
  }
  if (t.year < -kMaxUniverseYear || t.year > kMaxUniverseYear) {
    error = "year must be within +/-" + std::to_string(kMaxUniverseYear) + ", got " + std::to_string(t.year);
    return false;
  }
  const Calendar calendar = Calendar::standard();
  const int64_t month_count = static_cast<int64_t>(calendar.months.size());
  if (month < 1 || month > month_count) {
    error = "month must be 1-" + std::to_string(month_count) + ", got " + std::to_string(month);
    return false;
  }
  const int month_days = calendar.days_in_month(static_cast<int>(month));
  if (day < 1 || day > month_days) {
    error = "day must be 1-" + std::to_string(month_days) + " in month " + std::to_string(month) + ", got " +
            std::to_string(day);
    return false;
  }
  if (hour < 0 || hour > 23) {
    error = "hour must be 0-23, got " + std::to_string(hour);
    return false;
  }
  if (minute < 0 || minute > 59) {
    error = "minute must be 0-59, got " + std::to_string(minute);
    return false;
  }
  t.month = static_cast<int>(month);
  t.day = static_cast<int>(day);
  t.hour = static_cast<int>(hour);
  t.minute = static_cast<int>(minute);
  out = t;
  return true;
}

nlohmann::json to_json(const UniverseTime& time) {
  return nlohmann::json{{"year", time.year},
                        {"month", time.month},
                        {"day", time.day},
                        {"hour", time.hour},
                        {"minute", time.minute}};
}

bool time_delta_from_json(const nlohmann::json& j, TimeDelta& out, std::string& error) {
  if (!j.is_object()) {
    error = "time delta must be an object";
    return false;
  }
  TimeDelta d;
  for (auto it = j.begin(); it != j.end(); ++it) {
    const std::string& key = it.key();
    if (key != "years" && key != "months" && key != "days" && key != "hours" && key != "minutes") {
      error = "unknown time key '" + key + "'";
      return false;
    }
  }
  if (!read_int_field(j, "years", d.years, error) || !read_int_field(j, "months", d.months, error) ||
      !read_int_field(j, "days", d.days, error) || !read_int_field(j, "hours", d.hours, error) ||
      !read_int_field(j, "minutes", d.minutes, error)) {
    return false;
  }
  out = d;
  return true;
}

nlohmann::json to_json(const TimeDelta& delta) {
  return nlohmann::json{{"years", delta.years},
                        {"months", delta.months},
                        {"days", delta.days},
                        {"hours", delta.hours},
                        {"minutes", delta.minutes}};
}

TimeCheck validate_time_delta(const TimeDelta& delta, const Calendar& calendar, int max_years) {
  TimeCheck check;
  const std::pair<const char*, int64_t> parts[] = {{"years", delta.years},
                                                   {"months", delta.months},
                                                   {"days", delta.days},
                                                   {"hours", delta.hours},
                                                   {"minutes", delta.minutes}};
  for (const auto& part : parts) {
    if (part.second < 0) {
      check.errors.push_back(std::string("negative ") + part.first + " not allowed: " +
                             std::to_string(part.second));
    }
  }
  if (!check.ok()) return check;

  const int64_t max_days = static_cast<int64_t>(calendar.days_per_year()) * max_years;
  // Reject oversized components before converting so the sum cannot overflow.
  if (delta.years > max_years || delta.months > static_cast<int64_t>(max_years) * 12 ||
      delta.days > max_days || delta.hours > max_days * 24 || delta.minutes > max_days * kMinutesPerDay) {
    check.errors.push_back("time delta too large: exceeds maximum of " + std::to_string(max_days) +
                           " days");
    return check;
  }
  const int64_t total_days = to_total_minutes(delta, calendar) / kMinutesPerDay;
  if (total_days > max_days) {
    check.errors.push_back("time delta too large: " + std::to_string(total_days) +
                           " days exceeds maximum of " + std::to_string(max_days) + " days");
    return check;
  }
  if (delta.years > 10) {
    check.warnings.push_back("large time delta: " + std::to_string(delta.years) + " years");
  } else if (total_days > calendar.days_per_year()) {
    check.warnings.push_back("large time delta: " + std::to_string(total_days) + " days");
  }
  return check;
}

} // namespace tale
