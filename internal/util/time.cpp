#include "time.hpp"

#include <charconv>
#include <cstdio>

namespace booking::util {

namespace {

bool ParseFixed(std::string_view text, std::size_t pos, std::size_t width, int& out) {
  if (pos + width > text.size()) {
    return false;
  }
  for (std::size_t i = pos; i < pos + width; ++i) {
    if (text[i] < '0' || text[i] > '9') {
      return false;
    }
  }
  const auto* first = text.data() + pos;
  return std::from_chars(first, first + width, out).ec == std::errc{};
}

} // namespace

TimePoint Now() {
  return std::chrono::floor<std::chrono::seconds>(Clock::now());
}

std::optional<Date> ParseDate(std::string_view text) {
  int y = 0, m = 0, d = 0;
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }
  if (!ParseFixed(text, 0, 4, y) || !ParseFixed(text, 5, 2, m) || !ParseFixed(text, 8, 2, d)) {
    return std::nullopt;
  }

  const std::chrono::year_month_day ymd{std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(m)},
                                        std::chrono::day{static_cast<unsigned>(d)}};
  if (!ymd.ok()) {
    return std::nullopt;
  }
  return Date{ymd};
}

std::optional<std::chrono::minutes> ParseClock(std::string_view text) {
  int h = 0, m = 0;
  if (text.size() != 5 || text[2] != ':') {
    return std::nullopt;
  }
  if (!ParseFixed(text, 0, 2, h) || !ParseFixed(text, 3, 2, m)) {
    return std::nullopt;
  }
  if (h > 23 || m > 59) {
    return std::nullopt;
  }
  return std::chrono::hours(h) + std::chrono::minutes(m);
}

std::optional<TimePoint> ParseDateTime(std::string_view text) {
  if (text.size() != 16 && text.size() != 19) {
    return std::nullopt;
  }
  if (text[10] != 'T' && text[10] != ' ') {
    return std::nullopt;
  }

  auto date  = ParseDate(text.substr(0, 10));
  auto clock = ParseClock(text.substr(11, 5));
  if (!date || !clock) {
    return std::nullopt;
  }

  int seconds = 0;
  if (text.size() == 19) {
    if (text[16] != ':' || !ParseFixed(text, 17, 2, seconds) || seconds > 59) {
      return std::nullopt;
    }
  }

  return TimePoint{*date} + *clock + std::chrono::seconds(seconds);
}

std::string FormatDateTime(TimePoint tp) {
  const auto                        day = std::chrono::floor<std::chrono::days>(tp);
  const std::chrono::year_month_day ymd{day};
  const std::chrono::hh_mm_ss       hms{tp - day};

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d", static_cast<int>(ymd.year()),
                static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()), static_cast<int>(hms.hours().count()),
                static_cast<int>(hms.minutes().count()), static_cast<int>(hms.seconds().count()));
  return buf;
}

std::string FormatDate(Date date) {
  const std::chrono::year_month_day ymd{date};

  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()));
  return buf;
}

std::string FormatClock(TimePoint tp) {
  const auto                  day = std::chrono::floor<std::chrono::days>(tp);
  const std::chrono::hh_mm_ss hms{tp - day};

  char buf[8];
  std::snprintf(buf, sizeof(buf), "%02d:%02d", static_cast<int>(hms.hours().count()), static_cast<int>(hms.minutes().count()));
  return buf;
}

int64_t ToUnixSeconds(TimePoint tp) {
  return tp.time_since_epoch().count();
}

TimePoint FromUnixSeconds(int64_t seconds) {
  return TimePoint{std::chrono::seconds(seconds)};
}

} // namespace booking::util
