#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace storyloop {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// UTC, millisecond precision: 2024-01-31T12:00:00.250Z
inline auto format_timestamp(TimePoint tp) -> std::string {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch())
                .count();
  auto secs = static_cast<std::time_t>(ms / 1000);
  auto frac = static_cast<int>(ms % 1000);
  if (frac < 0) {
    frac += 1000;
    --secs;
  }
  std::tm tm{};
  gmtime_r(&secs, &tm);
  return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}.{:03d}Z",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec, frac);
}

inline auto format_timestamp() -> std::string {
  return format_timestamp(Clock::now());
}

// Accepts "YYYY-MM-DDTHH:MM:SS" with an optional fraction and an optional
// "Z" or "+00:00" suffix. A missing zone is read as UTC.
[[nodiscard]] inline auto parse_timestamp(std::string_view text)
    -> std::optional<TimePoint> {
  if (text.size() < 19) {
    return std::nullopt;
  }
  std::string s{text};
  std::tm tm{};
  int consumed = 0;
  if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &tm.tm_year,
                  &tm.tm_mon, &tm.tm_mday, &tm.tm_hour, &tm.tm_min, &tm.tm_sec,
                  &consumed) != 6 ||
      consumed != 19) {
    return std::nullopt;
  }
  if (tm.tm_mon < 1 || tm.tm_mon > 12 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
      tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
    return std::nullopt;
  }
  tm.tm_year -= 1900;
  tm.tm_mon -= 1;

  std::int64_t micros = 0;
  std::size_t pos = 19;
  if (pos < s.size() && s[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
      if (digits < 6) {
        micros = micros * 10 + (s[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    if (digits == 0) {
      return std::nullopt;
    }
    for (; digits < 6; ++digits) {
      micros *= 10;
    }
  }
  auto rest = std::string_view{s}.substr(pos);
  if (!rest.empty() && rest != "Z" && rest != "+00:00") {
    return std::nullopt;
  }

  auto secs = timegm(&tm);
  if (secs == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return TimePoint{std::chrono::seconds(secs)} +
         std::chrono::duration_cast<Clock::duration>(
             std::chrono::microseconds(micros));
}

}  // namespace storyloop
