#include "maestro/util/time.hpp"

#include <charconv>
#include <ctime>
#include <format>

namespace maestro {

namespace {

auto parse_int(std::string_view text, std::size_t pos, std::size_t len,
               int& out) -> bool {
  if (pos + len > text.size()) {
    return false;
  }
  auto first = text.data() + pos;
  auto [ptr, ec] = std::from_chars(first, first + len, out);
  return ec == std::errc{} && ptr == first + len;
}

}  // namespace

auto format_iso8601(TimePoint tp) -> std::string {
  auto time = Clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&time, &tm);
  return std::format("{:04d}-{:02d}-{:02d}T{:02d}:{:02d}:{:02d}Z",
                     tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                     tm.tm_min, tm.tm_sec);
}

auto format_compact_local(TimePoint tp) -> std::string {
  auto time = Clock::to_time_t(tp);
  std::tm tm{};
  localtime_r(&time, &tm);
  return std::format("{:04d}{:02d}{:02d}-{:02d}{:02d}{:02d}", tm.tm_year + 1900,
                     tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min,
                     tm.tm_sec);
}

auto container_name_for(std::string_view image, TimePoint tp) -> std::string {
  std::string name = "container-";
  for (char c : image) {
    bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                   (c >= '0' && c <= '9') || c == '_' || c == '.' || c == '-';
    name.push_back(allowed ? c : '_');
  }
  name.push_back('-');
  name += format_compact_local(tp);
  return name;
}

auto parse_rfc3339(std::string_view text) -> Result<TimePoint> {
  // YYYY-MM-DDTHH:MM:SS
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  if (text.size() < 20 || text[4] != '-' || text[7] != '-' ||
      (text[10] != 'T' && text[10] != 't' && text[10] != ' ') ||
      text[13] != ':' || text[16] != ':') {
    return fail(Error::ParseError);
  }
  if (!parse_int(text, 0, 4, year) || !parse_int(text, 5, 2, month) ||
      !parse_int(text, 8, 2, day) || !parse_int(text, 11, 2, hour) ||
      !parse_int(text, 14, 2, minute) || !parse_int(text, 17, 2, second)) {
    return fail(Error::ParseError);
  }

  std::size_t pos = 19;
  std::chrono::nanoseconds fraction{0};
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    std::int64_t nanos = 0;
    int digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits < 9) {
        nanos = nanos * 10 + (text[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    if (digits == 0) {
      return fail(Error::ParseError);
    }
    for (; digits < 9; ++digits) {
      nanos *= 10;
    }
    fraction = std::chrono::nanoseconds{nanos};
  }

  std::chrono::minutes offset{0};
  if (pos >= text.size()) {
    return fail(Error::ParseError);
  }
  if (text[pos] == 'Z' || text[pos] == 'z') {
    ++pos;
  } else if (text[pos] == '+' || text[pos] == '-') {
    int off_h = 0, off_m = 0;
    if (!parse_int(text, pos + 1, 2, off_h) || pos + 3 >= text.size() ||
        text[pos + 3] != ':' || !parse_int(text, pos + 4, 2, off_m)) {
      return fail(Error::ParseError);
    }
    offset = std::chrono::hours{off_h} + std::chrono::minutes{off_m};
    if (text[pos] == '-') {
      offset = -offset;
    }
    pos += 6;
  } else {
    return fail(Error::ParseError);
  }
  if (pos != text.size()) {
    return fail(Error::ParseError);
  }

  std::chrono::year_month_day ymd{
      std::chrono::year{year},
      std::chrono::month{static_cast<unsigned>(month)},
      std::chrono::day{static_cast<unsigned>(day)}};
  if (!ymd.ok() || hour > 23 || minute > 59 || second > 60) {
    return fail(Error::ParseError);
  }

  auto tp = std::chrono::sys_days{ymd} + std::chrono::hours{hour} +
            std::chrono::minutes{minute} + std::chrono::seconds{second} +
            fraction - offset;
  return ok(std::chrono::time_point_cast<Clock::duration>(tp));
}

}  // namespace maestro
