#include "time.hpp"

#include <cctype>
#include <cstdio>
#include <string>

#include "internal/util/errors.hpp"

namespace gaitrank::util {

namespace {

bool ReadNumber(std::string_view text, std::size_t& pos, std::size_t digits, int& out) {
  if (pos + digits > text.size()) return false;
  int value = 0;
  for (std::size_t i = 0; i < digits; ++i) {
    const char c = text[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    value = value * 10 + (c - '0');
  }
  pos += digits;
  out = value;
  return true;
}

bool Expect(std::string_view text, std::size_t& pos, char c) {
  if (pos >= text.size() || text[pos] != c) return false;
  ++pos;
  return true;
}

[[noreturn]] void Fail(std::string_view text) {
  throw InvalidArgument("invalid date: '" + std::string(text) + "'");
}

} // namespace

TimePoint Now() {
  return std::chrono::time_point_cast<std::chrono::seconds>(Clock::now());
}

TimePoint ParseDate(std::string_view text) {
  std::size_t pos = 0;
  int         year = 0, month = 0, day = 0;
  if (!ReadNumber(text, pos, 4, year) || !Expect(text, pos, '-') || !ReadNumber(text, pos, 2, month) || !Expect(text, pos, '-') ||
      !ReadNumber(text, pos, 2, day)) {
    Fail(text);
  }

  const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                                        std::chrono::day{static_cast<unsigned>(day)}};
  if (!ymd.ok()) Fail(text);

  int hour = 0, minute = 0, second = 0;
  if (pos < text.size()) {
    if (text[pos] != ' ' && text[pos] != 'T') Fail(text);
    ++pos;
    if (!ReadNumber(text, pos, 2, hour) || !Expect(text, pos, ':') || !ReadNumber(text, pos, 2, minute)) Fail(text);
    if (pos < text.size() && (!Expect(text, pos, ':') || !ReadNumber(text, pos, 2, second))) Fail(text);
    if (pos != text.size() || hour > 23 || minute > 59 || second > 59) Fail(text);
  }

  return std::chrono::sys_days{ymd} + std::chrono::hours{hour} + std::chrono::minutes{minute} + std::chrono::seconds{second};
}

std::string FormatDate(TimePoint tp) {
  const std::chrono::year_month_day ymd{std::chrono::floor<std::chrono::days>(tp)};

  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                static_cast<unsigned>(ymd.day()));
  return buf;
}

std::string FormatDateTime(TimePoint tp) {
  const auto day  = std::chrono::floor<std::chrono::days>(tp);
  const auto time = std::chrono::hh_mm_ss<std::chrono::seconds>(tp - day);
  if (time.to_duration().count() == 0) return FormatDate(tp);

  char buf[16];
  std::snprintf(buf, sizeof(buf), " %02d:%02d:%02d", static_cast<int>(time.hours().count()), static_cast<int>(time.minutes().count()),
                static_cast<int>(time.seconds().count()));
  return FormatDate(tp) + buf;
}

int64_t ToUnixSeconds(TimePoint tp) {
  return tp.time_since_epoch().count();
}

TimePoint FromUnixSeconds(int64_t seconds) {
  return TimePoint{std::chrono::seconds{seconds}};
}

int64_t DaysBetween(TimePoint from, TimePoint to) {
  return std::chrono::floor<std::chrono::days>(to - from).count();
}

} // namespace gaitrank::util
