// (c) 2024, Interance GmbH & Co KG.

#include "iso8601.hpp"

#include <caf/timespan.hpp>

#include <chrono>
#include <cstdint>
#include <cstdio>

namespace {

constexpr int64_t seconds_per_day = 86'400;

// Converts a civil date in the proleptic Gregorian calendar to the number of
// days since 1970-01-01.
int64_t days_from_civil(int64_t y, int64_t m, int64_t d) {
  y -= m <= 2 ? 1 : 0;
  auto era = (y >= 0 ? y : y - 399) / 400;
  auto yoe = y - era * 400;
  auto doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  auto doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146'097 + doe - 719'468;
}

struct civil_date {
  int64_t year;
  int month;
  int day;
};

// Inverse of `days_from_civil`.
civil_date civil_from_days(int64_t z) {
  z += 719'468;
  auto era = (z >= 0 ? z : z - 146'096) / 146'097;
  auto doe = z - era * 146'097;
  auto yoe = (doe - doe / 1460 + doe / 36'524 - doe / 146'096) / 365;
  auto doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  auto mp = (5 * doy + 2) / 153;
  auto d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
  auto m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
  return {yoe + era * 400 + (m <= 2 ? 1 : 0), m, d};
}

bool leap_year(int64_t y) {
  return y % 4 == 0 && (y % 100 != 0 || y % 400 == 0);
}

int days_in_month(int64_t y, int m) {
  constexpr int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return m == 2 && leap_year(y) ? 29 : days[m - 1];
}

// Minimal cursor for reading fixed-width fields.
class reader {
public:
  explicit reader(std::string_view str) : str_(str) {
    // nop
  }

  bool at_end() const noexcept {
    return pos_ == str_.size();
  }

  char peek() const noexcept {
    return at_end() ? '\0' : str_[pos_];
  }

  bool consume(char ch) {
    if (peek() != ch)
      return false;
    ++pos_;
    return true;
  }

  bool digits(size_t n, int64_t& result) {
    result = 0;
    for (size_t i = 0; i < n; ++i) {
      auto ch = peek();
      if (ch < '0' || ch > '9')
        return false;
      result = result * 10 + (ch - '0');
      ++pos_;
    }
    return true;
  }

  // Reads 1 to 9 fractional digits and scales them to nanoseconds.
  bool fraction(int64_t& ns) {
    ns = 0;
    size_t n = 0;
    for (auto ch = peek(); ch >= '0' && ch <= '9'; ch = peek()) {
      if (++n > 9)
        return false;
      ns = ns * 10 + (ch - '0');
      ++pos_;
    }
    if (n == 0)
      return false;
    for (; n < 9; ++n)
      ns *= 10;
    return true;
  }

private:
  std::string_view str_;
  size_t pos_ = 0;
};

} // namespace

std::string to_iso8601(caf::timestamp x) {
  using std::chrono::duration_cast;
  using std::chrono::microseconds;
  auto us = duration_cast<microseconds>(x.time_since_epoch()).count();
  constexpr int64_t us_per_day = seconds_per_day * 1'000'000;
  auto days = us / us_per_day;
  auto rem = us % us_per_day;
  if (rem < 0) {
    rem += us_per_day;
    --days;
  }
  auto date = civil_from_days(days);
  auto secs = rem / 1'000'000;
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%04lld-%02d-%02dT%02d:%02d:%02d.%06d",
                static_cast<long long>(date.year), date.month, date.day,
                static_cast<int>(secs / 3600), static_cast<int>(secs / 60 % 60),
                static_cast<int>(secs % 60),
                static_cast<int>(rem % 1'000'000));
  return buf;
}

bool from_iso8601(std::string_view str, caf::timestamp& x) {
  reader rd{str};
  int64_t year = 0;
  int64_t month = 0;
  int64_t day = 0;
  int64_t hour = 0;
  int64_t minute = 0;
  int64_t second = 0;
  int64_t ns = 0;
  if (!rd.digits(4, year) || !rd.consume('-') || !rd.digits(2, month)
      || !rd.consume('-') || !rd.digits(2, day))
    return false;
  if (!rd.consume('T') && !rd.consume(' '))
    return false;
  if (!rd.digits(2, hour) || !rd.consume(':') || !rd.digits(2, minute)
      || !rd.consume(':') || !rd.digits(2, second))
    return false;
  if (rd.consume('.') && !rd.fraction(ns))
    return false;
  int64_t offset = 0;
  if (rd.peek() == '+' || rd.peek() == '-') {
    auto sign = rd.peek() == '-' ? -1 : 1;
    rd.consume(rd.peek());
    int64_t offset_hours = 0;
    int64_t offset_minutes = 0;
    if (!rd.digits(2, offset_hours))
      return false;
    rd.consume(':');
    if (!rd.digits(2, offset_minutes) || offset_hours > 23
        || offset_minutes > 59)
      return false;
    offset = sign * (offset_hours * 3600 + offset_minutes * 60);
  } else {
    rd.consume('Z');
  }
  if (!rd.at_end())
    return false;
  if (month < 1 || month > 12 || day < 1
      || day > days_in_month(year, static_cast<int>(month)) || hour > 23
      || minute > 59 || second > 59)
    return false;
  auto secs = days_from_civil(year, month, day) * seconds_per_day
              + hour * 3600 + minute * 60 + second - offset;
  // Stay within the range of a nanosecond timestamp.
  using std::chrono::duration_cast;
  using std::chrono::seconds;
  constexpr auto max_ns = caf::timespan::max().count();
  auto max_secs = duration_cast<seconds>(caf::timespan::max()).count();
  if (secs > max_secs || secs < -max_secs
      || (secs == max_secs && ns > max_ns % 1'000'000'000))
    return false;
  x = caf::timestamp{caf::timespan{seconds{secs}} + caf::timespan{ns}};
  return true;
}
