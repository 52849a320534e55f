#pragma once

#include <chrono>
#include <cstddef>
#include <string_view>

#include "quay/simple-charconv.hpp"
#include "quay/timedef.hpp"

namespace quay {

/// Writes chars of the representation of a given time point in ISO 8601 UTC format and returns
/// a pointer after the last char written. The written format will be (in millisecond precision):
///   - 'YYYY-MM-DDTHH:MM:SS.sssZ'
/// The buffer should have a space of at least 24 chars.
constexpr auto TimeToStringISO8601UTCWithMs(SysTimePoint timePoint, auto out) {
  const auto daysFloor = std::chrono::floor<std::chrono::days>(timePoint);
  const std::chrono::year_month_day ymd{daysFloor};
  const std::chrono::hh_mm_ss hms{std::chrono::floor<std::chrono::milliseconds>(timePoint - daysFloor)};
  out = write4(out, static_cast<int>(ymd.year()));
  *out = '-';
  out = write2(++out, static_cast<unsigned>(ymd.month()));
  *out = '-';
  out = write2(++out, static_cast<unsigned>(ymd.day()));
  *out = 'T';
  out = write2(++out, hms.hours().count());
  *out = ':';
  out = write2(++out, hms.minutes().count());
  *out = ':';
  out = write2(++out, hms.seconds().count());
  *out = '.';
  out = write3(++out, hms.subseconds().count());
  *out = 'Z';
  return ++out;
}

inline constexpr std::size_t kISO8601WithMsStrLen = 24;

/// Format a time point to an RFC7231 IMF-fixdate string (e.g. "Sun, 06 Nov 1994 08:49:37 GMT").
/// Buffer must have space for at least 29 characters (no null terminator added).
/// Returns pointer past last written char.
constexpr auto TimeToStringRFC7231(SysTimePoint tp, auto out) {
  using namespace std::chrono;
  static constexpr const char* const kWeekdays[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
  static constexpr const char* const kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                                  "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
  const sys_seconds secTp = floor<seconds>(tp);
  const auto dayPoint = floor<days>(secTp);
  const year_month_day ymd{dayPoint};
  const weekday wd{dayPoint};
  const hh_mm_ss hms{secTp - dayPoint};
  out = copy3(out, kWeekdays[wd.c_encoding()]);
  *out = ',';
  *++out = ' ';
  out = write2(++out, static_cast<unsigned>(ymd.day()));
  *out = ' ';
  out = copy3(++out, kMonths[static_cast<unsigned>(ymd.month()) - 1]);
  *out = ' ';
  out = write4(++out, static_cast<int>(ymd.year()));
  *out = ' ';
  out = write2(++out, hms.hours().count());
  *out = ':';
  out = write2(++out, hms.minutes().count());
  *out = ':';
  out = write2(++out, hms.seconds().count());
  *out = ' ';
  return copy3(++out, "GMT");
}

inline constexpr std::size_t kRFC7231DateStrLen = 29;
inline constexpr SysTimePoint kInvalidTimePoint = SysTimePoint::max();

// Parse a string representation of a given time point in RFC7231 IMF-fixdate format and
// return a time_point. If parsing fails, returns kInvalidTimePoint.
SysTimePoint TryParseTimeRFC7231(const char* begPtr, const char* endPtr);

inline SysTimePoint TryParseTimeRFC7231(std::string_view value) {
  return TryParseTimeRFC7231(value.data(), value.data() + value.size());
}

}  // namespace quay
