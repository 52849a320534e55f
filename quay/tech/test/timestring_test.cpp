#include "quay/timestring.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <string_view>

#include "quay/timedef.hpp"

namespace quay {

using namespace std::chrono;

namespace {
SysTimePoint MakeTime(year_month_day ymd, hours hh, minutes mm, seconds ss, milliseconds ms = milliseconds{0}) {
  return sys_days{ymd} + hh + mm + ss + ms;
}
}  // namespace

TEST(TimeStringIso8601UTCTest, MillisecondPrecision) {
  char buf[kISO8601WithMsStrLen];
  const auto tp = MakeTime(year{2025} / 8 / 14, hours{12}, minutes{34}, seconds{56}, milliseconds{789});
  char* end = TimeToStringISO8601UTCWithMs(tp, buf);
  EXPECT_EQ(std::string_view(buf, static_cast<std::size_t>(end - buf)), "2025-08-14T12:34:56.789Z");
}

TEST(TimeStringIso8601UTCTest, TruncatesSubMilliseconds) {
  char buf[kISO8601WithMsStrLen];
  const auto tp = MakeTime(year{2024} / 2 / 29, hours{6}, minutes{30}, seconds{15}, milliseconds{123}) +
                  microseconds{999};
  char* end = TimeToStringISO8601UTCWithMs(tp, buf);
  EXPECT_EQ(std::string_view(buf, static_cast<std::size_t>(end - buf)), "2024-02-29T06:30:15.123Z");
}

TEST(TimeStringRFC7231Test, Format) {
  char buf[kRFC7231DateStrLen];
  const auto tp = MakeTime(year{1994} / 11 / 6, hours{8}, minutes{49}, seconds{37});
  char* end = TimeToStringRFC7231(tp, buf);
  EXPECT_EQ(std::string_view(buf, static_cast<std::size_t>(end - buf)), "Sun, 06 Nov 1994 08:49:37 GMT");
}

TEST(TimeStringRFC7231Test, FormatTruncatesSubSeconds) {
  char buf[kRFC7231DateStrLen];
  const auto tp = MakeTime(year{2025} / 1 / 1, hours{0}, minutes{0}, seconds{0}, milliseconds{999});
  char* end = TimeToStringRFC7231(tp, buf);
  EXPECT_EQ(std::string_view(buf, static_cast<std::size_t>(end - buf)), "Wed, 01 Jan 2025 00:00:00 GMT");
}

TEST(TimeStringRFC7231Test, ParseValid) {
  EXPECT_EQ(TryParseTimeRFC7231("Sun, 06 Nov 1994 08:49:37 GMT"),
            MakeTime(year{1994} / 11 / 6, hours{8}, minutes{49}, seconds{37}));
  EXPECT_EQ(TryParseTimeRFC7231("  Sun, 06 Nov 1994 08:49:37 GMT "),
            MakeTime(year{1994} / 11 / 6, hours{8}, minutes{49}, seconds{37}));
}

TEST(TimeStringRFC7231Test, ParseInvalid) {
  EXPECT_EQ(TryParseTimeRFC7231(""), kInvalidTimePoint);
  EXPECT_EQ(TryParseTimeRFC7231("Sunday, 06-Nov-94 08:49:37 GMT"), kInvalidTimePoint);
  EXPECT_EQ(TryParseTimeRFC7231("Mon, 06 Nov 1994 08:49:37 GMT"), kInvalidTimePoint);  // wrong weekday
  EXPECT_EQ(TryParseTimeRFC7231("Sun, 06 Nox 1994 08:49:37 GMT"), kInvalidTimePoint);
  EXPECT_EQ(TryParseTimeRFC7231("Sun, 06 Nov 1994 24:49:37 GMT"), kInvalidTimePoint);
  EXPECT_EQ(TryParseTimeRFC7231("Sun, 06 Nov 1994 08:49:37 UTC"), kInvalidTimePoint);
  EXPECT_EQ(TryParseTimeRFC7231("Thu, 31 Feb 2025 08:49:37 GMT"), kInvalidTimePoint);
}

TEST(TimeStringRFC7231Test, FormatThenParse) {
  char buf[kRFC7231DateStrLen];
  const auto tp = MakeTime(year{2030} / 7 / 19, hours{23}, minutes{59}, seconds{59});
  TimeToStringRFC7231(tp, buf);
  EXPECT_EQ(TryParseTimeRFC7231(std::string_view(buf, sizeof(buf))), tp);
}

}  // namespace quay
