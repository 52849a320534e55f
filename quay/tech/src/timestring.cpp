#include "quay/timestring.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iterator>
#include <utility>

#include "quay/simple-charconv.hpp"
#include "quay/timedef.hpp"

namespace quay {

namespace {

constexpr bool IsDigit(char ch) { return ch >= '0' && ch <= '9'; }

constexpr bool IsBlank(char ch) { return ch == ' ' || ch == '\t'; }

// Packs 3 chars into a comparable integer (only used for fixed tokens like month and weekday names).
constexpr uint32_t Pack3(const char* ptr) {
  return (static_cast<uint32_t>(static_cast<unsigned char>(ptr[0])) << 16U) |
         (static_cast<uint32_t>(static_cast<unsigned char>(ptr[1])) << 8U) |
         static_cast<uint32_t>(static_cast<unsigned char>(ptr[2]));
}

}  // namespace

SysTimePoint TryParseTimeRFC7231(const char* begPtr, const char* endPtr) {
  while (begPtr < endPtr && IsBlank(*begPtr)) {
    ++begPtr;
  }
  while (endPtr > begPtr && IsBlank(*(endPtr - 1))) {
    --endPtr;
  }

  if (std::cmp_not_equal(endPtr - begPtr, kRFC7231DateStrLen)) {
    return kInvalidTimePoint;  // only the strict IMF-fixdate form is accepted
  }

  const char* ptr = begPtr;
  if (ptr[3] != ',' || ptr[4] != ' ' || ptr[7] != ' ' || ptr[11] != ' ' || ptr[16] != ' ' || ptr[19] != ':' ||
      ptr[22] != ':' || ptr[25] != ' ') {
    return kInvalidTimePoint;
  }

  static constexpr int kDigitPositions[] = {5, 6, 12, 13, 14, 15, 17, 18, 20, 21, 23, 24};
  if (!std::ranges::all_of(kDigitPositions, [ptr](int pos) { return IsDigit(ptr[pos]); })) {
    return kInvalidTimePoint;
  }

  if (Pack3(ptr + 26) != Pack3("GMT")) {
    return kInvalidTimePoint;
  }

  static constexpr uint32_t kMonthsRep[]{
      Pack3("Jan"), Pack3("Feb"), Pack3("Mar"), Pack3("Apr"), Pack3("May"), Pack3("Jun"),
      Pack3("Jul"), Pack3("Aug"), Pack3("Sep"), Pack3("Oct"), Pack3("Nov"), Pack3("Dec"),
  };
  static constexpr uint32_t kWeekdaysRep[]{Pack3("Sun"), Pack3("Mon"), Pack3("Tue"), Pack3("Wed"),
                                           Pack3("Thu"), Pack3("Fri"), Pack3("Sat")};

  const auto monthIt = std::ranges::find(kMonthsRep, Pack3(ptr + 8));
  const auto weekdayIt = std::ranges::find(kWeekdaysRep, Pack3(ptr));
  if (monthIt == std::end(kMonthsRep) || weekdayIt == std::end(kWeekdaysRep)) {
    return kInvalidTimePoint;
  }

  const int dayValue = read2(ptr + 5);
  const int yearValue = read4(ptr + 12);
  const int hourValue = read2(ptr + 17);
  const int minuteValue = read2(ptr + 20);
  const int secondValue = read2(ptr + 23);

  if (hourValue > 23 || minuteValue > 59 || secondValue > 60) {
    return kInvalidTimePoint;
  }

  const std::chrono::year_month_day ymd{
      std::chrono::year{yearValue},
      std::chrono::month{static_cast<unsigned>(monthIt - std::begin(kMonthsRep)) + 1U},
      std::chrono::day{static_cast<unsigned>(dayValue)}};
  if (!ymd.ok()) {
    return kInvalidTimePoint;
  }

  const std::chrono::sys_days dayPoint{ymd};
  if (static_cast<unsigned>(weekdayIt - std::begin(kWeekdaysRep)) != std::chrono::weekday{dayPoint}.c_encoding()) {
    return kInvalidTimePoint;
  }

  return dayPoint + std::chrono::hours{hourValue} + std::chrono::minutes{minuteValue} +
         std::chrono::seconds{secondValue};
}

}  // namespace quay
