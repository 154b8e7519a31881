#pragma once

#include <chrono>
#include <cstddef>

#include "turbonet/timedef.hpp"

namespace turbonet {

inline constexpr std::size_t kRFC7231DateStrLen = 29;

namespace detail {

constexpr char* Write2(char* out, unsigned value) {
  *out++ = static_cast<char>('0' + ((value / 10U) % 10U));
  *out++ = static_cast<char>('0' + (value % 10U));
  return out;
}

constexpr char* Copy3(char* out, const char* src) {
  *out++ = src[0];
  *out++ = src[1];
  *out++ = src[2];
  return out;
}

}  // namespace detail

/// Formats a time point as an RFC7231 IMF-fixdate (e.g. "Sun, 06 Nov 1994 08:49:37 GMT"), as used in the Date header.
/// The buffer must have room for kRFC7231DateStrLen chars (no null terminator is written).
/// Returns a pointer past the last written char.
constexpr char* TimeToStringRFC7231(SysTimePoint tp, char* out) {
  using namespace std::chrono;
  constexpr const char* kWeekDays[] = {"Sun", "Mon", "Tue", "Wed", "Thu", "Fri", "Sat"};
  constexpr const char* kMonths[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun",
                                     "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
  const auto secTp = time_point_cast<seconds>(tp);
  const auto dayPoint = floor<days>(secTp);
  const year_month_day ymd{dayPoint};
  const weekday wd{dayPoint};
  const hh_mm_ss hms{secTp - dayPoint};

  out = detail::Copy3(out, kWeekDays[wd.c_encoding()]);
  *out++ = ',';
  *out++ = ' ';
  out = detail::Write2(out, static_cast<unsigned>(ymd.day()));
  *out++ = ' ';
  out = detail::Copy3(out, kMonths[static_cast<unsigned>(ymd.month()) - 1U]);
  *out++ = ' ';
  const auto year = static_cast<unsigned>(static_cast<int>(ymd.year()));
  out = detail::Write2(out, year / 100U);
  out = detail::Write2(out, year % 100U);
  *out++ = ' ';
  out = detail::Write2(out, static_cast<unsigned>(hms.hours().count()));
  *out++ = ':';
  out = detail::Write2(out, static_cast<unsigned>(hms.minutes().count()));
  *out++ = ':';
  out = detail::Write2(out, static_cast<unsigned>(hms.seconds().count()));
  *out++ = ' ';
  return detail::Copy3(out, "GMT");
}

}  // namespace turbonet
