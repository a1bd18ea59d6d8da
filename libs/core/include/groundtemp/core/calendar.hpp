/**
 * @file calendar.hpp
 * @brief Day-of-year helpers on the fixed 365-day calendar.
 * @author Watosn
 */
#pragma once

#include <array>

#include "groundtemp/core/types.hpp"

namespace groundtemp::core {

/**
 * @brief True if month/day fall inside 1..12 and 1..31.
 * @note Does not check per-month lengths; missing days are caught by the weather lookup.
 */
inline bool is_valid_calendar_day(const CalendarDay& d) {
  return d.month >= 1 && d.month <= 12 && d.day >= 1 && d.day <= 31;
}

/**
 * @brief Cumulative day ordinal (1 = January 1st), leap days ignored.
 */
inline int day_of_year(const CalendarDay& d) {
  constexpr std::array<int, 12> kDaysInMonth{31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  int t = 0;
  for (int m = 1; m < d.month && m <= 12; ++m) {
    t += kDaysInMonth[static_cast<std::size_t>(m - 1)];
  }
  return t + d.day;
}

}  // namespace groundtemp::core
