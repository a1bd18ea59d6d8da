/**
 * @file series_utils.hpp
 * @brief Hourly series rounding and summary helpers.
 * @author Watosn
 */
#pragma once

#include <algorithm>
#include <cmath>

#include "groundtemp/core/types.hpp"

namespace groundtemp::core {

/**
 * @brief Daily min/mean/max of an hourly series.
 */
struct SeriesStats {
  double min{};
  double mean{};
  double max{};
};

/**
 * @brief Round half away from zero to a fixed number of decimals.
 */
inline double round_to(double value, int decimals) {
  const double scale = std::pow(10.0, decimals);
  return std::round(value * scale) / scale;
}

inline bool all_finite(const HourlySeries& s) {
  return std::all_of(s.begin(), s.end(), [](double v) { return std::isfinite(v); });
}

/**
 * @brief Min/max of the series and its arithmetic mean rounded to `mean_decimals`.
 */
inline SeriesStats series_stats(const HourlySeries& s, int mean_decimals = 2) {
  const auto [lo, hi] = std::minmax_element(s.begin(), s.end());
  double sum = 0.0;
  for (const double v : s) {
    sum += v;
  }
  return SeriesStats{.min = *lo, .mean = round_to(sum / static_cast<double>(s.size()), mean_decimals), .max = *hi};
}

}  // namespace groundtemp::core
