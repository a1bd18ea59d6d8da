/**
 * @file points_csv.hpp
 * @brief CSV exchange with the point-sampling and rendering collaborators.
 * @author Watosn
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

#include "groundtemp/core/types.hpp"
#include "groundtemp/thermal/batch.hpp"

namespace groundtemp::io {

/**
 * @brief How hours without shading coverage (night) are filled.
 */
enum class NightShadingConvention : std::uint8_t {
  /// Use `night_value` for every uncovered hour.
  FixedValue,
  /// Repeat the last covered earlier hour, `night_value` before the first one.
  HoldLast
};

struct NightShadingConfig {
  NightShadingConvention convention{NightShadingConvention::FixedValue};
  double night_value{0.0};
};

/**
 * @brief Fill uncovered hours of a raw shading row.
 */
[[nodiscard]] groundtemp::core::HourlySeries fill_shading(
    const std::array<std::optional<double>, groundtemp::core::kHoursPerDay>& raw, const NightShadingConfig& config);

struct PointCsvConfig {
  std::filesystem::path csv_file{};
  NightShadingConfig night{};
};

/**
 * @brief Parsed point table.
 */
struct PointTable {
  std::vector<groundtemp::thermal::PointSample> points{};
  /// 1-based line numbers of rows that could not be parsed.
  std::vector<std::size_t> malformed_lines{};
  groundtemp::core::Status status{groundtemp::core::Status::Ok};
};

/**
 * @brief Read `id,x,y,lon,lat,material,alb,em,cv,lambd,ep,kc,fixed_temp_c,s1..s24`.
 *
 * Columns are located by header name. Empty or non-numeric material fields are stored as NaN
 * and rejected later as missing material properties. Empty shading cells are uncovered hours.
 */
[[nodiscard]] PointTable read_points_csv(const PointCsvConfig& config);

/**
 * @brief Write `id,x,y,t1..t24,min_c,mean_c,max_c,cycles,converged` for every solved point.
 * @return `Ok`, or `DataUnavailable` if the file cannot be opened.
 */
[[nodiscard]] groundtemp::core::Status write_results_csv(const std::filesystem::path& csv_file,
                                                         const std::vector<groundtemp::thermal::PointResult>& results);

}  // namespace groundtemp::io
