/**
 * @file time_zones.hpp
 * @brief Time-zone reference meridians used for solar time correction.
 * @author Watosn
 */
#pragma once

#include <optional>
#include <string_view>
#include <vector>

namespace groundtemp::weather {

struct TimeZoneEntry {
  int utc_offset_h{};
  double reference_longitude_deg{};  // degrees east
  std::string_view label{};
};

/**
 * @brief Selectable time zones, index order matches the CLI `tz` argument.
 */
[[nodiscard]] const std::vector<TimeZoneEntry>& time_zone_table();

/**
 * @brief Reference longitude of a time-zone index, empty if out of range.
 */
[[nodiscard]] std::optional<double> reference_longitude_deg(int tz_index);

/**
 * @brief Solar-time longitude correction `longm - longz` in degrees.
 * @param zone_longitude_deg Time-zone meridian, degrees east.
 * @param site_longitude_deg Mean sample longitude, degrees east.
 * @note The +/-180 meridian is taken on the site's side of the date line.
 */
[[nodiscard]] double longitude_correction_deg(double zone_longitude_deg, double site_longitude_deg);

}  // namespace groundtemp::weather
