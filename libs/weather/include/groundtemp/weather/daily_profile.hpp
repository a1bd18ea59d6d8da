/**
 * @file daily_profile.hpp
 * @brief Representative-day weather profile and yearly hourly statistics.
 * @author Watosn
 */
#pragma once

#include "groundtemp/core/types.hpp"

namespace groundtemp::weather {

/**
 * @brief Hourly forcing for the simulated day plus year-wide hour-of-day statistics.
 *
 * All series are indexed by hour of day 0..23 (EPW hour 1..24).
 */
struct DailyWeatherProfile {
  groundtemp::core::CalendarDay day{};
  int day_of_year{};
  groundtemp::core::HourlySeries air_temperature_k{};
  groundtemp::core::HourlySeries solar_radiation_whm2{};
  groundtemp::core::HourlySeries sky_temperature_k{};
  groundtemp::core::HourlySeries relative_humidity_pct{};
  /// Mean air temperature of each hour of day over the whole record.
  groundtemp::core::HourlySeries t_year_k{};
  /// max(Tmax_year - t_year_k[h], t_year_k[h] - Tmin_year).
  groundtemp::core::HourlySeries delta_t_k{};
  groundtemp::core::Status status{groundtemp::core::Status::Ok};
};

/**
 * @brief Fuentes (1987) clear-sky temperature from dry-bulb air temperature.
 * @param dry_bulb_c Air temperature in degC.
 * @return Sky temperature in K rounded to 0.01 K.
 * @note The fractional power term is dropped below 0 degC where it is undefined.
 */
[[nodiscard]] double sky_temperature_k(double dry_bulb_c);

}  // namespace groundtemp::weather
