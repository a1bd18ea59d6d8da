/**
 * @file evapotranspiration.hpp
 * @brief Hourly FAO-56 Penman-Monteith reference evapotranspiration as a surface heat flux.
 * @author Watosn
 */
#pragma once

#include <array>

#include "groundtemp/core/types.hpp"
#include "groundtemp/weather/daily_profile.hpp"

namespace groundtemp::models {

/// Clear-sky ratio substituted for Rs/Rso in the night-time net longwave term.
inline constexpr double kNightClearSkyRatio = 0.8;

struct EvapotranspirationResult {
  /// Latent heat flux in W/m2, never negative.
  groundtemp::core::HourlySeries flux_wm2{};
  /// True where the hour's solar hour angle lies between -ws and ws.
  std::array<bool, groundtemp::core::kHoursPerDay> daytime{};
  double sunset_hour_angle_rad{};
  double declination_rad{};
  groundtemp::core::Status status{groundtemp::core::Status::Ok};
};

/**
 * @brief Penman-Monteith reference evapotranspiration with a fixed nominal wind speed.
 */
class PenmanMonteithModel final {
 public:
  struct Config {
    double altitude_m{100.0};
    /// Time-zone meridian, degrees east.
    double zone_longitude_deg{15.0};
    /// Mean longitude of the sampled site, degrees east.
    double site_longitude_deg{0.0};
    /// Wind speed at the reference height, 1 km/h by default.
    double reference_wind_mps{0.27};
    double wind_height_m{2.0};
  };

  PenmanMonteithModel() = default;
  explicit PenmanMonteithModel(const Config& config) : config_(config) {}

  /**
   * @brief Evaluate the 24-hour latent heat flux for one location and surface albedo.
   * @param profile Day weather profile (air temperature in K, radiation in Wh/m2, RH in %).
   * @param latitude_deg Latitude of the point, degrees north.
   * @param albedo Surface albedo.
   */
  [[nodiscard]] EvapotranspirationResult evaluate(const groundtemp::weather::DailyWeatherProfile& profile,
                                                  double latitude_deg,
                                                  double albedo) const;

  /**
   * @brief Wind speed at 2 m from the logarithmic wind profile.
   */
  [[nodiscard]] double wind_speed_2m_mps() const;

 private:
  Config config_{};
};

}  // namespace groundtemp::models
