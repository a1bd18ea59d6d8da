/**
 * @file ground_depth_temperature.hpp
 * @brief Deep-ground boundary temperature from annual surface temperature statistics.
 * @author Watosn
 */
#pragma once

#include "groundtemp/core/types.hpp"
#include "groundtemp/models/material.hpp"
#include "groundtemp/weather/daily_profile.hpp"

namespace groundtemp::models {

struct GroundTemperatureResult {
  groundtemp::core::HourlySeries temperature_k{};
  double diffusivity_m2_day{};
  double damping_depth_m{};
  groundtemp::core::Status status{groundtemp::core::Status::Ok};
};

/**
 * @brief Annual heat-wave attenuation model evaluated at a fixed burial depth.
 *
 * Tint[h] = Tyear[h] - DeltaT[h] exp(-Z/Zo) cos(w t - Z/Zo), Zo = sqrt(2 Dh / w), w = 2 pi / 365.
 */
class GroundDepthTemperatureModel final {
 public:
  struct Config {
    double burial_depth_m{0.2};
  };

  GroundDepthTemperatureModel() = default;
  explicit GroundDepthTemperatureModel(const Config& config) : config_(config) {}

  /**
   * @brief Evaluate the boundary temperature series for one material.
   * @param material Material whose conductivity/heat capacity set the diffusivity.
   * @param profile Weather profile carrying day ordinal and yearly statistics.
   */
  [[nodiscard]] GroundTemperatureResult evaluate(const SurfaceMaterial& material,
                                                 const groundtemp::weather::DailyWeatherProfile& profile) const;

 private:
  Config config_{};
};

}  // namespace groundtemp::models
