/**
 * @file ground_depth_temperature.cpp
 * @brief Deep-ground boundary temperature implementation.
 * @author Watosn
 */

#include "groundtemp/models/ground_depth_temperature.hpp"

#include <cmath>
#include <cstddef>

#include "groundtemp/core/constants.hpp"
#include "groundtemp/core/series_utils.hpp"

namespace groundtemp::models {

GroundTemperatureResult GroundDepthTemperatureModel::evaluate(const SurfaceMaterial& material,
                                                              const groundtemp::weather::DailyWeatherProfile& profile) const {
  using namespace groundtemp::core::constants;
  if (profile.status != groundtemp::core::Status::Ok) {
    return GroundTemperatureResult{.status = profile.status};
  }
  if (!(material.lambda_w_mk > 0.0) || !(material.cv_j_m3k > 0.0) || config_.burial_depth_m < 0.0) {
    return GroundTemperatureResult{.status = groundtemp::core::Status::InvalidInput};
  }

  const double dh = (material.lambda_w_mk / material.cv_j_m3k) * kSecondsPerDay;
  const double w = 2.0 * kPi / kDaysPerYear;
  const double zo = std::sqrt(2.0 * dh / w);
  const double z_ratio = config_.burial_depth_m / zo;
  const double attenuation = std::exp(-z_ratio);
  const double phase = std::cos(w * static_cast<double>(profile.day_of_year) - z_ratio);

  GroundTemperatureResult out{.diffusivity_m2_day = dh, .damping_depth_m = zo};
  for (std::size_t h = 0; h < groundtemp::core::kHoursPerDay; ++h) {
    out.temperature_k[h] = profile.t_year_k[h] - profile.delta_t_k[h] * attenuation * phase;
  }
  if (!groundtemp::core::all_finite(out.temperature_k)) {
    return GroundTemperatureResult{.status = groundtemp::core::Status::NumericalError};
  }
  return out;
}

}  // namespace groundtemp::models
