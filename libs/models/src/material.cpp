/**
 * @file material.cpp
 * @brief Surface material validation.
 * @author Watosn
 */

#include "groundtemp/models/material.hpp"

#include <cmath>

namespace groundtemp::models {

groundtemp::core::Status validate_material(const SurfaceMaterial& m) {
  const bool finite = std::isfinite(m.albedo) && std::isfinite(m.emissivity) && std::isfinite(m.cv_j_m3k) &&
                      std::isfinite(m.lambda_w_mk) && std::isfinite(m.thickness_m) && std::isfinite(m.kc) &&
                      std::isfinite(m.fixed_temperature_c);
  if (!finite) {
    return groundtemp::core::Status::MissingMaterialProperty;
  }
  if (m.has_fixed_temperature()) {
    return groundtemp::core::Status::Ok;
  }
  if (m.thickness_m <= 0.0 || m.lambda_w_mk <= 0.0 || m.cv_j_m3k <= 0.0) {
    return groundtemp::core::Status::MissingMaterialProperty;
  }
  return groundtemp::core::Status::Ok;
}

}  // namespace groundtemp::models
