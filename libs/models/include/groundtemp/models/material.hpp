/**
 * @file material.hpp
 * @brief Ground surface material properties.
 * @author Watosn
 */
#pragma once

#include <string>

#include "groundtemp/core/types.hpp"

namespace groundtemp::models {

/**
 * @brief Thermal and radiative description of one surface layer.
 */
struct SurfaceMaterial {
  std::string name{};
  double albedo{};
  double emissivity{};
  double cv_j_m3k{};         // volumetric heat capacity
  double lambda_w_mk{};      // thermal conductivity
  double thickness_m{};
  double kc{};               // evapotranspiration coefficient
  double fixed_temperature_c{};  // 0 means not fixed

  [[nodiscard]] bool has_fixed_temperature() const { return fixed_temperature_c != 0.0; }
};

/**
 * @brief Check that every numeric property is present and physically usable.
 * @return `Ok`, or `MissingMaterialProperty` for NaN/inf fields and non-positive
 *         thickness, conductivity or heat capacity.
 */
[[nodiscard]] groundtemp::core::Status validate_material(const SurfaceMaterial& material);

}  // namespace groundtemp::models
