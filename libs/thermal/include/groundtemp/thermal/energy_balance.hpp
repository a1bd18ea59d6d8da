/**
 * @file energy_balance.hpp
 * @brief Surface energy balance A + B T + C T^4 = 0 and its root finder.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <vector>

#include "groundtemp/core/types.hpp"
#include "groundtemp/models/material.hpp"

namespace groundtemp::thermal {

inline constexpr double kDefaultConvectionCoefficientWm2K = 5.0;

/// Share of global radiation treated as direct (scaled by the sunlit fraction).
inline constexpr double kDirectRadiationShare = 0.8;
/// Share of global radiation treated as diffuse (received even when shaded).
inline constexpr double kDiffuseRadiationShare = 0.2;

/**
 * @brief Hourly forcing seen by one equivalence class.
 */
struct SurfaceForcing {
  groundtemp::core::HourlySeries sunlit_fraction{};
  groundtemp::core::HourlySeries solar_radiation_whm2{};
  groundtemp::core::HourlySeries sky_temperature_k{};
  groundtemp::core::HourlySeries air_temperature_k{};
  groundtemp::core::HourlySeries ground_temperature_k{};
  groundtemp::core::HourlySeries latent_flux_wm2{};
};

struct EnergyBalanceCoefficients {
  double a{};
  double b{};
  double c{};
};

/**
 * @brief Coefficients of the balance for one hour.
 * @param material Surface layer properties.
 * @param forcing Hourly forcing.
 * @param hour Hour of day 0..23.
 * @param previous_temperature_k Surface temperature one hour earlier.
 * @param convection_wm2k Convective exchange coefficient hc.
 */
[[nodiscard]] EnergyBalanceCoefficients energy_balance_coefficients(const groundtemp::models::SurfaceMaterial& material,
                                                                     const SurfaceForcing& forcing,
                                                                     std::size_t hour,
                                                                     double previous_temperature_k,
                                                                     double convection_wm2k = kDefaultConvectionCoefficientWm2K);

[[nodiscard]] inline double energy_balance_residual(const EnergyBalanceCoefficients& k, double temperature_k) {
  const double t2 = temperature_k * temperature_k;
  return k.a + k.b * temperature_k + k.c * t2 * t2;
}

/**
 * @brief Root finder settings.
 *
 * The initial guess is clamped to the search band; the returned root must lie in the accept band.
 */
struct RootSolverConfig {
  double search_min_k{200.0};
  double search_max_k{340.0};
  double accept_min_k{150.0};
  double accept_max_k{450.0};
  double residual_tolerance{1.0e-9};
  int max_iterations{100};
};

struct RootResult {
  double temperature_k{};
  int iterations{};
  bool used_companion_fallback{};
  groundtemp::core::Status status{groundtemp::core::Status::Ok};
};

/**
 * @brief Find the positive root of A + B T + C T^4.
 *
 * With B > 0, C >= 0 and A < 0 the polynomial is increasing on T > 0 and has exactly one
 * positive root, bracketed by [0, -A/B]. Newton steps are taken from the warm start and
 * replaced by bisection whenever they leave the bracket. If that does not converge the
 * real roots of the companion matrix are used instead.
 */
[[nodiscard]] RootResult solve_surface_temperature(const EnergyBalanceCoefficients& k,
                                                   double initial_guess_k,
                                                   const RootSolverConfig& config = {});

/**
 * @brief Real roots of C T^4 + B T + A from the eigenvalues of its companion matrix.
 * @return Roots in ascending order, empty if C == 0 or A == 0.
 */
[[nodiscard]] std::vector<double> quartic_real_roots(const EnergyBalanceCoefficients& k);

}  // namespace groundtemp::thermal
