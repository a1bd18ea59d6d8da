/**
 * @file test_energy_balance.cpp
 * @brief Energy balance coefficients and quartic root finder checks.
 * @author Watosn
 */

#include <cmath>
#include <cstddef>

#include <spdlog/spdlog.h>

#include "groundtemp/thermal/energy_balance.hpp"

namespace {

bool approx(double a, double b, double tol) { return std::abs(a - b) <= tol; }

}  // namespace

int main() {
  using groundtemp::core::Status;
  using namespace groundtemp::thermal;

  const groundtemp::models::SurfaceMaterial concrete{.name = "concrete",
                                                     .albedo = 0.3,
                                                     .emissivity = 0.9,
                                                     .cv_j_m3k = 2.0e6,
                                                     .lambda_w_mk = 1.4,
                                                     .thickness_m = 0.1,
                                                     .kc = 0.9};
  SurfaceForcing forcing{};
  forcing.sunlit_fraction.fill(1.0);
  forcing.solar_radiation_whm2.fill(600.0);
  forcing.sky_temperature_k.fill(284.0);
  forcing.air_temperature_k.fill(295.0);
  forcing.ground_temperature_k.fill(300.0);
  forcing.latent_flux_wm2.fill(100.0);
  forcing.sunlit_fraction[3] = 0.25;

  const auto k = energy_balance_coefficients(concrete, forcing, 0, 301.15);
  const double storage = 2.0e6 * 0.1 / 3600.0;
  const double expected_b = 5.0 + 14.0 + storage;
  const double expected_a = -(0.8 * 600.0 * 1.0 * 0.7 + 0.2 * 600.0 * 0.7) - 0.9 * 5.67e-8 * std::pow(284.0, 4) -
                            5.0 * 295.0 - 14.0 * 300.0 - storage * 301.15 + 100.0 * 0.9;
  if (!approx(k.b, expected_b, 1e-9) || !approx(k.c, 0.9 * 5.67e-8, 1e-20) || !approx(k.a, expected_a, 1e-6)) {
    spdlog::error("coefficient mismatch: a={} b={} c={}", k.a, k.b, k.c);
    return 1;
  }

  // Shaded hour only receives the diffuse share plus 0.8 * sunlit fraction of the direct share.
  const auto shaded = energy_balance_coefficients(concrete, forcing, 3, 301.15);
  if (!approx(shaded.a - k.a, 0.8 * 600.0 * 0.7 * 0.75, 1e-6)) {
    spdlog::error("sunlit fraction weighting mismatch: delta={}", shaded.a - k.a);
    return 2;
  }

  const auto root = solve_surface_temperature(k, 300.65);
  if (root.status != Status::Ok || std::abs(energy_balance_residual(k, root.temperature_k)) >= 1e-6 ||
      root.temperature_k < 200.0 || root.temperature_k > 340.0) {
    spdlog::error("root solve failed: T={} residual={}", root.temperature_k, energy_balance_residual(k, root.temperature_k));
    return 3;
  }

  // Same root from any starting point inside the band.
  for (const double guess : {150.0, 200.0, 250.0, 340.0, 1000.0}) {
    const auto r = solve_surface_temperature(k, guess);
    if (r.status != Status::Ok || !approx(r.temperature_k, root.temperature_k, 1e-8)) {
      spdlog::error("root depends on initial guess {}: {}", guess, r.temperature_k);
      return 4;
    }
  }

  // Companion-matrix roots agree with the Newton root.
  const auto roots = quartic_real_roots(k);
  bool found = false;
  for (const double r : roots) {
    if (r > 0.0 && approx(r, root.temperature_k, 1e-6)) {
      found = true;
    }
  }
  if (roots.size() != 2U || !found) {
    spdlog::error("companion roots mismatch: count={}", roots.size());
    return 5;
  }

  // Without a positive root the solve reports a numerical failure.
  const EnergyBalanceCoefficients no_root{.a = 10.0, .b = 50.0, .c = 5.0e-8};
  if (solve_surface_temperature(no_root, 300.0).status != Status::NumericalError) {
    spdlog::error("positive constant term should have no physical root");
    return 6;
  }
  // A root far outside the accepted band is rejected.
  const EnergyBalanceCoefficients scorching{.a = -50.0 * 1200.0 - 5.0e-8 * std::pow(1200.0, 4), .b = 50.0, .c = 5.0e-8};
  if (solve_surface_temperature(scorching, 300.0).status != Status::NumericalError) {
    spdlog::error("out-of-band root should be rejected");
    return 7;
  }
  const EnergyBalanceCoefficients nan_coeff{.a = std::nan(""), .b = 50.0, .c = 5.0e-8};
  if (solve_surface_temperature(nan_coeff, 300.0).status != Status::InvalidInput) {
    spdlog::error("non-finite coefficients should be rejected");
    return 8;
  }

  // Black-body-free surface reduces to the linear balance.
  const EnergyBalanceCoefficients linear{.a = -50.0 * 290.0, .b = 50.0, .c = 0.0};
  const auto lin = solve_surface_temperature(linear, 300.0);
  if (lin.status != Status::Ok || !approx(lin.temperature_k, 290.0, 1e-9)) {
    spdlog::error("linear balance root mismatch: {}", lin.temperature_k);
    return 9;
  }

  return 0;
}
