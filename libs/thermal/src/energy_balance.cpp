/**
 * @file energy_balance.cpp
 * @brief Surface energy balance coefficients and root finder implementation.
 * @author Watosn
 */

#include "groundtemp/thermal/energy_balance.hpp"

#include <algorithm>
#include <cmath>

#include <Eigen/Dense>

#include "groundtemp/core/constants.hpp"

namespace groundtemp::thermal {
namespace {

using groundtemp::core::Status;

constexpr double kImagTolerance = 1.0e-9;

double derivative(const EnergyBalanceCoefficients& k, double t) { return k.b + 4.0 * k.c * t * t * t; }

bool accepted(double t, const RootSolverConfig& config) {
  return std::isfinite(t) && t >= config.accept_min_k && t <= config.accept_max_k;
}

RootResult polish(const EnergyBalanceCoefficients& k, double t, const RootSolverConfig& config) {
  for (int i = 0; i < 8; ++i) {
    const double fx = energy_balance_residual(k, t);
    if (std::abs(fx) <= config.residual_tolerance) {
      break;
    }
    const double dfx = derivative(k, t);
    if (!(std::abs(dfx) > 0.0)) {
      break;
    }
    t -= fx / dfx;
  }
  if (!accepted(t, config)) {
    return RootResult{.status = Status::NumericalError};
  }
  return RootResult{.temperature_k = t, .used_companion_fallback = true, .status = Status::Ok};
}

}  // namespace

EnergyBalanceCoefficients energy_balance_coefficients(const groundtemp::models::SurfaceMaterial& material,
                                                      const SurfaceForcing& forcing,
                                                      std::size_t hour,
                                                      double previous_temperature_k,
                                                      double convection_wm2k) {
  using groundtemp::core::constants::kSecondsPerHour;
  using groundtemp::core::constants::kStefanBoltzmannWm2K4;

  const double conduction = material.lambda_w_mk / material.thickness_m;
  const double storage = material.cv_j_m3k * material.thickness_m / kSecondsPerHour;
  const double gh = forcing.solar_radiation_whm2[hour];
  const double absorbed_share = 1.0 - material.albedo;
  const double tsky = forcing.sky_temperature_k[hour];
  const double tsky2 = tsky * tsky;

  const double absorbed = kDirectRadiationShare * gh * forcing.sunlit_fraction[hour] * absorbed_share +
                          kDiffuseRadiationShare * gh * absorbed_share;
  const double a = -absorbed - material.emissivity * kStefanBoltzmannWm2K4 * tsky2 * tsky2 -
                   convection_wm2k * forcing.air_temperature_k[hour] - conduction * forcing.ground_temperature_k[hour] -
                   storage * previous_temperature_k + forcing.latent_flux_wm2[hour] * material.kc;

  return EnergyBalanceCoefficients{
      .a = a, .b = convection_wm2k + conduction + storage, .c = material.emissivity * kStefanBoltzmannWm2K4};
}

std::vector<double> quartic_real_roots(const EnergyBalanceCoefficients& k) {
  if (!(std::abs(k.c) > 0.0) || !(std::abs(k.a) > 0.0)) {
    return {};
  }
  // T = s u with s^4 = |A/C| gives the monic u^4 + (B / (C s^3)) u + sign(A) = 0.
  const double s = std::pow(std::abs(k.a / k.c), 0.25);
  const double p = k.b / (k.c * s * s * s);
  const double q = k.a > 0.0 ? 1.0 : -1.0;

  Eigen::Matrix4d companion = Eigen::Matrix4d::Zero();
  companion(1, 0) = 1.0;
  companion(2, 1) = 1.0;
  companion(3, 2) = 1.0;
  companion(0, 3) = -q;
  companion(1, 3) = -p;

  const Eigen::EigenSolver<Eigen::Matrix4d> solver(companion, false);
  if (solver.info() != Eigen::Success) {
    return {};
  }
  std::vector<double> roots;
  const auto& ev = solver.eigenvalues();
  for (Eigen::Index i = 0; i < ev.size(); ++i) {
    const double re = ev(i).real();
    const double im = ev(i).imag();
    if (std::abs(im) <= kImagTolerance * std::max(1.0, std::abs(re))) {
      roots.push_back(s * re);
    }
  }
  std::sort(roots.begin(), roots.end());
  return roots;
}

RootResult solve_surface_temperature(const EnergyBalanceCoefficients& k,
                                     double initial_guess_k,
                                     const RootSolverConfig& config) {
  if (!std::isfinite(k.a) || !std::isfinite(k.b) || !std::isfinite(k.c) || !std::isfinite(initial_guess_k)) {
    return RootResult{.status = Status::InvalidInput};
  }
  if (!(k.b > 0.0) || k.c < 0.0 || !(k.a < 0.0)) {
    // No positive root on the increasing branch.
    return RootResult{.status = Status::NumericalError};
  }

  double lo = 0.0;
  double hi = -k.a / k.b;
  double x = std::clamp(initial_guess_k, config.search_min_k, config.search_max_k);
  if (!(x > lo && x < hi)) {
    x = 0.5 * (lo + hi);
  }

  for (int it = 1; it <= config.max_iterations; ++it) {
    const double fx = energy_balance_residual(k, x);
    if (std::abs(fx) <= config.residual_tolerance) {
      if (!accepted(x, config)) {
        return RootResult{.temperature_k = x, .iterations = it, .status = Status::NumericalError};
      }
      return RootResult{.temperature_k = x, .iterations = it, .status = Status::Ok};
    }
    if (fx < 0.0) {
      lo = x;
    } else {
      hi = x;
    }
    double next = x - fx / derivative(k, x);
    if (!(next > lo && next < hi)) {
      next = 0.5 * (lo + hi);
    }
    if (next == x) {
      break;
    }
    x = next;
  }

  const auto roots = quartic_real_roots(k);
  for (const double r : roots) {
    if (r > 0.0) {
      auto out = polish(k, r, config);
      out.iterations = config.max_iterations;
      return out;
    }
  }
  return RootResult{.iterations = config.max_iterations, .status = Status::NumericalError};
}

}  // namespace groundtemp::thermal
