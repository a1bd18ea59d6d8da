/**
 * @file equilibrium_solver.cpp
 * @brief Diurnal-cycle surface temperature solver implementation.
 * @author Watosn
 */

#include "groundtemp/thermal/equilibrium_solver.hpp"

#include <cmath>
#include <cstddef>

#include "groundtemp/core/constants.hpp"

namespace groundtemp::thermal {
namespace {

using groundtemp::core::Status;
using groundtemp::core::constants::kCelsiusToKelvin;

constexpr double kSunlitWarmStartFraction = 0.4;
constexpr double kWarmingStepK = 1.0;
constexpr double kCoolingStepK = 0.5;

SolvedSeries make_result(const groundtemp::core::HourlySeries& history_k, double seed_k, int cycles, bool converged) {
  SolvedSeries out{.temperature_k = history_k, .seed_temperature_k = seed_k, .cycles = cycles, .converged = converged};
  for (std::size_t h = 0; h < groundtemp::core::kHoursPerDay; ++h) {
    out.temperature_c[h] = groundtemp::core::round_to(history_k[h] - kCelsiusToKelvin, 2);
  }
  out.stats = groundtemp::core::series_stats(out.temperature_c);
  return out;
}

bool finite_forcing(const SurfaceForcing& f) {
  using groundtemp::core::all_finite;
  return all_finite(f.sunlit_fraction) && all_finite(f.solar_radiation_whm2) && all_finite(f.sky_temperature_k) &&
         all_finite(f.air_temperature_k) && all_finite(f.ground_temperature_k) && all_finite(f.latent_flux_wm2);
}

}  // namespace

EquilibriumSolver::State EquilibriumSolver::initial_state() const {
  return Iterating{.cycles_completed = 0, .seed_k = config_.initial_seed_c + kCelsiusToKelvin};
}

EquilibriumSolver::CyclePass EquilibriumSolver::run_cycle(const ThermalProblem& problem, double seed_k) const {
  CyclePass pass{};
  double previous_k = seed_k;
  for (std::size_t h = 0; h < groundtemp::core::kHoursPerDay; ++h) {
    double guess_k = previous_k - kCoolingStepK;
    if (h > 0 && problem.forcing.sunlit_fraction[h] > kSunlitWarmStartFraction) {
      guess_k = previous_k + kWarmingStepK;
    }
    const auto k = energy_balance_coefficients(problem.material, problem.forcing, h, previous_k, config_.convection_wm2k);
    const auto root = solve_surface_temperature(k, guess_k, config_.root);
    if (root.status != Status::Ok) {
      pass.status = root.status;
      pass.failed_hour = static_cast<int>(h);
      return pass;
    }
    pass.history_k[h] = root.temperature_k;
    previous_k = root.temperature_k;
  }
  return pass;
}

EquilibriumSolver::State EquilibriumSolver::step(const State& state, const ThermalProblem& problem) const {
  const auto* iterating = std::get_if<Iterating>(&state);
  if (iterating == nullptr) {
    return state;
  }

  const auto pass = run_cycle(problem, iterating->seed_k);
  if (pass.status != Status::Ok) {
    return Failed{.status = pass.status, .cycles_completed = iterating->cycles_completed, .hour = pass.failed_hour};
  }

  const int cycles = iterating->cycles_completed + 1;
  const double last_k = pass.history_k.back();
  const double error_c = std::abs(last_k - iterating->seed_k);
  if (cycles >= config_.min_cycles && error_c < config_.threshold_c) {
    return Converged{.result = make_result(pass.history_k, iterating->seed_k, cycles, true)};
  }
  if (cycles >= config_.max_cycles) {
    return Unconverged{.result = make_result(pass.history_k, iterating->seed_k, cycles, false), .last_error_c = error_c};
  }
  return Iterating{.cycles_completed = cycles, .seed_k = last_k, .history_k = pass.history_k};
}

SolvedSeries EquilibriumSolver::solve(const ThermalProblem& problem) const {
  const auto& material = problem.material;
  const Status material_status = groundtemp::models::validate_material(material);
  if (material_status != Status::Ok) {
    return SolvedSeries{.status = material_status};
  }

  if (material.has_fixed_temperature()) {
    SolvedSeries out{.seed_temperature_k = material.fixed_temperature_c + kCelsiusToKelvin,
                     .converged = true,
                     .fixed_temperature = true};
    out.temperature_c.fill(material.fixed_temperature_c);
    out.temperature_k.fill(material.fixed_temperature_c + kCelsiusToKelvin);
    out.stats = groundtemp::core::SeriesStats{
        .min = material.fixed_temperature_c, .mean = material.fixed_temperature_c, .max = material.fixed_temperature_c};
    return out;
  }

  if (!finite_forcing(problem.forcing) || config_.max_cycles < 1 || config_.min_cycles < 1) {
    return SolvedSeries{.status = Status::InvalidInput};
  }

  State state = initial_state();
  while (!is_terminal(state)) {
    state = step(state, problem);
  }

  if (const auto* done = std::get_if<Converged>(&state)) {
    return done->result;
  }
  if (const auto* capped = std::get_if<Unconverged>(&state)) {
    return capped->result;
  }
  const auto& failed = std::get<Failed>(state);
  return SolvedSeries{.cycles = failed.cycles_completed, .status = failed.status};
}

}  // namespace groundtemp::thermal
