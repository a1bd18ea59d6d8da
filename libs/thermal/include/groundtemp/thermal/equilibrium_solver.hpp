/**
 * @file equilibrium_solver.hpp
 * @brief Diurnal-cycle surface temperature solver for one equivalence class.
 * @author Watosn
 */
#pragma once

#include <variant>

#include "groundtemp/core/series_utils.hpp"
#include "groundtemp/core/types.hpp"
#include "groundtemp/models/material.hpp"
#include "groundtemp/thermal/energy_balance.hpp"

namespace groundtemp::thermal {

/**
 * @brief Immutable inputs of one solve.
 */
struct ThermalProblem {
  groundtemp::models::SurfaceMaterial material{};
  SurfaceForcing forcing{};
};

/**
 * @brief Surface temperature series of one equivalence class.
 */
struct SolvedSeries {
  /// Final-cycle surface temperature, degC rounded to 0.01.
  groundtemp::core::HourlySeries temperature_c{};
  /// Final-cycle surface temperature before rounding, K.
  groundtemp::core::HourlySeries temperature_k{};
  /// Temperature preceding hour 0 in the final cycle, K.
  double seed_temperature_k{};
  groundtemp::core::SeriesStats stats{};
  int cycles{};
  bool converged{};
  bool fixed_temperature{};
  groundtemp::core::Status status{groundtemp::core::Status::Ok};
};

/**
 * @brief Iterates the 24-hour energy balance until hour 23 repeats from one cycle to the next.
 *
 * The loop is an explicit state machine. `step` is a pure function of the state and the
 * problem, so the cycle cap and the warning path can be driven directly.
 */
class EquilibriumSolver final {
 public:
  struct Config {
    double convection_wm2k{kDefaultConvectionCoefficientWm2K};
    double initial_seed_c{28.0};
    double threshold_c{0.5};
    int min_cycles{2};
    int max_cycles{25};
    RootSolverConfig root{};
  };

  /// Cycle in progress; `history_k` holds the last completed pass (zero before the first).
  struct Iterating {
    int cycles_completed{};
    double seed_k{};
    groundtemp::core::HourlySeries history_k{};
  };
  struct Converged {
    SolvedSeries result{};
  };
  /// Cycle cap reached above threshold; the result is the last pass.
  struct Unconverged {
    SolvedSeries result{};
    double last_error_c{};
  };
  struct Failed {
    groundtemp::core::Status status{groundtemp::core::Status::NumericalError};
    int cycles_completed{};
    int hour{-1};
  };
  using State = std::variant<Iterating, Converged, Unconverged, Failed>;

  /**
   * @brief One 24-hour pass from a seed temperature.
   */
  struct CyclePass {
    groundtemp::core::HourlySeries history_k{};
    int failed_hour{-1};
    groundtemp::core::Status status{groundtemp::core::Status::Ok};
  };

  EquilibriumSolver() = default;
  explicit EquilibriumSolver(const Config& config) : config_(config) {}

  [[nodiscard]] State initial_state() const;

  /**
   * @brief Advance one cycle. Terminal states are returned unchanged.
   */
  [[nodiscard]] State step(const State& state, const ThermalProblem& problem) const;

  [[nodiscard]] CyclePass run_cycle(const ThermalProblem& problem, double seed_k) const;

  /**
   * @brief Solve the problem, bypassing the iteration for fixed-temperature materials.
   * @return Series with `status`; `converged == false` when the cycle cap was hit.
   */
  [[nodiscard]] SolvedSeries solve(const ThermalProblem& problem) const;

  [[nodiscard]] static bool is_terminal(const State& state) { return !std::holds_alternative<Iterating>(state); }

  [[nodiscard]] const Config& config() const { return config_; }

 private:
  Config config_{};
};

}  // namespace groundtemp::thermal
