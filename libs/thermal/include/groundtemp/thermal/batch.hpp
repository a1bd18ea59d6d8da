/**
 * @file batch.hpp
 * @brief Equivalence-class grouping, parallel group solves and result fan-out.
 * @author Watosn
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

#include "groundtemp/core/types.hpp"
#include "groundtemp/models/evapotranspiration.hpp"
#include "groundtemp/models/ground_depth_temperature.hpp"
#include "groundtemp/models/material.hpp"
#include "groundtemp/thermal/equilibrium_solver.hpp"
#include "groundtemp/weather/daily_profile.hpp"

namespace groundtemp::thermal {

/**
 * @brief One sample of the spatial grid.
 */
struct PointSample {
  std::string id{};
  double x{};
  double y{};
  groundtemp::core::GeographicPoint location{};
  groundtemp::models::SurfaceMaterial material{};
  /// 1 = fully sunlit, 0 = fully shaded.
  groundtemp::core::HourlySeries sunlit_fraction{};
};

/**
 * @brief Material identity plus the exact shading sequence.
 *
 * Points with equal keys receive bitwise-identical series.
 */
struct EquivalenceKey {
  std::string material{};
  groundtemp::core::HourlySeries sunlit_fraction{};

  bool operator==(const EquivalenceKey& other) const {
    return material == other.material && sunlit_fraction == other.sunlit_fraction;
  }
  bool operator<(const EquivalenceKey& other) const {
    if (material != other.material) {
      return material < other.material;
    }
    return sunlit_fraction < other.sunlit_fraction;
  }
};

[[nodiscard]] EquivalenceKey make_key(const PointSample& point);

/**
 * @brief Compact key description for log messages.
 */
[[nodiscard]] std::string describe_key(const EquivalenceKey& key);

struct EquivalenceGroup {
  EquivalenceKey key{};
  /// Index of the point whose material and location drive the solve.
  std::size_t representative{};
  std::vector<std::size_t> members{};
};

struct SimplifiedProblem {
  std::vector<EquivalenceGroup> groups{};
  /// Points excluded before grouping (invalid material or shading).
  std::vector<std::size_t> rejected{};
  std::vector<groundtemp::core::Status> point_status{};
  /// Grouped points whose material properties differ from their representative's.
  std::vector<std::size_t> property_conflicts{};
};

/**
 * @brief Group valid points by equivalence key, in key order.
 * @note A member whose properties differ from the representative's is solved with the
 *       representative's and listed in `property_conflicts`.
 */
[[nodiscard]] SimplifiedProblem simplify(const std::vector<PointSample>& points);

struct GroupSolution {
  EquivalenceKey key{};
  SolvedSeries series{};
};

/**
 * @brief Per-point output row.
 */
struct PointResult {
  std::string id{};
  double x{};
  double y{};
  groundtemp::core::GeographicPoint location{};
  SolvedSeries series{};
  groundtemp::core::Status status{groundtemp::core::Status::Ok};
};

/**
 * @brief Copy each group's series onto all of its members, in input order.
 * @param solutions One entry per group of `simplified`, same order.
 */
[[nodiscard]] std::vector<PointResult> broadcast(const std::vector<PointSample>& points,
                                                 const SimplifiedProblem& simplified,
                                                 const std::vector<GroupSolution>& solutions);

struct BatchSummary {
  std::size_t points{};
  std::size_t groups{};
  std::size_t converged{};
  std::size_t unconverged{};
  std::size_t fixed{};
  std::size_t failed{};
  std::size_t cancelled{};
  std::size_t rejected_points{};
};

struct BatchResult {
  std::vector<PointResult> points{};
  BatchSummary summary{};
  groundtemp::core::Status status{groundtemp::core::Status::Ok};
};

/**
 * @brief Runs the full surface temperature pipeline for a point set and one day.
 */
class BatchRunner final {
 public:
  struct Config {
    /// Worker threads, 0 = hardware concurrency.
    int threads{0};
    EquilibriumSolver::Config solver{};
    groundtemp::models::GroundDepthTemperatureModel::Config ground{};
    /// `site_longitude_deg` is replaced by the mean longitude of the valid points.
    groundtemp::models::PenmanMonteithModel::Config evapotranspiration{};
  };

  BatchRunner() = default;
  explicit BatchRunner(const Config& config) : config_(config) {}

  /**
   * @brief Build the forcing of one group and solve it.
   */
  [[nodiscard]] SolvedSeries solve_group(const PointSample& representative,
                                         const EquivalenceKey& key,
                                         const groundtemp::weather::DailyWeatherProfile& profile,
                                         const groundtemp::models::PenmanMonteithModel& evapotranspiration) const;

  /**
   * @brief Simplify, solve every group in parallel, then broadcast.
   * @param cancel Optional flag checked before each group starts.
   */
  [[nodiscard]] BatchResult run(const std::vector<PointSample>& points,
                                const groundtemp::weather::DailyWeatherProfile& profile,
                                const std::atomic<bool>* cancel = nullptr) const;

 private:
  Config config_{};
};

}  // namespace groundtemp::thermal
