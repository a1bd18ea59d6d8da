/**
 * @file batch.cpp
 * @brief Equivalence-class grouping, parallel group solves and result fan-out.
 * @author Watosn
 */

#include "groundtemp/thermal/batch.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <map>
#include <thread>
#include <utility>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

namespace groundtemp::thermal {
namespace {

using groundtemp::core::Status;

Status validate_point(const PointSample& p) {
  const Status material_status = groundtemp::models::validate_material(p.material);
  if (material_status != Status::Ok) {
    return material_status;
  }
  for (const double s : p.sunlit_fraction) {
    if (!std::isfinite(s) || s < 0.0 || s > 1.0) {
      return Status::InvalidInput;
    }
  }
  return Status::Ok;
}

bool same_properties(const groundtemp::models::SurfaceMaterial& a, const groundtemp::models::SurfaceMaterial& b) {
  return a.albedo == b.albedo && a.emissivity == b.emissivity && a.cv_j_m3k == b.cv_j_m3k &&
         a.lambda_w_mk == b.lambda_w_mk && a.thickness_m == b.thickness_m && a.kc == b.kc &&
         a.fixed_temperature_c == b.fixed_temperature_c;
}

int resolve_thread_count(int requested) {
  if (requested > 0) {
    return requested;
  }
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0U ? static_cast<int>(hw) : 1;
}

}  // namespace

EquivalenceKey make_key(const PointSample& point) {
  return EquivalenceKey{.material = point.material.name, .sunlit_fraction = point.sunlit_fraction};
}

std::string describe_key(const EquivalenceKey& key) {
  return fmt::format("{}[{}]", key.material, fmt::join(key.sunlit_fraction, ","));
}

SimplifiedProblem simplify(const std::vector<PointSample>& points) {
  SimplifiedProblem out{};
  out.point_status.assign(points.size(), Status::Ok);

  std::map<EquivalenceKey, std::size_t> index_by_key;
  for (std::size_t i = 0; i < points.size(); ++i) {
    const Status status = validate_point(points[i]);
    if (status != Status::Ok) {
      out.point_status[i] = status;
      out.rejected.push_back(i);
      continue;
    }
    auto key = make_key(points[i]);
    const auto it = index_by_key.find(key);
    if (it != index_by_key.end()) {
      auto& group = out.groups[it->second];
      const auto& representative = points[group.representative];
      if (!same_properties(points[i].material, representative.material)) {
        spdlog::warn("point {} uses material '{}' with properties differing from point {}, solved with the latter",
                     points[i].id, points[i].material.name, representative.id);
        out.property_conflicts.push_back(i);
      }
      group.members.push_back(i);
      continue;
    }
    index_by_key.emplace(key, out.groups.size());
    out.groups.push_back(EquivalenceGroup{.key = std::move(key), .representative = i, .members = {i}});
  }

  std::sort(out.groups.begin(), out.groups.end(),
            [](const EquivalenceGroup& a, const EquivalenceGroup& b) { return a.key < b.key; });
  return out;
}

std::vector<PointResult> broadcast(const std::vector<PointSample>& points,
                                   const SimplifiedProblem& simplified,
                                   const std::vector<GroupSolution>& solutions) {
  std::vector<PointResult> out;
  out.reserve(points.size());
  for (std::size_t i = 0; i < points.size(); ++i) {
    const auto& p = points[i];
    const Status status = i < simplified.point_status.size() ? simplified.point_status[i] : Status::InvalidInput;
    out.push_back(PointResult{.id = p.id, .x = p.x, .y = p.y, .location = p.location, .status = status});
  }
  const std::size_t n = std::min(simplified.groups.size(), solutions.size());
  for (std::size_t g = 0; g < n; ++g) {
    for (const std::size_t m : simplified.groups[g].members) {
      out[m].series = solutions[g].series;
      out[m].status = solutions[g].series.status;
    }
  }
  return out;
}

SolvedSeries BatchRunner::solve_group(const PointSample& representative,
                                      const EquivalenceKey& key,
                                      const groundtemp::weather::DailyWeatherProfile& profile,
                                      const groundtemp::models::PenmanMonteithModel& evapotranspiration) const {
  ThermalProblem problem{.material = representative.material};
  problem.forcing.sunlit_fraction = key.sunlit_fraction;
  problem.forcing.solar_radiation_whm2 = profile.solar_radiation_whm2;
  problem.forcing.sky_temperature_k = profile.sky_temperature_k;
  problem.forcing.air_temperature_k = profile.air_temperature_k;

  if (!problem.material.has_fixed_temperature()) {
    const groundtemp::models::GroundDepthTemperatureModel ground(config_.ground);
    const auto tint = ground.evaluate(problem.material, profile);
    if (tint.status != Status::Ok) {
      return SolvedSeries{.status = tint.status};
    }
    const auto et = evapotranspiration.evaluate(profile, representative.location.lat_deg, problem.material.albedo);
    if (et.status != Status::Ok) {
      return SolvedSeries{.status = et.status};
    }
    problem.forcing.ground_temperature_k = tint.temperature_k;
    problem.forcing.latent_flux_wm2 = et.flux_wm2;
  }

  const EquilibriumSolver solver(config_.solver);
  return solver.solve(problem);
}

BatchResult BatchRunner::run(const std::vector<PointSample>& points,
                             const groundtemp::weather::DailyWeatherProfile& profile,
                             const std::atomic<bool>* cancel) const {
  if (profile.status != Status::Ok) {
    return BatchResult{.status = profile.status};
  }

  const SimplifiedProblem simplified = simplify(points);
  for (const std::size_t i : simplified.rejected) {
    spdlog::warn("point {} excluded: {}", points[i].id, groundtemp::core::status_name(simplified.point_status[i]));
  }

  double lon_sum = 0.0;
  std::size_t lon_count = 0;
  for (const auto& g : simplified.groups) {
    for (const std::size_t m : g.members) {
      lon_sum += points[m].location.lon_deg;
      ++lon_count;
    }
  }
  auto et_config = config_.evapotranspiration;
  if (lon_count > 0) {
    et_config.site_longitude_deg = lon_sum / static_cast<double>(lon_count);
  }
  const groundtemp::models::PenmanMonteithModel evapotranspiration(et_config);

  const auto& groups = simplified.groups;
  std::vector<GroupSolution> solutions(groups.size());
  const int threads = resolve_thread_count(config_.threads);
  spdlog::info("solving {} equivalence groups for {} points on {} threads", groups.size(), points.size(), threads);

  // Each iteration writes only its own slot of `solutions`.
  const auto group_count = static_cast<std::ptrdiff_t>(groups.size());
#pragma omp parallel for schedule(dynamic) num_threads(threads)
  for (std::ptrdiff_t g = 0; g < group_count; ++g) {
    const auto& group = groups[static_cast<std::size_t>(g)];
    auto& slot = solutions[static_cast<std::size_t>(g)];
    slot.key = group.key;
    if (cancel != nullptr && cancel->load(std::memory_order_relaxed)) {
      slot.series.status = Status::Cancelled;
      continue;
    }
    slot.series = solve_group(points[group.representative], group.key, profile, evapotranspiration);
  }

  BatchSummary summary{.points = points.size(), .groups = groups.size(), .rejected_points = simplified.rejected.size()};
  for (const auto& s : solutions) {
    const auto& series = s.series;
    if (series.status == Status::Cancelled) {
      ++summary.cancelled;
    } else if (series.status != Status::Ok) {
      ++summary.failed;
      spdlog::error("group {} failed: {}", describe_key(s.key), groundtemp::core::status_name(series.status));
    } else if (series.fixed_temperature) {
      ++summary.fixed;
    } else if (!series.converged) {
      ++summary.unconverged;
      spdlog::warn("equilibrium not reached after {} cycles for {}", series.cycles, describe_key(s.key));
    } else {
      ++summary.converged;
      spdlog::debug("equilibrium reached after {} cycles for {}", series.cycles, describe_key(s.key));
    }
  }
  if (summary.cancelled > 0) {
    spdlog::warn("run cancelled, {} of {} groups not solved", summary.cancelled, summary.groups);
  }

  return BatchResult{.points = broadcast(points, simplified, solutions),
                     .summary = summary,
                     .status = summary.cancelled > 0 ? Status::Cancelled : Status::Ok};
}

}  // namespace groundtemp::thermal
