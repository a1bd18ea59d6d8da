/**
 * @file test_batch_pipeline.cpp
 * @brief Grouping, parallel solve, fan-out and cancellation checks.
 * @author Watosn
 */

#include <atomic>
#include <cmath>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "groundtemp/thermal/batch.hpp"
#include "groundtemp/weather/epw_weather_provider.hpp"
#include "weather_fixture.hpp"

namespace {

using groundtemp::core::Status;
using groundtemp::thermal::PointSample;

groundtemp::models::SurfaceMaterial concrete() {
  return groundtemp::models::SurfaceMaterial{.name = "concrete",
                                             .albedo = 0.3,
                                             .emissivity = 0.9,
                                             .cv_j_m3k = 2.0e6,
                                             .lambda_w_mk = 1.4,
                                             .thickness_m = 0.1,
                                             .kc = 0.9};
}

PointSample point(const std::string& id, double x, const groundtemp::models::SurfaceMaterial& m, double sunlit) {
  PointSample p{.id = id, .x = x, .y = 2.0 * x, .location = {.lon_deg = 2.35, .lat_deg = 48.85}, .material = m};
  p.sunlit_fraction.fill(sunlit);
  return p;
}

std::vector<PointSample> scene() {
  auto asphalt = concrete();
  asphalt.name = "asphalt";
  asphalt.lambda_w_mk = std::nan("");

  auto water = concrete();
  water.name = "water";
  water.fixed_temperature_c = 18.0;

  std::vector<PointSample> pts;
  pts.push_back(point("a", 0.0, concrete(), 1.0));
  pts.push_back(point("b", 1.0, concrete(), 0.0));
  pts.push_back(point("c", 2.0, concrete(), 1.0));
  pts.push_back(point("d", 3.0, asphalt, 1.0));
  pts.push_back(point("e", 4.0, water, 0.5));
  pts.push_back(point("f", 5.0, concrete(), 1.0));
  pts.push_back(point("g", 6.0, concrete(), 1.5));
  return pts;
}

}  // namespace

int main() {
  namespace fs = std::filesystem;
  const auto pts = scene();

  const auto simplified = groundtemp::thermal::simplify(pts);
  if (simplified.groups.size() != 3 || simplified.rejected.size() != 2 ||
      simplified.point_status[3] != Status::MissingMaterialProperty || simplified.point_status[6] != Status::InvalidInput) {
    spdlog::error("unexpected grouping: groups={} rejected={}", simplified.groups.size(), simplified.rejected.size());
    return 1;
  }
  for (std::size_t g = 1; g < simplified.groups.size(); ++g) {
    if (!(simplified.groups[g - 1].key < simplified.groups[g].key)) {
      spdlog::error("groups not in key order");
      return 2;
    }
  }
  std::size_t members = 0;
  for (const auto& g : simplified.groups) {
    members += g.members.size();
    if (g.key.material == "concrete" && g.key.sunlit_fraction[0] == 1.0 &&
        (g.members != std::vector<std::size_t>{0, 2, 5} || g.representative != 0)) {
      spdlog::error("sunlit concrete group has wrong members");
      return 3;
    }
  }
  if (members != 5) {
    spdlog::error("every valid point must belong to exactly one group");
    return 4;
  }
  if (!simplified.property_conflicts.empty()) {
    spdlog::error("consistent materials reported as conflicting");
    return 20;
  }

  // Same material name with different properties stays in the group and is reported.
  auto conflicting = pts;
  conflicting[5].material.albedo = 0.5;
  const auto conflicted = groundtemp::thermal::simplify(conflicting);
  if (conflicted.groups.size() != 3 || conflicted.property_conflicts != std::vector<std::size_t>{5}) {
    spdlog::error("material property conflict not reported: {}", conflicted.property_conflicts.size());
    return 21;
  }

  const auto provider = groundtemp::weather::EpwWeatherProvider::FromRecords(groundtemp_test::synthetic_year());
  const auto profile = provider->profile({.month = 7, .day = 15});
  if (profile.status != Status::Ok) {
    spdlog::error("profile extraction failed");
    return 5;
  }

  const groundtemp::thermal::BatchRunner runner({.threads = 4});
  const auto result = runner.run(pts, profile);
  if (result.status != Status::Ok || result.points.size() != pts.size()) {
    spdlog::error("batch run failed: {}", groundtemp::core::status_name(result.status));
    return 6;
  }
  const auto& s = result.summary;
  if (s.groups != 3 || s.converged != 2 || s.fixed != 1 || s.failed != 0 || s.rejected_points != 2 || s.cancelled != 0) {
    spdlog::error("unexpected summary: converged={} fixed={} failed={} rejected={}", s.converged, s.fixed, s.failed,
                  s.rejected_points);
    return 7;
  }

  // Output rows follow input order and carry the input coordinates.
  for (std::size_t i = 0; i < pts.size(); ++i) {
    if (result.points[i].id != pts[i].id || result.points[i].x != pts[i].x || result.points[i].y != pts[i].y) {
      spdlog::error("row {} out of order", i);
      return 8;
    }
  }
  const auto& a = result.points[0].series;
  for (const std::size_t i : {std::size_t{2}, std::size_t{5}}) {
    if (result.points[i].series.temperature_c != a.temperature_c ||
        result.points[i].series.temperature_k != a.temperature_k || result.points[i].series.cycles != a.cycles) {
      spdlog::error("equivalent point {} differs from its representative", pts[i].id);
      return 9;
    }
  }
  if (!(result.points[1].series.stats.mean < a.stats.mean)) {
    spdlog::error("shaded concrete should be cooler than sunlit concrete");
    return 10;
  }
  if (result.points[3].status != Status::MissingMaterialProperty || result.points[6].status != Status::InvalidInput) {
    spdlog::error("rejected points must keep their status");
    return 11;
  }
  for (const double t : result.points[4].series.temperature_c) {
    if (t != 18.0) {
      spdlog::error("fixed-temperature point not exact");
      return 12;
    }
  }

  // Thread count does not change any value.
  const groundtemp::thermal::BatchRunner serial({.threads = 1});
  const auto serial_result = serial.run(pts, profile);
  for (std::size_t i = 0; i < pts.size(); ++i) {
    if (serial_result.points[i].series.temperature_k != result.points[i].series.temperature_k ||
        serial_result.points[i].status != result.points[i].status) {
      spdlog::error("parallel and serial runs differ at {}", pts[i].id);
      return 13;
    }
  }

  const std::atomic<bool> cancel{true};
  const auto cancelled = runner.run(pts, profile, &cancel);
  if (cancelled.status != Status::Cancelled || cancelled.summary.cancelled != 3 || cancelled.points[0].status != Status::Cancelled) {
    spdlog::error("cancellation not honoured");
    return 14;
  }

  auto bad_profile = profile;
  bad_profile.status = Status::DataFormatError;
  if (runner.run(pts, bad_profile).status != Status::DataFormatError) {
    spdlog::error("invalid profile should abort the run");
    return 15;
  }

  const auto empty = runner.run({}, profile);
  if (empty.status != Status::Ok || !empty.points.empty() || empty.summary.groups != 0) {
    spdlog::error("empty point set should succeed with no rows");
    return 16;
  }

  // Full chain from an EPW file on disk.
  const auto epw = fs::temp_directory_path() / "groundtemp_batch_test.epw";
  if (!groundtemp_test::write_epw(epw, groundtemp_test::synthetic_year())) {
    spdlog::error("failed to write EPW fixture");
    return 17;
  }
  const auto from_file = groundtemp::weather::EpwWeatherProvider::Create({.epw_file = epw});
  std::error_code ec;
  fs::remove(epw, ec);
  if (from_file->status() != Status::Ok) {
    spdlog::error("EPW fixture unreadable");
    return 18;
  }
  const auto file_result = runner.run(pts, from_file->profile({.month = 7, .day = 15}));
  if (file_result.status != Status::Ok ||
      std::abs(file_result.points[0].series.stats.mean - result.points[0].series.stats.mean) > 0.02) {
    spdlog::error("file-backed run differs from in-memory run");
    return 19;
  }

  return 0;
}
