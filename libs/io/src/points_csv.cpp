/**
 * @file points_csv.cpp
 * @brief Point table reader and result writer.
 * @author Watosn
 */

#include "groundtemp/io/points_csv.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>

#include <fmt/format.h>

namespace groundtemp::io {
namespace {

using groundtemp::core::kHoursPerDay;
using groundtemp::core::Status;

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> fields;
  std::string token;
  std::stringstream ss(line);
  while (std::getline(ss, token, ',')) {
    fields.push_back(token);
  }
  // getline drops a trailing empty field
  if (!line.empty() && line.back() == ',') {
    fields.emplace_back();
  }
  return fields;
}

std::string trim(const std::string& s) {
  const auto first = s.find_first_not_of(" \t\"");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = s.find_last_not_of(" \t\"");
  return s.substr(first, last - first + 1);
}

bool parse_double(const std::string& text, double& value) {
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  value = std::strtod(text.c_str(), &end);
  return end != text.c_str() && *end == '\0';
}

/// Material fields: missing or NaN both end up as NaN.
double material_field(const std::string& text) {
  double v = 0.0;
  return parse_double(text, v) ? v : kNaN;
}

}  // namespace

groundtemp::core::HourlySeries fill_shading(const std::array<std::optional<double>, kHoursPerDay>& raw,
                                            const NightShadingConfig& config) {
  groundtemp::core::HourlySeries out{};
  double last = config.night_value;
  for (std::size_t h = 0; h < kHoursPerDay; ++h) {
    if (raw[h].has_value()) {
      out[h] = *raw[h];
      last = *raw[h];
    } else {
      out[h] = config.convention == NightShadingConvention::HoldLast ? last : config.night_value;
    }
  }
  return out;
}

PointTable read_points_csv(const PointCsvConfig& config) {
  std::ifstream in(config.csv_file);
  if (!in) {
    return PointTable{.status = Status::DataUnavailable};
  }

  std::string line;
  std::size_t line_no = 0;
  std::unordered_map<std::string, std::size_t> column;
  while (std::getline(in, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    const auto header = split_csv_line(line);
    for (std::size_t i = 0; i < header.size(); ++i) {
      column.emplace(trim(header[i]), i);
    }
    break;
  }

  const char* required[] = {"id", "x", "y", "lon", "lat", "material", "alb", "em", "cv", "lambd", "ep", "kc", "fixed_temp_c"};
  for (const char* name : required) {
    if (column.find(name) == column.end()) {
      return PointTable{.status = Status::DataFormatError};
    }
  }
  std::array<std::size_t, kHoursPerDay> shading_col{};
  for (std::size_t h = 0; h < kHoursPerDay; ++h) {
    const auto it = column.find(fmt::format("s{}", h + 1));
    if (it == column.end()) {
      return PointTable{.status = Status::DataFormatError};
    }
    shading_col[h] = it->second;
  }

  PointTable out{};
  while (std::getline(in, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    const auto fields = split_csv_line(line);
    const auto field = [&](const char* name) -> std::string {
      const std::size_t idx = column.at(name);
      return idx < fields.size() ? trim(fields[idx]) : std::string{};
    };

    groundtemp::thermal::PointSample p{};
    p.id = field("id");
    if (p.id.empty() || !parse_double(field("x"), p.x) || !parse_double(field("y"), p.y) ||
        !parse_double(field("lon"), p.location.lon_deg) || !parse_double(field("lat"), p.location.lat_deg)) {
      out.malformed_lines.push_back(line_no);
      continue;
    }

    p.material.name = field("material");
    p.material.albedo = material_field(field("alb"));
    p.material.emissivity = material_field(field("em"));
    p.material.cv_j_m3k = material_field(field("cv"));
    p.material.lambda_w_mk = material_field(field("lambd"));
    p.material.thickness_m = material_field(field("ep"));
    p.material.kc = material_field(field("kc"));
    const std::string fixed = field("fixed_temp_c");
    p.material.fixed_temperature_c = fixed.empty() ? 0.0 : material_field(fixed);

    std::array<std::optional<double>, kHoursPerDay> raw{};
    bool shading_ok = true;
    for (std::size_t h = 0; h < kHoursPerDay; ++h) {
      const std::size_t idx = shading_col[h];
      const std::string text = idx < fields.size() ? trim(fields[idx]) : std::string{};
      if (text.empty()) {
        continue;
      }
      double v = 0.0;
      if (!parse_double(text, v) || !std::isfinite(v)) {
        shading_ok = false;
        break;
      }
      raw[h] = v;
    }
    if (!shading_ok) {
      out.malformed_lines.push_back(line_no);
      continue;
    }
    p.sunlit_fraction = fill_shading(raw, config.night);
    out.points.push_back(std::move(p));
  }
  return out;
}

groundtemp::core::Status write_results_csv(const std::filesystem::path& csv_file,
                                           const std::vector<groundtemp::thermal::PointResult>& results) {
  std::ofstream out(csv_file);
  if (!out) {
    return Status::DataUnavailable;
  }
  out << "id,x,y";
  for (std::size_t h = 1; h <= kHoursPerDay; ++h) {
    out << ",t" << h;
  }
  out << ",min_c,mean_c,max_c,cycles,converged\n";

  for (const auto& r : results) {
    if (r.status != Status::Ok) {
      continue;
    }
    out << fmt::format("{},{:.6f},{:.6f}", r.id, r.x, r.y);
    for (const double t : r.series.temperature_c) {
      out << fmt::format(",{:.2f}", t);
    }
    out << fmt::format(",{:.2f},{:.2f},{:.2f},{},{}\n", r.series.stats.min, r.series.stats.mean, r.series.stats.max,
                       r.series.cycles, r.series.converged ? 1 : 0);
  }
  return out ? Status::Ok : Status::DataUnavailable;
}

}  // namespace groundtemp::io
