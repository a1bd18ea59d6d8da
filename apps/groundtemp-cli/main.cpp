/**
 * @file main.cpp
 * @brief groundtemp surface temperature command-line entrypoint.
 * @author Watosn
 */

#include <cstdlib>
#include <filesystem>
#include <string>

#include <spdlog/spdlog.h>

#include "groundtemp/core/calendar.hpp"
#include "groundtemp/io/points_csv.hpp"
#include "groundtemp/thermal/batch.hpp"
#include "groundtemp/weather/epw_weather_provider.hpp"
#include "groundtemp/weather/time_zones.hpp"

int main(int argc, char** argv) {
  if (argc < 4 || argc > 10) {
    spdlog::error("usage: groundtemp_cli <points_csv> <weather_epw> <output_csv> [day] [month] [tz] [altitude_m] [threads] [night]");
    spdlog::error("points row: id,x,y,lon,lat,material,alb,em,cv,lambd,ep,kc,fixed_temp_c,s1..s24");
    spdlog::error("tz: time-zone index 0..23 (23 = UTC+1), night: zero | hold");
    return 1;
  }

  const std::filesystem::path points_csv = argv[1];
  const std::filesystem::path weather_epw = argv[2];
  const std::filesystem::path output_csv = argv[3];
  const groundtemp::core::CalendarDay day{.month = (argc >= 6) ? std::atoi(argv[5]) : 7,
                                          .day = (argc >= 5) ? std::atoi(argv[4]) : 21};
  const int tz_index = (argc >= 7) ? std::atoi(argv[6]) : 23;
  const double altitude_m = (argc >= 8) ? std::atof(argv[7]) : 100.0;
  const int threads = (argc >= 9) ? std::atoi(argv[8]) : 0;
  const std::string night = (argc >= 10) ? argv[9] : "zero";

  if (!groundtemp::core::is_valid_calendar_day(day)) {
    spdlog::error("invalid day/month: {}/{}", day.day, day.month);
    return 1;
  }
  const auto zone_longitude = groundtemp::weather::reference_longitude_deg(tz_index);
  if (!zone_longitude.has_value()) {
    spdlog::error("invalid time-zone index: {}", tz_index);
    return 1;
  }
  if (night != "zero" && night != "hold") {
    spdlog::error("invalid night convention: {}", night);
    return 1;
  }

  const auto weather =
      groundtemp::weather::EpwWeatherProvider::Create(groundtemp::weather::EpwWeatherProvider::Config{.epw_file = weather_epw});
  if (weather->status() != groundtemp::core::Status::Ok) {
    spdlog::error("failed to read weather file {}: {}", weather_epw.string(), groundtemp::core::status_name(weather->status()));
    return 2;
  }
  const auto profile = weather->profile(day);
  if (profile.status != groundtemp::core::Status::Ok) {
    spdlog::error("weather file has no complete record for {}/{}: {}", day.day, day.month,
                  groundtemp::core::status_name(profile.status));
    return 3;
  }
  spdlog::info("weather: {} hourly records, day-of-year {}", weather->records().size(), profile.day_of_year);

  groundtemp::io::PointCsvConfig points_config{.csv_file = points_csv};
  if (night == "hold") {
    points_config.night.convention = groundtemp::io::NightShadingConvention::HoldLast;
  }
  const auto table = groundtemp::io::read_points_csv(points_config);
  if (table.status != groundtemp::core::Status::Ok) {
    spdlog::error("failed to read points csv {}: {}", points_csv.string(), groundtemp::core::status_name(table.status));
    return 4;
  }
  for (const auto line_no : table.malformed_lines) {
    spdlog::warn("skipping malformed point row {}", line_no);
  }
  spdlog::info("points: {} loaded", table.points.size());

  groundtemp::thermal::BatchRunner::Config config{.threads = threads};
  config.evapotranspiration.altitude_m = altitude_m;
  config.evapotranspiration.zone_longitude_deg = *zone_longitude;
  const groundtemp::thermal::BatchRunner runner(config);
  const auto result = runner.run(table.points, profile);
  if (result.status != groundtemp::core::Status::Ok) {
    spdlog::error("batch run failed: {}", groundtemp::core::status_name(result.status));
    return 5;
  }

  if (groundtemp::io::write_results_csv(output_csv, result.points) != groundtemp::core::Status::Ok) {
    spdlog::error("failed to write output csv: {}", output_csv.string());
    return 6;
  }

  const auto& s = result.summary;
  spdlog::info("groups={} converged={} unconverged={} fixed={} failed={} rejected_points={}", s.groups, s.converged,
               s.unconverged, s.fixed, s.failed, s.rejected_points);
  spdlog::info("wrote surface temperatures: {}", output_csv.string());
  return 0;
}
