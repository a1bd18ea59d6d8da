/**
 * @file weather_profile_cli.cpp
 * @brief Prints the representative-day forcing, ground temperature and latent flux tables.
 * @author Watosn
 */

#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <iostream>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "groundtemp/models/evapotranspiration.hpp"
#include "groundtemp/models/ground_depth_temperature.hpp"
#include "groundtemp/weather/epw_weather_provider.hpp"
#include "groundtemp/weather/time_zones.hpp"

int main(int argc, char** argv) {
  if (argc < 2 || argc > 11) {
    spdlog::error("usage: weather_profile_cli <weather_epw> [day] [month] [tz] [altitude_m] [lat_deg] [lon_deg] [albedo] [lambda] [cv]");
    return 1;
  }

  const std::filesystem::path weather_epw = argv[1];
  const groundtemp::core::CalendarDay day{.month = (argc >= 4) ? std::atoi(argv[3]) : 7,
                                          .day = (argc >= 3) ? std::atoi(argv[2]) : 21};
  const int tz_index = (argc >= 5) ? std::atoi(argv[4]) : 23;
  const double altitude_m = (argc >= 6) ? std::atof(argv[5]) : 100.0;
  const double lat_deg = (argc >= 7) ? std::atof(argv[6]) : 48.85;
  const double lon_deg = (argc >= 8) ? std::atof(argv[7]) : 2.35;
  const double albedo = (argc >= 9) ? std::atof(argv[8]) : 0.3;

  groundtemp::models::SurfaceMaterial material{.name = "probe", .albedo = albedo, .emissivity = 0.9};
  material.lambda_w_mk = (argc >= 10) ? std::atof(argv[9]) : 1.4;
  material.cv_j_m3k = (argc >= 11) ? std::atof(argv[10]) : 2.0e6;
  material.thickness_m = 0.1;

  const auto zone_longitude = groundtemp::weather::reference_longitude_deg(tz_index);
  if (!zone_longitude.has_value()) {
    spdlog::error("invalid time-zone index: {}", tz_index);
    return 1;
  }

  const auto weather =
      groundtemp::weather::EpwWeatherProvider::Create(groundtemp::weather::EpwWeatherProvider::Config{.epw_file = weather_epw});
  const auto profile = weather->profile(day);
  if (profile.status != groundtemp::core::Status::Ok) {
    spdlog::error("failed to extract {}/{} from {}: {}", day.day, day.month, weather_epw.string(),
                  groundtemp::core::status_name(profile.status));
    return 2;
  }

  const groundtemp::models::GroundDepthTemperatureModel ground{};
  const auto tint = ground.evaluate(material, profile);
  const groundtemp::models::PenmanMonteithModel et_model(groundtemp::models::PenmanMonteithModel::Config{
      .altitude_m = altitude_m, .zone_longitude_deg = *zone_longitude, .site_longitude_deg = lon_deg});
  const auto et = et_model.evaluate(profile, lat_deg, albedo);
  if (tint.status != groundtemp::core::Status::Ok || et.status != groundtemp::core::Status::Ok) {
    spdlog::error("model evaluation failed: ground={} et={}", groundtemp::core::status_name(tint.status),
                  groundtemp::core::status_name(et.status));
    return 3;
  }

  std::cout << "hour,tair_k,gh_whm2,tsky_k,rh_pct,tyear_k,delta_t_k,tint_k,et0_wm2,daytime\n";
  for (std::size_t h = 0; h < groundtemp::core::kHoursPerDay; ++h) {
    std::cout << fmt::format("{},{:.2f},{:.1f},{:.2f},{:.1f},{:.3f},{:.3f},{:.3f},{:.3f},{}\n", h + 1,
                             profile.air_temperature_k[h], profile.solar_radiation_whm2[h], profile.sky_temperature_k[h],
                             profile.relative_humidity_pct[h], profile.t_year_k[h], profile.delta_t_k[h],
                             tint.temperature_k[h], et.flux_wm2[h], et.daytime[h] ? 1 : 0);
  }
  spdlog::info("day_of_year={} damping_depth_m={:.3f} sunset_hour_angle_rad={:.4f} wind_2m_mps={:.4f}",
               profile.day_of_year, tint.damping_depth_m, et.sunset_hour_angle_rad, et_model.wind_speed_2m_mps());
  return 0;
}
