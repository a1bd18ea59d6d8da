/**
 * @file evapotranspiration.cpp
 * @brief Hourly Penman-Monteith implementation (FAO Irrigation and Drainage Paper 56, ch. 3-4).
 * @author Watosn
 */

#include "groundtemp/models/evapotranspiration.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>

#include "groundtemp/core/constants.hpp"
#include "groundtemp/weather/time_zones.hpp"

namespace groundtemp::models {
namespace {

using namespace groundtemp::core::constants;

constexpr double kKelvinOffsetFao = 273.3;
constexpr double kDayWindCoeff = 0.24;
constexpr double kNightWindCoeff = 0.96;
constexpr double kDaySoilHeatFraction = 0.1;
constexpr double kNightSoilHeatFraction = 0.5;

double saturation_vapor_pressure_kpa(double t_c) { return 0.6108 * std::exp(17.27 * t_c / (t_c + 237.3)); }

/// Seasonal correction for solar time, hours.
double seasonal_correction_h(int day_of_year) {
  const double b = 2.0 * kPi * (static_cast<double>(day_of_year) - 81.0) / 364.0;
  return 0.1645 * std::sin(2.0 * b) - 0.1255 * std::cos(b) - 0.025 * std::sin(b);
}

}  // namespace

double PenmanMonteithModel::wind_speed_2m_mps() const {
  return config_.reference_wind_mps * (4.87 / std::log(67.8 * config_.wind_height_m - 5.42));
}

EvapotranspirationResult PenmanMonteithModel::evaluate(const groundtemp::weather::DailyWeatherProfile& profile,
                                                       double latitude_deg,
                                                       double albedo) const {
  if (profile.status != groundtemp::core::Status::Ok) {
    return EvapotranspirationResult{.status = profile.status};
  }
  if (!std::isfinite(latitude_deg) || std::abs(latitude_deg) > 90.0 || !std::isfinite(albedo) ||
      config_.wind_height_m * 67.8 - 5.42 <= 1.0) {
    return EvapotranspirationResult{.status = groundtemp::core::Status::InvalidInput};
  }

  const double t = static_cast<double>(profile.day_of_year);
  const double u2 = wind_speed_2m_mps();
  const double pressure_kpa = 101.3 * std::pow((293.0 - 0.0065 * config_.altitude_m) / 293.0, 5.26);
  const double gamma = 0.000665 * pressure_kpa;
  const double dr = 1.0 + 0.033 * std::cos(2.0 * kPi / kDaysPerYear * t);
  const double decl = 0.409 * std::sin(2.0 * kPi / kDaysPerYear * t - 1.39);
  const double sc = seasonal_correction_h(profile.day_of_year);
  const double lon_corr =
      groundtemp::weather::longitude_correction_deg(config_.zone_longitude_deg, config_.site_longitude_deg);

  const double phi = kPi / 180.0 * latitude_deg;
  const double ws = std::acos(std::clamp(-std::tan(phi) * std::tan(decl), -1.0, 1.0));
  const double clear_sky_factor = 0.75 + 2.0e-5 * config_.altitude_m;

  EvapotranspirationResult out{.sunset_hour_angle_rad = ws, .declination_rad = decl};
  for (std::size_t h = 0; h < groundtemp::core::kHoursPerDay; ++h) {
    const double tm = profile.air_temperature_k[h] - kKelvinOffsetFao;
    const double rs = profile.solar_radiation_whm2[h] * kWhm2ToMJm2;
    const double rns = (1.0 - albedo) * rs;

    const double es = saturation_vapor_pressure_kpa(tm);
    const double ea = es * (profile.relative_humidity_pct[h] / 100.0);
    const double delta = 4098.0 * es / ((tm + 237.3) * (tm + 237.3));
    const double tt = (37.0 / (tm + 273.0)) * u2;
    const double longwave_base = kStefanBoltzmannMJm2hK4 * std::pow(tm + 273.16, 4) * (0.34 - 0.14 * std::sqrt(ea));

    const double mid_hour = static_cast<double>(h) + 0.5;
    const double w = kPi / 12.0 * ((mid_hour + 0.06667 * lon_corr + sc) - 12.0);
    const double w1 = w - kPi / 24.0;
    const double w2 = w + kPi / 24.0;
    const bool day = w > -ws && w < ws;

    double ratio = kNightClearSkyRatio;
    double soil_fraction = kNightSoilHeatFraction;
    double wind_coeff = kNightWindCoeff;
    if (day) {
      const double ra = (12.0 * 60.0 / kPi) * 0.0820 * dr *
                        ((w2 - w1) * std::sin(phi) * std::sin(decl) +
                         std::cos(phi) * std::cos(decl) * (std::sin(w2) - std::sin(w1)));
      const double rso = clear_sky_factor * ra;
      if (rso > 0.0) {
        ratio = rs / rso;
      }
      soil_fraction = kDaySoilHeatFraction;
      wind_coeff = kDayWindCoeff;
    }

    const double rnl = longwave_base * (1.35 * ratio - 0.35);
    const double rn = rns - rnl;
    const double g = soil_fraction * rn;
    const double rng = 0.408 * rn - g;
    const double denom = delta + gamma * (1.0 + wind_coeff * u2);
    const double et_rad = (delta / denom) * rng;
    const double et_wind = (gamma / denom) * tt * (es - ea);

    const double flux = (et_rad + et_wind) * kLatentHeatVaporizationJkg / kSecondsPerHour;
    if (!std::isfinite(flux)) {
      return EvapotranspirationResult{.status = groundtemp::core::Status::NumericalError};
    }
    out.flux_wm2[h] = std::max(flux, 0.0);
    out.daytime[h] = day;
  }
  return out;
}

}  // namespace groundtemp::models
