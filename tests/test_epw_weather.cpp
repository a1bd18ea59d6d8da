/**
 * @file test_epw_weather.cpp
 * @brief EPW weather provider and representative-day extraction tests.
 * @author Watosn
 */

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <limits>

#include <spdlog/spdlog.h>

#include "groundtemp/weather/epw_weather_provider.hpp"
#include "weather_fixture.hpp"

namespace {

bool approx(double a, double b, double tol) { return std::abs(a - b) <= tol; }

}  // namespace

int main() {
  namespace fs = std::filesystem;
  using groundtemp::core::Status;
  using groundtemp::weather::EpwWeatherProvider;

  const auto records = groundtemp_test::synthetic_year();
  const auto epw = fs::temp_directory_path() / "groundtemp_epw_test.epw";
  if (!groundtemp_test::write_epw(epw, records)) {
    spdlog::error("failed to write epw");
    return 10;
  }

  const auto provider = EpwWeatherProvider::Create({.epw_file = epw});
  if (provider->status() != Status::Ok || provider->records().size() != 8760U) {
    spdlog::error("epw parse failed: status={} rows={}", groundtemp::core::status_name(provider->status()),
                  provider->records().size());
    return 1;
  }

  const auto profile = provider->profile({.month = 7, .day = 15});
  if (profile.status != Status::Ok || profile.day_of_year != 196) {
    spdlog::error("july profile extraction failed: day_of_year={}", profile.day_of_year);
    return 2;
  }
  const std::size_t july15 = static_cast<std::size_t>(195) * 24U;
  for (std::size_t h = 0; h < 24; ++h) {
    const auto& r = records[july15 + h];
    if (!approx(profile.air_temperature_k[h], r.dry_bulb_c + 273.15, 1e-9) ||
        !approx(profile.solar_radiation_whm2[h], r.global_horizontal_whm2, 1e-9) ||
        !approx(profile.relative_humidity_pct[h], r.relative_humidity_pct, 1e-9) ||
        !approx(profile.sky_temperature_k[h], groundtemp::weather::sky_temperature_k(r.dry_bulb_c), 0.0100001)) {
      spdlog::error("profile hour {} mismatch", h);
      return 3;
    }
  }

  if (!approx(groundtemp::weather::sky_temperature_k(20.0), 282.91, 1e-9) ||
      !approx(groundtemp::weather::sky_temperature_k(-5.0), 271.55, 1e-9)) {
    spdlog::error("sky temperature correlation mismatch: {} {}", groundtemp::weather::sky_temperature_k(20.0),
                  groundtemp::weather::sky_temperature_k(-5.0));
    return 4;
  }

  double t_max = -std::numeric_limits<double>::infinity();
  double t_min = std::numeric_limits<double>::infinity();
  for (const auto& r : records) {
    t_max = std::max(t_max, r.dry_bulb_c + 273.15);
    t_min = std::min(t_min, r.dry_bulb_c + 273.15);
  }
  for (std::size_t h = 0; h < 24; ++h) {
    double sum = 0.0;
    for (std::size_t d = 0; d < 365; ++d) {
      sum += records[d * 24U + h].dry_bulb_c + 273.15;
    }
    const double mean = sum / 365.0;
    const double delta = std::max(t_max - mean, mean - t_min);
    if (!approx(profile.t_year_k[h], mean, 1e-8) || !approx(profile.delta_t_k[h], delta, 1e-8)) {
      spdlog::error("yearly statistics mismatch at hour {}: tyear={} expected={}", h, profile.t_year_k[h], mean);
      return 5;
    }
  }

  if (provider->profile({.month = 2, .day = 30}).status != Status::DataFormatError) {
    spdlog::error("absent day should be a data format error");
    return 6;
  }
  if (provider->profile({.month = 13, .day = 1}).status != Status::InvalidInput) {
    spdlog::error("invalid month should be rejected");
    return 7;
  }

  auto partial = records;
  partial.erase(partial.begin() + static_cast<std::ptrdiff_t>(july15 + 5));
  const auto partial_provider = EpwWeatherProvider::FromRecords(partial);
  if (partial_provider->profile({.month = 7, .day = 15}).status != Status::DataFormatError ||
      partial_provider->profile({.month = 7, .day = 16}).status != Status::Ok) {
    spdlog::error("incomplete day handling failed");
    return 8;
  }

  // Records built in memory get the same range checks as parsed ones.
  for (const int bad_hour : {0, 25}) {
    auto out_of_range = records;
    out_of_range.push_back(
        EpwWeatherProvider::HourlyRecord{.year = 2021, .month = 12, .day = 31, .hour = bad_hour, .dry_bulb_c = 1.0});
    const auto bad_provider = EpwWeatherProvider::FromRecords(out_of_range);
    if (bad_provider->status() != Status::DataFormatError ||
        bad_provider->profile({.month = 7, .day = 15}).status != Status::DataFormatError) {
      spdlog::error("hour {} record should be a data format error", bad_hour);
      return 13;
    }
  }
  auto bad_month = records;
  bad_month.front().month = 13;
  if (EpwWeatherProvider::FromRecords(bad_month)->status() != Status::DataFormatError) {
    spdlog::error("month 13 record should be a data format error");
    return 14;
  }

  // 24 rows with a repeated hour leave hour 24 uncovered.
  auto repeated = records;
  repeated[july15 + 23].hour = 5;
  const auto repeated_provider = EpwWeatherProvider::FromRecords(repeated);
  if (repeated_provider->status() != Status::Ok ||
      repeated_provider->profile({.month = 7, .day = 15}).status != Status::DataFormatError) {
    spdlog::error("repeated hour should be a data format error");
    return 15;
  }

  // A duplicate row on top of a complete day is ignored, the first row per hour wins.
  auto duplicated = records;
  auto extra = records[july15 + 4];
  extra.dry_bulb_c += 7.0;
  duplicated.push_back(extra);
  const auto dup_profile = EpwWeatherProvider::FromRecords(duplicated)->profile({.month = 7, .day = 15});
  if (dup_profile.status != Status::Ok ||
      !approx(dup_profile.air_temperature_k[4], records[july15 + 4].dry_bulb_c + 273.15, 1e-9)) {
    spdlog::error("duplicate hour should keep the first row");
    return 16;
  }

  const auto header_only = fs::temp_directory_path() / "groundtemp_epw_header_only.epw";
  {
    std::ofstream out(header_only);
    out << "LOCATION,Nowhere,-,XXX,none,0,0,0,0,0\n";
    out << "DATA PERIODS,1,1,Data,Sunday, 1/ 1,12/31\n";
  }
  if (EpwWeatherProvider::Create({.epw_file = header_only})->status() != Status::DataFormatError) {
    spdlog::error("header-only file should be a data format error");
    return 9;
  }

  const auto malformed = fs::temp_directory_path() / "groundtemp_epw_malformed.epw";
  {
    std::ofstream out(malformed);
    out << "LOCATION,Nowhere,-,XXX,none,0,0,0,0,0\n";
    out << "2021,1,1,1,60,flags,5.0,2.0,80,101300,0,0,300,0\n";
    out << "2021,1,1,2,60,flags,warm,2.0,80,101300,0,0,300,0\n";
  }
  if (EpwWeatherProvider::Create({.epw_file = malformed})->status() != Status::DataFormatError) {
    spdlog::error("malformed row should be a data format error");
    return 11;
  }

  const auto missing = EpwWeatherProvider::Create({.epw_file = fs::temp_directory_path() / "groundtemp_no_such.epw"});
  if (missing->status() != Status::DataUnavailable ||
      missing->profile({.month = 7, .day = 15}).status != Status::DataUnavailable) {
    spdlog::error("missing file should be data unavailable");
    return 12;
  }

  return 0;
}
