/**
 * @file epw_weather_provider.cpp
 * @brief EPW weather record parsing and representative-day extraction.
 * @author Watosn
 */

#include "groundtemp/weather/epw_weather_provider.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

#include "groundtemp/core/calendar.hpp"
#include "groundtemp/core/constants.hpp"
#include "groundtemp/core/series_utils.hpp"

namespace groundtemp::weather {
namespace {

using groundtemp::core::Status;

constexpr std::size_t kMinEpwColumns = 14;
constexpr std::size_t kYearCol = 0;
constexpr std::size_t kMonthCol = 1;
constexpr std::size_t kDayCol = 2;
constexpr std::size_t kHourCol = 3;
constexpr std::size_t kDryBulbCol = 6;
constexpr std::size_t kRelativeHumidityCol = 8;
constexpr std::size_t kGlobalHorizontalCol = 13;

std::vector<std::string> split_csv_line(const std::string& line) {
  std::vector<std::string> fields;
  fields.reserve(40);
  std::string token;
  std::stringstream ss(line);
  while (std::getline(ss, token, ',')) {
    fields.push_back(token);
  }
  return fields;
}

bool is_all_digits(const std::string& text) {
  return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool parse_double(const std::string& text, double& value) {
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  value = std::strtod(text.c_str(), &end);
  return end != text.c_str() && *end == '\0' && std::isfinite(value);
}

bool parse_int(const std::string& text, int& value) {
  if (text.empty()) {
    return false;
  }
  char* end = nullptr;
  const long v = std::strtol(text.c_str(), &end, 10);
  if (end == text.c_str() || *end != '\0') {
    return false;
  }
  value = static_cast<int>(v);
  return true;
}

bool hour_in_range(int hour) { return hour >= 1 && hour <= static_cast<int>(groundtemp::core::kHoursPerDay); }

bool record_in_range(const EpwWeatherProvider::HourlyRecord& r) {
  return r.month >= 1 && r.month <= 12 && r.day >= 1 && r.day <= 31 && hour_in_range(r.hour) &&
         std::isfinite(r.dry_bulb_c) && std::isfinite(r.relative_humidity_pct) && std::isfinite(r.global_horizontal_whm2);
}

bool parse_record(const std::vector<std::string>& fields, EpwWeatherProvider::HourlyRecord& out) {
  if (fields.size() < kMinEpwColumns) {
    return false;
  }
  if (!parse_int(fields[kYearCol], out.year) || !parse_int(fields[kMonthCol], out.month) ||
      !parse_int(fields[kDayCol], out.day) || !parse_int(fields[kHourCol], out.hour) ||
      !parse_double(fields[kDryBulbCol], out.dry_bulb_c) ||
      !parse_double(fields[kRelativeHumidityCol], out.relative_humidity_pct) ||
      !parse_double(fields[kGlobalHorizontalCol], out.global_horizontal_whm2)) {
    return false;
  }
  return record_in_range(out);
}

DailyWeatherProfile failed_profile(const groundtemp::core::CalendarDay& day, Status status) {
  return DailyWeatherProfile{.day = day, .status = status};
}

}  // namespace

double sky_temperature_k(double dry_bulb_c) {
  const double power_term = dry_bulb_c > 0.0 ? 0.037536 * std::pow(dry_bulb_c, 1.5) : 0.0;
  return groundtemp::core::round_to(power_term + 0.32 * dry_bulb_c + groundtemp::core::constants::kCelsiusToKelvin, 2);
}

std::unique_ptr<EpwWeatherProvider> EpwWeatherProvider::Create(const Config& config) {
  std::ifstream in(config.epw_file);
  if (!in) {
    return std::unique_ptr<EpwWeatherProvider>(new EpwWeatherProvider({}, Status::DataUnavailable));
  }

  std::vector<HourlyRecord> records;
  records.reserve(8784);
  std::string line;
  bool in_data = false;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    const auto fields = split_csv_line(line);
    if (!in_data) {
      // EPW header rows (LOCATION, DESIGN CONDITIONS, ...) precede the first numeric row.
      if (fields.empty() || !is_all_digits(fields.front())) {
        continue;
      }
      in_data = true;
    }
    HourlyRecord rec{};
    if (!parse_record(fields, rec)) {
      return std::unique_ptr<EpwWeatherProvider>(new EpwWeatherProvider({}, Status::DataFormatError));
    }
    records.push_back(rec);
  }

  if (records.empty()) {
    return std::unique_ptr<EpwWeatherProvider>(new EpwWeatherProvider({}, Status::DataFormatError));
  }
  return FromRecords(std::move(records));
}

std::unique_ptr<EpwWeatherProvider> EpwWeatherProvider::FromRecords(std::vector<HourlyRecord> records) {
  Status status = records.empty() ? Status::DataFormatError : Status::Ok;
  if (!std::all_of(records.begin(), records.end(), record_in_range)) {
    status = Status::DataFormatError;
  }
  return std::unique_ptr<EpwWeatherProvider>(new EpwWeatherProvider(std::move(records), status));
}

DailyWeatherProfile EpwWeatherProvider::profile(const groundtemp::core::CalendarDay& day) const {
  using groundtemp::core::constants::kCelsiusToKelvin;
  using groundtemp::core::kHoursPerDay;

  if (status_ != Status::Ok) {
    return failed_profile(day, status_);
  }
  if (!groundtemp::core::is_valid_calendar_day(day)) {
    return failed_profile(day, Status::InvalidInput);
  }

  // First row of each hour in file order; every hour 1..24 must be present.
  std::array<const HourlyRecord*, kHoursPerDay> day_rows{};
  for (const auto& r : records_) {
    if (r.month == day.month && r.day == day.day && hour_in_range(r.hour)) {
      auto& slot = day_rows[static_cast<std::size_t>(r.hour - 1)];
      if (slot == nullptr) {
        slot = &r;
      }
    }
  }
  if (std::any_of(day_rows.begin(), day_rows.end(), [](const HourlyRecord* r) { return r == nullptr; })) {
    return failed_profile(day, Status::DataFormatError);
  }

  DailyWeatherProfile out{.day = day, .day_of_year = groundtemp::core::day_of_year(day)};
  for (std::size_t h = 0; h < kHoursPerDay; ++h) {
    const auto& r = *day_rows[h];
    out.air_temperature_k[h] = r.dry_bulb_c + kCelsiusToKelvin;
    out.solar_radiation_whm2[h] = r.global_horizontal_whm2;
    out.sky_temperature_k[h] = sky_temperature_k(r.dry_bulb_c);
    out.relative_humidity_pct[h] = r.relative_humidity_pct;
  }

  std::array<double, kHoursPerDay> sum_k{};
  std::array<int, kHoursPerDay> count{};
  double t_max_k = -std::numeric_limits<double>::infinity();
  double t_min_k = std::numeric_limits<double>::infinity();
  for (const auto& r : records_) {
    if (!hour_in_range(r.hour)) {
      return failed_profile(day, Status::DataFormatError);
    }
    const double t_k = r.dry_bulb_c + kCelsiusToKelvin;
    const auto h = static_cast<std::size_t>(r.hour - 1);
    sum_k[h] += t_k;
    ++count[h];
    t_max_k = std::max(t_max_k, t_k);
    t_min_k = std::min(t_min_k, t_k);
  }
  for (std::size_t h = 0; h < kHoursPerDay; ++h) {
    if (count[h] == 0) {
      return failed_profile(day, Status::DataFormatError);
    }
    out.t_year_k[h] = sum_k[h] / static_cast<double>(count[h]);
    out.delta_t_k[h] = std::max(t_max_k - out.t_year_k[h], out.t_year_k[h] - t_min_k);
  }
  out.status = Status::Ok;
  return out;
}

}  // namespace groundtemp::weather
