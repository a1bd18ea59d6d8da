/**
 * @file epw_weather_provider.hpp
 * @brief Yearly hourly weather record backed by an EnergyPlus weather (EPW) file.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <memory>
#include <utility>
#include <vector>

#include "groundtemp/core/types.hpp"
#include "groundtemp/weather/daily_profile.hpp"

namespace groundtemp::weather {

/**
 * @brief Parsed EPW record with representative-day extraction.
 */
class EpwWeatherProvider final {
 public:
  /**
   * @brief Hourly fields consumed by the surface models.
   */
  struct HourlyRecord {
    int year{};
    int month{};
    int day{};
    int hour{};  // EPW convention, 1..24
    double dry_bulb_c{};
    double relative_humidity_pct{};
    double global_horizontal_whm2{};
  };

  /**
   * @brief EPW provider configuration.
   */
  struct Config {
    std::filesystem::path epw_file{};
  };

  /**
   * @brief Factory helper that parses and validates EPW input.
   * @note Never returns null; check `status()` before use.
   */
  static std::unique_ptr<EpwWeatherProvider> Create(const Config& config);

  /**
   * @brief Build a provider from already-parsed records.
   * @note Out-of-range month, day or hour, or non-finite values, give `DataFormatError`.
   */
  static std::unique_ptr<EpwWeatherProvider> FromRecords(std::vector<HourlyRecord> records);

  [[nodiscard]] groundtemp::core::Status status() const { return status_; }
  [[nodiscard]] const std::vector<HourlyRecord>& records() const { return records_; }

  /**
   * @brief Extract the target-day profile and the yearly hour-of-day statistics.
   * @param day Target month/day.
   * @return Profile with `status` set; `DataFormatError` if any hour 1..24 of the day is missing.
   */
  [[nodiscard]] DailyWeatherProfile profile(const groundtemp::core::CalendarDay& day) const;

 private:
  EpwWeatherProvider(std::vector<HourlyRecord> records, groundtemp::core::Status status)
      : records_(std::move(records)), status_(status) {}

  std::vector<HourlyRecord> records_{};
  groundtemp::core::Status status_{groundtemp::core::Status::Ok};
};

}  // namespace groundtemp::weather
