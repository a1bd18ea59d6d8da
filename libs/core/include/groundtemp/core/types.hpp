/**
 * @file types.hpp
 * @brief Core domain types for groundtemp.
 * @author Watosn
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace groundtemp::core {

inline constexpr std::size_t kHoursPerDay = 24;

/**
 * @brief One value per hour of day, index 0 is EPW hour 1 (00:00-01:00).
 */
using HourlySeries = std::array<double, kHoursPerDay>;

/**
 * @brief Standard status code used by model outputs.
 */
enum class Status : std::uint8_t {
  Ok,
  InvalidInput,
  DataUnavailable,
  DataFormatError,
  MissingMaterialProperty,
  NumericalError,
  Cancelled
};

/**
 * @brief Short human-readable status name for logs and CSV output.
 */
inline const char* status_name(Status status) {
  switch (status) {
    case Status::Ok:
      return "ok";
    case Status::InvalidInput:
      return "invalid_input";
    case Status::DataUnavailable:
      return "data_unavailable";
    case Status::DataFormatError:
      return "data_format_error";
    case Status::MissingMaterialProperty:
      return "missing_material_property";
    case Status::NumericalError:
      return "numerical_error";
    case Status::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

/**
 * @brief Calendar day selector for the simulated day.
 */
struct CalendarDay {
  int month{7};
  int day{21};
};

/**
 * @brief Geographic location of a sample, degrees east/north.
 */
struct GeographicPoint {
  double lon_deg{};
  double lat_deg{};
};

}  // namespace groundtemp::core
