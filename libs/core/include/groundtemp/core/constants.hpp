/**
 * @file constants.hpp
 * @brief Shared physical constants for surface energy balance models.
 * @author Watosn
 */
#pragma once

namespace groundtemp::core::constants {

inline constexpr double kPi = 3.14159265358979323846;
inline constexpr double kCelsiusToKelvin = 273.15;
inline constexpr double kStefanBoltzmannWm2K4 = 5.67e-8;
inline constexpr double kStefanBoltzmannMJm2hK4 = 2.043e-10;
inline constexpr double kLatentHeatVaporizationJkg = 2260000.0;
inline constexpr double kSecondsPerHour = 3600.0;
inline constexpr double kSecondsPerDay = 86400.0;
inline constexpr double kDaysPerYear = 365.0;
inline constexpr double kWhm2ToMJm2 = 0.0036;

}  // namespace groundtemp::core::constants
