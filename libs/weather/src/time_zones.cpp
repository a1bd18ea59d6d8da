/**
 * @file time_zones.cpp
 * @brief Time-zone reference meridian table.
 * @author Watosn
 */

#include "groundtemp/weather/time_zones.hpp"

#include <cstddef>

namespace groundtemp::weather {

const std::vector<TimeZoneEntry>& time_zone_table() {
  static const std::vector<TimeZoneEntry> kTable{
      {0, 0.0, "UTC+0 Greenwich London, Lisbon, Abidjan"},
      {-1, -15.0, "UTC-1 Azores, Cabo Verde"},
      {-2, -30.0, "UTC-2"},
      {-3, -45.0, "UTC-3 Greenland, Brasilia, Buenos Aires"},
      {-4, -60.0, "UTC-4 Santiago, Caracas, La Paz"},
      {-5, -75.0, "UTC-5 Montreal, New York, Lima, Havana"},
      {-6, -90.0, "UTC-6 Chicago, Mexico, Dallas"},
      {-7, -105.0, "UTC-7 Denver, Edmonton"},
      {-8, -120.0, "UTC-8 Los Angeles, Vancouver"},
      {-9, -135.0, "UTC-9 Alaska"},
      {-10, -150.0, "UTC-10 French Polynesia, Hawaii"},
      {-11, -165.0, "UTC-11 Tonga"},
      {12, 180.0, "UTC-12/+12 Auckland, Fiji, Marshall Islands"},
      {11, 165.0, "UTC+11 New Caledonia, Solomon Islands"},
      {10, 150.0, "UTC+10 Sydney, Melbourne"},
      {9, 135.0, "UTC+9 Tokyo, Seoul, Central Australia"},
      {8, 120.0, "UTC+8 Beijing, Hong Kong, West Australia"},
      {7, 105.0, "UTC+7 Thailand, Vietnam"},
      {6, 90.0, "UTC+6 Nur-Sultan, Bangladesh"},
      {5, 75.0, "UTC+5 Uzbekistan, Pakistan, New Delhi"},
      {4, 60.0, "UTC+4 Tehran, Oman"},
      {3, 45.0, "UTC+3 Moscow, Istanbul, Nairobi"},
      {2, 30.0, "UTC+2 Kyiv, Cairo, Cape Town"},
      {1, 15.0, "UTC+1 Berlin, Paris, Madrid, Algiers"},
  };
  return kTable;
}

std::optional<double> reference_longitude_deg(int tz_index) {
  const auto& table = time_zone_table();
  if (tz_index < 0 || static_cast<std::size_t>(tz_index) >= table.size()) {
    return std::nullopt;
  }
  return table[static_cast<std::size_t>(tz_index)].reference_longitude_deg;
}

double longitude_correction_deg(double zone_longitude_deg, double site_longitude_deg) {
  double longz = zone_longitude_deg;
  if (longz > 170.0 && site_longitude_deg < 0.0) {
    longz = -longz;
  }
  return site_longitude_deg - longz;
}

}  // namespace groundtemp::weather
