#pragma once
#include <string_view>
#include <vector>
#include "model/Availability.hpp"

namespace rtop::collectors {

// CPU package temperature: hwmon CPU sensors first, then thermal zones.
class ThermalCollector {
public:
  rtop::model::Reading<double> cpu_package_c();
};

// Hottest /sys/class/thermal/thermal_zone* whose type contains one of the
// keys (case-insensitive). Values are millidegrees C.
rtop::model::Reading<double> read_thermal_zones(const std::vector<std::string_view>& type_keys);

// Millidegree or degree reading normalized to degrees C.
double normalize_celsius(double raw);

} // namespace rtop::collectors
