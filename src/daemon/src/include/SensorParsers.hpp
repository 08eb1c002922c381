/*
 * HwmonFanControl — parsers for external sensor tool output (header)
 * (c) 2026 HwmonFanControl contributors
 */
#pragma once

#include <optional>
#include <string>

namespace hfc {

/*
 * `sensors -j` output: pick the first chip whose key contains chipMatch
 * (case-insensitive), the feature object named exactly `feature`, and its
 * first "tempN_input" value.
 */
std::optional<double> parseLmSensorsJson(const std::string& text,
                                         const std::string& chipMatch,
                                         const std::string& feature,
                                         std::string* err = nullptr);

/*
 * `smartctl -A` output. Understands
 *   ATA:  "194 Temperature_Celsius 0x0022 036 045 000 Old_age Always - 36 (Min/Max 19/45)"
 *         (also Airflow_Temperature_Cel, Temperature_Internal; RAW_VALUE column)
 *   NVMe: "Temperature:                        36 Celsius"
 *   SCSI: "Current Drive Temperature:     36 C"
 */
std::optional<double> parseSmartctlTemperature(const std::string& text,
                                               std::string* err = nullptr);

/* hwmon tempN_input content (millidegrees Celsius). */
std::optional<double> parseHwmonMillidegrees(const std::string& text);

} // namespace hfc
