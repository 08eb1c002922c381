/*
 * HwmonFanControl — sensor output parser tests
 * (c) 2026 HwmonFanControl contributors
 */

#include <catch2/catch.hpp>

#include "include/SensorParsers.hpp"

#include <optional>
#include <string>

using hfc::parseHwmonMillidegrees;
using hfc::parseLmSensorsJson;
using hfc::parseSmartctlTemperature;

static const char* kSensorsJson = R"({
   "acpitz-acpi-0":{
      "Adapter": "ACPI interface",
      "temp1":{
         "temp1_input": 27.800,
         "temp1_crit": 119.000
      }
   },
   "coretemp-isa-0000":{
      "Adapter": "ISA adapter",
      "Package id 0":{
         "temp1_input": 47.000,
         "temp1_max": 80.000,
         "temp1_crit": 100.000,
         "temp1_crit_alarm": 0.000
      },
      "Core 0":{
         "temp2_input": 45.000,
         "temp2_max": 80.000
      }
   }
})";

TEST_CASE("parseLmSensorsJson: picks the feature input of the matching chip", "[parsers][lm-sensors]") {
    std::string err;
    auto v = parseLmSensorsJson(kSensorsJson, "coretemp", "Package id 0", &err);
    REQUIRE(v.has_value());
    REQUIRE(*v == Approx(47.0));

    SECTION("chip match is a case-insensitive substring") {
        auto c = parseLmSensorsJson(kSensorsJson, "CoreTemp", "Core 0");
        REQUIRE(c.has_value());
        REQUIRE(*c == Approx(45.0));
    }
}

TEST_CASE("parseLmSensorsJson: reports what is missing", "[parsers][lm-sensors]") {
    std::string err;

    SECTION("unknown chip") {
        REQUIRE_FALSE(parseLmSensorsJson(kSensorsJson, "k10temp", "Tctl", &err).has_value());
        REQUIRE(err.find("k10temp") != std::string::npos);
    }
    SECTION("unknown feature") {
        REQUIRE_FALSE(parseLmSensorsJson(kSensorsJson, "coretemp", "Package id 1", &err).has_value());
        REQUIRE(err.find("Package id 1") != std::string::npos);
    }
    SECTION("not JSON") {
        REQUIRE_FALSE(parseLmSensorsJson("sensors: command failed", "coretemp", "Package id 0", &err).has_value());
        REQUIRE_FALSE(err.empty());
    }
}

TEST_CASE("parseSmartctlTemperature: ATA attribute table", "[parsers][smartctl]") {
    const std::string out =
        "smartctl 7.3 2022-02-28 r5338 [x86_64-linux-6.1.0] (local build)\n"
        "=== START OF READ SMART DATA SECTION ===\n"
        "SMART Attributes Data Structure revision number: 16\n"
        "ID# ATTRIBUTE_NAME          FLAG     VALUE WORST THRESH TYPE      UPDATED  WHEN_FAILED RAW_VALUE\n"
        "  1 Raw_Read_Error_Rate     0x000b   100   100   016    Pre-fail  Always       -       0\n"
        "190 Airflow_Temperature_Cel 0x0022   062   045   040    Old_age   Always       -       38 (Min/Max 22/55)\n"
        "194 Temperature_Celsius     0x0002   166   166   000    Old_age   Always       -       36 (Min/Max 19/45)\n"
        "199 UDMA_CRC_Error_Count    0x000a   200   200   000    Old_age   Always       -       0\n";

    auto v = parseSmartctlTemperature(out);
    REQUIRE(v.has_value());
    REQUIRE(*v == Approx(36.0));

    SECTION("falls back to Airflow_Temperature_Cel") {
        const std::string airflow =
            "190 Airflow_Temperature_Cel 0x0022   062   045   040    Old_age   Always       -       38\n";
        auto a = parseSmartctlTemperature(airflow);
        REQUIRE(a.has_value());
        REQUIRE(*a == Approx(38.0));
    }
}

TEST_CASE("parseSmartctlTemperature: NVMe and SCSI formats", "[parsers][smartctl]") {
    const std::string nvme =
        "=== START OF SMART DATA SECTION ===\n"
        "SMART/Health Information (NVMe Log 0x02)\n"
        "Critical Warning:                   0x00\n"
        "Temperature:                        41 Celsius\n"
        "Available Spare:                    100%\n";
    auto n = parseSmartctlTemperature(nvme);
    REQUIRE(n.has_value());
    REQUIRE(*n == Approx(41.0));

    const std::string scsi =
        "Current Drive Temperature:     33 C\n"
        "Drive Trip Temperature:        60 C\n";
    auto s = parseSmartctlTemperature(scsi);
    REQUIRE(s.has_value());
    REQUIRE(*s == Approx(33.0));
}

TEST_CASE("parseSmartctlTemperature: no temperature attribute", "[parsers][smartctl]") {
    std::string err;
    const std::string out =
        "Smartctl open device: /dev/sdb failed: No such device\n";
    REQUIRE_FALSE(parseSmartctlTemperature(out, &err).has_value());
    REQUIRE_FALSE(err.empty());
}

TEST_CASE("parseHwmonMillidegrees", "[parsers][hwmon]") {
    REQUIRE(*parseHwmonMillidegrees("45000\n") == Approx(45.0));
    REQUIRE(*parseHwmonMillidegrees("-1500") == Approx(-1.5));
    REQUIRE_FALSE(parseHwmonMillidegrees("").has_value());
    REQUIRE_FALSE(parseHwmonMillidegrees("n/a").has_value());
}

TEST_CASE("parseSmartctlTemperature: oversized numbers are rejected, not thrown", "[parsers][smartctl]") {
    const std::string huge(400, '9');
    std::string err;

    SECTION("NVMe line") {
        std::optional<double> v;
        REQUIRE_NOTHROW(v = parseSmartctlTemperature("Temperature: " + huge + " Celsius\n", &err));
        REQUIRE_FALSE(v.has_value());
        REQUIRE(err.find("out of range") != std::string::npos);
    }
    SECTION("ATA raw value") {
        const std::string row =
            "194 Temperature_Celsius     0x0002   166   166   000    Old_age   Always       -       " + huge + "\n";
        std::optional<double> v;
        REQUIRE_NOTHROW(v = parseSmartctlTemperature(row, &err));
        REQUIRE_FALSE(v.has_value());
    }
    SECTION("a later valid attribute still wins") {
        const std::string out =
            "194 Temperature_Celsius     0x0002   166   166   000    Old_age   Always       -       " + huge + "\n"
            "190 Airflow_Temperature_Cel 0x0022   062   045   040    Old_age   Always       -       38\n";
        auto v = parseSmartctlTemperature(out, &err);
        REQUIRE(v.has_value());
        REQUIRE(*v == Approx(38.0));
    }
}
