/*
 * HwmonFanControl — configuration tests
 * (c) 2026 HwmonFanControl contributors
 */

#include <catch2/catch.hpp>

#include "include/Config.hpp"
#include "TestSupport.hpp"

#include <nlohmann/json.hpp>

using hfc::ConfigError;
using hfc::FanConfig;
using hfc::loadFanConfig;
using hfc::validateConfig;
using hfc::test::TempDir;
using hfc::test::writeFile;

TEST_CASE("Config: defaults follow the stock setup", "[config]") {
    const FanConfig c = hfc::defaultConfig();

    REQUIRE(c.thresholds.tempMin == Approx(40.0));
    REQUIRE(c.thresholds.tempTarget == Approx(55.0));
    REQUIRE(c.thresholds.tempMax == Approx(70.0));
    REQUIRE(c.thresholds.fanSpeedMin == 100);
    REQUIRE(c.thresholds.fanSpeedMax == 255);
    REQUIRE(c.pollIntervalMs == 30000);
    REQUIRE(c.sensors.size() == 3);
    REQUIRE(c.sensors[0].kind == hfc::SensorKind::LmSensors);
    REQUIRE(c.sensors[1].device == "/dev/sda");
    REQUIRE(c.sensors[2].device == "/dev/sdb");
    REQUIRE_NOTHROW(validateConfig(c));
}

TEST_CASE("Config: JSON file overrides defaults", "[config]") {
    TempDir dir;
    writeFile(dir / "hfcd.json", R"({
        // comments are allowed
        "temp_min": 35, "temp_target": 50, "temp_max": 75,
        "fan_speed_min": 80, "fan_speed_max": 240,
        "fan_off_temp": 28,
        "hysteresis_c": 1.5, "max_step": 15,
        "fallback": "hold", "shutdown": "auto",
        "log_level": "debug",
        "discovery": { "settle_ms": 1500 },
        "sensors": [
            { "type": "hwmon", "name": "board", "path": "/sys/class/hwmon/hwmon1/temp1_input" },
            { "type": "smartctl", "device": "/dev/nvme0" }
        ]
    })");

    const FanConfig c = loadFanConfig((dir / "hfcd.json").string());
    REQUIRE(c.configFile == (dir / "hfcd.json").string());
    REQUIRE(c.thresholds.tempMin == Approx(35.0));
    REQUIRE(c.thresholds.fanSpeedMax == 240);
    REQUIRE(c.thresholds.fanOffTemp.has_value());
    REQUIRE(*c.thresholds.fanOffTemp == Approx(28.0));
    REQUIRE(c.tuning.maxStep == 15);
    REQUIRE(c.tuning.fallback == hfc::FallbackPolicy::Hold);
    REQUIRE(c.shutdown == hfc::ShutdownPolicy::Auto);
    REQUIRE(c.logLevel == hfc::LogLevel::Debug);
    REQUIRE(c.discovery.settleMs == 1500);
    REQUIRE(c.discovery.rpmDelta == 150);

    // the sensors array replaces the defaults
    REQUIRE(c.sensors.size() == 2);
    REQUIRE(c.sensors[0].kind == hfc::SensorKind::Hwmon);
    REQUIRE(c.sensors[1].name == "nvme0");
    REQUIRE_NOTHROW(validateConfig(c));
}

TEST_CASE("Config: load failures are ConfigError", "[config]") {
    TempDir dir;

    SECTION("explicit file missing") {
        REQUIRE_THROWS_AS(loadFanConfig((dir / "missing.json").string()), ConfigError);
    }
    SECTION("malformed JSON") {
        writeFile(dir / "bad.json", "{ \"temp_min\": ");
        REQUIRE_THROWS_AS(loadFanConfig((dir / "bad.json").string()), ConfigError);
    }
    SECTION("wrong value type") {
        writeFile(dir / "type.json", R"({ "temp_min": "warm" })");
        REQUIRE_THROWS_AS(loadFanConfig((dir / "type.json").string()), ConfigError);
    }
    SECTION("unknown enum value") {
        writeFile(dir / "enum.json", R"({ "fallback": "panic" })");
        REQUIRE_THROWS_AS(loadFanConfig((dir / "enum.json").string()), ConfigError);
    }
    SECTION("unknown sensor type") {
        writeFile(dir / "sensor.json", R"({ "sensors": [ { "type": "ipmi" } ] })");
        REQUIRE_THROWS_AS(loadFanConfig((dir / "sensor.json").string()), ConfigError);
    }
}

TEST_CASE("Config: validation rejects contradictory settings", "[config]") {
    FanConfig c = hfc::defaultConfig();

    SECTION("threshold order") {
        c.thresholds.tempTarget = 80.0;
        REQUIRE_THROWS_AS(validateConfig(c), ConfigError);
    }
    SECTION("equal temperature bounds") {
        c.thresholds.tempMin = 70.0;
        REQUIRE_THROWS_AS(validateConfig(c), ConfigError);
    }
    SECTION("fan speed order") {
        c.thresholds.fanSpeedMin = 255;
        REQUIRE_THROWS_AS(validateConfig(c), ConfigError);
    }
    SECTION("fan speed above hardware range") {
        c.thresholds.fanSpeedMax = 300;
        REQUIRE_THROWS_AS(validateConfig(c), ConfigError);
    }
    SECTION("off temperature inside the control band") {
        c.thresholds.fanOffTemp = 45.0;
        REQUIRE_THROWS_AS(validateConfig(c), ConfigError);
    }
    SECTION("zero step") {
        c.tuning.maxStep = 0;
        REQUIRE_THROWS_AS(validateConfig(c), ConfigError);
    }
    SECTION("no sensors") {
        c.sensors.clear();
        REQUIRE_THROWS_AS(validateConfig(c), ConfigError);
    }
    SECTION("smartctl without a device") {
        c.sensors[1].device.clear();
        REQUIRE_THROWS_AS(validateConfig(c), ConfigError);
    }
}

TEST_CASE("Config: JSON round trip keeps the effective values", "[config]") {
    FanConfig c = hfc::defaultConfig();
    c.thresholds.fanOffTemp = 30.0;
    c.shutdown = hfc::ShutdownPolicy::Last;

    nlohmann::json j = c;
    REQUIRE(j["fan_off_temp"].get<double>() == Approx(30.0));
    REQUIRE(j["shutdown"] == "last");
    REQUIRE(j["sensors"][0]["type"] == "lm-sensors");

    FanConfig back = hfc::defaultConfig();
    hfc::from_json(j, back);
    REQUIRE(*back.thresholds.fanOffTemp == Approx(30.0));
    REQUIRE(back.shutdown == hfc::ShutdownPolicy::Last);
    REQUIRE(back.sensors.size() == 3);
}
