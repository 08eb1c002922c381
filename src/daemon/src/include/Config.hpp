/*
 * HwmonFanControl — Configuration (public interface)
 * (c) 2026 HwmonFanControl contributors
 *
 * NOTE:
 *  - FanConfig is built once at startup and handed by const reference to the
 *    loop, controller, actuator and discovery. Nothing mutates it afterwards.
 *  - Layering: defaults -> HFCD_* environment -> JSON file -> CLI (in main).
 */
#pragma once

#include "Log.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace hfc {

/* Invalid or contradictory configuration; fatal at startup. */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/* What the controller does when every sensor failed in a cycle. */
enum class FallbackPolicy {
    Hold,   // keep the last duty cycle
    Max     // force fanSpeedMax
};

/* What the fan is left at when the loop exits. */
enum class ShutdownPolicy {
    Max,    // write fanSpeedMax
    Last,   // leave the last written duty
    Auto    // restore the original pwmN_enable mode (hand back to firmware)
};

enum class SensorKind {
    LmSensors,   // `sensors -j`
    Smartctl,    // `smartctl -A <device>`
    Hwmon,       // sysfs tempN_input
    Libsensors   // libsensors C API
};

struct SensorSpec {
    std::string name;
    SensorKind  kind{SensorKind::LmSensors};
    std::string chip;                 // lm-sensors / libsensors chip match
    std::string feature;              // lm-sensors / libsensors feature label
    std::string device;               // smartctl device node
    std::string path;                 // hwmon temp input
    std::vector<std::string> command; // argv override for command sources
};

struct Thresholds {
    double tempMin{40.0};
    double tempTarget{55.0};
    double tempMax{70.0};
    int    fanSpeedMin{100};
    int    fanSpeedMax{255};
    std::optional<double> fanOffTemp;  // at or below: fan commanded off
};

struct ControllerTuning {
    double         hysteresisC{2.0};
    int            maxStep{20};
    FallbackPolicy fallback{FallbackPolicy::Max};
};

struct DiscoveryConfig {
    int settleMs{3000};
    int rpmDelta{150};
};

struct FanConfig {
    // Files / paths
    std::string configFile;
    std::string pwmPath;                        // override; empty = persisted/auto
    std::string stateFile{"/var/lib/hfcd/pwm.json"};
    std::string sysfsRoot{"/sys"};

    Thresholds       thresholds;
    ControllerTuning tuning;
    DiscoveryConfig  discovery;

    // Loop
    int            pollIntervalMs{30000};
    int            sensorTimeoutMs{5000};
    int            writeRetries{2};
    int            maxActuationFailures{5};
    ShutdownPolicy shutdown{ShutdownPolicy::Max};

    // Logging
    LogLevel    logLevel{LogLevel::Info};
    std::string logFile;

    std::vector<SensorSpec> sensors;
};

constexpr int kPwmHardwareMax = 255;

// JSON (de)serialization; from_json throws ConfigError on bad values
void to_json(nlohmann::json& j, const FanConfig& c);
void from_json(const nlohmann::json& j, FanConfig& c);
void to_json(nlohmann::json& j, const SensorSpec& s);
void from_json(const nlohmann::json& j, SensorSpec& s);

const char* fallbackPolicyName(FallbackPolicy p);
const char* shutdownPolicyName(ShutdownPolicy p);
const char* sensorKindName(SensorKind k);

/* Built-in defaults: CPU package via lm-sensors plus /dev/sda and /dev/sdb. */
FanConfig defaultConfig();

std::string defaultConfigPath();

/* Apply HFCD_* environment variables on top of c. */
void applyEnvOverrides(FanConfig& c);

/*
 * defaults -> env -> file. An empty path means defaultConfigPath(), which may
 * be missing (defaults are used). An explicit path must exist.
 * Throws ConfigError. Does not validate; call validateConfig() after CLI overrides.
 */
FanConfig loadFanConfig(const std::string& path);

/* Throws ConfigError naming the first violated invariant. */
void validateConfig(const FanConfig& c);

} // namespace hfc
