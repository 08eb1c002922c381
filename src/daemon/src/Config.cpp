/*
 * HwmonFanControl — Configuration (implementation)
 * (c) 2026 HwmonFanControl contributors
 *
 *  - Defaults mirror the original single-fan script (40/55/70 degC, 100..255).
 *  - ENV is a fallback layer below the JSON file, like the file layer is below CLI.
 *  - A missing default file is fine; a missing explicit --config is not.
 */

#include "include/Config.hpp"
#include "include/Utils.hpp"

#include <cmath>
#include <filesystem>
#include <string>
#include <system_error>

namespace fs = std::filesystem;
using nlohmann::json;

namespace hfc {

/* ----------------------------------------------------------------------------
 * enum <-> string
 * ----------------------------------------------------------------------------*/

const char* fallbackPolicyName(FallbackPolicy p) {
    switch (p) {
        case FallbackPolicy::Hold: return "hold";
        case FallbackPolicy::Max:  return "max";
    }
    return "max";
}

const char* shutdownPolicyName(ShutdownPolicy p) {
    switch (p) {
        case ShutdownPolicy::Max:  return "max";
        case ShutdownPolicy::Last: return "last";
        case ShutdownPolicy::Auto: return "auto";
    }
    return "max";
}

const char* sensorKindName(SensorKind k) {
    switch (k) {
        case SensorKind::LmSensors:  return "lm-sensors";
        case SensorKind::Smartctl:   return "smartctl";
        case SensorKind::Hwmon:      return "hwmon";
        case SensorKind::Libsensors: return "libsensors";
    }
    return "lm-sensors";
}

static FallbackPolicy parseFallback(const std::string& s) {
    const std::string v = util::to_lower(s);
    if (v == "hold") return FallbackPolicy::Hold;
    if (v == "max")  return FallbackPolicy::Max;
    throw ConfigError("fallback must be 'hold' or 'max', got '" + s + "'");
}

static ShutdownPolicy parseShutdown(const std::string& s) {
    const std::string v = util::to_lower(s);
    if (v == "max")  return ShutdownPolicy::Max;
    if (v == "last") return ShutdownPolicy::Last;
    if (v == "auto") return ShutdownPolicy::Auto;
    throw ConfigError("shutdown must be 'max', 'last' or 'auto', got '" + s + "'");
}

static SensorKind parseSensorKind(const std::string& s) {
    const std::string v = util::to_lower(s);
    if (v == "lm-sensors" || v == "sensors") return SensorKind::LmSensors;
    if (v == "smartctl")                     return SensorKind::Smartctl;
    if (v == "hwmon")                        return SensorKind::Hwmon;
    if (v == "libsensors")                   return SensorKind::Libsensors;
    throw ConfigError("unknown sensor type '" + s + "'");
}

static LogLevel parseLevelOrThrow(const std::string& s) {
    LogLevel lvl = LogLevel::Info;
    if (!parseLogLevel(s, lvl)) {
        throw ConfigError("log_level must be DEBUG, INFO, WARNING or ERROR, got '" + s + "'");
    }
    return lvl;
}

/* ----------------------------------------------------------------------------
 * json (de)serialization
 * ----------------------------------------------------------------------------*/

void to_json(json& j, const SensorSpec& s) {
    j = json{{"name", s.name}, {"type", sensorKindName(s.kind)}};
    if (!s.chip.empty())    j["chip"] = s.chip;
    if (!s.feature.empty()) j["feature"] = s.feature;
    if (!s.device.empty())  j["device"] = s.device;
    if (!s.path.empty())    j["path"] = s.path;
    if (!s.command.empty()) j["command"] = s.command;
}

void from_json(const json& j, SensorSpec& s) {
    s.kind = parseSensorKind(j.at("type").get<std::string>());
    if (j.contains("name"))    j.at("name").get_to(s.name);
    if (j.contains("chip"))    j.at("chip").get_to(s.chip);
    if (j.contains("feature")) j.at("feature").get_to(s.feature);
    if (j.contains("device"))  j.at("device").get_to(s.device);
    if (j.contains("path"))    j.at("path").get_to(s.path);
    if (j.contains("command")) j.at("command").get_to(s.command);

    if ((s.kind == SensorKind::LmSensors || s.kind == SensorKind::Libsensors)) {
        if (s.chip.empty())    s.chip = "coretemp";
        if (s.feature.empty()) s.feature = "Package id 0";
    }
    if (s.name.empty()) {
        switch (s.kind) {
            case SensorKind::Smartctl: s.name = fs::path(s.device).filename().string(); break;
            case SensorKind::Hwmon:    s.name = s.path; break;
            default:                   s.name = s.chip; break;
        }
    }
}

void to_json(json& j, const FanConfig& c) {
    j = json{
        {"pwm_path", c.pwmPath},
        {"state_file", c.stateFile},
        {"sysfs_root", c.sysfsRoot},

        {"temp_min", c.thresholds.tempMin},
        {"temp_target", c.thresholds.tempTarget},
        {"temp_max", c.thresholds.tempMax},
        {"fan_speed_min", c.thresholds.fanSpeedMin},
        {"fan_speed_max", c.thresholds.fanSpeedMax},
        {"fan_off_temp", c.thresholds.fanOffTemp ? json(*c.thresholds.fanOffTemp) : json(nullptr)},

        {"hysteresis_c", c.tuning.hysteresisC},
        {"max_step", c.tuning.maxStep},
        {"fallback", fallbackPolicyName(c.tuning.fallback)},

        {"poll_interval_ms", c.pollIntervalMs},
        {"sensor_timeout_ms", c.sensorTimeoutMs},
        {"write_retries", c.writeRetries},
        {"max_actuation_failures", c.maxActuationFailures},
        {"shutdown", shutdownPolicyName(c.shutdown)},

        {"log_level", logLevelName(c.logLevel)},
        {"log_file", c.logFile},

        {"discovery", {{"settle_ms", c.discovery.settleMs}, {"rpm_delta", c.discovery.rpmDelta}}},
        {"sensors", c.sensors}
    };
}

void from_json(const json& j, FanConfig& c) {
    if (!j.is_object()) throw ConfigError("configuration root must be a JSON object");
    try {
        if (j.contains("pwm_path"))               j.at("pwm_path").get_to(c.pwmPath);
        if (j.contains("state_file"))             j.at("state_file").get_to(c.stateFile);
        if (j.contains("sysfs_root"))             j.at("sysfs_root").get_to(c.sysfsRoot);

        if (j.contains("temp_min"))               j.at("temp_min").get_to(c.thresholds.tempMin);
        if (j.contains("temp_target"))            j.at("temp_target").get_to(c.thresholds.tempTarget);
        if (j.contains("temp_max"))               j.at("temp_max").get_to(c.thresholds.tempMax);
        if (j.contains("fan_speed_min"))          j.at("fan_speed_min").get_to(c.thresholds.fanSpeedMin);
        if (j.contains("fan_speed_max"))          j.at("fan_speed_max").get_to(c.thresholds.fanSpeedMax);
        if (j.contains("fan_off_temp")) {
            const auto& v = j.at("fan_off_temp");
            if (v.is_null()) c.thresholds.fanOffTemp.reset();
            else             c.thresholds.fanOffTemp = v.get<double>();
        }

        if (j.contains("hysteresis_c"))           j.at("hysteresis_c").get_to(c.tuning.hysteresisC);
        if (j.contains("max_step"))               j.at("max_step").get_to(c.tuning.maxStep);
        if (j.contains("fallback"))               c.tuning.fallback = parseFallback(j.at("fallback").get<std::string>());

        if (j.contains("poll_interval_ms"))       j.at("poll_interval_ms").get_to(c.pollIntervalMs);
        if (j.contains("sensor_timeout_ms"))      j.at("sensor_timeout_ms").get_to(c.sensorTimeoutMs);
        if (j.contains("write_retries"))          j.at("write_retries").get_to(c.writeRetries);
        if (j.contains("max_actuation_failures")) j.at("max_actuation_failures").get_to(c.maxActuationFailures);
        if (j.contains("shutdown"))               c.shutdown = parseShutdown(j.at("shutdown").get<std::string>());

        if (j.contains("log_level"))              c.logLevel = parseLevelOrThrow(j.at("log_level").get<std::string>());
        if (j.contains("log_file"))               j.at("log_file").get_to(c.logFile);

        if (j.contains("discovery")) {
            const auto& d = j.at("discovery");
            if (d.contains("settle_ms")) d.at("settle_ms").get_to(c.discovery.settleMs);
            if (d.contains("rpm_delta")) d.at("rpm_delta").get_to(c.discovery.rpmDelta);
        }

        // a sensors array replaces the defaults entirely
        if (j.contains("sensors")) {
            c.sensors = j.at("sensors").get<std::vector<SensorSpec>>();
        }
    } catch (const json::exception& ex) {
        throw ConfigError(std::string("bad configuration value: ") + ex.what());
    }
}

/* ----------------------------------------------------------------------------
 * Defaults
 * ----------------------------------------------------------------------------*/

std::string defaultConfigPath() {
    return "/etc/hfcd/hfcd.json";
}

FanConfig defaultConfig() {
    FanConfig c;
    c.configFile = defaultConfigPath();

    SensorSpec cpu;
    cpu.name    = "cpu";
    cpu.kind    = SensorKind::LmSensors;
    cpu.chip    = "coretemp";
    cpu.feature = "Package id 0";
    c.sensors.push_back(cpu);

    for (const char* dev : {"/dev/sda", "/dev/sdb"}) {
        SensorSpec disk;
        disk.kind   = SensorKind::Smartctl;
        disk.device = dev;
        disk.name   = fs::path(dev).filename().string();
        c.sensors.push_back(disk);
    }
    return c;
}

/* ----------------------------------------------------------------------------
 * ENV overlay
 * ----------------------------------------------------------------------------*/

static int envInt(const char* key, int def) {
    auto v = util::getenv_str(key);
    if (!v || v->empty()) return def;
    auto n = util::parse_ll(*v);
    if (!n) throw ConfigError(std::string(key) + " must be an integer, got '" + *v + "'");
    return static_cast<int>(*n);
}

void applyEnvOverrides(FanConfig& c) {
    if (auto v = util::getenv_str("HFCD_PWM_PATH"); v && !v->empty())   c.pwmPath = *v;
    if (auto v = util::getenv_str("HFCD_STATE_FILE"); v && !v->empty()) c.stateFile = *v;
    if (auto v = util::getenv_str("HFCD_SYSFS_ROOT"); v && !v->empty()) c.sysfsRoot = *v;
    if (auto v = util::getenv_str("HFCD_LOG_FILE"); v && !v->empty())   c.logFile = *v;
    if (auto v = util::getenv_str("HFCD_LOG_LEVEL"); v && !v->empty())  c.logLevel = parseLevelOrThrow(*v);
    c.pollIntervalMs = envInt("HFCD_POLL_INTERVAL_MS", c.pollIntervalMs);
}

static void expandPaths_(FanConfig& c) {
    c.pwmPath   = util::expandUserPath(c.pwmPath);
    c.stateFile = util::expandUserPath(c.stateFile);
    c.logFile   = util::expandUserPath(c.logFile);
    c.sysfsRoot = util::expandUserPath(c.sysfsRoot);
}

/* ----------------------------------------------------------------------------
 * Load / validate
 * ----------------------------------------------------------------------------*/

FanConfig loadFanConfig(const std::string& path) {
    FanConfig cfg = defaultConfig();
    applyEnvOverrides(cfg);

    const bool explicitPath = !path.empty();
    const std::string p = util::expandUserPath(explicitPath ? path : defaultConfigPath());

    std::error_code ec;
    if (!fs::exists(p, ec)) {
        if (explicitPath) throw ConfigError("config file not found: " + p);
        expandPaths_(cfg);
        return cfg;
    }

    json j;
    try {
        j = util::read_json_file(p);
    } catch (const std::runtime_error& ex) {
        throw ConfigError(ex.what());
    }
    from_json(j, cfg);
    cfg.configFile = p;
    expandPaths_(cfg);
    return cfg;
}

void validateConfig(const FanConfig& c) {
    const Thresholds& t = c.thresholds;
    auto fail = [](const std::string& msg) { throw ConfigError(msg); };

    if (!std::isfinite(t.tempMin) || !std::isfinite(t.tempTarget) || !std::isfinite(t.tempMax)) {
        fail("temperature thresholds must be finite numbers");
    }
    if (!(t.tempMin < t.tempTarget && t.tempTarget < t.tempMax)) {
        fail("thresholds must satisfy temp_min < temp_target < temp_max (got " +
             std::to_string(t.tempMin) + " / " + std::to_string(t.tempTarget) + " / " +
             std::to_string(t.tempMax) + ")");
    }
    if (!(0 <= t.fanSpeedMin && t.fanSpeedMin < t.fanSpeedMax && t.fanSpeedMax <= kPwmHardwareMax)) {
        fail("fan speeds must satisfy 0 <= fan_speed_min < fan_speed_max <= " +
             std::to_string(kPwmHardwareMax) + " (got " + std::to_string(t.fanSpeedMin) +
             " / " + std::to_string(t.fanSpeedMax) + ")");
    }
    if (t.fanOffTemp && !(*t.fanOffTemp < t.tempMin)) {
        fail("fan_off_temp must be below temp_min");
    }
    if (!(c.tuning.hysteresisC >= 0.0)) fail("hysteresis_c must be >= 0");
    if (c.tuning.maxStep < 1)           fail("max_step must be >= 1");
    if (c.pollIntervalMs < 100)         fail("poll_interval_ms must be >= 100");
    if (c.sensorTimeoutMs < 1)          fail("sensor_timeout_ms must be >= 1");
    if (c.writeRetries < 0)             fail("write_retries must be >= 0");
    if (c.maxActuationFailures < 1)     fail("max_actuation_failures must be >= 1");
    if (c.discovery.settleMs < 0)       fail("discovery.settle_ms must be >= 0");
    if (c.sensors.empty())              fail("at least one sensor must be configured");

    for (const auto& s : c.sensors) {
        switch (s.kind) {
            case SensorKind::Smartctl:
                if (s.device.empty()) fail("smartctl sensor '" + s.name + "' needs a device");
                break;
            case SensorKind::Hwmon:
                if (s.path.empty()) fail("hwmon sensor '" + s.name + "' needs a path");
                break;
            default:
                break;
        }
    }
}

} // namespace hfc
