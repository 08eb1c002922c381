/*
 * HwmonFanControl — temperature sources (implementation)
 * (c) 2026 HwmonFanControl contributors
 *
 * Command-backed sources treat the external tools as black boxes: run with a
 * timeout, parse stdout, never let a failure escape as an exception.
 */

#include "include/SensorSource.hpp"
#include "include/SensorParsers.hpp"
#include "include/Process.hpp"
#include "include/Utils.hpp"
#include "include/Log.hpp"

#include <sensors/sensors.h>

#include <cmath>
#include <cstdlib>
#include <mutex>
#include <string>
#include <utility>

namespace hfc {

const char* sensorCategoryName(SensorCategory c) {
    switch (c) {
        case SensorCategory::Processor: return "processor";
        case SensorCategory::Storage:   return "storage";
        case SensorCategory::Board:     return "board";
    }
    return "board";
}

/* ------------------------------ base -------------------------------------- */

TemperatureReading SensorSource::success(double valueC) const {
    if (!std::isfinite(valueC) || valueC < kMinPlausibleC || valueC > kMaxPlausibleC) {
        return failure("implausible value " + std::to_string(valueC) + " degC");
    }
    TemperatureReading r;
    r.source   = name();
    r.category = category();
    r.valueC   = valueC;
    r.ok       = true;
    return r;
}

TemperatureReading SensorSource::failure(const std::string& why) const {
    TemperatureReading r;
    r.source   = name();
    r.category = category();
    r.ok       = false;
    r.error    = why;
    return r;
}

/* ------------------------------ command ----------------------------------- */

CommandSensorSource::CommandSensorSource(std::string name,
                                         SensorCategory category,
                                         std::vector<std::string> argv,
                                         TextParser parser,
                                         int timeoutMs,
                                         const std::atomic<bool>* cancel)
: name_(std::move(name)),
  category_(category),
  argv_(std::move(argv)),
  parser_(std::move(parser)),
  timeoutMs_(timeoutMs),
  cancel_(cancel) {}

TemperatureReading CommandSensorSource::read() {
    CommandResult res = runCommand(argv_, timeoutMs_, cancel_);
    if (!res.started || res.timedOut || res.cancelled) {
        return failure(res.error.empty() ? std::string("command did not run") : res.error);
    }
    if (res.output.empty()) {
        if (!res.error.empty()) return failure(res.error);
        return failure(argv_.front() + " produced no output (exit " + std::to_string(res.exitCode) + ")");
    }

    // smartctl encodes warnings in its exit bitmask; usable output still counts
    if (res.exitCode != 0) {
        LOG_DEBUG("sensor: %s: %s exited %d, parsing output anyway",
                  name_.c_str(), argv_.front().c_str(), res.exitCode);
    }

    std::string why;
    auto v = parser_(res.output, &why);
    if (!v) return failure(why.empty() ? std::string("unparseable output") : why);
    return success(*v);
}

/* ------------------------------ hwmon file -------------------------------- */

HwmonSensorSource::HwmonSensorSource(std::string name, std::string inputPath)
: name_(std::move(name)), inputPath_(std::move(inputPath)) {}

TemperatureReading HwmonSensorSource::read() {
    std::string text;
    if (!util::read_file(inputPath_, text)) {
        return failure("cannot read " + inputPath_);
    }
    auto v = parseHwmonMillidegrees(text);
    if (!v) return failure("unparseable content in " + inputPath_);
    return success(*v);
}

/* ------------------------------ libsensors -------------------------------- */

namespace {

std::once_flag s_libsensorsOnce;
bool s_libsensorsReady = false;

void ensureLibsensors() {
    std::call_once(s_libsensorsOnce, [] {
        s_libsensorsReady = (sensors_init(nullptr) == 0);
        if (s_libsensorsReady) {
            std::atexit(sensors_cleanup);
        } else {
            LOG_WARN("sensor: libsensors initialisation failed");
        }
    });
}

std::string chipToString(const sensors_chip_name* chip) {
    char buf[256];
    buf[0] = '\0';
    if (sensors_snprintf_chip_name(buf, sizeof(buf), chip) >= 0) return std::string(buf);
    return "unknown";
}

} // namespace

LibsensorsSource::LibsensorsSource(std::string name, std::string chipMatch, std::string feature)
: name_(std::move(name)), chipMatch_(std::move(chipMatch)), feature_(std::move(feature)) {}

TemperatureReading LibsensorsSource::read() {
    ensureLibsensors();
    if (!s_libsensorsReady) return failure("libsensors unavailable");

    const std::string needle = util::to_lower(chipMatch_);
    int c = 0;
    const sensors_chip_name* chip;
    while ((chip = sensors_get_detected_chips(nullptr, &c)) != nullptr) {
        if (util::to_lower(chipToString(chip)).find(needle) == std::string::npos) continue;

        int f = 0;
        const sensors_feature* feat;
        while ((feat = sensors_get_features(chip, &f)) != nullptr) {
            if (feat->type != SENSORS_FEATURE_TEMP) continue;

            char* lbl = sensors_get_label(chip, feat);
            const bool match = lbl && feature_ == lbl;
            std::free(lbl);
            if (!match) continue;

            const sensors_subfeature* sub =
                sensors_get_subfeature(chip, feat, SENSORS_SUBFEATURE_TEMP_INPUT);
            if (!sub) return failure("feature '" + feature_ + "' has no input");

            double val = 0.0;
            if (sensors_get_value(chip, sub->number, &val) != 0) {
                return failure("sensors_get_value failed for '" + feature_ + "'");
            }
            return success(val);
        }
    }
    return failure("no libsensors chip/feature matching '" + chipMatch_ + "' / '" + feature_ + "'");
}

/* ------------------------------ factory ----------------------------------- */

std::unique_ptr<SensorSource> makeSensorSource(const SensorSpec& spec,
                                               int timeoutMs,
                                               const std::atomic<bool>* cancel) {
    switch (spec.kind) {
        case SensorKind::LmSensors: {
            auto argv = spec.command.empty() ? std::vector<std::string>{"sensors", "-j"} : spec.command;
            const std::string chip = spec.chip;
            const std::string feature = spec.feature;
            return std::make_unique<CommandSensorSource>(
                spec.name, SensorCategory::Processor, std::move(argv),
                [chip, feature](const std::string& text, std::string* err) {
                    return parseLmSensorsJson(text, chip, feature, err);
                },
                timeoutMs, cancel);
        }
        case SensorKind::Smartctl: {
            auto argv = spec.command.empty()
                ? std::vector<std::string>{"smartctl", "-A", spec.device}
                : spec.command;
            return std::make_unique<CommandSensorSource>(
                spec.name, SensorCategory::Storage, std::move(argv),
                [](const std::string& text, std::string* err) {
                    return parseSmartctlTemperature(text, err);
                },
                timeoutMs, cancel);
        }
        case SensorKind::Hwmon:
            return std::make_unique<HwmonSensorSource>(spec.name, spec.path);
        case SensorKind::Libsensors:
            return std::make_unique<LibsensorsSource>(spec.name, spec.chip, spec.feature);
    }
    throw ConfigError("unhandled sensor type for '" + spec.name + "'");
}

std::vector<std::unique_ptr<SensorSource>> makeSensorSources(const FanConfig& cfg,
                                                             const std::atomic<bool>* cancel) {
    std::vector<std::unique_ptr<SensorSource>> out;
    out.reserve(cfg.sensors.size());
    for (const auto& spec : cfg.sensors) {
        out.push_back(makeSensorSource(spec, cfg.sensorTimeoutMs, cancel));
        LOG_DEBUG("sensor: configured '%s' (%s)", spec.name.c_str(), sensorKindName(spec.kind));
    }
    return out;
}

} // namespace hfc
