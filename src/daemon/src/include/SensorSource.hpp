/*
 * HwmonFanControl — temperature sources (header)
 * (c) 2026 HwmonFanControl contributors
 */
#pragma once

#include "Config.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hfc {

enum class SensorCategory {
    Processor,
    Storage,
    Board
};

const char* sensorCategoryName(SensorCategory c);

/* One source's result for one poll cycle. Never persisted. */
struct TemperatureReading {
    std::string    source;
    SensorCategory category{SensorCategory::Board};
    double         valueC{0.0};
    bool           ok{false};
    std::string    error;
};

/* Plausible range for any reading; outside is treated as a parse failure. */
constexpr double kMinPlausibleC = -40.0;
constexpr double kMaxPlausibleC = 150.0;

/*
 * One category of temperature. read() never throws: every failure
 * (missing tool, timeout, parse error, device offline) is reported through
 * TemperatureReading::ok / ::error.
 */
class SensorSource {
public:
    virtual ~SensorSource() = default;

    virtual const std::string& name() const = 0;
    virtual SensorCategory category() const = 0;
    virtual TemperatureReading read() = 0;

protected:
    TemperatureReading success(double valueC) const;
    TemperatureReading failure(const std::string& why) const;
};

using TextParser = std::function<std::optional<double>(const std::string&, std::string*)>;

/* Runs an external tool with a timeout and feeds its stdout to a parser. */
class CommandSensorSource : public SensorSource {
public:
    CommandSensorSource(std::string name,
                        SensorCategory category,
                        std::vector<std::string> argv,
                        TextParser parser,
                        int timeoutMs,
                        const std::atomic<bool>* cancel = nullptr);

    const std::string& name() const override { return name_; }
    SensorCategory category() const override { return category_; }
    TemperatureReading read() override;

    const std::vector<std::string>& argv() const noexcept { return argv_; }

private:
    std::string              name_;
    SensorCategory           category_;
    std::vector<std::string> argv_;
    TextParser               parser_;
    int                      timeoutMs_;
    const std::atomic<bool>* cancel_;
};

/* Reads a sysfs tempN_input file (millidegrees). */
class HwmonSensorSource : public SensorSource {
public:
    HwmonSensorSource(std::string name, std::string inputPath);

    const std::string& name() const override { return name_; }
    SensorCategory category() const override { return SensorCategory::Board; }
    TemperatureReading read() override;

private:
    std::string name_;
    std::string inputPath_;
};

/* Reads a chip feature's temperature input through libsensors. */
class LibsensorsSource : public SensorSource {
public:
    LibsensorsSource(std::string name, std::string chipMatch, std::string feature);

    const std::string& name() const override { return name_; }
    SensorCategory category() const override { return SensorCategory::Processor; }
    TemperatureReading read() override;

private:
    std::string name_;
    std::string chipMatch_;
    std::string feature_;
};

/* Build the configured source; command sources honor timeoutMs and *cancel. */
std::unique_ptr<SensorSource> makeSensorSource(const SensorSpec& spec,
                                               int timeoutMs,
                                               const std::atomic<bool>* cancel);

std::vector<std::unique_ptr<SensorSource>> makeSensorSources(const FanConfig& cfg,
                                                             const std::atomic<bool>* cancel);

} // namespace hfc
