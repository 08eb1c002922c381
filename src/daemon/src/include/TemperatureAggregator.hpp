/*
 * HwmonFanControl — TemperatureAggregator (header)
 * - Worst case dominates: the hottest successful reading drives the fan
 * (c) 2026 HwmonFanControl contributors
 */
#pragma once

#include "SensorSource.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace hfc {

struct AggregateResult {
    std::vector<TemperatureReading> readings;
    std::optional<double>           controlTemp;   // nullopt = no data this cycle
    std::string                     hottest;       // source that produced controlTemp
};

class TemperatureAggregator {
public:
    explicit TemperatureAggregator(std::vector<std::unique_ptr<SensorSource>> sources);

    /* Read every source once, sequentially. Failures are logged, never fatal. */
    AggregateResult collect();

    size_t sourceCount() const noexcept { return sources_.size(); }

    /* Max of successful readings; nullopt if none succeeded. */
    static std::optional<double> combine(const std::vector<TemperatureReading>& readings,
                                         std::string* hottest = nullptr);

private:
    std::vector<std::unique_ptr<SensorSource>> sources_;
    std::vector<bool>                          failing_;   // per source, for log de-duplication
};

} // namespace hfc
