/*
 * HwmonFanControl — ControlLoop (header)
 * - gather -> aggregate -> step -> actuate -> sleep, one iteration at a time
 * (c) 2026 HwmonFanControl contributors
 */
#pragma once

#include "Config.hpp"
#include "PwmActuator.hpp"
#include "SpeedController.hpp"
#include "TemperatureAggregator.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace hfc {

/* Process exit status. */
enum class ExitCode : int {
    Ok            = 0,
    ConfigFailure = 2,
    ActuationLost = 3
};

struct IterationResult {
    AggregateResult aggregate;
    ControlDecision decision;
    bool        written{false};
    int         attempts{0};
    int         consecutiveFailures{0};
    std::string error;              // last write error, if !written
};

class ControlLoop {
public:
    /*
     * Throws ConfigError when fanSpeedMax exceeds what the channel accepts.
     * `stop` is shared with the sensor sources so a signal aborts blocked
     * commands as well as the poll sleep.
     */
    ControlLoop(const FanConfig& cfg,
                TemperatureAggregator aggregator,
                std::unique_ptr<PwmActuator> actuator,
                std::atomic<bool>& stop);

    ControlLoop(const ControlLoop&) = delete;
    ControlLoop& operator=(const ControlLoop&) = delete;

    /* One full iteration; never throws for sensor or write failures. */
    IterationResult runOnce(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    /*
     * Take manual control, iterate until requestStop(), apply the shutdown
     * policy. Returns ActuationLost after maxActuationFailures failed cycles.
     */
    ExitCode run();

    void requestStop() noexcept { stop_.store(true, std::memory_order_relaxed); }
    bool stopRequested() const noexcept { return stop_.load(std::memory_order_relaxed); }

    /* Leave the fan as configured by `shutdown`; also used by run(). */
    void applyShutdownPolicy();

    const SpeedController& controller() const noexcept { return controller_; }
    int consecutiveFailures() const noexcept { return consecutiveFailures_; }

private:
    bool sleepMsCancelable_(int ms) const;
    void logTargetCrossing_(const std::optional<double>& tempC);

private:
    const FanConfig&             cfg_;
    TemperatureAggregator        aggregator_;
    SpeedController              controller_;
    std::unique_ptr<PwmActuator> actuator_;
    std::atomic<bool>&           stop_;

    int                 consecutiveFailures_{0};
    std::optional<bool> aboveTarget_;   // side of tempTarget at the last valid reading
};

} // namespace hfc
