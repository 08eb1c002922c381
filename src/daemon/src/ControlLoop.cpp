/*
 * HwmonFanControl — ControlLoop (implementation)
 * (c) 2026 HwmonFanControl contributors
 */

#include "include/ControlLoop.hpp"
#include "include/Log.hpp"
#include "include/Utils.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace hfc {

ControlLoop::ControlLoop(const FanConfig& cfg,
                         TemperatureAggregator aggregator,
                         std::unique_ptr<PwmActuator> actuator,
                         std::atomic<bool>& stop)
: cfg_(cfg),
  aggregator_(std::move(aggregator)),
  controller_(cfg.thresholds, cfg.tuning),
  actuator_(std::move(actuator)),
  stop_(stop)
{
    if (!actuator_) {
        throw ConfigError("control loop needs a pwm actuator");
    }
    if (cfg_.thresholds.fanSpeedMax > actuator_->hardwareMax()) {
        throw ConfigError("fan_speed_max " + std::to_string(cfg_.thresholds.fanSpeedMax) +
                          " exceeds " + actuator_->path() + " maximum " +
                          std::to_string(actuator_->hardwareMax()));
    }
}

bool ControlLoop::sleepMsCancelable_(int ms) const {
    using namespace std::chrono;
    constexpr int kSliceMs = 100;
    const auto until = steady_clock::now() + milliseconds(ms);
    while (steady_clock::now() < until) {
        if (stopRequested()) return false;
        const auto left = duration_cast<milliseconds>(until - steady_clock::now());
        std::this_thread::sleep_for(std::min(left, milliseconds(kSliceMs)));
    }
    return !stopRequested();
}

void ControlLoop::logTargetCrossing_(const std::optional<double>& tempC) {
    if (!tempC) return;
    const double target = cfg_.thresholds.tempTarget;
    const bool above = *tempC > target;
    if (aboveTarget_ && *aboveTarget_ != above) {
        LOG_INFO("loop: control temperature %.1f C %s target %.1f C",
                 *tempC, above ? "rose above" : "fell below", target);
    }
    aboveTarget_ = above;
}

IterationResult ControlLoop::runOnce(std::chrono::steady_clock::time_point now) {
    IterationResult r;

    r.aggregate = aggregator_.collect();
    logTargetCrossing_(r.aggregate.controlTemp);

    r.decision = controller_.step(r.aggregate.controlTemp, now);

    const int attempts = 1 + std::max(0, cfg_.writeRetries);
    for (int i = 0; i < attempts && !r.written; ++i) {
        ++r.attempts;
        r.written = actuator_->write(r.decision.duty, &r.error);
        if (!r.written) {
            LOG_WARN("loop: write %d to %s failed (attempt %d/%d): %s",
                     r.decision.duty, actuator_->path().c_str(), i + 1, attempts, r.error.c_str());
        }
    }

    if (r.written) {
        r.error.clear();
        controller_.acknowledgeWrite(r.decision.duty, now);
        if (consecutiveFailures_ > 0) {
            LOG_INFO("loop: pwm writes recovered after %d failed cycle(s)", consecutiveFailures_);
        }
        consecutiveFailures_ = 0;
    } else {
        ++consecutiveFailures_;
        LOG_ERROR("loop: pwm write failed %d cycle(s) in a row (limit %d)",
                  consecutiveFailures_, cfg_.maxActuationFailures);
    }
    r.consecutiveFailures = consecutiveFailures_;

    const int pct = util::pwmPercentFromRaw(r.decision.duty, actuator_->hardwareMax());
    if (r.aggregate.controlTemp) {
        LOG_INFO("loop: temp=%.1f C (%s) target=%d duty=%d (%d%%) reason=%s",
                 *r.aggregate.controlTemp, r.aggregate.hottest.c_str(),
                 r.decision.target, r.decision.duty, pct, decisionReasonName(r.decision.reason));
    } else {
        LOG_WARN("loop: no temperature data, duty=%d (%d%%) reason=%s",
                 r.decision.duty, pct, decisionReasonName(r.decision.reason));
    }
    return r;
}

void ControlLoop::applyShutdownPolicy() {
    std::string err;
    switch (cfg_.shutdown) {
        case ShutdownPolicy::Max:
            if (actuator_->write(cfg_.thresholds.fanSpeedMax, &err)) {
                LOG_INFO("loop: shutdown, fan left at %d", cfg_.thresholds.fanSpeedMax);
            } else {
                LOG_ERROR("loop: shutdown write to %s failed: %s", actuator_->path().c_str(), err.c_str());
            }
            break;
        case ShutdownPolicy::Last:
            LOG_INFO("loop: shutdown, fan left at last duty %d", actuator_->lastWritten().value_or(-1));
            break;
        case ShutdownPolicy::Auto:
            if (actuator_->releaseControl(&err)) {
                LOG_INFO("loop: shutdown, fan handed back to firmware");
            } else {
                LOG_ERROR("loop: restoring enable mode of %s failed: %s", actuator_->path().c_str(), err.c_str());
            }
            break;
    }
}

ExitCode ControlLoop::run() {
    LOG_INFO("loop: start pwm=%s interval=%dms sources=%zu shutdown=%s",
             actuator_->path().c_str(), cfg_.pollIntervalMs, aggregator_.sourceCount(),
             shutdownPolicyName(cfg_.shutdown));

    std::string err;
    if (!actuator_->takeControl(&err)) {
        LOG_ERROR("loop: cannot switch %s to manual mode: %s", actuator_->path().c_str(), err.c_str());
        return ExitCode::ActuationLost;
    }

    while (!stopRequested()) {
        runOnce(std::chrono::steady_clock::now());

        if (consecutiveFailures_ >= cfg_.maxActuationFailures) {
            LOG_ERROR("loop: %s stopped accepting writes; giving up control", actuator_->path().c_str());
            if (!actuator_->releaseControl(&err)) {
                LOG_WARN("loop: restoring enable mode failed: %s", err.c_str());
            }
            return ExitCode::ActuationLost;
        }

        if (!sleepMsCancelable_(cfg_.pollIntervalMs)) break;
    }

    LOG_INFO("loop: stop requested");
    applyShutdownPolicy();
    return ExitCode::Ok;
}

} // namespace hfc
