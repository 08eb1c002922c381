/*
 * HwmonFanControl — SpeedController (implementation)
 * (c) 2026 HwmonFanControl contributors
 *
 * Step rules:
 *  - first cycle (Idle): write the target directly, no ramp
 *  - afterwards: move toward the target by at most maxStep per cycle,
 *    starting from the last acknowledged write once there is one
 *  - failsafe (no data, policy max): jump to fanSpeedMax at once
 *  - off band: 0 <-> fanSpeedMin is a single jump, never a ramp through
 *    speeds the fan cannot spin at
 */

#include "include/SpeedController.hpp"

#include <algorithm>
#include <cmath>

namespace hfc {

const char* decisionReasonName(DecisionReason r) {
    switch (r) {
        case DecisionReason::Initial:    return "initial";
        case DecisionReason::Retarget:   return "retarget";
        case DecisionReason::Deadband:   return "deadband";
        case DecisionReason::NoDataHold: return "no-data-hold";
        case DecisionReason::NoDataMax:  return "no-data-max";
    }
    return "?";
}

SpeedController::SpeedController(const Thresholds& thresholds, const ControllerTuning& tuning)
: thresholds_(thresholds), tuning_(tuning) {}

int SpeedController::baseDuty(double tempC) const {
    const Thresholds& t = thresholds_;
    if (tempC <= t.tempMin) return t.fanSpeedMin;
    if (tempC >= t.tempMax) return t.fanSpeedMax;

    const double u = (tempC - t.tempMin) / (t.tempMax - t.tempMin);
    const double y = static_cast<double>(t.fanSpeedMin) +
                     u * static_cast<double>(t.fanSpeedMax - t.fanSpeedMin);
    return std::clamp(static_cast<int>(std::lround(y)), t.fanSpeedMin, t.fanSpeedMax);
}

int SpeedController::targetFor(double tempC) const {
    if (thresholds_.fanOffTemp && tempC <= *thresholds_.fanOffTemp) return 0;
    return baseDuty(tempC);
}

int SpeedController::approach(int current, int target) const {
    const int fmin = thresholds_.fanSpeedMin;
    const int step = tuning_.maxStep;

    if (target == 0) {
        // ramp down to the floor, then switch off
        if (current <= fmin) return 0;
        return std::max(fmin, current - step);
    }
    if (current <= 0) {
        // spin up straight to the floor
        return std::max(fmin, std::min(target, step));
    }

    const int delta = std::clamp(target - current, -step, step);
    return std::max(fmin, current + delta);
}

ControlDecision SpeedController::commit(int duty, DecisionReason reason,
                                        std::chrono::steady_clock::time_point now) {
    ControlDecision d;
    d.duty    = duty;
    d.target  = state_.target;
    d.reason  = reason;
    d.changed = duty != state_.currentDuty;

    if (d.changed) state_.lastChange = now;
    state_.currentDuty = duty;
    state_.phase = ControllerPhase::Tracking;
    return d;
}

ControlDecision SpeedController::holdOrEscalate(std::chrono::steady_clock::time_point now) {
    // next valid temperature must retarget regardless of the deadband
    state_.referenceTempC.reset();

    // holding is only meaningful with a spinning, known duty
    const bool canHold = tuning_.fallback == FallbackPolicy::Hold &&
                         state_.phase == ControllerPhase::Tracking &&
                         state_.currentDuty > 0;
    if (canHold) {
        return commit(state_.currentDuty, DecisionReason::NoDataHold, now);
    }

    state_.failsafe = true;
    state_.target = thresholds_.fanSpeedMax;
    return commit(thresholds_.fanSpeedMax, DecisionReason::NoDataMax, now);
}

ControlDecision SpeedController::step(std::optional<double> tempC,
                                      std::chrono::steady_clock::time_point now) {
    if (!tempC || !std::isfinite(*tempC)) {
        return holdOrEscalate(now);
    }

    const double t = *tempC;

    if (state_.phase == ControllerPhase::Idle) {
        state_.target = targetFor(t);
        state_.referenceTempC = t;
        state_.failsafe = false;
        return commit(state_.target, DecisionReason::Initial, now);
    }

    DecisionReason reason = DecisionReason::Deadband;
    if (!state_.referenceTempC ||
        std::fabs(t - *state_.referenceTempC) >= tuning_.hysteresisC) {
        state_.target = targetFor(t);
        state_.referenceTempC = t;
        reason = DecisionReason::Retarget;
    }
    state_.failsafe = false;

    // a failed write must not let the ramp run ahead of the hardware
    const int from = state_.lastWrittenDuty >= 0 ? state_.lastWrittenDuty
                                                 : state_.currentDuty;
    int duty = approach(from, state_.target);

    // a hot system never runs below the floor, whatever the off band says
    if (t > thresholds_.tempMin && duty < thresholds_.fanSpeedMin) {
        duty = thresholds_.fanSpeedMin;
    }
    return commit(duty, reason, now);
}

void SpeedController::acknowledgeWrite(int duty, std::chrono::steady_clock::time_point now) {
    if (duty != state_.lastWrittenDuty) state_.lastChange = now;
    state_.lastWrittenDuty = duty;
}

void SpeedController::reset() {
    state_ = ControllerState{};
}

} // namespace hfc
