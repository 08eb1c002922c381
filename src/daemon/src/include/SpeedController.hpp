/*
 * HwmonFanControl — SpeedController (header)
 * - Linear temperature -> duty mapping between (tempMin, fanSpeedMin) and
 *   (tempMax, fanSpeedMax), a deadband around the reference temperature,
 *   per-cycle step limiting and the fanSpeedMin safety floor.
 * (c) 2026 HwmonFanControl contributors
 */
#pragma once

#include "Config.hpp"

#include <chrono>
#include <optional>

namespace hfc {

enum class ControllerPhase {
    Idle,       // no duty computed yet
    Tracking    // normal operation; never left except by reset()
};

/* Owned by SpeedController; mutated once per step(). In-memory only. */
struct ControllerState {
    ControllerPhase phase{ControllerPhase::Idle};
    int  currentDuty{-1};                        // duty the controller commands
    int  lastWrittenDuty{-1};                    // last duty confirmed by acknowledgeWrite()
    int  target{-1};                             // unsmoothed target for the reference temp
    std::optional<double> referenceTempC;        // temp that produced `target`
    std::chrono::steady_clock::time_point lastChange{};
    bool failsafe{false};                        // duty forced by missing data
};

enum class DecisionReason {
    Initial,        // first cycle: base target applied directly
    Retarget,       // temperature left the deadband, new target
    Deadband,       // within deadband, target kept
    NoDataHold,     // no temperature, last duty held
    NoDataMax       // no temperature, forced to fanSpeedMax
};

const char* decisionReasonName(DecisionReason r);

struct ControlDecision {
    int            duty{0};       // value to write this cycle
    int            target{0};     // where the ramp is heading
    bool           changed{false};
    DecisionReason reason{DecisionReason::Initial};
};

class SpeedController {
public:
    SpeedController(const Thresholds& thresholds, const ControllerTuning& tuning);

    /* Clamped linear interpolation; no extrapolation beyond the bounds. */
    int baseDuty(double tempC) const;

    /* baseDuty() plus the optional fan-off band (0 at or below fanOffTemp). */
    int targetFor(double tempC) const;

    /*
     * One control cycle. tempC == nullopt means every source failed;
     * the configured fallback policy decides. Never throws.
     */
    ControlDecision step(std::optional<double> tempC,
                         std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    /* Record that `duty` actually reached the hardware. */
    void acknowledgeWrite(int duty, std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    /* Back to Idle; the next step() applies its target without ramping. */
    void reset();

    const ControllerState& state() const noexcept { return state_; }

private:
    int approach(int current, int target) const;
    ControlDecision holdOrEscalate(std::chrono::steady_clock::time_point now);
    ControlDecision commit(int duty, DecisionReason reason, std::chrono::steady_clock::time_point now);

private:
    Thresholds       thresholds_;
    ControllerTuning tuning_;
    ControllerState  state_;
};

} // namespace hfc
