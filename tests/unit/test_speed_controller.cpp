/*
 * HwmonFanControl — SpeedController tests
 * (c) 2026 HwmonFanControl contributors
 */

#include <catch2/catch.hpp>

#include "include/SpeedController.hpp"
#include "TestSupport.hpp"

#include <limits>
#include <optional>

using hfc::ControllerTuning;
using hfc::DecisionReason;
using hfc::FallbackPolicy;
using hfc::SpeedController;
using hfc::Thresholds;

namespace {

Thresholds rampThresholds() {
    return hfc::test::rampConfig().thresholds;
}

ControllerTuning rampTuning(FallbackPolicy fb = FallbackPolicy::Max) {
    ControllerTuning t;
    t.hysteresisC = 2.0;
    t.maxStep     = 20;
    t.fallback    = fb;
    return t;
}

} // namespace

TEST_CASE("SpeedController: base mapping is clamped linear interpolation", "[controller]") {
    SpeedController c(rampThresholds(), rampTuning());

    SECTION("at and below temp_min maps to fan_speed_min") {
        REQUIRE(c.baseDuty(35.0) == 80);
        REQUIRE(c.baseDuty(20.0) == 80);
        REQUIRE(c.baseDuty(-10.0) == 80);
    }
    SECTION("at and above temp_max maps to fan_speed_max") {
        REQUIRE(c.baseDuty(70.0) == 255);
        REQUIRE(c.baseDuty(95.0) == 255);
    }
    SECTION("interior points") {
        REQUIRE(c.baseDuty(50.0) == 155);
        REQUIRE(c.baseDuty(65.0) == 230);
        REQUIRE(c.baseDuty(52.0) == 165);
    }
}

TEST_CASE("SpeedController: mapping is monotonic non-decreasing", "[controller]") {
    SpeedController c(rampThresholds(), rampTuning());
    int prev = c.baseDuty(0.0);
    for (double t = 0.0; t <= 100.0; t += 0.25) {
        const int d = c.baseDuty(t);
        REQUIRE(d >= prev);
        REQUIRE(d >= 80);
        REQUIRE(d <= 255);
        prev = d;
    }
}

TEST_CASE("SpeedController: first cycle jumps, later cycles ramp by max_step", "[controller]") {
    SpeedController c(rampThresholds(), rampTuning());

    auto first = c.step(50.0);
    REQUIRE(first.reason == DecisionReason::Initial);
    REQUIRE(first.duty == 155);
    REQUIRE(first.changed);

    auto second = c.step(65.0);
    REQUIRE(second.reason == DecisionReason::Retarget);
    REQUIRE(second.target == 230);
    REQUIRE(second.duty == 175);

    REQUIRE(c.step(65.0).duty == 195);
    REQUIRE(c.step(65.0).duty == 215);
    REQUIRE(c.step(65.0).duty == 230);

    SECTION("converged output is idempotent") {
        for (int i = 0; i < 5; ++i) {
            auto d = c.step(65.0);
            REQUIRE(d.duty == 230);
            REQUIRE_FALSE(d.changed);
        }
    }
}

TEST_CASE("SpeedController: step limit applies downwards too", "[controller]") {
    SpeedController c(rampThresholds(), rampTuning());
    REQUIRE(c.step(70.0).duty == 255);
    auto d = c.step(35.0);
    REQUIRE(d.target == 80);
    REQUIRE(d.duty == 235);
}

TEST_CASE("SpeedController: hysteresis suppresses small oscillations", "[controller]") {
    SpeedController c(rampThresholds(), rampTuning());
    REQUIRE(c.step(50.0).duty == 155);

    SECTION("alternating within the deadband keeps the duty") {
        for (double t : {51.0, 50.0, 51.5, 49.0, 50.5}) {
            auto d = c.step(t);
            REQUIRE(d.reason == DecisionReason::Deadband);
            REQUIRE(d.duty == 155);
        }
    }
    SECTION("drift is measured from the reference, not the previous sample") {
        REQUIRE(c.step(51.0).reason == DecisionReason::Deadband);
        auto d = c.step(52.0);
        REQUIRE(d.reason == DecisionReason::Retarget);
        REQUIRE(d.target == 165);
        REQUIRE(d.duty == 165);
    }
}

TEST_CASE("SpeedController: no data with fallback max forces full speed", "[controller][fallback]") {
    SpeedController c(rampThresholds(), rampTuning(FallbackPolicy::Max));

    SECTION("after tracking") {
        REQUIRE(c.step(50.0).duty == 155);
        auto d = c.step(std::nullopt);
        REQUIRE(d.reason == DecisionReason::NoDataMax);
        REQUIRE(d.duty == 255);
        REQUIRE(c.state().failsafe);

        // recovery retargets at once and ramps down
        auto r = c.step(50.0);
        REQUIRE(r.reason == DecisionReason::Retarget);
        REQUIRE(r.duty == 235);
        REQUIRE_FALSE(c.state().failsafe);
    }
    SECTION("on the very first cycle") {
        auto d = c.step(std::nullopt);
        REQUIRE(d.duty == 255);
    }
    SECTION("NaN counts as no data") {
        REQUIRE(c.step(std::numeric_limits<double>::quiet_NaN()).duty == 255);
    }
}

TEST_CASE("SpeedController: no data with fallback hold keeps the last duty", "[controller][fallback]") {
    SpeedController c(rampThresholds(), rampTuning(FallbackPolicy::Hold));

    SECTION("holds while tracking") {
        REQUIRE(c.step(50.0).duty == 155);
        auto d = c.step(std::nullopt);
        REQUIRE(d.reason == DecisionReason::NoDataHold);
        REQUIRE(d.duty == 155);
        REQUIRE_FALSE(c.state().failsafe);
    }
    SECTION("escalates when nothing is known yet") {
        auto d = c.step(std::nullopt);
        REQUIRE(d.reason == DecisionReason::NoDataMax);
        REQUIRE(d.duty == 255);
    }
}

TEST_CASE("SpeedController: optional fan-off band", "[controller][off]") {
    Thresholds th = rampThresholds();
    th.fanOffTemp = 30.0;
    SpeedController c(th, rampTuning());

    SECTION("cold start is off, warming jumps straight to the floor") {
        REQUIRE(c.step(25.0).duty == 0);
        auto d = c.step(40.0);
        REQUIRE(d.target == 105);
        REQUIRE(d.duty == 80);
        REQUIRE(c.step(40.0).duty == 100);
    }
    SECTION("cooling ramps to the floor, then switches off") {
        REQUIRE(c.step(36.0).duty == 85);
        REQUIRE(c.step(25.0).duty == 80);
        REQUIRE(c.step(25.0).duty == 0);
    }
    SECTION("above temp_min never runs below the floor") {
        c.step(25.0);
        for (int i = 0; i < 3; ++i) {
            REQUIRE(c.step(36.0).duty >= 80);
        }
    }
}

TEST_CASE("SpeedController: reset returns to Idle", "[controller]") {
    SpeedController c(rampThresholds(), rampTuning());
    c.step(70.0);
    c.acknowledgeWrite(255);
    REQUIRE(c.state().lastWrittenDuty == 255);

    c.reset();
    REQUIRE(c.state().phase == hfc::ControllerPhase::Idle);
    REQUIRE(c.state().currentDuty == -1);

    // no ramp after reset
    REQUIRE(c.step(35.0).duty == 80);
}

TEST_CASE("SpeedController: unacknowledged duties do not advance the ramp", "[controller]") {
    SpeedController c(rampThresholds(), rampTuning());
    REQUIRE(c.step(50.0).duty == 155);
    c.acknowledgeWrite(155);

    // writes of 175 never reached the hardware
    REQUIRE(c.step(65.0).duty == 175);
    REQUIRE(c.step(65.0).duty == 175);

    c.acknowledgeWrite(175);
    REQUIRE(c.step(65.0).duty == 195);
}
