/*
 * HwmonFanControl — Hwmon scanning and PwmActuator tests
 * (c) 2026 HwmonFanControl contributors
 */

#include <catch2/catch.hpp>

#include "include/Hwmon.hpp"
#include "include/PwmActuator.hpp"
#include "TestSupport.hpp"

#include <optional>
#include <stdexcept>

using hfc::Hwmon;
using hfc::HwmonPwm;
using hfc::PwmActuator;
using hfc::test::TempDir;
using hfc::test::makePwm;
using hfc::test::readFile;
using hfc::test::writeFile;

TEST_CASE("Hwmon: scan finds pwm channels and their companions", "[hwmon]") {
    TempDir sys;
    makePwm(sys.path(), "hwmon2", 2, 128, 2, 900);
    makePwm(sys.path(), "hwmon0", 1, 0);
    writeFile(sys / "class/hwmon/hwmon1/temp1_input", "30000\n");   // chip without pwm

    auto pwms = Hwmon::scanPwms(sys.path().string());
    REQUIRE(pwms.size() == 2);

    // sorted by path
    REQUIRE(pwms[0].chipName == "hwmon0chip");
    REQUIRE(pwms[0].index == 1);
    REQUIRE(pwms[0].pathEnable.empty());
    REQUIRE(pwms[0].pathFanInput.empty());

    const HwmonPwm& p = pwms[1];
    REQUIRE(p.index == 2);
    REQUIRE(p.pwmMax == 255);
    REQUIRE_FALSE(p.pathEnable.empty());
    REQUIRE(*Hwmon::readRaw(p) == 128);
    REQUIRE(*Hwmon::readEnable(p) == 2);
    REQUIRE(*Hwmon::readRpm(p) == 900);
}

TEST_CASE("Hwmon: missing sysfs root yields no channels", "[hwmon]") {
    TempDir sys;
    REQUIRE(Hwmon::scanPwms((sys / "nope").string()).empty());
}

TEST_CASE("Hwmon: describe an explicit path", "[hwmon]") {
    TempDir sys;
    const auto pwm = makePwm(sys.path(), "hwmon3", 3, 77, 1, 1200);
    writeFile(pwm.parent_path() / "pwm3_max", "127\n");

    auto d = Hwmon::describe(pwm.string());
    REQUIRE(d.has_value());
    REQUIRE(d->index == 3);
    REQUIRE(d->pwmMax == 127);
    REQUIRE(*Hwmon::readRpm(*d) == 1200);

    REQUIRE_FALSE(Hwmon::describe((sys / "class/hwmon/hwmon3/pwm9").string()).has_value());

    SECTION("an out-of-range channel number is treated as a plain attribute") {
        const auto odd = pwm.parent_path() / "pwm99999999999";
        writeFile(odd, "0\n");
        std::optional<hfc::HwmonPwm> o;
        REQUIRE_NOTHROW(o = Hwmon::describe(odd.string()));
        REQUIRE(o.has_value());
        REQUIRE(o->index == 0);
        REQUIRE(o->pathEnable.empty());
        REQUIRE(o->pathPwm == odd.string());
    }
}

TEST_CASE("PwmActuator: writes land in the attribute", "[actuator]") {
    TempDir sys;
    const auto pwm = makePwm(sys.path(), "hwmon0", 1, 0, 2);
    PwmActuator act(*Hwmon::describe(pwm.string()));

    std::string err;
    REQUIRE(act.write(180, &err));
    REQUIRE(readFile(pwm) == "180");
    REQUIRE(*act.readCurrent() == 180);
    REQUIRE(*act.lastWritten() == 180);

    REQUIRE(act.write(0, &err));
    REQUIRE(act.write(255, &err));
    REQUIRE(readFile(pwm) == "255");
}

TEST_CASE("PwmActuator: out-of-range duty is a contract violation", "[actuator]") {
    TempDir sys;
    const auto pwm = makePwm(sys.path(), "hwmon0", 1, 40);
    PwmActuator act(*Hwmon::describe(pwm.string()));

    REQUIRE_THROWS_AS(act.write(256), std::out_of_range);
    REQUIRE_THROWS_AS(act.write(-1), std::out_of_range);
    REQUIRE(readFile(pwm) == "40");
    REQUIRE_FALSE(act.lastWritten().has_value());
}

TEST_CASE("PwmActuator: a vanished attribute reports an error", "[actuator]") {
    TempDir sys;
    const auto pwm = makePwm(sys.path(), "hwmon0", 1, 40);
    PwmActuator act(*Hwmon::describe(pwm.string()));
    std::filesystem::remove(pwm);

    std::string err;
    REQUIRE_FALSE(act.write(100, &err));
    REQUIRE_FALSE(err.empty());
    REQUIRE_FALSE(act.lastWritten().has_value());
}

TEST_CASE("PwmActuator: manual mode is taken and given back", "[actuator]") {
    TempDir sys;
    const auto pwm = makePwm(sys.path(), "hwmon0", 1, 40, 2);
    const auto enable = pwm.parent_path() / "pwm1_enable";
    PwmActuator act(*Hwmon::describe(pwm.string()));

    REQUIRE(act.takeControl());
    REQUIRE(readFile(enable) == "1");

    REQUIRE(act.releaseControl());
    REQUIRE(readFile(enable) == "2");
}

TEST_CASE("PwmActuator: channels without an enable file need no mode switch", "[actuator]") {
    TempDir sys;
    const auto pwm = makePwm(sys.path(), "hwmon0", 1, 40);
    PwmActuator act(*Hwmon::describe(pwm.string()));

    REQUIRE(act.takeControl());
    REQUIRE(act.releaseControl());
    REQUIRE_FALSE(std::filesystem::exists(pwm.parent_path() / "pwm1_enable"));
}
