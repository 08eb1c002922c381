/*
 * HwmonFanControl — Hwmon interface
 * (c) 2026 HwmonFanControl contributors
 */
#pragma once

#include <optional>
#include <string>
#include <vector>

namespace hfc {

/* One PWM channel and its companion attributes (empty path = not present). */
struct HwmonPwm {
    std::string chipPath;      // .../hwmonX
    std::string chipName;      // content of .../hwmonX/name
    std::string pathPwm;       // .../pwmN
    std::string pathEnable;    // .../pwmN_enable
    std::string pathFanInput;  // .../fanN_input (tach)
    int         index{0};      // N
    int         pwmMax{255};   // .../pwmN_max or 255
};

class Hwmon {
public:
    // Enumerate <sysfsRoot>/class/hwmon/hwmon*/pwmN, sorted by path
    static std::vector<HwmonPwm> scanPwms(const std::string& sysfsRoot = "/sys");

    // Companion files for an explicit pwm path (override or persisted);
    // nullopt if the path does not exist
    static std::optional<HwmonPwm> describe(const std::string& pwmPath);

    // Reading helpers
    static std::optional<int> readRaw(const HwmonPwm& p);
    static std::optional<int> readEnable(const HwmonPwm& p);
    static std::optional<int> readRpm(const HwmonPwm& p);

    // Writing helpers; err receives strerror text on failure
    static bool writeRaw(const std::string& path, int raw, std::string* err = nullptr);
    static bool setEnable(const HwmonPwm& p, int mode, std::string* err = nullptr);
};

} // namespace hfc
