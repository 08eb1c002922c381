/*
 * HwmonFanControl — PwmActuator (header)
 * - Writes duty cycles to exactly one validated PWM attribute
 * (c) 2026 HwmonFanControl contributors
 */
#pragma once

#include "Hwmon.hpp"

#include <optional>
#include <string>

namespace hfc {

class PwmActuator {
public:
    explicit PwmActuator(HwmonPwm channel);
    ~PwmActuator();

    PwmActuator(const PwmActuator&) = delete;
    PwmActuator& operator=(const PwmActuator&) = delete;

    /*
     * Write duty in [0, hardwareMax()]. Out-of-range values are a caller bug
     * and throw std::out_of_range; clamping belongs to SpeedController.
     * I/O failures return false with the reason in *err.
     */
    bool write(int duty, std::string* err = nullptr);

    std::optional<int> readCurrent() const;
    std::optional<int> readRpm() const;

    /* Remember pwmN_enable and switch to manual (1). No-op without enable file. */
    bool takeControl(std::string* err = nullptr);

    /* Restore the remembered pwmN_enable mode (hands the fan back to firmware). */
    bool releaseControl(std::string* err = nullptr);

    const std::string& path() const noexcept { return channel_.pathPwm; }
    int hardwareMax() const noexcept { return channel_.pwmMax; }
    const HwmonPwm& channel() const noexcept { return channel_; }
    std::optional<int> lastWritten() const noexcept { return lastWritten_; }

private:
    HwmonPwm           channel_;
    std::optional<int> originalEnable_;
    std::optional<int> lastWritten_;
};

} // namespace hfc
