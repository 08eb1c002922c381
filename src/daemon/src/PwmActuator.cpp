/*
 * HwmonFanControl — PwmActuator (implementation)
 * (c) 2026 HwmonFanControl contributors
 */

#include "include/PwmActuator.hpp"
#include "include/Log.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace hfc {

PwmActuator::PwmActuator(HwmonPwm channel)
: channel_(std::move(channel)) {
    if (channel_.pwmMax <= 0) channel_.pwmMax = 255;
}

PwmActuator::~PwmActuator() = default;

bool PwmActuator::write(int duty, std::string* err) {
    if (duty < 0 || duty > channel_.pwmMax) {
        throw std::out_of_range("pwm duty " + std::to_string(duty) + " outside [0, " +
                                std::to_string(channel_.pwmMax) + "] for " + channel_.pathPwm);
    }

    std::string why;
    if (!Hwmon::writeRaw(channel_.pathPwm, duty, &why)) {
        if (err) *err = why;
        return false;
    }
    lastWritten_ = duty;
    LOG_DEBUG("pwm: %s <- %d", channel_.pathPwm.c_str(), duty);
    return true;
}

std::optional<int> PwmActuator::readCurrent() const {
    return Hwmon::readRaw(channel_);
}

std::optional<int> PwmActuator::readRpm() const {
    return Hwmon::readRpm(channel_);
}

bool PwmActuator::takeControl(std::string* err) {
    if (channel_.pathEnable.empty()) return true;

    if (!originalEnable_) originalEnable_ = Hwmon::readEnable(channel_);
    if (originalEnable_ && *originalEnable_ == 1) return true;

    if (!Hwmon::setEnable(channel_, 1, err)) return false;
    LOG_INFO("pwm: %s switched to manual mode (was %d)",
             channel_.pathPwm.c_str(), originalEnable_.value_or(-1));
    return true;
}

bool PwmActuator::releaseControl(std::string* err) {
    if (!originalEnable_ || *originalEnable_ == 1) return true;
    if (!Hwmon::setEnable(channel_, *originalEnable_, err)) return false;
    LOG_INFO("pwm: %s enable mode restored to %d", channel_.pathPwm.c_str(), *originalEnable_);
    return true;
}

} // namespace hfc
