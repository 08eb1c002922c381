/*
 * HwmonFanControl — Daemon entry (main)
 * (c) 2026 HwmonFanControl contributors
 */

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "include/Version.hpp"
#include "include/Config.hpp"
#include "include/ControlLoop.hpp"
#include "include/Hwmon.hpp"
#include "include/Log.hpp"
#include "include/PathDiscovery.hpp"
#include "include/PwmActuator.hpp"
#include "include/SensorSource.hpp"
#include "include/SpeedController.hpp"
#include "include/TemperatureAggregator.hpp"
#include "include/Utils.hpp"

using hfc::ExitCode;
using hfc::FanConfig;

static std::atomic<bool> gStop{false};
static void sig_handler(int) { gStop.store(true); }

static constexpr int kExitUsage = 1;
static constexpr size_t kLogRotateBytes = 5u * 1024u * 1024u;
static constexpr int kLogRotateFiles = 5;

enum class Mode { Run, Status, TestFan, Configure, DumpConfig };

static void usage(const char* exe) {
    std::cout <<
        "HwmonFanControl daemon (hfcd) " << HFCD_VERSION << "\n"
        "Usage: " << exe << " [mode] [options]\n"
        "Modes (default: continuous control):\n"
        "  --status              Show sensors, control temperature and current PWM (read-only)\n"
        "  --test-fan            Step the fan through min/mid/max and a sweep, then restore\n"
        "  --configure           Find the PWM attribute interactively and save it\n"
        "  --dump-config         Print the effective configuration as JSON\n"
        "Options:\n"
        "  --config PATH         Configuration file (default: " << hfc::defaultConfigPath() << ")\n"
        "  --pwm-path PATH       Use this PWM attribute; skips discovery\n"
        "  --log-level LEVEL     DEBUG, INFO, WARNING or ERROR (default: INFO)\n"
        "  --log-file PATH       Also log to PATH (rotated at 5 MiB)\n"
        "  --interval SECONDS    Poll interval (default: 30)\n"
        "  --version             Print version and exit\n"
        "  -h,--help             Show this help\n";
}

static void install_signals() {
    std::signal(SIGINT,  sig_handler);
    std::signal(SIGTERM, sig_handler);
#ifdef SIGHUP
    std::signal(SIGHUP,  sig_handler);
#endif
}

static bool require_root(const char* what) {
    if (::geteuid() == 0) return true;
    LOG_ERROR("%s requires root (PWM attributes are root-writable)", what);
    return false;
}

static bool sleep_ms_cancelable(int ms) {
    const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(ms);
    while (std::chrono::steady_clock::now() < until) {
        if (gStop.load(std::memory_order_relaxed)) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return !gStop.load(std::memory_order_relaxed);
}

/* ------------------------------- --status --------------------------------- */

static int run_status(const FanConfig& cfg) {
    hfc::TemperatureAggregator agg(hfc::makeSensorSources(cfg, &gStop));
    const hfc::AggregateResult res = agg.collect();

    std::printf("Sensors:\n");
    for (const auto& r : res.readings) {
        if (r.ok) {
            std::printf("  %-16s %-10s %6.1f C\n", r.source.c_str(),
                        hfc::sensorCategoryName(r.category), r.valueC);
        } else {
            std::printf("  %-16s %-10s    n/a (%s)\n", r.source.c_str(),
                        hfc::sensorCategoryName(r.category), r.error.c_str());
        }
    }

    hfc::SpeedController ctl(cfg.thresholds, cfg.tuning);
    if (res.controlTemp) {
        const int t = ctl.targetFor(*res.controlTemp);
        std::printf("Control temperature: %.1f C (%s), target %.1f C\n",
                    *res.controlTemp, res.hottest.c_str(), cfg.thresholds.tempTarget);
        std::printf("Mapped duty: %d (%d%%)\n", t, hfc::util::pwmPercentFromRaw(t, hfc::kPwmHardwareMax));
    } else {
        std::printf("Control temperature: n/a (no sensor produced data)\n");
    }

    hfc::PathDiscovery disc(cfg, &gStop);
    const auto pwm = disc.peek(cfg.pwmPath);
    if (!pwm) {
        std::printf("PWM: not configured (run --configure)\n");
        return 0;
    }
    std::printf("PWM: %s (%s)%s\n", pwm->pathPwm.c_str(), pwm->chipName.c_str(),
                hfc::util::is_writable(pwm->pathPwm) ? "" : " [not writable by this user]");
    if (auto raw = hfc::Hwmon::readRaw(*pwm)) {
        std::printf("  value: %d/%d (%d%%)\n", *raw, pwm->pwmMax,
                    hfc::util::pwmPercentFromRaw(*raw, pwm->pwmMax));
    } else {
        std::printf("  value: unreadable\n");
    }
    if (auto en = hfc::Hwmon::readEnable(*pwm)) std::printf("  enable: %d\n", *en);
    if (auto rpm = hfc::Hwmon::readRpm(*pwm))  std::printf("  fan: %d rpm\n", *rpm);
    return 0;
}

/* ------------------------------ --test-fan -------------------------------- */

static int run_test_fan(const FanConfig& cfg) {
    hfc::PathDiscovery disc(cfg, &gStop);
    hfc::PwmActuator act(disc.resolve(cfg.pwmPath));

    const auto original = act.readCurrent();
    std::string err;
    if (!act.takeControl(&err)) {
        LOG_ERROR("test: cannot switch %s to manual mode: %s", act.path().c_str(), err.c_str());
        return static_cast<int>(ExitCode::ActuationLost);
    }

    const hfc::Thresholds& t = cfg.thresholds;
    std::vector<int> steps{t.fanSpeedMin, (t.fanSpeedMin + t.fanSpeedMax) / 2, t.fanSpeedMax};
    for (int v = 0; v <= act.hardwareMax(); v += std::max(1, act.hardwareMax() / 5)) steps.push_back(v);
    if (steps.back() != act.hardwareMax()) steps.push_back(act.hardwareMax());

    int rc = 0;
    for (int duty : steps) {
        if (!act.write(duty, &err)) {
            LOG_ERROR("test: write %d to %s failed: %s", duty, act.path().c_str(), err.c_str());
            rc = static_cast<int>(ExitCode::ActuationLost);
            break;
        }
        if (!sleep_ms_cancelable(cfg.discovery.settleMs)) break;
        if (auto rpm = act.readRpm()) {
            LOG_INFO("test: duty %3d (%3d%%) -> %d rpm", duty,
                     hfc::util::pwmPercentFromRaw(duty, act.hardwareMax()), *rpm);
        } else {
            LOG_INFO("test: duty %3d (%3d%%)", duty, hfc::util::pwmPercentFromRaw(duty, act.hardwareMax()));
        }
    }

    if (original && !act.write(std::clamp(*original, 0, act.hardwareMax()), &err)) {
        LOG_ERROR("test: restoring %s to %d failed: %s", act.path().c_str(), *original, err.c_str());
        rc = static_cast<int>(ExitCode::ActuationLost);
    }
    if (!act.releaseControl(&err)) {
        LOG_ERROR("test: restoring enable mode of %s failed: %s", act.path().c_str(), err.c_str());
        rc = static_cast<int>(ExitCode::ActuationLost);
    }
    LOG_INFO("test: done, %s restored", act.path().c_str());
    return rc;
}

/* ------------------------------ --configure ------------------------------- */

static int run_configure(const FanConfig& cfg) {
    hfc::PathDiscovery disc(cfg, &gStop);
    hfc::ConsolePrompt prompt(std::cin, std::cout);

    const hfc::HwmonPwm found = disc.discoverInteractive(prompt);
    std::cout << "Fan control path saved: " << found.pathPwm << " -> " << disc.store().file() << "\n";
    return 0;
}

/* --------------------------------- run ------------------------------------ */

static int run_control(const FanConfig& cfg) {
    hfc::PathDiscovery disc(cfg, &gStop);
    auto act = std::make_unique<hfc::PwmActuator>(disc.resolve(cfg.pwmPath));

    hfc::TemperatureAggregator agg(hfc::makeSensorSources(cfg, &gStop));
    hfc::ControlLoop loop(cfg, std::move(agg), std::move(act), gStop);
    return static_cast<int>(loop.run());
}

int main(int argc, char** argv) {
    std::string cfgPath;
    std::optional<std::string> pwmPath;
    std::optional<std::string> logLevel;
    std::optional<std::string> logFile;
    std::optional<std::string> interval;
    Mode mode = Mode::Run;

    // Parse CLI first (no filesystem/config yet)
    for (int i=1; i<argc; ++i) {
        std::string a = argv[i];
        auto next = [&](const char* what)->std::string {
            if (i+1>=argc) { std::cerr << "missing value for " << what << "\n"; std::exit(kExitUsage); }
            return argv[++i];
        };
        if (a=="--config") cfgPath = next(a.c_str());
        else if (a=="--pwm-path")  pwmPath  = next(a.c_str());
        else if (a=="--log-level") logLevel = next(a.c_str());
        else if (a=="--log-file")  logFile  = next(a.c_str());
        else if (a=="--interval")  interval = next(a.c_str());
        else if (a=="--status")      mode = Mode::Status;
        else if (a=="--test-fan")    mode = Mode::TestFan;
        else if (a=="--configure")   mode = Mode::Configure;
        else if (a=="--dump-config") mode = Mode::DumpConfig;
        else if (a=="--version") { std::cout << "hfcd " << HFCD_VERSION << "\n"; return 0; }
        else if (a=="-h" || a=="--help") { usage(argv[0]); return 0; }
        else {
            std::cerr << "unknown arg: " << a << "\n";
            usage(argv[0]);
            return kExitUsage;
        }
    }

    // Console logging until the configuration says otherwise
    hfc::Logger::instance().init("", hfc::LogLevel::Info, true);

    FanConfig cfg;
    try {
        cfg = hfc::loadFanConfig(cfgPath);

        if (pwmPath) cfg.pwmPath = hfc::util::expandUserPath(*pwmPath);
        if (logFile) cfg.logFile = hfc::util::expandUserPath(*logFile);
        if (logLevel && !hfc::parseLogLevel(*logLevel, cfg.logLevel)) {
            throw hfc::ConfigError("invalid --log-level '" + *logLevel + "' (DEBUG, INFO, WARNING, ERROR)");
        }
        if (interval) {
            auto s = hfc::util::parse_ll(*interval);
            if (!s || *s <= 0 || *s > 24 * 3600) {
                throw hfc::ConfigError("invalid --interval '" + *interval + "' (seconds, > 0)");
            }
            cfg.pollIntervalMs = static_cast<int>(*s * 1000);
        }

        hfc::validateConfig(cfg);
    } catch (const hfc::ConfigError& e) {
        LOG_ERROR("config: %s", e.what());
        return static_cast<int>(ExitCode::ConfigFailure);
    }

    if (mode == Mode::DumpConfig) {
        nlohmann::json j = cfg;
        std::cout << j.dump(2) << "\n";
        return 0;
    }

    hfc::Logger::instance().init(cfg.logFile, cfg.logLevel, true);
    if (!cfg.logFile.empty()) hfc::Logger::instance().enableRotation(kLogRotateBytes, kLogRotateFiles);
    LOG_INFO("hfcd starting (version %s, config %s)", HFCD_VERSION,
             cfg.configFile.empty() ? "<defaults>" : cfg.configFile.c_str());

    install_signals();

    int rc = 0;
    try {
        switch (mode) {
            case Mode::Status:
                rc = run_status(cfg);
                break;
            case Mode::TestFan:
                rc = require_root("--test-fan") ? run_test_fan(cfg) : kExitUsage;
                break;
            case Mode::Configure:
                rc = require_root("--configure") ? run_configure(cfg) : kExitUsage;
                break;
            case Mode::Run:
                rc = require_root("fan control") ? run_control(cfg) : kExitUsage;
                break;
            case Mode::DumpConfig:
                break;
        }
    } catch (const hfc::DiscoveryError& e) {
        LOG_ERROR("discovery: %s", e.what());
        LOG_ERROR("hint: load the fan driver (e.g. modprobe it87), run 'hfcd --configure', or pass --pwm-path");
        rc = static_cast<int>(ExitCode::ConfigFailure);
    } catch (const hfc::ConfigError& e) {
        LOG_ERROR("config: %s", e.what());
        rc = static_cast<int>(ExitCode::ConfigFailure);
    }

    LOG_INFO("hfcd exiting (status %d)", rc);
    hfc::Logger::instance().shutdown();
    return rc;
}
