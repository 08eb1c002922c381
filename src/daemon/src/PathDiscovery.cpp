/*
 * HwmonFanControl — PathDiscovery (implementation)
 * (c) 2026 HwmonFanControl contributors
 */

#include "include/PathDiscovery.hpp"
#include "include/Log.hpp"
#include "include/Utils.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <istream>
#include <ostream>
#include <thread>
#include <utility>

namespace hfc {

/* ------------------------------ ConsolePrompt ----------------------------- */

ConsolePrompt::ConsolePrompt(std::istream& in, std::ostream& out)
: in_(in), out_(out) {}

void ConsolePrompt::notify(const std::string& message) {
    out_ << message << std::endl;
}

bool ConsolePrompt::confirm(const std::string& question) {
    out_ << question << " [y/N] " << std::flush;
    std::string line;
    if (!std::getline(in_, line)) return false;
    const std::string a = util::to_lower(util::trim(line));
    return a == "y" || a == "yes";
}

/* -------------------------------- PathStore ------------------------------- */

PathStore::PathStore(std::string file)
: file_(std::move(file)) {}

std::optional<std::string> PathStore::load() const {
    std::error_code ec;
    if (file_.empty() || !std::filesystem::exists(file_, ec)) return std::nullopt;

    try {
        const nlohmann::json j = util::read_json_file(file_);
        if (!j.is_object() || !j.contains("pwm_path") || !j["pwm_path"].is_string()) {
            LOG_WARN("discovery: %s has no pwm_path; ignoring", file_.c_str());
            return std::nullopt;
        }
        std::string p = j["pwm_path"].get<std::string>();
        if (p.empty()) return std::nullopt;
        return p;
    } catch (const std::exception& e) {
        LOG_WARN("discovery: cannot read %s: %s", file_.c_str(), e.what());
        return std::nullopt;
    }
}

bool PathStore::save(const std::string& pwmPath, std::string* err) const {
    std::error_code ec;
    util::ensure_parent_dirs(file_, &ec);
    if (ec) {
        if (err) *err = ec.message();
        return false;
    }
    nlohmann::json j{
        {"pwm_path", pwmPath},
        {"saved_at", util::utc_iso8601()}
    };
    return util::write_json_file(file_, j, err);
}

/* ------------------------------ PathDiscovery ----------------------------- */

PathDiscovery::PathDiscovery(const FanConfig& cfg, const std::atomic<bool>* stop)
: cfg_(cfg), store_(cfg.stateFile), stop_(stop) {}

bool PathDiscovery::stopRequested_() const {
    return stop_ && stop_->load(std::memory_order_relaxed);
}

bool PathDiscovery::sleepMsCancelable_(int ms) const {
    using namespace std::chrono;
    const auto until = steady_clock::now() + milliseconds(ms);
    while (steady_clock::now() < until) {
        if (stopRequested_()) return false;
        const auto left = duration_cast<milliseconds>(until - steady_clock::now());
        std::this_thread::sleep_for(std::min(left, milliseconds(50)));
    }
    return !stopRequested_();
}

int PathDiscovery::testDutyFor(int prior, int pwmMax) {
    if (pwmMax <= 0) pwmMax = kPwmHardwareMax;
    return prior < (pwmMax + 1) / 2 ? pwmMax : 0;
}

std::vector<HwmonPwm> PathDiscovery::candidates() const {
    std::vector<HwmonPwm> out;
    for (auto& p : Hwmon::scanPwms(cfg_.sysfsRoot)) {
        if (!util::is_writable(p.pathPwm)) {
            LOG_DEBUG("discovery: %s not writable; skipped", p.pathPwm.c_str());
            continue;
        }
        out.push_back(std::move(p));
    }
    LOG_INFO("discovery: %zu writable pwm candidate(s)", out.size());
    return out;
}

ProbeOutcome PathDiscovery::probe(const HwmonPwm& c, OperatorPrompt* prompt) {
    ProbeOutcome r;

    const auto prevRaw = Hwmon::readRaw(c);
    if (!prevRaw) {
        r.error = "current value unreadable";
        return r;
    }
    const auto prevMode = Hwmon::readEnable(c);

    auto restore = [&]() -> bool {
        bool ok = true;
        std::string why;
        if (!Hwmon::writeRaw(c.pathPwm, *prevRaw, &why)) {
            LOG_WARN("discovery: restoring %s to %d failed: %s", c.pathPwm.c_str(), *prevRaw, why.c_str());
            ok = false;
        }
        if (prevMode && !Hwmon::setEnable(c, *prevMode, &why)) ok = false;
        return ok;
    };

    if (prevMode && *prevMode != 1) {
        std::string why;
        if (!Hwmon::setEnable(c, 1, &why)) {
            r.error = "cannot switch to manual mode: " + why;
            return r;
        }
    }

    r.rpmBefore = Hwmon::readRpm(c);
    r.testDuty  = testDutyFor(*prevRaw, c.pwmMax);

    std::string why;
    if (!Hwmon::writeRaw(c.pathPwm, r.testDuty, &why)) {
        r.error = "test write failed: " + why;
        restore();
        return r;
    }
    LOG_INFO("discovery: %s set to %d (was %d)", c.pathPwm.c_str(), r.testDuty, *prevRaw);

    bool confirmed = false;
    if (prompt) {
        prompt->notify("Testing " + c.pathPwm + " (" + c.chipName + "): set to " +
                       std::to_string(r.testDuty) + ", was " + std::to_string(*prevRaw) + ".");
        if (sleepMsCancelable_(cfg_.discovery.settleMs)) {
            confirmed = prompt->confirm("Did a fan change speed?");
        }
    } else if (sleepMsCancelable_(cfg_.discovery.settleMs)) {
        r.rpmAfter = Hwmon::readRpm(c);
        if (r.rpmBefore && r.rpmAfter) {
            const int delta = std::abs(*r.rpmAfter - *r.rpmBefore);
            confirmed = delta >= cfg_.discovery.rpmDelta;
            LOG_INFO("discovery: %s tach %d -> %d rpm (delta %d, need %d)",
                     c.pathPwm.c_str(), *r.rpmBefore, *r.rpmAfter, delta, cfg_.discovery.rpmDelta);
        } else {
            confirmed = true; // no tach: a successful write is all we can check
            LOG_INFO("discovery: %s has no tach; accepting on write success", c.pathPwm.c_str());
        }
    }

    const bool restored = restore();
    if (stopRequested_()) {
        throw DiscoveryError("discovery interrupted");
    }
    if (!restored) {
        r.error = "restoring previous state failed";
        return r;
    }

    r.accepted  = true;
    r.confirmed = confirmed;
    return r;
}

HwmonPwm PathDiscovery::discoverInteractive(OperatorPrompt& prompt) {
    const auto cands = candidates();
    if (cands.empty()) {
        throw DiscoveryError("no writable pwm attribute under " + cfg_.sysfsRoot +
                             "/class/hwmon (is the fan driver loaded, e.g. it87?)");
    }

    for (const auto& c : cands) {
        const ProbeOutcome r = probe(c, &prompt);
        if (!r.accepted) {
            LOG_WARN("discovery: %s rejected: %s", c.pathPwm.c_str(), r.error.c_str());
            continue;
        }
        if (r.confirmed) {
            LOG_INFO("discovery: %s confirmed by operator", c.pathPwm.c_str());
            std::string err;
            if (!store_.save(c.pathPwm, &err)) {
                throw DiscoveryError("cannot save " + store_.file() + ": " + err);
            }
            LOG_INFO("discovery: saved %s to %s", c.pathPwm.c_str(), store_.file().c_str());
            return c;
        }
        LOG_INFO("discovery: %s not confirmed", c.pathPwm.c_str());
    }
    throw DiscoveryError("no pwm candidate was confirmed (" + std::to_string(cands.size()) + " tested)");
}

HwmonPwm PathDiscovery::discoverAutomatic() {
    const auto cands = candidates();
    if (cands.empty()) {
        throw DiscoveryError("no writable pwm attribute under " + cfg_.sysfsRoot +
                             "/class/hwmon (is the fan driver loaded, e.g. it87?)");
    }

    for (const auto& c : cands) {
        const ProbeOutcome r = probe(c, nullptr);
        if (!r.accepted) {
            LOG_WARN("discovery: %s rejected: %s", c.pathPwm.c_str(), r.error.c_str());
            continue;
        }
        if (r.confirmed) return c;
    }
    throw DiscoveryError("no pwm candidate reacted to a test write; run --configure");
}

std::optional<HwmonPwm> PathDiscovery::peek(const std::string& overridePath) const {
    if (!overridePath.empty()) return Hwmon::describe(overridePath);
    if (auto saved = store_.load()) return Hwmon::describe(*saved);
    return std::nullopt;
}

HwmonPwm PathDiscovery::resolve(const std::string& overridePath) {
    if (!overridePath.empty()) {
        auto d = Hwmon::describe(overridePath);
        if (!d) {
            throw DiscoveryError("pwm path " + overridePath + " does not exist");
        }
        if (!util::is_writable(d->pathPwm)) {
            throw DiscoveryError("pwm path " + overridePath + " is not writable (run as root?)");
        }
        LOG_INFO("discovery: using configured pwm path %s", d->pathPwm.c_str());
        return *d;
    }

    if (auto saved = store_.load()) {
        auto d = Hwmon::describe(*saved);
        if (d && util::is_writable(d->pathPwm)) {
            LOG_INFO("discovery: using saved pwm path %s", d->pathPwm.c_str());
            return *d;
        }
        LOG_WARN("discovery: saved pwm path %s is gone or not writable; rediscovering", saved->c_str());
    }

    HwmonPwm found = discoverAutomatic();
    std::string err;
    if (store_.save(found.pathPwm, &err)) {
        LOG_INFO("discovery: saved %s to %s", found.pathPwm.c_str(), store_.file().c_str());
    } else {
        LOG_WARN("discovery: could not save %s: %s", store_.file().c_str(), err.c_str());
    }
    return found;
}

} // namespace hfc
