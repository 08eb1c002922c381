/*
 * HwmonFanControl — PathDiscovery (header)
 * - Finds the pwmN attribute that really drives the fan, persists it, and
 *   resolves the path to use: override > persisted > auto-discovered
 * (c) 2026 HwmonFanControl contributors
 */
#pragma once

#include "Config.hpp"
#include "Hwmon.hpp"

#include <atomic>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace hfc {

/* No usable PWM path; fatal at startup. */
class DiscoveryError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/* Synchronous operator interaction used while a test duty is applied. */
class OperatorPrompt {
public:
    virtual ~OperatorPrompt() = default;
    virtual void notify(const std::string& message) = 0;
    virtual bool confirm(const std::string& question) = 0;
};

/* Prompt on a terminal: y/yes confirms, anything else (or EOF) declines. */
class ConsolePrompt : public OperatorPrompt {
public:
    ConsolePrompt(std::istream& in, std::ostream& out);
    void notify(const std::string& message) override;
    bool confirm(const std::string& question) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

/* JSON file remembering the confirmed path: {"pwm_path": ..., "saved_at": ...}. */
class PathStore {
public:
    explicit PathStore(std::string file);

    std::optional<std::string> load() const;
    bool save(const std::string& pwmPath, std::string* err = nullptr) const;
    const std::string& file() const noexcept { return file_; }

private:
    std::string file_;
};

struct ProbeOutcome {
    bool accepted{false};     // test write and restore succeeded
    bool confirmed{false};    // operator or tach says the fan reacted
    int  testDuty{0};
    std::optional<int> rpmBefore;
    std::optional<int> rpmAfter;
    std::string error;
};

class PathDiscovery {
public:
    PathDiscovery(const FanConfig& cfg, const std::atomic<bool>* stop = nullptr);

    /* Scanned PWM channels that the process may write. */
    std::vector<HwmonPwm> candidates() const;

    /*
     * Bounded read-modify-restore: remember value + enable mode, go manual,
     * write a test duty, wait settleMs, confirm (prompt if given, else tach),
     * restore. The prior state is restored on every path out.
     */
    ProbeOutcome probe(const HwmonPwm& candidate, OperatorPrompt* prompt);

    /* First candidate the operator confirms, saved to the store. Throws DiscoveryError. */
    HwmonPwm discoverInteractive(OperatorPrompt& prompt);

    /* First candidate passing the tach check (or accepting writes when it has no tach). */
    HwmonPwm discoverAutomatic();

    /*
     * override (must exist and be writable) > persisted (if still writable) >
     * discoverAutomatic() (persisted on success). Throws DiscoveryError.
     */
    HwmonPwm resolve(const std::string& overridePath);

    /* Resolution without probing or persisting, for read-only status. */
    std::optional<HwmonPwm> peek(const std::string& overridePath) const;

    /* Full speed if the prior value is below half scale, else stopped. */
    static int testDutyFor(int prior, int pwmMax);

    const PathStore& store() const noexcept { return store_; }

private:
    bool sleepMsCancelable_(int ms) const;
    bool stopRequested_() const;

private:
    const FanConfig&         cfg_;
    PathStore                store_;
    const std::atomic<bool>* stop_;
};

} // namespace hfc
