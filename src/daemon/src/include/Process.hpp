/*
 * HwmonFanControl — external command runner (header)
 * (c) 2026 HwmonFanControl contributors
 */
#pragma once

#include <atomic>
#include <string>
#include <vector>

namespace hfc {

struct CommandResult {
    bool        started{false};   // fork/exec succeeded far enough to run
    bool        timedOut{false};
    bool        cancelled{false};
    int         exitCode{-1};     // -1 when killed by a signal or not started
    std::string output;           // captured stdout
    std::string error;            // runner-side failure description
};

/*
 * Run argv[0] (PATH lookup) with stdout captured and stderr discarded.
 * The child is killed once timeoutMs elapses or *cancel becomes true; the
 * call never blocks longer than timeoutMs plus one poll slice.
 */
CommandResult runCommand(const std::vector<std::string>& argv,
                         int timeoutMs,
                         const std::atomic<bool>* cancel = nullptr);

} // namespace hfc
