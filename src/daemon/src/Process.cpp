/*
 * HwmonFanControl — external command runner (implementation)
 * (c) 2026 HwmonFanControl contributors
 */

#include "include/Process.hpp"
#include "include/Log.hpp"

#include <chrono>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <string>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace hfc {

namespace {

constexpr int    kPollSliceMs   = 50;
constexpr size_t kMaxOutputSize = 1024 * 1024;

void killAndReap(pid_t pid) {
    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

} // namespace

CommandResult runCommand(const std::vector<std::string>& argv,
                         int timeoutMs,
                         const std::atomic<bool>* cancel) {
    CommandResult res;
    if (argv.empty()) {
        res.error = "empty command";
        return res;
    }

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        res.error = std::string("pipe failed: ") + std::strerror(errno);
        return res;
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        res.error = std::string("fork failed: ") + std::strerror(errno);
        ::close(fds[0]);
        ::close(fds[1]);
        return res;
    }

    if (pid == 0) {
        // child: stdout -> pipe, stdin/stderr -> /dev/null
        ::dup2(fds[1], STDOUT_FILENO);
        int nullfd = ::open("/dev/null", O_RDWR);
        if (nullfd >= 0) {
            ::dup2(nullfd, STDIN_FILENO);
            ::dup2(nullfd, STDERR_FILENO);
        }
        ::execvp(cargv[0], cargv.data());
        _exit(127);
    }

    ::close(fds[1]);
    res.started = true;

    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(timeoutMs);
    bool eof = false;
    char buf[4096];

    auto expired = [&]() -> bool {
        if (cancel && cancel->load(std::memory_order_relaxed)) {
            res.cancelled = true;
            return true;
        }
        if (clock::now() >= deadline) {
            res.timedOut = true;
            return true;
        }
        return false;
    };

    while (!eof) {
        if (expired()) break;

        pollfd pfd{fds[0], POLLIN, 0};
        int rc = ::poll(&pfd, 1, kPollSliceMs);
        if (rc < 0) {
            if (errno == EINTR) continue;
            res.error = std::string("poll failed: ") + std::strerror(errno);
            break;
        }
        if (rc == 0) continue;

        ssize_t n = ::read(fds[0], buf, sizeof(buf));
        if (n > 0) {
            if (res.output.size() < kMaxOutputSize) res.output.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
            eof = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            res.error = std::string("read failed: ") + std::strerror(errno);
            break;
        }
    }
    ::close(fds[0]);

    if (!eof) {
        killAndReap(pid);
        if (res.timedOut)   res.error = "timed out after " + std::to_string(timeoutMs) + " ms";
        if (res.cancelled)  res.error = "cancelled";
        LOG_DEBUG("process: '%s' killed (%s)", argv[0].c_str(), res.error.c_str());
        return res;
    }

    // stdout closed; the child may still linger, bound the wait by the same deadline
    int status = 0;
    for (;;) {
        pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) break;
        if (w < 0 && errno != EINTR) {
            res.error = std::string("waitpid failed: ") + std::strerror(errno);
            return res;
        }
        if (expired()) {
            killAndReap(pid);
            res.error = res.timedOut ? "timed out after " + std::to_string(timeoutMs) + " ms"
                                     : std::string("cancelled");
            return res;
        }
        ::usleep(kPollSliceMs * 1000);
    }

    if (WIFEXITED(status)) {
        res.exitCode = WEXITSTATUS(status);
        if (res.exitCode == 127 && res.output.empty()) {
            res.error = "command not found: " + argv[0];
        }
    } else if (WIFSIGNALED(status)) {
        res.error = std::string("terminated by signal ") + std::to_string(WTERMSIG(status));
    }
    return res;
}

} // namespace hfc
