/*
 * HwmonFanControl — Logging (header)
 * - Levelled logger with optional file output and size-based rotation
 * - printf-style API for cheap call-sites inside the control loop
 * (c) 2026 HwmonFanControl contributors
 */
#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

namespace hfc {

/* Severity levels (ascending verbosity). */
enum class LogLevel {
    Error = 0,  // halting failures, exhausted retries
    Warn  = 1,  // sensor dropouts, failsafe, recoverable write errors
    Info  = 2,  // default operational messages
    Debug = 3   // per-cycle diagnostics
};

/* Parse "DEBUG" / "INFO" / "WARNING" (or "WARN") / "ERROR", case-insensitive. */
bool parseLogLevel(const std::string& text, LogLevel& out);

/* Canonical upper-case name as accepted by parseLogLevel(). */
const char* logLevelName(LogLevel lvl);

/*
 * Logger: process-wide singleton.
 * - The log file is opened lazily; its directory is created if needed.
 * - Rotation is size-based (maxBytes/maxFiles).
 * - With mirroring enabled, WARN/ERROR go to stderr and the rest to stdout.
 */
class Logger {
public:
    static Logger& instance();

    ~Logger();

    /*
     * (Re)initialize:
     *  - logFilePath: destination file (empty = no file).
     *  - lvl: minimum severity to emit.
     *  - mirrorToStdio: also print to stdout/stderr.
     */
    void init(const std::string& logFilePath, LogLevel lvl, bool mirrorToStdio);

    /* Close the file (idempotent). */
    void shutdown();

    /*
     * Rotation: rotate when the file would exceed maxBytes (>0 to enable),
     * keep maxFiles rotated copies. Default 5 MiB / 5 files.
     */
    void enableRotation(size_t maxBytes, int maxFiles);

    void write(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    void vwrite(LogLevel lvl, const char* fmt, va_list ap);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void openFileIfNeeded();
    void closeFileUnlocked();
    const char* levelTag(LogLevel lvl) const;
    void checkRotateBeforeWrite(size_t incomingBytes);

    /* Shift N-1..1 -> N..2, move active -> .1 */
    void rotateFilesUnlocked();

private:
    std::mutex mtx_;
    std::atomic<int> level_{static_cast<int>(LogLevel::Info)};
    std::string filePath_;
    FILE* file_{nullptr};
    bool mirror_{true};
    size_t maxBytes_{5 * 1024 * 1024};
    int    maxFiles_{5};
    size_t currentSize_{0};
};

#define LOG_ERROR(fmt, ...) ::hfc::Logger::instance().write(::hfc::LogLevel::Error, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  ::hfc::Logger::instance().write(::hfc::LogLevel::Warn,  fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  ::hfc::Logger::instance().write(::hfc::LogLevel::Info,  fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) ::hfc::Logger::instance().write(::hfc::LogLevel::Debug, fmt, ##__VA_ARGS__)

} // namespace hfc
