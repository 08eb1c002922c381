/*
 * HwmonFanControl — Logging (implementation)
 * (c) 2026 HwmonFanControl contributors
 */

#include "include/Log.hpp"
#include "include/Utils.hpp"

#include <array>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <mutex>
#include <string>
#include <system_error>

namespace hfc {

// -----------------------------------------------------------------------------
// helpers
// -----------------------------------------------------------------------------

static inline size_t fileSizeOrZero(const std::string& path) {
    std::error_code ec;
    auto sz = std::filesystem::file_size(path, ec);
    return ec ? 0u : static_cast<size_t>(sz);
}

static inline std::string makeTimestamp() {
    // "YYYY-MM-DD HH:MM:SS" local time
    std::time_t t = std::time(nullptr);
    std::tm tmv{};
    localtime_r(&t, &tmv);
    std::array<char, 32> buf{};
    if (std::strftime(buf.data(), buf.size(), "%Y-%m-%d %H:%M:%S", &tmv) == 0) {
        return "1970-01-01 00:00:00";
    }
    return std::string(buf.data());
}

bool parseLogLevel(const std::string& text, LogLevel& out) {
    const std::string v = util::to_upper(util::trim(text));
    if (v == "DEBUG")                  { out = LogLevel::Debug; return true; }
    if (v == "INFO")                   { out = LogLevel::Info;  return true; }
    if (v == "WARNING" || v == "WARN") { out = LogLevel::Warn;  return true; }
    if (v == "ERROR")                  { out = LogLevel::Error; return true; }
    return false;
}

const char* logLevelName(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn:  return "WARNING";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Debug: return "DEBUG";
    }
    return "INFO";
}

// -----------------------------------------------------------------------------
// Logger
// -----------------------------------------------------------------------------

Logger& Logger::instance() {
    static Logger g;
    return g;
}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(mtx_);
    closeFileUnlocked();
}

void Logger::init(const std::string& logFilePath, LogLevel lvl, bool mirrorToStdio) {
    std::lock_guard<std::mutex> lock(mtx_);

    level_.store(static_cast<int>(lvl), std::memory_order_relaxed);
    mirror_ = mirrorToStdio;

    closeFileUnlocked();
    filePath_ = logFilePath;
    currentSize_ = 0;

    if (!filePath_.empty()) {
        std::error_code ec;
        util::ensure_parent_dirs(filePath_, &ec);
        openFileIfNeeded();
        currentSize_ = fileSizeOrZero(filePath_);
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mtx_);
    closeFileUnlocked();
}

void Logger::enableRotation(size_t maxBytes, int maxFiles) {
    std::lock_guard<std::mutex> lock(mtx_);
    maxBytes_ = maxBytes;
    maxFiles_ = maxFiles;
    if (!filePath_.empty() && maxBytes_ > 0 && maxFiles_ > 0 &&
        fileSizeOrZero(filePath_) >= maxBytes_) {
        rotateFilesUnlocked();
        openFileIfNeeded();
        currentSize_ = 0;
    }
}

void Logger::openFileIfNeeded() {
    if (file_ || filePath_.empty()) return;
    file_ = std::fopen(filePath_.c_str(), "a");
    if (!file_) {
        // keep messages visible somewhere
        mirror_ = true;
        return;
    }
    std::fseek(file_, 0, SEEK_END);
    long pos = std::ftell(file_);
    currentSize_ = pos > 0 ? static_cast<size_t>(pos) : 0;
}

void Logger::closeFileUnlocked() {
    if (file_) {
        std::fflush(file_);
        std::fclose(file_);
        file_ = nullptr;
    }
}

const char* Logger::levelTag(LogLevel lvl) const {
    switch (lvl) {
        case LogLevel::Error: return "E";
        case LogLevel::Warn:  return "W";
        case LogLevel::Info:  return "I";
        case LogLevel::Debug: return "D";
    }
    return "?";
}

void Logger::checkRotateBeforeWrite(size_t incomingBytes) {
    if (maxBytes_ == 0 || maxFiles_ <= 0 || filePath_.empty()) return;
    if (currentSize_ + incomingBytes > maxBytes_) {
        rotateFilesUnlocked();
        openFileIfNeeded();
        currentSize_ = 0;
    }
}

void Logger::rotateFilesUnlocked() {
    closeFileUnlocked();

    for (int i = maxFiles_ - 1; i >= 1; --i) {
        std::filesystem::path src = filePath_ + "." + std::to_string(i);
        std::filesystem::path dst = filePath_ + "." + std::to_string(i + 1);
        std::error_code ec;
        if (std::filesystem::exists(src, ec)) {
            std::filesystem::remove(dst, ec);
            std::filesystem::rename(src, dst, ec);
        }
    }

    std::error_code ec;
    const std::filesystem::path dst = filePath_ + ".1";
    if (std::filesystem::exists(filePath_, ec)) {
        std::filesystem::remove(dst, ec);
        std::filesystem::rename(filePath_, dst, ec);
    }
}

void Logger::write(LogLevel lvl, const char* fmt, ...) {
    if (static_cast<int>(lvl) > level_.load(std::memory_order_relaxed)) return;

    va_list ap;
    va_start(ap, fmt);
    vwrite(lvl, fmt, ap);
    va_end(ap);
}

void Logger::vwrite(LogLevel lvl, const char* fmt, va_list ap) {
    if (static_cast<int>(lvl) > level_.load(std::memory_order_relaxed)) return;

    // "2026-10-19 14:22:11 [I] loop: ..."
    char prefix[64];
    std::snprintf(prefix, sizeof(prefix), "%s [%s] ", makeTimestamp().c_str(), levelTag(lvl));

    char msgBuf[2048];
    std::vsnprintf(msgBuf, sizeof(msgBuf), fmt, ap);

    std::string line = std::string(prefix) + msgBuf;
    if (line.back() != '\n') line.push_back('\n');

    std::lock_guard<std::mutex> lock(mtx_);

    if (!file_ && !filePath_.empty()) {
        openFileIfNeeded();
    }

    checkRotateBeforeWrite(line.size());

    if (file_) {
        std::fwrite(line.data(), 1, line.size(), file_);
        std::fflush(file_);
        currentSize_ += line.size();
    }

    if (mirror_) {
        FILE* out = (lvl == LogLevel::Error || lvl == LogLevel::Warn) ? stderr : stdout;
        std::fwrite(line.data(), 1, line.size(), out);
        std::fflush(out);
    }
}

} // namespace hfc
