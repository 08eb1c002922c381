/*
 * HwmonFanControl — Utility helpers (implementation; Linux-only)
 * (c) 2026 HwmonFanControl contributors
 */

#include "include/Utils.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace hfc { namespace util {

using json = nlohmann::json;

/* ----------------------------------------------------------------------------
 * Environment helpers
 * ----------------------------------------------------------------------------*/

std::optional<std::string> getenv_str(const char* key) {
    if (!key || !*key) return std::nullopt;
    const char* v = std::getenv(key);
    if (!v) return std::nullopt;
    return std::string(v);
}

/* ----------------------------------------------------------------------------
 * String helpers
 * ----------------------------------------------------------------------------*/

std::string trim(std::string_view sv) {
    size_t i = 0, j = sv.size();
    while (i < j && std::isspace(static_cast<unsigned char>(sv[i]))) ++i;
    while (j > i && std::isspace(static_cast<unsigned char>(sv[j-1]))) --j;
    return std::string(sv.substr(i, j - i));
}

std::vector<std::string> split_ws(std::string_view sv) {
    std::vector<std::string> out;
    size_t i = 0;
    while (i < sv.size()) {
        while (i < sv.size() && std::isspace(static_cast<unsigned char>(sv[i]))) ++i;
        size_t start = i;
        while (i < sv.size() && !std::isspace(static_cast<unsigned char>(sv[i]))) ++i;
        if (i > start) out.emplace_back(sv.substr(start, i - start));
    }
    return out;
}

std::string to_lower(std::string_view sv) {
    std::string s(sv);
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string to_upper(std::string_view sv) {
    std::string s(sv);
    for (char& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

std::optional<long long> parse_ll(std::string_view sv) {
    const std::string s = trim(sv);
    if (s.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end != s.c_str() + s.size()) return std::nullopt;
    return v;
}

/* ----------------------------------------------------------------------------
 * Time helpers
 * ----------------------------------------------------------------------------*/

std::string utc_iso8601() {
    char buf[32] = {0};
    std::time_t now = std::time(nullptr);
    std::tm tm_utc{};
    gmtime_r(&now, &tm_utc);
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc) == 0) {
        return std::string();
    }
    return std::string(buf);
}

/* ----------------------------------------------------------------------------
 * Filesystem helpers
 * ----------------------------------------------------------------------------*/

bool read_file(const fs::path& p, std::string& out) {
    std::ifstream ifs(p, std::ios::binary);
    if (!ifs) return false;
    std::ostringstream ss;
    ss << ifs.rdbuf();
    out = ss.str();
    return !ifs.bad();
}

std::string read_first_line(const fs::path& p) {
    std::ifstream f(p);
    if (!f) return {};
    std::string s;
    std::getline(f, s);
    return trim(s);
}

std::optional<long long> read_first_line_ll(const fs::path& p) {
    std::ifstream f(p);
    if (!f) return std::nullopt;
    std::string s;
    std::getline(f, s);
    return parse_ll(s);
}

bool write_int_file(const fs::path& p, int value, std::string* err) {
    int fd = ::open(p.c_str(), O_WRONLY | O_TRUNC);
    if (fd < 0) {
        if (err) *err = std::strerror(errno);
        return false;
    }
    const std::string text = std::to_string(value);
    const ssize_t n = ::write(fd, text.data(), text.size());
    const int writeErrno = errno;
    // sysfs reports driver rejections (EINVAL, EIO) from write() or close()
    if (::close(fd) != 0 && n >= 0) {
        if (err) *err = std::strerror(errno);
        return false;
    }
    if (n != static_cast<ssize_t>(text.size())) {
        if (err) *err = n < 0 ? std::strerror(writeErrno) : "short write";
        return false;
    }
    return true;
}

bool is_writable(const fs::path& p) {
    return ::access(p.c_str(), W_OK) == 0;
}

void ensure_parent_dirs(const fs::path& p, std::error_code* ec) {
    fs::path dir = p.parent_path();
    if (dir.empty()) return;
    std::error_code tmp;
    fs::create_directories(dir, tmp);
    if (ec) *ec = tmp;
}

static inline bool isIdentChar_(char c) {
    return (c == '_') ||
           (c >= 'A' && c <= 'Z') ||
           (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9');
}

std::string expandUserPath(const std::string& in) {
    if (in.empty()) return in;

    std::string out = in;

    // "~" -> $HOME
    if (out.front() == '~') {
        auto home = getenv_str("HOME");
        if (home && !home->empty()) {
            if (out.size() == 1) return *home;
            if (out[1] == '/') out = *home + out.substr(1);
        }
    }

    std::string result;
    result.reserve(out.size());
    for (size_t i = 0; i < out.size(); ++i) {
        char c = out[i];
        if (c == '$') {
            if (i + 1 < out.size() && out[i + 1] == '{') {
                size_t j = i + 2;
                while (j < out.size() && out[j] != '}') ++j;
                if (j < out.size()) {
                    auto v = getenv_str(out.substr(i + 2, j - (i + 2)).c_str());
                    if (v) result += *v;
                    i = j;
                    continue;
                }
            } else {
                size_t j = i + 1;
                while (j < out.size() && isIdentChar_(out[j])) ++j;
                if (j > i + 1) {
                    auto v = getenv_str(out.substr(i + 1, j - (i + 1)).c_str());
                    if (v) result += *v;
                    i = j - 1;
                    continue;
                }
            }
        }
        result.push_back(c);
    }
    return result;
}

/* ----------------------------------------------------------------------------
 * JSON helpers
 * ----------------------------------------------------------------------------*/

json read_json_file(const std::string& path) {
    std::string text;
    if (!read_file(path, text)) {
        throw std::runtime_error("cannot open '" + path + "': " + std::strerror(errno));
    }
    // allow // and /* */ comments in hand-edited files
    json j = json::parse(text, /*cb=*/nullptr, /*allow_exceptions=*/false, /*ignore_comments=*/true);
    if (j.is_discarded()) {
        throw std::runtime_error("invalid JSON in '" + path + "'");
    }
    return j;
}

bool write_json_file(const std::string& path, const json& j, std::string* err) {
    std::error_code ec;
    ensure_parent_dirs(path, &ec);
    if (ec) {
        if (err) *err = "cannot create parent dirs: " + ec.message();
        return false;
    }
    const std::string tmp = path + ".tmp";
    {
        std::ofstream os(tmp, std::ios::trunc);
        if (!os) {
            if (err) *err = std::string("cannot open '") + tmp + "': " + std::strerror(errno);
            return false;
        }
        os << j.dump(2) << "\n";
        if (!os.good()) {
            if (err) *err = "write failed for '" + tmp + "'";
            return false;
        }
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        if (err) *err = "rename failed: " + ec.message();
        fs::remove(tmp, ec);
        return false;
    }
    return true;
}

/* ----------------------------------------------------------------------------
 * PWM helpers
 * ----------------------------------------------------------------------------*/

int pwmPercentFromRaw(int raw, int maxRaw) {
    if (maxRaw <= 0) maxRaw = 255;
    if (raw < 0) raw = 0;
    if (raw > maxRaw) raw = maxRaw;
    return (raw * 100 + (maxRaw / 2)) / maxRaw;
}

}} // namespace hfc::util
