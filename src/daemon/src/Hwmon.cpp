/*
 * HwmonFanControl — hwmon scanner + I/O
 * (c) 2026 HwmonFanControl contributors
 *
 * Responsibilities:
 *  - Enumerate hwmonX/pwmN channels (numbering is not stable across boots)
 *  - Read PWM / enable / tach values
 *  - Write raw PWM and switch enable mode
 *  - Never drop a PWM just because pwmN_enable is missing or unreadable
 */

#include "include/Hwmon.hpp"
#include "include/Utils.hpp"
#include "include/Log.hpp"

#include <algorithm>
#include <filesystem>
#include <regex>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace hfc {

/* ------------------------------ fs helpers -------------------------------- */

static inline bool fileExists(const fs::path& p) {
    std::error_code ec;
    return fs::exists(p, ec);
}

static std::string chipName(const fs::path& base) {
    // Prefer "name", else directory leaf
    std::string n = util::read_first_line(base / "name");
    if (!n.empty()) return n;
    return base.filename().string();
}

static HwmonPwm makeChannel(const fs::path& base, int index) {
    const std::string stem = "pwm" + std::to_string(index);
    const fs::path pen  = base / (stem + "_enable");
    const fs::path pmax = base / (stem + "_max");
    const fs::path fin  = base / ("fan" + std::to_string(index) + "_input");

    HwmonPwm w{};
    w.chipPath     = base.string();
    w.chipName     = chipName(base);
    w.pathPwm      = (base / stem).string();
    w.pathEnable   = fileExists(pen) ? pen.string() : std::string();
    w.pathFanInput = fileExists(fin) ? fin.string() : std::string();
    w.index        = index;

    auto mx = util::read_first_line_ll(pmax);
    w.pwmMax = (mx && *mx > 0) ? static_cast<int>(*mx) : 255;
    return w;
}

/* --------------------------------- scan ----------------------------------- */

std::vector<HwmonPwm> Hwmon::scanPwms(const std::string& sysfsRoot) {
    std::vector<HwmonPwm> out;
    const fs::path root = fs::path(sysfsRoot) / "class" / "hwmon";

    std::error_code ec;
    if (!fs::exists(root, ec)) {
        LOG_WARN("hwmon: root missing: %s", root.string().c_str());
        return out;
    }

    for (const auto& dir : fs::directory_iterator(root, ec)) {
        const fs::path base = dir.path();
        std::error_code dec;
        if (!fs::is_directory(base, dec)) continue;

        for (int i = 1; i <= 10; ++i) {
            if (!fileExists(base / ("pwm" + std::to_string(i)))) continue;
            HwmonPwm w = makeChannel(base, i);
            LOG_DEBUG("hwmon: pwm found chip=%s path=%s enable=%s tach=%s max=%d",
                      w.chipName.c_str(), w.pathPwm.c_str(),
                      w.pathEnable.empty() ? "<none>" : w.pathEnable.c_str(),
                      w.pathFanInput.empty() ? "<none>" : w.pathFanInput.c_str(),
                      w.pwmMax);
            out.push_back(std::move(w));
        }
    }
    if (ec) {
        LOG_WARN("hwmon: listing %s failed: %s", root.string().c_str(), ec.message().c_str());
    }

    std::sort(out.begin(), out.end(),
              [](const HwmonPwm& a, const HwmonPwm& b) { return a.pathPwm < b.pathPwm; });

    LOG_INFO("hwmon: scan complete (pwms=%zu)", out.size());
    return out;
}

std::optional<HwmonPwm> Hwmon::describe(const std::string& pwmPath) {
    if (pwmPath.empty() || !fileExists(pwmPath)) return std::nullopt;

    static const std::regex kPwmName(R"(pwm(\d{1,3}))");
    const fs::path p(pwmPath);
    std::smatch m;
    const std::string leaf = p.filename().string();
    if (std::regex_match(leaf, m, kPwmName)) {
        return makeChannel(p.parent_path(), std::stoi(m[1].str()));
    }

    // non-standard attribute name: no companions known
    HwmonPwm w{};
    w.chipPath = p.parent_path().string();
    w.chipName = chipName(p.parent_path());
    w.pathPwm  = pwmPath;
    return w;
}

/* ------------------------------ read helpers ------------------------------ */

std::optional<int> Hwmon::readRaw(const HwmonPwm& p) {
    auto v = util::read_first_line_ll(p.pathPwm);
    if (!v) return std::nullopt;
    return static_cast<int>(*v);
}

std::optional<int> Hwmon::readEnable(const HwmonPwm& p) {
    if (p.pathEnable.empty()) return std::nullopt; // unknown
    auto v = util::read_first_line_ll(p.pathEnable);
    if (!v) return std::nullopt;
    return static_cast<int>(*v);
}

std::optional<int> Hwmon::readRpm(const HwmonPwm& p) {
    if (p.pathFanInput.empty()) return std::nullopt;
    auto v = util::read_first_line_ll(p.pathFanInput);
    if (!v) return std::nullopt;
    return static_cast<int>(*v);
}

/* ------------------------------ write helpers ----------------------------- */

bool Hwmon::writeRaw(const std::string& path, int raw, std::string* err) {
    std::string why;
    const bool ok = util::write_int_file(path, raw, &why);
    if (!ok) {
        LOG_DEBUG("hwmon: write %d -> %s failed: %s", raw, path.c_str(), why.c_str());
        if (err) *err = why;
    }
    return ok;
}

bool Hwmon::setEnable(const HwmonPwm& p, int mode, std::string* err) {
    // Common modes: 0=full speed, 1=manual, 2+=automatic (driver specific)
    if (p.pathEnable.empty()) {
        // Many drivers have no enable attribute; writes go straight through.
        return true;
    }
    std::string why;
    const bool ok = util::write_int_file(p.pathEnable, mode, &why);
    if (!ok) {
        LOG_WARN("hwmon: setEnable path=%s mode=%d failed: %s", p.pathEnable.c_str(), mode, why.c_str());
        if (err) *err = why;
    } else {
        LOG_DEBUG("hwmon: setEnable path=%s mode=%d", p.pathEnable.c_str(), mode);
    }
    return ok;
}

} // namespace hfc
