/*
 * HwmonFanControl — parsers for external sensor tool output
 * (c) 2026 HwmonFanControl contributors
 */

#include "include/SensorParsers.hpp"
#include "include/Utils.hpp"

#include <nlohmann/json.hpp>

#include <regex>
#include <sstream>
#include <string>
#include <vector>

using nlohmann::json;

namespace hfc {

static void setErr(std::string* err, const std::string& msg) {
    if (err) *err = msg;
}

std::optional<double> parseLmSensorsJson(const std::string& text,
                                         const std::string& chipMatch,
                                         const std::string& feature,
                                         std::string* err) {
    json j = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded() || !j.is_object()) {
        setErr(err, "sensors output is not a JSON object");
        return std::nullopt;
    }

    static const std::regex kInputKey(R"(temp\d+_input)");
    const std::string needle = util::to_lower(chipMatch);
    bool chipSeen = false;

    for (auto it = j.begin(); it != j.end(); ++it) {
        if (util::to_lower(it.key()).find(needle) == std::string::npos) continue;
        if (!it.value().is_object()) continue;
        chipSeen = true;

        auto feat = it.value().find(feature);
        if (feat == it.value().end() || !feat->is_object()) continue;

        for (auto sub = feat->begin(); sub != feat->end(); ++sub) {
            if (!std::regex_match(sub.key(), kInputKey)) continue;
            if (!sub.value().is_number()) continue;
            return sub.value().get<double>();
        }
    }

    setErr(err, chipSeen ? "feature '" + feature + "' not found on chip '" + chipMatch + "'"
                         : "no chip matching '" + chipMatch + "'");
    return std::nullopt;
}

std::optional<double> parseSmartctlTemperature(const std::string& text, std::string* err) {
    static const std::regex kNvme(R"(^\s*Temperature:\s+(-?\d+)\s+Celsius)");
    static const std::regex kScsi(R"(^\s*Current Drive Temperature:\s+(-?\d+)\s+C)");
    static const std::regex kLeadingInt(R"(^(-?\d+))");

    // ATA attribute names in order of preference
    static const char* const kAtaNames[] = {
        "Temperature_Celsius", "Temperature_Internal", "Airflow_Temperature_Cel"
    };

    std::optional<double> ata[3];
    std::istringstream in(text);
    std::string line;
    std::smatch m;
    bool badValue = false;

    while (std::getline(in, line)) {
        if (std::regex_search(line, m, kNvme) || std::regex_search(line, m, kScsi)) {
            if (auto v = util::parse_ll(m[1].str())) return static_cast<double>(*v);
            badValue = true;
            continue;
        }

        // ID# ATTRIBUTE_NAME FLAG VALUE WORST THRESH TYPE UPDATED WHEN_FAILED RAW_VALUE
        const auto fields = util::split_ws(line);
        if (fields.size() < 10) continue;
        for (size_t i = 0; i < 3; ++i) {
            if (fields[1] != kAtaNames[i] || ata[i]) continue;
            if (std::regex_search(fields[9], m, kLeadingInt)) {
                if (auto v = util::parse_ll(m[1].str())) ata[i] = static_cast<double>(*v);
                else badValue = true;
            }
        }
    }

    for (const auto& v : ata) {
        if (v) return v;
    }
    setErr(err, badValue ? "smartctl temperature value out of range"
                         : "no temperature attribute in smartctl output");
    return std::nullopt;
}

std::optional<double> parseHwmonMillidegrees(const std::string& text) {
    auto v = util::parse_ll(text);
    if (!v) return std::nullopt;
    return static_cast<double>(*v) / 1000.0;
}

} // namespace hfc
