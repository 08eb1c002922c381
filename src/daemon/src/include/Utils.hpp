/*
 * HwmonFanControl — Utility helpers (header)
 * (c) 2026 HwmonFanControl contributors
 */
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <nlohmann/json.hpp>

namespace hfc { namespace util {

/* ----------------------------------------------------------------------------
 * Environment helpers
 * ----------------------------------------------------------------------------*/

std::optional<std::string> getenv_str(const char* key);

/* ----------------------------------------------------------------------------
 * String helpers
 * ----------------------------------------------------------------------------*/

std::string trim(std::string_view sv);
std::vector<std::string> split_ws(std::string_view sv);
std::string to_lower(std::string_view sv);
std::string to_upper(std::string_view sv);

/* Strict integer parse of the whole (trimmed) string. */
std::optional<long long> parse_ll(std::string_view sv);

/* ----------------------------------------------------------------------------
 * Time helpers
 * ----------------------------------------------------------------------------*/

std::string utc_iso8601();

/* ----------------------------------------------------------------------------
 * Filesystem helpers
 * ----------------------------------------------------------------------------*/

bool read_file(const std::filesystem::path& p, std::string& out);
std::string read_first_line(const std::filesystem::path& p);
std::optional<long long> read_first_line_ll(const std::filesystem::path& p);

/*
 * Write a decimal integer the way sysfs attributes expect it (no newline,
 * single write(2)). On failure returns false and stores strerror(errno) in *err.
 */
bool write_int_file(const std::filesystem::path& p, int value, std::string* err = nullptr);

/* access(2) W_OK check; false for missing paths. */
bool is_writable(const std::filesystem::path& p);

/** Ensure parent directory of path exists (no-op if already exists). */
void ensure_parent_dirs(const std::filesystem::path& p, std::error_code* ec = nullptr);

/* Expand a leading '~' and $VAR / ${VAR} references. */
std::string expandUserPath(const std::string& path);

/* ----------------------------------------------------------------------------
 * JSON helpers
 * ----------------------------------------------------------------------------*/

/* Parse a JSON file; throws std::runtime_error naming the file on failure. */
nlohmann::json read_json_file(const std::string& path);

/* Write via "<path>.tmp" + rename so readers never see a partial file. */
bool write_json_file(const std::string& path, const nlohmann::json& j, std::string* err = nullptr);

/* ----------------------------------------------------------------------------
 * PWM helpers
 * ----------------------------------------------------------------------------*/

/** Convert raw PWM value to percent in range [0,100]. Clamps on bounds. */
int pwmPercentFromRaw(int raw, int maxRaw);

}} // namespace hfc::util
