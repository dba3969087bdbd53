#pragma once

#include "sandcastle/common/result.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace sandcastle::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::string join(const std::vector<std::string> &values, const std::string &sep);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Percent-encode everything outside the RFC 3986 unreserved set.
[[nodiscard]] std::string url_encode(const std::string &value);

/// Current UTC time as 2025-01-31T12:00:00Z.
[[nodiscard]] std::string now_rfc3339();
[[nodiscard]] std::string format_rfc3339(std::chrono::system_clock::time_point when);

/// Component-wise prefix test on already-normalized paths.
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                              const std::filesystem::path &parent);

/// Hex string of `bytes` random bytes from the OpenSSL CSPRNG.
[[nodiscard]] Result<std::string> random_hex(std::size_t bytes);

} // namespace sandcastle::common
