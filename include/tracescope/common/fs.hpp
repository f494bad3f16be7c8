#pragma once

#include "tracescope/common/result.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace tracescope::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split(const std::string &value, char delimiter);
[[nodiscard]] std::vector<std::string> split_lines(const std::string &value);
[[nodiscard]] std::string join(const std::vector<std::string> &parts, const std::string &separator);

/// Number of code points in a UTF-8 string.
[[nodiscard]] std::size_t utf8_length(const std::string &value);

/// Keeps the first `max_code_points` code points of `value`.
[[nodiscard]] std::string utf8_prefix(const std::string &value, std::size_t max_code_points);

/// Moves `pos` backwards until it sits on the first byte of a UTF-8 sequence.
[[nodiscard]] std::size_t utf8_floor(const std::string &value, std::size_t pos);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);
[[nodiscard]] Result<std::filesystem::file_time_type>
file_mtime(const std::filesystem::path &path);

} // namespace tracescope::common
