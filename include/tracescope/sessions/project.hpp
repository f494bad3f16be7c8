#pragma once

#include "tracescope/transcript/entry.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Naming heuristics that recover a session identity and a project from transcript metadata
// and the layout of the file path.
namespace tracescope::sessions {

inline constexpr const char *UNKNOWN_PROJECT = "unknown-project";

/// 32-bit rolling hash (`h = h * 31 + c`, two's complement wrap) rendered as lowercase hex.
[[nodiscard]] std::string rolling_hash_hex(const std::string &text);

/// First session id carried by an entry, else an 8-digit hash of the leading raw lines.
[[nodiscard]] std::string extract_session_id(const std::vector<transcript::Entry> &entries,
                                             const std::vector<std::string> &head_lines);

/// UUID or long hex id embedded in the file name, else `fallback`.
[[nodiscard]] std::string extract_full_session_id(const std::filesystem::path &file_path,
                                                  const std::string &fallback);

[[nodiscard]] bool is_valid_project_name(const std::string &name);

[[nodiscard]] std::string extract_project_name(const std::vector<transcript::Entry> &entries,
                                               const std::filesystem::path &file_path,
                                               const std::string &extension = ".jsonl");

[[nodiscard]] std::string
extract_project_path(const std::optional<transcript::Entry> &first_entry,
                     const std::filesystem::path &file_path, const std::string &project_name);

} // namespace tracescope::sessions
