#pragma once

#include <cstddef>
#include <string>

// Best-effort cleanup of free text. These are pattern heuristics over prose and can be wrong
// for unusual inputs; every function is total and never throws.
namespace tracescope::transcript::heuristics {

inline constexpr const char *CONTINUATION_PLACEHOLDER =
    "[Continued session - see full detail for context]";
inline constexpr const char *FULL_DETAIL_PLACEHOLDER = "[See full detail for complete context]";

/// True for the preamble emitted when a session is resumed from a summary.
[[nodiscard]] bool is_continuation_session(const std::string &text);

/// Reduces a continuation preamble to the trailing user request, or the placeholder.
[[nodiscard]] std::string extract_continuation_request(const std::string &text);

[[nodiscard]] bool is_user_request_indicator(const std::string &line);
[[nodiscard]] bool is_non_metadata_line(const std::string &line);

/// True when the text carries tool-execution artifacts (flow headers, `[1] Read` markers,
/// `File:` / `Command:` prefixes and similar).
[[nodiscard]] bool contains_tool_artifacts(const std::string &text);

/// True when `line` starts the artifact block. Once a marker was seen, any bracketed line
/// also counts.
[[nodiscard]] bool is_tool_artifact_line(const std::string &line, bool marker_seen);

/// Keeps the prose lines that precede the first artifact line.
[[nodiscard]] std::string extract_user_prose(const std::string &text);

/// Applies continuation reduction, then artifact stripping, then trims.
[[nodiscard]] std::string clean_user_text(const std::string &text);

/// True for a bare instruction to resume the previous task.
[[nodiscard]] bool is_compact_continuation_text(const std::string &text);

/// Single-line preview: line breaks and whitespace runs collapse to one space, control
/// characters are removed, and the result is cut to `max_length` code points plus "...".
[[nodiscard]] std::string sanitize_for_display(const std::string &text, std::size_t max_length);

/// Cuts to `max_length` code points, preferring a word boundary, and appends "...".
[[nodiscard]] std::string smart_truncate(const std::string &text, std::size_t max_length);

} // namespace tracescope::transcript::heuristics
