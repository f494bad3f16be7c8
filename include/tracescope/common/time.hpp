#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace tracescope::common {

using Timestamp = std::chrono::system_clock::time_point;

/// Parses an ISO-8601 timestamp such as `2025-01-01T10:00:00.123Z` or
/// `2025-01-01T10:00:00+09:00`. Fractional seconds are kept to the millisecond.
[[nodiscard]] std::optional<Timestamp> parse_iso8601(const std::string &value);

/// UTC rendering with millisecond precision, `YYYY-MM-DDTHH:MM:SS.mmmZ`.
[[nodiscard]] std::string format_iso8601(Timestamp value);

/// Local calendar date `YYYY-MM-DD` of the given instant.
[[nodiscard]] std::string local_date_key(Timestamp value);

/// Local wall-clock rendering `YYYY-MM-DD HH:MM`.
[[nodiscard]] std::string format_local(Timestamp value);

[[nodiscard]] double seconds_between(Timestamp from, Timestamp to);

} // namespace tracescope::common
