#pragma once

#include "tracescope/common/result.hpp"
#include "tracescope/transcript/entry.hpp"

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace tracescope::transcript {

inline constexpr const char *TRUNCATION_MARKER = "...[truncated]";

struct DecodeOptions {
  std::size_t tool_result_max_chars = 10'000;
  std::size_t streaming_threshold_bytes = 5 * 1024 * 1024;
};

struct DecodeResult {
  std::vector<Entry> entries;
  std::optional<Entry> first_entry;
  /// Raw text of the first few surviving lines, kept for session identity hashing.
  std::vector<std::string> head_lines;
  std::size_t line_count = 0;
  std::size_t skipped_lines = 0;
  std::size_t ignored_entries = 0;
};

enum class LineOutcome { Entry, Blank, Malformed, Ignored };

/// Decodes JSON Lines transcripts. Malformed lines are skipped and counted, never reported as
/// errors. Streaming and whole-buffer decoding produce identical results.
class Ingestor {
public:
  explicit Ingestor(DecodeOptions options = {});

  [[nodiscard]] LineOutcome decode_line(const std::string &line, common::Timestamp fallback_time,
                                        Entry &out) const;

  [[nodiscard]] DecodeResult decode_text(const std::string &text) const;
  [[nodiscard]] DecodeResult decode_stream(std::istream &input) const;
  [[nodiscard]] common::Result<DecodeResult> decode_file(const std::filesystem::path &path) const;

  [[nodiscard]] const DecodeOptions &options() const { return options_; }

private:
  void consume_line(const std::string &line, common::Timestamp fallback_time,
                    DecodeResult &result) const;

  DecodeOptions options_;
};

} // namespace tracescope::transcript
