#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace tracescope::config {

struct TranscriptsConfig {
  std::vector<std::string> directories = {"~/.claude/projects"};
  std::string extension = ".jsonl";
  std::size_t max_scan_depth = 5;
};

struct ParserConfig {
  std::size_t streaming_threshold_bytes = 5 * 1024 * 1024;
  std::size_t tool_result_max_chars = 10'000;
  std::size_t workers = 2;
  bool memoize = true;
};

struct SearchConfig {
  std::size_t max_results = 0;
  bool case_sensitive = false;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  TranscriptsConfig transcripts;
  ParserConfig parser;
  SearchConfig search;
  ObservabilityConfig observability;
};

} // namespace tracescope::config
