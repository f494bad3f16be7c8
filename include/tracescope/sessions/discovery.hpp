#pragma once

#include "tracescope/config/schema.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace tracescope::sessions {

struct DiscoveryOptions {
  std::vector<std::string> directories;
  std::string extension = ".jsonl";
  std::size_t max_depth = 5;
};

[[nodiscard]] DiscoveryOptions discovery_options(const config::Config &config);

/// True for directory names never descended into: hidden entries and tool caches.
[[nodiscard]] bool is_skipped_directory(const std::string &name);

/// Transcript files under the configured roots, sorted by path. Missing or unreadable
/// directories contribute nothing.
[[nodiscard]] std::vector<std::filesystem::path>
discover_transcripts(const DiscoveryOptions &options);

} // namespace tracescope::sessions
