#include "tracescope/transcript/text_heuristics.hpp"

#include "tracescope/common/fs.hpp"

#include <array>
#include <cctype>
#include <regex>
#include <vector>

namespace tracescope::transcript::heuristics {

namespace {

constexpr std::array<const char *, 7> ARTIFACT_SUBSTRINGS = {
    "🔧 TOOLS EXECUTION FLOW:", "🧠 THINKING PROCESS:", "[Thinking", "File:", "Command:",
    "pattern:",                  "path:"};

constexpr std::array<const char *, 4> ARTIFACT_LINE_PREFIXES = {"File:", "Command:", "pattern:",
                                                                "path:"};

const std::regex &tool_index_pattern() {
  static const std::regex pattern(R"(\[\d+\]\s+(Read|Write|Edit|Bash|Glob|Grep|Task))");
  return pattern;
}

const std::regex &bare_tool_line_pattern() {
  static const std::regex pattern(R"(^\s*\[\d+\]\s+\w+$)");
  return pattern;
}

const std::regex &tool_line_start_pattern() {
  static const std::regex pattern(R"(^\s*\[\d+\]\s+\w+)");
  return pattern;
}

const std::regex &thinking_line_pattern() {
  static const std::regex pattern(R"(^\s*\[Thinking \d+\])");
  return pattern;
}

const std::regex &request_verb_pattern() {
  static const std::regex pattern("requested|asked|want", std::regex::icase);
  return pattern;
}

const std::regex &numbered_line_pattern() {
  static const std::regex pattern(R"(^\d+\.)");
  return pattern;
}

// Each entry matches when its words occur in order on one line of lowercased text.
const std::vector<std::vector<std::string>> &continuation_sequences() {
  static const std::vector<std::vector<std::string>> sequences = {
      {"please continue the conversation from where we left it off"},
      {"without asking the user any further questions"},
      {"continue with the last task that you were asked to work on"},
      {"continue", "conversation", "from", "where", "left"},
      {"continue", "last", "task"},
      {"作業", "続"},
      {"続き", "作業"},
  };
  return sequences;
}

bool contains_in_order(const std::string &text, const std::vector<std::string> &words) {
  std::size_t from = 0;
  for (const auto &word : words) {
    const auto pos = text.find(word, from);
    if (pos == std::string::npos) {
      return false;
    }
    from = pos + word.size();
  }
  return true;
}

bool contains(const std::string &text, const char *needle) {
  return text.find(needle) != std::string::npos;
}

bool starts_with_ci(const std::string &value, const std::string &prefix) {
  return common::starts_with(common::to_lower(value.substr(0, prefix.size())),
                             common::to_lower(prefix));
}

} // namespace

bool is_continuation_session(const std::string &text) {
  return contains(text, "This session is being continued from a previous conversation");
}

bool is_user_request_indicator(const std::string &line) {
  for (const char *prefix : {"The user", "User", "ユーザー"}) {
    if (starts_with_ci(line, prefix)) {
      const std::string rest = line.substr(std::string(prefix).size());
      if (rest.find(':') != std::string::npos || contains(rest, "：")) {
        return true;
      }
    }
  }
  if (std::regex_search(line, request_verb_pattern())) {
    return true;
  }
  for (const char *marker : {"リクエスト", "依頼", "要求", "表示方法", "見直し", "修正", "改善"}) {
    if (contains(line, marker)) {
      return true;
    }
  }
  return false;
}

bool is_non_metadata_line(const std::string &line) {
  return !line.empty() && !common::starts_with(line, "Analysis:") &&
         !common::starts_with(line, "Summary:") && !common::starts_with(line, "-") &&
         !std::regex_search(line, numbered_line_pattern());
}

std::string extract_continuation_request(const std::string &text) {
  const auto lines = common::split_lines(text);
  std::string request;
  for (std::size_t i = lines.size(); i-- > 0;) {
    const std::string line = common::trim(lines[i]);
    if (is_user_request_indicator(line)) {
      const std::vector<std::string> tail(lines.begin() + static_cast<std::ptrdiff_t>(i),
                                          lines.end());
      request = common::trim(common::join(tail, "\n"));
      break;
    }
    if (is_non_metadata_line(line)) {
      request = line;
    }
  }
  return request.empty() ? CONTINUATION_PLACEHOLDER : request;
}

bool contains_tool_artifacts(const std::string &text) {
  for (const char *marker : ARTIFACT_SUBSTRINGS) {
    if (contains(text, marker)) {
      return true;
    }
  }
  if (std::regex_search(text, tool_index_pattern())) {
    return true;
  }
  for (const auto &line : common::split_lines(text)) {
    if (std::regex_search(line, bare_tool_line_pattern())) {
      return true;
    }
  }
  return false;
}

bool is_tool_artifact_line(const std::string &line, const bool marker_seen) {
  if (contains(line, "🔧 TOOLS EXECUTION FLOW:") || contains(line, "🧠 THINKING PROCESS:")) {
    return true;
  }
  if (std::regex_search(line, thinking_line_pattern()) ||
      std::regex_search(line, tool_line_start_pattern())) {
    return true;
  }
  for (const char *prefix : ARTIFACT_LINE_PREFIXES) {
    if (common::starts_with(line, prefix)) {
      return true;
    }
  }
  return marker_seen && common::starts_with(common::trim(line), "[");
}

std::string extract_user_prose(const std::string &text) {
  std::vector<std::string> kept;
  for (const auto &line : common::split_lines(text)) {
    if (is_tool_artifact_line(line, false)) {
      break;
    }
    kept.push_back(line);
  }
  const std::string prose = common::trim(common::join(kept, "\n"));
  return prose.empty() ? FULL_DETAIL_PLACEHOLDER : prose;
}

std::string clean_user_text(const std::string &text) {
  if (is_continuation_session(text)) {
    return extract_continuation_request(text);
  }
  if (contains_tool_artifacts(text)) {
    return extract_user_prose(text);
  }
  return common::trim(text);
}

bool is_compact_continuation_text(const std::string &text) {
  for (const auto &line : common::split_lines(common::to_lower(text))) {
    for (const auto &sequence : continuation_sequences()) {
      if (contains_in_order(line, sequence)) {
        return true;
      }
    }
  }
  for (const char *marker : {"つづけて", "続けて", "継続", "続行"}) {
    if (contains(text, marker)) {
      return true;
    }
  }
  return false;
}

std::string sanitize_for_display(const std::string &text, const std::size_t max_length) {
  std::string collapsed;
  collapsed.reserve(text.size());
  bool pending_space = false;
  for (const char ch : text) {
    const auto uch = static_cast<unsigned char>(ch);
    if (std::isspace(uch) != 0) {
      pending_space = true;
      continue;
    }
    if (uch < 0x20 || uch == 0x7F) {
      continue;
    }
    if (pending_space && !collapsed.empty()) {
      collapsed.push_back(' ');
    }
    pending_space = false;
    collapsed.push_back(ch);
  }

  if (common::utf8_length(collapsed) > max_length) {
    return common::utf8_prefix(collapsed, max_length) + "...";
  }
  return collapsed;
}

std::string smart_truncate(const std::string &text, const std::size_t max_length) {
  if (common::utf8_length(text) <= max_length) {
    return text;
  }
  const std::size_t budget = max_length > 3 ? max_length - 3 : max_length;
  std::string cut = common::utf8_prefix(text, budget);
  const auto space = cut.find_last_of(" \n\t");
  if (space != std::string::npos && space > cut.size() / 2) {
    cut.resize(space);
  }
  return common::trim(cut) + "...";
}

} // namespace tracescope::transcript::heuristics
