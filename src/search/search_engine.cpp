#include "tracescope/search/search_engine.hpp"

#include "tracescope/common/fs.hpp"
#include "tracescope/observability/global.hpp"
#include "tracescope/transcript/text_heuristics.hpp"

#include <algorithm>
#include <initializer_list>

namespace tracescope::search {

namespace heuristics = transcript::heuristics;

namespace {

constexpr std::size_t UNMATCHED_CONTEXT_CHARS = 2 * CONTEXT_RADIUS;

// std::regex recurses once per character it consumes, so patterns only ever see
// one line, and long lines are scanned in overlapping windows.
constexpr std::size_t REGEX_WINDOW_BYTES = 4096;
constexpr std::size_t REGEX_WINDOW_OVERLAP = 512;

std::optional<TextMatch> regex_find_in_line(const std::string &text, const std::size_t line_begin,
                                            const std::size_t line_end, const std::regex &regex) {
  std::size_t start = line_begin;
  while (true) {
    std::size_t stop = line_end;
    if (line_end - start > REGEX_WINDOW_BYTES) {
      stop = common::utf8_floor(text, start + REGEX_WINDOW_BYTES);
      if (stop <= start) {
        stop = start + REGEX_WINDOW_BYTES;
      }
    }
    auto flags = std::regex_constants::match_default;
    if (start > line_begin) {
      flags |= std::regex_constants::match_prev_avail;
    }
    if (stop < line_end) {
      flags |= std::regex_constants::match_not_eol;
    }
    std::smatch match;
    const auto first = text.begin() + static_cast<std::ptrdiff_t>(start);
    const auto last = text.begin() + static_cast<std::ptrdiff_t>(stop);
    if (std::regex_search(first, last, match, regex, flags) && match.length(0) > 0) {
      return TextMatch{.position = start + static_cast<std::size_t>(match.position(0)),
                       .length = static_cast<std::size_t>(match.length(0))};
    }
    if (stop >= line_end) {
      return std::nullopt;
    }
    const std::size_t next = common::utf8_floor(text, stop - REGEX_WINDOW_OVERLAP);
    start = next > start ? next : stop;
  }
}

struct FieldMatch {
  MatchType type = MatchType::User;
  const std::string *text = nullptr;
  TextMatch match;
};

std::optional<FieldMatch> match_pair(const conversation::ConversationPair &pair,
                                     const QueryMatcher &matcher, const SearchOptions &options) {
  if (!options.thinking_only) {
    if (auto found = matcher.find(pair.user_content); found.has_value()) {
      return FieldMatch{.type = MatchType::User, .text = &pair.user_content, .match = *found};
    }
    if (auto found = matcher.find(pair.assistant_content); found.has_value()) {
      return FieldMatch{
          .type = MatchType::Assistant, .text = &pair.assistant_content, .match = *found};
    }
  }
  for (const auto &block : pair.thinking_blocks) {
    if (auto found = matcher.find(block.text); found.has_value()) {
      return FieldMatch{.type = MatchType::Thinking, .text = &block.text, .match = *found};
    }
  }
  return std::nullopt;
}

std::string context_for(const FieldMatch &field, const QueryMatcher &matcher) {
  const std::string cleaned = searchable_text(*field.text);
  if (cleaned == *field.text) {
    return extract_context(cleaned, field.match);
  }
  if (auto found = matcher.find(cleaned); found.has_value()) {
    return extract_context(cleaned, *found);
  }
  return heuristics::sanitize_for_display(cleaned, UNMATCHED_CONTEXT_CHARS);
}

} // namespace

std::string_view match_type_name(const MatchType type) {
  switch (type) {
  case MatchType::User:
    return "user";
  case MatchType::Assistant:
    return "assistant";
  case MatchType::Thinking:
    return "thinking";
  }
  return "user";
}

VectorSessionSource::VectorSessionSource(const std::vector<sessions::SessionPtr> &sessions)
    : sessions_(sessions) {}

std::size_t VectorSessionSource::session_count() const { return sessions_.size(); }

const sessions::Session &VectorSessionSource::session_at(const std::size_t index) const {
  return *sessions_.at(index);
}

std::vector<std::string> split_or_terms(const std::string &query) {
  std::vector<std::string> terms;
  std::size_t start = 0;
  while (start <= query.size()) {
    std::size_t cut = std::string::npos;
    std::size_t width = 0;
    for (const char *separator : {" OR ", " or "}) {
      const auto pos = query.find(separator, start);
      if (pos != std::string::npos && pos < cut) {
        cut = pos;
        width = 4;
      }
    }
    const std::string term = common::trim(query.substr(start, cut == std::string::npos
                                                                  ? std::string::npos
                                                                  : cut - start));
    if (!term.empty()) {
      terms.push_back(term);
    }
    if (cut == std::string::npos) {
      break;
    }
    start = cut + width;
  }
  return terms;
}

std::optional<QueryMatcher> QueryMatcher::compile(const std::string &query,
                                                  const SearchOptions &options) {
  if (common::trim(query).empty()) {
    return std::nullopt;
  }

  QueryMatcher matcher;
  matcher.case_sensitive_ = options.case_sensitive;
  if (options.regex) {
    try {
      matcher.regex_.emplace(query, std::regex::ECMAScript | std::regex::icase);
    } catch (const std::regex_error &e) {
      observability::record_error("search", "invalid regex '" + query + "': " + e.what());
      return std::nullopt;
    }
    return matcher;
  }

  for (auto &term : split_or_terms(query)) {
    matcher.terms_.push_back(options.case_sensitive ? term : common::to_lower(term));
  }
  if (matcher.terms_.empty()) {
    return std::nullopt;
  }
  return matcher;
}

std::optional<TextMatch> QueryMatcher::find(const std::string &text) const {
  if (text.empty()) {
    return std::nullopt;
  }
  if (regex_.has_value()) {
    std::size_t line_begin = 0;
    while (line_begin <= text.size()) {
      std::size_t line_end = text.find('\n', line_begin);
      if (line_end == std::string::npos) {
        line_end = text.size();
      }
      if (auto found = regex_find_in_line(text, line_begin, line_end, *regex_); found.has_value()) {
        return found;
      }
      line_begin = line_end + 1;
    }
    return std::nullopt;
  }

  const std::string haystack = case_sensitive_ ? text : common::to_lower(text);
  std::optional<TextMatch> best;
  for (const auto &term : terms_) {
    const auto pos = haystack.find(term);
    if (pos != std::string::npos && (!best.has_value() || pos < best->position)) {
      best = TextMatch{.position = pos, .length = term.size()};
    }
  }
  return best;
}

std::string searchable_text(const std::string &text) {
  if (heuristics::is_continuation_session(text) || heuristics::contains_tool_artifacts(text)) {
    return heuristics::clean_user_text(text);
  }
  return text;
}

std::string extract_context(const std::string &text, const TextMatch &match,
                            const std::size_t radius) {
  const std::size_t start =
      common::utf8_floor(text, match.position > radius ? match.position - radius : 0);
  const std::size_t end = common::utf8_floor(text, match.position + match.length + radius);
  return text.substr(start, end - start);
}

SearchEngine::SearchEngine(const SessionSource &source) : source_(source) {}

std::vector<SearchResult> SearchEngine::search(const std::string &query,
                                               const SearchOptions &options) const {
  std::vector<SearchResult> results;
  const auto matcher = QueryMatcher::compile(query, options);
  if (!matcher.has_value()) {
    observability::record_search(query, 0, options.regex);
    return results;
  }

  const auto full = [&]() {
    return options.max_results > 0 && results.size() >= options.max_results;
  };

  for (std::size_t s = 0; s < source_.session_count() && !full(); ++s) {
    const sessions::Session &session = source_.session_at(s);
    for (std::size_t i = 0; i < session.pairs.size() && !full(); ++i) {
      const auto &pair = session.pairs[i];
      const auto field = match_pair(pair, *matcher, options);
      if (!field.has_value()) {
        continue;
      }
      SearchResult result;
      result.session_id = session.session_id;
      result.project_name = session.project_name;
      result.session_index = s;
      result.conversation_index = i;
      result.match_type = field->type;
      result.matched_text = field->text->substr(field->match.position, field->match.length);
      result.match_context = context_for(*field, *matcher);
      result.user_time = pair.user_time;
      result.response_time_seconds = pair.response_time_seconds;
      result.tool_count = pair.tool_count();
      results.push_back(std::move(result));
    }
  }

  std::stable_sort(results.begin(), results.end(),
                   [](const SearchResult &lhs, const SearchResult &rhs) {
                     return lhs.user_time > rhs.user_time;
                   });
  observability::record_search(query, results.size(), options.regex);
  return results;
}

} // namespace tracescope::search
