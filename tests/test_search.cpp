#include "test_framework.hpp"

#include "tracescope/common/fs.hpp"
#include "tracescope/search/search_engine.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

namespace th = tracescope::testing;
namespace conv = tracescope::conversation;
namespace sess = tracescope::sessions;
namespace search = tracescope::search;

conv::ConversationPair text_pair(const long seconds, const std::string &user,
                                 const std::string &assistant,
                                 const std::vector<std::string> &thinking = {}) {
  conv::ConversationPair pair;
  pair.user_time = *tracescope::common::parse_iso8601(th::at(seconds));
  pair.assistant_time = *tracescope::common::parse_iso8601(th::at(seconds + 3));
  pair.response_time_seconds = 3.0;
  pair.user_content = user;
  pair.assistant_content = assistant;
  for (const auto &text : thinking) {
    pair.thinking_blocks.push_back(conv::ThinkingBlock{.timestamp = pair.assistant_time,
                                                       .text = text});
  }
  return pair;
}

sess::SessionPtr session_of(const std::string &id, std::vector<conv::ConversationPair> pairs) {
  sess::Session session;
  session.session_id = id;
  session.full_session_id = id;
  session.project_name = "proj";
  session.pairs = std::move(pairs);
  return std::make_shared<const sess::Session>(std::move(session));
}

std::vector<search::SearchResult> run(const std::vector<sess::SessionPtr> &sessions,
                                      const std::string &query,
                                      const search::SearchOptions &options = {}) {
  const search::VectorSessionSource source(sessions);
  return search::SearchEngine(source).search(query, options);
}

class CountingSource final : public search::SessionSource {
public:
  explicit CountingSource(const std::vector<sess::SessionPtr> &sessions) : sessions_(sessions) {}

  [[nodiscard]] std::size_t session_count() const override { return sessions_.size(); }
  [[nodiscard]] const sess::Session &session_at(const std::size_t index) const override {
    ++visits;
    return *sessions_.at(index);
  }

  mutable std::size_t visits = 0;

private:
  const std::vector<sess::SessionPtr> &sessions_;
};

} // namespace

void register_search_tests(std::vector<tracescope::tests::TestCase> &tests) {
  using tracescope::tests::require;

  tests.push_back({"search_or_query_reports_first_matching_field", [] {
                     const std::vector<sess::SessionPtr> sessions = {session_of(
                         "s1", {text_pair(0, "deploy the service",
                                          "The request failed with a timeout after 30s")})};
                     const auto results = run(sessions, "timeout OR crash");
                     require(results.size() == 1, "one result expected");
                     require(results[0].match_type == search::MatchType::Assistant,
                             "assistant field expected");
                     require(results[0].matched_text == "timeout", "matched text mismatch");
                     require(results[0].session_id == "s1", "session id mismatch");
                     require(results[0].conversation_index == 0, "conversation index mismatch");
                     require(search::match_type_name(results[0].match_type) == "assistant",
                             "match type name mismatch");

                     const std::vector<sess::SessionPtr> reworded = {
                         session_of("s2", {text_pair(0, "deploy", "the request timed out")})};
                     require(run(reworded, "timeout OR crash").empty(),
                             "terms are substrings, so \"timed out\" does not contain \"timeout\"");
                   }});

  tests.push_back({"search_user_field_wins_over_assistant", [] {
                     const std::vector<sess::SessionPtr> sessions = {
                         session_of("s1", {text_pair(0, "crash on start", "crash fixed")})};
                     const auto results = run(sessions, "crash");
                     require(results.size() == 1, "a pair reports one match only");
                     require(results[0].match_type == search::MatchType::User,
                             "user field is checked first");
                   }});

  tests.push_back({"search_literal_is_case_insensitive_by_default", [] {
                     const std::vector<sess::SessionPtr> sessions = {
                         session_of("s1", {text_pair(0, "question", "Connection TIMEOUT")})};
                     require(run(sessions, "timeout").size() == 1, "default mode ignores case");
                     search::SearchOptions options;
                     options.case_sensitive = true;
                     require(run(sessions, "timeout", options).empty(),
                             "case sensitive mode must not match");
                     require(run(sessions, "TIMEOUT", options).size() == 1,
                             "exact case should match");
                   }});

  tests.push_back({"search_regex_mode_matches_patterns", [] {
                     const std::vector<sess::SessionPtr> sessions = {
                         session_of("s1", {text_pair(0, "see error E1234 in log", "ok"),
                                           text_pair(10, "nothing here", "ok")})};
                     search::SearchOptions options;
                     options.regex = true;
                     const auto results = run(sessions, R"(e\d{4})", options);
                     require(results.size() == 1, "one regex match expected");
                     require(results[0].matched_text == "E1234",
                             "regex matches ignore case");
                   }});

  tests.push_back({"search_regex_scans_long_fields_line_by_line", [] {
                     const std::string long_line = std::string(300'000, 'a') + "needle";
                     const std::vector<sess::SessionPtr> sessions = {
                         session_of("s1", {text_pair(0, "question", long_line),
                                           text_pair(10, "intro\nerror E42 here", "ok")})};
                     search::SearchOptions options;
                     options.regex = true;
                     const auto greedy = run(sessions, ".*needle", options);
                     require(greedy.size() == 1, "long single line should match");
                     require(greedy[0].match_type == search::MatchType::Assistant,
                             "assistant field expected");
                     require(tracescope::common::ends_with(greedy[0].matched_text, "needle"),
                             "match ends at the needle");

                     const auto anchored = run(sessions, "^error e\\d+", options);
                     require(anchored.size() == 1 && anchored[0].matched_text == "error E42",
                             "anchors apply per line");
                   }});

  tests.push_back({"search_invalid_regex_yields_empty_results", [] {
                     th::ObserverScope scope;
                     const std::vector<sess::SessionPtr> sessions = {
                         session_of("s1", {text_pair(0, "([", "ok")})};
                     search::SearchOptions options;
                     options.regex = true;
                     require(run(sessions, "([", options).empty(), "invalid regex gives nothing");
                     const auto errors = scope.observer().events<tracescope::observability::ErrorEvent>();
                     require(errors.size() == 1, "invalid regex should be reported");
                     require(errors[0].component == "search", "error component mismatch");
                     const auto searches =
                         scope.observer().events<tracescope::observability::SearchEvent>();
                     require(searches.size() == 1 && searches[0].results == 0,
                             "search event still recorded");
                   }});

  tests.push_back({"search_empty_query_yields_nothing", [] {
                     const std::vector<sess::SessionPtr> sessions = {
                         session_of("s1", {text_pair(0, "anything", "ok")})};
                     require(run(sessions, "   ").empty(), "blank query matches nothing");
                     require(run(sessions, " OR ").empty(), "query of separators matches nothing");
                   }});

  tests.push_back({"search_stops_scanning_at_max_results", [] {
                     std::vector<sess::SessionPtr> sessions;
                     for (int i = 0; i < 5; ++i) {
                       sessions.push_back(session_of("s" + std::to_string(i),
                                                     {text_pair(i * 100, "needle", "ok")}));
                     }
                     const CountingSource source(sessions);
                     search::SearchOptions options;
                     options.max_results = 2;
                     const auto results = search::SearchEngine(source).search("needle", options);
                     require(results.size() == 2, "results capped at max");
                     require(source.visits == 2, "sessions past the cap must not be visited");
                   }});

  tests.push_back({"search_orders_results_newest_first", [] {
                     const std::vector<sess::SessionPtr> sessions = {
                         session_of("a", {text_pair(0, "needle one", "ok"),
                                          text_pair(100, "needle two", "ok")}),
                         session_of("b", {text_pair(50, "needle three", "ok")})};
                     const auto results = run(sessions, "needle");
                     require(results.size() == 3, "three results expected");
                     require(results[0].session_id == "a" && results[0].conversation_index == 1,
                             "newest turn first");
                     require(results[1].session_id == "b" && results[1].session_index == 1,
                             "middle turn second");
                     require(results[2].session_id == "a" && results[2].conversation_index == 0,
                             "oldest turn last");
                   }});

  tests.push_back({"search_thinking_only_restricts_fields", [] {
                     const std::vector<sess::SessionPtr> sessions = {session_of(
                         "s1", {text_pair(0, "alpha request", "alpha reply", {"alpha deep dive"}),
                                text_pair(10, "alpha again", "done")})};
                     const auto all = run(sessions, "alpha");
                     require(all.size() == 2, "both pairs match in default mode");
                     search::SearchOptions options;
                     options.thinking_only = true;
                     const auto thinking = run(sessions, "alpha", options);
                     require(thinking.size() == 1, "only the pair with thinking matches");
                     require(thinking[0].match_type == search::MatchType::Thinking,
                             "thinking match type expected");
                     require(thinking[0].match_context == "alpha deep dive", "context mismatch");
                   }});

  tests.push_back({"search_context_window_surrounds_match", [] {
                     const std::string text = std::string(100, 'a') + "needle" +
                                              std::string(100, 'b');
                     const auto context = search::extract_context(text, {.position = 100,
                                                                         .length = 6});
                     require(context == std::string(50, 'a') + "needle" + std::string(50, 'b'),
                             "fifty bytes either side expected");
                     const auto head = search::extract_context("needle at start", {.position = 0,
                                                                                   .length = 6});
                     require(head == "needle at start", "window clamps at text start");
                   }});

  tests.push_back({"search_context_respects_code_points", [] {
                     const std::string text = "\xC3\xA9" + std::string(49, 'x') + "key";
                     const auto context = search::extract_context(text, {.position = 51,
                                                                         .length = 3});
                     require(context == text, "window start moves back to the character boundary");
                   }});

  tests.push_back({"search_context_uses_cleaned_user_text", [] {
                     const std::string user =
                         "please check\n\xF0\x9F\x94\xA7 TOOLS EXECUTION FLOW:\n[1] Read\n"
                         "File: keyword.cpp";
                     const std::vector<sess::SessionPtr> sessions = {
                         session_of("s1", {text_pair(0, user, "ok")})};
                     const auto in_artifacts = run(sessions, "keyword");
                     require(in_artifacts.size() == 1, "raw text still matches");
                     require(in_artifacts[0].match_context == "please check",
                             "context falls back to the cleaned prose");
                     const auto in_prose = run(sessions, "check");
                     require(in_prose.size() == 1 && in_prose[0].match_context == "please check",
                             "context comes from the cleaned prose");
                   }});

  tests.push_back({"search_split_or_terms", [] {
                     const auto terms = search::split_or_terms("timeout OR crash or  panic ");
                     require(terms.size() == 3, "three terms expected");
                     require(terms[0] == "timeout" && terms[1] == "crash" && terms[2] == "panic",
                             "terms mismatch");
                     const auto single = search::split_or_terms("ORACLE error");
                     require(single.size() == 1 && single[0] == "ORACLE error",
                             "separator needs surrounding spaces");
                   }});
}
