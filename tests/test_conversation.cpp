#include "test_framework.hpp"

#include "tracescope/conversation/reconstructor.hpp"
#include "tests/helpers/test_helpers.hpp"

namespace {

namespace th = tracescope::testing;
namespace conv = tracescope::conversation;

std::vector<conv::ConversationPair> rebuild(const std::vector<std::string> &lines) {
  return conv::ConversationReconstructor::reconstruct(th::decode_lines(lines));
}

} // namespace

void register_conversation_tests(std::vector<tracescope::tests::TestCase> &tests) {
  using tracescope::tests::require;

  tests.push_back({"reconstructor_handles_very_long_user_line", [] {
                     const std::string text = "please continue " + std::string(500'000, 'x');
                     const auto pairs = rebuild({
                         th::user_line(text, th::at(0)),
                         th::assistant_text_line("ok", th::at(2)),
                     });
                     require(pairs.size() == 1, "one pair expected");
                     require(pairs[0].user_content == text, "long user text kept whole");
                   }});

  tests.push_back({"reconstructor_joins_tool_result_into_single_turn", [] {
                     const auto pairs = rebuild({
                         th::user_line("fix bug", th::at(0)),
                         th::assistant_line({th::tool_use_item("Bash", "t1", R"({"command":"ls"})")},
                                            th::at(2)),
                         th::user_items_line({R"({"tool_use_id":"t1","content":"file.txt"})"}, th::at(3)),
                         th::assistant_text_line("Done", th::at(5)),
                     });
                     require(pairs.size() == 1, "exactly one pair expected");
                     const auto &pair = pairs[0];
                     require(pair.user_content == "fix bug", "user content mismatch");
                     require(pair.assistant_content == "Done", "assistant content mismatch");
                     require(pair.tool_uses.size() == 1, "one tool use expected");
                     require(pair.tool_uses[0].tool_name == "Bash", "tool name mismatch");
                     require(pair.tool_uses[0].result.has_value() &&
                                 *pair.tool_uses[0].result == "file.txt",
                             "tool result should be joined by id");
                     require(pair.tool_uses[0].input.at("command") == "ls", "tool input mismatch");
                     require(pair.response_time_seconds == 5.0, "response time runs to last reply");
                     require(pair.raw_assistant_content.size() == 2,
                             "raw content keeps every assistant item");
                   }});

  tests.push_back({"reconstructor_is_idempotent", [] {
                     const auto entries = th::decode_lines({
                         th::user_line("first", th::at(0)),
                         th::assistant_line({th::thinking_item("consider"), th::text_item("one")},
                                            th::at(4), {},
                                            R"({"input_tokens":3,"output_tokens":4})"),
                         th::user_line("second", th::at(10)),
                         th::assistant_text_line("two", th::at(12)),
                     });
                     const auto first = conv::ConversationReconstructor::reconstruct(entries);
                     const auto second = conv::ConversationReconstructor::reconstruct(entries);
                     require(first.size() == 2, "two pairs expected");
                     require(first == second, "reconstruction must be deterministic");
                   }});

  tests.push_back({"reconstructor_turn_boundaries_need_actual_content", [] {
                     const auto pairs = rebuild({
                         th::assistant_text_line("orphan reply", th::at(0)),
                         th::user_line("abandoned", th::at(1)),
                         th::user_line("asked again", th::at(2)),
                         th::assistant_text_line("answer", th::at(3)),
                         th::user_line("no real reply", th::at(4)),
                         th::assistant_line({th::text_item("   ")}, th::at(5)),
                     });
                     require(pairs.size() == 1, "only the answered turn survives");
                     require(pairs[0].user_content == "asked again", "latest user entry opens the turn");
                   }});

  tests.push_back({"reconstructor_accumulates_multiple_responses", [] {
                     const auto pairs = rebuild({
                         th::user_line("refactor", th::at(0)),
                         th::assistant_line({th::thinking_item("abc"), th::tool_use_item("Read", "r1")},
                                            th::at(1), {}, R"({"input_tokens":10,"output_tokens":1})"),
                         th::user_items_line({th::tool_result_item("r1", "contents", true)}, th::at(2)),
                         th::assistant_line({th::thinking_item("de"), th::tool_use_item("Edit", "e1")},
                                            th::at(3), {}, R"({"input_tokens":20,"output_tokens":2})"),
                         th::assistant_text_line("Refactored", th::at(4)),
                     });
                     require(pairs.size() == 1, "one pair expected");
                     const auto &pair = pairs[0];
                     require(pair.tool_uses.size() == 2, "two tools expected");
                     require(pair.tool_uses[0].is_error, "error flag should be joined");
                     require(!pair.tool_uses[1].result.has_value(),
                             "unmatched invocation has no result");
                     require(pair.thinking_blocks.size() == 2, "two thinking blocks");
                     require(pair.thinking_char_count == 5, "thinking chars summed");
                     require(pair.token_usage.input_tokens == 30, "input tokens summed");
                     require(pair.token_usage.total_tokens == 33, "total tokens summed");
                     require(pair.assistant_content == "Refactored", "last response is the anchor");
                   }});

  tests.push_back({"reconstructor_clamps_response_time", [] {
                     const auto slow = rebuild({
                         th::user_line("long job", th::at(0)),
                         th::assistant_text_line("finally", th::at(7200)),
                     });
                     require(slow.size() == 1, "one pair expected");
                     require(slow[0].response_time_seconds == conv::MAX_RESPONSE_TIME_SECONDS,
                             "response time is capped at an hour");

                     const auto skewed = rebuild({
                         th::user_line("clock skew", th::at(0)),
                         th::assistant_text_line("earlier", th::at(-30)),
                     });
                     require(skewed[0].response_time_seconds == 0.0,
                             "negative deltas clamp to zero");
                   }});

  tests.push_back({"reconstructor_tracks_sub_agent_threads", [] {
                     const auto pairs = rebuild({
                         th::user_line("research the outage", th::at(0)),
                         th::assistant_line({th::tool_use_item("Task", "k1")}, th::at(1)),
                         th::user_line("Investigate the logs", th::at(2), {.uuid = "cmd-1"}),
                         th::assistant_text_line("Looking into it", th::at(3)),
                         th::assistant_text_line("Task completed successfully", th::at(4)),
                         th::user_items_line({th::tool_result_item("k1", "report")}, th::at(5)),
                         th::assistant_text_line("Here is the report", th::at(6)),
                     });
                     require(pairs.size() == 1, "sub-agent command must not open a turn");
                     const auto &pair = pairs[0];
                     require(pair.user_content == "research the outage", "primary user content");
                     require(pair.tool_uses.empty(), "Task is excluded from tool uses");
                     require(pair.all_tool_uses.size() == 1 &&
                                 pair.all_tool_uses[0].result.value_or("") == "report",
                             "Task is kept in the unfiltered list");
                     require(pair.sub_agent_threads.size() == 1, "one thread expected");
                     const auto &thread = pair.sub_agent_threads[0];
                     require(thread.command == "Investigate the logs", "command mismatch");
                     require(thread.command_uuid == "cmd-1", "command uuid mismatch");
                     require(thread.responses.size() == 2, "two replies before completion");
                     require(thread.complete, "completion phrase closes the thread");
                     require(pair.assistant_content == "Here is the report", "anchor mismatch");
                   }});

  tests.push_back({"reconstructor_session_mismatch_discards_turn", [] {
                     const auto pairs = rebuild({
                         th::user_line("from A", th::at(0), {.session_id = "A"}),
                         th::assistant_text_line("from B", th::at(1), {.session_id = "B"}),
                         th::assistant_text_line("late A", th::at(2), {.session_id = "A"}),
                         th::user_line("again", th::at(3), {.session_id = "A"}),
                         th::assistant_text_line("ok", th::at(4), {.session_id = "A"}),
                     });
                     require(pairs.size() == 1, "mismatched turn should be dropped");
                     require(pairs[0].user_content == "again", "surviving turn mismatch");
                     require(pairs[0].session_id == "A", "session id copied from user");
                   }});

  tests.push_back({"reconstructor_marks_compact_continuations", [] {
                     const auto pairs = rebuild({
                         th::user_line("normal start", th::at(0)),
                         th::assistant_text_line("reply", th::at(1)),
                         R"({"type":"user","isCompactSummary":true,"timestamp":")" + th::at(2) +
                             R"(","message":{"role":"user","content":"Summary of earlier work"}})",
                         th::assistant_text_line("resumed", th::at(3)),
                         th::user_line("continue with the last task", th::at(4)),
                         th::assistant_text_line("continuing", th::at(5)),
                     });
                     require(pairs.size() == 3, "three pairs expected");
                     require(!pairs[0].compact_continuation, "ordinary turn is not compact");
                     require(pairs[1].compact_continuation, "compact summary flag");
                     require(pairs[2].compact_continuation, "resume instruction text");
                   }});

  tests.push_back({"reconstructor_streaming_state", [] {
                     conv::ConversationReconstructor reconstructor;
                     const auto entries = th::decode_lines({
                         th::user_line("q1", th::at(0)),
                         th::assistant_line({th::tool_use_item("Task", "k1")}, th::at(1)),
                         th::user_line("q2", th::at(2)),
                     });
                     reconstructor.consume(entries[0]);
                     require(reconstructor.state().open(), "turn should be open");
                     require(!reconstructor.state().closable(), "no reply yet");
                     reconstructor.consume(entries[1]);
                     require(reconstructor.pending_task(), "Task invocation sets pending");
                     require(reconstructor.state().closable(), "tool use counts as a reply");
                     reconstructor.consume(entries[2]);
                     require(!reconstructor.pending_task(), "command consumes pending task");
                     require(reconstructor.emitted() == 0, "command does not close the turn");
                     const auto pairs = reconstructor.finish();
                     require(pairs.size() == 1, "finish closes the open turn");
                     require(pairs[0].sub_agent_threads.size() == 1, "command recorded as thread");
                   }});

  tests.push_back({"completion_and_summary_phrases", [] {
                     require(conv::is_completion_text("I've completed the migration"), "english");
                     require(conv::is_completion_text("作業を完了しました"), "japanese");
                     require(!conv::is_completion_text("still working"), "not complete");
                     require(conv::is_summary_text("In summary, it works"), "summary phrase");
                   }});
}
