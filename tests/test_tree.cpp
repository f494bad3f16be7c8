#include "test_framework.hpp"

#include "tracescope/conversation/tree.hpp"
#include "tracescope/common/time.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <functional>

namespace {

namespace th = tracescope::testing;
namespace conv = tracescope::conversation;

conv::ConversationPair make_pair(const std::string &user_uuid, const std::string &user_parent,
                                 const std::string &assistant_uuid,
                                 const std::string &assistant_parent, const long seconds) {
  conv::ConversationPair pair;
  pair.user_uuid = user_uuid;
  pair.user_parent_uuid = user_parent;
  pair.assistant_uuid = assistant_uuid;
  pair.assistant_parent_uuid = assistant_parent;
  pair.user_time = *tracescope::common::parse_iso8601(th::at(seconds));
  pair.assistant_time = *tracescope::common::parse_iso8601(th::at(seconds + 1));
  pair.user_content = "user " + user_uuid;
  pair.assistant_content = "assistant " + assistant_uuid;
  return pair;
}

} // namespace

void register_tree_tests(std::vector<tracescope::tests::TestCase> &tests) {
  using tracescope::tests::require;

  tests.push_back({"tree_links_known_parents", [] {
                     const std::vector<conv::ConversationPair> pairs = {
                         make_pair("u1", "", "a1", "u1", 0),
                         make_pair("u2", "a1", "a2", "u2", 10),
                     };
                     const auto tree = conv::ConversationTree::build(pairs);
                     require(tree.size() == 4, "four nodes expected");
                     require(tree.roots() == std::vector<std::string>{"u1"}, "u1 is the only root");
                     require(tree.children("u1") == std::vector<std::string>{"a1"}, "u1 -> a1");
                     require(tree.children("a2").empty(), "leaf has no children");
                     const auto *node = tree.find("a2");
                     require(node != nullptr && node->kind == conv::NodeKind::Assistant,
                             "assistant node expected");
                     require(node->pair == &pairs[1], "node points at its pair");
                     require(node->content == "assistant a2", "node content mismatch");
                   }});

  tests.push_back({"tree_broken_links_become_roots", [] {
                     const std::vector<conv::ConversationPair> pairs = {
                         make_pair("u1", "missing", "a1", "u1", 5),
                         make_pair("u2", "", "", "", 0),
                     };
                     const auto tree = conv::ConversationTree::build(pairs);
                     require(tree.size() == 3, "empty identities are not materialized");
                     require(tree.roots() == std::vector<std::string>{"u2", "u1"},
                             "roots sorted by timestamp");
                     require(tree.find("u1")->parent_id == "missing", "recorded parent kept");
                     require(tree.find("u1")->linked_parent.empty(), "broken link not followed");
                   }});

  tests.push_back({"tree_path_to_node_is_root_first", [] {
                     const std::vector<conv::ConversationPair> pairs = {
                         make_pair("u1", "", "a1", "u1", 0),
                         make_pair("u2", "a1", "a2", "u2", 10),
                         make_pair("u3", "a2", "a3", "u3", 20),
                     };
                     const auto tree = conv::ConversationTree::build(pairs);
                     const auto path = tree.path_to_node("a3");
                     require(path == std::vector<std::string>{"u1", "a1", "u2", "a2", "u3", "a3"},
                             "path should run from root to target");
                     require(tree.path_to_node("nope").empty(), "unknown node has no path");
                   }});

  tests.push_back({"tree_descendants_sorted_by_time", [] {
                     const std::vector<conv::ConversationPair> pairs = {
                         make_pair("u1", "", "a1", "u1", 0),
                         make_pair("u3", "a1", "a3", "u3", 30),
                         make_pair("u2", "a1", "a2", "u2", 10),
                     };
                     const auto tree = conv::ConversationTree::build(pairs);
                     require(tree.children("a1") == std::vector<std::string>{"u2", "u3"},
                             "siblings sorted by time");
                     const auto below = tree.descendants("u1");
                     require(below == std::vector<std::string>{"a1", "u2", "a2", "u3", "a3"},
                             "descendants sorted by time");
                     require(tree.descendants("a3").empty(), "leaf has no descendants");
                   }});

  tests.push_back({"tree_never_contains_cycles", [] {
                     const std::vector<conv::ConversationPair> pairs = {
                         make_pair("u1", "a2", "a1", "u1", 0),
                         make_pair("u2", "a1", "a2", "u2", 10),
                         make_pair("u1", "", "a9", "a9", 20),
                     };
                     const auto tree = conv::ConversationTree::build(pairs);
                     require(tree.find("a9")->linked_parent.empty(), "self link is not followed");
                     require(tree.find("u1")->linked_parent.empty(),
                             "forward reference is not followed");

                     std::size_t reached = 0;
                     std::function<void(const std::string &, std::size_t)> walk =
                         [&](const std::string &id, std::size_t depth) {
                           require(depth <= tree.size(), "walk should terminate");
                           ++reached;
                           for (const auto &child : tree.children(id)) {
                             walk(child, depth + 1);
                           }
                         };
                     for (const auto &root : tree.roots()) {
                       walk(root, 0);
                     }
                     require(reached == tree.size(), "every node reachable exactly once");
                   }});
}
