#pragma once

#include "tracescope/conversation/pair.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace tracescope::conversation {

enum class NodeKind { User, Assistant };

struct TreeNode {
  std::string id;
  /// Parent identity as recorded in the transcript, resolved or not.
  std::string parent_id;
  /// Parent the node is actually linked under. Empty for roots.
  std::string linked_parent;
  NodeKind kind = NodeKind::User;
  std::string content;
  common::Timestamp timestamp{};
  bool is_meta = false;
  bool is_sidechain = false;
  /// Owning pair. Not owned; valid while the pair list the tree was built from is alive.
  const ConversationPair *pair = nullptr;
  std::size_t order = 0;
};

/// Forest over the user and assistant endpoints of a session's pairs, linked by identity.
/// A link is made only to a node materialized earlier, so the structure cannot contain cycles.
class ConversationTree {
public:
  [[nodiscard]] static ConversationTree build(const std::vector<ConversationPair> &pairs);

  [[nodiscard]] const TreeNode *find(const std::string &id) const;
  [[nodiscard]] const std::vector<std::string> &roots() const { return roots_; }
  [[nodiscard]] const std::vector<std::string> &children(const std::string &id) const;

  /// Root-first chain ending at `id`. Empty when `id` is unknown.
  [[nodiscard]] std::vector<std::string> path_to_node(const std::string &id) const;

  /// Every node below `id`, ordered by timestamp.
  [[nodiscard]] std::vector<std::string> descendants(const std::string &id) const;

  [[nodiscard]] std::size_t size() const { return nodes_.size(); }
  [[nodiscard]] bool empty() const { return nodes_.empty(); }

private:
  void sort_by_time(std::vector<std::string> &ids) const;

  std::unordered_map<std::string, TreeNode> nodes_;
  std::unordered_map<std::string, std::vector<std::string>> children_;
  std::vector<std::string> roots_;
};

} // namespace tracescope::conversation
