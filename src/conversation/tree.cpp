#include "tracescope/conversation/tree.hpp"

#include <algorithm>
#include <deque>
#include <unordered_set>

namespace tracescope::conversation {

namespace {

const std::vector<std::string> NO_CHILDREN;

} // namespace

ConversationTree ConversationTree::build(const std::vector<ConversationPair> &pairs) {
  ConversationTree tree;
  std::vector<std::string> materialized;

  const auto add_node = [&](const std::string &id, const std::string &parent_id, NodeKind kind,
                            const std::string &content, common::Timestamp timestamp,
                            const ConversationPair &pair) {
    if (id.empty() || tree.nodes_.contains(id)) {
      return;
    }
    TreeNode node;
    node.id = id;
    node.parent_id = parent_id;
    node.kind = kind;
    node.content = content;
    node.timestamp = timestamp;
    node.is_meta = pair.is_meta;
    node.is_sidechain = pair.is_sidechain;
    node.pair = &pair;
    node.order = materialized.size();
    tree.nodes_.emplace(id, std::move(node));
    materialized.push_back(id);
  };

  for (const auto &pair : pairs) {
    add_node(pair.user_uuid, pair.user_parent_uuid, NodeKind::User, pair.user_content,
             pair.user_time, pair);
    add_node(pair.assistant_uuid, pair.assistant_parent_uuid, NodeKind::Assistant,
             pair.assistant_content, pair.assistant_time, pair);
  }

  for (const auto &id : materialized) {
    TreeNode &node = tree.nodes_.at(id);
    const auto parent = tree.nodes_.find(node.parent_id);
    if (node.parent_id.empty() || parent == tree.nodes_.end() ||
        parent->second.order >= node.order) {
      tree.roots_.push_back(id);
      continue;
    }
    node.linked_parent = node.parent_id;
    tree.children_[node.parent_id].push_back(id);
  }

  for (auto &[parent, children] : tree.children_) {
    tree.sort_by_time(children);
  }
  tree.sort_by_time(tree.roots_);
  return tree;
}

const TreeNode *ConversationTree::find(const std::string &id) const {
  const auto it = nodes_.find(id);
  return it == nodes_.end() ? nullptr : &it->second;
}

const std::vector<std::string> &ConversationTree::children(const std::string &id) const {
  const auto it = children_.find(id);
  return it == children_.end() ? NO_CHILDREN : it->second;
}

std::vector<std::string> ConversationTree::path_to_node(const std::string &id) const {
  std::vector<std::string> path;
  std::unordered_set<std::string> visited;
  const TreeNode *node = find(id);
  while (node != nullptr && visited.insert(node->id).second) {
    path.push_back(node->id);
    if (node->linked_parent.empty()) {
      break;
    }
    node = find(node->linked_parent);
  }
  std::reverse(path.begin(), path.end());
  return path;
}

std::vector<std::string> ConversationTree::descendants(const std::string &id) const {
  std::vector<std::string> out;
  if (find(id) == nullptr) {
    return out;
  }
  std::unordered_set<std::string> visited{id};
  std::deque<std::string> queue{id};
  while (!queue.empty()) {
    const std::string current = queue.front();
    queue.pop_front();
    for (const auto &child : children(current)) {
      if (visited.insert(child).second) {
        out.push_back(child);
        queue.push_back(child);
      }
    }
  }
  sort_by_time(out);
  return out;
}

void ConversationTree::sort_by_time(std::vector<std::string> &ids) const {
  std::sort(ids.begin(), ids.end(), [this](const std::string &lhs, const std::string &rhs) {
    const TreeNode &a = nodes_.at(lhs);
    const TreeNode &b = nodes_.at(rhs);
    if (a.timestamp != b.timestamp) {
      return a.timestamp < b.timestamp;
    }
    return a.order < b.order;
  });
}

} // namespace tracescope::conversation
