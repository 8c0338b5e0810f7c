#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file thought_tree.hpp
 * @brief Per-session tree of thought nodes with value-guided pruning
 *
 * One ThoughtTree per session. Every admitted record becomes a node; the
 * record's role decides where it hangs:
 *
 *   Branch   -> child of the node carrying branch_from_thought (cursor
 *               ancestry wins ties; unknown number falls back to the cursor)
 *   Revision -> sibling of the revised node (revising the root makes a child
 *               of the root; unknown number falls back to the cursor)
 *   Plain    -> child of the cursor (the first record becomes the root)
 *
 * The cursor always moves to the newly admitted node.
 *
 * Capacity: when an insert would overflow, leaves are pruned first, so
 * size() <= capacity() holds whenever a prunable leaf exists. The root, the
 * cursor and the chosen parent are never pruned. Removal order among leaves:
 *   1. visited leaves before unvisited ones
 *   2. lower average value first
 *   3. older last_touched first
 *   4. earlier insertion first
 * Pruning a leaf can expose its parent within the same pass. A tree whose
 * only leaves are protected (a single chain) stops pruning early.
 *
 * Visit/value statistics are mutated only through mcts::MCTSEngine.
 *
 * Thread safety: external synchronization required (ThoughtTreeManager
 * serializes access).
 */

#include "common.hpp"
#include "errors.hpp"
#include "thought.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace trellis::tree {

using NodeId = std::string;

/// Characters of thought text kept in serialized tree views
constexpr size_t THOUGHT_PREVIEW_LENGTH = 100;

struct ThoughtNode {
  NodeId id;
  std::optional<NodeId> parent_id;  ///< nullopt for the root
  std::vector<NodeId> children;     ///< Insertion order
  int depth = 0;                    ///< Root = 0

  int visit_count = 0;
  double total_value = 0.0;
  bool is_terminal = false;  ///< !record.next_thought_needed

  TimestampMs created_at = 0;
  TimestampMs last_touched = 0;
  uint64_t serial = 0;  ///< Admission order within the tree

  ThoughtRecord record;

  // Attached after admission by the tree manager
  std::optional<double> confidence;
  std::optional<std::string> strategy;

  double average_value() const {
    return visit_count > 0 ? total_value / visit_count : 0.0;
  }
  int thought_number() const { return record.thought_number; }
  bool is_root() const { return !parent_id.has_value(); }
  bool is_leaf() const { return children.empty(); }
};

// ============================================================================
// Depth-limited serialization view
// ============================================================================

/// Stands in for the children of a node beyond the requested depth
struct TruncationMarker {
  size_t count = 0;
};

struct TreeNodeView;
using TreeChildren = std::variant<std::vector<TreeNodeView>, TruncationMarker>;

struct TreeNodeView {
  NodeId node_id;
  int thought_number = 0;
  std::string thought;  ///< Preview, suffixed with "..." when cut
  int depth = 0;
  int visit_count = 0;
  double average_value = 0.0;
  bool is_terminal = false;
  bool is_cursor = false;
  size_t child_count = 0;
  TreeChildren children;
};

inline void to_json(nlohmann::json& j, const TreeNodeView& v) {
  j = nlohmann::json{
      {"nodeId", v.node_id},
      {"thoughtNumber", v.thought_number},
      {"thought", v.thought},
      {"depth", v.depth},
      {"visitCount", v.visit_count},
      {"averageValue", v.average_value},
      {"isTerminal", v.is_terminal},
      {"isCursor", v.is_cursor},
      {"childCount", v.child_count},
  };
  if (const auto* marker = std::get_if<TruncationMarker>(&v.children)) {
    j["children"] = std::to_string(marker->count) + " children truncated";
  } else {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& child : std::get<std::vector<TreeNodeView>>(v.children)) {
      arr.push_back(child);
    }
    j["children"] = std::move(arr);
  }
}

// ============================================================================
// ThoughtTree
// ============================================================================

class ThoughtTree {
public:
  /**
   * @param session_id Owning session
   * @param max_nodes Capacity ceiling (values below 1 are raised to 1)
   * @param clock Time source for node timestamps
   */
  ThoughtTree(std::string session_id, int64_t max_nodes,
              ClockFn clock = system_clock())
      : session_id_(std::move(session_id)),
        max_nodes_(max_nodes < 1 ? 1 : static_cast<size_t>(max_nodes)),
        clock_(std::move(clock)) {
    created_at_ = clock_();
    last_accessed_ = created_at_;
  }

  /**
   * Admit a record as a new node and move the cursor to it
   *
   * Never fails for capacity reasons. Prunes before inserting when full,
   * and again once the new node holds the cursor.
   *
   * @return The new node (reference valid until the node is pruned)
   */
  const ThoughtNode& add_thought(const ThoughtRecord& record) {
    TimestampMs now = clock_();
    last_accessed_ = now;

    std::optional<NodeId> parent_id;
    if (root_id_) {
      parent_id = resolve_parent(record);
    }

    if (nodes_.size() + 1 > max_nodes_) {
      std::unordered_set<NodeId> keep;
      if (parent_id) keep.insert(*parent_id);
      prune_to(max_nodes_ - 1, keep);
    }

    ThoughtNode node;
    node.serial = next_serial_++;
    node.id = make_node_id(node.serial, now);
    node.record = record;
    node.is_terminal = !record.next_thought_needed;
    node.created_at = now;
    node.last_touched = now;

    if (parent_id) {
      ThoughtNode& parent = nodes_.at(*parent_id);
      node.parent_id = parent_id;
      node.depth = parent.depth + 1;
      parent.children.push_back(node.id);
    } else {
      root_id_ = node.id;
    }

    NodeId id = node.id;
    by_number_[record.thought_number].push_back(id);
    auto [it, inserted] = nodes_.emplace(id, std::move(node));
    (void)inserted;
    cursor_id_ = id;

    // The previous cursor is an ordinary leaf now
    if (nodes_.size() > max_nodes_) prune_to(max_nodes_, {});

    TRELLIS_LOG_DEBUG("[tree::add_thought] %s #%d %s depth=%d size=%zu",
                      session_id_.c_str(), record.thought_number,
                      role_name(record.role()), it->second.depth, nodes_.size());
    return it->second;
  }

  /**
   * Move the cursor to an existing node
   *
   * @throws TreeError if the node is absent
   */
  const ThoughtNode& set_cursor(const NodeId& id) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
      throw TreeError("Node not found: " + id, {{"nodeId", id}});
    }
    cursor_id_ = id;
    it->second.last_touched = clock_();
    last_accessed_ = it->second.last_touched;
    return it->second;
  }

  const ThoughtNode* get_node(const NodeId& id) const {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
  }

  ThoughtNode* get_node(const NodeId& id) {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
  }

  const ThoughtNode* root() const {
    return root_id_ ? get_node(*root_id_) : nullptr;
  }

  const ThoughtNode* cursor() const {
    return cursor_id_ ? get_node(*cursor_id_) : nullptr;
  }

  /**
   * Node carrying thought number `n`
   *
   * When several nodes share `n`, the one on the cursor's ancestor chain
   * (or the cursor itself) wins, else the earliest admitted.
   */
  const ThoughtNode* find_node_by_thought_number(int n) const {
    auto it = by_number_.find(n);
    if (it == by_number_.end() || it->second.empty()) return nullptr;
    const auto& ids = it->second;
    if (ids.size() > 1 && cursor_id_) {
      auto chain = ancestor_ids(*cursor_id_);
      for (const auto& candidate : ids) {
        if (chain.count(candidate)) return get_node(candidate);
      }
    }
    return get_node(ids.front());
  }

  /// Root-first path ending at `id` (empty if absent)
  std::vector<const ThoughtNode*> get_ancestor_path(const NodeId& id) const {
    std::vector<const ThoughtNode*> path;
    const ThoughtNode* node = get_node(id);
    while (node) {
      path.push_back(node);
      node = node->parent_id ? get_node(*node->parent_id) : nullptr;
    }
    std::reverse(path.begin(), path.end());
    return path;
  }

  std::vector<const ThoughtNode*> get_children(const NodeId& id) const {
    std::vector<const ThoughtNode*> out;
    if (const ThoughtNode* node = get_node(id)) {
      for (const auto& child_id : node->children) {
        if (const ThoughtNode* child = get_node(child_id)) out.push_back(child);
      }
    }
    return out;
  }

  std::vector<const ThoughtNode*> get_leaf_nodes() const {
    std::vector<const ThoughtNode*> out;
    for (const ThoughtNode* node : get_all_nodes()) {
      if (node->is_leaf()) out.push_back(node);
    }
    return out;
  }

  /// Non-terminal nodes, admission order
  std::vector<const ThoughtNode*> get_expandable_nodes() const {
    std::vector<const ThoughtNode*> out;
    for (const ThoughtNode* node : get_all_nodes()) {
      if (!node->is_terminal) out.push_back(node);
    }
    return out;
  }

  /// Every node in admission order
  std::vector<const ThoughtNode*> get_all_nodes() const {
    std::vector<const ThoughtNode*> out;
    out.reserve(nodes_.size());
    for (const auto& [id, node] : nodes_) out.push_back(&node);
    std::sort(out.begin(), out.end(),
              [](const ThoughtNode* a, const ThoughtNode* b) {
                return a->serial < b->serial;
              });
    return out;
  }

  /**
   * Depth-limited view rooted at the root
   *
   * Nodes at `max_depth` report their children as a TruncationMarker.
   *
   * @return nullopt for an empty tree
   */
  std::optional<TreeNodeView> to_view(std::optional<int> max_depth = std::nullopt) const {
    const ThoughtNode* r = root();
    if (!r) return std::nullopt;
    return build_view(*r, max_depth);
  }

  /// to_view() as JSON; null for an empty tree
  nlohmann::json to_json(std::optional<int> max_depth = std::nullopt) const {
    auto view = to_view(max_depth);
    if (!view) return nullptr;
    return *view;
  }

  /**
   * Prune down to capacity
   *
   * add_thought() keeps the tree within capacity on its own; this is for
   * callers that lowered expectations and want an explicit pass.
   *
   * @return Number of nodes removed
   */
  size_t prune() { return prune_to(max_nodes_, {}); }

  size_t size() const { return nodes_.size(); }
  bool empty() const { return nodes_.empty(); }
  size_t capacity() const { return max_nodes_; }

  const std::string& session_id() const { return session_id_; }
  TimestampMs created_at() const { return created_at_; }
  TimestampMs last_accessed() const { return last_accessed_; }
  void touch() { last_accessed_ = clock_(); }
  TimestampMs now() const { return clock_(); }

private:
  NodeId resolve_parent(const ThoughtRecord& record) const {
    switch (record.role()) {
      case ThoughtRole::Branch: {
        if (const ThoughtNode* origin =
                find_node_by_thought_number(*record.branch_from_thought)) {
          return origin->id;
        }
        TRELLIS_LOG_DEBUG(
            "[tree::resolve_parent] Branch origin #%d not found; using cursor",
            *record.branch_from_thought);
        return *cursor_id_;
      }
      case ThoughtRole::Revision: {
        const ThoughtNode* revised =
            find_node_by_thought_number(*record.revises_thought);
        if (!revised) {
          TRELLIS_LOG_DEBUG(
              "[tree::resolve_parent] Revised #%d not found; using cursor",
              *record.revises_thought);
          return *cursor_id_;
        }
        // Revising the root hangs the revision under the root
        return revised->parent_id ? *revised->parent_id : revised->id;
      }
      case ThoughtRole::Plain:
        break;
    }
    return *cursor_id_;
  }

  std::unordered_set<NodeId> ancestor_ids(const NodeId& id) const {
    std::unordered_set<NodeId> out;
    const ThoughtNode* node = get_node(id);
    while (node) {
      out.insert(node->id);
      node = node->parent_id ? get_node(*node->parent_id) : nullptr;
    }
    return out;
  }

  /// Returns true if `a` should be pruned before `b`
  static bool prune_before(const ThoughtNode* a, const ThoughtNode* b) {
    bool a_visited = a->visit_count > 0;
    bool b_visited = b->visit_count > 0;
    if (a_visited != b_visited) return a_visited;
    if (a->average_value() != b->average_value()) {
      return a->average_value() < b->average_value();
    }
    if (a->last_touched != b->last_touched) {
      return a->last_touched < b->last_touched;
    }
    return a->serial < b->serial;
  }

  size_t prune_to(size_t target, const std::unordered_set<NodeId>& keep) {
    size_t removed = 0;
    while (nodes_.size() > target) {
      const ThoughtNode* victim = nullptr;
      for (const auto& [id, node] : nodes_) {
        if (!node.is_leaf()) continue;
        if (id == root_id_ || id == cursor_id_ || keep.count(id)) continue;
        if (!victim || prune_before(&node, victim)) victim = &node;
      }
      if (!victim) {
        TRELLIS_LOG_DEBUG(
            "[tree::prune] %s: no prunable leaf, size=%zu capacity=%zu",
            session_id_.c_str(), nodes_.size(), max_nodes_);
        break;
      }
      remove_leaf(victim->id);
      ++removed;
    }
    if (removed > 0) {
      TRELLIS_LOG_DEBUG("[tree::prune] %s: removed %zu node(s), size=%zu",
                        session_id_.c_str(), removed, nodes_.size());
    }
    return removed;
  }

  void remove_leaf(NodeId id) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return;

    if (it->second.parent_id) {
      if (ThoughtNode* parent = get_node(*it->second.parent_id)) {
        auto& siblings = parent->children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), id),
                       siblings.end());
      }
    }

    auto num_it = by_number_.find(it->second.thought_number());
    if (num_it != by_number_.end()) {
      auto& ids = num_it->second;
      ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
      if (ids.empty()) by_number_.erase(num_it);
    }

    nodes_.erase(it);
  }

  TreeNodeView build_view(const ThoughtNode& node,
                          std::optional<int> max_depth) const {
    TreeNodeView v;
    v.node_id = node.id;
    v.thought_number = node.thought_number();
    v.thought = node.record.thought.size() > THOUGHT_PREVIEW_LENGTH
                    ? utf8_prefix(node.record.thought, THOUGHT_PREVIEW_LENGTH) + "..."
                    : node.record.thought;
    v.depth = node.depth;
    v.visit_count = node.visit_count;
    v.average_value = node.average_value();
    v.is_terminal = node.is_terminal;
    v.is_cursor = cursor_id_ && *cursor_id_ == node.id;
    v.child_count = node.children.size();

    if (max_depth && node.depth >= *max_depth && !node.children.empty()) {
      v.children = TruncationMarker{node.children.size()};
      return v;
    }

    std::vector<TreeNodeView> kids;
    kids.reserve(node.children.size());
    for (const auto& child_id : node.children) {
      if (const ThoughtNode* child = get_node(child_id)) {
        kids.push_back(build_view(*child, max_depth));
      }
    }
    v.children = std::move(kids);
    return v;
  }

  static NodeId make_node_id(uint64_t serial, TimestampMs now) {
    static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::string stamp;
    uint64_t t = now > 0 ? static_cast<uint64_t>(now) : 0;
    do {
      stamp.insert(stamp.begin(), digits[t % 36]);
      t /= 36;
    } while (t > 0);
    return "node_" + std::to_string(serial) + "_" + stamp;
  }

  std::string session_id_;
  size_t max_nodes_;
  ClockFn clock_;

  std::unordered_map<NodeId, ThoughtNode> nodes_;
  std::unordered_map<int, std::vector<NodeId>> by_number_;  // admission order
  std::optional<NodeId> root_id_;
  std::optional<NodeId> cursor_id_;
  uint64_t next_serial_ = 0;

  TimestampMs created_at_ = 0;
  TimestampMs last_accessed_ = 0;
};

}  // namespace trellis::tree
