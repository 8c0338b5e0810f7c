#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file mcts.hpp
 * @brief UCB1 scoring, backpropagation and suggestion over a ThoughtTree
 *
 * MCTSEngine holds no tree state; every call takes the tree it works on.
 * The caller evaluates nodes (the "simulation" step is external), the engine
 * propagates scores to the root and ranks expandable nodes by UCB1:
 *
 *   UCB1(n) = Q(n) + C * sqrt(ln N(parent) / N(n)),   Q(n) = W(n) / N(n)
 *
 * Unvisited nodes score +inf so they are suggested before anything else.
 *
 * Example usage:
 *
 *   trellis::tree::ThoughtTree tree("session", 500);
 *   auto& root = tree.add_thought(first);
 *   auto& next = tree.add_thought(second);
 *
 *   trellis::mcts::MCTSEngine engine;
 *   engine.backpropagate(tree, next.id, 0.8);   // updates next and root
 *
 *   auto result = engine.suggest_next(tree, trellis::mcts::Strategy::Balanced);
 *   auto path = engine.extract_best_path(tree);
 */

#include "common.hpp"
#include "errors.hpp"
#include "thought_tree.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace trellis::mcts {

using tree::NodeId;
using tree::ThoughtNode;
using tree::ThoughtTree;

constexpr double DEFAULT_EXPLORATION_CONSTANT = 1.4142135623730951;  // sqrt(2)

/// Explore doubles the configured constant; exploit drops exploration
constexpr double EXPLORE_MULTIPLIER = 2.0;

// ============================================================================
// Strategy
// ============================================================================

enum class Strategy { Explore, Exploit, Balanced };

inline const char* strategy_name(Strategy s) {
  switch (s) {
    case Strategy::Explore: return "explore";
    case Strategy::Exploit: return "exploit";
    case Strategy::Balanced: return "balanced";
  }
  return "balanced";
}

inline std::optional<Strategy> parse_strategy(const std::string& name) {
  if (name == "explore") return Strategy::Explore;
  if (name == "exploit") return Strategy::Exploit;
  if (name == "balanced") return Strategy::Balanced;
  return std::nullopt;
}

// ============================================================================
// Caller-facing shapes
// ============================================================================

/// Detached copy of a node's public state
struct TreeNodeInfo {
  NodeId node_id;
  int thought_number = 0;
  std::string thought;
  int depth = 0;
  int visit_count = 0;
  double average_value = 0.0;
  size_t child_count = 0;
  bool is_terminal = false;
};

struct TreeStats {
  size_t total_nodes = 0;
  int max_depth = 0;
  size_t unexplored_count = 0;  ///< visit_count == 0
  double average_value = 0.0;   ///< Mean average value over visited nodes
  size_t terminal_count = 0;
};

struct Suggestion {
  TreeNodeInfo node;
  double ucb1_score = 0.0;  ///< +inf for unvisited nodes
};

struct SuggestResult {
  std::optional<Suggestion> suggestion;  ///< nullopt when every node is terminal
  std::vector<Suggestion> alternatives;  ///< Descending by score
  Strategy strategy = Strategy::Balanced;
  std::optional<TreeStats> tree_stats;  ///< Attached by ThoughtTreeManager
};

inline void to_json(nlohmann::json& j, const TreeNodeInfo& n) {
  j = nlohmann::json{
      {"nodeId", n.node_id},
      {"thoughtNumber", n.thought_number},
      {"thought", n.thought},
      {"depth", n.depth},
      {"visitCount", n.visit_count},
      {"averageValue", n.average_value},
      {"childCount", n.child_count},
      {"isTerminal", n.is_terminal},
  };
}

inline void to_json(nlohmann::json& j, const TreeStats& s) {
  j = nlohmann::json{
      {"totalNodes", s.total_nodes},
      {"maxDepth", s.max_depth},
      {"unexploredCount", s.unexplored_count},
      {"averageValue", s.average_value},
      {"terminalCount", s.terminal_count},
  };
}

// JSON has no infinity; unvisited nodes serialize with "ucb1Score": null
inline void to_json(nlohmann::json& j, const Suggestion& s) {
  j = nlohmann::json(s.node);
  if (std::isfinite(s.ucb1_score)) {
    j["ucb1Score"] = s.ucb1_score;
  } else {
    j["ucb1Score"] = nullptr;
    j["unexplored"] = true;
  }
}

inline void to_json(nlohmann::json& j, const SuggestResult& r) {
  j = nlohmann::json{
      {"suggestion", nullptr},
      {"alternatives", r.alternatives},
      {"strategy", strategy_name(r.strategy)},
  };
  if (r.suggestion) j["suggestion"] = *r.suggestion;
  if (r.tree_stats) j["treeStats"] = *r.tree_stats;
}

// ============================================================================
// UCB1
// ============================================================================

/**
 * UCB1 score
 *
 * @param visits N(n)
 * @param total_value W(n)
 * @param parent_visits N(parent); below 1 the exploration term is 0
 * @param c Exploration constant
 * @return +inf when visits == 0
 */
inline double compute_ucb1(int visits, double total_value, int parent_visits,
                           double c) {
  if (visits <= 0) {
    return std::numeric_limits<double>::infinity();
  }
  double exploitation = total_value / visits;
  if (parent_visits < 1) {
    return exploitation;
  }
  double exploration =
      c * std::sqrt(std::log(static_cast<double>(parent_visits)) / visits);
  return exploitation + exploration;
}

// ============================================================================
// MCTSEngine
// ============================================================================

class MCTSEngine {
public:
  explicit MCTSEngine(double exploration_constant = DEFAULT_EXPLORATION_CONSTANT)
      : c_(exploration_constant) {}

  double exploration_constant() const { return c_; }

  /// Effective constant for a strategy
  double effective_constant(Strategy s) const {
    switch (s) {
      case Strategy::Explore: return c_ * EXPLORE_MULTIPLIER;
      case Strategy::Exploit: return 0.0;
      case Strategy::Balanced: return c_;
    }
    return c_;
  }

  /**
   * Add one visit and `score` to every node from `node_id` up to the root
   *
   * @return Nodes updated (depth + 1)
   * @throws TreeError if `node_id` is absent
   */
  size_t backpropagate(ThoughtTree& tree, const NodeId& node_id, double score) const {
    ThoughtNode* node = tree.get_node(node_id);
    if (!node) {
      throw TreeError("Node not found: " + node_id, {{"nodeId", node_id}});
    }
    TimestampMs now = tree.now();
    size_t updated = 0;
    while (node) {
      node->visit_count++;
      node->total_value += score;
      node->last_touched = now;
      ++updated;
      node = node->parent_id ? tree.get_node(*node->parent_id) : nullptr;
    }
    tree.touch();
    return updated;
  }

  /**
   * Rank every expandable node by UCB1
   *
   * Each node uses its parent's visit count (the root uses its own). Ties
   * keep admission order.
   */
  SuggestResult suggest_next(const ThoughtTree& tree, Strategy strategy) const {
    SuggestResult result;
    result.strategy = strategy;
    double c = effective_constant(strategy);

    std::vector<Suggestion> scored;
    for (const ThoughtNode* node : tree.get_expandable_nodes()) {
      int parent_visits = node->visit_count;
      if (node->parent_id) {
        if (const ThoughtNode* parent = tree.get_node(*node->parent_id)) {
          parent_visits = parent->visit_count;
        }
      }
      scored.push_back(Suggestion{
          to_node_info(*node),
          compute_ucb1(node->visit_count, node->total_value, parent_visits, c)});
    }
    if (scored.empty()) {
      return result;
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const Suggestion& a, const Suggestion& b) {
                       return a.ucb1_score > b.ucb1_score;
                     });
    result.suggestion = std::move(scored.front());
    result.alternatives.assign(std::make_move_iterator(scored.begin() + 1),
                               std::make_move_iterator(scored.end()));
    return result;
  }

  /**
   * Root-to-leaf path following the highest-average child
   *
   * Ties go to the earliest child. Empty for an empty tree.
   */
  std::vector<const ThoughtNode*> extract_best_path(const ThoughtTree& tree) const {
    std::vector<const ThoughtNode*> path;
    const ThoughtNode* node = tree.root();
    while (node) {
      path.push_back(node);
      const ThoughtNode* best = nullptr;
      for (const ThoughtNode* child : tree.get_children(node->id)) {
        if (!best || child->average_value() > best->average_value()) {
          best = child;
        }
      }
      node = best;
    }
    return path;
  }

  TreeStats get_tree_stats(const ThoughtTree& tree) const {
    TreeStats stats;
    double value_sum = 0.0;
    size_t visited = 0;
    for (const ThoughtNode* node : tree.get_all_nodes()) {
      stats.total_nodes++;
      stats.max_depth = std::max(stats.max_depth, node->depth);
      if (node->visit_count == 0) {
        stats.unexplored_count++;
      } else {
        value_sum += node->average_value();
        ++visited;
      }
      if (node->is_terminal) stats.terminal_count++;
    }
    stats.average_value = visited > 0 ? value_sum / visited : 0.0;
    return stats;
  }

  static TreeNodeInfo to_node_info(const ThoughtNode& node) {
    return TreeNodeInfo{
        node.id,
        node.thought_number(),
        node.record.thought,
        node.depth,
        node.visit_count,
        node.average_value(),
        node.children.size(),
        node.is_terminal,
    };
  }

  static std::vector<TreeNodeInfo> to_node_infos(
      const std::vector<const ThoughtNode*>& nodes) {
    std::vector<TreeNodeInfo> out;
    out.reserve(nodes.size());
    for (const ThoughtNode* node : nodes) out.push_back(to_node_info(*node));
    return out;
  }

private:
  double c_;
};

}  // namespace trellis::mcts
