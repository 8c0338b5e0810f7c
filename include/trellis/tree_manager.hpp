#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file tree_manager.hpp
 * @brief Per-session thought trees, thinking modes and their MCTS verbs
 *
 * ThoughtTreeManager is the registry of session id -> {ThoughtTree, mode}.
 * Trees are created on the first recorded thought (or on set_mode) and live
 * until one of:
 * - the SessionTracker evicts the session (on_eviction subscription)
 * - cleanup() finds the tree idle longer than `max_tree_age_ms`
 * - more than MAX_CONCURRENT_TREES trees exist (least recently used go)
 *
 * Verbs addressing a session without a tree throw TreeError.
 *
 * Thread safety: all public methods are safe to call concurrently. The
 * SessionTracker passed at construction must be destroyed before (or
 * outlive) the manager, since it holds callbacks into it.
 */

#include "common.hpp"
#include "confidence.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "mcts.hpp"
#include "session_tracker.hpp"
#include "thinking_modes.hpp"
#include "thought.hpp"
#include "thought_tree.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace trellis::tree {

using mcts::MCTSEngine;
using mcts::TreeNodeInfo;
using mcts::TreeStats;
using modes::ModeGuidance;
using modes::ThinkingMode;
using modes::ThinkingModeConfig;

constexpr size_t MAX_CONCURRENT_TREES = 100;

// ===== Results =====

struct RecordResult {
  NodeId node_id;
  std::optional<NodeId> parent_node_id;
  TreeStats tree_stats;
  std::optional<ModeGuidance> mode_guidance;  ///< Only when a mode is set
};

struct BacktrackResult {
  TreeNodeInfo node;
  std::vector<TreeNodeInfo> children;
  TreeStats tree_stats;
};

struct EvaluateResult {
  NodeId node_id;
  int new_visit_count = 0;
  double new_average_value = 0.0;
  size_t nodes_updated = 0;
  TreeStats tree_stats;
};

struct ThinkingSummary {
  std::vector<TreeNodeInfo> best_path;
  std::optional<TreeNodeView> tree_structure;
  TreeStats tree_stats;
};

inline void to_json(nlohmann::json& j, const RecordResult& r) {
  j = nlohmann::json{
      {"nodeId", r.node_id},
      {"parentNodeId", nullptr},
      {"treeStats", r.tree_stats},
  };
  if (r.parent_node_id) j["parentNodeId"] = *r.parent_node_id;
  if (r.mode_guidance) j["modeGuidance"] = *r.mode_guidance;
}

inline void to_json(nlohmann::json& j, const BacktrackResult& r) {
  j = nlohmann::json{
      {"node", r.node},
      {"children", r.children},
      {"treeStats", r.tree_stats},
  };
}

inline void to_json(nlohmann::json& j, const EvaluateResult& r) {
  j = nlohmann::json{
      {"nodeId", r.node_id},
      {"newVisitCount", r.new_visit_count},
      {"newAverageValue", r.new_average_value},
      {"nodesUpdated", r.nodes_updated},
      {"treeStats", r.tree_stats},
  };
}

inline void to_json(nlohmann::json& j, const ThinkingSummary& s) {
  j = nlohmann::json{
      {"bestPath", s.best_path},
      {"treeStructure", nullptr},
      {"treeStats", s.tree_stats},
  };
  if (s.tree_structure) j["treeStructure"] = *s.tree_structure;
}

// ============================================================================
// ThoughtTreeManager
// ============================================================================

class ThoughtTreeManager {
public:
  /**
   * @param config Tree capacity, age limit, exploration constant, auto-tree
   * @param tracker Optional; eviction and periodic cleanup follow its sweep
   * @param assessor Optional; defaults to KeywordConfidenceAssessor
   * @param clock Time source shared with every tree
   */
  explicit ThoughtTreeManager(MctsConfig config,
                              session::SessionTracker* tracker = nullptr,
                              std::shared_ptr<const ConfidenceAssessor> assessor = nullptr,
                              ClockFn clock = system_clock())
      : config_(config),
        engine_(config.exploration_constant),
        assessor_(assessor ? std::move(assessor)
                           : std::make_shared<KeywordConfidenceAssessor>()),
        clock_(std::move(clock)) {
    if (tracker) {
      tracker->on_eviction([this](const std::vector<std::string>& ids) { evict(ids); });
      tracker->on_periodic_cleanup([this]() { cleanup(); });
    }
  }

  ThoughtTreeManager(const ThoughtTreeManager&) = delete;
  ThoughtTreeManager& operator=(const ThoughtTreeManager&) = delete;

  /**
   * Place a stored record in its session's tree
   *
   * Scores the new node with the confidence assessor, backpropagates the
   * mode's auto-evaluation value when it has one, then generates guidance
   * from a single stats computation.
   *
   * @return nullopt when auto-tree is off or the record has no session id
   */
  std::optional<RecordResult> record_thought(const ThoughtRecord& record) {
    if (!config_.enable_auto_tree) return std::nullopt;
    if (!record.session_id || record.session_id->empty()) return std::nullopt;

    std::lock_guard<std::mutex> lock(mu_);
    Session& s = get_or_create_locked(*record.session_id);
    ThoughtTree& tree = *s.tree;

    std::optional<double> previous;
    std::vector<std::string> context;
    if (const ThoughtNode* prev = tree.cursor()) previous = prev->confidence;
    for (const ThoughtNode* n : tree.get_all_nodes()) context.push_back(n->record.thought);

    const NodeId id = tree.add_thought(record).id;
    ThoughtNode* node = tree.get_node(id);

    ConfidenceResult conf = assessor_->assess(record.thought, context, previous);
    node->confidence = conf.confidence;

    MCTSEngine engine = engine_for(s);
    if (s.mode) {
      node->strategy = mcts::strategy_name(s.mode->suggest_strategy);
      if (auto value = modes::ModeEngine::auto_eval_value(*s.mode)) {
        engine.backpropagate(tree, id, *value);
      }
    }

    RecordResult result;
    result.node_id = id;
    result.parent_node_id = node->parent_id;
    result.tree_stats = engine.get_tree_stats(tree);
    if (s.mode) {
      result.mode_guidance =
          mode_engine_.generate_guidance(*s.mode, tree, engine, result.tree_stats);
    }

    TRELLIS_LOG_DEBUG("[tree::record] session '%s' node %s depth %d confidence %.2f",
                      record.session_id->c_str(), id.c_str(), node->depth,
                      conf.confidence);
    return result;
  }

  /// Move the cursor to `node_id`
  BacktrackResult backtrack(const std::string& session_id, const NodeId& node_id) {
    std::lock_guard<std::mutex> lock(mu_);
    Session& s = get_locked(session_id);
    const ThoughtNode& node = s.tree->set_cursor(node_id);

    BacktrackResult r;
    r.node = MCTSEngine::to_node_info(node);
    r.children = MCTSEngine::to_node_infos(s.tree->get_children(node_id));
    r.tree_stats = engine_.get_tree_stats(*s.tree);
    return r;
  }

  /// Backpropagate `value` from `node_id` to the root
  EvaluateResult evaluate(const std::string& session_id, const NodeId& node_id,
                          double value) {
    std::lock_guard<std::mutex> lock(mu_);
    Session& s = get_locked(session_id);

    EvaluateResult r;
    r.node_id = node_id;
    r.nodes_updated = engine_.backpropagate(*s.tree, node_id, value);
    const ThoughtNode* node = s.tree->get_node(node_id);
    r.new_visit_count = node->visit_count;
    r.new_average_value = node->average_value();
    r.tree_stats = engine_.get_tree_stats(*s.tree);
    return r;
  }

  /**
   * Rank expandable nodes
   *
   * @param strategy Defaults to the session mode's strategy, else balanced
   */
  mcts::SuggestResult suggest(const std::string& session_id,
                              std::optional<mcts::Strategy> strategy = std::nullopt) {
    std::lock_guard<std::mutex> lock(mu_);
    Session& s = get_locked(session_id);
    mcts::Strategy chosen =
        strategy.value_or(s.mode ? s.mode->suggest_strategy : mcts::Strategy::Balanced);

    MCTSEngine engine = engine_for(s);
    mcts::SuggestResult r = engine.suggest_next(*s.tree, chosen);
    r.tree_stats = engine.get_tree_stats(*s.tree);
    return r;
  }

  ThinkingSummary get_summary(const std::string& session_id,
                              std::optional<int> max_depth = std::nullopt) {
    std::lock_guard<std::mutex> lock(mu_);
    Session& s = get_locked(session_id);

    ThinkingSummary summary;
    summary.best_path = MCTSEngine::to_node_infos(engine_.extract_best_path(*s.tree));
    summary.tree_structure = s.tree->to_view(max_depth);
    summary.tree_stats = engine_.get_tree_stats(*s.tree);
    return summary;
  }

  /// Attach a preset to the session, creating its tree if needed
  ThinkingModeConfig set_mode(const std::string& session_id, ThinkingMode mode) {
    std::lock_guard<std::mutex> lock(mu_);
    Session& s = get_or_create_locked(session_id);
    s.mode = modes::get_preset(mode);
    TRELLIS_LOG_INFO("[tree::set_mode] session '%s' -> %s", session_id.c_str(),
                     modes::mode_name(mode));
    return *s.mode;
  }

  std::optional<ThinkingModeConfig> get_mode(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return std::nullopt;
    return it->second.mode;
  }

  /// nullopt if the session has no tree or no node carries `thought_number`
  std::optional<TreeNodeInfo> find_node_by_thought_number(const std::string& session_id,
                                                          int thought_number) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return std::nullopt;
    const ThoughtNode* node = it->second.tree->find_node_by_thought_number(thought_number);
    if (!node) return std::nullopt;
    return MCTSEngine::to_node_info(*node);
  }

  bool has_tree(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    return sessions_.count(session_id) > 0;
  }

  size_t tree_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return sessions_.size();
  }

  /**
   * Drop trees idle longer than `max_tree_age_ms`, then the least recently
   * used above MAX_CONCURRENT_TREES
   *
   * @return Number of trees removed
   */
  size_t cleanup() {
    std::lock_guard<std::mutex> lock(mu_);
    TimestampMs now = clock_();
    size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      if (now - it->second.tree->last_accessed() > config_.max_tree_age_ms) {
        it = sessions_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    removed += evict_lru_locked(MAX_CONCURRENT_TREES);
    if (removed > 0) {
      TRELLIS_LOG_INFO("[tree::cleanup] Removed %zu tree(s), %zu remain", removed,
                       sessions_.size());
    }
    return removed;
  }

  /// Forget the given sessions' trees and modes
  void evict(const std::vector<std::string>& session_ids) {
    std::lock_guard<std::mutex> lock(mu_);
    for (const auto& id : session_ids) sessions_.erase(id);
  }

  void destroy() {
    std::lock_guard<std::mutex> lock(mu_);
    sessions_.clear();
  }

  const MctsConfig& config() const { return config_; }

private:
  struct Session {
    std::unique_ptr<ThoughtTree> tree;
    std::optional<ThinkingModeConfig> mode;
  };

  // The session's mode sets its exploration constant
  MCTSEngine engine_for(const Session& s) const {
    return s.mode ? MCTSEngine(s.mode->exploration_constant) : engine_;
  }

  Session& get_or_create_locked(const std::string& session_id) {
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
      it->second.tree->touch();
      return it->second;
    }
    evict_lru_locked(MAX_CONCURRENT_TREES - 1);
    Session& s = sessions_[session_id];
    s.tree = std::make_unique<ThoughtTree>(session_id, config_.max_nodes_per_tree, clock_);
    TRELLIS_LOG_DEBUG("[tree::create] session '%s' (%zu tree(s))", session_id.c_str(),
                      sessions_.size());
    return s;
  }

  Session& get_locked(const std::string& session_id) {
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      throw TreeError("No thought tree found for session: " + session_id,
                      {{"sessionId", session_id}});
    }
    it->second.tree->touch();
    return it->second;
  }

  size_t evict_lru_locked(size_t keep) {
    if (sessions_.size() <= keep) return 0;
    std::vector<std::pair<TimestampMs, std::string>> by_age;
    by_age.reserve(sessions_.size());
    for (const auto& [id, s] : sessions_) by_age.emplace_back(s.tree->last_accessed(), id);
    std::sort(by_age.begin(), by_age.end());

    size_t excess = sessions_.size() - keep;
    for (size_t i = 0; i < excess; ++i) sessions_.erase(by_age[i].second);
    return excess;
  }

  MctsConfig config_;
  MCTSEngine engine_;
  modes::ModeEngine mode_engine_;
  std::shared_ptr<const ConfidenceAssessor> assessor_;
  ClockFn clock_;

  mutable std::mutex mu_;
  std::unordered_map<std::string, Session> sessions_;
};

}  // namespace trellis::tree
