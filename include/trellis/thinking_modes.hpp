#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file thinking_modes.hpp
 * @brief Per-session thinking presets and the guidance derived from them
 *
 * A session may carry one ThinkingModeConfig (fast, expert or deep). After
 * every admitted thought, ModeEngine reads the tree and produces ModeGuidance:
 * which phase the session is in, what to do next, and a rendered prompt.
 *
 * Action precedence:
 *   1. conclude   converged, fast mode at target depth, or (no convergence
 *                 threshold and depth at target)
 *   2. continue   tree has no cursor
 *   3. backtrack  cursor scored below threshold and an ancestor can take
 *                 another branch
 *   4. branch     cursor below branching cap, not terminal, deep enough
 *   5. evaluate   unevaluated leaves exist and the mode does not auto-evaluate
 *   6. continue
 *
 * Perspective suggestions accompany evaluate recommendations and any tree
 * with two or more open (non-terminal) nodes.
 */

#include "common.hpp"
#include "mcts.hpp"
#include "thought_tree.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace trellis::modes {

using mcts::MCTSEngine;
using mcts::Strategy;
using mcts::TreeNodeInfo;
using mcts::TreeStats;
using tree::ThoughtNode;
using tree::ThoughtTree;

enum class ThinkingMode { Fast, Expert, Deep };

inline const char* mode_name(ThinkingMode m) {
  switch (m) {
    case ThinkingMode::Fast: return "fast";
    case ThinkingMode::Expert: return "expert";
    case ThinkingMode::Deep: return "deep";
  }
  return "expert";
}

inline std::optional<ThinkingMode> parse_mode(const std::string& name) {
  if (name == "fast") return ThinkingMode::Fast;
  if (name == "expert") return ThinkingMode::Expert;
  if (name == "deep") return ThinkingMode::Deep;
  return std::nullopt;
}

struct ThinkingModeConfig {
  ThinkingMode mode = ThinkingMode::Expert;
  double exploration_constant = mcts::DEFAULT_EXPLORATION_CONSTANT;
  Strategy suggest_strategy = Strategy::Balanced;
  int max_branching_factor = 3;
  int target_depth_min = 5;
  int target_depth_max = 10;
  bool auto_evaluate = false;
  double auto_eval_value = 0.0;
  bool enable_backtracking = true;
  double backtrack_threshold = 0.4;
  int min_evaluations_before_converge = 3;
  double convergence_threshold = 0.7;  ///< 0 disables convergence tracking
  int progress_overview_interval = 4;
  size_t max_thought_display_length = 250;
  bool enable_critique = true;
  std::optional<int> branch_min_depth = 2;  ///< nullopt: never suggest branching
  bool use_mcts_for_branching = false;
};

inline ThinkingModeConfig get_preset(ThinkingMode mode) {
  ThinkingModeConfig c;
  c.mode = mode;
  switch (mode) {
    case ThinkingMode::Fast:
      c.exploration_constant = 0.5;
      c.suggest_strategy = Strategy::Exploit;
      c.max_branching_factor = 1;
      c.target_depth_min = 3;
      c.target_depth_max = 5;
      c.auto_evaluate = true;
      c.auto_eval_value = 0.7;
      c.enable_backtracking = false;
      c.backtrack_threshold = 0.0;
      c.min_evaluations_before_converge = 0;
      c.convergence_threshold = 0.0;
      c.progress_overview_interval = 3;
      c.max_thought_display_length = 150;
      c.enable_critique = false;
      c.branch_min_depth = std::nullopt;
      c.use_mcts_for_branching = false;
      break;
    case ThinkingMode::Expert:
      break;  // member defaults
    case ThinkingMode::Deep:
      c.exploration_constant = 2.0;
      c.suggest_strategy = Strategy::Explore;
      c.max_branching_factor = 5;
      c.target_depth_min = 10;
      c.target_depth_max = 20;
      c.backtrack_threshold = 0.5;
      c.min_evaluations_before_converge = 5;
      c.convergence_threshold = 0.85;
      c.progress_overview_interval = 5;
      c.max_thought_display_length = 300;
      c.branch_min_depth = 0;
      c.use_mcts_for_branching = true;
      break;
  }
  return c;
}

inline void to_json(nlohmann::json& j, const ThinkingModeConfig& c) {
  j = nlohmann::json{
      {"mode", mode_name(c.mode)},
      {"explorationConstant", c.exploration_constant},
      {"suggestStrategy", mcts::strategy_name(c.suggest_strategy)},
      {"maxBranchingFactor", c.max_branching_factor},
      {"targetDepthMin", c.target_depth_min},
      {"targetDepthMax", c.target_depth_max},
      {"autoEvaluate", c.auto_evaluate},
      {"autoEvalValue", c.auto_eval_value},
      {"enableBacktracking", c.enable_backtracking},
      {"backtrackThreshold", c.backtrack_threshold},
      {"minEvaluationsBeforeConverge", c.min_evaluations_before_converge},
      {"convergenceThreshold", c.convergence_threshold},
      {"progressOverviewInterval", c.progress_overview_interval},
      {"maxThoughtDisplayLength", c.max_thought_display_length},
      {"enableCritique", c.enable_critique},
      {"branchMinDepth", nullptr},
      {"useMCTSForBranching", c.use_mcts_for_branching},
  };
  if (c.branch_min_depth) j["branchMinDepth"] = *c.branch_min_depth;
}

// ============================================================================
// Guidance
// ============================================================================

enum class Phase { Exploring, Evaluating, Converging, Concluded };
enum class Action { Continue, Branch, Evaluate, Backtrack, Conclude };

inline const char* phase_name(Phase p) {
  switch (p) {
    case Phase::Exploring: return "exploring";
    case Phase::Evaluating: return "evaluating";
    case Phase::Converging: return "converging";
    case Phase::Concluded: return "concluded";
  }
  return "exploring";
}

inline const char* action_name(Action a) {
  switch (a) {
    case Action::Continue: return "continue";
    case Action::Branch: return "branch";
    case Action::Evaluate: return "evaluate";
    case Action::Backtrack: return "backtrack";
    case Action::Conclude: return "conclude";
  }
  return "continue";
}

struct ConvergenceStatus {
  bool is_converged = false;
  double score = 0.0;
  double best_path_value = 0.0;
};

struct BranchingSuggestion {
  tree::NodeId from_node_id;
  std::string reason;
};

struct BacktrackSuggestion {
  tree::NodeId to_node_id;
  int depth = 0;
  std::string reason;
};

struct PerspectiveSuggestion {
  std::string perspective;
  std::string description;
};

struct ModeGuidance {
  ThinkingMode mode = ThinkingMode::Expert;
  Phase phase = Phase::Exploring;
  Action recommended_action = Action::Continue;
  std::string reasoning;
  int target_total_thoughts = 0;
  std::optional<ConvergenceStatus> convergence;
  std::optional<BranchingSuggestion> branching;
  std::optional<BacktrackSuggestion> backtrack;
  std::string thought_prompt;
  std::optional<std::string> progress_overview;
  std::optional<std::string> critique;
  std::optional<double> confidence_score;  ///< Cursor's assessed confidence
  std::vector<PerspectiveSuggestion> perspective_suggestions;
};

inline void to_json(nlohmann::json& j, const ModeGuidance& g) {
  j = nlohmann::json{
      {"mode", mode_name(g.mode)},
      {"currentPhase", phase_name(g.phase)},
      {"recommendedAction", action_name(g.recommended_action)},
      {"reasoning", g.reasoning},
      {"targetTotalThoughts", g.target_total_thoughts},
      {"convergenceStatus", nullptr},
      {"branchingSuggestion", nullptr},
      {"backtrackSuggestion", nullptr},
      {"thoughtPrompt", g.thought_prompt},
      {"progressOverview", nullptr},
      {"critique", nullptr},
      {"confidenceScore", nullptr},
  };
  nlohmann::json perspectives = nlohmann::json::array();
  for (const auto& p : g.perspective_suggestions) {
    perspectives.push_back({{"perspective", p.perspective},
                            {"description", p.description}});
  }
  j["perspectiveSuggestions"] = std::move(perspectives);
  if (g.convergence) {
    j["convergenceStatus"] = {{"isConverged", g.convergence->is_converged},
                              {"score", g.convergence->score},
                              {"bestPathValue", g.convergence->best_path_value}};
  }
  if (g.branching) {
    j["branchingSuggestion"] = {{"shouldBranch", true},
                                {"fromNodeId", g.branching->from_node_id},
                                {"reason", g.branching->reason}};
  }
  if (g.backtrack) {
    j["backtrackSuggestion"] = {{"shouldBacktrack", true},
                                {"toNodeId", g.backtrack->to_node_id},
                                {"reason", g.backtrack->reason}};
  }
  if (g.progress_overview) j["progressOverview"] = *g.progress_overview;
  if (g.critique) j["critique"] = *g.critique;
  if (g.confidence_score) j["confidenceScore"] = *g.confidence_score;
}

// ============================================================================
// Text helpers
// ============================================================================

namespace detail {

inline std::string fixed2(double v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.2f", v);
  return buf;
}

struct Perspective {
  const char* name;
  const char* description;
};

inline const std::vector<Perspective>& perspectives() {
  static const std::vector<Perspective> table = {
      {"optimist", "What are the best possible outcomes and opportunities?"},
      {"pessimist", "What could go wrong and what are the risks?"},
      {"expert", "What would a domain expert immediately recognize?"},
      {"beginner", "What basic questions might someone new ask?"},
      {"skeptic", "What assumptions might be wrong?"},
  };
  return table;
}

/**
 * Angles to try next
 *
 * Empty unless `stuck` or `attempts >= 2`. Returns min(attempts + 1, 5)
 * entries, starting at table position `attempts % 5` and wrapping, so
 * successive calls rotate through the table.
 */
inline std::vector<PerspectiveSuggestion> suggest_perspectives(bool stuck,
                                                               size_t attempts) {
  std::vector<PerspectiveSuggestion> out;
  if (!stuck && attempts < 2) return out;
  const auto& table = perspectives();
  size_t count = std::min(attempts + 1, table.size());
  for (size_t i = 0; i < count; ++i) {
    const Perspective& p = table[(attempts + i) % table.size()];
    out.push_back({p.name, p.description});
  }
  return out;
}

/// Shortest round-trip form ("0.7", "1.4142135623730951")
inline std::string number(double v) { return nlohmann::json(v).dump(); }

inline std::string word_cut(const std::string& text, size_t max_len) {
  size_t cutoff = max_len > 3 ? max_len - 3 : 0;
  size_t space = cutoff > 0 ? text.rfind(' ', cutoff) : std::string::npos;
  size_t at = (space != std::string::npos && space > 0) ? space : cutoff;
  return utf8_prefix(text, at) + "...";
}

/// Split after '.', '!' or '?' followed by whitespace
inline std::vector<std::string> split_sentences(const std::string& text) {
  std::vector<std::string> out;
  size_t start = 0;
  for (size_t i = 0; i + 1 < text.size(); ++i) {
    char c = text[i];
    if ((c == '.' || c == '!' || c == '?') &&
        std::isspace(static_cast<unsigned char>(text[i + 1]))) {
      out.push_back(text.substr(start, i + 1 - start));
      size_t j = i + 1;
      while (j < text.size() && std::isspace(static_cast<unsigned char>(text[j]))) ++j;
      start = j;
      i = j - 1;
    }
  }
  if (start < text.size()) out.push_back(text.substr(start));
  return out;
}

/**
 * Shorten `text` to at most `max_len` bytes
 *
 * Prefers "first [...] last" sentence, then "first [...]", then a word
 * boundary cut with "...".
 */
inline std::string compress_thought(const std::string& text, size_t max_len) {
  if (text.size() <= max_len) return text;

  auto sentences = split_sentences(text);
  if (sentences.size() < 2) return word_cut(text, max_len);

  const std::string& first = sentences.front();
  std::string combined = first + " [...] " + sentences.back();
  if (combined.size() <= max_len) return combined;

  std::string first_only = first + " [...]";
  if (first_only.size() <= max_len) return first_only;

  return word_cut(first, max_len);
}

inline std::string first_sentence(const std::string& text) {
  for (size_t i = 1; i < text.size(); ++i) {
    char c = text[i];
    if (c == '\n') break;
    if ((c == '.' || c == '!' || c == '?') &&
        (i + 1 == text.size() || std::isspace(static_cast<unsigned char>(text[i + 1])))) {
      return text.substr(0, i + 1);
    }
  }
  if (text.size() <= 50) return text;
  return word_cut(text, 50);
}

/// Replace every {{name}} with params[name] (unknown names render empty)
inline std::string render_template(
    const std::string& tmpl,
    const std::unordered_map<std::string, std::string>& params) {
  std::string out;
  out.reserve(tmpl.size() + 64);
  size_t pos = 0;
  while (pos < tmpl.size()) {
    size_t open = tmpl.find("{{", pos);
    if (open == std::string::npos) break;
    size_t close = tmpl.find("}}", open + 2);
    if (close == std::string::npos) break;
    out.append(tmpl, pos, open - pos);
    auto it = params.find(tmpl.substr(open + 2, close - open - 2));
    if (it != params.end()) out += it->second;
    pos = close + 2;
  }
  out.append(tmpl, pos, std::string::npos);
  return out;
}

inline const std::string& template_for(ThinkingMode mode, Action action) {
  static const std::unordered_map<std::string, std::string> templates = {
      {"fast_continue",
       "Step {{thoughtNumber}} of ~{{targetDepthMax}}. Build on: \"{{currentThought}}\". "
       "Next logical step; no alternatives, stay linear."},
      {"fast_conclude",
       "Reached target depth ({{currentDepth}}/{{targetDepthMax}}). Synthesize your "
       "{{totalNodes}} steps into a direct, concise answer."},
      {"fast_evaluate",
       "Assess quality at step {{thoughtNumber}} (depth {{currentDepth}}/{{targetDepthMax}}). "
       "Current value: {{cursorValue}}."},

      {"expert_continue",
       "Step {{thoughtNumber}}, depth {{currentDepth}}/{{targetDepthMax}}. {{unexploredCount}} "
       "paths unexplored. Building on: \"{{currentThought}}\". What follows logically?"},
      {"expert_branch",
       "Decision point at node {{branchFromNodeId}}. {{branchCount}}/{{maxBranches}} "
       "perspectives explored. Current path: \"{{currentThought}}\". Branch with a "
       "different angle, method, or assumption."},
      {"expert_evaluate",
       "{{unexploredCount}} paths need scoring. Use evaluate_thought to rate quality and "
       "guide exploration. Best path so far: {{bestPathSummary}}."},
      {"expert_backtrack",
       "Path scoring {{cursorValue}} is below threshold. Backtrack to node "
       "{{backtrackToNodeId}} (depth {{backtrackDepth}}). What assumption led astray?"},
      {"expert_conclude",
       "Convergence reached (score {{convergenceScore}}, threshold {{convergenceThreshold}}). "
       "Best path: {{bestPathSummary}}. Synthesize the strongest path into a final answer."},

      {"deep_continue",
       "Depth {{currentDepth}}/{{targetDepthMax}}, {{totalNodes}} nodes, {{unexploredCount}} "
       "unscored. Building on: \"{{currentThought}}\". What nuance, edge case, or deeper "
       "implication?"},
      {"deep_branch",
       "{{branchCount}}/{{maxBranches}} alternatives explored from node {{branchFromNodeId}}. "
       "Branch with a contrarian, lateral, or adversarial perspective on: "
       "\"{{currentThought}}\"."},
      {"deep_evaluate",
       "{{unexploredCount}} paths unscored across {{leafCount}} leaves. Score before "
       "convergence check. Best path: {{bestPathSummary}}."},
      {"deep_backtrack",
       "Path scoring {{cursorValue}}. Backtrack to node {{backtrackToNodeId}} (depth "
       "{{backtrackDepth}}). Find the weakest link in the reasoning and explore the opposite."},
      {"deep_conclude",
       "Deep convergence (score {{convergenceScore}}, threshold {{convergenceThreshold}}, "
       "{{totalNodes}} nodes). Summarize findings, address counterarguments, and state "
       "confidence level."},
  };
  static const std::string fallback =
      "{{recommendedAction}} at step {{thoughtNumber}} (depth "
      "{{currentDepth}}/{{targetDepthMax}}). {{totalNodes}} nodes explored.";

  auto it = templates.find(std::string(mode_name(mode)) + "_" + action_name(action));
  return it != templates.end() ? it->second : fallback;
}

}  // namespace detail

// ============================================================================
// ModeEngine
// ============================================================================

class ModeEngine {
public:
  /// Score to backpropagate onto each new node, if the mode auto-evaluates
  static std::optional<double> auto_eval_value(const ThinkingModeConfig& config) {
    if (!config.auto_evaluate) return std::nullopt;
    return config.auto_eval_value;
  }

  /**
   * Derive guidance from the current tree
   *
   * @param stats Stats already computed by the caller (computed here if absent)
   */
  ModeGuidance generate_guidance(const ThinkingModeConfig& config,
                                 const ThoughtTree& tree, const MCTSEngine& engine,
                                 std::optional<TreeStats> stats = std::nullopt) const {
    TreeStats st = stats ? *stats : engine.get_tree_stats(tree);
    auto best_path = MCTSEngine::to_node_infos(engine.extract_best_path(tree));
    int current_depth = st.max_depth;
    size_t evaluated = st.total_nodes - st.unexplored_count;

    ModeGuidance g;
    g.mode = config.mode;
    g.target_total_thoughts = config.target_depth_max;
    g.convergence = convergence_status(config, best_path, evaluated);
    g.phase = determine_phase(config, current_depth, evaluated, g.convergence);
    determine_action(config, tree, engine, current_depth, g);

    auto params = template_params(config, tree, st, best_path, g);
    params["recommendedAction"] = action_name(g.recommended_action);
    g.thought_prompt = detail::render_template(
        detail::template_for(config.mode, g.recommended_action), params);

    g.progress_overview = progress_overview(config, tree, st, best_path);
    g.critique = critique(config, tree, st, best_path);
    if (const ThoughtNode* cursor = tree.cursor()) {
      g.confidence_score = cursor->confidence;
    }
    g.perspective_suggestions = detail::suggest_perspectives(
        g.recommended_action == Action::Evaluate, st.total_nodes - st.terminal_count);
    return g;
  }

private:
  static std::optional<ConvergenceStatus> convergence_status(
      const ThinkingModeConfig& config, const std::vector<TreeNodeInfo>& best_path,
      size_t evaluated) {
    if (config.convergence_threshold == 0.0) return std::nullopt;

    ConvergenceStatus cs;
    cs.best_path_value = best_path.empty() ? 0.0 : best_path.back().average_value;

    // Mean over visited nodes, scaled by the visited share of the path
    double sum = 0.0;
    size_t visited = 0;
    for (const auto& n : best_path) {
      if (n.visit_count > 0) {
        sum += n.average_value;
        ++visited;
      }
    }
    if (visited > 0) {
      cs.score = (sum / visited) *
                 (static_cast<double>(visited) / static_cast<double>(best_path.size()));
    }
    cs.is_converged =
        evaluated >= static_cast<size_t>(config.min_evaluations_before_converge) &&
        cs.score >= config.convergence_threshold;
    return cs;
  }

  static Phase determine_phase(const ThinkingModeConfig& config, int depth,
                               size_t evaluated,
                               const std::optional<ConvergenceStatus>& cs) {
    if (cs && cs->is_converged) return Phase::Concluded;
    if (config.mode == ThinkingMode::Fast && depth >= config.target_depth_max) {
      return Phase::Concluded;
    }
    if (config.convergence_threshold > 0 &&
        evaluated >= static_cast<size_t>(config.min_evaluations_before_converge)) {
      return Phase::Converging;
    }
    if (evaluated > 0 && depth >= config.target_depth_min) return Phase::Evaluating;
    return Phase::Exploring;
  }

  static void determine_action(const ThinkingModeConfig& config, const ThoughtTree& tree,
                               const MCTSEngine& engine, int depth, ModeGuidance& g) {
    bool concluded = g.phase == Phase::Concluded ||
                     (config.convergence_threshold == 0.0 &&
                      depth >= config.target_depth_max);
    if (concluded) {
      std::string info =
          g.convergence
              ? " (score: " + detail::fixed2(g.convergence->score) +
                    ", threshold: " + detail::number(config.convergence_threshold) + ")"
              : " (" + std::to_string(depth) + "/" +
                    std::to_string(config.target_depth_max) + ")";
      g.recommended_action = Action::Conclude;
      g.reasoning = "Target reached" + info + ". " + mode_name(config.mode) +
                    " mode: conclude.";
      return;
    }

    const ThoughtNode* cursor = tree.cursor();
    if (!cursor) {
      g.recommended_action = Action::Continue;
      g.reasoning = "No cursor; submit a thought to begin.";
      return;
    }

    if (check_backtrack(config, tree, *cursor, depth, g)) return;
    if (check_branch(config, tree, engine, *cursor, depth, g)) return;

    if (!config.auto_evaluate) {
      size_t unevaluated = 0;
      for (const ThoughtNode* leaf : tree.get_leaf_nodes()) {
        if (leaf->visit_count == 0) ++unevaluated;
      }
      if (unevaluated > 0) {
        g.recommended_action = Action::Evaluate;
        g.reasoning = std::to_string(unevaluated) +
                      " leaf node(s) unevaluated. Score them to guide exploration.";
        return;
      }
    }

    g.recommended_action = Action::Continue;
    g.reasoning = std::string(mode_name(config.mode)) +
                  " mode: continue exploring (depth " + std::to_string(depth) + "/" +
                  std::to_string(config.target_depth_max) + ").";
  }

  static bool check_backtrack(const ThinkingModeConfig& config, const ThoughtTree& tree,
                              const ThoughtNode& cursor, int depth, ModeGuidance& g) {
    if (!config.enable_backtracking || config.backtrack_threshold <= 0) return false;
    if (cursor.visit_count == 0) return false;

    double avg = cursor.average_value();
    bool eligible = !cursor.children.empty() || depth > 1;
    if (avg >= config.backtrack_threshold || !eligible) return false;

    auto path = tree.get_ancestor_path(cursor.id);
    if (path.size() <= 1) return false;

    const ThoughtNode* target = nullptr;
    for (size_t i = path.size() - 1; i-- > 0;) {
      if (path[i]->children.size() > 1 || !path[i]->is_terminal) {
        target = path[i];
        break;
      }
    }
    if (!target) target = path.front();

    g.recommended_action = Action::Backtrack;
    g.reasoning = "Current path scoring " + detail::fixed2(avg) + " (threshold " +
                  detail::number(config.backtrack_threshold) +
                  "). Backtrack to explore alternatives.";
    g.backtrack = BacktrackSuggestion{
        target->id, target->depth,
        "Node at depth " + std::to_string(target->depth) +
            " has better potential for branching."};
    return true;
  }

  static bool check_branch(const ThinkingModeConfig& config, const ThoughtTree& tree,
                           const MCTSEngine& engine, const ThoughtNode& cursor,
                           int depth, ModeGuidance& g) {
    auto children = static_cast<int>(cursor.children.size());
    if (children >= config.max_branching_factor || cursor.is_terminal) return false;
    if (!config.branch_min_depth || depth < *config.branch_min_depth) return false;

    tree::NodeId from = cursor.id;
    if (config.use_mcts_for_branching) {
      auto s = engine.suggest_next(tree, config.suggest_strategy);
      if (s.suggestion) from = s.suggestion->node.node_id;
    }

    g.recommended_action = Action::Branch;
    g.reasoning = std::string(mode_name(config.mode)) + " mode: " +
                  std::to_string(children) + "/" +
                  std::to_string(config.max_branching_factor) +
                  " branches explored. Consider alternative approaches.";
    g.branching = BranchingSuggestion{
        from, "Node has capacity for " +
                  std::to_string(config.max_branching_factor - children) +
                  " more branches."};
    return true;
  }

  static std::unordered_map<std::string, std::string> template_params(
      const ThinkingModeConfig& config, const ThoughtTree& tree, const TreeStats& st,
      const std::vector<TreeNodeInfo>& best_path, const ModeGuidance& g) {
    size_t max_len = config.max_thought_display_length;
    std::unordered_map<std::string, std::string> p;

    const ThoughtNode* cursor = tree.cursor();
    int cursor_depth = cursor ? cursor->depth : 0;
    p["thoughtNumber"] = std::to_string(cursor ? cursor->thought_number() : 0);
    p["currentDepth"] = std::to_string(cursor_depth);
    p["branchCount"] = std::to_string(cursor ? cursor->children.size() : 0);
    p["currentThought"] =
        cursor ? detail::compress_thought(cursor->record.thought, max_len) : "(none)";
    p["cursorValue"] = (cursor && cursor->visit_count > 0)
                           ? detail::fixed2(cursor->average_value())
                           : "unscored";

    std::string parent_thought = "(root)";
    if (cursor && cursor->parent_id) {
      if (const ThoughtNode* parent = tree.get_node(*cursor->parent_id)) {
        parent_thought = detail::compress_thought(parent->record.thought, max_len);
      }
    }
    p["parentThought"] = parent_thought;

    p["targetDepthMin"] = std::to_string(config.target_depth_min);
    p["targetDepthMax"] = std::to_string(config.target_depth_max);
    p["totalNodes"] = std::to_string(st.total_nodes);
    p["unexploredCount"] = std::to_string(st.unexplored_count);
    p["leafCount"] = std::to_string(tree.get_leaf_nodes().size());
    p["terminalCount"] = std::to_string(st.terminal_count);
    p["progress"] = config.target_depth_max > 0
                        ? detail::fixed2(static_cast<double>(cursor_depth) /
                                         config.target_depth_max)
                        : "0.00";
    p["bestPathValue"] =
        best_path.empty() ? "0.00" : detail::fixed2(best_path.back().average_value);
    p["convergenceScore"] = g.convergence ? detail::fixed2(g.convergence->score) : "N/A";
    p["maxBranches"] = std::to_string(config.max_branching_factor);
    p["convergenceThreshold"] = detail::number(config.convergence_threshold);

    std::string summary;
    for (const auto& n : best_path) {
      if (!summary.empty()) summary += " -> ";
      summary += std::to_string(n.thought_number);
    }
    p["bestPathSummary"] = summary.empty() ? "(none)" : summary;

    p["branchFromNodeId"] = g.branching ? g.branching->from_node_id : "";
    p["backtrackToNodeId"] = g.backtrack ? g.backtrack->to_node_id : "";
    p["backtrackDepth"] = std::to_string(g.backtrack ? g.backtrack->depth : 0);
    return p;
  }

  static std::optional<std::string> progress_overview(
      const ThinkingModeConfig& config, const ThoughtTree& tree, const TreeStats& st,
      const std::vector<TreeNodeInfo>& best_path) {
    auto interval = static_cast<size_t>(std::max(config.progress_overview_interval, 0));
    if (interval == 0 || st.total_nodes == 0 || st.total_nodes % interval != 0) {
      return std::nullopt;
    }

    size_t evaluated = st.total_nodes - st.unexplored_count;
    std::string summary;
    size_t single_child = 0;
    for (const auto& n : best_path) {
      if (!summary.empty()) summary += " → ";
      summary += detail::first_sentence(n.thought);
      if (n.child_count == 1) ++single_child;
    }
    if (summary.empty()) summary = "(none)";
    std::string score =
        best_path.empty() ? "0.00" : detail::fixed2(best_path.back().average_value);

    return "PROGRESS [" + std::to_string(st.total_nodes) + " thoughts, depth " +
           std::to_string(st.max_depth) + "/" + std::to_string(config.target_depth_max) +
           "]: Evaluated " + std::to_string(evaluated) + "/" +
           std::to_string(st.total_nodes) + " | Leaves " +
           std::to_string(tree.get_leaf_nodes().size()) + " | Terminal " +
           std::to_string(st.terminal_count) + ".\nBest path (score " + score +
           "): " + summary + ".\nGaps: " + std::to_string(st.unexplored_count) +
           " unscored, " + std::to_string(single_child) +
           " single-child branch points to expand.";
  }

  static std::optional<std::string> critique(const ThinkingModeConfig& config,
                                             const ThoughtTree& tree, const TreeStats& st,
                                             const std::vector<TreeNodeInfo>& best_path) {
    if (!config.enable_critique || best_path.size() < 2) return std::nullopt;

    const TreeNodeInfo* weakest = nullptr;
    for (const auto& n : best_path) {
      if (n.visit_count > 0 && (!weakest || n.average_value < weakest->average_value)) {
        weakest = &n;
      }
    }

    size_t unchallenged = 0;
    for (size_t i = 1; i < best_path.size(); ++i) {
      const ThoughtNode* parent = tree.get_node(best_path[i - 1].node_id);
      if (parent && parent->children.size() == 1) ++unchallenged;
    }

    size_t total_children = 0;
    for (const auto& n : best_path) total_children += n.child_count;
    size_t theoretical =
        best_path.size() * static_cast<size_t>(std::max(config.max_branching_factor, 0));
    long coverage = theoretical > 0
                        ? std::lround(100.0 * static_cast<double>(total_children) /
                                      static_cast<double>(theoretical))
                        : 0;

    double balance = st.total_nodes > 0 ? static_cast<double>(best_path.size()) /
                                              static_cast<double>(st.total_nodes)
                                        : 0.0;
    const char* balance_label =
        balance > 0.8 ? "one-sided" : (balance > 0.5 ? "moderate" : "well-balanced");

    std::string weakest_info =
        weakest ? "Weakest: step " + std::to_string(weakest->thought_number) + " (score " +
                      detail::fixed2(weakest->average_value) + "): \"" +
                      detail::compress_thought(weakest->thought, 60) + "\"."
                : "Weakest: N/A (no scored nodes).";

    return "CRITIQUE: " + weakest_info + "\nUnchallenged: " + std::to_string(unchallenged) +
           "/" + std::to_string(best_path.size() - 1) +
           " steps have no alternatives. Coverage: " + std::to_string(total_children) +
           "/" + std::to_string(theoretical) + " branches (" + std::to_string(coverage) +
           "%).\nBalance: " + balance_label + ", " +
           std::to_string(std::lround(balance * 100)) + "% of nodes on best path.";
  }
};

}  // namespace trellis::modes
