#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file service.hpp
 * @brief ThinkingService: the composed registry behind every verb
 *
 * One ThinkingService owns one instance of each component and wires them:
 *
 *   SessionTracker ──► SecureThoughtSecurity   (rate windows)
 *         │
 *         └──────────► ThoughtTreeManager      (eviction, periodic cleanup)
 *   SecureThoughtStorage ─► BasicMetricsCollector ─► HealthChecker
 *
 * Submission order:
 *   validate shape -> resolve session -> sanitize -> blocked patterns and
 *   rate limit -> store -> tree -> metrics
 *
 * Every verb is timed and recorded as a request, successful or not. Errors
 * propagate as trellis::Error; dispatch() converts them to the JSON error
 * envelope for transports.
 *
 * Example usage:
 *
 *   trellis::ThinkingService service(trellis::Config::from_env());
 *
 *   trellis::ThoughtRecord t;
 *   t.thought = "Start from the constraints";
 *   t.thought_number = 1;
 *   t.total_thoughts = 3;
 *   t.session_id = "s1";
 *   auto r = service.submit_thought(t);
 *
 *   service.evaluate_node("s1", r.tree->node_id, 0.8);
 *   auto next = service.suggest_next("s1", trellis::mcts::Strategy::Balanced);
 */

#include "common.hpp"
#include "confidence.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "health.hpp"
#include "history.hpp"
#include "mcts.hpp"
#include "metrics.hpp"
#include "security.hpp"
#include "session_tracker.hpp"
#include "thinking_modes.hpp"
#include "thought.hpp"
#include "tree_manager.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cmath>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace trellis {

struct SubmitResult {
  int thought_number = 0;
  int total_thoughts = 0;
  bool next_thought_needed = true;
  std::vector<std::string> branches;
  size_t history_length = 0;
  std::string session_id;
  TimestampMs timestamp_ms = 0;
  std::optional<tree::RecordResult> tree;  ///< nullopt when auto-tree is off
};

/// Tree fields are merged into the top level
inline void to_json(nlohmann::json& j, const SubmitResult& r) {
  j = nlohmann::json{
      {"thoughtNumber", r.thought_number},
      {"totalThoughts", r.total_thoughts},
      {"nextThoughtNeeded", r.next_thought_needed},
      {"branches", r.branches},
      {"thoughtHistoryLength", r.history_length},
      {"sessionId", r.session_id},
      {"timestamp", r.timestamp_ms},
  };
  if (r.tree) j.update(nlohmann::json(*r.tree));
}

class ThinkingService {
public:
  /**
   * @param config Validated here; a bad config throws ValidationError
   * @param clock Time source for every component
   * @param assessor Confidence scorer for tree nodes (keyword-based if null)
   */
  explicit ThinkingService(Config config = Config{}, ClockFn clock = system_clock(),
                           std::shared_ptr<const ConfidenceAssessor> assessor = nullptr)
      : config_(validated(std::move(config))),
        tracker_(config_.session, clock),
        security_(config_.security, tracker_),
        storage_(config_.state, clock),
        trees_(config_.mcts, &tracker_, std::move(assessor), clock),
        metrics_(storage_, tracker_, clock),
        health_(metrics_, storage_, security_, config_.monitoring, clock) {
    log::set_level(config_.logging.level);
    TRELLIS_LOG_INFO("[service::init] history=%lld trees=%s maxNodes=%lld rate=%lld/min",
                     static_cast<long long>(config_.state.max_history_size),
                     config_.mcts.enable_auto_tree ? "on" : "off",
                     static_cast<long long>(config_.mcts.max_nodes_per_tree),
                     static_cast<long long>(config_.security.max_thoughts_per_minute));
  }

  ~ThinkingService() { destroy(); }

  ThinkingService(const ThinkingService&) = delete;
  ThinkingService& operator=(const ThinkingService&) = delete;

  // ===== Verbs =====

  /**
   * Admit one thought
   *
   * The caller's record is not modified. Nothing is stored when any check
   * fails.
   *
   * @throws ValidationError malformed record
   * @throws SecurityError bad session id, blocked content, rate limit
   */
  SubmitResult submit_thought(const ThoughtRecord& input) {
    return timed([&] {
      validate_thought_record(input, max_thought_length());

      std::string session_id = resolve_session(input.session_id);
      std::string sanitized = security_.sanitize_content(input.thought);
      security_.validate_thought(sanitized, session_id);

      ThoughtRecord record = input;
      record.thought = std::move(sanitized);
      record.session_id = session_id;
      ThoughtRecord stored = storage_.add_thought(record);

      SubmitResult r;
      r.thought_number = stored.thought_number;
      r.total_thoughts = stored.total_thoughts;
      r.next_thought_needed = stored.next_thought_needed;
      r.branches = storage_.get_branches();
      r.history_length = storage_.get_stats().history_size;
      r.session_id = session_id;
      r.timestamp_ms = stored.timestamp_ms.value_or(0);
      r.tree = trees_.record_thought(stored);

      if (config_.logging.thought_logging) log_thought(stored);
      metrics_.record_thought_processed(stored);
      return r;
    });
  }

  tree::BacktrackResult backtrack(const std::string& session_id, const tree::NodeId& node_id) {
    return timed([&] { return trees_.backtrack(session_id, node_id); });
  }

  /// @throws ValidationError if `score` is not finite
  tree::EvaluateResult evaluate_node(const std::string& session_id,
                                     const tree::NodeId& node_id, double score) {
    return timed([&] {
      if (!std::isfinite(score)) {
        throw ValidationError("value must be a finite number", {{"nodeId", node_id}});
      }
      return trees_.evaluate(session_id, node_id, score);
    });
  }

  mcts::SuggestResult suggest_next(const std::string& session_id,
                                   std::optional<mcts::Strategy> strategy = std::nullopt) {
    return timed([&] { return trees_.suggest(session_id, strategy); });
  }

  tree::ThinkingSummary get_summary(const std::string& session_id,
                                    std::optional<int> max_depth = std::nullopt) {
    return timed([&] { return trees_.get_summary(session_id, max_depth); });
  }

  /// @throws ValidationError for a mode name other than fast, expert or deep
  modes::ThinkingModeConfig set_thinking_mode(const std::string& session_id,
                                              const std::string& mode) {
    return timed([&] {
      auto parsed = modes::parse_mode(mode);
      if (!parsed) {
        throw ValidationError("Unknown thinking mode: " + mode + " (expected fast, expert or deep)",
                              {{"mode", mode}});
      }
      if (!security_.validate_session(session_id)) {
        throw SecurityError("Invalid session ID format: must be 1-100 characters",
                            {{"length", session_id.size()}});
      }
      return trees_.set_mode(session_id, *parsed);
    });
  }

  /// Whole history, or one session's, most recent `limit`
  std::vector<ThoughtRecord> get_history(const std::optional<std::string>& session_id = std::nullopt,
                                         std::optional<size_t> limit = std::nullopt) {
    return timed([&] {
      if (session_id) return storage_.get_session_history(*session_id, limit);
      return storage_.get_history(limit);
    });
  }

  history::StorageStats get_stats() {
    return timed([&] { return storage_.get_stats(); });
  }

  metrics::MetricsSnapshot get_metrics() const { return metrics_.get_metrics(); }

  health::HealthReport get_health() const { return health_.check(); }

  // ===== Wire dispatch =====

  /**
   * Run a verb by wire name with camelCase JSON arguments
   *
   * @return The verb's result, or an error envelope with `"isError": true`
   *         for trellis::Error and malformed arguments
   */
  nlohmann::json dispatch(const std::string& verb, const nlohmann::json& args) {
    try {
      return run_verb(verb, args.is_null() ? nlohmann::json::object() : args);
    } catch (const Error& e) {
      return envelope(e);
    } catch (const nlohmann::json::exception& e) {
      return envelope(ValidationError(std::string("Invalid arguments: ") + e.what()));
    }
  }

  // ===== Lifecycle =====

  /// Stop background work and release every component; idempotent
  void destroy() {
    if (destroyed_) return;
    destroyed_ = true;
    // Tracker first: its sweep calls into the tree manager
    tracker_.destroy();
    storage_.destroy();
    trees_.destroy();
    metrics_.destroy();
    TRELLIS_LOG_DEBUG("[service::destroy] done");
  }

  const Config& config() const { return config_; }
  session::SessionTracker& tracker() { return tracker_; }
  tree::ThoughtTreeManager& trees() { return trees_; }
  history::SecureThoughtStorage& storage() { return storage_; }

private:
  static Config validated(Config c) {
    c.validate();
    return c;
  }

  size_t max_thought_length() const {
    return static_cast<size_t>(config_.state.max_thought_length);
  }

  std::string resolve_session(const std::optional<std::string>& supplied) const {
    if (supplied) {
      if (!security_.validate_session(*supplied)) {
        throw SecurityError("Invalid session ID format: must be 1-100 characters (got " +
                                std::to_string(supplied->size()) + ")",
                            {{"length", supplied->size()}});
      }
      return *supplied;
    }
    return security_.generate_session_id();
  }

  template <typename F>
  auto timed(F&& fn) -> decltype(fn()) {
    auto start = std::chrono::steady_clock::now();
    auto elapsed_ms = [&start] {
      return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start)
          .count();
    };
    try {
      auto result = fn();
      metrics_.record_request(elapsed_ms(), true);
      return result;
    } catch (const std::exception&) {
      metrics_.record_request(elapsed_ms(), false);
      throw;
    }
  }

  static void log_thought(const ThoughtRecord& t) {
    std::string context;
    switch (t.role()) {
      case ThoughtRole::Branch:
        context = " (branch " + t.branch_id.value_or("") + " from " +
                  std::to_string(t.branch_from_thought.value_or(0)) + ")";
        break;
      case ThoughtRole::Revision:
        context = " (revision of " + std::to_string(t.revises_thought.value_or(0)) + ")";
        break;
      case ThoughtRole::Plain:
        break;
    }
    TRELLIS_LOG_INFO("[Thought %d/%d]%s session=%s", t.thought_number, t.total_thoughts,
                     context.c_str(), t.session_id.value_or("").c_str());
  }

  static nlohmann::json envelope(const Error& e) {
    nlohmann::json j = e.to_json();
    j["isError"] = true;
    return j;
  }

  static std::string required_string(const nlohmann::json& args, const char* key) {
    auto v = detail::string_field(args, key);
    if (!v || v->empty()) {
      throw ValidationError(std::string(key) + " is required", {{"field", key}});
    }
    return *v;
  }

  static std::optional<int64_t> optional_count(const nlohmann::json& args, const char* key) {
    auto it = args.find(key);
    if (it == args.end() || it->is_null()) return std::nullopt;
    if (!it->is_number_integer() || it->get<int64_t>() < 0) {
      throw ValidationError(std::string(key) + " must be a non-negative integer",
                            {{"field", key}});
    }
    return it->get<int64_t>();
  }

  nlohmann::json run_verb(const std::string& verb, const nlohmann::json& args) {
    if (verb == "sequentialthinking") {
      ThoughtRecord record;
      try {
        record = parse_thought(args, max_thought_length());
      } catch (const Error&) {
        metrics_.record_request(0.0, false);
        throw;
      }
      return submit_thought(record);
    }
    if (verb == "backtrack") {
      return backtrack(required_string(args, "sessionId"), required_string(args, "nodeId"));
    }
    if (verb == "evaluate_thought") {
      auto it = args.find("value");
      if (it == args.end() || !it->is_number()) {
        throw ValidationError("value must be a number", {{"field", "value"}});
      }
      return evaluate_node(required_string(args, "sessionId"), required_string(args, "nodeId"),
                           it->get<double>());
    }
    if (verb == "suggest_next_thought") {
      std::optional<mcts::Strategy> strategy;
      if (auto name = detail::string_field(args, "strategy")) {
        strategy = mcts::parse_strategy(*name);
        if (!strategy) {
          throw ValidationError("strategy must be one of explore, exploit, balanced",
                                {{"strategy", *name}});
        }
      }
      return suggest_next(required_string(args, "sessionId"), strategy);
    }
    if (verb == "get_thinking_summary") {
      std::optional<int> max_depth;
      if (auto d = optional_count(args, "maxDepth")) max_depth = static_cast<int>(*d);
      return get_summary(required_string(args, "sessionId"), max_depth);
    }
    if (verb == "set_thinking_mode") {
      return set_thinking_mode(required_string(args, "sessionId"), required_string(args, "mode"));
    }
    if (verb == "get_history") {
      std::optional<size_t> limit;
      if (auto l = optional_count(args, "limit")) limit = static_cast<size_t>(*l);
      return get_history(detail::string_field(args, "sessionId"), limit);
    }
    if (verb == "get_stats") return get_stats();
    if (verb == "get_metrics") return get_metrics();
    if (verb == "health") return get_health();

    throw ValidationError("Unknown tool: " + verb, {{"tool", verb}});
  }

  Config config_;

  // Declaration order is construction order
  session::SessionTracker tracker_;
  security::SecureThoughtSecurity security_;
  history::SecureThoughtStorage storage_;
  tree::ThoughtTreeManager trees_;
  metrics::BasicMetricsCollector metrics_;
  health::HealthChecker health_;

  bool destroyed_ = false;
};

}  // namespace trellis
