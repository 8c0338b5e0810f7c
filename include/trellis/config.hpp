#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file config.hpp
 * @brief Named limits for every component, with documented defaults
 *
 * Three sources, applied in this order by callers that want all of them:
 * 1. Defaults (the member initializers below)
 * 2. Config::from_json(): a document of the same shape as to_json()
 * 3. Config::from_env(): environment overrides
 *
 * JSON shape:
 *
 *   {
 *     "state":      {"maxHistorySize": 1000, "maxBranchAge": 3600000, ...},
 *     "security":   {"maxThoughtsPerMinute": 60, "blockedPatterns": [...]},
 *     "session":    {"sweepInterval": 60000, "expiry": 3600000},
 *     "mcts":       {"maxNodesPerTree": 500, "maxTreeAge": 3600000,
 *                    "explorationConstant": 1.414, "enableAutoTree": true},
 *     "logging":    {"level": "warn", "thoughtLogging": true},
 *     "monitoring": {"maxResponseTime": 200, "maxStoragePercent": 80,
 *                    "errorRateDegraded": 2, "errorRateUnhealthy": 5}
 *   }
 */

#include "common.hpp"
#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

namespace trellis {

struct StateConfig {
  int64_t max_history_size = 1000;
  int64_t max_branch_age_ms = 3600000;
  int64_t max_thought_length = 5000;
  int64_t max_thoughts_per_branch = 100;
  int64_t cleanup_interval_ms = 300000;  ///< 0 disables branch-age cleanup
};

inline std::vector<std::string> default_blocked_patterns() {
  return {
      "<script[^>]*>.*?</script>",
      "javascript:",
      "data:text/html",
      "eval\\s*\\(",
      "function\\s*\\(",
      "document\\.",
      "window\\.",
      "\\.php",
      "\\.exe",
      "\\.bat",
      "\\.cmd",
  };
}

struct SecurityConfig {
  int64_t max_thoughts_per_minute = 60;
  /// Case-insensitive regular expressions; malformed entries are skipped
  std::vector<std::string> blocked_patterns = default_blocked_patterns();
};

struct SessionConfig {
  int64_t sweep_interval_ms = 60000;  ///< 0 disables the idle sweep
  int64_t expiry_ms = 3600000;
};

struct MctsConfig {
  int64_t max_nodes_per_tree = 500;
  int64_t max_tree_age_ms = 3600000;
  double exploration_constant = 1.4142135623730951;
  bool enable_auto_tree = true;
};

struct LoggingConfig {
  log::Level level = log::Level::Warn;
  bool thought_logging = true;
};

struct MonitoringConfig {
  double max_response_time_ms = 200.0;
  double max_storage_percent = 80.0;
  double error_rate_degraded = 2.0;   ///< percent
  double error_rate_unhealthy = 5.0;  ///< percent
};

namespace detail {

inline const char* env_or_null(const char* name) {
  const char* v = std::getenv(name);
  return (v && *v) ? v : nullptr;
}

/// Unparseable values leave `out` untouched
inline void env_int(const char* name, int64_t& out) {
  const char* v = env_or_null(name);
  if (!v) return;
  char* end = nullptr;
  long long parsed = std::strtoll(v, &end, 10);
  if (end == v || *end != '\0') {
    TRELLIS_LOG_WARN("[config::from_env] Ignoring non-integer %s='%s'", name, v);
    return;
  }
  out = static_cast<int64_t>(parsed);
}

inline void env_double(const char* name, double& out) {
  const char* v = env_or_null(name);
  if (!v) return;
  char* end = nullptr;
  double parsed = std::strtod(v, &end);
  if (end == v || *end != '\0' || !std::isfinite(parsed)) {
    TRELLIS_LOG_WARN("[config::from_env] Ignoring non-numeric %s='%s'", name, v);
    return;
  }
  out = parsed;
}

inline bool env_true(const char* name) {
  const char* v = env_or_null(name);
  return v && std::string(v) == "true";
}

inline std::vector<std::string> split_patterns(const std::string& csv) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= csv.size()) {
    size_t comma = csv.find(',', start);
    if (comma == std::string::npos) comma = csv.size();
    std::string item = csv.substr(start, comma - start);
    size_t b = item.find_first_not_of(" \t");
    size_t e = item.find_last_not_of(" \t");
    if (b != std::string::npos) {
      out.push_back(item.substr(b, e - b + 1));
    }
    start = comma + 1;
  }
  return out;
}

template <typename T>
void json_field(const nlohmann::json& section, const char* key, T& out) {
  auto it = section.find(key);
  if (it == section.end() || it->is_null()) return;
  try {
    out = it->get<T>();
  } catch (const nlohmann::json::exception&) {
    throw ValidationError(std::string("Configuration field '") + key +
                              "' has the wrong type",
                          {{"field", key}});
  }
}

inline const nlohmann::json& json_section(const nlohmann::json& doc,
                                          const char* name) {
  static const nlohmann::json empty = nlohmann::json::object();
  auto it = doc.find(name);
  if (it == doc.end() || it->is_null()) return empty;
  if (!it->is_object()) {
    throw ValidationError(std::string("Configuration section '") + name +
                          "' must be an object");
  }
  return *it;
}

inline void check_range(const char* field, double value, double lo, double hi) {
  if (!(value >= lo && value <= hi)) {
    throw ValidationError(std::string(field) + " must be between " +
                              std::to_string(lo) + " and " + std::to_string(hi),
                          {{"field", field}, {"value", value}});
  }
}

inline void check_non_negative(const char* field, double value) {
  if (!(value >= 0)) {
    throw ValidationError(std::string(field) + " must be non-negative",
                          {{"field", field}, {"value", value}});
  }
}

}  // namespace detail

struct Config {
  StateConfig state;
  SecurityConfig security;
  SessionConfig session;
  MctsConfig mcts;
  LoggingConfig logging;
  MonitoringConfig monitoring;

  /**
   * Apply environment overrides on top of `base`
   *
   * Unparseable numbers keep the value from `base`. Call validate() on the
   * result before use.
   */
  static Config from_env(Config base = Config{}) {
    Config c = std::move(base);
    detail::env_int("MAX_HISTORY_SIZE", c.state.max_history_size);
    detail::env_int("MAX_BRANCH_AGE", c.state.max_branch_age_ms);
    detail::env_int("MAX_THOUGHT_LENGTH", c.state.max_thought_length);
    detail::env_int("MAX_THOUGHTS_PER_BRANCH", c.state.max_thoughts_per_branch);
    detail::env_int("CLEANUP_INTERVAL", c.state.cleanup_interval_ms);

    detail::env_int("MAX_THOUGHTS_PER_MIN", c.security.max_thoughts_per_minute);
    if (const char* v = detail::env_or_null("BLOCKED_PATTERNS")) {
      c.security.blocked_patterns = detail::split_patterns(v);
    }

    detail::env_int("SESSION_SWEEP_INTERVAL", c.session.sweep_interval_ms);
    detail::env_int("SESSION_EXPIRY", c.session.expiry_ms);

    detail::env_int("MCTS_MAX_NODES", c.mcts.max_nodes_per_tree);
    detail::env_int("MCTS_MAX_TREE_AGE", c.mcts.max_tree_age_ms);
    detail::env_double("MCTS_EXPLORATION_CONSTANT", c.mcts.exploration_constant);
    if (detail::env_true("MCTS_DISABLE_AUTO_TREE")) {
      c.mcts.enable_auto_tree = false;
    }

    if (const char* v = detail::env_or_null("LOG_LEVEL")) {
      c.logging.level = log::parse_level(v, c.logging.level);
    }
    if (detail::env_true("DISABLE_THOUGHT_LOGGING")) {
      c.logging.thought_logging = false;
    }

    detail::env_double("HEALTH_MAX_RESPONSE_TIME", c.monitoring.max_response_time_ms);
    detail::env_double("HEALTH_MAX_STORAGE", c.monitoring.max_storage_percent);
    detail::env_double("HEALTH_ERROR_RATE_DEGRADED", c.monitoring.error_rate_degraded);
    detail::env_double("HEALTH_ERROR_RATE_UNHEALTHY", c.monitoring.error_rate_unhealthy);
    return c;
  }

  /**
   * Read a configuration document; missing keys keep defaults
   *
   * @throws ValidationError if a section is not an object or a field is mistyped
   */
  static Config from_json(const nlohmann::json& doc) {
    if (!doc.is_object()) {
      throw ValidationError("Configuration document must be a JSON object");
    }
    Config c;

    const auto& state = detail::json_section(doc, "state");
    detail::json_field(state, "maxHistorySize", c.state.max_history_size);
    detail::json_field(state, "maxBranchAge", c.state.max_branch_age_ms);
    detail::json_field(state, "maxThoughtLength", c.state.max_thought_length);
    detail::json_field(state, "maxThoughtsPerBranch", c.state.max_thoughts_per_branch);
    detail::json_field(state, "cleanupInterval", c.state.cleanup_interval_ms);

    const auto& security = detail::json_section(doc, "security");
    detail::json_field(security, "maxThoughtsPerMinute",
                       c.security.max_thoughts_per_minute);
    detail::json_field(security, "blockedPatterns", c.security.blocked_patterns);

    const auto& session = detail::json_section(doc, "session");
    detail::json_field(session, "sweepInterval", c.session.sweep_interval_ms);
    detail::json_field(session, "expiry", c.session.expiry_ms);

    const auto& mcts = detail::json_section(doc, "mcts");
    detail::json_field(mcts, "maxNodesPerTree", c.mcts.max_nodes_per_tree);
    detail::json_field(mcts, "maxTreeAge", c.mcts.max_tree_age_ms);
    detail::json_field(mcts, "explorationConstant", c.mcts.exploration_constant);
    detail::json_field(mcts, "enableAutoTree", c.mcts.enable_auto_tree);

    const auto& logging = detail::json_section(doc, "logging");
    std::string level = log::level_name(c.logging.level);
    detail::json_field(logging, "level", level);
    c.logging.level = log::parse_level(level, c.logging.level);
    detail::json_field(logging, "thoughtLogging", c.logging.thought_logging);

    const auto& monitoring = detail::json_section(doc, "monitoring");
    detail::json_field(monitoring, "maxResponseTime", c.monitoring.max_response_time_ms);
    detail::json_field(monitoring, "maxStoragePercent", c.monitoring.max_storage_percent);
    detail::json_field(monitoring, "errorRateDegraded", c.monitoring.error_rate_degraded);
    detail::json_field(monitoring, "errorRateUnhealthy", c.monitoring.error_rate_unhealthy);
    return c;
  }

  /**
   * Enforce documented ranges
   *
   * @throws ValidationError naming the first out-of-range field
   */
  void validate() const {
    detail::check_range("maxHistorySize", static_cast<double>(state.max_history_size), 1, 10000);
    detail::check_non_negative("maxBranchAge", static_cast<double>(state.max_branch_age_ms));
    detail::check_range("maxThoughtLength", static_cast<double>(state.max_thought_length), 1, 100000);
    detail::check_range("maxThoughtsPerBranch",
                        static_cast<double>(state.max_thoughts_per_branch), 1, 10000);
    detail::check_non_negative("cleanupInterval", static_cast<double>(state.cleanup_interval_ms));

    detail::check_range("maxThoughtsPerMinute",
                        static_cast<double>(security.max_thoughts_per_minute), 1, 1000);

    detail::check_non_negative("sweepInterval", static_cast<double>(session.sweep_interval_ms));
    detail::check_non_negative("expiry", static_cast<double>(session.expiry_ms));

    detail::check_range("maxNodesPerTree", static_cast<double>(mcts.max_nodes_per_tree), 1, 100000);
    detail::check_non_negative("maxTreeAge", static_cast<double>(mcts.max_tree_age_ms));
    detail::check_range("explorationConstant", mcts.exploration_constant, 0, 10);

    detail::check_non_negative("maxResponseTime", monitoring.max_response_time_ms);
    detail::check_range("maxStoragePercent", monitoring.max_storage_percent, 0, 100);
    detail::check_range("errorRateDegraded", monitoring.error_rate_degraded, 0, 100);
    detail::check_range("errorRateUnhealthy", monitoring.error_rate_unhealthy, 0, 100);
  }

  nlohmann::json to_json() const {
    return {
        {"state",
         {{"maxHistorySize", state.max_history_size},
          {"maxBranchAge", state.max_branch_age_ms},
          {"maxThoughtLength", state.max_thought_length},
          {"maxThoughtsPerBranch", state.max_thoughts_per_branch},
          {"cleanupInterval", state.cleanup_interval_ms}}},
        {"security",
         {{"maxThoughtsPerMinute", security.max_thoughts_per_minute},
          {"blockedPatterns", security.blocked_patterns}}},
        {"session",
         {{"sweepInterval", session.sweep_interval_ms},
          {"expiry", session.expiry_ms}}},
        {"mcts",
         {{"maxNodesPerTree", mcts.max_nodes_per_tree},
          {"maxTreeAge", mcts.max_tree_age_ms},
          {"explorationConstant", mcts.exploration_constant},
          {"enableAutoTree", mcts.enable_auto_tree}}},
        {"logging",
         {{"level", log::level_name(logging.level)},
          {"thoughtLogging", logging.thought_logging}}},
        {"monitoring",
         {{"maxResponseTime", monitoring.max_response_time_ms},
          {"maxStoragePercent", monitoring.max_storage_percent},
          {"errorRateDegraded", monitoring.error_rate_degraded},
          {"errorRateUnhealthy", monitoring.error_rate_unhealthy}}},
    };
  }
};

}  // namespace trellis
