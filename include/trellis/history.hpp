#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file history.hpp
 * @brief Authoritative linear thought history, bounded by count and age
 *
 * Two layers:
 * - BoundedThoughtManager: the main CircularBuffer of records plus one
 *   bounded sequence per branch id, with per-session counters. A periodic
 *   cleanup drops branches whose newest thought is older than
 *   `max_branch_age_ms`.
 * - SecureThoughtStorage: the entry point used by the service. Clones each
 *   submitted record, stamps session id / timestamp / total on the clone and
 *   hands the clone to the manager. The caller's record is never touched.
 *
 * The tree (thought_tree.hpp) is an optional structural index over the same
 * stream; history never depends on it.
 *
 * Thread safety: all public methods are safe to call concurrently.
 */

#include "circular_buffer.hpp"
#include "common.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "periodic_task.hpp"
#include "thought.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace trellis::history {

/// Session counters older than this are dropped by cleanup()
constexpr TimestampMs SESSION_STATS_TTL_MS = 3600000;

struct BranchData {
  std::vector<ThoughtRecord> thoughts;
  TimestampMs created_at = 0;
  TimestampMs last_updated = 0;  ///< Time the newest thought was added
};

struct SessionStats {
  int64_t count = 0;
  TimestampMs last_access = 0;
};

struct StorageStats {
  size_t history_size = 0;
  size_t history_capacity = 0;
  size_t branch_count = 0;
  size_t session_count = 0;
  std::optional<ThoughtRecord> oldest_thought;
  std::optional<ThoughtRecord> newest_thought;
};

inline void to_json(nlohmann::json& j, const StorageStats& s) {
  j = nlohmann::json{
      {"historySize", s.history_size},
      {"historyCapacity", s.history_capacity},
      {"branchCount", s.branch_count},
      {"sessionCount", s.session_count},
  };
  if (s.oldest_thought) j["oldestThought"] = *s.oldest_thought;
  if (s.newest_thought) j["newestThought"] = *s.newest_thought;
}

// ============================================================================
// BoundedThoughtManager
// ============================================================================

class BoundedThoughtManager {
public:
  explicit BoundedThoughtManager(StateConfig config, ClockFn clock = system_clock())
      : config_(config),
        clock_(std::move(clock)),
        history_(config.max_history_size) {
    if (config_.cleanup_interval_ms > 0) {
      cleanup_task_ = std::make_unique<PeriodicTask>(
          "branch-cleanup", config_.cleanup_interval_ms, [this]() { cleanup(); });
    }
  }

  ~BoundedThoughtManager() { destroy(); }

  BoundedThoughtManager(const BoundedThoughtManager&) = delete;
  BoundedThoughtManager& operator=(const BoundedThoughtManager&) = delete;

  /**
   * Append a record (oldest evicted on overflow)
   *
   * Records carrying a branch id also go to that branch's sequence, which
   * keeps its newest `max_thoughts_per_branch` entries.
   *
   * @throws ValidationError if the text exceeds `max_thought_length`
   */
  void add_thought(ThoughtRecord thought) {
    if (static_cast<int64_t>(thought.thought.size()) > config_.max_thought_length) {
      throw ValidationError(
          "Thought exceeds maximum length of " +
              std::to_string(config_.max_thought_length) + " characters",
          {{"maxLength", config_.max_thought_length},
           {"actualLength", thought.thought.size()}});
    }

    std::lock_guard<std::mutex> lock(mu_);
    TimestampMs now = clock_();
    if (!thought.timestamp_ms) thought.timestamp_ms = now;

    SessionStats& stats = session_stats_[thought.session_id.value_or("anonymous")];
    stats.count++;
    stats.last_access = now;

    if (thought.branch_id) {
      auto [it, inserted] = branches_.try_emplace(*thought.branch_id);
      BranchData& branch = it->second;
      if (inserted) branch.created_at = now;
      branch.thoughts.push_back(thought);
      branch.last_updated = now;
      trim_branch(branch);
    }

    history_.add(std::move(thought));
  }

  /// Oldest first; `limit` keeps the most recent entries
  std::vector<ThoughtRecord> get_history(std::optional<size_t> limit = std::nullopt) const {
    std::lock_guard<std::mutex> lock(mu_);
    return history_.get_all(limit);
  }

  /// Branch ids, sorted
  std::vector<std::string> get_branches() const {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<std::string> ids;
    ids.reserve(branches_.size());
    for (const auto& [id, branch] : branches_) ids.push_back(id);
    return ids;
  }

  std::optional<BranchData> get_branch(const std::string& branch_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = branches_.find(branch_id);
    if (it == branches_.end()) return std::nullopt;
    return it->second;
  }

  size_t branch_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return branches_.size();
  }

  std::unordered_map<std::string, SessionStats> get_session_stats() const {
    std::lock_guard<std::mutex> lock(mu_);
    return session_stats_;
  }

  StorageStats get_stats() const {
    std::lock_guard<std::mutex> lock(mu_);
    StorageStats s;
    s.history_size = history_.size();
    s.history_capacity = history_.capacity();
    s.branch_count = branches_.size();
    s.session_count = session_stats_.size();
    s.oldest_thought = history_.oldest();
    s.newest_thought = history_.newest();
    return s;
  }

  void clear_history() {
    std::lock_guard<std::mutex> lock(mu_);
    history_.clear();
    branches_.clear();
    session_stats_.clear();
  }

  /**
   * Drop expired branches and stale session counters
   *
   * @return Number of branches removed
   */
  size_t cleanup() {
    std::lock_guard<std::mutex> lock(mu_);
    TimestampMs now = clock_();
    size_t removed = 0;
    for (auto it = branches_.begin(); it != branches_.end();) {
      if (now - it->second.last_updated > config_.max_branch_age_ms) {
        TRELLIS_LOG_DEBUG("[history::cleanup] Dropping expired branch '%s'",
                          it->first.c_str());
        it = branches_.erase(it);
        ++removed;
      } else {
        trim_branch(it->second);
        ++it;
      }
    }

    TimestampMs stats_cutoff = now - SESSION_STATS_TTL_MS;
    for (auto it = session_stats_.begin(); it != session_stats_.end();) {
      if (it->second.last_access < stats_cutoff) {
        it = session_stats_.erase(it);
      } else {
        ++it;
      }
    }
    return removed;
  }

  /// Stop cleanup and release state; idempotent
  void destroy() {
    if (cleanup_task_) cleanup_task_->stop();
    clear_history();
  }

  const StateConfig& config() const { return config_; }

private:
  void trim_branch(BranchData& branch) const {
    auto limit = static_cast<size_t>(config_.max_thoughts_per_branch);
    if (branch.thoughts.size() > limit) {
      branch.thoughts.erase(branch.thoughts.begin(),
                            branch.thoughts.end() - static_cast<std::ptrdiff_t>(limit));
    }
  }

  StateConfig config_;
  ClockFn clock_;

  mutable std::mutex mu_;
  CircularBuffer<ThoughtRecord> history_;
  std::map<std::string, BranchData> branches_;
  std::unordered_map<std::string, SessionStats> session_stats_;

  std::unique_ptr<PeriodicTask> cleanup_task_;
};

// ============================================================================
// SecureThoughtStorage
// ============================================================================

class SecureThoughtStorage {
public:
  explicit SecureThoughtStorage(StateConfig config, ClockFn clock = system_clock())
      : clock_(clock), manager_(config, std::move(clock)) {}

  /**
   * Store a copy of `thought`
   *
   * The copy gets a session id ("anonymous-<uuid>" when absent), a
   * timestamp, and total_thoughts raised to thought_number when lower.
   *
   * @return The stored copy
   */
  ThoughtRecord add_thought(const ThoughtRecord& thought) {
    ThoughtRecord entry = thought;
    if (!entry.session_id || entry.session_id->empty()) {
      entry.session_id = "anonymous-" + uuid_v4();
    }
    if (entry.thought_number > entry.total_thoughts) {
      entry.total_thoughts = entry.thought_number;
    }
    entry.timestamp_ms = clock_();
    manager_.add_thought(entry);
    return entry;
  }

  std::vector<ThoughtRecord> get_history(std::optional<size_t> limit = std::nullopt) const {
    return manager_.get_history(limit);
  }

  /// History entries of one session, most recent `limit`
  std::vector<ThoughtRecord> get_session_history(
      const std::string& session_id, std::optional<size_t> limit = std::nullopt) const {
    std::vector<ThoughtRecord> out;
    for (auto& t : manager_.get_history()) {
      if (t.session_id && *t.session_id == session_id) out.push_back(std::move(t));
    }
    if (limit && *limit < out.size()) {
      out.erase(out.begin(), out.end() - static_cast<std::ptrdiff_t>(*limit));
    }
    return out;
  }

  std::vector<std::string> get_branches() const { return manager_.get_branches(); }
  size_t branch_count() const { return manager_.branch_count(); }
  std::optional<BranchData> get_branch(const std::string& id) const {
    return manager_.get_branch(id);
  }

  StorageStats get_stats() const { return manager_.get_stats(); }
  void clear_history() { manager_.clear_history(); }
  size_t cleanup() { return manager_.cleanup(); }
  void destroy() { manager_.destroy(); }

private:
  ClockFn clock_;
  BoundedThoughtManager manager_;
};

}  // namespace trellis::history
