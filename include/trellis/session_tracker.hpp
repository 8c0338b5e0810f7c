#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file session_tracker.hpp
 * @brief Per-session activity and rate-window tracking
 *
 * One record per session id: last activity and a fixed rate window
 * (start, count). A window opens on the first thought and resets once
 * RATE_LIMIT_WINDOW_MS has elapsed since it opened.
 *
 * A sweep (cleanup()) runs every `sweep_interval_ms` on a PeriodicTask:
 * - sessions idle longer than `expiry_ms` are evicted
 * - at MAX_TRACKED_SESSIONS, the least recently active are evicted down to
 *   100 below the ceiling
 * - eviction subscribers receive the evicted ids, then periodic-cleanup
 *   subscribers run
 *
 * Recording a thought that brings the tracker to the ceiling runs the same
 * sweep inline, so the ceiling holds between sweeps.
 *
 * Subscribers run outside the tracker lock and may call back into it. A
 * throwing subscriber is logged and the remaining subscribers still run.
 *
 * Thread safety: all public methods are safe to call concurrently.
 */

#include "common.hpp"
#include "config.hpp"
#include "periodic_task.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace trellis::session {

constexpr TimestampMs RATE_LIMIT_WINDOW_MS = 60000;
constexpr size_t MAX_TRACKED_SESSIONS = 10000;

using EvictionCallback = std::function<void(const std::vector<std::string>&)>;
using CleanupCallback = std::function<void()>;

class SessionTracker {
public:
  explicit SessionTracker(SessionConfig config = SessionConfig{},
                          ClockFn clock = system_clock())
      : config_(config), clock_(std::move(clock)) {
    if (config_.sweep_interval_ms > 0) {
      sweep_ = std::make_unique<PeriodicTask>(
          "session-sweep", config_.sweep_interval_ms, [this]() { cleanup(); });
    }
  }

  ~SessionTracker() { destroy(); }

  SessionTracker(const SessionTracker&) = delete;
  SessionTracker& operator=(const SessionTracker&) = delete;

  void on_eviction(EvictionCallback cb) {
    std::lock_guard<std::mutex> lock(mu_);
    eviction_callbacks_.push_back(std::move(cb));
  }

  void on_periodic_cleanup(CleanupCallback cb) {
    std::lock_guard<std::mutex> lock(mu_);
    cleanup_callbacks_.push_back(std::move(cb));
  }

  /// Record activity unconditionally (counts against the rate window)
  void record_thought(const std::string& session_id) {
    bool at_ceiling = false;
    {
      std::lock_guard<std::mutex> lock(mu_);
      TimestampMs now = clock_();
      Entry& e = entry_locked(session_id, now);
      roll_window(e, now);
      e.last_access = now;
      e.window_count++;
      at_ceiling = sessions_.size() >= MAX_TRACKED_SESSIONS;
    }
    if (at_ceiling) cleanup();
  }

  /**
   * Count the thought if the session is within `max_per_window`
   *
   * Check and record happen under one lock.
   *
   * @return false (nothing recorded) if the window is already full
   */
  bool check_and_record(const std::string& session_id, int64_t max_per_window) {
    bool at_ceiling = false;
    {
      std::lock_guard<std::mutex> lock(mu_);
      TimestampMs now = clock_();
      auto it = sessions_.find(session_id);
      if (it != sessions_.end()) {
        roll_window(it->second, now);
        if (it->second.window_count >= max_per_window) {
          return false;
        }
      } else if (max_per_window < 1) {
        return false;
      }
      Entry& e = entry_locked(session_id, now);
      e.last_access = now;
      e.window_count++;
      at_ceiling = sessions_.size() >= MAX_TRACKED_SESSIONS;
    }
    if (at_ceiling) cleanup();
    return true;
  }

  /// Thoughts counted in the session's current window
  int64_t window_count(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return 0;
    if (clock_() - it->second.window_start >= RATE_LIMIT_WINDOW_MS) return 0;
    return it->second.window_count;
  }

  /// Sessions active within `expiry_ms`
  size_t get_active_session_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    TimestampMs cutoff = clock_() - config_.expiry_ms;
    size_t count = 0;
    for (const auto& [id, e] : sessions_) {
      if (e.last_access >= cutoff) ++count;
    }
    return count;
  }

  bool has_session(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    return sessions_.count(session_id) > 0;
  }

  size_t session_count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return sessions_.size();
  }

  /**
   * Evict idle sessions, then LRU-evict above MAX_TRACKED_SESSIONS, then
   * notify subscribers
   *
   * @return Evicted session ids
   */
  std::vector<std::string> cleanup() {
    std::vector<std::string> evicted;
    std::vector<EvictionCallback> on_evict;
    std::vector<CleanupCallback> on_cleanup;
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (destroyed_) return evicted;
      TimestampMs cutoff = clock_() - config_.expiry_ms;

      for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->second.last_access < cutoff) {
          evicted.push_back(it->first);
          it = sessions_.erase(it);
        } else {
          ++it;
        }
      }

      if (sessions_.size() >= MAX_TRACKED_SESSIONS) {
        // Drop down to 100 below the ceiling
        size_t excess = sessions_.size() - MAX_TRACKED_SESSIONS + 100;
        std::vector<std::pair<TimestampMs, std::string>> by_age;
        by_age.reserve(sessions_.size());
        for (const auto& [id, e] : sessions_) by_age.emplace_back(e.last_access, id);
        std::sort(by_age.begin(), by_age.end());
        for (size_t i = 0; i < excess && i < by_age.size(); ++i) {
          sessions_.erase(by_age[i].second);
          evicted.push_back(by_age[i].second);
        }
      }

      on_evict = eviction_callbacks_;
      on_cleanup = cleanup_callbacks_;
    }

    if (!evicted.empty()) {
      TRELLIS_LOG_INFO("[session::cleanup] Evicted %zu session(s)", evicted.size());
      for (const auto& cb : on_evict) {
        try {
          cb(evicted);
        } catch (const std::exception& e) {
          TRELLIS_LOG_ERROR("[session::cleanup] Eviction subscriber failed: %s",
                            e.what());
        }
      }
    }
    for (const auto& cb : on_cleanup) {
      try {
        cb();
      } catch (const std::exception& e) {
        TRELLIS_LOG_ERROR("[session::cleanup] Cleanup subscriber failed: %s",
                          e.what());
      }
    }
    return evicted;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mu_);
    sessions_.clear();
  }

  /// Stop the sweep and drop all state and subscribers; idempotent
  void destroy() {
    if (sweep_) sweep_->stop();
    std::lock_guard<std::mutex> lock(mu_);
    destroyed_ = true;
    sessions_.clear();
    eviction_callbacks_.clear();
    cleanup_callbacks_.clear();
  }

private:
  struct Entry {
    TimestampMs last_access = 0;
    TimestampMs window_start = 0;
    int64_t window_count = 0;
  };

  Entry& entry_locked(const std::string& session_id, TimestampMs now) {
    auto [it, inserted] = sessions_.try_emplace(session_id);
    if (inserted) {
      it->second.last_access = now;
      it->second.window_start = now;
    }
    return it->second;
  }

  static void roll_window(Entry& e, TimestampMs now) {
    if (now - e.window_start >= RATE_LIMIT_WINDOW_MS) {
      e.window_start = now;
      e.window_count = 0;
    }
  }

  SessionConfig config_;
  ClockFn clock_;

  mutable std::mutex mu_;
  std::unordered_map<std::string, Entry> sessions_;
  std::vector<EvictionCallback> eviction_callbacks_;
  std::vector<CleanupCallback> cleanup_callbacks_;
  bool destroyed_ = false;

  std::unique_ptr<PeriodicTask> sweep_;
};

}  // namespace trellis::session
