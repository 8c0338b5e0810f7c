#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file metrics.hpp
 * @brief Request and thought counters with 60-second sliding rates
 *
 * Totals are kept as counters; everything windowed is answered from
 * CircularBuffers so memory stays fixed:
 * - the last 100 response times (rolling average)
 * - the last 1000 request and thought timestamps (per-minute rates)
 *
 * A timestamp counts toward a rate iff `ts > now - 60000`; a sample taken
 * exactly 60 s ago has left the window.
 *
 * Branch and active-session counts are read live from SecureThoughtStorage
 * and SessionTracker instead of being tracked twice.
 *
 * Thread safety: all public methods are safe to call concurrently.
 */

#include "circular_buffer.hpp"
#include "common.hpp"
#include "history.hpp"
#include "session_tracker.hpp"
#include "thought.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>

namespace trellis::metrics {

constexpr TimestampMs RATE_WINDOW_MS = 60000;
constexpr int64_t RESPONSE_TIME_SAMPLES = 100;
constexpr int64_t TIMESTAMP_SAMPLES = 1000;

// ============================================================================
// Snapshot
// ============================================================================

struct RequestMetrics {
  int64_t total = 0;
  int64_t successful = 0;
  int64_t failed = 0;
  double average_response_time_ms = 0.0;  ///< Over the last 100 requests
  std::optional<TimestampMs> last_request_time;
  int64_t requests_per_minute = 0;
};

struct ThoughtMetrics {
  int64_t total = 0;
  int64_t average_length = 0;  ///< Rounded running mean, bytes
  int64_t thoughts_per_minute = 0;
  int64_t revision_count = 0;
  int64_t branch_count = 0;
  int64_t active_sessions = 0;
};

struct SystemMetrics {
  TimestampMs uptime_ms = 0;  ///< Since the collector was constructed
  TimestampMs timestamp = 0;
};

struct MetricsSnapshot {
  RequestMetrics requests;
  ThoughtMetrics thoughts;
  SystemMetrics system;
};

inline void to_json(nlohmann::json& j, const RequestMetrics& m) {
  j = nlohmann::json{
      {"totalRequests", m.total},
      {"successfulRequests", m.successful},
      {"failedRequests", m.failed},
      {"averageResponseTime", m.average_response_time_ms},
      {"lastRequestTime", nullptr},
      {"requestsPerMinute", m.requests_per_minute},
  };
  if (m.last_request_time) j["lastRequestTime"] = *m.last_request_time;
}

inline void to_json(nlohmann::json& j, const ThoughtMetrics& m) {
  j = nlohmann::json{
      {"totalThoughts", m.total},
      {"averageThoughtLength", m.average_length},
      {"thoughtsPerMinute", m.thoughts_per_minute},
      {"revisionCount", m.revision_count},
      {"branchCount", m.branch_count},
      {"activeSessions", m.active_sessions},
  };
}

inline void to_json(nlohmann::json& j, const MetricsSnapshot& s) {
  j = nlohmann::json{
      {"requests", s.requests},
      {"thoughts", s.thoughts},
      {"system", {{"uptime", s.system.uptime_ms}, {"timestamp", s.system.timestamp}}},
  };
}

// ============================================================================
// Collector
// ============================================================================

namespace detail {

inline int64_t count_after(const CircularBuffer<TimestampMs>& buf, TimestampMs cutoff) {
  int64_t n = 0;
  for (TimestampMs ts : buf.get_all()) {
    if (ts > cutoff) ++n;
  }
  return n;
}

}  // namespace detail

class BasicMetricsCollector {
public:
  /**
   * @param storage Source of the live branch count (must outlive this)
   * @param tracker Source of the live active-session count (must outlive this)
   */
  BasicMetricsCollector(const history::SecureThoughtStorage& storage,
                        const session::SessionTracker& tracker,
                        ClockFn clock = system_clock())
      : storage_(storage),
        tracker_(tracker),
        clock_(std::move(clock)),
        response_times_(RESPONSE_TIME_SAMPLES),
        request_times_(TIMESTAMP_SAMPLES),
        thought_times_(TIMESTAMP_SAMPLES) {
    started_at_ = clock_();
  }

  void record_request(double duration_ms, bool success) {
    std::lock_guard<std::mutex> lock(mu_);
    TimestampMs now = clock_();

    requests_.total++;
    requests_.last_request_time = now;
    if (success) {
      requests_.successful++;
    } else {
      requests_.failed++;
    }

    response_times_.add(duration_ms);
    double sum = 0.0;
    auto samples = response_times_.get_all();
    for (double d : samples) sum += d;
    requests_.average_response_time_ms = sum / static_cast<double>(samples.size());

    request_times_.add(now);
  }

  void record_thought_processed(const ThoughtRecord& thought) {
    // Read collaborators before taking our own lock
    auto branches = static_cast<int64_t>(storage_.branch_count());
    auto active = static_cast<int64_t>(tracker_.get_active_session_count());

    std::lock_guard<std::mutex> lock(mu_);
    TimestampMs now = clock_();

    thoughts_.total++;
    thought_times_.add(now);

    // Running mean over the rounded previous mean
    double prev_total = static_cast<double>(thoughts_.average_length) *
                        static_cast<double>(thoughts_.total - 1);
    double total_length = prev_total + static_cast<double>(thought.thought.size());
    thoughts_.average_length =
        std::llround(total_length / static_cast<double>(thoughts_.total));

    if (thought.is_revision) thoughts_.revision_count++;
    thoughts_.branch_count = branches;
    thoughts_.active_sessions = active;
  }

  MetricsSnapshot get_metrics() const {
    std::lock_guard<std::mutex> lock(mu_);
    TimestampMs now = clock_();
    TimestampMs cutoff = now - RATE_WINDOW_MS;

    MetricsSnapshot s;
    s.requests = requests_;
    s.requests.requests_per_minute = detail::count_after(request_times_, cutoff);
    s.thoughts = thoughts_;
    s.thoughts.thoughts_per_minute = detail::count_after(thought_times_, cutoff);
    s.system.uptime_ms = now - started_at_;
    s.system.timestamp = now;
    return s;
  }

  /// Clear buffers and zero every counter; idempotent
  void destroy() {
    std::lock_guard<std::mutex> lock(mu_);
    response_times_.clear();
    request_times_.clear();
    thought_times_.clear();
    requests_ = RequestMetrics{};
    thoughts_ = ThoughtMetrics{};
  }

private:
  const history::SecureThoughtStorage& storage_;
  const session::SessionTracker& tracker_;
  ClockFn clock_;
  TimestampMs started_at_ = 0;

  mutable std::mutex mu_;
  RequestMetrics requests_;
  ThoughtMetrics thoughts_;
  CircularBuffer<double> response_times_;
  CircularBuffer<TimestampMs> request_times_;
  CircularBuffer<TimestampMs> thought_times_;
};

}  // namespace trellis::metrics
