#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file health.hpp
 * @brief Aggregate health report over metrics, storage and security
 *
 * Four checks, each healthy / degraded / unhealthy with a message:
 *
 *   responseTime  average > max                 degraded ("elevated")
 *                 average > 0.6 * max           degraded ("slightly elevated")
 *   errorRate     failed/total % > unhealthy    unhealthy
 *                 failed/total % > degraded     degraded
 *   storage       history use % > max           degraded ("elevated")
 *                 history use % > 0.8 * max     degraded ("slightly elevated")
 *   security      status reported               healthy
 *
 * The overall status is the worst check. A check that throws is reported as
 * unhealthy; check() itself never throws.
 */

#include "common.hpp"
#include "config.hpp"
#include "history.hpp"
#include "metrics.hpp"
#include "security.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdio>
#include <exception>
#include <functional>
#include <string>
#include <utility>

namespace trellis::health {

enum class Status { Healthy = 0, Degraded = 1, Unhealthy = 2 };

inline const char* status_name(Status s) {
  switch (s) {
    case Status::Healthy: return "healthy";
    case Status::Degraded: return "degraded";
    case Status::Unhealthy: return "unhealthy";
  }
  return "unhealthy";
}

struct CheckResult {
  Status status = Status::Healthy;
  std::string message;
  nlohmann::json details;  ///< null when the check has none
  TimestampMs response_time_ms = 0;
  TimestampMs timestamp = 0;
};

struct HealthReport {
  Status status = Status::Healthy;
  CheckResult response_time;
  CheckResult error_rate;
  CheckResult storage;
  CheckResult security;
  std::string summary;
  TimestampMs uptime_ms = 0;
  TimestampMs timestamp = 0;
};

inline void to_json(nlohmann::json& j, const CheckResult& c) {
  j = nlohmann::json{
      {"status", status_name(c.status)},
      {"message", c.message},
      {"responseTime", c.response_time_ms},
      {"timestamp", c.timestamp},
  };
  if (!c.details.is_null()) j["details"] = c.details;
}

inline void to_json(nlohmann::json& j, const HealthReport& r) {
  j = nlohmann::json{
      {"status", status_name(r.status)},
      {"checks",
       {{"responseTime", r.response_time},
        {"errorRate", r.error_rate},
        {"storage", r.storage},
        {"security", r.security}}},
      {"summary", r.summary},
      {"uptime", r.uptime_ms},
      {"timestamp", r.timestamp},
  };
}

class HealthChecker {
public:
  /// Collaborators must outlive the checker
  HealthChecker(const metrics::BasicMetricsCollector& metrics,
                const history::SecureThoughtStorage& storage,
                const security::SecureThoughtSecurity& security,
                MonitoringConfig config = MonitoringConfig{},
                ClockFn clock = system_clock())
      : metrics_(metrics),
        storage_(storage),
        security_(security),
        config_(config),
        clock_(std::move(clock)) {
    started_at_ = clock_();
  }

  HealthReport check() const {
    HealthReport r;
    r.response_time = run("Response time", [this] { return check_response_time(); });
    r.error_rate = run("Error rate", [this] { return check_error_rate(); });
    r.storage = run("Storage", [this] { return check_storage(); });
    r.security = run("Security", [this] { return check_security(); });

    for (const CheckResult* c : {&r.response_time, &r.error_rate, &r.storage, &r.security}) {
      if (c->status > r.status) r.status = c->status;
    }

    r.timestamp = clock_();
    r.uptime_ms = r.timestamp - started_at_;
    r.summary = std::string("Health check completed: ") + status_name(r.status);
    if (r.status != Status::Healthy) {
      TRELLIS_LOG_WARN("[health::check] Overall status %s", status_name(r.status));
    }
    return r;
  }

private:
  static std::string format(const char* fmt, double v) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), fmt, v);
    return buf;
  }

  CheckResult run(const char* name, const std::function<CheckResult()>& fn) const {
    TimestampMs start = clock_();
    CheckResult c;
    try {
      c = fn();
    } catch (const std::exception& e) {
      TRELLIS_LOG_ERROR("[health::check] %s check failed: %s", name, e.what());
      c = CheckResult{};
      c.status = Status::Unhealthy;
      c.message = std::string(name) + " check failed";
    }
    c.timestamp = clock_();
    c.response_time_ms = c.timestamp - start;
    return c;
  }

  CheckResult check_response_time() const {
    auto requests = metrics_.get_metrics().requests;
    double avg = requests.average_response_time_ms;
    double max = config_.max_response_time_ms;

    CheckResult c;
    c.details = {{"avgResponseTime", std::llround(avg)}, {"requestCount", requests.total}};
    if (avg > max) {
      c.status = Status::Degraded;
      c.message = format("Response time elevated: %.0fms", avg);
    } else if (avg > max * 0.6) {
      c.status = Status::Degraded;
      c.message = format("Response time slightly elevated: %.0fms", avg);
    } else {
      c.message = format("Response time normal: %.0fms", avg);
    }
    return c;
  }

  CheckResult check_error_rate() const {
    auto requests = metrics_.get_metrics().requests;
    double rate = requests.total > 0 ? 100.0 * static_cast<double>(requests.failed) /
                                           static_cast<double>(requests.total)
                                     : 0.0;

    CheckResult c;
    c.details = {{"totalRequests", requests.total},
                 {"failedRequests", requests.failed},
                 {"errorRate", rate}};
    if (rate > config_.error_rate_unhealthy) {
      c.status = Status::Unhealthy;
    } else if (rate > config_.error_rate_degraded) {
      c.status = Status::Degraded;
    }
    c.message = format("Error rate: %.1f%%", rate);
    return c;
  }

  CheckResult check_storage() const {
    auto stats = storage_.get_stats();
    double usage = stats.history_capacity > 0
                       ? 100.0 * static_cast<double>(stats.history_size) /
                             static_cast<double>(stats.history_capacity)
                       : 0.0;
    double max = config_.max_storage_percent;

    CheckResult c;
    c.details = {{"historySize", stats.history_size},
                 {"historyCapacity", stats.history_capacity},
                 {"usagePercent", std::llround(usage)}};
    if (usage > max) {
      c.status = Status::Degraded;
      c.message = format("Storage usage elevated: %.1f%%", usage);
    } else if (usage > max * 0.8) {
      c.status = Status::Degraded;
      c.message = format("Storage usage slightly elevated: %.1f%%", usage);
    } else {
      c.message = format("Storage usage normal: %.1f%%", usage);
    }
    return c;
  }

  CheckResult check_security() const {
    CheckResult c;
    c.message = "Security systems operational";
    c.details = security_.get_security_status();
    return c;
  }

  const metrics::BasicMetricsCollector& metrics_;
  const history::SecureThoughtStorage& storage_;
  const security::SecureThoughtSecurity& security_;
  MonitoringConfig config_;
  ClockFn clock_;
  TimestampMs started_at_ = 0;
};

}  // namespace trellis::health
