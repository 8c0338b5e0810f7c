/**
 * Health Checker Unit Tests
 *
 * Validates each check's thresholds and that the overall status is the
 * worst of the four.
 */

#include <doctest/doctest.h>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <trellis/config.hpp>
#include <trellis/health.hpp>
#include <trellis/history.hpp>
#include <trellis/metrics.hpp>
#include <trellis/security.hpp>
#include <trellis/session_tracker.hpp>

using namespace trellis;
using trellis::health::Status;

namespace {

struct ManualClock {
  std::shared_ptr<TimestampMs> t = std::make_shared<TimestampMs>(1000);
  ClockFn fn() const {
    auto p = t;
    return [p]() { return *p; };
  }
  void advance(TimestampMs ms) { *t += ms; }
};

struct Fixture {
  ManualClock clock;
  session::SessionTracker tracker;
  security::SecureThoughtSecurity security;
  history::SecureThoughtStorage storage;
  metrics::BasicMetricsCollector metrics;
  health::HealthChecker checker;

  explicit Fixture(int64_t history_size = 100)
      : tracker(sessions(), clock.fn()),
        security(SecurityConfig{}, tracker),
        storage(state(history_size), clock.fn()),
        metrics(storage, tracker, clock.fn()),
        checker(metrics, storage, security, MonitoringConfig{}, clock.fn()) {}

  static StateConfig state(int64_t history_size) {
    StateConfig c;
    c.max_history_size = history_size;
    c.cleanup_interval_ms = 0;
    return c;
  }
  static SessionConfig sessions() {
    SessionConfig c;
    c.sweep_interval_ms = 0;
    return c;
  }

  void store(int n) {
    for (int i = 1; i <= n; ++i) {
      ThoughtRecord t;
      t.thought = "note " + std::to_string(i);
      t.thought_number = i;
      t.total_thoughts = n;
      t.session_id = "s";
      storage.add_thought(t);
    }
  }
};

}  // namespace

TEST_CASE("health: idle system is healthy") {
  Fixture f;
  f.clock.advance(250);
  auto r = f.checker.check();
  CHECK(r.status == Status::Healthy);
  CHECK(r.summary == "Health check completed: healthy");
  CHECK(r.uptime_ms == 250);
  CHECK(r.response_time.message == "Response time normal: 0ms");
  CHECK(r.error_rate.message == "Error rate: 0.0%");
  CHECK(r.storage.message == "Storage usage normal: 0.0%");
  CHECK(r.security.message == "Security systems operational");
  CHECK(r.security.details["blockedPatterns"] == 11);
}

TEST_CASE("health: response time thresholds") {
  SUBCASE("slightly elevated above 60% of max") {
    Fixture f;
    f.metrics.record_request(150.0, true);
    auto r = f.checker.check();
    CHECK(r.response_time.status == Status::Degraded);
    CHECK(r.response_time.message == "Response time slightly elevated: 150ms");
    CHECK(r.status == Status::Degraded);
  }
  SUBCASE("elevated above max") {
    Fixture f;
    f.metrics.record_request(250.0, true);
    auto r = f.checker.check();
    CHECK(r.response_time.status == Status::Degraded);
    CHECK(r.response_time.message == "Response time elevated: 250ms");
  }
  SUBCASE("normal at 60% of max") {
    Fixture f;
    f.metrics.record_request(120.0, true);
    CHECK(f.checker.check().response_time.status == Status::Healthy);
  }
}

TEST_CASE("health: error rate thresholds") {
  SUBCASE("above the unhealthy percentage") {
    Fixture f;
    for (int i = 0; i < 9; ++i) f.metrics.record_request(1.0, true);
    f.metrics.record_request(1.0, false);
    auto r = f.checker.check();
    CHECK(r.error_rate.status == Status::Unhealthy);
    CHECK(r.error_rate.message == "Error rate: 10.0%");
    CHECK(r.status == Status::Unhealthy);
    CHECK(r.summary == "Health check completed: unhealthy");
  }
  SUBCASE("between degraded and unhealthy") {
    Fixture f;
    for (int i = 0; i < 39; ++i) f.metrics.record_request(1.0, true);
    f.metrics.record_request(1.0, false);
    auto r = f.checker.check();
    CHECK(r.error_rate.status == Status::Degraded);
    CHECK(r.error_rate.message == "Error rate: 2.5%");
  }
  SUBCASE("at the degraded percentage") {
    Fixture f;
    for (int i = 0; i < 49; ++i) f.metrics.record_request(1.0, true);
    f.metrics.record_request(1.0, false);
    CHECK(f.checker.check().error_rate.status == Status::Healthy);
  }
}

TEST_CASE("health: storage thresholds") {
  SUBCASE("elevated above max") {
    Fixture f(10);
    f.store(9);
    auto r = f.checker.check();
    CHECK(r.storage.status == Status::Degraded);
    CHECK(r.storage.message == "Storage usage elevated: 90.0%");
    CHECK(r.storage.details["usagePercent"] == 90);
  }
  SUBCASE("slightly elevated above 80% of max") {
    Fixture f(10);
    f.store(7);
    auto r = f.checker.check();
    CHECK(r.storage.status == Status::Degraded);
    CHECK(r.storage.message == "Storage usage slightly elevated: 70.0%");
  }
  SUBCASE("normal") {
    Fixture f(10);
    f.store(6);
    CHECK(f.checker.check().storage.status == Status::Healthy);
  }
}

TEST_CASE("health: report JSON groups the checks") {
  Fixture f;
  nlohmann::json j = f.checker.check();
  CHECK(j["status"] == "healthy");
  CHECK(j["checks"]["responseTime"]["status"] == "healthy");
  CHECK(j["checks"]["errorRate"]["details"]["totalRequests"] == 0);
  CHECK(j["checks"]["storage"]["details"]["historyCapacity"] == 100);
  CHECK(j["checks"]["security"]["details"]["status"] == "healthy");
  CHECK(j.contains("uptime"));
}
