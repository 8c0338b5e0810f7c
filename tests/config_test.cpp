/**
 * Config Unit Tests
 *
 * Validates defaults, JSON documents, environment overrides and range
 * checks.
 */

#include <cstdlib>
#include <doctest/doctest.h>
#include <nlohmann/json.hpp>
#include <trellis/config.hpp>
#include <trellis/errors.hpp>

using namespace trellis;

namespace {

// Sets an environment variable for the lifetime of the guard
struct EnvGuard {
  const char* name;
  EnvGuard(const char* n, const char* value) : name(n) { setenv(n, value, 1); }
  ~EnvGuard() { unsetenv(name); }
};

}  // namespace

TEST_CASE("config: defaults match the documented table") {
  Config c;
  CHECK(c.state.max_history_size == 1000);
  CHECK(c.state.max_branch_age_ms == 3600000);
  CHECK(c.state.max_thought_length == 5000);
  CHECK(c.state.max_thoughts_per_branch == 100);
  CHECK(c.state.cleanup_interval_ms == 300000);
  CHECK(c.security.max_thoughts_per_minute == 60);
  CHECK(c.security.blocked_patterns.size() == 11);
  CHECK(c.session.sweep_interval_ms == 60000);
  CHECK(c.mcts.max_nodes_per_tree == 500);
  CHECK(c.mcts.exploration_constant == doctest::Approx(1.41421356));
  CHECK(c.mcts.enable_auto_tree);
  CHECK(c.logging.level == log::Level::Warn);
  CHECK_NOTHROW(c.validate());
}

TEST_CASE("config: from_json overrides present keys only") {
  nlohmann::json doc = {
      {"state", {{"maxHistorySize", 50}, {"cleanupInterval", 0}}},
      {"security", {{"blockedPatterns", {"forbidden"}}}},
      {"mcts", {{"enableAutoTree", false}}},
      {"logging", {{"level", "debug"}}},
  };
  Config c = Config::from_json(doc);
  CHECK(c.state.max_history_size == 50);
  CHECK(c.state.cleanup_interval_ms == 0);
  CHECK(c.state.max_thought_length == 5000);
  REQUIRE(c.security.blocked_patterns.size() == 1);
  CHECK(c.security.blocked_patterns[0] == "forbidden");
  CHECK_FALSE(c.mcts.enable_auto_tree);
  CHECK(c.logging.level == log::Level::Debug);
}

TEST_CASE("config: mistyped JSON fields are validation errors") {
  CHECK_THROWS_AS(Config::from_json({{"state", {{"maxHistorySize", "big"}}}}),
                  ValidationError);
  CHECK_THROWS_AS(Config::from_json({{"state", 5}}), ValidationError);
  CHECK_THROWS_AS(Config::from_json(nlohmann::json::array()), ValidationError);
}

TEST_CASE("config: to_json round-trips through from_json") {
  Config c;
  c.state.max_history_size = 42;
  c.mcts.exploration_constant = 0.5;
  Config back = Config::from_json(c.to_json());
  CHECK(back.state.max_history_size == 42);
  CHECK(back.mcts.exploration_constant == doctest::Approx(0.5));
}

TEST_CASE("config: environment overrides") {
  EnvGuard history("MAX_HISTORY_SIZE", "250");
  EnvGuard rate("MAX_THOUGHTS_PER_MIN", "not-a-number");
  EnvGuard patterns("BLOCKED_PATTERNS", "alpha, beta ,,gamma");
  EnvGuard tree("MCTS_DISABLE_AUTO_TREE", "true");
  EnvGuard level("LOG_LEVEL", "error");

  Config c = Config::from_env();
  CHECK(c.state.max_history_size == 250);
  CHECK(c.security.max_thoughts_per_minute == 60);
  REQUIRE(c.security.blocked_patterns.size() == 3);
  CHECK(c.security.blocked_patterns[1] == "beta");
  CHECK_FALSE(c.mcts.enable_auto_tree);
  CHECK(c.logging.level == log::Level::Error);
}

TEST_CASE("config: validate enforces ranges") {
  Config c;
  c.state.max_history_size = 0;
  CHECK_THROWS_AS(c.validate(), ValidationError);

  c = Config{};
  c.security.max_thoughts_per_minute = 1001;
  CHECK_THROWS_AS(c.validate(), ValidationError);

  c = Config{};
  c.mcts.exploration_constant = -1.0;
  CHECK_THROWS_AS(c.validate(), ValidationError);

  c = Config{};
  c.session.expiry_ms = -5;
  CHECK_THROWS_AS(c.validate(), ValidationError);
}
