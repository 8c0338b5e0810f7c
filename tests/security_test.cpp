/**
 * Security Unit Tests
 *
 * Validates sanitization, blocked-pattern matching, the per-session rate
 * limit and session id checks.
 */

#include <doctest/doctest.h>
#include <nlohmann/json.hpp>
#include <regex>
#include <string>
#include <trellis/config.hpp>
#include <trellis/errors.hpp>
#include <trellis/security.hpp>
#include <trellis/session_tracker.hpp>

using namespace trellis;
using trellis::security::SecureThoughtSecurity;
using trellis::session::SessionTracker;

namespace {

SessionConfig no_sweep() {
  SessionConfig c;
  c.sweep_interval_ms = 0;
  return c;
}

}  // namespace

TEST_CASE("security: sanitize strips the fixed denylist") {
  SessionTracker tracker(no_sweep());
  SecureThoughtSecurity sec(SecurityConfig{}, tracker);

  CHECK(sec.sanitize_content("<script>alert(1)</script>safe") == "safe");
  CHECK(sec.sanitize_content("see JavaScript:go") == "see go");
  CHECK(sec.sanitize_content("<div onclick=run()>") == "<div run()>");
  CHECK(sec.sanitize_content("eval(x)") == "x)");
  CHECK(sec.sanitize_content("Plain reasoning stays as is.") ==
        "Plain reasoning stays as is.");
}

TEST_CASE("security: script blocks are stripped per line, any case") {
  SessionTracker tracker(no_sweep());
  SecureThoughtSecurity sec(SecurityConfig{}, tracker);

  CHECK(sec.sanitize_content("<SCRIPT src=x>y</Script>z") == "z");
  CHECK(sec.sanitize_content("<script>a</script>b<script>c</script>") == "b");
  CHECK(sec.sanitize_content("<script>a\nb</script>") == "<script>a\nb</script>");
  CHECK(sec.sanitize_content("<script>unterminated") == "<script>unterminated");
  CHECK(sec.sanitize_content("xonclick=y onload") == "xy onload");
}

TEST_CASE("security: maximum-length thoughts are sanitized and screened") {
  SessionTracker tracker(no_sweep());
  SecureThoughtSecurity sec(SecurityConfig{}, tracker);

  std::string body(100000 - 8, 'a');
  CHECK(sec.sanitize_content("<script>" + body) == "<script>" + body);
  CHECK(sec.sanitize_content("<script>" + body + "</script>ok") == "ok");

  std::string handler = "on" + std::string(99990, 'x');
  CHECK(sec.sanitize_content(handler + "=1") == "1");
  CHECK(sec.sanitize_content(handler) == handler);

  CHECK_NOTHROW(sec.validate_thought("<script>" + body, "s"));
  CHECK_THROWS_AS(sec.validate_thought(std::string(60000, 'a') + " window.open", "s"),
                  SecurityError);

  // Straddles the first window edge
  std::string edge(4094, 'a');
  CHECK_THROWS_AS(sec.validate_thought(edge + "window." + edge, "s"), SecurityError);
}

TEST_CASE("security: blocked content is rejected the same way every time") {
  SessionTracker tracker(no_sweep());
  SecureThoughtSecurity sec(SecurityConfig{}, tracker);

  for (int i = 0; i < 3; ++i) {
    CHECK_THROWS_AS(sec.validate_thought("call eval (payload)", "s"), SecurityError);
  }
  // Blocked attempts are not counted against the rate window
  CHECK(tracker.window_count("s") == 0);

  try {
    sec.validate_thought("open setup.EXE now", "s");
    FAIL("expected SecurityError");
  } catch (const SecurityError& e) {
    CHECK(std::string(e.what()) == "Thought contains prohibited content");
    CHECK(e.details()["pattern"] == "\\.exe");
  }
}

TEST_CASE("security: rate limit applies per session") {
  SessionTracker tracker(no_sweep());
  SecurityConfig c;
  c.max_thoughts_per_minute = 2;
  SecureThoughtSecurity sec(c, tracker);

  CHECK_NOTHROW(sec.validate_thought("first", "s"));
  CHECK_NOTHROW(sec.validate_thought("second", "s"));
  CHECK_THROWS_AS(sec.validate_thought("third", "s"), SecurityError);
  CHECK_NOTHROW(sec.validate_thought("first", "other"));
}

TEST_CASE("security: empty session id skips the rate check") {
  SessionTracker tracker(no_sweep());
  SecurityConfig c;
  c.max_thoughts_per_minute = 1;
  SecureThoughtSecurity sec(c, tracker);

  for (int i = 0; i < 5; ++i) CHECK_NOTHROW(sec.validate_thought("fine", ""));
  CHECK(tracker.session_count() == 0);
}

TEST_CASE("security: malformed pattern is skipped") {
  SessionTracker tracker(no_sweep());
  SecurityConfig c;
  c.blocked_patterns = {"[unclosed", "forbidden"};
  SecureThoughtSecurity sec(c, tracker);

  auto status = sec.get_security_status();
  CHECK(status.blocked_patterns == 1);
  CHECK(status.skipped_patterns == 1);
  CHECK_THROWS_AS(sec.validate_thought("this is FORBIDDEN", "s"), SecurityError);
  CHECK_NOTHROW(sec.validate_thought("[unclosed bracket is fine", "s"));

  nlohmann::json j = status;
  CHECK(j["status"] == "healthy");
  CHECK(j["skippedPatterns"] == 1);
}

TEST_CASE("security: session id length bounds") {
  SessionTracker tracker(no_sweep());
  SecureThoughtSecurity sec(SecurityConfig{}, tracker);

  CHECK_FALSE(sec.validate_session(""));
  CHECK(sec.validate_session("a"));
  CHECK(sec.validate_session(std::string(100, 'x')));
  CHECK_FALSE(sec.validate_session(std::string(101, 'x')));
}

TEST_CASE("security: generated session ids are v4 uuids") {
  SessionTracker tracker(no_sweep());
  SecureThoughtSecurity sec(SecurityConfig{}, tracker);
  std::regex uuid("^[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}$");

  std::string a = sec.generate_session_id();
  std::string b = sec.generate_session_id();
  CHECK(std::regex_match(a, uuid));
  CHECK(std::regex_match(b, uuid));
  CHECK(a != b);
}
