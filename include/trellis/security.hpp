#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file security.hpp
 * @brief Content sanitization, blocked-content matching and rate limiting
 *
 * Two independent filters:
 * - sanitize_content(): a fixed, non-configurable denylist that strips
 *   script tags, javascript: URIs, eval( / Function( calls and inline event
 *   handler attributes. Content without matches comes back unchanged.
 * - validate_thought(): configured blocked patterns (case-insensitive
 *   regular expressions), then the per-session rate limit, which is
 *   enforced through SessionTracker::check_and_record().
 *
 * Patterns are compiled once at construction; a malformed pattern is logged
 * and skipped. std::regex keeps no match state between calls, so identical
 * input is always judged identically.
 *
 * std::regex recurses once per repetition it consumes, so no regex ever sees
 * more than REGEX_WINDOW bytes at once. Blocked patterns are searched in
 * overlapping windows and match anywhere as long as the match itself fits
 * in REGEX_WINDOW / 2 bytes. The sanitizer scans script blocks and event
 * handler attributes by hand and keeps regexes for the fixed tokens only.
 */

#include "common.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "session_tracker.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace trellis::security {

constexpr size_t MAX_SESSION_ID_LENGTH = 100;
constexpr size_t REGEX_WINDOW = 4096;

namespace detail {

inline char ascii_lower(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

inline bool is_word_char(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '_';
}

inline std::string ascii_lowercase(const std::string& s) {
  std::string out(s);
  for (char& c : out) c = ascii_lower(c);
  return out;
}

/// Remove `<script...>...</script>` blocks whose body stays on one line
inline std::string strip_script_blocks(const std::string& in) {
  static const std::string open_tag = "<script";
  static const std::string close_tag = "</script>";
  const std::string lower = ascii_lowercase(in);

  std::string out;
  out.reserve(in.size());
  size_t copied = 0;
  size_t pos = 0;
  size_t close = 0;
  size_t eol = 0;
  bool close_scanned = false;
  bool eol_scanned = false;

  while ((pos = lower.find(open_tag, pos)) != std::string::npos) {
    size_t gt = lower.find('>', pos + open_tag.size());
    if (gt == std::string::npos) break;
    if (!close_scanned || (close != std::string::npos && close <= gt)) {
      close = lower.find(close_tag, gt + 1);
      close_scanned = true;
    }
    if (close == std::string::npos) break;
    if (!eol_scanned || (eol != std::string::npos && eol <= gt)) {
      eol = lower.find_first_of("\r\n", gt + 1);
      eol_scanned = true;
    }
    if (eol != std::string::npos && eol < close) {
      ++pos;
      continue;
    }
    out.append(in, copied, pos - copied);
    copied = close + close_tag.size();
    pos = copied;
  }
  out.append(in, copied, std::string::npos);
  return out;
}

/// Remove `on<word>=` event handler attributes (case-insensitive)
inline std::string strip_event_handlers(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  size_t i = 0;
  while (i < in.size()) {
    if (i + 1 < in.size() && ascii_lower(in[i]) == 'o' &&
        ascii_lower(in[i + 1]) == 'n') {
      size_t end = i + 2;
      while (end < in.size() && is_word_char(in[end])) ++end;
      if (end > i + 2 && end < in.size() && in[end] == '=') {
        i = end + 1;
        continue;
      }
      if (end > i + 2) {
        // No '=' after this word run, so no later start inside it matches
        out.append(in, i, end - i);
        i = end;
        continue;
      }
    }
    out.push_back(in[i]);
    ++i;
  }
  return out;
}

/// regex_search over overlapping windows of at most REGEX_WINDOW bytes
inline bool windowed_search(const std::string& text, const std::regex& re) {
  if (text.size() <= REGEX_WINDOW) return std::regex_search(text, re);
  const size_t step = REGEX_WINDOW / 2;
  for (size_t off = 0; off < text.size(); off += step) {
    size_t end = std::min(text.size(), off + REGEX_WINDOW);
    auto flags = std::regex_constants::match_default;
    if (off > 0) flags |= std::regex_constants::match_prev_avail;
    if (end < text.size()) flags |= std::regex_constants::match_not_eol;
    if (std::regex_search(text.begin() + static_cast<std::ptrdiff_t>(off),
                          text.begin() + static_cast<std::ptrdiff_t>(end), re,
                          flags)) {
      return true;
    }
    if (end == text.size()) break;
  }
  return false;
}

}  // namespace detail

struct SecurityStatus {
  std::string status = "healthy";
  size_t blocked_patterns = 0;  ///< Patterns that compiled
  size_t skipped_patterns = 0;  ///< Malformed patterns ignored
  int64_t max_thoughts_per_minute = 0;
};

inline void to_json(nlohmann::json& j, const SecurityStatus& s) {
  j = nlohmann::json{
      {"status", s.status},
      {"blockedPatterns", s.blocked_patterns},
      {"skippedPatterns", s.skipped_patterns},
      {"maxThoughtsPerMinute", s.max_thoughts_per_minute},
  };
}

class SecureThoughtSecurity {
public:
  /**
   * @param config Blocked patterns and rate limit
   * @param tracker Rate window owner (must outlive this object)
   */
  SecureThoughtSecurity(SecurityConfig config, session::SessionTracker& tracker)
      : config_(std::move(config)), tracker_(tracker) {
    for (const auto& source : config_.blocked_patterns) {
      try {
        blocked_.push_back(Pattern{
            source, std::regex(source, std::regex::ECMAScript | std::regex::icase)});
      } catch (const std::regex_error& e) {
        ++skipped_;
        TRELLIS_LOG_WARN("[security::compile] Skipping malformed pattern '%s': %s",
                         source.c_str(), e.what());
      }
    }
    TRELLIS_LOG_DEBUG("[security::compile] %zu blocked pattern(s) active",
                      blocked_.size());
  }

  /// Strip the fixed denylist from `content`
  std::string sanitize_content(const std::string& content) const {
    std::string out = detail::strip_script_blocks(content);
    for (const auto& re : token_sanitizers()) {
      out = std::regex_replace(out, re, "");
    }
    return detail::strip_event_handlers(out);
  }

  /**
   * Gate a thought before it is stored
   *
   * On success the thought has been counted against the session's rate
   * window. An empty `session_id` skips the rate check.
   *
   * @throws SecurityError on blocked content or an exhausted rate window
   */
  void validate_thought(const std::string& text, const std::string& session_id) const {
    for (const auto& p : blocked_) {
      if (detail::windowed_search(text, p.re)) {
        TRELLIS_LOG_WARN("[security::validate] Blocked content in session '%s'",
                         session_id.c_str());
        throw SecurityError("Thought contains prohibited content",
                            {{"pattern", p.source}, {"sessionId", session_id}});
      }
    }

    if (session_id.empty()) return;
    if (!tracker_.check_and_record(session_id, config_.max_thoughts_per_minute)) {
      TRELLIS_LOG_WARN("[security::validate] Rate limit exceeded for session '%s'",
                       session_id.c_str());
      throw SecurityError(
          "Rate limit exceeded: maximum " +
              std::to_string(config_.max_thoughts_per_minute) +
              " thoughts per minute",
          {{"sessionId", session_id},
           {"maxThoughtsPerMinute", config_.max_thoughts_per_minute}});
    }
  }

  /// True iff 0 < length <= 100
  bool validate_session(const std::string& session_id) const {
    return !session_id.empty() && session_id.size() <= MAX_SESSION_ID_LENGTH;
  }

  std::string generate_session_id() const { return uuid_v4(); }

  SecurityStatus get_security_status() const {
    SecurityStatus s;
    s.blocked_patterns = blocked_.size();
    s.skipped_patterns = skipped_;
    s.max_thoughts_per_minute = config_.max_thoughts_per_minute;
    return s;
  }

private:
  struct Pattern {
    std::string source;
    std::regex re;
  };

  // Fixed tokens only: no repetition, so matching depth stays constant
  static const std::vector<std::regex>& token_sanitizers() {
    static const std::vector<std::regex> list = [] {
      auto flags = std::regex::ECMAScript | std::regex::icase;
      return std::vector<std::regex>{
          std::regex("javascript:", flags),
          std::regex("eval\\(", flags),
          std::regex("Function\\(", flags),
      };
    }();
    return list;
  }

  SecurityConfig config_;
  session::SessionTracker& tracker_;
  std::vector<Pattern> blocked_;
  size_t skipped_ = 0;
};

}  // namespace trellis::security
