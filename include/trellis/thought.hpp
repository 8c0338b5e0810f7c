#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file thought.hpp
 * @brief ThoughtRecord: one submitted reasoning unit plus sequencing metadata
 *
 * A record plays exactly one role:
 * - Plain:    continues from the current position
 * - Revision: corrects an earlier thought (is_revision + revises_thought)
 * - Branch:   diverges from an earlier thought (branch_from_thought + branch_id)
 *
 * A record carrying both revision and branch markers is treated as a branch.
 *
 * Wire shape (camelCase, as submitted by callers):
 *
 *   {
 *     "thought": "...", "thoughtNumber": 3, "totalThoughts": 5,
 *     "nextThoughtNeeded": true, "isRevision": false, "revisesThought": 1,
 *     "branchFromThought": 1, "branchId": "b1", "needsMoreThoughts": false,
 *     "sessionId": "..."
 *   }
 */

#include "common.hpp"
#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <string>

namespace trellis {

enum class ThoughtRole { Plain, Revision, Branch };

struct ThoughtRecord {
  std::string thought;
  int thought_number = 1;        ///< 1-based sequence number
  int total_thoughts = 1;        ///< Caller's estimate of the total
  bool next_thought_needed = true;

  bool is_revision = false;
  std::optional<int> revises_thought;

  std::optional<int> branch_from_thought;
  std::optional<std::string> branch_id;

  bool needs_more_thoughts = false;

  std::optional<std::string> session_id;
  std::optional<TimestampMs> timestamp_ms;  ///< Set on the stored copy

  ThoughtRole role() const {
    if (branch_from_thought && branch_id) {
      if (is_revision && revises_thought) {
        TRELLIS_LOG_DEBUG(
            "[thought::role] #%d carries revision and branch markers; "
            "treating as branch", thought_number);
      }
      return ThoughtRole::Branch;
    }
    if (is_revision && revises_thought) {
      return ThoughtRole::Revision;
    }
    return ThoughtRole::Plain;
  }
};

inline const char* role_name(ThoughtRole role) {
  switch (role) {
    case ThoughtRole::Plain: return "plain";
    case ThoughtRole::Revision: return "revision";
    case ThoughtRole::Branch: return "branch";
  }
  return "plain";
}

/**
 * Longest prefix of `s` no longer than `max_bytes` that does not split a
 * UTF-8 sequence
 */
inline std::string utf8_prefix(const std::string& s, size_t max_bytes) {
  if (s.size() <= max_bytes) return s;
  size_t cut = max_bytes;
  while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) {
    --cut;
  }
  return s.substr(0, cut);
}

// ============================================================================
// JSON binding
// ============================================================================

inline void to_json(nlohmann::json& j, const ThoughtRecord& t) {
  j = nlohmann::json{
      {"thought", t.thought},
      {"thoughtNumber", t.thought_number},
      {"totalThoughts", t.total_thoughts},
      {"nextThoughtNeeded", t.next_thought_needed},
  };
  if (t.is_revision) j["isRevision"] = true;
  if (t.revises_thought) j["revisesThought"] = *t.revises_thought;
  if (t.branch_from_thought) j["branchFromThought"] = *t.branch_from_thought;
  if (t.branch_id) j["branchId"] = *t.branch_id;
  if (t.needs_more_thoughts) j["needsMoreThoughts"] = true;
  if (t.session_id) j["sessionId"] = *t.session_id;
  if (t.timestamp_ms) j["timestamp"] = *t.timestamp_ms;
}

namespace detail {

inline bool is_blank(const std::string& s) {
  return std::all_of(s.begin(), s.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

inline int positive_int_field(const nlohmann::json& j, const char* key,
                              bool required) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    if (required) {
      throw ValidationError(std::string(key) + " is required");
    }
    return 0;
  }
  if (!it->is_number_integer() && !it->is_number_unsigned()) {
    // 2.0 is accepted as an integer, 2.5 is not
    if (it->is_number_float()) {
      double v = it->get<double>();
      if (v == static_cast<double>(static_cast<int64_t>(v)) && v >= 1 &&
          v <= 2147483647.0) {
        return static_cast<int>(v);
      }
    }
    throw ValidationError(std::string(key) + " must be a positive integer",
                          {{"field", key}});
  }
  int64_t v = it->get<int64_t>();
  if (v < 1 || v > 2147483647) {
    throw ValidationError(std::string(key) + " must be a positive integer",
                          {{"field", key}, {"value", v}});
  }
  return static_cast<int>(v);
}

inline bool bool_field(const nlohmann::json& j, const char* key, bool required,
                       bool fallback = false) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    if (required) {
      throw ValidationError(std::string(key) + " is required");
    }
    return fallback;
  }
  if (!it->is_boolean()) {
    throw ValidationError(std::string(key) + " must be a boolean",
                          {{"field", key}});
  }
  return it->get<bool>();
}

inline std::optional<std::string> string_field(const nlohmann::json& j,
                                               const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return std::nullopt;
  if (!it->is_string()) {
    throw ValidationError(std::string(key) + " must be a string",
                          {{"field", key}});
  }
  return it->get<std::string>();
}

}  // namespace detail

/**
 * Validate a record's shape and sequencing rules
 *
 * @param max_thought_length Upper bound on thought text length
 * @throws ValidationError on the first violated rule
 */
inline void validate_thought_record(const ThoughtRecord& t,
                                    size_t max_thought_length) {
  if (t.thought.empty() || detail::is_blank(t.thought)) {
    throw ValidationError("Thought is required and must be a non-empty string");
  }
  if (t.thought.size() > max_thought_length) {
    throw ValidationError(
        "Thought exceeds maximum length of " +
            std::to_string(max_thought_length) + " characters (actual: " +
            std::to_string(t.thought.size()) + ")",
        {{"maxLength", max_thought_length}, {"actualLength", t.thought.size()}});
  }
  if (t.thought_number < 1) {
    throw ValidationError("thoughtNumber must be a positive integer");
  }
  if (t.total_thoughts < 1) {
    throw ValidationError("totalThoughts must be a positive integer");
  }
  if (t.revises_thought && *t.revises_thought < 1) {
    throw ValidationError("revisesThought must be a positive integer");
  }
  if (t.branch_from_thought && *t.branch_from_thought < 1) {
    throw ValidationError("branchFromThought must be a positive integer");
  }
  if (t.is_revision && !t.revises_thought) {
    throw ValidationError("isRevision requires revisesThought to be specified");
  }
  if (t.branch_from_thought && (!t.branch_id || t.branch_id->empty())) {
    throw ValidationError("branchFromThought requires branchId to be specified");
  }
}

/**
 * Parse and validate a wire record
 *
 * Nothing is mutated on failure; the returned record is a fresh value.
 *
 * @throws ValidationError for missing or mistyped fields and rule violations
 */
inline ThoughtRecord parse_thought(const nlohmann::json& j,
                                   size_t max_thought_length) {
  if (!j.is_object()) {
    throw ValidationError("Thought record must be a JSON object");
  }

  ThoughtRecord t;
  auto text = detail::string_field(j, "thought");
  if (!text) {
    throw ValidationError("Thought is required and must be a non-empty string");
  }
  t.thought = *text;
  t.thought_number = detail::positive_int_field(j, "thoughtNumber", true);
  t.total_thoughts = detail::positive_int_field(j, "totalThoughts", true);
  t.next_thought_needed = detail::bool_field(j, "nextThoughtNeeded", true);
  t.is_revision = detail::bool_field(j, "isRevision", false);
  if (int v = detail::positive_int_field(j, "revisesThought", false)) {
    t.revises_thought = v;
  }
  if (int v = detail::positive_int_field(j, "branchFromThought", false)) {
    t.branch_from_thought = v;
  }
  t.branch_id = detail::string_field(j, "branchId");
  t.needs_more_thoughts = detail::bool_field(j, "needsMoreThoughts", false);
  t.session_id = detail::string_field(j, "sessionId");

  validate_thought_record(t, max_thought_length);
  return t;
}

}  // namespace trellis
