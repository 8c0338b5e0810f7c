#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file common.hpp
 * @brief Logging macros and the millisecond clock shared by every component
 *
 * Logging follows one line per event, tagged with the component and the
 * operation that emitted it:
 *
 *   TRELLIS_LOG_WARN("[security::compile] Skipping malformed pattern '%s'", p);
 *
 * Levels below the runtime threshold (default: warn) are dropped. DEBUG
 * lines compile away entirely unless TRELLIS_DEBUG is defined.
 *
 * Time-dependent components take a ClockFn so tests can drive time by hand.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <random>
#include <string>

namespace trellis {

// ============================================================================
// Clock
// ============================================================================

/// Milliseconds since the Unix epoch
using TimestampMs = int64_t;

/// Injectable time source (tests substitute a manual clock)
using ClockFn = std::function<TimestampMs()>;

inline TimestampMs now_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

inline ClockFn system_clock() { return &now_ms; }

// ============================================================================
// Identifiers
// ============================================================================

/// Random RFC 4122 version-4 UUID, lowercase hex
inline std::string uuid_v4() {
  thread_local std::mt19937_64 rng{std::random_device{}()};
  uint64_t hi = rng();
  uint64_t lo = rng();
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // variant 10

  static const char hex[] = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (int i = 0; i < 32; ++i) {
    if (i == 8 || i == 12 || i == 16 || i == 20) out.push_back('-');
    uint64_t word = i < 16 ? hi : lo;
    int shift = 60 - 4 * (i % 16);
    out.push_back(hex[(word >> shift) & 0xF]);
  }
  return out;
}

// ============================================================================
// Logging
// ============================================================================

namespace log {

enum class Level : int { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

namespace detail {
inline std::atomic<int>& threshold() {
  static std::atomic<int> level{static_cast<int>(Level::Warn)};
  return level;
}
}  // namespace detail

inline void set_level(Level level) {
  detail::threshold().store(static_cast<int>(level));
}

inline Level get_level() {
  return static_cast<Level>(detail::threshold().load());
}

inline bool enabled(Level level) {
  return static_cast<int>(level) >= detail::threshold().load();
}

/**
 * Parse a level name ("debug", "info", "warn", "error", "off")
 *
 * @return Parsed level, or `fallback` for unknown names
 */
inline Level parse_level(const std::string& name, Level fallback = Level::Warn) {
  if (name == "debug") return Level::Debug;
  if (name == "info") return Level::Info;
  if (name == "warn") return Level::Warn;
  if (name == "error") return Level::Error;
  if (name == "off") return Level::Off;
  return fallback;
}

inline const char* level_name(Level level) {
  switch (level) {
    case Level::Debug: return "debug";
    case Level::Info: return "info";
    case Level::Warn: return "warn";
    case Level::Error: return "error";
    case Level::Off: return "off";
  }
  return "warn";
}

}  // namespace log
}  // namespace trellis

#define TRELLIS_LOG_AT(lvl, tag, ...)                                   \
  do {                                                                  \
    if (::trellis::log::enabled(lvl)) {                                 \
      std::fprintf(stderr, "trellis %s ", tag);                         \
      std::fprintf(stderr, __VA_ARGS__);                                \
      std::fputc('\n', stderr);                                         \
    }                                                                   \
  } while (0)

#ifdef TRELLIS_DEBUG
#define TRELLIS_LOG_DEBUG(...) \
  TRELLIS_LOG_AT(::trellis::log::Level::Debug, "DEBUG", __VA_ARGS__)
#else
#define TRELLIS_LOG_DEBUG(...) ((void)0)
#endif

#define TRELLIS_LOG_INFO(...) \
  TRELLIS_LOG_AT(::trellis::log::Level::Info, "INFO ", __VA_ARGS__)
#define TRELLIS_LOG_WARN(...) \
  TRELLIS_LOG_AT(::trellis::log::Level::Warn, "WARN ", __VA_ARGS__)
#define TRELLIS_LOG_ERROR(...) \
  TRELLIS_LOG_AT(::trellis::log::Level::Error, "ERROR", __VA_ARGS__)
