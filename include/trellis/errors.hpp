#pragma once

// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 Lloyal Labs

/**
 * @file errors.hpp
 * @brief Caller-facing error conditions
 *
 * Three kinds, each raised before any state is mutated:
 * - Validation: malformed input shape or out-of-range values (fix the input)
 * - Security:   rate limit, blocked content, malformed session id (back off)
 * - Tree:       session has no tree or the node id is absent (fix sequencing)
 *
 * All derive from trellis::Error (a std::runtime_error), so callers that do
 * not care about the kind can catch std::runtime_error as elsewhere.
 */

#include <nlohmann/json.hpp>

#include <ctime>
#include <stdexcept>
#include <string>
#include <utility>

namespace trellis {

enum class ErrorKind { Validation, Security, Tree };

inline const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::Validation: return "VALIDATION";
    case ErrorKind::Security: return "SECURITY";
    case ErrorKind::Tree: return "TREE";
  }
  return "VALIDATION";
}

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string& message,
        nlohmann::json details = nullptr)
      : std::runtime_error(message), kind_(kind), details_(std::move(details)) {}

  ErrorKind kind() const noexcept { return kind_; }

  /// Stable machine-readable code ("VALIDATION_ERROR", ...)
  std::string code() const {
    return std::string(error_kind_name(kind_)) + "_ERROR";
  }

  /// HTTP-like status: 400 validation, 403 security, 404 tree
  int status_code() const noexcept {
    switch (kind_) {
      case ErrorKind::Validation: return 400;
      case ErrorKind::Security: return 403;
      case ErrorKind::Tree: return 404;
    }
    return 400;
  }

  const nlohmann::json& details() const noexcept { return details_; }

  /**
   * Error envelope returned to callers
   *
   * {error, message, category, statusCode, details?, timestamp}
   */
  nlohmann::json to_json() const {
    nlohmann::json j = {
        {"error", code()},
        {"message", what()},
        {"category", error_kind_name(kind_)},
        {"statusCode", status_code()},
        {"timestamp", iso_timestamp()},
    };
    if (!details_.is_null()) {
      j["details"] = details_;
    }
    return j;
  }

private:
  static std::string iso_timestamp() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
  }

  ErrorKind kind_;
  nlohmann::json details_;
};

class ValidationError : public Error {
public:
  explicit ValidationError(const std::string& message,
                           nlohmann::json details = nullptr)
      : Error(ErrorKind::Validation, message, std::move(details)) {}
};

class SecurityError : public Error {
public:
  explicit SecurityError(const std::string& message,
                         nlohmann::json details = nullptr)
      : Error(ErrorKind::Security, message, std::move(details)) {}
};

class TreeError : public Error {
public:
  explicit TreeError(const std::string& message,
                     nlohmann::json details = nullptr)
      : Error(ErrorKind::Tree, message, std::move(details)) {}
};

}  // namespace trellis
