#pragma once

#include <map>
#include <string>
#include <utility>

namespace dsa::core {

/// Error categories: lets callers branch on the kind of failure without
/// parsing messages.
enum class ErrorCategory {
  Validation,   // Malformed schedule specification
  Registration, // Trigger could not be bound into the timer registry
  Execution,    // Task callback failed
  Network,      // HTTP/connection failures
  Timeout,      // Deadline exceeded
  Canceled,     // User or system cancellation
  Internal,     // Programming error / invariant violation
  Unknown
};

/// Structured error type shared by the parser, the engine and infra.
struct Error {
  ErrorCategory category = ErrorCategory::Unknown;
  int code = 0;          // Numeric code for log aggregation
  std::string message;   // Human-readable detail
  bool retryable = false;
  std::map<std::string, std::string> details; // e.g. "token" -> "24:00"

  Error() = default;

  Error(ErrorCategory cat, int c, std::string msg, bool retry = false,
        std::map<std::string, std::string> dets = {})
      : category(cat), code(c), message(std::move(msg)), retryable(retry),
        details(std::move(dets)) {}

  /// Detail lookup; empty string when absent.
  [[nodiscard]] std::string detail(const std::string &key) const {
    const auto it = details.find(key);
    return it == details.end() ? std::string() : it->second;
  }

  static Error Canceled(std::string msg = "Operation canceled") {
    return {ErrorCategory::Canceled, 1, std::move(msg)};
  }
  static Error Timeout(std::string msg = "Deadline exceeded") {
    return {ErrorCategory::Timeout, 2, std::move(msg), true};
  }
  static Error Internal(std::string msg) {
    return {ErrorCategory::Internal, 4, std::move(msg)};
  }
  /// Specification error; `token` names the offending piece of input.
  static Error Validation(std::string msg, std::string token) {
    return {ErrorCategory::Validation, 10, std::move(msg), false,
            {{"token", std::move(token)}}};
  }
  static Error Registration(std::string msg) {
    return {ErrorCategory::Registration, 11, std::move(msg)};
  }
  static Error Execution(std::string msg) {
    return {ErrorCategory::Execution, 12, std::move(msg)};
  }
};

/// Convert ErrorCategory to string for logging.
inline const char *to_string(ErrorCategory cat) {
  switch (cat) {
  case ErrorCategory::Validation:
    return "Validation";
  case ErrorCategory::Registration:
    return "Registration";
  case ErrorCategory::Execution:
    return "Execution";
  case ErrorCategory::Network:
    return "Network";
  case ErrorCategory::Timeout:
    return "Timeout";
  case ErrorCategory::Canceled:
    return "Canceled";
  case ErrorCategory::Internal:
    return "Internal";
  case ErrorCategory::Unknown:
    return "Unknown";
  }
  return "Unknown";
}

} // namespace dsa::core
