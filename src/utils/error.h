/**
 * @file error.h
 * @brief Error codes and error type used with Expected<T, Error>
 */

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace rvfstore::utils {

/**
 * @brief Error codes grouped by subsystem
 *
 * Values are stable; they are printed by the CLI and stored in
 * migration manifests as failure context.
 */
enum class ErrorCode : std::uint16_t {
  // General (0-99)
  kSuccess = 0,
  kUnknown = 1,
  kInvalidArgument = 2,
  kNotFound = 3,
  kAlreadyExists = 4,
  kOutOfRange = 5,
  kTimeout = 6,
  kInternalError = 7,
  kNotImplemented = 8,
  kInvalidState = 9,
  kCancelled = 10,
  kIOError = 11,

  // Configuration (100-199)
  kConfigFileNotFound = 100,
  kConfigParseError = 101,
  kConfigYamlError = 102,
  kConfigValidationError = 103,
  kConfigInvalidValue = 104,

  // Container / storage (200-299)
  kCorruptSegment = 200,
  kChecksumMismatch = 201,
  kUnsupportedVersion = 202,
  kLockHeld = 203,
  kReadOnly = 204,
  kStorageWriteError = 205,
  kStorageReadError = 206,

  // Vectors / index (300-399)
  kVectorDimensionMismatch = 300,
  kVectorNotFound = 301,
  kMetricMismatch = 302,
  kQuantizationError = 303,

  // Migration (400-499)
  kMigrationFailed = 400,
  kLegacyReadError = 401,
};

/**
 * @brief Stable name of an error code (e.g. "ChecksumMismatch")
 */
inline const char* ErrorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kSuccess:
      return "Success";
    case ErrorCode::kUnknown:
      return "Unknown";
    case ErrorCode::kInvalidArgument:
      return "InvalidArgument";
    case ErrorCode::kNotFound:
      return "NotFound";
    case ErrorCode::kAlreadyExists:
      return "AlreadyExists";
    case ErrorCode::kOutOfRange:
      return "OutOfRange";
    case ErrorCode::kTimeout:
      return "Timeout";
    case ErrorCode::kInternalError:
      return "InternalError";
    case ErrorCode::kNotImplemented:
      return "NotImplemented";
    case ErrorCode::kInvalidState:
      return "InvalidState";
    case ErrorCode::kCancelled:
      return "Cancelled";
    case ErrorCode::kIOError:
      return "IOError";
    case ErrorCode::kConfigFileNotFound:
      return "ConfigFileNotFound";
    case ErrorCode::kConfigParseError:
      return "ConfigParseError";
    case ErrorCode::kConfigYamlError:
      return "ConfigYamlError";
    case ErrorCode::kConfigValidationError:
      return "ConfigValidationError";
    case ErrorCode::kConfigInvalidValue:
      return "ConfigInvalidValue";
    case ErrorCode::kCorruptSegment:
      return "CorruptSegment";
    case ErrorCode::kChecksumMismatch:
      return "ChecksumMismatch";
    case ErrorCode::kUnsupportedVersion:
      return "UnsupportedVersion";
    case ErrorCode::kLockHeld:
      return "LockHeld";
    case ErrorCode::kReadOnly:
      return "ReadOnly";
    case ErrorCode::kStorageWriteError:
      return "StorageWriteError";
    case ErrorCode::kStorageReadError:
      return "StorageReadError";
    case ErrorCode::kVectorDimensionMismatch:
      return "VectorDimensionMismatch";
    case ErrorCode::kVectorNotFound:
      return "VectorNotFound";
    case ErrorCode::kMetricMismatch:
      return "MetricMismatch";
    case ErrorCode::kQuantizationError:
      return "QuantizationError";
    case ErrorCode::kMigrationFailed:
      return "MigrationFailed";
    case ErrorCode::kLegacyReadError:
      return "LegacyReadError";
  }
  return "Unknown";
}

/**
 * @brief Error value carried by Expected
 *
 * Holds a code, a human-readable message and optional context
 * (usually the file path or operation that failed).
 */
class Error {
 public:
  Error() = default;
  Error(ErrorCode code, std::string message, std::string context = "")
      : code_(code), message_(std::move(message)), context_(std::move(context)) {}

  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] const std::string& message() const { return message_; }
  [[nodiscard]] const std::string& context() const { return context_; }

  /**
   * @brief Format as "<CodeName>: <message> (<context>)"
   */
  [[nodiscard]] std::string to_string() const {
    std::string result = ErrorCodeToString(code_);
    if (!message_.empty()) {
      result += ": " + message_;
    }
    if (!context_.empty()) {
      result += " (" + context_ + ")";
    }
    return result;
  }

 private:
  ErrorCode code_ = ErrorCode::kUnknown;
  std::string message_;
  std::string context_;
};

/**
 * @brief Create an Error
 */
inline Error MakeError(ErrorCode code, std::string message = "", std::string context = "") {
  return Error(code, std::move(message), std::move(context));
}

}  // namespace rvfstore::utils
