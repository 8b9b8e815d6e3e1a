/**
 * @file structured_log.h
 * @brief Structured logging utilities for container, index and migration events
 *
 * Every storage event goes through StructuredLog so that log lines can be
 * parsed by tooling. The helpers at the bottom cover the events emitted by
 * the container, the HNSW builder and the migration engine.
 */

#pragma once

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

namespace rvfstore::utils {

/**
 * @brief Log output format
 */
enum class LogFormat : std::uint8_t {
  JSON,  // {"event":"name","field":"value"}
  TEXT   // event=name field=value
};

/**
 * @brief One structured log line
 *
 * @code
 * StructuredLog()
 *   .Event("container_open")
 *   .Field("path", path)
 *   .Field("segments", static_cast<uint64_t>(count))
 *   .Info();
 * @endcode
 *
 * Fields keep insertion order. The output format is process-wide and set
 * with SetFormat().
 */
class StructuredLog {
 public:
  StructuredLog() = default;

  static void SetFormat(LogFormat format) { format_.store(format, std::memory_order_relaxed); }
  static LogFormat GetFormat() { return format_.load(std::memory_order_relaxed); }

  StructuredLog& Event(const std::string& event) {
    event_ = event;
    return *this;
  }

  StructuredLog& Field(const std::string& key, const char* value) { return Add(key, std::string(value)); }
  StructuredLog& Field(const std::string& key, const std::string& value) { return Add(key, value); }
  StructuredLog& Field(const std::string& key, int64_t value) { return Add(key, value); }
  StructuredLog& Field(const std::string& key, uint64_t value) { return Add(key, value); }
  StructuredLog& Field(const std::string& key, double value) { return Add(key, value); }
  StructuredLog& Field(const std::string& key, bool value) { return Add(key, value); }

  /// Human-readable context, emitted right after the event name
  StructuredLog& Message(const std::string& message) {
    message_ = message;
    return *this;
  }

  void Error() { spdlog::error("{}", Build()); }
  void Warn() { spdlog::warn("{}", Build()); }
  void Info() { spdlog::info("{}", Build()); }
  void Debug() { spdlog::debug("{}", Build()); }

  /**
   * @brief Rendered line in the current format
   */
  std::string Build() const {
    nlohmann::ordered_json line = nlohmann::ordered_json::object();
    if (!event_.empty()) {
      line["event"] = event_;
    }
    if (!message_.empty()) {
      line["message"] = message_;
    }
    for (auto field = fields_.begin(); field != fields_.end(); ++field) {
      line[field.key()] = field.value();
    }

    if (format_.load(std::memory_order_relaxed) == LogFormat::JSON) {
      return line.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
    }

    std::string text;
    for (auto field = line.begin(); field != line.end(); ++field) {
      if (!text.empty()) {
        text += ' ';
      }
      text += field.key();
      text += '=';
      text += field->is_string() ? QuoteText(field->get<std::string>()) : field->dump();
    }
    return text;
  }

 private:
  template <typename T>
  StructuredLog& Add(const std::string& key, T&& value) {
    fields_[key] = std::forward<T>(value);
    return *this;
  }

  /// Bare when the value has no spaces or quotes, otherwise quoted and escaped
  static std::string QuoteText(const std::string& value) {
    if (value.find_first_of(" \"\n\t\r") == std::string::npos && !value.empty()) {
      return value;
    }
    std::string quoted = "\"";
    for (char chr : value) {
      switch (chr) {
        case '"':
        case '\\':
          quoted += '\\';
          quoted += chr;
          break;
        case '\n':
          quoted += "\\n";
          break;
        case '\r':
          quoted += "\\r";
          break;
        case '\t':
          quoted += "\\t";
          break;
        default:
          quoted += chr;
      }
    }
    quoted += '"';
    return quoted;
  }

  std::string event_;
  std::string message_;
  nlohmann::ordered_json fields_ = nlohmann::ordered_json::object();
  static inline std::atomic<LogFormat> format_{LogFormat::JSON};
};

/**
 * @brief Log storage error in structured format
 */
inline void LogStorageError(const std::string& operation, const std::string& filepath, const std::string& error_msg) {
  StructuredLog()
      .Event("storage_error")
      .Field("operation", operation)
      .Field("filepath", filepath)
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log storage info in structured format
 */
inline void LogStorageInfo(const std::string& operation, const std::string& message) {
  StructuredLog().Event("storage_info").Field("operation", operation).Field("message", message).Info();
}

/**
 * @brief Log storage warning in structured format
 */
inline void LogStorageWarning(const std::string& operation, const std::string& message) {
  StructuredLog().Event("storage_warning").Field("operation", operation).Field("message", message).Warn();
}

/**
 * @brief Log a segment that failed its checksum or structural check
 */
inline void LogCorruptSegment(const std::string& filepath, const std::string& segment_id, const std::string& reason) {
  StructuredLog()
      .Event("corrupt_segment")
      .Field("filepath", filepath)
      .Field("segment", segment_id)
      .Field("reason", reason)
      .Error();
}

/**
 * @brief Log vector index error in structured format
 */
inline void LogVectorIndexError(const std::string& operation, const std::string& vector_id, uint32_t dimension,
                                const std::string& error_msg) {
  StructuredLog()
      .Event("vector_index_error")
      .Field("operation", operation)
      .Field("vector_id", vector_id)
      .Field("dimension", static_cast<uint64_t>(dimension))
      .Field("error", error_msg)
      .Error();
}

/**
 * @brief Log HNSW build progress
 */
inline void LogIndexProgress(uint64_t indexed, uint64_t total, uint32_t max_level) {
  StructuredLog()
      .Event("index_build_progress")
      .Field("indexed", indexed)
      .Field("total", total)
      .Field("max_level", static_cast<uint64_t>(max_level))
      .Debug();
}

/**
 * @brief Log migration state transition
 */
inline void LogMigrationEvent(const std::string& status, const std::string& source, const std::string& target,
                              const std::string& detail = "") {
  StructuredLog log;
  log.Event("migration").Field("status", status).Field("source", source).Field("target", target);
  if (!detail.empty()) {
    log.Field("detail", detail);
  }
  if (status == "failed") {
    log.Error();
  } else {
    log.Info();
  }
}

}  // namespace rvfstore::utils
