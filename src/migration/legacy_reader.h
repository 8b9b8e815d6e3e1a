/**
 * @file legacy_reader.h
 * @brief Readers for the legacy SQLite and JSON memory stores
 *
 * Both readers stream entries in source order (SQLite rowid order, JSON
 * document order) and never write to the source file.
 */

#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "migration/format_detector.h"
#include "storage/segment_codec.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace rvfstore::migration {

/**
 * @brief One legacy memory entry
 */
struct LegacyEntry {
  storage::KvRecord record;
  std::optional<std::vector<float>> embedding;
};

/**
 * @brief One legacy event (becomes a LOG record)
 */
struct LegacyEvent {
  uint64_t timestamp = 0;
  std::string payload;
};

/// Callback return value stops the iteration when it holds an error
using EntryVisitor = std::function<utils::Expected<void, utils::Error>(LegacyEntry&&)>;
using EventVisitor = std::function<utils::Expected<void, utils::Error>(LegacyEvent&&)>;

/**
 * @brief SQLite store: table memory_entries, optional table events
 *
 * Column names follow the newest legacy schema (id, key, namespace,
 * content, embedding, tags, created_at, updated_at, expires_at); the
 * older schema (key, value, namespace, timestamp) is accepted too.
 */
class SqliteLegacyReader {
 public:
  static utils::Expected<SqliteLegacyReader, utils::Error> Open(const std::string& path);

  utils::Expected<uint64_t, utils::Error> CountEntries() const;
  utils::Expected<void, utils::Error> ForEachEntry(const EntryVisitor& visitor) const;
  utils::Expected<void, utils::Error> ForEachEvent(const EventVisitor& visitor) const;

  [[nodiscard]] const std::string& path() const { return path_; }

 private:
  struct Closer {
    void operator()(sqlite3* db) const { sqlite3_close(db); }
  };

  SqliteLegacyReader(std::string path, sqlite3* db) : path_(std::move(path)), db_(db) {}

  bool TableExists(const char* table) const;
  std::vector<std::string> Columns(const char* table) const;
  utils::Error SqlError(const std::string& what) const;

  std::string path_;
  std::unique_ptr<sqlite3, Closer> db_;
};

/**
 * @brief JSON store
 *
 * Accepted layouts:
 * - {"<namespace>": [entry, ...], ...}
 * - [entry, ...]
 * - {"entries": [entry, ...], "events": [event, ...]}
 */
class JsonLegacyReader {
 public:
  static utils::Expected<JsonLegacyReader, utils::Error> Open(const std::string& path);

  utils::Expected<uint64_t, utils::Error> CountEntries() const;
  utils::Expected<void, utils::Error> ForEachEntry(const EntryVisitor& visitor) const;
  utils::Expected<void, utils::Error> ForEachEvent(const EventVisitor& visitor) const;

  [[nodiscard]] const std::string& path() const { return path_; }

 private:
  JsonLegacyReader(std::string path, nlohmann::json document)
      : path_(std::move(path)), document_(std::move(document)) {}

  utils::Expected<LegacyEntry, utils::Error> ParseEntry(const nlohmann::json& item, const std::string& ns,
                                                        size_t position) const;

  std::string path_;
  nlohmann::json document_;
};

/**
 * @brief Reader chosen by format
 */
using LegacySource = std::variant<SqliteLegacyReader, JsonLegacyReader>;

/**
 * @brief Open the reader matching @p format
 * @return kInvalidArgument for non-legacy formats, kLegacyReadError if unreadable
 */
utils::Expected<LegacySource, utils::Error> OpenLegacySource(const std::string& path, StoreFormat format);

utils::Expected<uint64_t, utils::Error> CountEntries(const LegacySource& source);
utils::Expected<void, utils::Error> ForEachEntry(const LegacySource& source, const EntryVisitor& visitor);
utils::Expected<void, utils::Error> ForEachEvent(const LegacySource& source, const EventVisitor& visitor);

/**
 * @brief Parse a timestamp given as epoch milliseconds or ISO-8601 text
 */
std::optional<uint64_t> ParseLegacyTimestamp(const nlohmann::json& value);

}  // namespace rvfstore::migration
