/**
 * @file legacy_reader.cpp
 * @brief Legacy SQLite and JSON readers
 */

#include "migration/legacy_reader.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <initializer_list>
#include <fstream>
#include <sstream>

namespace rvfstore::migration {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

struct StatementFinalizer {
  void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

std::optional<std::string> ColumnString(sqlite3_stmt* stmt, int column) {
  int type = sqlite3_column_type(stmt, column);
  if (type == SQLITE_NULL) {
    return std::nullopt;
  }
  if (type == SQLITE_BLOB) {
    const void* blob = sqlite3_column_blob(stmt, column);
    int bytes = sqlite3_column_bytes(stmt, column);
    return std::string(static_cast<const char*>(blob), static_cast<size_t>(bytes));
  }
  const unsigned char* text = sqlite3_column_text(stmt, column);
  int bytes = sqlite3_column_bytes(stmt, column);
  return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(bytes));
}

std::optional<uint64_t> ColumnTimestamp(sqlite3_stmt* stmt, int column) {
  switch (sqlite3_column_type(stmt, column)) {
    case SQLITE_NULL:
      return std::nullopt;
    case SQLITE_INTEGER: {
      sqlite3_int64 value = sqlite3_column_int64(stmt, column);
      return value < 0 ? 0 : static_cast<uint64_t>(value);
    }
    case SQLITE_FLOAT: {
      double value = sqlite3_column_double(stmt, column);
      return value < 0 ? 0 : static_cast<uint64_t>(value);
    }
    default: {
      auto text = ColumnString(stmt, column);
      return text ? ParseLegacyTimestamp(nlohmann::json(*text)) : std::nullopt;
    }
  }
}

std::vector<std::string> SplitTags(const std::string& text) {
  std::vector<std::string> tags;
  std::stringstream stream(text);
  std::string tag;
  while (std::getline(stream, tag, ',')) {
    auto begin = tag.find_first_not_of(" \t");
    auto end = tag.find_last_not_of(" \t");
    if (begin != std::string::npos) {
      tags.push_back(tag.substr(begin, end - begin + 1));
    }
  }
  return tags;
}

/// Tags stored as a JSON array, or as comma-separated text by older writers
std::vector<std::string> ParseTags(const std::string& text) {
  if (text.empty()) {
    return {};
  }
  auto parsed = nlohmann::json::parse(text, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_array()) {
    return SplitTags(text);
  }
  std::vector<std::string> tags;
  for (const auto& item : parsed) {
    tags.push_back(item.is_string() ? item.get<std::string>() : item.dump());
  }
  return tags;
}

std::optional<std::vector<float>> ParseEmbeddingJson(const nlohmann::json& value) {
  if (!value.is_array() || value.empty()) {
    return std::nullopt;
  }
  std::vector<float> embedding;
  embedding.reserve(value.size());
  for (const auto& item : value) {
    if (!item.is_number()) {
      return std::nullopt;
    }
    embedding.push_back(item.get<float>());
  }
  return embedding;
}

/// Embedding column: float32 BLOB or JSON array text
std::optional<std::vector<float>> ColumnEmbedding(sqlite3_stmt* stmt, int column, const std::string& id) {
  int type = sqlite3_column_type(stmt, column);
  if (type == SQLITE_NULL) {
    return std::nullopt;
  }
  if (type == SQLITE_BLOB) {
    int bytes = sqlite3_column_bytes(stmt, column);
    if (bytes == 0) {
      return std::nullopt;
    }
    if (bytes % static_cast<int>(sizeof(float)) != 0) {
      spdlog::warn("Skipping embedding of '{}': BLOB size {} is not a multiple of 4", id, bytes);
      return std::nullopt;
    }
    std::vector<float> embedding(static_cast<size_t>(bytes) / sizeof(float));
    std::memcpy(embedding.data(), sqlite3_column_blob(stmt, column), static_cast<size_t>(bytes));
    return embedding;
  }
  auto text = ColumnString(stmt, column);
  if (!text || text->empty()) {
    return std::nullopt;
  }
  auto parsed = nlohmann::json::parse(*text, nullptr, false);
  auto embedding = parsed.is_discarded() ? std::nullopt : ParseEmbeddingJson(parsed);
  if (!embedding) {
    spdlog::warn("Skipping embedding of '{}': not a JSON array of numbers", id);
  }
  return embedding;
}

/// First member of @p object among @p names that is not null
const nlohmann::json* FindMember(const nlohmann::json& object, std::initializer_list<const char*> names) {
  for (const char* name : names) {
    auto iter = object.find(name);
    if (iter != object.end() && !iter->is_null()) {
      return &*iter;
    }
  }
  return nullptr;
}

std::string AsText(const nlohmann::json& value) { return value.is_string() ? value.get<std::string>() : value.dump(); }

}  // namespace

// ============================================================================
// Timestamps
// ============================================================================

std::optional<uint64_t> ParseLegacyTimestamp(const nlohmann::json& value) {
  if (value.is_number_unsigned()) {
    return value.get<uint64_t>();
  }
  if (value.is_number_integer()) {
    auto number = value.get<int64_t>();
    return number < 0 ? 0 : static_cast<uint64_t>(number);
  }
  if (value.is_number_float()) {
    auto number = value.get<double>();
    return number < 0 ? 0 : static_cast<uint64_t>(number);
  }
  if (!value.is_string()) {
    return std::nullopt;
  }

  const std::string text = value.get<std::string>();
  auto is_digit = [](unsigned char c) { return std::isdigit(c) != 0; };
  if (!text.empty() && text.size() <= 19 && std::all_of(text.begin(), text.end(), is_digit)) {
    return std::stoull(text);
  }

  // ISO-8601: YYYY-MM-DD[T ]HH:MM:SS[.fff][Z]
  std::tm parts{};
  int millis = 0;
  char separator = 'T';
  int matched = std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d", &parts.tm_year, &parts.tm_mon, &parts.tm_mday,
                            &separator, &parts.tm_hour, &parts.tm_min, &parts.tm_sec);
  if (matched < 3) {
    return std::nullopt;
  }
  if (matched < 7) {
    parts.tm_hour = parts.tm_min = parts.tm_sec = 0;
  }
  auto dot = text.find('.');
  if (matched == 7 && dot != std::string::npos) {
    std::string fraction;
    for (size_t i = dot + 1; i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])) != 0; ++i) {
      fraction.push_back(text[i]);
    }
    fraction.resize(3, '0');
    millis = std::stoi(fraction);
  }
  parts.tm_year -= 1900;
  parts.tm_mon -= 1;
  time_t seconds = timegm(&parts);
  if (seconds < 0) {
    return 0;
  }
  return static_cast<uint64_t>(seconds) * 1000 + static_cast<uint64_t>(millis);
}

// ============================================================================
// SQLite
// ============================================================================

Expected<SqliteLegacyReader, Error> SqliteLegacyReader::Open(const std::string& path) {
  sqlite3* raw = nullptr;
  int rc = sqlite3_open_v2(path.c_str(), &raw, SQLITE_OPEN_READONLY, nullptr);
  SqliteLegacyReader reader(path, raw);
  if (rc != SQLITE_OK) {
    return MakeUnexpected(reader.SqlError("open"));
  }
  if (!reader.TableExists("memory_entries")) {
    return MakeUnexpected(MakeError(ErrorCode::kLegacyReadError, "No memory_entries table", path));
  }
  return std::move(reader);
}

Error SqliteLegacyReader::SqlError(const std::string& what) const {
  const char* message = db_ != nullptr ? sqlite3_errmsg(db_.get()) : "out of memory";
  return MakeError(ErrorCode::kLegacyReadError, "SQLite " + what + " failed: " + message, path_);
}

bool SqliteLegacyReader::TableExists(const char* table) const {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_.get(), "SELECT 1 FROM sqlite_master WHERE type='table' AND name=?", -1, &raw,
                         nullptr) != SQLITE_OK) {
    return false;
  }
  Statement stmt(raw);
  sqlite3_bind_text(stmt.get(), 1, table, -1, SQLITE_STATIC);
  return sqlite3_step(stmt.get()) == SQLITE_ROW;
}

std::vector<std::string> SqliteLegacyReader::Columns(const char* table) const {
  std::vector<std::string> columns;
  sqlite3_stmt* raw = nullptr;
  std::string sql = std::string("PRAGMA table_info(") + table + ")";
  if (sqlite3_prepare_v2(db_.get(), sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    return columns;
  }
  Statement stmt(raw);
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    auto name = ColumnString(stmt.get(), 1);
    if (name) {
      columns.push_back(*name);
    }
  }
  return columns;
}

Expected<uint64_t, Error> SqliteLegacyReader::CountEntries() const {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_.get(), "SELECT COUNT(*) FROM memory_entries", -1, &raw, nullptr) != SQLITE_OK) {
    return MakeUnexpected(SqlError("count"));
  }
  Statement stmt(raw);
  if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
    return MakeUnexpected(SqlError("count"));
  }
  return static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 0));
}

Expected<void, Error> SqliteLegacyReader::ForEachEntry(const EntryVisitor& visitor) const {
  const auto columns = Columns("memory_entries");
  auto pick = [&columns](std::initializer_list<const char*> names) -> std::string {
    for (const char* name : names) {
      if (std::find(columns.begin(), columns.end(), name) != columns.end()) {
        return std::string("\"") + name + "\"";
      }
    }
    return "NULL";
  };

  // Result columns, in this order
  enum Column { kRowId, kId, kKey, kNamespace, kValue, kEmbedding, kTags, kCreated, kUpdated, kExpires };
  std::string sql = "SELECT rowid, " + pick({"id"}) + ", " + pick({"key"}) + ", " + pick({"namespace"}) + ", " +
                    pick({"content", "value"}) + ", " + pick({"embedding"}) + ", " + pick({"tags"}) + ", " +
                    pick({"created_at", "timestamp"}) + ", " + pick({"updated_at", "timestamp"}) + ", " +
                    pick({"expires_at"}) + " FROM memory_entries ORDER BY rowid";

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    return MakeUnexpected(SqlError("query"));
  }
  Statement stmt(raw);

  while (true) {
    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
      break;
    }
    if (rc != SQLITE_ROW) {
      return MakeUnexpected(SqlError("step"));
    }

    LegacyEntry entry;
    storage::KvRecord& record = entry.record;
    auto id = ColumnString(stmt.get(), kId);
    record.id = id && !id->empty() ? *id : "entry-" + std::to_string(sqlite3_column_int64(stmt.get(), kRowId));
    auto key = ColumnString(stmt.get(), kKey);
    record.key = key ? *key : record.id;
    auto ns = ColumnString(stmt.get(), kNamespace);
    record.ns = ns && !ns->empty() ? *ns : "default";
    record.value = ColumnString(stmt.get(), kValue).value_or("");
    auto tags = ColumnString(stmt.get(), kTags);
    if (tags) {
      record.tags = ParseTags(*tags);
    }
    record.created_at = ColumnTimestamp(stmt.get(), kCreated).value_or(0);
    record.updated_at = ColumnTimestamp(stmt.get(), kUpdated).value_or(record.created_at);
    record.expires_at = ColumnTimestamp(stmt.get(), kExpires);
    entry.embedding = ColumnEmbedding(stmt.get(), kEmbedding, record.id);

    auto visited = visitor(std::move(entry));
    if (!visited) {
      return visited;
    }
  }
  return {};
}

Expected<void, Error> SqliteLegacyReader::ForEachEvent(const EventVisitor& visitor) const {
  if (!TableExists("events")) {
    return {};
  }
  const auto columns = Columns("events");
  auto has = [&columns](const char* name) { return std::find(columns.begin(), columns.end(), name) != columns.end(); };
  const char* payload_column = has("payload") ? "payload" : (has("data") ? "data" : nullptr);
  const char* time_column = has("timestamp") ? "timestamp" : (has("created_at") ? "created_at" : nullptr);
  if (payload_column == nullptr) {
    spdlog::warn("Table events in {} has no payload column; events not migrated", path_);
    return {};
  }

  std::string sql = std::string("SELECT \"") + payload_column + "\", " +
                    (time_column != nullptr ? std::string("\"") + time_column + "\"" : std::string("NULL")) +
                    " FROM events ORDER BY rowid";
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_.get(), sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    return MakeUnexpected(SqlError("query"));
  }
  Statement stmt(raw);

  while (true) {
    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
      break;
    }
    if (rc != SQLITE_ROW) {
      return MakeUnexpected(SqlError("step"));
    }
    LegacyEvent event;
    event.payload = ColumnString(stmt.get(), 0).value_or("");
    event.timestamp = ColumnTimestamp(stmt.get(), 1).value_or(0);
    auto visited = visitor(std::move(event));
    if (!visited) {
      return visited;
    }
  }
  return {};
}

// ============================================================================
// JSON
// ============================================================================

Expected<JsonLegacyReader, Error> JsonLegacyReader::Open(const std::string& path) {
  std::ifstream input_stream(path, std::ios::binary);
  if (!input_stream) {
    return MakeUnexpected(MakeError(ErrorCode::kLegacyReadError, "Failed to open file for reading", path));
  }
  std::stringstream buffer;
  buffer << input_stream.rdbuf();
  std::string text = buffer.str();

  if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
    return JsonLegacyReader(path, nlohmann::json::object());
  }

  try {
    auto document = nlohmann::json::parse(text);
    if (!document.is_object() && !document.is_array()) {
      return MakeUnexpected(MakeError(ErrorCode::kLegacyReadError, "Top-level JSON value must be an object or array",
                                      path));
    }
    return JsonLegacyReader(path, std::move(document));
  } catch (const nlohmann::json::parse_error& e) {
    return MakeUnexpected(MakeError(ErrorCode::kLegacyReadError, std::string("JSON parse error: ") + e.what(), path));
  }
}

Expected<LegacyEntry, Error> JsonLegacyReader::ParseEntry(const nlohmann::json& item, const std::string& ns,
                                                          size_t position) const {
  const std::string where = "entry " + std::to_string(position);
  if (!item.is_object()) {
    return MakeUnexpected(MakeError(ErrorCode::kLegacyReadError, where + " is not an object", path_));
  }

  LegacyEntry entry;
  storage::KvRecord& record = entry.record;

  const auto* item_ns = FindMember(item, {"namespace"});
  record.ns = item_ns != nullptr && item_ns->is_string() ? item_ns->get<std::string>() : ns;
  if (record.ns.empty()) {
    record.ns = "default";
  }

  const auto* key = FindMember(item, {"key"});
  const auto* id = FindMember(item, {"id"});
  if (key == nullptr && id == nullptr) {
    return MakeUnexpected(MakeError(ErrorCode::kLegacyReadError, where + " has neither key nor id", path_));
  }
  record.key = key != nullptr ? AsText(*key) : AsText(*id);
  record.id = id != nullptr ? AsText(*id) : record.ns + ":" + record.key;

  if (const auto* value = FindMember(item, {"value", "content"})) {
    record.value = AsText(*value);
  }

  const auto* tags = FindMember(item, {"tags"});
  if (tags == nullptr) {
    const auto* metadata = FindMember(item, {"metadata"});
    if (metadata != nullptr && metadata->is_object()) {
      tags = FindMember(*metadata, {"tags"});
    }
  }
  if (tags != nullptr && tags->is_array()) {
    for (const auto& tag : *tags) {
      record.tags.push_back(AsText(tag));
    }
  } else if (tags != nullptr && tags->is_string()) {
    record.tags = SplitTags(tags->get<std::string>());
  }

  if (const auto* created = FindMember(item, {"created_at", "createdAt", "timestamp"})) {
    record.created_at = ParseLegacyTimestamp(*created).value_or(0);
  }
  record.updated_at = record.created_at;
  if (const auto* updated = FindMember(item, {"updated_at", "updatedAt"})) {
    record.updated_at = ParseLegacyTimestamp(*updated).value_or(record.created_at);
  }
  if (const auto* expires = FindMember(item, {"expires_at", "expiresAt"})) {
    record.expires_at = ParseLegacyTimestamp(*expires);
  }

  if (const auto* embedding = FindMember(item, {"embedding"})) {
    entry.embedding = ParseEmbeddingJson(*embedding);
    if (!entry.embedding) {
      spdlog::warn("Skipping embedding of '{}': not a JSON array of numbers", record.id);
    }
  }
  return entry;
}

Expected<uint64_t, Error> JsonLegacyReader::CountEntries() const {
  uint64_t count = 0;
  auto counted = ForEachEntry([&count](LegacyEntry&&) -> Expected<void, Error> {
    ++count;
    return {};
  });
  if (!counted) {
    return MakeUnexpected(counted.error());
  }
  return count;
}

Expected<void, Error> JsonLegacyReader::ForEachEntry(const EntryVisitor& visitor) const {
  size_t position = 0;
  auto visit_array = [&](const nlohmann::json& entries, const std::string& ns) -> Expected<void, Error> {
    for (const auto& item : entries) {
      auto entry = ParseEntry(item, ns, position++);
      if (!entry) {
        return MakeUnexpected(entry.error());
      }
      auto visited = visitor(std::move(*entry));
      if (!visited) {
        return visited;
      }
    }
    return {};
  };

  if (document_.is_array()) {
    return visit_array(document_, "default");
  }

  auto entries = document_.find("entries");
  if (entries != document_.end() && entries->is_array()) {
    return visit_array(*entries, "default");
  }

  // nlohmann::json objects iterate in key order
  for (auto iter = document_.begin(); iter != document_.end(); ++iter) {
    if (!iter.value().is_array()) {
      return MakeUnexpected(
          MakeError(ErrorCode::kLegacyReadError, "Namespace '" + iter.key() + "' does not hold an array", path_));
    }
    auto visited = visit_array(iter.value(), iter.key());
    if (!visited) {
      return visited;
    }
  }
  return {};
}

Expected<void, Error> JsonLegacyReader::ForEachEvent(const EventVisitor& visitor) const {
  if (!document_.is_object() || document_.find("entries") == document_.end()) {
    return {};
  }
  auto events = document_.find("events");
  if (events == document_.end() || !events->is_array()) {
    return {};
  }
  for (const auto& item : *events) {
    LegacyEvent event;
    if (item.is_object()) {
      if (const auto* payload = FindMember(item, {"payload", "data"})) {
        event.payload = AsText(*payload);
      }
      if (const auto* timestamp = FindMember(item, {"timestamp", "created_at"})) {
        event.timestamp = ParseLegacyTimestamp(*timestamp).value_or(0);
      }
    } else {
      event.payload = AsText(item);
    }
    auto visited = visitor(std::move(event));
    if (!visited) {
      return visited;
    }
  }
  return {};
}

// ============================================================================
// Dispatch
// ============================================================================

Expected<LegacySource, Error> OpenLegacySource(const std::string& path, StoreFormat format) {
  switch (format) {
    case StoreFormat::kLegacyRelational: {
      auto reader = SqliteLegacyReader::Open(path);
      if (!reader) {
        return MakeUnexpected(reader.error());
      }
      return LegacySource(std::move(*reader));
    }
    case StoreFormat::kLegacyFlatFile: {
      auto reader = JsonLegacyReader::Open(path);
      if (!reader) {
        return MakeUnexpected(reader.error());
      }
      return LegacySource(std::move(*reader));
    }
    default:
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument,
                                      std::string("Not a legacy format: ") + FormatName(format), path));
  }
}

Expected<uint64_t, Error> CountEntries(const LegacySource& source) {
  return std::visit([](const auto& reader) { return reader.CountEntries(); }, source);
}

Expected<void, Error> ForEachEntry(const LegacySource& source, const EntryVisitor& visitor) {
  return std::visit([&visitor](const auto& reader) { return reader.ForEachEntry(visitor); }, source);
}

Expected<void, Error> ForEachEvent(const LegacySource& source, const EventVisitor& visitor) {
  return std::visit([&visitor](const auto& reader) { return reader.ForEachEvent(visitor); }, source);
}

}  // namespace rvfstore::migration
