/**
 * @file legacy_reader_test.cpp
 * @brief Unit tests for the legacy SQLite and JSON readers
 */

#include "migration/legacy_reader.h"

#include <gtest/gtest.h>

#include "migration/legacy_fixtures.h"
#include "test_helpers.h"

namespace rvfstore::migration {
namespace {

using rvfstore::testing::ExecSql;
using rvfstore::testing::FixtureEntry;
using rvfstore::testing::OpenSqlite;
using rvfstore::testing::ReadFileBytes;
using rvfstore::testing::TempDir;
using rvfstore::testing::WriteFileBytes;
using utils::Error;
using utils::Expected;

std::vector<LegacyEntry> CollectEntries(const LegacySource& source) {
  std::vector<LegacyEntry> entries;
  auto read = ForEachEntry(source, [&entries](LegacyEntry&& entry) -> Expected<void, Error> {
    entries.push_back(std::move(entry));
    return {};
  });
  EXPECT_TRUE(read) << read.error().to_string();
  return entries;
}

std::vector<LegacyEvent> CollectEvents(const LegacySource& source) {
  std::vector<LegacyEvent> events;
  auto read = ForEachEvent(source, [&events](LegacyEvent&& event) -> Expected<void, Error> {
    events.push_back(std::move(event));
    return {};
  });
  EXPECT_TRUE(read) << read.error().to_string();
  return events;
}

class LegacyReaderTest : public ::testing::Test {
 protected:
  TempDir dir_;
};

// ============================================================================
// SQLite
// ============================================================================

TEST_F(LegacyReaderTest, SqliteCurrentSchema) {
  FixtureEntry first;
  first.id = "a";
  first.key = "greeting";
  first.ns = "notes";
  first.content = "hello";
  first.tags = "[\"x\",\"y\"]";
  first.created_at = 1000;
  first.updated_at = 2000;
  first.expires_at = 9000;
  first.embedding = std::vector<float>{0.5F, -0.25F, 1.0F};

  FixtureEntry second;
  second.id = "b";
  second.key = "plain";
  second.content = "no vector";
  second.tags = "alpha, beta ,gamma";

  const std::string path = dir_.File("memory.db");
  rvfstore::testing::WriteSqliteStore(path, {first, second}, {{"created a", 1500}, {"created b", 2500}});

  auto source = OpenLegacySource(path, StoreFormat::kLegacyRelational);
  ASSERT_TRUE(source) << source.error().to_string();
  auto count = CountEntries(*source);
  ASSERT_TRUE(count);
  EXPECT_EQ(*count, 2U);

  auto entries = CollectEntries(*source);
  ASSERT_EQ(entries.size(), 2U);

  const auto& a = entries[0].record;
  EXPECT_EQ(a.id, "a");
  EXPECT_EQ(a.key, "greeting");
  EXPECT_EQ(a.ns, "notes");
  EXPECT_EQ(a.value, "hello");
  EXPECT_EQ(a.tags, (std::vector<std::string>{"x", "y"}));
  EXPECT_EQ(a.created_at, 1000U);
  EXPECT_EQ(a.updated_at, 2000U);
  EXPECT_EQ(a.expires_at, std::optional<uint64_t>(9000));
  ASSERT_TRUE(entries[0].embedding.has_value());
  EXPECT_EQ(*entries[0].embedding, (std::vector<float>{0.5F, -0.25F, 1.0F}));

  const auto& b = entries[1].record;
  EXPECT_EQ(b.ns, "default");
  EXPECT_EQ(b.tags, (std::vector<std::string>{"alpha", "beta", "gamma"}));
  EXPECT_FALSE(b.expires_at.has_value());
  EXPECT_FALSE(entries[1].embedding.has_value());

  auto events = CollectEvents(*source);
  ASSERT_EQ(events.size(), 2U);
  EXPECT_EQ(events[0].payload, "created a");
  EXPECT_EQ(events[1].timestamp, 2500U);
}

TEST_F(LegacyReaderTest, SqliteOlderSchema) {
  const std::string path = dir_.File("old.db");
  {
    auto db = OpenSqlite(path);
    ExecSql(db.get(), "CREATE TABLE memory_entries (key TEXT, value TEXT, namespace TEXT, timestamp TEXT)");
    ExecSql(db.get(),
            "INSERT INTO memory_entries VALUES ('k1', 'v1', NULL, '2024-01-02T03:04:05.678Z'), "
            "('k2', 'v2', 'ops', '1700000000000')");
    ExecSql(db.get(), "CREATE TABLE events (data TEXT, created_at INTEGER)");
    ExecSql(db.get(), "INSERT INTO events VALUES ('{\"type\":\"boot\"}', 42)");
  }

  auto source = OpenLegacySource(path, StoreFormat::kLegacyRelational);
  ASSERT_TRUE(source) << source.error().to_string();
  auto entries = CollectEntries(*source);
  ASSERT_EQ(entries.size(), 2U);

  EXPECT_EQ(entries[0].record.id, "entry-1");
  EXPECT_EQ(entries[0].record.key, "k1");
  EXPECT_EQ(entries[0].record.ns, "default");
  EXPECT_EQ(entries[0].record.value, "v1");
  EXPECT_EQ(entries[0].record.created_at, 1704164645678U);
  EXPECT_EQ(entries[0].record.updated_at, 1704164645678U);
  EXPECT_EQ(entries[1].record.ns, "ops");
  EXPECT_EQ(entries[1].record.created_at, 1700000000000U);

  auto events = CollectEvents(*source);
  ASSERT_EQ(events.size(), 1U);
  EXPECT_EQ(events[0].payload, "{\"type\":\"boot\"}");
  EXPECT_EQ(events[0].timestamp, 42U);
}

TEST_F(LegacyReaderTest, SqliteJsonTextEmbedding) {
  const std::string path = dir_.File("text.db");
  {
    auto db = OpenSqlite(path);
    ExecSql(db.get(), "CREATE TABLE memory_entries (id TEXT, key TEXT, content TEXT, embedding TEXT)");
    ExecSql(db.get(),
            "INSERT INTO memory_entries VALUES ('a', 'a', 'x', '[1.5, 2, -3]'), ('b', 'b', 'y', 'not json')");
  }

  auto source = OpenLegacySource(path, StoreFormat::kLegacyRelational);
  ASSERT_TRUE(source);
  auto entries = CollectEntries(*source);
  ASSERT_EQ(entries.size(), 2U);
  ASSERT_TRUE(entries[0].embedding.has_value());
  EXPECT_EQ(*entries[0].embedding, (std::vector<float>{1.5F, 2.0F, -3.0F}));
  EXPECT_FALSE(entries[1].embedding.has_value());
  EXPECT_TRUE(CollectEvents(*source).empty());
}

TEST_F(LegacyReaderTest, SqliteWithoutEntriesTable) {
  const std::string path = dir_.File("other.db");
  {
    auto db = OpenSqlite(path);
    ExecSql(db.get(), "CREATE TABLE something_else (x INTEGER)");
  }
  auto source = OpenLegacySource(path, StoreFormat::kLegacyRelational);
  ASSERT_FALSE(source);
  EXPECT_EQ(source.error().code(), utils::ErrorCode::kLegacyReadError);
}

TEST_F(LegacyReaderTest, SqliteReaderNeverWrites) {
  const std::string path = dir_.File("memory.db");
  rvfstore::testing::WriteSqliteStore(path, rvfstore::testing::MakeEntries(10, 5, 4));
  const std::string before = ReadFileBytes(path);

  auto source = OpenLegacySource(path, StoreFormat::kLegacyRelational);
  ASSERT_TRUE(source);
  EXPECT_EQ(CollectEntries(*source).size(), 10U);
  EXPECT_EQ(ReadFileBytes(path), before);
}

TEST_F(LegacyReaderTest, VisitorErrorStopsIteration) {
  const std::string path = dir_.File("memory.db");
  rvfstore::testing::WriteSqliteStore(path, rvfstore::testing::MakeEntries(10, 0, 4));
  auto source = OpenLegacySource(path, StoreFormat::kLegacyRelational);
  ASSERT_TRUE(source);

  size_t seen = 0;
  auto read = ForEachEntry(*source, [&seen](LegacyEntry&&) -> Expected<void, Error> {
    if (++seen == 3) {
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kCancelled, "cancelled"));
    }
    return {};
  });
  ASSERT_FALSE(read);
  EXPECT_EQ(read.error().code(), utils::ErrorCode::kCancelled);
  EXPECT_EQ(seen, 3U);
}

// ============================================================================
// JSON
// ============================================================================

TEST_F(LegacyReaderTest, JsonNamespaceLayout) {
  const std::string path = dir_.File("memory.json");
  WriteFileBytes(path, R"({
    "zeta": [{"key": "z1", "value": "last"}],
    "alpha": [
      {"key": "a1", "content": {"nested": true}, "metadata": {"tags": ["m"]}, "createdAt": 5},
      {"id": "custom", "key": "a2", "value": "x", "embedding": [1, 2]}
    ]
  })");

  auto source = OpenLegacySource(path, StoreFormat::kLegacyFlatFile);
  ASSERT_TRUE(source) << source.error().to_string();
  auto entries = CollectEntries(*source);
  ASSERT_EQ(entries.size(), 3U);

  // Namespaces are visited in key order
  EXPECT_EQ(entries[0].record.ns, "alpha");
  EXPECT_EQ(entries[0].record.id, "alpha:a1");
  EXPECT_EQ(entries[0].record.value, "{\"nested\":true}");
  EXPECT_EQ(entries[0].record.tags, (std::vector<std::string>{"m"}));
  EXPECT_EQ(entries[0].record.created_at, 5U);
  EXPECT_EQ(entries[0].record.updated_at, 5U);
  EXPECT_EQ(entries[1].record.id, "custom");
  ASSERT_TRUE(entries[1].embedding.has_value());
  EXPECT_EQ(entries[1].embedding->size(), 2U);
  EXPECT_EQ(entries[2].record.ns, "zeta");
  EXPECT_TRUE(CollectEvents(*source).empty());
}

TEST_F(LegacyReaderTest, JsonArrayLayout) {
  const std::string path = dir_.File("memory.json");
  WriteFileBytes(path, R"([{"key": "k", "namespace": "ops", "value": 7, "tags": "a,b"}])");

  auto source = OpenLegacySource(path, StoreFormat::kLegacyFlatFile);
  ASSERT_TRUE(source);
  auto entries = CollectEntries(*source);
  ASSERT_EQ(entries.size(), 1U);
  EXPECT_EQ(entries[0].record.ns, "ops");
  EXPECT_EQ(entries[0].record.id, "ops:k");
  EXPECT_EQ(entries[0].record.value, "7");
  EXPECT_EQ(entries[0].record.tags, (std::vector<std::string>{"a", "b"}));
}

TEST_F(LegacyReaderTest, JsonEntriesAndEvents) {
  const std::string path = dir_.File("memory.json");
  FixtureEntry entry;
  entry.id = "e1";
  entry.key = "k1";
  entry.content = "v";
  entry.created_at = 10;
  entry.updated_at = 20;
  entry.expires_at = 30;
  rvfstore::testing::WriteJsonStore(path, rvfstore::testing::MakeJsonDocument({entry}, {{"first", 11}, {"second", 12}}));

  auto source = OpenLegacySource(path, StoreFormat::kLegacyFlatFile);
  ASSERT_TRUE(source);
  auto count = CountEntries(*source);
  ASSERT_TRUE(count);
  EXPECT_EQ(*count, 1U);

  auto entries = CollectEntries(*source);
  ASSERT_EQ(entries.size(), 1U);
  EXPECT_EQ(entries[0].record.updated_at, 20U);
  EXPECT_EQ(entries[0].record.expires_at, std::optional<uint64_t>(30));

  auto events = CollectEvents(*source);
  ASSERT_EQ(events.size(), 2U);
  EXPECT_EQ(events[0].payload, "first");
  EXPECT_EQ(events[1].timestamp, 12U);
}

TEST_F(LegacyReaderTest, JsonBlankFileIsEmptyStore) {
  const std::string path = dir_.File("empty.json");
  WriteFileBytes(path, "\n");
  auto source = OpenLegacySource(path, StoreFormat::kLegacyFlatFile);
  ASSERT_TRUE(source);
  EXPECT_TRUE(CollectEntries(*source).empty());
}

TEST_F(LegacyReaderTest, JsonErrors) {
  const std::string broken = dir_.File("broken.json");
  WriteFileBytes(broken, "{\"default\": [");
  auto parse_error = OpenLegacySource(broken, StoreFormat::kLegacyFlatFile);
  ASSERT_FALSE(parse_error);
  EXPECT_EQ(parse_error.error().code(), utils::ErrorCode::kLegacyReadError);

  const std::string keyless = dir_.File("keyless.json");
  WriteFileBytes(keyless, R"([{"value": "orphan"}])");
  auto source = OpenLegacySource(keyless, StoreFormat::kLegacyFlatFile);
  ASSERT_TRUE(source);
  auto read = ForEachEntry(*source, [](LegacyEntry&&) -> Expected<void, Error> { return {}; });
  ASSERT_FALSE(read);
  EXPECT_EQ(read.error().code(), utils::ErrorCode::kLegacyReadError);

  const std::string scalar_ns = dir_.File("scalar.json");
  WriteFileBytes(scalar_ns, R"({"default": 5})");
  auto scalar = OpenLegacySource(scalar_ns, StoreFormat::kLegacyFlatFile);
  ASSERT_TRUE(scalar);
  EXPECT_FALSE(CountEntries(*scalar));
}

TEST_F(LegacyReaderTest, NativeFormatIsNotLegacy) {
  auto source = OpenLegacySource(dir_.File("x.rvf"), StoreFormat::kNativeContainer);
  ASSERT_FALSE(source);
  EXPECT_EQ(source.error().code(), utils::ErrorCode::kInvalidArgument);
}

// ============================================================================
// Timestamps
// ============================================================================

TEST(LegacyTimestampTest, Formats) {
  EXPECT_EQ(ParseLegacyTimestamp(nlohmann::json(1700000000000ULL)), 1700000000000ULL);
  EXPECT_EQ(ParseLegacyTimestamp(nlohmann::json(-5)), 0U);
  EXPECT_EQ(ParseLegacyTimestamp(nlohmann::json(12.9)), 12U);
  EXPECT_EQ(ParseLegacyTimestamp(nlohmann::json("1700000000000")), 1700000000000ULL);
  EXPECT_EQ(ParseLegacyTimestamp(nlohmann::json("2024-01-02T03:04:05.678Z")), 1704164645678ULL);
  EXPECT_EQ(ParseLegacyTimestamp(nlohmann::json("2024-01-02 03:04:05")), 1704164645000ULL);
  EXPECT_EQ(ParseLegacyTimestamp(nlohmann::json("2023-11-14")), 1699920000000ULL);
  EXPECT_FALSE(ParseLegacyTimestamp(nlohmann::json("yesterday")).has_value());
  EXPECT_FALSE(ParseLegacyTimestamp(nlohmann::json(true)).has_value());
}

}  // namespace
}  // namespace rvfstore::migration
