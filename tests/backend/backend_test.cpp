/**
 * @file backend_test.cpp
 * @brief Native and legacy backends and the OpenBackend() facade
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <map>

#include "backend/backend_facade.h"
#include "backend/legacy_backend.h"
#include "backend/native_backend.h"
#include "migration/legacy_fixtures.h"
#include "test_helpers.h"

namespace rvfstore::backend {
namespace {

using rvfstore::testing::MakeEntries;
using rvfstore::testing::ReadFileBytes;
using rvfstore::testing::TempDir;
using rvfstore::testing::WriteFileBytes;
using rvfstore::testing::WriteSqliteStore;

BackendOptions SmallOptions() {
  BackendOptions options;
  options.fsync = false;
  options.vectors.id_width = 16;
  options.vectors.metric = vectors::Metric::kL2;
  options.vectors.index.m = 8;
  options.vectors.index.ef_construction = 64;
  return options;
}

MemoryEntry MakeEntry(const std::string& id, const std::string& ns, std::vector<float> embedding) {
  MemoryEntry entry;
  entry.record.id = id;
  entry.record.key = "key-" + id;
  entry.record.ns = ns;
  entry.record.value = "value of " + id;
  entry.record.created_at = 1000;
  entry.record.updated_at = 1000;
  entry.embedding = std::move(embedding);
  return entry;
}

MemoryEntry MakeRecord(const std::string& id, const std::string& ns, const std::string& key,
                       std::vector<std::string> tags, uint64_t created_at) {
  MemoryEntry entry;
  entry.record.id = id;
  entry.record.key = key;
  entry.record.ns = ns;
  entry.record.value = "value of " + id;
  entry.record.tags = std::move(tags);
  entry.record.created_at = created_at;
  entry.record.updated_at = created_at + 50;
  return entry;
}

std::vector<std::string> Ids(const utils::Expected<std::vector<storage::KvRecord>, utils::Error>& records) {
  std::vector<std::string> ids;
  if (!records) {
    ADD_FAILURE() << records.error().to_string();
    return ids;
  }
  for (const auto& record : *records) {
    ids.push_back(record.id);
  }
  return ids;
}

std::vector<std::string> Ids(const utils::Expected<std::vector<SearchResult>, utils::Error>& results) {
  std::vector<std::string> ids;
  if (!results) {
    ADD_FAILURE() << results.error().to_string();
    return ids;
  }
  for (const auto& result : *results) {
    ids.push_back(result.id);
  }
  return ids;
}

using IdList = std::vector<std::string>;

class NativeBackendTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto opened = OpenBackend(dir_.File("memory"), SmallOptions());
    ASSERT_TRUE(opened) << opened.error().to_string();
    backend_ = std::move(*opened);
  }

  TempDir dir_;
  std::unique_ptr<Backend> backend_;
};

TEST_F(NativeBackendTest, StoreAndGet) {
  auto stored = backend_->Store(MakeEntry("a", "default", {0.0F, 0.0F, 1.0F}));
  ASSERT_TRUE(stored) << stored.error().to_string();
  EXPECT_EQ(stored->version, 1U);

  auto again = backend_->Store(MakeEntry("a", "default", {0.0F, 1.0F, 0.0F}));
  ASSERT_TRUE(again);
  EXPECT_EQ(again->version, 2U);

  ASSERT_TRUE(backend_->Get("a").has_value());
  EXPECT_EQ(backend_->Get("a")->value, "value of a");
  ASSERT_TRUE(backend_->GetByKey("default", "key-a").has_value());
  EXPECT_EQ(backend_->GetByKey("default", "key-a")->id, "a");
  EXPECT_FALSE(backend_->GetByKey("other", "key-a").has_value());
  EXPECT_FALSE(backend_->Get("missing").has_value());
}

TEST_F(NativeBackendTest, CountsAndNamespaces) {
  ASSERT_TRUE(backend_->Store(MakeEntry("a", "default", {1.0F, 0.0F, 0.0F})));
  ASSERT_TRUE(backend_->Store(MakeEntry("b", "notes", {0.0F, 1.0F, 0.0F})));
  ASSERT_TRUE(backend_->Store(MakeEntry("c", "notes", {0.0F, 0.0F, 1.0F})));

  EXPECT_EQ(backend_->Count(), 3U);
  EXPECT_EQ(backend_->Count(std::string("notes")), 2U);
  EXPECT_EQ(backend_->ListNamespaces(), (std::vector<std::string>{"default", "notes"}));
}

TEST_F(NativeBackendTest, DimensionMismatch) {
  ASSERT_TRUE(backend_->Store(MakeEntry("a", "default", {1.0F, 0.0F, 0.0F})));
  auto wrong = backend_->Store(MakeEntry("b", "default", {1.0F, 0.0F}));
  ASSERT_FALSE(wrong);
  EXPECT_EQ(wrong.error().code(), utils::ErrorCode::kVectorDimensionMismatch);
  EXPECT_FALSE(backend_->Get("b").has_value());
}

TEST_F(NativeBackendTest, EntryWithoutEmbedding) {
  MemoryEntry entry = MakeEntry("plain", "default", {});
  entry.embedding.reset();
  ASSERT_TRUE(backend_->Store(entry));

  auto results = backend_->Search({1.0F, 0.0F}, 5);
  ASSERT_TRUE(results);
  EXPECT_TRUE(results->empty());
}

TEST_F(NativeBackendTest, SearchSkipsDeletedAndExpired) {
  ASSERT_TRUE(backend_->Store(MakeEntry("near", "default", {0.0F, 0.0F, 0.1F})));
  ASSERT_TRUE(backend_->Store(MakeEntry("mid", "default", {0.0F, 0.0F, 1.0F})));
  MemoryEntry expiring = MakeEntry("expiring", "default", {0.0F, 0.0F, 0.0F});
  expiring.record.expires_at = 5000;
  ASSERT_TRUE(backend_->Store(expiring));
  ASSERT_TRUE(backend_->Store(MakeEntry("far", "default", {9.0F, 9.0F, 9.0F})));

  auto before = backend_->Search({0.0F, 0.0F, 0.0F}, 2);
  ASSERT_TRUE(before) << before.error().to_string();
  ASSERT_EQ(before->size(), 2U);
  EXPECT_EQ((*before)[0].id, "expiring");
  EXPECT_EQ((*before)[1].id, "near");
  EXPECT_FLOAT_EQ((*before)[0].score, -(*before)[0].distance);
  ASSERT_TRUE((*before)[1].record.has_value());
  EXPECT_EQ((*before)[1].record->value, "value of near");

  ASSERT_TRUE(backend_->Delete("near", 2000));
  EXPECT_FALSE(backend_->Get("near").has_value());
  EXPECT_EQ(backend_->Delete("near", 2001).error().code(), utils::ErrorCode::kNotFound);

  auto after = backend_->Search({0.0F, 0.0F, 0.0F}, 2, 6000);
  ASSERT_TRUE(after);
  ASSERT_EQ(after->size(), 2U);
  EXPECT_EQ((*after)[0].id, "mid");
  EXPECT_EQ((*after)[1].id, "far");

  // An expiry check is skipped when no time is given
  auto unfiltered = backend_->Search({0.0F, 0.0F, 0.0F}, 1);
  ASSERT_TRUE(unfiltered);
  ASSERT_EQ(unfiltered->size(), 1U);
  EXPECT_EQ((*unfiltered)[0].id, "expiring");
}

TEST_F(NativeBackendTest, LogAndSnapshots) {
  auto first = backend_->Append("{\"op\":\"store\"}", 100);
  ASSERT_TRUE(first);
  EXPECT_EQ(*first, 1U);
  auto second = backend_->Append("{\"op\":\"delete\"}", 200);
  ASSERT_TRUE(second);
  EXPECT_EQ(*second, 2U);

  auto tail = backend_->ReadLog(2);
  ASSERT_EQ(tail.size(), 1U);
  EXPECT_EQ(tail[0].payload, "{\"op\":\"delete\"}");
  EXPECT_EQ(backend_->ReadLog().size(), 2U);

  storage::SnapshotRecord snapshot;
  snapshot.aggregate_key = "session";
  snapshot.at_seq = 2;
  snapshot.timestamp = 300;
  snapshot.state = "{}";
  ASSERT_TRUE(backend_->SaveSnapshot(snapshot));
  ASSERT_TRUE(backend_->GetSnapshot("session").has_value());
  EXPECT_EQ(*backend_->GetSnapshot("session"), snapshot);
  EXPECT_FALSE(backend_->GetSnapshot("other").has_value());
}

TEST_F(NativeBackendTest, SurvivesReopen) {
  ASSERT_TRUE(backend_->Store(MakeEntry("a", "default", {1.0F, 2.0F, 3.0F})));
  ASSERT_TRUE(backend_->Append("event", 10));
  ASSERT_TRUE(backend_->Close());
  backend_.reset();

  auto reopened = OpenBackend(dir_.File("memory"), SmallOptions());
  ASSERT_TRUE(reopened) << reopened.error().to_string();
  EXPECT_EQ((*reopened)->Get("a")->value, "value of a");
  EXPECT_EQ((*reopened)->ReadLog().size(), 1U);

  auto results = (*reopened)->Search({1.0F, 2.0F, 3.0F}, 1);
  ASSERT_TRUE(results);
  ASSERT_EQ(results->size(), 1U);
  EXPECT_EQ((*results)[0].id, "a");

  HealthStatus health = (*reopened)->Health();
  EXPECT_EQ(health.format, migration::StoreFormat::kNativeContainer);
  EXPECT_TRUE(health.last_checksum_ok);
  EXPECT_FALSE(health.read_only);
  EXPECT_GE(health.segment_count, 3U);
  EXPECT_DOUBLE_EQ(health.index_build_fraction, 1.0);
}

TEST_F(NativeBackendTest, CosineScore) {
  backend_.reset();
  BackendOptions options = SmallOptions();
  options.vectors.metric = vectors::Metric::kCosine;
  auto opened = OpenBackend(dir_.File("cosine"), options);
  ASSERT_TRUE(opened);

  ASSERT_TRUE((*opened)->Store(MakeEntry("x", "default", {1.0F, 0.0F})));
  auto results = (*opened)->Search({2.0F, 0.0F}, 1);
  ASSERT_TRUE(results);
  ASSERT_EQ(results->size(), 1U);
  EXPECT_NEAR((*results)[0].distance, 0.0F, 1e-5F);
  EXPECT_NEAR((*results)[0].score, 1.0F, 1e-5F);
}

TEST_F(NativeBackendTest, OverlongIdLeavesNothingBehind) {
  const std::string long_id(100, 'x');

  // No vector segment yet
  auto first = backend_->Store(MakeEntry(long_id, "default", std::vector<float>(8, 0.5F)));
  ASSERT_FALSE(first);
  EXPECT_EQ(first.error().code(), utils::ErrorCode::kInvalidArgument);
  EXPECT_FALSE(backend_->Get(long_id).has_value());
  EXPECT_EQ(backend_->Count(), 0U);

  // The rejected embedding did not fix the dimension
  ASSERT_TRUE(backend_->Store(MakeEntry("a", "default", {1.0F, 0.0F, 0.0F})));

  // Existing vector segment
  auto second = backend_->Store(MakeEntry(long_id, "default", {0.0F, 1.0F, 0.0F}));
  ASSERT_FALSE(second);
  EXPECT_EQ(second.error().code(), utils::ErrorCode::kInvalidArgument);
  EXPECT_FALSE(backend_->Get(long_id).has_value());
  EXPECT_EQ(backend_->Count(), 1U);
}

TEST_F(NativeBackendTest, UpdateMergesIntoNewVersion) {
  MemoryEntry entry = MakeEntry("a", "default", {1.0F, 0.0F, 0.0F});
  entry.record.tags = {"draft"};
  ASSERT_TRUE(backend_->Store(entry));

  EntryUpdate update;
  update.value = "changed";
  update.expires_at = 9000;
  auto updated = backend_->Update("a", update, 5000);
  ASSERT_TRUE(updated) << updated.error().to_string();
  EXPECT_EQ(updated->version, 2U);
  EXPECT_EQ(updated->value, "changed");
  EXPECT_EQ(updated->tags, IdList{"draft"});
  EXPECT_EQ(updated->key, "key-a");
  EXPECT_EQ(updated->created_at, 1000U);
  EXPECT_EQ(updated->updated_at, 5000U);
  EXPECT_EQ(updated->expires_at, std::optional<uint64_t>(9000));
  EXPECT_EQ(backend_->Get("a")->value, "changed");

  EntryUpdate move;
  move.tags = IdList{"final"};
  move.embedding = std::vector<float>{0.0F, 1.0F, 0.0F};
  auto moved = backend_->Update("a", move, 6000);
  ASSERT_TRUE(moved) << moved.error().to_string();
  EXPECT_EQ(moved->version, 3U);
  EXPECT_EQ(moved->value, "changed");
  EXPECT_EQ(moved->tags, IdList{"final"});
  auto near = backend_->Search({0.0F, 1.0F, 0.0F}, 1);
  ASSERT_TRUE(near);
  ASSERT_EQ(near->size(), 1U);
  EXPECT_NEAR((*near)[0].distance, 0.0F, 1e-5F);

  EntryUpdate wrong;
  wrong.embedding = std::vector<float>{1.0F};
  auto rejected = backend_->Update("a", wrong, 7000);
  ASSERT_FALSE(rejected);
  EXPECT_EQ(rejected.error().code(), utils::ErrorCode::kVectorDimensionMismatch);
  EXPECT_EQ(backend_->Get("a")->version, 3U);

  auto missing = backend_->Update("missing", update, 5000);
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().code(), utils::ErrorCode::kNotFound);
}

TEST_F(NativeBackendTest, QueryFilters) {
  ASSERT_TRUE(backend_->Store(MakeRecord("a", "default", "user/alice", {"red", "blue"}, 100)));
  ASSERT_TRUE(backend_->Store(MakeRecord("b", "default", "user/bob", {"red"}, 200)));
  MemoryEntry expiring = MakeRecord("c", "notes", "note/1", {"blue"}, 300);
  expiring.record.expires_at = 1000;
  ASSERT_TRUE(backend_->Store(expiring));
  ASSERT_TRUE(backend_->Store(MakeRecord("d", "notes", "user/carol", {}, 400)));

  MemoryQuery all;
  EXPECT_EQ(Ids(backend_->Query(all)), (IdList{"a", "b", "c", "d"}));

  MemoryQuery by_ns;
  by_ns.ns = "notes";
  EXPECT_EQ(Ids(backend_->Query(by_ns)), (IdList{"c", "d"}));

  MemoryQuery by_key;
  by_key.key = "user/bob";
  EXPECT_EQ(Ids(backend_->Query(by_key)), IdList{"b"});

  MemoryQuery by_prefix;
  by_prefix.key_prefix = "user/";
  EXPECT_EQ(Ids(backend_->Query(by_prefix)), (IdList{"a", "b", "d"}));

  MemoryQuery by_tags;
  by_tags.tags = {"red"};
  EXPECT_EQ(Ids(backend_->Query(by_tags)), (IdList{"a", "b"}));
  by_tags.tags = {"red", "blue"};
  EXPECT_EQ(Ids(backend_->Query(by_tags)), IdList{"a"});

  MemoryQuery created;
  created.created_after = 100;
  created.created_before = 400;
  EXPECT_EQ(Ids(backend_->Query(created)), (IdList{"b", "c"}));

  MemoryQuery updated_after;
  updated_after.updated_after = 250;
  EXPECT_EQ(Ids(backend_->Query(updated_after)), (IdList{"c", "d"}));
  MemoryQuery updated_before;
  updated_before.updated_before = 250;
  EXPECT_EQ(Ids(backend_->Query(updated_before)), IdList{"a"});

  MemoryQuery at_time;
  at_time.now = 2000;
  EXPECT_EQ(Ids(backend_->Query(at_time)), (IdList{"a", "b", "d"}));
  at_time.include_expired = true;
  EXPECT_EQ(Ids(backend_->Query(at_time)), (IdList{"a", "b", "c", "d"}));

  MemoryQuery page;
  page.offset = 1;
  page.limit = 2;
  EXPECT_EQ(Ids(backend_->Query(page)), (IdList{"b", "c"}));
  page.offset = 10;
  EXPECT_TRUE(Ids(backend_->Query(page)).empty());

  ASSERT_TRUE(backend_->Delete("b", 500));
  by_tags.tags = {"red"};
  EXPECT_EQ(Ids(backend_->Query(by_tags)), IdList{"a"});
}

TEST_F(NativeBackendTest, BulkInsertIsAllOrNothing) {
  MemoryEntry plain = MakeEntry("z", "notes", {});
  plain.embedding.reset();

  auto mixed = backend_->BulkInsert({MakeEntry("x", "default", {1.0F, 0.0F, 0.0F}),
                                     MakeEntry("y", "default", {0.0F, 1.0F}), plain});
  ASSERT_FALSE(mixed);
  EXPECT_EQ(mixed.error().code(), utils::ErrorCode::kVectorDimensionMismatch);
  EXPECT_EQ(backend_->Count(), 0U);

  auto overlong = backend_->BulkInsert({plain, MakeEntry(std::string(40, 'q'), "default", {1.0F, 0.0F, 0.0F})});
  ASSERT_FALSE(overlong);
  EXPECT_EQ(overlong.error().code(), utils::ErrorCode::kInvalidArgument);
  EXPECT_EQ(backend_->Count(), 0U);

  auto stored = backend_->BulkInsert({MakeEntry("x", "default", {1.0F, 0.0F, 0.0F}),
                                      MakeEntry("y", "default", {0.0F, 1.0F, 0.0F}), plain});
  ASSERT_TRUE(stored) << stored.error().to_string();
  ASSERT_EQ(stored->size(), 3U);
  EXPECT_EQ((*stored)[0].version, 1U);
  EXPECT_EQ(backend_->Count(), 3U);
  EXPECT_EQ(Ids(backend_->Search({0.0F, 1.0F, 0.0F}, 1)), IdList{"y"});
}

TEST_F(NativeBackendTest, BulkDeleteAndClearNamespace) {
  ASSERT_TRUE(backend_->Store(MakeEntry("a", "default", {1.0F, 0.0F, 0.0F})));
  ASSERT_TRUE(backend_->Store(MakeEntry("b", "default", {0.0F, 1.0F, 0.0F})));
  ASSERT_TRUE(backend_->Store(MakeEntry("c", "notes", {0.0F, 0.0F, 1.0F})));
  ASSERT_TRUE(backend_->Store(MakeEntry("d", "notes", {1.0F, 1.0F, 0.0F})));
  ASSERT_TRUE(backend_->Store(MakeEntry("e", "notes", {0.0F, 1.0F, 1.0F})));

  auto deleted = backend_->BulkDelete({"a", "missing", "a", "c"}, 2000);
  ASSERT_TRUE(deleted) << deleted.error().to_string();
  EXPECT_EQ(*deleted, 2U);
  EXPECT_EQ(backend_->Count(), 3U);

  auto cleared = backend_->ClearNamespace("notes", 3000);
  ASSERT_TRUE(cleared);
  EXPECT_EQ(*cleared, 2U);
  EXPECT_EQ(backend_->Count(std::string("notes")), 0U);
  EXPECT_EQ(backend_->ListNamespaces(), IdList{"default"});
  EXPECT_EQ(Ids(backend_->Search({0.0F, 1.0F, 1.0F}, 5)), IdList{"b"});

  auto again = backend_->ClearNamespace("notes", 4000);
  ASSERT_TRUE(again);
  EXPECT_EQ(*again, 0U);
}

TEST_F(NativeBackendTest, Stats) {
  ASSERT_TRUE(backend_->Store(MakeEntry("a", "default", {1.0F, 0.0F, 0.0F})));
  ASSERT_TRUE(backend_->Store(MakeEntry("b", "default", {0.0F, 1.0F, 0.0F})));
  MemoryEntry plain = MakeEntry("c", "notes", {});
  plain.embedding.reset();
  ASSERT_TRUE(backend_->Store(plain));
  ASSERT_TRUE(backend_->Delete("b", 2000));

  BackendStats stats = backend_->GetStats();
  EXPECT_EQ(stats.total_entries, 2U);
  EXPECT_EQ(stats.entries_by_namespace, (std::map<std::string, size_t>{{"default", 1}, {"notes", 1}}));
  EXPECT_EQ(stats.vector_count, 1U);
  EXPECT_GE(stats.index_size, 1U);
  EXPECT_EQ(stats.value_bytes, 20U);
}

TEST_F(NativeBackendTest, SearchFilters) {
  for (int i = 0; i < 6; ++i) {
    ASSERT_TRUE(backend_->Store(MakeEntry("d" + std::to_string(i), "default", {0.1F * i, 0.0F, 0.0F})));
  }
  MemoryEntry pinned = MakeEntry("n0", "notes", {5.0F, 0.0F, 0.0F});
  pinned.record.tags = {"pin"};
  ASSERT_TRUE(backend_->Store(pinned));

  // The only match is the farthest vector
  SearchFilter by_ns;
  by_ns.ns = "notes";
  EXPECT_EQ(Ids(backend_->Search({0.0F, 0.0F, 0.0F}, 1, 0, by_ns)), IdList{"n0"});

  SearchFilter by_tag;
  by_tag.tags = {"pin"};
  EXPECT_EQ(Ids(backend_->Search({0.0F, 0.0F, 0.0F}, 3, 0, by_tag)), IdList{"n0"});

  // L2 scores are negated squared distances: 0, -0.01, -0.04, -0.09, ...
  SearchFilter threshold;
  threshold.min_score = -0.05F;
  EXPECT_EQ(Ids(backend_->Search({0.0F, 0.0F, 0.0F}, 10, 0, threshold)), (IdList{"d0", "d1", "d2"}));

  SearchFilter nothing;
  nothing.ns = "archive";
  auto none = backend_->Search({0.0F, 0.0F, 0.0F}, 3, 0, nothing);
  ASSERT_TRUE(none);
  EXPECT_TRUE(none->empty());
}

class LegacyBackendTest : public ::testing::Test {
 protected:
  void SetUp() override {
    path_ = dir_.File("memory.db");
    entries_ = MakeEntries(12, 6, 4);
    entries_[2].expires_at = 1500;
    WriteSqliteStore(path_, entries_, {{"first", 10}, {"second", 20}});
    pristine_ = ReadFileBytes(path_);
  }

  TempDir dir_;
  std::string path_;
  std::vector<rvfstore::testing::FixtureEntry> entries_;
  std::string pristine_;
};

TEST_F(LegacyBackendTest, LoadsOnFirstAccess) {
  LegacyBackend backend(path_, migration::StoreFormat::kLegacyRelational, vectors::Metric::kL2);
  EXPECT_FALSE(backend.loaded());
  EXPECT_FALSE(backend.Health().last_checksum_ok);

  EXPECT_EQ(backend.Count(), 12U);
  EXPECT_TRUE(backend.loaded());
  EXPECT_EQ(backend.Count(std::string("notes")), 4U);
  EXPECT_EQ(backend.ListNamespaces(), (std::vector<std::string>{"default", "notes"}));

  auto record = backend.GetByKey("default", "key-7");
  ASSERT_TRUE(record.has_value());
  EXPECT_EQ(record->id, "mem-7");
  EXPECT_EQ(record->value, "content of entry 7");
  EXPECT_EQ(record->tags, (std::vector<std::string>{"t2"}));

  auto log = backend.ReadLog(2);
  ASSERT_EQ(log.size(), 1U);
  EXPECT_EQ(log[0].payload, "second");

  HealthStatus health = backend.Health();
  EXPECT_TRUE(health.read_only);
  EXPECT_TRUE(health.last_checksum_ok);
  EXPECT_EQ(health.format, migration::StoreFormat::kLegacyRelational);
}

TEST_F(LegacyBackendTest, WritesAreRejected) {
  LegacyBackend backend(path_, migration::StoreFormat::kLegacyRelational);

  auto stored = backend.Store(MakeEntry("new", "default", {1.0F, 0.0F, 0.0F, 0.0F}));
  ASSERT_FALSE(stored);
  EXPECT_EQ(stored.error().code(), utils::ErrorCode::kReadOnly);
  EXPECT_EQ(backend.Delete("mem-1", 1).error().code(), utils::ErrorCode::kReadOnly);
  EXPECT_EQ(backend.Append("x", 1).error().code(), utils::ErrorCode::kReadOnly);
  EXPECT_EQ(backend.SaveSnapshot({}).error().code(), utils::ErrorCode::kReadOnly);
  EXPECT_EQ(backend.Update("mem-1", EntryUpdate{}, 1).error().code(), utils::ErrorCode::kReadOnly);
  EXPECT_EQ(backend.BulkInsert({MakeEntry("new", "default", {})}).error().code(), utils::ErrorCode::kReadOnly);
  EXPECT_EQ(backend.BulkDelete({"mem-1"}, 1).error().code(), utils::ErrorCode::kReadOnly);
  EXPECT_EQ(backend.ClearNamespace("notes", 1).error().code(), utils::ErrorCode::kReadOnly);
  EXPECT_EQ(backend.Count(), 12U);
  EXPECT_TRUE(backend.Flush());
  ASSERT_TRUE(backend.Close());

  EXPECT_EQ(ReadFileBytes(path_), pristine_);
}

TEST_F(LegacyBackendTest, BruteForceSearch) {
  LegacyBackend backend(path_, migration::StoreFormat::kLegacyRelational, vectors::Metric::kL2);

  auto results = backend.Search(*entries_[4].embedding, 3);
  ASSERT_TRUE(results) << results.error().to_string();
  ASSERT_EQ(results->size(), 3U);
  EXPECT_EQ((*results)[0].id, "mem-4");
  EXPECT_NEAR((*results)[0].distance, 0.0F, 1e-5F);
  EXPECT_LE((*results)[0].distance, (*results)[1].distance);
  EXPECT_LE((*results)[1].distance, (*results)[2].distance);

  // mem-2 expired at 1500
  auto later = backend.Search(*entries_[2].embedding, 6, 2000);
  ASSERT_TRUE(later);
  EXPECT_EQ(later->size(), 5U);
  for (const auto& result : *later) {
    EXPECT_NE(result.id, "mem-2");
  }

  auto wrong_dim = backend.Search({1.0F, 0.0F}, 3);
  ASSERT_TRUE(wrong_dim);
  EXPECT_TRUE(wrong_dim->empty());
}

TEST_F(LegacyBackendTest, LoadFailureIsReported) {
  const std::string broken = dir_.File("broken.json");
  WriteFileBytes(broken, "{\"default\": [");
  LegacyBackend backend(broken, migration::StoreFormat::kLegacyFlatFile);

  auto results = backend.Search({1.0F}, 1);
  ASSERT_FALSE(results);
  EXPECT_EQ(results.error().code(), utils::ErrorCode::kLegacyReadError);
  EXPECT_EQ(backend.Count(), 0U);
  EXPECT_FALSE(backend.Health().last_checksum_ok);
}

TEST_F(LegacyBackendTest, QueryAndStats) {
  LegacyBackend backend(path_, migration::StoreFormat::kLegacyRelational, vectors::Metric::kL2);

  MemoryQuery by_ns;
  by_ns.ns = "notes";
  EXPECT_EQ(Ids(backend.Query(by_ns)), (IdList{"mem-0", "mem-3", "mem-6", "mem-9"}));

  MemoryQuery by_tag;
  by_tag.tags = {"t2"};
  EXPECT_EQ(Ids(backend.Query(by_tag)), (IdList{"mem-2", "mem-7"}));
  by_tag.now = 2000;
  EXPECT_EQ(Ids(backend.Query(by_tag)), IdList{"mem-7"});

  MemoryQuery by_prefix;
  by_prefix.key_prefix = "key-1";
  by_prefix.limit = 2;
  EXPECT_EQ(Ids(backend.Query(by_prefix)), (IdList{"mem-1", "mem-10"}));

  BackendStats stats = backend.GetStats();
  EXPECT_EQ(stats.total_entries, 12U);
  EXPECT_EQ(stats.entries_by_namespace, (std::map<std::string, size_t>{{"default", 8}, {"notes", 4}}));
  EXPECT_EQ(stats.vector_count, 6U);
  EXPECT_EQ(stats.index_size, 0U);
}

TEST_F(LegacyBackendTest, SearchFilters) {
  LegacyBackend backend(path_, migration::StoreFormat::kLegacyRelational, vectors::Metric::kL2);

  SearchFilter by_ns;
  by_ns.ns = "notes";
  auto notes = backend.Search(*entries_[4].embedding, 6, 0, by_ns);
  ASSERT_TRUE(notes);
  ASSERT_EQ(notes->size(), 2U);
  for (const auto& result : *notes) {
    EXPECT_TRUE(result.id == "mem-0" || result.id == "mem-3") << result.id;
  }

  SearchFilter by_tag;
  by_tag.tags = {"t4"};
  EXPECT_EQ(Ids(backend.Search(*entries_[1].embedding, 6, 0, by_tag)), IdList{"mem-4"});

  SearchFilter exact;
  exact.min_score = 0.0F;
  EXPECT_EQ(Ids(backend.Search(*entries_[5].embedding, 6, 0, exact)), IdList{"mem-5"});
}

TEST_F(LegacyBackendTest, LaterEmbeddingOfDuplicateIdWins) {
  std::vector<rvfstore::testing::FixtureEntry> entries(3);
  entries[0].id = "dup";
  entries[0].key = "k";
  entries[0].content = "older";
  entries[0].embedding = std::vector<float>{1.0F, 0.0F};
  entries[1].id = "other";
  entries[1].key = "o";
  entries[1].content = "other";
  entries[1].embedding = std::vector<float>{1.0F, 0.0F};
  entries[2] = entries[0];
  entries[2].content = "newer";
  entries[2].embedding = std::vector<float>{0.0F, 1.0F};
  const std::string json_path = dir_.File("memory.json");
  rvfstore::testing::WriteJsonStore(json_path, rvfstore::testing::MakeJsonDocument(entries));

  LegacyBackend backend(json_path, migration::StoreFormat::kLegacyFlatFile, vectors::Metric::kL2);
  EXPECT_EQ(backend.Count(), 2U);
  ASSERT_TRUE(backend.Get("dup").has_value());
  EXPECT_EQ(backend.Get("dup")->value, "newer");
  EXPECT_EQ(backend.Get("dup")->version, 2U);
  EXPECT_EQ(backend.GetStats().vector_count, 2U);

  auto results = backend.Search({0.0F, 1.0F}, 2);
  ASSERT_TRUE(results) << results.error().to_string();
  ASSERT_EQ(results->size(), 2U);
  EXPECT_EQ((*results)[0].id, "dup");
  EXPECT_NEAR((*results)[0].distance, 0.0F, 1e-6F);
  EXPECT_EQ((*results)[1].id, "other");
}

class BackendFacadeTest : public ::testing::Test {
 protected:
  TempDir dir_;
};

TEST_F(BackendFacadeTest, AutoMigratesLegacyStore) {
  const std::string legacy = dir_.File("memory.db");
  WriteSqliteStore(legacy, MakeEntries(20, 10, 4), {{"boot", 1}});
  const std::string original = ReadFileBytes(legacy);

  auto opened = OpenBackend(dir_.File("memory.db"), SmallOptions());
  ASSERT_TRUE(opened) << opened.error().to_string();

  HealthStatus health = (*opened)->Health();
  EXPECT_EQ(health.format, migration::StoreFormat::kNativeContainer);
  EXPECT_FALSE(health.read_only);
  EXPECT_EQ((*opened)->Count(), 20U);
  EXPECT_EQ((*opened)->ReadLog().size(), 1U);

  EXPECT_TRUE(std::filesystem::exists(dir_.File("memory.rvf")));
  EXPECT_FALSE(std::filesystem::exists(legacy));
  EXPECT_EQ(ReadFileBytes(dir_.File("memory.db.bak")), original);

  // Writable after migration
  ASSERT_TRUE((*opened)->Store(MakeEntry("fresh", "default", {0.5F, 0.5F, 0.5F, 0.5F})));
  ASSERT_TRUE((*opened)->Close());
}

TEST_F(BackendFacadeTest, ReadOnlyServesLegacyInPlace) {
  const std::string legacy = dir_.File("memory.db");
  WriteSqliteStore(legacy, MakeEntries(5, 0, 4));
  const std::string original = ReadFileBytes(legacy);

  BackendOptions options = SmallOptions();
  options.read_only = true;
  auto opened = OpenBackend(dir_.File("memory"), options);
  ASSERT_TRUE(opened) << opened.error().to_string();

  HealthStatus health = (*opened)->Health();
  EXPECT_TRUE(health.read_only);
  EXPECT_EQ(health.format, migration::StoreFormat::kLegacyRelational);
  EXPECT_EQ((*opened)->Count(), 5U);
  EXPECT_EQ((*opened)->Store(MakeEntry("x", "default", {1.0F})).error().code(), utils::ErrorCode::kReadOnly);

  EXPECT_FALSE(std::filesystem::exists(dir_.File("memory.rvf")));
  EXPECT_EQ(ReadFileBytes(legacy), original);
}

TEST_F(BackendFacadeTest, AutoMigrateDisabled) {
  const std::string legacy = dir_.File("memory.json");
  rvfstore::testing::WriteJsonStore(legacy, rvfstore::testing::MakeJsonDocument(MakeEntries(3, 0, 4)));

  BackendOptions options = SmallOptions();
  options.auto_migrate = false;
  auto opened = OpenBackend(legacy, options);
  ASSERT_TRUE(opened) << opened.error().to_string();
  EXPECT_EQ((*opened)->Health().format, migration::StoreFormat::kLegacyFlatFile);
  EXPECT_EQ((*opened)->Count(), 3U);
  EXPECT_FALSE(std::filesystem::exists(dir_.File("memory.rvf")));
}

TEST_F(BackendFacadeTest, UnknownFileIsNeverOverwritten) {
  const std::string path = dir_.File("memory.bin");
  WriteFileBytes(path, "someone else's data");

  auto opened = OpenBackend(path, SmallOptions());
  ASSERT_FALSE(opened);
  EXPECT_EQ(opened.error().code(), utils::ErrorCode::kAlreadyExists);
  EXPECT_EQ(ReadFileBytes(path), "someone else's data");
}

TEST_F(BackendFacadeTest, NothingToOpen) {
  BackendOptions options = SmallOptions();
  options.create = false;
  auto missing = OpenBackend(dir_.File("memory"), options);
  ASSERT_FALSE(missing);
  EXPECT_EQ(missing.error().code(), utils::ErrorCode::kNotFound);

  options.create = true;
  options.read_only = true;
  auto read_only = OpenBackend(dir_.File("memory"), options);
  ASSERT_FALSE(read_only);
  EXPECT_EQ(read_only.error().code(), utils::ErrorCode::kNotFound);
}

TEST_F(BackendFacadeTest, CreatesNewContainer) {
  auto opened = OpenBackend(dir_.File("memory"), SmallOptions());
  ASSERT_TRUE(opened) << opened.error().to_string();
  EXPECT_EQ((*opened)->Count(), 0U);
  ASSERT_TRUE((*opened)->Flush());
  EXPECT_EQ(migration::DetectFormat(dir_.File("memory.rvf")), migration::StoreFormat::kNativeContainer);
}

}  // namespace
}  // namespace rvfstore::backend
