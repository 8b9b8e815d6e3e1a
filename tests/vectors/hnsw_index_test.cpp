/**
 * @file hnsw_index_test.cpp
 * @brief HNSW construction, progressive build, persistence and recall
 */

#include "vectors/hnsw_index.h"

#include <gtest/gtest.h>

#include <atomic>
#include <random>
#include <set>
#include <thread>
#include <vector>

#include "storage/segment_codec.h"
#include "vectors/vector_arena.h"

namespace rvfstore::vectors {
namespace {

std::vector<std::vector<float>> RandomVectors(size_t count, uint32_t dim, uint32_t seed) {
  std::mt19937 gen(seed);
  std::normal_distribution<float> dist(0.0f, 1.0f);
  std::vector<std::vector<float>> vectors(count, std::vector<float>(dim));
  for (auto& vec : vectors) {
    for (float& value : vec) {
      value = dist(gen);
    }
  }
  return vectors;
}

/**
 * @brief Arena with @p count random vectors appended, nothing indexed yet
 */
class HnswIndexTest : public ::testing::Test {
 protected:
  void Fill(size_t count, uint32_t dim, Metric metric = Metric::kCosine, uint32_t seed = 1) {
    storage::VecHeader header;
    header.dim = dim;
    header.id_width = 16;
    header.metric = metric;
    payload_ = storage::EncodeVecHeader(header);
    auto arena = VectorArena::Attach(&payload_);
    ASSERT_TRUE(arena);
    arena_ = std::move(*arena);

    vectors_ = RandomVectors(count, dim, seed);
    for (size_t i = 0; i < count; ++i) {
      ASSERT_TRUE(arena_->Append("v" + std::to_string(i), vectors_[i], Quantization::kFp32));
    }
    params_.metric = metric;
  }

  std::unique_ptr<HnswIndex> BuildAll() {
    auto index = HnswIndex::Create(arena_.get(), params_);
    EXPECT_TRUE(index);
    EXPECT_TRUE((*index)->BuildFromSegment(arena_.get(), params_));
    (*index)->BuildAll();
    return std::move(*index);
  }

  std::string payload_;
  std::unique_ptr<VectorArena> arena_;
  std::vector<std::vector<float>> vectors_;
  HnswParams params_;
};

// ============================================================================
// Basic behavior
// ============================================================================

TEST_F(HnswIndexTest, EmptyIndexReturnsNothing) {
  Fill(0, 8);
  auto index = BuildAll();
  auto hits = index->Search(std::vector<float>(8, 1.0f), 5);
  ASSERT_TRUE(hits);
  EXPECT_TRUE(hits->empty());
  EXPECT_TRUE(index->Status().complete);
  EXPECT_DOUBLE_EQ(index->Status().fraction, 1.0);
}

TEST_F(HnswIndexTest, SelfQueryFindsItselfFirst) {
  Fill(200, 32);
  auto index = BuildAll();
  for (size_t i = 0; i < vectors_.size(); i += 17) {
    auto hits = index->Search(vectors_[i], 1);
    ASSERT_TRUE(hits);
    ASSERT_EQ(hits->size(), 1U);
    EXPECT_EQ((*hits)[0].id, "v" + std::to_string(i));
    EXPECT_NEAR((*hits)[0].distance, 0.0f, 1e-5f);
  }
}

TEST_F(HnswIndexTest, ResultsAreSortedAndBounded) {
  Fill(300, 16, Metric::kL2);
  auto index = BuildAll();
  auto hits = index->Search(vectors_[5], 10, 50);
  ASSERT_TRUE(hits);
  ASSERT_EQ(hits->size(), 10U);
  for (size_t i = 1; i < hits->size(); ++i) {
    EXPECT_LE((*hits)[i - 1].distance, (*hits)[i].distance);
  }
}

TEST_F(HnswIndexTest, MetricMismatchIsRejected) {
  Fill(10, 8, Metric::kCosine);
  HnswParams wrong = params_;
  wrong.metric = Metric::kDot;

  auto created = HnswIndex::Create(arena_.get(), wrong);
  ASSERT_FALSE(created);
  EXPECT_EQ(created.error().code(), utils::ErrorCode::kMetricMismatch);

  auto index = BuildAll();
  auto rebuilt = index->BuildFromSegment(arena_.get(), wrong);
  ASSERT_FALSE(rebuilt);
  EXPECT_EQ(rebuilt.error().code(), utils::ErrorCode::kMetricMismatch);
}

TEST_F(HnswIndexTest, QueryDimensionMismatch) {
  Fill(10, 8);
  auto index = BuildAll();
  auto hits = index->Search(std::vector<float>(7, 0.5f), 3);
  ASSERT_FALSE(hits);
  EXPECT_EQ(hits.error().code(), utils::ErrorCode::kVectorDimensionMismatch);
}

TEST_F(HnswIndexTest, InsertAndRemove) {
  Fill(50, 8);
  auto index = BuildAll();

  std::vector<float> extra(8, 0.0f);
  extra[3] = 1.0f;
  auto slot = index->Insert("extra", extra);
  ASSERT_TRUE(slot);

  auto hits = index->Search(extra, 1);
  ASSERT_TRUE(hits);
  ASSERT_FALSE(hits->empty());
  EXPECT_EQ((*hits)[0].id, "extra");

  ASSERT_TRUE(index->Remove("extra"));
  hits = index->Search(extra, 10);
  ASSERT_TRUE(hits);
  for (const auto& hit : *hits) {
    EXPECT_NE(hit.id, "extra");
  }
}

// ============================================================================
// Progressive build
// ============================================================================

TEST_F(HnswIndexTest, BuildStepReportsProgress) {
  Fill(250, 16);
  auto index = HnswIndex::Create(arena_.get(), params_);
  ASSERT_TRUE(index);
  ASSERT_TRUE((*index)->BuildFromSegment(arena_.get(), params_));

  auto status = (*index)->Status();
  EXPECT_EQ(status.total, 250U);
  EXPECT_EQ(status.indexed, 0U);
  EXPECT_FALSE(status.complete);

  EXPECT_EQ((*index)->BuildStep(100), 100U);
  status = (*index)->Status();
  EXPECT_EQ(status.indexed, 100U);
  EXPECT_NEAR(status.fraction, 0.4, 1e-9);

  // Searches answer over the linked prefix only
  auto hits = (*index)->Search(vectors_[200], 300, 300);
  ASSERT_TRUE(hits);
  EXPECT_LE(hits->size(), 100U);
  for (const auto& hit : *hits) {
    EXPECT_LT(hit.slot, 100U);
  }

  while ((*index)->BuildStep(64) > 0) {
  }
  status = (*index)->Status();
  EXPECT_TRUE(status.complete);
  EXPECT_EQ(status.indexed, 250U);
  EXPECT_DOUBLE_EQ(status.fraction, 1.0);
}

TEST_F(HnswIndexTest, SearchRunsWhileBuilding) {
  Fill(600, 16);
  auto index = HnswIndex::Create(arena_.get(), params_);
  ASSERT_TRUE(index);
  ASSERT_TRUE((*index)->BuildFromSegment(arena_.get(), params_));
  HnswIndex* raw = index->get();

  std::atomic<bool> done{false};
  std::thread builder([raw, &done]() {
    while (raw->BuildStep(25) > 0) {
    }
    done = true;
  });

  size_t searches = 0;
  while (!done) {
    auto hits = raw->Search(vectors_[searches % vectors_.size()], 5);
    ASSERT_TRUE(hits);
    ++searches;
  }
  builder.join();

  EXPECT_TRUE(raw->Status().complete);
  auto hits = raw->Search(vectors_[599], 1);
  ASSERT_TRUE(hits);
  ASSERT_EQ(hits->size(), 1U);
  EXPECT_EQ((*hits)[0].id, "v599");
}

// ============================================================================
// Persistence
// ============================================================================

TEST_F(HnswIndexTest, SameSeedGivesSameGraph) {
  Fill(150, 16);
  auto first = BuildAll();
  auto second = BuildAll();
  EXPECT_EQ(first->Serialize(), second->Serialize());
}

TEST_F(HnswIndexTest, SerializeRoundTripKeepsResults) {
  Fill(300, 24);
  auto index = BuildAll();
  std::string bytes = index->Serialize();

  auto restored = HnswIndex::Deserialize(bytes, arena_.get());
  ASSERT_TRUE(restored) << restored.error().to_string();
  EXPECT_TRUE((*restored)->Status().complete);

  for (size_t i = 0; i < 300; i += 31) {
    auto original_hits = index->Search(vectors_[i], 10);
    auto restored_hits = (*restored)->Search(vectors_[i], 10);
    ASSERT_TRUE(original_hits);
    ASSERT_TRUE(restored_hits);
    ASSERT_EQ(original_hits->size(), restored_hits->size());
    for (size_t j = 0; j < original_hits->size(); ++j) {
      EXPECT_EQ((*original_hits)[j].id, (*restored_hits)[j].id);
    }
  }
}

TEST_F(HnswIndexTest, DeserializeRejectsForeignArena) {
  Fill(40, 8);
  auto index = BuildAll();
  std::string bytes = index->Serialize();

  ASSERT_TRUE(arena_->Append("late", std::vector<float>(8, 0.25f), Quantization::kFp32));
  auto restored = HnswIndex::Deserialize(bytes, arena_.get());
  ASSERT_FALSE(restored);
  EXPECT_EQ(restored.error().code(), utils::ErrorCode::kCorruptSegment);

  auto garbage = HnswIndex::Deserialize("not an index", arena_.get());
  ASSERT_FALSE(garbage);
  EXPECT_EQ(garbage.error().code(), utils::ErrorCode::kCorruptSegment);
}

// ============================================================================
// Recall
// ============================================================================

TEST_F(HnswIndexTest, RecallAtDefaultEfSearch) {
  constexpr size_t kCount = 1000;
  constexpr uint32_t kDim = 128;
  constexpr size_t kTopK = 10;
  constexpr size_t kQueries = 100;

  Fill(kCount, kDim, Metric::kCosine, 2024);
  auto index = BuildAll();
  auto queries = RandomVectors(kQueries, kDim, 99);

  size_t found = 0;
  for (const auto& query : queries) {
    auto exact = arena_->ScanNearest(query, kTopK);
    auto approx = index->Search(query, kTopK, hnsw_defaults::kEfSearch);
    ASSERT_TRUE(approx);

    std::set<std::string> truth;
    for (const auto& hit : exact) {
      truth.insert(hit.id);
    }
    for (const auto& hit : *approx) {
      found += truth.count(hit.id);
    }
  }

  double recall = static_cast<double>(found) / static_cast<double>(kQueries * kTopK);
  EXPECT_GE(recall, 0.99) << "recall@" << kTopK << " = " << recall;
}

}  // namespace
}  // namespace rvfstore::vectors
