/**
 * @file segment_codec_test.cpp
 * @brief Unit tests for the per-segment record codecs
 */

#include "storage/segment_codec.h"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace rvfstore::storage {
namespace {

KvRecord MakeKv(const std::string& id, const std::string& value, uint32_t version = 1) {
  KvRecord record;
  record.id = id;
  record.key = "key-" + id;
  record.ns = "notes";
  record.value = value;
  record.tags = {"alpha", "beta"};
  record.created_at = 1700000000000ULL;
  record.updated_at = 1700000000500ULL;
  record.version = version;
  return record;
}

// ============================================================================
// KV
// ============================================================================

TEST(SegmentCodecTest, KvRecordsDecodeAsWritten) {
  std::vector<KvRecord> records = {MakeKv("a", "first"), MakeKv("b", std::string("bin\0ary", 7))};
  records[1].expires_at = 1800000000000ULL;
  records[1].tags.clear();

  auto decoded = DecodeKvSegment(EncodeKvSegment(records));
  ASSERT_TRUE(decoded) << decoded.error().to_string();
  ASSERT_EQ(decoded->size(), 2U);
  EXPECT_EQ((*decoded)[0], records[0]);
  EXPECT_EQ((*decoded)[1], records[1]);
  EXPECT_EQ((*decoded)[1].value.size(), 7U);
}

TEST(SegmentCodecTest, KvAppendDoesNotRewritePrefix) {
  std::string payload;
  AppendKvRecord(&payload, MakeKv("a", "one"));
  const std::string prefix = payload;

  KvRecord tombstone = MakeKv("a", "", 2);
  tombstone.tombstone = true;
  AppendKvRecord(&payload, tombstone);

  EXPECT_EQ(payload.compare(0, prefix.size(), prefix), 0);
  auto decoded = DecodeKvSegment(payload);
  ASSERT_TRUE(decoded);
  ASSERT_EQ(decoded->size(), 2U);
  EXPECT_FALSE((*decoded)[0].tombstone);
  EXPECT_TRUE((*decoded)[1].tombstone);
  EXPECT_EQ((*decoded)[1].version, 2U);
}

TEST(SegmentCodecTest, EmptyKvPayloadHasNoRecords) {
  auto decoded = DecodeKvSegment("");
  ASSERT_TRUE(decoded);
  EXPECT_TRUE(decoded->empty());
}

TEST(SegmentCodecTest, TruncatedKvIsCorrupt) {
  std::string payload = EncodeKvSegment({MakeKv("a", "value")});
  payload.pop_back();

  auto decoded = DecodeKvSegment(payload);
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().code(), utils::ErrorCode::kCorruptSegment);
}

TEST(SegmentCodecTest, KvLengthPastEndIsCorrupt) {
  std::string payload = EncodeKvSegment({MakeKv("a", "value")});
  payload[0] = static_cast<char>(0xFF);
  payload[1] = static_cast<char>(0xFF);

  auto decoded = DecodeKvSegment(payload);
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().code(), utils::ErrorCode::kCorruptSegment);
  EXPECT_NE(decoded.error().context().find("KV segment at byte 0"), std::string::npos);
}

TEST(SegmentCodecTest, KvEmptyIdIsCorrupt) {
  KvRecord record = MakeKv("", "value");
  auto decoded = DecodeKvSegment(EncodeKvSegment({record}));
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().code(), utils::ErrorCode::kCorruptSegment);
}

// ============================================================================
// LOG / SNAP / META
// ============================================================================

TEST(SegmentCodecTest, LogRecordsKeepOrder) {
  std::vector<LogRecord> records = {{1, 100, "created"}, {2, 200, "updated"}, {5, 300, ""}};
  auto decoded = DecodeLogSegment(EncodeLogSegment(records));
  ASSERT_TRUE(decoded) << decoded.error().to_string();
  EXPECT_EQ(*decoded, records);
}

TEST(SegmentCodecTest, LogSequenceMustIncrease) {
  std::vector<LogRecord> records = {{2, 100, "a"}, {2, 200, "b"}};
  auto decoded = DecodeLogSegment(EncodeLogSegment(records));
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().code(), utils::ErrorCode::kCorruptSegment);
  EXPECT_NE(decoded.error().message().find("not increasing"), std::string::npos);
}

TEST(SegmentCodecTest, SnapshotsDecodeAsWritten) {
  std::vector<SnapshotRecord> records = {{"session:1", 10, 1000, "{\"count\":3}"}, {"session:1", 20, 2000, "{}"}};
  auto decoded = DecodeSnapshotSegment(EncodeSnapshotSegment(records));
  ASSERT_TRUE(decoded) << decoded.error().to_string();
  EXPECT_EQ(*decoded, records);
}

TEST(SegmentCodecTest, SnapshotWithoutKeyIsCorrupt) {
  auto decoded = DecodeSnapshotSegment(EncodeSnapshotSegment({{"", 1, 1, "state"}}));
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().code(), utils::ErrorCode::kCorruptSegment);
}

TEST(SegmentCodecTest, MetaEntries) {
  MetaEntries entries = {{"source_format", "sqlite"}, {"migrated_at", "1700000000000"}};
  auto decoded = DecodeMetaSegment(EncodeMetaSegment(entries));
  ASSERT_TRUE(decoded) << decoded.error().to_string();
  EXPECT_EQ(*decoded, entries);
}

TEST(SegmentCodecTest, MetaTrailingBytesAreCorrupt) {
  std::string payload = EncodeMetaSegment({{"k", "v"}});
  payload.push_back('x');
  auto decoded = DecodeMetaSegment(payload);
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().code(), utils::ErrorCode::kCorruptSegment);
}

// ============================================================================
// VEC
// ============================================================================

TEST(SegmentCodecTest, VecHeaderFields) {
  VecHeader header;
  header.dim = 384;
  header.id_width = 48;
  header.quantization = vectors::Quantization::kInt8;
  header.metric = vectors::Metric::kDot;

  std::string payload = EncodeVecHeader(header);
  ASSERT_EQ(payload.size(), vec_format::kHeaderSize);

  auto decoded = DecodeVecHeader(payload);
  ASSERT_TRUE(decoded) << decoded.error().to_string();
  EXPECT_EQ(decoded->dim, 384U);
  EXPECT_EQ(decoded->id_width, 48U);
  EXPECT_EQ(decoded->quantization, vectors::Quantization::kInt8);
  EXPECT_EQ(decoded->metric, vectors::Metric::kDot);
}

TEST(SegmentCodecTest, VecHeaderRejectsBadIdWidth) {
  VecHeader header;
  header.dim = 4;
  header.id_width = vec_format::kMinIdWidth - 1;
  auto decoded = DecodeVecHeader(EncodeVecHeader(header));
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().code(), utils::ErrorCode::kCorruptSegment);

  header.id_width = vec_format::kMaxIdWidth + 1;
  EXPECT_FALSE(DecodeVecHeader(EncodeVecHeader(header)));
}

TEST(SegmentCodecTest, VecHeaderRejectsZeroDimension) {
  VecHeader header;
  header.dim = 0;
  EXPECT_FALSE(DecodeVecHeader(EncodeVecHeader(header)));
}

TEST(SegmentCodecTest, VecRecordsHaveFixedStride) {
  VecHeader header;
  header.dim = 4;
  header.id_width = 16;
  header.quantization = vectors::Quantization::kFp32;

  const std::vector<float> values = {0.5F, -1.0F, 2.0F, 0.0F};
  std::string payload = EncodeVecHeader(header);
  AppendVecRecord(&payload, header, "vec-1", vectors::Quantize(values.data(), 4, vectors::Quantization::kFp32), 0);
  AppendVecRecord(&payload, header, "vec-2", vectors::Quantize(values.data(), 4, vectors::Quantization::kInt8),
                  vec_format::kFlagTombstone);

  const size_t stride = VecStride(header);
  EXPECT_EQ(stride, 16U + vec_format::kRecordPrefixSize + 16U);
  EXPECT_EQ(payload.size(), vec_format::kHeaderSize + 2 * stride);

  auto decoded = DecodeVecSegment(payload);
  ASSERT_TRUE(decoded) << decoded.error().to_string();
  EXPECT_EQ(decoded->second, 2U);

  VecRecordView second = ReadVecRecord(payload, header, 1);
  EXPECT_EQ(second.id, "vec-2");
  EXPECT_EQ(second.quantization, vectors::Quantization::kInt8);
  EXPECT_EQ(second.flags, vec_format::kFlagTombstone);
}

TEST(SegmentCodecTest, VecPartialRecordIsCorrupt) {
  VecHeader header;
  header.dim = 2;
  header.id_width = 8;
  const std::vector<float> values = {1.0F, 2.0F};
  std::string payload = EncodeVecHeader(header);
  AppendVecRecord(&payload, header, "v", vectors::Quantize(values.data(), 2, vectors::Quantization::kFp32), 0);
  payload.resize(payload.size() - 3);

  auto decoded = DecodeVecSegment(payload);
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().code(), utils::ErrorCode::kCorruptSegment);
}

TEST(SegmentCodecTest, VecRecordWiderThanStorageClassIsCorrupt) {
  VecHeader header;
  header.dim = 2;
  header.id_width = 8;
  header.quantization = vectors::Quantization::kInt8;
  const std::vector<float> values = {1.0F, 2.0F};
  std::string payload = EncodeVecHeader(header);
  AppendVecRecord(&payload, header, "v", vectors::Quantize(values.data(), 2, vectors::Quantization::kInt8), 0);

  // Rewrite the record's quantization tag to fp32
  payload[vec_format::kHeaderSize + header.id_width] = static_cast<char>(vectors::Quantization::kFp32);
  auto decoded = DecodeVecSegment(payload);
  ASSERT_FALSE(decoded);
  EXPECT_EQ(decoded.error().code(), utils::ErrorCode::kCorruptSegment);
}

// ============================================================================
// Generic entry points
// ============================================================================

TEST(SegmentCodecTest, EncodeSegmentChecksAlternative) {
  SegmentRecords records = std::vector<LogRecord>{{1, 1, "x"}};
  auto wrong = EncodeSegment(SegmentType::kKv, records);
  ASSERT_FALSE(wrong);
  EXPECT_EQ(wrong.error().code(), utils::ErrorCode::kInvalidArgument);

  auto right = EncodeSegment(SegmentType::kLog, records);
  ASSERT_TRUE(right);
  auto decoded = DecodeSegment(SegmentType::kLog, *right);
  ASSERT_TRUE(decoded);
  ASSERT_TRUE(std::holds_alternative<std::vector<LogRecord>>(*decoded));
  EXPECT_EQ(std::get<std::vector<LogRecord>>(*decoded).size(), 1U);
}

TEST(SegmentCodecTest, EncodeVecSegmentRejectsLongId) {
  VecSegment segment;
  segment.header.dim = 2;
  segment.header.id_width = 8;
  const std::vector<float> values = {1.0F, 2.0F};
  segment.records.push_back(
      {"identifier-too-long", vectors::Quantize(values.data(), 2, vectors::Quantization::kFp32), 0});

  auto encoded = EncodeSegment(SegmentType::kVec, segment);
  ASSERT_FALSE(encoded);
  EXPECT_EQ(encoded.error().code(), utils::ErrorCode::kInvalidArgument);
}

TEST(SegmentCodecTest, VecSegmentThroughGenericCodec) {
  VecSegment segment;
  segment.header.dim = 3;
  segment.header.id_width = 8;
  segment.header.quantization = vectors::Quantization::kFp16;
  const std::vector<float> values = {0.25F, 0.5F, 0.75F};
  segment.records.push_back({"a", vectors::Quantize(values.data(), 3, vectors::Quantization::kFp16), 0});
  segment.records.push_back({"b", vectors::Quantize(values.data(), 3, vectors::Quantization::kBinary), 0});

  auto encoded = EncodeSegment(SegmentType::kVec, segment);
  ASSERT_TRUE(encoded) << encoded.error().to_string();
  auto decoded = DecodeSegment(SegmentType::kVec, *encoded);
  ASSERT_TRUE(decoded) << decoded.error().to_string();

  const auto& result = std::get<VecSegment>(*decoded);
  ASSERT_EQ(result.records.size(), 2U);
  EXPECT_EQ(result.records[0].id, "a");
  EXPECT_EQ(result.records[0].vector.data, segment.records[0].vector.data);
  EXPECT_EQ(result.records[1].vector.quantization, vectors::Quantization::kBinary);
  EXPECT_EQ(result.records[1].vector.data, segment.records[1].vector.data);
}

}  // namespace
}  // namespace rvfstore::storage
