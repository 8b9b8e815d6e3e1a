/**
 * @file segment_codec.h
 * @brief Record types and byte codecs for every known segment type
 *
 * KV, LOG and SNAP payloads are streams of self-delimiting records with
 * no leading count, so appending a record never rewrites earlier bytes.
 * META is a rewritten-on-change list of string pairs. VEC payloads are a
 * 16-byte header followed by fixed-stride records (O(1) access by index).
 * INDEX payloads are owned by vectors::HnswIndex.
 *
 * Every decoder rejects structurally invalid input with
 * ErrorCode::kCorruptSegment; nothing is recovered best-effort.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "storage/container_format.h"
#include "utils/error.h"
#include "utils/expected.h"
#include "vectors/quantization.h"

namespace rvfstore::storage {

// ============================================================================
// Record types
// ============================================================================

/**
 * @brief One version of a key-value entry
 */
struct KvRecord {
  std::string id;
  std::string key;
  std::string ns = "default";
  std::string value;
  std::vector<std::string> tags;
  uint64_t created_at = 0;  // milliseconds since epoch
  uint64_t updated_at = 0;
  std::optional<uint64_t> expires_at;
  uint32_t version = 1;
  bool tombstone = false;

  bool operator==(const KvRecord& other) const {
    return id == other.id && key == other.key && ns == other.ns && value == other.value && tags == other.tags &&
           created_at == other.created_at && updated_at == other.updated_at && expires_at == other.expires_at &&
           version == other.version && tombstone == other.tombstone;
  }
  bool operator!=(const KvRecord& other) const { return !(*this == other); }
};

/**
 * @brief Append-only log entry
 */
struct LogRecord {
  uint64_t seq = 0;
  uint64_t timestamp = 0;
  std::string payload;

  bool operator==(const LogRecord& other) const {
    return seq == other.seq && timestamp == other.timestamp && payload == other.payload;
  }
};

/**
 * @brief Aggregate state captured at a log position
 */
struct SnapshotRecord {
  std::string aggregate_key;
  uint64_t at_seq = 0;
  uint64_t timestamp = 0;
  std::string state;

  bool operator==(const SnapshotRecord& other) const {
    return aggregate_key == other.aggregate_key && at_seq == other.at_seq && timestamp == other.timestamp &&
           state == other.state;
  }
};

using MetaEntries = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief VEC segment header
 */
struct VecHeader {
  uint32_t dim = 0;
  uint32_t id_width = 64;  // bytes reserved for the NUL-padded id
  vectors::Quantization quantization = vectors::Quantization::kFp32;  // storage class of every slot
  vectors::Metric metric = vectors::Metric::kCosine;
};

namespace vec_format {
constexpr size_t kHeaderSize = 16;
constexpr size_t kRecordPrefixSize = 12;  // quant u8, flags u8, reserved u16, scale f32, offset f32
constexpr uint32_t kMinIdWidth = 8;
constexpr uint32_t kMaxIdWidth = 1024;
constexpr uint32_t kMaxDim = 65536;
constexpr uint8_t kFlagTombstone = 0x01;
}  // namespace vec_format

/**
 * @brief Decoded view of a single VEC record
 */
struct VecRecordView {
  std::string id;
  vectors::Quantization quantization = vectors::Quantization::kFp32;
  uint8_t flags = 0;
  float scale = 1.0F;
  float offset = 0.0F;
  const uint8_t* data = nullptr;  // points into the payload
};

/**
 * @brief One VEC record with its quantized payload copied out
 */
struct VectorRecord {
  std::string id;
  vectors::QuantizedVector vector;
  uint8_t flags = 0;
};

/**
 * @brief Whole VEC segment: header plus records in slot order
 */
struct VecSegment {
  VecHeader header;
  std::vector<VectorRecord> records;
};

/// Decoded content of any known segment
using SegmentRecords = std::variant<std::vector<KvRecord>, std::vector<LogRecord>, std::vector<SnapshotRecord>,
                                    MetaEntries, VecSegment, std::string>;

// ============================================================================
// KV
// ============================================================================

void AppendKvRecord(std::string* payload, const KvRecord& record);
std::string EncodeKvSegment(const std::vector<KvRecord>& records);
utils::Expected<std::vector<KvRecord>, utils::Error> DecodeKvSegment(const std::string& payload);

// ============================================================================
// LOG / SNAP
// ============================================================================

void AppendLogRecord(std::string* payload, const LogRecord& record);
std::string EncodeLogSegment(const std::vector<LogRecord>& records);

/// Also checks that seq strictly increases
utils::Expected<std::vector<LogRecord>, utils::Error> DecodeLogSegment(const std::string& payload);

void AppendSnapshotRecord(std::string* payload, const SnapshotRecord& record);
std::string EncodeSnapshotSegment(const std::vector<SnapshotRecord>& records);
utils::Expected<std::vector<SnapshotRecord>, utils::Error> DecodeSnapshotSegment(const std::string& payload);

// ============================================================================
// META
// ============================================================================

std::string EncodeMetaSegment(const MetaEntries& entries);
utils::Expected<MetaEntries, utils::Error> DecodeMetaSegment(const std::string& payload);

// ============================================================================
// VEC
// ============================================================================

/// Bytes per record for @p header
size_t VecStride(const VecHeader& header);

std::string EncodeVecHeader(const VecHeader& header);

utils::Expected<VecHeader, utils::Error> DecodeVecHeader(const std::string& payload);

/**
 * @brief Append one fixed-stride record
 *
 * The record's quantization must fit in the header's storage class and
 * the id must fit in id_width bytes; both are checked by the caller.
 */
void AppendVecRecord(std::string* payload, const VecHeader& header, const std::string& id,
                     const vectors::QuantizedVector& vector, uint8_t flags);

/**
 * @brief Validate a whole VEC payload (stride, tags, flags)
 * @return Header and record count
 */
utils::Expected<std::pair<VecHeader, size_t>, utils::Error> DecodeVecSegment(const std::string& payload);

/// Decode record @p index; the payload must already be validated
VecRecordView ReadVecRecord(const std::string& payload, const VecHeader& header, size_t index);

// ============================================================================
// Generic entry points
// ============================================================================

/**
 * @brief Encode records of any known type
 *
 * Returns kInvalidArgument when the variant alternative does not match
 * @p type.
 */
utils::Expected<std::string, utils::Error> EncodeSegment(SegmentType type, const SegmentRecords& records);

/**
 * @brief Decode a payload of any known type
 *
 * INDEX payloads are returned as an opaque string; HnswIndex validates
 * them against the vector arena.
 */
utils::Expected<SegmentRecords, utils::Error> DecodeSegment(SegmentType type, const std::string& payload);

}  // namespace rvfstore::storage
