/**
 * @file segment_codec.cpp
 * @brief Segment codecs
 */

#include "storage/segment_codec.h"

#include <cstring>

#include "storage/byte_buffer.h"

namespace rvfstore::storage {

using namespace utils;

namespace {

// KV body flags
constexpr uint8_t kKvHasExpiry = 0x01;
constexpr uint8_t kKvTombstone = 0x02;
constexpr uint8_t kKvKnownFlags = kKvHasExpiry | kKvTombstone;

// Upper bound on tags per record; anything larger is treated as garbage
constexpr uint32_t kMaxTags = 65536;

Error Corrupt(const std::string& segment, const std::string& what, size_t position) {
  return MakeError(ErrorCode::kCorruptSegment, what, segment + " segment at byte " + std::to_string(position));
}

}  // namespace

// ============================================================================
// KV
// ============================================================================

// Record: u32 body_len | body
// Body:   id | key | ns | value | u32 tag_count | tags... | u64 created_at |
//         u64 updated_at | u8 flags | [u64 expires_at] | u32 version
void AppendKvRecord(std::string* payload, const KvRecord& record) {
  ByteWriter body;
  body.PutString(record.id);
  body.PutString(record.key);
  body.PutString(record.ns);
  body.PutString(record.value);
  body.PutU32(static_cast<uint32_t>(record.tags.size()));
  for (const auto& tag : record.tags) {
    body.PutString(tag);
  }
  body.PutU64(record.created_at);
  body.PutU64(record.updated_at);
  uint8_t flags = 0;
  if (record.expires_at.has_value()) {
    flags |= kKvHasExpiry;
  }
  if (record.tombstone) {
    flags |= kKvTombstone;
  }
  body.PutU8(flags);
  if (record.expires_at.has_value()) {
    body.PutU64(*record.expires_at);
  }
  body.PutU32(record.version);

  ByteWriter out(payload);
  out.PutU32(static_cast<uint32_t>(body.size()));
  out.PutBytes(body.data().data(), body.size());
}

std::string EncodeKvSegment(const std::vector<KvRecord>& records) {
  std::string payload;
  for (const auto& record : records) {
    AppendKvRecord(&payload, record);
  }
  return payload;
}

Expected<std::vector<KvRecord>, Error> DecodeKvSegment(const std::string& payload) {
  std::vector<KvRecord> records;
  ByteReader reader(payload);

  while (!reader.AtEnd()) {
    size_t record_start = reader.position();
    uint32_t body_len = reader.GetU32();
    if (!reader.ok() || body_len > reader.remaining()) {
      return MakeUnexpected(Corrupt("KV", "record length exceeds segment", record_start));
    }

    ByteReader body(reader.cursor(), body_len);
    reader.Skip(body_len);

    KvRecord record;
    body.GetString(record.id);
    body.GetString(record.key);
    body.GetString(record.ns);
    body.GetString(record.value);
    uint32_t tag_count = body.GetU32();
    if (!body.ok() || tag_count > kMaxTags || tag_count > body.remaining() / 4) {
      return MakeUnexpected(Corrupt("KV", "invalid tag count", record_start));
    }
    record.tags.resize(tag_count);
    for (auto& tag : record.tags) {
      body.GetString(tag);
    }
    record.created_at = body.GetU64();
    record.updated_at = body.GetU64();
    uint8_t flags = body.GetU8();
    if ((flags & ~kKvKnownFlags) != 0) {
      return MakeUnexpected(Corrupt("KV", "unknown record flags", record_start));
    }
    if ((flags & kKvHasExpiry) != 0) {
      record.expires_at = body.GetU64();
    }
    record.tombstone = (flags & kKvTombstone) != 0;
    record.version = body.GetU32();

    if (!body.ok()) {
      return MakeUnexpected(Corrupt("KV", "truncated record", record_start));
    }
    if (!body.AtEnd()) {
      return MakeUnexpected(Corrupt("KV", "trailing bytes in record", record_start));
    }
    if (record.id.empty()) {
      return MakeUnexpected(Corrupt("KV", "empty record id", record_start));
    }
    records.push_back(std::move(record));
  }

  return records;
}

// ============================================================================
// LOG
// ============================================================================

// Record: u64 seq | u64 timestamp | payload (u32 len + bytes)
void AppendLogRecord(std::string* payload, const LogRecord& record) {
  ByteWriter out(payload);
  out.PutU64(record.seq);
  out.PutU64(record.timestamp);
  out.PutString(record.payload);
}

std::string EncodeLogSegment(const std::vector<LogRecord>& records) {
  std::string payload;
  for (const auto& record : records) {
    AppendLogRecord(&payload, record);
  }
  return payload;
}

Expected<std::vector<LogRecord>, Error> DecodeLogSegment(const std::string& payload) {
  std::vector<LogRecord> records;
  ByteReader reader(payload);
  bool first = true;
  uint64_t last_seq = 0;

  while (!reader.AtEnd()) {
    size_t record_start = reader.position();
    LogRecord record;
    record.seq = reader.GetU64();
    record.timestamp = reader.GetU64();
    reader.GetString(record.payload);
    if (!reader.ok()) {
      return MakeUnexpected(Corrupt("LOG", "truncated record", record_start));
    }
    if (!first && record.seq <= last_seq) {
      return MakeUnexpected(Corrupt("LOG",
                                    "sequence not increasing (" + std::to_string(last_seq) + " then " +
                                        std::to_string(record.seq) + ")",
                                    record_start));
    }
    first = false;
    last_seq = record.seq;
    records.push_back(std::move(record));
  }

  return records;
}

// ============================================================================
// SNAP
// ============================================================================

// Record: aggregate_key | u64 at_seq | u64 timestamp | state
void AppendSnapshotRecord(std::string* payload, const SnapshotRecord& record) {
  ByteWriter out(payload);
  out.PutString(record.aggregate_key);
  out.PutU64(record.at_seq);
  out.PutU64(record.timestamp);
  out.PutString(record.state);
}

std::string EncodeSnapshotSegment(const std::vector<SnapshotRecord>& records) {
  std::string payload;
  for (const auto& record : records) {
    AppendSnapshotRecord(&payload, record);
  }
  return payload;
}

Expected<std::vector<SnapshotRecord>, Error> DecodeSnapshotSegment(const std::string& payload) {
  std::vector<SnapshotRecord> records;
  ByteReader reader(payload);

  while (!reader.AtEnd()) {
    size_t record_start = reader.position();
    SnapshotRecord record;
    reader.GetString(record.aggregate_key);
    record.at_seq = reader.GetU64();
    record.timestamp = reader.GetU64();
    reader.GetString(record.state);
    if (!reader.ok()) {
      return MakeUnexpected(Corrupt("SNAP", "truncated record", record_start));
    }
    if (record.aggregate_key.empty()) {
      return MakeUnexpected(Corrupt("SNAP", "empty aggregate key", record_start));
    }
    records.push_back(std::move(record));
  }

  return records;
}

// ============================================================================
// META
// ============================================================================

// u32 count | (key, value)*
std::string EncodeMetaSegment(const MetaEntries& entries) {
  ByteWriter out;
  out.PutU32(static_cast<uint32_t>(entries.size()));
  for (const auto& [key, value] : entries) {
    out.PutString(key);
    out.PutString(value);
  }
  return out.Take();
}

Expected<MetaEntries, Error> DecodeMetaSegment(const std::string& payload) {
  MetaEntries entries;
  if (payload.empty()) {
    return entries;
  }

  ByteReader reader(payload);
  uint32_t count = reader.GetU32();
  // Each pair needs at least two length prefixes
  if (!reader.ok() || count > reader.remaining() / 8) {
    return MakeUnexpected(Corrupt("META", "invalid entry count", 0));
  }
  entries.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    std::string key;
    std::string value;
    reader.GetString(key);
    reader.GetString(value);
    if (!reader.ok()) {
      return MakeUnexpected(Corrupt("META", "truncated entry " + std::to_string(i), reader.position()));
    }
    entries.emplace_back(std::move(key), std::move(value));
  }
  if (!reader.AtEnd()) {
    return MakeUnexpected(Corrupt("META", "trailing bytes", reader.position()));
  }
  return entries;
}

// ============================================================================
// VEC
// ============================================================================

size_t VecStride(const VecHeader& header) {
  return header.id_width + vec_format::kRecordPrefixSize + vectors::EncodedSize(header.quantization, header.dim);
}

std::string EncodeVecHeader(const VecHeader& header) {
  ByteWriter out;
  out.PutU32(header.dim);
  out.PutU32(header.id_width);
  out.PutU8(static_cast<uint8_t>(header.quantization));
  out.PutU8(static_cast<uint8_t>(header.metric));
  out.PutZeros(6);
  return out.Take();
}

Expected<VecHeader, Error> DecodeVecHeader(const std::string& payload) {
  if (payload.size() < vec_format::kHeaderSize) {
    return MakeUnexpected(Corrupt("VEC", "payload shorter than header", 0));
  }
  ByteReader reader(payload.data(), vec_format::kHeaderSize);
  VecHeader header;
  header.dim = reader.GetU32();
  header.id_width = reader.GetU32();
  uint8_t quant = reader.GetU8();
  uint8_t metric = reader.GetU8();

  if (header.dim == 0 || header.dim > vec_format::kMaxDim) {
    return MakeUnexpected(Corrupt("VEC", "invalid dimension " + std::to_string(header.dim), 0));
  }
  if (header.id_width < vec_format::kMinIdWidth || header.id_width > vec_format::kMaxIdWidth) {
    return MakeUnexpected(Corrupt("VEC", "invalid id width " + std::to_string(header.id_width), 4));
  }
  if (!vectors::IsValidQuantization(quant)) {
    return MakeUnexpected(Corrupt("VEC", "unknown storage quantization " + std::to_string(quant), 8));
  }
  if (!vectors::IsValidMetric(metric)) {
    return MakeUnexpected(Corrupt("VEC", "unknown metric " + std::to_string(metric), 9));
  }
  header.quantization = static_cast<vectors::Quantization>(quant);
  header.metric = static_cast<vectors::Metric>(metric);
  return header;
}

void AppendVecRecord(std::string* payload, const VecHeader& header, const std::string& id,
                     const vectors::QuantizedVector& vector, uint8_t flags) {
  ByteWriter out(payload);
  out.PutBytes(id.data(), id.size());
  out.PutZeros(header.id_width - id.size());
  out.PutU8(static_cast<uint8_t>(vector.quantization));
  out.PutU8(flags);
  out.PutU16(0);
  out.PutF32(vector.scale);
  out.PutF32(vector.offset);
  out.PutBytes(vector.data.data(), vector.data.size());
  // Narrower records are zero-padded to the storage class width
  out.PutZeros(vectors::EncodedSize(header.quantization, header.dim) - vector.data.size());
}

Expected<std::pair<VecHeader, size_t>, Error> DecodeVecSegment(const std::string& payload) {
  auto header = DecodeVecHeader(payload);
  if (!header) {
    return MakeUnexpected(header.error());
  }

  size_t stride = VecStride(*header);
  size_t body = payload.size() - vec_format::kHeaderSize;
  if (body % stride != 0) {
    return MakeUnexpected(Corrupt("VEC",
                                  "body of " + std::to_string(body) + " bytes is not a multiple of stride " +
                                      std::to_string(stride),
                                  vec_format::kHeaderSize));
  }

  size_t count = body / stride;
  for (size_t i = 0; i < count; ++i) {
    size_t base = vec_format::kHeaderSize + i * stride;
    if (payload[base] == '\0') {
      return MakeUnexpected(Corrupt("VEC", "empty id in record " + std::to_string(i), base));
    }
    auto quant = static_cast<uint8_t>(payload[base + header->id_width]);
    auto flags = static_cast<uint8_t>(payload[base + header->id_width + 1]);
    if (!vectors::IsValidQuantization(quant) ||
        !vectors::FitsIn(static_cast<vectors::Quantization>(quant), header->quantization)) {
      return MakeUnexpected(Corrupt("VEC", "record quantization wider than storage class", base));
    }
    if ((flags & ~vec_format::kFlagTombstone) != 0) {
      return MakeUnexpected(Corrupt("VEC", "unknown record flags", base));
    }
  }

  return std::make_pair(*header, count);
}

VecRecordView ReadVecRecord(const std::string& payload, const VecHeader& header, size_t index) {
  size_t base = vec_format::kHeaderSize + index * VecStride(header);
  const char* record = payload.data() + base;

  VecRecordView view;
  view.id.assign(record, strnlen(record, header.id_width));

  ByteReader reader(record + header.id_width, vec_format::kRecordPrefixSize);
  view.quantization = static_cast<vectors::Quantization>(reader.GetU8());
  view.flags = reader.GetU8();
  reader.GetU16();
  view.scale = reader.GetF32();
  view.offset = reader.GetF32();
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  view.data = reinterpret_cast<const uint8_t*>(record + header.id_width + vec_format::kRecordPrefixSize);
  return view;
}

// ============================================================================
// Generic entry points
// ============================================================================

Expected<std::string, Error> EncodeSegment(SegmentType type, const SegmentRecords& records) {
  auto mismatch = [type]() {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument,
                                    std::string("Records do not match segment type ") +
                                        SegmentTypeName(static_cast<uint8_t>(type))));
  };

  switch (type) {
    case SegmentType::kKv:
      if (const auto* kv = std::get_if<std::vector<KvRecord>>(&records)) {
        return EncodeKvSegment(*kv);
      }
      return mismatch();
    case SegmentType::kLog:
      if (const auto* log = std::get_if<std::vector<LogRecord>>(&records)) {
        return EncodeLogSegment(*log);
      }
      return mismatch();
    case SegmentType::kSnap:
      if (const auto* snap = std::get_if<std::vector<SnapshotRecord>>(&records)) {
        return EncodeSnapshotSegment(*snap);
      }
      return mismatch();
    case SegmentType::kMeta:
      if (const auto* meta = std::get_if<MetaEntries>(&records)) {
        return EncodeMetaSegment(*meta);
      }
      return mismatch();
    case SegmentType::kVec:
      if (const auto* vec = std::get_if<VecSegment>(&records)) {
        std::string payload = EncodeVecHeader(vec->header);
        for (const auto& record : vec->records) {
          if (record.id.empty() || record.id.size() > vec->header.id_width) {
            return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Vector id does not fit the id width",
                                            record.id));
          }
          if (!vectors::FitsIn(record.vector.quantization, vec->header.quantization) ||
              record.vector.data.size() != vectors::EncodedSize(record.vector.quantization, vec->header.dim)) {
            return MakeUnexpected(MakeError(ErrorCode::kQuantizationError,
                                            "Vector payload does not match the segment storage class", record.id));
          }
          AppendVecRecord(&payload, vec->header, record.id, record.vector, record.flags);
        }
        return payload;
      }
      return mismatch();
    case SegmentType::kIndex:
      if (const auto* raw = std::get_if<std::string>(&records)) {
        return *raw;
      }
      return mismatch();
  }
  return mismatch();
}

Expected<SegmentRecords, Error> DecodeSegment(SegmentType type, const std::string& payload) {
  switch (type) {
    case SegmentType::kKv: {
      auto kv = DecodeKvSegment(payload);
      if (!kv) {
        return MakeUnexpected(kv.error());
      }
      return SegmentRecords(std::move(*kv));
    }
    case SegmentType::kLog: {
      auto log = DecodeLogSegment(payload);
      if (!log) {
        return MakeUnexpected(log.error());
      }
      return SegmentRecords(std::move(*log));
    }
    case SegmentType::kSnap: {
      auto snap = DecodeSnapshotSegment(payload);
      if (!snap) {
        return MakeUnexpected(snap.error());
      }
      return SegmentRecords(std::move(*snap));
    }
    case SegmentType::kMeta: {
      auto meta = DecodeMetaSegment(payload);
      if (!meta) {
        return MakeUnexpected(meta.error());
      }
      return SegmentRecords(std::move(*meta));
    }
    case SegmentType::kVec: {
      auto decoded = DecodeVecSegment(payload);
      if (!decoded) {
        return MakeUnexpected(decoded.error());
      }
      VecSegment segment;
      segment.header = decoded->first;
      segment.records.reserve(decoded->second);
      for (size_t i = 0; i < decoded->second; ++i) {
        VecRecordView view = ReadVecRecord(payload, segment.header, i);
        VectorRecord record;
        record.id = view.id;
        record.flags = view.flags;
        record.vector.quantization = view.quantization;
        record.vector.scale = view.scale;
        record.vector.offset = view.offset;
        // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
        record.vector.data.assign(reinterpret_cast<const char*>(view.data),
                                  vectors::EncodedSize(view.quantization, segment.header.dim));
        segment.records.push_back(std::move(record));
      }
      return SegmentRecords(std::move(segment));
    }
    case SegmentType::kIndex:
      return SegmentRecords(payload);
  }
  return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Unknown segment type"));
}

}  // namespace rvfstore::storage
