/**
 * @file rvf_container.cpp
 * @brief Container open/flush/validate and typed segment accessors
 */

#include "storage/rvf_container.h"

#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <unistd.h>
#include <zlib.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <set>

#include "storage/byte_buffer.h"
#include "utils/fd_guard.h"
#include "utils/sha256.h"
#include "utils/structured_log.h"

namespace rvfstore::storage {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

/**
 * @brief zlib CRC-32 continued from @p crc over @p length bytes
 *
 * crc32() takes a uInt length, so large buffers are fed in chunks.
 */
uint32_t ContinueCrc32(uint32_t crc, const char* data, size_t length) {
  constexpr size_t kChunk = std::numeric_limits<uInt>::max();
  uLong value = crc;
  while (length > 0) {
    size_t part = std::min(length, kChunk);
    value = crc32(value, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(part));
    data += part;
    length -= part;
  }
  return static_cast<uint32_t>(value);
}

Expected<std::string, Error> ReadWholeFile(const std::string& path) {
  std::ifstream input_stream(path, std::ios::binary);
  if (!input_stream) {
    return MakeUnexpected(
        MakeError(ErrorCode::kStorageReadError, "Failed to open file for reading: " + std::string(std::strerror(errno)),
                  path));
  }
  std::string bytes((std::istreambuf_iterator<char>(input_stream)), std::istreambuf_iterator<char>());
  if (input_stream.bad()) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageReadError, "Failed to read file", path));
  }
  return bytes;
}

Expected<void, Error> WriteAll(int fd, const char* data, size_t length, const std::string& path) {
  while (length > 0) {
    ssize_t written = ::write(fd, data, length);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      return MakeUnexpected(
          MakeError(ErrorCode::kStorageWriteError, "write failed: " + std::string(std::strerror(errno)), path));
    }
    data += written;
    length -= static_cast<size_t>(written);
  }
  return {};
}

/// fsync the directory holding @p path so the rename itself is durable
void SyncParentDirectory(const std::string& path) {
  std::filesystem::path parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) {
    parent = ".";
  }
  utils::FDGuard dir_fd(::open(parent.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
  if (dir_fd.Get() >= 0) {
    ::fsync(dir_fd.Get());
  }
}

bool IsValidSegmentId(const std::string& id) {
  return !id.empty() && id.size() <= container_format::kSegmentIdSize && id.find('\0') == std::string::npos;
}

Error Corrupt(const std::string& path, const std::string& message) {
  return MakeError(ErrorCode::kCorruptSegment, message, path);
}

/// Type a well-known segment id must carry, if @p id is one
std::optional<SegmentType> WellKnownType(const std::string& id) {
  if (id == segment_ids::kKv) {
    return SegmentType::kKv;
  }
  if (id == segment_ids::kVec) {
    return SegmentType::kVec;
  }
  if (id == segment_ids::kIndex) {
    return SegmentType::kIndex;
  }
  if (id == segment_ids::kLog) {
    return SegmentType::kLog;
  }
  if (id == segment_ids::kSnap) {
    return SegmentType::kSnap;
  }
  if (id == segment_ids::kMeta) {
    return SegmentType::kMeta;
  }
  return std::nullopt;
}

}  // namespace

const char* ContainerStateName(ContainerState state) {
  switch (state) {
    case ContainerState::kClosed:
      return "closed";
    case ContainerState::kOpening:
      return "opening";
    case ContainerState::kOpen:
      return "open";
    case ContainerState::kClosing:
      return "closing";
  }
  return "unknown";
}

RvfContainer::~RvfContainer() {
  if (state_ == ContainerState::kOpen) {
    auto closed = Close();
    if (!closed) {
      utils::LogStorageError("close", path_, closed.error().to_string());
    }
  }
}

// ============================================================================
// Open / Close
// ============================================================================

Expected<void, Error> RvfContainer::Open(const std::string& path, const OpenOptions& options) {
  if (state_ != ContainerState::kClosed) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidState,
                                    std::string("Container is ") + ContainerStateName(state_), path_));
  }

  state_ = ContainerState::kOpening;
  path_ = path;
  options_ = options;

  auto fail = [this](const Error& error) -> Expected<void, Error> {
    Reset();
    lock_.Release();
    state_ = ContainerState::kClosed;
    return MakeUnexpected(error);
  };

  if (!options_.read_only && !options_.lock_held) {
    auto lock = utils::FileLock::Acquire(path);
    if (!lock) {
      return fail(lock.error());
    }
    lock_ = std::move(*lock);
  }

  std::error_code ec;
  bool exists = std::filesystem::exists(path, ec);
  if (!exists) {
    if (options_.read_only || !options_.create) {
      return fail(MakeError(ErrorCode::kNotFound, "Container not found", path));
    }
    // Stays in memory until the first Flush()
    on_disk_ = false;
    last_checksum_ok_ = true;
    state_ = ContainerState::kOpen;
    spdlog::debug("Created empty container {}", path);
    return {};
  }

  auto bytes = ReadWholeFile(path);
  if (!bytes) {
    return fail(bytes.error());
  }

  auto loaded = Load(*bytes);
  if (!loaded) {
    utils::LogStorageError("open", path, loaded.error().to_string());
    return fail(loaded.error());
  }

  on_disk_ = true;
  state_ = ContainerState::kOpen;
  spdlog::debug("Opened container {} ({} segments, {})", path, segments_.size(),
                options_.read_only ? "read-only" : "read-write");
  return {};
}

Expected<void, Error> RvfContainer::Close() {
  if (state_ == ContainerState::kClosed) {
    return {};
  }
  if (state_ != ContainerState::kOpen) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidState,
                                    std::string("Cannot close while ") + ContainerStateName(state_), path_));
  }

  if (!options_.read_only) {
    auto flushed = Flush();
    if (!flushed) {
      return flushed;
    }
  }

  state_ = ContainerState::kClosing;
  Reset();
  lock_.Release();
  state_ = ContainerState::kClosed;
  return {};
}

void RvfContainer::Discard() {
  if (state_ == ContainerState::kClosed) {
    return;
  }
  state_ = ContainerState::kClosing;
  Reset();
  lock_.Release();
  state_ = ContainerState::kClosed;
}

void RvfContainer::Reset() {
  index_.reset();
  arena_.reset();
  segments_.clear();
  segment_index_.clear();
  kv_latest_.clear();
  kv_keys_.clear();
  last_seq_ = 0;
  snapshots_.clear();
  meta_.clear();
  index_dirty_ = false;
  on_disk_ = false;
  last_checksum_ok_ = false;
  minor_version_ = container_format::kMinorVersion;
}

// ============================================================================
// Loading
// ============================================================================

Expected<void, Error> RvfContainer::Load(const std::string& bytes) {
  using namespace container_format;

  if (bytes.size() < kHeaderSize || std::memcmp(bytes.data(), kMagicNumber.data(), kMagicNumber.size()) != 0) {
    return MakeUnexpected(Corrupt(path_, "Not an RVF container (bad magic)"));
  }

  ByteReader header(bytes.data(), kHeaderSize);
  header.Skip(kMagicNumber.size());
  uint16_t major = header.GetU16();
  uint16_t minor = header.GetU16();
  uint64_t directory_offset = header.GetU64();

  if (major > kMaxSupportedMajorVersion) {
    return MakeUnexpected(MakeError(ErrorCode::kUnsupportedVersion,
                                    "Container major version " + std::to_string(major) + " is newer than " +
                                        std::to_string(kMaxSupportedMajorVersion) + "; upgrade required",
                                    path_));
  }
  if (major == 0) {
    return MakeUnexpected(Corrupt(path_, "Invalid major version 0"));
  }
  if (bytes.size() < kMinFileSize) {
    return MakeUnexpected(Corrupt(path_, "File truncated (" + std::to_string(bytes.size()) + " bytes)"));
  }

  const size_t body_size = bytes.size() - kDigestSize;
  auto digest = utils::SHA256::Hash(reinterpret_cast<const uint8_t*>(bytes.data()), body_size);
  if (std::memcmp(digest.data(), bytes.data() + body_size, kDigestSize) != 0) {
    last_checksum_ok_ = false;
    return MakeUnexpected(MakeError(ErrorCode::kChecksumMismatch, "File digest mismatch", path_));
  }
  last_checksum_ok_ = true;
  minor_version_ = minor;

  if (directory_offset < kHeaderSize || directory_offset > body_size - kDirectoryCountSize) {
    return MakeUnexpected(Corrupt(path_, "Directory offset out of range: " + std::to_string(directory_offset)));
  }

  ByteReader directory(bytes.data() + directory_offset, body_size - directory_offset);
  uint32_t count = directory.GetU32();
  if (count > kMaxSegments || static_cast<uint64_t>(count) * kDescriptorSize > directory.remaining()) {
    return MakeUnexpected(Corrupt(path_, "Segment count " + std::to_string(count) + " exceeds directory space"));
  }

  const uint64_t payload_start = directory_offset + kDirectoryCountSize + static_cast<uint64_t>(count) * kDescriptorSize;
  std::vector<SegmentDescriptor> descriptors;
  descriptors.reserve(count);
  std::set<std::string> seen_ids;

  for (uint32_t i = 0; i < count; ++i) {
    SegmentDescriptor descriptor;
    descriptor.offset = directory.GetU64();
    descriptor.length = directory.GetU64();
    descriptor.checksum = directory.GetU32();
    descriptor.type = directory.GetU8();
    descriptor.flags = directory.GetU8();
    char id_bytes[kSegmentIdSize];
    directory.GetBytes(id_bytes, kSegmentIdSize);
    descriptor.id.assign(id_bytes, strnlen(id_bytes, kSegmentIdSize));

    std::string where = "descriptor " + std::to_string(i);
    if (descriptor.id.empty()) {
      return MakeUnexpected(Corrupt(path_, where + " has an empty id"));
    }
    if (!seen_ids.insert(descriptor.id).second) {
      return MakeUnexpected(Corrupt(path_, "Duplicate segment id '" + descriptor.id + "'"));
    }
    if (descriptor.offset < payload_start || descriptor.offset > body_size ||
        descriptor.length > body_size - descriptor.offset) {
      return MakeUnexpected(Corrupt(path_, "Segment '" + descriptor.id + "' lies outside the payload area"));
    }
    descriptors.push_back(std::move(descriptor));
  }

  std::vector<const SegmentDescriptor*> by_offset;
  by_offset.reserve(descriptors.size());
  for (const auto& descriptor : descriptors) {
    by_offset.push_back(&descriptor);
  }
  std::sort(by_offset.begin(), by_offset.end(),
            [](const SegmentDescriptor* lhs, const SegmentDescriptor* rhs) { return lhs->offset < rhs->offset; });
  for (size_t i = 1; i < by_offset.size(); ++i) {
    if (by_offset[i - 1]->offset + by_offset[i - 1]->length > by_offset[i]->offset) {
      return MakeUnexpected(
          Corrupt(path_, "Segments '" + by_offset[i - 1]->id + "' and '" + by_offset[i]->id + "' overlap"));
    }
  }

  const SegmentEntry* index_segment = nullptr;
  for (auto& descriptor : descriptors) {
    auto entry = std::make_unique<SegmentEntry>();
    entry->payload.assign(bytes, descriptor.offset, descriptor.length);
    entry->flushed_size = entry->payload.size();
    entry->known = IsKnownSegmentType(descriptor.type);
    entry->descriptor = std::move(descriptor);

    uint32_t crc = ContinueCrc32(0, entry->payload.data(), entry->payload.size());
    if (crc != entry->descriptor.checksum) {
      entry->corrupt = true;
      entry->corrupt_reason = "CRC-32 mismatch";
    } else if (entry->known && entry->descriptor.type != static_cast<uint8_t>(SegmentType::kIndex)) {
      auto decoded = LoadSegment(*entry);
      if (!decoded) {
        entry->corrupt = true;
        entry->corrupt_reason = decoded.error().message();
      }
    }

    const bool derived = entry->descriptor.type == static_cast<uint8_t>(SegmentType::kIndex);
    if (entry->corrupt) {
      utils::LogCorruptSegment(path_, entry->descriptor.id, entry->corrupt_reason);
      if (!options_.read_only && !derived) {
        return MakeUnexpected(
            Corrupt(path_, "Segment '" + entry->descriptor.id + "': " + entry->corrupt_reason));
      }
    }

    segment_index_.emplace(entry->descriptor.id, segments_.size());
    segments_.push_back(std::move(entry));
    if (derived && segments_.back()->descriptor.id == segment_ids::kIndex) {
      index_segment = segments_.back().get();
    }
  }

  LoadIndex(index_segment);
  return {};
}

Expected<void, Error> RvfContainer::LoadSegment(SegmentEntry& entry) {
  const std::string& id = entry.descriptor.id;
  auto type = static_cast<SegmentType>(entry.descriptor.type);
  auto expected_type = WellKnownType(id);
  if (expected_type && *expected_type != type) {
    return MakeUnexpected(Corrupt(path_, "Segment '" + id + "' has type " + SegmentTypeName(entry.descriptor.type)));
  }
  const bool well_known = expected_type.has_value();

  switch (type) {
    case SegmentType::kKv: {
      auto records = DecodeKvSegment(entry.payload);
      if (!records) {
        return MakeUnexpected(records.error());
      }
      if (well_known) {
        for (const auto& record : *records) {
          TrackKv(record);
        }
      }
      return {};
    }
    case SegmentType::kLog: {
      auto records = DecodeLogSegment(entry.payload);
      if (!records) {
        return MakeUnexpected(records.error());
      }
      if (well_known) {
        last_seq_ = records->empty() ? 0 : records->back().seq;
      }
      return {};
    }
    case SegmentType::kSnap: {
      auto records = DecodeSnapshotSegment(entry.payload);
      if (!records) {
        return MakeUnexpected(records.error());
      }
      if (well_known) {
        for (auto& record : *records) {
          snapshots_[record.aggregate_key] = std::move(record);
        }
      }
      return {};
    }
    case SegmentType::kMeta: {
      auto entries = DecodeMetaSegment(entry.payload);
      if (!entries) {
        return MakeUnexpected(entries.error());
      }
      if (well_known) {
        meta_ = std::move(*entries);
      }
      return {};
    }
    case SegmentType::kVec: {
      if (!well_known) {
        auto decoded = DecodeVecSegment(entry.payload);
        if (!decoded) {
          return MakeUnexpected(decoded.error());
        }
        return {};
      }
      auto arena = vectors::VectorArena::Attach(&entry.payload);
      if (!arena) {
        return MakeUnexpected(arena.error());
      }
      arena_ = std::move(*arena);
      return {};
    }
    case SegmentType::kIndex:
      return {};
  }
  return {};
}

void RvfContainer::LoadIndex(const SegmentEntry* index_segment) {
  if (arena_ == nullptr) {
    if (index_segment != nullptr) {
      utils::LogStorageWarning("index_load", "INDEX segment present without a VEC segment; ignored");
    }
    return;
  }

  if (index_segment != nullptr && !index_segment->corrupt) {
    auto restored = vectors::HnswIndex::Deserialize(index_segment->payload, arena_.get());
    if (restored) {
      index_ = std::move(*restored);
    } else {
      utils::LogStorageWarning("index_load", "Discarding INDEX segment: " + restored.error().message());
    }
  }

  if (index_ == nullptr) {
    vectors::HnswParams params = options_.index_params;
    params.metric = arena_->metric();
    auto created = vectors::HnswIndex::Create(arena_.get(), params);
    if (!created) {
      utils::LogStorageWarning("index_load", "Cannot create index: " + created.error().message());
      return;
    }
    index_ = std::move(*created);
    auto scheduled = index_->BuildFromSegment(arena_.get(), params);
    if (!scheduled) {
      utils::LogStorageWarning("index_load", "Cannot schedule index build: " + scheduled.error().message());
      index_.reset();
      return;
    }
    index_dirty_ = true;
  }

  if (options_.build_index && !index_->Status().complete) {
    index_->BuildAll();
    index_dirty_ = true;
  }
}

void RvfContainer::TrackKv(const KvRecord& record) {
  auto iter = kv_latest_.find(record.id);
  if (iter != kv_latest_.end()) {
    const KvRecord& previous = iter->second;
    auto key_iter = kv_keys_.find({previous.ns, previous.key});
    if (key_iter != kv_keys_.end() && key_iter->second == record.id) {
      kv_keys_.erase(key_iter);
    }
    iter->second = record;
  } else {
    kv_latest_.emplace(record.id, record);
  }
  if (!record.tombstone) {
    kv_keys_[{record.ns, record.key}] = record.id;
  }
}

// ============================================================================
// Flush
// ============================================================================

bool RvfContainer::HasPendingChanges() const {
  if (!on_disk_ || index_dirty_) {
    return true;
  }
  return std::any_of(segments_.begin(), segments_.end(), [](const std::unique_ptr<SegmentEntry>& entry) {
    return entry->dirty || entry->payload.size() != entry->flushed_size;
  });
}

void RvfContainer::StoreIndexSegment() {
  if (index_ == nullptr || !index_dirty_) {
    return;
  }
  SegmentEntry* entry = MutableSegment(segment_ids::kIndex);
  if (entry == nullptr) {
    auto created = std::make_unique<SegmentEntry>();
    created->descriptor.id = segment_ids::kIndex;
    created->descriptor.type = static_cast<uint8_t>(SegmentType::kIndex);
    created->descriptor.flags = container_format::flags::kDerived;
    segment_index_.emplace(created->descriptor.id, segments_.size());
    segments_.push_back(std::move(created));
    entry = segments_.back().get();
  }
  entry->payload = index_->Serialize();
  entry->dirty = true;
  entry->corrupt = false;
  entry->corrupt_reason.clear();
  index_dirty_ = false;
}

Expected<void, Error> RvfContainer::Flush() {
  auto writable = CheckWritable("flush");
  if (!writable) {
    return writable;
  }

  StoreIndexSegment();
  if (!HasPendingChanges()) {
    return {};
  }

  using namespace container_format;
  std::vector<SegmentDescriptor> descriptors;
  descriptors.reserve(segments_.size());
  uint64_t offset = kHeaderSize + kDirectoryCountSize + segments_.size() * kDescriptorSize;
  for (const auto& entry : segments_) {
    SegmentDescriptor descriptor = entry->descriptor;
    if (entry->dirty) {
      descriptor.checksum = ContinueCrc32(0, entry->payload.data(), entry->payload.size());
    } else if (entry->payload.size() > entry->flushed_size) {
      descriptor.checksum = ContinueCrc32(descriptor.checksum, entry->payload.data() + entry->flushed_size,
                                          entry->payload.size() - entry->flushed_size);
    }
    descriptor.offset = offset;
    descriptor.length = entry->payload.size();
    offset += descriptor.length;
    descriptors.push_back(std::move(descriptor));
  }

  auto written = WriteFile(descriptors);
  if (!written) {
    utils::LogStorageError("flush", path_, written.error().to_string());
    return written;
  }

  for (size_t i = 0; i < segments_.size(); ++i) {
    segments_[i]->descriptor = descriptors[i];
    segments_[i]->flushed_size = segments_[i]->payload.size();
    segments_[i]->dirty = false;
  }
  on_disk_ = true;
  last_checksum_ok_ = true;
  minor_version_ = container_format::kMinorVersion;
  spdlog::debug("Flushed container {} ({} segments, {} bytes)", path_, segments_.size(),
                offset + container_format::kDigestSize);
  return {};
}

Expected<void, Error> RvfContainer::WriteFile(const std::vector<SegmentDescriptor>& descriptors) const {
  using namespace container_format;

  std::string head;
  ByteWriter writer(&head);
  writer.PutBytes(kMagicNumber.data(), kMagicNumber.size());
  writer.PutU16(kMajorVersion);
  writer.PutU16(kMinorVersion);
  writer.PutU64(kHeaderSize);
  writer.PutU32(static_cast<uint32_t>(descriptors.size()));
  for (const auto& descriptor : descriptors) {
    writer.PutU64(descriptor.offset);
    writer.PutU64(descriptor.length);
    writer.PutU32(descriptor.checksum);
    writer.PutU8(descriptor.type);
    writer.PutU8(descriptor.flags);
    writer.PutBytes(descriptor.id.data(), descriptor.id.size());
    writer.PutZeros(kSegmentIdSize - descriptor.id.size());
  }

  const std::string temp_path = path_ + ".tmp";
  utils::FDGuard fd(::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
  if (fd.Get() < 0) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageWriteError,
                                    "Failed to open file for writing: " + std::string(std::strerror(errno)),
                                    temp_path));
  }
  utils::ScopeGuard remove_temp([&temp_path]() { ::unlink(temp_path.c_str()); });

  utils::SHA256 hasher;
  hasher.Update(head);
  auto result = WriteAll(fd.Get(), head.data(), head.size(), temp_path);
  for (size_t i = 0; result && i < segments_.size(); ++i) {
    const std::string& payload = segments_[i]->payload;
    hasher.Update(payload);
    result = WriteAll(fd.Get(), payload.data(), payload.size(), temp_path);
  }
  if (!result) {
    return result;
  }

  auto digest = hasher.Finalize();
  result = WriteAll(fd.Get(), reinterpret_cast<const char*>(digest.data()), digest.size(), temp_path);
  if (!result) {
    return result;
  }

  if (options_.fsync && ::fsync(fd.Get()) != 0) {
    return MakeUnexpected(
        MakeError(ErrorCode::kStorageWriteError, "fsync failed: " + std::string(std::strerror(errno)), temp_path));
  }
  // Closed by hand so that a failing close() is reported
  if (::close(fd.Release()) != 0) {
    return MakeUnexpected(
        MakeError(ErrorCode::kStorageWriteError, "close failed: " + std::string(std::strerror(errno)), temp_path));
  }

  if (::rename(temp_path.c_str(), path_.c_str()) != 0) {
    return MakeUnexpected(
        MakeError(ErrorCode::kStorageWriteError, "rename failed: " + std::string(std::strerror(errno)), path_));
  }
  remove_temp.Release();

  if (options_.fsync) {
    SyncParentDirectory(path_);
  }
  return {};
}

// ============================================================================
// Segments
// ============================================================================

Expected<void, Error> RvfContainer::CheckWritable(const char* operation) const {
  if (state_ != ContainerState::kOpen) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidState,
                                    std::string("Container is ") + ContainerStateName(state_), operation));
  }
  if (options_.read_only) {
    return MakeUnexpected(MakeError(ErrorCode::kReadOnly, "Container opened read-only", operation));
  }
  return {};
}

const SegmentEntry* RvfContainer::Segment(const std::string& id) const {
  auto iter = segment_index_.find(id);
  return iter == segment_index_.end() ? nullptr : segments_[iter->second].get();
}

SegmentEntry* RvfContainer::MutableSegment(const std::string& id) {
  auto iter = segment_index_.find(id);
  return iter == segment_index_.end() ? nullptr : segments_[iter->second].get();
}

std::vector<SegmentDescriptor> RvfContainer::ListSegments() const {
  std::vector<SegmentDescriptor> result;
  result.reserve(segments_.size());
  for (const auto& entry : segments_) {
    result.push_back(entry->descriptor);
  }
  return result;
}

Expected<void, Error> RvfContainer::CreateSegment(const std::string& id, SegmentType type) {
  auto writable = CheckWritable("create_segment");
  if (!writable) {
    return writable;
  }
  if (!IsValidSegmentId(id)) {
    return MakeUnexpected(
        MakeError(ErrorCode::kInvalidArgument, "Segment id must be 1..10 bytes without NUL", id));
  }
  if (Segment(id) != nullptr) {
    return MakeUnexpected(MakeError(ErrorCode::kAlreadyExists, "Segment already exists", id));
  }
  if (type == SegmentType::kVec || type == SegmentType::kIndex) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument,
                                    "VEC and INDEX segments are created through CreateVectorSegment()", id));
  }
  auto expected_type = WellKnownType(id);
  if (expected_type && *expected_type != type) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument,
                                    std::string("Segment id is reserved for ") +
                                        SegmentTypeName(static_cast<uint8_t>(*expected_type)),
                                    id));
  }

  auto entry = std::make_unique<SegmentEntry>();
  entry->descriptor.id = id;
  entry->descriptor.type = static_cast<uint8_t>(type);
  entry->dirty = true;
  segment_index_.emplace(id, segments_.size());
  segments_.push_back(std::move(entry));
  return {};
}

Expected<SegmentEntry*, Error> RvfContainer::EnsureSegment(const char* id, SegmentType type) {
  SegmentEntry* entry = MutableSegment(id);
  if (entry == nullptr) {
    auto created = CreateSegment(id, type);
    if (!created) {
      return MakeUnexpected(created.error());
    }
    entry = MutableSegment(id);
  }
  if (entry->corrupt) {
    return MakeUnexpected(Corrupt(path_, std::string("Segment '") + id + "' is corrupt"));
  }
  return entry;
}

// ============================================================================
// KV
// ============================================================================

Expected<KvRecord, Error> RvfContainer::PutKv(KvRecord record) {
  auto iter = kv_latest_.find(record.id);
  if (iter != kv_latest_.end()) {
    record.version = iter->second.version + 1;
    if (record.created_at == 0) {
      record.created_at = iter->second.created_at;
    }
  } else {
    record.version = 1;
  }
  auto appended = AppendKvVersion(record);
  if (!appended) {
    return MakeUnexpected(appended.error());
  }
  return record;
}

Expected<void, Error> RvfContainer::AppendKvVersion(const KvRecord& record) {
  auto writable = CheckWritable("kv_put");
  if (!writable) {
    return writable;
  }
  if (record.id.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "ID cannot be empty"));
  }
  auto iter = kv_latest_.find(record.id);
  if (iter != kv_latest_.end() && record.version <= iter->second.version) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument,
                                    "Version " + std::to_string(record.version) + " is not newer than " +
                                        std::to_string(iter->second.version),
                                    record.id));
  }

  auto segment = EnsureSegment(segment_ids::kKv, SegmentType::kKv);
  if (!segment) {
    return MakeUnexpected(segment.error());
  }
  AppendKvRecord(&(*segment)->payload, record);
  TrackKv(record);
  return {};
}

std::optional<KvRecord> RvfContainer::GetKv(const std::string& id) const {
  auto iter = kv_latest_.find(id);
  if (iter == kv_latest_.end() || iter->second.tombstone) {
    return std::nullopt;
  }
  return iter->second;
}

std::optional<KvRecord> RvfContainer::GetKvByKey(const std::string& ns, const std::string& key) const {
  auto iter = kv_keys_.find({ns, key});
  if (iter == kv_keys_.end()) {
    return std::nullopt;
  }
  return GetKv(iter->second);
}

Expected<void, Error> RvfContainer::DeleteKv(const std::string& id, uint64_t timestamp) {
  auto current = GetKv(id);
  if (!current) {
    return MakeUnexpected(MakeError(ErrorCode::kNotFound, "No live entry", id));
  }
  KvRecord tombstone;
  tombstone.id = id;
  tombstone.key = current->key;
  tombstone.ns = current->ns;
  tombstone.created_at = current->created_at;
  tombstone.updated_at = timestamp;
  tombstone.version = current->version + 1;
  tombstone.tombstone = true;
  return AppendKvVersion(tombstone);
}

std::vector<KvRecord> RvfContainer::ListKv(const std::optional<std::string>& ns) const {
  std::vector<KvRecord> result;
  for (const auto& [id, record] : kv_latest_) {
    if (!record.tombstone && (!ns || record.ns == *ns)) {
      result.push_back(record);
    }
  }
  std::sort(result.begin(), result.end(), [](const KvRecord& lhs, const KvRecord& rhs) { return lhs.id < rhs.id; });
  return result;
}

size_t RvfContainer::KvCount(const std::optional<std::string>& ns) const {
  return static_cast<size_t>(std::count_if(kv_latest_.begin(), kv_latest_.end(), [&ns](const auto& item) {
    return !item.second.tombstone && (!ns || item.second.ns == *ns);
  }));
}

Expected<void, Error> RvfContainer::CompactKv() {
  auto writable = CheckWritable("kv_compact");
  if (!writable) {
    return writable;
  }
  SegmentEntry* entry = MutableSegment(segment_ids::kKv);
  if (entry == nullptr) {
    return {};
  }
  if (entry->corrupt) {
    return MakeUnexpected(Corrupt(path_, "Segment 'kv' is corrupt"));
  }

  // Keep the order in which the surviving versions were written
  auto records = DecodeKvSegment(entry->payload);
  if (!records) {
    return MakeUnexpected(records.error());
  }
  std::vector<KvRecord> survivors;
  for (auto& record : *records) {
    auto iter = kv_latest_.find(record.id);
    if (iter != kv_latest_.end() && !iter->second.tombstone && iter->second.version == record.version) {
      survivors.push_back(std::move(record));
    }
  }

  size_t before = records->size();
  entry->payload = EncodeKvSegment(survivors);
  entry->dirty = true;
  for (auto iter = kv_latest_.begin(); iter != kv_latest_.end();) {
    iter = iter->second.tombstone ? kv_latest_.erase(iter) : std::next(iter);
  }
  utils::LogStorageInfo("kv_compact",
                        "Compacted KV segment from " + std::to_string(before) + " to " +
                            std::to_string(survivors.size()) + " records");
  return {};
}

// ============================================================================
// Vectors
// ============================================================================

Expected<void, Error> RvfContainer::CreateVectorSegment(const VecHeader& header,
                                                        const vectors::HnswParams& index_params) {
  auto writable = CheckWritable("create_vector_segment");
  if (!writable) {
    return writable;
  }
  if (Segment(segment_ids::kVec) != nullptr) {
    return MakeUnexpected(MakeError(ErrorCode::kAlreadyExists, "Segment already exists", segment_ids::kVec));
  }
  if (index_params.metric != header.metric) {
    return MakeUnexpected(MakeError(ErrorCode::kMetricMismatch,
                                    std::string("Index metric ") + vectors::MetricName(index_params.metric) +
                                        " differs from segment metric " + vectors::MetricName(header.metric)));
  }

  auto entry = std::make_unique<SegmentEntry>();
  entry->descriptor.id = segment_ids::kVec;
  entry->descriptor.type = static_cast<uint8_t>(SegmentType::kVec);
  entry->payload = EncodeVecHeader(header);
  entry->dirty = true;

  auto arena = vectors::VectorArena::Attach(&entry->payload);
  if (!arena) {
    return MakeUnexpected(arena.error());
  }
  auto index = vectors::HnswIndex::Create(arena->get(), index_params);
  if (!index) {
    return MakeUnexpected(index.error());
  }

  segment_index_.emplace(entry->descriptor.id, segments_.size());
  segments_.push_back(std::move(entry));
  arena_ = std::move(*arena);
  index_ = std::move(*index);
  index_dirty_ = true;
  return {};
}

Expected<void, Error> RvfContainer::PutVector(const std::string& id, const std::vector<float>& vector,
                                              vectors::Quantization quantization) {
  auto writable = CheckWritable("vector_put");
  if (!writable) {
    return writable;
  }
  if (arena_ == nullptr) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidState, "Container has no vector segment", id));
  }
  if (index_ != nullptr) {
    auto inserted = index_->Insert(id, vector, quantization);
    if (!inserted) {
      return MakeUnexpected(inserted.error());
    }
  } else {
    auto appended = arena_->Append(id, vector, quantization);
    if (!appended) {
      return MakeUnexpected(appended.error());
    }
  }
  index_dirty_ = true;
  return {};
}

Expected<void, Error> RvfContainer::AppendQuantizedVector(const std::string& id,
                                                          const vectors::QuantizedVector& vector) {
  auto writable = CheckWritable("vector_put");
  if (!writable) {
    return writable;
  }
  if (arena_ == nullptr) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidState, "Container has no vector segment", id));
  }
  auto appended = arena_->AppendQuantized(id, vector);
  if (!appended) {
    return MakeUnexpected(appended.error());
  }
  index_dirty_ = true;
  return {};
}

Expected<void, Error> RvfContainer::RemoveVector(const std::string& id) {
  auto writable = CheckWritable("vector_remove");
  if (!writable) {
    return writable;
  }
  if (arena_ == nullptr) {
    return MakeUnexpected(MakeError(ErrorCode::kVectorNotFound, "Container has no vector segment", id));
  }
  auto removed = index_ != nullptr ? index_->Remove(id) : arena_->Remove(id);
  if (!removed) {
    return removed;
  }
  index_dirty_ = true;
  return {};
}

std::optional<std::vector<float>> RvfContainer::GetVector(const std::string& id) const {
  if (arena_ == nullptr) {
    return std::nullopt;
  }
  return arena_->GetVector(id);
}

Expected<std::vector<vectors::Neighbor>, Error> RvfContainer::SearchVectors(const std::vector<float>& query,
                                                                           size_t top_k, size_t ef_search) const {
  if (arena_ == nullptr) {
    return std::vector<vectors::Neighbor>{};
  }
  if (query.size() != arena_->dim()) {
    return MakeUnexpected(MakeError(ErrorCode::kVectorDimensionMismatch,
                                    "Query dimension mismatch: expected " + std::to_string(arena_->dim()) +
                                        ", got " + std::to_string(query.size())));
  }
  if (index_ == nullptr) {
    return arena_->ScanNearest(query, top_k);
  }
  return index_->Search(query, top_k, ef_search);
}

Expected<void, Error> RvfContainer::RebuildIndex(const vectors::HnswParams& params, bool build_now) {
  if (state_ != ContainerState::kOpen) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidState,
                                    std::string("Container is ") + ContainerStateName(state_), "rebuild_index"));
  }
  if (arena_ == nullptr) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidState, "Container has no vector segment"));
  }
  auto index = vectors::HnswIndex::Create(arena_.get(), params);
  if (!index) {
    return MakeUnexpected(index.error());
  }
  auto scheduled = (*index)->BuildFromSegment(arena_.get(), params);
  if (!scheduled) {
    return scheduled;
  }
  if (build_now) {
    (*index)->BuildAll();
  }
  index_ = std::move(*index);
  index_dirty_ = true;
  return {};
}

size_t RvfContainer::BuildIndexStep(size_t max_nodes) {
  if (index_ == nullptr) {
    return 0;
  }
  size_t linked = index_->BuildStep(max_nodes);
  if (linked > 0) {
    index_dirty_ = true;
  }
  return linked;
}

vectors::IndexStatus RvfContainer::IndexStatus() const {
  if (index_ == nullptr) {
    return vectors::IndexStatus{};
  }
  return index_->Status();
}

// ============================================================================
// LOG / SNAP / META
// ============================================================================

Expected<uint64_t, Error> RvfContainer::AppendLog(const std::string& payload, uint64_t timestamp) {
  LogRecord record;
  record.seq = last_seq_ + 1;
  record.timestamp = timestamp;
  record.payload = payload;
  auto appended = AppendLogRecord(record);
  if (!appended) {
    return MakeUnexpected(appended.error());
  }
  return record.seq;
}

Expected<void, Error> RvfContainer::AppendLogRecord(const LogRecord& record) {
  auto writable = CheckWritable("log_append");
  if (!writable) {
    return writable;
  }
  if (record.seq <= last_seq_) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument,
                                    "Log seq " + std::to_string(record.seq) + " does not follow " +
                                        std::to_string(last_seq_)));
  }
  auto segment = EnsureSegment(segment_ids::kLog, SegmentType::kLog);
  if (!segment) {
    return MakeUnexpected(segment.error());
  }
  storage::AppendLogRecord(&(*segment)->payload, record);
  last_seq_ = record.seq;
  return {};
}

std::vector<LogRecord> RvfContainer::ReadLog(uint64_t from_seq) const {
  std::vector<LogRecord> result;
  const SegmentEntry* entry = Segment(segment_ids::kLog);
  if (entry == nullptr || entry->corrupt) {
    return result;
  }
  auto records = DecodeLogSegment(entry->payload);
  if (!records) {
    utils::LogCorruptSegment(path_, segment_ids::kLog, records.error().message());
    return result;
  }
  for (auto& record : *records) {
    if (record.seq >= from_seq) {
      result.push_back(std::move(record));
    }
  }
  return result;
}

Expected<void, Error> RvfContainer::SaveSnapshot(const SnapshotRecord& record) {
  auto writable = CheckWritable("snapshot_save");
  if (!writable) {
    return writable;
  }
  if (record.aggregate_key.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Aggregate key cannot be empty"));
  }
  auto segment = EnsureSegment(segment_ids::kSnap, SegmentType::kSnap);
  if (!segment) {
    return MakeUnexpected(segment.error());
  }
  AppendSnapshotRecord(&(*segment)->payload, record);
  snapshots_[record.aggregate_key] = record;
  return {};
}

std::optional<SnapshotRecord> RvfContainer::GetSnapshot(const std::string& aggregate_key) const {
  auto iter = snapshots_.find(aggregate_key);
  if (iter == snapshots_.end()) {
    return std::nullopt;
  }
  return iter->second;
}

std::optional<std::string> RvfContainer::GetMeta(const std::string& key) const {
  for (const auto& [name, value] : meta_) {
    if (name == key) {
      return value;
    }
  }
  return std::nullopt;
}

Expected<void, Error> RvfContainer::SetMeta(const std::string& key, const std::string& value) {
  auto writable = CheckWritable("meta_set");
  if (!writable) {
    return writable;
  }
  auto segment = EnsureSegment(segment_ids::kMeta, SegmentType::kMeta);
  if (!segment) {
    return MakeUnexpected(segment.error());
  }

  auto iter = std::find_if(meta_.begin(), meta_.end(), [&key](const auto& item) { return item.first == key; });
  if (iter != meta_.end()) {
    if (iter->second == value) {
      return {};
    }
    iter->second = value;
  } else {
    meta_.emplace_back(key, value);
  }
  (*segment)->payload = EncodeMetaSegment(meta_);
  (*segment)->dirty = true;
  return {};
}

// ============================================================================
// Diagnostics
// ============================================================================

ContainerHealth RvfContainer::Health() const {
  ContainerHealth health;
  health.segment_count = segments_.size();
  health.corrupt_segments = static_cast<size_t>(std::count_if(
      segments_.begin(), segments_.end(), [](const std::unique_ptr<SegmentEntry>& entry) { return entry->corrupt; }));
  health.index_build_fraction = index_ != nullptr ? index_->Status().fraction : 1.0;
  health.last_checksum_ok = last_checksum_ok_;
  health.read_only = options_.read_only;
  health.state = state_;
  return health;
}

Expected<ValidationReport, Error> RvfContainer::Validate(const std::string& path) {
  RvfContainer container;
  OpenOptions options;
  options.read_only = true;
  options.build_index = false;
  auto opened = container.Open(path, options);
  if (!opened) {
    return MakeUnexpected(opened.error());
  }

  for (const auto& entry : container.segments_) {
    if (entry->corrupt) {
      return MakeUnexpected(Corrupt(path, "Segment '" + entry->descriptor.id + "': " + entry->corrupt_reason));
    }
  }
  if (container.arena_ != nullptr) {
    const SegmentEntry* index_segment = container.Segment(segment_ids::kIndex);
    if (index_segment != nullptr) {
      auto restored = vectors::HnswIndex::Deserialize(index_segment->payload, container.arena_.get());
      if (!restored) {
        return MakeUnexpected(
            Corrupt(path, "Segment '" + std::string(segment_ids::kIndex) + "': " + restored.error().message()));
      }
    }
  }

  ValidationReport report;
  report.path = path;
  report.major_version = container_format::kMajorVersion;
  report.minor_version = container.minor_version_;
  report.segments = container.ListSegments();

  std::error_code ec;
  report.file_size = std::filesystem::file_size(path, ec);
  if (ec) {
    return MakeUnexpected(MakeError(ErrorCode::kIOError, ec.message(), path));
  }

  std::ifstream input_stream(path, std::ios::binary);
  if (input_stream && report.file_size >= container_format::kDigestSize) {
    input_stream.seekg(static_cast<std::streamoff>(report.file_size - container_format::kDigestSize));
    utils::SHA256::Digest digest{};
    input_stream.read(reinterpret_cast<char*>(digest.data()), static_cast<std::streamsize>(digest.size()));
    report.digest_hex = utils::SHA256::ToHex(digest);
  }

  auto closed = container.Close();
  if (!closed) {
    return MakeUnexpected(closed.error());
  }
  return report;
}

}  // namespace rvfstore::storage
