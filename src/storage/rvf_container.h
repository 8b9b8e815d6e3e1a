/**
 * @file rvf_container.h
 * @brief Segmented .rvf container: header, directory, payloads, digest
 *
 * The container loads every segment into memory on open and writes the
 * whole file back on Flush() through a temp file and an atomic rename, so
 * a reader never observes a half-written file. Write handles hold an
 * advisory lock ("<path>.lock"); read-only handles take no lock and see the
 * file as of their open.
 *
 * Well-known segments ("kv", "vec", "index", "log", "snap", "meta") back
 * the typed accessors. Other segments, including types this build does not
 * know, are carried through unchanged.
 */

#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "storage/container_format.h"
#include "storage/segment_codec.h"
#include "utils/error.h"
#include "utils/expected.h"
#include "utils/file_lock.h"
#include "vectors/hnsw_index.h"
#include "vectors/vector_arena.h"

namespace rvfstore::storage {

/**
 * @brief Open state machine: Closed -> Opening -> Open -> Closing -> Closed
 */
enum class ContainerState : std::uint8_t {
  kClosed,
  kOpening,
  kOpen,
  kClosing,
};

const char* ContainerStateName(ContainerState state);

/**
 * @brief Options for RvfContainer::Open()
 */
struct OpenOptions {
  bool create = false;     ///< Start an empty container when the file is absent
  bool read_only = false;  ///< No lock, no writes; corrupt segments are skipped
  bool fsync = true;       ///< fsync the temp file and directory on flush
  bool build_index = true;  ///< Link every pending index node during open
  bool lock_held = false;   ///< Caller already holds FileLock on the path; Open() takes none
  vectors::HnswParams index_params;  ///< Used when the index has to be rebuilt
};

/**
 * @brief One segment held in memory
 */
struct SegmentEntry {
  SegmentDescriptor descriptor;
  std::string payload;
  bool known = true;        ///< Type code understood by this build
  bool corrupt = false;     ///< Failed CRC or decode (read-only opens only)
  std::string corrupt_reason;
  bool dirty = false;       ///< Rewritten since last flush; CRC recomputed in full
  size_t flushed_size = 0;  ///< Payload bytes covered by descriptor.checksum
};

/**
 * @brief Health summary; never fails
 */
struct ContainerHealth {
  size_t segment_count = 0;
  size_t corrupt_segments = 0;
  double index_build_fraction = 1.0;
  bool last_checksum_ok = false;
  bool read_only = false;
  ContainerState state = ContainerState::kClosed;
};

/**
 * @brief Result of a full validation pass
 */
struct ValidationReport {
  std::string path;
  uint16_t major_version = 0;
  uint16_t minor_version = 0;
  uint64_t file_size = 0;
  std::string digest_hex;
  std::vector<SegmentDescriptor> segments;
};

/**
 * @brief Segmented binary container
 *
 * Not thread-safe except for SearchVectors() and IndexStatus(), which may
 * run concurrently with BuildIndexStep() (the index has its own lock).
 *
 * Example:
 * @code
 * RvfContainer container;
 * OpenOptions options;
 * options.create = true;
 * auto opened = container.Open("memory.rvf", options);
 * if (!opened) { ... }
 * container.AppendLog("payload", now_ms);
 * container.Flush();
 * container.Close();
 * @endcode
 */
class RvfContainer {
 public:
  RvfContainer() = default;
  ~RvfContainer();

  RvfContainer(const RvfContainer&) = delete;
  RvfContainer& operator=(const RvfContainer&) = delete;
  RvfContainer(RvfContainer&&) = delete;
  RvfContainer& operator=(RvfContainer&&) = delete;

  /**
   * @brief Open or create a container
   *
   * Errors leave the container Closed:
   * - kNotFound: file absent and create is false
   * - kUnsupportedVersion: major version newer than this build
   * - kChecksumMismatch: whole-file digest disagrees
   * - kCorruptSegment: directory or (write mode) a segment fails to parse
   * - kLockHeld: another writer holds the lock
   */
  utils::Expected<void, utils::Error> Open(const std::string& path, const OpenOptions& options);

  /**
   * @brief Persist changes (temp file + fsync + rename)
   *
   * Segment CRCs are recomputed only for rewritten segments; appended
   * segments extend their CRC over the appended bytes. A flush with no
   * pending change does nothing.
   */
  utils::Expected<void, utils::Error> Flush();

  /**
   * @brief Flush (write handles) and release the lock
   */
  utils::Expected<void, utils::Error> Close();

  /**
   * @brief Drop unflushed changes and release the lock without writing
   */
  void Discard();

  [[nodiscard]] ContainerState state() const { return state_; }
  [[nodiscard]] bool read_only() const { return options_.read_only; }
  [[nodiscard]] const std::string& path() const { return path_; }
  [[nodiscard]] bool HasPendingChanges() const;

  // ---------------------------------------------------------------------------
  // Segments
  // ---------------------------------------------------------------------------

  /// Segment by id, nullptr if absent
  const SegmentEntry* Segment(const std::string& id) const;

  /// Descriptors in directory order (offsets as of the last flush)
  std::vector<SegmentDescriptor> ListSegments() const;

  /**
   * @brief Add an empty segment of a known type
   *
   * VEC segments need a header; use CreateVectorSegment().
   */
  utils::Expected<void, utils::Error> CreateSegment(const std::string& id, SegmentType type);

  // ---------------------------------------------------------------------------
  // KV
  // ---------------------------------------------------------------------------

  /**
   * @brief Store a new version of @p record.id
   *
   * version is previous + 1; created_at is kept from the previous version
   * when the caller leaves it 0.
   *
   * @return The stored version
   */
  utils::Expected<KvRecord, utils::Error> PutKv(KvRecord record);

  /**
   * @brief Append a version exactly as given (migration)
   *
   * The version must be newer than the latest stored one.
   */
  utils::Expected<void, utils::Error> AppendKvVersion(const KvRecord& record);

  /// Latest live version
  std::optional<KvRecord> GetKv(const std::string& id) const;
  std::optional<KvRecord> GetKvByKey(const std::string& ns, const std::string& key) const;

  /**
   * @brief Append a tombstone version
   * @return kNotFound if there is no live version
   */
  utils::Expected<void, utils::Error> DeleteKv(const std::string& id, uint64_t timestamp);

  /// Live records, optionally in one namespace, ordered by id
  std::vector<KvRecord> ListKv(const std::optional<std::string>& ns = std::nullopt) const;
  size_t KvCount(const std::optional<std::string>& ns = std::nullopt) const;

  /**
   * @brief Rewrite the KV segment with only the latest live versions
   */
  utils::Expected<void, utils::Error> CompactKv();

  // ---------------------------------------------------------------------------
  // Vectors
  // ---------------------------------------------------------------------------

  /**
   * @brief Create the "vec" segment and an empty index over it
   */
  utils::Expected<void, utils::Error> CreateVectorSegment(const VecHeader& header,
                                                          const vectors::HnswParams& index_params);

  [[nodiscard]] bool HasVectors() const { return arena_ != nullptr; }
  [[nodiscard]] const vectors::VectorArena* arena() const { return arena_.get(); }

  /**
   * @brief Append a vector and link it into the index
   */
  utils::Expected<void, utils::Error> PutVector(const std::string& id, const std::vector<float>& vector,
                                                vectors::Quantization quantization);

  /**
   * @brief Append an already quantized vector without linking it (bulk load)
   *
   * Call RebuildIndex() once every vector is in.
   */
  utils::Expected<void, utils::Error> AppendQuantizedVector(const std::string& id,
                                                            const vectors::QuantizedVector& vector);

  utils::Expected<void, utils::Error> RemoveVector(const std::string& id);
  std::optional<std::vector<float>> GetVector(const std::string& id) const;

  /**
   * @brief Nearest vectors through the index, or a scan when there is none
   */
  utils::Expected<std::vector<vectors::Neighbor>, utils::Error> SearchVectors(const std::vector<float>& query,
                                                                             size_t top_k,
                                                                             size_t ef_search) const;

  /**
   * @brief Discard the index and schedule a rebuild from the VEC segment
   * @param build_now Link every node before returning
   */
  utils::Expected<void, utils::Error> RebuildIndex(const vectors::HnswParams& params, bool build_now);

  /// Link up to @p max_nodes pending nodes
  size_t BuildIndexStep(size_t max_nodes);

  vectors::IndexStatus IndexStatus() const;

  // ---------------------------------------------------------------------------
  // LOG
  // ---------------------------------------------------------------------------

  /**
   * @brief Append with the next sequence number
   * @return Assigned seq
   */
  utils::Expected<uint64_t, utils::Error> AppendLog(const std::string& payload, uint64_t timestamp);

  /**
   * @brief Append with an explicit seq, which must exceed LastSeq()
   */
  utils::Expected<void, utils::Error> AppendLogRecord(const LogRecord& record);

  /// Records with seq >= @p from_seq, in order
  std::vector<LogRecord> ReadLog(uint64_t from_seq = 0) const;

  [[nodiscard]] uint64_t LastSeq() const { return last_seq_; }

  // ---------------------------------------------------------------------------
  // SNAP
  // ---------------------------------------------------------------------------

  /**
   * @brief Append a snapshot; it becomes the live one for its key
   */
  utils::Expected<void, utils::Error> SaveSnapshot(const SnapshotRecord& record);

  /// Latest snapshot for @p aggregate_key
  std::optional<SnapshotRecord> GetSnapshot(const std::string& aggregate_key) const;

  // ---------------------------------------------------------------------------
  // META
  // ---------------------------------------------------------------------------

  std::optional<std::string> GetMeta(const std::string& key) const;
  utils::Expected<void, utils::Error> SetMeta(const std::string& key, const std::string& value);
  [[nodiscard]] const MetaEntries& meta() const { return meta_; }

  // ---------------------------------------------------------------------------
  // Diagnostics
  // ---------------------------------------------------------------------------

  ContainerHealth Health() const;

  /**
   * @brief Reopen @p path read-only and verify the digest and every segment
   *
   * Fails on the first problem found (checksum, structure, segment parse).
   */
  static utils::Expected<ValidationReport, utils::Error> Validate(const std::string& path);

 private:
  utils::Expected<void, utils::Error> Load(const std::string& bytes);
  utils::Expected<void, utils::Error> LoadSegment(SegmentEntry& entry);
  void LoadIndex(const SegmentEntry* index_segment);
  void Reset();

  utils::Expected<void, utils::Error> CheckWritable(const char* operation) const;
  SegmentEntry* MutableSegment(const std::string& id);
  utils::Expected<SegmentEntry*, utils::Error> EnsureSegment(const char* id, SegmentType type);
  void TrackKv(const KvRecord& record);
  void StoreIndexSegment();
  utils::Expected<void, utils::Error> WriteFile(const std::vector<SegmentDescriptor>& descriptors) const;

  std::string path_;
  OpenOptions options_;
  ContainerState state_ = ContainerState::kClosed;
  utils::FileLock lock_;
  bool on_disk_ = false;
  bool last_checksum_ok_ = false;
  uint16_t minor_version_ = container_format::kMinorVersion;

  std::vector<std::unique_ptr<SegmentEntry>> segments_;  ///< Directory order; stable payload addresses
  std::unordered_map<std::string, size_t> segment_index_;

  std::unordered_map<std::string, KvRecord> kv_latest_;  ///< id -> latest version (may be tombstone)
  std::map<std::pair<std::string, std::string>, std::string> kv_keys_;  ///< (ns, key) -> id
  uint64_t last_seq_ = 0;
  std::unordered_map<std::string, SnapshotRecord> snapshots_;
  MetaEntries meta_;

  std::unique_ptr<vectors::VectorArena> arena_;
  std::unique_ptr<vectors::HnswIndex> index_;
  bool index_dirty_ = false;
};

}  // namespace rvfstore::storage
