/**
 * @file backend.h
 * @brief Uniform memory-store interface over native and legacy stores
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "migration/format_detector.h"
#include "storage/segment_codec.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace rvfstore::backend {

/**
 * @brief KV record plus optional embedding
 */
struct MemoryEntry {
  storage::KvRecord record;
  std::optional<std::vector<float>> embedding;
};

/**
 * @brief Search hit
 */
struct SearchResult {
  std::string id;
  float distance = 0.0F;
  float score = 0.0F;  ///< 1 - distance for cosine, -distance otherwise
  std::optional<storage::KvRecord> record;
};

/**
 * @brief Partial change applied by Backend::Update(); unset fields are kept
 */
struct EntryUpdate {
  std::optional<std::string> value;
  std::optional<std::vector<std::string>> tags;
  std::optional<uint64_t> expires_at;
  std::optional<std::vector<float>> embedding;
};

/**
 * @brief Filters for Backend::Query()
 *
 * Every set field must match. Time bounds are exclusive. Results are
 * ordered by id.
 */
struct MemoryQuery {
  std::optional<std::string> ns;
  std::optional<std::string> key;
  std::optional<std::string> key_prefix;
  std::vector<std::string> tags;  ///< Entry must carry all of them
  std::optional<uint64_t> created_after;
  std::optional<uint64_t> created_before;
  std::optional<uint64_t> updated_after;
  std::optional<uint64_t> updated_before;
  bool include_expired = false;
  uint64_t now = 0;   ///< Expiry reference; 0 skips the expiry check
  size_t limit = 0;   ///< 0 means no limit
  size_t offset = 0;
};

/**
 * @brief Extra conditions on Backend::Search() hits
 */
struct SearchFilter {
  std::optional<std::string> ns;
  std::vector<std::string> tags;   ///< Entry must carry all of them
  std::optional<float> min_score;  ///< Hits scoring below are dropped

  [[nodiscard]] bool empty() const { return !ns && tags.empty() && !min_score; }
};

/**
 * @brief Entry statistics
 */
struct BackendStats {
  size_t total_entries = 0;
  std::map<std::string, size_t> entries_by_namespace;
  size_t vector_count = 0;  ///< Live embeddings
  size_t index_size = 0;    ///< Nodes linked into the HNSW index
  uint64_t value_bytes = 0;
};

/**
 * @brief Backend health; never fails
 */
struct HealthStatus {
  size_t segment_count = 0;
  double index_build_fraction = 1.0;
  bool last_checksum_ok = false;
  bool read_only = false;
  migration::StoreFormat format = migration::StoreFormat::kUnknown;
};

/**
 * @brief Memory store
 *
 * Timestamps are supplied by the caller (milliseconds since epoch) so the
 * store itself never reads the clock.
 */
class Backend {
 public:
  virtual ~Backend() = default;

  /**
   * @brief Store a new version of an entry (and its embedding, if any)
   * @return Stored record with its assigned version
   */
  virtual utils::Expected<storage::KvRecord, utils::Error> Store(const MemoryEntry& entry) = 0;

  /**
   * @brief Store all entries, or none if one of them is invalid
   */
  virtual utils::Expected<std::vector<storage::KvRecord>, utils::Error> BulkInsert(
      const std::vector<MemoryEntry>& entries) = 0;

  /**
   * @brief Merge @p update into the live entry @p id as a new version
   * @return kNotFound if @p id has no live version
   */
  virtual utils::Expected<storage::KvRecord, utils::Error> Update(const std::string& id, const EntryUpdate& update,
                                                                  uint64_t timestamp) = 0;

  virtual std::optional<storage::KvRecord> Get(const std::string& id) const = 0;
  virtual std::optional<storage::KvRecord> GetByKey(const std::string& ns, const std::string& key) const = 0;
  virtual utils::Expected<void, utils::Error> Delete(const std::string& id, uint64_t timestamp) = 0;

  /**
   * @brief Delete every live id in @p ids; unknown ids are skipped
   * @return Number deleted
   */
  virtual utils::Expected<size_t, utils::Error> BulkDelete(const std::vector<std::string>& ids,
                                                           uint64_t timestamp) = 0;

  /// Delete every live entry in @p ns; returns the number deleted
  virtual utils::Expected<size_t, utils::Error> ClearNamespace(const std::string& ns, uint64_t timestamp) = 0;

  virtual utils::Expected<std::vector<storage::KvRecord>, utils::Error> Query(const MemoryQuery& query) const = 0;
  virtual size_t Count(const std::optional<std::string>& ns = std::nullopt) const = 0;
  virtual std::vector<std::string> ListNamespaces() const = 0;
  virtual BackendStats GetStats() const = 0;

  /**
   * @brief Nearest entries to @p vector
   *
   * Entries that are deleted or expired at @p now are dropped; pass 0 to
   * skip the expiry check. Hits failing @p filter are dropped before the
   * top_k cut.
   */
  virtual utils::Expected<std::vector<SearchResult>, utils::Error> Search(const std::vector<float>& vector,
                                                                         size_t top_k, uint64_t now = 0,
                                                                         const SearchFilter& filter = {}) const = 0;

  /**
   * @brief Append an event
   * @return Assigned sequence number
   */
  virtual utils::Expected<uint64_t, utils::Error> Append(const std::string& payload, uint64_t timestamp) = 0;
  virtual std::vector<storage::LogRecord> ReadLog(uint64_t from_seq = 0) const = 0;

  virtual utils::Expected<void, utils::Error> SaveSnapshot(const storage::SnapshotRecord& snapshot) = 0;
  virtual std::optional<storage::SnapshotRecord> GetSnapshot(const std::string& aggregate_key) const = 0;

  virtual utils::Expected<void, utils::Error> Flush() = 0;
  virtual utils::Expected<void, utils::Error> Close() = 0;
  virtual HealthStatus Health() const = 0;
};

/**
 * @brief Score reported for a distance under @p metric_is_cosine
 */
inline float ScoreFromDistance(float distance, bool metric_is_cosine) {
  return metric_is_cosine ? 1.0F - distance : -distance;
}

/// True if @p record carries every tag in @p tags
bool HasAllTags(const storage::KvRecord& record, const std::vector<std::string>& tags);

/// Query filters, without offset and limit
bool MatchesQuery(const storage::KvRecord& record, const MemoryQuery& query);

/// Namespace and tag conditions of @p filter (the score is checked by the caller)
bool MatchesFilter(const storage::KvRecord& record, const SearchFilter& filter);

/**
 * @brief Sort matches by id and apply offset and limit
 */
std::vector<storage::KvRecord> PageQueryResults(std::vector<storage::KvRecord> matches, const MemoryQuery& query);

/// EntryUpdate applied to a copy of @p current
storage::KvRecord MergeUpdate(storage::KvRecord current, const EntryUpdate& update, uint64_t timestamp);

}  // namespace rvfstore::backend
