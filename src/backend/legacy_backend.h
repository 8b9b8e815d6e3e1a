/**
 * @file legacy_backend.h
 * @brief Read-only backend over an unmigrated legacy store
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "backend/backend.h"
#include "migration/legacy_reader.h"
#include "vectors/quantization.h"

namespace rvfstore::backend {

/**
 * @brief Legacy store served read-only
 *
 * Nothing is read until the first access; the whole source is then loaded
 * into memory. Writes fail with kReadOnly. Search is a brute-force scan.
 */
class LegacyBackend : public Backend {
 public:
  LegacyBackend(std::string path, migration::StoreFormat format, vectors::Metric metric = vectors::Metric::kCosine);

  utils::Expected<storage::KvRecord, utils::Error> Store(const MemoryEntry& entry) override;
  utils::Expected<std::vector<storage::KvRecord>, utils::Error> BulkInsert(
      const std::vector<MemoryEntry>& entries) override;
  utils::Expected<storage::KvRecord, utils::Error> Update(const std::string& id, const EntryUpdate& update,
                                                          uint64_t timestamp) override;
  std::optional<storage::KvRecord> Get(const std::string& id) const override;
  std::optional<storage::KvRecord> GetByKey(const std::string& ns, const std::string& key) const override;
  utils::Expected<void, utils::Error> Delete(const std::string& id, uint64_t timestamp) override;
  utils::Expected<size_t, utils::Error> BulkDelete(const std::vector<std::string>& ids, uint64_t timestamp) override;
  utils::Expected<size_t, utils::Error> ClearNamespace(const std::string& ns, uint64_t timestamp) override;
  utils::Expected<std::vector<storage::KvRecord>, utils::Error> Query(const MemoryQuery& query) const override;
  size_t Count(const std::optional<std::string>& ns = std::nullopt) const override;
  std::vector<std::string> ListNamespaces() const override;
  BackendStats GetStats() const override;
  utils::Expected<std::vector<SearchResult>, utils::Error> Search(const std::vector<float>& vector, size_t top_k,
                                                                 uint64_t now = 0,
                                                                 const SearchFilter& filter = {}) const override;
  utils::Expected<uint64_t, utils::Error> Append(const std::string& payload, uint64_t timestamp) override;
  std::vector<storage::LogRecord> ReadLog(uint64_t from_seq = 0) const override;
  utils::Expected<void, utils::Error> SaveSnapshot(const storage::SnapshotRecord& snapshot) override;
  std::optional<storage::SnapshotRecord> GetSnapshot(const std::string& aggregate_key) const override;
  utils::Expected<void, utils::Error> Flush() override;
  utils::Expected<void, utils::Error> Close() override;
  HealthStatus Health() const override;

  /// True once the source has been read
  [[nodiscard]] bool loaded() const { return loaded_; }

 private:
  /// Load on first use; later calls return the cached outcome
  utils::Expected<void, utils::Error> EnsureLoaded() const;
  utils::Error ReadOnlyError(const char* operation) const;
  void Clear() const;

  std::string path_;
  migration::StoreFormat format_;
  vectors::Metric metric_;

  mutable bool loaded_ = false;
  mutable std::optional<utils::Error> load_error_;
  mutable std::unordered_map<std::string, storage::KvRecord> records_;
  mutable std::map<std::pair<std::string, std::string>, std::string> keys_;
  mutable std::vector<std::pair<std::string, std::vector<float>>> embeddings_;  ///< First-seen order
  mutable std::unordered_map<std::string, size_t> embedding_slots_;            ///< id -> embeddings_ index
  mutable std::vector<storage::LogRecord> log_;
};

}  // namespace rvfstore::backend
