/**
 * @file native_backend.h
 * @brief Backend over an RvfContainer
 */

#pragma once

#include <memory>
#include <string>

#include "backend/backend.h"
#include "storage/rvf_container.h"
#include "vectors/vector_settings.h"

namespace rvfstore::backend {

class NativeBackend : public Backend {
 public:
  /**
   * @brief Open (or create) the container at @p path
   */
  static utils::Expected<std::unique_ptr<NativeBackend>, utils::Error> Open(const std::string& path,
                                                                            const storage::OpenOptions& options,
                                                                            const vectors::VectorSettings& settings);

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

  /// Underlying container (index build steps, meta, validation)
  storage::RvfContainer& container() { return *container_; }

 private:
  NativeBackend(std::unique_ptr<storage::RvfContainer> container, vectors::VectorSettings settings)
      : container_(std::move(container)), settings_(std::move(settings)) {}

  /// Dimension new embeddings must have; 0 while neither the segment nor the settings fix it
  uint32_t ExpectedDimension() const;

  /**
   * @brief Everything that can reject @p entry's embedding, checked before any write
   */
  utils::Expected<void, utils::Error> CheckEmbedding(const MemoryEntry& entry, uint32_t dim) const;

  /// Store after CheckEmbedding() passed
  utils::Expected<storage::KvRecord, utils::Error> StoreChecked(const MemoryEntry& entry);

  std::unique_ptr<storage::RvfContainer> container_;
  vectors::VectorSettings settings_;
};

}  // namespace rvfstore::backend
