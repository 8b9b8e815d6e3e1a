/**
 * @file native_backend.cpp
 * @brief Backend over an RvfContainer
 */

#include "backend/native_backend.h"

#include <algorithm>
#include <set>

namespace rvfstore::backend {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

Expected<std::unique_ptr<NativeBackend>, Error> NativeBackend::Open(const std::string& path,
                                                                    const storage::OpenOptions& options,
                                                                    const vectors::VectorSettings& settings) {
  auto container = std::make_unique<storage::RvfContainer>();
  auto opened = container->Open(path, options);
  if (!opened) {
    return MakeUnexpected(opened.error());
  }
  return std::unique_ptr<NativeBackend>(new NativeBackend(std::move(container), settings));
}

uint32_t NativeBackend::ExpectedDimension() const {
  return container_->HasVectors() ? container_->arena()->dim() : settings_.dimension;
}

Expected<void, Error> NativeBackend::CheckEmbedding(const MemoryEntry& entry, uint32_t dim) const {
  const auto& embedding = *entry.embedding;
  if (dim != 0 && embedding.size() != dim) {
    return MakeUnexpected(MakeError(ErrorCode::kVectorDimensionMismatch,
                                    "Embedding dimension mismatch: expected " + std::to_string(dim) + ", got " +
                                        std::to_string(embedding.size()),
                                    entry.record.id));
  }
  if (container_->HasVectors()) {
    return container_->arena()->CheckAppend(entry.record.id, settings_.quantization);
  }
  return vectors::VectorArena::CheckId(entry.record.id, settings_.id_width);
}

Expected<storage::KvRecord, Error> NativeBackend::Store(const MemoryEntry& entry) {
  if (entry.embedding) {
    auto checked = CheckEmbedding(entry, ExpectedDimension());
    if (!checked) {
      return MakeUnexpected(checked.error());
    }
  }
  return StoreChecked(entry);
}

Expected<storage::KvRecord, Error> NativeBackend::StoreChecked(const MemoryEntry& entry) {
  if (entry.embedding && !container_->HasVectors()) {
    auto created = container_->CreateVectorSegment(
        settings_.MakeHeader(static_cast<uint32_t>(entry.embedding->size())), settings_.IndexParams());
    if (!created) {
      return MakeUnexpected(created.error());
    }
  }

  auto stored = container_->PutKv(entry.record);
  if (!stored) {
    return stored;
  }
  if (entry.embedding) {
    auto put = container_->PutVector(entry.record.id, *entry.embedding, settings_.quantization);
    if (!put) {
      return MakeUnexpected(put.error());
    }
  }
  return stored;
}

Expected<std::vector<storage::KvRecord>, Error> NativeBackend::BulkInsert(const std::vector<MemoryEntry>& entries) {
  uint32_t dim = ExpectedDimension();
  for (const auto& entry : entries) {
    if (entry.record.id.empty()) {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "ID cannot be empty"));
    }
    if (!entry.embedding) {
      continue;
    }
    // The first embedding of the batch fixes the dimension of a new segment
    if (dim == 0) {
      dim = static_cast<uint32_t>(entry.embedding->size());
    }
    auto checked = CheckEmbedding(entry, dim);
    if (!checked) {
      return MakeUnexpected(checked.error());
    }
  }

  std::vector<storage::KvRecord> stored;
  stored.reserve(entries.size());
  for (const auto& entry : entries) {
    auto result = StoreChecked(entry);
    if (!result) {
      return MakeUnexpected(result.error());
    }
    stored.push_back(std::move(*result));
  }
  return stored;
}

Expected<storage::KvRecord, Error> NativeBackend::Update(const std::string& id, const EntryUpdate& update,
                                                         uint64_t timestamp) {
  auto current = container_->GetKv(id);
  if (!current) {
    return MakeUnexpected(MakeError(ErrorCode::kNotFound, "No live entry", id));
  }
  MemoryEntry entry;
  entry.record = MergeUpdate(std::move(*current), update, timestamp);
  entry.embedding = update.embedding;
  return Store(entry);
}

std::optional<storage::KvRecord> NativeBackend::Get(const std::string& id) const { return container_->GetKv(id); }

std::optional<storage::KvRecord> NativeBackend::GetByKey(const std::string& ns, const std::string& key) const {
  return container_->GetKvByKey(ns, key);
}

Expected<void, Error> NativeBackend::Delete(const std::string& id, uint64_t timestamp) {
  auto deleted = container_->DeleteKv(id, timestamp);
  if (!deleted) {
    return deleted;
  }
  if (container_->HasVectors() && container_->arena()->FindSlot(id)) {
    return container_->RemoveVector(id);
  }
  return {};
}

Expected<size_t, Error> NativeBackend::BulkDelete(const std::vector<std::string>& ids, uint64_t timestamp) {
  size_t deleted = 0;
  for (const auto& id : ids) {
    auto result = Delete(id, timestamp);
    if (!result) {
      if (result.error().code() == ErrorCode::kNotFound) {
        continue;
      }
      return MakeUnexpected(result.error());
    }
    ++deleted;
  }
  return deleted;
}

Expected<size_t, Error> NativeBackend::ClearNamespace(const std::string& ns, uint64_t timestamp) {
  std::vector<std::string> ids;
  for (const auto& record : container_->ListKv(ns)) {
    ids.push_back(record.id);
  }
  return BulkDelete(ids, timestamp);
}

Expected<std::vector<storage::KvRecord>, Error> NativeBackend::Query(const MemoryQuery& query) const {
  std::vector<storage::KvRecord> matches;
  for (auto& record : container_->ListKv(query.ns)) {
    if (MatchesQuery(record, query)) {
      matches.push_back(std::move(record));
    }
  }
  return PageQueryResults(std::move(matches), query);
}

size_t NativeBackend::Count(const std::optional<std::string>& ns) const { return container_->KvCount(ns); }

std::vector<std::string> NativeBackend::ListNamespaces() const {
  std::set<std::string> namespaces;
  for (const auto& record : container_->ListKv()) {
    namespaces.insert(record.ns);
  }
  return {namespaces.begin(), namespaces.end()};
}

BackendStats NativeBackend::GetStats() const {
  BackendStats stats;
  for (const auto& record : container_->ListKv()) {
    ++stats.total_entries;
    ++stats.entries_by_namespace[record.ns];
    stats.value_bytes += record.value.size();
  }
  if (container_->HasVectors()) {
    stats.vector_count = container_->arena()->LiveCount();
    stats.index_size = container_->IndexStatus().indexed;
  }
  return stats;
}

Expected<std::vector<SearchResult>, Error> NativeBackend::Search(const std::vector<float>& vector, size_t top_k,
                                                                 uint64_t now, const SearchFilter& filter) const {
  std::vector<SearchResult> results;
  if (top_k == 0 || !container_->HasVectors()) {
    return results;
  }

  // Over-fetch, and widen while filtering leaves fewer than top_k hits
  const bool cosine = container_->arena()->metric() == vectors::Metric::kCosine;
  const size_t live = container_->arena()->LiveCount();
  if (live == 0) {
    return results;
  }
  size_t fetch = std::min(live, top_k * 2);
  while (true) {
    auto neighbors = container_->SearchVectors(vector, fetch, std::max<size_t>(settings_.ef_search, fetch));
    if (!neighbors) {
      return MakeUnexpected(neighbors.error());
    }

    results.clear();
    for (const auto& neighbor : *neighbors) {
      auto record = container_->GetKv(neighbor.id);
      if (!record) {
        continue;
      }
      if (now != 0 && record->expires_at && *record->expires_at <= now) {
        continue;
      }
      if (!MatchesFilter(*record, filter)) {
        continue;
      }
      const float score = ScoreFromDistance(neighbor.distance, cosine);
      if (filter.min_score && score < *filter.min_score) {
        continue;
      }
      results.push_back(SearchResult{neighbor.id, neighbor.distance, score, std::move(record)});
      if (results.size() == top_k) {
        return results;
      }
    }
    if (fetch >= live) {
      return results;
    }
    fetch = std::min(live, fetch * 2);
  }
}

Expected<uint64_t, Error> NativeBackend::Append(const std::string& payload, uint64_t timestamp) {
  return container_->AppendLog(payload, timestamp);
}

std::vector<storage::LogRecord> NativeBackend::ReadLog(uint64_t from_seq) const {
  return container_->ReadLog(from_seq);
}

Expected<void, Error> NativeBackend::SaveSnapshot(const storage::SnapshotRecord& snapshot) {
  return container_->SaveSnapshot(snapshot);
}

std::optional<storage::SnapshotRecord> NativeBackend::GetSnapshot(const std::string& aggregate_key) const {
  return container_->GetSnapshot(aggregate_key);
}

Expected<void, Error> NativeBackend::Flush() { return container_->Flush(); }

Expected<void, Error> NativeBackend::Close() { return container_->Close(); }

HealthStatus NativeBackend::Health() const {
  auto container_health = container_->Health();
  HealthStatus health;
  health.segment_count = container_health.segment_count;
  health.index_build_fraction = container_health.index_build_fraction;
  health.last_checksum_ok = container_health.last_checksum_ok;
  health.read_only = container_health.read_only;
  health.format = migration::StoreFormat::kNativeContainer;
  return health;
}

}  // namespace rvfstore::backend
