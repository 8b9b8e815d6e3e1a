/**
 * @file legacy_backend.cpp
 * @brief Read-only legacy backend
 */

#include "backend/legacy_backend.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <set>

#include "vectors/distance.h"

namespace rvfstore::backend {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

LegacyBackend::LegacyBackend(std::string path, migration::StoreFormat format, vectors::Metric metric)
    : path_(std::move(path)), format_(format), metric_(metric) {}

Expected<void, Error> LegacyBackend::EnsureLoaded() const {
  if (loaded_) {
    if (load_error_) {
      return MakeUnexpected(*load_error_);
    }
    return {};
  }
  loaded_ = true;

  auto fail = [this](const Error& error) -> Expected<void, Error> {
    load_error_ = error;
    Clear();
    spdlog::error("Failed to load legacy store {}: {}", path_, error.to_string());
    return MakeUnexpected(error);
  };

  auto source = migration::OpenLegacySource(path_, format_);
  if (!source) {
    return fail(source.error());
  }

  auto read = migration::ForEachEntry(*source, [this](migration::LegacyEntry&& entry) -> Expected<void, Error> {
    storage::KvRecord& record = entry.record;
    auto previous = records_.find(record.id);
    if (previous != records_.end()) {
      record.version = previous->second.version + 1;
      keys_.erase({previous->second.ns, previous->second.key});
    }
    keys_[{record.ns, record.key}] = record.id;
    if (entry.embedding) {
      auto [slot, inserted] = embedding_slots_.emplace(record.id, embeddings_.size());
      if (inserted) {
        embeddings_.emplace_back(record.id, std::move(*entry.embedding));
      } else {
        embeddings_[slot->second].second = std::move(*entry.embedding);
      }
    }
    records_[record.id] = std::move(record);
    return {};
  });
  if (!read) {
    return fail(read.error());
  }

  read = migration::ForEachEvent(*source, [this](migration::LegacyEvent&& event) -> Expected<void, Error> {
    storage::LogRecord record;
    record.seq = log_.size() + 1;
    record.timestamp = event.timestamp;
    record.payload = std::move(event.payload);
    log_.push_back(std::move(record));
    return {};
  });
  if (!read) {
    return fail(read.error());
  }

  spdlog::debug("Loaded legacy store {} ({} entries, {} embeddings, {} events)", path_, records_.size(),
                embeddings_.size(), log_.size());
  return {};
}

Error LegacyBackend::ReadOnlyError(const char* operation) const {
  return MakeError(ErrorCode::kReadOnly, std::string("Legacy store is read-only; migrate it to ") + operation, path_);
}

void LegacyBackend::Clear() const {
  records_.clear();
  keys_.clear();
  embeddings_.clear();
  embedding_slots_.clear();
  log_.clear();
}

Expected<storage::KvRecord, Error> LegacyBackend::Store(const MemoryEntry& /*entry*/) {
  return MakeUnexpected(ReadOnlyError("store"));
}

Expected<std::vector<storage::KvRecord>, Error> LegacyBackend::BulkInsert(const std::vector<MemoryEntry>& /*entries*/) {
  return MakeUnexpected(ReadOnlyError("store"));
}

Expected<storage::KvRecord, Error> LegacyBackend::Update(const std::string& /*id*/, const EntryUpdate& /*update*/,
                                                         uint64_t /*timestamp*/) {
  return MakeUnexpected(ReadOnlyError("update"));
}

std::optional<storage::KvRecord> LegacyBackend::Get(const std::string& id) const {
  if (!EnsureLoaded()) {
    return std::nullopt;
  }
  auto iter = records_.find(id);
  if (iter == records_.end()) {
    return std::nullopt;
  }
  return iter->second;
}

std::optional<storage::KvRecord> LegacyBackend::GetByKey(const std::string& ns, const std::string& key) const {
  if (!EnsureLoaded()) {
    return std::nullopt;
  }
  auto iter = keys_.find({ns, key});
  if (iter == keys_.end()) {
    return std::nullopt;
  }
  return Get(iter->second);
}

Expected<void, Error> LegacyBackend::Delete(const std::string& /*id*/, uint64_t /*timestamp*/) {
  return MakeUnexpected(ReadOnlyError("delete"));
}

Expected<size_t, Error> LegacyBackend::BulkDelete(const std::vector<std::string>& /*ids*/, uint64_t /*timestamp*/) {
  return MakeUnexpected(ReadOnlyError("delete"));
}

Expected<size_t, Error> LegacyBackend::ClearNamespace(const std::string& /*ns*/, uint64_t /*timestamp*/) {
  return MakeUnexpected(ReadOnlyError("delete"));
}

Expected<std::vector<storage::KvRecord>, Error> LegacyBackend::Query(const MemoryQuery& query) const {
  auto loaded = EnsureLoaded();
  if (!loaded) {
    return MakeUnexpected(loaded.error());
  }
  std::vector<storage::KvRecord> matches;
  for (const auto& [id, record] : records_) {
    if (MatchesQuery(record, query)) {
      matches.push_back(record);
    }
  }
  return PageQueryResults(std::move(matches), query);
}

size_t LegacyBackend::Count(const std::optional<std::string>& ns) const {
  if (!EnsureLoaded()) {
    return 0;
  }
  if (!ns) {
    return records_.size();
  }
  return static_cast<size_t>(std::count_if(records_.begin(), records_.end(),
                                           [&ns](const auto& item) { return item.second.ns == *ns; }));
}

std::vector<std::string> LegacyBackend::ListNamespaces() const {
  std::set<std::string> namespaces;
  if (EnsureLoaded()) {
    for (const auto& [id, record] : records_) {
      namespaces.insert(record.ns);
    }
  }
  return {namespaces.begin(), namespaces.end()};
}

BackendStats LegacyBackend::GetStats() const {
  BackendStats stats;
  if (!EnsureLoaded()) {
    return stats;
  }
  for (const auto& [id, record] : records_) {
    ++stats.total_entries;
    ++stats.entries_by_namespace[record.ns];
    stats.value_bytes += record.value.size();
  }
  stats.vector_count = embeddings_.size();
  return stats;
}

Expected<std::vector<SearchResult>, Error> LegacyBackend::Search(const std::vector<float>& vector, size_t top_k,
                                                                 uint64_t now, const SearchFilter& filter) const {
  auto loaded = EnsureLoaded();
  if (!loaded) {
    return MakeUnexpected(loaded.error());
  }

  std::vector<SearchResult> results;
  if (top_k == 0 || vector.empty()) {
    return results;
  }
  vectors::QueryDistance distance(metric_, vector.data(), vector.size());
  const bool cosine = metric_ == vectors::Metric::kCosine;
  for (const auto& [id, embedding] : embeddings_) {
    if (embedding.size() != vector.size()) {
      continue;
    }
    auto record = records_.find(id);
    if (record == records_.end()) {
      continue;
    }
    if (now != 0 && record->second.expires_at && *record->second.expires_at <= now) {
      continue;
    }
    if (!MatchesFilter(record->second, filter)) {
      continue;
    }
    float value = distance(embedding.data());
    float score = ScoreFromDistance(value, cosine);
    if (filter.min_score && score < *filter.min_score) {
      continue;
    }
    results.push_back(SearchResult{id, value, score, record->second});
  }

  auto by_distance = [](const SearchResult& lhs, const SearchResult& rhs) {
    return lhs.distance < rhs.distance || (lhs.distance == rhs.distance && lhs.id < rhs.id);
  };
  std::sort(results.begin(), results.end(), by_distance);
  if (results.size() > top_k) {
    results.resize(top_k);
  }
  return results;
}

Expected<uint64_t, Error> LegacyBackend::Append(const std::string& /*payload*/, uint64_t /*timestamp*/) {
  return MakeUnexpected(ReadOnlyError("append"));
}

std::vector<storage::LogRecord> LegacyBackend::ReadLog(uint64_t from_seq) const {
  std::vector<storage::LogRecord> result;
  if (!EnsureLoaded()) {
    return result;
  }
  for (const auto& record : log_) {
    if (record.seq >= from_seq) {
      result.push_back(record);
    }
  }
  return result;
}

Expected<void, Error> LegacyBackend::SaveSnapshot(const storage::SnapshotRecord& /*snapshot*/) {
  return MakeUnexpected(ReadOnlyError("save snapshots"));
}

std::optional<storage::SnapshotRecord> LegacyBackend::GetSnapshot(const std::string& /*aggregate_key*/) const {
  return std::nullopt;
}

Expected<void, Error> LegacyBackend::Flush() { return {}; }

Expected<void, Error> LegacyBackend::Close() {
  Clear();
  loaded_ = false;
  load_error_.reset();
  return {};
}

HealthStatus LegacyBackend::Health() const {
  HealthStatus health;
  health.segment_count = 0;
  health.index_build_fraction = 0.0;
  health.last_checksum_ok = loaded_ && !load_error_;
  health.read_only = true;
  health.format = format_;
  return health;
}

}  // namespace rvfstore::backend
