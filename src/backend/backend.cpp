/**
 * @file backend.cpp
 * @brief Query, filter and update helpers shared by the backends
 */

#include "backend/backend.h"

#include <algorithm>
#include <cstddef>

namespace rvfstore::backend {

bool HasAllTags(const storage::KvRecord& record, const std::vector<std::string>& tags) {
  return std::all_of(tags.begin(), tags.end(), [&record](const std::string& tag) {
    return std::find(record.tags.begin(), record.tags.end(), tag) != record.tags.end();
  });
}

bool MatchesQuery(const storage::KvRecord& record, const MemoryQuery& query) {
  if (query.ns && record.ns != *query.ns) {
    return false;
  }
  if (query.key && record.key != *query.key) {
    return false;
  }
  if (query.key_prefix && record.key.compare(0, query.key_prefix->size(), *query.key_prefix) != 0) {
    return false;
  }
  if (!HasAllTags(record, query.tags)) {
    return false;
  }
  if (query.created_after && record.created_at <= *query.created_after) {
    return false;
  }
  if (query.created_before && record.created_at >= *query.created_before) {
    return false;
  }
  if (query.updated_after && record.updated_at <= *query.updated_after) {
    return false;
  }
  if (query.updated_before && record.updated_at >= *query.updated_before) {
    return false;
  }
  if (!query.include_expired && query.now != 0 && record.expires_at && *record.expires_at <= query.now) {
    return false;
  }
  return true;
}

bool MatchesFilter(const storage::KvRecord& record, const SearchFilter& filter) {
  if (filter.ns && record.ns != *filter.ns) {
    return false;
  }
  return HasAllTags(record, filter.tags);
}

std::vector<storage::KvRecord> PageQueryResults(std::vector<storage::KvRecord> matches, const MemoryQuery& query) {
  std::sort(matches.begin(), matches.end(),
            [](const storage::KvRecord& lhs, const storage::KvRecord& rhs) { return lhs.id < rhs.id; });
  if (query.offset >= matches.size()) {
    return {};
  }
  matches.erase(matches.begin(), matches.begin() + static_cast<std::ptrdiff_t>(query.offset));
  if (query.limit != 0 && matches.size() > query.limit) {
    matches.resize(query.limit);
  }
  return matches;
}

storage::KvRecord MergeUpdate(storage::KvRecord current, const EntryUpdate& update, uint64_t timestamp) {
  if (update.value) {
    current.value = *update.value;
  }
  if (update.tags) {
    current.tags = *update.tags;
  }
  if (update.expires_at) {
    current.expires_at = *update.expires_at;
  }
  current.updated_at = timestamp;
  return current;
}

}  // namespace rvfstore::backend
