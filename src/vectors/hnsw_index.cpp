/**
 * @file hnsw_index.cpp
 * @brief HNSW construction, search and serialization
 */

#include "vectors/hnsw_index.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <functional>
#include <mutex>
#include <queue>

#include "storage/byte_buffer.h"
#include "utils/structured_log.h"

namespace rvfstore::vectors {

namespace {

constexpr std::array<char, 4> kIndexMagic = {'H', 'N', 'S', 'W'};
constexpr uint32_t kIndexFormatVersion = 1;

// Progress is logged once per this many linked nodes
constexpr size_t kProgressLogInterval = 10000;

utils::Error CorruptIndex(const std::string& what) {
  return utils::MakeError(utils::ErrorCode::kCorruptSegment, what, "INDEX segment");
}

}  // namespace

HnswIndex::HnswIndex(VectorArena* arena, HnswParams params)
    : arena_(arena),
      params_(params),
      level_multiplier_(1.0 / std::log(static_cast<double>(std::max<uint32_t>(params.m, 2)))),
      rng_(params.seed) {}

utils::Expected<std::unique_ptr<HnswIndex>, utils::Error> HnswIndex::Create(VectorArena* arena, HnswParams params) {
  if (params.m < 2) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument, "HNSW m must be at least 2"));
  }
  if (params.metric != arena->metric()) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kMetricMismatch,
                                                  std::string("Index metric ") + MetricName(params.metric) +
                                                      " does not match segment metric " +
                                                      MetricName(arena->metric())));
  }
  return std::make_unique<HnswIndex>(arena, params);
}

utils::Expected<void, utils::Error> HnswIndex::BuildFromSegment(VectorArena* arena, const HnswParams& params) {
  if (params.m < 2) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument, "HNSW m must be at least 2"));
  }
  if (params.metric != arena->metric()) {
    auto error = utils::MakeError(utils::ErrorCode::kMetricMismatch,
                                  std::string("Index metric ") + MetricName(params.metric) +
                                      " does not match segment metric " + MetricName(arena->metric()));
    utils::LogVectorIndexError("build", "", arena->dim(), error.message());
    return utils::MakeUnexpected(error);
  }

  std::unique_lock lock(mutex_);
  arena_ = arena;
  params_ = params;
  level_multiplier_ = 1.0 / std::log(static_cast<double>(params_.m));
  rng_.seed(params_.seed);

  levels_.assign(arena_->SlotCount(), kAbsent);
  links_.assign(arena_->SlotCount(), {});
  entry_ = kNoEntry;
  max_level_ = 0;
  indexed_ = 0;

  auto live = arena_->LiveSlots();
  pending_.assign(live.begin(), live.end());

  utils::StructuredLog()
      .Event("index_build_scheduled")
      .Field("nodes", static_cast<uint64_t>(pending_.size()))
      .Field("m", static_cast<uint64_t>(params_.m))
      .Field("ef_construction", static_cast<uint64_t>(params_.ef_construction))
      .Field("metric", MetricName(params_.metric))
      .Debug();
  return {};
}

size_t HnswIndex::BuildStep(size_t max_nodes) {
  size_t linked = 0;
  while (linked < max_nodes) {
    std::unique_lock lock(mutex_);
    if (pending_.empty()) {
      break;
    }
    uint32_t slot = pending_.front();
    pending_.pop_front();
    if (slot < levels_.size() && levels_[slot] != kAbsent) {
      continue;  // already linked through InsertSlot()
    }
    LinkSlotLocked(slot);
    ++linked;

    if (indexed_ % kProgressLogInterval == 0 || pending_.empty()) {
      utils::LogIndexProgress(indexed_, indexed_ + pending_.size(), static_cast<uint32_t>(max_level_));
    }
  }
  return linked;
}

void HnswIndex::BuildAll() {
  while (BuildStep(kProgressLogInterval) > 0) {
  }
}

utils::Expected<uint32_t, utils::Error> HnswIndex::Insert(const std::string& id, const std::vector<float>& vector,
                                                          Quantization quantization) {
  std::unique_lock lock(mutex_);
  auto slot = arena_->Append(id, vector, quantization);
  if (!slot) {
    return utils::MakeUnexpected(slot.error());
  }
  LinkSlotLocked(*slot);
  return *slot;
}

utils::Expected<void, utils::Error> HnswIndex::InsertSlot(uint32_t slot) {
  std::unique_lock lock(mutex_);
  if (slot >= arena_->SlotCount()) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kOutOfRange,
                                                  "Slot " + std::to_string(slot) + " is beyond the arena"));
  }
  if (slot < levels_.size() && levels_[slot] != kAbsent) {
    return {};
  }
  LinkSlotLocked(slot);
  return {};
}

utils::Expected<void, utils::Error> HnswIndex::Remove(const std::string& id) {
  std::unique_lock lock(mutex_);
  return arena_->Remove(id);
}

// ============================================================================
// Construction
// ============================================================================

int HnswIndex::RandomLevel() {
  std::uniform_real_distribution<double> uniform(0.0, 1.0);
  double sample = uniform(rng_);
  // uniform() may return exactly 0
  sample = std::max(sample, 1e-12);
  auto level = static_cast<int>(std::floor(-std::log(sample) * level_multiplier_));
  return std::min(level, hnsw_defaults::kMaxLevel);
}

void HnswIndex::EnsureSlotCapacity(uint32_t slot) {
  if (slot >= levels_.size()) {
    levels_.resize(static_cast<size_t>(slot) + 1, kAbsent);
    links_.resize(static_cast<size_t>(slot) + 1);
  }
}

float HnswIndex::SlotDistance(const QueryDistance& query, uint32_t slot, std::vector<float>& scratch) const {
  arena_->DecodeInto(slot, scratch.data());
  return query(scratch.data());
}

uint32_t HnswIndex::GreedyClosest(const QueryDistance& query, uint32_t entry, int from_level, int to_level,
                                  std::vector<float>& scratch) const {
  uint32_t current = entry;
  float current_distance = SlotDistance(query, current, scratch);

  for (int level = from_level; level > to_level; --level) {
    bool changed = true;
    while (changed) {
      changed = false;
      for (uint32_t neighbor : links_[current][level]) {
        float distance = SlotDistance(query, neighbor, scratch);
        if (distance < current_distance) {
          current_distance = distance;
          current = neighbor;
          changed = true;
        }
      }
    }
  }
  return current;
}

std::vector<HnswIndex::Candidate> HnswIndex::SearchLayer(const QueryDistance& query, uint32_t entry, size_t ef,
                                                         int level, std::vector<float>& scratch) const {
  std::vector<bool> visited(levels_.size(), false);
  std::priority_queue<Candidate, std::vector<Candidate>, std::greater<>> frontier;  // closest first
  std::priority_queue<Candidate> best;                                              // farthest first

  Candidate start{SlotDistance(query, entry, scratch), entry};
  visited[entry] = true;
  frontier.push(start);
  best.push(start);

  while (!frontier.empty()) {
    Candidate current = frontier.top();
    if (current.distance > best.top().distance && best.size() >= ef) {
      break;
    }
    frontier.pop();

    for (uint32_t neighbor : links_[current.slot][level]) {
      if (visited[neighbor]) {
        continue;
      }
      visited[neighbor] = true;
      float distance = SlotDistance(query, neighbor, scratch);
      if (best.size() < ef || distance < best.top().distance) {
        frontier.push(Candidate{distance, neighbor});
        best.push(Candidate{distance, neighbor});
        if (best.size() > ef) {
          best.pop();
        }
      }
    }
  }

  std::vector<Candidate> result;
  result.reserve(best.size());
  while (!best.empty()) {
    result.push_back(best.top());
    best.pop();
  }
  std::reverse(result.begin(), result.end());
  return result;
}

std::vector<uint32_t> HnswIndex::SelectNeighbors(const std::vector<Candidate>& sorted, size_t max_count) const {
  // Heuristic selection: keep a candidate only if it is closer to the base
  // than to every neighbor already kept, which spreads links across clusters
  std::vector<uint32_t> selected;
  std::vector<float> candidate_vec(arena_->dim());
  std::vector<float> selected_vec(arena_->dim());

  for (const auto& candidate : sorted) {
    if (selected.size() >= max_count) {
      break;
    }
    arena_->DecodeInto(candidate.slot, candidate_vec.data());
    QueryDistance from_candidate(params_.metric, candidate_vec.data(), arena_->dim());

    bool keep = true;
    for (uint32_t kept : selected) {
      if (SlotDistance(from_candidate, kept, selected_vec) < candidate.distance) {
        keep = false;
        break;
      }
    }
    if (keep) {
      selected.push_back(candidate.slot);
    }
  }
  return selected;
}

void HnswIndex::LinkSlotLocked(uint32_t slot) {
  EnsureSlotCapacity(static_cast<uint32_t>(arena_->SlotCount() - 1));
  EnsureSlotCapacity(slot);

  int level = RandomLevel();
  levels_[slot] = level;
  links_[slot].assign(static_cast<size_t>(level) + 1, {});
  ++indexed_;

  if (entry_ == kNoEntry) {
    entry_ = slot;
    max_level_ = level;
    return;
  }

  std::vector<float> query_vec(arena_->dim());
  std::vector<float> scratch(arena_->dim());
  arena_->DecodeInto(slot, query_vec.data());
  QueryDistance query(params_.metric, query_vec.data(), arena_->dim());

  uint32_t current = GreedyClosest(query, entry_, max_level_, level, scratch);

  for (int layer = std::min(level, max_level_); layer >= 0; --layer) {
    auto candidates = SearchLayer(query, current, params_.ef_construction, layer, scratch);
    auto neighbors = SelectNeighbors(candidates, params_.m);
    links_[slot][layer] = neighbors;

    for (uint32_t neighbor : neighbors) {
      auto& back_links = links_[neighbor][layer];
      back_links.push_back(slot);
      if (back_links.size() <= Capacity(layer)) {
        continue;
      }

      // Over capacity: re-select this neighbor's links around itself
      std::vector<float> neighbor_vec(arena_->dim());
      arena_->DecodeInto(neighbor, neighbor_vec.data());
      QueryDistance from_neighbor(params_.metric, neighbor_vec.data(), arena_->dim());
      std::vector<Candidate> ranked;
      ranked.reserve(back_links.size());
      for (uint32_t linked : back_links) {
        ranked.push_back(Candidate{SlotDistance(from_neighbor, linked, scratch), linked});
      }
      std::sort(ranked.begin(), ranked.end());
      back_links = SelectNeighbors(ranked, Capacity(layer));
    }

    if (!candidates.empty()) {
      current = candidates.front().slot;
    }
  }

  if (level > max_level_) {
    max_level_ = level;
    entry_ = slot;
  }
}

// ============================================================================
// Search
// ============================================================================

utils::Expected<std::vector<Neighbor>, utils::Error> HnswIndex::Search(const std::vector<float>& query,
                                                                       size_t top_k, size_t ef_search) const {
  std::shared_lock lock(mutex_);

  if (query.size() != arena_->dim()) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kVectorDimensionMismatch,
                                                  "Query dimension mismatch: expected " +
                                                      std::to_string(arena_->dim()) + ", got " +
                                                      std::to_string(query.size())));
  }

  std::vector<Neighbor> results;
  if (top_k == 0 || entry_ == kNoEntry) {
    return results;
  }

  std::vector<float> scratch(arena_->dim());
  QueryDistance distance(params_.metric, query.data(), arena_->dim());

  uint32_t current = GreedyClosest(distance, entry_, max_level_, 0, scratch);
  auto candidates = SearchLayer(distance, current, std::max(ef_search, top_k), 0, scratch);

  for (const auto& candidate : candidates) {
    if (results.size() >= top_k) {
      break;
    }
    // Superseded and removed records stay in the graph as routers only
    if (!arena_->IsLive(candidate.slot)) {
      continue;
    }
    results.push_back(Neighbor{arena_->IdAt(candidate.slot), candidate.slot, candidate.distance});
  }
  return results;
}

IndexStatus HnswIndex::Status() const {
  std::shared_lock lock(mutex_);
  IndexStatus status;
  status.indexed = indexed_;
  status.total = indexed_ + pending_.size();
  status.fraction = status.total == 0 ? 1.0 : static_cast<double>(indexed_) / static_cast<double>(status.total);
  status.max_level = static_cast<uint32_t>(max_level_);
  status.complete = pending_.empty();
  return status;
}

// ============================================================================
// Serialization
// ============================================================================

// magic "HNSW" | u32 version | u32 dim | u8 metric | 3 reserved | u32 m |
// u32 ef_construction | u64 seed | u64 slot_count | u32 entry | u32 max_level |
// per slot: u32 level (0xFFFFFFFF = absent), then per level: u32 n, n x u32 slot
std::string HnswIndex::Serialize() const {
  std::shared_lock lock(mutex_);
  storage::ByteWriter out;
  out.PutBytes(kIndexMagic.data(), kIndexMagic.size());
  out.PutU32(kIndexFormatVersion);
  out.PutU32(arena_->dim());
  out.PutU8(static_cast<uint8_t>(params_.metric));
  out.PutZeros(3);
  out.PutU32(params_.m);
  out.PutU32(params_.ef_construction);
  out.PutU64(params_.seed);
  out.PutU64(arena_->SlotCount());
  out.PutU32(entry_);
  out.PutU32(static_cast<uint32_t>(max_level_));

  for (size_t slot = 0; slot < arena_->SlotCount(); ++slot) {
    int32_t level = slot < levels_.size() ? levels_[slot] : kAbsent;
    out.PutU32(static_cast<uint32_t>(level));
    for (int32_t layer = 0; layer <= level; ++layer) {
      const auto& neighbors = links_[slot][layer];
      out.PutU32(static_cast<uint32_t>(neighbors.size()));
      for (uint32_t neighbor : neighbors) {
        out.PutU32(neighbor);
      }
    }
  }
  return out.Take();
}

utils::Expected<std::unique_ptr<HnswIndex>, utils::Error> HnswIndex::Deserialize(const std::string& payload,
                                                                                 VectorArena* arena) {
  storage::ByteReader reader(payload);
  std::array<char, 4> magic{};
  reader.GetBytes(magic.data(), magic.size());
  if (!reader.ok() || magic != kIndexMagic) {
    return utils::MakeUnexpected(CorruptIndex("bad magic"));
  }
  uint32_t version = reader.GetU32();
  uint32_t dim = reader.GetU32();
  uint8_t metric = reader.GetU8();
  reader.Skip(3);

  HnswParams params;
  params.m = reader.GetU32();
  params.ef_construction = reader.GetU32();
  params.seed = reader.GetU64();
  uint64_t slot_count = reader.GetU64();
  uint32_t entry = reader.GetU32();
  uint32_t max_level = reader.GetU32();

  if (!reader.ok()) {
    return utils::MakeUnexpected(CorruptIndex("truncated header"));
  }
  if (version != kIndexFormatVersion) {
    return utils::MakeUnexpected(CorruptIndex("unsupported index version " + std::to_string(version)));
  }
  if (!IsValidMetric(metric) || static_cast<Metric>(metric) != arena->metric() || dim != arena->dim()) {
    return utils::MakeUnexpected(CorruptIndex("index was built for a different vector segment"));
  }
  if (slot_count != arena->SlotCount()) {
    return utils::MakeUnexpected(CorruptIndex("index covers " + std::to_string(slot_count) + " slots, segment has " +
                                              std::to_string(arena->SlotCount())));
  }
  if (params.m < 2 || max_level > static_cast<uint32_t>(hnsw_defaults::kMaxLevel)) {
    return utils::MakeUnexpected(CorruptIndex("invalid construction parameters"));
  }
  params.metric = static_cast<Metric>(metric);

  auto index = std::make_unique<HnswIndex>(arena, params);
  // Continue the level sequence deterministically after a reload
  index->rng_.seed(params.seed ^ slot_count);
  index->levels_.assign(slot_count, kAbsent);
  index->links_.assign(slot_count, {});

  for (size_t slot = 0; slot < slot_count; ++slot) {
    auto level = static_cast<int32_t>(reader.GetU32());
    if (!reader.ok()) {
      return utils::MakeUnexpected(CorruptIndex("truncated node list"));
    }
    if (level == kAbsent) {
      continue;
    }
    if (level < 0 || level > static_cast<int32_t>(max_level)) {
      return utils::MakeUnexpected(CorruptIndex("node level out of range at slot " + std::to_string(slot)));
    }
    index->levels_[slot] = level;
    index->links_[slot].resize(static_cast<size_t>(level) + 1);
    for (int32_t layer = 0; layer <= level; ++layer) {
      uint32_t count = reader.GetU32();
      if (!reader.ok() || count > index->Capacity(layer) || count > reader.remaining() / 4) {
        return utils::MakeUnexpected(CorruptIndex("invalid neighbor count at slot " + std::to_string(slot)));
      }
      auto& neighbors = index->links_[slot][layer];
      neighbors.resize(count);
      for (auto& neighbor : neighbors) {
        neighbor = reader.GetU32();
        if (neighbor >= slot_count) {
          return utils::MakeUnexpected(CorruptIndex("neighbor out of range at slot " + std::to_string(slot)));
        }
      }
    }
    ++index->indexed_;
  }
  if (!reader.ok() || !reader.AtEnd()) {
    return utils::MakeUnexpected(CorruptIndex("trailing or missing bytes"));
  }

  // Every link must point at a node present on that layer
  for (size_t slot = 0; slot < slot_count; ++slot) {
    for (int32_t layer = 0; layer <= index->levels_[slot]; ++layer) {
      for (uint32_t neighbor : index->links_[slot][layer]) {
        if (index->levels_[neighbor] < layer) {
          return utils::MakeUnexpected(CorruptIndex("dangling link at slot " + std::to_string(slot)));
        }
      }
    }
  }

  if (index->indexed_ == 0) {
    if (entry != kNoEntry) {
      return utils::MakeUnexpected(CorruptIndex("entry point in an empty graph"));
    }
  } else {
    if (entry >= slot_count || index->levels_[entry] != static_cast<int32_t>(max_level)) {
      return utils::MakeUnexpected(CorruptIndex("invalid entry point"));
    }
    index->entry_ = entry;
    index->max_level_ = static_cast<int>(max_level);
  }

  // Live slots that never made it into the graph resume building
  for (uint32_t slot : arena->LiveSlots()) {
    if (index->levels_[slot] == kAbsent) {
      index->pending_.push_back(slot);
    }
  }
  return index;
}

}  // namespace rvfstore::vectors
