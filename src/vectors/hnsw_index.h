/**
 * @file hnsw_index.h
 * @brief Hierarchical Navigable Small World index over a VectorArena
 *
 * The graph stores arena slots, never vector copies, so it is a derived
 * structure: it can be thrown away and rebuilt from the VEC segment at any
 * time. Vectors are dequantized into scratch buffers for one distance
 * computation at a time.
 *
 * Progressive availability: BuildFromSegment() only schedules the live
 * slots; BuildStep() links them in batches. Search() may run (from other
 * threads) while a build is in progress and answers over the nodes linked
 * so far. Status() reports how far the build has come.
 */

#pragma once

#include <cstdint>
#include <deque>
#include <memory>
#include <random>
#include <shared_mutex>
#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"
#include "vectors/distance.h"
#include "vectors/quantization.h"
#include "vectors/vector_arena.h"

namespace rvfstore::vectors {

namespace hnsw_defaults {
constexpr uint32_t kM = 16;
constexpr uint32_t kEfConstruction = 200;
constexpr uint32_t kEfSearch = 100;
constexpr uint64_t kSeed = 42;
constexpr int kMaxLevel = 16;
}  // namespace hnsw_defaults

/**
 * @brief Construction parameters
 */
struct HnswParams {
  uint32_t m = hnsw_defaults::kM;                              ///< Max neighbors per node on upper layers
  uint32_t ef_construction = hnsw_defaults::kEfConstruction;  ///< Beam width while linking
  Metric metric = Metric::kCosine;                             ///< Must match the VEC segment
  uint64_t seed = hnsw_defaults::kSeed;                        ///< Level assignment RNG seed
};

/**
 * @brief Build progress
 */
struct IndexStatus {
  size_t total = 0;        ///< Nodes linked plus nodes pending
  size_t indexed = 0;      ///< Nodes linked into the graph
  double fraction = 1.0;   ///< indexed / total (1.0 when empty)
  uint32_t max_level = 0;  ///< Highest populated layer
  bool complete = true;    ///< No pending nodes
};

/**
 * @brief HNSW graph (Malkov & Yashunin) over arena slots
 *
 * Thread-safety:
 * - Search() and Status() take a shared lock
 * - Insert(), BuildStep() and BuildFromSegment() take an exclusive lock;
 *   BuildStep() releases it between nodes so searches interleave
 *
 * Example:
 * @code
 * HnswIndex index(arena.get(), params);
 * index.BuildFromSegment(arena.get(), params);
 * while (!index.Status().complete) {
 *   index.BuildStep(256);
 * }
 * auto hits = index.Search(query, 10, hnsw_defaults::kEfSearch);
 * @endcode
 */
class HnswIndex {
 public:
  /**
   * @brief Empty index bound to @p arena
   *
   * Use Create() when the metric has not been checked yet.
   */
  HnswIndex(VectorArena* arena, HnswParams params);

  /**
   * @brief Create an empty index, rejecting a metric that differs from the arena's
   */
  static utils::Expected<std::unique_ptr<HnswIndex>, utils::Error> Create(VectorArena* arena, HnswParams params);

  /**
   * @brief Discard the graph and schedule every live slot of @p arena
   *
   * @return kMetricMismatch if params.metric differs from the segment metric,
   *         kInvalidArgument for m < 2
   */
  utils::Expected<void, utils::Error> BuildFromSegment(VectorArena* arena, const HnswParams& params);

  /**
   * @brief Link up to @p max_nodes pending slots
   * @return Number of slots linked
   */
  size_t BuildStep(size_t max_nodes);

  /**
   * @brief Link every pending slot
   */
  void BuildAll();

  /**
   * @brief Append a vector to the arena and link it
   *
   * @return Arena slot of the new record
   */
  utils::Expected<uint32_t, utils::Error> Insert(const std::string& id, const std::vector<float>& vector,
                                                 Quantization quantization = Quantization::kFp32);

  /**
   * @brief Link a slot that was appended to the arena directly
   */
  utils::Expected<void, utils::Error> InsertSlot(uint32_t slot);

  /**
   * @brief Remove @p id through the arena (tombstone); the node stays as a router
   */
  utils::Expected<void, utils::Error> Remove(const std::string& id);

  /**
   * @brief Approximate k nearest live vectors
   *
   * @param ef_search Beam width on layer 0 (raised to k when smaller)
   * @return Hits sorted by distance, or kVectorDimensionMismatch
   */
  utils::Expected<std::vector<Neighbor>, utils::Error> Search(const std::vector<float>& query, size_t top_k,
                                                              size_t ef_search = hnsw_defaults::kEfSearch) const;

  IndexStatus Status() const;

  [[nodiscard]] const HnswParams& params() const { return params_; }

  /**
   * @brief Serialize to an INDEX segment payload
   */
  std::string Serialize() const;

  /**
   * @brief Restore a graph saved by Serialize()
   *
   * Fails with kCorruptSegment when the payload is malformed or was built
   * over a different arena (slot count, dimension or metric). Callers
   * discard the payload and rebuild in that case.
   */
  static utils::Expected<std::unique_ptr<HnswIndex>, utils::Error> Deserialize(const std::string& payload,
                                                                               VectorArena* arena);

 private:
  struct Candidate {
    float distance;
    uint32_t slot;
    bool operator<(const Candidate& other) const {
      return distance < other.distance || (distance == other.distance && slot < other.slot);
    }
    bool operator>(const Candidate& other) const { return other < *this; }
  };

  static constexpr int32_t kAbsent = -1;
  static constexpr uint32_t kNoEntry = 0xFFFFFFFFU;

  void LinkSlotLocked(uint32_t slot);
  int RandomLevel();
  size_t Capacity(int level) const { return level == 0 ? 2 * params_.m : params_.m; }

  float SlotDistance(const QueryDistance& query, uint32_t slot, std::vector<float>& scratch) const;

  uint32_t GreedyClosest(const QueryDistance& query, uint32_t entry, int from_level, int to_level,
                         std::vector<float>& scratch) const;
  std::vector<Candidate> SearchLayer(const QueryDistance& query, uint32_t entry, size_t ef, int level,
                                     std::vector<float>& scratch) const;
  std::vector<uint32_t> SelectNeighbors(const std::vector<Candidate>& sorted, size_t max_count) const;
  void EnsureSlotCapacity(uint32_t slot);

  VectorArena* arena_;
  HnswParams params_;
  double level_multiplier_;
  std::mt19937_64 rng_;

  mutable std::shared_mutex mutex_;
  std::vector<int32_t> levels_;                          ///< slot -> top level, kAbsent if not linked
  std::vector<std::vector<std::vector<uint32_t>>> links_;  ///< slot -> level -> neighbor slots
  uint32_t entry_ = kNoEntry;
  int max_level_ = 0;
  size_t indexed_ = 0;
  std::deque<uint32_t> pending_;
};

}  // namespace rvfstore::vectors
