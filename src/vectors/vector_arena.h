/**
 * @file vector_arena.h
 * @brief Append-only vector arena over a VEC segment payload
 *
 * The arena is a view onto the VEC segment bytes owned by the container.
 * Records are fixed-stride, so slot i is found without scanning. Updating
 * or removing a vector appends a newer record for the same id (a tombstone
 * for removal); the latest record per id is the live one. Slots are never
 * rewritten, which keeps the segment append-only.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "storage/segment_codec.h"
#include "utils/error.h"
#include "utils/expected.h"
#include "vectors/quantization.h"

namespace rvfstore::vectors {

/**
 * @brief Search hit
 */
struct Neighbor {
  std::string id;
  uint32_t slot = 0;
  float distance = 0.0F;
};

/**
 * @brief Arena statistics
 */
struct ArenaStatistics {
  size_t slot_count = 0;    ///< Records in the segment, including superseded ones
  size_t live_count = 0;    ///< Ids with a live (non-tombstone) latest record
  uint32_t dimension = 0;   ///< Vector dimension
  size_t payload_bytes = 0;  ///< Size of the VEC segment payload
};

/**
 * @brief Fixed-stride vector records with id lookup
 *
 * Not thread-safe on its own. HnswIndex serializes appends against
 * concurrent searches with its own lock.
 *
 * Example:
 * @code
 * std::string payload = storage::EncodeVecHeader(header);
 * auto arena = VectorArena::Attach(&payload);
 * (*arena)->Append("item1", values, Quantization::kFp32);
 * @endcode
 */
class VectorArena {
 public:
  /**
   * @brief Attach to a VEC payload and index its ids
   *
   * @param payload Segment bytes; must outlive the arena. Appends grow it.
   * @return Arena or kCorruptSegment if the payload does not validate
   */
  static utils::Expected<std::unique_ptr<VectorArena>, utils::Error> Attach(std::string* payload);

  [[nodiscard]] const storage::VecHeader& header() const { return header_; }
  [[nodiscard]] uint32_t dim() const { return header_.dim; }
  [[nodiscard]] Metric metric() const { return header_.metric; }

  /// Number of records, including superseded ones and tombstones
  [[nodiscard]] size_t SlotCount() const { return slot_count_; }

  /// Number of ids whose latest record is a vector
  [[nodiscard]] size_t LiveCount() const { return live_count_; }

  std::string IdAt(uint32_t slot) const;

  /**
   * @brief True if @p slot is the latest record of its id and not a tombstone
   */
  bool IsLive(uint32_t slot) const;

  /// Live slot for @p id
  std::optional<uint32_t> FindSlot(const std::string& id) const;

  /// Live slots in slot order
  std::vector<uint32_t> LiveSlots() const;

  /**
   * @brief Dequantize slot @p slot into @p out (dim() floats)
   */
  void DecodeInto(uint32_t slot, float* out) const;

  /// Dequantized copy of the live vector for @p id
  std::optional<std::vector<float>> GetVector(const std::string& id) const;

  /**
   * @brief Quantize and append a vector
   *
   * @param quantization Must not be wider than the segment's storage class
   * @return Slot of the new record
   */
  utils::Expected<uint32_t, utils::Error> Append(const std::string& id, const std::vector<float>& values,
                                                 Quantization quantization);

  /**
   * @brief Validate an id for a segment with @p id_width id bytes
   * @return kInvalidArgument if the id is empty, too long or holds a NUL
   */
  static utils::Expected<void, utils::Error> CheckId(const std::string& id, uint32_t id_width);

  /**
   * @brief Everything Append() checks about @p id and @p quantization, without writing
   */
  utils::Expected<void, utils::Error> CheckAppend(const std::string& id, Quantization quantization) const;

  /**
   * @brief Append an already quantized vector unchanged (migration, copy)
   */
  utils::Expected<uint32_t, utils::Error> AppendQuantized(const std::string& id, const QuantizedVector& vector);

  /**
   * @brief Append a tombstone for @p id
   * @return kVectorNotFound if @p id has no live vector
   */
  utils::Expected<void, utils::Error> Remove(const std::string& id);

  /**
   * @brief Exact k nearest live vectors (brute-force scan)
   */
  std::vector<Neighbor> ScanNearest(const std::vector<float>& query, size_t top_k) const;

  ArenaStatistics GetStatistics() const;

 private:
  VectorArena(std::string* payload, storage::VecHeader header, size_t slot_count);

  void Track(uint32_t slot, const std::string& id, bool tombstone);

  std::string* payload_;
  storage::VecHeader header_;
  size_t slot_count_;
  size_t live_count_ = 0;
  std::unordered_map<std::string, uint32_t> latest_;  ///< id -> latest slot (may be a tombstone)
};

}  // namespace rvfstore::vectors
