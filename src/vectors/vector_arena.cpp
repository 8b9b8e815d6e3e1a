/**
 * @file vector_arena.cpp
 * @brief Vector arena implementation
 */

#include "vectors/vector_arena.h"

#include <algorithm>

#include "utils/structured_log.h"
#include "vectors/distance.h"

namespace rvfstore::vectors {

VectorArena::VectorArena(std::string* payload, storage::VecHeader header, size_t slot_count)
    : payload_(payload), header_(header), slot_count_(slot_count) {}

utils::Expected<std::unique_ptr<VectorArena>, utils::Error> VectorArena::Attach(std::string* payload) {
  auto decoded = storage::DecodeVecSegment(*payload);
  if (!decoded) {
    return utils::MakeUnexpected(decoded.error());
  }

  std::unique_ptr<VectorArena> arena(new VectorArena(payload, decoded->first, decoded->second));
  for (size_t slot = 0; slot < arena->slot_count_; ++slot) {
    auto view = storage::ReadVecRecord(*payload, arena->header_, slot);
    arena->Track(static_cast<uint32_t>(slot), view.id, (view.flags & storage::vec_format::kFlagTombstone) != 0);
  }
  return arena;
}

void VectorArena::Track(uint32_t slot, const std::string& id, bool tombstone) {
  auto iter = latest_.find(id);
  bool was_live = false;
  if (iter != latest_.end()) {
    auto previous = storage::ReadVecRecord(*payload_, header_, iter->second);
    was_live = (previous.flags & storage::vec_format::kFlagTombstone) == 0;
    iter->second = slot;
  } else {
    latest_.emplace(id, slot);
  }

  if (was_live && tombstone) {
    --live_count_;
  } else if (!was_live && !tombstone) {
    ++live_count_;
  }
}

std::string VectorArena::IdAt(uint32_t slot) const {
  return storage::ReadVecRecord(*payload_, header_, slot).id;
}

bool VectorArena::IsLive(uint32_t slot) const {
  if (slot >= slot_count_) {
    return false;
  }
  auto view = storage::ReadVecRecord(*payload_, header_, slot);
  if ((view.flags & storage::vec_format::kFlagTombstone) != 0) {
    return false;
  }
  auto iter = latest_.find(view.id);
  return iter != latest_.end() && iter->second == slot;
}

std::optional<uint32_t> VectorArena::FindSlot(const std::string& id) const {
  auto iter = latest_.find(id);
  if (iter == latest_.end()) {
    return std::nullopt;
  }
  auto view = storage::ReadVecRecord(*payload_, header_, iter->second);
  if ((view.flags & storage::vec_format::kFlagTombstone) != 0) {
    return std::nullopt;
  }
  return iter->second;
}

std::vector<uint32_t> VectorArena::LiveSlots() const {
  std::vector<uint32_t> slots;
  slots.reserve(live_count_);
  for (const auto& [id, slot] : latest_) {
    auto view = storage::ReadVecRecord(*payload_, header_, slot);
    if ((view.flags & storage::vec_format::kFlagTombstone) == 0) {
      slots.push_back(slot);
    }
  }
  std::sort(slots.begin(), slots.end());
  return slots;
}

void VectorArena::DecodeInto(uint32_t slot, float* out) const {
  auto view = storage::ReadVecRecord(*payload_, header_, slot);
  Dequantize(view.quantization, view.scale, view.offset, view.data, header_.dim, out);
}

std::optional<std::vector<float>> VectorArena::GetVector(const std::string& id) const {
  auto slot = FindSlot(id);
  if (!slot) {
    return std::nullopt;
  }
  std::vector<float> out(header_.dim);
  DecodeInto(*slot, out.data());
  return out;
}

utils::Expected<void, utils::Error> VectorArena::CheckId(const std::string& id, uint32_t id_width) {
  if (id.empty()) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument, "ID cannot be empty"));
  }
  if (id.size() > id_width || id.find('\0') != std::string::npos) {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kInvalidArgument,
        "Vector id must be at most " + std::to_string(id_width) + " bytes without NUL", id));
  }
  return {};
}

utils::Expected<void, utils::Error> VectorArena::CheckAppend(const std::string& id, Quantization quantization) const {
  auto id_check = CheckId(id, header_.id_width);
  if (!id_check) {
    return id_check;
  }
  if (!FitsIn(quantization, header_.quantization)) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kQuantizationError,
                                                  std::string("Quantization ") + QuantizationName(quantization) +
                                                      " is wider than the segment storage class " +
                                                      QuantizationName(header_.quantization),
                                                  id));
  }
  return {};
}

utils::Expected<uint32_t, utils::Error> VectorArena::Append(const std::string& id, const std::vector<float>& values,
                                                            Quantization quantization) {
  if (values.size() != header_.dim) {
    auto error = utils::MakeError(
        utils::ErrorCode::kVectorDimensionMismatch,
        "Vector dimension mismatch: expected " + std::to_string(header_.dim) + ", got " + std::to_string(values.size()));
    utils::LogVectorIndexError("append", id, static_cast<uint32_t>(values.size()), error.message());
    return utils::MakeUnexpected(error);
  }
  return AppendQuantized(id, Quantize(values.data(), header_.dim, quantization));
}

utils::Expected<uint32_t, utils::Error> VectorArena::AppendQuantized(const std::string& id,
                                                                     const QuantizedVector& vector) {
  auto checked = CheckAppend(id, vector.quantization);
  if (!checked) {
    if (checked.error().code() == utils::ErrorCode::kQuantizationError) {
      utils::LogVectorIndexError("append", id, header_.dim, checked.error().message());
    }
    return utils::MakeUnexpected(checked.error());
  }
  if (vector.data.size() != EncodedSize(vector.quantization, header_.dim)) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kVectorDimensionMismatch, "Encoded vector size does not match dimension", id));
  }

  auto slot = static_cast<uint32_t>(slot_count_);
  storage::AppendVecRecord(payload_, header_, id, vector, 0);
  ++slot_count_;
  Track(slot, id, false);
  return slot;
}

utils::Expected<void, utils::Error> VectorArena::Remove(const std::string& id) {
  if (!FindSlot(id)) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kVectorNotFound, "No live vector", id));
  }
  // Tombstones carry zero bytes at the narrowest width
  QuantizedVector empty;
  empty.quantization = Quantization::kBinary;
  empty.scale = 0.0F;
  empty.data.assign(EncodedSize(Quantization::kBinary, header_.dim), '\0');

  auto slot = static_cast<uint32_t>(slot_count_);
  storage::AppendVecRecord(payload_, header_, id, empty, storage::vec_format::kFlagTombstone);
  ++slot_count_;
  Track(slot, id, true);
  return {};
}

std::vector<Neighbor> VectorArena::ScanNearest(const std::vector<float>& query, size_t top_k) const {
  std::vector<Neighbor> results;
  if (query.size() != header_.dim || top_k == 0) {
    return results;
  }

  QueryDistance distance(header_.metric, query.data(), header_.dim);
  std::vector<float> scratch(header_.dim);
  for (uint32_t slot : LiveSlots()) {
    DecodeInto(slot, scratch.data());
    results.push_back(Neighbor{IdAt(slot), slot, distance(scratch.data())});
  }

  auto by_distance = [](const Neighbor& lhs, const Neighbor& rhs) {
    return lhs.distance < rhs.distance || (lhs.distance == rhs.distance && lhs.slot < rhs.slot);
  };
  if (results.size() > top_k) {
    std::partial_sort(results.begin(), results.begin() + static_cast<std::ptrdiff_t>(top_k), results.end(),
                      by_distance);
    results.resize(top_k);
  } else {
    std::sort(results.begin(), results.end(), by_distance);
  }
  return results;
}

ArenaStatistics VectorArena::GetStatistics() const {
  ArenaStatistics stats;
  stats.slot_count = slot_count_;
  stats.live_count = live_count_;
  stats.dimension = header_.dim;
  stats.payload_bytes = payload_->size();
  return stats;
}

}  // namespace rvfstore::vectors
