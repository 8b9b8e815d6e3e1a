/**
 * @file vector_settings.h
 * @brief Vector segment and index settings shared by migration and backends
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "storage/segment_codec.h"
#include "vectors/hnsw_index.h"
#include "vectors/quantization.h"

namespace rvfstore::vectors {

/**
 * @brief How new VEC segments and their index are laid out
 */
struct VectorSettings {
  uint32_t dimension = 0;  ///< 0: taken from the first vector stored
  uint32_t id_width = 64;
  Quantization quantization = Quantization::kFp32;
  Metric metric = Metric::kCosine;
  HnswParams index;
  uint32_t ef_search = hnsw_defaults::kEfSearch;
  size_t build_batch = 1024;  ///< Nodes linked per BuildIndexStep() call

  storage::VecHeader MakeHeader(uint32_t dim) const {
    storage::VecHeader header;
    header.dim = dim;
    header.id_width = id_width;
    header.quantization = quantization;
    header.metric = metric;
    return header;
  }

  /// Index parameters with the metric forced to the segment's
  HnswParams IndexParams() const {
    HnswParams params = index;
    params.metric = metric;
    return params;
  }
};

}  // namespace rvfstore::vectors
