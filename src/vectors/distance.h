/**
 * @file distance.h
 * @brief Metric distances over a capability-detected kernel table
 *
 * The fastest kernel set (AVX2, NEON or scalar) is chosen once, on first
 * use, from runtime CPU detection. Callers only see DistanceFunctions and
 * the metric helpers below and never branch on the active implementation.
 *
 * All metrics are expressed as distances (lower is closer):
 *   cosine  1 - dot(a, b) / (|a| |b|), 1 for a zero vector
 *   l2      squared Euclidean distance
 *   dot     -dot(a, b)
 */

#pragma once

#include <cmath>
#include <cstddef>
#include <vector>

#include "vectors/quantization.h"

namespace rvfstore::vectors {

namespace simd {

using DotProductFunc = float (*)(const float*, const float*, size_t);
using SquaredL2Func = float (*)(const float*, const float*, size_t);

/**
 * @brief Dispatch table for distance kernels
 */
struct DistanceFunctions {
  DotProductFunc dot_product;
  SquaredL2Func squared_l2;
  const char* implementation_name;  ///< "AVX2", "NEON" or "Scalar"
};

/**
 * @brief Optimal kernels for this CPU (thread-safe static initialization)
 */
const DistanceFunctions& GetOptimalImpl();

/**
 * @brief Scalar kernels, used as the reference in tests
 */
const DistanceFunctions& GetScalarImpl();

inline const char* GetImplementationName() {
  return GetOptimalImpl().implementation_name;
}

}  // namespace simd

inline float Norm(const float* v, size_t n) {
  return std::sqrt(simd::GetOptimalImpl().dot_product(v, v, n));
}

/**
 * @brief Distance between two float vectors under @p metric
 */
inline float Distance(Metric metric, const float* a, const float* b, size_t n) {
  const auto& impl = simd::GetOptimalImpl();
  switch (metric) {
    case Metric::kL2:
      return impl.squared_l2(a, b, n);
    case Metric::kDot:
      return -impl.dot_product(a, b, n);
    case Metric::kCosine: {
      float norm_a = Norm(a, n);
      float norm_b = Norm(b, n);
      if (norm_a == 0.0F || norm_b == 0.0F) {
        return 1.0F;
      }
      return 1.0F - impl.dot_product(a, b, n) / (norm_a * norm_b);
    }
  }
  return 0.0F;
}

/**
 * @brief Distance from a fixed query, with the query norm computed once
 */
class QueryDistance {
 public:
  QueryDistance(Metric metric, const float* query, size_t dim)
      : metric_(metric), query_(query), dim_(dim), impl_(simd::GetOptimalImpl()) {
    if (metric_ == Metric::kCosine) {
      query_norm_ = Norm(query_, dim_);
    }
  }

  float operator()(const float* other) const {
    switch (metric_) {
      case Metric::kL2:
        return impl_.squared_l2(query_, other, dim_);
      case Metric::kDot:
        return -impl_.dot_product(query_, other, dim_);
      case Metric::kCosine: {
        float other_norm = std::sqrt(impl_.dot_product(other, other, dim_));
        if (query_norm_ == 0.0F || other_norm == 0.0F) {
          return 1.0F;
        }
        return 1.0F - impl_.dot_product(query_, other, dim_) / (query_norm_ * other_norm);
      }
    }
    return 0.0F;
  }

 private:
  Metric metric_;
  const float* query_;
  size_t dim_;
  const simd::DistanceFunctions& impl_;
  float query_norm_ = 0.0F;
};

}  // namespace rvfstore::vectors
