/**
 * @file distance_kernels.h
 * @brief Dot product and squared L2 kernels: scalar, AVX2 and NEON
 *
 * All kernels take raw pointers and a length so the dispatcher can hold
 * them in a single function table. The scalar versions are the reference
 * for correctness tests. Loads are unaligned: callers pass scratch buffers
 * of dequantized values with no alignment guarantee.
 */

#pragma once

#include <cstddef>

#ifdef __AVX2__
#include <immintrin.h>
#endif

#ifdef __ARM_NEON
#include <arm_neon.h>
#endif

namespace rvfstore::vectors::simd {

// ============================================================================
// Scalar
// ============================================================================

inline float DotProductScalar(const float* a, const float* b, size_t n) {
  float sum = 0.0F;
  for (size_t i = 0; i < n; ++i) {
    sum += a[i] * b[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  }
  return sum;
}

inline float SquaredL2Scalar(const float* a, const float* b, size_t n) {
  float sum_sq = 0.0F;
  for (size_t i = 0; i < n; ++i) {
    float diff = a[i] - b[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    sum_sq += diff * diff;
  }
  return sum_sq;
}

// ============================================================================
// AVX2 (8 floats per iteration)
// ============================================================================

#ifdef __AVX2__

inline float HorizontalSumAVX2(__m256 v) {
  __m128 lo = _mm256_castps256_ps128(v);
  __m128 hi = _mm256_extractf128_ps(v, 1);
  __m128 sum128 = _mm_add_ps(lo, hi);
  sum128 = _mm_hadd_ps(sum128, sum128);
  sum128 = _mm_hadd_ps(sum128, sum128);
  return _mm_cvtss_f32(sum128);
}

inline float DotProductAVX2(const float* a, const float* b, size_t n) {
  constexpr size_t kLanes = 8;
  __m256 acc = _mm256_setzero_ps();
  size_t i = 0;
  for (; i + kLanes <= n; i += kLanes) {
    acc = _mm256_add_ps(acc, _mm256_mul_ps(_mm256_loadu_ps(a + i), _mm256_loadu_ps(b + i)));
  }
  float sum = HorizontalSumAVX2(acc);
  for (; i < n; ++i) {
    sum += a[i] * b[i];
  }
  return sum;
}

inline float SquaredL2AVX2(const float* a, const float* b, size_t n) {
  constexpr size_t kLanes = 8;
  __m256 acc = _mm256_setzero_ps();
  size_t i = 0;
  for (; i + kLanes <= n; i += kLanes) {
    __m256 diff = _mm256_sub_ps(_mm256_loadu_ps(a + i), _mm256_loadu_ps(b + i));
    acc = _mm256_add_ps(acc, _mm256_mul_ps(diff, diff));
  }
  float sum_sq = HorizontalSumAVX2(acc);
  for (; i < n; ++i) {
    float diff = a[i] - b[i];
    sum_sq += diff * diff;
  }
  return sum_sq;
}

#endif  // __AVX2__

// ============================================================================
// NEON (4 floats per iteration)
// ============================================================================

#ifdef __ARM_NEON

inline float HorizontalSumNEON(float32x4_t v) {
#if defined(__aarch64__)
  return vaddvq_f32(v);
#else
  float32x2_t pair = vadd_f32(vget_low_f32(v), vget_high_f32(v));
  return vget_lane_f32(pair, 0) + vget_lane_f32(pair, 1);
#endif
}

inline float DotProductNEON(const float* a, const float* b, size_t n) {
  constexpr size_t kLanes = 4;
  float32x4_t acc = vdupq_n_f32(0.0F);
  size_t i = 0;
  for (; i + kLanes <= n; i += kLanes) {
    acc = vmlaq_f32(acc, vld1q_f32(a + i), vld1q_f32(b + i));  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  }
  float sum = HorizontalSumNEON(acc);
  for (; i < n; ++i) {
    sum += a[i] * b[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  }
  return sum;
}

inline float SquaredL2NEON(const float* a, const float* b, size_t n) {
  constexpr size_t kLanes = 4;
  float32x4_t acc = vdupq_n_f32(0.0F);
  size_t i = 0;
  for (; i + kLanes <= n; i += kLanes) {
    float32x4_t diff = vsubq_f32(vld1q_f32(a + i), vld1q_f32(b + i));  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    acc = vmlaq_f32(acc, diff, diff);
  }
  float sum_sq = HorizontalSumNEON(acc);
  for (; i < n; ++i) {
    float diff = a[i] - b[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    sum_sq += diff * diff;
  }
  return sum_sq;
}

#endif  // __ARM_NEON

}  // namespace rvfstore::vectors::simd
