/**
 * @file quantization.h
 * @brief Vector quantization codecs and their error bounds
 *
 * Supported modes and per-component absolute error after a round trip,
 * where range = max(v) - min(v) and amax = max(|v|) over the vector:
 *
 *   fp32    exact
 *   fp16    amax * 2^-11 + 2^-24   (round to nearest, 11-bit significand)
 *   int8    range / 510            (half of one of 255 steps)
 *   int4    range / 30             (half of one of 15 steps)
 *   binary  amax                   (sign only, magnitude = mean |v|)
 *
 * int4 is always looser than int8. fp16 is tighter than int8 whenever
 * amax < 4 * range, which holds for embeddings centred near zero.
 * Quantized vectors are dequantized only into a caller-provided scratch
 * buffer for a single distance computation; storage never widens.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace rvfstore::vectors {

/**
 * @brief Storage precision of a vector record
 *
 * Ordered from widest to narrowest; the numeric value is the on-disk tag.
 */
enum class Quantization : std::uint8_t {
  kFp32 = 0,
  kFp16 = 1,
  kInt8 = 2,
  kInt4 = 3,
  kBinary = 4,
};

/**
 * @brief Distance metric fixed per vector segment
 */
enum class Metric : std::uint8_t {
  kCosine = 0,  // 1 - cos(a, b)
  kL2 = 1,      // squared Euclidean distance
  kDot = 2,     // -dot(a, b)
};

/// Bits used per component
uint32_t BitsPerValue(Quantization quantization);

/// Bytes needed to store @p dim components
size_t EncodedSize(Quantization quantization, uint32_t dim);

/// True if @p record_q fits in a slot sized for @p storage_q
inline bool FitsIn(Quantization record_q, Quantization storage_q) {
  return BitsPerValue(record_q) <= BitsPerValue(storage_q);
}

bool IsValidQuantization(uint8_t tag);
bool IsValidMetric(uint8_t tag);

const char* QuantizationName(Quantization quantization);
const char* MetricName(Metric metric);

/// Parse "fp32", "fp16", "int8", "int4", "binary"
utils::Expected<Quantization, utils::Error> ParseQuantization(const std::string& name);

/// Parse "cosine", "l2" (or "euclidean"), "dot"
utils::Expected<Metric, utils::Error> ParseMetric(const std::string& name);

/**
 * @brief Quantized representation of one vector
 */
struct QuantizedVector {
  Quantization quantization = Quantization::kFp32;
  float scale = 1.0F;   // int8/int4: step size; binary: magnitude
  float offset = 0.0F;  // int8/int4: value of code 0
  std::string data;     // EncodedSize(quantization, dim) bytes
};

/**
 * @brief Quantize a float vector
 */
QuantizedVector Quantize(const float* values, uint32_t dim, Quantization quantization);

/**
 * @brief Dequantize into @p out (dim floats)
 * @param data Encoded bytes, at least EncodedSize(quantization, dim)
 */
void Dequantize(Quantization quantization, float scale, float offset, const uint8_t* data, uint32_t dim, float* out);

/**
 * @brief Documented per-component absolute error bound for a vector
 */
float ErrorBound(Quantization quantization, const float* values, uint32_t dim);

/// IEEE 754 binary16 conversions (round to nearest even)
uint16_t FloatToHalf(float value);
float HalfToFloat(uint16_t half);

}  // namespace rvfstore::vectors
