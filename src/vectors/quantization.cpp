/**
 * @file quantization.cpp
 * @brief Quantization codecs
 */

#include "vectors/quantization.h"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace rvfstore::vectors {

namespace {

constexpr float kInt8Levels = 255.0F;
constexpr float kInt4Levels = 15.0F;

// Float rounding slack added to the analytic bounds
constexpr float kRoundingSlack = 1e-6F;

struct RangeStats {
  float min = 0.0F;
  float max = 0.0F;
  float amax = 0.0F;
};

RangeStats ComputeRange(const float* values, uint32_t dim) {
  RangeStats stats;
  if (dim == 0) {
    return stats;
  }
  stats.min = values[0];
  stats.max = values[0];
  for (uint32_t i = 0; i < dim; ++i) {
    stats.min = std::min(stats.min, values[i]);
    stats.max = std::max(stats.max, values[i]);
    stats.amax = std::max(stats.amax, std::fabs(values[i]));
  }
  return stats;
}

uint32_t QuantizeLinear(float value, float offset, float step, uint32_t max_code) {
  if (step <= 0.0F) {
    return 0;
  }
  float code = std::round((value - offset) / step);
  code = std::clamp(code, 0.0F, static_cast<float>(max_code));
  return static_cast<uint32_t>(code);
}

}  // namespace

uint32_t BitsPerValue(Quantization quantization) {
  switch (quantization) {
    case Quantization::kFp32:
      return 32;
    case Quantization::kFp16:
      return 16;
    case Quantization::kInt8:
      return 8;
    case Quantization::kInt4:
      return 4;
    case Quantization::kBinary:
      return 1;
  }
  return 32;
}

size_t EncodedSize(Quantization quantization, uint32_t dim) {
  return (static_cast<size_t>(dim) * BitsPerValue(quantization) + 7) / 8;
}

bool IsValidQuantization(uint8_t tag) {
  return tag <= static_cast<uint8_t>(Quantization::kBinary);
}

bool IsValidMetric(uint8_t tag) {
  return tag <= static_cast<uint8_t>(Metric::kDot);
}

const char* QuantizationName(Quantization quantization) {
  switch (quantization) {
    case Quantization::kFp32:
      return "fp32";
    case Quantization::kFp16:
      return "fp16";
    case Quantization::kInt8:
      return "int8";
    case Quantization::kInt4:
      return "int4";
    case Quantization::kBinary:
      return "binary";
  }
  return "unknown";
}

const char* MetricName(Metric metric) {
  switch (metric) {
    case Metric::kCosine:
      return "cosine";
    case Metric::kL2:
      return "l2";
    case Metric::kDot:
      return "dot";
  }
  return "unknown";
}

utils::Expected<Quantization, utils::Error> ParseQuantization(const std::string& name) {
  if (name == "fp32") {
    return Quantization::kFp32;
  }
  if (name == "fp16") {
    return Quantization::kFp16;
  }
  if (name == "int8") {
    return Quantization::kInt8;
  }
  if (name == "int4") {
    return Quantization::kInt4;
  }
  if (name == "binary") {
    return Quantization::kBinary;
  }
  return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument,
                                                "Unknown quantization (expected fp32, fp16, int8, int4, binary): " + name));
}

utils::Expected<Metric, utils::Error> ParseMetric(const std::string& name) {
  if (name == "cosine") {
    return Metric::kCosine;
  }
  if (name == "l2" || name == "euclidean") {
    return Metric::kL2;
  }
  if (name == "dot") {
    return Metric::kDot;
  }
  return utils::MakeUnexpected(
      utils::MakeError(utils::ErrorCode::kInvalidArgument, "Unknown metric (expected cosine, l2, dot): " + name));
}

// ============================================================================
// binary16
// ============================================================================

uint16_t FloatToHalf(float value) {
  uint32_t bits = 0;
  std::memcpy(&bits, &value, sizeof(bits));

  auto sign = static_cast<uint16_t>((bits >> 16) & 0x8000U);
  uint32_t abs = bits & 0x7FFFFFFFU;

  if (abs >= 0x7F800000U) {
    // Inf stays inf, NaN stays NaN (quiet)
    return static_cast<uint16_t>(sign | 0x7C00U | (abs > 0x7F800000U ? 0x0200U : 0U));
  }

  if (abs < 0x38800000U) {
    // Below the smallest normal half: subnormal or zero
    if (abs < 0x33000000U) {
      return sign;
    }
    uint32_t exponent = abs >> 23;
    uint32_t mantissa = (abs & 0x007FFFFFU) | 0x00800000U;
    uint32_t shift = 126 - exponent;
    uint32_t half_mantissa = mantissa >> shift;
    uint32_t remainder = mantissa & ((1U << shift) - 1);
    uint32_t halfway = 1U << (shift - 1);
    if (remainder > halfway || (remainder == halfway && (half_mantissa & 1U) != 0)) {
      ++half_mantissa;
    }
    return static_cast<uint16_t>(sign | half_mantissa);
  }

  uint32_t rebased = abs - 0x38000000U;
  uint32_t half = rebased >> 13;
  uint32_t remainder = rebased & 0x1FFFU;
  if (remainder > 0x1000U || (remainder == 0x1000U && (half & 1U) != 0)) {
    ++half;
  }
  if (half >= 0x7C00U) {
    // Saturate to the largest finite half instead of producing inf
    half = 0x7BFFU;
  }
  return static_cast<uint16_t>(sign | half);
}

float HalfToFloat(uint16_t half) {
  uint32_t sign = static_cast<uint32_t>(half & 0x8000U) << 16;
  uint32_t exponent = (half >> 10) & 0x1FU;
  uint32_t mantissa = half & 0x3FFU;

  if (exponent == 0) {
    if (mantissa == 0) {
      float zero = 0.0F;
      uint32_t zero_bits = sign;
      std::memcpy(&zero, &zero_bits, sizeof(zero));
      return zero;
    }
    float magnitude = std::ldexp(static_cast<float>(mantissa), -24);
    return sign != 0 ? -magnitude : magnitude;
  }

  uint32_t bits = 0;
  if (exponent == 31) {
    bits = sign | 0x7F800000U | (mantissa << 13);
  } else {
    bits = sign | ((exponent + 112) << 23) | (mantissa << 13);
  }
  float result = 0.0F;
  std::memcpy(&result, &bits, sizeof(result));
  return result;
}

// ============================================================================
// Quantize / Dequantize
// ============================================================================

QuantizedVector Quantize(const float* values, uint32_t dim, Quantization quantization) {
  QuantizedVector out;
  out.quantization = quantization;
  out.data.assign(EncodedSize(quantization, dim), '\0');
  auto* bytes = reinterpret_cast<uint8_t*>(out.data.data());  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)

  switch (quantization) {
    case Quantization::kFp32:
      std::memcpy(bytes, values, static_cast<size_t>(dim) * sizeof(float));
      break;

    case Quantization::kFp16:
      for (uint32_t i = 0; i < dim; ++i) {
        uint16_t half = FloatToHalf(values[i]);
        bytes[i * 2] = static_cast<uint8_t>(half & 0xFFU);
        bytes[i * 2 + 1] = static_cast<uint8_t>(half >> 8);
      }
      break;

    case Quantization::kInt8: {
      RangeStats stats = ComputeRange(values, dim);
      out.offset = stats.min;
      out.scale = (stats.max - stats.min) / kInt8Levels;
      for (uint32_t i = 0; i < dim; ++i) {
        bytes[i] = static_cast<uint8_t>(QuantizeLinear(values[i], out.offset, out.scale, 255));
      }
      break;
    }

    case Quantization::kInt4: {
      RangeStats stats = ComputeRange(values, dim);
      out.offset = stats.min;
      out.scale = (stats.max - stats.min) / kInt4Levels;
      for (uint32_t i = 0; i < dim; ++i) {
        uint32_t code = QuantizeLinear(values[i], out.offset, out.scale, 15);
        if ((i & 1U) == 0) {
          bytes[i / 2] = static_cast<uint8_t>(code);
        } else {
          bytes[i / 2] = static_cast<uint8_t>(bytes[i / 2] | (code << 4));
        }
      }
      break;
    }

    case Quantization::kBinary: {
      double sum_abs = 0.0;
      for (uint32_t i = 0; i < dim; ++i) {
        sum_abs += std::fabs(values[i]);
        if (values[i] >= 0.0F) {
          bytes[i / 8] = static_cast<uint8_t>(bytes[i / 8] | (1U << (i % 8)));
        }
      }
      out.scale = dim > 0 ? static_cast<float>(sum_abs / dim) : 0.0F;
      out.offset = 0.0F;
      break;
    }
  }
  return out;
}

void Dequantize(Quantization quantization, float scale, float offset, const uint8_t* data, uint32_t dim,
                float* out) {
  switch (quantization) {
    case Quantization::kFp32:
      std::memcpy(out, data, static_cast<size_t>(dim) * sizeof(float));
      break;

    case Quantization::kFp16:
      for (uint32_t i = 0; i < dim; ++i) {
        auto half = static_cast<uint16_t>(data[i * 2] | (data[i * 2 + 1] << 8));
        out[i] = HalfToFloat(half);
      }
      break;

    case Quantization::kInt8:
      for (uint32_t i = 0; i < dim; ++i) {
        out[i] = offset + static_cast<float>(data[i]) * scale;
      }
      break;

    case Quantization::kInt4:
      for (uint32_t i = 0; i < dim; ++i) {
        uint32_t code = (i & 1U) == 0 ? (data[i / 2] & 0x0FU) : (data[i / 2] >> 4);
        out[i] = offset + static_cast<float>(code) * scale;
      }
      break;

    case Quantization::kBinary:
      for (uint32_t i = 0; i < dim; ++i) {
        bool positive = ((data[i / 8] >> (i % 8)) & 1U) != 0;
        out[i] = positive ? scale : -scale;
      }
      break;
  }
}

float ErrorBound(Quantization quantization, const float* values, uint32_t dim) {
  RangeStats stats = ComputeRange(values, dim);
  float range = stats.max - stats.min;
  float slack = kRoundingSlack * std::max(1.0F, stats.amax);

  switch (quantization) {
    case Quantization::kFp32:
      return 0.0F;
    case Quantization::kFp16:
      return stats.amax * std::ldexp(1.0F, -11) + std::ldexp(1.0F, -24);
    case Quantization::kInt8:
      return range / (2.0F * kInt8Levels) + slack;
    case Quantization::kInt4:
      return range / (2.0F * kInt4Levels) + slack;
    case Quantization::kBinary:
      return stats.amax + slack;
  }
  return 0.0F;
}

}  // namespace rvfstore::vectors
