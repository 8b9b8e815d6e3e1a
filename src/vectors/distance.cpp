/**
 * @file distance.cpp
 * @brief Kernel selection from runtime CPU features
 */

#include "vectors/distance.h"

#include "utils/structured_log.h"
#include "vectors/distance_kernels.h"

namespace rvfstore::vectors::simd {

namespace {

struct CpuInfo {
  const char* arch_name = "unknown";
  bool has_avx2 = false;  ///< AVX2 compiled in and reported by the CPU
  bool has_neon = false;  ///< NEON compiled in (baseline on AArch64)
};

CpuInfo DetectCpu() {
  CpuInfo info;
#if defined(__x86_64__)
  info.arch_name = "x86_64";
#if defined(__AVX2__)
  info.has_avx2 = __builtin_cpu_supports("avx2") != 0;
#endif
#elif defined(__aarch64__)
  info.arch_name = "aarch64";
#elif defined(__arm__)
  info.arch_name = "arm";
#endif
#if defined(__ARM_NEON)
  info.has_neon = true;
#endif
  return info;
}

}  // namespace

const DistanceFunctions& GetScalarImpl() {
  static const DistanceFunctions impl{DotProductScalar, SquaredL2Scalar, "Scalar"};
  return impl;
}

const DistanceFunctions& GetOptimalImpl() {
  static const DistanceFunctions impl = []() {
    CpuInfo cpu = DetectCpu();
    DistanceFunctions selected = GetScalarImpl();

#ifdef __AVX2__
    if (cpu.has_avx2) {
      selected = DistanceFunctions{DotProductAVX2, SquaredL2AVX2, "AVX2"};
    }
#endif

#ifdef __ARM_NEON
    if (cpu.has_neon) {
      selected = DistanceFunctions{DotProductNEON, SquaredL2NEON, "NEON"};
    }
#endif

    utils::StructuredLog()
        .Event("distance_kernels")
        .Field("arch", cpu.arch_name)
        .Field("implementation", selected.implementation_name)
        .Debug();
    return selected;
  }();

  return impl;
}

}  // namespace rvfstore::vectors::simd
