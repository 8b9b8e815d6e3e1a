/**
 * @file sha256.h
 * @brief SHA-256 implementation for the container's whole-file digest
 *
 * Based on FIPS 180-4 - Secure Hash Standard
 * Standalone implementation without external dependencies.
 *
 * NOLINTBEGIN - Low-level cryptographic implementation following FIPS 180-4
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace rvfstore::utils {

/**
 * @brief Incremental SHA-256 hasher
 */
class SHA256 {
 public:
  static constexpr size_t kDigestSize = 32;
  using Digest = std::array<uint8_t, kDigestSize>;

  SHA256();

  /**
   * @brief Update hash with data
   */
  void Update(const uint8_t* data, size_t len);

  /**
   * @brief Update hash with string
   */
  void Update(const std::string& str) { Update(reinterpret_cast<const uint8_t*>(str.data()), str.size()); }

  /**
   * @brief Finalize and get digest (the hasher must not be reused afterwards)
   */
  Digest Finalize();

  /**
   * @brief Convenience method to hash a buffer
   */
  static Digest Hash(const uint8_t* data, size_t len);

  /**
   * @brief Lowercase hex representation of a digest
   */
  static std::string ToHex(const Digest& digest);

 private:
  void Transform(const uint8_t block[64]);

  uint32_t state_[8];
  uint64_t bit_count_;
  uint8_t buffer_[64];
  size_t buffer_len_;
};

}  // namespace rvfstore::utils

// NOLINTEND
