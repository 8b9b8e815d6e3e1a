/**
 * @file container_format.h
 * @brief Binary layout constants for .rvf container files
 *
 * File Format Overview (all integers little-endian):
 *   Offset 0   4 bytes  Magic "RVF\0"
 *   Offset 4   2 bytes  Major version (uint16_t)
 *   Offset 6   2 bytes  Minor version (uint16_t)
 *   Offset 8   8 bytes  Segment directory offset (uint64_t)
 *
 * The directory is a uint32_t segment count followed by that many
 * fixed-size descriptors (see SegmentDescriptor). Segment payloads follow
 * the directory, contiguous and in directory order. The file ends with a
 * 32-byte SHA-256 digest over every preceding byte.
 *
 * Descriptor layout (32 bytes):
 *   offset u64 | length u64 | crc32 u32 | type u8 | flags u8 | id[10]
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace rvfstore::storage {

namespace container_format {

// Magic number for container files ("RVF\0")
constexpr std::array<char, 4> kMagicNumber = {'R', 'V', 'F', '\0'};

// Version we write
constexpr uint16_t kMajorVersion = 1;
constexpr uint16_t kMinorVersion = 0;

// Newest major version this build can read; newer files need an upgrade
constexpr uint16_t kMaxSupportedMajorVersion = 1;

constexpr size_t kHeaderSize = 16;
constexpr size_t kDirectoryCountSize = 4;
constexpr size_t kDescriptorSize = 32;
constexpr size_t kSegmentIdSize = 10;
constexpr size_t kDigestSize = 32;

// Smallest valid file: header + empty directory + digest
constexpr size_t kMinFileSize = kHeaderSize + kDirectoryCountSize + kDigestSize;

// Upper bound on segment count accepted when reading a directory
constexpr uint32_t kMaxSegments = 4096;

/**
 * @brief Segment descriptor flags
 */
namespace flags {
constexpr uint8_t kNone = 0x00;
constexpr uint8_t kDerived = 0x01;  // Rebuildable from other segments (INDEX)
}  // namespace flags

}  // namespace container_format

/**
 * @brief Segment type codes stored in the directory
 *
 * Codes not listed here are unknown to this build; such segments are
 * skipped on read and written back unchanged on flush.
 */
enum class SegmentType : std::uint8_t {
  kKv = 1,
  kVec = 2,
  kIndex = 3,
  kLog = 4,
  kSnap = 5,
  kMeta = 6,
};

inline bool IsKnownSegmentType(uint8_t code) {
  return code >= static_cast<uint8_t>(SegmentType::kKv) && code <= static_cast<uint8_t>(SegmentType::kMeta);
}

inline const char* SegmentTypeName(uint8_t code) {
  switch (code) {
    case 1:
      return "KV";
    case 2:
      return "VEC";
    case 3:
      return "INDEX";
    case 4:
      return "LOG";
    case 5:
      return "SNAP";
    case 6:
      return "META";
    default:
      return "UNKNOWN";
  }
}

/**
 * @brief Decoded directory entry
 */
struct SegmentDescriptor {
  std::string id;
  uint8_t type = 0;
  uint8_t flags = container_format::flags::kNone;
  uint64_t offset = 0;
  uint64_t length = 0;
  uint32_t checksum = 0;  // zlib CRC-32 of the payload
};

/**
 * @brief Well-known segment ids used by the container's typed accessors
 */
namespace segment_ids {
constexpr const char* kKv = "kv";
constexpr const char* kVec = "vec";
constexpr const char* kIndex = "index";
constexpr const char* kLog = "log";
constexpr const char* kSnap = "snap";
constexpr const char* kMeta = "meta";
}  // namespace segment_ids

}  // namespace rvfstore::storage
