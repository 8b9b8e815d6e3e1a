/**
 * @file format_detector.h
 * @brief Store format detection from leading bytes and extension
 */

#pragma once

#include <cstdint>
#include <string>

namespace rvfstore::migration {

/**
 * @brief Kind of store found at a path
 */
enum class StoreFormat : std::uint8_t {
  kNativeContainer,   ///< "RVF\0" container
  kLegacyRelational,  ///< SQLite database with a memory_entries table
  kLegacyFlatFile,    ///< JSON document
  kUnknown,           ///< Missing, unreadable or unrecognized
};

/**
 * @brief Stable name used in status output and manifests
 */
const char* FormatName(StoreFormat format);

/**
 * @brief Inverse of FormatName(); kUnknown for anything else
 */
StoreFormat ParseFormatName(const std::string& name);

inline bool IsLegacyFormat(StoreFormat format) {
  return format == StoreFormat::kLegacyRelational || format == StoreFormat::kLegacyFlatFile;
}

/**
 * @brief Classify @p path
 *
 * Reads at most 16 bytes. A .json file whose first 16 bytes are blank is
 * kLegacyFlatFile. Never fails: missing and unreadable paths are kUnknown.
 */
StoreFormat DetectFormat(const std::string& path);

/**
 * @brief Result of resolving a logical store name
 */
struct ResolvedStore {
  std::string path;
  StoreFormat format = StoreFormat::kUnknown;
  bool exists = false;
};

/**
 * @brief "<base>.rvf" for a logical path or any known store file name
 */
std::string NativePathFor(const std::string& logical_path);

/**
 * @brief Find the store behind a logical path
 *
 * Tries "<base>.rvf", "<base>.db", "<base>.sqlite", "<base>.json" and the
 * path itself. A native container always wins; the legacy file beside it
 * is left alone. When nothing recognizable exists the result names the
 * path itself if it exists (format kUnknown) and "<base>.rvf" otherwise.
 */
ResolvedStore ResolveStorePath(const std::string& logical_path);

}  // namespace rvfstore::migration
