/**
 * @file migration_manifest.h
 * @brief Persistent record of a migration ("<target>.migration.json")
 */

#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "utils/error.h"
#include "utils/expected.h"

namespace rvfstore::migration {

/**
 * @brief Migration lifecycle
 *
 * pending -> in-progress -> complete | failed; rollback returns to pending.
 */
enum class MigrationStatus : std::uint8_t {
  kPending,
  kInProgress,
  kComplete,
  kFailed,
};

const char* MigrationStatusName(MigrationStatus status);
std::optional<MigrationStatus> ParseMigrationStatus(const std::string& name);

/**
 * @brief Records written to the target, per segment kind
 */
struct RecordCounts {
  uint64_t kv = 0;
  uint64_t vectors = 0;
  uint64_t log = 0;

  bool operator==(const RecordCounts& other) const {
    return kv == other.kv && vectors == other.vectors && log == other.log;
  }
};

/**
 * @brief Migration manifest
 */
struct MigrationManifest {
  std::string source_path;
  std::string source_format;
  std::string target_path;
  std::string backup_path;
  MigrationStatus status = MigrationStatus::kPending;
  std::string failure_reason;
  RecordCounts records_migrated;
  uint64_t skipped_vectors = 0;  ///< Embeddings that could not be stored
  uint64_t updated_at = 0;       ///< Milliseconds since epoch

  /// "<target>.migration.json"
  static std::string PathFor(const std::string& target_path) { return target_path + ".migration.json"; }

  nlohmann::json ToJson() const;
  static utils::Expected<MigrationManifest, utils::Error> FromJson(const nlohmann::json& json);

  /**
   * @brief Load from @p path
   * @return kNotFound when absent, kMigrationFailed when unparsable
   */
  static utils::Expected<MigrationManifest, utils::Error> Load(const std::string& path);

  /**
   * @brief Stamp updated_at and write atomically (temp file + rename)
   */
  utils::Expected<void, utils::Error> Save(const std::string& path);
};

}  // namespace rvfstore::migration
