/**
 * @file migration_engine.h
 * @brief Atomic, reversible migration from a legacy store to a container
 *
 * Protocol for Migrate(), all under the target's writer lock:
 *   1. manifest pending, then in-progress
 *   2. open the source with the matching legacy reader
 *   3. stream entries into KV and VEC, events into LOG, in source order
 *   4. rebuild the HNSW index, flush, re-validate the target
 *   5. rename the source to its backup path
 *   6. manifest complete
 *
 * A failure in steps 2-4 deletes the partial target and leaves the source
 * untouched (manifest failed). Legacy files are only ever renamed.
 */

#pragma once

#include <atomic>
#include <optional>
#include <string>

#include "migration/format_detector.h"
#include "migration/legacy_reader.h"
#include "migration/migration_manifest.h"
#include "storage/rvf_container.h"
#include "utils/error.h"
#include "utils/expected.h"
#include "vectors/vector_settings.h"

namespace rvfstore::migration {

/**
 * @brief Per-run options
 */
struct MigrationOptions {
  bool dry_run = false;  ///< Write into a temp directory, report counts, touch nothing
  bool force = false;    ///< Replace a stale target or a failed manifest; pick a free backup name
  const std::atomic<bool>* cancel_token = nullptr;  ///< Checked between records
};

/**
 * @brief Migration driver
 *
 * Example:
 * @code
 * MigrationEngine engine(settings);
 * auto manifest = engine.Migrate("memory.db", "memory.rvf", StoreFormat::kLegacyRelational, {});
 * if (!manifest) {
 *   spdlog::error("{}", manifest.error().to_string());
 * }
 * @endcode
 */
class MigrationEngine {
 public:
  /**
   * @param settings Layout of the VEC segment and index in new containers
   * @param fsync fsync the target and manifest writes
   */
  explicit MigrationEngine(vectors::VectorSettings settings = {}, bool fsync = true);

  /**
   * @brief Migrate @p source into a new container at @p target
   *
   * A complete manifest with an existing target makes this a no-op that
   * returns the manifest. An in-progress manifest (interrupted run) is
   * resolved first: finalized if the rename already happened, otherwise
   * cleaned up and retried.
   *
   * @return Final manifest; in a dry run the manifest is not persisted and
   *         its counts describe the throwaway target
   */
  utils::Expected<MigrationManifest, utils::Error> Migrate(const std::string& source, const std::string& target,
                                                           StoreFormat source_format,
                                                           const MigrationOptions& options = {});

  /**
   * @brief Undo a complete migration
   *
   * Renames the backup back to the source path, deletes the target and
   * resets the manifest to pending.
   */
  utils::Expected<MigrationManifest, utils::Error> Rollback(const std::string& target);

  /**
   * @brief Manifest for @p target, nullopt if there is none
   */
  static utils::Expected<std::optional<MigrationManifest>, utils::Error> Status(const std::string& target);

 private:
  utils::Expected<MigrationManifest, utils::Error> DryRun(const std::string& source, const std::string& target,
                                                          StoreFormat source_format, const MigrationOptions& options);

  /**
   * @brief Steps 2-4 into an open container (no flush)
   */
  utils::Expected<void, utils::Error> CopyRecords(const std::string& source, StoreFormat source_format,
                                                  storage::RvfContainer& container, const MigrationOptions& options,
                                                  MigrationManifest& manifest) const;

  /**
   * @brief Resolve an in-progress manifest left by a crash
   *
   * The caller holds the target's writer lock.
   * @return true if the migration had in fact completed
   */
  utils::Expected<bool, utils::Error> RecoverInterrupted(MigrationManifest& manifest,
                                                         const std::string& manifest_path) const;

  utils::Expected<std::string, utils::Error> ChooseBackupPath(const std::string& source, bool force) const;

  vectors::VectorSettings settings_;
  bool fsync_;
};

}  // namespace rvfstore::migration
