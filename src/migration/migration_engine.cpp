/**
 * @file migration_engine.cpp
 * @brief Migration protocol, crash recovery, rollback and dry run
 */

#include "migration/migration_engine.h"

#include <spdlog/spdlog.h>
#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <utility>

#include "utils/fd_guard.h"
#include "utils/file_lock.h"
#include "utils/structured_log.h"
#include "vectors/quantization.h"

namespace rvfstore::migration {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace fs = std::filesystem;

namespace {

constexpr const char* kBackupSuffix = ".bak";
constexpr int kMaxBackupAttempts = 1000;

bool PathExists(const std::string& path) {
  std::error_code ec;
  return fs::exists(path, ec);
}

bool SamePath(const std::string& lhs, const std::string& rhs) {
  std::error_code ec_lhs;
  std::error_code ec_rhs;
  auto canonical_lhs = fs::weakly_canonical(lhs, ec_lhs);
  auto canonical_rhs = fs::weakly_canonical(rhs, ec_rhs);
  if (ec_lhs || ec_rhs) {
    return lhs == rhs;
  }
  return canonical_lhs == canonical_rhs;
}

/// Remove a partial target and its temp file; missing files are fine
void RemoveTarget(const std::string& target) {
  std::error_code ec;
  fs::remove(target, ec);
  if (ec) {
    utils::LogStorageWarning("migration_cleanup", "Failed to remove " + target + ": " + ec.message());
  }
  fs::remove(target + ".tmp", ec);
}

bool Cancelled(const MigrationOptions& options) {
  return options.cancel_token != nullptr && options.cancel_token->load();
}

Error CancelledError() { return MakeError(ErrorCode::kCancelled, "cancelled"); }

}  // namespace

MigrationEngine::MigrationEngine(vectors::VectorSettings settings, bool fsync)
    : settings_(std::move(settings)), fsync_(fsync) {}

// ============================================================================
// Migrate
// ============================================================================

Expected<MigrationManifest, Error> MigrationEngine::Migrate(const std::string& source, const std::string& target,
                                                            StoreFormat source_format,
                                                            const MigrationOptions& options) {
  if (!IsLegacyFormat(source_format)) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument,
                                    std::string("Cannot migrate from format ") + FormatName(source_format), source));
  }
  if (SamePath(source, target)) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Source and target are the same file", source));
  }
  if (options.dry_run) {
    return DryRun(source, target, source_format, options);
  }

  // Held until the manifest reaches complete or failed. A target another
  // writer has open is never touched, not even with force.
  auto target_lock = utils::FileLock::Acquire(target);
  if (!target_lock) {
    return MakeUnexpected(MakeError(ErrorCode::kMigrationFailed, target_lock.error().to_string(), target));
  }

  const std::string manifest_path = MigrationManifest::PathFor(target);
  MigrationManifest manifest;

  auto existing = MigrationManifest::Load(manifest_path);
  if (existing) {
    manifest = *existing;
    switch (manifest.status) {
      case MigrationStatus::kComplete:
        if (PathExists(target)) {
          spdlog::info("Migration of {} to {} already complete", manifest.source_path, target);
          return manifest;
        }
        break;
      case MigrationStatus::kInProgress: {
        auto recovered = RecoverInterrupted(manifest, manifest_path);
        if (!recovered) {
          return MakeUnexpected(recovered.error());
        }
        if (*recovered) {
          return manifest;
        }
        break;
      }
      case MigrationStatus::kFailed:
        if (!options.force) {
          return MakeUnexpected(MakeError(ErrorCode::kMigrationFailed,
                                          "Previous migration failed (" + manifest.failure_reason +
                                              "); rerun with force to retry",
                                          manifest_path));
        }
        break;
      case MigrationStatus::kPending:
        break;
    }
  } else if (existing.error().code() != ErrorCode::kNotFound && !options.force) {
    return MakeUnexpected(existing.error());
  }

  if (!PathExists(source)) {
    return MakeUnexpected(MakeError(ErrorCode::kNotFound, "Source not found", source));
  }
  if (PathExists(target)) {
    if (!options.force) {
      return MakeUnexpected(MakeError(ErrorCode::kAlreadyExists, "Target already exists; use force to replace it",
                                      target));
    }
    spdlog::warn("Replacing stale target {}", target);
    RemoveTarget(target);
  }

  auto backup_path = ChooseBackupPath(source, options.force);
  if (!backup_path) {
    return MakeUnexpected(backup_path.error());
  }

  manifest = MigrationManifest{};
  manifest.source_path = source;
  manifest.source_format = FormatName(source_format);
  manifest.target_path = target;
  manifest.backup_path = *backup_path;
  manifest.status = MigrationStatus::kPending;
  auto saved = manifest.Save(manifest_path);
  if (!saved) {
    return MakeUnexpected(saved.error());
  }
  manifest.status = MigrationStatus::kInProgress;
  saved = manifest.Save(manifest_path);
  if (!saved) {
    return MakeUnexpected(saved.error());
  }
  utils::LogMigrationEvent(MigrationStatusName(manifest.status), source, target, manifest.source_format);

  storage::RvfContainer container;
  auto fail = [&](const Error& error) -> Expected<MigrationManifest, Error> {
    container.Discard();
    RemoveTarget(target);
    manifest.status = MigrationStatus::kFailed;
    manifest.failure_reason = error.code() == ErrorCode::kCancelled ? error.message() : error.to_string();
    auto recorded = manifest.Save(manifest_path);
    if (!recorded) {
      utils::LogStorageError("migration_manifest", manifest_path, recorded.error().to_string());
    }
    utils::LogMigrationEvent(MigrationStatusName(manifest.status), source, target, manifest.failure_reason);
    return MakeUnexpected(MakeError(ErrorCode::kMigrationFailed, manifest.failure_reason, source));
  };

  storage::OpenOptions open_options;
  open_options.create = true;
  open_options.fsync = fsync_;
  open_options.index_params = settings_.IndexParams();
  open_options.lock_held = true;
  auto opened = container.Open(target, open_options);
  if (!opened) {
    return fail(opened.error());
  }

  auto copied = CopyRecords(source, source_format, container, options, manifest);
  if (!copied) {
    return fail(copied.error());
  }
  if (Cancelled(options)) {
    return fail(CancelledError());
  }

  auto flushed = container.Flush();
  if (!flushed) {
    return fail(flushed.error());
  }
  auto validated = storage::RvfContainer::Validate(target);
  if (!validated) {
    return fail(validated.error());
  }

  std::error_code ec;
  fs::rename(source, manifest.backup_path, ec);
  if (ec) {
    return fail(MakeError(ErrorCode::kIOError, "Failed to rename source to backup: " + ec.message(),
                          manifest.backup_path));
  }

  manifest.status = MigrationStatus::kComplete;
  manifest.failure_reason.clear();
  saved = manifest.Save(manifest_path);
  if (!saved) {
    // The rename happened; recovery finalizes the manifest on the next run
    utils::LogStorageError("migration_manifest", manifest_path, saved.error().to_string());
  }

  auto closed = container.Close();
  if (!closed) {
    utils::LogStorageError("close", target, closed.error().to_string());
  }

  utils::LogMigrationEvent(MigrationStatusName(manifest.status), source, target,
                           "kv=" + std::to_string(manifest.records_migrated.kv) +
                               " vectors=" + std::to_string(manifest.records_migrated.vectors) +
                               " log=" + std::to_string(manifest.records_migrated.log));
  return manifest;
}

Expected<void, Error> MigrationEngine::CopyRecords(const std::string& source, StoreFormat source_format,
                                                   storage::RvfContainer& container, const MigrationOptions& options,
                                                   MigrationManifest& manifest) const {
  auto legacy = OpenLegacySource(source, source_format);
  if (!legacy) {
    return MakeUnexpected(legacy.error());
  }

  RecordCounts counts;
  uint64_t skipped_vectors = 0;
  uint32_t dim = settings_.dimension;

  auto copied = ForEachEntry(*legacy, [&](LegacyEntry&& entry) -> Expected<void, Error> {
    if (Cancelled(options)) {
      return MakeUnexpected(CancelledError());
    }
    auto stored = container.PutKv(entry.record);
    if (!stored) {
      return MakeUnexpected(stored.error());
    }
    ++counts.kv;

    if (!entry.embedding) {
      return {};
    }
    const std::vector<float>& embedding = *entry.embedding;
    if (!container.HasVectors()) {
      if (dim == 0) {
        dim = static_cast<uint32_t>(embedding.size());
      }
      auto created = container.CreateVectorSegment(settings_.MakeHeader(dim), settings_.IndexParams());
      if (!created) {
        return created;
      }
    }
    if (embedding.size() != dim) {
      spdlog::warn("Skipping embedding of '{}' (dimension {}, expected {})", entry.record.id, embedding.size(), dim);
      ++skipped_vectors;
      return {};
    }
    if (entry.record.id.size() > settings_.id_width) {
      spdlog::warn("Skipping embedding of '{}' (id is {} bytes, vector ids hold at most {})", entry.record.id,
                   entry.record.id.size(), settings_.id_width);
      ++skipped_vectors;
      return {};
    }
    auto quantized = vectors::Quantize(embedding.data(), dim, settings_.quantization);
    auto appended = container.AppendQuantizedVector(entry.record.id, quantized);
    if (!appended) {
      return appended;
    }
    ++counts.vectors;
    return {};
  });
  if (!copied) {
    return copied;
  }

  copied = ForEachEvent(*legacy, [&](LegacyEvent&& event) -> Expected<void, Error> {
    if (Cancelled(options)) {
      return MakeUnexpected(CancelledError());
    }
    storage::LogRecord record;
    record.seq = counts.log + 1;
    record.timestamp = event.timestamp;
    record.payload = std::move(event.payload);
    auto appended = container.AppendLogRecord(record);
    if (!appended) {
      return appended;
    }
    ++counts.log;
    return {};
  });
  if (!copied) {
    return copied;
  }

  if (container.HasVectors()) {
    auto rebuilt = container.RebuildIndex(settings_.IndexParams(), true);
    if (!rebuilt) {
      return rebuilt;
    }
  }

  // No wall-clock values here, so repeated migrations are byte-identical
  const storage::MetaEntries meta = {{"source_format", FormatName(source_format)},
                                     {"migrated_kv", std::to_string(counts.kv)},
                                     {"migrated_vectors", std::to_string(counts.vectors)},
                                     {"migrated_log", std::to_string(counts.log)}};
  for (const auto& [key, value] : meta) {
    auto set = container.SetMeta(key, value);
    if (!set) {
      return set;
    }
  }

  manifest.records_migrated = counts;
  manifest.skipped_vectors = skipped_vectors;
  return {};
}

// ============================================================================
// Recovery, backup naming
// ============================================================================

Expected<bool, Error> MigrationEngine::RecoverInterrupted(MigrationManifest& manifest,
                                                          const std::string& manifest_path) const {
  const bool source_gone = !PathExists(manifest.source_path);
  const bool backup_present = !manifest.backup_path.empty() && PathExists(manifest.backup_path);

  if (source_gone && backup_present && storage::RvfContainer::Validate(manifest.target_path)) {
    manifest.status = MigrationStatus::kComplete;
    manifest.failure_reason.clear();
    auto saved = manifest.Save(manifest_path);
    if (!saved) {
      return MakeUnexpected(saved.error());
    }
    utils::LogMigrationEvent("recovered", manifest.source_path, manifest.target_path, "interrupted after rename");
    return true;
  }

  // Interrupted before the rename (or the target is unusable): undo
  if (source_gone && backup_present) {
    std::error_code ec;
    fs::rename(manifest.backup_path, manifest.source_path, ec);
    if (ec) {
      return MakeUnexpected(MakeError(ErrorCode::kIOError, "Failed to restore backup: " + ec.message(),
                                      manifest.backup_path));
    }
  }
  RemoveTarget(manifest.target_path);

  manifest.status = MigrationStatus::kFailed;
  manifest.failure_reason = "interrupted";
  auto saved = manifest.Save(manifest_path);
  if (!saved) {
    return MakeUnexpected(saved.error());
  }
  utils::LogMigrationEvent(MigrationStatusName(manifest.status), manifest.source_path, manifest.target_path,
                           "interrupted run cleaned up");
  return false;
}

Expected<std::string, Error> MigrationEngine::ChooseBackupPath(const std::string& source, bool force) const {
  std::string backup = source + kBackupSuffix;
  if (!PathExists(backup)) {
    return backup;
  }
  if (!force) {
    return MakeUnexpected(MakeError(ErrorCode::kAlreadyExists, "Backup already exists; use force", backup));
  }
  for (int attempt = 1; attempt <= kMaxBackupAttempts; ++attempt) {
    std::string candidate = backup + "." + std::to_string(attempt);
    if (!PathExists(candidate)) {
      return candidate;
    }
  }
  return MakeUnexpected(MakeError(ErrorCode::kAlreadyExists, "No free backup name", backup));
}

// ============================================================================
// Rollback / Status / DryRun
// ============================================================================

Expected<MigrationManifest, Error> MigrationEngine::Rollback(const std::string& target) {
  auto lock = utils::FileLock::Acquire(target);
  if (!lock) {
    return MakeUnexpected(lock.error());
  }

  const std::string manifest_path = MigrationManifest::PathFor(target);
  auto loaded = MigrationManifest::Load(manifest_path);
  if (!loaded) {
    return MakeUnexpected(loaded.error());
  }
  MigrationManifest manifest = *loaded;

  if (manifest.status != MigrationStatus::kComplete) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidState,
                                    std::string("Nothing to roll back (status ") +
                                        MigrationStatusName(manifest.status) + ")",
                                    manifest_path));
  }
  if (!PathExists(manifest.backup_path)) {
    return MakeUnexpected(MakeError(ErrorCode::kNotFound, "Backup not found", manifest.backup_path));
  }
  if (PathExists(manifest.source_path)) {
    return MakeUnexpected(MakeError(ErrorCode::kAlreadyExists, "Source path is occupied", manifest.source_path));
  }

  std::error_code ec;
  fs::rename(manifest.backup_path, manifest.source_path, ec);
  if (ec) {
    return MakeUnexpected(
        MakeError(ErrorCode::kIOError, "Failed to restore backup: " + ec.message(), manifest.backup_path));
  }
  fs::remove(target, ec);
  if (ec) {
    return MakeUnexpected(MakeError(ErrorCode::kIOError, "Failed to remove target: " + ec.message(), target));
  }

  manifest.status = MigrationStatus::kPending;
  manifest.failure_reason.clear();
  auto saved = manifest.Save(manifest_path);
  if (!saved) {
    return MakeUnexpected(saved.error());
  }
  utils::LogMigrationEvent("rolled-back", manifest.source_path, target, "");
  return manifest;
}

Expected<std::optional<MigrationManifest>, Error> MigrationEngine::Status(const std::string& target) {
  auto loaded = MigrationManifest::Load(MigrationManifest::PathFor(target));
  if (!loaded) {
    if (loaded.error().code() == ErrorCode::kNotFound) {
      return std::optional<MigrationManifest>{};
    }
    return MakeUnexpected(loaded.error());
  }
  return std::optional<MigrationManifest>(std::move(*loaded));
}

Expected<MigrationManifest, Error> MigrationEngine::DryRun(const std::string& source, const std::string& target,
                                                           StoreFormat source_format,
                                                           const MigrationOptions& options) {
  if (!PathExists(source)) {
    return MakeUnexpected(MakeError(ErrorCode::kNotFound, "Source not found", source));
  }

  std::error_code ec;
  auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  fs::path work_dir = fs::temp_directory_path(ec) /
                      ("rvf-migrate-dry-run-" + std::to_string(::getpid()) + "-" + std::to_string(stamp));
  if (ec || !fs::create_directories(work_dir, ec)) {
    return MakeUnexpected(MakeError(ErrorCode::kIOError, "Cannot create dry-run directory: " + ec.message(),
                                    work_dir.string()));
  }
  utils::ScopeGuard remove_work_dir([&work_dir]() {
    std::error_code cleanup_ec;
    fs::remove_all(work_dir, cleanup_ec);
  });

  const std::string scratch_target = (work_dir / fs::path(target).filename()).string();

  MigrationManifest manifest;
  manifest.source_path = source;
  manifest.source_format = FormatName(source_format);
  manifest.target_path = target;
  manifest.backup_path = source + kBackupSuffix;

  storage::RvfContainer container;
  storage::OpenOptions open_options;
  open_options.create = true;
  open_options.fsync = false;
  open_options.index_params = settings_.IndexParams();
  auto opened = container.Open(scratch_target, open_options);
  if (!opened) {
    return MakeUnexpected(opened.error());
  }

  auto copied = CopyRecords(source, source_format, container, options, manifest);
  if (!copied) {
    container.Discard();
    return MakeUnexpected(MakeError(ErrorCode::kMigrationFailed, copied.error().code() == ErrorCode::kCancelled
                                                                     ? copied.error().message()
                                                                     : copied.error().to_string(),
                                    source));
  }
  auto closed = container.Close();
  if (!closed) {
    return MakeUnexpected(closed.error());
  }
  auto validated = storage::RvfContainer::Validate(scratch_target);
  if (!validated) {
    return MakeUnexpected(validated.error());
  }

  spdlog::info("Dry run of {}: kv={} vectors={} log={} ({} bytes)", source, manifest.records_migrated.kv,
               manifest.records_migrated.vectors, manifest.records_migrated.log, validated->file_size);
  return manifest;
}

}  // namespace rvfstore::migration
