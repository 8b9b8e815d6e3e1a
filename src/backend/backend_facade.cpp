/**
 * @file backend_facade.cpp
 * @brief Store resolution, auto-migration and backend selection
 */

#include "backend/backend_facade.h"

#include <spdlog/spdlog.h>

#include "backend/legacy_backend.h"
#include "backend/native_backend.h"
#include "migration/migration_engine.h"
#include "utils/structured_log.h"

namespace rvfstore::backend {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

Expected<std::unique_ptr<Backend>, Error> OpenNative(const std::string& path, bool create,
                                                     const BackendOptions& options) {
  storage::OpenOptions open_options;
  open_options.create = create;
  open_options.read_only = options.read_only;
  open_options.fsync = options.fsync;
  open_options.index_params = options.vectors.IndexParams();

  auto backend = NativeBackend::Open(path, open_options, options.vectors);
  if (!backend) {
    return MakeUnexpected(backend.error());
  }
  return std::unique_ptr<Backend>(std::move(*backend));
}

}  // namespace

Expected<std::unique_ptr<Backend>, Error> OpenBackend(const std::string& logical_path, const BackendOptions& options) {
  const migration::ResolvedStore store = migration::ResolveStorePath(logical_path);

  switch (store.format) {
    case migration::StoreFormat::kNativeContainer:
      return OpenNative(store.path, false, options);

    case migration::StoreFormat::kLegacyRelational:
    case migration::StoreFormat::kLegacyFlatFile: {
      if (!options.auto_migrate || options.read_only) {
        spdlog::info("Serving legacy store {} ({}) read-only", store.path, migration::FormatName(store.format));
        return std::unique_ptr<Backend>(
            std::make_unique<LegacyBackend>(store.path, store.format, options.vectors.metric));
      }

      const std::string target = migration::NativePathFor(store.path);
      utils::LogMigrationEvent("auto-migrate", store.path, target, migration::FormatName(store.format));
      migration::MigrationEngine engine(options.vectors, options.fsync);
      auto manifest = engine.Migrate(store.path, target, store.format);
      if (!manifest) {
        return MakeUnexpected(manifest.error());
      }
      return OpenNative(target, false, options);
    }

    case migration::StoreFormat::kUnknown:
      break;
  }

  if (store.exists) {
    return MakeUnexpected(
        MakeError(ErrorCode::kAlreadyExists, "Refusing to overwrite a file that is not a known store", store.path));
  }
  if (!options.create || options.read_only) {
    return MakeUnexpected(MakeError(ErrorCode::kNotFound, "No store found", logical_path));
  }
  spdlog::info("Creating new container {}", store.path);
  return OpenNative(store.path, true, options);
}

}  // namespace rvfstore::backend
