/**
 * @file backend_facade.h
 * @brief Single entry point that opens whatever store lives at a path
 */

#pragma once

#include <memory>
#include <string>

#include "backend/backend.h"
#include "vectors/vector_settings.h"

namespace rvfstore::backend {

/**
 * @brief Options for OpenBackend()
 */
struct BackendOptions {
  bool auto_migrate = true;  ///< Migrate legacy stores to "<base>.rvf" on open
  bool read_only = false;    ///< Never write; legacy stores are served as they are
  bool create = true;        ///< Create an empty container when nothing exists
  bool fsync = true;
  vectors::VectorSettings vectors;
};

/**
 * @brief Open the store behind @p logical_path
 *
 * - native container: NativeBackend
 * - legacy store: migrated and opened natively, or served read-only by a
 *   LegacyBackend when auto_migrate is off or the open is read-only
 * - nothing: a new container at "<base>.rvf" (if create is set)
 * - an unrecognized file: kAlreadyExists, it is never overwritten
 */
utils::Expected<std::unique_ptr<Backend>, utils::Error> OpenBackend(const std::string& logical_path,
                                                                    const BackendOptions& options = {});

}  // namespace rvfstore::backend
