/**
 * @file config.h
 * @brief Configuration structures and YAML parser for rvfstore
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"
#include "vectors/vector_settings.h"

namespace rvfstore::config {

// Default values for configuration
namespace defaults {

// Storage defaults
constexpr const char* kDataDir = ".";
constexpr uint32_t kLockTimeoutMs = 0;  // Reserved: locks are non-blocking
constexpr bool kFsync = true;

// Vector defaults
constexpr uint32_t kDimension = 0;  // 0 = taken from the first vector stored
constexpr const char* kMetric = "cosine";
constexpr const char* kQuantization = "fp32";
constexpr uint32_t kIdWidth = 64;

// Index defaults
constexpr uint32_t kM = vectors::hnsw_defaults::kM;
constexpr uint32_t kEfConstruction = vectors::hnsw_defaults::kEfConstruction;
constexpr uint32_t kEfSearch = vectors::hnsw_defaults::kEfSearch;
constexpr uint64_t kSeed = vectors::hnsw_defaults::kSeed;
constexpr uint32_t kBuildBatch = 1024;

// Migration defaults
constexpr bool kAutoMigrate = true;
constexpr const char* kBackupSuffix = ".bak";

// Logging defaults
constexpr const char* kLogLevel = "info";

}  // namespace defaults

/**
 * @brief Storage configuration
 */
struct StorageConfig {
  std::string data_dir = defaults::kDataDir;           ///< Base directory for relative store paths
  uint32_t lock_timeout_ms = defaults::kLockTimeoutMs;  ///< Reserved, must be 0
  bool fsync = defaults::kFsync;                       ///< fsync on flush and manifest writes
};

/**
 * @brief Vector segment configuration
 */
struct VectorsConfig {
  uint32_t dimension = defaults::kDimension;
  std::string metric = defaults::kMetric;              ///< "cosine", "l2", "dot"
  std::string quantization = defaults::kQuantization;  ///< "fp32", "fp16", "int8", "int4", "binary"
  uint32_t id_width = defaults::kIdWidth;              ///< Bytes reserved per record id
};

/**
 * @brief HNSW index configuration
 */
struct IndexConfig {
  uint32_t m = defaults::kM;
  uint32_t ef_construction = defaults::kEfConstruction;
  uint32_t ef_search = defaults::kEfSearch;
  uint64_t seed = defaults::kSeed;
  uint32_t build_batch = defaults::kBuildBatch;  ///< Nodes linked per progressive build step
};

/**
 * @brief Migration configuration
 */
struct MigrationConfig {
  bool auto_migrate = defaults::kAutoMigrate;          ///< Migrate legacy stores when a backend opens them
  std::string backup_suffix = defaults::kBackupSuffix;  ///< Fixed; other values are rejected
  std::vector<std::string> known_paths;                ///< Stores listed by "status" without arguments
};

/**
 * @brief Logging configuration
 */
struct LoggingConfig {
  std::string level = defaults::kLogLevel;  ///< Log level: trace, debug, info, warn, error
  bool json = false;                        ///< Use structured JSON logging
  std::string file;                         ///< Log file path (empty = stderr)
};

/**
 * @brief Root configuration
 */
struct Config {
  StorageConfig storage;
  VectorsConfig vectors;
  IndexConfig index;
  MigrationConfig migration;
  LoggingConfig logging;
};

/**
 * @brief Load configuration from YAML file
 *
 * The document is checked against the embedded JSON Schema, then by
 * ValidateConfig().
 *
 * @param path Path to YAML configuration file
 * @return Expected<Config, Error> with configuration or error
 */
utils::Expected<Config, utils::Error> LoadConfig(const std::string& path);

/**
 * @brief Validate configuration
 *
 * @param config Configuration to validate
 * @return Expected<void, Error> with success or validation error
 */
utils::Expected<void, utils::Error> ValidateConfig(const Config& config);

/**
 * @brief Vector and index settings described by @p config
 */
utils::Expected<vectors::VectorSettings, utils::Error> ToVectorSettings(const Config& config);

}  // namespace rvfstore::config
