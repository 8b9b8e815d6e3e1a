/**
 * @file config.cpp
 * @brief Configuration parser implementation for rvfstore
 */

#include "config/config.h"

#include <yaml-cpp/yaml.h>

#include <sstream>
#include <stdexcept>

#include <nlohmann/json-schema.hpp>
#include <nlohmann/json.hpp>

#include "config/config_schema_embedded.h"
#include "utils/error.h"
#include "utils/structured_log.h"

using nlohmann::json;
using nlohmann::json_schema::json_validator;

namespace rvfstore::config {

namespace {

/**
 * @brief Convert YAML node to JSON (recursive)
 *
 * Quoted scalars stay strings; plain scalars become the narrowest of
 * integer, double, bool, string.
 */
nlohmann::json YamlToJson(const YAML::Node& yaml_node) {
  if (yaml_node.IsNull()) {
    return nlohmann::json();
  }

  if (yaml_node.IsScalar()) {
    if (yaml_node.Tag() == "!") {
      return yaml_node.as<std::string>();
    }
    try {
      return yaml_node.as<int64_t>();
    } catch (const YAML::BadConversion&) {
      try {
        return yaml_node.as<double>();
      } catch (const YAML::BadConversion&) {
        try {
          return yaml_node.as<bool>();
        } catch (const YAML::BadConversion&) {
          return yaml_node.as<std::string>();
        }
      }
    }
  }

  if (yaml_node.IsSequence()) {
    nlohmann::json json_array = nlohmann::json::array();
    for (const auto& item : yaml_node) {
      json_array.push_back(YamlToJson(item));
    }
    return json_array;
  }

  if (yaml_node.IsMap()) {
    nlohmann::json json_object = nlohmann::json::object();
    for (const auto& pair : yaml_node) {
      std::string key = pair.first.as<std::string>();
      json_object[key] = YamlToJson(pair.second);
    }
    return json_object;
  }

  return nlohmann::json();
}

/**
 * @brief Parse storage configuration
 */
StorageConfig ParseStorageConfig(const YAML::Node& node) {
  StorageConfig config;

  if (node["data_dir"]) {
    config.data_dir = node["data_dir"].as<std::string>();
  }
  if (node["lock_timeout_ms"]) {
    config.lock_timeout_ms = node["lock_timeout_ms"].as<uint32_t>();
  }
  if (node["fsync"]) {
    config.fsync = node["fsync"].as<bool>();
  }

  return config;
}

/**
 * @brief Parse vectors configuration
 */
VectorsConfig ParseVectorsConfig(const YAML::Node& node) {
  VectorsConfig config;

  if (node["dimension"]) {
    config.dimension = node["dimension"].as<uint32_t>();
  }
  if (node["metric"]) {
    config.metric = node["metric"].as<std::string>();
  }
  if (node["quantization"]) {
    config.quantization = node["quantization"].as<std::string>();
  }
  if (node["id_width"]) {
    config.id_width = node["id_width"].as<uint32_t>();
  }

  return config;
}

/**
 * @brief Parse index configuration
 */
IndexConfig ParseIndexConfig(const YAML::Node& node) {
  IndexConfig config;

  if (node["m"]) {
    config.m = node["m"].as<uint32_t>();
  }
  if (node["ef_construction"]) {
    config.ef_construction = node["ef_construction"].as<uint32_t>();
  }
  if (node["ef_search"]) {
    config.ef_search = node["ef_search"].as<uint32_t>();
  }
  if (node["seed"]) {
    config.seed = node["seed"].as<uint64_t>();
  }
  if (node["build_batch"]) {
    config.build_batch = node["build_batch"].as<uint32_t>();
  }

  return config;
}

/**
 * @brief Parse migration configuration
 */
MigrationConfig ParseMigrationConfig(const YAML::Node& node) {
  MigrationConfig config;

  if (node["auto_migrate"]) {
    config.auto_migrate = node["auto_migrate"].as<bool>();
  }
  if (node["backup_suffix"]) {
    config.backup_suffix = node["backup_suffix"].as<std::string>();
  }
  if (node["known_paths"] && node["known_paths"].IsSequence()) {
    for (const auto& path_node : node["known_paths"]) {
      config.known_paths.push_back(path_node.as<std::string>());
    }
  }

  return config;
}

/**
 * @brief Parse logging configuration
 */
LoggingConfig ParseLoggingConfig(const YAML::Node& node) {
  LoggingConfig config;

  if (node["level"]) {
    config.level = node["level"].as<std::string>();
  }
  if (node["json"]) {
    config.json = node["json"].as<bool>();
  }
  if (node["file"]) {
    config.file = node["file"].as<std::string>();
  }

  return config;
}

/**
 * @brief Validate configuration against JSON Schema
 *
 * @param config_json JSON representation of configuration
 * @return Expected<void, Error> with success or validation error
 */
utils::Expected<void, utils::Error> ValidateConfigSchema(const nlohmann::json& config_json) {
  try {
    json schema_json = json::parse(kConfigSchemaJson);

    json_validator validator;
    validator.set_root_schema(schema_json);

    try {
      validator.validate(config_json);
      utils::StructuredLog().Event("config_validation").Field("status", "passed").Debug();
    } catch (const std::exception& e) {
      std::stringstream err_msg;
      err_msg << "Configuration validation failed:\n";
      err_msg << "  " << e.what() << "\n\n";
      err_msg << "  Common configuration issues:\n";
      err_msg << "    - Unknown sections or keys (allowed: storage, vectors, index, migration, logging)\n";
      err_msg << "    - Invalid data types (string instead of number, etc.)\n";
      err_msg << "    - Invalid enum values (check allowed values)\n";
      err_msg << "    - Out of range values (check min/max constraints)";
      return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigValidationError, err_msg.str()));
    }
  } catch (const json::parse_error& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigParseError, std::string("JSON parse error: ") + e.what()));
  }

  return {};
}

}  // namespace

utils::Expected<Config, utils::Error> LoadConfig(const std::string& path) {
  try {
    YAML::Node root = YAML::LoadFile(path);

    // An empty file is a valid configuration made of defaults
    nlohmann::json config_json = root.IsNull() ? nlohmann::json::object() : YamlToJson(root);

    auto validation_result = ValidateConfigSchema(config_json);
    if (!validation_result) {
      return utils::MakeUnexpected(validation_result.error());
    }

    Config config;

    if (root["storage"]) {
      config.storage = ParseStorageConfig(root["storage"]);
    }
    if (root["vectors"]) {
      config.vectors = ParseVectorsConfig(root["vectors"]);
    }
    if (root["index"]) {
      config.index = ParseIndexConfig(root["index"]);
    }
    if (root["migration"]) {
      config.migration = ParseMigrationConfig(root["migration"]);
    }
    if (root["logging"]) {
      config.logging = ParseLoggingConfig(root["logging"]);
    }

    auto semantic_validation = ValidateConfig(config);
    if (!semantic_validation) {
      return utils::MakeUnexpected(semantic_validation.error());
    }

    return config;

  } catch (const YAML::BadFile& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigFileNotFound, "Failed to open config file: " + std::string(e.what())));
  } catch (const YAML::Exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigYamlError, "YAML parsing error: " + std::string(e.what())));
  } catch (const std::exception& e) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigParseError, "Configuration error: " + std::string(e.what())));
  }
}

utils::Expected<void, utils::Error> ValidateConfig(const Config& config) {
  // Validate storage configuration
  if (config.storage.data_dir.empty()) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "storage.data_dir must not be empty"));
  }
  if (config.storage.lock_timeout_ms != 0) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigInvalidValue,
                                                  "storage.lock_timeout_ms is reserved and must be 0"));
  }

  // Validate vectors configuration
  if (!vectors::ParseMetric(config.vectors.metric)) {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kConfigInvalidValue,
        "vectors.metric must be one of: cosine, l2, dot (got: " + config.vectors.metric + ")"));
  }
  if (!vectors::ParseQuantization(config.vectors.quantization)) {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kConfigInvalidValue,
        "vectors.quantization must be one of: fp32, fp16, int8, int4, binary (got: " + config.vectors.quantization +
            ")"));
  }
  if (config.vectors.id_width < storage::vec_format::kMinIdWidth ||
      config.vectors.id_width > storage::vec_format::kMaxIdWidth) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigInvalidValue,
                                                  "vectors.id_width must be between " +
                                                      std::to_string(storage::vec_format::kMinIdWidth) + " and " +
                                                      std::to_string(storage::vec_format::kMaxIdWidth)));
  }

  // Validate index configuration
  if (config.index.m < 2) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "index.m must be >= 2"));
  }
  if (config.index.ef_construction < config.index.m) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "index.ef_construction must be >= index.m"));
  }
  if (config.index.ef_search == 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "index.ef_search must be greater than 0"));
  }
  if (config.index.build_batch == 0) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, "index.build_batch must be greater than 0"));
  }

  // Validate migration configuration
  if (config.migration.backup_suffix != defaults::kBackupSuffix) {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kConfigInvalidValue,
        std::string("migration.backup_suffix must be \"") + defaults::kBackupSuffix + "\" (got: \"" +
            config.migration.backup_suffix + "\")"));
  }

  // Validate logging configuration
  if (config.logging.level != "trace" && config.logging.level != "debug" && config.logging.level != "info" &&
      config.logging.level != "warn" && config.logging.level != "error") {
    return utils::MakeUnexpected(utils::MakeError(
        utils::ErrorCode::kConfigInvalidValue,
        "logging.level must be one of: trace, debug, info, warn, error (got: " + config.logging.level + ")"));
  }

  return {};
}

utils::Expected<vectors::VectorSettings, utils::Error> ToVectorSettings(const Config& config) {
  auto metric = vectors::ParseMetric(config.vectors.metric);
  if (!metric) {
    return utils::MakeUnexpected(utils::MakeError(utils::ErrorCode::kConfigInvalidValue, metric.error().message()));
  }
  auto quantization = vectors::ParseQuantization(config.vectors.quantization);
  if (!quantization) {
    return utils::MakeUnexpected(
        utils::MakeError(utils::ErrorCode::kConfigInvalidValue, quantization.error().message()));
  }

  vectors::VectorSettings settings;
  settings.dimension = config.vectors.dimension;
  settings.id_width = config.vectors.id_width;
  settings.quantization = *quantization;
  settings.metric = *metric;
  settings.index.m = config.index.m;
  settings.index.ef_construction = config.index.ef_construction;
  settings.index.seed = config.index.seed;
  settings.index.metric = *metric;
  settings.ef_search = config.index.ef_search;
  settings.build_batch = config.index.build_batch;
  return settings;
}

}  // namespace rvfstore::config
