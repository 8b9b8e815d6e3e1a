/**
 * @file migration_manifest.cpp
 * @brief Manifest JSON encoding and atomic persistence
 */

#include "migration/migration_manifest.h"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>

#include "utils/fd_guard.h"

namespace rvfstore::migration {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

const char* MigrationStatusName(MigrationStatus status) {
  switch (status) {
    case MigrationStatus::kPending:
      return "pending";
    case MigrationStatus::kInProgress:
      return "in-progress";
    case MigrationStatus::kComplete:
      return "complete";
    case MigrationStatus::kFailed:
      return "failed";
  }
  return "pending";
}

std::optional<MigrationStatus> ParseMigrationStatus(const std::string& name) {
  for (auto status :
       {MigrationStatus::kPending, MigrationStatus::kInProgress, MigrationStatus::kComplete, MigrationStatus::kFailed}) {
    if (name == MigrationStatusName(status)) {
      return status;
    }
  }
  return std::nullopt;
}

nlohmann::json MigrationManifest::ToJson() const {
  nlohmann::json json;
  json["source_path"] = source_path;
  json["source_format"] = source_format;
  json["target_path"] = target_path;
  json["backup_path"] = backup_path;
  json["status"] = MigrationStatusName(status);
  json["failure_reason"] = failure_reason;
  json["records_migrated"] = {
      {"kv", records_migrated.kv}, {"vectors", records_migrated.vectors}, {"log", records_migrated.log}};
  json["skipped_vectors"] = skipped_vectors;
  json["updated_at"] = updated_at;
  return json;
}

Expected<MigrationManifest, Error> MigrationManifest::FromJson(const nlohmann::json& json) {
  try {
    MigrationManifest manifest;
    manifest.source_path = json.at("source_path").get<std::string>();
    manifest.source_format = json.value("source_format", "");
    manifest.target_path = json.at("target_path").get<std::string>();
    manifest.backup_path = json.value("backup_path", "");
    auto status = ParseMigrationStatus(json.at("status").get<std::string>());
    if (!status) {
      return MakeUnexpected(
          MakeError(ErrorCode::kMigrationFailed, "Unknown manifest status: " + json.at("status").get<std::string>()));
    }
    manifest.status = *status;
    manifest.failure_reason = json.value("failure_reason", "");
    if (json.contains("records_migrated")) {
      const auto& records = json.at("records_migrated");
      manifest.records_migrated.kv = records.value("kv", uint64_t{0});
      manifest.records_migrated.vectors = records.value("vectors", uint64_t{0});
      manifest.records_migrated.log = records.value("log", uint64_t{0});
    }
    manifest.skipped_vectors = json.value("skipped_vectors", uint64_t{0});
    manifest.updated_at = json.value("updated_at", uint64_t{0});
    return manifest;
  } catch (const nlohmann::json::exception& e) {
    return MakeUnexpected(MakeError(ErrorCode::kMigrationFailed, std::string("Invalid manifest: ") + e.what()));
  }
}

Expected<MigrationManifest, Error> MigrationManifest::Load(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return MakeUnexpected(MakeError(ErrorCode::kNotFound, "No migration manifest", path));
  }
  std::ifstream input_stream(path);
  if (!input_stream) {
    return MakeUnexpected(MakeError(ErrorCode::kIOError, "Failed to open manifest", path));
  }
  try {
    nlohmann::json json = nlohmann::json::parse(input_stream);
    auto manifest = FromJson(json);
    if (!manifest) {
      return MakeUnexpected(MakeError(manifest.error().code(), manifest.error().message(), path));
    }
    return manifest;
  } catch (const nlohmann::json::parse_error& e) {
    return MakeUnexpected(
        MakeError(ErrorCode::kMigrationFailed, std::string("Manifest is not valid JSON: ") + e.what(), path));
  }
}

Expected<void, Error> MigrationManifest::Save(const std::string& path) {
  updated_at = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                         std::chrono::system_clock::now().time_since_epoch())
                                         .count());
  const std::string text = ToJson().dump(2) + "\n";
  const std::string temp_path = path + ".tmp";

  utils::FDGuard fd(::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
  if (fd.Get() < 0) {
    return MakeUnexpected(
        MakeError(ErrorCode::kIOError, "Failed to open manifest for writing: " + std::string(std::strerror(errno)),
                  temp_path));
  }
  utils::ScopeGuard remove_temp([&temp_path]() { ::unlink(temp_path.c_str()); });

  const char* data = text.data();
  size_t remaining = text.size();
  while (remaining > 0) {
    ssize_t written = ::write(fd.Get(), data, remaining);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      return MakeUnexpected(
          MakeError(ErrorCode::kIOError, "Manifest write failed: " + std::string(std::strerror(errno)), temp_path));
    }
    data += written;
    remaining -= static_cast<size_t>(written);
  }
  if (::fsync(fd.Get()) != 0) {
    return MakeUnexpected(
        MakeError(ErrorCode::kIOError, "Manifest fsync failed: " + std::string(std::strerror(errno)), temp_path));
  }
  if (::rename(temp_path.c_str(), path.c_str()) != 0) {
    return MakeUnexpected(
        MakeError(ErrorCode::kIOError, "Manifest rename failed: " + std::string(std::strerror(errno)), path));
  }
  remove_temp.Release();
  return {};
}

}  // namespace rvfstore::migration
