/**
 * @file format_detector.cpp
 * @brief Store format detection
 */

#include "migration/format_detector.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>

#include "storage/container_format.h"

namespace rvfstore::migration {

namespace {

constexpr size_t kSniffSize = 16;
constexpr char kSqliteMagic[kSniffSize] = {'S', 'Q', 'L', 'i', 't', 'e', ' ', 'f',
                                           'o', 'r', 'm', 'a', 't', ' ', '3', '\0'};

// Extensions stripped to find the base name, in lookup order
constexpr std::array<const char*, 4> kStoreExtensions = {".rvf", ".db", ".sqlite", ".json"};

std::string LowerExtension(const std::string& path) {
  std::string extension = std::filesystem::path(path).extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return extension;
}

bool IsRegularFile(const std::string& path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

/// First non-whitespace byte of @p prefix, '\0' if it is empty or blank
char FirstJsonByte(const char* prefix, size_t size) {
  for (size_t i = 0; i < size; ++i) {
    if (std::isspace(static_cast<unsigned char>(prefix[i])) == 0) {
      return prefix[i];
    }
  }
  return '\0';
}

std::string BaseName(const std::string& logical_path) {
  std::string extension = LowerExtension(logical_path);
  for (const char* known : kStoreExtensions) {
    if (extension == known) {
      return logical_path.substr(0, logical_path.size() - extension.size());
    }
  }
  return logical_path;
}

}  // namespace

const char* FormatName(StoreFormat format) {
  switch (format) {
    case StoreFormat::kNativeContainer:
      return "native";
    case StoreFormat::kLegacyRelational:
      return "legacy-sqlite";
    case StoreFormat::kLegacyFlatFile:
      return "legacy-json";
    case StoreFormat::kUnknown:
      return "unknown";
  }
  return "unknown";
}

StoreFormat ParseFormatName(const std::string& name) {
  for (auto format : {StoreFormat::kNativeContainer, StoreFormat::kLegacyRelational, StoreFormat::kLegacyFlatFile}) {
    if (name == FormatName(format)) {
      return format;
    }
  }
  return StoreFormat::kUnknown;
}

StoreFormat DetectFormat(const std::string& path) {
  if (!IsRegularFile(path)) {
    return StoreFormat::kUnknown;
  }
  std::ifstream input_stream(path, std::ios::binary);
  if (!input_stream) {
    return StoreFormat::kUnknown;
  }

  char header[kSniffSize] = {};
  input_stream.read(header, sizeof(header));
  auto got = static_cast<size_t>(input_stream.gcount());

  const auto& magic = storage::container_format::kMagicNumber;
  if (got >= magic.size() && std::memcmp(header, magic.data(), magic.size()) == 0) {
    return StoreFormat::kNativeContainer;
  }
  if (got == kSniffSize && std::memcmp(header, kSqliteMagic, kSniffSize) == 0) {
    return StoreFormat::kLegacyRelational;
  }

  // Only the header bytes are inspected; a blank header counts as JSON
  if (LowerExtension(path) == ".json") {
    char first = FirstJsonByte(header, got);
    if (first == '\0' || first == '{' || first == '[') {
      return StoreFormat::kLegacyFlatFile;
    }
  }
  return StoreFormat::kUnknown;
}

std::string NativePathFor(const std::string& logical_path) { return BaseName(logical_path) + ".rvf"; }

ResolvedStore ResolveStorePath(const std::string& logical_path) {
  const std::string base = BaseName(logical_path);

  for (const char* extension : kStoreExtensions) {
    std::string candidate = base + extension;
    if (!IsRegularFile(candidate)) {
      continue;
    }
    StoreFormat format = DetectFormat(candidate);
    if (format != StoreFormat::kUnknown) {
      return ResolvedStore{candidate, format, true};
    }
  }

  if (IsRegularFile(logical_path)) {
    return ResolvedStore{logical_path, DetectFormat(logical_path), true};
  }
  std::string native = base + ".rvf";
  return ResolvedStore{native, StoreFormat::kUnknown, IsRegularFile(native)};
}

}  // namespace rvfstore::migration
