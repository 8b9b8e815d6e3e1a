/**
 * @file migrate_commands.cpp
 * @brief rvf-migrate subcommands and option parsing
 */

#include "cli/migrate_commands.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iomanip>
#include <ostream>

#include "migration/format_detector.h"
#include "migration/migration_engine.h"
#include "storage/container_format.h"
#include "storage/rvf_container.h"
#include "utils/structured_log.h"
#include "version.h"

namespace rvfstore::cli {

namespace {

namespace fs = std::filesystem;

constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";

void PrintUsage(std::ostream& out, const char* program) {
  out << "Usage: " << program << " [OPTIONS] <command> [<args>]\n";
  out << "\n";
  out << "Commands:\n";
  out << "  status [paths...]                      Show the store format of each path\n";
  out << "  run [--dry-run] [--force] <source> [target]\n";
  out << "                                         Migrate a legacy store into a container\n";
  out << "  rollback <target>                      Undo a completed migration\n";
  out << "  validate <container>                   Check a container's digest and segments\n";
  out << "\n";
  out << "Options:\n";
  out << "  -c, --config <file>            Configuration file path\n";
  out << "      --verbose                  Debug logging\n";
  out << "  -h, --help                     Show this help message\n";
  out << "  -v, --version                  Show version information\n";
  out << "\n";
  out << "Example:\n";
  out << "  " << program << " run memory.db\n";
  out << "  " << program << " -c /etc/rvfstore/config.yaml status\n";
}

/**
 * @brief Relative paths are taken from storage.data_dir
 */
std::string ResolveDataPath(const config::Config& config, const std::string& path) {
  if (path.empty() || fs::path(path).is_absolute() || config.storage.data_dir == config::defaults::kDataDir) {
    return path;
  }
  return (fs::path(config.storage.data_dir) / path).string();
}

migration::MigrationEngine MakeEngine(const config::Config& config) {
  auto settings = config::ToVectorSettings(config);
  // Config was validated on load; defaults are always convertible
  return migration::MigrationEngine(settings ? *settings : vectors::VectorSettings{}, config.storage.fsync);
}

void PrintCounts(std::ostream& out, const migration::MigrationManifest& manifest) {
  out << "  kv:      " << manifest.records_migrated.kv << "\n";
  out << "  vectors: " << manifest.records_migrated.vectors << "\n";
  out << "  log:     " << manifest.records_migrated.log << "\n";
  if (manifest.skipped_vectors > 0) {
    out << "  skipped vectors: " << manifest.skipped_vectors << "\n";
  }
}

}  // namespace

void ConfigureLogging(const config::LoggingConfig& logging, bool verbose) {
  if (!logging.file.empty()) {
    try {
      spdlog::drop("rvf-migrate");
      auto logger = spdlog::basic_logger_mt("rvf-migrate", logging.file);
      spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex& e) {
      spdlog::warn("Cannot open log file {}: {}", logging.file, e.what());
    }
  }
  spdlog::set_pattern(kLogPattern);
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::from_str(logging.level));
  utils::StructuredLog::SetFormat(logging.json ? utils::LogFormat::JSON : utils::LogFormat::TEXT);
}

int CmdStatus(const CommandContext& ctx, const std::vector<std::string>& args) {
  std::vector<std::string> paths = args;
  if (paths.empty()) {
    paths = ctx.config.migration.known_paths;
  }
  if (paths.empty()) {
    *ctx.err << "Error: status needs at least one path (or migration.known_paths in the config)\n";
    return kExitFailure;
  }

  int status = kExitSuccess;
  for (const auto& arg : paths) {
    const std::string logical = ResolveDataPath(ctx.config, arg);
    const migration::ResolvedStore store = migration::ResolveStorePath(logical);
    *ctx.out << arg << ": " << migration::FormatName(store.format);
    if (store.exists) {
      *ctx.out << " (" << store.path << ")";
    } else {
      *ctx.out << " (not found)";
    }

    const std::string target = store.format == migration::StoreFormat::kNativeContainer
                                   ? store.path
                                   : migration::NativePathFor(store.path);
    auto manifest = migration::MigrationEngine::Status(target);
    if (!manifest) {
      *ctx.out << " migration=unreadable";
      status = kExitFailure;
    } else if (*manifest) {
      const auto& value = **manifest;
      *ctx.out << " migration=" << migration::MigrationStatusName(value.status);
      if (!value.failure_reason.empty()) {
        *ctx.out << " reason=\"" << value.failure_reason << "\"";
      }
    }
    *ctx.out << "\n";
  }
  return status;
}

int CmdRun(const CommandContext& ctx, const std::vector<std::string>& args) {
  migration::MigrationOptions options;
  std::vector<std::string> positional;
  for (const auto& arg : args) {
    if (arg == "--dry-run") {
      options.dry_run = true;
    } else if (arg == "--force") {
      options.force = true;
    } else if (!arg.empty() && arg[0] == '-') {
      *ctx.err << "Error: Unknown option for run: " << arg << "\n";
      return kExitFailure;
    } else {
      positional.push_back(arg);
    }
  }
  if (positional.empty() || positional.size() > 2) {
    *ctx.err << "Error: run needs <source> [target]\n";
    return kExitFailure;
  }

  const std::string source = ResolveDataPath(ctx.config, positional[0]);
  const std::string target =
      positional.size() == 2 ? ResolveDataPath(ctx.config, positional[1]) : migration::NativePathFor(source);
  const migration::StoreFormat format = migration::DetectFormat(source);
  if (!migration::IsLegacyFormat(format)) {
    *ctx.err << "Error: " << source << " is not a legacy store (format: " << migration::FormatName(format) << ")\n";
    return kExitFailure;
  }

  auto engine = MakeEngine(ctx.config);
  auto manifest = engine.Migrate(source, target, format, options);
  if (!manifest) {
    *ctx.err << "Error: " << manifest.error().to_string() << "\n";
    return kExitFailure;
  }

  if (options.dry_run) {
    *ctx.out << "Dry run of " << source << " (" << migration::FormatName(format) << "): nothing was changed\n";
  } else {
    *ctx.out << "Migrated " << source << " -> " << manifest->target_path << "\n";
    *ctx.out << "  backup:  " << manifest->backup_path << "\n";
  }
  PrintCounts(*ctx.out, *manifest);
  return kExitSuccess;
}

int CmdRollback(const CommandContext& ctx, const std::vector<std::string>& args) {
  if (args.size() != 1) {
    *ctx.err << "Error: rollback needs exactly one <target>\n";
    return kExitFailure;
  }
  const std::string target = ResolveDataPath(ctx.config, args[0]);
  auto engine = MakeEngine(ctx.config);
  auto manifest = engine.Rollback(target);
  if (!manifest) {
    *ctx.err << "Error: " << manifest.error().to_string() << "\n";
    return kExitFailure;
  }
  *ctx.out << "Restored " << manifest->source_path << " and removed " << target << "\n";
  return kExitSuccess;
}

int CmdValidate(const CommandContext& ctx, const std::vector<std::string>& args) {
  if (args.size() != 1) {
    *ctx.err << "Error: validate needs exactly one <container>\n";
    return kExitFailure;
  }
  const std::string path = ResolveDataPath(ctx.config, args[0]);
  auto report = storage::RvfContainer::Validate(path);
  if (!report) {
    *ctx.out << path << ": INVALID\n";
    *ctx.err << "Error: " << report.error().to_string() << "\n";
    return kExitFailure;
  }

  *ctx.out << path << ": OK\n";
  *ctx.out << "  version:  " << report->major_version << "." << report->minor_version << "\n";
  *ctx.out << "  size:     " << report->file_size << " bytes\n";
  *ctx.out << "  sha256:   " << report->digest_hex << "\n";
  *ctx.out << "  segments: " << report->segments.size() << "\n";
  for (const auto& segment : report->segments) {
    *ctx.out << "    " << std::left << std::setw(12) << segment.id << std::setw(8)
             << storage::SegmentTypeName(segment.type) << std::right << std::setw(12) << segment.length << " bytes"
             << "  crc32=" << std::hex << std::setw(8) << std::setfill('0') << segment.checksum << std::dec
             << std::setfill(' ');
    if ((segment.flags & storage::container_format::flags::kDerived) != 0) {
      *ctx.out << "  derived";
    }
    *ctx.out << "\n";
  }
  return kExitSuccess;
}

int RunMigrateCli(int argc, char* argv[], std::ostream& out, std::ostream& err) {
  const char* program = argc > 0 ? argv[0] : "rvf-migrate";
  const char* config_path = nullptr;
  bool verbose = false;
  std::string command;
  std::vector<std::string> args;

  // Global options come before the command; everything after it belongs to the command
  // NOLINTBEGIN(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (!command.empty()) {
      args.push_back(arg);
      continue;
    }
    if (arg == "-h" || arg == "--help") {
      PrintUsage(out, program);
      return kExitSuccess;
    }
    if (arg == "-v" || arg == "--version") {
      out << "rvf-migrate version " << Version::String() << "\n";
      out << "Container format " << storage::container_format::kMajorVersion << "."
          << storage::container_format::kMinorVersion << "\n";
      return kExitSuccess;
    }
    if (arg == "-c" || arg == "--config") {
      if (i + 1 < argc) {
        config_path = argv[++i];
      } else {
        err << "Error: " << arg << " requires a file path\n";
        return kExitFailure;
      }
    } else if (arg == "--verbose") {
      verbose = true;
    } else if (arg[0] == '-') {
      err << "Error: Unknown option: " << arg << "\n";
      err << "Use -h or --help for usage information\n";
      return kExitFailure;
    } else {
      command = arg;
    }
  }
  // NOLINTEND(cppcoreguidelines-pro-bounds-pointer-arithmetic)

  if (command.empty()) {
    PrintUsage(err, program);
    return kExitFailure;
  }

  CommandContext ctx;
  ctx.out = &out;
  ctx.err = &err;
  if (config_path != nullptr) {
    auto config_result = config::LoadConfig(config_path);
    if (!config_result) {
      err << "Error: Failed to load config: " << config_result.error().message() << "\n";
      return kExitFailure;
    }
    ctx.config = *config_result;
  }
  ConfigureLogging(ctx.config.logging, verbose);

  if (command == "status") {
    return CmdStatus(ctx, args);
  }
  if (command == "run") {
    return CmdRun(ctx, args);
  }
  if (command == "rollback") {
    return CmdRollback(ctx, args);
  }
  if (command == "validate") {
    return CmdValidate(ctx, args);
  }
  err << "Error: Unknown command: " << command << "\n";
  err << "Use -h or --help for usage information\n";
  return kExitFailure;
}

}  // namespace rvfstore::cli
