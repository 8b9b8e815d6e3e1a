/**
 * @file migrate_commands.h
 * @brief Subcommands of the rvf-migrate tool
 */

#pragma once

#include <iosfwd>
#include <string>
#include <vector>

#include "config/config.h"

namespace rvfstore::cli {

/**
 * @brief Exit codes
 */
constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;

/**
 * @brief Shared state for one invocation
 */
struct CommandContext {
  config::Config config;
  std::ostream* out = nullptr;
  std::ostream* err = nullptr;
};

/// Print the format (and migration state) of each path; read only
int CmdStatus(const CommandContext& ctx, const std::vector<std::string>& args);

/// run [--dry-run] [--force] <source> [target]
int CmdRun(const CommandContext& ctx, const std::vector<std::string>& args);

/// rollback <target>
int CmdRollback(const CommandContext& ctx, const std::vector<std::string>& args);

/// validate <container>
int CmdValidate(const CommandContext& ctx, const std::vector<std::string>& args);

/**
 * @brief Parse global options and dispatch to a subcommand
 * @return Process exit code
 */
int RunMigrateCli(int argc, char* argv[], std::ostream& out, std::ostream& err);

/**
 * @brief Apply logging settings (level, pattern, file sink, structured format)
 */
void ConfigureLogging(const config::LoggingConfig& logging, bool verbose);

}  // namespace rvfstore::cli
