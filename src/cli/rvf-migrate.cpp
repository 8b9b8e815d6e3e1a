/**
 * @file rvf-migrate.cpp
 * @brief Entry point for the rvf-migrate tool
 */

#include <iostream>

#include "cli/migrate_commands.h"

int main(int argc, char* argv[]) { return rvfstore::cli::RunMigrateCli(argc, argv, std::cout, std::cerr); }
