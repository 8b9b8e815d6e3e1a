/**
 * @file version.h
 * @brief rvfstore version information
 */

#pragma once

#include <string>

namespace rvfstore {

/**
 * @brief Version information
 */
class Version {
 public:
  /**
   * @brief Get version string
   * @return Version string (e.g., "1.0.0")
   */
  static std::string String() { return "1.0.0"; }

  /**
   * @brief Get major version
   */
  static int Major() { return 1; }

  /**
   * @brief Get minor version
   */
  static int Minor() { return 0; }

  /**
   * @brief Get patch version
   */
  static int Patch() { return 0; }
};

}  // namespace rvfstore
