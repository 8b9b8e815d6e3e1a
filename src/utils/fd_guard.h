/**
 * @file fd_guard.h
 * @brief Scope-bound ownership of file descriptors and cleanup actions
 *
 * The container writer and the manifest writer use both guards around
 * "write temp file, fsync, rename": the descriptor is closed on every
 * early return and the temp file is unlinked unless the rename happened.
 */

#pragma once

#include <unistd.h>

#include <utility>

namespace rvfstore::utils {

/**
 * @brief Owns a file descriptor; closes it on destruction
 *
 * @code
 * FDGuard fd{::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644)};
 * if (fd.Get() < 0) { ... }
 * @endcode
 */
class FDGuard {
 public:
  explicit FDGuard(int file_descriptor = -1) : fd_(file_descriptor) {}
  ~FDGuard() { Reset(); }

  FDGuard(const FDGuard&) = delete;
  FDGuard& operator=(const FDGuard&) = delete;

  FDGuard(FDGuard&& other) noexcept : fd_(other.Release()) {}
  FDGuard& operator=(FDGuard&& other) noexcept {
    if (this != &other) {
      Reset(other.Release());
    }
    return *this;
  }

  /**
   * @brief Give up ownership without closing
   * @return The descriptor, or -1 if none was held
   */
  int Release() { return std::exchange(fd_, -1); }

  /// Close the held descriptor (if any) and take @p file_descriptor
  void Reset(int file_descriptor = -1) {
    if (fd_ >= 0) {
      ::close(fd_);
    }
    fd_ = file_descriptor;
  }

  [[nodiscard]] int Get() const { return fd_; }

 private:
  int fd_ = -1;
};

/**
 * @brief Runs @p CleanupFunc on scope exit unless released
 *
 * @code
 * ScopeGuard remove_temp([&temp_path]() { ::unlink(temp_path.c_str()); });
 * ... write, fsync, rename ...
 * remove_temp.Release();
 * @endcode
 */
template <typename CleanupFunc>
class ScopeGuard {
 public:
  explicit ScopeGuard(CleanupFunc cleanup) : cleanup_(std::move(cleanup)) {}
  ~ScopeGuard() {
    if (active_) {
      cleanup_();
    }
  }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard(ScopeGuard&& other) noexcept
      : cleanup_(std::move(other.cleanup_)), active_(std::exchange(other.active_, false)) {}
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  void Release() { active_ = false; }

 private:
  CleanupFunc cleanup_;
  bool active_ = true;
};

}  // namespace rvfstore::utils
