/**
 * @file file_lock.h
 * @brief Advisory single-writer lock held next to a container file
 */

#pragma once

#include <string>

#include "utils/error.h"
#include "utils/expected.h"
#include "utils/fd_guard.h"

namespace rvfstore::utils {

/**
 * @brief Exclusive advisory lock on "<path>.lock"
 *
 * Acquired with flock(LOCK_EX | LOCK_NB). A second writer, in this process
 * or another, gets ErrorCode::kLockHeld. The lock is released when the
 * object is destroyed or Release() is called. The lock file itself is left
 * in place; its presence alone means nothing.
 */
class FileLock {
 public:
  FileLock() = default;
  ~FileLock();

  FileLock(const FileLock&) = delete;
  FileLock& operator=(const FileLock&) = delete;
  FileLock(FileLock&& other) noexcept;
  FileLock& operator=(FileLock&& other) noexcept;

  /**
   * @brief Try to take the write lock for a data file
   * @param data_path Path of the protected file (".lock" is appended)
   */
  static Expected<FileLock, Error> Acquire(const std::string& data_path);

  /**
   * @brief Lock file path used for a data file
   */
  static std::string LockPathFor(const std::string& data_path) { return data_path + ".lock"; }

  [[nodiscard]] bool IsHeld() const { return fd_.Get() >= 0; }
  [[nodiscard]] const std::string& path() const { return lock_path_; }

  void Release();

 private:
  FileLock(FDGuard fd, std::string lock_path) : fd_(std::move(fd)), lock_path_(std::move(lock_path)) {}

  FDGuard fd_;
  std::string lock_path_;
};

}  // namespace rvfstore::utils
