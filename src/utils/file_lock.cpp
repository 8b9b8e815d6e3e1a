/**
 * @file file_lock.cpp
 * @brief Advisory lock implementation (flock)
 */

#include "utils/file_lock.h"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "utils/structured_log.h"

namespace rvfstore::utils {

FileLock::~FileLock() {
  Release();
}

FileLock::FileLock(FileLock&& other) noexcept : fd_(std::move(other.fd_)), lock_path_(std::move(other.lock_path_)) {}

FileLock& FileLock::operator=(FileLock&& other) noexcept {
  if (this != &other) {
    Release();
    fd_ = std::move(other.fd_);
    lock_path_ = std::move(other.lock_path_);
  }
  return *this;
}

Expected<FileLock, Error> FileLock::Acquire(const std::string& data_path) {
  std::string lock_path = LockPathFor(data_path);

  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
  FDGuard guard{::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644)};
  if (guard.Get() < 0) {
    return MakeUnexpected(
        MakeError(ErrorCode::kIOError, "Failed to open lock file: " + std::string(std::strerror(errno)), lock_path));
  }

  if (::flock(guard.Get(), LOCK_EX | LOCK_NB) != 0) {
    if (errno == EWOULDBLOCK) {
      StructuredLog()
          .Event("lock_conflict")
          .Field("path", data_path)
          .Message("another writer holds the container")
          .Warn();
      return MakeUnexpected(MakeError(ErrorCode::kLockHeld, "Container is locked by another writer", data_path));
    }
    return MakeUnexpected(
        MakeError(ErrorCode::kIOError, "flock failed: " + std::string(std::strerror(errno)), lock_path));
  }

  return FileLock(std::move(guard), std::move(lock_path));
}

void FileLock::Release() {
  if (fd_.Get() >= 0) {
    ::flock(fd_.Get(), LOCK_UN);
    fd_.Reset();
  }
}

}  // namespace rvfstore::utils
