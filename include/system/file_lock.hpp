#pragma once

#include "io/fd.hpp"
#include "util/result.hpp"

#include <string>

namespace relup {

// Advisory flock(2) on a lock file. The lock is released when the object is
// destroyed or Release() is called. Two FileLock objects on the same path
// exclude each other even inside one process.
class FileLock {
  public:
    FileLock() = default;
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    FileLock(FileLock&& other) noexcept = default;
    FileLock& operator=(FileLock&& other) noexcept = default;
    ~FileLock();

    // Fails with ErrorKind::LockContention instead of waiting.
    static Result TryAcquire(const std::string& path, FileLock& out);
    // Waits until the lock is free.
    static Result Acquire(const std::string& path, FileLock& out);

    bool Held() const { return fd_.Valid(); }
    const std::string& Path() const { return path_; }
    void Release();

  private:
    static Result Lock(const std::string& path, bool blocking, FileLock& out);

    Fd fd_;
    std::string path_;
};

} // namespace relup
