#include "system/file_lock.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

namespace relup {

FileLock::~FileLock() { Release(); }

Result FileLock::TryAcquire(const std::string& path, FileLock& out) {
    return Lock(path, /*blocking=*/false, out);
}

Result FileLock::Acquire(const std::string& path, FileLock& out) {
    return Lock(path, /*blocking=*/true, out);
}

Result FileLock::Lock(const std::string& path, bool blocking, FileLock& out) {
    out.Release();

    const int fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
    if (fd < 0) {
        return Result::Fail(errno, "cannot open lock file " + path + ": " + std::strerror(errno));
    }
    Fd holder(fd);

    const int op = blocking ? LOCK_EX : (LOCK_EX | LOCK_NB);
    while (::flock(holder.Get(), op) != 0) {
        if (errno == EINTR) continue;
        if (errno == EWOULDBLOCK) {
            return Result::Fail(ErrorKind::LockContention, "lock held by another process: " + path);
        }
        return Result::Fail(errno, "flock failed on " + path + ": " + std::strerror(errno));
    }

    out.fd_ = std::move(holder);
    out.path_ = path;
    return Result::Ok();
}

void FileLock::Release() {
    if (fd_.Valid()) {
        (void)::flock(fd_.Get(), LOCK_UN);
        fd_.Close();
    }
    path_.clear();
}

} // namespace relup
