#include "io/file_writer.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

namespace relup {

namespace {

Result WriteAllToFd(int fd, std::span<const std::uint8_t> in) {
    size_t rem = in.size();
    const std::uint8_t* p = in.data();

    while (rem > 0) {
        ssize_t n = ::write(fd, p, rem);
        if (n > 0) {
            p += static_cast<size_t>(n);
            rem -= static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR) {
            continue;
        }
        return Result::Fail(errno, "Write failed (" + std::string(std::strerror(errno)) + ")");
    }
    return Result::Ok();
}

void FsyncParentDir(const std::string& path) {
    const std::string parent = std::filesystem::path(path).parent_path().string();
    const int dfd = ::open(parent.empty() ? "." : parent.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd < 0) return;
    (void)::fsync(dfd);
    ::close(dfd);
}

} // namespace

Result FileWriter::Open(std::string path, FileWriter& out, bool exclusive, mode_t mode) {
    out.path_ = std::move(path);

    int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
    flags |= exclusive ? O_EXCL : O_TRUNC;
    int fd = ::open(out.path_.c_str(), flags, mode);
    if (fd < 0) {
        return Result::Fail(
            errno, "Failed to open output: " + out.path_ + " (" + std::strerror(errno) + ")");
    }
    out.fd_.Reset(fd);
    return Result::Ok();
}

Result FileWriter::WriteAll(std::span<const std::uint8_t> in) {
    return WriteAllToFd(fd_.Get(), in);
}

Result FileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        return Result::Fail(errno, "fsync failed (" + std::string(std::strerror(errno)) + ")");
    }
    return Result::Ok();
}

Result AtomicFileWriter::Open(std::string dest_path, AtomicFileWriter& out, mode_t mode) {
    out.Abandon();
    out.dest_path_ = std::move(dest_path);
    out.mode_ = mode;

    std::string tmpl = out.dest_path_ + ".tmp-XXXXXX";
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    const int fd = ::mkostemp(buf.data(), O_CLOEXEC);
    if (fd < 0) {
        return Result::Fail(errno,
                            "mkstemp failed for " + out.dest_path_ + " (" + std::strerror(errno) + ")");
    }
    out.fd_.Reset(fd);
    out.tmp_path_ = buf.data();
    return Result::Ok();
}

AtomicFileWriter::AtomicFileWriter(AtomicFileWriter&& other) noexcept { *this = std::move(other); }

AtomicFileWriter& AtomicFileWriter::operator=(AtomicFileWriter&& other) noexcept {
    if (this != &other) {
        Abandon();
        dest_path_ = std::move(other.dest_path_);
        tmp_path_ = std::move(other.tmp_path_);
        mode_ = other.mode_;
        fd_ = std::move(other.fd_);
        other.tmp_path_.clear();
    }
    return *this;
}

AtomicFileWriter::~AtomicFileWriter() { Abandon(); }

Result AtomicFileWriter::WriteAll(std::span<const std::uint8_t> in) {
    if (!fd_.Valid()) return Result::Fail(EBADF, "atomic writer not open");
    return WriteAllToFd(fd_.Get(), in);
}

Result AtomicFileWriter::FsyncNow() {
    if (::fsync(fd_.Get()) == -1) {
        return Result::Fail(errno, "fsync failed (" + std::string(std::strerror(errno)) + ")");
    }
    return Result::Ok();
}

Result AtomicFileWriter::Commit() {
    if (!fd_.Valid() || tmp_path_.empty()) return Result::Fail(EBADF, "atomic writer not open");

    if (::fchmod(fd_.Get(), mode_) != 0) {
        const int err = errno;
        Abandon();
        return Result::Fail(err, "chmod failed: " + std::string(std::strerror(err)));
    }
    auto fr = FsyncNow();
    if (!fr.is_ok()) {
        Abandon();
        return fr;
    }
    fd_.Close();

    if (::rename(tmp_path_.c_str(), dest_path_.c_str()) != 0) {
        const int err = errno;
        Abandon();
        return Result::Fail(err, "Atomic rename failed: " + std::string(std::strerror(err)));
    }
    tmp_path_.clear();
    FsyncParentDir(dest_path_);
    return Result::Ok();
}

void AtomicFileWriter::Abandon() {
    fd_.Close();
    if (!tmp_path_.empty()) {
        ::unlink(tmp_path_.c_str());
        tmp_path_.clear();
    }
}

} // namespace relup
