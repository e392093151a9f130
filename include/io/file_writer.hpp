#pragma once

#include "io/fd.hpp"
#include "io/io.hpp"
#include "util/result.hpp"

#include <span>
#include <string>
#include <sys/types.h>

namespace relup {

class FileWriter final : public IWriter {
  public:
    // O_CREAT|O_TRUNC, or O_CREAT|O_EXCL when exclusive is set.
    static Result Open(std::string path, FileWriter& out, bool exclusive = false, mode_t mode = 0644);

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;

    int GetFd() const { return fd_.Get(); }
    void Close() { fd_.Close(); }

  private:
    std::string path_;
    Fd fd_;
};

// Writes into a sibling temp file and renames it over the destination on
// Commit(). An uncommitted writer unlinks its temp file on destruction, so the
// destination is either the old content or the complete new content.
class AtomicFileWriter final : public IWriter {
  public:
    static Result Open(std::string dest_path, AtomicFileWriter& out, mode_t mode = 0644);

    AtomicFileWriter() = default;
    AtomicFileWriter(const AtomicFileWriter&) = delete;
    AtomicFileWriter& operator=(const AtomicFileWriter&) = delete;
    AtomicFileWriter(AtomicFileWriter&& other) noexcept;
    AtomicFileWriter& operator=(AtomicFileWriter&& other) noexcept;
    ~AtomicFileWriter() override;

    Result WriteAll(std::span<const std::uint8_t> in) override;
    Result FsyncNow() override;

    Result Commit();
    void Abandon();

    const std::string& TempPath() const { return tmp_path_; }
    int GetFd() const { return fd_.Get(); }

  private:
    std::string dest_path_;
    std::string tmp_path_;
    mode_t mode_ = 0644;
    Fd fd_;
};

} // namespace relup
