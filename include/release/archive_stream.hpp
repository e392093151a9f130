#pragma once

#include "io/io.hpp"

#include <archive.h>

#include <cstdint>
#include <string>
#include <vector>

namespace relup {

// Feeds an IReader into archive_read_open2. Owned by the caller; it must
// outlive the archive handle it was opened on.
class ArchiveReadSource {
  public:
    explicit ArchiveReadSource(IReader& reader, size_t buffer_size = 64 * 1024)
        : reader_(&reader), buffer_(buffer_size) {}

    ArchiveReadSource(const ArchiveReadSource&) = delete;
    ArchiveReadSource& operator=(const ArchiveReadSource&) = delete;

    int OpenOn(struct archive* ar);

  private:
    static la_ssize_t ReadCb(struct archive*, void* client_data, const void** out_buf);

    IReader* reader_ = nullptr;
    std::vector<std::uint8_t> buffer_;
};

std::string ArchiveErr(struct archive* ar);

} // namespace relup
