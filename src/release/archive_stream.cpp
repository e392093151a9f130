#include "release/archive_stream.hpp"

#include "system/signals.hpp"

#include <cerrno>

namespace relup {

la_ssize_t ArchiveReadSource::ReadCb(struct archive*, void* client_data, const void** out_buf) {
    if (CancelRequested()) {
        errno = EINTR;
        return -1;
    }

    auto* self = static_cast<ArchiveReadSource*>(client_data);
    const ssize_t n = self->reader_->Read(std::span<std::uint8_t>(self->buffer_.data(), self->buffer_.size()));
    if (n < 0) return -1;

    *out_buf = self->buffer_.data();
    return static_cast<la_ssize_t>(n); // 0 => EOF
}

int ArchiveReadSource::OpenOn(struct archive* ar) {
    return archive_read_open2(ar, this, /*open*/ nullptr, ReadCb, /*skip*/ nullptr, /*close*/ nullptr);
}

std::string ArchiveErr(struct archive* ar) {
    const char* s = ar ? archive_error_string(ar) : nullptr;
    return s ? std::string(s) : std::string("unknown");
}

} // namespace relup
