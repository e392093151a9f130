#include "release/package_archive_reader.hpp"

#include "io/file_reader.hpp"
#include "io/file_util.hpp"
#include "io/file_writer.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <vector>

namespace relup {

PackageArchiveReader::~PackageArchiveReader() {
    if (ar_) {
        archive_read_free(ar_);
        ar_ = nullptr;
    }
}

Result PackageArchiveReader::Open(IReader& src) {
    if (opened_) return Result::Fail(-1, "package already opened");

    ar_ = archive_read_new();
    if (!ar_) return Result::Fail(-1, "archive_read_new failed");

    archive_read_support_filter_all(ar_);
    archive_read_support_format_tar(ar_);

    source_ = std::make_unique<ArchiveReadSource>(src);
    if (source_->OpenOn(ar_) != ARCHIVE_OK) {
        const std::string em = ArchiveErr(ar_);
        archive_read_free(ar_);
        ar_ = nullptr;
        return Result::Fail(ErrorKind::InvalidManifest, "cannot open package: " + em);
    }

    opened_ = true;
    return Result::Ok();
}

Result PackageArchiveReader::Next(PackageEntryInfo& out, bool& eof) {
    eof = false;
    if (!opened_ || !ar_) return Result::Fail(-1, "package not opened");

    if (in_entry_) {
        return Result::Fail(-1, "previous entry not finished (read to EOF or call SkipCurrent)");
    }

    while (true) {
        const int r = archive_read_next_header(ar_, &cur_entry_);
        if (r == ARCHIVE_EOF) {
            eof = true;
            return Result::Ok();
        }
        if (r != ARCHIVE_OK) {
            return Result::Fail(ErrorKind::InvalidManifest, "archive_read_next_header: " + ArchiveErr(ar_));
        }

        if (archive_entry_filetype(cur_entry_) != AE_IFREG) {
            if (archive_read_data_skip(ar_) != ARCHIVE_OK) {
                return Result::Fail(-1, "archive_read_data_skip: " + ArchiveErr(ar_));
            }
            continue;
        }

        const char* name = archive_entry_pathname(cur_entry_);
        out.name = NormalizeTarPath(name ? std::string(name) : std::string());
        out.size = static_cast<std::uint64_t>(archive_entry_size(cur_entry_));
        out.perm = archive_entry_perm(cur_entry_);

        in_entry_ = true;
        return Result::Ok();
    }
}

Result PackageArchiveReader::SkipCurrent() {
    if (!in_entry_) return Result::Ok();
    if (archive_read_data_skip(ar_) != ARCHIVE_OK) {
        return Result::Fail(-1, "archive_read_data_skip: " + ArchiveErr(ar_));
    }
    in_entry_ = false;
    return Result::Ok();
}

Result PackageArchiveReader::ReadCurrentToString(std::string& out) {
    if (!in_entry_) return Result::Fail(-1, "no current entry");
    out.clear();

    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const la_ssize_t n = archive_read_data(ar_, buf.data(), buf.size());
        if (n == 0) break;
        if (n < 0) return Result::Fail(-1, "archive_read_data: " + ArchiveErr(ar_));
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }

    in_entry_ = false;
    return Result::Ok();
}

Result PackageArchiveReader::OpenCurrentEntryReader(std::unique_ptr<IReader>& out_reader) {
    if (!in_entry_) return Result::Fail(-1, "no current entry");
    out_reader = std::make_unique<EntryReader>(this);
    return Result::Ok();
}

ssize_t PackageArchiveReader::EntryReader::Read(std::span<std::uint8_t> out) {
    if (!parent_ || !parent_->in_entry_) return -1;
    const la_ssize_t n = archive_read_data(parent_->ar_, out.data(), out.size());
    if (n < 0) return -1;
    if (n == 0) {
        parent_->in_entry_ = false;
        return 0;
    }
    return static_cast<ssize_t>(n);
}

std::optional<std::uint64_t> PackageArchiveReader::EntryReader::TotalSize() const {
    if (!parent_ || !parent_->cur_entry_) return std::nullopt;
    const la_int64_t sz = archive_entry_size(parent_->cur_entry_);
    if (sz < 0) return std::nullopt;
    return static_cast<std::uint64_t>(sz);
}

Result ExtractPackageEntry(const std::string& package_path,
                           const std::string& entry_name,
                           const std::string& dest_path,
                           mode_t mode) {
    FileReader file;
    if (auto r = FileReader::Open(package_path, file); !r.ok) return r;

    PackageArchiveReader pkg;
    if (auto r = pkg.Open(file); !r.ok) return r;

    const std::string wanted = NormalizeTarPath(entry_name);
    while (true) {
        PackageEntryInfo info;
        bool eof = false;
        if (auto r = pkg.Next(info, eof); !r.ok) return r;
        if (eof) break;

        if (info.name != wanted) {
            if (auto r = pkg.SkipCurrent(); !r.ok) return r;
            continue;
        }

        LogDebug("extracting %s (%llu bytes) -> %s",
                 info.name.c_str(), (unsigned long long)info.size, dest_path.c_str());

        std::unique_ptr<IReader> entry;
        if (auto r = pkg.OpenCurrentEntryReader(entry); !r.ok) return r;

        AtomicFileWriter out;
        if (auto r = AtomicFileWriter::Open(dest_path, out, mode); !r.ok) return r;
        if (auto r = PipeReaderToWriter(*entry, out); !r.ok) return r;
        return out.Commit();
    }

    return Result::Fail(ErrorKind::InvalidManifest, "package has no entry " + wanted + ": " + package_path);
}

} // namespace relup
