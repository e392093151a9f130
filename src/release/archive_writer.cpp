#include "release/archive_writer.hpp"

#include "io/file_reader.hpp"
#include "io/file_writer.hpp"
#include "release/archive_stream.hpp"
#include "util/logger.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <memory>
#include <sys/stat.h>
#include <vector>

namespace fs = std::filesystem;

namespace relup {

namespace {

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

struct ArchiveEntryDeleter {
    void operator()(archive_entry* e) const {
        if (e) archive_entry_free(e);
    }
};

Result AddFile(archive* aw, const fs::path& abs, const std::string& rel, const struct stat& st) {
    std::unique_ptr<archive_entry, ArchiveEntryDeleter> entry(archive_entry_new());
    if (!entry) return Result::Fail(-1, "archive_entry_new failed");

    archive_entry_set_pathname(entry.get(), rel.c_str());
    archive_entry_set_perm(entry.get(), st.st_mode & 07777);
    archive_entry_set_mtime(entry.get(), st.st_mtime, 0);

    if (S_ISDIR(st.st_mode)) {
        archive_entry_set_filetype(entry.get(), AE_IFDIR);
        archive_entry_set_size(entry.get(), 0);
        if (archive_write_header(aw, entry.get()) != ARCHIVE_OK) {
            return Result::Fail(-1, "archive_write_header: " + ArchiveErr(aw));
        }
        return Result::Ok();
    }

    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(st.st_size));
    if (archive_write_header(aw, entry.get()) != ARCHIVE_OK) {
        return Result::Fail(-1, "archive_write_header: " + ArchiveErr(aw));
    }

    FileReader reader;
    auto r = FileReader::Open(abs.string(), reader);
    if (!r.is_ok()) return r;

    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return Result::Fail(-1, "read failed: " + abs.string());
        if (archive_write_data(aw, buf.data(), static_cast<size_t>(n)) < 0) {
            return Result::Fail(-1, "archive_write_data: " + ArchiveErr(aw));
        }
    }
    return Result::Ok();
}

} // namespace

Result WriteTarGz(const std::string& src_dir, const std::string& out_path) {
    std::error_code ec;
    if (!fs::is_directory(src_dir, ec)) {
        return Result::Fail(-1, "Source directory does not exist: " + src_dir);
    }

    std::vector<fs::path> members;
    for (fs::recursive_directory_iterator it(src_dir, ec), end; !ec && it != end; it.increment(ec)) {
        members.push_back(it->path());
    }
    if (ec) return Result::Fail(-1, "cannot walk " + src_dir + ": " + ec.message());
    std::sort(members.begin(), members.end());

    AtomicFileWriter out;
    auto r = AtomicFileWriter::Open(out_path, out, 0644);
    if (!r.is_ok()) return r;

    std::unique_ptr<archive, ArchiveWriteDeleter> aw(archive_write_new());
    if (!aw) return Result::Fail(-1, "archive_write_new failed");
    if (archive_write_add_filter_gzip(aw.get()) != ARCHIVE_OK ||
        archive_write_set_format_pax_restricted(aw.get()) != ARCHIVE_OK) {
        return Result::Fail(-1, "archive format setup: " + ArchiveErr(aw.get()));
    }
    if (archive_write_open_fd(aw.get(), out.GetFd()) != ARCHIVE_OK) {
        return Result::Fail(-1, "archive_write_open_fd: " + ArchiveErr(aw.get()));
    }

    for (const auto& abs : members) {
        struct stat st{};
        if (::lstat(abs.c_str(), &st) != 0) return Result::Fail(errno, "stat failed: " + abs.string());
        if (!S_ISREG(st.st_mode) && !S_ISDIR(st.st_mode)) {
            LogWarn("skip non-regular file: %s", abs.string().c_str());
            continue;
        }
        const std::string rel = fs::relative(abs, src_dir).generic_string();
        LogDebug("archive add: %s", rel.c_str());
        r = AddFile(aw.get(), abs, rel, st);
        if (!r.is_ok()) return r;
    }

    if (archive_write_close(aw.get()) != ARCHIVE_OK) {
        return Result::Fail(-1, "archive_write_close: " + ArchiveErr(aw.get()));
    }
    aw.reset();

    return out.Commit();
}

} // namespace relup
