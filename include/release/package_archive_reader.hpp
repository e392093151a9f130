#pragma once

#include "io/io.hpp"
#include "release/archive_stream.hpp"
#include "util/result.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace relup {

struct PackageEntryInfo {
    // Normalized relative path ("bin/app").
    std::string name;
    std::uint64_t size = 0;
    mode_t perm = 0;
};

// Sequential reader over a (optionally compressed) tar package.
class PackageArchiveReader {
public:
    PackageArchiveReader() = default;
    ~PackageArchiveReader();

    PackageArchiveReader(const PackageArchiveReader&) = delete;
    PackageArchiveReader& operator=(const PackageArchiveReader&) = delete;

    // src must outlive this reader.
    Result Open(IReader& src);

    // Move to next regular file entry.
    // Returns Ok + eof=true when end-of-archive.
    Result Next(PackageEntryInfo& out, bool& eof);

    Result ReadCurrentToString(std::string& out);

    // Streams the current entry. libarchive is sequential: read it to EOF
    // before calling Next().
    Result OpenCurrentEntryReader(std::unique_ptr<IReader>& out_reader);

    Result SkipCurrent();

private:
    bool opened_ = false;
    struct archive* ar_ = nullptr;
    struct archive_entry* cur_entry_ = nullptr;
    bool in_entry_ = false;
    std::unique_ptr<ArchiveReadSource> source_;

    class EntryReader final : public IReader {
    public:
        explicit EntryReader(PackageArchiveReader* parent) : parent_(parent) {}
        ssize_t Read(std::span<std::uint8_t> out) override;
        std::optional<std::uint64_t> TotalSize() const override;

    private:
        PackageArchiveReader* parent_ = nullptr;
    };
};

// Copies the regular file named entry_name out of the package at
// package_path into dest_path (replacing it atomically, mode applied).
// ErrorKind::InvalidManifest when the entry is absent.
Result ExtractPackageEntry(const std::string& package_path,
                           const std::string& entry_name,
                           const std::string& dest_path,
                           mode_t mode);

} // namespace relup
