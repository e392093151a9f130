#include "io/file_util.hpp"

#include "io/file_reader.hpp"
#include "io/file_writer.hpp"

#include <cerrno>
#include <unistd.h>

namespace relup {

Result ReadFileToString(const std::string& path, std::string& out) {
    std::vector<std::uint8_t> bytes;
    auto r = ReadFileBytes(path, bytes);
    if (!r.is_ok()) return r;
    out.assign(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    return Result::Ok();
}

Result ReadFileBytes(const std::string& path, std::vector<std::uint8_t>& out) {
    FileReader reader;
    auto r = FileReader::Open(path, reader);
    if (!r.is_ok()) return r;

    out.clear();
    if (auto sz = reader.TotalSize()) out.reserve(static_cast<size_t>(*sz));

    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return Result::Fail(errno, "read failed: " + path);
        out.insert(out.end(), buf.begin(), buf.begin() + n);
    }
    return Result::Ok();
}

Result WriteFileAtomic(const std::string& path, const std::string& content, mode_t mode) {
    AtomicFileWriter writer;
    auto r = AtomicFileWriter::Open(path, writer, mode);
    if (!r.is_ok()) return r;
    r = writer.WriteAll(std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(content.data()), content.size()));
    if (!r.is_ok()) return r;
    return writer.Commit();
}

Result PipeReaderToWriter(IReader& r, IWriter& w) {
    std::vector<std::uint8_t> buffer(256 * 1024);
    while (true) {
        const ssize_t n = r.Read(std::span<std::uint8_t>(buffer.data(), buffer.size()));
        if (n == 0) break;
        if (n < 0) return Result::Fail(errno, "Read failed during pipe");

        auto res = w.WriteAll({buffer.data(), static_cast<size_t>(n)});
        if (!res.is_ok()) return res;
    }
    return Result::Ok();
}

Result CopyFileContents(const std::string& src, const std::string& dst, bool exclusive, mode_t mode) {
    FileReader reader;
    auto r = FileReader::Open(src, reader);
    if (!r.is_ok()) return r;

    if (exclusive) {
        FileWriter writer;
        r = FileWriter::Open(dst, writer, /*exclusive=*/true, mode);
        if (!r.is_ok()) return r;
        r = PipeReaderToWriter(reader, writer);
        if (r.is_ok()) r = writer.FsyncNow();
        if (!r.is_ok()) {
            writer.Close();
            ::unlink(dst.c_str());
        }
        return r;
    }

    AtomicFileWriter writer;
    r = AtomicFileWriter::Open(dst, writer, mode);
    if (!r.is_ok()) return r;
    r = PipeReaderToWriter(reader, writer);
    if (!r.is_ok()) return r;
    return writer.Commit();
}

} // namespace relup
