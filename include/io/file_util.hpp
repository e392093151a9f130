#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <string>
#include <sys/types.h>
#include <vector>

namespace relup {

Result ReadFileToString(const std::string& path, std::string& out);
Result ReadFileBytes(const std::string& path, std::vector<std::uint8_t>& out);

// Replace path with content in one rename.
Result WriteFileAtomic(const std::string& path, const std::string& content, mode_t mode = 0644);

Result PipeReaderToWriter(IReader& r, IWriter& w);

// Copy src to dst. With exclusive set an existing dst is an error and is left
// untouched; otherwise dst is replaced atomically.
Result CopyFileContents(const std::string& src, const std::string& dst, bool exclusive, mode_t mode);

} // namespace relup
