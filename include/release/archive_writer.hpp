#pragma once

#include "util/result.hpp"

#include <string>

namespace relup {

// Writes every regular file and directory below src_dir into a gzip
// compressed pax tar at out_path. Entry names are relative to src_dir and
// emitted in sorted order so equal trees produce equal member lists.
Result WriteTarGz(const std::string& src_dir, const std::string& out_path);

} // namespace relup
