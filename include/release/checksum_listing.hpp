#pragma once

#include "crypto/digest.hpp"
#include "util/result.hpp"

#include <expected>
#include <string>
#include <vector>

namespace relup {

struct ChecksumLine {
    std::string hex;
    std::string file_name;
};

// "<hex>  <name>\n" per line, the sha256sum/md5sum text format.
std::string FormatChecksumListing(const std::vector<ChecksumLine>& lines);

// Accepts the binary-mode marker ("<hex> *<name>") too. Blank lines and
// '#' comments are skipped.
std::expected<std::vector<ChecksumLine>, std::string> ParseChecksumListing(const std::string& text);

// Digest every file in dir whose name matches one of the suffixes and write
// the listing to dir/listing_name. Files are listed in name order.
Result WriteChecksumListing(const std::string& dir,
                            const std::string& listing_name,
                            DigestAlgorithm algo,
                            const std::vector<std::string>& suffixes,
                            std::vector<ChecksumLine>* out_lines = nullptr);

// Looks up file_name in a listing file. Ok with empty out_hex if the listing
// has no such line.
Result LookupChecksum(const std::string& listing_path, const std::string& file_name, std::string& out_hex);

} // namespace relup
