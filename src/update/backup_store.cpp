#include "update/backup_store.hpp"

#include "io/file_util.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <filesystem>

namespace fs = std::filesystem;

namespace relup {

namespace {

constexpr const char* kSuffix = ".bak";
constexpr int kMaxNameAttempts = 16;

std::string SanitizeTag(const std::string& tag) {
    std::string out;
    for (unsigned char c : tag) {
        const bool keep = std::isalnum(c) || c == '.' || c == '-' || c == '+';
        out.push_back(keep ? static_cast<char>(c) : '-');
    }
    return out.empty() ? "unknown" : out;
}

bool ParseRecordName(const std::string& name, const std::string& dir, BackupRecord& out) {
    const std::string sfx = kSuffix;
    if (name.size() <= sfx.size() || name.compare(name.size() - sfx.size(), sfx.size(), sfx) != 0) return false;
    const std::string base = name.substr(0, name.size() - sfx.size());
    const auto sep = base.find('_');
    if (sep == std::string::npos) return false;

    BackupRecord rec;
    if (!ParseCompactUtc(base.substr(0, sep), rec.captured_at)) return false;
    rec.version_tag = base.substr(sep + 1);
    rec.path = dir + "/" + name;
    out = std::move(rec);
    return true;
}

} // namespace

BackupStore::BackupStore(std::string dir) : dir_(std::move(dir)) {}

Result BackupStore::Backup(const std::string& binary_path, const std::string& version_tag, BackupRecord& out,
                           Clock::time_point now) const {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) return Result::Fail(ec.value(), "cannot create backup dir " + dir_ + ": " + ec.message());

    const std::string tag = SanitizeTag(version_tag);

    // Two captures inside one clock tick get distinct names.
    for (int attempt = 0; attempt < kMaxNameAttempts; ++attempt) {
        const Clock::time_point ts = now + std::chrono::microseconds(attempt);
        const std::string path = dir_ + "/" + FormatCompactUtc(ts) + "_" + tag + kSuffix;

        auto r = CopyFileContents(binary_path, path, /*exclusive=*/true, 0755);
        if (!r.ok && r.err == EEXIST) continue;
        if (!r.ok) return r;

        out.captured_at = std::chrono::time_point_cast<Clock::duration>(ts);
        out.version_tag = tag;
        out.path = path;
        LogInfo("Backup created: %s", path.c_str());
        return Result::Ok();
    }
    return Result::Fail(EEXIST, "cannot find a free backup name in " + dir_);
}

Result BackupStore::List(std::vector<BackupRecord>& out) const {
    out.clear();
    std::error_code ec;
    if (!fs::exists(dir_, ec)) return Result::Ok();

    for (fs::directory_iterator it(dir_, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        BackupRecord rec;
        if (ParseRecordName(it->path().filename().string(), dir_, rec)) out.push_back(std::move(rec));
    }
    if (ec) return Result::Fail(ec.value(), "cannot list " + dir_ + ": " + ec.message());

    std::sort(out.begin(), out.end(), [](const BackupRecord& a, const BackupRecord& b) {
        if (a.captured_at != b.captured_at) return a.captured_at > b.captured_at;
        return a.path > b.path;
    });
    return Result::Ok();
}

Result BackupStore::Latest(BackupRecord& out) const {
    std::vector<BackupRecord> all;
    if (auto r = List(all); !r.ok) return r;
    if (all.empty()) return Result::Fail(ErrorKind::NoBackupAvailable, "no backups in " + dir_);
    out = std::move(all.front());
    return Result::Ok();
}

Result BackupStore::Restore(const BackupRecord& record, const std::string& target_path) const {
    LogInfo("Restoring %s (version %s) to %s", record.path.c_str(), record.version_tag.c_str(),
            target_path.c_str());
    return CopyFileContents(record.path, target_path, /*exclusive=*/false, 0755);
}

Result BackupStore::Prune(std::size_t keep, const std::string& protect_path, std::size_t& removed) const {
    removed = 0;
    if (keep == 0) return Result::Ok();

    std::vector<BackupRecord> all;
    if (auto r = List(all); !r.ok) return r;

    for (std::size_t i = keep; i < all.size(); ++i) {
        if (all[i].path == protect_path) continue;
        std::error_code ec;
        if (!fs::remove(all[i].path, ec) && ec) {
            return Result::Fail(ec.value(), "cannot remove " + all[i].path + ": " + ec.message());
        }
        LogDebug("Pruned backup %s", all[i].path.c_str());
        ++removed;
    }
    return Result::Ok();
}

} // namespace relup
