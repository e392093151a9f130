#include "manifest/manifest_publisher.hpp"

#include "io/file_util.hpp"
#include "manifest/manifest_codec.hpp"
#include "release/semantic_version.hpp"
#include "system/file_lock.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace relup {

ManifestPublisher::ManifestPublisher(std::string root_dir) : root_dir_(std::move(root_dir)) {}

std::string ManifestPublisher::ManifestPath(const std::string& channel) const {
    return (fs::path(root_dir_) / channel / "manifest.json").string();
}

Result ManifestPublisher::Load(const std::string& channel, Manifest& out) const {
    const std::string path = ManifestPath(channel);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        out = Manifest{};
        out.channel = channel;
        return Result::Ok();
    }

    std::string text;
    auto r = ReadFileToString(path, text);
    if (!r.is_ok()) return r;

    auto parsed = ManifestCodec::Parse(text);
    if (!parsed) {
        return Result::Fail(ErrorKind::InvalidManifest, "Manifest parse error in " + path + ": " + parsed.error());
    }
    if (!parsed->channel.empty() && parsed->channel != channel) {
        return Result::Fail(ErrorKind::InvalidManifest,
                            path + " belongs to channel '" + parsed->channel + "', not '" + channel + "'");
    }
    out = std::move(*parsed);
    out.channel = channel;
    return Result::Ok();
}

Result ManifestPublisher::Publish(const std::string& channel, const ManifestEntry& entry, Manifest& out,
                                  Clock::time_point now) const {
    const auto normalized = NormalizeChannel(channel);
    if (!normalized) return Result::Fail(ErrorKind::Config, "unknown channel: " + channel);
    if (entry.version.empty()) return Result::Fail(ErrorKind::InvalidManifest, "entry has no version");
    if (auto v = SemanticVersion::Parse(entry.version); !v) {
        return Result::Fail(ErrorKind::InvalidManifest, "entry version '" + entry.version + "': " + v.error());
    }

    const fs::path dir = fs::path(root_dir_) / *normalized;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) return Result::Fail(ErrorKind::Io, "cannot create " + dir.string() + ": " + ec.message());

    FileLock lock;
    auto lr = FileLock::Acquire((dir / ".manifest.lock").string(), lock);
    if (!lr.is_ok()) return lr;

    Manifest m;
    auto r = Load(*normalized, m);
    if (!r.is_ok()) return r;

    auto same = std::find_if(m.releases.begin(), m.releases.end(), [&](const ManifestEntry& e) {
        return CompareVersions(e.version, entry.version) == 0;
    });
    if (same != m.releases.end()) {
        LogInfo("Replacing %s entry for %s", normalized->c_str(), entry.version.c_str());
        *same = entry;
    } else {
        m.releases.push_back(entry);
    }

    std::stable_sort(m.releases.begin(), m.releases.end(), [](const ManifestEntry& a, const ManifestEntry& b) {
        return CompareVersions(a.version, b.version) > 0;
    });

    m.channel = *normalized;
    m.latest_version = m.releases.front().version;
    m.current_version = entry.version;
    m.last_check = FormatIso8601Utc(now);

    r = WriteFileAtomic(ManifestPath(*normalized), ManifestCodec::Serialize(m));
    if (!r.is_ok()) return r;

    LogInfo("Published %s to %s (latest=%s, releases=%zu)",
            entry.version.c_str(), normalized->c_str(), m.latest_version.c_str(), m.releases.size());
    out = std::move(m);
    return Result::Ok();
}

} // namespace relup
