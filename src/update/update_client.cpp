#include "update/update_client.hpp"

#include "io/fd.hpp"
#include "io/file_reader.hpp"
#include "io/file_util.hpp"
#include "manifest/manifest_codec.hpp"
#include "release/package_archive_reader.hpp"
#include "release/semantic_version.hpp"
#include "system/file_lock.hpp"
#include "system/signals.hpp"
#include "update/signature_verifier.hpp"
#include "update/version_probe.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"
#include "util/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace relup {

namespace {

using std::chrono::milliseconds;

// Sniffs compressed or plain tar; anything else is taken as a bare binary.
bool LooksLikeArchive(const std::string& path) {
    FileReader reader;
    if (!FileReader::Open(path, reader).ok) return false;

    std::array<std::uint8_t, 512> head{};
    std::size_t got = 0;
    while (got < head.size()) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(head.data() + got, head.size() - got));
        if (n <= 0) break;
        got += static_cast<std::size_t>(n);
    }

    auto starts_with = [&](std::initializer_list<std::uint8_t> magic) {
        return got >= magic.size() && std::equal(magic.begin(), magic.end(), head.begin());
    };
    if (starts_with({0x1f, 0x8b})) return true;                          // gzip
    if (starts_with({0xfd, '7', 'z', 'X', 'Z', 0x00})) return true;      // xz
    if (starts_with({'B', 'Z', 'h'})) return true;                       // bzip2
    if (starts_with({0x28, 0xb5, 0x2f, 0xfd})) return true;              // zstd
    return got >= 262 && std::memcmp(head.data() + 257, "ustar", 5) == 0;
}

milliseconds Remaining(std::chrono::steady_clock::time_point deadline) {
    return std::chrono::duration_cast<milliseconds>(deadline - std::chrono::steady_clock::now());
}

// A stage that runs out of time fails the way that stage fails.
Result AsStageFailure(Result r, ErrorKind stage) {
    if (!r.ok && r.kind == ErrorKind::Timeout) return r.As(stage);
    return r;
}

void RemoveQuietly(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) LogWarn("cannot remove %s: %s", path.c_str(), ec.message().c_str());
}

Result FsyncDir(const std::string& dir) {
    Fd fd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC));
    if (!fd.Valid()) return Result::Fail(errno, "open " + dir + ": " + std::strerror(errno));
    if (::fsync(fd.Get()) != 0) return Result::Fail(errno, "fsync " + dir + ": " + std::strerror(errno));
    return Result::Ok();
}

} // namespace

const char* UpdateStateName(UpdateState state) {
    switch (state) {
        case UpdateState::Idle: return "Idle";
        case UpdateState::Checking: return "Checking";
        case UpdateState::UpdateAvailable: return "UpdateAvailable";
        case UpdateState::Downloading: return "Downloading";
        case UpdateState::Verifying: return "Verifying";
        case UpdateState::BackingUp: return "BackingUp";
        case UpdateState::Applying: return "Applying";
        case UpdateState::Verified: return "Verified";
        case UpdateState::RolledBack: return "RolledBack";
    }
    return "?";
}

const char* UpdateOutcomeName(UpdateOutcome outcome) {
    switch (outcome) {
        case UpdateOutcome::None: return "none";
        case UpdateOutcome::UpToDate: return "up_to_date";
        case UpdateOutcome::Incompatible: return "incompatible";
        case UpdateOutcome::Verified: return "verified";
        case UpdateOutcome::RolledBack: return "rolled_back";
        case UpdateOutcome::Failed: return "failed";
    }
    return "?";
}

UpdateClient::UpdateClient(InstallationContext ctx, std::shared_ptr<IFetcher> fetcher)
    : UpdateClient(std::move(ctx), std::move(fetcher), ProcessTerminator()) {}

UpdateClient::UpdateClient(InstallationContext ctx, std::shared_ptr<IFetcher> fetcher, ProcessTerminator terminator)
    : ctx_(std::move(ctx)),
      fetcher_(std::move(fetcher)),
      terminator_(std::move(terminator)),
      backups_(ctx_.BackupDir()) {}

Result UpdateClient::EnsureDirs() const {
    for (const auto& d : {ctx_.install_dir, ctx_.state_dir, ctx_.BackupDir(), ctx_.DownloadDir()}) {
        std::error_code ec;
        fs::create_directories(d, ec);
        if (ec) return Result::Fail(ec.value(), "cannot create " + d + ": " + ec.message());
    }
    return Result::Ok();
}

Result UpdateClient::WithRetries(const char* what, SteadyClock::time_point deadline,
                                 const std::function<Result(milliseconds)>& op) {
    Result last = Result::Fail(ErrorKind::NetworkFailure, std::string(what) + ": session timed out");
    for (unsigned attempt = 0;; ++attempt) {
        const auto left = Remaining(deadline);
        if (left.count() <= 0) return last;

        last = op(left);
        if (last.ok || last.kind == ErrorKind::Cancelled || last.err == kFetchNotFound) return last;
        if (attempt >= ctx_.download_retries) break;

        const auto delay = ctx_.retry_base_delay * (1LL << std::min(attempt, 16u));
        if (SteadyClock::now() + delay >= deadline) break;

        LogWarn("%s failed (%s), retry %u/%u in %lld ms", what, last.msg.c_str(), attempt + 1,
                ctx_.download_retries, static_cast<long long>(delay.count()));
        const auto wake = SteadyClock::now() + delay;
        while (SteadyClock::now() < wake) {
            if (CancelRequested()) return Result::Fail(ErrorKind::Cancelled, std::string(what) + ": cancelled");
            std::this_thread::sleep_for(std::min<milliseconds>(milliseconds(50), Remaining(wake)));
        }
    }
    return last;
}

Result UpdateClient::FetchManifest(SteadyClock::time_point deadline, Manifest& out) {
    if (ctx_.update_url.empty()) return Result::Fail(ErrorKind::Config, "update_url is not configured");
    if (!fetcher_) return Result::Fail(ErrorKind::Config, "no fetcher");

    const std::string url = ctx_.ManifestUrl();
    LogInfo("Fetching manifest %s", url.c_str());

    std::string body;
    auto r = WithRetries("manifest fetch", deadline,
                         [&](milliseconds t) { return fetcher_->FetchToString(url, t, body); });
    if (!r.ok) return AsStageFailure(r, ErrorKind::NetworkFailure);

    auto parsed = ManifestCodec::Parse(body);
    if (!parsed) {
        return Result::Fail(ErrorKind::NetworkFailure, "invalid manifest at " + url + ": " + parsed.error());
    }
    if (!parsed->channel.empty() && NormalizeChannel(parsed->channel) != ctx_.channel) {
        return Result::Fail(ErrorKind::NetworkFailure,
                            "manifest at " + url + " is for channel '" + parsed->channel + "'");
    }
    out = std::move(*parsed);
    return Result::Ok();
}

Result UpdateClient::InstalledVersion(std::string& out) const {
    out.clear();
    std::error_code ec;
    if (!fs::exists(ctx_.BinaryPath(), ec)) return Result::Ok();
    return ProbeBinaryVersion(ctx_.BinaryPath(), ctx_.version_probe_timeout, out);
}

bool UpdateClient::IsSystemCompatible(const ManifestEntry& entry) const {
    if (ctx_.system_version.empty() || entry.min_system_version.empty()) return true;
    return CompareVersions(ctx_.system_version, entry.min_system_version) >= 0;
}

Result UpdateClient::Check(CheckReport& out) {
    out = CheckReport{};
    const auto deadline = SteadyClock::now() + ctx_.session_timeout;

    if (auto r = FetchManifest(deadline, out.manifest); !r.ok) return r;
    if (auto r = InstalledVersion(out.installed_version); !r.ok) {
        LogWarn("cannot determine installed version: %s", r.msg.c_str());
        out.installed_version.clear();
    }

    const ManifestEntry* latest = out.manifest.LatestRelease();
    if (!latest) {
        LogInfo("Channel %s has no releases", ctx_.channel.c_str());
        return Result::Ok();
    }
    out.candidate = *latest;
    out.update_available = CompareVersions(latest->version, out.installed_version) != 0;
    out.compatible = IsSystemCompatible(*latest);
    return Result::Ok();
}

Result UpdateClient::StageBinary(const std::string& package_path) const {
    const std::string staged = ctx_.StagingPath();
    RemoveQuietly(staged);

    if (LooksLikeArchive(package_path)) {
        return ExtractPackageEntry(package_path, "bin/" + ctx_.binary_name, staged, 0755);
    }
    LogDebug("%s is not an archive, installing it as the binary", package_path.c_str());
    return CopyFileContents(package_path, staged, /*exclusive=*/false, 0755);
}

Result UpdateClient::TerminateRunning(milliseconds grace) const {
    ProcessTerminator::Policy policy;
    policy.grace = grace;
    return terminator_.TerminateAll(ctx_.BinaryPath(), policy);
}

Result UpdateClient::SwapInStaged(SteadyClock::time_point deadline) const {
    if (CancelRequested()) {
        return Result::Fail(ErrorKind::Cancelled, "cancelled before the binary was replaced");
    }
    const auto left = Remaining(deadline);
    if (left.count() <= 0) {
        return Result::Fail(ErrorKind::ApplyFailure, "session deadline passed before apply");
    }

    const milliseconds grace = std::min<milliseconds>(ctx_.terminate_grace, left);
    if (auto r = TerminateRunning(grace); !r.ok) return r.As(ErrorKind::ApplyFailure);

    if (::rename(ctx_.StagingPath().c_str(), ctx_.BinaryPath().c_str()) != 0) {
        return Result::Fail(ErrorKind::ApplyFailure,
                            "cannot replace " + ctx_.BinaryPath() + ": " + std::strerror(errno));
    }
    if (auto r = FsyncDir(ctx_.install_dir); !r.ok) {
        LogWarn("%s", r.msg.c_str());
    }
    LogInfo("Installed new binary at %s", ctx_.BinaryPath().c_str());
    return Result::Ok();
}

Result UpdateClient::WriteVersionRecord(const std::string& version, const std::string& source) const {
    nlohmann::json j = {
        {"version", version},
        {"updated_at", FormatIso8601Utc(Clock::now())},
        {"channel", ctx_.channel},
        {"source", source},
    };
    return WriteFileAtomic(ctx_.VersionRecordPath(), j.dump(4) + "\n", 0644);
}

Result UpdateClient::Update(UpdateSession& session) {
    session = UpdateSession{};
    session.channel = ctx_.channel;

    if (ctx_.require_signature && ctx_.trusted_certificate_pem.empty()) {
        return Result::Fail(ErrorKind::Config, "signatures are required but no trusted_certificate is configured");
    }
    if (auto r = EnsureDirs(); !r.ok) return r;

    FileLock lock;
    if (auto r = FileLock::TryAcquire(ctx_.LockPath(), lock); !r.ok) {
        session.outcome = UpdateOutcome::Failed;
        return r;
    }

    const auto deadline = SteadyClock::now() + ctx_.session_timeout;
    UpdateState state = UpdateState::Idle;

    auto enter = [&](UpdateState next) {
        LogInfo("Update state: %s -> %s", UpdateStateName(state), UpdateStateName(next));
        if (observer_) observer_(state, next);
        if (next != UpdateState::Idle) session.history.push_back(next);
        state = next;
    };
    auto abort_session = [&](Result r) {
        LogError("Update aborted in %s: %s", UpdateStateName(state), r.msg.c_str());
        session.outcome = UpdateOutcome::Failed;
        enter(UpdateState::Idle);
        return r;
    };

    enter(UpdateState::Checking);

    Manifest manifest;
    if (auto r = FetchManifest(deadline, manifest); !r.ok) return abort_session(r);

    if (auto r = InstalledVersion(session.installed_version); !r.ok) {
        LogWarn("installed binary does not report a version (%s), treating it as unknown", r.msg.c_str());
        session.installed_version.clear();
    }

    const ManifestEntry* latest = manifest.LatestRelease();
    if (!latest) {
        return abort_session(Result::Fail(ErrorKind::NetworkFailure,
                                          "manifest for channel " + ctx_.channel + " lists no releases"));
    }
    session.candidate = *latest;

    const int cmp = CompareVersions(latest->version, session.installed_version);
    if (cmp == 0) {
        LogInfo("Already up to date (%s)", session.installed_version.c_str());
        session.outcome = UpdateOutcome::UpToDate;
        return Result::Ok();
    }
    if (cmp < 0) {
        LogWarn("Channel %s offers %s, older than installed %s", ctx_.channel.c_str(), latest->version.c_str(),
                session.installed_version.c_str());
    }
    if (!IsSystemCompatible(*latest)) {
        LogWarn("%s requires system version %s, this system is %s", latest->version.c_str(),
                latest->min_system_version.c_str(), ctx_.system_version.c_str());
        session.outcome = UpdateOutcome::Incompatible;
        enter(UpdateState::Idle);
        return Result::Ok();
    }

    enter(UpdateState::UpdateAvailable);
    LogInfo("Update available: %s -> %s%s",
            session.installed_version.empty() ? "(none)" : session.installed_version.c_str(),
            latest->version.c_str(), latest->critical ? " [critical]" : "");

    if (CancelRequested()) return abort_session(Result::Fail(ErrorKind::Cancelled, "cancelled"));

    enter(UpdateState::Downloading);
    std::string file_name = UrlBaseName(latest->download_url);
    if (file_name.empty()) file_name = ctx_.binary_name + ".pkg";
    session.downloaded_path = ctx_.DownloadDir() + "/" + file_name;
    auto discard_download = [&]() {
        RemoveQuietly(session.downloaded_path);
        RemoveQuietly(ctx_.StagingPath());
    };

    const std::string url = latest->download_url;
    auto dr = WithRetries("download", deadline, [&](milliseconds t) {
        return fetcher_->FetchToFile(url, session.downloaded_path, t);
    });
    if (!dr.ok) {
        discard_download();
        return abort_session(AsStageFailure(dr, ErrorKind::NetworkFailure));
    }

    std::optional<std::vector<std::uint8_t>> signature;
    std::string sig_body;
    auto sr = WithRetries("signature download", deadline, [&](milliseconds t) {
        return fetcher_->FetchToString(url + ".sig", t, sig_body);
    });
    if (sr.ok) {
        signature.emplace(sig_body.begin(), sig_body.end());
    } else if (sr.err != kFetchNotFound) {
        discard_download();
        return abort_session(AsStageFailure(sr, ErrorKind::NetworkFailure));
    }

    enter(UpdateState::Verifying);
    SignatureVerifier verifier(ctx_.trusted_certificate_pem, SignatureVerifier::Policy{ctx_.require_signature});
    VerificationResult vr;
    if (auto r = verifier.Verify(session.downloaded_path, latest->checksum, signature, latest->signature, vr);
        !r.ok) {
        discard_download();
        return abort_session(r);
    }
    if (auto r = StageBinary(session.downloaded_path); !r.ok) {
        discard_download();
        return abort_session(r);
    }
    session.verified = true;

    if (CancelRequested()) {
        discard_download();
        return abort_session(Result::Fail(ErrorKind::Cancelled, "cancelled"));
    }

    enter(UpdateState::BackingUp);
    std::error_code ec;
    if (fs::exists(ctx_.BinaryPath(), ec)) {
        BackupRecord rec;
        const std::string tag = session.installed_version.empty() ? "unknown" : session.installed_version;
        if (auto r = backups_.Backup(ctx_.BinaryPath(), tag, rec); !r.ok) {
            discard_download();
            return abort_session(r);
        }
        session.backup = rec;

        std::size_t pruned = 0;
        if (auto r = backups_.Prune(ctx_.backup_retention, rec.path, pruned); !r.ok) {
            LogWarn("backup pruning failed: %s", r.msg.c_str());
        } else if (pruned > 0) {
            LogInfo("Pruned %zu old backup(s)", pruned);
        }
    } else {
        LogInfo("Nothing installed at %s: no backup available for this session", ctx_.BinaryPath().c_str());
    }

    enter(UpdateState::Applying);
    std::string reported;
    Result ar = SwapInStaged(deadline);
    if (ar.ok) {
        const auto probe_timeout = std::min<milliseconds>(ctx_.version_probe_timeout,
                                                          std::max<milliseconds>(Remaining(deadline), milliseconds(1000)));
        ar = AsStageFailure(ProbeBinaryVersion(ctx_.BinaryPath(), probe_timeout, reported), ErrorKind::ApplyFailure);
        if (ar.ok && CompareVersions(reported, latest->version) != 0) {
            ar = Result::Fail(ErrorKind::ApplyFailure,
                              "new binary reports " + reported + ", expected " + latest->version);
        }
    }
    RemoveQuietly(session.downloaded_path);

    if (ar.ok) {
        enter(UpdateState::Verified);
        session.outcome = UpdateOutcome::Verified;
        session.installed_version = reported;
        if (auto r = WriteVersionRecord(reported, "update"); !r.ok) {
            LogWarn("cannot write version record: %s", r.msg.c_str());
        }
        LogInfo("Update to %s verified", reported.c_str());
        enter(UpdateState::Idle);
        return Result::Ok();
    }

    LogError("Apply failed: %s", ar.msg.c_str());
    RemoveQuietly(ctx_.StagingPath());

    if (!session.backup) {
        // First install: the last good state is "nothing installed".
        RemoveQuietly(ctx_.BinaryPath());
        return abort_session(Result::Fail(ErrorKind::ApplyFailure,
                                          "apply failed and there is no backup to restore: " + ar.msg));
    }

    if (auto r = TerminateRunning(ctx_.terminate_grace); !r.ok) {
        LogWarn("before restore: %s", r.msg.c_str());
    }
    if (auto r = backups_.Restore(*session.backup, ctx_.BinaryPath()); !r.ok) {
        return abort_session(Result::Fail(ErrorKind::ApplyFailure, "rollback failed: " + r.msg));
    }
    std::string restored;
    if (auto r = ProbeBinaryVersion(ctx_.BinaryPath(), ctx_.version_probe_timeout, restored, /*ignore_cancel=*/true);
        !r.ok) {
        return abort_session(Result::Fail(ErrorKind::ApplyFailure, "restored binary does not start: " + r.msg));
    }

    enter(UpdateState::RolledBack);
    session.outcome = UpdateOutcome::RolledBack;
    session.installed_version = restored;
    if (auto r = WriteVersionRecord(restored, "rollback"); !r.ok) {
        LogWarn("cannot write version record: %s", r.msg.c_str());
    }
    enter(UpdateState::Idle);
    return Result::Fail(ErrorKind::ApplyFailure,
                        "update to " + latest->version + " failed (" + ar.msg + "), rolled back to " + restored);
}

Result UpdateClient::Rollback(BackupRecord& used) {
    // Nothing is created on disk unless there is something to restore.
    BackupRecord rec;
    if (auto r = backups_.Latest(rec); !r.ok) return r;
    if (auto r = EnsureDirs(); !r.ok) return r;

    FileLock lock;
    if (auto r = FileLock::TryAcquire(ctx_.LockPath(), lock); !r.ok) return r;
    // Another session may have pruned or added backups meanwhile.
    if (auto r = backups_.Latest(rec); !r.ok) return r;

    if (auto r = TerminateRunning(ctx_.terminate_grace); !r.ok) return r.As(ErrorKind::ApplyFailure);
    if (auto r = backups_.Restore(rec, ctx_.BinaryPath()); !r.ok) return r.As(ErrorKind::ApplyFailure);

    std::string restored;
    if (auto r = ProbeBinaryVersion(ctx_.BinaryPath(), ctx_.version_probe_timeout, restored, /*ignore_cancel=*/true);
        !r.ok) {
        return Result::Fail(ErrorKind::ApplyFailure, "restored binary does not start: " + r.msg);
    }
    if (auto r = WriteVersionRecord(restored, "rollback"); !r.ok) {
        LogWarn("cannot write version record: %s", r.msg.c_str());
    }
    LogInfo("Rolled back to %s", restored.c_str());
    used = std::move(rec);
    return Result::Ok();
}

} // namespace relup
