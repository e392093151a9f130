#pragma once

#include "manifest/manifest.hpp"
#include "system/process_terminator.hpp"
#include "update/backup_store.hpp"
#include "update/fetcher.hpp"
#include "update/installation_context.hpp"
#include "util/result.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace relup {

enum class UpdateState {
    Idle,
    Checking,
    UpdateAvailable,
    Downloading,
    Verifying,
    BackingUp,
    Applying,
    Verified,
    RolledBack,
};

const char* UpdateStateName(UpdateState state);

enum class UpdateOutcome {
    None,
    UpToDate,
    Incompatible,
    Verified,
    RolledBack,
    Failed,
};

const char* UpdateOutcomeName(UpdateOutcome outcome);

// One run of the update workflow. Lives only for the duration of the call.
struct UpdateSession {
    std::string channel;
    std::string installed_version;
    std::optional<ManifestEntry> candidate;
    std::string downloaded_path;
    bool verified = false;
    std::optional<BackupRecord> backup;
    UpdateOutcome outcome = UpdateOutcome::None;
    // States entered, in order, starting with Checking.
    std::vector<UpdateState> history;
};

struct CheckReport {
    std::string installed_version;
    Manifest manifest;
    std::optional<ManifestEntry> candidate;
    bool update_available = false;
    bool compatible = true;
};

class UpdateClient {
  public:
    using TransitionObserver = std::function<void(UpdateState from, UpdateState to)>;

    UpdateClient(InstallationContext ctx, std::shared_ptr<IFetcher> fetcher);
    UpdateClient(InstallationContext ctx, std::shared_ptr<IFetcher> fetcher, ProcessTerminator terminator);

    void SetTransitionObserver(TransitionObserver observer) { observer_ = std::move(observer); }

    // Fetches the manifest and compares it with the installed binary. Takes
    // no lock and changes nothing.
    Result Check(CheckReport& out);

    // Checking -> ... -> Verified | RolledBack. Holds the installation lock
    // for the whole session; a second concurrent session fails at once with
    // ErrorKind::LockContention. An apply that had to be rolled back is
    // reported as ErrorKind::ApplyFailure with session.outcome RolledBack.
    Result Update(UpdateSession& session);

    // Restores the most recent backup of any version.
    Result Rollback(BackupRecord& used);

    // Version reported by the installed binary; empty when nothing is
    // installed.
    Result InstalledVersion(std::string& out) const;

    const InstallationContext& Context() const { return ctx_; }

  private:
    using SteadyClock = std::chrono::steady_clock;

    Result FetchManifest(SteadyClock::time_point deadline, Manifest& out);
    Result WithRetries(const char* what, SteadyClock::time_point deadline,
                       const std::function<Result(std::chrono::milliseconds)>& op);
    Result EnsureDirs() const;
    Result StageBinary(const std::string& package_path) const;
    Result SwapInStaged(SteadyClock::time_point deadline) const;
    Result TerminateRunning(std::chrono::milliseconds grace) const;
    bool IsSystemCompatible(const ManifestEntry& entry) const;
    Result WriteVersionRecord(const std::string& version, const std::string& source) const;

    InstallationContext ctx_;
    std::shared_ptr<IFetcher> fetcher_;
    ProcessTerminator terminator_;
    BackupStore backups_;
    TransitionObserver observer_;
};

} // namespace relup
