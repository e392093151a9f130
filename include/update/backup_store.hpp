#pragma once

#include "util/result.hpp"
#include "util/time_utils.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace relup {

struct BackupRecord {
    Clock::time_point captured_at{};
    std::string version_tag;
    // The stored copy of the binary.
    std::string path;
};

// Directory of immutable binary snapshots named <compact-utc>_<version>.bak.
class BackupStore {
  public:
    explicit BackupStore(std::string dir);

    // Copies binary_path into a new record. An existing record is never
    // replaced.
    Result Backup(const std::string& binary_path, const std::string& version_tag, BackupRecord& out,
                  Clock::time_point now = Clock::now()) const;

    // Newest first. A missing directory is an empty store.
    Result List(std::vector<BackupRecord>& out) const;

    // Most recently captured record across all versions, or
    // ErrorKind::NoBackupAvailable.
    Result Latest(BackupRecord& out) const;

    // Atomically replaces target_path with the record's bytes (mode 0755).
    Result Restore(const BackupRecord& record, const std::string& target_path) const;

    // Keeps the newest `keep` records (0 keeps everything). The record at
    // protect_path survives regardless.
    Result Prune(std::size_t keep, const std::string& protect_path, std::size_t& removed) const;

    const std::string& Dir() const { return dir_; }

  private:
    std::string dir_;
};

} // namespace relup
