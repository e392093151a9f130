#include "system/process_terminator.hpp"

#include "util/logger.hpp"

#include <cerrno>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <string_view>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;

namespace relup {

namespace {

constexpr std::string_view kDeletedSuffix = " (deleted)";

bool IsNumeric(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

class ProcfsProcessTable final : public ProcessTerminator::IProcessTable {
  public:
    std::vector<pid_t> FindByExecutable(const std::string& exe_path) const override {
        std::vector<pid_t> out;
        std::error_code ec;
        fs::path wanted = fs::weakly_canonical(exe_path, ec);
        if (ec) wanted = exe_path;

        const pid_t self = ::getpid();
        for (fs::directory_iterator it("/proc", ec), end; !ec && it != end; it.increment(ec)) {
            const std::string name = it->path().filename().string();
            if (!IsNumeric(name)) continue;

            std::error_code lec;
            std::string target = fs::read_symlink(it->path() / "exe", lec).string();
            if (lec) continue;
            if (target.size() > kDeletedSuffix.size() &&
                target.compare(target.size() - kDeletedSuffix.size(), kDeletedSuffix.size(), kDeletedSuffix) == 0) {
                target.resize(target.size() - kDeletedSuffix.size());
            }
            if (target != wanted.string()) continue;

            const pid_t pid = static_cast<pid_t>(std::stol(name));
            if (pid != self) out.push_back(pid);
        }
        return out;
    }

    bool Signal(pid_t pid, int sig) const override {
        return ::kill(pid, sig) == 0 || errno == ESRCH;
    }

    bool IsAlive(pid_t pid) const override {
        if (::kill(pid, 0) != 0 && errno != EPERM) return false;
        // A zombie has exited already.
        std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
        std::string line;
        if (!std::getline(stat, line)) return false;
        const auto close = line.rfind(')');
        if (close == std::string::npos || close + 2 >= line.size()) return true;
        return line[close + 2] != 'Z';
    }
};

} // namespace

std::shared_ptr<const ProcessTerminator::IProcessTable> ProcessTerminator::DefaultTable() {
    static const std::shared_ptr<const IProcessTable> kDefault = std::make_shared<ProcfsProcessTable>();
    return kDefault;
}

ProcessTerminator::ProcessTerminator() : table_(DefaultTable()) {}

ProcessTerminator::ProcessTerminator(std::shared_ptr<const IProcessTable> table)
    : table_(table ? std::move(table) : DefaultTable()) {}

Result ProcessTerminator::TerminateAll(const std::string& exe_path, const Policy& policy) const {
    std::vector<pid_t> pids = table_->FindByExecutable(exe_path);
    if (pids.empty()) {
        LogDebug("no running instance of %s", exe_path.c_str());
        return Result::Ok();
    }

    for (pid_t pid : pids) {
        LogInfo("SIGTERM -> pid %d (%s)", static_cast<int>(pid), exe_path.c_str());
        (void)table_->Signal(pid, SIGTERM);
    }

    auto wait_gone = [&](std::chrono::milliseconds budget) {
        const auto deadline = std::chrono::steady_clock::now() + budget;
        while (true) {
            std::erase_if(pids, [&](pid_t p) { return !table_->IsAlive(p); });
            if (pids.empty() || std::chrono::steady_clock::now() >= deadline) return;
            std::this_thread::sleep_for(policy.poll_interval);
        }
    };

    wait_gone(policy.grace);
    if (pids.empty()) return Result::Ok();

    for (pid_t pid : pids) {
        LogWarn("pid %d ignored SIGTERM for %lld ms, sending SIGKILL",
                static_cast<int>(pid), static_cast<long long>(policy.grace.count()));
        (void)table_->Signal(pid, SIGKILL);
    }

    wait_gone(policy.kill_wait);
    if (!pids.empty()) {
        return Result::Fail(ErrorKind::ApplyFailure,
                            "could not stop " + std::to_string(pids.size()) + " instance(s) of " + exe_path);
    }
    return Result::Ok();
}

} // namespace relup
