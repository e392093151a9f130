#include "system/process_runner.hpp"

#include "io/fd.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace relup {

namespace {

using SteadyClock = std::chrono::steady_clock;

bool IsExecutableFile(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return ::access(path.c_str(), X_OK) == 0;
}

void FillExitStatus(int status, ProcessResult& out) {
    if (WIFEXITED(status)) {
        out.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        out.term_signal = WTERMSIG(status);
        out.exit_code = -1;
    }
}

void KillAndReap(pid_t pid, int& status) {
    ::kill(pid, SIGKILL);
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

} // namespace

std::optional<std::string> FindExecutable(const std::string& name) {
    if (name.empty()) return std::nullopt;
    if (name.find('/') != std::string::npos) {
        if (IsExecutableFile(name)) return name;
        return std::nullopt;
    }

    const char* path_env = std::getenv("PATH");
    const std::string path_list = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";

    std::size_t start = 0;
    while (start <= path_list.size()) {
        const std::size_t end = path_list.find(':', start);
        std::string dir = path_list.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (dir.empty()) dir = ".";
        const std::string candidate = dir + "/" + name;
        if (IsExecutableFile(candidate)) return candidate;
        if (end == std::string::npos) break;
        start = end + 1;
    }
    return std::nullopt;
}

Result CheckRequiredTools(const std::vector<std::string>& tools) {
    std::string missing;
    for (const auto& tool : tools) {
        if (FindExecutable(tool)) {
            LogDebug("dependency ok: %s", tool.c_str());
            continue;
        }
        LogError("Missing dependency: %s", tool.c_str());
        if (!missing.empty()) missing += ", ";
        missing += tool;
    }
    if (!missing.empty()) {
        return Result::Fail(ErrorKind::MissingDependency, "missing dependency: " + missing);
    }
    return Result::Ok();
}

Result RunProcess(const std::vector<std::string>& argv, const ProcessOptions& opt, ProcessResult& out) {
    out = ProcessResult{};
    if (argv.empty() || argv.front().empty()) return Result::Fail(EINVAL, "empty command");

    // Everything the child touches is prepared before fork().
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);
    const char* cwd = opt.working_dir.empty() ? nullptr : opt.working_dir.c_str();

    int pipefd[2];
    if (::pipe2(pipefd, O_CLOEXEC) != 0) {
        return Result::Fail(errno, std::string("pipe failed: ") + std::strerror(errno));
    }
    Fd read_end(pipefd[0]);
    Fd write_end(pipefd[1]);

    const pid_t pid = ::fork();
    if (pid < 0) {
        return Result::Fail(errno, std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        ::dup2(write_end.Get(), STDOUT_FILENO);
        ::dup2(write_end.Get(), STDERR_FILENO);
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        if (cwd && ::chdir(cwd) != 0) ::_exit(126);
        ::execvp(cargv[0], cargv.data());
        ::_exit(127);
    }
    write_end.Close();

    const auto deadline = SteadyClock::now() + opt.timeout;
    char buf[4096];
    int status = 0;

    while (true) {
        if (!opt.ignore_cancel && CancelRequested()) {
            KillAndReap(pid, status);
            FillExitStatus(status, out);
            return Result::Fail(ErrorKind::Cancelled, "cancelled while running " + argv.front());
        }

        const auto now = SteadyClock::now();
        if (now >= deadline) {
            KillAndReap(pid, status);
            FillExitStatus(status, out);
            out.timed_out = true;
            return Result::Fail(ErrorKind::Timeout, "timed out running " + argv.front());
        }

        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        pollfd pfd{.fd = read_end.Get(), .events = POLLIN, .revents = 0};
        const int wait_ms = static_cast<int>(std::min<long long>(left.count(), 200));
        const int pr = ::poll(&pfd, 1, wait_ms);
        if (pr < 0) {
            if (errno == EINTR) continue;
            KillAndReap(pid, status);
            return Result::Fail(errno, std::string("poll failed: ") + std::strerror(errno));
        }
        if (pr == 0) continue;

        const ssize_t n = ::read(read_end.Get(), buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            KillAndReap(pid, status);
            return Result::Fail(errno, std::string("read failed: ") + std::strerror(errno));
        }
        if (n == 0) break; // child closed its end
        if (out.output.size() < opt.max_output_bytes) {
            const std::size_t room = opt.max_output_bytes - out.output.size();
            out.output.append(buf, std::min(room, static_cast<std::size_t>(n)));
        }
    }

    // Output closed; the child may still be running (e.g. it closed stdout).
    while (true) {
        const pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) break;
        if (w < 0 && errno != EINTR) {
            return Result::Fail(errno, std::string("waitpid failed: ") + std::strerror(errno));
        }
        if (SteadyClock::now() >= deadline) {
            KillAndReap(pid, status);
            FillExitStatus(status, out);
            out.timed_out = true;
            return Result::Fail(ErrorKind::Timeout, "timed out running " + argv.front());
        }
        ::usleep(10 * 1000);
    }

    FillExitStatus(status, out);
    if (out.exit_code == 127) {
        LogDebug("exec of %s returned 127", argv.front().c_str());
    }
    return Result::Ok();
}

} // namespace relup
