#include "release/build_step.hpp"

#include "system/process_runner.hpp"
#include "util/logger.hpp"

#include <filesystem>

namespace relup {

namespace {

std::string JoinArgs(const std::vector<std::string>& argv) {
    std::string s;
    for (const auto& a : argv) {
        if (!s.empty()) s += ' ';
        s += a;
    }
    return s;
}

// Last few lines of build output, enough to see the compiler error.
std::string Tail(const std::string& out, std::size_t max_bytes = 2048) {
    if (out.size() <= max_bytes) return out;
    return "..." + out.substr(out.size() - max_bytes);
}

} // namespace

Result RunBuildStep(const BuildStep& step) {
    if (!step.command.empty()) {
        LogInfo("Building: %s (in %s)", JoinArgs(step.command).c_str(),
                step.working_dir.empty() ? "." : step.working_dir.c_str());

        ProcessOptions opt;
        opt.timeout = step.timeout;
        opt.working_dir = step.working_dir;

        ProcessResult pr;
        auto r = RunProcess(step.command, opt, pr);
        if (!r.ok) {
            if (r.kind == ErrorKind::Timeout || r.kind == ErrorKind::Cancelled) return r;
            return r.As(ErrorKind::BuildFailure);
        }
        if (!pr.Succeeded()) {
            LogError("build output:\n%s", Tail(pr.output).c_str());
            if (pr.term_signal != 0) {
                return Result::Fail(ErrorKind::BuildFailure,
                                    "build killed by signal " + std::to_string(pr.term_signal));
            }
            return Result::Fail(ErrorKind::BuildFailure,
                                "build exited with code " + std::to_string(pr.exit_code));
        }
        LogDebug("build output:\n%s", Tail(pr.output).c_str());
    }

    std::error_code ec;
    if (step.built_binary.empty() || !std::filesystem::is_regular_file(step.built_binary, ec)) {
        return Result::Fail(ErrorKind::BuildFailure, "build produced no binary at " + step.built_binary);
    }
    LogInfo("Build output: %s", step.built_binary.c_str());
    return Result::Ok();
}

} // namespace relup
