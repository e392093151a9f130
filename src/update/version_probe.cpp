#include "update/version_probe.hpp"

#include "release/semantic_version.hpp"
#include "system/process_runner.hpp"
#include "util/logger.hpp"

namespace relup {

Result ProbeBinaryVersion(const std::string& binary_path, std::chrono::milliseconds timeout,
                          std::string& out_version, bool ignore_cancel) {
    ProcessOptions opt;
    opt.timeout = timeout;
    opt.ignore_cancel = ignore_cancel;
    opt.max_output_bytes = 64 * 1024;

    ProcessResult pr;
    if (auto r = RunProcess({binary_path, "--version"}, opt, pr); !r.ok) return r;
    if (!pr.Succeeded()) {
        return Result::Fail(ErrorKind::ApplyFailure,
                            binary_path + " --version exited with code " + std::to_string(pr.exit_code) +
                                (pr.term_signal ? " (signal " + std::to_string(pr.term_signal) + ")" : ""));
    }

    auto version = FindVersionInText(pr.output);
    if (!version) {
        return Result::Fail(ErrorKind::ApplyFailure, binary_path + " --version printed no version");
    }
    LogDebug("%s reports version %s", binary_path.c_str(), version->c_str());
    out_version = *version;
    return Result::Ok();
}

} // namespace relup
