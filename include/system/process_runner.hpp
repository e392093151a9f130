#pragma once

#include "util/result.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace relup {

struct ProcessResult {
    int exit_code = -1;
    int term_signal = 0;
    bool timed_out = false;
    // stdout and stderr, interleaved.
    std::string output;

    bool Succeeded() const { return !timed_out && term_signal == 0 && exit_code == 0; }
};

struct ProcessOptions {
    std::chrono::milliseconds timeout{std::chrono::seconds(30)};
    std::string working_dir;
    // Output beyond this is drained and dropped.
    std::size_t max_output_bytes = 1024 * 1024;
    // Recovery steps run to completion even after a cancel request.
    bool ignore_cancel = false;
};

// Runs argv[0] (PATH lookup) and waits for it. A child that outlives the
// timeout is killed; that is reported as ErrorKind::Timeout with
// out.timed_out set. A non-zero exit is not a failure here, callers inspect
// out.exit_code.
Result RunProcess(const std::vector<std::string>& argv, const ProcessOptions& opt, ProcessResult& out);

// Absolute path of an executable found in $PATH (or the name itself if it
// already contains a '/' and is executable).
std::optional<std::string> FindExecutable(const std::string& name);

// ErrorKind::MissingDependency naming every absent tool.
Result CheckRequiredTools(const std::vector<std::string>& tools);

} // namespace relup
