#pragma once

#include "util/result.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace relup {

struct BuildStep {
    // Empty means the binary is produced elsewhere.
    std::vector<std::string> command;
    std::string working_dir;
    std::string built_binary;
    std::chrono::seconds timeout{std::chrono::minutes(30)};
};

// Runs the opaque build. ErrorKind::BuildFailure on a non-zero exit, a kill,
// or when built_binary is missing afterwards; ErrorKind::Timeout when the
// build overruns.
Result RunBuildStep(const BuildStep& step);

} // namespace relup
