#pragma once

#include "util/result.hpp"

#include <chrono>
#include <string>

namespace relup {

// Runs `<binary> --version` and pulls the first version token out of its
// output. Fails when the binary does not start, exits non-zero, overruns
// the timeout or prints no version. With ignore_cancel a pending cancel
// request does not stop the probe.
Result ProbeBinaryVersion(const std::string& binary_path, std::chrono::milliseconds timeout,
                          std::string& out_version, bool ignore_cancel = false);

} // namespace relup
