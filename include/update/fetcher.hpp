#pragma once

#include "util/result.hpp"

#include <chrono>
#include <string>

namespace relup {

// Result::err value for a resource the server says does not exist.
inline constexpr int kFetchNotFound = 404;

// Transport for manifests, packages and signatures. Failures are
// ErrorKind::NetworkFailure (err = kFetchNotFound for a missing resource),
// ErrorKind::Timeout or ErrorKind::Cancelled.
class IFetcher {
  public:
    virtual ~IFetcher() = default;

    virtual Result FetchToString(const std::string& url, std::chrono::milliseconds timeout, std::string& out) = 0;

    // dest_path is replaced atomically once the whole body has arrived.
    virtual Result FetchToFile(const std::string& url, const std::string& dest_path,
                               std::chrono::milliseconds timeout) = 0;
};

} // namespace relup
