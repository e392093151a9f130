#pragma once

#include "update/fetcher.hpp"

#include <cstddef>

namespace relup {

// libcurl based fetcher for http(s):// and file:// URLs.
class CurlFetcher final : public IFetcher {
  public:
    struct Options {
        long connect_timeout_seconds = 15;
        // Responses held in memory are capped; packages go to disk.
        std::size_t max_in_memory_bytes = 8 * 1024 * 1024;
        std::string user_agent = "relup-update/1.0";
    };

    CurlFetcher();
    explicit CurlFetcher(Options opt);

    Result FetchToString(const std::string& url, std::chrono::milliseconds timeout, std::string& out) override;
    Result FetchToFile(const std::string& url, const std::string& dest_path,
                       std::chrono::milliseconds timeout) override;

  private:
    Options opt_;
};

} // namespace relup
