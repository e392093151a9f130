#include "update/curl_fetcher.hpp"

#include "io/file_writer.hpp"
#include "system/signals.hpp"
#include "util/logger.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace relup {

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* c) const {
        if (c) curl_easy_cleanup(c);
    }
};
using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;

void GlobalInitOnce() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct StringSink {
    std::string* out = nullptr;
    std::size_t limit = 0;
    bool overflow = false;
};

size_t WriteToString(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<StringSink*>(userdata);
    const size_t n = size * nmemb;
    if (sink->out->size() + n > sink->limit) {
        sink->overflow = true;
        return 0;
    }
    sink->out->append(ptr, n);
    return n;
}

struct FileSink {
    AtomicFileWriter* writer = nullptr;
    Result status;
};

size_t WriteToFile(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<FileSink*>(userdata);
    const size_t n = size * nmemb;
    sink->status = sink->writer->WriteAll(
        std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(ptr), n));
    return sink->status.ok ? n : 0;
}

int XferInfo(void*, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
    return CancelRequested() ? 1 : 0;
}

void ApplyCommonOptions(CURL* c, const std::string& url, std::chrono::milliseconds timeout,
                        const CurlFetcher::Options& opt) {
    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(c, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(c, CURLOPT_XFERINFOFUNCTION, XferInfo);
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT, opt.connect_timeout_seconds);
    curl_easy_setopt(c, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count() > 0 ? timeout.count() : 1));
    curl_easy_setopt(c, CURLOPT_USERAGENT, opt.user_agent.c_str());
}

Result Perform(CURL* c, const std::string& url) {
    const CURLcode rc = curl_easy_perform(c);
    if (rc == CURLE_OK) return Result::Ok();

    long status = 0;
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &status);

    const std::string what = url + ": " + curl_easy_strerror(rc) +
                             (status > 0 ? " (HTTP " + std::to_string(status) + ")" : std::string());
    switch (rc) {
        case CURLE_OPERATION_TIMEDOUT:
            return Result::Fail(ErrorKind::Timeout, what);
        case CURLE_ABORTED_BY_CALLBACK:
            return Result::Fail(ErrorKind::Cancelled, what);
        case CURLE_FILE_COULDNT_READ_FILE:
        case CURLE_REMOTE_FILE_NOT_FOUND: {
            Result r = Result::Fail(ErrorKind::NetworkFailure, what);
            r.err = kFetchNotFound;
            return r;
        }
        default: {
            Result r = Result::Fail(ErrorKind::NetworkFailure, what);
            if (status == 404 || status == 410) r.err = kFetchNotFound;
            return r;
        }
    }
}

} // namespace

CurlFetcher::CurlFetcher() : CurlFetcher(Options{}) {}

CurlFetcher::CurlFetcher(Options opt) : opt_(std::move(opt)) {
    GlobalInitOnce();
}

Result CurlFetcher::FetchToString(const std::string& url, std::chrono::milliseconds timeout, std::string& out) {
    CurlEasyPtr c(curl_easy_init());
    if (!c) return Result::Fail(ErrorKind::NetworkFailure, "curl_easy_init failed");

    std::string body;
    StringSink sink{&body, opt_.max_in_memory_bytes, false};
    ApplyCommonOptions(c.get(), url, timeout, opt_);
    curl_easy_setopt(c.get(), CURLOPT_WRITEFUNCTION, WriteToString);
    curl_easy_setopt(c.get(), CURLOPT_WRITEDATA, &sink);

    LogDebug("GET %s", url.c_str());
    auto r = Perform(c.get(), url);
    if (sink.overflow) {
        return Result::Fail(ErrorKind::NetworkFailure,
                            url + ": response exceeds " + std::to_string(opt_.max_in_memory_bytes) + " bytes");
    }
    if (!r.ok) return r;

    out = std::move(body);
    return Result::Ok();
}

Result CurlFetcher::FetchToFile(const std::string& url, const std::string& dest_path,
                                std::chrono::milliseconds timeout) {
    CurlEasyPtr c(curl_easy_init());
    if (!c) return Result::Fail(ErrorKind::NetworkFailure, "curl_easy_init failed");

    AtomicFileWriter writer;
    if (auto r = AtomicFileWriter::Open(dest_path, writer, 0600); !r.ok) return r;

    FileSink sink{&writer, Result::Ok()};
    ApplyCommonOptions(c.get(), url, timeout, opt_);
    curl_easy_setopt(c.get(), CURLOPT_WRITEFUNCTION, WriteToFile);
    curl_easy_setopt(c.get(), CURLOPT_WRITEDATA, &sink);

    LogDebug("GET %s -> %s", url.c_str(), dest_path.c_str());
    auto r = Perform(c.get(), url);
    if (!sink.status.ok) return sink.status;
    if (!r.ok) return r;

    return writer.Commit();
}

} // namespace relup
