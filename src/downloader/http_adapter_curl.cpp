/*
 * rangefetch/src/downloader/http_adapter_curl.cpp
 *
 * Notes
 * - probe() issues a HEAD and reads Content-Length / Accept-Ranges.
 * - fetchRange() issues one GET with a Range header and streams the body into the sink.
 * - All easy handles share one CURLSH (connection cache, DNS, TLS sessions) so concurrent
 *   segment workers reuse connections to the same host.
 * - Timeout is applied as a connect timeout plus a stall timeout (no bytes for `timeout`),
 *   never as a whole-transfer limit.
 * - Cooperative cancellation via the xferinfo callback.
 *
 * Build
 * - Linked via CURL::libcurl.
 */

#include <rangefetch/downloader/downloader.hpp>

#include <curl/curl.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <mutex>
#include <string_view>

namespace rangefetch::downloader {

namespace {

std::once_flag g_curlInitOnce;

void ensureCurlGlobalInit() {
    std::call_once(g_curlInitOnce, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            spdlog::error("curl_global_init failed");
        }
    });
}

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_ABORTED_BY_CALLBACK:
            err.code = ErrorCode::OperationCancelled;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::InvalidArgument;
            break;
        case CURLE_PARTIAL_FILE:
            err.code = ErrorCode::TruncatedTransfer;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
            // certificate problems are terminal
            err.code = ErrorCode::PermissionDenied;
            break;
        default:
            err.code = ErrorCode::NetworkError;
            break;
    }
    return err;
}

Error httpStatusError(long status, std::string_view url) {
    if (status >= 500) {
        return Error{ErrorCode::ServerError, fmt::format("HTTP {} from {}", status, url)};
    }
    return Error{ErrorCode::ClientError, fmt::format("HTTP {} from {}", status, url)};
}

// Headers of the last response in a redirect chain.
struct HeaderParseContext {
    bool acceptRangesBytes{false};
    std::optional<std::uint64_t> contentLength{};
};

size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<HeaderParseContext*>(userdata);
    std::string_view line(buffer, total);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.remove_suffix(1);

    // New status line: a redirect hop starts over.
    if (line.size() >= 5 && to_lower(line.substr(0, 5)) == "http/") {
        *ctx = HeaderParseContext{};
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    auto key = to_lower(trim(line.substr(0, colon)));
    auto val = trim(line.substr(colon + 1));

    if (key == "accept-ranges") {
        ctx->acceptRangesBytes = to_lower(val) == "bytes";
    } else if (key == "content-length") {
        ctx->contentLength = parseContentLength(val);
    }
    return total;
}

struct WriteContext {
    CURL* curl{nullptr};
    const BodySink* sink{nullptr};
    ByteRange requested;
    std::string url;
    bool statusChecked{false};
    bool discardBody{false}; // error responses: body is not part of the resource
    std::optional<Error> error;
    std::uint64_t received{0};
};

// Runs the first time body bytes arrive, before any byte reaches the sink, so a server that
// ignores Range never corrupts a partial file.
std::optional<Error> checkRangeResponse(WriteContext& ctx) {
    long status = 0;
    curl_easy_getinfo(ctx.curl, CURLINFO_RESPONSE_CODE, &status);
    curl_off_t length = -1;
    curl_easy_getinfo(ctx.curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
    std::optional<std::uint64_t> contentLength;
    if (length >= 0)
        contentLength = static_cast<std::uint64_t>(length);

    auto decision = classifyRangeResponse(status, contentLength, ctx.requested, ctx.url);
    if (!decision)
        return decision.error();
    ctx.discardBody = !decision.value();
    return std::nullopt;
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    auto* ctx = static_cast<WriteContext*>(userdata);

    if (!ctx->statusChecked) {
        ctx->statusChecked = true;
        if (auto err = checkRangeResponse(*ctx)) {
            ctx->error = std::move(*err);
            return 0; // CURLE_WRITE_ERROR
        }
    }
    if (ctx->discardBody || total == 0)
        return total;

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = (*ctx->sink)(bytes);
    if (!r) {
        ctx->error = r.error();
        return 0;
    }
    ctx->received += total;
    return total;
}

int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* shouldCancel = static_cast<const ShouldCancel*>(userdata);
    if (shouldCancel && *shouldCancel && (*shouldCancel)())
        return 1; // CURLE_ABORTED_BY_CALLBACK
    return 0;
}

struct EasyDeleter {
    void operator()(CURL* c) const noexcept { curl_easy_cleanup(c); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const noexcept { curl_slist_free_all(l); }
};
using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

} // namespace

Result<bool> classifyRangeResponse(long status, std::optional<std::uint64_t> contentLength,
                                   const ByteRange& requested, std::string_view url) {
    if (status == 206)
        return true;
    if (status == 200) {
        if (requested.offset == 0 && contentLength && *contentLength == requested.length)
            return true;
        return Error{ErrorCode::RangeNotSupported,
                     fmt::format("server answered 200 to Range bytes={}-{} for {}",
                                 requested.offset, requested.last(), url)};
    }
    if (status >= 400)
        return false;
    return Error{ErrorCode::InvalidData,
                 fmt::format("unexpected HTTP {} for ranged GET of {}", status, url)};
}

std::optional<std::uint64_t> parseContentLength(std::string_view value) {
    const auto v = trim(value);
    if (v.empty())
        return std::nullopt;
    std::uint64_t out{0};
    auto res = std::from_chars(v.data(), v.data() + v.size(), out);
    if (res.ec != std::errc() || res.ptr != v.data() + v.size())
        return std::nullopt;
    return out;
}

namespace {

// Connection pool shared by every handle created by one adapter.
class CurlShare {
public:
    CurlShare() : share_(curl_share_init()) {
        if (!share_) {
            spdlog::warn("curl_share_init failed; connections will not be shared");
            return;
        }
        curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, &CurlShare::lock);
        curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, &CurlShare::unlock);
        curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
        curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
        curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    }

    ~CurlShare() {
        if (share_)
            curl_share_cleanup(share_);
    }

    CurlShare(const CurlShare&) = delete;
    CurlShare& operator=(const CurlShare&) = delete;

    CURLSH* get() const noexcept { return share_; }

private:
    static void lock(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
        static_cast<CurlShare*>(userptr)->mutexFor(data).lock();
    }
    static void unlock(CURL*, curl_lock_data data, void* userptr) {
        static_cast<CurlShare*>(userptr)->mutexFor(data).unlock();
    }

    std::mutex& mutexFor(curl_lock_data data) {
        auto idx = static_cast<std::size_t>(data);
        return locks_[idx < locks_.size() ? idx : 0];
    }

    CURLSH* share_{nullptr};
    std::array<std::mutex, static_cast<std::size_t>(CURL_LOCK_DATA_LAST)> locks_;
};

class CurlHttpAdapter final : public IHttpAdapter {
public:
    explicit CurlHttpAdapter(DownloaderConfig config) : config_(std::move(config)) {
        ensureCurlGlobalInit();
        share_ = std::make_unique<CurlShare>();
    }

    Result<ProbeResult> probe(std::string_view url) override {
        EasyHandle curl{curl_easy_init()};
        if (!curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }
        const std::string u(url);
        HeaderParseContext hctx{};

        curl_easy_setopt(curl.get(), CURLOPT_URL, u.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &hctx);
        configureCommon(curl.get());

        CURLcode rc = curl_easy_perform(curl.get());
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "probe(HEAD)");
        }

        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
        if (status >= 400) {
            return httpStatusError(status, url);
        }
        if (!hctx.contentLength) {
            curl_off_t length = -1;
            curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
            if (length < 0) {
                return Error{ErrorCode::InvalidData,
                             fmt::format("{} did not report a Content-Length", url)};
            }
            hctx.contentLength = static_cast<std::uint64_t>(length);
        }

        ProbeResult out;
        out.contentLength = *hctx.contentLength;
        out.acceptRanges = hctx.acceptRangesBytes;
        out.httpStatus = status;
        spdlog::debug("probe {}: HTTP {}, {} bytes, ranges {}", url, status, out.contentLength,
                      out.acceptRanges ? "yes" : "not advertised");
        return out;
    }

    Result<FetchSummary> fetchRange(std::string_view url, const ByteRange& range,
                                    const BodySink& sink,
                                    const ShouldCancel& shouldCancel) override {
        if (range.empty()) {
            return FetchSummary{206, 0};
        }
        EasyHandle curl{curl_easy_init()};
        if (!curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }
        const std::string u(url);
        const std::string rangeHeader =
            "Range: bytes=" + std::to_string(range.offset) + "-" + std::to_string(range.last());
        HeaderList list{curl_slist_append(nullptr, rangeHeader.c_str())};

        WriteContext wctx;
        wctx.curl = curl.get();
        wctx.sink = &sink;
        wctx.requested = range;
        wctx.url = u;

        curl_easy_setopt(curl.get(), CURLOPT_URL, u.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &wctx);
        curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &shouldCancel);
        configureCommon(curl.get());

        CURLcode rc = curl_easy_perform(curl.get());

        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);

        if (wctx.error) {
            return *wctx.error;
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "fetchRange(GET)");
        }
        if (status >= 400) {
            return httpStatusError(status, url);
        }
        if (!wctx.statusChecked && status != 206 && status != 200) {
            return Error{ErrorCode::InvalidData,
                         fmt::format("unexpected HTTP {} for ranged GET of {}", status, url)};
        }
        return FetchSummary{status, wctx.received};
    }

private:
    void configureCommon(CURL* curl) const {
        const auto& c = config_;
        if (share_ && share_->get()) {
            curl_easy_setopt(curl, CURLOPT_SHARE, share_->get());
        }

        // Connect timeout + stall detection (below 1 byte/s for `timeout`).
        const long timeoutMs = static_cast<long>(std::max<std::int64_t>(c.timeout.count(), 1));
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeoutMs);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, std::max(1L, timeoutMs / 1000));

        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, c.followRedirects ? 1L : 0L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, c.tls.insecure ? 0L : 1L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, c.tls.insecure ? 0L : 2L);
        if (!c.tls.caPath.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, c.tls.caPath.c_str());
        }
        if (c.proxy && !c.proxy->empty()) {
            curl_easy_setopt(curl, CURLOPT_PROXY, c.proxy->c_str());
        }
        if (!c.userAgent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, c.userAgent.c_str());
        }

        curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    }

    DownloaderConfig config_;
    std::unique_ptr<CurlShare> share_;
};

} // namespace

std::shared_ptr<IHttpAdapter> makeCurlHttpAdapter(const DownloaderConfig& config) {
    return std::make_shared<CurlHttpAdapter>(config);
}

} // namespace rangefetch::downloader
