/*
 * http_client_curl.cpp
 *
 * Notes
 * - IHttpClient on the libcurl easy API; one easy handle per request.
 * - Handles share a CURLSH (connections, DNS, TLS sessions) so the client behaves
 *   as a connection pool that every worker can use concurrently.
 * - HTTPS only, including redirects. TLS peer and host verification always on.
 * - Whole-body fetches negotiate compression; range fetches ask for the identity
 *   encoding because their offsets must address the stored bytes.
 * - Single attempt per call; retries belong to the decorator in http_client_retry.cpp.
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <mlget/downloader/http_client.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <mutex>
#include <string_view>

namespace mlget::downloader {

namespace {

// Local helper: lowercase copy
std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

// Local helper: trim whitespace
std::string_view trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(b, e - b);
}

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where, std::string_view url) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    err.url = std::string(url);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::Success;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorCode::TlsError;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::InvalidArgument;
            err.message = std::string(where) + ": only https:// urls are allowed";
            break;
        case CURLE_BAD_CONTENT_ENCODING:
            err.code = ErrorCode::InvalidData;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

// 5xx, 408 and 429 are worth retrying; every other error status is final
Error makeHttpStatusError(long status, std::string_view where, std::string_view url) {
    const bool transient = status >= 500 || status == 408 || status == 429;
    Error err{transient ? ErrorCode::ServerError : ErrorCode::HttpError,
              std::string(where) + ": HTTP status " + std::to_string(status)};
    err.url = std::string(url);
    return err;
}

// Header parser context
struct HeaderParseContext {
    std::optional<std::uint64_t> contentLength{};
};

// CURL header callback
size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<HeaderParseContext*>(userdata);
    std::string_view line(buffer, total);

    // A status line starts a new response (redirect chains); forget earlier headers
    if (line.size() >= 5 && line.substr(0, 5) == "HTTP/") {
        ctx->contentLength.reset();
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    auto key = to_lower(trim(line.substr(0, colon)));
    auto val = trim(line.substr(colon + 1));

    if (key == "content-length") {
        std::uint64_t tmp{0};
        auto res = std::from_chars(val.data(), val.data() + val.size(), tmp);
        if (res.ec == std::errc()) {
            ctx->contentLength = tmp;
        }
    }
    return total;
}

// Bounded in-memory body for range requests
struct BufferContext {
    ByteVector* out{nullptr};
    std::uint64_t limit{0};
    bool overflow{false};
};

size_t buffer_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* ctx = static_cast<BufferContext*>(userdata);
    if (ctx == nullptr || total == 0)
        return 0;

    if (ctx->out->size() + total > ctx->limit) {
        ctx->overflow = true;
        return 0; // abort => CURLE_WRITE_ERROR
    }
    auto* first = reinterpret_cast<const std::byte*>(ptr);
    ctx->out->insert(ctx->out->end(), first, first + total);
    return total;
}

// Streaming body for whole-file requests
struct SinkContext {
    const BodySink* sink{nullptr};
    std::uint64_t offset{0};
    std::optional<Error> error;
};

size_t sink_write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* ctx = static_cast<SinkContext*>(userdata);
    if (ctx == nullptr || total == 0)
        return 0;

    auto r = (*ctx->sink)(ctx->offset, ByteSpan{reinterpret_cast<const std::byte*>(ptr), total});
    if (!r) {
        ctx->error = r.error();
        return 0;
    }
    ctx->offset += total;
    return total;
}

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            spdlog::error("curl_global_init failed");
        }
    });
}

/**
 * Shared connection/DNS/TLS-session cache with the locking libcurl requires when
 * easy handles on different threads use it.
 */
class CurlShare {
public:
    CurlShare() {
        ensure_curl_global_init();
        share_ = curl_share_init();
        if (!share_)
            return;
        curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, &CurlShare::lock_cb);
        curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, &CurlShare::unlock_cb);
        curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
        curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
        curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
    }

    ~CurlShare() {
        if (share_)
            curl_share_cleanup(share_);
    }

    CurlShare(const CurlShare&) = delete;
    CurlShare& operator=(const CurlShare&) = delete;

    CURLSH* get() const noexcept { return share_; }

private:
    static void lock_cb(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
        static_cast<CurlShare*>(userptr)->locks_[static_cast<std::size_t>(data)].lock();
    }

    static void unlock_cb(CURL*, curl_lock_data data, void* userptr) {
        static_cast<CurlShare*>(userptr)->locks_[static_cast<std::size_t>(data)].unlock();
    }

    CURLSH* share_{nullptr};
    std::array<std::mutex, static_cast<std::size_t>(CURL_LOCK_DATA_LAST)> locks_;
};

class CurlHttpClient final : public IHttpClient {
public:
    explicit CurlHttpClient(HttpClientOptions options) : options_(std::move(options)) {}

    ~CurlHttpClient() override = default;

    Result<std::optional<std::uint64_t>> headSize(std::string_view url) override {
        auto curl = newHandle(url, /*compressed=*/false);
        if (!curl)
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};

        HeaderParseContext hctx{};
        curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &hctx);

        CURLcode rc = curl_easy_perform(curl.get());
        if (auto err = checkTransfer(curl.get(), rc, "HEAD", url))
            return *err;

        spdlog::debug("HEAD {} -> content-length {}", url,
                      hctx.contentLength ? std::to_string(*hctx.contentLength) : "unknown");
        return hctx.contentLength;
    }

    Result<ByteVector> getRange(std::string_view url, std::uint64_t start,
                                std::uint64_t end) override {
        if (end < start) {
            return Error{ErrorCode::InvalidArgument, "Invalid byte range"}.withUrl(
                std::string(url));
        }
        const std::uint64_t expected = end - start + 1;

        auto curl = newHandle(url, /*compressed=*/false);
        if (!curl)
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};

        const std::string rangeHeader =
            "Range: bytes=" + std::to_string(start) + "-" + std::to_string(end);
        HeaderList list(curl_slist_append(nullptr, rangeHeader.c_str()), &curl_slist_free_all);
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, list.get());
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);

        ByteVector body;
        body.reserve(static_cast<std::size_t>(expected));
        BufferContext bctx{&body, expected, false};
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, buffer_write_cb);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &bctx);

        CURLcode rc = curl_easy_perform(curl.get());
        if (bctx.overflow) {
            return Error{ErrorCode::InvalidData, "Response body exceeds the requested range"}
                .withUrl(std::string(url))
                .withOffset(start);
        }
        if (auto err = checkTransfer(curl.get(), rc, "GET range", url))
            return Error{*err}.withOffset(start);

        long status = 0;
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
        if (status == 200 && start != 0) {
            return Error{ErrorCode::InvalidData, "Server ignored the range request"}
                .withUrl(std::string(url))
                .withOffset(start);
        }
        if (status != 200 && status != 206) {
            return Error{ErrorCode::InvalidData,
                         "Unexpected HTTP status " + std::to_string(status) +
                             " for range request"}
                .withUrl(std::string(url))
                .withOffset(start);
        }
        if (body.size() != expected) {
            return Error{ErrorCode::NetworkError, "Truncated range response: got " +
                                                      std::to_string(body.size()) + " of " +
                                                      std::to_string(expected) + " bytes"}
                .withUrl(std::string(url))
                .withOffset(start);
        }
        return body;
    }

    Result<std::uint64_t> getFull(std::string_view url, const BodySink& sink) override {
        auto curl = newHandle(url, /*compressed=*/true);
        if (!curl)
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};

        SinkContext sctx{&sink, 0, std::nullopt};
        curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, sink_write_cb);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &sctx);

        CURLcode rc = curl_easy_perform(curl.get());
        if (sctx.error)
            return *sctx.error;
        if (auto err = checkTransfer(curl.get(), rc, "GET", url))
            return *err;
        return sctx.offset;
    }

private:
    CurlHandle newHandle(std::string_view url, bool compressed) const {
        CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
        if (!curl)
            return curl;
        configure_common(curl.get(), std::string(url), compressed);
        return curl;
    }

    // Common CURL easy handle configuration
    void configure_common(CURL* curl, const std::string& url, bool compressed) const {
        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        if (share_.get())
            curl_easy_setopt(curl, CURLOPT_SHARE, share_.get());
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);

        if (!options_.userAgent.empty())
            curl_easy_setopt(curl, CURLOPT_USERAGENT, options_.userAgent.c_str());
        if (compressed)
            curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, ""); // all built-in encodings

        // Timeouts
        const long timeoutMs = static_cast<long>(options_.timeout.count());
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeoutMs);
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, std::min<long>(timeoutMs, 30000));

        // Redirects, https only
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
        curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "https");
        curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "https");

        // TLS
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
        if (!options_.tls.caPath.empty()) {
            curl_easy_setopt(curl, CURLOPT_CAINFO, options_.tls.caPath.c_str());
        }

        // Robustness
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
        curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
        curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    }

    std::optional<Error> checkTransfer(CURL* curl, CURLcode rc, std::string_view where,
                                       std::string_view url) const {
        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
        if (rc == CURLE_HTTP_RETURNED_ERROR || (rc == CURLE_OK && status >= 400)) {
            return makeHttpStatusError(status, where, url);
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, where, url);
        }
        return std::nullopt;
    }

    HttpClientOptions options_;
    CurlShare share_;
};

} // namespace

std::shared_ptr<IHttpClient> makeCurlHttpClient(const HttpClientOptions& options) {
    return std::make_shared<CurlHttpClient>(options);
}

} // namespace mlget::downloader
