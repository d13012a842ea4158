/*
 * libcurl implementation of IHttpAdapter
 *
 * - probeContentLength() issues a HEAD request and reads Content-Length.
 * - fetch() streams a GET to the caller's sink; HTTP status >= 400 is a failure and no
 *   body bytes reach the sink in that case.
 * - Honors connect/overall timeouts, headers and redirects; TLS verification stays on.
 * - A connection that delivers nothing for the read timeout is aborted as Timeout.
 */

#include <modelpull/config/config_helpers.h>
#include <modelpull/transfer/transfer.hpp>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <mutex>
#include <string_view>

namespace modelpull::transfer {

namespace {

constexpr std::string_view kContentLength = "content-length";

bool is_content_length(std::string_view name) {
    return std::ranges::equal(name, kContentLength, [](unsigned char a, unsigned char b) {
        return std::tolower(a) == b;
    });
}

} // namespace

// Map CURLcode to Error
static Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::Success;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_WRITE_ERROR:
            err.code = ErrorCode::IoError;
            break;
        default:
            err.code = ErrorCode::NetworkError;
            break;
    }
    return err;
}

// Header parser context
struct HeaderParseContext {
    std::optional<std::uint64_t> contentLength{};
};

// CURL header callback
static size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<HeaderParseContext*>(userdata);
    std::string_view line(buffer, total);

    // A new status line starts a new header block (redirect hops)
    if (line.starts_with("HTTP/")) {
        ctx->contentLength.reset();
        return total;
    }

    auto colon = line.find(':');
    if (colon == std::string_view::npos)
        return total;

    std::string name(line.substr(0, colon));
    config::trim(name);
    if (is_content_length(name)) {
        std::string val(line.substr(colon + 1));
        config::trim(val);
        std::uint64_t tmp{0};
        auto res = std::from_chars(val.data(), val.data() + val.size(), tmp);
        if (res.ec == std::errc()) {
            ctx->contentLength = tmp;
        }
    }
    return total;
}

// Write sink context for fetch
struct WriteContext {
    const ChunkSink* sink{nullptr};
    const ContentLengthCallback* onContentLength{nullptr};
    HeaderParseContext* headers{nullptr};
    bool started{false};
    std::optional<Error> sinkError{};
};

// CURL write callback
static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (!ctx->started) {
        ctx->started = true;
        if (ctx->onContentLength && *ctx->onContentLength) {
            (*ctx->onContentLength)(ctx->headers->contentLength);
        }
    }
    if (total == 0)
        return 0;

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = (ctx->sink && *ctx->sink)
                 ? (*ctx->sink)(bytes)
                 : Result<void>{Error{ErrorCode::IoError, "No sink provided"}};
    if (!r) {
        ctx->sinkError = r.error();
        return 0; // signal error to curl => CURLE_WRITE_ERROR
    }
    return total;
}

// Helper to build curl_slist from headers
static curl_slist* build_header_list(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

// Common CURL easy handle configuration
static void configure_common(CURL* curl, std::chrono::milliseconds connectTimeout,
                             std::chrono::milliseconds timeout, std::chrono::seconds readTimeout,
                             bool followRedirects) {
    if (timeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    }
    if (connectTimeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(connectTimeout.count()));
    }
    // Stalled peers: below 1 byte/s for readTimeout seconds => CURLE_OPERATION_TIMEDOUT
    if (readTimeout.count() > 0) {
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(readTimeout.count()));
    }

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    // TLS
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    // Robustness
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
}

static void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter() { ensure_curl_global_init(); }
    ~CurlHttpAdapter() override = default;

    Result<std::optional<std::uint64_t>>
    probeContentLength(std::string_view url, const std::vector<Header>& headers,
                       std::chrono::milliseconds timeout) override {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }

        auto* list = build_header_list(headers);
        HeaderParseContext hctx{};

        curl_easy_setopt(curl, CURLOPT_URL, std::string(url).c_str());
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &hctx);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);

        const auto stall = std::max(std::chrono::seconds{1},
                                    std::chrono::duration_cast<std::chrono::seconds>(timeout));
        configure_common(curl, timeout, timeout, stall, /*followRedirects=*/true);

        CURLcode rc = curl_easy_perform(curl);
        long http_status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

        if (list)
            curl_slist_free_all(list);
        curl_easy_cleanup(curl);

        if (rc == CURLE_HTTP_RETURNED_ERROR) {
            return Error{ErrorCode::NetworkError, "probe(HEAD): HTTP error " +
                                                      std::to_string(http_status)};
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "probe(HEAD)");
        }
        return hctx.contentLength;
    }

    Result<void> fetch(std::string_view url, const std::vector<Header>& headers,
                       const FetchOptions& options, const ContentLengthCallback& onContentLength,
                       const ChunkSink& sink) override {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }

        curl_slist* list = build_header_list(headers);

        curl_easy_setopt(curl, CURLOPT_URL, std::string(url).c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);

        HeaderParseContext hctx{};
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &hctx);

        WriteContext wctx;
        wctx.sink = &sink;
        wctx.onContentLength = &onContentLength;
        wctx.headers = &hctx;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &wctx);

        configure_common(curl, options.connectTimeout, options.timeout, options.readTimeout,
                         options.followRedirects);

        CURLcode rc = curl_easy_perform(curl);

        long http_status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_status);

        if (list)
            curl_slist_free_all(list);
        curl_easy_cleanup(curl);

        if (wctx.sinkError) {
            return *wctx.sinkError;
        }
        if (rc == CURLE_HTTP_RETURNED_ERROR) {
            return Error{ErrorCode::NetworkError, "HTTP error " + std::to_string(http_status)};
        }
        if (rc != CURLE_OK) {
            return makeCurlError(rc, "fetch(GET)");
        }
        if (!wctx.started && onContentLength) {
            // Empty body: the write callback never ran
            onContentLength(hctx.contentLength);
        }

        spdlog::debug("HTTP fetch finished with status {}", http_status);
        return Result<void>{};
    }
};

/// Factory: higher layers create the adapter through this.
std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    return std::make_unique<CurlHttpAdapter>();
}

} // namespace modelpull::transfer
