/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - Single GET/RETR per fetch() using the libcurl easy API.
 * - Honors timeout, TLS verify/CA, proxy, headers, redirects and credentials (basic or bearer).
 * - Reports the final response head before the first body byte; non-2xx bodies are drained.
 * - FTP refusals (550 and friends) come back as a response status instead of an error so
 *   the caller can classify them like HTTP statuses.
 * - Cooperative cancellation through std::stop_token (write + xferinfo callbacks).
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <geofetch/downloader/downloader.hpp>

#include "curl_global.h"

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <mutex>
#include <string_view>

namespace geofetch::downloader {

// Local helper: lowercase copy
static std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s)
        out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

// Local helper: trim whitespace
static std::string trim(std::string_view s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string{s.substr(b, e - b)};
}

static bool is_http_url(std::string_view url) {
    auto l = to_lower(url.substr(0, std::min<size_t>(url.size(), 8)));
    return l.rfind("http://", 0) == 0 || l.rfind("https://", 0) == 0;
}

// Map CURLcode to Error
static Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::None;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        /* CURLE_SSL_CACERT is an alias of CURLE_PEER_FAILED_VERIFICATION in newer libcurl */
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
        case CURLE_SSL_CIPHER:
        case CURLE_SSL_ISSUER_ERROR:
            err.code = ErrorCode::TlsVerificationFailed;
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
        case CURLE_LOGIN_DENIED:
            err.code = ErrorCode::AuthenticationError;
            break;
        case CURLE_WRITE_ERROR:
            err.code = ErrorCode::IoError;
            break;
        case CURLE_ABORTED_BY_CALLBACK:
            err.code = ErrorCode::Cancelled;
            break;
        default:
            err.code = ErrorCode::NetworkError;
            break;
    }
    return err;
}

// Header parser context; reset on every status line so only the final response survives
struct HeaderParseContext {
    std::optional<std::uint64_t> contentLength{};
    std::optional<std::string> contentDisposition;
    std::optional<std::string> retryAfter;
    std::optional<std::string> etag;
};

// CURL header callback
static size_t header_cb(char* buffer, size_t size, size_t nitems, void* userdata) {
    const size_t total = size * nitems;
    if (total == 0 || userdata == nullptr)
        return 0;

    auto* ctx = static_cast<HeaderParseContext*>(userdata);
    std::string_view line(buffer, total);

    // Strip CRLF
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    if (line.rfind("HTTP/", 0) == 0) {
        *ctx = HeaderParseContext{};
        return total;
    }

    // We expect "Key: Value"
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
    } else if (key == "content-disposition") {
        ctx->contentDisposition = std::move(val);
    } else if (key == "retry-after") {
        ctx->retryAfter = std::move(val);
    } else if (key == "etag") {
        // Strip surrounding quotes if present
        if (val.size() >= 2 && val.front() == '"' && val.back() == '"') {
            val = val.substr(1, val.size() - 2);
        }
        ctx->etag = std::move(val);
    }

    return total;
}

// Write sink context
struct WriteContext {
    CURL* curl{nullptr};
    bool http{true};
    const HeaderParseContext* headers{nullptr};
    const std::function<bool(const ResponseHead&)>* onResponse{nullptr};
    const std::function<Expected<void>(std::span<const std::byte>)>* sink{nullptr};
    std::stop_token cancel;

    bool headSeen{false};
    bool deliver{false};
    std::uint64_t downloaded{0};
    bool cancelRequested{false};
    std::optional<Error> sinkError;
};

static ResponseHead snapshot_head(CURL* curl, const HeaderParseContext& h, bool http) {
    ResponseHead head;
    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    // FTP reports 150 while the data connection is open
    head.status = (!http && code < 200) ? 200 : code;
    head.contentLength = h.contentLength;
    head.contentDisposition = h.contentDisposition;
    head.retryAfter = h.retryAfter;
    head.etag = h.etag;
    return head;
}

static void announce_head(WriteContext& ctx) {
    if (ctx.headSeen)
        return;
    ctx.headSeen = true;
    auto head = snapshot_head(ctx.curl, *ctx.headers, ctx.http);
    const bool wanted = (*ctx.onResponse) ? (*ctx.onResponse)(head) : true;
    const bool success = head.status >= 200 && head.status < 300;
    ctx.deliver = wanted && success;
}

// CURL write callback
static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;

    auto* ctx = static_cast<WriteContext*>(userdata);
    if (total == 0)
        return 0;

    if (ctx->cancel.stop_requested()) {
        ctx->cancelRequested = true;
        return 0; // signal error to curl => CURLE_WRITE_ERROR
    }

    announce_head(*ctx);
    if (!ctx->deliver) {
        // Drain
        return total;
    }

    std::span<const std::byte> bytes{reinterpret_cast<const std::byte*>(ptr), total};
    auto r = (*ctx->sink) ? (*ctx->sink)(bytes)
                          : Expected<void>{Error{ErrorCode::IoError, "No sink provided"}};
    if (!r.ok()) {
        ctx->sinkError = r.error();
        return 0;
    }

    ctx->downloaded += static_cast<std::uint64_t>(total);
    return total;
}

static int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<WriteContext*>(userdata);
    if (ctx != nullptr && ctx->cancel.stop_requested()) {
        ctx->cancelRequested = true;
        return 1;
    }
    return 0;
}

// Helper to build curl_slist from headers
static curl_slist* build_header_list(const std::vector<Header>& headers,
                                     const std::optional<std::string>& bearer) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    if (bearer) {
        std::string line = "Authorization: Bearer " + *bearer;
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

// Common CURL easy handle configuration
static void configure_common(CURL* curl, std::chrono::milliseconds timeout, const TlsConfig& tls,
                             const std::optional<std::string>& proxy, bool followRedirects) {
    // Timeouts
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min<long>(timeout.count(), 30000)));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Redirects
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, followRedirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);

    // TLS (opportunistic for FTP, implied by https://)
    curl_easy_setopt(curl, CURLOPT_USE_SSL, CURLUSESSL_TRY);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, tls.insecure ? 0L : 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, tls.insecure ? 0L : 2L);
    if (!tls.caPath.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, tls.caPath.c_str());
    }

    // Proxy
    if (proxy && !proxy->empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXY, proxy->c_str());
    }

    // Robustness
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
}

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter() = default;
    ~CurlHttpAdapter() override = default;

    Expected<TransportResponse>
    fetch(const TransferSpec& spec, const std::function<bool(const ResponseHead&)>& onResponse,
          const std::function<Expected<void>(std::span<const std::byte>)>& sink,
          std::stop_token cancel) override {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::Unknown, "curl_easy_init failed"};
        }

        const bool http = is_http_url(spec.url);
        curl_slist* list = build_header_list(spec.headers, spec.auth.bearerToken);

        curl_easy_setopt(curl, CURLOPT_URL, spec.url.c_str());
        if (http) {
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        }
        if (list) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
        }

        // Basic credentials; for ftp:// these become USER/PASS, otherwise anonymous login
        if (spec.auth.username) {
            curl_easy_setopt(curl, CURLOPT_USERNAME, spec.auth.username->c_str());
            curl_easy_setopt(curl, CURLOPT_PASSWORD,
                             spec.auth.password ? spec.auth.password->c_str() : "");
            if (http) {
                curl_easy_setopt(curl, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
            }
        }

        HeaderParseContext hctx{};
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_cb);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &hctx);

        WriteContext wctx;
        wctx.curl = curl;
        wctx.http = http;
        wctx.headers = &hctx;
        wctx.onResponse = &onResponse;
        wctx.sink = &sink;
        wctx.cancel = cancel;
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &wctx);
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &wctx);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);

        configure_common(curl, spec.timeout, spec.tls, spec.proxy, spec.followRedirects);

        CURLcode rc = curl_easy_perform(curl);

        long status = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);

        Expected<TransportResponse> result{Error{ErrorCode::Unknown, "transfer not completed"}};
        if (wctx.cancelRequested || cancel.stop_requested()) {
            result = Error{ErrorCode::Cancelled, "Transfer cancelled"};
        } else if (wctx.sinkError) {
            result = *wctx.sinkError;
        } else if (rc != CURLE_OK && !http && status >= 400 &&
                   (rc == CURLE_REMOTE_FILE_NOT_FOUND || rc == CURLE_FTP_COULDNT_RETR_FILE ||
                    rc == CURLE_REMOTE_ACCESS_DENIED)) {
            // FTP refusal: surface the reply code as a response status
            spdlog::debug("FTP server refused {} with reply {}", withoutQuery(spec.url), status);
            announce_head(wctx);
            result = TransportResponse{snapshot_head(curl, hctx, http), wctx.downloaded};
        } else if (rc != CURLE_OK) {
            result = makeCurlError(rc, "fetch");
        } else {
            // Responses without a body never reached write_cb
            announce_head(wctx);
            TransportResponse response;
            response.head = snapshot_head(curl, hctx, http);
            response.bodyBytes = wctx.downloaded;
            if (hctx.etag) {
                spdlog::debug("HTTP fetch captured ETag: {}", *hctx.etag);
            }
            result = std::move(response);
        }

        if (list)
            curl_slist_free_all(list);
        curl_easy_cleanup(curl);
        return result;
    }
};

namespace {
std::once_flag g_curlInit;
}

void ensureCurlGlobalInit() {
    std::call_once(g_curlInit, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            spdlog::error("curl_global_init failed");
        }
    });
}

/// Factory: the production transport for the orchestrator.
std::shared_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    ensureCurlGlobalInit();
    return std::make_shared<CurlHttpAdapter>();
}

} // namespace geofetch::downloader
