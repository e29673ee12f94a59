/*
 * http_client_curl.cpp
 *
 * Notes
 * - Synchronous POST over the libcurl easy API, one handle per request.
 * - Honors timeout, TLS verify/CA, proxy and headers.
 * - Cooperative cancellation through the transfer progress callback.
 */

#include <kbase/http/http_client.h>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <mutex>
#include <string_view>

namespace kbase::http {

namespace {

// Map CURLcode to Error
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
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
        case CURLE_SSL_CACERT_BADFILE:
        case CURLE_SSL_CERTPROBLEM:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::InvalidArgument;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

struct TransferContext {
    std::string body;
    const std::function<bool()>* shouldCancel = nullptr;
};

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    auto* ctx = static_cast<TransferContext*>(userdata);
    ctx->body.append(ptr, total);
    return total;
}

int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (ctx && ctx->shouldCancel && *ctx->shouldCancel && (*ctx->shouldCancel)()) {
        return 1; // abort => CURLE_ABORTED_BY_CALLBACK
    }
    return 0;
}

// RAII holders for the easy handle and header list
struct CurlHandleDeleter {
    void operator()(CURL* c) const {
        if (c)
            curl_easy_cleanup(c);
    }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const {
        if (l)
            curl_slist_free_all(l);
    }
};

void ensureGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

class CurlHttpClient final : public IHttpClient {
public:
    explicit CurlHttpClient(CurlClientOptions options) : options_(std::move(options)) {
        ensureGlobalInit();
    }

    Result<HttpResponse> post(const HttpRequest& request) override {
        std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
        if (!curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }

        std::unique_ptr<curl_slist, SlistDeleter> headers;
        for (const auto& h : request.headers) {
            std::string line = h.name + ": " + h.value;
            curl_slist* next = curl_slist_append(headers.get(), line.c_str());
            if (!next) {
                return Error{ErrorCode::InternalError, "curl_slist_append failed"};
            }
            headers.release();
            headers.reset(next);
        }

        TransferContext ctx;
        ctx.shouldCancel = &request.shouldCancel;

        CURL* h = curl.get();
        curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(h, CURLOPT_POST, 1L);
        curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, xferinfo_cb);
        curl_easy_setopt(h, CURLOPT_XFERINFODATA, &ctx);
        curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);

        // Timeouts
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(std::min<long>(request.timeout.count(), 30000)));

        // Redirects
        curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h, CURLOPT_MAXREDIRS, 5L);

        // TLS
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, options_.verifyTls ? 1L : 0L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, options_.verifyTls ? 2L : 0L);
        if (!options_.caPath.empty()) {
            curl_easy_setopt(h, CURLOPT_CAINFO, options_.caPath.c_str());
        }

        // Proxy
        if (!options_.proxy.empty()) {
            curl_easy_setopt(h, CURLOPT_PROXY, options_.proxy.c_str());
        }
        curl_easy_setopt(h, CURLOPT_USERAGENT, options_.userAgent.c_str());

        CURLcode rc = curl_easy_perform(h);
        if (rc != CURLE_OK) {
            auto err = makeCurlError(rc, "POST " + request.url);
            spdlog::debug("HTTP transfer failed: {}", err.message);
            return err;
        }

        HttpResponse response;
        curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
        response.body = std::move(ctx.body);
        spdlog::debug("POST {} -> {} ({} bytes)", request.url, response.status,
                      response.body.size());
        return response;
    }

private:
    CurlClientOptions options_;
};

} // namespace

std::shared_ptr<IHttpClient> makeCurlHttpClient(CurlClientOptions options) {
    return std::make_shared<CurlHttpClient>(std::move(options));
}

} // namespace kbase::http
