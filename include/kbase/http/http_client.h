#pragma once

#include <kbase/core/types.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace kbase::http {

struct Header {
    std::string name;
    std::string value;
};

struct HttpRequest {
    std::string url;
    std::vector<Header> headers;
    std::string body;
    std::chrono::milliseconds timeout{30000};
    /// Polled during the transfer; returning true aborts it
    std::function<bool()> shouldCancel;
};

struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * @brief Minimal POST transport used by the embedding backends
 *
 * Transport failures (DNS, connect, TLS, timeout, cancellation) are errors;
 * any HTTP status, including 4xx/5xx, is a successful response.
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;
    virtual Result<HttpResponse> post(const HttpRequest& request) = 0;
};

struct CurlClientOptions {
    bool verifyTls = true;
    std::string caPath;
    std::string proxy;
    std::string userAgent = "kbase/1.0";
};

std::shared_ptr<IHttpClient> makeCurlHttpClient(CurlClientOptions options = {});

} // namespace kbase::http
