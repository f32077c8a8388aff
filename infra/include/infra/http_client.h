#pragma once
#include "core/cancel_token.h"
#include "core/error.h"
#include "core/result.h"
#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace dsa::infra {

enum class HttpMethod {
    GET,
    POST
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    std::string trace_id;  // carried into logs and error details
    std::chrono::milliseconds timeout{30000};
};

struct HttpResponse {
    int status_code = 0;
    std::string body;
    std::chrono::milliseconds elapsed_ms{0};
};

// Failure classes, stored in Error::details["http_error_code"].
enum class HttpErrorCode {
    NETWORK_ERROR = 1001,    // unreachable host, DNS failure, refused
    TIMEOUT = 1002,          // connect or transfer deadline exceeded
    CANCELED = 1003,         // CancelToken fired
    SERVER_ERROR = 1004,     // 5xx
    CLIENT_ERROR = 1005,     // 4xx other than 429
    RATE_LIMIT = 1006,       // 429
    PARSE_ERROR = 1007,      // body not in the expected format
    UNKNOWN = 1999
};

dsa::core::Error make_http_error(
    HttpErrorCode code,
    const std::string& message,
    const std::string& internal_message,
    bool retryable = false
);

/// Classification stored by make_http_error(); UNKNOWN when absent.
HttpErrorCode http_error_code(const dsa::core::Error& error);

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual dsa::core::Result<HttpResponse, dsa::core::Error> get(
        const HttpRequest& request,
        std::shared_ptr<dsa::core::CancelToken> cancel_token = nullptr
    ) {
        HttpRequest req = request;
        req.method = HttpMethod::GET;
        return execute(req, std::move(cancel_token));
    }

    /// Synchronous request. Non-2xx statuses come back as errors.
    virtual dsa::core::Result<HttpResponse, dsa::core::Error> execute(
        const HttpRequest& request,
        std::shared_ptr<dsa::core::CancelToken> cancel_token = nullptr
    ) = 0;
};

} // namespace dsa::infra
