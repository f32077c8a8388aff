#pragma once

#include "infra/http_client.h"
#include <memory>
#include <mutex>

// Forward declaration keeps <curl/curl.h> out of dependents.
typedef void CURL;

namespace dsa::infra {

/// libcurl-backed IHttpClient: per-request timeout, cancellation through
/// CancelToken, error classification.
class CurlHttpClient : public IHttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    dsa::core::Result<HttpResponse, dsa::core::Error> execute(
        const HttpRequest& request,
        std::shared_ptr<dsa::core::CancelToken> cancel_token = nullptr
    ) override;

private:
    CURL* curl_;  // one easy handle, serialized by curl_mutex_
    std::mutex curl_mutex_;
};

} // namespace dsa::infra
