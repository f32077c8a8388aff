#include "infra/curl_http_client.h"

#include <curl/curl.h>

#include <chrono>
#include <stdexcept>
#include <string>

namespace dsa::infra {

namespace {

struct CurlGlobalInit {
    CurlGlobalInit() { curl_global_init(CURL_GLOBAL_ALL); }
    ~CurlGlobalInit() { curl_global_cleanup(); }
};
CurlGlobalInit g_curl_init;

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::string*>(userdata);
    const size_t total = size * nmemb;
    buffer->append(ptr, total);
    return total;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* cancel_token = static_cast<dsa::core::CancelToken*>(clientp);
    return cancel_token != nullptr && cancel_token->is_canceled() ? 1 : 0;
}

HttpErrorCode classify_curl_error(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
            return HttpErrorCode::NETWORK_ERROR;
        case CURLE_OPERATION_TIMEDOUT:
            return HttpErrorCode::TIMEOUT;
        case CURLE_ABORTED_BY_CALLBACK:
            return HttpErrorCode::CANCELED;
        default:
            return HttpErrorCode::UNKNOWN;
    }
}

} // namespace

CurlHttpClient::CurlHttpClient() : curl_(curl_easy_init()) {
    if (!curl_) {
        throw std::runtime_error("Failed to initialize CURL");
    }
}

CurlHttpClient::~CurlHttpClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
}

dsa::core::Result<HttpResponse, dsa::core::Error> CurlHttpClient::execute(
    const HttpRequest& request,
    std::shared_ptr<dsa::core::CancelToken> cancel_token
) {
    using Result = dsa::core::Result<HttpResponse, dsa::core::Error>;

    if (request.url.empty()) {
        return Result::Err(make_http_error(HttpErrorCode::CLIENT_ERROR,
                                           "Request URL is empty", "empty url"));
    }
    if (request.timeout <= std::chrono::milliseconds::zero()) {
        return Result::Err(make_http_error(HttpErrorCode::TIMEOUT,
                                           "Request deadline already passed",
                                           "non-positive timeout for " + request.url));
    }

    std::lock_guard<std::mutex> lock(curl_mutex_);
    curl_easy_reset(curl_);

    curl_easy_setopt(curl_, CURLOPT_URL, request.url.c_str());
    const long timeout_ms = static_cast<long>(request.timeout.count());
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);

    if (request.method == HttpMethod::POST) {
        curl_easy_setopt(curl_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else {
        curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
    }

    struct curl_slist* headers = nullptr;
    for (const auto& [key, value] : request.headers) {
        const std::string header = key + ": " + value;
        headers = curl_slist_append(headers, header.c_str());
    }
    if (headers) {
        curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
    }

    std::string response_buffer;
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, &write_callback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response_buffer);

    if (cancel_token) {
        curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, &progress_callback);
        curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, cancel_token.get());
        curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
    }

    const auto start_time = std::chrono::steady_clock::now();
    const CURLcode res = curl_easy_perform(curl_);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    if (headers) {
        curl_slist_free_all(headers);
    }

    if (res != CURLE_OK) {
        const HttpErrorCode code = classify_curl_error(res);
        std::string message;
        switch (code) {
            case HttpErrorCode::NETWORK_ERROR:
                message = "Network error while fetching " + request.url;
                break;
            case HttpErrorCode::TIMEOUT:
                message = "Request to " + request.url + " timed out";
                break;
            case HttpErrorCode::CANCELED:
                message = "Request to " + request.url + " was canceled";
                break;
            default:
                message = "Request to " + request.url + " failed";
                break;
        }
        const std::string internal = std::string("CURL error: ") +
                                     curl_easy_strerror(res) +
                                     " (code: " + std::to_string(res) + ")";
        return Result::Err(make_http_error(code, message, internal,
                                           code != HttpErrorCode::CANCELED));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);
    const std::string status = "HTTP " + std::to_string(http_code);

    if (http_code >= 500) {
        return Result::Err(make_http_error(HttpErrorCode::SERVER_ERROR,
                                           "Server error from " + request.url,
                                           status, true));
    }
    if (http_code == 429) {
        return Result::Err(make_http_error(HttpErrorCode::RATE_LIMIT,
                                           "Rate limited by " + request.url,
                                           status, true));
    }
    if (http_code >= 400) {
        return Result::Err(make_http_error(HttpErrorCode::CLIENT_ERROR,
                                           "Request rejected by " + request.url,
                                           status, false));
    }

    HttpResponse response;
    response.status_code = static_cast<int>(http_code);
    response.body = std::move(response_buffer);
    response.elapsed_ms = elapsed;
    return Result::Ok(std::move(response));
}

} // namespace dsa::infra
