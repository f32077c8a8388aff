#include "infra/http_client.h"

#include <charconv>

namespace dsa::infra {

dsa::core::Error make_http_error(
    HttpErrorCode code,
    const std::string &message,
    const std::string &internal_message,
    bool retryable
) {
  dsa::core::ErrorCategory category = dsa::core::ErrorCategory::Unknown;
  switch (code) {
  case HttpErrorCode::NETWORK_ERROR:
  case HttpErrorCode::SERVER_ERROR:
  case HttpErrorCode::RATE_LIMIT:
  case HttpErrorCode::CLIENT_ERROR:
    category = dsa::core::ErrorCategory::Network;
    break;
  case HttpErrorCode::TIMEOUT:
    category = dsa::core::ErrorCategory::Timeout;
    break;
  case HttpErrorCode::CANCELED:
    category = dsa::core::ErrorCategory::Canceled;
    break;
  case HttpErrorCode::PARSE_ERROR:
    category = dsa::core::ErrorCategory::Internal;
    break;
  case HttpErrorCode::UNKNOWN:
    category = dsa::core::ErrorCategory::Unknown;
    break;
  }

  std::map<std::string, std::string> details = {
      {"http_error_code", std::to_string(static_cast<int>(code))},
      {"internal", internal_message}};

  return dsa::core::Error(category, static_cast<int>(code), message, retryable,
                          std::move(details));
}

HttpErrorCode http_error_code(const dsa::core::Error &error) {
  const std::string value = error.detail("http_error_code");
  if (value.empty()) {
    return HttpErrorCode::UNKNOWN;
  }
  int parsed = 0;
  auto [ptr, ec] =
      std::from_chars(value.data(), value.data() + value.size(), parsed);
  if (ec != std::errc() || ptr != value.data() + value.size()) {
    return HttpErrorCode::UNKNOWN;
  }
  return static_cast<HttpErrorCode>(parsed);
}

} // namespace dsa::infra
