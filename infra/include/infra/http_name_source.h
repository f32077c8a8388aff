#pragma once

#include "core/stock_name_service.h"
#include "infra/http_client.h"

#include <memory>
#include <string>

namespace dsa::infra {

/// INameSource over HTTP. GET <base_url>/<a|hk|us> returns one
/// "code<TAB>name" pair per line; blank lines and '#' comments are skipped.
///
/// The time left until the caller's deadline becomes the request timeout,
/// so a fetch never outlives its budget.
class HttpNameSource : public dsa::core::INameSource {
public:
  HttpNameSource(std::shared_ptr<IHttpClient> http_client,
                 std::string base_url);

  dsa::core::Result<Listing, dsa::core::Error>
  fetch(dsa::core::Market market, Deadline deadline,
        std::shared_ptr<dsa::core::CancelToken> cancel) override;

  [[nodiscard]] std::string url_for(dsa::core::Market market) const;

  /// Parse a listing body. Lines without a tab are a PARSE_ERROR.
  static dsa::core::Result<Listing, dsa::core::Error>
  parse_listing(const std::string &body);

private:
  std::shared_ptr<IHttpClient> http_client_;
  std::string base_url_;
};

} // namespace dsa::infra
