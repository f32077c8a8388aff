#include "infra/http_name_source.h"

#include <chrono>
#include <sstream>

namespace dsa::infra {

namespace {

const char *market_path(dsa::core::Market market) {
  switch (market) {
  case dsa::core::Market::AShare:
    return "a";
  case dsa::core::Market::HongKong:
    return "hk";
  case dsa::core::Market::US:
    return "us";
  }
  return "a";
}

} // namespace

HttpNameSource::HttpNameSource(std::shared_ptr<IHttpClient> http_client,
                               std::string base_url)
    : http_client_(std::move(http_client)), base_url_(std::move(base_url)) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string HttpNameSource::url_for(dsa::core::Market market) const {
  return base_url_ + "/" + market_path(market);
}

dsa::core::Result<HttpNameSource::Listing, dsa::core::Error>
HttpNameSource::fetch(dsa::core::Market market, Deadline deadline,
                      std::shared_ptr<dsa::core::CancelToken> cancel) {
  using R = dsa::core::Result<Listing, dsa::core::Error>;

  if (!http_client_) {
    return R::Err(dsa::core::Error::Internal("HTTP client is null"));
  }
  if (cancel && cancel->is_canceled()) {
    return R::Err(dsa::core::Error::Canceled("Name fetch canceled"));
  }
  const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
      deadline - std::chrono::steady_clock::now());
  if (remaining <= std::chrono::milliseconds::zero()) {
    return R::Err(dsa::core::Error::Timeout(
        std::string("Deadline passed before fetching ") +
        dsa::core::to_string(market)));
  }

  HttpRequest request;
  request.method = HttpMethod::GET;
  request.url = url_for(market);
  request.trace_id = std::string("names-") + market_path(market);
  request.timeout = remaining;
  request.headers["Accept"] = "text/tab-separated-values";

  auto response = http_client_->get(request, std::move(cancel));
  if (response.is_err()) {
    return R::Err(response.error());
  }
  return parse_listing(response.value().body);
}

dsa::core::Result<HttpNameSource::Listing, dsa::core::Error>
HttpNameSource::parse_listing(const std::string &body) {
  using R = dsa::core::Result<Listing, dsa::core::Error>;
  Listing listing;
  std::istringstream in(body);
  std::string line;
  int line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty() || line.front() == '#') {
      continue;
    }
    const size_t tab = line.find('\t');
    if (tab == std::string::npos || tab == 0 || tab + 1 == line.size()) {
      return R::Err(make_http_error(
          HttpErrorCode::PARSE_ERROR, "Malformed listing line " +
                                          std::to_string(line_no),
          line));
    }
    listing.emplace_back(line.substr(0, tab), line.substr(tab + 1));
  }
  return R::Ok(std::move(listing));
}

} // namespace dsa::infra
