#include "core/stock_name_service.h"

#include "core/logger.h"

#include <algorithm>
#include <array>
#include <cctype>

namespace dsa::core {

namespace {

constexpr const char *kComponent = "stock_names";
constexpr const char *kTrace = "names";
constexpr std::array<Market, 3> kMarkets = {Market::AShare, Market::HongKong,
                                            Market::US};
constexpr std::size_t kMaxListedNew = 10;

// now + timeout, clamped to INameSource::Deadline::max() instead of overflowing.
INameSource::Deadline deadline_after(std::chrono::milliseconds timeout) {
  const auto now = std::chrono::steady_clock::now();
  if (timeout <= std::chrono::milliseconds::zero()) {
    return now;
  }
  const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
      INameSource::Deadline::max() - now);
  if (timeout >= headroom) {
    return INameSource::Deadline::max();
  }
  return now + timeout;
}

std::string trim_upper(const std::string &s) {
  std::size_t begin = 0;
  std::size_t end = s.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
    --end;
  }
  std::string out = s.substr(begin, end - begin);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return out;
}

std::string zero_pad(std::string s, std::size_t width) {
  if (s.size() < width) {
    s.insert(0, width - s.size(), '0');
  }
  return s;
}

/// "HK00700" / "0700" / "700" -> "00700".
std::string hk_key(const std::string &code) {
  std::string out;
  for (std::size_t i = 0; i < code.size(); ++i) {
    if (code.compare(i, 2, "HK") == 0) {
      ++i;
      continue;
    }
    out.push_back(code[i]);
  }
  const std::size_t first = out.find_first_not_of('0');
  out = first == std::string::npos ? std::string() : out.substr(first);
  return zero_pad(std::move(out), 5);
}

} // namespace

const char *to_string(Market market) {
  switch (market) {
  case Market::AShare:
    return "a_shares";
  case Market::HongKong:
    return "hk_shares";
  case Market::US:
    return "us_shares";
  }
  return "unknown";
}

std::map<std::string, std::string> &NameSnapshot::names(Market market) {
  switch (market) {
  case Market::HongKong:
    return hk_shares;
  case Market::US:
    return us_shares;
  case Market::AShare:
    break;
  }
  return a_shares;
}

const std::map<std::string, std::string> &
NameSnapshot::names(Market market) const {
  switch (market) {
  case Market::HongKong:
    return hk_shares;
  case Market::US:
    return us_shares;
  case Market::AShare:
    break;
  }
  return a_shares;
}

StockNameService::StockNameService(std::shared_ptr<INameCache> cache,
                                   std::shared_ptr<INameSource> source,
                                   std::shared_ptr<ILogger> logger,
                                   std::shared_ptr<IClock> clock,
                                   NameServiceConfig config)
    : cache_(std::move(cache)), source_(std::move(source)),
      logger_(std::move(logger)),
      clock_(clock ? std::move(clock) : create_system_clock()),
      config_(config) {}

std::string StockNameService::normalize_code(Market market,
                                             const std::string &raw) {
  std::string code = trim_upper(raw);
  if (market == Market::US) {
    const std::size_t dot = code.rfind('.');
    if (dot != std::string::npos) {
      code = code.substr(dot + 1);
    }
  } else if (market == Market::HongKong) {
    code = zero_pad(std::move(code), 5);
  }
  return code;
}

std::optional<std::string> StockNameService::lookup(const std::string &code) {
  std::lock_guard<std::mutex> lock(mutex_);
  ensure_loaded_locked();

  const std::string normalized = trim_upper(code);
  if (normalized.empty()) {
    return std::nullopt;
  }
  auto found = find_locked(normalized);
  if (found || !config_.refresh_on_miss || !source_ || !is_expired_locked()) {
    return found;
  }

  if (logger_) {
    logger_->info(kTrace, kComponent, "lookup_miss",
                  normalized + " not cached and cache is stale, refreshing");
  }
  refresh_locked(false, nullptr);
  return find_locked(normalized);
}

std::optional<std::string>
StockNameService::find_locked(const std::string &code) const {
  if (auto it = snapshot_.a_shares.find(code); it != snapshot_.a_shares.end()) {
    return it->second;
  }
  if (auto it = snapshot_.hk_shares.find(hk_key(code));
      it != snapshot_.hk_shares.end()) {
    return it->second;
  }
  if (auto it = snapshot_.hk_shares.find(code); it != snapshot_.hk_shares.end()) {
    return it->second;
  }
  if (auto it = snapshot_.us_shares.find(code); it != snapshot_.us_shares.end()) {
    return it->second;
  }
  return std::nullopt;
}

RefreshStats StockNameService::refresh(bool force,
                                       std::shared_ptr<CancelToken> cancel) {
  std::lock_guard<std::mutex> lock(mutex_);
  ensure_loaded_locked();
  return refresh_locked(force, cancel);
}

RefreshStats
StockNameService::refresh_locked(bool force,
                                 const std::shared_ptr<CancelToken> &cancel) {
  RefreshStats stats;
  if (!force && !is_expired_locked()) {
    if (logger_) {
      logger_->info(kTrace, kComponent, "refresh_skipped",
                    "Cache still fresh, skipping refresh");
    }
  } else if (!source_) {
    if (logger_) {
      logger_->warn(kTrace, kComponent, "refresh_unavailable",
                    "No listing source configured");
    }
  } else {
    stats.refreshed = true;
    for (const Market market : kMarkets) {
      if (cancel && cancel->is_canceled()) {
        ++stats.failed_markets;
        continue;
      }
      const auto deadline = deadline_after(config_.fetch_timeout);
      auto listing = source_->fetch(market, deadline, cancel);
      if (listing.is_err()) {
        ++stats.failed_markets;
        if (logger_) {
          logger_->error(kTrace, kComponent, "fetch_failed",
                         std::string(to_string(market)) + ": " +
                             listing.error().message);
        }
        continue;
      }
      auto &names = snapshot_.names(market);
      for (const auto &[raw_code, name] : listing.value()) {
        const std::string code = normalize_code(market, raw_code);
        if (!code.empty() && !name.empty()) {
          names[code] = name;
        }
      }
      if (logger_) {
        logger_->info(kTrace, kComponent, "fetch_succeeded",
                      std::string(to_string(market)) + ": " +
                          std::to_string(names.size()) + " names");
      }
    }

    if (stats.failed_markets < kMarkets.size()) {
      snapshot_.last_update = clock_->now();
      if (cache_) {
        auto saved = cache_->save(snapshot_);
        if (saved.is_err() && logger_) {
          logger_->error(kTrace, kComponent, "cache_save_failed",
                         saved.error().message);
        }
      }
    }
  }

  stats.a_shares = snapshot_.a_shares.size();
  stats.hk_shares = snapshot_.hk_shares.size();
  stats.us_shares = snapshot_.us_shares.size();
  return stats;
}

NewListings
StockNameService::check_new_listings(std::shared_ptr<CancelToken> cancel) {
  std::lock_guard<std::mutex> lock(mutex_);
  ensure_loaded_locked();

  const NameSnapshot before = snapshot_;
  refresh_locked(true, cancel);

  NewListings listings;
  std::size_t total = 0;
  for (const Market market : kMarkets) {
    const auto &old_names = before.names(market);
    auto &fresh = listings[market];
    for (const auto &[code, name] : snapshot_.names(market)) {
      if (old_names.find(code) == old_names.end()) {
        fresh.emplace_back(code, name);
      }
    }
    total += fresh.size();
  }

  if (!logger_) {
    return listings;
  }
  if (total == 0) {
    logger_->info(kTrace, kComponent, "new_listings", "No new listings");
    return listings;
  }
  for (const auto &[market, fresh] : listings) {
    const std::size_t shown = std::min(fresh.size(), kMaxListedNew);
    for (std::size_t i = 0; i < shown; ++i) {
      logger_->info(kTrace, kComponent, "new_listing",
                    std::string(to_string(market)) + ": " + fresh[i].first +
                        " " + fresh[i].second);
    }
    if (fresh.size() > shown) {
      logger_->info(kTrace, kComponent, "new_listing",
                    std::string(to_string(market)) + ": " +
                        std::to_string(fresh.size()) + " new in total");
    }
  }
  return listings;
}

std::string to_string(const NameStatistics &stats) {
  std::string out = "a_shares=" + std::to_string(stats.a_shares) +
                    " hk_shares=" + std::to_string(stats.hk_shares) +
                    " us_shares=" + std::to_string(stats.us_shares) +
                    " total=" + std::to_string(stats.total);
  out += " last_update=" +
         (stats.last_update.empty() ? std::string("never") : stats.last_update);
  return out;
}

NameStatistics StockNameService::statistics() {
  std::lock_guard<std::mutex> lock(mutex_);
  ensure_loaded_locked();

  NameStatistics stats;
  stats.a_shares = snapshot_.a_shares.size();
  stats.hk_shares = snapshot_.hk_shares.size();
  stats.us_shares = snapshot_.us_shares.size();
  stats.total = stats.a_shares + stats.hk_shares + stats.us_shares;
  if (snapshot_.last_update) {
    stats.last_update = format_local(*snapshot_.last_update);
  }
  stats.cache_location = cache_ ? cache_->location() : std::string();
  return stats;
}

std::map<std::string, std::string> StockNameService::export_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  ensure_loaded_locked();

  std::map<std::string, std::string> merged = snapshot_.a_shares;
  for (const auto &[code, name] : snapshot_.hk_shares) {
    merged[zero_pad(code, 5)] = name;
  }
  for (const auto &[code, name] : snapshot_.us_shares) {
    merged[code] = name;
  }
  return merged;
}

void StockNameService::ensure_loaded_locked() {
  if (loaded_) {
    return;
  }
  loaded_ = true;
  if (!cache_) {
    return;
  }
  auto loaded = cache_->load();
  if (loaded.is_err()) {
    if (logger_) {
      logger_->warn(kTrace, kComponent, "cache_load_failed",
                    loaded.error().message);
    }
    return;
  }
  snapshot_ = std::move(loaded).value();
  if (logger_) {
    logger_->info(kTrace, kComponent, "cache_loaded",
                  "A " + std::to_string(snapshot_.a_shares.size()) + ", HK " +
                      std::to_string(snapshot_.hk_shares.size()) + ", US " +
                      std::to_string(snapshot_.us_shares.size()));
  }
}

bool StockNameService::is_expired_locked() const {
  if (!snapshot_.last_update) {
    return true;
  }
  return clock_->now() - *snapshot_.last_update > config_.ttl;
}

} // namespace dsa::core
