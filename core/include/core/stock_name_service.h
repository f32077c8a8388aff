#pragma once

#include "core/cancel_token.h"
#include "core/clock.h"
#include "core/error.h"
#include "core/result.h"

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace dsa::core {

class ILogger;

enum class Market { AShare, HongKong, US };

const char *to_string(Market market);

/// Code -> display name, one map per market.
struct NameSnapshot {
  std::map<std::string, std::string> a_shares;
  std::map<std::string, std::string> hk_shares;
  std::map<std::string, std::string> us_shares;
  std::optional<IClock::TimePoint> last_update;

  std::map<std::string, std::string> &names(Market market);
  [[nodiscard]] const std::map<std::string, std::string> &
  names(Market market) const;
};

/// Persistent storage for a NameSnapshot. Injected into the service so
/// tests can use an in-memory cache.
class INameCache {
public:
  virtual ~INameCache() = default;

  /// Missing storage is not an error: it yields an empty snapshot.
  virtual Result<NameSnapshot, Error> load() = 0;
  virtual Result<void, Error> save(const NameSnapshot &snapshot) = 0;
  [[nodiscard]] virtual std::string location() const = 0;
};

/// Listing source queried when the cache is stale.
class INameSource {
public:
  using Deadline = std::chrono::steady_clock::time_point;
  using Listing = std::vector<std::pair<std::string, std::string>>;

  virtual ~INameSource() = default;

  /// Fetch the full listing for `market`. Must give up with a Timeout error
  /// once `deadline` passes and with Canceled once `cancel` is set.
  virtual Result<Listing, Error> fetch(Market market, Deadline deadline,
                                       std::shared_ptr<CancelToken> cancel) = 0;
};

struct NameServiceConfig {
  std::chrono::hours ttl{24};
  /// Budget for one market's fetch.
  std::chrono::milliseconds fetch_timeout{15000};
  /// On a lookup miss with a stale cache, refresh once and retry.
  bool refresh_on_miss = true;
};

struct RefreshStats {
  bool refreshed = false; // false when the cache was still fresh
  std::size_t a_shares = 0;
  std::size_t hk_shares = 0;
  std::size_t us_shares = 0;
  std::size_t failed_markets = 0;
};

struct NameStatistics {
  std::size_t a_shares = 0;
  std::size_t hk_shares = 0;
  std::size_t us_shares = 0;
  std::size_t total = 0;
  std::string last_update; // "" when never refreshed
  std::string cache_location;
};

/// One-line summary: "a_shares=N hk_shares=N us_shares=N total=N ...".
std::string to_string(const NameStatistics &stats);

using NewListings = std::map<Market, INameSource::Listing>;

/// Stock code -> name resolution for A-share, Hong Kong and US markets.
///
/// Caller-owned: construct one, hand it to whoever needs it. The cache and
/// the network source are injected; the snapshot is loaded lazily on first
/// use. All public methods are thread-safe.
class StockNameService {
public:
  StockNameService(std::shared_ptr<INameCache> cache,
                   std::shared_ptr<INameSource> source,
                   std::shared_ptr<ILogger> logger,
                   std::shared_ptr<IClock> clock = nullptr,
                   NameServiceConfig config = {});

  /// Resolve `code` ("600519", "hk00700", "00700", "AAPL"...).
  std::optional<std::string> lookup(const std::string &code);

  /// Refetch all markets unless the cache is younger than the TTL.
  RefreshStats refresh(bool force,
                       std::shared_ptr<CancelToken> cancel = nullptr);

  /// Forced refresh; returns codes absent before it, per market.
  NewListings check_new_listings(std::shared_ptr<CancelToken> cancel = nullptr);

  NameStatistics statistics();

  /// All markets merged into one map.
  std::map<std::string, std::string> export_all();

  /// Normalize a fetched code for storage: US "105.AAPL" -> "AAPL",
  /// Hong Kong codes zero-padded to 5 digits.
  static std::string normalize_code(Market market, const std::string &raw);

private:
  void ensure_loaded_locked();
  [[nodiscard]] bool is_expired_locked() const;
  std::optional<std::string> find_locked(const std::string &code) const;
  RefreshStats refresh_locked(bool force, const std::shared_ptr<CancelToken> &cancel);

  std::shared_ptr<INameCache> cache_;
  std::shared_ptr<INameSource> source_;
  std::shared_ptr<ILogger> logger_;
  std::shared_ptr<IClock> clock_;
  NameServiceConfig config_;

  std::mutex mutex_;
  bool loaded_ = false;
  NameSnapshot snapshot_;
};

} // namespace dsa::core
