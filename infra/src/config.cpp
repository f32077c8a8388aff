#include "infra/config.h"

#include "core/logger.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace dsa::infra {

namespace {

constexpr long kMaxPollIntervalSec = 86400;
constexpr long kMaxFetchTimeoutMs = 600000;

void warn_invalid(const std::shared_ptr<dsa::core::ILogger> &logger,
                  const char *name, const char *raw,
                  const std::string &fallback) {
  if (logger) {
    logger->warn("startup", "config", "config_invalid",
                 std::string("Invalid value for ") + name + "=" + raw +
                     ", fallback=" + fallback);
  }
}

// Accepts 1..max; anything else warns and keeps `fallback`.
long parse_env_int(const AppConfig::Lookup &lookup, const char *name,
                   long fallback, long max,
                   const std::shared_ptr<dsa::core::ILogger> &logger) {
  const char *raw = lookup(name);
  if (!raw || raw[0] == 0) {
    return fallback;
  }

  char *end = nullptr;
  errno = 0;
  const long value = std::strtol(raw, &end, 10);
  if (!end || *end != 0 || errno == ERANGE || value <= 0 || value > max) {
    warn_invalid(logger, name, raw, std::to_string(fallback));
    return fallback;
  }
  return value;
}

bool parse_env_bool(const AppConfig::Lookup &lookup, const char *name,
                    bool fallback,
                    const std::shared_ptr<dsa::core::ILogger> &logger) {
  const char *raw = lookup(name);
  if (!raw || raw[0] == 0) {
    return fallback;
  }

  std::string value(raw);
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (value == "true" || value == "1" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "false" || value == "0" || value == "no" || value == "off") {
    return false;
  }
  warn_invalid(logger, name, raw, fallback ? "true" : "false");
  return fallback;
}

std::string parse_env_string(const AppConfig::Lookup &lookup, const char *name,
                             const std::string &fallback) {
  const char *raw = lookup(name);
  return raw && raw[0] != 0 ? std::string(raw) : fallback;
}

} // namespace

AppConfig
AppConfig::from_environment(const std::shared_ptr<dsa::core::ILogger> &logger) {
  return from_lookup([](const char *name) { return std::getenv(name); },
                     logger);
}

AppConfig
AppConfig::from_lookup(const Lookup &lookup,
                       const std::shared_ptr<dsa::core::ILogger> &logger) {
  AppConfig cfg;

  cfg.schedule_enabled =
      parse_env_bool(lookup, "SCHEDULE_ENABLED", cfg.schedule_enabled, logger);
  cfg.schedule_time =
      parse_env_string(lookup, "SCHEDULE_TIME", cfg.schedule_time);
  cfg.run_immediately = parse_env_bool(lookup, "SCHEDULE_RUN_IMMEDIATELY",
                                       cfg.run_immediately, logger);
  cfg.poll_interval = std::chrono::seconds(parse_env_int(
      lookup, "SCHEDULE_POLL_INTERVAL_SEC", cfg.poll_interval.count(),
      kMaxPollIntervalSec, logger));
  cfg.task_command =
      parse_env_string(lookup, "SCHEDULE_TASK_COMMAND", cfg.task_command);

  cfg.name_refresh_enabled = parse_env_bool(
      lookup, "STOCK_NAME_REFRESH_ENABLED", cfg.name_refresh_enabled, logger);
  cfg.name_refresh_time =
      parse_env_string(lookup, "STOCK_NAME_REFRESH_TIME", cfg.name_refresh_time);
  cfg.name_source_url =
      parse_env_string(lookup, "STOCK_NAME_SOURCE_URL", cfg.name_source_url);
  cfg.name_fetch_timeout = std::chrono::milliseconds(
      parse_env_int(lookup, "STOCK_NAME_FETCH_TIMEOUT_MS",
                    static_cast<long>(cfg.name_fetch_timeout.count()),
                    kMaxFetchTimeoutMs, logger));

  cfg.log_level = parse_env_string(lookup, "DSA_LOG_LEVEL", cfg.log_level);
  cfg.cache_dir = parse_env_string(lookup, "DSA_CACHE_DIR", cfg.cache_dir);
  return cfg;
}

} // namespace dsa::infra
