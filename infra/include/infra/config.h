#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace dsa::core {
class ILogger;
} // namespace dsa::core

namespace dsa::infra {

/// Application configuration, read from the environment at startup.
struct AppConfig {
  using Lookup = std::function<const char *(const char *)>;

  bool schedule_enabled = false;
  std::string schedule_time = "18:00";
  bool run_immediately = true;
  std::chrono::seconds poll_interval{30};
  std::string task_command;

  bool name_refresh_enabled = true;
  std::string name_refresh_time = "09:00";
  std::string name_source_url;
  std::chrono::milliseconds name_fetch_timeout{15000};

  std::string log_level = "info";
  std::string cache_dir; // "" -> platform default

  /// Read from the process environment.
  static AppConfig
  from_environment(const std::shared_ptr<dsa::core::ILogger> &logger = nullptr);

  /// Read through `lookup` (returns nullptr for unset names). Invalid numbers
  /// and booleans are logged and keep their default.
  static AppConfig
  from_lookup(const Lookup &lookup,
              const std::shared_ptr<dsa::core::ILogger> &logger = nullptr);
};

} // namespace dsa::infra
