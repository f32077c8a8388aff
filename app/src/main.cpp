#include "core/logger.h"
#include "core/scheduler.h"
#include "core/stock_name_service.h"
#include "infra/config.h"
#include "infra/curl_http_client.h"
#include "infra/graceful_shutdown.h"
#include "infra/http_name_source.h"
#include "infra/logger.h"
#include "infra/name_cache.h"
#include "infra/path_service.h"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitInvalidSchedule = 2;

struct CliArgs {
  bool schedule = false;
  bool no_run_immediately = false;
  std::string schedule_time; // overrides SCHEDULE_TIME when set
  bool help = false;
};

void print_usage(const char *argv0) {
  std::cout << "Usage: " << argv0 << " [options]\n"
            << "  --schedule              run on the configured schedule\n"
            << "  --time <spec>           schedule spec, e.g. \"18:00\" or "
               "\"1-5@09:30,15:00\"\n"
            << "  --no-run-immediately    skip the startup run\n"
            << "  -h, --help              show this help\n";
}

bool parse_args(int argc, char **argv, CliArgs &args) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--schedule") {
      args.schedule = true;
    } else if (arg == "--no-run-immediately") {
      args.no_run_immediately = true;
    } else if (arg == "--time" && i + 1 < argc) {
      args.schedule_time = argv[++i];
    } else if (arg == "-h" || arg == "--help") {
      args.help = true;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      return false;
    }
  }
  return true;
}

/// The scheduled task: run the configured shell command.
dsa::core::Scheduler::TaskCallback
make_command_task(std::string command,
                  std::shared_ptr<dsa::core::ILogger> logger) {
  return [command = std::move(command), logger]() {
    if (command.empty()) {
      logger->warn("task", "app", "task_command_missing",
                   "SCHEDULE_TASK_COMMAND is not set, nothing to run");
      return;
    }
    logger->info("task", "app", "task_command", command);
    const int status = std::system(command.c_str());
    if (status != 0) {
      throw std::runtime_error("Command exited with status " +
                               std::to_string(status));
    }
  };
}

} // namespace

int main(int argc, char **argv) {
  CliArgs args;
  if (!parse_args(argc, argv, args)) {
    print_usage(argv[0]);
    return kExitFailure;
  }
  if (args.help) {
    print_usage(argv[0]);
    return kExitOk;
  }

  // Config is read twice: once to learn the log level, once more with the
  // real logger so invalid values get reported.
  const auto bootstrap = dsa::infra::AppConfig::from_environment();
  std::shared_ptr<dsa::core::ILogger> logger =
      dsa::infra::create_console_logger(bootstrap.log_level);
  auto config = dsa::infra::AppConfig::from_environment(logger);
  if (!args.schedule_time.empty()) {
    config.schedule_time = args.schedule_time;
  }
  if (args.no_run_immediately) {
    config.run_immediately = false;
  }

  auto task = make_command_task(config.task_command, logger);

  if (!config.schedule_enabled && !args.schedule) {
    logger->info("startup", "app", "single_run",
                 "Scheduling disabled, running task once");
    try {
      task();
    } catch (const std::exception &e) {
      logger->error("startup", "app", "task_failed", e.what());
      return kExitFailure;
    }
    return kExitOk;
  }

  dsa::infra::GracefulShutdown shutdown(logger);

  dsa::core::SchedulerOptions options;
  options.config.poll_interval = config.poll_interval;
  options.logger = logger;
  options.shutdown_requested = shutdown.probe();

  // Kept alive for the whole run; FileNameCache holds a reference.
  std::unique_ptr<dsa::infra::PathService> path_service;
  std::shared_ptr<dsa::core::StockNameService> names;
  std::vector<dsa::core::AuxiliaryJob> auxiliary;

  if (config.name_refresh_enabled && !config.name_source_url.empty()) {
    try {
      path_service = dsa::infra::PathService::create(config.cache_dir);
      auto http = std::make_shared<dsa::infra::CurlHttpClient>();
      dsa::core::NameServiceConfig name_config;
      name_config.fetch_timeout = config.name_fetch_timeout;
      names = std::make_shared<dsa::core::StockNameService>(
          std::make_shared<dsa::infra::FileNameCache>(*path_service),
          std::make_shared<dsa::infra::HttpNameSource>(http,
                                                       config.name_source_url),
          logger, nullptr, name_config);
    } catch (const std::exception &e) {
      logger->error("startup", "app", "name_service_unavailable", e.what());
      return kExitFailure;
    }

    auxiliary.push_back(dsa::core::AuxiliaryJob{
        "stock_name_refresh", config.name_refresh_time,
        [names, logger]() {
          names->check_new_listings();
          logger->info("names", "app", "name_cache_stats",
                       dsa::core::to_string(names->statistics()));
        }});
  } else if (config.name_refresh_enabled) {
    logger->info("startup", "app", "name_refresh_disabled",
                 "STOCK_NAME_SOURCE_URL not set, stock-name refresh skipped");
  }

  auto result = dsa::core::run_with_schedule(
      std::move(task), config.schedule_time, config.run_immediately,
      std::move(options), std::move(auxiliary));
  if (result.is_err()) {
    const auto &error = result.error();
    logger->error("startup", "app", "scheduler_failed", error.message);
    return error.category == dsa::core::ErrorCategory::Validation
               ? kExitInvalidSchedule
               : kExitFailure;
  }
  return kExitOk;
}
