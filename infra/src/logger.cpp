#include "infra/logger.h"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>

namespace dsa::infra {

namespace {

class ConsoleLogger : public dsa::core::ILogger {
public:
  explicit ConsoleLogger(const std::string &level) {
    logger_ = spdlog::get("dsa");
    if (!logger_) {
      logger_ = spdlog::stdout_color_mt("dsa");
    }
    logger_->set_pattern("[%Y-%m-%dT%H:%M:%S.%e%z] [%^%l%$] %v");

    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to off; only honor an explicit "off".
    if (parsed == spdlog::level::off && level != "off") {
      parsed = spdlog::level::info;
    }
    logger_->set_level(parsed);
    logger_->flush_on(spdlog::level::warn);
  }

  void info(const std::string &trace_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->info("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

  void warn(const std::string &trace_id, const std::string &component,
            const std::string &event, const std::string &msg) override {
    logger_->warn("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

  void error(const std::string &trace_id, const std::string &component,
             const std::string &event, const std::string &msg) override {
    logger_->error("[{}] [{}] {}: {}", trace_id, component, event, msg);
  }

private:
  std::shared_ptr<spdlog::logger> logger_;
};

} // namespace

std::unique_ptr<dsa::core::ILogger>
create_console_logger(const std::string &level) {
  return std::make_unique<ConsoleLogger>(level);
}

} // namespace dsa::infra
