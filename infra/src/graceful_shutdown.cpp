#include "infra/graceful_shutdown.h"

#include "core/logger.h"

#include <atomic>
#include <csignal>
#include <string>
#include <utility>

namespace dsa::infra {

namespace {

std::atomic<bool> g_shutdown_requested{false};
std::atomic<int> g_signal{0};

static_assert(std::atomic<bool>::is_always_lock_free,
              "signal handler needs a lock-free flag");

extern "C" void on_shutdown_signal(int signal) {
  g_signal.store(signal, std::memory_order_relaxed);
  g_shutdown_requested.store(true, std::memory_order_release);
}

} // namespace

GracefulShutdown::GracefulShutdown(std::shared_ptr<dsa::core::ILogger> logger)
    : logger_(std::move(logger)) {
  g_shutdown_requested.store(false, std::memory_order_release);
  g_signal.store(0, std::memory_order_relaxed);
  previous_int_ = std::signal(SIGINT, on_shutdown_signal);
  previous_term_ = std::signal(SIGTERM, on_shutdown_signal);
}

GracefulShutdown::~GracefulShutdown() {
  std::signal(SIGINT, previous_int_ == SIG_ERR ? SIG_DFL : previous_int_);
  std::signal(SIGTERM, previous_term_ == SIG_ERR ? SIG_DFL : previous_term_);
}

bool GracefulShutdown::should_shutdown() {
  if (!g_shutdown_requested.load(std::memory_order_acquire)) {
    return false;
  }
  if (!logged_) {
    logged_ = true;
    if (logger_) {
      const int signal = g_signal.load(std::memory_order_relaxed);
      logger_->info("engine", "shutdown", "shutdown_signal",
                    signal != 0 ? "Received signal " + std::to_string(signal) +
                                      ", finishing current task before exit"
                                : std::string("Shutdown requested"));
    }
  }
  return true;
}

void GracefulShutdown::request() {
  g_shutdown_requested.store(true, std::memory_order_release);
}

std::function<bool()> GracefulShutdown::probe() {
  return [this]() { return should_shutdown(); };
}

} // namespace dsa::infra
