#pragma once

#include <functional>
#include <memory>

namespace dsa::core {
class ILogger;
} // namespace dsa::core

namespace dsa::infra {

/// SIGINT/SIGTERM -> process-wide shutdown flag.
///
/// The handlers only store into a lock-free atomic; the scheduler polls
/// should_shutdown() once per tick, so a running task always finishes
/// before the loop exits. One instance per process; the previous handlers
/// are restored on destruction.
class GracefulShutdown {
public:
  explicit GracefulShutdown(std::shared_ptr<dsa::core::ILogger> logger);
  ~GracefulShutdown();

  GracefulShutdown(const GracefulShutdown &) = delete;
  GracefulShutdown &operator=(const GracefulShutdown &) = delete;

  /// True once a signal arrived or request() was called. The first
  /// observation is logged.
  bool should_shutdown();

  /// Set the flag without a signal.
  void request();

  /// Probe suitable for SchedulerOptions::shutdown_requested.
  std::function<bool()> probe();

private:
  std::shared_ptr<dsa::core::ILogger> logger_;
  bool logged_ = false;
  void (*previous_int_)(int) = nullptr;
  void (*previous_term_)(int) = nullptr;
};

} // namespace dsa::infra
