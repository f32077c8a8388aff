#pragma once

#include "core/clock.h"
#include "core/error.h"
#include "core/execution_guard.h"
#include "core/result.h"
#include "core/schedule_spec.h"
#include "core/timer_registry.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dsa::core {

class ILogger;

/// Engine lifecycle. Idle -> Running happens once; Stopped is terminal.
enum class EngineState { Idle, Running, Stopped };

const char *to_string(EngineState state);

/// Engine runtime configuration.
struct EngineConfig {
  /// Time between two checks for due triggers. Also the granularity at
  /// which stop() and the shutdown flag are observed.
  std::chrono::milliseconds poll_interval{30000};
};

/// Collaborators handed to the engine. Every member is optional.
struct SchedulerOptions {
  EngineConfig config{};
  std::shared_ptr<ILogger> logger;
  std::shared_ptr<IClock> clock;           // default: system clock
  std::unique_ptr<ITimerRegistry> timers;  // default: TimerRegistry
  /// External shutdown flag (e.g. SIGTERM seen), read once per tick.
  std::function<bool()> shutdown_requested;
};

/// Recurring-task scheduler.
///
/// Owns a ScheduleTable, the task callback and its single-flight guard.
/// Every (day, time) pair of the table becomes one trigger in the timer
/// registry, all bound to the same guarded wrapper. run() polls the
/// registry on the calling thread; callbacks execute synchronously on it.
///
/// A trigger that fires while the callback is still running is skipped and
/// logged, never queued. Errors thrown by the callback are logged and
/// swallowed; the guard is released either way.
class Scheduler {
public:
  using TaskCallback = std::function<void()>;

  /// Parse `spec` and build an engine. Fails with the parser's Validation
  /// error; no engine exists in that case. No triggers are registered yet.
  static Result<std::unique_ptr<Scheduler>, Error>
  create(const ScheduleSpec &spec, SchedulerOptions options = {});

  ~Scheduler();

  Scheduler(const Scheduler &) = delete;
  Scheduler &operator=(const Scheduler &) = delete;

  /// Store `task` and register one trigger per table entry. A trigger the
  /// registry rejects is logged and skipped; the others still register.
  /// With `run_immediately`, the guarded wrapper runs once before this
  /// returns. Returns the number of triggers registered.
  Result<std::size_t, Error> register_task(TaskCallback task,
                                           bool run_immediately);

  /// Register an auxiliary job with its own schedule and its own guard
  /// (e.g. the daily stock-name refresh). Same overlap-skip semantics.
  Result<std::size_t, Error> add_job(const std::string &name,
                                     const ScheduleSpec &spec,
                                     TaskCallback job);

  /// Blocking polling loop. Idle -> Running -> Stopped. Returns an error if
  /// the engine already ran; it is not restartable.
  Result<void, Error> run();

  /// Ask run() to exit after the current tick. Idempotent, callable from
  /// any thread and before run(). Never interrupts a running callback.
  void stop();

  /// Run the task's guarded wrapper now. Thread-safe. Returns false when
  /// the run was skipped because the task is already running or no task
  /// is registered.
  bool fire();

  [[nodiscard]] EngineState state() const noexcept { return state_.load(); }
  [[nodiscard]] const ScheduleTable &table() const noexcept { return table_; }
  [[nodiscard]] std::size_t trigger_count() const;
  [[nodiscard]] std::optional<IClock::TimePoint> next_run() const;
  [[nodiscard]] bool is_task_running() const noexcept;
  [[nodiscard]] bool stop_requested() const noexcept {
    return stop_requested_.load();
  }

private:
  struct Job {
    std::string name;
    TaskCallback callback;
    ExecutionGuard guard;
  };

  Scheduler(ScheduleTable table, SchedulerOptions options);

  std::size_t register_triggers(const ScheduleTable &table, Job *job);
  bool run_guarded(Job &job);
  [[nodiscard]] bool should_exit() const;
  [[nodiscard]] bool is_heartbeat_tick(IClock::TimePoint now) const;
  [[nodiscard]] std::string describe_next_run() const;
  std::string next_trace_id();

  void log_info(const std::string &trace_id, const std::string &event,
                const std::string &msg) const;
  void log_warn(const std::string &trace_id, const std::string &event,
                const std::string &msg) const;
  void log_error(const std::string &trace_id, const std::string &event,
                 const std::string &msg) const;

  ScheduleTable table_;
  EngineConfig config_;
  std::shared_ptr<ILogger> logger_;
  std::shared_ptr<IClock> clock_;
  std::unique_ptr<ITimerRegistry> timers_;
  std::function<bool()> shutdown_requested_;

  // unique_ptr keeps Job addresses stable for the bound trigger lambdas.
  std::vector<std::unique_ptr<Job>> jobs_;
  // Published once register_task has built the job; read by fire().
  std::atomic<Job *> task_{nullptr};

  std::atomic<EngineState> state_{EngineState::Idle};
  std::atomic<bool> stop_requested_{false};
  std::atomic<std::uint64_t> fire_seq_{0};
};

/// Auxiliary job description for run_with_schedule().
struct AuxiliaryJob {
  std::string name;
  ScheduleSpec spec;
  Scheduler::TaskCallback callback;
};

/// Construct, register and run in one call, blocking until stopped.
/// Returns the Validation error if `spec` (or an auxiliary spec) is
/// invalid; in that case nothing runs.
Result<void, Error> run_with_schedule(Scheduler::TaskCallback task,
                                      const ScheduleSpec &spec,
                                      bool run_immediately,
                                      SchedulerOptions options = {},
                                      std::vector<AuxiliaryJob> auxiliary = {});

} // namespace dsa::core
