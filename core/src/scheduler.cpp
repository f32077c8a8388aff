#include "core/scheduler.h"

#include "core/logger.h"

#include <exception>
#include <utility>

namespace dsa::core {

namespace {

constexpr const char *kComponent = "scheduler";
constexpr const char *kEngineTrace = "engine";
constexpr const char *kTaskName = "task";

} // namespace

const char *to_string(EngineState state) {
  switch (state) {
  case EngineState::Idle:
    return "Idle";
  case EngineState::Running:
    return "Running";
  case EngineState::Stopped:
    return "Stopped";
  }
  return "Unknown";
}

Result<std::unique_ptr<Scheduler>, Error>
Scheduler::create(const ScheduleSpec &spec, SchedulerOptions options) {
  using R = Result<std::unique_ptr<Scheduler>, Error>;
  auto table = parse_schedule(spec);
  if (table.is_err()) {
    if (options.logger) {
      options.logger->error(kEngineTrace, kComponent, "spec_invalid",
                            table.error().message);
    }
    return R::Err(table.error());
  }
  return R::Ok(std::unique_ptr<Scheduler>(
      new Scheduler(std::move(table).value(), std::move(options))));
}

Scheduler::Scheduler(ScheduleTable table, SchedulerOptions options)
    : table_(std::move(table)), config_(options.config),
      logger_(std::move(options.logger)), clock_(std::move(options.clock)),
      timers_(std::move(options.timers)),
      shutdown_requested_(std::move(options.shutdown_requested)) {
  if (!clock_) {
    clock_ = create_system_clock();
  }
  if (!timers_) {
    timers_ = std::make_unique<TimerRegistry>(clock_);
  }
  if (config_.poll_interval <= std::chrono::milliseconds::zero()) {
    config_.poll_interval = EngineConfig{}.poll_interval;
  }
}

Scheduler::~Scheduler() = default;

Result<std::size_t, Error> Scheduler::register_task(TaskCallback task,
                                                    bool run_immediately) {
  using R = Result<std::size_t, Error>;
  if (!task) {
    return R::Err(Error::Internal("Task callback must not be null"));
  }
  if (task_.load() != nullptr) {
    return R::Err(Error::Internal("A task is already registered"));
  }
  if (state_.load() != EngineState::Idle) {
    return R::Err(Error::Internal(std::string("Cannot register in state ") +
                                  to_string(state_.load())));
  }

  auto job = std::make_unique<Job>();
  job->name = kTaskName;
  job->callback = std::move(task);
  Job *registered_job = job.get();
  jobs_.push_back(std::move(job));
  task_.store(registered_job);

  const std::size_t registered = register_triggers(table_, registered_job);
  if (table_.empty()) {
    log_warn(kEngineTrace, "schedule_empty",
             "Schedule has no triggers; the task only runs on demand");
  }

  if (run_immediately) {
    log_info(kEngineTrace, "run_immediately", "Running task once at startup");
    run_guarded(*registered_job);
  }
  return R::Ok(registered);
}

Result<std::size_t, Error> Scheduler::add_job(const std::string &name,
                                              const ScheduleSpec &spec,
                                              TaskCallback callback) {
  using R = Result<std::size_t, Error>;
  if (!callback) {
    return R::Err(Error::Internal("Job callback must not be null: " + name));
  }
  if (state_.load() != EngineState::Idle) {
    return R::Err(Error::Internal(std::string("Cannot register in state ") +
                                  to_string(state_.load())));
  }
  auto table = parse_schedule(spec);
  if (table.is_err()) {
    log_error(kEngineTrace, "spec_invalid",
              name + ": " + table.error().message);
    return R::Err(table.error());
  }

  auto job = std::make_unique<Job>();
  job->name = name;
  job->callback = std::move(callback);
  Job *raw = job.get();
  jobs_.push_back(std::move(job));
  return R::Ok(register_triggers(table.value(), raw));
}

std::size_t Scheduler::register_triggers(const ScheduleTable &table, Job *job) {
  const auto now = clock_->now();
  std::size_t registered = 0;
  for (const auto &[day, times] : table.entries()) {
    for (const TimeOfDay &time : times) {
      const Trigger trigger{day, time};
      auto added = timers_->add(
          trigger, [this, job]() { run_guarded(*job); }, now);
      if (added.is_err()) {
        log_error(kEngineTrace, "trigger_register_failed",
                  job->name + " @ " + trigger.to_string() + ": " +
                      added.error().message);
        continue;
      }
      ++registered;
      log_info(kEngineTrace, "trigger_registered",
               job->name + " @ " + trigger.to_string());
    }
  }
  log_info(kEngineTrace, "triggers_registered",
           job->name + ": " + std::to_string(registered) + "/" +
               std::to_string(table.trigger_count()) + " triggers [" +
               table.describe() + "]");
  return registered;
}

Result<void, Error> Scheduler::run() {
  EngineState expected = EngineState::Idle;
  if (!state_.compare_exchange_strong(expected, EngineState::Running)) {
    return Result<void, Error>::Err(Error::Internal(
        std::string("Scheduler is not restartable (state=") +
        to_string(expected) + ")"));
  }

  log_info(kEngineTrace, "loop_started",
           "Scheduler running, poll interval " +
               std::to_string(config_.poll_interval.count()) + "ms");
  log_info(kEngineTrace, "next_run", "Next run: " + describe_next_run());

  while (!should_exit()) {
    timers_->run_pending(clock_->now());
    clock_->sleep_for(config_.poll_interval);

    if (is_heartbeat_tick(clock_->now())) {
      log_info(kEngineTrace, "heartbeat",
               "Scheduler alive, next run: " + describe_next_run());
    }
  }

  state_.store(EngineState::Stopped);
  log_info(kEngineTrace, "loop_stopped",
           stop_requested_.load() ? "Scheduler stopped (stop requested)"
                                  : "Scheduler stopped (shutdown signal)");
  return Result<void, Error>::Ok();
}

void Scheduler::stop() {
  if (!stop_requested_.exchange(true)) {
    log_info(kEngineTrace, "stop_requested",
             std::string("Stop requested in state ") + to_string(state_.load()));
  }
}

bool Scheduler::fire() {
  Job *task = task_.load();
  if (task == nullptr) {
    log_warn(kEngineTrace, "fire_ignored", "No task registered");
    return false;
  }
  return run_guarded(*task);
}

std::size_t Scheduler::trigger_count() const { return timers_->size(); }

std::optional<IClock::TimePoint> Scheduler::next_run() const {
  return timers_->next_run();
}

bool Scheduler::is_task_running() const noexcept {
  const Job *task = task_.load();
  return task != nullptr && task->guard.is_locked();
}

bool Scheduler::run_guarded(Job &job) {
  const std::string trace_id = next_trace_id();

  ExecutionGuard::Lease lease(job.guard);
  if (!lease.owns()) {
    log_warn(trace_id, "run_skipped",
             job.name + " is still running, trigger skipped");
    return false;
  }

  log_info(trace_id, "run_started",
           job.name + " started at " + format_local(clock_->now()));
  try {
    job.callback();
  } catch (const std::exception &e) {
    log_error(trace_id, "run_failed", job.name + " failed: " + e.what());
  } catch (...) {
    log_error(trace_id, "run_failed",
              job.name + " failed with a non-standard exception");
  }
  log_info(trace_id, "run_finished",
           job.name + " finished at " + format_local(clock_->now()));
  return true;
}

bool Scheduler::should_exit() const {
  return stop_requested_.load() ||
         (shutdown_requested_ && shutdown_requested_());
}

bool Scheduler::is_heartbeat_tick(IClock::TimePoint now) const {
  // First tick after the top of the hour.
  const std::tm tm = to_local_tm(now);
  const auto since_hour =
      std::chrono::seconds(tm.tm_sec) + std::chrono::minutes(tm.tm_min);
  return since_hour < config_.poll_interval;
}

std::string Scheduler::describe_next_run() const {
  const auto next = timers_->next_run();
  return next ? format_local(*next) : std::string("not scheduled");
}

std::string Scheduler::next_trace_id() {
  return "fire-" + std::to_string(fire_seq_.fetch_add(1) + 1);
}

void Scheduler::log_info(const std::string &trace_id, const std::string &event,
                         const std::string &msg) const {
  if (logger_) {
    logger_->info(trace_id, kComponent, event, msg);
  }
}

void Scheduler::log_warn(const std::string &trace_id, const std::string &event,
                         const std::string &msg) const {
  if (logger_) {
    logger_->warn(trace_id, kComponent, event, msg);
  }
}

void Scheduler::log_error(const std::string &trace_id, const std::string &event,
                          const std::string &msg) const {
  if (logger_) {
    logger_->error(trace_id, kComponent, event, msg);
  }
}

Result<void, Error> run_with_schedule(Scheduler::TaskCallback task,
                                      const ScheduleSpec &spec,
                                      bool run_immediately,
                                      SchedulerOptions options,
                                      std::vector<AuxiliaryJob> auxiliary) {
  auto created = Scheduler::create(spec, std::move(options));
  if (created.is_err()) {
    return Result<void, Error>::Err(created.error());
  }
  std::unique_ptr<Scheduler> scheduler = std::move(created).value();

  // Validate auxiliary jobs before the task gets a chance to run.
  for (auto &aux : auxiliary) {
    auto added = scheduler->add_job(aux.name, aux.spec, std::move(aux.callback));
    if (added.is_err()) {
      return Result<void, Error>::Err(added.error());
    }
  }

  auto registered = scheduler->register_task(std::move(task), run_immediately);
  if (registered.is_err()) {
    return Result<void, Error>::Err(registered.error());
  }
  return scheduler->run();
}

} // namespace dsa::core
