#pragma once

#include "core/clock.h"
#include "core/error.h"
#include "core/result.h"
#include "core/schedule_spec.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dsa::core {

/// One registered firing point: a day (or every day) and a time of day.
struct Trigger {
  DayKey day = DayKey::Every;
  TimeOfDay time;

  [[nodiscard]] std::string to_string() const;
};

/// First local wall-clock instant strictly after `after` at which `trigger`
/// fires. Always within the next 7 days.
IClock::TimePoint next_occurrence(const Trigger &trigger,
                                  IClock::TimePoint after);

/// Timing subsystem the engine binds its triggers into.
/// Abstract so tests can substitute a registry that rejects some triggers.
class ITimerRegistry {
public:
  using Job = std::function<void()>;

  virtual ~ITimerRegistry() = default;

  /// Register `job` to run at every occurrence of `trigger`, starting with
  /// the first one after `now`.
  virtual Result<void, Error> add(const Trigger &trigger, Job job,
                                  IClock::TimePoint now) = 0;

  /// Run every job whose next occurrence is at or before `now`, then
  /// reschedule it. Returns how many jobs ran.
  virtual std::size_t run_pending(IClock::TimePoint now) = 0;

  /// Earliest next occurrence across all entries; nullopt when empty.
  [[nodiscard]] virtual std::optional<IClock::TimePoint> next_run() const = 0;

  [[nodiscard]] virtual std::size_t size() const = 0;
};

/// Default registry. Jobs run on the thread calling run_pending(); they are
/// rescheduled from the clock's time after they return, so occurrences that
/// pass while a job is running are dropped rather than replayed.
class TimerRegistry final : public ITimerRegistry {
public:
  explicit TimerRegistry(std::shared_ptr<IClock> clock);

  Result<void, Error> add(const Trigger &trigger, Job job,
                          IClock::TimePoint now) override;
  std::size_t run_pending(IClock::TimePoint now) override;
  [[nodiscard]] std::optional<IClock::TimePoint> next_run() const override;
  [[nodiscard]] std::size_t size() const override;

private:
  struct Entry {
    Trigger trigger;
    Job job;
    IClock::TimePoint next_run;
  };

  std::shared_ptr<IClock> clock_;
  // Guards entries_ bookkeeping; never held while a job runs.
  mutable std::mutex mutex_;
  std::vector<Entry> entries_;
};

} // namespace dsa::core
