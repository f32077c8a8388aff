#include "core/timer_registry.h"

#include <algorithm>

namespace dsa::core {

std::string Trigger::to_string() const {
  return std::string(dsa::core::to_string(day)) + " " + time.to_string();
}

IClock::TimePoint next_occurrence(const Trigger &trigger,
                                  IClock::TimePoint after) {
  const std::tm base = to_local_tm(after);
  // Offset 7 covers "same weekday, time already passed".
  for (int offset = 0; offset <= 7; ++offset) {
    std::tm candidate = base;
    candidate.tm_mday += offset;
    candidate.tm_hour = trigger.time.hour;
    candidate.tm_min = trigger.time.minute;
    candidate.tm_sec = 0;
    const IClock::TimePoint at = from_local_tm(candidate);
    if (at <= after) {
      continue;
    }
    if (day_matches(trigger.day, to_local_tm(at).tm_wday)) {
      return at;
    }
  }
  // Unreachable for a valid trigger; a week later is a safe upper bound.
  return after + std::chrono::hours(24 * 7);
}

TimerRegistry::TimerRegistry(std::shared_ptr<IClock> clock)
    : clock_(std::move(clock)) {}

Result<void, Error> TimerRegistry::add(const Trigger &trigger, Job job,
                                       IClock::TimePoint now) {
  if (!job) {
    return Result<void, Error>::Err(
        Error::Registration("Job must not be null (" + trigger.to_string() + ")"));
  }
  if (!trigger.time.valid()) {
    return Result<void, Error>::Err(
        Error::Registration("Trigger time out of range: " + trigger.to_string()));
  }

  std::lock_guard<std::mutex> lock(mutex_);
  entries_.push_back(
      Entry{trigger, std::move(job), next_occurrence(trigger, now)});
  return Result<void, Error>::Ok();
}

std::size_t TimerRegistry::run_pending(IClock::TimePoint now) {
  // Snapshot due entries in firing order, then run them without the lock.
  std::vector<std::pair<IClock::TimePoint, std::size_t>> due;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (std::size_t i = 0; i < entries_.size(); ++i) {
      if (entries_[i].next_run <= now) {
        due.emplace_back(entries_[i].next_run, i);
      }
    }
  }
  std::stable_sort(due.begin(), due.end(),
                   [](const auto &a, const auto &b) { return a.first < b.first; });

  for (const auto &[when, index] : due) {
    Job job;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      job = entries_[index].job;
    }
    job();

    const IClock::TimePoint finished = std::max(now, clock_->now());
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[index].next_run =
        next_occurrence(entries_[index].trigger, finished);
  }
  return due.size();
}

std::optional<IClock::TimePoint> TimerRegistry::next_run() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (entries_.empty()) {
    return std::nullopt;
  }
  auto it = std::min_element(
      entries_.begin(), entries_.end(),
      [](const Entry &a, const Entry &b) { return a.next_run < b.next_run; });
  return it->next_run;
}

std::size_t TimerRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

} // namespace dsa::core
