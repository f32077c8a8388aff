#pragma once

#include <chrono>
#include <ctime>
#include <memory>
#include <string>

namespace dsa::core {

/// Wall-clock source for the scheduler.
/// Triggers are expressed in host local time, so the clock hands out
/// system_clock time points; tests substitute a virtual clock whose
/// sleep_for() advances time instantly.
class IClock {
public:
  using TimePoint = std::chrono::system_clock::time_point;

  virtual ~IClock() = default;

  [[nodiscard]] virtual TimePoint now() const = 0;

  /// Block the calling thread for `duration`.
  virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

/// Real clock backed by std::chrono::system_clock.
std::shared_ptr<IClock> create_system_clock();

/// Break a time point down in the host's local timezone.
std::tm to_local_tm(IClock::TimePoint tp);

/// Inverse of to_local_tm(); out-of-range fields are normalized (mktime).
IClock::TimePoint from_local_tm(std::tm tm);

/// "YYYY-MM-DD HH:MM:SS" in local time.
std::string format_local(IClock::TimePoint tp);

} // namespace dsa::core
