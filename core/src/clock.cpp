#include "core/clock.h"

#include <iomanip>
#include <sstream>
#include <thread>

namespace dsa::core {

namespace {

class SystemClock final : public IClock {
public:
  [[nodiscard]] TimePoint now() const override {
    return std::chrono::system_clock::now();
  }

  void sleep_for(std::chrono::milliseconds duration) override {
    std::this_thread::sleep_for(duration);
  }
};

} // namespace

std::shared_ptr<IClock> create_system_clock() {
  return std::make_shared<SystemClock>();
}

std::tm to_local_tm(IClock::TimePoint tp) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm out{};
#ifdef _WIN32
  localtime_s(&out, &t);
#else
  localtime_r(&t, &out);
#endif
  return out;
}

IClock::TimePoint from_local_tm(std::tm tm) {
  tm.tm_isdst = -1; // let mktime resolve DST for the target date
  return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

std::string format_local(IClock::TimePoint tp) {
  const std::tm tm = to_local_tm(tp);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

} // namespace dsa::core
