#include <gtest/gtest.h>

#include "core/scheduler.h"
#include "test_support.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace dsa::core;
using dsa::test::FakeClock;
using dsa::test::local_time;
using dsa::test::RecordingLogger;

namespace {

// 2024-01-01 is a Monday.
const auto kMondayMorning = local_time(2024, 1, 1, 9, 29);

struct Harness {
  std::shared_ptr<FakeClock> clock =
      std::make_shared<FakeClock>(kMondayMorning);
  std::shared_ptr<RecordingLogger> logger =
      std::make_shared<RecordingLogger>();

  SchedulerOptions options(std::unique_ptr<ITimerRegistry> timers = nullptr) {
    SchedulerOptions opts;
    opts.logger = logger;
    opts.clock = clock;
    opts.timers = std::move(timers);
    return opts;
  }

  /// Stop `scheduler` once the virtual clock reaches `until`.
  void stop_at(Scheduler *scheduler, IClock::TimePoint until) {
    clock->set_on_sleep([this, scheduler, until]() {
      if (clock->now() >= until) {
        scheduler->stop();
      }
    });
  }
};

std::unique_ptr<Scheduler> make_scheduler(const ScheduleSpec &spec,
                                          SchedulerOptions options) {
  auto created = Scheduler::create(spec, std::move(options));
  EXPECT_TRUE(created.is_ok());
  if (created.is_err()) {
    return nullptr;
  }
  return std::move(created).value();
}

/// Delegates to a real registry but refuses Saturday triggers.
class RejectSaturdayRegistry : public ITimerRegistry {
public:
  explicit RejectSaturdayRegistry(std::shared_ptr<IClock> clock)
      : inner_(std::move(clock)) {}

  Result<void, Error> add(const Trigger &trigger, Job job,
                          IClock::TimePoint now) override {
    if (trigger.day == DayKey::Sat) {
      return Result<void, Error>::Err(
          Error::Registration("Saturday is closed"));
    }
    return inner_.add(trigger, std::move(job), now);
  }
  std::size_t run_pending(IClock::TimePoint now) override {
    return inner_.run_pending(now);
  }
  std::optional<IClock::TimePoint> next_run() const override {
    return inner_.next_run();
  }
  std::size_t size() const override { return inner_.size(); }

private:
  TimerRegistry inner_;
};

} // namespace

// ============ Construction ============

TEST(SchedulerTest, InvalidMappingYieldsNoEngine) {
  Harness h;
  ScheduleMapping mapping = {{"9", {"09:30"}}};
  auto created = Scheduler::create(mapping, h.options());
  ASSERT_TRUE(created.is_err());
  EXPECT_EQ(created.error().category, ErrorCategory::Validation);
  EXPECT_EQ(created.error().detail("token"), "9");
  EXPECT_EQ(h.logger->count("spec_invalid"), 1);
}

TEST(SchedulerTest, CreateRegistersNothing) {
  Harness h;
  auto scheduler = make_scheduler(std::string("09:30"), h.options());
  ASSERT_NE(scheduler, nullptr);
  EXPECT_EQ(scheduler->state(), EngineState::Idle);
  EXPECT_EQ(scheduler->trigger_count(), 0u);
  EXPECT_FALSE(scheduler->next_run().has_value());
}

// ============ Registration ============

TEST(SchedulerTest, RegistersOneTriggerPerDayAndTime) {
  Harness h;
  auto scheduler =
      make_scheduler(std::string("1-5@09:30,13:30;6-7@10:00"), h.options());
  ASSERT_NE(scheduler, nullptr);

  auto registered = scheduler->register_task([] {}, false);
  ASSERT_TRUE(registered.is_ok());
  EXPECT_EQ(registered.value(), 12u);
  EXPECT_EQ(scheduler->trigger_count(), 12u);
  EXPECT_EQ(h.logger->count("trigger_registered"), 12);
  EXPECT_EQ(scheduler->next_run(), local_time(2024, 1, 1, 9, 30));
}

TEST(SchedulerTest, RegistrationFailuresAreIsolated) {
  Harness h;
  auto scheduler =
      make_scheduler(std::string("1-5@09:30;6@10:00"),
                     h.options(std::make_unique<RejectSaturdayRegistry>(h.clock)));
  ASSERT_NE(scheduler, nullptr);

  auto registered = scheduler->register_task([] {}, false);
  ASSERT_TRUE(registered.is_ok());
  EXPECT_EQ(registered.value(), 5u);
  EXPECT_EQ(h.logger->count("trigger_registered"), 5);
  EXPECT_EQ(h.logger->count("trigger_register_failed"), 1);
}

TEST(SchedulerTest, RejectsNullAndSecondTask) {
  Harness h;
  auto scheduler = make_scheduler(std::string("09:30"), h.options());
  ASSERT_NE(scheduler, nullptr);

  EXPECT_TRUE(scheduler->register_task(nullptr, false).is_err());
  EXPECT_TRUE(scheduler->register_task([] {}, false).is_ok());
  EXPECT_TRUE(scheduler->register_task([] {}, false).is_err());
}

TEST(SchedulerTest, RunImmediatelyInvokesOnceBeforeReturning) {
  Harness h;
  auto scheduler = make_scheduler(std::string("18:00"), h.options());
  ASSERT_NE(scheduler, nullptr);

  int runs = 0;
  ASSERT_TRUE(scheduler->register_task([&] { ++runs; }, true).is_ok());
  EXPECT_EQ(runs, 1);
  EXPECT_EQ(h.logger->count("run_started"), 1);
  EXPECT_EQ(h.logger->count("run_finished"), 1);
}

// ============ Guarded wrapper ============

TEST(SchedulerTest, OverlappingFireIsSkipped) {
  Harness h;
  auto scheduler = make_scheduler(std::string("18:00"), h.options());
  ASSERT_NE(scheduler, nullptr);

  std::mutex mu;
  std::condition_variable cv;
  bool entered = false;
  bool release = false;
  std::atomic<int> runs{0};

  ASSERT_TRUE(scheduler
                  ->register_task(
                      [&] {
                        ++runs;
                        std::unique_lock<std::mutex> lock(mu);
                        entered = true;
                        cv.notify_all();
                        cv.wait(lock, [&] { return release; });
                      },
                      false)
                  .is_ok());

  bool first_ran = false;
  std::thread runner([&] { first_ran = scheduler->fire(); });
  {
    std::unique_lock<std::mutex> lock(mu);
    cv.wait(lock, [&] { return entered; });
  }

  EXPECT_TRUE(scheduler->is_task_running());
  EXPECT_FALSE(scheduler->fire());
  EXPECT_EQ(h.logger->count("run_skipped"), 1);

  {
    std::lock_guard<std::mutex> lock(mu);
    release = true;
  }
  cv.notify_all();
  runner.join();

  EXPECT_TRUE(first_ran);
  EXPECT_EQ(runs.load(), 1);
  EXPECT_FALSE(scheduler->is_task_running());
}

TEST(SchedulerTest, ThrowingCallbackReleasesGuard) {
  Harness h;
  auto scheduler = make_scheduler(std::string("18:00"), h.options());
  ASSERT_NE(scheduler, nullptr);

  int calls = 0;
  ASSERT_TRUE(scheduler
                  ->register_task(
                      [&] {
                        if (++calls == 1) {
                          throw std::runtime_error("boom");
                        }
                      },
                      false)
                  .is_ok());

  EXPECT_TRUE(scheduler->fire());
  EXPECT_FALSE(scheduler->is_task_running());
  EXPECT_EQ(h.logger->count("run_failed"), 1);
  EXPECT_EQ(h.logger->count("run_finished"), 1);

  EXPECT_TRUE(scheduler->fire());
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(h.logger->count("run_failed"), 1);
  EXPECT_EQ(h.logger->count("run_finished"), 2);
}

TEST(SchedulerTest, EachFiringGetsItsOwnTraceId) {
  Harness h;
  auto scheduler = make_scheduler(std::string("18:00"), h.options());
  ASSERT_NE(scheduler, nullptr);
  ASSERT_TRUE(scheduler->register_task([] {}, false).is_ok());

  scheduler->fire();
  scheduler->fire();

  std::vector<std::string> traces;
  for (const auto &r : h.logger->records()) {
    if (r.event == "run_started") {
      traces.push_back(r.trace_id);
    }
  }
  ASSERT_EQ(traces.size(), 2u);
  EXPECT_NE(traces[0], traces[1]);
}

TEST(SchedulerTest, FireWithoutTaskIsIgnored) {
  Harness h;
  auto scheduler = make_scheduler(std::string("18:00"), h.options());
  ASSERT_NE(scheduler, nullptr);
  EXPECT_FALSE(scheduler->fire());
}

TEST(SchedulerTest, FireFromAnotherThreadDuringRegistration) {
  Harness h;
  auto scheduler =
      make_scheduler(std::string("1-5@09:30,13:30;6-7@10:00"), h.options());
  ASSERT_NE(scheduler, nullptr);

  std::atomic<int> runs{0};
  std::atomic<bool> done{false};
  std::thread firer([&] {
    while (!done.load()) {
      scheduler->fire();
    }
  });
  ASSERT_TRUE(scheduler->register_task([&] { ++runs; }, false).is_ok());
  done.store(true);
  firer.join();

  EXPECT_TRUE(scheduler->fire());
  EXPECT_GE(runs.load(), 1);
  EXPECT_FALSE(scheduler->is_task_running());
}

// ============ Loop ============

TEST(SchedulerTest, MappingFiresMondayAndDailyTriggers) {
  Harness h;
  ScheduleMapping mapping = {{"1", {"09:30"}}, {"every", {"18:00"}}};
  auto scheduler = make_scheduler(mapping, h.options());
  ASSERT_NE(scheduler, nullptr);

  int runs = 0;
  ASSERT_TRUE(scheduler->register_task([&] { ++runs; }, false).is_ok());
  h.stop_at(scheduler.get(), local_time(2024, 1, 1, 18, 1));

  ASSERT_TRUE(scheduler->run().is_ok());
  EXPECT_EQ(runs, 2);
  EXPECT_EQ(scheduler->state(), EngineState::Stopped);
  EXPECT_EQ(scheduler->next_run(), local_time(2024, 1, 2, 18, 0));
}

TEST(SchedulerTest, WeekdayTriggerDoesNotFireOnOtherDays) {
  Harness h;
  auto scheduler = make_scheduler(std::string("2@09:30"), h.options());
  ASSERT_NE(scheduler, nullptr);

  int runs = 0;
  ASSERT_TRUE(scheduler->register_task([&] { ++runs; }, false).is_ok());
  h.stop_at(scheduler.get(), local_time(2024, 1, 1, 23, 0));

  ASSERT_TRUE(scheduler->run().is_ok());
  EXPECT_EQ(runs, 0);
  EXPECT_EQ(scheduler->next_run(), local_time(2024, 1, 2, 9, 30));
}

TEST(SchedulerTest, HeartbeatOncePerHour) {
  Harness h;
  auto scheduler = make_scheduler(std::string("23:00"), h.options());
  ASSERT_NE(scheduler, nullptr);
  ASSERT_TRUE(scheduler->register_task([] {}, false).is_ok());

  // 09:29 -> 12:10 crosses 10:00, 11:00 and 12:00.
  h.stop_at(scheduler.get(), local_time(2024, 1, 1, 12, 10));
  ASSERT_TRUE(scheduler->run().is_ok());
  EXPECT_EQ(h.logger->count("heartbeat"), 3);
  EXPECT_EQ(h.logger->count("loop_started"), 1);
  EXPECT_EQ(h.logger->count("loop_stopped"), 1);
}

TEST(SchedulerTest, StopBeforeRunNeverIterates) {
  Harness h;
  auto scheduler = make_scheduler(std::string("09:30"), h.options());
  ASSERT_NE(scheduler, nullptr);

  int runs = 0;
  ASSERT_TRUE(scheduler->register_task([&] { ++runs; }, false).is_ok());
  scheduler->stop();
  scheduler->stop();

  ASSERT_TRUE(scheduler->run().is_ok());
  EXPECT_EQ(runs, 0);
  EXPECT_EQ(h.clock->sleeps(), 0);
  EXPECT_EQ(h.logger->count("stop_requested"), 1);
  EXPECT_EQ(h.logger->count("loop_stopped"), 1);
  EXPECT_EQ(scheduler->state(), EngineState::Stopped);
}

TEST(SchedulerTest, RepeatedStopDuringRunLogsOnce) {
  Harness h;
  auto scheduler = make_scheduler(std::string("09:30"), h.options());
  ASSERT_NE(scheduler, nullptr);
  ASSERT_TRUE(scheduler->register_task([] {}, false).is_ok());

  Scheduler *raw = scheduler.get();
  h.clock->set_on_sleep([raw]() {
    raw->stop();
    raw->stop();
  });
  ASSERT_TRUE(scheduler->run().is_ok());
  EXPECT_EQ(h.clock->sleeps(), 1);
  EXPECT_EQ(h.logger->count("stop_requested"), 1);
}

TEST(SchedulerTest, NotRestartable) {
  Harness h;
  auto scheduler = make_scheduler(std::string("09:30"), h.options());
  ASSERT_NE(scheduler, nullptr);
  ASSERT_TRUE(scheduler->register_task([] {}, false).is_ok());

  scheduler->stop();
  ASSERT_TRUE(scheduler->run().is_ok());
  EXPECT_TRUE(scheduler->run().is_err());
  EXPECT_TRUE(scheduler->register_task([] {}, false).is_err());
}

TEST(SchedulerTest, ShutdownProbeEndsLoop) {
  Harness h;
  int probes = 0;
  auto opts = h.options();
  opts.shutdown_requested = [&probes]() { return ++probes > 3; };
  auto scheduler = make_scheduler(std::string("09:30"), std::move(opts));
  ASSERT_NE(scheduler, nullptr);
  ASSERT_TRUE(scheduler->register_task([] {}, false).is_ok());

  ASSERT_TRUE(scheduler->run().is_ok());
  EXPECT_EQ(h.clock->sleeps(), 3);
  EXPECT_FALSE(scheduler->stop_requested());
  EXPECT_EQ(scheduler->state(), EngineState::Stopped);
}

// ============ Auxiliary jobs ============

TEST(SchedulerTest, AuxiliaryJobRunsOnItsOwnSchedule) {
  Harness h;
  auto scheduler = make_scheduler(std::string("18:00"), h.options());
  ASSERT_NE(scheduler, nullptr);

  int task_runs = 0;
  int aux_runs = 0;
  auto added =
      scheduler->add_job("refresh", std::string("09:45"), [&] { ++aux_runs; });
  ASSERT_TRUE(added.is_ok());
  EXPECT_EQ(added.value(), 1u);
  ASSERT_TRUE(scheduler->register_task([&] { ++task_runs; }, false).is_ok());

  h.stop_at(scheduler.get(), local_time(2024, 1, 1, 10, 0));
  ASSERT_TRUE(scheduler->run().is_ok());
  EXPECT_EQ(aux_runs, 1);
  EXPECT_EQ(task_runs, 0);
}

TEST(SchedulerTest, AuxiliaryJobWithInvalidSpecIsRejected) {
  Harness h;
  auto scheduler = make_scheduler(std::string("18:00"), h.options());
  ASSERT_NE(scheduler, nullptr);
  auto added = scheduler->add_job("refresh", std::string("9:45"), [] {});
  ASSERT_TRUE(added.is_err());
  EXPECT_EQ(added.error().category, ErrorCategory::Validation);
  EXPECT_EQ(scheduler->trigger_count(), 0u);
}

// ============ run_with_schedule ============

TEST(RunWithScheduleTest, InvalidSpecRunsNothing) {
  Harness h;
  int runs = 0;
  auto result = run_with_schedule([&] { ++runs; }, std::string("24:00"), true,
                                  h.options());
  ASSERT_TRUE(result.is_err());
  EXPECT_EQ(result.error().category, ErrorCategory::Validation);
  EXPECT_EQ(runs, 0);
}

TEST(RunWithScheduleTest, RunsImmediatelyThenLoopsUntilShutdown) {
  Harness h;
  int runs = 0;
  int probes = 0;
  auto opts = h.options();
  opts.shutdown_requested = [&probes]() { return ++probes > 2; };

  auto result = run_with_schedule([&] { ++runs; }, std::string("18:00"), true,
                                  std::move(opts));
  ASSERT_TRUE(result.is_ok());
  EXPECT_EQ(runs, 1);
  EXPECT_EQ(h.logger->count("loop_stopped"), 1);
}
