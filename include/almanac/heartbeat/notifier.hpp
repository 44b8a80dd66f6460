#pragma once

#include "almanac/heartbeat/sink.hpp"
#include "almanac/schedule/store.hpp"
#include "almanac/schedule/time.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

namespace almanac::heartbeat {

struct NotifierOptions {
  std::chrono::milliseconds interval{30000};
};

struct TickReport {
  std::size_t scanned = 0;
  std::size_t notified = 0;
};

/// Pending and `now` has reached start_time minus reminder_minutes.
[[nodiscard]] bool is_due(const schedule::ScheduleRecord &record, schedule::Clock::time_point now);

[[nodiscard]] Notification make_notification(const schedule::ScheduleRecord &record);

/// Periodically moves due schedules to "notified" and emits one notification for each.
class ReminderNotifier {
public:
  ReminderNotifier(std::shared_ptr<schedule::ScheduleStore> store,
                   std::shared_ptr<NotificationSink> sink, NotifierOptions options = {});
  ~ReminderNotifier();

  ReminderNotifier(const ReminderNotifier &) = delete;
  ReminderNotifier &operator=(const ReminderNotifier &) = delete;

  void start();
  void stop();
  [[nodiscard]] bool is_running() const;
  [[nodiscard]] std::size_t ticks() const { return ticks_.load(); }

  /// One scan. Notifications go out only after the updated records are saved.
  [[nodiscard]] common::Result<TickReport> tick(schedule::Clock::time_point now);
  [[nodiscard]] common::Result<TickReport> tick() { return tick(schedule::Clock::now()); }

private:
  void run_loop();

  std::shared_ptr<schedule::ScheduleStore> store_;
  std::shared_ptr<NotificationSink> sink_;
  NotifierOptions options_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::size_t> ticks_{0};
};

} // namespace almanac::heartbeat
