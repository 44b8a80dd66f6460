#include "almanac/heartbeat/notifier.hpp"

#include "almanac/observability/global.hpp"

#include <algorithm>
#include <exception>
#include <vector>

namespace almanac::heartbeat {

bool is_due(const schedule::ScheduleRecord &record, const schedule::Clock::time_point now) {
  if (record.status != schedule::ScheduleStatus::Pending) {
    return false;
  }
  const auto start = schedule::parse_local_time(record.start_time);
  if (!start.has_value()) {
    return false;
  }
  const int lead = std::clamp(record.reminder_minutes, 0, schedule::MAX_REMINDER_MINUTES);
  return now >= *start - std::chrono::minutes(lead);
}

Notification make_notification(const schedule::ScheduleRecord &record) {
  Notification notification;
  notification.schedule_id = record.id;
  notification.title =
      "Schedule reminder: " + (record.title.empty() ? std::string("(untitled)") : record.title);
  notification.body = record.start_time;
  if (record.reminder_minutes > 0) {
    notification.body +=
        " (reminder " + std::to_string(record.reminder_minutes) + " minutes before)";
  }
  if (record.notes.has_value() && !record.notes->empty()) {
    notification.body += " - " + *record.notes;
  }
  return notification;
}

ReminderNotifier::ReminderNotifier(std::shared_ptr<schedule::ScheduleStore> store,
                                   std::shared_ptr<NotificationSink> sink,
                                   NotifierOptions options)
    : store_(std::move(store)), sink_(std::move(sink)), options_(options) {}

ReminderNotifier::~ReminderNotifier() { stop(); }

void ReminderNotifier::start() {
  if (running_) {
    return;
  }
  running_ = true;
  thread_ = std::thread([this]() { run_loop(); });
}

void ReminderNotifier::stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool ReminderNotifier::is_running() const { return running_; }

common::Result<TickReport> ReminderNotifier::tick(const schedule::Clock::time_point now) {
  ++ticks_;
  if (!store_) {
    return common::Result<TickReport>::failure("notifier has no schedule store");
  }

  TickReport report;
  std::vector<Notification> due;
  const std::string stamp = schedule::format_local_second(now);
  auto mutated = store_->mutate([&](std::vector<schedule::ScheduleRecord> &records, bool &changed) {
    report.scanned = records.size();
    for (auto &record : records) {
      if (!is_due(record, now)) {
        continue;
      }
      record.status = schedule::ScheduleStatus::Notified;
      record.notified_at = stamp;
      due.push_back(make_notification(record));
      changed = true;
    }
    return common::Status::success();
  });
  if (!mutated.ok()) {
    return common::Result<TickReport>::failure(mutated);
  }

  report.notified = due.size();
  for (const auto &notification : due) {
    observability::record_reminder_emitted(notification.schedule_id, notification.title);
    if (!sink_) {
      continue;
    }
    auto sent = sink_->notify(notification);
    if (!sent.ok()) {
      observability::record_error("notifier", "reminder " + notification.schedule_id +
                                                  " not delivered via " +
                                                  std::string(sink_->name()) + ": " + sent.error());
    }
  }
  observability::record_reminder_tick(report.scanned, report.notified);
  return common::Result<TickReport>::success(report);
}

void ReminderNotifier::run_loop() {
  while (running_) {
    try {
      auto result = tick();
      if (!result.ok()) {
        observability::record_error("notifier", "tick failed: " + result.error());
      }
    } catch (const std::exception &e) {
      observability::record_error("notifier", std::string("tick threw: ") + e.what());
    }
    const auto wait_steps = std::max<long long>(1, options_.interval.count() / 100);
    for (long long i = 0; i < wait_steps && running_; ++i) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }
}

} // namespace almanac::heartbeat
