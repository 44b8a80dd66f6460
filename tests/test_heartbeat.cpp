#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "almanac/heartbeat/notifier.hpp"
#include "almanac/heartbeat/sink.hpp"

#include <memory>
#include <mutex>
#include <sstream>
#include <thread>

namespace {

namespace hb = almanac::heartbeat;
namespace sched = almanac::schedule;

struct Collected {
  std::mutex mutex;
  std::vector<hb::Notification> items;

  std::shared_ptr<hb::NotificationSink> sink() {
    return std::make_shared<hb::CallbackNotificationSink>([this](const hb::Notification &n) {
      std::lock_guard<std::mutex> lock(mutex);
      items.push_back(n);
    });
  }

  std::size_t size() {
    std::lock_guard<std::mutex> lock(mutex);
    return items.size();
  }
};

class FailingSink final : public hb::NotificationSink {
public:
  almanac::common::Status notify(const hb::Notification &) override {
    ++attempts;
    return almanac::common::Status::error(almanac::common::ErrorKind::Io, "display gone");
  }
  std::string_view name() const override { return "failing"; }

  int attempts = 0;
};

sched::Clock::time_point at(const std::string &text) {
  const auto parsed = sched::parse_local_time(text);
  almanac::tests::require(parsed.has_value(), "bad test time " + text);
  return *parsed;
}

} // namespace

void register_heartbeat_tests(std::vector<almanac::tests::TestCase> &tests) {
  using almanac::tests::require;

  tests.push_back({"heartbeat_due_record_is_notified_once", [] {
                     almanac::testing::TempWorkspace ws;
                     auto store = std::make_shared<sched::ScheduleStore>(ws.path() / "s.json");
                     const auto record =
                         store->create({.title = "Call Bob", .start_time = "2030-05-01 10:00",
                                        .notes = "dial in"})
                             .value();
                     Collected collected;
                     hb::ReminderNotifier notifier(store, collected.sink());

                     auto first = notifier.tick(at("2030-05-01 10:01"));
                     require(first.ok(), first.error());
                     require(first.value().scanned == 1, "one record scanned");
                     require(first.value().notified == 1, "one notification expected");
                     require(collected.size() == 1, "sink should see it");
                     require(collected.items[0].schedule_id == record.id, "id mismatch");
                     require(collected.items[0].title == "Schedule reminder: Call Bob", "title");
                     require(collected.items[0].body.find("dial in") != std::string::npos,
                             "notes should be in the body");

                     const auto stored = store->get(record.id).value();
                     require(stored.status == sched::ScheduleStatus::Notified, "status not saved");
                     require(stored.notified_at.has_value(), "notified_at missing");

                     auto second = notifier.tick(at("2030-05-01 10:02"));
                     require(second.ok() && second.value().notified == 0, "no repeat");
                     require(collected.size() == 1, "notification must not repeat");
                   }});

  tests.push_back({"heartbeat_reminder_window_is_honoured", [] {
                     almanac::testing::TempWorkspace ws;
                     auto store = std::make_shared<sched::ScheduleStore>(ws.path() / "s.json");
                     require(store->create({.title = "Review", .start_time = "2030-05-01 10:00",
                                            .reminder_minutes = 15})
                                 .ok(),
                             "create");
                     Collected collected;
                     hb::ReminderNotifier notifier(store, collected.sink());
                     require(notifier.tick(at("2030-05-01 09:44")).value().notified == 0,
                             "too early");
                     require(notifier.tick(at("2030-05-01 09:45")).value().notified == 1,
                             "window reached");
                     require(collected.items[0].body.find("15 minutes before") != std::string::npos,
                             "lead time should be mentioned");
                   }});

  tests.push_back({"heartbeat_future_and_cancelled_records_are_left_alone", [] {
                     almanac::testing::TempWorkspace ws;
                     auto store = std::make_shared<sched::ScheduleStore>(ws.path() / "s.json");
                     const auto future =
                         store->create({.title = "Later", .start_time = "2031-01-01 10:00"}).value();
                     const auto cancelled =
                         store->create({.title = "Dropped", .start_time = "2030-01-01 10:00"})
                             .value();
                     require(store->update(cancelled.id,
                                           {.status = sched::ScheduleStatus::Cancelled})
                                 .ok(),
                             "cancel");
                     Collected collected;
                     hb::ReminderNotifier notifier(store, collected.sink());
                     auto report = notifier.tick(at("2030-06-01 00:00"));
                     require(report.ok(), report.error());
                     require(report.value().scanned == 2 && report.value().notified == 0,
                             "nothing should be due");
                     require(store->get(future.id).value().status == sched::ScheduleStatus::Pending,
                             "future record changed");
                     require(store->get(cancelled.id).value().status ==
                                 sched::ScheduleStatus::Cancelled,
                             "cancelled record changed");
                     require(collected.size() == 0, "no notifications expected");
                   }});

  tests.push_back({"heartbeat_sink_failure_does_not_undo_the_transition", [] {
                     almanac::testing::TempWorkspace ws;
                     auto store = std::make_shared<sched::ScheduleStore>(ws.path() / "s.json");
                     const auto record =
                         store->create({.title = "Ping", .start_time = "2030-05-01 10:00"}).value();
                     auto sink = std::make_shared<FailingSink>();
                     hb::ReminderNotifier notifier(store, sink);
                     auto report = notifier.tick(at("2030-05-01 10:00"));
                     require(report.ok(), report.error());
                     require(sink->attempts == 1, "sink should be tried");
                     require(store->get(record.id).value().status ==
                                 sched::ScheduleStatus::Notified,
                             "record should stay notified");
                   }});

  tests.push_back({"heartbeat_loop_survives_store_failures", [] {
                     almanac::testing::TempWorkspace ws;
                     const auto blocker = ws.create_file("not-a-dir", "x");
                     auto store = std::make_shared<sched::ScheduleStore>(blocker / "s.json");
                     Collected collected;
                     hb::ReminderNotifier notifier(store, collected.sink(),
                                                   {.interval = std::chrono::milliseconds(100)});
                     require(!notifier.tick().ok(), "unusable store should fail a tick");

                     notifier.start();
                     require(notifier.is_running(), "notifier should run");
                     for (int i = 0; i < 50 && notifier.ticks() < 4; ++i) {
                       std::this_thread::sleep_for(std::chrono::milliseconds(100));
                     }
                     const auto ticks = notifier.ticks();
                     notifier.stop();
                     require(ticks >= 4, "loop should keep ticking after failures");
                     require(!notifier.is_running(), "notifier should stop");
                   }});

  tests.push_back({"heartbeat_sinks", [] {
                     std::ostringstream out;
                     hb::LogNotificationSink log(out);
                     auto status = log.notify({.schedule_id = "ab12cd34",
                                               .title = "Schedule reminder: Lunch",
                                               .body = "2030-05-01 12:00"});
                     require(status.ok(), status.error());
                     require(out.str() == "[NOTIFY] Schedule reminder: Lunch - 2030-05-01 12:00\n",
                             "log line mismatch: " + out.str());

                     require(hb::make_notification_sink("log").value()->name() == "log", "log");
                     require(hb::make_notification_sink("desktop").value()->name() == "desktop",
                             "desktop");
                     auto unknown = hb::make_notification_sink("pager");
                     require(!unknown.ok(), "unknown sink should fail");
                     require(unknown.kind() == almanac::common::ErrorKind::InvalidArguments,
                             "kind mismatch");
                   }});

  tests.push_back({"heartbeat_notification_text", [] {
                     sched::ScheduleRecord record;
                     record.id = "ab12cd34";
                     record.start_time = "2030-05-01 12:00";
                     const auto untitled = hb::make_notification(record);
                     require(untitled.title == "Schedule reminder: (untitled)", "untitled");
                     require(untitled.body == "2030-05-01 12:00", "plain body");
                     require(hb::is_due(record, at("2030-05-01 12:00")), "due at start");
                     require(!hb::is_due(record, at("2030-05-01 11:59")), "not due before");
                     record.reminder_minutes = 2147483647;
                     require(hb::is_due(record, at("2030-04-01 12:00")),
                             "oversized lead time is capped at a year");
                     require(!hb::is_due(record, at("2029-04-01 12:00")),
                             "more than a year ahead is not due");
                     record.reminder_minutes = 0;
                     record.status = sched::ScheduleStatus::Notified;
                     require(!hb::is_due(record, at("2030-05-01 12:30")), "notified is not due");
                   }});
}
