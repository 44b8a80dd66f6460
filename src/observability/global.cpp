#include "almanac/observability/global.hpp"

#include <mutex>

namespace almanac::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_connection_opened(const std::string &connection_id) {
  record_event(ConnectionOpenedEvent{.connection_id = connection_id});
}

void record_connection_closed(const std::string &connection_id, const std::string &final_phase) {
  record_event(ConnectionClosedEvent{.connection_id = connection_id, .final_phase = final_phase});
}

void record_message_processed(const std::string &session_id,
                              const std::chrono::milliseconds duration,
                              const std::size_t tool_turns, const bool success) {
  record_event(MessageProcessedEvent{.session_id = session_id,
                                     .duration = duration,
                                     .tool_turns = tool_turns,
                                     .success = success});
}

void record_tool_call(const std::string &tool, const std::chrono::milliseconds duration,
                      const bool success) {
  record_event(ToolCallEvent{.tool = tool, .duration = duration, .success = success});
}

void record_reminder_tick(const std::size_t scanned, const std::size_t notified) {
  record_event(ReminderTickEvent{.scanned = scanned, .notified = notified});
}

void record_reminder_emitted(const std::string &schedule_id, const std::string &title) {
  record_event(ReminderEmittedEvent{.schedule_id = schedule_id, .title = title});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace almanac::observability
