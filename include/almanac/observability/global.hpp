#pragma once

#include "almanac/observability/observer.hpp"

#include <memory>

namespace almanac::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_connection_opened(const std::string &connection_id);
void record_connection_closed(const std::string &connection_id, const std::string &final_phase);
void record_message_processed(const std::string &session_id, std::chrono::milliseconds duration,
                              std::size_t tool_turns, bool success);
void record_tool_call(const std::string &tool, std::chrono::milliseconds duration, bool success);
void record_reminder_tick(std::size_t scanned, std::size_t notified);
void record_reminder_emitted(const std::string &schedule_id, const std::string &title);
void record_error(const std::string &component, const std::string &message);

} // namespace almanac::observability
