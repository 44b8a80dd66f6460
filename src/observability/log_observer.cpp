#include "almanac/observability/log_observer.hpp"

#include <iostream>
#include <string_view>
#include <type_traits>

namespace almanac::observability {

namespace {

std::string_view level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

LogObserver::LogObserver(const LogLevel min_level) : LogObserver(min_level, std::cerr) {}

LogObserver::LogObserver(const LogLevel min_level, std::ostream &out)
    : min_level_(min_level), out_(out) {}

void LogObserver::write(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(write_mutex_);
  out_ << "[" << level_name(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ConnectionOpenedEvent>) {
          write(LogLevel::Info, "connection.open id=" + evt.connection_id);
        } else if constexpr (std::is_same_v<T, ConnectionClosedEvent>) {
          write(LogLevel::Info,
                "connection.close id=" + evt.connection_id + " phase=" + evt.final_phase);
        } else if constexpr (std::is_same_v<T, MessageProcessedEvent>) {
          write(evt.success ? LogLevel::Info : LogLevel::Warn,
                   "session.message session=" + evt.session_id +
                       " duration_ms=" + std::to_string(evt.duration.count()) +
                       " tool_turns=" + std::to_string(evt.tool_turns) +
                       " success=" + bool_text(evt.success));
        } else if constexpr (std::is_same_v<T, ToolCallEvent>) {
          write(evt.success ? LogLevel::Info : LogLevel::Warn, "tool.call name=" + evt.tool +
                               " duration_ms=" + std::to_string(evt.duration.count()) +
                               " success=" + bool_text(evt.success));
        } else if constexpr (std::is_same_v<T, ReminderTickEvent>) {
          write(LogLevel::Debug, "reminder.tick scanned=" + std::to_string(evt.scanned) +
                                " notified=" + std::to_string(evt.notified));
        } else if constexpr (std::is_same_v<T, ReminderEmittedEvent>) {
          write(LogLevel::Info, "reminder.emit id=" + evt.schedule_id + " title=" + evt.title);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          write(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ActiveConnectionsMetric>) {
          write(LogLevel::Debug, "metric.active_connections=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, ActiveSessionsMetric>) {
          write(LogLevel::Debug, "metric.active_sessions=" + std::to_string(m.count));
        }
      },
      metric);
}

} // namespace almanac::observability
