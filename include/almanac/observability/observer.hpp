#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace almanac::observability {

struct ConnectionOpenedEvent {
  std::string connection_id;
};

struct ConnectionClosedEvent {
  std::string connection_id;
  std::string final_phase;
};

struct MessageProcessedEvent {
  std::string session_id;
  std::chrono::milliseconds duration{0};
  std::size_t tool_turns = 0;
  bool success = false;
};

struct ToolCallEvent {
  std::string tool;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct ReminderTickEvent {
  std::size_t scanned = 0;
  std::size_t notified = 0;
};

struct ReminderEmittedEvent {
  std::string schedule_id;
  std::string title;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<ConnectionOpenedEvent, ConnectionClosedEvent, MessageProcessedEvent,
                 ToolCallEvent, ReminderTickEvent, ReminderEmittedEvent, ErrorEvent>;

struct ActiveConnectionsMetric {
  std::uint64_t count = 0;
};

struct ActiveSessionsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<ActiveConnectionsMetric, ActiveSessionsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

/// Installed when `observability.backend` is "none" and by the test runner.
class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace almanac::observability
