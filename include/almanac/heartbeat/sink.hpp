#pragma once

#include "almanac/common/result.hpp"

#include <functional>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace almanac::heartbeat {

struct Notification {
  std::string schedule_id;
  std::string title;
  std::string body;
};

class NotificationSink {
public:
  virtual ~NotificationSink() = default;

  [[nodiscard]] virtual common::Status notify(const Notification &notification) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

class LogNotificationSink final : public NotificationSink {
public:
  LogNotificationSink();
  explicit LogNotificationSink(std::ostream &out);

  [[nodiscard]] common::Status notify(const Notification &notification) override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  std::ostream &out_;
  std::mutex mutex_;
};

/// notify-send on Linux, osascript on macOS. Falls back to the log when neither is available
/// or the command fails.
class DesktopNotificationSink final : public NotificationSink {
public:
  DesktopNotificationSink();

  [[nodiscard]] common::Status notify(const Notification &notification) override;
  [[nodiscard]] std::string_view name() const override { return "desktop"; }

  /// Shell command for the current platform, empty when no notifier binary is on PATH.
  [[nodiscard]] static std::string build_command(const Notification &notification);

private:
  LogNotificationSink fallback_;
};

class CallbackNotificationSink final : public NotificationSink {
public:
  using Callback = std::function<void(const Notification &)>;

  explicit CallbackNotificationSink(Callback callback) : callback_(std::move(callback)) {}

  [[nodiscard]] common::Status notify(const Notification &notification) override;
  [[nodiscard]] std::string_view name() const override { return "callback"; }

private:
  Callback callback_;
};

/// "log" or "desktop".
[[nodiscard]] common::Result<std::shared_ptr<NotificationSink>>
make_notification_sink(const std::string &kind);

} // namespace almanac::heartbeat
