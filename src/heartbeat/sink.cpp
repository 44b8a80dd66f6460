#include "almanac/heartbeat/sink.hpp"

#include "almanac/common/fs.hpp"
#include "almanac/observability/global.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>

#include <sys/wait.h>

namespace almanac::heartbeat {

namespace {

std::string shell_quote(const std::string &value) {
  std::string out = "'";
  for (const char ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

bool command_exists(const std::string &command) {
  const char *path_raw = std::getenv("PATH");
  if (path_raw == nullptr || *path_raw == '\0') {
    return false;
  }
  std::stringstream stream{std::string(path_raw)};
  std::string dir;
  while (std::getline(stream, dir, ':')) {
    if (dir.empty()) {
      continue;
    }
    std::error_code ec;
    if (std::filesystem::exists(std::filesystem::path(dir) / command, ec) && !ec) {
      return true;
    }
  }
  return false;
}

[[maybe_unused]] std::string escape_applescript(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(ch);
  }
  return escaped;
}

} // namespace

LogNotificationSink::LogNotificationSink() : out_(std::cerr) {}

LogNotificationSink::LogNotificationSink(std::ostream &out) : out_(out) {}

common::Status LogNotificationSink::notify(const Notification &notification) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[NOTIFY] " << notification.title;
  if (!notification.body.empty()) {
    out_ << " - " << notification.body;
  }
  out_ << "\n";
  out_.flush();
  if (!out_) {
    return common::Status::error(common::ErrorKind::Io, "failed to write notification log");
  }
  return common::Status::success();
}

DesktopNotificationSink::DesktopNotificationSink() = default;

std::string DesktopNotificationSink::build_command(const Notification &notification) {
#if defined(__APPLE__)
  if (command_exists("osascript")) {
    const std::string script = "display notification \"" + escape_applescript(notification.body) +
                               "\" with title \"" + escape_applescript(notification.title) + "\"";
    return "osascript -e " + shell_quote(script);
  }
#else
  if (command_exists("notify-send")) {
    return "notify-send " + shell_quote(notification.title) + " " +
           shell_quote(notification.body);
  }
#endif
  return "";
}

common::Status DesktopNotificationSink::notify(const Notification &notification) {
  const std::string command = build_command(notification);
  if (command.empty()) {
    return fallback_.notify(notification);
  }
  const int rc = std::system((command + " >/dev/null 2>&1").c_str());
  if (rc == -1 || !WIFEXITED(rc) || WEXITSTATUS(rc) != 0) {
    observability::record_error("notifier", "desktop notification failed (status " +
                                                std::to_string(rc) + "), logging instead");
    return fallback_.notify(notification);
  }
  return common::Status::success();
}

common::Status CallbackNotificationSink::notify(const Notification &notification) {
  if (!callback_) {
    return common::Status::error("notification callback is empty");
  }
  callback_(notification);
  return common::Status::success();
}

common::Result<std::shared_ptr<NotificationSink>> make_notification_sink(const std::string &kind) {
  const std::string normalized = common::to_lower(common::trim(kind));
  if (normalized.empty() || normalized == "log") {
    return common::Result<std::shared_ptr<NotificationSink>>::success(
        std::make_shared<LogNotificationSink>());
  }
  if (normalized == "desktop") {
    return common::Result<std::shared_ptr<NotificationSink>>::success(
        std::make_shared<DesktopNotificationSink>());
  }
  return common::Result<std::shared_ptr<NotificationSink>>::failure(
      common::ErrorKind::InvalidArguments, "unknown notification sink: " + kind);
}

} // namespace almanac::heartbeat
