#pragma once

#include "almanac/agent/session_registry.hpp"
#include "almanac/common/result.hpp"
#include "almanac/config/schema.hpp"
#include "almanac/heartbeat/notifier.hpp"
#include "almanac/schedule/store.hpp"
#include "almanac/tools/tool_registry.hpp"

#include <memory>
#include <string>
#include <vector>

namespace almanac::runtime {

/// Validated configuration plus the factories that turn it into running components.
class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  /// Loads and validates the config; validation warnings are kept for the caller to print.
  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;
  [[nodiscard]] const std::vector<std::string> &warnings() const { return warnings_; }

  /// Installs the configured observer as the process-wide one.
  void install_observer() const;

  [[nodiscard]] common::Result<std::shared_ptr<schedule::ScheduleStore>> create_schedule_store();
  [[nodiscard]] common::Result<std::shared_ptr<tools::ToolRegistry>>
  create_tool_registry(const std::shared_ptr<schedule::ScheduleStore> &store) const;
  [[nodiscard]] common::Result<std::shared_ptr<agent::SessionRegistry>>
  create_session_registry(const std::shared_ptr<tools::ToolRegistry> &tools) const;
  [[nodiscard]] common::Result<std::unique_ptr<heartbeat::ReminderNotifier>>
  create_notifier(const std::shared_ptr<schedule::ScheduleStore> &store) const;

private:
  config::Config config_;
  std::vector<std::string> warnings_;
  std::shared_ptr<schedule::ScheduleStore> store_;
};

} // namespace almanac::runtime
