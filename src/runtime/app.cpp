#include "almanac/runtime/app.hpp"

#include "almanac/agent/prompt.hpp"
#include "almanac/common/fs.hpp"
#include "almanac/config/config.hpp"
#include "almanac/observability/factory.hpp"
#include "almanac/observability/global.hpp"
#include "almanac/providers/factory.hpp"

namespace almanac::runtime {

RuntimeContext::RuntimeContext(config::Config config) : config_(std::move(config)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.status());
  }
  auto validated = config::validate_config(loaded.value());
  if (!validated.ok()) {
    return common::Result<RuntimeContext>::failure(validated.status());
  }
  RuntimeContext context(std::move(loaded.value()));
  context.warnings_ = std::move(validated.value());
  return common::Result<RuntimeContext>::success(std::move(context));
}

const config::Config &RuntimeContext::config() const { return config_; }

void RuntimeContext::install_observer() const {
  observability::set_global_observer(observability::create_observer(config_));
}

common::Result<std::shared_ptr<schedule::ScheduleStore>> RuntimeContext::create_schedule_store() {
  if (store_) {
    return common::Result<std::shared_ptr<schedule::ScheduleStore>>::success(store_);
  }
  auto path = config::schedule_file(config_);
  if (!path.ok()) {
    return common::Result<std::shared_ptr<schedule::ScheduleStore>>::failure(path.status());
  }
  store_ = std::make_shared<schedule::ScheduleStore>(path.value());
  return common::Result<std::shared_ptr<schedule::ScheduleStore>>::success(store_);
}

common::Result<std::shared_ptr<tools::ToolRegistry>>
RuntimeContext::create_tool_registry(const std::shared_ptr<schedule::ScheduleStore> &store) const {
  auto registry = std::make_shared<tools::ToolRegistry>();
  auto registered = registry->register_builtins(store);
  if (!registered.ok()) {
    return common::Result<std::shared_ptr<tools::ToolRegistry>>::failure(registered);
  }
  return common::Result<std::shared_ptr<tools::ToolRegistry>>::success(std::move(registry));
}

common::Result<std::shared_ptr<agent::SessionRegistry>>
RuntimeContext::create_session_registry(const std::shared_ptr<tools::ToolRegistry> &tools) const {
  auto provider = providers::create_provider(config_.provider);
  if (!provider.ok()) {
    return common::Result<std::shared_ptr<agent::SessionRegistry>>::failure(provider.status());
  }

  agent::SessionOptions options;
  options.model = config_.provider.model;
  options.temperature = config_.provider.temperature;
  options.max_tool_iterations = config_.agent.max_tool_iterations;
  options.prompt_template = agent::load_prompt_template(
      config_.agent.system_prompt_file.empty()
          ? std::filesystem::path()
          : std::filesystem::path(common::expand_path(config_.agent.system_prompt_file)));

  return common::Result<std::shared_ptr<agent::SessionRegistry>>::success(
      std::make_shared<agent::SessionRegistry>(provider.value(), tools, std::move(options)));
}

common::Result<std::unique_ptr<heartbeat::ReminderNotifier>>
RuntimeContext::create_notifier(const std::shared_ptr<schedule::ScheduleStore> &store) const {
  auto sink = heartbeat::make_notification_sink(config_.notifier.sink);
  if (!sink.ok()) {
    return common::Result<std::unique_ptr<heartbeat::ReminderNotifier>>::failure(sink.status());
  }
  heartbeat::NotifierOptions options;
  options.interval = std::chrono::seconds(config_.notifier.interval_secs);
  return common::Result<std::unique_ptr<heartbeat::ReminderNotifier>>::success(
      std::make_unique<heartbeat::ReminderNotifier>(store, sink.value(), options));
}

} // namespace almanac::runtime
