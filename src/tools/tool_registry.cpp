#include "almanac/tools/tool_registry.hpp"

#include "almanac/common/fs.hpp"
#include "almanac/observability/global.hpp"
#include "almanac/tools/builtin/ask_user_question.hpp"
#include "almanac/tools/builtin/schedule.hpp"

#include <chrono>
#include <exception>
#include <mutex>

namespace almanac::tools {

common::Status ToolRegistry::register_tool(std::unique_ptr<ITool> tool) {
  if (tool == nullptr) {
    return common::Status::error(common::ErrorKind::InvalidArguments, "tool is null");
  }
  const std::string key = common::to_lower(std::string(tool->name()));
  if (key.empty()) {
    return common::Status::error(common::ErrorKind::InvalidArguments, "tool name is empty");
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (by_name_.contains(key)) {
    return common::Status::error(common::ErrorKind::DuplicateTool,
                                 "tool already registered: " + std::string(tool->name()));
  }
  by_name_[key] = tool.get();
  tools_.push_back(std::move(tool));
  return common::Status::success();
}

common::Status ToolRegistry::register_function(std::string name, std::string description,
                                               std::vector<ToolParam> params,
                                               FunctionTool::Handler handler) {
  return register_tool(std::make_unique<FunctionTool>(std::move(name), std::move(description),
                                                      std::move(params), std::move(handler)));
}

common::Status ToolRegistry::register_builtins(std::shared_ptr<schedule::ScheduleStore> store) {
  std::vector<std::unique_ptr<ITool>> builtins;
  builtins.push_back(std::make_unique<CreateScheduleTool>(store));
  builtins.push_back(std::make_unique<ListSchedulesTool>(store));
  builtins.push_back(std::make_unique<UpdateScheduleTool>(store));
  builtins.push_back(std::make_unique<DeleteScheduleTool>(store));
  builtins.push_back(std::make_unique<AskUserQuestionTool>());
  for (auto &tool : builtins) {
    auto status = register_tool(std::move(tool));
    if (!status.ok()) {
      return status;
    }
  }
  return common::Status::success();
}

ITool *ToolRegistry::get_tool(const std::string_view name) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  const auto it = by_name_.find(common::to_lower(std::string(name)));
  if (it == by_name_.end()) {
    return nullptr;
  }
  return it->second;
}

bool ToolRegistry::contains(const std::string_view name) const { return get_tool(name) != nullptr; }

std::size_t ToolRegistry::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return tools_.size();
}

std::vector<ToolSpec> ToolRegistry::all_specs() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<ToolSpec> specs;
  specs.reserve(tools_.size());
  for (const auto &tool : tools_) {
    specs.push_back(tool->spec());
  }
  return specs;
}

common::Result<ToolResult> ToolRegistry::invoke(const std::string_view name, const ToolArgs &args,
                                                const ToolContext &ctx) const {
  ITool *tool = get_tool(name);
  if (tool == nullptr) {
    return common::Result<ToolResult>::failure(common::ErrorKind::UnknownTool,
                                               "unknown tool: " + std::string(name));
  }

  auto valid = validate_arguments(tool->parameters(), args);
  if (!valid.ok()) {
    return common::Result<ToolResult>::failure(valid);
  }

  const auto started = std::chrono::steady_clock::now();
  auto finish = [&](common::Result<ToolResult> result) {
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    observability::record_tool_call(std::string(tool->name()), elapsed,
                                    result.ok() && result.value().success);
    return result;
  };

  try {
    auto result = tool->execute(args, ctx);
    if (!result.ok()) {
      const auto kind = result.kind() == common::ErrorKind::InvalidArguments
                            ? common::ErrorKind::InvalidArguments
                            : common::ErrorKind::ToolExecution;
      return finish(common::Result<ToolResult>::failure(
          kind, "tool " + std::string(tool->name()) + " failed: " + result.error()));
    }
    return finish(std::move(result));
  } catch (const std::exception &ex) {
    return finish(common::Result<ToolResult>::failure(
        common::ErrorKind::ToolExecution,
        "tool " + std::string(tool->name()) + " threw: " + ex.what()));
  }
}

common::Result<ToolResult> ToolRegistry::invoke_json(const std::string_view name,
                                                     const std::string &arguments_json,
                                                     const ToolContext &ctx) const {
  if (!contains(name)) {
    return common::Result<ToolResult>::failure(common::ErrorKind::UnknownTool,
                                               "unknown tool: " + std::string(name));
  }
  auto args = parse_tool_arguments(arguments_json);
  if (!args.ok()) {
    return common::Result<ToolResult>::failure(args.status());
  }
  return invoke(name, args.value(), ctx);
}

} // namespace almanac::tools
